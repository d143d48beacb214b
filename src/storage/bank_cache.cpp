// File: src/storage/bank_cache.cpp
#include "storage/bank_cache.hpp"

namespace engram {

BankCache::BankCache(size_t capacity)
    : capacity_(capacity == 0 ? 1 : capacity) {}

BankCache::BankPtr BankCache::Get(const std::string& partition) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = index_.find(partition);
    if (it == index_.end()) {
        misses_.fetch_add(1, std::memory_order_relaxed);
        return nullptr;
    }

    hits_.fetch_add(1, std::memory_order_relaxed);
    items_.splice(items_.begin(), items_, it->second);
    return it->second->second;
}

void BankCache::Put(const std::string& partition, BankPtr bank) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = index_.find(partition);
    if (it != index_.end()) {
        it->second->second = std::move(bank);
        items_.splice(items_.begin(), items_, it->second);
        return;
    }

    if (items_.size() >= capacity_) {
        index_.erase(items_.back().first);
        items_.pop_back();
        evictions_.fetch_add(1, std::memory_order_relaxed);
    }

    items_.emplace_front(partition, std::move(bank));
    index_[partition] = items_.begin();
}

bool BankCache::Remove(const std::string& partition) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = index_.find(partition);
    if (it == index_.end()) {
        return false;
    }
    items_.erase(it->second);
    index_.erase(it);
    return true;
}

void BankCache::Clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    items_.clear();
    index_.clear();
    hits_.store(0, std::memory_order_relaxed);
    misses_.store(0, std::memory_order_relaxed);
    evictions_.store(0, std::memory_order_relaxed);
}

size_t BankCache::Size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return items_.size();
}

bool BankCache::Contains(const std::string& partition) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return index_.count(partition) > 0;
}

BankCache::Stats BankCache::GetStats() const {
    std::lock_guard<std::mutex> lock(mutex_);

    Stats stats;
    stats.size = items_.size();
    stats.capacity = capacity_;
    stats.hits = hits_.load(std::memory_order_relaxed);
    stats.misses = misses_.load(std::memory_order_relaxed);
    stats.evictions = evictions_.load(std::memory_order_relaxed);

    uint64_t total = stats.hits + stats.misses;
    if (total > 0) {
        stats.hit_rate = static_cast<float>(stats.hits) / static_cast<float>(total);
    }
    return stats;
}

} // namespace engram
