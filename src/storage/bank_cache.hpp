// File: src/storage/bank_cache.hpp
#pragma once

#include "cluster/neuron.hpp"
#include <atomic>
#include <list>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

namespace engram {

/// All neurons stored in one partition, keyed by id
using NeuronBank = std::map<NeuronID, Neuron>;

/// BankCache: LRU cache of decoded partition banks
///
/// Keyed by partition key. Banks are shared immutable snapshots; a writer
/// builds a new bank and Put()s it. Thread-safe, since partition writes
/// run in parallel.
class BankCache {
public:
    using BankPtr = std::shared_ptr<const NeuronBank>;

    /// @param capacity Maximum number of banks kept (minimum 1)
    explicit BankCache(size_t capacity);

    /// Get a bank and mark it most recently used
    /// @return The bank, or nullptr if not cached
    BankPtr Get(const std::string& partition);

    /// Insert or replace a bank, evicting the least recently used one when full
    void Put(const std::string& partition, BankPtr bank);

    /// @return true if the partition was cached
    bool Remove(const std::string& partition);

    void Clear();

    size_t Size() const;
    size_t Capacity() const { return capacity_; }
    bool Contains(const std::string& partition) const;

    struct Stats {
        size_t size{0};
        size_t capacity{0};
        uint64_t hits{0};
        uint64_t misses{0};
        uint64_t evictions{0};
        float hit_rate{0.0f};
    };

    Stats GetStats() const;

private:
    size_t capacity_;

    // Front = most recently used
    std::list<std::pair<std::string, BankPtr>> items_;
    std::unordered_map<std::string, std::list<std::pair<std::string, BankPtr>>::iterator> index_;

    mutable std::mutex mutex_;

    std::atomic<uint64_t> hits_{0};
    std::atomic<uint64_t> misses_{0};
    std::atomic<uint64_t> evictions_{0};
};

} // namespace engram
