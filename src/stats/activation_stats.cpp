// File: src/stats/activation_stats.cpp
#include "stats/activation_stats.hpp"
#include <algorithm>

namespace engram {

ActivationStats::ActivationStats() : ActivationStats(Config()) {}

ActivationStats::ActivationStats(const Config& config)
    : config_(config) {
    if (config_.history_size == 0) {
        config_.history_size = 1;
    }
    if (config_.frequency_saturation <= 0.0) {
        config_.frequency_saturation = 1.0;
    }
}

// ============================================================================
// Recording
// ============================================================================

void ActivationStats::RecordActivation(const RegionCode& region, const FeatureVector& vector) {
    RegionHistory& history = regions_[region];

    history.count++;
    if (history.mean.Empty()) {
        history.mean = vector;
    } else {
        // Incremental mean over all samples
        FeatureVector delta = vector - history.mean;
        history.mean.AddScaled(delta, 1.0f / static_cast<float>(history.count));
    }

    history.samples.push_back(vector);
    TrimHistory(history);
    history.last_seen = Timestamp::Now();

    total_activations_++;
}

void ActivationStats::TrimHistory(RegionHistory& history) const {
    while (history.samples.size() > config_.history_size) {
        history.samples.pop_front();
    }
}

// ============================================================================
// Queries
// ============================================================================

float ActivationStats::CalculateNovelty(const RegionCode& region, const FeatureVector& vector) const {
    auto it = regions_.find(region);
    if (it == regions_.end() || it->second.count == 0) {
        return 1.0f;
    }

    const RegionHistory& history = it->second;

    float query_distance = std::min(1.0f, vector.EuclideanDistance(history.mean) / 2.0f);

    float history_spread = 0.0f;
    if (!history.samples.empty()) {
        for (const auto& sample : history.samples) {
            history_spread += sample.EuclideanDistance(history.mean);
        }
        history_spread = std::min(1.0f, history_spread / static_cast<float>(history.samples.size()) / 2.0f);
    }

    float spread = 0.5f * (query_distance + history_spread);
    float count = static_cast<float>(history.count);
    float familiarity = count / (count + 1.0f);

    float novelty = spread + (1.0f - familiarity) * (1.0f - spread) * 0.5f;
    return std::clamp(novelty, 0.0f, 1.0f);
}

float ActivationStats::Frequency(const RegionCode& region) const {
    double count = static_cast<double>(ActivationCount(region));
    return static_cast<float>(count / (count + config_.frequency_saturation));
}

uint64_t ActivationStats::ActivationCount(const RegionCode& region) const {
    auto it = regions_.find(region);
    return it == regions_.end() ? 0 : it->second.count;
}

std::vector<std::pair<RegionCode, uint64_t>> ActivationStats::TopRegions(size_t n) const {
    std::vector<std::pair<RegionCode, uint64_t>> ranked;
    ranked.reserve(regions_.size());
    for (const auto& [code, history] : regions_) {
        ranked.emplace_back(code, history.count);
    }

    std::sort(ranked.begin(), ranked.end(), [](const auto& a, const auto& b) {
        if (a.second != b.second) return a.second > b.second;
        return a.first < b.first;
    });

    if (ranked.size() > n) {
        ranked.resize(n);
    }
    return ranked;
}

// ============================================================================
// Maintenance
// ============================================================================

size_t ActivationStats::Prune(uint64_t min_count) {
    size_t removed = 0;
    for (auto it = regions_.begin(); it != regions_.end();) {
        if (it->second.count < min_count) {
            total_activations_ -= std::min(total_activations_, it->second.count);
            it = regions_.erase(it);
            ++removed;
        } else {
            ++it;
        }
    }
    return removed;
}

void ActivationStats::Merge(const ActivationStats& other) {
    for (const auto& [code, incoming] : other.regions_) {
        RegionHistory& history = regions_[code];
        if (history.count == 0) {
            history = incoming;
            TrimHistory(history);
            continue;
        }

        uint64_t combined = history.count + incoming.count;
        if (incoming.count > 0 && !incoming.mean.Empty()) {
            float weight = static_cast<float>(incoming.count) / static_cast<float>(combined);
            history.mean.AddScaled(incoming.mean - history.mean, weight);
        }
        history.count = combined;
        for (const auto& sample : incoming.samples) {
            history.samples.push_back(sample);
        }
        TrimHistory(history);
        history.last_seen = std::max(history.last_seen, incoming.last_seen);
    }
    total_activations_ += other.total_activations_;
}

void ActivationStats::Reset() {
    regions_.clear();
    total_activations_ = 0;
}

bool ActivationStats::operator==(const ActivationStats& other) const {
    if (total_activations_ != other.total_activations_ || regions_.size() != other.regions_.size()) {
        return false;
    }
    for (const auto& [code, history] : regions_) {
        auto it = other.regions_.find(code);
        if (it == other.regions_.end()) return false;
        const RegionHistory& rhs = it->second;
        if (history.count != rhs.count || history.mean != rhs.mean ||
            history.samples.size() != rhs.samples.size()) {
            return false;
        }
        for (size_t i = 0; i < history.samples.size(); ++i) {
            if (history.samples[i] != rhs.samples[i]) return false;
        }
    }
    return true;
}

// ============================================================================
// Serialization
// ============================================================================

void ActivationStats::Serialize(std::ostream& out) const {
    io::WritePod(out, total_activations_);
    io::WritePod<uint64_t>(out, regions_.size());
    for (const auto& [code, history] : regions_) {
        io::WriteString(out, code);
        io::WritePod(out, history.count);
        history.last_seen.Serialize(out);
        history.mean.Serialize(out);
        io::WritePod<uint64_t>(out, history.samples.size());
        for (const auto& sample : history.samples) {
            sample.Serialize(out);
        }
    }
}

ActivationStats ActivationStats::Deserialize(std::istream& in, const Config& config) {
    ActivationStats stats(config);
    stats.total_activations_ = io::ReadPod<uint64_t>(in);

    uint64_t region_count = io::ReadPod<uint64_t>(in);
    for (uint64_t r = 0; r < region_count; ++r) {
        RegionCode code = io::ReadString(in);
        RegionHistory history;
        history.count = io::ReadPod<uint64_t>(in);
        history.last_seen = Timestamp::Deserialize(in);
        history.mean = FeatureVector::Deserialize(in);

        uint64_t sample_count = io::ReadPod<uint64_t>(in);
        for (uint64_t s = 0; s < sample_count; ++s) {
            history.samples.push_back(FeatureVector::Deserialize(in));
        }
        stats.TrimHistory(history);
        stats.regions_.emplace(std::move(code), std::move(history));
    }
    return stats;
}

} // namespace engram
