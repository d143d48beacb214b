// File: src/stats/activation_stats.hpp
#pragma once

#include "core/feature_vector.hpp"
#include "core/types.hpp"
#include <deque>
#include <unordered_map>
#include <utility>
#include <vector>

namespace engram {

/// ActivationStats: Per-region activation history used to score novelty
///
/// Each region keeps a running mean over every vector ever recorded plus a
/// bounded ring of the most recent samples. Novelty falls as a region
/// accumulates samples that sit tightly around its mean:
///
///   spread      = (|v - mean| / 2 + mean_i |h_i - mean| / 2) / 2
///   familiarity = count / (count + 1)
///   novelty     = spread + (1 - familiarity) * (1 - spread) / 2
///
/// Distances are divided by 2, the diameter of the unit sphere.
/// An unseen region always has novelty 1.
class ActivationStats {
public:
    struct Config {
        Config() = default;
        size_t history_size{64};          // samples kept per region
        double frequency_saturation{100};  // count at which Frequency() reaches 0.5
    };

    /// Per-region state
    struct RegionHistory {
        FeatureVector mean;
        std::deque<FeatureVector> samples;
        uint64_t count{0};
        Timestamp last_seen;
    };

    ActivationStats();
    explicit ActivationStats(const Config& config);

    /// Record one activation of a region
    void RecordActivation(const RegionCode& region, const FeatureVector& vector);

    /// Novelty of a vector relative to a region's history, in [0,1]
    float CalculateNovelty(const RegionCode& region, const FeatureVector& vector) const;

    /// Saturating activation frequency of a region, in [0,1)
    float Frequency(const RegionCode& region) const;

    /// Raw activation count of a region
    uint64_t ActivationCount(const RegionCode& region) const;

    /// Regions ordered by activation count (descending), at most n
    std::vector<std::pair<RegionCode, uint64_t>> TopRegions(size_t n) const;

    /// Remove regions with fewer than min_count activations
    /// @return Number of regions removed
    size_t Prune(uint64_t min_count);

    /// Fold another instance into this one
    void Merge(const ActivationStats& other);

    void Reset();

    size_t RegionCount() const { return regions_.size(); }
    uint64_t TotalActivations() const { return total_activations_; }
    const Config& GetConfig() const { return config_; }

    /// Equality of counts, means and histories (used by persistence checks)
    bool operator==(const ActivationStats& other) const;

    void Serialize(std::ostream& out) const;
    static ActivationStats Deserialize(std::istream& in, const Config& config);

private:
    Config config_;
    std::unordered_map<RegionCode, RegionHistory> regions_;
    uint64_t total_activations_{0};

    void TrimHistory(RegionHistory& history) const;
};

} // namespace engram
