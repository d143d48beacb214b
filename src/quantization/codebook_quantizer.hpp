// File: src/quantization/codebook_quantizer.hpp
#pragma once

#include "quantization/region_quantizer.hpp"
#include <cstdint>
#include <optional>
#include <vector>

namespace engram {

/// CodebookSnapshot: Complete learned state of a CodebookQuantizer
struct CodebookSnapshot {
    size_t codebook_size{0};
    size_t dimension{0};
    float commitment_cost{0.25f};
    float ema_decay{0.99f};
    std::vector<FeatureVector> codebook;
    std::vector<float> ema_cluster_size;
    std::vector<FeatureVector> ema_codebook_sum;
    std::vector<uint64_t> usage_counts;
    uint64_t total_encodings{0};
    double total_commitment_loss{0.0};

    void Serialize(std::ostream& out) const;
    static CodebookSnapshot Deserialize(std::istream& in);
};

/// CodebookQuantizer: Learned vector quantizer with EMA centroid refinement
///
/// Every Assign() is both a query and a training step: the winning code is
/// moved toward the input with the bias-corrected exponential moving average
///
///   size[c] = decay * size[c] + (1 - decay)
///   sum[c]  = decay * sum[c]  + (1 - decay) * x
///   code[c] = sum[c] / (size[c] + epsilon)
///
/// so region codes drift as data arrives. Use Nearest() or QuantizeReadOnly()
/// for lookups that must not train.
class CodebookQuantizer : public RegionQuantizer {
public:
    struct Config {
        Config() = default;
        size_t codebook_size{512};
        size_t dimension{FeatureVector::kDefaultDimension};
        float commitment_cost{0.25f};
        float ema_decay{0.99f};
        uint32_t seed{42};
        // Initial code components are drawn from [-init_range, init_range]
        float init_range{0.01f};
    };

    /// Usage statistics over the codebook
    struct Stats {
        size_t codebook_size{0};
        size_t active_codes{0};
        float utilization{0.0f};
        float perplexity{0.0f};
        size_t most_used_code{0};
        uint64_t most_used_count{0};
        size_t least_used_code{0};
        uint64_t least_used_count{0};
        uint64_t total_encodings{0};
        double average_commitment_loss{0.0};
    };

    /// Result of a training assignment
    struct Assignment {
        size_t code{0};
        float distance{0.0f};
        float commitment_loss{0.0f};
    };

    CodebookQuantizer();
    explicit CodebookQuantizer(const Config& config);

    // ========================================================================
    // RegionQuantizer
    // ========================================================================

    RegionCode Assign(const FeatureVector& vector) override;
    std::vector<RegionCode> Nearest(const FeatureVector& vector, size_t k) const override;
    bool MutatesOnAssign() const override { return true; }
    std::string GetName() const override { return "codebook"; }
    size_t Dimension() const override { return config_.dimension; }

    // ========================================================================
    // Codebook API
    // ========================================================================

    /// Nearest code with EMA update and usage bookkeeping
    Assignment QuantizeAndUpdate(const FeatureVector& vector);

    /// Nearest code index without any mutation
    size_t QuantizeReadOnly(const FeatureVector& vector) const;

    /// k closest code indices ordered by distance, without mutation
    std::vector<size_t> GetNearestCodes(const FeatureVector& vector, size_t k) const;

    /// Current vector of a code
    const FeatureVector& GetCode(size_t index) const;

    Stats GetStats() const;

    /// Capture the learned state
    CodebookSnapshot Export() const;

    /// Replace the learned state
    /// @throws std::invalid_argument if the snapshot shape does not match
    void Import(const CodebookSnapshot& snapshot);

    /// "vq_<index>"
    static RegionCode CodeName(size_t index);

    /// Inverse of CodeName
    static std::optional<size_t> ParseCodeName(const RegionCode& code);

    const Config& GetConfig() const { return config_; }

private:
    static constexpr float kEpsilon = 1e-5f;

    Config config_;

    std::vector<FeatureVector> codebook_;
    std::vector<float> ema_cluster_size_;
    std::vector<FeatureVector> ema_codebook_sum_;
    std::vector<uint64_t> usage_counts_;
    uint64_t total_encodings_{0};
    double total_commitment_loss_{0.0};

    void CheckDimension(const FeatureVector& vector) const;
    std::vector<std::pair<float, size_t>> RankCodes(const FeatureVector& vector) const;
    void UpdateCode(size_t index, const FeatureVector& vector);
};

} // namespace engram
