// File: src/quantization/lsh_quantizer.hpp
#pragma once

#include "quantization/region_quantizer.hpp"
#include <cstdint>
#include <vector>

namespace engram {

/// LshQuantizer: Static random-hyperplane partitioner
///
/// bands * rows_per_band Gaussian hyperplanes are drawn once at construction
/// from a seeded generator. Each band turns its sign bits into a 16-bit
/// bucket; the region code is the band buckets in hex joined by '_'.
/// The partition never adapts, so Assign() is a pure function.
class LshQuantizer : public RegionQuantizer {
public:
    struct Config {
        Config() = default;
        size_t dimension{FeatureVector::kDefaultDimension};
        size_t bands{16};
        size_t rows_per_band{4};
        uint32_t seed{42};
    };

    LshQuantizer();
    explicit LshQuantizer(const Config& config);

    RegionCode Assign(const FeatureVector& vector) override;

    /// Primary region first, then regions that differ by one flipped band bit
    std::vector<RegionCode> Nearest(const FeatureVector& vector, size_t k) const override;

    bool MutatesOnAssign() const override { return false; }
    std::string GetName() const override { return "lsh"; }
    size_t Dimension() const override { return config_.dimension; }

    /// Per-band sign-bit patterns for a vector (rows_per_band bits each)
    std::vector<uint32_t> ComputeBandBits(const FeatureVector& vector) const;

    const Config& GetConfig() const { return config_; }

private:
    Config config_;

    // bands * rows_per_band unit hyperplanes
    std::vector<FeatureVector> hyperplanes_;

    uint16_t BandBucket(size_t band, uint32_t bits) const;
    RegionCode FormatCode(const std::vector<uint32_t>& band_bits) const;
};

} // namespace engram
