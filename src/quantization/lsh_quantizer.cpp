// File: src/quantization/lsh_quantizer.cpp
#include "quantization/lsh_quantizer.hpp"
#include <iomanip>
#include <random>
#include <sstream>
#include <stdexcept>

namespace engram {

LshQuantizer::LshQuantizer() : LshQuantizer(Config()) {}

LshQuantizer::LshQuantizer(const Config& config)
    : config_(config) {
    if (config_.dimension == 0 || config_.bands == 0 || config_.rows_per_band == 0) {
        throw std::invalid_argument("LshQuantizer requires non-zero dimension, bands and rows");
    }
    if (config_.rows_per_band > 16) {
        throw std::invalid_argument("LshQuantizer supports at most 16 rows per band");
    }

    std::mt19937 rng(config_.seed);
    std::normal_distribution<float> gaussian(0.0f, 1.0f);

    size_t count = config_.bands * config_.rows_per_band;
    hyperplanes_.reserve(count);
    for (size_t i = 0; i < count; ++i) {
        FeatureVector plane(config_.dimension);
        for (size_t d = 0; d < config_.dimension; ++d) {
            plane[d] = gaussian(rng);
        }
        hyperplanes_.push_back(plane.Normalized());
    }
}

RegionCode LshQuantizer::Assign(const FeatureVector& vector) {
    return FormatCode(ComputeBandBits(vector));
}

std::vector<RegionCode> LshQuantizer::Nearest(const FeatureVector& vector, size_t k) const {
    std::vector<RegionCode> regions;
    if (k == 0) {
        return regions;
    }

    std::vector<uint32_t> bits = ComputeBandBits(vector);
    regions.push_back(FormatCode(bits));

    for (size_t band = 0; band < bits.size() && regions.size() < k; ++band) {
        std::vector<uint32_t> flipped = bits;
        flipped[band] ^= 1u;
        regions.push_back(FormatCode(flipped));
    }

    return regions;
}

std::vector<uint32_t> LshQuantizer::ComputeBandBits(const FeatureVector& vector) const {
    if (vector.Dimension() != config_.dimension) {
        throw std::invalid_argument("LshQuantizer: vector dimension " +
                                    std::to_string(vector.Dimension()) + " != " +
                                    std::to_string(config_.dimension));
    }

    std::vector<uint32_t> band_bits(config_.bands, 0);
    for (size_t band = 0; band < config_.bands; ++band) {
        uint32_t bits = 0;
        for (size_t row = 0; row < config_.rows_per_band; ++row) {
            const FeatureVector& plane = hyperplanes_[band * config_.rows_per_band + row];
            if (plane.DotProduct(vector) >= 0.0f) {
                bits |= (1u << row);
            }
        }
        band_bits[band] = bits;
    }
    return band_bits;
}

uint16_t LshQuantizer::BandBucket(size_t band, uint32_t bits) const {
    // Mix the band index in so equal bit patterns in different bands differ
    uint32_t h = static_cast<uint32_t>(band) * 2654435761u;
    h ^= bits + 0x9e3779b9u + (h << 6) + (h >> 2);
    return static_cast<uint16_t>(h & 0xFFFFu);
}

RegionCode LshQuantizer::FormatCode(const std::vector<uint32_t>& band_bits) const {
    std::ostringstream oss;
    oss << std::uppercase << std::hex << std::setfill('0');
    for (size_t band = 0; band < band_bits.size(); ++band) {
        if (band > 0) oss << '_';
        oss << std::setw(4) << BandBucket(band, band_bits[band]);
    }
    return oss.str();
}

} // namespace engram
