// File: src/quantization/region_quantizer.hpp
#pragma once

#include "core/feature_vector.hpp"
#include "core/types.hpp"
#include <string>
#include <vector>

namespace engram {

/// RegionQuantizer: Discretizes the continuous feature space into region codes
///
/// Contract shared by all strategies:
/// - Assign(v) returns the region for v. For learned strategies this call is
///   also a training step that moves the chosen region toward v; check
///   MutatesOnAssign() before using it as a lookup.
/// - Nearest(v, k) returns up to k region codes ordered from closest to
///   farthest and never mutates state. Its first element is the region
///   Assign(v) would pick at this moment.
class RegionQuantizer {
public:
    virtual ~RegionQuantizer() = default;

    /// Assign a vector to a region (may adapt the quantizer)
    virtual RegionCode Assign(const FeatureVector& vector) = 0;

    /// Up to k closest regions without mutation
    virtual std::vector<RegionCode> Nearest(const FeatureVector& vector, size_t k) const = 0;

    /// Whether Assign() adapts internal state
    virtual bool MutatesOnAssign() const = 0;

    /// Strategy name ("lsh", "codebook")
    virtual std::string GetName() const = 0;

    /// Dimension the quantizer accepts
    virtual size_t Dimension() const = 0;
};

} // namespace engram
