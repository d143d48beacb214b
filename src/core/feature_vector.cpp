// File: src/core/feature_vector.cpp
#include "core/feature_vector.hpp"
#include "core/types.hpp"
#include <algorithm>
#include <cmath>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace engram {

namespace {
void RequireSameDimension(const FeatureVector& a, const FeatureVector& b, const char* op) {
    if (a.Dimension() != b.Dimension()) {
        throw std::invalid_argument(std::string("FeatureVector dimensions must match for ") + op);
    }
}
} // namespace

FeatureVector::FeatureVector(size_t dimension) : data_(dimension, 0.0f) {}

FeatureVector::FeatureVector(const StorageType& data) : data_(data) {}

FeatureVector::FeatureVector(StorageType&& data) : data_(std::move(data)) {}

float FeatureVector::Norm() const {
    float sum_sq = 0.0f;
    for (float val : data_) {
        sum_sq += val * val;
    }
    return std::sqrt(sum_sq);
}

bool FeatureVector::IsZero() const {
    return std::all_of(data_.begin(), data_.end(), [](float v) { return v == 0.0f; });
}

FeatureVector FeatureVector::Normalized() const {
    float norm = Norm();
    if (norm == 0.0f) {
        return FeatureVector(data_.size());
    }

    FeatureVector result(data_.size());
    for (size_t i = 0; i < data_.size(); ++i) {
        result[i] = data_[i] / norm;
    }
    return result;
}

float FeatureVector::DotProduct(const FeatureVector& other) const {
    RequireSameDimension(*this, other, "dot product");

    float dot = 0.0f;
    for (size_t i = 0; i < data_.size(); ++i) {
        dot += data_[i] * other.data_[i];
    }
    return dot;
}

float FeatureVector::EuclideanDistance(const FeatureVector& other) const {
    return std::sqrt(SquaredDistance(other));
}

float FeatureVector::SquaredDistance(const FeatureVector& other) const {
    RequireSameDimension(*this, other, "distance");

    float sum_sq_diff = 0.0f;
    for (size_t i = 0; i < data_.size(); ++i) {
        float diff = data_[i] - other.data_[i];
        sum_sq_diff += diff * diff;
    }
    return sum_sq_diff;
}

float FeatureVector::CosineSimilarity(const FeatureVector& other) const {
    RequireSameDimension(*this, other, "cosine similarity");

    float norm_product = Norm() * other.Norm();
    if (norm_product == 0.0f) {
        return 0.0f;
    }

    // Rounding can push |cos| marginally past 1
    return std::clamp(DotProduct(other) / norm_product, -1.0f, 1.0f);
}

void FeatureVector::AddScaled(const FeatureVector& other, float scale) {
    RequireSameDimension(*this, other, "accumulation");
    for (size_t i = 0; i < data_.size(); ++i) {
        data_[i] += other.data_[i] * scale;
    }
}

FeatureVector FeatureVector::operator+(const FeatureVector& other) const {
    FeatureVector result(*this);
    result.AddScaled(other, 1.0f);
    return result;
}

FeatureVector FeatureVector::operator-(const FeatureVector& other) const {
    FeatureVector result(*this);
    result.AddScaled(other, -1.0f);
    return result;
}

FeatureVector FeatureVector::operator*(float scalar) const {
    FeatureVector result(data_.size());
    for (size_t i = 0; i < data_.size(); ++i) {
        result[i] = data_[i] * scalar;
    }
    return result;
}

bool FeatureVector::operator==(const FeatureVector& other) const {
    if (Dimension() != other.Dimension()) {
        return false;
    }

    for (size_t i = 0; i < data_.size(); ++i) {
        if (std::abs(data_[i] - other.data_[i]) > 1e-6f) {
            return false;
        }
    }
    return true;
}

void FeatureVector::Serialize(std::ostream& out) const {
    io::WriteFloats(out, data_);
}

FeatureVector FeatureVector::Deserialize(std::istream& in) {
    return FeatureVector(io::ReadFloats(in));
}

std::string FeatureVector::ToString(size_t max_elements) const {
    if (data_.empty()) {
        return "FeatureVector[]";
    }

    std::ostringstream oss;
    oss << "FeatureVector[" << data_.size() << "](";

    size_t count = std::min(max_elements, data_.size());
    for (size_t i = 0; i < count; ++i) {
        if (i > 0) oss << ", ";
        oss << std::fixed << std::setprecision(4) << data_[i];
    }

    if (data_.size() > max_elements) {
        oss << ", ...";
    }
    oss << ")";

    return oss.str();
}

} // namespace engram
