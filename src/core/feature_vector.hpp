// File: src/core/feature_vector.hpp
#pragma once

#include <vector>
#include <string>
#include <cstddef>
#include <iosfwd>

namespace engram {

// FeatureVector: Dense numerical representation of a token or pattern
class FeatureVector {
public:
    using ValueType = float;
    using StorageType = std::vector<ValueType>;

    // Dimension produced by the FeatureEncoder
    static constexpr size_t kDefaultDimension = 128;

    // Constructors
    FeatureVector() = default;
    explicit FeatureVector(size_t dimension);
    explicit FeatureVector(const StorageType& data);
    explicit FeatureVector(StorageType&& data);

    size_t Dimension() const { return data_.size(); }
    bool Empty() const { return data_.empty(); }

    // Element access
    ValueType operator[](size_t index) const { return data_[index]; }
    ValueType& operator[](size_t index) { return data_[index]; }

    const StorageType& Data() const { return data_; }
    StorageType& Data() { return data_; }

    // Compute L2 norm
    float Norm() const;

    // True when every component is exactly zero (or the vector is empty)
    bool IsZero() const;

    // Normalize to unit length (zero vector stays zero)
    FeatureVector Normalized() const;

    // Dot product
    float DotProduct(const FeatureVector& other) const;

    // Euclidean distance
    float EuclideanDistance(const FeatureVector& other) const;

    // Squared Euclidean distance
    float SquaredDistance(const FeatureVector& other) const;

    // Cosine similarity in [-1, 1]; 0 when either vector has zero norm
    float CosineSimilarity(const FeatureVector& other) const;

    // this += other * scale
    void AddScaled(const FeatureVector& other, float scale);

    // Vector operations
    FeatureVector operator+(const FeatureVector& other) const;
    FeatureVector operator-(const FeatureVector& other) const;
    FeatureVector operator*(float scalar) const;

    // Equality comparison (1e-6 tolerance)
    bool operator==(const FeatureVector& other) const;
    bool operator!=(const FeatureVector& other) const { return !(*this == other); }

    // Serialization
    void Serialize(std::ostream& out) const;
    static FeatureVector Deserialize(std::istream& in);

    // String representation
    std::string ToString(size_t max_elements = 10) const;

private:
    StorageType data_;
};

} // namespace engram
