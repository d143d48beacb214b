// File: tests/core/feature_vector_test.cpp
#include "core/feature_vector.hpp"
#include <gtest/gtest.h>
#include <cmath>
#include <sstream>

namespace engram {
namespace {

// ============================================================================
// Construction Tests
// ============================================================================

TEST(FeatureVectorTest, DimensionConstructorZeroFills) {
    FeatureVector v(4);
    EXPECT_EQ(4u, v.Dimension());
    EXPECT_TRUE(v.IsZero());
    EXPECT_FALSE(v.Empty());
}

TEST(FeatureVectorTest, DefaultIsEmpty) {
    FeatureVector v;
    EXPECT_TRUE(v.Empty());
    EXPECT_TRUE(v.IsZero());
    EXPECT_FLOAT_EQ(0.0f, v.Norm());
}

// ============================================================================
// Math Tests
// ============================================================================

TEST(FeatureVectorTest, NormAndNormalized) {
    FeatureVector v(std::vector<float>{3.0f, 4.0f});
    EXPECT_FLOAT_EQ(5.0f, v.Norm());

    FeatureVector unit = v.Normalized();
    EXPECT_NEAR(1.0f, unit.Norm(), 1e-6f);
    EXPECT_FLOAT_EQ(0.6f, unit[0]);
    EXPECT_FLOAT_EQ(0.8f, unit[1]);
}

TEST(FeatureVectorTest, NormalizedZeroStaysZero) {
    FeatureVector zero(3);
    EXPECT_TRUE(zero.Normalized().IsZero());
}

TEST(FeatureVectorTest, Distances) {
    FeatureVector a(std::vector<float>{0.0f, 0.0f});
    FeatureVector b(std::vector<float>{3.0f, 4.0f});
    EXPECT_FLOAT_EQ(25.0f, a.SquaredDistance(b));
    EXPECT_FLOAT_EQ(5.0f, a.EuclideanDistance(b));
}

TEST(FeatureVectorTest, CosineIsBoundedAndSymmetric) {
    FeatureVector a(std::vector<float>{1.0f, 2.0f, -3.0f});
    FeatureVector b(std::vector<float>{-2.0f, 0.5f, 4.0f});

    float ab = a.CosineSimilarity(b);
    float ba = b.CosineSimilarity(a);
    EXPECT_FLOAT_EQ(ab, ba);
    EXPECT_GE(ab, -1.0f);
    EXPECT_LE(ab, 1.0f);

    EXPECT_NEAR(1.0f, a.CosineSimilarity(a * 3.0f), 1e-6f);
    EXPECT_NEAR(-1.0f, a.CosineSimilarity(a * -1.0f), 1e-6f);
}

TEST(FeatureVectorTest, CosineWithZeroVectorIsZero) {
    FeatureVector a(std::vector<float>{1.0f, 2.0f});
    FeatureVector zero(2);
    EXPECT_FLOAT_EQ(0.0f, a.CosineSimilarity(zero));
}

TEST(FeatureVectorTest, MismatchedDimensionsThrow) {
    FeatureVector a(2);
    FeatureVector b(3);
    EXPECT_THROW(a.DotProduct(b), std::invalid_argument);
    EXPECT_THROW(a.CosineSimilarity(b), std::invalid_argument);
    EXPECT_THROW(a + b, std::invalid_argument);
}

TEST(FeatureVectorTest, ArithmeticOperators) {
    FeatureVector a(std::vector<float>{1.0f, 2.0f});
    FeatureVector b(std::vector<float>{0.5f, -1.0f});

    EXPECT_EQ(FeatureVector(std::vector<float>{1.5f, 1.0f}), a + b);
    EXPECT_EQ(FeatureVector(std::vector<float>{0.5f, 3.0f}), a - b);
    EXPECT_EQ(FeatureVector(std::vector<float>{2.0f, 4.0f}), a * 2.0f);

    a.AddScaled(b, 2.0f);
    EXPECT_EQ(FeatureVector(std::vector<float>{2.0f, 0.0f}), a);
}

// ============================================================================
// Serialization Tests
// ============================================================================

TEST(FeatureVectorTest, SerializationPreservesValues) {
    FeatureVector original(std::vector<float>{0.1f, -0.2f, 0.3f});
    std::stringstream ss;
    original.Serialize(ss);

    FeatureVector restored = FeatureVector::Deserialize(ss);
    EXPECT_EQ(original, restored);
}

TEST(FeatureVectorTest, ToStringTruncates) {
    FeatureVector v(std::vector<float>{1.0f, 2.0f, 3.0f});
    EXPECT_EQ("FeatureVector[3](1.0000, 2.0000, ...)", v.ToString(2));
    EXPECT_EQ("FeatureVector[]", FeatureVector().ToString());
}

} // namespace
} // namespace engram
