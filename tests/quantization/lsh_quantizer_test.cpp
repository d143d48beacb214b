// File: tests/quantization/lsh_quantizer_test.cpp
#include "quantization/lsh_quantizer.hpp"
#include "encoding/feature_encoder.hpp"
#include <gtest/gtest.h>
#include <set>

namespace engram {
namespace {

LshQuantizer::Config SmallConfig() {
    LshQuantizer::Config config;
    config.dimension = FeatureEncoder::kDimension;
    config.bands = 4;
    config.rows_per_band = 4;
    config.seed = 7;
    return config;
}

// ============================================================================
// Construction Tests
// ============================================================================

TEST(LshQuantizerTest, RejectsInvalidShapes) {
    LshQuantizer::Config config = SmallConfig();
    config.bands = 0;
    EXPECT_THROW(LshQuantizer{config}, std::invalid_argument);

    config = SmallConfig();
    config.rows_per_band = 17;
    EXPECT_THROW(LshQuantizer{config}, std::invalid_argument);
}

TEST(LshQuantizerTest, ReportsContract) {
    LshQuantizer quantizer(SmallConfig());
    EXPECT_FALSE(quantizer.MutatesOnAssign());
    EXPECT_EQ("lsh", quantizer.GetName());
    EXPECT_EQ(FeatureEncoder::kDimension, quantizer.Dimension());
}

// ============================================================================
// Assignment Tests
// ============================================================================

TEST(LshQuantizerTest, AssignIsPureAndSeeded) {
    FeatureEncoder encoder;
    FeatureVector v = encoder.Encode("apple");

    LshQuantizer first(SmallConfig());
    LshQuantizer second(SmallConfig());

    RegionCode code = first.Assign(v);
    EXPECT_EQ(code, first.Assign(v));
    EXPECT_EQ(code, second.Assign(v));

    // Four bands of four hex digits joined by '_'
    EXPECT_EQ(4u * 4u + 3u, code.size());
}

TEST(LshQuantizerTest, ScaledVectorsShareRegion) {
    FeatureEncoder encoder;
    FeatureVector v = encoder.Encode("banana");
    LshQuantizer quantizer(SmallConfig());
    EXPECT_EQ(quantizer.Assign(v), quantizer.Assign(v * 3.0f));
}

TEST(LshQuantizerTest, NearestStartsWithAssignedRegion) {
    FeatureEncoder encoder;
    FeatureVector v = encoder.Encode("cherry");
    LshQuantizer quantizer(SmallConfig());

    auto regions = quantizer.Nearest(v, 3);
    ASSERT_EQ(3u, regions.size());
    EXPECT_EQ(quantizer.Assign(v), regions.front());
    EXPECT_EQ(3u, std::set<RegionCode>(regions.begin(), regions.end()).size());

    EXPECT_TRUE(quantizer.Nearest(v, 0).empty());
    // One primary plus one neighbour per band at most
    EXPECT_EQ(5u, quantizer.Nearest(v, 100).size());
}

TEST(LshQuantizerTest, WrongDimensionThrows) {
    LshQuantizer quantizer(SmallConfig());
    EXPECT_THROW(quantizer.Assign(FeatureVector(3)), std::invalid_argument);
}

TEST(LshQuantizerTest, BandBitsFitRowCount) {
    FeatureEncoder encoder;
    LshQuantizer quantizer(SmallConfig());
    for (uint32_t bits : quantizer.ComputeBandBits(encoder.Encode("dates"))) {
        EXPECT_LT(bits, 16u);
    }
}

} // namespace
} // namespace engram
