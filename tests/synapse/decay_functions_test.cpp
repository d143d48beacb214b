// File: tests/synapse/decay_functions_test.cpp
#include "synapse/decay_functions.hpp"
#include <gtest/gtest.h>
#include <cmath>

namespace engram {
namespace {

// ============================================================================
// ExponentialDecay Tests
// ============================================================================

TEST(ExponentialDecayTest, RetainsFactorPerHour) {
    ExponentialDecay decay(0.99f);
    EXPECT_NEAR(0.99f, decay.ApplyDecay(1.0f, 1.0), 1e-6f);
    EXPECT_NEAR(std::pow(0.99f, 10.0f), decay.ApplyDecay(1.0f, 10.0), 1e-5f);
}

TEST(ExponentialDecayTest, NoTimeNoDecay) {
    ExponentialDecay decay(0.5f);
    EXPECT_FLOAT_EQ(0.8f, decay.ApplyDecay(0.8f, 0.0));
    EXPECT_FLOAT_EQ(0.8f, decay.ApplyDecay(0.8f, -3.0));
    EXPECT_FLOAT_EQ(0.0f, decay.ApplyDecay(0.0f, 5.0));
}

TEST(ExponentialDecayTest, HalfLife) {
    ExponentialDecay decay(0.5f);
    EXPECT_NEAR(1.0f, decay.GetHalfLife(), 1e-6f);
    EXPECT_TRUE(std::isinf(ExponentialDecay(1.0f).GetHalfLife()));
    EXPECT_FLOAT_EQ(0.0f, ExponentialDecay(0.0f).GetHalfLife());
}

TEST(ExponentialDecayTest, FactorIsClamped) {
    EXPECT_FLOAT_EQ(1.0f, ExponentialDecay(3.0f).GetFactorPerHour());
    EXPECT_FLOAT_EQ(0.0f, ExponentialDecay(-1.0f).GetFactorPerHour());
}

// ============================================================================
// PowerLawDecay Tests
// ============================================================================

TEST(PowerLawDecayTest, FollowsPowerLaw) {
    PowerLawDecay decay(1.0f, 0.5f);
    // 1 / sqrt(1 + 3)
    EXPECT_NEAR(0.5f, decay.ApplyDecay(1.0f, 3.0), 1e-6f);
    EXPECT_NEAR(0.25f, decay.GetDecayAmount(0.5f, 3.0), 1e-6f);
}

TEST(PowerLawDecayTest, InvalidParametersFallBack) {
    PowerLawDecay decay(-2.0f, -1.0f);
    EXPECT_FLOAT_EQ(1.0f, decay.GetTimeConstant());
    EXPECT_FLOAT_EQ(0.5f, decay.GetExponent());
}

TEST(PowerLawDecayTest, SlowerThanExponentialOverLongGaps) {
    PowerLawDecay power(1.0f, 0.5f);
    ExponentialDecay exponential(0.9f);
    EXPECT_GT(power.ApplyDecay(1.0f, 200.0), exponential.ApplyDecay(1.0f, 200.0));
}

// ============================================================================
// Factory Tests
// ============================================================================

TEST(DecayFactoryTest, CreatesByName) {
    auto exponential = CreateDecayFunction("exponential", 0.9f);
    ASSERT_NE(nullptr, exponential);
    EXPECT_STREQ("ExponentialDecay", exponential->GetName());
    EXPECT_NEAR(0.9f, exponential->ApplyDecay(1.0f, 1.0), 1e-6f);

    auto power = CreateDecayFunction("powerlaw");
    ASSERT_NE(nullptr, power);
    EXPECT_STREQ("PowerLawDecay", power->GetName());

    EXPECT_EQ(nullptr, CreateDecayFunction("linear"));
}

TEST(DecayFactoryTest, CloneKeepsParameters) {
    ExponentialDecay decay(0.8f);
    auto clone = decay.Clone();
    EXPECT_FLOAT_EQ(decay.ApplyDecay(1.0f, 2.0), clone->ApplyDecay(1.0f, 2.0));
}

} // namespace
} // namespace engram
