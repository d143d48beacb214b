// File: tests/allocation/neuron_hypernetwork_test.cpp
#include "allocation/neuron_hypernetwork.hpp"
#include "encoding/feature_encoder.hpp"
#include <gtest/gtest.h>

namespace engram {
namespace {

// ============================================================================
// Sizing Tests
// ============================================================================

TEST(NeuronHypernetworkTest, MinimumForFamiliarSimplePattern) {
    NeuronHypernetwork network;
    EXPECT_EQ(5, network.NeuronCount(0.0, 0.0, 0.0));
}

TEST(NeuronHypernetworkTest, AllSignalsAtMaximum) {
    NeuronHypernetwork network;
    // 5 + 20 * ln 2 + 100 + 50
    EXPECT_EQ(169, network.NeuronCount(1.0, 1.0, 1.0));
}

TEST(NeuronHypernetworkTest, InputsAreClamped) {
    NeuronHypernetwork network;
    EXPECT_EQ(network.NeuronCount(1.0, 1.0, 1.0), network.NeuronCount(7.0, 3.0, 2.0));
    EXPECT_EQ(5, network.NeuronCount(-1.0, -5.0, -2.0));
}

TEST(NeuronHypernetworkTest, CountRespectsMaximum) {
    NeuronHypernetwork::Config config;
    config.max_neurons = 40;
    NeuronHypernetwork network(config);
    EXPECT_EQ(40, network.NeuronCount(1.0, 1.0, 1.0));
}

TEST(NeuronHypernetworkTest, NoveltyGrowsClusters) {
    NeuronHypernetwork network;
    EXPECT_LT(network.NeuronCount(0.1, 0.5, 0.5), network.NeuronCount(0.9, 0.5, 0.5));
}

// ============================================================================
// Complexity Tests
// ============================================================================

TEST(NeuronHypernetworkTest, ComplexityOfZeroVector) {
    EXPECT_DOUBLE_EQ(0.0, NeuronHypernetwork::Complexity(FeatureVector(8)));
    EXPECT_DOUBLE_EQ(0.0, NeuronHypernetwork::Complexity(FeatureVector()));
}

TEST(NeuronHypernetworkTest, ComplexityOfUniformVector) {
    FeatureVector uniform(std::vector<float>(16, 1.0f));
    // Fully dense, no variance, maximal entropy
    EXPECT_NEAR(0.7, NeuronHypernetwork::Complexity(uniform), 1e-6);
}

TEST(NeuronHypernetworkTest, ComplexityOfOneHotVector) {
    FeatureVector one_hot(std::vector<float>{1.0f, 0.0f, 0.0f, 0.0f});
    EXPECT_NEAR(0.375, NeuronHypernetwork::Complexity(one_hot), 1e-6);
}

// ============================================================================
// Property Generation Tests
// ============================================================================

TEST(NeuronHypernetworkTest, PropertiesAreDeterministicAndInRange) {
    FeatureEncoder encoder;
    FeatureVector v = encoder.Encode("apple");
    NeuronHypernetwork network;

    auto first = network.GenerateNeuronProperties(v, 10, 3);
    auto second = network.GenerateNeuronProperties(v, 10, 3);
    ASSERT_EQ(10u, first.size());

    for (size_t i = 0; i < first.size(); ++i) {
        EXPECT_EQ(3 + i, first[i].index);
        EXPECT_FLOAT_EQ(first[i].activation_threshold, second[i].activation_threshold);
        EXPECT_FLOAT_EQ(first[i].decay_rate, second[i].decay_rate);
        EXPECT_EQ(first[i].role, second[i].role);

        EXPECT_GE(first[i].activation_threshold, 0.3f);
        EXPECT_LE(first[i].activation_threshold, 0.7f);
        EXPECT_GE(first[i].decay_rate, 0.9f);
        EXPECT_LE(first[i].decay_rate, 0.99f);
    }
}

TEST(NeuronHypernetworkTest, RolesFollowBatchPosition) {
    FeatureEncoder encoder;
    NeuronHypernetwork network;
    auto props = network.GenerateNeuronProperties(encoder.Encode("banana"), 10);

    EXPECT_EQ(NeuronRole::INPUT_RECEIVER, props[0].role);
    EXPECT_EQ(NeuronRole::INPUT_RECEIVER, props[1].role);
    EXPECT_EQ(NeuronRole::OUTPUT_GENERATOR, props[8].role);
    EXPECT_EQ(NeuronRole::OUTPUT_GENERATOR, props[9].role);
    for (size_t i = 2; i < 8; ++i) {
        EXPECT_TRUE(props[i].role == NeuronRole::PATTERN_DETECTOR ||
                    props[i].role == NeuronRole::INTEGRATOR);
    }
    EXPECT_STREQ("INTEGRATOR", ToString(NeuronRole::INTEGRATOR));
}

} // namespace
} // namespace engram
