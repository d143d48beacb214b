// File: tests/cluster/neuron_test.cpp
#include "cluster/neuron.hpp"
#include <gtest/gtest.h>
#include <chrono>
#include <sstream>

namespace engram {
namespace {

Neuron MakeNeuron() {
    NeuronProperties props;
    props.activation_threshold = 0.5f;
    props.decay_rate = 0.9f;
    props.role = NeuronRole::PATTERN_DETECTOR;
    return Neuron(NeuronID(7), props);
}

// ============================================================================
// Construction Tests
// ============================================================================

TEST(NeuronTest, StartsAtRest) {
    Neuron neuron = MakeNeuron();
    EXPECT_EQ(NeuronID(7), neuron.GetID());
    EXPECT_EQ(NeuronRole::PATTERN_DETECTOR, neuron.GetRole());
    EXPECT_FLOAT_EQ(Neuron::kRestingPotential, neuron.GetCurrentPotential());
    EXPECT_FLOAT_EQ(Neuron::kRestingPotential + 1.0f, neuron.GetThreshold());
    EXPECT_FLOAT_EQ(0.0f, neuron.ActivationAboveRest());
    EXPECT_FALSE(neuron.HasWeights());
}

// ============================================================================
// Firing Tests
// ============================================================================

TEST(NeuronTest, FiresAboveThreshold) {
    Neuron neuron = MakeNeuron();
    FeatureID feature(1);
    neuron.SetWeight(feature, 3.0f);

    float output = neuron.ProcessInputs({{feature, 1.0f}});
    EXPECT_GT(output, 0.99f);
    EXPECT_LE(output, 1.0f);
    EXPECT_EQ(1u, neuron.GetActivationCount());
    EXPECT_FLOAT_EQ(3.0f, neuron.ActivationAboveRest());
    EXPECT_GT(neuron.GetImportance(), 0.0f);
}

TEST(NeuronTest, SilentBelowThresholdDecaysPotential) {
    Neuron neuron = MakeNeuron();
    FeatureID feature(1);
    neuron.SetWeight(feature, 0.5f);

    EXPECT_FLOAT_EQ(0.0f, neuron.ProcessInputs({{feature, 1.0f}}));
    EXPECT_EQ(0u, neuron.GetActivationCount());
    EXPECT_NEAR(0.45f, neuron.ActivationAboveRest(), 1e-4f);
}

TEST(NeuronTest, UnknownFeaturesAreIgnored) {
    Neuron neuron = MakeNeuron();
    neuron.SetWeight(FeatureID(1), 3.0f);
    EXPECT_FLOAT_EQ(0.0f, neuron.ProcessInputs({{FeatureID(2), 1.0f}}));
}

TEST(NeuronTest, FatigueSilencesAndRestRecovers) {
    Neuron neuron = MakeNeuron();
    FeatureID feature(1);
    neuron.SetWeight(feature, Neuron::kMaxAbsWeight);

    int firings = 0;
    for (int i = 0; i < 20; ++i) {
        if (neuron.ProcessInputs({{feature, 1.0f}}) > 0.0f) {
            ++firings;
        }
    }
    EXPECT_GT(firings, 0);
    EXPECT_LT(firings, 20);
    EXPECT_GT(neuron.GetFatigue(), 0.0f);

    neuron.Rest(std::chrono::minutes(30));
    EXPECT_FLOAT_EQ(0.0f, neuron.GetFatigue());
    EXPECT_FLOAT_EQ(Neuron::kRestingPotential, neuron.GetCurrentPotential());
    EXPECT_GT(neuron.ProcessInputs({{feature, 1.0f}}), 0.0f);
}

// ============================================================================
// Learning Tests
// ============================================================================

TEST(NeuronTest, DeltaRuleMovesWeight) {
    Neuron neuron = MakeNeuron();
    FeatureID feature(3);
    neuron.SetWeight(feature, 1.0f);

    neuron.Learn(feature, 1.0f, 1.0f, 0.0f);
    EXPECT_FLOAT_EQ(1.0f, neuron.GetWeight(feature).value());
    EXPECT_TRUE(neuron.ConsolidateToLtm(1e-3f));
    EXPECT_FLOAT_EQ(1.1f, neuron.GetWeight(feature).value());

    neuron.Learn(feature, 1.0f, 0.0f, 1.0f);
    EXPECT_TRUE(neuron.ConsolidateToLtm(1e-3f));
    EXPECT_FLOAT_EQ(1.0f, neuron.GetWeight(feature).value());
}

TEST(NeuronTest, LearningAccumulatesInShortTermMemory) {
    Neuron neuron = MakeNeuron();
    FeatureID feature(3);
    EXPECT_FALSE(neuron.HasPendingStm());

    neuron.Learn(feature, 1.0f, 1.0f, 0.0f);
    neuron.Learn(feature, 0.5f, 1.0f, 0.0f);
    neuron.Learn(FeatureID(4), 0.0f, 1.0f, 0.0f);

    ASSERT_TRUE(neuron.HasPendingStm());
    EXPECT_EQ(1u, neuron.GetPendingDeltas().size());
    EXPECT_FLOAT_EQ(0.15f, neuron.GetPendingDeltas().at(feature));
    EXPECT_FLOAT_EQ(0.15f, neuron.GetStmSalience());
    EXPECT_FALSE(neuron.GetWeight(feature).has_value());

    EXPECT_TRUE(neuron.ConsolidateToLtm(1e-3f));
    EXPECT_FLOAT_EQ(0.15f, neuron.GetWeight(feature).value());
    EXPECT_FALSE(neuron.HasPendingStm());
    EXPECT_FLOAT_EQ(0.075f, neuron.GetStmSalience());
}

TEST(NeuronTest, ConsolidationSkipsSmallDeltasAndDropsVanishingWeights) {
    Neuron neuron = MakeNeuron();
    neuron.SetWeight(FeatureID(1), 0.1f);
    neuron.SetWeight(FeatureID(2), 2.0f);

    neuron.Learn(FeatureID(1), 1.0f, 0.0f, 1.0f);   // -0.1 cancels the weight
    neuron.Learn(FeatureID(2), 0.001f, 1.0f, 0.0f); // below epsilon

    EXPECT_TRUE(neuron.ConsolidateToLtm(1e-3f));
    EXPECT_FALSE(neuron.GetWeight(FeatureID(1)).has_value());
    EXPECT_FLOAT_EQ(2.0f, neuron.GetWeight(FeatureID(2)).value());
    EXPECT_FALSE(neuron.HasPendingStm());
    EXPECT_FALSE(neuron.ConsolidateToLtm(1e-3f));
}

TEST(NeuronTest, WeightsAreClamped) {
    Neuron neuron = MakeNeuron();
    neuron.SetWeight(FeatureID(1), 50.0f);
    neuron.SetWeight(FeatureID(2), -50.0f);
    EXPECT_FLOAT_EQ(Neuron::kMaxAbsWeight, neuron.GetWeight(FeatureID(1)).value());
    EXPECT_FLOAT_EQ(-Neuron::kMaxAbsWeight, neuron.GetWeight(FeatureID(2)).value());
    EXPECT_FALSE(neuron.GetWeight(FeatureID(3)).has_value());
}

TEST(NeuronTest, InitializeWeightsOnlyFillsGaps) {
    Neuron neuron = MakeNeuron();
    std::mt19937 rng(5);
    neuron.SetWeight(FeatureID(1), 0.25f);

    NeuronInputs inputs{{FeatureID(1), 1.0f}, {FeatureID(2), 1.0f}, {FeatureID(3), 0.5f}};
    EXPECT_EQ(2u, neuron.InitializeWeights(inputs, rng));
    EXPECT_EQ(0u, neuron.InitializeWeights(inputs, rng));

    EXPECT_FLOAT_EQ(0.25f, neuron.GetWeight(FeatureID(1)).value());
    for (FeatureID id : {FeatureID(2), FeatureID(3)}) {
        float w = neuron.GetWeight(id).value();
        EXPECT_GE(w, 1.5f);
        EXPECT_LE(w, 4.5f);
    }
}

// ============================================================================
// Serialization Tests
// ============================================================================

TEST(NeuronTest, SerializeRoundTrip) {
    Neuron neuron = MakeNeuron();
    neuron.SetWeight(FeatureID(1), 2.5f);
    neuron.AddConcept("apple");
    neuron.ProcessInputs({{FeatureID(1), 1.0f}});
    neuron.Learn(FeatureID(2), 1.0f, 1.0f, 0.0f);

    std::stringstream ss;
    neuron.Serialize(ss);
    Neuron restored = Neuron::Deserialize(ss);

    EXPECT_EQ(neuron.GetID(), restored.GetID());
    EXPECT_EQ(neuron.GetRole(), restored.GetRole());
    EXPECT_FLOAT_EQ(neuron.GetThreshold(), restored.GetThreshold());
    EXPECT_FLOAT_EQ(neuron.GetFatigue(), restored.GetFatigue());
    EXPECT_EQ(neuron.GetActivationCount(), restored.GetActivationCount());
    EXPECT_FLOAT_EQ(2.5f, restored.GetWeight(FeatureID(1)).value());
    EXPECT_TRUE(restored.HasConcept("apple"));
    EXPECT_EQ(neuron.GetCreatedAt(), restored.GetCreatedAt());
    ASSERT_TRUE(restored.HasPendingStm());
    EXPECT_FLOAT_EQ(0.1f, restored.GetPendingDeltas().at(FeatureID(2)));
    EXPECT_FLOAT_EQ(neuron.GetStmSalience(), restored.GetStmSalience());
}

TEST(NeuronTest, DeserializeRejectsUnknownFormat) {
    std::stringstream ss;
    io::WritePod<uint8_t>(ss, 99);
    EXPECT_THROW(Neuron::Deserialize(ss), std::runtime_error);
}

} // namespace
} // namespace engram
