// File: tests/cluster/neuron_cluster_test.cpp
#include "cluster/neuron_cluster.hpp"
#include <gtest/gtest.h>
#include <chrono>
#include <map>
#include <sstream>

namespace engram {
namespace {

class NeuronClusterTest : public ::testing::Test {
protected:
    NeuronCluster MakeCluster() {
        return NeuronCluster(ClusterID::Generate(), "apple", "r1", "p0");
    }

    FeatureVector Axis(size_t index, size_t dimension = 4) {
        FeatureVector v(dimension);
        v[index] = 1.0f;
        return v;
    }

    std::mt19937 rng_{17};
};

// ============================================================================
// Matching Tests
// ============================================================================

TEST_F(NeuronClusterTest, SimilarityFallsBackToRegion) {
    NeuronCluster cluster = MakeCluster();
    EXPECT_FLOAT_EQ(0.8f, cluster.Similarity(Axis(0), "r1"));
    EXPECT_FLOAT_EQ(0.5f, cluster.Similarity(Axis(0), "r2"));
}

TEST_F(NeuronClusterTest, FirstPatternSeedsCentroid) {
    NeuronCluster cluster = MakeCluster();
    cluster.UpdateCentroid(Axis(1) * 4.0f);

    ASSERT_TRUE(cluster.GetCentroid().has_value());
    EXPECT_EQ(Axis(1), *cluster.GetCentroid());
    EXPECT_EQ(1u, cluster.GetPatternCount());
    EXPECT_FLOAT_EQ(1.0f, cluster.Similarity(Axis(1), "other"));
    EXPECT_FLOAT_EQ(0.0f, cluster.Similarity(Axis(1) * -1.0f, "r1"));
}

TEST_F(NeuronClusterTest, CentroidMovesTowardNewPatterns) {
    NeuronCluster cluster = MakeCluster();
    cluster.UpdateCentroid(Axis(0));
    float before = cluster.Similarity(Axis(1), "r1");

    cluster.UpdateCentroid(Axis(1));
    EXPECT_GT(cluster.Similarity(Axis(1), "r1"), before);
    EXPECT_NEAR(1.0f, cluster.GetCentroid()->Norm(), 1e-5f);
}

// ============================================================================
// Membership Tests
// ============================================================================

TEST_F(NeuronClusterTest, GrowToCreatesOnlyDelta) {
    NeuronCluster cluster = MakeCluster();
    auto first = cluster.GrowTo(5, "apple", {});
    EXPECT_EQ(5u, first.size());

    auto second = cluster.GrowTo(8, "apple", {});
    EXPECT_EQ(3u, second.size());
    EXPECT_TRUE(cluster.GrowTo(4, "apple", {}).empty());
    EXPECT_EQ(8u, cluster.Size());
    EXPECT_EQ(8u, cluster.CountNeuronsByConcept("apple"));
    EXPECT_EQ(0u, cluster.CountNeuronsByConcept("pear"));
}

TEST_F(NeuronClusterTest, GrowToConsumesProperties) {
    NeuronCluster cluster = MakeCluster();
    NeuronProperties output;
    output.role = NeuronRole::OUTPUT_GENERATOR;

    auto created = cluster.GrowTo(2, "apple", {output});
    ASSERT_EQ(2u, created.size());
    EXPECT_EQ(NeuronRole::OUTPUT_GENERATOR, cluster.GetNeuron(created[0])->GetRole());
    EXPECT_EQ(NeuronRole::INTEGRATOR, cluster.GetNeuron(created[1])->GetRole());
    EXPECT_EQ(nullptr, cluster.GetNeuron(NeuronID()));
}

// ============================================================================
// Activity Tests
// ============================================================================

TEST_F(NeuronClusterTest, TrainingMakesMembersFire) {
    NeuronCluster cluster = MakeCluster();
    cluster.GrowTo(6, "apple", {});
    cluster.MarkSaved();

    NeuronInputs inputs{{FeatureID(1), 1.0f}, {FeatureID(2), 0.7f}};
    TrainingOutcome outcome = cluster.Train(inputs, 1.0f, rng_);

    EXPECT_EQ(6u, outcome.neurons_trained);
    EXPECT_EQ(12u, outcome.weights_created);
    EXPECT_EQ(6u, outcome.fired.size());
    EXPECT_TRUE(cluster.HasUnsavedChanges());

    auto outputs = cluster.ProcessInputs(inputs);
    EXPECT_FALSE(outputs.empty());
    EXPECT_GT(cluster.ConceptActivation("apple"), 0.0);
    EXPECT_DOUBLE_EQ(0.0, cluster.ConceptActivation("pear"));
}

TEST_F(NeuronClusterTest, RestReturnsMembersToRest) {
    NeuronCluster cluster = MakeCluster();
    cluster.GrowTo(3, "apple", {});
    NeuronInputs inputs{{FeatureID(1), 1.0f}};
    cluster.Train(inputs, 1.0f, rng_);
    ASSERT_GT(cluster.ConceptActivation("apple"), 0.0);

    cluster.RestNeurons(std::chrono::minutes(10));
    EXPECT_DOUBLE_EQ(0.0, cluster.ConceptActivation("apple"));
}

TEST_F(NeuronClusterTest, TrainingBuffersDeltasUntilConsolidated) {
    NeuronCluster cluster = MakeCluster();
    cluster.GrowTo(6, "apple", {});
    NeuronInputs inputs{{FeatureID(1), 1.0f}};
    cluster.Train(inputs, 0.0f, rng_);

    std::map<NeuronID, float> before;
    for (const auto& [id, neuron] : cluster.GetNeurons()) {
        before[id] = neuron.GetWeight(FeatureID(1)).value();
    }
    EXPECT_EQ(6u, cluster.PendingStmCount());
    cluster.MarkSaved();

    EXPECT_EQ(2u, cluster.ConsolidateStm(2, 1e-3f));
    EXPECT_EQ(4u, cluster.PendingStmCount());
    EXPECT_TRUE(cluster.HasUnsavedChanges());

    EXPECT_EQ(4u, cluster.ConsolidateStm(10, 1e-3f));
    EXPECT_EQ(0u, cluster.PendingStmCount());
    for (const auto& [id, neuron] : cluster.GetNeurons()) {
        EXPECT_LT(neuron.GetWeight(FeatureID(1)).value(), before[id]);
    }
    EXPECT_EQ(0u, cluster.ConsolidateStm(10, 1e-3f));
}

TEST_F(NeuronClusterTest, DeltasBelowEpsilonAreDiscarded) {
    NeuronCluster cluster = MakeCluster();
    cluster.GrowTo(3, "apple", {});
    cluster.Train({{FeatureID(1), 1.0f}}, 0.0f, rng_);
    cluster.MarkSaved();

    EXPECT_EQ(0u, cluster.ConsolidateStm(10, 5.0f));
    EXPECT_EQ(0u, cluster.PendingStmCount());
    EXPECT_FALSE(cluster.HasUnsavedChanges());
}

// ============================================================================
// Lifecycle Tests
// ============================================================================

TEST_F(NeuronClusterTest, SummaryRoundTrip) {
    NeuronCluster cluster = MakeCluster();
    cluster.UpdateCentroid(Axis(2));
    cluster.GrowTo(4, "apple", {});

    std::stringstream ss;
    cluster.Summary().Serialize(ss);
    ClusterSummary summary = ClusterSummary::Deserialize(ss);

    EXPECT_EQ(cluster.GetID(), summary.id);
    EXPECT_EQ("apple", summary.label);
    EXPECT_EQ("r1", summary.origin_region);
    EXPECT_EQ("p0", summary.partition);
    EXPECT_EQ(4u, summary.neuron_count);
    ASSERT_TRUE(summary.centroid.has_value());
    EXPECT_EQ(Axis(2), *summary.centroid);
}

TEST_F(NeuronClusterTest, UnloadedClusterHydratesThroughLoader) {
    NeuronCluster source = MakeCluster();
    source.GrowTo(3, "apple", {});
    std::vector<Neuron> members;
    for (const auto& [id, neuron] : source.GetNeurons()) {
        members.push_back(neuron);
    }

    NeuronCluster cluster = NeuronCluster::FromSummary(source.Summary());
    EXPECT_FALSE(cluster.IsLoaded());
    EXPECT_FALSE(cluster.HasUnsavedChanges());
    EXPECT_EQ(3u, cluster.Size());
    EXPECT_THROW(cluster.GrowTo(5, "apple", {}), std::runtime_error);

    // No loader installed
    EXPECT_FALSE(cluster.EnsureLoaded());

    int calls = 0;
    cluster.SetLoader([&](ClusterID id) -> std::optional<std::vector<Neuron>> {
        ++calls;
        EXPECT_EQ(source.GetID(), id);
        return members;
    });
    EXPECT_TRUE(cluster.EnsureLoaded());
    EXPECT_TRUE(cluster.EnsureLoaded());
    EXPECT_EQ(1, calls);
    EXPECT_EQ(3u, cluster.CountNeuronsByConcept("apple"));
}

TEST_F(NeuronClusterTest, FailingLoaderLeavesClusterUnloaded) {
    NeuronCluster cluster = NeuronCluster::FromSummary(MakeCluster().Summary());
    cluster.SetLoader([](ClusterID) -> std::optional<std::vector<Neuron>> {
        return std::nullopt;
    });
    EXPECT_FALSE(cluster.EnsureLoaded());
    EXPECT_FALSE(cluster.IsLoaded());
}

TEST_F(NeuronClusterTest, UnloadKeepsSummaryFacts) {
    NeuronCluster cluster = MakeCluster();
    cluster.GrowTo(4, "apple", {});
    cluster.Unload();

    EXPECT_FALSE(cluster.IsLoaded());
    EXPECT_EQ(4u, cluster.Size());
    EXPECT_TRUE(cluster.GetNeurons().empty());
}

TEST_F(NeuronClusterTest, IdleWindow) {
    NeuronCluster cluster = MakeCluster();
    cluster.Touch();
    EXPECT_TRUE(cluster.ShouldStayLoaded(std::chrono::hours(1)));
    EXPECT_FALSE(cluster.ShouldStayLoaded(std::chrono::microseconds(0)));
}

} // namespace
} // namespace engram
