// File: tests/synapse/sparse_synaptic_graph_test.cpp
#include "synapse/sparse_synaptic_graph.hpp"
#include <gtest/gtest.h>
#include <random>

namespace engram {
namespace {

class SparseSynapticGraphTest : public ::testing::Test {
protected:
    NeuronID a_{101};
    NeuronID b_{102};
    NeuronID c_{103};
};

// ============================================================================
// Coactivation Tests
// ============================================================================

TEST_F(SparseSynapticGraphTest, CoactivationCreatesSymmetricEdges) {
    SparseSynapticGraph graph;
    size_t touched = graph.RecordCoactivation({{a_, 1.0f}, {b_, 0.5f}});

    EXPECT_EQ(2u, touched);
    EXPECT_EQ(2u, graph.GetEdgeCount());
    EXPECT_NEAR(0.005f, graph.GetWeight(a_, b_).value(), 1e-7f);
    EXPECT_NEAR(0.005f, graph.GetWeight(b_, a_).value(), 1e-7f);
}

TEST_F(SparseSynapticGraphTest, WeakActivationsAreIgnored) {
    SparseSynapticGraph graph;
    EXPECT_EQ(0u, graph.RecordCoactivation({{a_, 1.0f}, {b_, 0.1f}}));
    EXPECT_EQ(0u, graph.RecordCoactivation({{a_, 1.0f}, {NeuronID(), 1.0f}}));
    EXPECT_EQ(0u, graph.GetEdgeCount());
}

TEST_F(SparseSynapticGraphTest, RepeatedCoactivationAccumulates) {
    SparseSynapticGraph graph;
    for (int i = 0; i < 3; ++i) {
        graph.RecordCoactivation({{a_, 1.0f}, {b_, 1.0f}, {c_, 1.0f}});
    }
    EXPECT_EQ(6u, graph.GetEdgeCount());
    EXPECT_NEAR(0.03f, graph.GetWeight(a_, c_).value(), 1e-6f);

    auto outgoing = graph.GetOutgoing(a_);
    ASSERT_EQ(2u, outgoing.size());
    EXPECT_EQ(3u, outgoing[0].coactivation_count);
}

TEST_F(SparseSynapticGraphTest, WeightsStayBounded) {
    SparseSynapticGraph::Config config;
    config.learning_rate = 0.7f;
    SparseSynapticGraph graph(config);

    std::mt19937 rng(3);
    std::uniform_real_distribution<float> strength(-2.0f, 3.0f);
    for (int i = 0; i < 200; ++i) {
        graph.RecordCoactivation({{a_, strength(rng)}, {b_, strength(rng)}, {c_, strength(rng)}});
    }
    for (const auto& synapse : graph.Export()) {
        EXPECT_GE(synapse.weight, config.min_weight);
        EXPECT_LE(synapse.weight, config.max_weight);
    }
}

// ============================================================================
// Connect Tests
// ============================================================================

TEST_F(SparseSynapticGraphTest, ConnectKeepsStrongerExistingWeight) {
    SparseSynapticGraph graph;
    ASSERT_TRUE(graph.Connect(a_, b_, 0.6f));

    EXPECT_TRUE(graph.Connect(a_, b_, 0.2f));
    EXPECT_FLOAT_EQ(0.6f, graph.GetWeight(a_, b_).value());

    EXPECT_TRUE(graph.Connect(a_, b_, 0.8f));
    EXPECT_FLOAT_EQ(0.8f, graph.GetWeight(a_, b_).value());
    EXPECT_EQ(1u, graph.GetEdgeCount());
}

TEST_F(SparseSynapticGraphTest, ConnectClampsAndRejectsSelfLinks) {
    SparseSynapticGraph graph;
    EXPECT_TRUE(graph.Connect(a_, b_, 4.0f));
    EXPECT_FLOAT_EQ(1.0f, graph.GetWeight(a_, b_).value());
    EXPECT_FALSE(graph.HasEdge(b_, a_));

    EXPECT_FALSE(graph.Connect(a_, a_, 0.5f));
    EXPECT_FALSE(graph.Connect(NeuronID(), b_, 0.5f));
    EXPECT_EQ(1u, graph.GetEdgeCount());
}

// ============================================================================
// Pruning and Aging Tests
// ============================================================================

TEST_F(SparseSynapticGraphTest, PruneRemovesWeakEdges) {
    SparseSynapticGraph graph;
    graph.Connect(a_, b_, 0.001f);
    graph.Connect(a_, c_, 0.5f);
    graph.Connect(b_, c_, 0.004f);

    EXPECT_EQ(2u, graph.Prune());
    EXPECT_EQ(1u, graph.GetEdgeCount());
    EXPECT_TRUE(graph.HasEdge(a_, c_));
    EXPECT_EQ(0u, graph.Prune());
}

TEST_F(SparseSynapticGraphTest, AgingDecaysThenPrunes) {
    SparseSynapticGraph graph;
    graph.Connect(a_, b_, 0.5f);
    graph.Connect(b_, c_, 0.00505f);

    EXPECT_EQ(1u, graph.AgeAll(1.0));
    EXPECT_NEAR(0.495f, graph.GetWeight(a_, b_).value(), 1e-6f);
    EXPECT_DOUBLE_EQ(1.0, graph.GetOutgoing(a_)[0].age_hours);
}

TEST_F(SparseSynapticGraphTest, CustomDecayFunction) {
    SparseSynapticGraph graph;
    graph.SetDecayFunction(std::make_unique<PowerLawDecay>(1.0f, 0.5f));
    graph.SetDecayFunction(nullptr);
    EXPECT_STREQ("PowerLawDecay", graph.GetDecayFunction().GetName());

    graph.Connect(a_, b_, 1.0f);
    graph.AgeAll(3.0);
    EXPECT_NEAR(0.5f, graph.GetWeight(a_, b_).value(), 1e-6f);
}

// ============================================================================
// Stats and Persistence Tests
// ============================================================================

TEST_F(SparseSynapticGraphTest, StatsDescribeGraph) {
    SparseSynapticGraph graph;
    EXPECT_EQ(0u, graph.GetStats().edge_count);

    graph.Connect(a_, b_, 0.2f);
    graph.Connect(b_, a_, 0.6f);
    graph.Connect(a_, c_, 0.4f);

    auto stats = graph.GetStats();
    EXPECT_EQ(3u, stats.edge_count);
    EXPECT_EQ(3u, stats.unique_neurons);
    EXPECT_NEAR(0.4f, stats.average_weight, 1e-6f);
    EXPECT_FLOAT_EQ(0.6f, stats.max_weight);
    EXPECT_FLOAT_EQ(0.2f, stats.min_weight);
    EXPECT_NEAR(0.5f, stats.sparsity, 1e-6f);
}

TEST_F(SparseSynapticGraphTest, ExportImportRestoresEdges) {
    SparseSynapticGraph graph;
    graph.RecordCoactivation({{a_, 1.0f}, {b_, 1.0f}});
    graph.Connect(b_, c_, 0.3f);

    std::vector<Synapse> records = graph.Export();
    records.emplace_back(c_, c_, 0.5f);
    records.emplace_back(a_, c_, 7.0f);

    SparseSynapticGraph restored;
    restored.Import(records);
    EXPECT_EQ(4u, restored.GetEdgeCount());
    EXPECT_FALSE(restored.HasEdge(c_, c_));
    EXPECT_FLOAT_EQ(1.0f, restored.GetWeight(a_, c_).value());
    EXPECT_FLOAT_EQ(graph.GetWeight(a_, b_).value(), restored.GetWeight(a_, b_).value());
    EXPECT_EQ(2u, restored.GetOutgoing(a_).size());

    // Imported ids are reserved so new neurons never reuse them
    EXPECT_GT(NeuronID::Generate(), c_);

    restored.Clear();
    EXPECT_EQ(0u, restored.GetEdgeCount());
}

} // namespace
} // namespace engram
