// File: src/synapse/sparse_synaptic_graph.hpp
#pragma once

#include "cluster/neuron.hpp"
#include "synapse/decay_functions.hpp"
#include "synapse/synapse.hpp"
#include <memory>
#include <optional>
#include <unordered_map>
#include <vector>

namespace engram {

/// SparseSynapticGraph: Hebbian co-activation graph over neurons
///
/// Adjacency is source -> (target -> Synapse). Every weight stays within
/// [min_weight, max_weight]; edges that fall below prune_threshold are
/// removed by Prune() and AgeAll().
class SparseSynapticGraph {
public:
    struct Config {
        Config() = default;

        float learning_rate{0.01f};
        float min_weight{0.0f};
        float max_weight{1.0f};
        float prune_threshold{0.005f};
        float coactivation_floor{0.1f};  // strengths at or below are ignored
        float decay_factor{0.99f};       // per-hour retention for AgeAll
    };

    struct Stats {
        size_t edge_count{0};
        size_t unique_neurons{0};
        float average_weight{0.0f};
        float max_weight{0.0f};
        float min_weight{0.0f};
        float sparsity{1.0f};
    };

    SparseSynapticGraph();
    explicit SparseSynapticGraph(const Config& config);

    // ========================================================================
    // Learning
    // ========================================================================

    /// Strengthen every pair of co-active neurons in both directions
    ///
    /// delta = learning_rate * s_i * s_j for pairs with both strengths above
    /// the floor. Missing edges are created.
    /// @return Number of directed edges touched
    size_t RecordCoactivation(const std::vector<NeuronActivation>& activations);

    /// Create a directed edge, or raise an existing one to `weight` (clamped)
    /// @return false for self links or invalid ids
    bool Connect(NeuronID source, NeuronID target, float weight);

    /// Remove edges below prune_threshold
    /// @return Number of edges removed
    size_t Prune();

    /// Apply the decay function for `hours`, age every edge, then prune
    /// @return Number of edges removed
    size_t AgeAll(double hours);

    /// Replace the decay function (defaults to ExponentialDecay(decay_factor))
    void SetDecayFunction(std::unique_ptr<DecayFunction> decay);
    const DecayFunction& GetDecayFunction() const { return *decay_; }

    // ========================================================================
    // Queries
    // ========================================================================

    std::optional<float> GetWeight(NeuronID source, NeuronID target) const;
    bool HasEdge(NeuronID source, NeuronID target) const;
    std::vector<Synapse> GetOutgoing(NeuronID source) const;

    size_t GetEdgeCount() const { return edge_count_; }
    size_t GetNeuronCount() const;

    Stats GetStats() const;

    // ========================================================================
    // Persistence
    // ========================================================================

    std::vector<Synapse> Export() const;

    /// Replace the graph with the given records; weights are clamped,
    /// self links and invalid ids are skipped
    void Import(const std::vector<Synapse>& synapses);

    void Clear();

    const Config& GetConfig() const { return config_; }

private:
    Config config_;
    std::unique_ptr<DecayFunction> decay_;

    std::unordered_map<NeuronID, std::unordered_map<NeuronID, Synapse>> adjacency_;
    size_t edge_count_{0};

    float ClampWeight(float weight) const;
    Synapse& GetOrCreate(NeuronID source, NeuronID target);
};

} // namespace engram
