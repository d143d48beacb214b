// File: src/synapse/sparse_synaptic_graph.cpp
#include "synapse/sparse_synaptic_graph.hpp"
#include <algorithm>
#include <limits>
#include <unordered_set>

namespace engram {

SparseSynapticGraph::SparseSynapticGraph() : SparseSynapticGraph(Config()) {}

SparseSynapticGraph::SparseSynapticGraph(const Config& config)
    : config_(config) {
    if (config_.min_weight > config_.max_weight) {
        std::swap(config_.min_weight, config_.max_weight);
    }
    decay_ = std::make_unique<ExponentialDecay>(config_.decay_factor);
}

float SparseSynapticGraph::ClampWeight(float weight) const {
    return std::clamp(weight, config_.min_weight, config_.max_weight);
}

Synapse& SparseSynapticGraph::GetOrCreate(NeuronID source, NeuronID target) {
    auto& outgoing = adjacency_[source];
    auto it = outgoing.find(target);
    if (it == outgoing.end()) {
        it = outgoing.emplace(target, Synapse(source, target, ClampWeight(0.0f))).first;
        ++edge_count_;
    }
    return it->second;
}

// ============================================================================
// Learning
// ============================================================================

size_t SparseSynapticGraph::RecordCoactivation(const std::vector<NeuronActivation>& activations) {
    std::vector<NeuronActivation> active;
    active.reserve(activations.size());
    for (const auto& entry : activations) {
        if (entry.first.IsValid() && entry.second > config_.coactivation_floor) {
            active.push_back(entry);
        }
    }

    Timestamp now = Timestamp::Now();
    size_t touched = 0;
    for (size_t i = 0; i < active.size(); ++i) {
        for (size_t j = i + 1; j < active.size(); ++j) {
            const auto& [a, sa] = active[i];
            const auto& [b, sb] = active[j];
            if (a == b) {
                continue;
            }

            float delta = config_.learning_rate * sa * sb;
            for (const auto& [from, to] : {std::make_pair(a, b), std::make_pair(b, a)}) {
                Synapse& synapse = GetOrCreate(from, to);
                synapse.weight = ClampWeight(synapse.weight + delta);
                synapse.coactivation_count++;
                synapse.last_reinforced = now;
                ++touched;
            }
        }
    }
    return touched;
}

bool SparseSynapticGraph::Connect(NeuronID source, NeuronID target, float weight) {
    if (!source.IsValid() || !target.IsValid() || source == target) {
        return false;
    }
    bool existed = HasEdge(source, target);
    Synapse& synapse = GetOrCreate(source, target);
    // Never weakens an edge that learning already strengthened
    synapse.weight = existed ? std::max(synapse.weight, ClampWeight(weight)) : ClampWeight(weight);
    synapse.last_reinforced = Timestamp::Now();
    return true;
}

size_t SparseSynapticGraph::Prune() {
    size_t removed = 0;
    for (auto it = adjacency_.begin(); it != adjacency_.end();) {
        auto& outgoing = it->second;
        for (auto edge = outgoing.begin(); edge != outgoing.end();) {
            if (edge->second.weight < config_.prune_threshold) {
                edge = outgoing.erase(edge);
                ++removed;
            } else {
                ++edge;
            }
        }
        if (outgoing.empty()) {
            it = adjacency_.erase(it);
        } else {
            ++it;
        }
    }
    edge_count_ -= removed;
    return removed;
}

size_t SparseSynapticGraph::AgeAll(double hours) {
    if (hours > 0.0) {
        for (auto& [source, outgoing] : adjacency_) {
            for (auto& [target, synapse] : outgoing) {
                synapse.weight = ClampWeight(decay_->ApplyDecay(synapse.weight, hours));
                synapse.age_hours += hours;
            }
        }
    }
    return Prune();
}

void SparseSynapticGraph::SetDecayFunction(std::unique_ptr<DecayFunction> decay) {
    if (decay) {
        decay_ = std::move(decay);
    }
}

// ============================================================================
// Queries
// ============================================================================

std::optional<float> SparseSynapticGraph::GetWeight(NeuronID source, NeuronID target) const {
    auto it = adjacency_.find(source);
    if (it == adjacency_.end()) {
        return std::nullopt;
    }
    auto edge = it->second.find(target);
    if (edge == it->second.end()) {
        return std::nullopt;
    }
    return edge->second.weight;
}

bool SparseSynapticGraph::HasEdge(NeuronID source, NeuronID target) const {
    return GetWeight(source, target).has_value();
}

std::vector<Synapse> SparseSynapticGraph::GetOutgoing(NeuronID source) const {
    std::vector<Synapse> result;
    auto it = adjacency_.find(source);
    if (it == adjacency_.end()) {
        return result;
    }
    result.reserve(it->second.size());
    for (const auto& [target, synapse] : it->second) {
        result.push_back(synapse);
    }
    return result;
}

size_t SparseSynapticGraph::GetNeuronCount() const {
    std::unordered_set<NeuronID> neurons;
    for (const auto& [source, outgoing] : adjacency_) {
        neurons.insert(source);
        for (const auto& [target, synapse] : outgoing) {
            neurons.insert(target);
        }
    }
    return neurons.size();
}

SparseSynapticGraph::Stats SparseSynapticGraph::GetStats() const {
    Stats stats;
    stats.edge_count = edge_count_;
    stats.unique_neurons = GetNeuronCount();
    if (edge_count_ == 0) {
        return stats;
    }

    double total = 0.0;
    stats.max_weight = std::numeric_limits<float>::lowest();
    stats.min_weight = std::numeric_limits<float>::max();
    for (const auto& [source, outgoing] : adjacency_) {
        for (const auto& [target, synapse] : outgoing) {
            total += synapse.weight;
            stats.max_weight = std::max(stats.max_weight, synapse.weight);
            stats.min_weight = std::min(stats.min_weight, synapse.weight);
        }
    }
    stats.average_weight = static_cast<float>(total / static_cast<double>(edge_count_));

    double n = static_cast<double>(stats.unique_neurons);
    double possible = n * (n - 1.0);
    if (possible > 0.0) {
        stats.sparsity = static_cast<float>(1.0 - static_cast<double>(edge_count_) / possible);
    }
    return stats;
}

// ============================================================================
// Persistence
// ============================================================================

std::vector<Synapse> SparseSynapticGraph::Export() const {
    std::vector<Synapse> synapses;
    synapses.reserve(edge_count_);
    for (const auto& [source, outgoing] : adjacency_) {
        for (const auto& [target, synapse] : outgoing) {
            synapses.push_back(synapse);
        }
    }
    return synapses;
}

void SparseSynapticGraph::Import(const std::vector<Synapse>& synapses) {
    Clear();
    for (const auto& record : synapses) {
        if (!record.source.IsValid() || !record.target.IsValid() || record.source == record.target) {
            continue;
        }
        NeuronID::ReserveThrough(std::max(record.source.value(), record.target.value()));
        Synapse& synapse = GetOrCreate(record.source, record.target);
        synapse = record;
        synapse.weight = ClampWeight(record.weight);
    }
}

void SparseSynapticGraph::Clear() {
    adjacency_.clear();
    edge_count_ = 0;
}

} // namespace engram
