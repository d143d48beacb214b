// File: src/cluster/neuron_cluster.cpp
#include "cluster/neuron_cluster.hpp"
#include <algorithm>
#include <cmath>
#include <iostream>
#include <sstream>
#include <stdexcept>

namespace engram {

// ============================================================================
// ClusterSummary
// ============================================================================

void ClusterSummary::Serialize(std::ostream& out) const {
    id.Serialize(out);
    io::WriteString(out, label);
    io::WriteString(out, origin_region);
    io::WriteString(out, partition);
    io::WritePod<uint8_t>(out, centroid.has_value() ? 1 : 0);
    if (centroid) {
        centroid->Serialize(out);
    }
    io::WritePod<uint64_t>(out, neuron_count);
    io::WritePod(out, pattern_count);
    io::WritePod(out, importance);
    created_at.Serialize(out);
    last_access.Serialize(out);
}

ClusterSummary ClusterSummary::Deserialize(std::istream& in) {
    ClusterSummary summary;
    summary.id = ClusterID::Deserialize(in);
    summary.label = io::ReadString(in);
    summary.origin_region = io::ReadString(in);
    summary.partition = io::ReadString(in);
    if (io::ReadPod<uint8_t>(in) != 0) {
        summary.centroid = FeatureVector::Deserialize(in);
    }
    summary.neuron_count = static_cast<size_t>(io::ReadPod<uint64_t>(in));
    summary.pattern_count = io::ReadPod<uint64_t>(in);
    summary.importance = io::ReadPod<float>(in);
    summary.created_at = Timestamp::Deserialize(in);
    summary.last_access = Timestamp::Deserialize(in);
    return summary;
}

// ============================================================================
// Construction
// ============================================================================

NeuronCluster::NeuronCluster(ClusterID id, std::string label, RegionCode origin_region,
                             std::string partition, const Config& config)
    : id_(id),
      label_(std::move(label)),
      origin_region_(std::move(origin_region)),
      partition_(std::move(partition)),
      config_(config),
      created_at_(Timestamp::Now()),
      last_access_(created_at_) {}

NeuronCluster NeuronCluster::FromSummary(const ClusterSummary& summary, const Config& config) {
    NeuronCluster cluster(summary.id, summary.label, summary.origin_region,
                          summary.partition, config);
    cluster.centroid_ = summary.centroid;
    cluster.pattern_count_ = summary.pattern_count;
    cluster.unloaded_size_ = summary.neuron_count;
    cluster.unloaded_importance_ = summary.importance;
    cluster.created_at_ = summary.created_at;
    cluster.last_access_ = summary.last_access;
    cluster.loaded_ = false;
    cluster.dirty_ = false;
    return cluster;
}

size_t NeuronCluster::Size() const {
    return loaded_ ? neurons_.size() : unloaded_size_;
}

// ============================================================================
// Matching
// ============================================================================

float NeuronCluster::Similarity(const FeatureVector& query, const RegionCode& query_region) const {
    if (!centroid_ || centroid_->Dimension() != query.Dimension()) {
        return query_region == origin_region_ ? 0.8f : 0.5f;
    }
    return std::max(0.0f, centroid_->CosineSimilarity(query));
}

void NeuronCluster::UpdateCentroid(const FeatureVector& pattern) {
    ++pattern_count_;
    dirty_ = true;

    if (!centroid_ || centroid_->Dimension() != pattern.Dimension()) {
        centroid_ = pattern.Normalized();
        return;
    }

    float rate = std::clamp(config_.centroid_rate, 0.0f, 1.0f);
    FeatureVector moved = (*centroid_) * (1.0f - rate) + pattern * rate;
    centroid_ = moved.Normalized();
}

// ============================================================================
// Membership
// ============================================================================

std::vector<NeuronID> NeuronCluster::GrowTo(size_t target, const std::string& label,
                                            const std::vector<NeuronProperties>& properties) {
    if (!loaded_) {
        throw std::runtime_error("Cannot grow unloaded cluster " + id_.ToString());
    }

    std::vector<NeuronID> created;
    if (target <= neurons_.size()) {
        return created;
    }

    size_t delta = target - neurons_.size();
    created.reserve(delta);
    for (size_t i = 0; i < delta; ++i) {
        NeuronProperties props = i < properties.size() ? properties[i] : NeuronProperties{};
        NeuronID id = NeuronID::Generate();
        Neuron neuron(id, props);
        neuron.AddConcept(label);
        neurons_.emplace(id, std::move(neuron));
        created.push_back(id);
    }

    dirty_ = true;
    return created;
}

std::vector<NeuronID> NeuronCluster::FindNeuronsByConcept(const std::string& label) const {
    std::vector<NeuronID> found;
    for (const auto& [id, neuron] : neurons_) {
        if (neuron.HasConcept(label)) {
            found.push_back(id);
        }
    }
    return found;
}

size_t NeuronCluster::CountNeuronsByConcept(const std::string& label) const {
    return static_cast<size_t>(std::count_if(neurons_.begin(), neurons_.end(),
        [&label](const auto& entry) { return entry.second.HasConcept(label); }));
}

const Neuron* NeuronCluster::GetNeuron(NeuronID id) const {
    auto it = neurons_.find(id);
    return it != neurons_.end() ? &it->second : nullptr;
}

void NeuronCluster::InstallNeurons(std::vector<Neuron> neurons) {
    neurons_.clear();
    for (auto& neuron : neurons) {
        NeuronID id = neuron.GetID();
        NeuronID::ReserveThrough(id.value());
        neurons_.emplace(id, std::move(neuron));
    }
    loaded_ = true;
}

// ============================================================================
// Activity
// ============================================================================

std::vector<NeuronActivation> NeuronCluster::ProcessInputs(const NeuronInputs& inputs) {
    std::vector<NeuronActivation> outputs;
    for (auto& [id, neuron] : neurons_) {
        float output = neuron.ProcessInputs(inputs);
        if (std::abs(output) > config_.activity_threshold) {
            outputs.emplace_back(id, output);
        }
    }
    last_access_ = Timestamp::Now();
    return outputs;
}

TrainingOutcome NeuronCluster::Train(const NeuronInputs& inputs, float target, std::mt19937& rng) {
    TrainingOutcome outcome;
    for (auto& [id, neuron] : neurons_) {
        outcome.weights_created += neuron.InitializeWeights(inputs, rng);

        float actual = neuron.ProcessInputs(inputs);
        for (const auto& [feature, value] : inputs) {
            neuron.Learn(feature, value, target, actual);
        }

        if (actual > 0.0f) {
            outcome.fired.emplace_back(id, actual);
        }
        ++outcome.neurons_trained;
    }

    if (outcome.neurons_trained > 0) {
        dirty_ = true;
    }
    last_access_ = Timestamp::Now();
    return outcome;
}

size_t NeuronCluster::ConsolidateStm(size_t max_neurons, float epsilon) {
    std::vector<Neuron*> pending;
    for (auto& [id, neuron] : neurons_) {
        if (neuron.HasPendingStm()) {
            pending.push_back(&neuron);
        }
    }
    std::stable_sort(pending.begin(), pending.end(), [](const Neuron* a, const Neuron* b) {
        return a->GetStmSalience() > b->GetStmSalience();
    });
    if (pending.size() > max_neurons) {
        pending.resize(max_neurons);
    }

    size_t changed = 0;
    for (Neuron* neuron : pending) {
        if (neuron->ConsolidateToLtm(epsilon)) {
            ++changed;
        }
    }
    if (changed > 0) {
        dirty_ = true;
    }
    return changed;
}

size_t NeuronCluster::PendingStmCount() const {
    return static_cast<size_t>(std::count_if(neurons_.begin(), neurons_.end(),
        [](const auto& entry) { return entry.second.HasPendingStm(); }));
}

double NeuronCluster::ConceptActivation(const std::string& label) const {
    double total = 0.0;
    size_t count = 0;
    for (const auto& [id, neuron] : neurons_) {
        if (neuron.HasConcept(label)) {
            total += neuron.ActivationAboveRest();
            ++count;
        }
    }
    return count > 0 ? total / static_cast<double>(count) : 0.0;
}

float NeuronCluster::Importance() const {
    if (!loaded_) {
        return unloaded_importance_;
    }
    if (neurons_.empty()) {
        return 0.0f;
    }
    float total = 0.0f;
    for (const auto& [id, neuron] : neurons_) {
        total += neuron.GetImportance();
    }
    return total / static_cast<float>(neurons_.size());
}

void NeuronCluster::RestNeurons(Timestamp::Duration elapsed) {
    for (auto& [id, neuron] : neurons_) {
        neuron.Rest(elapsed);
    }
}

// ============================================================================
// Lifecycle
// ============================================================================

bool NeuronCluster::EnsureLoaded() {
    if (loaded_) {
        return true;
    }
    if (!loader_) {
        std::cerr << "NeuronCluster: no loader for " << id_.ToString() << std::endl;
        return false;
    }

    auto members = loader_(id_);
    if (!members) {
        std::cerr << "NeuronCluster: failed to hydrate " << id_.ToString() << std::endl;
        return false;
    }

    InstallNeurons(std::move(*members));
    return true;
}

void NeuronCluster::Unload() {
    if (!loaded_) {
        return;
    }
    unloaded_size_ = neurons_.size();
    unloaded_importance_ = Importance();
    neurons_.clear();
    loaded_ = false;
}

bool NeuronCluster::ShouldStayLoaded(Timestamp::Duration idle) const {
    return (Timestamp::Now() - last_access_) < idle;
}

ClusterSummary NeuronCluster::Summary() const {
    ClusterSummary summary;
    summary.id = id_;
    summary.label = label_;
    summary.origin_region = origin_region_;
    summary.partition = partition_;
    summary.centroid = centroid_;
    summary.neuron_count = Size();
    summary.pattern_count = pattern_count_;
    summary.importance = Importance();
    summary.created_at = created_at_;
    summary.last_access = last_access_;
    return summary;
}

std::string NeuronCluster::ToString() const {
    std::ostringstream oss;
    oss << "NeuronCluster{" << id_.ToString()
        << ", label=" << label_
        << ", region=" << origin_region_
        << ", partition=" << partition_
        << ", neurons=" << Size()
        << ", patterns=" << pattern_count_
        << (loaded_ ? "" : ", unloaded")
        << (dirty_ ? ", dirty" : "")
        << "}";
    return oss.str();
}

} // namespace engram
