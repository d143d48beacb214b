// File: src/cluster/neuron_cluster.hpp
#pragma once

#include "cluster/neuron.hpp"
#include "core/feature_vector.hpp"
#include "core/types.hpp"
#include <functional>
#include <map>
#include <optional>
#include <random>
#include <string>
#include <utility>
#include <vector>

namespace engram {

// ClusterSummary: Everything about a cluster except its neurons.
// This is what the cluster index holds for clusters that are not loaded.
struct ClusterSummary {
    ClusterID id;
    std::string label;
    RegionCode origin_region;
    std::string partition;
    std::optional<FeatureVector> centroid;
    size_t neuron_count{0};
    uint64_t pattern_count{0};
    float importance{0.0f};
    Timestamp created_at;
    Timestamp last_access;

    void Serialize(std::ostream& out) const;
    static ClusterSummary Deserialize(std::istream& in);
};

// Result of presenting a training example to every member
struct TrainingOutcome {
    std::vector<NeuronActivation> fired;
    size_t neurons_trained{0};
    size_t weights_created{0};
};

// NeuronCluster: Group of neurons sharing one region of feature space
//
// A cluster is either loaded (neurons in memory) or a summary only. Lazy
// hydration goes through the loader installed by the storage layer.
class NeuronCluster {
public:
    struct Config {
        Config();
        float centroid_rate{0.1f};        // EMA rate for centroid updates
        float activity_threshold{0.001f}; // |output| kept by ProcessInputs
    };

    // Returns the members of a cluster, or nullopt when they cannot be read
    using Loader = std::function<std::optional<std::vector<Neuron>>(ClusterID)>;

    /// Create a new, empty, loaded cluster
    NeuronCluster(ClusterID id, std::string label, RegionCode origin_region,
                  std::string partition, const Config& config = Config());

    /// Create an unloaded cluster from its index entry
    static NeuronCluster FromSummary(const ClusterSummary& summary,
                                     const Config& config = Config());

    // ========================================================================
    // Identity
    // ========================================================================

    ClusterID GetID() const { return id_; }
    const std::string& GetLabel() const { return label_; }
    const RegionCode& GetOriginRegion() const { return origin_region_; }
    const std::string& GetPartition() const { return partition_; }
    const std::optional<FeatureVector>& GetCentroid() const { return centroid_; }
    uint64_t GetPatternCount() const { return pattern_count_; }
    Timestamp GetCreatedAt() const { return created_at_; }
    Timestamp GetLastAccess() const { return last_access_; }

    /// Neuron count; known from the summary even when unloaded
    size_t Size() const;

    bool IsLoaded() const { return loaded_; }

    // ========================================================================
    // Matching
    // ========================================================================

    /// Similarity of a query to this cluster in [0,1]
    ///
    /// max(0, cosine) to the centroid. Without a centroid: 0.8 when the
    /// query region equals the origin region, else 0.5.
    float Similarity(const FeatureVector& query, const RegionCode& query_region) const;

    /// Move the centroid toward a new pattern
    ///
    /// The first pattern seeds the centroid; later ones apply an EMA at
    /// centroid_rate followed by renormalization.
    void UpdateCentroid(const FeatureVector& pattern);

    // ========================================================================
    // Membership
    // ========================================================================

    /// Grow to `target` neurons, creating only the delta. Properties are
    /// consumed in order; missing entries use defaults.
    /// @return Ids of the neurons created
    /// @throws std::runtime_error if the cluster is not loaded
    std::vector<NeuronID> GrowTo(size_t target, const std::string& label,
                                 const std::vector<NeuronProperties>& properties);

    std::vector<NeuronID> FindNeuronsByConcept(const std::string& label) const;
    size_t CountNeuronsByConcept(const std::string& label) const;

    const Neuron* GetNeuron(NeuronID id) const;
    const std::map<NeuronID, Neuron>& GetNeurons() const { return neurons_; }

    /// Install hydrated members and mark the cluster loaded
    void InstallNeurons(std::vector<Neuron> neurons);

    // ========================================================================
    // Activity
    // ========================================================================

    /// Present inputs to every member without learning
    /// @return Members whose |output| exceeds the activity threshold
    std::vector<NeuronActivation> ProcessInputs(const NeuronInputs& inputs);

    /// Initialize weights, process and buffer the delta rule toward `target`
    /// in every member's short-term memory
    TrainingOutcome Train(const NeuronInputs& inputs, float target, std::mt19937& rng);

    /// Promote short-term deltas into weights for at most `max_neurons`
    /// members with pending deltas, most salient first
    /// @return Number of members whose weights changed
    size_t ConsolidateStm(size_t max_neurons, float epsilon);

    /// Members with buffered deltas
    size_t PendingStmCount() const;

    /// Mean depolarization of the neurons tagged with a concept
    double ConceptActivation(const std::string& label) const;

    /// Mean importance of the members
    float Importance() const;

    void RestNeurons(Timestamp::Duration elapsed);

    void Touch() { last_access_ = Timestamp::Now(); }

    // ========================================================================
    // Lifecycle
    // ========================================================================

    void SetLoader(Loader loader) { loader_ = std::move(loader); }

    /// Hydrate members through the loader if needed
    /// @return false when the loader is missing or fails
    bool EnsureLoaded();

    /// Drop members from memory, keeping the summary
    void Unload();

    /// True while the cluster was accessed within `idle`
    bool ShouldStayLoaded(Timestamp::Duration idle) const;

    bool HasUnsavedChanges() const { return dirty_; }
    void MarkDirty() { dirty_ = true; }
    void MarkSaved() { dirty_ = false; }

    ClusterSummary Summary() const;

    std::string ToString() const;

private:
    ClusterID id_;
    std::string label_;
    RegionCode origin_region_;
    std::string partition_;
    Config config_;

    std::optional<FeatureVector> centroid_;
    uint64_t pattern_count_{0};

    std::map<NeuronID, Neuron> neurons_;
    size_t unloaded_size_{0};
    float unloaded_importance_{0.0f};
    bool loaded_{true};
    bool dirty_{true};

    Timestamp created_at_;
    Timestamp last_access_;

    Loader loader_;
};

inline NeuronCluster::Config::Config() = default;

} // namespace engram
