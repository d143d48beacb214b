// File: src/engine/orchestrator.hpp
#pragma once

#include "allocation/capacity_controller.hpp"
#include "allocation/neuron_hypernetwork.hpp"
#include "cluster/neuron_cluster.hpp"
#include "config/engine_config.hpp"
#include "core/load_result.hpp"
#include "encoding/feature_encoder.hpp"
#include "engine/feature_mapper.hpp"
#include "quantization/codebook_quantizer.hpp"
#include "quantization/region_quantizer.hpp"
#include "stats/activation_stats.hpp"
#include "storage/brain_storage.hpp"
#include "synapse/sparse_synaptic_graph.hpp"
#include <deque>
#include <map>
#include <memory>
#include <optional>
#include <random>
#include <set>
#include <string>
#include <unordered_map>
#include <vector>

namespace engram {

/// Status of every persisted family after Initialize()
struct LoadReport {
    LoadStatus feature_map{LoadStatus::kAbsent};
    LoadStatus counters{LoadStatus::kAbsent};
    LoadStatus synapses{LoadStatus::kAbsent};
    LoadStatus cluster_index{LoadStatus::kAbsent};
    LoadStatus region_map{LoadStatus::kAbsent};
    LoadStatus capacities{LoadStatus::kAbsent};
    LoadStatus activation_stats{LoadStatus::kAbsent};
    LoadStatus codebook{LoadStatus::kAbsent};

    size_t clusters_indexed{0};
    size_t synapses_loaded{0};
    size_t features_loaded{0};

    /// True when no family was found at all
    bool IsColdStart() const;

    /// True when at least one family failed to decode
    bool HasCorruption() const;

    std::string ToString() const;
};

/// Outcome of one LearnConcept() call
struct LearningResult {
    ClusterID cluster_id;
    bool success{false};
    size_t neurons_involved{0};   // neurons tagged with the concept after growth
    size_t neurons_created{0};
    bool created_cluster{false};
    RegionCode region;
    float novelty{0.0f};
};

/// Outcome of one ProcessInput() call
struct ProcessingResult {
    std::string response;
    std::vector<ClusterID> activated_clusters;
    size_t activated_neuron_count{0};
    double confidence{0.0};
};

/// Summary of one Maintenance() pass
struct MaintenanceReport {
    size_t clusters_saved{0};
    size_t clusters_unloaded{0};
    size_t synapses_pruned{0};
    size_t regions_pruned{0};
    size_t neurons_consolidated{0};
};

/// Orchestrator: Owns every subsystem and runs the learn and process pipelines
///
/// Learn pipeline:
///   Encode -> Quantize -> Match/Create -> Size -> Grow -> Train
///          -> Hebbian update -> Capacity adjust -> Link
///
/// The orchestrator is single-writer: callers serialize LearnConcept,
/// ProcessInput, Save and Maintenance. Only partition writes inside Save()
/// run in parallel.
class Orchestrator {
public:
    /// Engine statistics
    struct Stats {
        size_t loaded_clusters{0};
        size_t total_clusters{0};
        size_t total_neurons{0};
        size_t synapse_count{0};
        uint64_t neurons_created{0};
        uint64_t concepts_learned{0};
        uint64_t inputs_processed{0};
        uint64_t storage_bytes{0};
        double uptime_seconds{0.0};
    };

    /// Stats plus per-subsystem detail
    struct EnhancedStats {
        Stats engine;
        std::vector<BrainStorage::PartitionStats> partitions;
        std::optional<CodebookQuantizer::Stats> codebook;
        SparseSynapticGraph::Stats synapses;
        size_t activation_regions{0};
        uint64_t total_activations{0};
        size_t capacity_entries{0};
        size_t feature_count{0};
    };

    /// Number of recently learned clusters remembered for cross-cluster links
    static constexpr size_t kRecentClusterWindow = 32;

    /// @throws std::invalid_argument for an invalid configuration
    /// @throws std::runtime_error if storage cannot be opened
    explicit Orchestrator(const EngineConfig& config);

    ~Orchestrator() = default;

    Orchestrator(const Orchestrator&) = delete;
    Orchestrator& operator=(const Orchestrator&) = delete;

    // ========================================================================
    // Lifecycle
    // ========================================================================

    /// Load every persisted family. Idempotent: later calls return the
    /// first report without touching storage.
    LoadReport Initialize();

    bool IsInitialized() const { return initialized_; }

    /// Consolidate short-term learning, then persist everything that
    /// changed since the last save
    /// @return true when every family was written
    bool Save();

    /// Consolidate short-term learning, unload idle clusters, prune and
    /// age synapses, rest neurons
    MaintenanceReport Maintenance();

    // ========================================================================
    // Pipelines
    // ========================================================================

    /// Learn a concept from named features
    /// @param label Concept label (trimmed, lower-cased; empty fails)
    /// @param features Named features; the label itself is always added
    ///        as a feature of value 1.0 unless already present
    LearningResult LearnConcept(const std::string& label, const FeatureMap& features);

    /// Present an input to the most relevant clusters
    ///
    /// Without features, each extracted concept word that is a known
    /// feature is presented with value 1.0.
    ProcessingResult ProcessInput(const std::string& input, const FeatureMap& features);

    /// Mean depolarization above rest of the neurons tagged with a concept
    /// in its best candidate clusters; 0 for unknown concepts
    double GetConceptMasteryLevel(const std::string& label);

    // ========================================================================
    // Inspection
    // ========================================================================

    Stats GetStats() const;
    EnhancedStats GetEnhancedStats() const;

    const NeuronCluster* GetCluster(ClusterID id) const;
    std::vector<ClusterID> GetClusterIDs() const;

    /// Clusters known to hold neurons tagged with a concept
    std::vector<ClusterID> ClustersForConcept(const std::string& label) const;

    const RegionMap& GetRegionMap() const { return region_map_; }
    const SparseSynapticGraph& GetSynapticGraph() const { return graph_; }
    const ActivationStats& GetActivationStats() const { return activation_stats_; }
    const ConceptCapacityController& GetCapacityController() const { return capacity_; }
    const FeatureMapper& GetFeatureMapper() const { return features_; }
    const RegionQuantizer& GetQuantizer() const { return *quantizer_; }
    const BrainStorage& GetStorage() const { return *storage_; }
    const EngineConfig& GetConfig() const { return config_; }

    /// Codebook quantizer when that strategy is configured
    const CodebookQuantizer* GetCodebook() const;

    // ========================================================================
    // Helpers
    // ========================================================================

    /// Quantizer for a configured strategy name
    /// @throws std::invalid_argument for unknown strategies
    static std::unique_ptr<RegionQuantizer> CreateQuantizer(const EngineConfig& config);

    /// Distinct lower-cased words longer than two characters, punctuation
    /// stripped, in order of first appearance
    static std::vector<std::string> ExtractConcepts(const std::string& input);

    /// Trimmed, lower-cased concept label
    static std::string NormalizeLabel(const std::string& label);

private:
    EngineConfig config_;

    // Subsystems
    FeatureEncoder encoder_;
    std::unique_ptr<RegionQuantizer> quantizer_;
    ActivationStats activation_stats_;
    NeuronHypernetwork hypernetwork_;
    ConceptCapacityController capacity_;
    SparseSynapticGraph graph_;
    FeatureMapper features_;
    std::unique_ptr<BrainStorage> storage_;

    // Cluster state
    std::map<ClusterID, NeuronCluster> clusters_;
    RegionMap region_map_;
    std::unordered_map<std::string, std::set<ClusterID>> concept_affinity_;
    std::deque<ClusterID> recent_clusters_;

    std::mt19937 rng_;

    bool initialized_{false};
    LoadReport load_report_;

    // Statistics tracking
    Timestamp started_at_;
    Timestamp last_maintenance_;
    uint64_t neurons_created_{0};
    uint64_t concepts_learned_{0};
    uint64_t inputs_processed_{0};

    // Learn pipeline stages
    NeuronCluster* MatchOrCreateCluster(const std::string& label, const FeatureVector& vector,
                                        const RegionCode& region, bool& created);
    size_t GrowForConcept(NeuronCluster& cluster, const std::string& label,
                          const FeatureVector& vector, int target);
    void RecordHebbian(const TrainingOutcome& outcome);
    void LinkToRecentClusters(NeuronCluster& cluster, const std::string& label);
    void RememberRecent(ClusterID id);

    /// Clusters registered under the regions plus those with affinity to the label
    std::set<ClusterID> CandidateClusters(const std::vector<RegionCode>& regions,
                                          const std::string& label) const;

    /// Hydrate a cluster, indexing the concepts of its neurons on first load
    bool Hydrate(NeuronCluster& cluster);

    /// Read-only conversion of named features; unknown names are skipped
    NeuronInputs LookupInputs(const FeatureMap& features) const;

    NeuronCluster& AddCluster(NeuronCluster cluster);
    NeuronCluster::Loader MakeLoader(const std::string& partition);

    /// Write dirty clusters and upsert the index rows of those written
    size_t SaveDirtyClusters(const std::vector<NeuronCluster*>& clusters);

    bool SaveCounters();

    /// Promote buffered deltas in every loaded cluster, within the
    /// per-cluster budget
    size_t ConsolidateLoadedClusters();

    static std::string BuildResponse(const std::vector<NeuronActivation>& outputs,
                                     const std::vector<std::string>& concepts);
};

} // namespace engram
