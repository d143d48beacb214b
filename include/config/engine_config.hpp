// File: include/config/engine_config.hpp
//
// YAML configuration for the engram engine.
// Every subsystem reads its settings from one section of this file.

#ifndef ENGRAM_ENGINE_CONFIG_HPP
#define ENGRAM_ENGINE_CONFIG_HPP

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace engram {

/// Configuration structure for the engram engine
struct EngineConfig {
    // === Persistence ===
    struct Storage {
        std::string root_path = "engram_data";
        size_t max_concurrent_writes = 4;
        size_t partition_shards = 16;
        size_t bank_cache_size = 32;
        bool enable_wal = true;
        std::string synchronous = "NORMAL";
    } storage;

    // === Region quantization ===
    struct Quantizer {
        std::string strategy = "codebook";   // codebook | lsh
        size_t codebook_size = 512;
        float commitment_cost = 0.25f;
        float ema_decay = 0.99f;
        size_t lsh_bands = 16;
        size_t lsh_rows_per_band = 4;
        uint32_t seed = 42;
        size_t neighbor_regions = 5;          // k for Nearest() during matching
    } quantizer;

    // === Novelty history ===
    struct Activation {
        size_t history_size = 64;
        double frequency_saturation = 100.0;
        size_t max_regions = 10000;           // maintenance prunes above this
        size_t prune_min_count = 2;
    } activation;

    // === Neuron count sizing ===
    struct Hypernetwork {
        double alpha = 20.0;
        double beta = 100.0;
        double gamma = 50.0;
        int min_neurons = 5;
        int max_neurons = 500;
        uint32_t seed = 42;
        std::string strategy = "hypernetwork";  // hypernetwork | stochastic
    } hypernetwork;

    // === Per-concept capacity ===
    struct Capacity {
        int min_neurons = 50;
        int max_neurons = 600;
        double ema_alpha = 0.05;
        double hysteresis = 0.15;
    } capacity;

    // === Cluster matching and residency ===
    struct Cluster {
        float similarity_threshold = 0.85f;
        float centroid_rate = 0.1f;
        size_t idle_unload_seconds = 600;
        size_t max_activated_clusters = 5;
        size_t candidate_clusters = 3;
    } cluster;

    // === Hebbian graph ===
    struct Synapse {
        float learning_rate = 0.01f;
        float min_weight = 0.0f;
        float max_weight = 1.0f;
        float prune_threshold = 0.005f;
        float coactivation_floor = 0.1f;
        float decay_factor = 0.99f;
    } synapse;

    // === Learning pipeline ===
    struct Learning {
        float target_activation = 0.8f;
        size_t max_growth_per_run = 64;
        size_t cross_cluster_fanout = 2;
        size_t synapses_per_link = 3;
        size_t hebbian_sample = 32;           // strongest fired neurons per update
        size_t consolidation_budget = 10;     // neurons promoted per cluster per pass
        float consolidation_epsilon = 1e-3f;  // smallest delta worth promoting
        bool verbose = false;
    } learning;

    /// Load configuration from YAML file
    /// @param filepath Path to YAML configuration file
    /// @return EngineConfig if successful, std::nullopt on error
    static std::optional<EngineConfig> LoadFromFile(const std::string& filepath);

    /// Load configuration from YAML string
    /// @param yaml_content YAML content as string
    /// @return EngineConfig if successful, std::nullopt on error
    static std::optional<EngineConfig> LoadFromString(const std::string& yaml_content);

    /// Save configuration to YAML file
    /// @return true if successful, false on error
    bool SaveToFile(const std::string& filepath) const;

    /// YAML representation of the configuration
    std::string ToYamlString() const;

    /// @return true if configuration is valid
    bool Validate() const;

    /// @return One message per invalid value
    std::vector<std::string> GetValidationErrors() const;

    /// Configuration with every default
    static EngineConfig Default();
};

} // namespace engram

#endif // ENGRAM_ENGINE_CONFIG_HPP
