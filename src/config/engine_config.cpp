// File: src/config/engine_config.cpp
//
// YAML loading and saving for EngineConfig

#include "config/engine_config.hpp"
#include <yaml.h>
#include <fstream>
#include <iostream>
#include <sstream>
#include <stdexcept>

namespace engram {

// Helper function to read string from YAML scalar
static std::string GetScalarValue(yaml_event_t* event) {
    return std::string(reinterpret_cast<char*>(event->data.scalar.value),
                       event->data.scalar.length);
}

// Helper to convert string to bool
static bool ParseBool(const std::string& value) {
    return (value == "true" || value == "True" || value == "TRUE" ||
            value == "yes" || value == "Yes" || value == "YES" ||
            value == "1" || value == "on" || value == "On" || value == "ON");
}

static const char* FormatBool(bool value) {
    return value ? "true" : "false";
}

// Apply one section/key/value triple. Unknown keys are ignored.
// Throws std::invalid_argument or std::out_of_range on malformed numbers.
static void ApplyValue(EngineConfig& config, const std::string& section,
                       const std::string& key, const std::string& value) {
    if (section == "storage") {
        auto& s = config.storage;
        if (key == "root_path") s.root_path = value;
        else if (key == "max_concurrent_writes") s.max_concurrent_writes = std::stoul(value);
        else if (key == "partition_shards") s.partition_shards = std::stoul(value);
        else if (key == "bank_cache_size") s.bank_cache_size = std::stoul(value);
        else if (key == "enable_wal") s.enable_wal = ParseBool(value);
        else if (key == "synchronous") s.synchronous = value;
    }
    else if (section == "quantizer") {
        auto& q = config.quantizer;
        if (key == "strategy") q.strategy = value;
        else if (key == "codebook_size") q.codebook_size = std::stoul(value);
        else if (key == "commitment_cost") q.commitment_cost = std::stof(value);
        else if (key == "ema_decay") q.ema_decay = std::stof(value);
        else if (key == "lsh_bands") q.lsh_bands = std::stoul(value);
        else if (key == "lsh_rows_per_band") q.lsh_rows_per_band = std::stoul(value);
        else if (key == "seed") q.seed = static_cast<uint32_t>(std::stoul(value));
        else if (key == "neighbor_regions") q.neighbor_regions = std::stoul(value);
    }
    else if (section == "activation") {
        auto& a = config.activation;
        if (key == "history_size") a.history_size = std::stoul(value);
        else if (key == "frequency_saturation") a.frequency_saturation = std::stod(value);
        else if (key == "max_regions") a.max_regions = std::stoul(value);
        else if (key == "prune_min_count") a.prune_min_count = std::stoul(value);
    }
    else if (section == "hypernetwork") {
        auto& h = config.hypernetwork;
        if (key == "alpha") h.alpha = std::stod(value);
        else if (key == "beta") h.beta = std::stod(value);
        else if (key == "gamma") h.gamma = std::stod(value);
        else if (key == "min_neurons") h.min_neurons = std::stoi(value);
        else if (key == "max_neurons") h.max_neurons = std::stoi(value);
        else if (key == "seed") h.seed = static_cast<uint32_t>(std::stoul(value));
        else if (key == "strategy") h.strategy = value;
    }
    else if (section == "capacity") {
        auto& c = config.capacity;
        if (key == "min_neurons") c.min_neurons = std::stoi(value);
        else if (key == "max_neurons") c.max_neurons = std::stoi(value);
        else if (key == "ema_alpha") c.ema_alpha = std::stod(value);
        else if (key == "hysteresis") c.hysteresis = std::stod(value);
    }
    else if (section == "cluster") {
        auto& c = config.cluster;
        if (key == "similarity_threshold") c.similarity_threshold = std::stof(value);
        else if (key == "centroid_rate") c.centroid_rate = std::stof(value);
        else if (key == "idle_unload_seconds") c.idle_unload_seconds = std::stoul(value);
        else if (key == "max_activated_clusters") c.max_activated_clusters = std::stoul(value);
        else if (key == "candidate_clusters") c.candidate_clusters = std::stoul(value);
    }
    else if (section == "synapse") {
        auto& s = config.synapse;
        if (key == "learning_rate") s.learning_rate = std::stof(value);
        else if (key == "min_weight") s.min_weight = std::stof(value);
        else if (key == "max_weight") s.max_weight = std::stof(value);
        else if (key == "prune_threshold") s.prune_threshold = std::stof(value);
        else if (key == "coactivation_floor") s.coactivation_floor = std::stof(value);
        else if (key == "decay_factor") s.decay_factor = std::stof(value);
    }
    else if (section == "learning") {
        auto& l = config.learning;
        if (key == "target_activation") l.target_activation = std::stof(value);
        else if (key == "max_growth_per_run") l.max_growth_per_run = std::stoul(value);
        else if (key == "cross_cluster_fanout") l.cross_cluster_fanout = std::stoul(value);
        else if (key == "synapses_per_link") l.synapses_per_link = std::stoul(value);
        else if (key == "hebbian_sample") l.hebbian_sample = std::stoul(value);
        else if (key == "consolidation_budget") l.consolidation_budget = std::stoul(value);
        else if (key == "consolidation_epsilon") l.consolidation_epsilon = std::stof(value);
        else if (key == "verbose") l.verbose = ParseBool(value);
    }
}

std::optional<EngineConfig> EngineConfig::LoadFromFile(const std::string& filepath) {
    std::ifstream file(filepath);
    if (!file.is_open()) {
        std::cerr << "Failed to open config file: " << filepath << std::endl;
        return std::nullopt;
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    return LoadFromString(buffer.str());
}

std::optional<EngineConfig> EngineConfig::LoadFromString(const std::string& yaml_content) {
    yaml_parser_t parser;
    yaml_event_t event;

    if (!yaml_parser_initialize(&parser)) {
        std::cerr << "Failed to initialize YAML parser" << std::endl;
        return std::nullopt;
    }

    yaml_parser_set_input_string(&parser,
        reinterpret_cast<const unsigned char*>(yaml_content.c_str()),
        yaml_content.size());

    EngineConfig config = Default();
    std::string current_section;
    std::string current_key;
    int depth = 0;

    bool done = false;
    while (!done) {
        if (!yaml_parser_parse(&parser, &event)) {
            std::cerr << "YAML parse error at line " << parser.problem_mark.line + 1
                      << ": " << (parser.problem ? parser.problem : "unknown") << std::endl;
            yaml_parser_delete(&parser);
            return std::nullopt;
        }

        switch (event.type) {
            case YAML_MAPPING_START_EVENT:
                depth++;
                break;

            case YAML_MAPPING_END_EVENT:
                depth--;
                if (depth == 1) {
                    current_section.clear();
                }
                break;

            case YAML_SCALAR_EVENT: {
                std::string value = GetScalarValue(&event);

                if (depth == 1) {
                    current_section = value;
                } else if (depth == 2) {
                    if (current_key.empty()) {
                        current_key = value;
                    } else {
                        try {
                            ApplyValue(config, current_section, current_key, value);
                        } catch (const std::exception& e) {
                            std::cerr << "Invalid value for " << current_section << "."
                                      << current_key << ": \"" << value << "\" (" << e.what() << ")" << std::endl;
                            yaml_event_delete(&event);
                            yaml_parser_delete(&parser);
                            return std::nullopt;
                        }
                        current_key.clear();
                    }
                }
                break;
            }

            case YAML_STREAM_END_EVENT:
            case YAML_DOCUMENT_END_EVENT:
                done = true;
                break;

            default:
                break;
        }

        yaml_event_delete(&event);
    }

    yaml_parser_delete(&parser);

    if (!config.Validate()) {
        std::cerr << "Configuration validation failed:" << std::endl;
        for (const auto& error : config.GetValidationErrors()) {
            std::cerr << "  - " << error << std::endl;
        }
        return std::nullopt;
    }

    return config;
}

bool EngineConfig::SaveToFile(const std::string& filepath) const {
    std::ofstream file(filepath);
    if (!file.is_open()) {
        std::cerr << "Failed to open file for writing: " << filepath << std::endl;
        return false;
    }

    file << ToYamlString();
    return static_cast<bool>(file);
}

std::string EngineConfig::ToYamlString() const {
    std::ostringstream ss;

    ss << "# engram engine configuration\n\n";

    ss << "storage:\n";
    ss << "  root_path: \"" << storage.root_path << "\"\n";
    ss << "  max_concurrent_writes: " << storage.max_concurrent_writes << "\n";
    ss << "  partition_shards: " << storage.partition_shards << "\n";
    ss << "  bank_cache_size: " << storage.bank_cache_size << "\n";
    ss << "  enable_wal: " << FormatBool(storage.enable_wal) << "\n";
    ss << "  synchronous: \"" << storage.synchronous << "\"\n\n";

    ss << "quantizer:\n";
    ss << "  strategy: \"" << quantizer.strategy << "\"\n";
    ss << "  codebook_size: " << quantizer.codebook_size << "\n";
    ss << "  commitment_cost: " << quantizer.commitment_cost << "\n";
    ss << "  ema_decay: " << quantizer.ema_decay << "\n";
    ss << "  lsh_bands: " << quantizer.lsh_bands << "\n";
    ss << "  lsh_rows_per_band: " << quantizer.lsh_rows_per_band << "\n";
    ss << "  seed: " << quantizer.seed << "\n";
    ss << "  neighbor_regions: " << quantizer.neighbor_regions << "\n\n";

    ss << "activation:\n";
    ss << "  history_size: " << activation.history_size << "\n";
    ss << "  frequency_saturation: " << activation.frequency_saturation << "\n";
    ss << "  max_regions: " << activation.max_regions << "\n";
    ss << "  prune_min_count: " << activation.prune_min_count << "\n\n";

    ss << "hypernetwork:\n";
    ss << "  alpha: " << hypernetwork.alpha << "\n";
    ss << "  beta: " << hypernetwork.beta << "\n";
    ss << "  gamma: " << hypernetwork.gamma << "\n";
    ss << "  min_neurons: " << hypernetwork.min_neurons << "\n";
    ss << "  max_neurons: " << hypernetwork.max_neurons << "\n";
    ss << "  seed: " << hypernetwork.seed << "\n";
    ss << "  strategy: \"" << hypernetwork.strategy << "\"\n\n";

    ss << "capacity:\n";
    ss << "  min_neurons: " << capacity.min_neurons << "\n";
    ss << "  max_neurons: " << capacity.max_neurons << "\n";
    ss << "  ema_alpha: " << capacity.ema_alpha << "\n";
    ss << "  hysteresis: " << capacity.hysteresis << "\n\n";

    ss << "cluster:\n";
    ss << "  similarity_threshold: " << cluster.similarity_threshold << "\n";
    ss << "  centroid_rate: " << cluster.centroid_rate << "\n";
    ss << "  idle_unload_seconds: " << cluster.idle_unload_seconds << "\n";
    ss << "  max_activated_clusters: " << cluster.max_activated_clusters << "\n";
    ss << "  candidate_clusters: " << cluster.candidate_clusters << "\n\n";

    ss << "synapse:\n";
    ss << "  learning_rate: " << synapse.learning_rate << "\n";
    ss << "  min_weight: " << synapse.min_weight << "\n";
    ss << "  max_weight: " << synapse.max_weight << "\n";
    ss << "  prune_threshold: " << synapse.prune_threshold << "\n";
    ss << "  coactivation_floor: " << synapse.coactivation_floor << "\n";
    ss << "  decay_factor: " << synapse.decay_factor << "\n\n";

    ss << "learning:\n";
    ss << "  target_activation: " << learning.target_activation << "\n";
    ss << "  max_growth_per_run: " << learning.max_growth_per_run << "\n";
    ss << "  cross_cluster_fanout: " << learning.cross_cluster_fanout << "\n";
    ss << "  synapses_per_link: " << learning.synapses_per_link << "\n";
    ss << "  hebbian_sample: " << learning.hebbian_sample << "\n";
    ss << "  consolidation_budget: " << learning.consolidation_budget << "\n";
    ss << "  consolidation_epsilon: " << learning.consolidation_epsilon << "\n";
    ss << "  verbose: " << FormatBool(learning.verbose) << "\n";

    return ss.str();
}

bool EngineConfig::Validate() const {
    return GetValidationErrors().empty();
}

std::vector<std::string> EngineConfig::GetValidationErrors() const {
    std::vector<std::string> errors;

    // Storage
    if (storage.root_path.empty()) {
        errors.push_back("storage.root_path must not be empty");
    }
    if (storage.max_concurrent_writes == 0) {
        errors.push_back("storage.max_concurrent_writes must be greater than 0");
    }
    if (storage.partition_shards == 0) {
        errors.push_back("storage.partition_shards must be greater than 0");
    }
    if (storage.synchronous != "FULL" && storage.synchronous != "NORMAL" &&
        storage.synchronous != "OFF") {
        errors.push_back("storage.synchronous must be one of: FULL, NORMAL, OFF");
    }

    // Quantizer
    if (quantizer.strategy != "codebook" && quantizer.strategy != "lsh") {
        errors.push_back("quantizer.strategy must be one of: codebook, lsh");
    }
    if (quantizer.codebook_size == 0) {
        errors.push_back("quantizer.codebook_size must be greater than 0");
    }
    if (quantizer.ema_decay <= 0.0f || quantizer.ema_decay >= 1.0f) {
        errors.push_back("quantizer.ema_decay must be in (0, 1)");
    }
    if (quantizer.lsh_bands == 0) {
        errors.push_back("quantizer.lsh_bands must be greater than 0");
    }
    if (quantizer.lsh_rows_per_band == 0 || quantizer.lsh_rows_per_band > 16) {
        errors.push_back("quantizer.lsh_rows_per_band must be between 1 and 16");
    }

    // Activation
    if (activation.history_size == 0) {
        errors.push_back("activation.history_size must be greater than 0");
    }
    if (activation.frequency_saturation <= 0.0) {
        errors.push_back("activation.frequency_saturation must be greater than 0");
    }

    // Hypernetwork
    if (hypernetwork.min_neurons > hypernetwork.max_neurons) {
        errors.push_back("hypernetwork.min_neurons must be <= hypernetwork.max_neurons");
    }
    if (hypernetwork.strategy != "hypernetwork" && hypernetwork.strategy != "stochastic") {
        errors.push_back("hypernetwork.strategy must be one of: hypernetwork, stochastic");
    }

    // Capacity
    if (capacity.min_neurons > capacity.max_neurons) {
        errors.push_back("capacity.min_neurons must be <= capacity.max_neurons");
    }
    if (capacity.ema_alpha < 0.0 || capacity.ema_alpha > 1.0) {
        errors.push_back("capacity.ema_alpha must be between 0.0 and 1.0");
    }
    if (capacity.hysteresis < 0.0 || capacity.hysteresis >= 1.0) {
        errors.push_back("capacity.hysteresis must be in [0, 1)");
    }

    // Cluster
    if (cluster.similarity_threshold < 0.0f || cluster.similarity_threshold > 1.0f) {
        errors.push_back("cluster.similarity_threshold must be between 0.0 and 1.0");
    }
    if (cluster.centroid_rate < 0.0f || cluster.centroid_rate > 1.0f) {
        errors.push_back("cluster.centroid_rate must be between 0.0 and 1.0");
    }

    // Synapse
    if (synapse.min_weight > synapse.max_weight) {
        errors.push_back("synapse.min_weight must be <= synapse.max_weight");
    }
    if (synapse.decay_factor < 0.0f || synapse.decay_factor > 1.0f) {
        errors.push_back("synapse.decay_factor must be between 0.0 and 1.0");
    }

    // Learning
    if (learning.target_activation < 0.0f || learning.target_activation > 1.0f) {
        errors.push_back("learning.target_activation must be between 0.0 and 1.0");
    }
    if (learning.consolidation_epsilon < 0.0f) {
        errors.push_back("learning.consolidation_epsilon must be non-negative");
    }

    return errors;
}

EngineConfig EngineConfig::Default() {
    return EngineConfig{};
}

} // namespace engram
