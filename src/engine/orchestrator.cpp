// File: src/engine/orchestrator.cpp
#include "engine/orchestrator.hpp"
#include "quantization/lsh_quantizer.hpp"
#include <algorithm>
#include <cctype>
#include <chrono>
#include <iomanip>
#include <iostream>
#include <iterator>
#include <sstream>
#include <stdexcept>

namespace engram {

namespace {

const EngineConfig& Validated(const EngineConfig& config) {
    auto errors = config.GetValidationErrors();
    if (!errors.empty()) {
        std::string message = "Invalid engine configuration:";
        for (const auto& error : errors) {
            message += "\n  " + error;
        }
        throw std::invalid_argument(message);
    }
    return config;
}

ActivationStats::Config ActivationConfig(const EngineConfig& config) {
    ActivationStats::Config ac;
    ac.history_size = config.activation.history_size;
    ac.frequency_saturation = config.activation.frequency_saturation;
    return ac;
}

NeuronHypernetwork::Config HypernetworkConfig(const EngineConfig& config) {
    NeuronHypernetwork::Config hc;
    hc.alpha = config.hypernetwork.alpha;
    hc.beta = config.hypernetwork.beta;
    hc.gamma = config.hypernetwork.gamma;
    hc.min_neurons = config.hypernetwork.min_neurons;
    hc.max_neurons = config.hypernetwork.max_neurons;
    hc.seed = config.hypernetwork.seed;
    return hc;
}

ConceptCapacityController::Config CapacityConfig(const EngineConfig& config) {
    ConceptCapacityController::Config cc;
    cc.min_neurons = config.capacity.min_neurons;
    cc.max_neurons = config.capacity.max_neurons;
    cc.ema_alpha = config.capacity.ema_alpha;
    cc.hysteresis = config.capacity.hysteresis;
    cc.strategy = ParseAllocationStrategy(config.hypernetwork.strategy);
    cc.hypernetwork = HypernetworkConfig(config);
    cc.stochastic.min_neurons = config.hypernetwork.min_neurons;
    cc.stochastic.max_neurons = config.hypernetwork.max_neurons;
    cc.stochastic.seed = config.hypernetwork.seed;
    return cc;
}

SparseSynapticGraph::Config GraphConfig(const EngineConfig& config) {
    SparseSynapticGraph::Config gc;
    gc.learning_rate = config.synapse.learning_rate;
    gc.min_weight = config.synapse.min_weight;
    gc.max_weight = config.synapse.max_weight;
    gc.prune_threshold = config.synapse.prune_threshold;
    gc.coactivation_floor = config.synapse.coactivation_floor;
    gc.decay_factor = config.synapse.decay_factor;
    return gc;
}

BrainStorage::Config StorageConfig(const EngineConfig& config) {
    BrainStorage::Config sc;
    sc.root_path = config.storage.root_path;
    sc.max_concurrent_writes = config.storage.max_concurrent_writes;
    sc.partition_shards = config.storage.partition_shards;
    sc.bank_cache_size = config.storage.bank_cache_size;
    sc.enable_wal = config.storage.enable_wal;
    sc.synchronous = config.storage.synchronous;
    sc.verbose = config.learning.verbose;
    return sc;
}

NeuronCluster::Config ClusterConfig(const EngineConfig& config) {
    NeuronCluster::Config cc;
    cc.centroid_rate = config.cluster.centroid_rate;
    return cc;
}

void LogCorrupt(const char* family, const std::string& error) {
    std::cerr << "Orchestrator: " << family << " is corrupt, starting empty ("
              << error << ")" << std::endl;
}

} // namespace

// ============================================================================
// LoadReport
// ============================================================================

bool LoadReport::IsColdStart() const {
    for (LoadStatus status : {feature_map, counters, synapses, cluster_index, region_map,
                              capacities, activation_stats, codebook}) {
        if (status != LoadStatus::kAbsent) {
            return false;
        }
    }
    return true;
}

bool LoadReport::HasCorruption() const {
    for (LoadStatus status : {feature_map, counters, synapses, cluster_index, region_map,
                              capacities, activation_stats, codebook}) {
        if (status == LoadStatus::kCorrupt) {
            return true;
        }
    }
    return false;
}

std::string LoadReport::ToString() const {
    std::ostringstream oss;
    oss << "LoadReport(feature_map=" << engram::ToString(feature_map)
        << ", counters=" << engram::ToString(counters)
        << ", synapses=" << engram::ToString(synapses)
        << ", cluster_index=" << engram::ToString(cluster_index)
        << ", region_map=" << engram::ToString(region_map)
        << ", capacities=" << engram::ToString(capacities)
        << ", activation_stats=" << engram::ToString(activation_stats)
        << ", codebook=" << engram::ToString(codebook)
        << ", clusters=" << clusters_indexed
        << ", synapses=" << synapses_loaded
        << ", features=" << features_loaded << ")";
    return oss.str();
}

// ============================================================================
// Constructor & Helpers
// ============================================================================

Orchestrator::Orchestrator(const EngineConfig& config)
    : config_(Validated(config)),
      quantizer_(CreateQuantizer(config_)),
      activation_stats_(ActivationConfig(config_)),
      hypernetwork_(HypernetworkConfig(config_)),
      capacity_(CapacityConfig(config_)),
      graph_(GraphConfig(config_)),
      storage_(std::make_unique<BrainStorage>(StorageConfig(config_))),
      rng_(config_.quantizer.seed),
      started_at_(Timestamp::Now()),
      last_maintenance_(started_at_) {}

std::unique_ptr<RegionQuantizer> Orchestrator::CreateQuantizer(const EngineConfig& config) {
    if (config.quantizer.strategy == "codebook") {
        CodebookQuantizer::Config qc;
        qc.codebook_size = config.quantizer.codebook_size;
        qc.dimension = FeatureEncoder::kDimension;
        qc.commitment_cost = config.quantizer.commitment_cost;
        qc.ema_decay = config.quantizer.ema_decay;
        qc.seed = config.quantizer.seed;
        return std::make_unique<CodebookQuantizer>(qc);
    }
    if (config.quantizer.strategy == "lsh") {
        LshQuantizer::Config lc;
        lc.dimension = FeatureEncoder::kDimension;
        lc.bands = config.quantizer.lsh_bands;
        lc.rows_per_band = config.quantizer.lsh_rows_per_band;
        lc.seed = config.quantizer.seed;
        return std::make_unique<LshQuantizer>(lc);
    }
    throw std::invalid_argument("Unknown quantizer strategy: " + config.quantizer.strategy);
}

std::string Orchestrator::NormalizeLabel(const std::string& label) {
    size_t begin = 0;
    size_t end = label.size();
    while (begin < end && std::isspace(static_cast<unsigned char>(label[begin]))) {
        ++begin;
    }
    while (end > begin && std::isspace(static_cast<unsigned char>(label[end - 1]))) {
        --end;
    }
    std::string result = label.substr(begin, end - begin);
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return result;
}

std::vector<std::string> Orchestrator::ExtractConcepts(const std::string& input) {
    std::vector<std::string> concepts;
    std::set<std::string> seen;

    std::istringstream words(input);
    std::string word;
    while (words >> word) {
        // Strip punctuation at both ends so "apple," and "apple" match
        size_t begin = 0;
        size_t end = word.size();
        while (begin < end && std::ispunct(static_cast<unsigned char>(word[begin]))) {
            ++begin;
        }
        while (end > begin && std::ispunct(static_cast<unsigned char>(word[end - 1]))) {
            --end;
        }
        std::string token = NormalizeLabel(word.substr(begin, end - begin));
        if (token.size() > 2 && seen.insert(token).second) {
            concepts.push_back(std::move(token));
        }
    }
    return concepts;
}

const CodebookQuantizer* Orchestrator::GetCodebook() const {
    return dynamic_cast<const CodebookQuantizer*>(quantizer_.get());
}

NeuronCluster& Orchestrator::AddCluster(NeuronCluster cluster) {
    ClusterID id = cluster.GetID();
    return clusters_.insert_or_assign(id, std::move(cluster)).first->second;
}

NeuronCluster::Loader Orchestrator::MakeLoader(const std::string& partition) {
    return [this, partition](ClusterID id) -> std::optional<std::vector<Neuron>> {
        auto result = storage_->LoadCluster(id, partition);
        if (result.IsLoaded()) {
            return std::move(*result.value);
        }
        if (result.IsAbsent()) {
            std::cerr << "Orchestrator: no membership file for " << id.ToString()
                      << " in " << partition << std::endl;
        } else {
            std::cerr << "Orchestrator: cannot hydrate " << id.ToString() << ": "
                      << result.error << std::endl;
        }
        return std::nullopt;
    };
}

bool Orchestrator::Hydrate(NeuronCluster& cluster) {
    bool was_loaded = cluster.IsLoaded();
    if (!cluster.EnsureLoaded()) {
        return false;
    }
    if (!was_loaded) {
        for (const auto& [id, neuron] : cluster.GetNeurons()) {
            for (const auto& label : neuron.GetConcepts()) {
                concept_affinity_[label].insert(cluster.GetID());
            }
        }
    }
    return true;
}

std::set<ClusterID> Orchestrator::CandidateClusters(const std::vector<RegionCode>& regions,
                                                     const std::string& label) const {
    std::set<ClusterID> candidates;
    for (const auto& region : regions) {
        auto it = region_map_.find(region);
        if (it != region_map_.end()) {
            candidates.insert(it->second.begin(), it->second.end());
        }
    }
    auto affinity = concept_affinity_.find(label);
    if (affinity != concept_affinity_.end()) {
        candidates.insert(affinity->second.begin(), affinity->second.end());
    }
    return candidates;
}

NeuronInputs Orchestrator::LookupInputs(const FeatureMap& features) const {
    NeuronInputs inputs;
    for (const auto& [name, value] : features) {
        if (auto id = features_.Find(name)) {
            inputs[*id] = value;
        }
    }
    return inputs;
}

// ============================================================================
// Initialize
// ============================================================================

LoadReport Orchestrator::Initialize() {
    if (initialized_) {
        return load_report_;
    }

    LoadReport report;
    MetadataStore& metadata = storage_->Metadata();

    // Identifier high-water marks first, so nothing generated later collides
    auto counters = metadata.LoadCounters();
    report.counters = counters.status;
    if (counters.IsLoaded()) {
        for (const auto& [name, value] : *counters.value) {
            if (name == "cluster") {
                ClusterID::ReserveThrough(value);
            } else if (name == "neuron") {
                NeuronID::ReserveThrough(value);
            } else if (name == "feature") {
                FeatureID::ReserveThrough(value);
            }
        }
    } else if (counters.IsCorrupt()) {
        LogCorrupt("id_counters", counters.error);
    }

    auto feature_map = metadata.LoadFeatureMap();
    report.feature_map = feature_map.status;
    if (feature_map.IsLoaded()) {
        features_.Restore(*feature_map.value);
        report.features_loaded = features_.Size();
    } else if (feature_map.IsCorrupt()) {
        LogCorrupt("feature_map", feature_map.error);
    }

    auto synapses = metadata.LoadSynapses();
    report.synapses = synapses.status;
    if (synapses.IsLoaded()) {
        graph_.Import(*synapses.value);
        report.synapses_loaded = graph_.GetEdgeCount();
    } else if (synapses.IsCorrupt()) {
        LogCorrupt("synapses", synapses.error);
    }

    // Summaries only; members are hydrated on first use
    auto index = metadata.LoadClusterIndex();
    report.cluster_index = index.status;
    if (index.IsLoaded()) {
        for (const auto& summary : *index.value) {
            ClusterID::ReserveThrough(summary.id.value());
            NeuronCluster& cluster = AddCluster(NeuronCluster::FromSummary(summary, ClusterConfig(config_)));
            cluster.SetLoader(MakeLoader(summary.partition));
            concept_affinity_[summary.label].insert(summary.id);
        }
        report.clusters_indexed = clusters_.size();
    } else if (index.IsCorrupt()) {
        LogCorrupt("cluster_index", index.error);
    }

    auto regions = metadata.LoadRegionMap();
    report.region_map = regions.status;
    if (regions.IsLoaded()) {
        for (const auto& [region, ids] : *regions.value) {
            for (const auto& id : ids) {
                // Clusters created but never saved have no index entry
                if (clusters_.count(id) > 0) {
                    region_map_[region].insert(id);
                }
            }
        }
    } else if (regions.IsCorrupt()) {
        LogCorrupt("region_map", regions.error);
    }

    auto capacities = metadata.LoadCapacities();
    report.capacities = capacities.status;
    if (capacities.IsLoaded()) {
        capacity_.Restore(*capacities.value);
    } else if (capacities.IsCorrupt()) {
        LogCorrupt("concept_capacity", capacities.error);
    }

    auto stats = storage_->LoadActivationStats(ActivationConfig(config_));
    report.activation_stats = stats.status;
    if (stats.IsLoaded()) {
        activation_stats_ = std::move(*stats.value);
    } else if (stats.IsCorrupt()) {
        LogCorrupt("activation_stats", stats.error);
    }

    if (auto* codebook = dynamic_cast<CodebookQuantizer*>(quantizer_.get())) {
        auto snapshot = storage_->LoadCodebook();
        report.codebook = snapshot.status;
        if (snapshot.IsLoaded()) {
            try {
                codebook->Import(*snapshot.value);
            } catch (const std::invalid_argument& e) {
                report.codebook = LoadStatus::kCorrupt;
                LogCorrupt("codebook", e.what());
            }
        } else if (snapshot.IsCorrupt()) {
            LogCorrupt("codebook", snapshot.error);
        }
    }

    initialized_ = true;
    load_report_ = report;

    if (config_.learning.verbose) {
        std::cerr << "Orchestrator: " << report.ToString() << std::endl;
    }
    return report;
}

// ============================================================================
// Learn Pipeline
// ============================================================================

LearningResult Orchestrator::LearnConcept(const std::string& raw_label, const FeatureMap& features) {
    LearningResult result;
    if (!initialized_) {
        Initialize();
    }

    std::string label = NormalizeLabel(raw_label);
    if (label.empty()) {
        std::cerr << "Orchestrator: cannot learn an empty concept label" << std::endl;
        return result;
    }

    // Encode
    FeatureVector vector = encoder_.EncodePhrase(label);

    // Quantize: novelty and frequency are read before this activation counts
    RegionCode region = quantizer_->Assign(vector);
    float novelty = activation_stats_.CalculateNovelty(region, vector);
    float frequency = activation_stats_.Frequency(region);
    activation_stats_.RecordActivation(region, vector);

    // Match / Create
    bool created = false;
    NeuronCluster* cluster = MatchOrCreateCluster(label, vector, region, created);
    cluster->Touch();
    cluster->UpdateCentroid(vector);

    // Size
    AllocationSignal signal;
    signal.novelty = novelty;
    signal.frequency = frequency;
    signal.complexity = NeuronHypernetwork::Complexity(vector);
    signal.features = features;
    for (const auto& [id, other] : clusters_) {
        if (other.IsLoaded()) {
            signal.neurons_in_use += other.Size();
        }
    }
    int target = capacity_.TargetFor(label, signal);

    // Grow
    size_t grown = GrowForConcept(*cluster, label, vector, target);

    // Train every member; the label is always one of the inputs
    FeatureMap presented = features;
    presented.emplace(label, 1.0f);
    NeuronInputs inputs = features_.ToNeuronInputs(presented);
    TrainingOutcome outcome = cluster->Train(inputs, config_.learning.target_activation, rng_);

    // Hebbian update
    RecordHebbian(outcome);

    // Capacity adjust
    size_t observed = cluster->CountNeuronsByConcept(label);
    double demand = std::min(1.5, static_cast<double>(observed) / std::max(1, target));
    capacity_.Adjust(label, static_cast<int>(observed), demand);

    // Link
    LinkToRecentClusters(*cluster, label);
    RememberRecent(cluster->GetID());
    concept_affinity_[label].insert(cluster->GetID());

    neurons_created_ += grown;
    concepts_learned_++;

    result.cluster_id = cluster->GetID();
    result.success = true;
    result.neurons_involved = observed;
    result.neurons_created = grown;
    result.created_cluster = created;
    result.region = region;
    result.novelty = novelty;

    if (config_.learning.verbose) {
        std::cerr << "Orchestrator: learned '" << label << "' in " << cluster->GetID().ToString()
                  << (created ? " (new)" : "") << " +" << grown << " neurons, "
                  << outcome.fired.size() << " fired, novelty " << std::fixed
                  << std::setprecision(2) << novelty << std::endl;
    }
    return result;
}

NeuronCluster* Orchestrator::MatchOrCreateCluster(const std::string& label, const FeatureVector& vector,
                                                  const RegionCode& region, bool& created) {
    std::vector<RegionCode> regions = quantizer_->Nearest(vector, config_.quantizer.neighbor_regions);
    regions.insert(regions.begin(), region);

    std::vector<std::pair<float, NeuronCluster*>> scored;
    for (ClusterID id : CandidateClusters(regions, label)) {
        auto it = clusters_.find(id);
        if (it != clusters_.end()) {
            scored.emplace_back(it->second.Similarity(vector, region), &it->second);
        }
    }
    std::stable_sort(scored.begin(), scored.end(),
                     [](const auto& a, const auto& b) { return a.first > b.first; });

    for (const auto& [score, candidate] : scored) {
        if (score < config_.cluster.similarity_threshold) {
            break;
        }
        if (!Hydrate(*candidate)) {
            continue;
        }
        // Codes drift, so the reused cluster is also registered under today's region
        region_map_[region].insert(candidate->GetID());
        return candidate;
    }

    ClusterID id = ClusterID::Generate();
    std::string partition = storage_->AssignPartition(id, label);
    NeuronCluster& cluster = AddCluster(NeuronCluster(id, label, region, partition, ClusterConfig(config_)));
    cluster.SetLoader(MakeLoader(partition));
    region_map_[region].insert(id);
    created = true;
    return &cluster;
}

size_t Orchestrator::GrowForConcept(NeuronCluster& cluster, const std::string& label,
                                    const FeatureVector& vector, int target) {
    size_t existing = cluster.CountNeuronsByConcept(label);
    if (target <= 0 || existing >= static_cast<size_t>(target)) {
        return 0;
    }

    size_t needed = static_cast<size_t>(target) - existing;
    if (existing > 0) {
        needed = std::min(needed, config_.learning.max_growth_per_run);
    }
    if (needed == 0) {
        return 0;
    }

    size_t first = cluster.Size();
    auto properties = hypernetwork_.GenerateNeuronProperties(vector, needed, first);
    return cluster.GrowTo(first + needed, label, properties).size();
}

void Orchestrator::RecordHebbian(const TrainingOutcome& outcome) {
    size_t sample = std::min(outcome.fired.size(), config_.learning.hebbian_sample);
    if (sample < 2) {
        return;
    }

    std::vector<NeuronActivation> strongest = outcome.fired;
    std::partial_sort(strongest.begin(), strongest.begin() + sample, strongest.end(),
                      [](const NeuronActivation& a, const NeuronActivation& b) {
                          return a.second > b.second;
                      });
    strongest.resize(sample);
    graph_.RecordCoactivation(strongest);
}

void Orchestrator::LinkToRecentClusters(NeuronCluster& cluster, const std::string& label) {
    if (config_.learning.cross_cluster_fanout == 0 || config_.learning.synapses_per_link == 0) {
        return;
    }
    std::vector<NeuronID> sources = cluster.FindNeuronsByConcept(label);
    if (sources.empty()) {
        return;
    }

    std::uniform_real_distribution<float> weight(0.0f, 0.1f);
    std::uniform_int_distribution<size_t> pick_source(0, sources.size() - 1);

    size_t linked = 0;
    for (auto it = recent_clusters_.rbegin();
         it != recent_clusters_.rend() && linked < config_.learning.cross_cluster_fanout; ++it) {
        if (*it == cluster.GetID()) {
            continue;
        }
        auto found = clusters_.find(*it);
        if (found == clusters_.end() || !found->second.IsLoaded() || found->second.GetNeurons().empty()) {
            continue;
        }

        const auto& targets = found->second.GetNeurons();
        std::uniform_int_distribution<size_t> pick_target(0, targets.size() - 1);
        for (size_t i = 0; i < config_.learning.synapses_per_link; ++i) {
            NeuronID source = sources[pick_source(rng_)];
            auto target = std::next(targets.begin(), static_cast<std::ptrdiff_t>(pick_target(rng_)));
            graph_.Connect(source, target->first, weight(rng_));
        }
        ++linked;
    }
}

void Orchestrator::RememberRecent(ClusterID id) {
    auto it = std::find(recent_clusters_.begin(), recent_clusters_.end(), id);
    if (it != recent_clusters_.end()) {
        recent_clusters_.erase(it);
    }
    recent_clusters_.push_back(id);
    while (recent_clusters_.size() > kRecentClusterWindow) {
        recent_clusters_.pop_front();
    }
}

// ============================================================================
// Process Pipeline
// ============================================================================

ProcessingResult Orchestrator::ProcessInput(const std::string& input, const FeatureMap& features) {
    ProcessingResult result;
    if (!initialized_) {
        Initialize();
    }
    inputs_processed_++;

    std::vector<std::string> concepts = ExtractConcepts(input);

    NeuronInputs inputs;
    if (!features.empty()) {
        inputs = LookupInputs(features);
    } else {
        for (const auto& word : concepts) {
            if (auto id = features_.Find(word)) {
                inputs[*id] = 1.0f;
            }
        }
    }

    // Score candidate clusters over every concept
    std::map<ClusterID, double> scores;
    for (const auto& word : concepts) {
        FeatureVector vector = encoder_.Encode(word);
        if (vector.IsZero()) {
            continue;
        }
        std::vector<RegionCode> regions = quantizer_->Nearest(vector, config_.quantizer.neighbor_regions);
        if (regions.empty()) {
            continue;
        }
        activation_stats_.RecordActivation(regions.front(), vector);

        for (ClusterID id : CandidateClusters(regions, word)) {
            auto it = clusters_.find(id);
            if (it != clusters_.end()) {
                scores[id] += it->second.Similarity(vector, regions.front());
            }
        }
    }

    std::vector<std::pair<ClusterID, double>> ranked(scores.begin(), scores.end());
    std::stable_sort(ranked.begin(), ranked.end(),
                     [](const auto& a, const auto& b) { return a.second > b.second; });

    std::vector<NeuronActivation> outputs;
    for (const auto& [id, score] : ranked) {
        if (result.activated_clusters.size() >= config_.cluster.max_activated_clusters) {
            break;
        }
        NeuronCluster& cluster = clusters_.at(id);
        if (!Hydrate(cluster)) {
            continue;
        }
        cluster.Touch();
        auto fired = cluster.ProcessInputs(inputs);
        outputs.insert(outputs.end(), fired.begin(), fired.end());
        result.activated_clusters.push_back(id);
    }

    result.response = BuildResponse(outputs, concepts);
    result.activated_neuron_count = outputs.size();
    if (!outputs.empty()) {
        double sum = 0.0;
        double max = 0.0;
        for (const auto& [id, value] : outputs) {
            sum += value;
            max = std::max(max, static_cast<double>(value));
        }
        result.confidence = (sum / static_cast<double>(outputs.size()) + max) / 2.0;
    }

    if (config_.learning.verbose) {
        std::cerr << "Orchestrator: processed \"" << input << "\" -> "
                  << result.activated_clusters.size() << " clusters, "
                  << result.activated_neuron_count << " neurons, confidence "
                  << std::fixed << std::setprecision(2) << result.confidence << std::endl;
    }
    return result;
}

std::string Orchestrator::BuildResponse(const std::vector<NeuronActivation>& outputs,
                                        const std::vector<std::string>& concepts) {
    if (outputs.empty()) {
        return "I need to learn more about this.";
    }

    double sum = 0.0;
    double max = 0.0;
    for (const auto& [id, value] : outputs) {
        sum += value;
        max = std::max(max, static_cast<double>(value));
    }
    double mean = sum / static_cast<double>(outputs.size());

    auto join = [&concepts](size_t n) {
        std::string joined;
        for (size_t i = 0; i < concepts.size() && i < n; ++i) {
            if (i > 0) {
                joined += ", ";
            }
            joined += concepts[i];
        }
        return joined;
    };

    std::ostringstream response;
    if (max > 0.7) {
        response << "I recognize this strongly! It relates to: " << join(3);
    } else if (max > 0.4) {
        response << "This seems familiar to me. I associate it with: " << join(2);
    } else if (mean > 0.2) {
        response << "I have some knowledge about this. Possibly related to: "
                 << (concepts.empty() ? std::string("unknown") : concepts.front());
    } else {
        response << "This is quite new to me. I'm learning from this input...";
    }
    response << " (" << outputs.size() << " neurons activated)";
    return response.str();
}

double Orchestrator::GetConceptMasteryLevel(const std::string& raw_label) {
    if (!initialized_) {
        Initialize();
    }
    std::string label = NormalizeLabel(raw_label);
    if (label.empty()) {
        return 0.0;
    }

    FeatureVector vector = encoder_.EncodePhrase(label);
    std::vector<RegionCode> regions = quantizer_->Nearest(vector, config_.quantizer.neighbor_regions);
    RegionCode primary = regions.empty() ? RegionCode() : regions.front();

    std::vector<std::pair<float, NeuronCluster*>> scored;
    for (ClusterID id : CandidateClusters(regions, label)) {
        auto it = clusters_.find(id);
        if (it != clusters_.end()) {
            scored.emplace_back(it->second.Similarity(vector, primary), &it->second);
        }
    }
    std::stable_sort(scored.begin(), scored.end(),
                     [](const auto& a, const auto& b) { return a.first > b.first; });

    double total = 0.0;
    size_t tagged = 0;
    size_t used = 0;
    for (const auto& [score, cluster] : scored) {
        if (used >= config_.cluster.candidate_clusters) {
            break;
        }
        if (!Hydrate(*cluster)) {
            continue;
        }
        ++used;
        size_t count = cluster->CountNeuronsByConcept(label);
        total += cluster->ConceptActivation(label) * static_cast<double>(count);
        tagged += count;
    }
    return tagged > 0 ? total / static_cast<double>(tagged) : 0.0;
}

// ============================================================================
// Persistence
// ============================================================================

bool Orchestrator::SaveCounters() {
    return storage_->Metadata().SaveCounters({
        {"cluster", ClusterID::HighWater()},
        {"neuron", NeuronID::HighWater()},
        {"feature", FeatureID::HighWater()},
    });
}

size_t Orchestrator::ConsolidateLoadedClusters() {
    size_t promoted = 0;
    size_t touched = 0;
    for (auto& [id, cluster] : clusters_) {
        if (!cluster.IsLoaded()) {
            continue;
        }
        size_t changed = cluster.ConsolidateStm(config_.learning.consolidation_budget,
                                                config_.learning.consolidation_epsilon);
        if (changed > 0) {
            promoted += changed;
            ++touched;
        }
    }
    if (config_.learning.verbose && promoted > 0) {
        std::cerr << "Orchestrator: consolidated " << promoted << " neurons across "
                  << touched << " clusters" << std::endl;
    }
    return promoted;
}

size_t Orchestrator::SaveDirtyClusters(const std::vector<NeuronCluster*>& clusters) {
    if (clusters.empty()) {
        return 0;
    }

    std::vector<const NeuronCluster*> batch(clusters.begin(), clusters.end());
    std::vector<ClusterID> saved = storage_->SaveClusters(batch);
    std::set<ClusterID> written(saved.begin(), saved.end());

    size_t count = 0;
    for (NeuronCluster* cluster : clusters) {
        if (written.count(cluster->GetID()) > 0) {
            cluster->MarkSaved();
            ++count;
        }
    }
    return count;
}

bool Orchestrator::Save() {
    if (!initialized_) {
        Initialize();
    }

    bool ok = true;
    MetadataStore& metadata = storage_->Metadata();

    // Neuron weights are keyed by feature id, so the map goes first
    ok = metadata.SaveFeatureMap(features_.Snapshot()) && ok;
    ok = SaveCounters() && ok;

    ConsolidateLoadedClusters();

    std::vector<NeuronCluster*> dirty;
    for (auto& [id, cluster] : clusters_) {
        if (cluster.IsLoaded() && cluster.HasUnsavedChanges()) {
            dirty.push_back(&cluster);
        }
    }
    size_t saved = SaveDirtyClusters(dirty);
    if (saved < dirty.size()) {
        std::cerr << "Orchestrator: saved " << saved << " of " << dirty.size()
                  << " modified clusters" << std::endl;
        ok = false;
    }

    // Clusters still dirty have no membership file yet and stay out of the index
    std::vector<ClusterSummary> summaries;
    summaries.reserve(clusters_.size());
    for (const auto& [id, cluster] : clusters_) {
        if (!cluster.HasUnsavedChanges()) {
            summaries.push_back(cluster.Summary());
        }
    }
    ok = metadata.SaveClusterIndex(summaries) && ok;
    ok = metadata.SaveRegionMap(region_map_) && ok;
    ok = metadata.SaveSynapses(graph_.Export()) && ok;
    ok = metadata.SaveCapacities(capacity_.Snapshot()) && ok;
    ok = storage_->SaveActivationStats(activation_stats_) && ok;
    if (const CodebookQuantizer* codebook = GetCodebook()) {
        ok = storage_->SaveCodebook(codebook->Export()) && ok;
    }

    if (!ok) {
        std::cerr << "Orchestrator: save incomplete" << std::endl;
    } else if (config_.learning.verbose) {
        std::cerr << "Orchestrator: saved " << saved << " clusters, " << summaries.size()
                  << " indexed, " << graph_.GetEdgeCount() << " synapses" << std::endl;
    }
    return ok;
}

// ============================================================================
// Maintenance
// ============================================================================

MaintenanceReport Orchestrator::Maintenance() {
    MaintenanceReport report;
    if (!initialized_) {
        Initialize();
    }

    Timestamp now = Timestamp::Now();
    auto idle = std::chrono::duration_cast<Timestamp::Duration>(
        std::chrono::seconds(config_.cluster.idle_unload_seconds));

    // Before the idle scan, so promoted weights reach disk ahead of unloading
    report.neurons_consolidated = ConsolidateLoadedClusters();

    std::vector<NeuronCluster*> idle_clusters;
    std::vector<NeuronCluster*> dirty;
    for (auto& [id, cluster] : clusters_) {
        if (cluster.IsLoaded() && !cluster.ShouldStayLoaded(idle)) {
            idle_clusters.push_back(&cluster);
            if (cluster.HasUnsavedChanges()) {
                dirty.push_back(&cluster);
            }
        }
    }

    if (!dirty.empty()) {
        MetadataStore& metadata = storage_->Metadata();
        if (metadata.SaveFeatureMap(features_.Snapshot()) && SaveCounters()) {
            report.clusters_saved = SaveDirtyClusters(dirty);

            std::vector<NeuronCluster*> written;
            std::vector<ClusterSummary> summaries;
            for (NeuronCluster* cluster : dirty) {
                if (!cluster->HasUnsavedChanges()) {
                    written.push_back(cluster);
                    summaries.push_back(cluster->Summary());
                }
            }
            if (!summaries.empty() &&
                !(metadata.SaveClusterIndex(summaries) && metadata.SaveRegionMap(region_map_))) {
                // Not findable after a restart yet; keep them in memory
                for (NeuronCluster* cluster : written) {
                    cluster->MarkDirty();
                }
                report.clusters_saved = 0;
            }
        } else {
            std::cerr << "Orchestrator: cannot save feature map, keeping idle clusters loaded"
                      << std::endl;
        }
    }

    for (NeuronCluster* cluster : idle_clusters) {
        if (!cluster->HasUnsavedChanges()) {
            cluster->Unload();
            report.clusters_unloaded++;
        }
    }

    report.synapses_pruned = graph_.Prune();
    report.synapses_pruned += graph_.AgeAll(1.0);

    Timestamp::Duration elapsed = now - last_maintenance_;
    for (auto& [id, cluster] : clusters_) {
        if (cluster.IsLoaded()) {
            cluster.RestNeurons(elapsed);
        }
    }
    last_maintenance_ = now;

    if (activation_stats_.RegionCount() > config_.activation.max_regions) {
        report.regions_pruned = activation_stats_.Prune(config_.activation.prune_min_count);
    }

    if (config_.learning.verbose) {
        std::cerr << "Orchestrator: maintenance consolidated " << report.neurons_consolidated
                  << ", saved " << report.clusters_saved
                  << ", unloaded " << report.clusters_unloaded
                  << ", pruned " << report.synapses_pruned << " synapses and "
                  << report.regions_pruned << " regions" << std::endl;
    }
    return report;
}

// ============================================================================
// Statistics
// ============================================================================

Orchestrator::Stats Orchestrator::GetStats() const {
    Stats stats;
    stats.total_clusters = clusters_.size();
    for (const auto& [id, cluster] : clusters_) {
        if (cluster.IsLoaded()) {
            stats.loaded_clusters++;
        }
        stats.total_neurons += cluster.Size();
    }
    stats.synapse_count = graph_.GetEdgeCount();
    stats.neurons_created = neurons_created_;
    stats.concepts_learned = concepts_learned_;
    stats.inputs_processed = inputs_processed_;
    stats.storage_bytes = storage_->GetStorageStats().total_bytes;
    stats.uptime_seconds = SecondsBetween(started_at_, Timestamp::Now());
    return stats;
}

Orchestrator::EnhancedStats Orchestrator::GetEnhancedStats() const {
    EnhancedStats stats;
    stats.engine = GetStats();
    stats.partitions = storage_->GetPartitionStats();
    if (const CodebookQuantizer* codebook = GetCodebook()) {
        stats.codebook = codebook->GetStats();
    }
    stats.synapses = graph_.GetStats();
    stats.activation_regions = activation_stats_.RegionCount();
    stats.total_activations = activation_stats_.TotalActivations();
    stats.capacity_entries = capacity_.Size();
    stats.feature_count = features_.Size();
    return stats;
}

const NeuronCluster* Orchestrator::GetCluster(ClusterID id) const {
    auto it = clusters_.find(id);
    return it != clusters_.end() ? &it->second : nullptr;
}

std::vector<ClusterID> Orchestrator::GetClusterIDs() const {
    std::vector<ClusterID> ids;
    ids.reserve(clusters_.size());
    for (const auto& [id, cluster] : clusters_) {
        ids.push_back(id);
    }
    return ids;
}

std::vector<ClusterID> Orchestrator::ClustersForConcept(const std::string& label) const {
    auto it = concept_affinity_.find(NormalizeLabel(label));
    if (it == concept_affinity_.end()) {
        return {};
    }
    return std::vector<ClusterID>(it->second.begin(), it->second.end());
}

} // namespace engram
