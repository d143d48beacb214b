// File: src/storage/partitioner.cpp
#include "storage/partitioner.hpp"
#include <algorithm>
#include <cctype>
#include <cstdio>
#include <utility>

namespace engram {

namespace {

const std::vector<std::pair<std::string, std::vector<std::string>>>& DomainKeywords() {
    static const std::vector<std::pair<std::string, std::vector<std::string>>> keywords = {
        {"sensory", {"red", "blue", "green", "color", "visual", "audio", "touch"}},
        {"motor", {"move", "action", "motor", "control", "execute"}},
        {"memory", {"remember", "recall", "episodic", "semantic"}},
        {"association", {"relate", "connect", "associate", "concept"}},
    };
    return keywords;
}

} // namespace

Partitioner::Partitioner() : Partitioner(Config()) {}

Partitioner::Partitioner(const Config& config) : config_(config) {
    config_.shards = std::max<size_t>(1, config_.shards);
}

const std::vector<std::string>& Partitioner::Domains() {
    static const std::vector<std::string> domains = {
        "sensory", "motor", "memory", "association", "general"};
    return domains;
}

std::string Partitioner::DomainFor(const std::string& label) {
    std::string lowered = label;
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    for (const auto& [domain, words] : DomainKeywords()) {
        for (const auto& word : words) {
            if (lowered.find(word) != std::string::npos) {
                return domain;
            }
        }
    }
    return "general";
}

size_t Partitioner::ShardFor(ClusterID id) const {
    return static_cast<size_t>(id.value() % config_.shards);
}

std::string Partitioner::PartitionFor(ClusterID id, const std::string& label) const {
    char shard[32];
    std::snprintf(shard, sizeof(shard), "shard_%02zu", ShardFor(id));
    return DomainFor(label) + "/" + shard;
}

} // namespace engram
