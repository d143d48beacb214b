// File: src/engine/feature_mapper.cpp
#include "engine/feature_mapper.hpp"
#include <algorithm>
#include <cctype>

namespace engram {

std::string FeatureMapper::Normalize(const std::string& name) {
    std::string result = name;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return result;
}

FeatureID FeatureMapper::GetOrCreate(const std::string& name) {
    std::string key = Normalize(name);
    auto it = by_name_.find(key);
    if (it != by_name_.end()) {
        return it->second;
    }

    FeatureID id = FeatureID::Generate();
    by_name_.emplace(key, id);
    by_id_.emplace(id, std::move(key));
    return id;
}

std::optional<FeatureID> FeatureMapper::Find(const std::string& name) const {
    auto it = by_name_.find(Normalize(name));
    if (it == by_name_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::optional<std::string> FeatureMapper::NameOf(FeatureID id) const {
    auto it = by_id_.find(id);
    if (it == by_id_.end()) {
        return std::nullopt;
    }
    return it->second;
}

NeuronInputs FeatureMapper::ToNeuronInputs(const FeatureMap& features) {
    NeuronInputs inputs;
    inputs.reserve(features.size());
    for (const auto& [name, value] : features) {
        // Names that differ only by case collapse; the last one wins
        inputs[GetOrCreate(name)] = value;
    }
    return inputs;
}

std::map<std::string, FeatureID> FeatureMapper::Snapshot() const {
    return std::map<std::string, FeatureID>(by_name_.begin(), by_name_.end());
}

void FeatureMapper::Restore(const std::map<std::string, FeatureID>& mapping) {
    by_name_.clear();
    by_id_.clear();
    for (const auto& [name, id] : mapping) {
        if (!id.IsValid()) {
            continue;
        }
        std::string key = Normalize(name);
        by_name_[key] = id;
        by_id_[id] = key;
        FeatureID::ReserveThrough(id.value());
    }
}

} // namespace engram
