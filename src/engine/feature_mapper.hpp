// File: src/engine/feature_mapper.hpp
#pragma once

#include "cluster/neuron.hpp"
#include "core/types.hpp"
#include <map>
#include <optional>
#include <string>
#include <unordered_map>

namespace engram {

/// FeatureMapper: Stable mapping between feature names and FeatureIDs
///
/// Names are lower-cased before lookup, so "Red" and "red" share an id.
/// Ids are never reused; Restore() advances the FeatureID generator past
/// every restored id.
class FeatureMapper {
public:
    FeatureMapper() = default;

    /// Id for a feature name, created on first use
    FeatureID GetOrCreate(const std::string& name);

    /// Id for a feature name if it has been seen
    std::optional<FeatureID> Find(const std::string& name) const;

    /// Name registered for an id
    std::optional<std::string> NameOf(FeatureID id) const;

    /// Convert named features to neuron inputs, registering new names
    NeuronInputs ToNeuronInputs(const FeatureMap& features);

    /// Ordered copy of the name -> id map
    std::map<std::string, FeatureID> Snapshot() const;

    /// Replace the mapping
    void Restore(const std::map<std::string, FeatureID>& mapping);

    size_t Size() const { return by_name_.size(); }

    /// Lower-case ASCII copy of a name
    static std::string Normalize(const std::string& name);

private:
    std::unordered_map<std::string, FeatureID> by_name_;
    std::unordered_map<FeatureID, std::string> by_id_;
};

} // namespace engram
