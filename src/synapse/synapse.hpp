// File: src/synapse/synapse.hpp
#pragma once

#include "core/types.hpp"
#include <string>

namespace engram {

/// Synapse: Directed weighted link between two neurons
///
/// Plain record. Bounds on the weight are enforced by the graph that owns it.
struct Synapse {
    NeuronID source;
    NeuronID target;
    float weight{0.0f};
    double age_hours{0.0};
    uint32_t coactivation_count{0};
    Timestamp created_at;
    Timestamp last_reinforced;

    Synapse() = default;
    Synapse(NeuronID source, NeuronID target, float weight);

    std::string ToString() const;
};

} // namespace engram
