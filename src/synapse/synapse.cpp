// File: src/synapse/synapse.cpp
#include "synapse/synapse.hpp"
#include <iomanip>
#include <sstream>

namespace engram {

Synapse::Synapse(NeuronID source_id, NeuronID target_id, float initial_weight)
    : source(source_id),
      target(target_id),
      weight(initial_weight),
      created_at(Timestamp::Now()),
      last_reinforced(created_at) {}

std::string Synapse::ToString() const {
    std::ostringstream oss;
    oss << "Synapse{" << source.ToString() << " -> " << target.ToString()
        << ", weight=" << std::fixed << std::setprecision(4) << weight
        << ", age=" << std::setprecision(1) << age_hours << "h"
        << ", coactivations=" << coactivation_count << "}";
    return oss.str();
}

} // namespace engram
