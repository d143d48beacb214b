// File: src/allocation/capacity_controller.cpp
#include "allocation/capacity_controller.hpp"
#include <algorithm>
#include <cmath>

namespace engram {

ConceptCapacityController::ConceptCapacityController()
    : ConceptCapacityController(Config()) {}

ConceptCapacityController::ConceptCapacityController(const Config& config)
    : config_(config),
      hypernetwork_(config.hypernetwork),
      stochastic_(config.stochastic) {
    config_.min_neurons = std::max(1, config_.min_neurons);
    config_.max_neurons = std::max(config_.min_neurons, config_.max_neurons);
    config_.ema_alpha = std::clamp(config_.ema_alpha, 0.0, 1.0);
    config_.hysteresis = std::clamp(config_.hysteresis, 0.0, 0.99);
}

int ConceptCapacityController::Clamp(int value) const {
    return std::clamp(value, config_.min_neurons, config_.max_neurons);
}

int ConceptCapacityController::TargetFor(const std::string& label, const AllocationSignal& signal) {
    auto it = targets_.find(label);
    if (it != targets_.end()) {
        return it->second;
    }

    int seeded = 0;
    if (config_.strategy == AllocationStrategy::STOCHASTIC) {
        seeded = stochastic_.NeuronCount(label, signal.features, signal.neurons_in_use);
    } else {
        seeded = hypernetwork_.NeuronCount(signal.novelty, signal.frequency, signal.complexity);
    }

    int target = Clamp(seeded);
    targets_.emplace(label, target);
    return target;
}

void ConceptCapacityController::Adjust(const std::string& label, int observed, double demand) {
    demand_[label] = demand;

    auto it = targets_.find(label);
    int current = it != targets_.end() ? it->second : Clamp(observed);
    current = Clamp(current);

    double ratio = static_cast<double>(std::max(1, observed)) /
                   static_cast<double>(std::max(1, current));
    double lower = 1.0 - config_.hysteresis;
    double upper = 1.0 + config_.hysteresis;

    if (ratio < lower || ratio > upper) {
        double desired = static_cast<double>(Clamp(observed));
        double updated = current * (1.0 - config_.ema_alpha) + desired * config_.ema_alpha;
        current = Clamp(static_cast<int>(std::lround(updated)));
    }

    targets_[label] = current;
}

std::optional<int> ConceptCapacityController::Get(const std::string& label) const {
    auto it = targets_.find(label);
    if (it == targets_.end()) {
        return std::nullopt;
    }
    return it->second;
}

void ConceptCapacityController::Set(const std::string& label, int target) {
    targets_[label] = Clamp(target);
}

std::optional<double> ConceptCapacityController::GetDemand(const std::string& label) const {
    auto it = demand_.find(label);
    if (it == demand_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::map<std::string, int> ConceptCapacityController::Snapshot() const {
    return std::map<std::string, int>(targets_.begin(), targets_.end());
}

void ConceptCapacityController::Restore(const std::map<std::string, int>& targets) {
    targets_.clear();
    for (const auto& [label, target] : targets) {
        targets_[label] = Clamp(target);
    }
}

} // namespace engram
