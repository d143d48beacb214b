// File: src/allocation/capacity_controller.hpp
#pragma once

#include "allocation/neuron_hypernetwork.hpp"
#include "allocation/stochastic_allocator.hpp"
#include "core/types.hpp"
#include <map>
#include <optional>
#include <string>
#include <unordered_map>

namespace engram {

/// Inputs used to seed a concept's first capacity target
struct AllocationSignal {
    double novelty{1.0};
    double frequency{0.0};
    double complexity{0.0};
    FeatureMap features;
    size_t neurons_in_use{0};
};

/// ConceptCapacityController: Per-concept target neuron counts
///
/// The first request for a concept seeds its target from the configured
/// allocator. Afterwards Adjust() only moves the target when the observed
/// neuron count leaves the hysteresis band [1-h, 1+h] around it, and then
/// only by an EMA step of alpha toward the observation. Targets always stay
/// within [min_neurons, max_neurons].
class ConceptCapacityController {
public:
    struct Config {
        Config() = default;
        int min_neurons{50};
        int max_neurons{600};
        double ema_alpha{0.05};
        double hysteresis{0.15};
        AllocationStrategy strategy{AllocationStrategy::HYPERNETWORK};
        NeuronHypernetwork::Config hypernetwork;
        StochasticAllocator::Config stochastic;
    };

    ConceptCapacityController();
    explicit ConceptCapacityController(const Config& config);

    /// Memoized target for a concept; seeds from the allocator on first use
    int TargetFor(const std::string& label, const AllocationSignal& signal);

    /// Adapt a concept's target toward an observed neuron count
    /// @param label Concept
    /// @param observed Neurons currently serving the concept
    /// @param demand observed / target, capped at 1.5; kept for statistics
    void Adjust(const std::string& label, int observed, double demand);

    /// Stored target, if any
    std::optional<int> Get(const std::string& label) const;

    /// Overwrite a target (clamped)
    void Set(const std::string& label, int target);

    /// Last demand signal passed to Adjust()
    std::optional<double> GetDemand(const std::string& label) const;

    /// Ordered copy of all targets
    std::map<std::string, int> Snapshot() const;

    /// Replace all targets (each clamped)
    void Restore(const std::map<std::string, int>& targets);

    size_t Size() const { return targets_.size(); }

    int Clamp(int value) const;

    const Config& GetConfig() const { return config_; }

private:
    Config config_;
    NeuronHypernetwork hypernetwork_;
    StochasticAllocator stochastic_;

    std::unordered_map<std::string, int> targets_;
    std::unordered_map<std::string, double> demand_;
};

} // namespace engram
