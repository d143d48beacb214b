// File: src/allocation/stochastic_allocator.hpp
#pragma once

#include "core/types.hpp"
#include <cstdint>
#include <string>

namespace engram {

/// AllocationStrategy: Which sizing rule seeds a concept's capacity
enum class AllocationStrategy : uint8_t {
    HYPERNETWORK = 0,  // NeuronHypernetwork, used by the learn pipeline
    STOCHASTIC = 1,    // StochasticAllocator, opt-in alternative
};

const char* ToString(AllocationStrategy strategy);

/// @throws std::invalid_argument for unknown names
AllocationStrategy ParseAllocationStrategy(const std::string& str);

/// StochasticAllocator: Noisy power-law sizing rule
///
/// Alternative to NeuronHypernetwork that models developmental variability:
/// a jittered base count plus feature-interaction, network-position and
/// variation terms, passed through a power law with exponent in [1.3, 1.7]
/// and divided by a resource-pressure factor. The generator is seeded from an
/// FNV-1a hash of the label, so a given (label, features, load) triple is
/// reproducible, but neighbouring concepts get very different sizes.
class StochasticAllocator {
public:
    struct Config {
        Config() = default;
        int min_neurons{50};
        int max_neurons{600};
        uint32_t seed{42};
        double base_neurons{50.0};
        // Neurons in use at which resource pressure reaches 1.0
        double pressure_scale{10000.0};
    };

    StochasticAllocator();
    explicit StochasticAllocator(const Config& config);

    /// @param label Concept label
    /// @param features Caller-supplied features
    /// @param neurons_in_use Neurons currently loaded across all clusters
    int NeuronCount(const std::string& label,
                    const FeatureMap& features,
                    size_t neurons_in_use) const;

    /// 32-bit FNV-1a
    static uint32_t Fnv1a(const std::string& text);

    const Config& GetConfig() const { return config_; }

private:
    Config config_;
};

} // namespace engram
