// File: src/allocation/neuron_hypernetwork.hpp
#pragma once

#include "core/feature_vector.hpp"
#include <cstdint>
#include <string>
#include <vector>

namespace engram {

/// NeuronRole: Position-derived specialization of a neuron within its cluster
enum class NeuronRole : uint8_t {
    INPUT_RECEIVER = 0,
    PATTERN_DETECTOR = 1,
    INTEGRATOR = 2,
    OUTPUT_GENERATOR = 3,
};

const char* ToString(NeuronRole role);

/// Procedurally generated properties for one new neuron
struct NeuronProperties {
    size_t index{0};
    float activation_threshold{0.5f};  // [0.3, 0.7]
    float decay_rate{0.9f};            // [0.9, 0.99]
    NeuronRole role{NeuronRole::INTEGRATOR};
};

/// NeuronHypernetwork: Maps pattern statistics to a cluster size
///
/// N = clamp(round(min + alpha*log(1 + frequency) + beta*novelty + gamma*complexity),
///           min, max)
///
/// Pure: the same (novelty, frequency, complexity) always gives the same N.
class NeuronHypernetwork {
public:
    struct Config {
        Config() = default;
        double alpha{20.0};   // frequency weight
        double beta{100.0};   // novelty weight
        double gamma{50.0};   // complexity weight
        int min_neurons{5};
        int max_neurons{500};
        uint32_t seed{42};
    };

    NeuronHypernetwork();
    explicit NeuronHypernetwork(const Config& config);

    /// Target neuron count; inputs are clamped to [0,1]
    int NeuronCount(double novelty, double frequency, double complexity) const;

    /// Dispersion of a vector in [0,1]:
    /// 0.3 * nonzero fraction + 0.3 * min(1, 10 * variance) + 0.4 * normalized entropy of |x|
    static double Complexity(const FeatureVector& vector);

    /// Deterministic per-neuron properties seeded from the config seed and the vector
    std::vector<NeuronProperties> GenerateNeuronProperties(const FeatureVector& vector,
                                                           size_t count,
                                                           size_t first_index = 0) const;

    const Config& GetConfig() const { return config_; }

private:
    Config config_;

    uint32_t PatternSeed(const FeatureVector& vector) const;
};

} // namespace engram
