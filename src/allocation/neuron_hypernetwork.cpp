// File: src/allocation/neuron_hypernetwork.cpp
#include "allocation/neuron_hypernetwork.hpp"
#include <algorithm>
#include <cmath>
#include <cstring>
#include <random>

namespace engram {

const char* ToString(NeuronRole role) {
    switch (role) {
        case NeuronRole::INPUT_RECEIVER: return "INPUT_RECEIVER";
        case NeuronRole::PATTERN_DETECTOR: return "PATTERN_DETECTOR";
        case NeuronRole::INTEGRATOR: return "INTEGRATOR";
        case NeuronRole::OUTPUT_GENERATOR: return "OUTPUT_GENERATOR";
        default: return "UNKNOWN";
    }
}

NeuronHypernetwork::NeuronHypernetwork() : NeuronHypernetwork(Config()) {}

NeuronHypernetwork::NeuronHypernetwork(const Config& config)
    : config_(config) {
    config_.min_neurons = std::max(1, config_.min_neurons);
    config_.max_neurons = std::max(config_.min_neurons, config_.max_neurons);
}

int NeuronHypernetwork::NeuronCount(double novelty, double frequency, double complexity) const {
    novelty = std::clamp(novelty, 0.0, 1.0);
    frequency = std::clamp(frequency, 0.0, 1.0);
    complexity = std::clamp(complexity, 0.0, 1.0);

    double raw = config_.min_neurons
               + config_.alpha * std::log(1.0 + frequency)
               + config_.beta * novelty
               + config_.gamma * complexity;

    int count = static_cast<int>(std::lround(raw));
    return std::clamp(count, config_.min_neurons, config_.max_neurons);
}

double NeuronHypernetwork::Complexity(const FeatureVector& vector) {
    const size_t n = vector.Dimension();
    if (n == 0) {
        return 0.0;
    }

    size_t nonzero = 0;
    double sum = 0.0;
    double abs_sum = 0.0;
    for (float v : vector.Data()) {
        if (std::abs(v) > 1e-6f) ++nonzero;
        sum += v;
        abs_sum += std::abs(v);
    }

    double sparsity_score = static_cast<double>(nonzero) / static_cast<double>(n);

    double mean = sum / static_cast<double>(n);
    double variance = 0.0;
    for (float v : vector.Data()) {
        variance += (v - mean) * (v - mean);
    }
    variance /= static_cast<double>(n);
    double variance_score = std::min(1.0, variance * 10.0);

    double entropy = 0.0;
    if (abs_sum > 0.0 && n > 1) {
        for (float v : vector.Data()) {
            double p = std::abs(v) / abs_sum;
            if (p > 1e-10) {
                entropy -= p * std::log(p);
            }
        }
        entropy /= std::log(static_cast<double>(n));
    }

    double complexity = 0.3 * sparsity_score + 0.3 * variance_score + 0.4 * entropy;
    return std::clamp(complexity, 0.0, 1.0);
}

std::vector<NeuronProperties> NeuronHypernetwork::GenerateNeuronProperties(
        const FeatureVector& vector, size_t count, size_t first_index) const {
    std::vector<NeuronProperties> properties;
    properties.reserve(count);

    std::mt19937 rng(PatternSeed(vector) ^ static_cast<uint32_t>(first_index * 2654435761u));
    std::uniform_real_distribution<float> unit(0.0f, 1.0f);

    // Roles are assigned by position within the batch being generated
    for (size_t i = 0; i < count; ++i) {
        NeuronProperties p;
        p.index = first_index + i;
        p.activation_threshold = 0.3f + unit(rng) * 0.4f;
        p.decay_rate = 0.9f + unit(rng) * 0.09f;

        double position = static_cast<double>(i) / static_cast<double>(count);
        if (position < 0.2) {
            p.role = NeuronRole::INPUT_RECEIVER;
        } else if (position < 0.8) {
            p.role = unit(rng) < 0.3f ? NeuronRole::PATTERN_DETECTOR : NeuronRole::INTEGRATOR;
        } else {
            p.role = NeuronRole::OUTPUT_GENERATOR;
        }
        properties.push_back(p);
    }

    return properties;
}

uint32_t NeuronHypernetwork::PatternSeed(const FeatureVector& vector) const {
    uint32_t hash = config_.seed;
    for (float value : vector.Data()) {
        uint32_t bits;
        std::memcpy(&bits, &value, sizeof(bits));
        hash = hash * 31u + bits;
    }
    return hash;
}

} // namespace engram
