// File: src/allocation/stochastic_allocator.cpp
#include "allocation/stochastic_allocator.hpp"
#include <algorithm>
#include <cmath>
#include <random>
#include <stdexcept>

namespace engram {

const char* ToString(AllocationStrategy strategy) {
    switch (strategy) {
        case AllocationStrategy::HYPERNETWORK: return "hypernetwork";
        case AllocationStrategy::STOCHASTIC: return "stochastic";
        default: return "unknown";
    }
}

AllocationStrategy ParseAllocationStrategy(const std::string& str) {
    if (str == "hypernetwork") return AllocationStrategy::HYPERNETWORK;
    if (str == "stochastic") return AllocationStrategy::STOCHASTIC;
    throw std::invalid_argument("Unknown AllocationStrategy: " + str);
}

StochasticAllocator::StochasticAllocator() : StochasticAllocator(Config()) {}

StochasticAllocator::StochasticAllocator(const Config& config)
    : config_(config) {
    config_.min_neurons = std::max(1, config_.min_neurons);
    config_.max_neurons = std::max(config_.min_neurons, config_.max_neurons);
    if (config_.pressure_scale <= 0.0) {
        config_.pressure_scale = 1.0;
    }
}

uint32_t StochasticAllocator::Fnv1a(const std::string& text) {
    uint32_t hash = 2166136261u;
    for (unsigned char c : text) {
        hash ^= c;
        hash *= 16777619u;
    }
    return hash;
}

int StochasticAllocator::NeuronCount(const std::string& label,
                                     const FeatureMap& features,
                                     size_t neurons_in_use) const {
    std::mt19937 rng(Fnv1a(label) ^ config_.seed);
    std::uniform_real_distribution<double> unit(0.0, 1.0);
    std::uniform_int_distribution<int> base_jitter(-20, 79);

    double base = config_.base_neurons + base_jitter(rng);
    double pressure = std::clamp(static_cast<double>(neurons_in_use) / config_.pressure_scale, 0.5, 3.0);

    double score = 0.0;

    // Short words are cheaper to represent
    double efficiency = label.size() <= 4 ? 8.0 : (label.size() <= 6 ? 5.0 : 0.0);
    score -= efficiency * (0.5 + unit(rng) * 1.5) + (unit(rng) - 0.5) * 10.0;

    // Feature interactions
    if (features.empty()) {
        score += unit(rng) * 20.0;
    } else {
        double product = 1.0;
        double sum = 0.0;
        size_t taken = 0;
        for (const auto& [name, value] : features) {
            if (taken++ == 8) break;
            product *= (1.0 + value * 0.1);
            sum += value;
        }
        score += std::log(std::max(product, 1e-6)) * 25.0;
        score += sum * (2.0 + unit(rng) * 3.0);
        if (features.size() > 10) {
            score += static_cast<double>(features.size() - 10) * unit(rng) * 8.0;
        }
        score += (unit(rng) - 0.5) * 40.0;
    }

    // Network position
    score += (label.size() < 8 ? 30.0 : 15.0) * unit(rng);
    score += unit(rng) * 25.0;
    score += (unit(rng) - 0.5) * 30.0;

    // Individual variation
    score += (unit(rng) - 0.5) * 50.0;

    double exponent = 1.3 + unit(rng) * 0.4;
    double emergent = std::pow(std::abs(score), exponent) * (score < 0.0 ? -1.0 : 1.0);

    int count = static_cast<int>(std::ceil(base + emergent / pressure));
    return std::clamp(count, config_.min_neurons, config_.max_neurons);
}

} // namespace engram
