// File: src/synapse/decay_functions.hpp
#pragma once

#include <algorithm>
#include <cmath>
#include <limits>
#include <memory>
#include <string>

namespace engram {

/**
 * @brief Abstract interface for synapse weight decay
 *
 * A decay function maps a weight and the number of hours that passed
 * without reinforcement to a weakened weight. Implementations never
 * increase a weight and never return a negative one.
 */
class DecayFunction {
public:
    virtual ~DecayFunction() = default;

    /**
     * @brief Apply decay to a weight
     *
     * @param weight Current weight (typically in [0.0, 1.0])
     * @param hours Hours elapsed since the last decay step
     * @return Decayed weight
     */
    virtual float ApplyDecay(float weight, double hours) const = 0;

    /**
     * @brief Amount of weight lost over `hours` (always >= 0)
     */
    virtual float GetDecayAmount(float weight, double hours) const {
        return weight - ApplyDecay(weight, hours);
    }

    virtual const char* GetName() const = 0;

    virtual std::unique_ptr<DecayFunction> Clone() const = 0;
};

/**
 * @brief Exponential decay expressed as a per-hour retention factor
 *
 *   w(t) = w_0 * factor^t
 *
 * With the default factor 0.99 a synapse keeps 99% of its weight for
 * every hour it goes unreinforced.
 */
class ExponentialDecay : public DecayFunction {
public:
    explicit ExponentialDecay(float factor_per_hour = 0.99f)
        : factor_per_hour_(std::clamp(factor_per_hour, 0.0f, 1.0f)) {}

    float ApplyDecay(float weight, double hours) const override {
        if (weight <= 0.0f || hours <= 0.0 || factor_per_hour_ == 1.0f) {
            return weight;
        }
        float decayed = weight * static_cast<float>(std::pow(factor_per_hour_, hours));
        return std::max(0.0f, std::min(decayed, weight));
    }

    const char* GetName() const override { return "ExponentialDecay"; }

    std::unique_ptr<DecayFunction> Clone() const override {
        return std::make_unique<ExponentialDecay>(factor_per_hour_);
    }

    float GetFactorPerHour() const { return factor_per_hour_; }

    /**
     * @brief Hours for a weight to fall to 50%
     */
    float GetHalfLife() const {
        if (factor_per_hour_ <= 0.0f) {
            return 0.0f;
        }
        if (factor_per_hour_ >= 1.0f) {
            return std::numeric_limits<float>::infinity();
        }
        return std::log(0.5f) / std::log(factor_per_hour_);
    }

private:
    float factor_per_hour_;
};

/**
 * @brief Power-law decay
 *
 *   w(t) = w_0 / (1 + t/tau)^beta
 *
 * Slower than exponential over long idle periods.
 */
class PowerLawDecay : public DecayFunction {
public:
    explicit PowerLawDecay(float time_constant = 1.0f, float exponent = 0.5f)
        : time_constant_(time_constant > 0.0f ? time_constant : 1.0f),
          exponent_(exponent >= 0.0f ? exponent : 0.5f) {}

    float ApplyDecay(float weight, double hours) const override {
        if (weight <= 0.0f || hours <= 0.0) {
            return weight;
        }
        float divisor = static_cast<float>(std::pow(1.0 + hours / time_constant_, exponent_));
        float decayed = weight / divisor;
        return std::max(0.0f, std::min(decayed, weight));
    }

    const char* GetName() const override { return "PowerLawDecay"; }

    std::unique_ptr<DecayFunction> Clone() const override {
        return std::make_unique<PowerLawDecay>(time_constant_, exponent_);
    }

    float GetTimeConstant() const { return time_constant_; }
    float GetExponent() const { return exponent_; }

private:
    float time_constant_;  // tau, hours
    float exponent_;       // beta
};

/**
 * @brief Create a decay function by name
 *
 * @param name "exponential" or "powerlaw"
 * @param factor_per_hour Retention factor used by the exponential form
 * @return The decay function, or nullptr if the name is not recognized
 */
inline std::unique_ptr<DecayFunction> CreateDecayFunction(const std::string& name,
                                                          float factor_per_hour = 0.99f) {
    if (name == "exponential") {
        return std::make_unique<ExponentialDecay>(factor_per_hour);
    } else if (name == "powerlaw") {
        return std::make_unique<PowerLawDecay>();
    }
    return nullptr;
}

} // namespace engram
