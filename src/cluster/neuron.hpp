// File: src/cluster/neuron.hpp
#pragma once

#include "allocation/neuron_hypernetwork.hpp"
#include "core/types.hpp"
#include <optional>
#include <random>
#include <set>
#include <string>
#include <unordered_map>
#include <utility>

namespace engram {

/// Feature-id keyed input activations for a neuron
using NeuronInputs = std::unordered_map<FeatureID, float>;

/// Output of one neuron for one input presentation
using NeuronActivation = std::pair<NeuronID, float>;

/// Neuron: Threshold unit with learned per-feature input weights
///
/// The membrane potential is resting + bias + sum(w * x). A neuron fires
/// when the potential exceeds its threshold raised by 10 * fatigue and it
/// is not exhausted; firing returns tanh(2 * (pot - rest) / (thr - rest)).
/// Each firing adds fatigue, which recovers at 0.1 per idle minute.
class Neuron {
public:
    static constexpr float kRestingPotential = -70.0f;
    static constexpr float kDefaultLearningRate = 0.1f;
    static constexpr float kExhaustionFatigue = 0.8f;
    static constexpr float kFatiguePerFiring = 0.1f;
    static constexpr float kFatigueRecoveryPerMinute = 0.1f;
    static constexpr float kMaxAbsWeight = 10.0f;
    static constexpr float kMinRetainedWeight = 0.001f;

    Neuron() = default;
    Neuron(NeuronID id, const NeuronProperties& properties);

    // ========================================================================
    // Identity and properties
    // ========================================================================

    NeuronID GetID() const { return id_; }
    NeuronRole GetRole() const { return role_; }
    float GetRestingPotential() const { return resting_potential_; }
    float GetThreshold() const { return threshold_; }
    float GetCurrentPotential() const { return current_potential_; }
    float GetBias() const { return bias_; }
    float GetLearningRate() const { return learning_rate_; }
    float GetFatigue() const { return fatigue_; }
    float GetPotentialDecay() const { return potential_decay_; }
    float GetLastOutput() const { return last_output_; }
    uint64_t GetActivationCount() const { return activation_count_; }
    float GetImportance() const { return importance_; }
    Timestamp GetCreatedAt() const { return created_at_; }
    Timestamp GetLastUsed() const { return last_used_; }

    bool IsExhausted() const { return fatigue_ > kExhaustionFatigue; }

    /// Depolarization above rest, never negative
    float ActivationAboveRest() const;

    // ========================================================================
    // Weights
    // ========================================================================

    const std::unordered_map<FeatureID, float>& GetWeights() const { return weights_; }
    std::optional<float> GetWeight(FeatureID feature) const;
    bool HasWeights() const { return !weights_.empty(); }

    /// Set a weight (clamped to +/- kMaxAbsWeight)
    void SetWeight(FeatureID feature, float weight);

    /// Give every input feature without a weight an initial weight of
    /// uniform(0.5, 1.5) * 3
    /// @return Number of weights created
    size_t InitializeWeights(const NeuronInputs& inputs, std::mt19937& rng);

    // ========================================================================
    // Dynamics
    // ========================================================================

    /// Integrate inputs and possibly fire
    /// @return Firing output in (0, 1], or 0 when silent
    float ProcessInputs(const NeuronInputs& inputs);

    /// Delta rule: lr * (target - actual) * input is buffered in short-term
    /// memory and adds |delta| to the neuron's salience. Weights are not
    /// touched until ConsolidateToLtm().
    void Learn(FeatureID feature, float input, float target, float actual);

    // ========================================================================
    // Short-term memory
    // ========================================================================

    bool HasPendingStm() const { return !stm_deltas_.empty(); }
    float GetStmSalience() const { return stm_salience_; }
    const std::unordered_map<FeatureID, float>& GetPendingDeltas() const { return stm_deltas_; }

    /// Apply buffered deltas with |delta| >= epsilon to the weights, drop
    /// weights that end up below kMinRetainedWeight, clear the buffer and
    /// halve the salience
    /// @return true if any weight changed
    bool ConsolidateToLtm(float epsilon);

    /// Recover fatigue and return to rest after an idle period
    void Rest(Timestamp::Duration elapsed);

    // ========================================================================
    // Concepts
    // ========================================================================

    void AddConcept(const std::string& label) { concepts_.insert(label); }
    bool HasConcept(const std::string& label) const { return concepts_.count(label) > 0; }
    const std::set<std::string>& GetConcepts() const { return concepts_; }

    // ========================================================================
    // Serialization
    // ========================================================================

    void Serialize(std::ostream& out) const;
    static Neuron Deserialize(std::istream& in);

private:
    NeuronID id_;
    NeuronRole role_{NeuronRole::INTEGRATOR};

    float resting_potential_{kRestingPotential};
    float threshold_{kRestingPotential + 1.0f};
    float current_potential_{kRestingPotential};
    float bias_{0.0f};
    float learning_rate_{kDefaultLearningRate};
    float fatigue_{0.0f};
    float potential_decay_{0.9f};
    float last_output_{0.0f};
    uint64_t activation_count_{0};
    float importance_{0.0f};

    Timestamp created_at_;
    Timestamp last_used_;

    std::unordered_map<FeatureID, float> weights_;
    std::set<std::string> concepts_;

    std::unordered_map<FeatureID, float> stm_deltas_;
    float stm_salience_{0.0f};

    void Fire();
    void UpdateImportance();
};

} // namespace engram
