// File: src/cluster/neuron.cpp
#include "cluster/neuron.hpp"
#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace engram {

Neuron::Neuron(NeuronID id, const NeuronProperties& properties)
    : id_(id),
      role_(properties.role),
      threshold_(kRestingPotential + 2.0f * std::clamp(properties.activation_threshold, 0.05f, 1.0f)),
      potential_decay_(std::clamp(properties.decay_rate, 0.0f, 1.0f)),
      created_at_(Timestamp::Now()),
      last_used_(created_at_) {}

float Neuron::ActivationAboveRest() const {
    return std::max(0.0f, current_potential_ - resting_potential_);
}

std::optional<float> Neuron::GetWeight(FeatureID feature) const {
    auto it = weights_.find(feature);
    if (it == weights_.end()) {
        return std::nullopt;
    }
    return it->second;
}

void Neuron::SetWeight(FeatureID feature, float weight) {
    weights_[feature] = std::clamp(weight, -kMaxAbsWeight, kMaxAbsWeight);
}

size_t Neuron::InitializeWeights(const NeuronInputs& inputs, std::mt19937& rng) {
    std::uniform_real_distribution<float> initial(0.5f, 1.5f);
    size_t created = 0;
    for (const auto& [feature, value] : inputs) {
        if (weights_.count(feature) == 0) {
            weights_[feature] = initial(rng) * 3.0f;
            ++created;
        }
    }
    return created;
}

// ============================================================================
// Dynamics
// ============================================================================

float Neuron::ProcessInputs(const NeuronInputs& inputs) {
    Timestamp now = Timestamp::Now();
    if (now > last_used_) {
        double idle_minutes = SecondsBetween(last_used_, now) / 60.0;
        fatigue_ = std::max(0.0f, fatigue_ - static_cast<float>(idle_minutes) * kFatigueRecoveryPerMinute);
    }
    last_used_ = now;

    float weighted_sum = bias_;
    for (const auto& [feature, value] : inputs) {
        auto it = weights_.find(feature);
        if (it != weights_.end()) {
            weighted_sum += value * it->second;
        }
    }

    float adjusted_threshold = threshold_ + fatigue_ * 10.0f;
    current_potential_ = resting_potential_ + weighted_sum;

    if (current_potential_ > adjusted_threshold && !IsExhausted()) {
        Fire();
        float normalized = (current_potential_ - resting_potential_) / (threshold_ - resting_potential_);
        last_output_ = std::tanh(normalized * 2.0f);
        return last_output_;
    }

    current_potential_ = resting_potential_ + (current_potential_ - resting_potential_) * potential_decay_;
    last_output_ = 0.0f;
    return 0.0f;
}

void Neuron::Fire() {
    activation_count_++;
    fatigue_ = std::min(1.0f, fatigue_ + kFatiguePerFiring);
    UpdateImportance();
}

void Neuron::UpdateImportance() {
    float usage = std::log(static_cast<float>(activation_count_) + 1.0f) / 10.0f;
    float connections = static_cast<float>(weights_.size()) / 100.0f;
    float concepts = static_cast<float>(concepts_.size()) / 10.0f;
    importance_ = std::clamp(usage + connections + concepts, 0.0f, 1.0f);
}

void Neuron::Learn(FeatureID feature, float input, float target, float actual) {
    float delta = learning_rate_ * (target - actual) * input;
    if (delta == 0.0f) {
        return;
    }
    stm_deltas_[feature] += delta;
    stm_salience_ += std::abs(delta);
}

bool Neuron::ConsolidateToLtm(float epsilon) {
    if (stm_deltas_.empty()) {
        return false;
    }

    bool changed = false;
    for (const auto& [feature, delta] : stm_deltas_) {
        if (std::abs(delta) < epsilon) {
            continue;
        }
        auto it = weights_.find(feature);
        float current = it != weights_.end() ? it->second : 0.0f;
        SetWeight(feature, current + delta);
        if (std::abs(weights_[feature]) < kMinRetainedWeight) {
            weights_.erase(feature);
        }
        changed = true;
    }

    stm_deltas_.clear();
    stm_salience_ *= 0.5f;
    return changed;
}

void Neuron::Rest(Timestamp::Duration elapsed) {
    double minutes = static_cast<double>(elapsed.count()) / 60e6;
    fatigue_ = std::max(0.0f, fatigue_ - static_cast<float>(minutes) * kFatigueRecoveryPerMinute);
    current_potential_ = resting_potential_;
}

// ============================================================================
// Serialization
// ============================================================================

namespace {
constexpr uint8_t kNeuronFormat = 2;
} // namespace

void Neuron::Serialize(std::ostream& out) const {
    io::WritePod(out, kNeuronFormat);
    id_.Serialize(out);
    io::WritePod(out, static_cast<uint8_t>(role_));
    io::WritePod(out, resting_potential_);
    io::WritePod(out, threshold_);
    io::WritePod(out, current_potential_);
    io::WritePod(out, bias_);
    io::WritePod(out, learning_rate_);
    io::WritePod(out, fatigue_);
    io::WritePod(out, potential_decay_);
    io::WritePod(out, last_output_);
    io::WritePod(out, activation_count_);
    io::WritePod(out, importance_);
    created_at_.Serialize(out);
    last_used_.Serialize(out);

    io::WritePod<uint64_t>(out, weights_.size());
    for (const auto& [feature, weight] : weights_) {
        feature.Serialize(out);
        io::WritePod(out, weight);
    }
    io::WriteStringSet(out, concepts_);

    io::WritePod(out, stm_salience_);
    io::WritePod<uint64_t>(out, stm_deltas_.size());
    for (const auto& [feature, delta] : stm_deltas_) {
        feature.Serialize(out);
        io::WritePod(out, delta);
    }
}

Neuron Neuron::Deserialize(std::istream& in) {
    uint8_t format = io::ReadPod<uint8_t>(in);
    if (format != kNeuronFormat) {
        throw std::runtime_error("Unsupported neuron format " + std::to_string(format));
    }

    Neuron neuron;
    neuron.id_ = NeuronID::Deserialize(in);
    neuron.role_ = static_cast<NeuronRole>(io::ReadPod<uint8_t>(in));
    neuron.resting_potential_ = io::ReadPod<float>(in);
    neuron.threshold_ = io::ReadPod<float>(in);
    neuron.current_potential_ = io::ReadPod<float>(in);
    neuron.bias_ = io::ReadPod<float>(in);
    neuron.learning_rate_ = io::ReadPod<float>(in);
    neuron.fatigue_ = io::ReadPod<float>(in);
    neuron.potential_decay_ = io::ReadPod<float>(in);
    neuron.last_output_ = io::ReadPod<float>(in);
    neuron.activation_count_ = io::ReadPod<uint64_t>(in);
    neuron.importance_ = io::ReadPod<float>(in);
    neuron.created_at_ = Timestamp::Deserialize(in);
    neuron.last_used_ = Timestamp::Deserialize(in);

    uint64_t weight_count = io::ReadPod<uint64_t>(in);
    for (uint64_t i = 0; i < weight_count; ++i) {
        FeatureID feature = FeatureID::Deserialize(in);
        neuron.weights_[feature] = io::ReadPod<float>(in);
    }
    neuron.concepts_ = io::ReadStringSet(in);

    neuron.stm_salience_ = io::ReadPod<float>(in);
    uint64_t delta_count = io::ReadPod<uint64_t>(in);
    for (uint64_t i = 0; i < delta_count; ++i) {
        FeatureID feature = FeatureID::Deserialize(in);
        neuron.stm_deltas_[feature] = io::ReadPod<float>(in);
    }
    return neuron;
}

} // namespace engram
