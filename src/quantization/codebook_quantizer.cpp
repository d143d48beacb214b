// File: src/quantization/codebook_quantizer.cpp
#include "quantization/codebook_quantizer.hpp"
#include <algorithm>
#include <cmath>
#include <limits>
#include <random>
#include <stdexcept>

namespace engram {

// ============================================================================
// CodebookSnapshot
// ============================================================================

void CodebookSnapshot::Serialize(std::ostream& out) const {
    io::WritePod<uint64_t>(out, codebook_size);
    io::WritePod<uint64_t>(out, dimension);
    io::WritePod(out, commitment_cost);
    io::WritePod(out, ema_decay);
    for (size_t i = 0; i < codebook_size; ++i) {
        codebook[i].Serialize(out);
        io::WritePod(out, ema_cluster_size[i]);
        ema_codebook_sum[i].Serialize(out);
        io::WritePod(out, usage_counts[i]);
    }
    io::WritePod(out, total_encodings);
    io::WritePod(out, total_commitment_loss);
}

CodebookSnapshot CodebookSnapshot::Deserialize(std::istream& in) {
    CodebookSnapshot snapshot;
    snapshot.codebook_size = io::ReadPod<uint64_t>(in);
    snapshot.dimension = io::ReadPod<uint64_t>(in);
    snapshot.commitment_cost = io::ReadPod<float>(in);
    snapshot.ema_decay = io::ReadPod<float>(in);

    if (snapshot.codebook_size > (1u << 20)) {
        throw std::runtime_error("Codebook snapshot size out of range");
    }

    snapshot.codebook.reserve(snapshot.codebook_size);
    for (size_t i = 0; i < snapshot.codebook_size; ++i) {
        snapshot.codebook.push_back(FeatureVector::Deserialize(in));
        snapshot.ema_cluster_size.push_back(io::ReadPod<float>(in));
        snapshot.ema_codebook_sum.push_back(FeatureVector::Deserialize(in));
        snapshot.usage_counts.push_back(io::ReadPod<uint64_t>(in));
    }
    snapshot.total_encodings = io::ReadPod<uint64_t>(in);
    snapshot.total_commitment_loss = io::ReadPod<double>(in);
    return snapshot;
}

// ============================================================================
// Construction
// ============================================================================

CodebookQuantizer::CodebookQuantizer() : CodebookQuantizer(Config()) {}

CodebookQuantizer::CodebookQuantizer(const Config& config)
    : config_(config) {
    if (config_.codebook_size == 0 || config_.dimension == 0) {
        throw std::invalid_argument("CodebookQuantizer requires non-zero size and dimension");
    }
    config_.ema_decay = std::clamp(config_.ema_decay, 0.0f, 0.9999f);

    std::mt19937 rng(config_.seed);
    std::uniform_real_distribution<float> init(-config_.init_range, config_.init_range);

    codebook_.reserve(config_.codebook_size);
    for (size_t i = 0; i < config_.codebook_size; ++i) {
        FeatureVector code(config_.dimension);
        for (size_t d = 0; d < config_.dimension; ++d) {
            code[d] = init(rng);
        }
        codebook_.push_back(std::move(code));
    }

    ema_cluster_size_.assign(config_.codebook_size, 0.0f);
    ema_codebook_sum_.assign(config_.codebook_size, FeatureVector(config_.dimension));
    usage_counts_.assign(config_.codebook_size, 0);
}

// ============================================================================
// RegionQuantizer
// ============================================================================

RegionCode CodebookQuantizer::Assign(const FeatureVector& vector) {
    return CodeName(QuantizeAndUpdate(vector).code);
}

std::vector<RegionCode> CodebookQuantizer::Nearest(const FeatureVector& vector, size_t k) const {
    std::vector<RegionCode> regions;
    for (size_t index : GetNearestCodes(vector, k)) {
        regions.push_back(CodeName(index));
    }
    return regions;
}

// ============================================================================
// Quantization
// ============================================================================

CodebookQuantizer::Assignment CodebookQuantizer::QuantizeAndUpdate(const FeatureVector& vector) {
    Assignment result;
    if (vector.Empty()) {
        // Degenerate input maps to the first code
        return result;
    }
    CheckDimension(vector);

    auto ranked = RankCodes(vector);
    result.code = ranked.front().second;
    result.distance = ranked.front().first;
    result.commitment_loss = config_.commitment_cost * result.distance;

    usage_counts_[result.code]++;
    total_encodings_++;
    total_commitment_loss_ += result.commitment_loss;

    // A zero vector carries no direction to learn from
    if (!vector.IsZero()) {
        UpdateCode(result.code, vector);
    }

    return result;
}

size_t CodebookQuantizer::QuantizeReadOnly(const FeatureVector& vector) const {
    if (vector.Empty()) {
        return 0;
    }
    CheckDimension(vector);
    return RankCodes(vector).front().second;
}

std::vector<size_t> CodebookQuantizer::GetNearestCodes(const FeatureVector& vector, size_t k) const {
    std::vector<size_t> codes;
    if (k == 0) {
        return codes;
    }
    if (vector.Empty()) {
        codes.push_back(0);
        return codes;
    }
    CheckDimension(vector);

    auto ranked = RankCodes(vector);
    size_t count = std::min(k, ranked.size());
    codes.reserve(count);
    for (size_t i = 0; i < count; ++i) {
        codes.push_back(ranked[i].second);
    }
    return codes;
}

const FeatureVector& CodebookQuantizer::GetCode(size_t index) const {
    if (index >= codebook_.size()) {
        throw std::out_of_range("Codebook index out of range: " + std::to_string(index));
    }
    return codebook_[index];
}

void CodebookQuantizer::CheckDimension(const FeatureVector& vector) const {
    if (vector.Dimension() != config_.dimension) {
        throw std::invalid_argument("CodebookQuantizer: vector dimension " +
                                    std::to_string(vector.Dimension()) + " != " +
                                    std::to_string(config_.dimension));
    }
}

std::vector<std::pair<float, size_t>> CodebookQuantizer::RankCodes(const FeatureVector& vector) const {
    std::vector<std::pair<float, size_t>> ranked;
    ranked.reserve(codebook_.size());
    for (size_t i = 0; i < codebook_.size(); ++i) {
        ranked.emplace_back(codebook_[i].SquaredDistance(vector), i);
    }
    // Ties resolve to the lower index
    std::sort(ranked.begin(), ranked.end());
    return ranked;
}

void CodebookQuantizer::UpdateCode(size_t index, const FeatureVector& vector) {
    const float decay = config_.ema_decay;

    ema_cluster_size_[index] = decay * ema_cluster_size_[index] + (1.0f - decay);

    FeatureVector& sum = ema_codebook_sum_[index];
    for (size_t d = 0; d < config_.dimension; ++d) {
        sum[d] = decay * sum[d] + (1.0f - decay) * vector[d];
    }

    float denominator = ema_cluster_size_[index] + kEpsilon;
    FeatureVector& code = codebook_[index];
    for (size_t d = 0; d < config_.dimension; ++d) {
        code[d] = sum[d] / denominator;
    }
}

// ============================================================================
// Statistics
// ============================================================================

CodebookQuantizer::Stats CodebookQuantizer::GetStats() const {
    Stats stats;
    stats.codebook_size = codebook_.size();
    stats.total_encodings = total_encodings_;

    uint64_t most = 0;
    uint64_t least = std::numeric_limits<uint64_t>::max();
    double entropy = 0.0;

    for (size_t i = 0; i < usage_counts_.size(); ++i) {
        uint64_t count = usage_counts_[i];
        if (count == 0) {
            continue;
        }
        stats.active_codes++;
        if (count > most) {
            most = count;
            stats.most_used_code = i;
        }
        if (count < least) {
            least = count;
            stats.least_used_code = i;
        }
        if (total_encodings_ > 0) {
            double p = static_cast<double>(count) / static_cast<double>(total_encodings_);
            entropy -= p * std::log(p);
        }
    }

    stats.most_used_count = most;
    stats.least_used_count = stats.active_codes > 0 ? least : 0;
    stats.utilization = static_cast<float>(stats.active_codes) /
                        static_cast<float>(std::max<size_t>(1, codebook_.size()));
    stats.perplexity = stats.active_codes > 0 ? static_cast<float>(std::exp(entropy)) : 0.0f;
    stats.average_commitment_loss = total_encodings_ > 0
        ? total_commitment_loss_ / static_cast<double>(total_encodings_)
        : 0.0;
    return stats;
}

// ============================================================================
// Snapshot
// ============================================================================

CodebookSnapshot CodebookQuantizer::Export() const {
    CodebookSnapshot snapshot;
    snapshot.codebook_size = codebook_.size();
    snapshot.dimension = config_.dimension;
    snapshot.commitment_cost = config_.commitment_cost;
    snapshot.ema_decay = config_.ema_decay;
    snapshot.codebook = codebook_;
    snapshot.ema_cluster_size = ema_cluster_size_;
    snapshot.ema_codebook_sum = ema_codebook_sum_;
    snapshot.usage_counts = usage_counts_;
    snapshot.total_encodings = total_encodings_;
    snapshot.total_commitment_loss = total_commitment_loss_;
    return snapshot;
}

void CodebookQuantizer::Import(const CodebookSnapshot& snapshot) {
    if (snapshot.codebook_size != config_.codebook_size ||
        snapshot.dimension != config_.dimension ||
        snapshot.codebook.size() != snapshot.codebook_size ||
        snapshot.ema_cluster_size.size() != snapshot.codebook_size ||
        snapshot.ema_codebook_sum.size() != snapshot.codebook_size ||
        snapshot.usage_counts.size() != snapshot.codebook_size) {
        throw std::invalid_argument("Codebook snapshot shape does not match quantizer");
    }
    for (size_t i = 0; i < snapshot.codebook_size; ++i) {
        if (snapshot.codebook[i].Dimension() != config_.dimension ||
            snapshot.ema_codebook_sum[i].Dimension() != config_.dimension) {
            throw std::invalid_argument("Codebook snapshot entry has wrong dimension");
        }
    }

    codebook_ = snapshot.codebook;
    ema_cluster_size_ = snapshot.ema_cluster_size;
    ema_codebook_sum_ = snapshot.ema_codebook_sum;
    usage_counts_ = snapshot.usage_counts;
    total_encodings_ = snapshot.total_encodings;
    total_commitment_loss_ = snapshot.total_commitment_loss;
}

RegionCode CodebookQuantizer::CodeName(size_t index) {
    return "vq_" + std::to_string(index);
}

std::optional<size_t> CodebookQuantizer::ParseCodeName(const RegionCode& code) {
    if (code.size() <= 3 || code.compare(0, 3, "vq_") != 0) {
        return std::nullopt;
    }
    size_t value = 0;
    for (size_t i = 3; i < code.size(); ++i) {
        char c = code[i];
        if (c < '0' || c > '9') {
            return std::nullopt;
        }
        value = value * 10 + static_cast<size_t>(c - '0');
    }
    return value;
}

} // namespace engram
