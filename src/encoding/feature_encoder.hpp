// File: src/encoding/feature_encoder.hpp
#pragma once

#include "core/feature_vector.hpp"
#include <cstdint>
#include <string>

namespace engram {

/// FeatureEncoder: Deterministic token -> FeatureVector mapping
///
/// The 128-dimensional output is split into four 32-slot sections:
/// - [0, 32)    orthographic shape (length, character class ratios, case, repeats)
/// - [32, 64)   hashed character bigrams and trigrams
/// - [64, 96)   phonetic heuristics (syllables, consonant clusters, edge letters)
/// - [96, 128)  statistical heuristics (estimated frequency, rank, word shape)
///
/// Slots a section does not compute are filled from a stable string hash so
/// every dimension carries signal. The result is L2-normalized.
/// The encoder holds no state; the same token always yields the same bytes.
class FeatureEncoder {
public:
    static constexpr size_t kSectionSize = 32;
    static constexpr size_t kDimension = 4 * kSectionSize;

    static constexpr size_t kOrthographicOffset = 0;
    static constexpr size_t kNgramOffset = kSectionSize;
    static constexpr size_t kPhoneticOffset = 2 * kSectionSize;
    static constexpr size_t kStatisticalOffset = 3 * kSectionSize;

    FeatureEncoder() = default;

    /// Encode a single token
    /// @param token Raw token (trimmed; case only affects the shape features)
    /// @return Unit vector of kDimension, or the zero vector for blank input
    FeatureVector Encode(const std::string& token) const;

    /// Encode whitespace separated text as the normalized mean of its words
    /// @param text Phrase to encode
    /// @return Unit vector, or the zero vector when no words are present
    FeatureVector EncodePhrase(const std::string& text) const;

    /// 31-multiplier string hash over bytes, seeded with 17, absolute value
    static int64_t StableHash(const std::string& text);

    /// Estimated corpus frequency of a lower-case word (>= 1)
    static double EstimateFrequency(const std::string& word);

    /// Estimated frequency rank derived from EstimateFrequency
    static double EstimateRank(double frequency);

    /// Vowel-group syllable count, minimum 1
    static int CountSyllables(const std::string& word);

private:
    void EncodeOrthographic(const std::string& raw, const std::string& word, FeatureVector& out) const;
    void EncodeNgrams(const std::string& word, FeatureVector& out) const;
    void EncodePhonetic(const std::string& word, FeatureVector& out) const;
    void EncodeStatistical(const std::string& raw, const std::string& word, FeatureVector& out) const;

    // Fill [first, kSectionSize) of a section with hash-derived values in [-0.5, 0.5)
    static void FillSection(const std::string& word, const char* section,
                            size_t offset, size_t first, FeatureVector& out);

    // Hash a key into [0, 1)
    static float HashUnit(const std::string& key);
};

} // namespace engram
