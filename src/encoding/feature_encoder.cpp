// File: src/encoding/feature_encoder.cpp
#include "encoding/feature_encoder.hpp"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <set>
#include <sstream>

namespace engram {

namespace {

bool IsVowel(char c) {
    return c == 'a' || c == 'e' || c == 'i' || c == 'o' || c == 'u';
}

// 'y' counts as a vowel for syllable grouping only
bool IsSyllableVowel(char c) {
    return IsVowel(c) || c == 'y';
}

bool IsLetter(char c) {
    return std::isalpha(static_cast<unsigned char>(c)) != 0;
}

bool IsConsonant(char c) {
    return IsLetter(c) && !IsVowel(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
}

std::string Trim(const std::string& text) {
    size_t begin = 0;
    size_t end = text.size();
    while (begin < end && std::isspace(static_cast<unsigned char>(text[begin]))) ++begin;
    while (end > begin && std::isspace(static_cast<unsigned char>(text[end - 1]))) --end;
    return text.substr(begin, end - begin);
}

std::string ToLower(const std::string& text) {
    std::string lowered = text;
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return lowered;
}

} // namespace

// ============================================================================
// Public API
// ============================================================================

FeatureVector FeatureEncoder::Encode(const std::string& token) const {
    std::string raw = Trim(token);
    FeatureVector features(kDimension);
    if (raw.empty()) {
        return features;
    }

    std::string word = ToLower(raw);

    EncodeOrthographic(raw, word, features);
    EncodeNgrams(word, features);
    EncodePhonetic(word, features);
    EncodeStatistical(raw, word, features);

    return features.Normalized();
}

FeatureVector FeatureEncoder::EncodePhrase(const std::string& text) const {
    std::istringstream stream(text);
    std::string word;

    FeatureVector sum(kDimension);
    size_t count = 0;
    while (stream >> word) {
        sum.AddScaled(Encode(word), 1.0f);
        ++count;
    }

    if (count == 0) {
        return sum;
    }
    return sum.Normalized();
}

int64_t FeatureEncoder::StableHash(const std::string& text) {
    // 32-bit signed wraparound, computed in unsigned space to stay well defined
    uint32_t hash = 17;
    for (unsigned char c : text) {
        hash = hash * 31u + c;
    }
    int64_t signed_hash = static_cast<int32_t>(hash);
    return signed_hash < 0 ? -signed_hash : signed_hash;
}

double FeatureEncoder::EstimateFrequency(const std::string& word) {
    static const char* kCommonPatterns[] = {"the", "ing", "er", "ed", "ly", "s"};

    double length_score = std::max(0.0, 10.0 - static_cast<double>(word.size())) / 10.0;

    double pattern_score = 0.0;
    for (const char* pattern : kCommonPatterns) {
        if (word.find(pattern) != std::string::npos) {
            pattern_score += 0.1;
        }
    }

    return std::max(1.0, length_score * 10.0 + pattern_score * 5.0);
}

double FeatureEncoder::EstimateRank(double frequency) {
    if (frequency > 5.0) {
        return 1000.0 * (10.0 / frequency);
    }
    if (frequency > 1.0) {
        return 1000.0 + 9000.0 * (5.0 - frequency) / 4.0;
    }
    return 10000.0 + 1000.0 / std::max(0.1, frequency);
}

int FeatureEncoder::CountSyllables(const std::string& word) {
    int syllables = 0;
    bool previous_vowel = false;
    for (char c : word) {
        bool vowel = IsSyllableVowel(c);
        if (vowel && !previous_vowel) {
            ++syllables;
        }
        previous_vowel = vowel;
    }

    // Silent trailing 'e'
    if (word.size() > 2 && word.back() == 'e' && !IsSyllableVowel(word[word.size() - 2])) {
        --syllables;
    }

    return std::max(1, syllables);
}

// ============================================================================
// Sections
// ============================================================================

void FeatureEncoder::EncodeOrthographic(const std::string& raw, const std::string& word,
                                        FeatureVector& out) const {
    const size_t base = kOrthographicOffset;
    const float length = static_cast<float>(word.size());

    size_t vowels = 0, consonants = 0, digits = 0, other = 0;
    for (char c : word) {
        if (IsVowel(c)) ++vowels;
        else if (IsLetter(c)) ++consonants;
        else if (std::isdigit(static_cast<unsigned char>(c))) ++digits;
        else ++other;
    }

    out[base + 0] = std::tanh(length / 10.0f);
    out[base + 1] = vowels / length;
    out[base + 2] = consonants / length;
    out[base + 3] = digits / length;
    out[base + 4] = other / length;

    bool first_upper = std::isupper(static_cast<unsigned char>(raw[0])) != 0;
    bool any_upper = std::any_of(raw.begin(), raw.end(),
                                 [](unsigned char c) { return std::isupper(c) != 0; });
    bool all_upper = any_upper && std::none_of(raw.begin(), raw.end(),
                                               [](unsigned char c) { return std::islower(c) != 0; });
    out[base + 5] = first_upper ? 1.0f : 0.0f;
    out[base + 6] = all_upper ? 1.0f : 0.0f;
    out[base + 7] = any_upper ? 1.0f : 0.0f;

    size_t longest_run = 1;
    size_t run = 1;
    for (size_t i = 1; i < word.size(); ++i) {
        run = (word[i] == word[i - 1]) ? run + 1 : 1;
        longest_run = std::max(longest_run, run);
    }
    out[base + 8] = std::tanh(static_cast<float>(longest_run) / 3.0f);

    FillSection(word, "orth", base, 9, out);
}

void FeatureEncoder::EncodeNgrams(const std::string& word, FeatureVector& out) const {
    const size_t base = kNgramOffset;
    const size_t half = kSectionSize / 2;

    // Each distinct n-gram counts once, first occurrences up to `half` of each length
    auto hash_distinct = [&](size_t length, size_t offset) {
        std::set<std::string> seen;
        for (size_t i = 0; i + length <= word.size() && seen.size() < half; ++i) {
            std::string gram = word.substr(i, length);
            if (!seen.insert(gram).second) {
                continue;
            }
            size_t slot = static_cast<size_t>(StableHash(gram) % half);
            out[offset + slot] += 0.5f;
        }
    };
    hash_distinct(2, base);
    hash_distinct(3, base + half);
}

void FeatureEncoder::EncodePhonetic(const std::string& word, FeatureVector& out) const {
    const size_t base = kPhoneticOffset;

    out[base + 0] = std::tanh(static_cast<float>(CountSyllables(word)) / 4.0f);

    size_t leading = 0;
    while (leading < word.size() && IsConsonant(word[leading])) ++leading;
    size_t trailing = 0;
    while (trailing < word.size() && IsConsonant(word[word.size() - 1 - trailing])) ++trailing;

    out[base + 1] = std::min(1.0f, static_cast<float>(leading) / 3.0f);
    out[base + 2] = std::min(1.0f, static_cast<float>(trailing) / 3.0f);
    out[base + 3] = HashUnit(std::string("first_") + word.front());
    out[base + 4] = HashUnit(std::string("last_") + word.back());

    FillSection(word, "phon", base, 5, out);
}

void FeatureEncoder::EncodeStatistical(const std::string& raw, const std::string& word,
                                       FeatureVector& out) const {
    const size_t base = kStatisticalOffset;

    double frequency = EstimateFrequency(word);
    double rank = EstimateRank(frequency);
    out[base + 0] = static_cast<float>(std::tanh(std::log(frequency + 1.0) / 10.0));
    out[base + 1] = static_cast<float>(std::tanh(std::log(rank + 1.0) / 10.0));

    std::string shape;
    shape.reserve(raw.size());
    for (unsigned char c : raw) {
        if (std::isupper(c)) shape.push_back('X');
        else if (std::islower(c)) shape.push_back('x');
        else if (std::isdigit(c)) shape.push_back('9');
        else shape.push_back(static_cast<char>(c));
    }
    out[base + 2] = HashUnit("shape_" + shape);

    FillSection(word, "stat", base, 3, out);
}

// ============================================================================
// Hash helpers
// ============================================================================

void FeatureEncoder::FillSection(const std::string& word, const char* section,
                                 size_t offset, size_t first, FeatureVector& out) {
    for (size_t i = first; i < kSectionSize; ++i) {
        std::string key = word + "_" + section + "_" + std::to_string(i);
        out[offset + i] = HashUnit(key) - 0.5f;
    }
}

float FeatureEncoder::HashUnit(const std::string& key) {
    return static_cast<float>(StableHash(key) % 1000) / 1000.0f;
}

} // namespace engram
