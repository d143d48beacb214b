// File: tests/encoding/feature_encoder_test.cpp
#include "encoding/feature_encoder.hpp"
#include <gtest/gtest.h>
#include <cmath>
#include <vector>

namespace engram {
namespace {

// ============================================================================
// Encode Tests
// ============================================================================

TEST(FeatureEncoderTest, ProducesUnitVectorsOfFixedDimension) {
    FeatureEncoder encoder;
    for (const char* token : {"apple", "Banana", "x", "HTTP2", "don't", "aaaaab"}) {
        FeatureVector v = encoder.Encode(token);
        EXPECT_EQ(FeatureEncoder::kDimension, v.Dimension()) << token;
        EXPECT_NEAR(1.0f, v.Norm(), 1e-5f) << token;
    }
}

TEST(FeatureEncoderTest, IsDeterministicAcrossInstances) {
    FeatureEncoder first;
    FeatureEncoder second;

    FeatureVector a = first.Encode("memory");
    FeatureVector b = second.Encode("memory");
    ASSERT_EQ(a.Dimension(), b.Dimension());
    for (size_t i = 0; i < a.Dimension(); ++i) {
        EXPECT_EQ(a[i], b[i]) << "slot " << i;
    }
}

TEST(FeatureEncoderTest, BlankInputGivesZeroVector) {
    FeatureEncoder encoder;
    EXPECT_TRUE(encoder.Encode("").IsZero());
    EXPECT_TRUE(encoder.Encode("   \t").IsZero());
    EXPECT_TRUE(encoder.EncodePhrase("").IsZero());
    EXPECT_EQ(FeatureEncoder::kDimension, encoder.Encode("").Dimension());
}

TEST(FeatureEncoderTest, SurroundingWhitespaceIsIgnored) {
    FeatureEncoder encoder;
    EXPECT_EQ(encoder.Encode("apple"), encoder.Encode("  apple \n"));
}

TEST(FeatureEncoderTest, DistinctWordsGiveDistinctVectors) {
    FeatureEncoder encoder;
    FeatureVector apple = encoder.Encode("apple");
    FeatureVector zebra = encoder.Encode("zebra");
    EXPECT_LT(apple.CosineSimilarity(zebra), 0.99f);
}

TEST(FeatureEncoderTest, CaseOnlyChangesShapeFeatures) {
    FeatureEncoder encoder;
    FeatureVector lower = encoder.Encode("apple");
    FeatureVector title = encoder.Encode("Apple");

    EXPECT_NE(lower, title);
    EXPECT_GT(lower.CosineSimilarity(title), 0.5f);

    // Hash-filled n-gram slots depend on the lower-cased word only
    FeatureVector lower_raw = encoder.Encode("apple");
    for (size_t i = FeatureEncoder::kNgramOffset;
         i < FeatureEncoder::kNgramOffset + FeatureEncoder::kSectionSize; ++i) {
        EXPECT_EQ(lower[i] == 0.0f, title[i] == 0.0f) << "slot " << i;
        EXPECT_EQ(lower[i], lower_raw[i]);
    }
}

TEST(FeatureEncoderTest, RepeatedNgramsCountOnce) {
    FeatureEncoder encoder;
    FeatureVector v = encoder.Encode("aaaaaa");
    const size_t half = FeatureEncoder::kSectionSize / 2;

    std::vector<float> bigram_slots;
    std::vector<float> trigram_slots;
    for (size_t i = 0; i < half; ++i) {
        float bigram = v[FeatureEncoder::kNgramOffset + i];
        float trigram = v[FeatureEncoder::kNgramOffset + half + i];
        if (bigram != 0.0f) bigram_slots.push_back(bigram);
        if (trigram != 0.0f) trigram_slots.push_back(trigram);
    }
    ASSERT_EQ(1u, bigram_slots.size());
    ASSERT_EQ(1u, trigram_slots.size());
    EXPECT_FLOAT_EQ(bigram_slots[0], trigram_slots[0]);
}

TEST(FeatureEncoderTest, NgramsAreCappedPerLength) {
    FeatureEncoder encoder;
    // 19 distinct bigrams and 18 distinct trigrams, both above the cap of 16
    FeatureVector v = encoder.Encode("abcdefghijklmnopqrst");
    const size_t half = FeatureEncoder::kSectionSize / 2;

    float bigram_total = 0.0f;
    float trigram_total = 0.0f;
    for (size_t i = 0; i < half; ++i) {
        bigram_total += v[FeatureEncoder::kNgramOffset + i];
        trigram_total += v[FeatureEncoder::kNgramOffset + half + i];
    }
    EXPECT_GT(bigram_total, 0.0f);
    EXPECT_NEAR(bigram_total, trigram_total, 1e-5f);
}

// ============================================================================
// Phrase Tests
// ============================================================================

TEST(FeatureEncoderTest, SingleWordPhraseMatchesToken) {
    FeatureEncoder encoder;
    FeatureVector phrase = encoder.EncodePhrase("apple");
    FeatureVector token = encoder.Encode("apple");
    EXPECT_NEAR(1.0f, phrase.CosineSimilarity(token), 1e-5f);
}

TEST(FeatureEncoderTest, PhraseIsNormalizedMeanOfWords) {
    FeatureEncoder encoder;
    FeatureVector expected = (encoder.Encode("red") + encoder.Encode("apple")).Normalized();
    FeatureVector phrase = encoder.EncodePhrase("red apple");
    EXPECT_NEAR(1.0f, phrase.CosineSimilarity(expected), 1e-5f);
    EXPECT_NEAR(1.0f, phrase.Norm(), 1e-5f);
}

// ============================================================================
// Heuristic Tests
// ============================================================================

TEST(FeatureEncoderTest, StableHashKnownValues) {
    EXPECT_EQ(17, FeatureEncoder::StableHash(""));
    EXPECT_EQ(17 * 31 + 'a', FeatureEncoder::StableHash("a"));
    EXPECT_GE(FeatureEncoder::StableHash("a much longer key that wraps around"), 0);
}

TEST(FeatureEncoderTest, CountSyllables) {
    EXPECT_EQ(3, FeatureEncoder::CountSyllables("banana"));
    EXPECT_EQ(1, FeatureEncoder::CountSyllables("cake"));   // silent e
    EXPECT_EQ(1, FeatureEncoder::CountSyllables("rhythm")); // y as vowel
    EXPECT_EQ(1, FeatureEncoder::CountSyllables("bcd"));    // minimum 1
}

TEST(FeatureEncoderTest, FrequencyAndRankEstimates) {
    EXPECT_DOUBLE_EQ(7.5, FeatureEncoder::EstimateFrequency("the"));
    EXPECT_DOUBLE_EQ(1.0, FeatureEncoder::EstimateFrequency("extraordinarily"));

    EXPECT_DOUBLE_EQ(1000.0, FeatureEncoder::EstimateRank(10.0));
    EXPECT_DOUBLE_EQ(11000.0, FeatureEncoder::EstimateRank(1.0));
    EXPECT_GT(FeatureEncoder::EstimateRank(2.0), FeatureEncoder::EstimateRank(4.0));
}

} // namespace
} // namespace engram
