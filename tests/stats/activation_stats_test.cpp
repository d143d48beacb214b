// File: tests/stats/activation_stats_test.cpp
#include "stats/activation_stats.hpp"
#include "encoding/feature_encoder.hpp"
#include <gtest/gtest.h>
#include <sstream>

namespace engram {
namespace {

// ============================================================================
// Novelty Tests
// ============================================================================

TEST(ActivationStatsTest, UnseenRegionIsFullyNovel) {
    FeatureEncoder encoder;
    ActivationStats stats;
    EXPECT_FLOAT_EQ(1.0f, stats.CalculateNovelty("r1", encoder.Encode("apple")));
    EXPECT_FLOAT_EQ(0.0f, stats.Frequency("r1"));
}

TEST(ActivationStatsTest, NoveltyFallsWithRepetition) {
    FeatureEncoder encoder;
    FeatureVector v = encoder.Encode("apple");
    ActivationStats stats;

    float previous = stats.CalculateNovelty("r1", v);
    for (int i = 0; i < 5; ++i) {
        stats.RecordActivation("r1", v);
        float novelty = stats.CalculateNovelty("r1", v);
        EXPECT_LT(novelty, previous);
        EXPECT_GE(novelty, 0.0f);
        previous = novelty;
    }

    // Identical samples: novelty = (1 - n / (n + 1)) / 2
    EXPECT_NEAR(1.0f / 12.0f, previous, 1e-5f);
}

TEST(ActivationStatsTest, DistantVectorIsMoreNovelThanFamiliarOne) {
    FeatureEncoder encoder;
    FeatureVector v = encoder.Encode("apple");
    ActivationStats stats;
    for (int i = 0; i < 3; ++i) {
        stats.RecordActivation("r1", v);
    }

    EXPECT_GT(stats.CalculateNovelty("r1", v * -1.0f), stats.CalculateNovelty("r1", v));
}

// ============================================================================
// Counting Tests
// ============================================================================

TEST(ActivationStatsTest, CountsAndFrequency) {
    ActivationStats::Config config;
    config.frequency_saturation = 4.0;
    ActivationStats stats(config);

    FeatureVector v(std::vector<float>{1.0f, 0.0f});
    for (int i = 0; i < 4; ++i) {
        stats.RecordActivation("busy", v);
    }
    stats.RecordActivation("quiet", v);

    EXPECT_EQ(4u, stats.ActivationCount("busy"));
    EXPECT_EQ(5u, stats.TotalActivations());
    EXPECT_FLOAT_EQ(0.5f, stats.Frequency("busy"));
    EXPECT_LT(stats.Frequency("quiet"), stats.Frequency("busy"));

    auto top = stats.TopRegions(1);
    ASSERT_EQ(1u, top.size());
    EXPECT_EQ("busy", top[0].first);
}

TEST(ActivationStatsTest, HistoryIsBounded) {
    ActivationStats::Config config;
    config.history_size = 2;
    ActivationStats stats(config);

    for (int i = 0; i < 5; ++i) {
        stats.RecordActivation("r", FeatureVector(std::vector<float>{static_cast<float>(i)}));
    }

    std::stringstream ss;
    stats.Serialize(ss);
    ActivationStats restored = ActivationStats::Deserialize(ss, config);
    EXPECT_TRUE(stats == restored);
    EXPECT_EQ(5u, restored.ActivationCount("r"));
}

TEST(ActivationStatsTest, PruneDropsRareRegions) {
    ActivationStats stats;
    FeatureVector v(std::vector<float>{0.0f, 1.0f});
    stats.RecordActivation("rare", v);
    stats.RecordActivation("common", v);
    stats.RecordActivation("common", v);

    EXPECT_EQ(1u, stats.Prune(2));
    EXPECT_EQ(1u, stats.RegionCount());
    EXPECT_EQ(0u, stats.ActivationCount("rare"));
    EXPECT_EQ(2u, stats.TotalActivations());
}

TEST(ActivationStatsTest, MergeCombinesCountsAndMeans) {
    ActivationStats a;
    ActivationStats b;
    a.RecordActivation("r", FeatureVector(std::vector<float>{0.0f}));
    b.RecordActivation("r", FeatureVector(std::vector<float>{2.0f}));
    b.RecordActivation("s", FeatureVector(std::vector<float>{1.0f}));

    a.Merge(b);
    EXPECT_EQ(2u, a.ActivationCount("r"));
    EXPECT_EQ(1u, a.ActivationCount("s"));
    EXPECT_EQ(3u, a.TotalActivations());

    a.Reset();
    EXPECT_EQ(0u, a.RegionCount());
}

} // namespace
} // namespace engram
