// File: tests/storage/bank_cache_test.cpp
#include "storage/bank_cache.hpp"
#include <gtest/gtest.h>
#include <string>
#include <thread>
#include <vector>

namespace engram {
namespace {

BankCache::BankPtr MakeBank(size_t neurons) {
    auto bank = std::make_shared<NeuronBank>();
    for (size_t i = 0; i < neurons; ++i) {
        NeuronID id(1000 + i);
        bank->emplace(id, Neuron(id, NeuronProperties{}));
    }
    return bank;
}

// ============================================================================
// Basic Operations Tests
// ============================================================================

TEST(BankCacheTest, ZeroCapacitySetToOne) {
    BankCache cache(0);
    EXPECT_EQ(1u, cache.Capacity());
}

TEST(BankCacheTest, PutAndGet) {
    BankCache cache(4);
    cache.Put("general/shard_00", MakeBank(3));

    auto bank = cache.Get("general/shard_00");
    ASSERT_NE(nullptr, bank);
    EXPECT_EQ(3u, bank->size());
    EXPECT_EQ(nullptr, cache.Get("general/shard_01"));
}

TEST(BankCacheTest, PutReplacesBank) {
    BankCache cache(4);
    cache.Put("p", MakeBank(1));
    cache.Put("p", MakeBank(5));
    EXPECT_EQ(1u, cache.Size());
    EXPECT_EQ(5u, cache.Get("p")->size());
}

TEST(BankCacheTest, RemoveAndClear) {
    BankCache cache(4);
    cache.Put("a", MakeBank(1));
    cache.Put("b", MakeBank(1));

    EXPECT_TRUE(cache.Remove("a"));
    EXPECT_FALSE(cache.Remove("a"));
    EXPECT_FALSE(cache.Contains("a"));

    cache.Clear();
    EXPECT_EQ(0u, cache.Size());
}

// ============================================================================
// Eviction Tests
// ============================================================================

TEST(BankCacheTest, EvictsLeastRecentlyUsed) {
    BankCache cache(2);
    cache.Put("a", MakeBank(1));
    cache.Put("b", MakeBank(1));
    cache.Get("a");
    cache.Put("c", MakeBank(1));

    EXPECT_TRUE(cache.Contains("a"));
    EXPECT_FALSE(cache.Contains("b"));
    EXPECT_TRUE(cache.Contains("c"));
    EXPECT_EQ(1u, cache.GetStats().evictions);
}

TEST(BankCacheTest, EvictedBankStaysValidForHolders) {
    BankCache cache(1);
    cache.Put("a", MakeBank(2));
    auto held = cache.Get("a");
    cache.Put("b", MakeBank(1));

    ASSERT_NE(nullptr, held);
    EXPECT_EQ(2u, held->size());
}

// ============================================================================
// Statistics Tests
// ============================================================================

TEST(BankCacheTest, HitRate) {
    BankCache cache(2);
    cache.Put("a", MakeBank(1));
    cache.Get("a");
    cache.Get("a");
    cache.Get("a");
    cache.Get("missing");

    auto stats = cache.GetStats();
    EXPECT_EQ(3u, stats.hits);
    EXPECT_EQ(1u, stats.misses);
    EXPECT_FLOAT_EQ(0.75f, stats.hit_rate);
    EXPECT_EQ(1u, stats.size);
    EXPECT_EQ(2u, stats.capacity);
}

// ============================================================================
// Thread Safety Tests
// ============================================================================

TEST(BankCacheTest, ConcurrentPartitionsDoNotInterfere) {
    BankCache cache(16);
    std::vector<std::thread> threads;
    for (int t = 0; t < 8; ++t) {
        threads.emplace_back([&cache, t]() {
            std::string key = "shard_" + std::to_string(t);
            for (int i = 0; i < 100; ++i) {
                cache.Put(key, MakeBank(static_cast<size_t>(t)));
                auto bank = cache.Get(key);
                ASSERT_NE(nullptr, bank);
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    EXPECT_EQ(8u, cache.Size());
    for (int t = 0; t < 8; ++t) {
        EXPECT_EQ(static_cast<size_t>(t), cache.Get("shard_" + std::to_string(t))->size());
    }
}

} // namespace
} // namespace engram
