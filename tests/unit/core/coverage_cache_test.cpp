#include <gtest/gtest.h>
#include <thread>
#include <chrono>
#include "scoreflow/core/coverage_cache.h"

using namespace scoreflow::core;
using namespace std::chrono_literals;

namespace {
    using Ids = std::vector<std::string>;

    CoverageKey lessonKey(const std::string& scope, std::uint64_t version = 1) {
        return CoverageKey::make(Level::Component, Coverage::all(), scope, version);
    }
}

class CoverageCacheTest : public ::testing::Test {
protected:
    void SetUp() override {
        CacheConfig config;
        config.max_entries = 4;
        config.ttl = std::chrono::seconds(1);
        config.track_stats = true;
        cache = std::make_unique<CoverageCache>(config);
    }

    std::unique_ptr<CoverageCache> cache;
};

TEST_F(CoverageCacheTest, PutAndGet) {
    ASSERT_FALSE(cache->get(lessonKey("L1")).has_value());
    cache->put(lessonKey("L1"), {"c1", "c2"});

    auto items = cache->get(lessonKey("L1"));
    ASSERT_TRUE(items.has_value());
    EXPECT_EQ(*items, (Ids{"c1", "c2"}));

    ASSERT_TRUE(cache->remove(lessonKey("L1")));
    ASSERT_FALSE(cache->get(lessonKey("L1")).has_value());
    ASSERT_FALSE(cache->remove(lessonKey("L1")));
}

TEST_F(CoverageCacheTest, PutReplacesExistingEntry) {
    cache->put(lessonKey("L1"), {"a"});
    cache->put(lessonKey("L1"), {"b", "c"});
    EXPECT_EQ(cache->size(), 1u);
    EXPECT_EQ(*cache->get(lessonKey("L1")), (Ids{"b", "c"}));
}

TEST_F(CoverageCacheTest, KeyFieldsAreComparedSeparately) {
    cache->put(CoverageKey::make(Level::Lesson, Coverage::include({"L1", "L2"}), std::nullopt, 1),
               {"L1", "L2"});

    EXPECT_FALSE(cache->get(CoverageKey::make(Level::Lesson, Coverage::include({"L1,L2"}),
                                              std::nullopt, 1)).has_value());
    EXPECT_FALSE(cache->get(CoverageKey::make(Level::Lesson, Coverage::exclude({"L1", "L2"}),
                                              std::nullopt, 1)).has_value());
    EXPECT_FALSE(cache->get(CoverageKey::make(Level::Lesson, Coverage::include({"L1", "L2"}),
                                              std::string(""), 1)).has_value());
    EXPECT_FALSE(cache->get(CoverageKey::make(Level::Lesson, Coverage::include({"L1", "L2"}),
                                              std::nullopt, 2)).has_value());
    EXPECT_TRUE(cache->get(CoverageKey::make(Level::Lesson, Coverage::include({"L2", "L1"}),
                                             std::nullopt, 1)).has_value());
}

TEST_F(CoverageCacheTest, KeyNormalizesIdOrder) {
    auto a = CoverageKey::make(Level::Component, Coverage::exclude({"c2", "c1", "c2"}), std::nullopt, 3);
    auto b = CoverageKey::make(Level::Component, Coverage::exclude({"c1", "c2"}), std::nullopt, 3);
    EXPECT_EQ(a, b);
    EXPECT_EQ(CoverageKeyHash()(a), CoverageKeyHash()(b));
    EXPECT_EQ(a.ids, (Ids{"c1", "c2"}));
}

TEST_F(CoverageCacheTest, EvictsLeastRecentlyUsed) {
    cache->put(lessonKey("k0"), {"0"});
    cache->put(lessonKey("k1"), {"1"});
    cache->put(lessonKey("k2"), {"2"});
    cache->put(lessonKey("k3"), {"3"});

    // Touch k0 so k1 becomes the oldest
    ASSERT_TRUE(cache->get(lessonKey("k0")).has_value());
    cache->put(lessonKey("k4"), {"4"});

    EXPECT_TRUE(cache->get(lessonKey("k0")).has_value());
    EXPECT_FALSE(cache->get(lessonKey("k1")).has_value());
    EXPECT_TRUE(cache->get(lessonKey("k4")).has_value());
    EXPECT_EQ(cache->size(), 4u);
    EXPECT_EQ(cache->get_stats().evictions, 1u);
}

TEST_F(CoverageCacheTest, EntriesExpire) {
    cache->put(lessonKey("L1"), {"a"});
    ASSERT_TRUE(cache->get(lessonKey("L1")).has_value());

    std::this_thread::sleep_for(1500ms);

    ASSERT_FALSE(cache->get(lessonKey("L1")).has_value());
    EXPECT_EQ(cache->size(), 0u);
}

TEST_F(CoverageCacheTest, Statistics) {
    cache->get(lessonKey("L1"));
    auto stats = cache->get_stats();
    EXPECT_EQ(stats.misses, 1u);
    EXPECT_EQ(stats.hits, 0u);

    cache->put(lessonKey("L1"), {"a"});
    cache->get(lessonKey("L1"));
    stats = cache->get_stats();
    EXPECT_EQ(stats.hits, 1u);
    EXPECT_EQ(stats.insertions, 1u);

    cache->clear();
    stats = cache->get_stats();
    EXPECT_EQ(stats.evictions, 1u);
    EXPECT_EQ(cache->size(), 0u);
}

TEST_F(CoverageCacheTest, ConcurrentAccess) {
    const int numThreads = 8;
    const int opsPerThread = 200;
    std::vector<std::thread> threads;

    for (int i = 0; i < numThreads; ++i) {
        threads.emplace_back([this, i]() {
            const auto key = lessonKey("L" + std::to_string(i % 6));
            for (int j = 0; j < opsPerThread; ++j) {
                switch (j % 3) {
                    case 0: cache->put(key, {std::to_string(j)}); break;
                    case 1: cache->get(key); break;
                    default: cache->remove(key); break;
                }
            }
        });
    }
    for (auto& t : threads) {
        t.join();
    }

    EXPECT_LE(cache->size(), 4u);
    cache->put(lessonKey("after"), {"x"});
    ASSERT_TRUE(cache->get(lessonKey("after")).has_value());
}
