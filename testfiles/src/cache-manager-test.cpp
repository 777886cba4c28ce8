// SPDX-License-Identifier: GPL-2.0-or-later
/*
 * Tests for the filter result cache
 *
 * Released under GNU GPL v2+, read the file 'COPYING' for more information.
 */

#include <atomic>
#include <memory>
#include <string>
#include <thread>
#include <vector>
#include <gtest/gtest.h>
#include "filters/cache-manager.h"
#include "filters/filter-errors.h"

using namespace Svgfx::Filters;
using namespace std::chrono_literals;

namespace {

FilterExecutionResult markup_result(std::string xml)
{
    FilterExecutionResult result;
    result.strategy = RenderStrategy::NativeEffect;
    result.payload = MarkupFragment{std::move(xml)};
    result.bounds = Geom::Rect(0, 0, 10, 10);
    return result;
}

class CacheManagerTest : public ::testing::Test
{
protected:
    CacheManager::Clock::time_point now = CacheManager::Clock::time_point(1h);

    CacheOptions options()
    {
        CacheOptions opts;
        opts.background_sweep = false;
        opts.ttl = 10s;
        opts.now = [this] { return now; };
        return opts;
    }
};

} // namespace

TEST_F(CacheManagerTest, PutThenGet)
{
    CacheManager cache(options());

    EXPECT_FALSE(cache.get(1));
    cache.put(1, markup_result("<a:blur/>"));

    auto value = cache.get(1);
    ASSERT_TRUE(value);
    ASSERT_TRUE(value->markup());
    EXPECT_EQ(*value->markup(), "<a:blur/>");
    EXPECT_TRUE(cache.contains(1));

    auto stats = cache.stats();
    EXPECT_EQ(stats.hits, 1u);
    EXPECT_EQ(stats.misses, 1u);
    EXPECT_EQ(stats.entries, 1u);
}

TEST_F(CacheManagerTest, PutReplaces)
{
    CacheManager cache(options());
    cache.put(1, markup_result("a"), 100);
    cache.put(1, markup_result("b"), 200);

    EXPECT_EQ(*cache.get(1)->markup(), "b");
    EXPECT_EQ(cache.stats().entries, 1u);
    EXPECT_EQ(cache.stats().bytes, 200u);
}

TEST_F(CacheManagerTest, TtlExpiryOnAccess)
{
    CacheManager cache(options());
    cache.put(1, markup_result("a"));

    now += 9s;
    EXPECT_TRUE(cache.get(1));

    now += 1s;
    EXPECT_FALSE(cache.get(1));
    EXPECT_FALSE(cache.contains(1));
    EXPECT_EQ(cache.stats().expirations, 1u);
}

TEST_F(CacheManagerTest, PerEntryTtl)
{
    CacheManager cache(options());
    cache.put(1, markup_result("short"), 0, 1s);
    cache.put(2, markup_result("default"));
    cache.put(3, markup_result("forever"), 0, 0s);

    now += 2s;
    EXPECT_FALSE(cache.get(1));
    EXPECT_TRUE(cache.get(2));

    now += 1000s;
    EXPECT_FALSE(cache.get(2));
    EXPECT_TRUE(cache.get(3));
}

TEST_F(CacheManagerTest, SweepRemovesExpired)
{
    CacheManager cache(options());
    cache.put(1, markup_result("a"), 0, 1s);
    cache.put(2, markup_result("b"), 0, 1s);
    cache.put(3, markup_result("c"), 0, 60s);

    now += 5s;
    EXPECT_EQ(cache.sweep_expired(), 2u);
    EXPECT_FALSE(cache.contains(1));
    EXPECT_FALSE(cache.contains(2));
    EXPECT_TRUE(cache.contains(3));
    EXPECT_EQ(cache.stats().expirations, 2u);
}

TEST_F(CacheManagerTest, BackgroundSweeper)
{
    auto opts = options();
    opts.background_sweep = true;
    opts.sweep_interval = 10ms;
    opts.now = [] { return CacheManager::Clock::now(); };
    opts.ttl = 1ms;

    CacheManager cache(opts);
    cache.put(1, markup_result("a"));

    for (int i = 0; i < 500 && cache.contains(1); i++) {
        std::this_thread::sleep_for(10ms);
    }
    EXPECT_FALSE(cache.contains(1));
    EXPECT_GE(cache.stats().expirations, 1u);

    cache.shutdown();
    cache.put(2, markup_result("b"), 0, 0s);
    EXPECT_TRUE(cache.get(2));
}

TEST_F(CacheManagerTest, LruEvictionByCount)
{
    auto opts = options();
    opts.capacity_entries = 2;
    CacheManager cache(opts);

    cache.put(1, markup_result("a"));
    cache.put(2, markup_result("b"));
    EXPECT_TRUE(cache.get(1)); // 2 is now least recently used
    cache.put(3, markup_result("c"));

    EXPECT_TRUE(cache.contains(1));
    EXPECT_FALSE(cache.contains(2));
    EXPECT_TRUE(cache.contains(3));
    EXPECT_EQ(cache.stats().evictions, 1u);
}

TEST_F(CacheManagerTest, LruEvictionByBytes)
{
    auto opts = options();
    opts.capacity_bytes = 1000;
    CacheManager cache(opts);

    cache.put(1, markup_result("a"), 400);
    cache.put(2, markup_result("b"), 400);
    cache.put(3, markup_result("c"), 400);

    EXPECT_FALSE(cache.contains(1));
    EXPECT_TRUE(cache.contains(2));
    EXPECT_TRUE(cache.contains(3));
    EXPECT_EQ(cache.stats().bytes, 800u);

    // Larger than the whole cache: not stored, nothing evicted.
    cache.put(4, markup_result("d"), 2000);
    EXPECT_FALSE(cache.contains(4));
    EXPECT_EQ(cache.stats().entries, 2u);
}

TEST_F(CacheManagerTest, ZeroCapacityStoresNothing)
{
    auto opts = options();
    opts.capacity_entries = 0;
    CacheManager cache(opts);

    cache.put(1, markup_result("a"));
    EXPECT_FALSE(cache.get(1));
}

TEST_F(CacheManagerTest, Flush)
{
    CacheManager cache(options());
    cache.put(1, markup_result("a"));
    cache.put(2, markup_result("b"));

    cache.flush(1);
    EXPECT_FALSE(cache.contains(1));
    EXPECT_TRUE(cache.contains(2));

    cache.flush();
    EXPECT_EQ(cache.stats().entries, 0u);
    EXPECT_EQ(cache.stats().bytes, 0u);
}

TEST_F(CacheManagerTest, InvalidateByKind)
{
    CacheManager cache(options());
    cache.put(1, PrimitiveKind::Blur, markup_result("<a:blur rad=\"1\"/>"));
    cache.put(2, PrimitiveKind::Offset, markup_result("<a:outerShdw/>"));
    cache.put(3, PrimitiveKind::Blur, markup_result("<a:blur rad=\"2\"/>"));
    cache.put(4, markup_result("untagged"));

    EXPECT_EQ(cache.invalidate(PrimitiveKind::Blur), 2u);
    EXPECT_FALSE(cache.contains(1));
    EXPECT_TRUE(cache.contains(2));
    EXPECT_FALSE(cache.contains(3));
    EXPECT_TRUE(cache.contains(4));
    EXPECT_EQ(cache.stats().entries, 2u);

    EXPECT_EQ(cache.invalidate(PrimitiveKind::Blur), 0u);
    EXPECT_EQ(cache.invalidate(PrimitiveKind::Tile), 0u);

    // Replacing an entry replaces its kind too.
    cache.put(2, PrimitiveKind::Flood, markup_result("<a:solidFill/>"));
    EXPECT_EQ(cache.invalidate(PrimitiveKind::Offset), 0u);
    EXPECT_EQ(cache.invalidate(PrimitiveKind::Flood), 1u);
}

TEST_F(CacheManagerTest, CorruptionFlushesOnlyThatKey)
{
    CacheManager cache(options());
    cache.put(1, markup_result("a"));
    cache.put(2, markup_result("b"));

    // Tamper with the stored value behind the cache's back.
    auto stored = cache.get(1);
    const_cast<FilterExecutionResult &>(*stored).payload = MarkupFragment{"tampered"};

    EXPECT_THROW(cache.lookup(1), CacheCorruptionError);
    EXPECT_FALSE(cache.contains(1));
    EXPECT_TRUE(cache.contains(2));
    EXPECT_EQ(cache.stats().corruptions, 1u);

    cache.put(1, markup_result("a"));
    stored = cache.get(1);
    const_cast<FilterExecutionResult &>(*stored).bounds = Geom::Rect(0, 0, 1, 1);

    EXPECT_FALSE(cache.get(1)); // reported as a miss
    EXPECT_EQ(cache.stats().corruptions, 2u);
}

TEST_F(CacheManagerTest, ConcurrentAccess)
{
    auto opts = options();
    opts.capacity_entries = 64;
    CacheManager cache(opts);

    std::atomic<int> found{0};
    std::vector<std::thread> threads;
    for (int t = 0; t < 8; t++) {
        threads.emplace_back([&, t] {
            for (int i = 0; i < 500; i++) {
                CacheKey key = (t * 31 + i) % 100;
                if (auto value = cache.get(key)) {
                    EXPECT_EQ(*value->markup(), std::to_string(key));
                    found++;
                } else {
                    cache.put(key, markup_result(std::to_string(key)));
                }
            }
        });
    }
    for (auto &thread : threads) {
        thread.join();
    }

    auto stats = cache.stats();
    EXPECT_LE(stats.entries, 64u);
    EXPECT_EQ(stats.hits, static_cast<std::size_t>(found.load()));
    EXPECT_EQ(stats.corruptions, 0u);
}
