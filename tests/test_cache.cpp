// ═══════════════════════════════════════════════════════════════════
//  test_cache.cpp — LRU + TTL response cache
// ═══════════════════════════════════════════════════════════════════

#include <gtest/gtest.h>
#include <pqcache/cache.h>
#include <atomic>
#include <thread>
#include <vector>

using namespace pqcache::cache;

TEST(LRUCacheTest, BasicSetAndGet) {
    LRUCache<> cache;
    EXPECT_TRUE(cache.set("key1", "value1"));
    auto val = cache.get("key1");
    ASSERT_TRUE(val.has_value());
    EXPECT_EQ(*val, "value1");
}

TEST(LRUCacheTest, MissReturnsNullopt) {
    LRUCache<> cache;
    EXPECT_FALSE(cache.get("missing").has_value());
    EXPECT_FALSE(cache.has("missing"));
}

TEST(LRUCacheTest, Defaults) {
    LRUCache<> cache;
    EXPECT_EQ(cache.capacity(), 100u);
    CacheOptions options;
    EXPECT_EQ(options.ttlMs, 60 * 60 * 1000);
}

TEST(LRUCacheTest, CapacityPlusOneKeepsCapacityEntries) {
    LRUCache<> cache(CacheOptions{5, 0});
    for (int i = 0; i < 6; ++i) {
        cache.set("k" + std::to_string(i), std::to_string(i));
    }
    EXPECT_EQ(cache.size(), 5u);
    EXPECT_FALSE(cache.has("k0"));
    for (int i = 1; i < 6; ++i) {
        EXPECT_TRUE(cache.has("k" + std::to_string(i)));
    }
}

TEST(LRUCacheTest, GetRefreshesRecency) {
    LRUCache<> cache(3, 0);
    cache.set("a", "1");
    cache.set("b", "2");
    cache.set("c", "3");

    cache.get("a");
    cache.set("d", "4");   // evicts "b"

    EXPECT_TRUE(cache.has("a"));
    EXPECT_FALSE(cache.has("b"));
    EXPECT_TRUE(cache.has("d"));
}

TEST(LRUCacheTest, HasDoesNotRefreshRecency) {
    LRUCache<> cache(2, 0);
    cache.set("a", "1");
    cache.set("b", "2");

    EXPECT_TRUE(cache.has("a"));
    cache.set("c", "3");   // "a" is still least recently used

    EXPECT_FALSE(cache.has("a"));
    EXPECT_TRUE(cache.has("b"));
    EXPECT_TRUE(cache.has("c"));
}

TEST(LRUCacheTest, TTLExpiry) {
    LRUCache<> cache(100, 50);
    cache.set("key", "value");
    ASSERT_TRUE(cache.get("key").has_value());

    std::this_thread::sleep_for(std::chrono::milliseconds(100));

    EXPECT_FALSE(cache.get("key").has_value());
    EXPECT_FALSE(cache.has("key"));
}

TEST(LRUCacheTest, PerEntryTtlOverride) {
    LRUCache<> cache(100, 0);
    cache.set("short", "v", 30);
    cache.set("forever", "v");

    std::this_thread::sleep_for(std::chrono::milliseconds(80));

    EXPECT_FALSE(cache.has("short"));
    EXPECT_TRUE(cache.has("forever"));
}

TEST(LRUCacheTest, PruneDropsExpiredEntries) {
    LRUCache<> cache(100, 30);
    cache.set("a", "1");
    cache.set("b", "2");
    cache.set("keep", "3", 60000);

    std::this_thread::sleep_for(std::chrono::milliseconds(80));

    EXPECT_EQ(cache.prune(), 2u);
    EXPECT_EQ(cache.size(), 1u);
}

TEST(LRUCacheTest, OverwriteExisting) {
    LRUCache<> cache;
    cache.set("key", "old");
    cache.set("key", "new");

    auto val = cache.get("key");
    ASSERT_TRUE(val.has_value());
    EXPECT_EQ(*val, "new");
    EXPECT_EQ(cache.size(), 1u);
}

TEST(LRUCacheTest, DeleteAndClear) {
    LRUCache<> cache;
    cache.set("a", "1");
    cache.set("b", "2");

    cache.del("a");
    EXPECT_FALSE(cache.has("a"));
    EXPECT_EQ(cache.size(), 1u);

    cache.clear();
    EXPECT_EQ(cache.size(), 0u);
}

TEST(LRUCacheTest, ZeroCapacityRejectsWrites) {
    LRUCache<> cache(0, 0);
    EXPECT_FALSE(cache.set("a", "1"));
    EXPECT_FALSE(cache.has("a"));
}

TEST(LRUCacheTest, ReturnsCopiesOfCachedResponses) {
    LRUCache<CachedResponse> cache;
    cache.set("k", {R"({"data":{}})", "application/json"});

    auto first = cache.get("k");
    ASSERT_TRUE(first.has_value());
    first->body = "mutated";

    auto second = cache.get("k");
    ASSERT_TRUE(second.has_value());
    EXPECT_EQ(second->body, R"({"data":{}})");
}

TEST(LRUCacheTest, UsableThroughInterface) {
    auto concrete = std::make_shared<LRUCache<CachedResponse>>();
    std::shared_ptr<ResponseCache> store = concrete;

    store->set("k", {"body", "application/json"});
    EXPECT_TRUE(store->has("k"));
    EXPECT_EQ(store->get("k")->contentType, "application/json");
}

TEST(LRUCacheTest, ConcurrentWritersStayWithinBound) {
    LRUCache<> cache(50, 0);
    std::vector<std::thread> threads;
    for (int t = 0; t < 4; ++t) {
        threads.emplace_back([&cache, t] {
            for (int i = 0; i < 500; ++i) {
                auto key = std::to_string(t) + ":" + std::to_string(i);
                cache.set(key, key);
                cache.get(key);
                cache.has(key);
            }
        });
    }
    for (auto& th : threads) th.join();

    EXPECT_EQ(cache.size(), 50u);
}
