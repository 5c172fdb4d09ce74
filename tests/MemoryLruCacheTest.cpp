#include <gtest/gtest.h>
#include <tlcache/memory/MemoryLruCache.hpp>
#include <functional>
#include <string>
#include <vector>

/**
 * @brief Тесты для MemoryLruCache
 *
 * Проверяем:
 * - Базовые операции (get, put, remove, evictAll)
 * - LRU-порядок и вытеснение по весу
 * - create() и гонку create() с put()
 * - Причины удаления в entryRemoved()
 * - Счётчики и toString()
 */

namespace {

/**
 * @brief Кэш, который записывает все удаления и умеет создавать значения
 */
class RecordingCache : public MemoryLruCache<std::string, std::string> {
public:
    struct Removal {
        RemovalCause cause;
        std::string key;
        std::string oldValue;
        std::optional<std::string> newValue;
    };

    using MemoryLruCache::MemoryLruCache;

    std::vector<Removal> removals;
    std::function<std::optional<std::string>(const std::string&)> creator;

protected:
    std::optional<std::string> create(const std::string& key) override {
        if (creator) {
            return creator(key);
        }
        return std::nullopt;
    }

    void entryRemoved(RemovalCause cause, const std::string& key,
                      const std::string& oldValue, const std::optional<std::string>& newValue) override {
        removals.push_back({cause, key, oldValue, newValue});
    }
};

/**
 * @brief Вес элемента = длина строки
 */
class WeightedCache : public MemoryLruCache<std::string, std::string> {
public:
    using MemoryLruCache::MemoryLruCache;

protected:
    size_t sizeOf(const std::string& key, const std::string& value) override {
        (void)key;
        return value.size();
    }
};

std::vector<std::string> keysOf(const std::vector<std::pair<std::string, std::string>>& entries) {
    std::vector<std::string> keys;
    for (const auto& entry : entries) {
        keys.push_back(entry.first);
    }
    return keys;
}

}  // namespace

// ==================== Конструктор ====================

TEST(MemoryLruCacheTest, ConstructorThrowsOnZeroMaxSize) {
    EXPECT_THROW((MemoryLruCache<std::string, int>(0)), std::invalid_argument);
}

TEST(MemoryLruCacheTest, EmptyOnCreate) {
    MemoryLruCache<std::string, int> cache(10);

    EXPECT_EQ(cache.size(), 0);
    EXPECT_EQ(cache.maxSize(), 10);
    EXPECT_TRUE(cache.snapshot().empty());
}

// ==================== Put и Get ====================

TEST(MemoryLruCacheTest, PutAndGet) {
    MemoryLruCache<std::string, int> cache(10);

    EXPECT_FALSE(cache.put("key1", 42).has_value());

    auto result = cache.get("key1");
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result.value(), 42);
}

TEST(MemoryLruCacheTest, GetMissingReturnsNullopt) {
    MemoryLruCache<std::string, int> cache(10);

    EXPECT_FALSE(cache.get("missing").has_value());
    EXPECT_EQ(cache.missCount(), 1);
    EXPECT_EQ(cache.createCount(), 0);
}

TEST(MemoryLruCacheTest, PutReturnsPreviousValue) {
    MemoryLruCache<std::string, int> cache(10);

    cache.put("key1", 1);
    auto previous = cache.put("key1", 2);

    ASSERT_TRUE(previous.has_value());
    EXPECT_EQ(previous.value(), 1);
    EXPECT_EQ(cache.get("key1").value(), 2);
    EXPECT_EQ(cache.size(), 1);
}

TEST(MemoryLruCacheTest, RemoveReturnsPreviousValue) {
    MemoryLruCache<std::string, int> cache(10);
    cache.put("key1", 42);

    auto removed = cache.remove("key1");

    ASSERT_TRUE(removed.has_value());
    EXPECT_EQ(removed.value(), 42);
    EXPECT_FALSE(cache.contains("key1"));
    EXPECT_FALSE(cache.remove("key1").has_value());
    EXPECT_EQ(cache.size(), 0);
}

// ==================== LRU-порядок ====================

TEST(MemoryLruCacheTest, EvictsLeastRecentlyUsed) {
    MemoryLruCache<std::string, int> cache(3);

    cache.put("a", 1);
    cache.put("b", 2);
    cache.put("c", 3);
    cache.get("a");      // a становится самым свежим
    cache.put("d", 4);   // вытесняет b

    EXPECT_TRUE(cache.contains("a"));
    EXPECT_FALSE(cache.contains("b"));
    EXPECT_TRUE(cache.contains("c"));
    EXPECT_TRUE(cache.contains("d"));
    EXPECT_EQ(cache.evictionCount(), 1);
}

TEST(MemoryLruCacheTest, SnapshotIsOrderedFromOldestToNewest) {
    MemoryLruCache<std::string, std::string> cache(10);

    cache.put("a", "A");
    cache.put("b", "B");
    cache.put("c", "C");
    cache.get("a");
    cache.put("b", "B2");

    std::vector<std::string> expected = {"c", "a", "b"};
    EXPECT_EQ(keysOf(cache.snapshot()), expected);
    EXPECT_EQ(cache.snapshot().back().second, "B2");
}

TEST(MemoryLruCacheTest, ContainsDoesNotChangeOrderOrCounters) {
    MemoryLruCache<std::string, int> cache(2);

    cache.put("a", 1);
    cache.put("b", 2);
    EXPECT_TRUE(cache.contains("a"));
    cache.put("c", 3);   // a всё ещё самый старый

    EXPECT_FALSE(cache.contains("a"));
    EXPECT_EQ(cache.hitCount(), 0);
    EXPECT_EQ(cache.missCount(), 0);
}

// ==================== Вес элементов ====================

TEST(MemoryLruCacheTest, WeightedEviction) {
    WeightedCache cache(10);

    cache.put("a", "12345");
    cache.put("b", "1234");
    EXPECT_EQ(cache.size(), 9);

    cache.put("c", "123");   // 12 > 10 — вытесняем a

    EXPECT_FALSE(cache.contains("a"));
    EXPECT_EQ(cache.size(), 7);
}

TEST(MemoryLruCacheTest, ReplacingValueUpdatesWeight) {
    WeightedCache cache(10);

    cache.put("a", "12345");
    cache.put("a", "12");

    EXPECT_EQ(cache.size(), 2);
}

TEST(MemoryLruCacheTest, EntryHeavierThanMaxSizeIsEvictedImmediately) {
    WeightedCache cache(4);

    cache.put("a", "1");
    cache.put("big", "123456");

    EXPECT_EQ(cache.size(), 0);
    EXPECT_FALSE(cache.contains("big"));
    EXPECT_EQ(cache.evictionCount(), 2);
}

TEST(MemoryLruCacheTest, TrimToSmallerSize) {
    MemoryLruCache<std::string, int> cache(5);
    for (int i = 0; i < 5; ++i) {
        cache.put("k" + std::to_string(i), i);
    }

    cache.trimToSize(2);

    EXPECT_EQ(cache.size(), 2);
    EXPECT_TRUE(cache.contains("k3"));
    EXPECT_TRUE(cache.contains("k4"));
    EXPECT_EQ(cache.evictionCount(), 3);
}

// ==================== create() ====================

TEST(MemoryLruCacheTest, CreateIsCalledOnMiss) {
    RecordingCache cache(10);
    cache.creator = [](const std::string& key) -> std::optional<std::string> {
        return "created-" + key;
    };

    bool hit = true;
    auto value = cache.get("a", hit);

    ASSERT_TRUE(value.has_value());
    EXPECT_EQ(value.value(), "created-a");
    EXPECT_FALSE(hit);
    EXPECT_TRUE(cache.contains("a"));
    EXPECT_EQ(cache.missCount(), 1);
    EXPECT_EQ(cache.createCount(), 1);

    cache.get("a", hit);
    EXPECT_TRUE(hit);
    EXPECT_EQ(cache.hitCount(), 1);
}

TEST(MemoryLruCacheTest, CreateResultTriggersEviction) {
    RecordingCache cache(1);
    cache.creator = [](const std::string& key) -> std::optional<std::string> {
        return key;
    };

    cache.put("a", "A");
    cache.get("b");

    ASSERT_EQ(cache.removals.size(), 1);
    EXPECT_EQ(cache.removals[0].cause, RemovalCause::Evicted);
    EXPECT_EQ(cache.removals[0].key, "a");
}

TEST(MemoryLruCacheTest, ExistingValueWinsOverCreatedValue) {
    RecordingCache cache(10);
    // Пока create() работает без блокировки, значение кладут "извне"
    cache.creator = [&cache](const std::string& key) -> std::optional<std::string> {
        cache.put(key, "existing");
        return std::string("created");
    };

    bool created = true;
    auto value = cache.get("a", created);

    ASSERT_TRUE(value.has_value());
    EXPECT_EQ(value.value(), "existing");
    EXPECT_FALSE(created);
    EXPECT_EQ(cache.createCount(), 1);

    ASSERT_EQ(cache.removals.size(), 1);
    EXPECT_EQ(cache.removals[0].cause, RemovalCause::Removed);
    EXPECT_EQ(cache.removals[0].oldValue, "created");
    ASSERT_TRUE(cache.removals[0].newValue.has_value());
    EXPECT_EQ(cache.removals[0].newValue.value(), "existing");
}

// ==================== adopt() ====================

TEST(MemoryLruCacheTest, AdoptDoesNotTouchCounters) {
    MemoryLruCache<std::string, int> cache(10);

    EXPECT_EQ(cache.adopt("a", 1), 1);

    EXPECT_TRUE(cache.contains("a"));
    EXPECT_EQ(cache.putCount(), 0);
    EXPECT_EQ(cache.createCount(), 0);
}

TEST(MemoryLruCacheTest, AdoptKeepsResidentValue) {
    MemoryLruCache<std::string, int> cache(10);
    cache.put("a", 1);

    EXPECT_EQ(cache.adopt("a", 2), 1);
    EXPECT_EQ(cache.get("a").value(), 1);
}

// ==================== entryRemoved() ====================

TEST(MemoryLruCacheTest, RemovalCauses) {
    RecordingCache cache(1);

    cache.put("a", "A");
    cache.put("b", "B");     // Evicted(a)
    cache.put("b", "B2");    // Removed(b, B -> B2)
    cache.remove("b");       // Removed(b, B2)

    ASSERT_EQ(cache.removals.size(), 3);

    EXPECT_EQ(cache.removals[0].cause, RemovalCause::Evicted);
    EXPECT_EQ(cache.removals[0].key, "a");
    EXPECT_FALSE(cache.removals[0].newValue.has_value());

    EXPECT_EQ(cache.removals[1].cause, RemovalCause::Removed);
    EXPECT_EQ(cache.removals[1].oldValue, "B");
    EXPECT_EQ(cache.removals[1].newValue.value(), "B2");

    EXPECT_EQ(cache.removals[2].cause, RemovalCause::Removed);
    EXPECT_EQ(cache.removals[2].oldValue, "B2");
    EXPECT_FALSE(cache.removals[2].newValue.has_value());
}

TEST(MemoryLruCacheTest, EvictAllNotifiesFromOldestToNewest) {
    RecordingCache cache(10);
    cache.put("a", "A");
    cache.put("b", "B");
    cache.put("c", "C");

    cache.evictAll();

    ASSERT_EQ(cache.removals.size(), 3);
    EXPECT_EQ(cache.removals[0].key, "a");
    EXPECT_EQ(cache.removals[1].key, "b");
    EXPECT_EQ(cache.removals[2].key, "c");
    for (const auto& removal : cache.removals) {
        EXPECT_EQ(removal.cause, RemovalCause::Removed);
    }
    EXPECT_EQ(cache.size(), 0);
    EXPECT_EQ(cache.evictionCount(), 0);
}

TEST(MemoryLruCacheTest, EvictAllWithEvictedCauseCountsEvictions) {
    RecordingCache cache(10);
    cache.put("a", "A");
    cache.put("b", "B");

    cache.evictAll(RemovalCause::Evicted);

    ASSERT_EQ(cache.removals.size(), 2);
    EXPECT_EQ(cache.removals[0].cause, RemovalCause::Evicted);
    EXPECT_EQ(cache.evictionCount(), 2);
}

// ==================== Статистика ====================

TEST(MemoryLruCacheTest, ToStringReportsHitRate) {
    MemoryLruCache<std::string, int> cache(10);
    cache.put("a", 1);
    cache.get("a");
    cache.get("b");

    EXPECT_EQ(cache.toString(), "MemoryLruCache[maxSize=10,hits=1,misses=1,hitRate=50%]");
    EXPECT_EQ(cache.putCount(), 1);
}

TEST(MemoryLruCacheTest, ToStringWithoutAccesses) {
    MemoryLruCache<std::string, int> cache(3);

    EXPECT_EQ(cache.toString(), "MemoryLruCache[maxSize=3,hits=0,misses=0,hitRate=0%]");
}

TEST(RemovalCauseTest, ToString) {
    EXPECT_EQ(toString(RemovalCause::Evicted), "EVICTED");
    EXPECT_EQ(toString(RemovalCause::Removed), "REMOVED");
}
