#include <gtest/gtest.h>
#include "tlcache/TwoLevelCache.hpp"
#include "tlcache/listeners/LoggingListener.hpp"
#include "tlcache/listeners/StatsListener.hpp"
#include "tlcache/serialization/BinaryConverter.hpp"
#include <cstdlib>
#include <filesystem>
#include <sstream>
#include <string>

/**
 * @brief Тесты для слушателей
 *
 * Проверяем:
 * - StatsListener различает попадания в память и на диск
 * - LoggingListener выводит сообщения и учитывает уровень
 * - Множественные слушатели работают вместе
 * - Удаление слушателей
 */

namespace fs = std::filesystem;

class TwoLevelListenersTest : public ::testing::Test {
protected:
    void SetUp() override {
        directory_ = fs::temp_directory_path()
            / ("tlcache_listeners_test_"
                + std::string(::testing::UnitTest::GetInstance()->current_test_info()->name())
                + "_" + std::to_string(std::rand()));
        fs::remove_all(directory_);
    }

    void TearDown() override {
        fs::remove_all(directory_);
    }

    std::unique_ptr<TwoLevelCache<int>> makeCache(size_t maxSizeMem) {
        return std::make_unique<TwoLevelCache<int>>(directory_, 1, maxSizeMem, 1024 * 1024,
            std::make_shared<BinaryConverter<int>>());
    }

    fs::path directory_;
};

// ==================== StatsListener ====================

TEST(StatsListenerTest, InitiallyZero) {
    StatsListener<int> stats;

    EXPECT_EQ(stats.memoryHits(), 0);
    EXPECT_EQ(stats.diskHits(), 0);
    EXPECT_EQ(stats.misses(), 0);
    EXPECT_EQ(stats.creates(), 0);
    EXPECT_EQ(stats.diskWrites(), 0);
    EXPECT_EQ(stats.diskRemoves(), 0);
    EXPECT_EQ(stats.evictions(), 0);
    EXPECT_EQ(stats.removals(), 0);
    EXPECT_EQ(stats.diskErrors(), 0);
    EXPECT_EQ(stats.totalRequests(), 0);
    EXPECT_DOUBLE_EQ(stats.hitRate(), 0.0);
}

TEST_F(TwoLevelListenersTest, StatsSeparateMemoryAndDiskHits) {
    auto cache = makeCache(2);
    auto stats = std::make_shared<StatsListener<int>>();
    cache->addListener(stats);

    cache->put("a", 1);
    cache->put("b", 2);
    cache->put("c", 3);     // a → только диск
    cache->get("c");        // память
    cache->get("a");        // диск
    cache->get("missing");  // нигде

    EXPECT_EQ(stats->memoryHits(), 1);
    EXPECT_EQ(stats->diskHits(), 1);
    EXPECT_EQ(stats->misses(), 1);
    EXPECT_EQ(stats->diskWrites(), 3);
    EXPECT_EQ(stats->totalRequests(), 3);
    EXPECT_NEAR(stats->hitRate(), 2.0 / 3.0, 1e-9);

    // Встроенные счётчики видят только память
    EXPECT_EQ(cache->hitCount(), 1);
    EXPECT_EQ(cache->missCount(), 2);
}

TEST_F(TwoLevelListenersTest, StatsCountEvictionsAndRemovals) {
    auto cache = makeCache(1);
    auto stats = std::make_shared<StatsListener<int>>();
    cache->addListener(stats);

    cache->put("a", 1);
    cache->put("b", 2);     // Evicted(a)
    cache->put("b", 3);     // Removed(b)
    cache->remove("b");     // Removed(b)

    EXPECT_EQ(stats->evictions(), 1);
    EXPECT_EQ(stats->removals(), 2);
    EXPECT_EQ(stats->diskRemoves(), 2);
}

TEST(StatsListenerTest, Reset) {
    StatsListener<int> stats;

    stats.onHit("key");
    stats.onMiss("key");
    stats.onPromote("key");
    stats.onDiskError(DiskOperation::Read, "key", "boom");

    stats.reset();

    EXPECT_EQ(stats.memoryHits(), 0);
    EXPECT_EQ(stats.misses(), 0);
    EXPECT_EQ(stats.diskHits(), 0);
    EXPECT_EQ(stats.diskErrors(), 0);
}

// ==================== LoggingListener ====================

TEST(LoggingListenerTest, LogsEventsWithPrefix) {
    std::ostringstream oss;
    LoggingListener<int> logger("Test", oss);

    logger.onHit("key1");
    logger.onMiss("key2");
    logger.onPromote("key3");
    logger.onWriteThrough("key4");
    logger.onEntryRemoved(RemovalCause::Evicted, "key5", 5);

    EXPECT_EQ(oss.str(),
        "[Test] HIT: key1\n"
        "[Test] MISS: key2\n"
        "[Test] PROMOTE: key3\n"
        "[Test] WRITE: key4\n"
        "[Test] EVICTED: key5\n");
}

TEST(LoggingListenerTest, LogsDiskError) {
    std::ostringstream oss;
    LoggingListener<int> logger("Images", oss);

    logger.onDiskError(DiskOperation::Write, "logo", "No space left on device");

    EXPECT_EQ(oss.str(), "[Images] DISK ERROR (write): logo (No space left on device)\n");
}

TEST(LoggingListenerTest, ErrorLevelSkipsRegularEvents) {
    std::ostringstream oss;
    LoggingListener<int> logger("Test", oss, LoggingListener<int>::Level::Error);

    logger.onHit("key1");
    logger.onCreate("key2");
    logger.onDiskRemove("key3");
    EXPECT_TRUE(oss.str().empty());

    logger.onDiskError(DiskOperation::Read, "key4", "corrupt");
    EXPECT_NE(oss.str().find("DISK ERROR (read): key4"), std::string::npos);
}

TEST(LoggingListenerTest, IntegrationWithMemoryOnlyCache) {
    std::ostringstream oss;
    TwoLevelCache<int> cache(1);
    cache.addListener(std::make_shared<LoggingListener<int>>("Cache", oss));

    cache.put("key1", 42);
    cache.get("key1");
    cache.get("missing");
    cache.put("key2", 7);

    std::string output = oss.str();
    EXPECT_NE(output.find("[Cache] HIT: key1"), std::string::npos);
    EXPECT_NE(output.find("[Cache] MISS: missing"), std::string::npos);
    EXPECT_NE(output.find("[Cache] EVICTED: key1"), std::string::npos);
    // Без диска нет записи
    EXPECT_EQ(output.find("WRITE"), std::string::npos);
}

TEST(DiskOperationTest, ToString) {
    EXPECT_EQ(toString(DiskOperation::Read), "read");
    EXPECT_EQ(toString(DiskOperation::Write), "write");
    EXPECT_EQ(toString(DiskOperation::Remove), "remove");
}

// ==================== Множественные слушатели ====================

TEST_F(TwoLevelListenersTest, MultipleListeners) {
    auto cache = makeCache(10);
    auto stats = std::make_shared<StatsListener<int>>();
    std::ostringstream oss;
    auto logger = std::make_shared<LoggingListener<int>>("Test", oss);

    cache->addListener(stats);
    cache->addListener(logger);

    cache->put("key1", 42);
    cache->get("key1");

    // Оба слушателя получили события
    EXPECT_EQ(stats->diskWrites(), 1);
    EXPECT_EQ(stats->memoryHits(), 1);
    EXPECT_NE(oss.str().find("WRITE: key1"), std::string::npos);
    EXPECT_NE(oss.str().find("HIT: key1"), std::string::npos);
}

TEST(ListenersTest, RemoveListener) {
    TwoLevelCache<int> cache(10);
    auto stats = std::make_shared<StatsListener<int>>();

    cache.addListener(stats);
    cache.put("a", 1);
    cache.get("a");     // Stats: 1 hit

    cache.removeListener(stats);
    cache.get("a");     // Stats не должен обновиться

    EXPECT_EQ(stats->memoryHits(), 1);
}

TEST(ListenersTest, DefaultErrorLoggerCanBeRemoved) {
    TwoLevelCache<int> cache(10);
    auto logger = cache.errorLogger();

    cache.removeListener(logger);
    cache.put("key1", 42);

    EXPECT_EQ(cache.get("key1").value(), 42);
    EXPECT_EQ(logger.use_count(), 2);   // кэш и локальная копия
}

TEST(ListenersTest, AddNullListenerIgnored) {
    TwoLevelCache<int> cache(10);

    cache.addListener(nullptr);  // Не должно падать
    cache.put("key1", 42);       // Не должно падать

    EXPECT_EQ(cache.size(), 1);
}
