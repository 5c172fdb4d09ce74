#pragma once

#include <tlcache/listeners/ICacheListener.hpp>
#include <cstdint>
#include <atomic>

/**
 * @brief Слушатель для сбора статистики по обоим уровням
 * @tparam V Тип значения
 *
 * Встроенные счётчики TwoLevelCache (hitCount() и т.д.) видят только
 * memory-уровень: чтение с диска там засчитывается как miss.
 * Этот слушатель различает:
 * - memoryHits — найдено в памяти
 * - diskHits   — найдено на диске и поднято в память
 * - misses     — не найдено нигде
 *
 * Использование:
 *   auto stats = std::make_shared<StatsListener<std::string>>();
 *   cache.addListener(stats);
 *   // ... работа с кэшем ...
 *   std::cout << "Hit rate: " << stats->hitRate() << std::endl;
 *
 * Примечание: счётчики atomic для потокобезопасности.
 */
template<typename V>
class StatsListener : public ICacheListener<V> {
public:
    void onHit(const std::string& key) override {
        (void)key;
        ++memoryHits_;
    }

    void onMiss(const std::string& key) override {
        (void)key;
        ++misses_;
    }

    void onCreate(const std::string& key) override {
        (void)key;
        ++creates_;
    }

    void onPromote(const std::string& key) override {
        (void)key;
        ++diskHits_;
    }

    void onWriteThrough(const std::string& key) override {
        (void)key;
        ++diskWrites_;
    }

    void onDiskRemove(const std::string& key) override {
        (void)key;
        ++diskRemoves_;
    }

    void onEntryRemoved(RemovalCause cause, const std::string& key, const V& oldValue) override {
        (void)key; (void)oldValue;
        if (cause == RemovalCause::Evicted) {
            ++evictions_;
        } else {
            ++removals_;
        }
    }

    void onDiskError(DiskOperation operation, const std::string& key,
                     const std::string& message) override {
        (void)operation; (void)key; (void)message;
        ++diskErrors_;
    }

    // ==================== Геттеры ====================

    uint64_t memoryHits() const { return memoryHits_; }
    uint64_t diskHits() const { return diskHits_; }
    uint64_t misses() const { return misses_; }
    uint64_t creates() const { return creates_; }
    uint64_t diskWrites() const { return diskWrites_; }
    uint64_t diskRemoves() const { return diskRemoves_; }
    uint64_t evictions() const { return evictions_; }
    uint64_t removals() const { return removals_; }
    uint64_t diskErrors() const { return diskErrors_; }

    /**
     * @brief Общее количество запросов get()
     */
    uint64_t totalRequests() const {
        return memoryHits_ + diskHits_ + creates_ + misses_;
    }

    /**
     * @brief Доля запросов, обслуженных любым из уровней (0.0 - 1.0)
     * @return hit rate или 0.0 если запросов не было
     */
    double hitRate() const {
        uint64_t total = totalRequests();
        if (total == 0) return 0.0;
        return static_cast<double>(memoryHits_ + diskHits_) / static_cast<double>(total);
    }

    /**
     * @brief Сбросить все счётчики
     */
    void reset() {
        memoryHits_ = 0;
        diskHits_ = 0;
        misses_ = 0;
        creates_ = 0;
        diskWrites_ = 0;
        diskRemoves_ = 0;
        evictions_ = 0;
        removals_ = 0;
        diskErrors_ = 0;
    }

private:
    std::atomic<uint64_t> memoryHits_{0};
    std::atomic<uint64_t> diskHits_{0};
    std::atomic<uint64_t> misses_{0};
    std::atomic<uint64_t> creates_{0};
    std::atomic<uint64_t> diskWrites_{0};
    std::atomic<uint64_t> diskRemoves_{0};
    std::atomic<uint64_t> evictions_{0};
    std::atomic<uint64_t> removals_{0};
    std::atomic<uint64_t> diskErrors_{0};
};
