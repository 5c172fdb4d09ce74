#include <tlcache/TwoLevelCache.hpp>
#include <tlcache/memory/MemoryLruCache.hpp>
#include <tlcache/serialization/BinaryConverter.hpp>
#include <tlcache/listeners/StatsListener.hpp>

#include <iostream>
#include <chrono>
#include <filesystem>
#include <random>
#include <vector>
#include <string>
#include <iomanip>
#include <thread>

/**
 * @brief Бенчмарк для двухуровневого кэша
 *
 * Измеряем:
 * - Throughput memory-уровня (put/get)
 * - Стоимость write-through на диск
 * - Стоимость промаха памяти с чтением с диска
 * - Hit rate по уровням при случайном доступе
 */

namespace fs = std::filesystem;

// ==================== Утилиты ====================

template<typename Func>
double measureMs(Func&& func) {
    auto start = std::chrono::high_resolution_clock::now();
    func();
    auto end = std::chrono::high_resolution_clock::now();

    std::chrono::duration<double, std::milli> duration = end - start;
    return duration.count();
}

void printResult(const std::string& name, double timeMs, size_t operations) {
    double opsPerSec = (operations / timeMs) * 1000.0;
    std::cout << std::left << std::setw(45) << name
              << std::right << std::setw(10) << std::fixed << std::setprecision(2)
              << timeMs << " ms"
              << std::setw(15) << std::fixed << std::setprecision(0)
              << opsPerSec << " ops/sec\n";
}

fs::path benchmarkDirectory(const std::string& name) {
    auto directory = fs::temp_directory_path() / ("tlcache_benchmark_" + name);
    fs::remove_all(directory);
    return directory;
}

std::unique_ptr<TwoLevelCache<std::string>> makeCache(const fs::path& directory, size_t maxSizeMem) {
    return std::make_unique<TwoLevelCache<std::string>>(
        directory, 1, maxSizeMem, 256 * 1024 * 1024,
        std::make_shared<BinaryConverter<std::string>>());
}

std::string keyOf(size_t i) {
    return "key-" + std::to_string(i);
}

// ==================== Memory-уровень ====================

void benchmarkMemoryPut(size_t cacheSize, size_t numOperations) {
    MemoryLruCache<std::string, int> cache(cacheSize);

    std::vector<std::string> keys(numOperations);
    for (size_t i = 0; i < numOperations; ++i) {
        keys[i] = keyOf(i);
    }

    double timeMs = measureMs([&]() {
        for (size_t i = 0; i < numOperations; ++i) {
            cache.put(keys[i], static_cast<int>(i));
        }
    });

    printResult("Memory put (size=" + std::to_string(cacheSize) + ")", timeMs, numOperations);
}

void benchmarkMemoryGet(size_t cacheSize, size_t numOperations) {
    TwoLevelCache<int> cache(cacheSize);
    for (size_t i = 0; i < cacheSize; ++i) {
        cache.put(keyOf(i), static_cast<int>(i));
    }

    double timeMs = measureMs([&]() {
        for (size_t i = 0; i < numOperations; ++i) {
            cache.get(keyOf(i % cacheSize));
        }
    });

    printResult("Memory get (100% hit)", timeMs, numOperations);
}

// ==================== Дисковый уровень ====================

void benchmarkWriteThrough(size_t cacheSize, size_t numOperations, size_t valueSize) {
    auto directory = benchmarkDirectory("write");
    auto cache = makeCache(directory, cacheSize);
    std::string value(valueSize, 'x');

    double timeMs = measureMs([&]() {
        for (size_t i = 0; i < numOperations; ++i) {
            cache->put(keyOf(i), value);
        }
    });

    printResult("Put with write-through (" + std::to_string(valueSize) + " B)", timeMs, numOperations);
    std::cout << "   Disk size: " << cache->sizeDisk() / 1024 << " KiB\n";

    cache.reset();
    fs::remove_all(directory);
}

void benchmarkDiskPromotion(size_t cacheSize, size_t numOperations) {
    auto directory = benchmarkDirectory("promote");
    auto cache = makeCache(directory, cacheSize);
    for (size_t i = 0; i < numOperations; ++i) {
        cache->put(keyOf(i), "value-" + std::to_string(i));
    }
    cache->evictAllMem();

    double timeMs = measureMs([&]() {
        for (size_t i = 0; i < numOperations; ++i) {
            cache->get(keyOf(i));
        }
    });

    printResult("Get with disk promotion (0% memory hit)", timeMs, numOperations);

    cache.reset();
    fs::remove_all(directory);
}

void benchmarkRandomAccess(size_t cacheSize, size_t numOperations, size_t keyRange) {
    auto directory = benchmarkDirectory("random");
    auto cache = makeCache(directory, cacheSize);
    auto stats = std::make_shared<StatsListener<std::string>>();
    cache->addListener(stats);

    std::mt19937 rng(42);
    std::uniform_int_distribution<size_t> dist(0, keyRange - 1);

    std::vector<size_t> keys(numOperations);
    for (size_t i = 0; i < numOperations; ++i) {
        keys[i] = dist(rng);
    }

    double timeMs = measureMs([&]() {
        for (size_t i = 0; i < numOperations; ++i) {
            const std::string key = keyOf(keys[i]);
            if (!cache->get(key).has_value()) {
                cache->put(key, "value-" + key);
            }
        }
    });

    printResult("Random access (range=" + std::to_string(keyRange) + ")", timeMs, numOperations);
    std::cout << "   Memory hits: " << stats->memoryHits()
              << ", disk hits: " << stats->diskHits()
              << ", misses: " << stats->misses() << "\n";
    std::cout << "   Hit rate: " << std::fixed << std::setprecision(2)
              << (stats->hitRate() * 100) << "%\n";

    cache.reset();
    fs::remove_all(directory);
}

void benchmarkConcurrentReads(size_t cacheSize, size_t numOperations, int numThreads) {
    auto directory = benchmarkDirectory("concurrent");
    auto cache = makeCache(directory, cacheSize);
    const size_t keyRange = cacheSize * 4;
    for (size_t i = 0; i < keyRange; ++i) {
        cache->put(keyOf(i), "value-" + std::to_string(i));
    }

    double timeMs = measureMs([&]() {
        std::vector<std::thread> threads;
        for (int t = 0; t < numThreads; ++t) {
            threads.emplace_back([&cache, t, numOperations, keyRange]() {
                std::mt19937 rng(static_cast<unsigned>(t));
                std::uniform_int_distribution<size_t> dist(0, keyRange - 1);
                for (size_t i = 0; i < numOperations; ++i) {
                    cache->get(keyOf(dist(rng)));
                }
            });
        }
        for (auto& th : threads) {
            th.join();
        }
    });

    printResult("Concurrent get (" + std::to_string(numThreads) + " threads)",
                timeMs, numOperations * static_cast<size_t>(numThreads));

    cache.reset();
    fs::remove_all(directory);
}

int main() {
    const size_t SMALL_CACHE = 1000;
    const size_t LARGE_CACHE = 100000;
    const size_t NUM_OPS = 1000000;
    const size_t DISK_OPS = 10000;

    std::cout << "=== TwoLevelCache Benchmark ===\n";

    std::cout << "\n--- Memory level ---\n";
    benchmarkMemoryPut(SMALL_CACHE, NUM_OPS);
    benchmarkMemoryPut(LARGE_CACHE, NUM_OPS);
    benchmarkMemoryGet(LARGE_CACHE, NUM_OPS);

    std::cout << "\n--- Disk level ---\n";
    benchmarkWriteThrough(SMALL_CACHE, DISK_OPS, 100);
    benchmarkWriteThrough(SMALL_CACHE, DISK_OPS, 10 * 1024);
    benchmarkDiskPromotion(SMALL_CACHE, DISK_OPS);

    std::cout << "\n--- Access patterns ---\n";
    benchmarkRandomAccess(SMALL_CACHE, DISK_OPS, SMALL_CACHE * 2);
    benchmarkRandomAccess(SMALL_CACHE, DISK_OPS, SMALL_CACHE * 10);
    benchmarkConcurrentReads(SMALL_CACHE, DISK_OPS, 4);

    std::cout << "\n=== Benchmark complete ===\n";

    return 0;
}
