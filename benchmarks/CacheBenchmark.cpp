#include <ttlcache/TTLCache.hpp>

#include <algorithm>
#include <cstdint>
#include <iostream>
#include <iomanip>
#include <chrono>
#include <random>
#include <vector>
#include <string>
#include <thread>

/**
 * @brief Бенчмарк записи в TTL-кэш
 *
 * Измеряем throughput set() (ops/sec):
 * - Без ограничения размера и с ограничением (100 / 10000)
 * - 10 "горячих" ключей против неограниченного множества ключей
 * - Один поток и несколько потоков
 *
 * Кэш перед каждым замером предзаполнен 10000 ключами.
 */

using namespace std::chrono_literals;

// ==================== Утилиты ====================

constexpr int kPrefill = 10'000;

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

std::unique_ptr<TTLCache<std::string, std::string>> makePrefilledCache(size_t maxSize) {
    auto cache = std::make_unique<TTLCache<std::string, std::string>>(0ns, 0ns, maxSize);
    for (int i = 0; i < kPrefill; ++i) {
        cache->set("a" + std::to_string(i), "val");
    }
    return cache;
}

/**
 * @brief Заранее сгенерированные ключи, чтобы не мерить генератор
 * @param hotKeys Количество различных ключей (0 - без ограничения)
 */
std::vector<std::string> makeKeys(size_t count, size_t hotKeys, uint32_t seed) {
    std::mt19937 rng(seed);
    std::vector<std::string> keys;
    keys.reserve(count);
    for (size_t i = 0; i < count; ++i) {
        uint32_t n = rng();
        if (hotKeys > 0) {
            n %= hotKeys;
        }
        keys.push_back("b" + std::to_string(n));
    }
    return keys;
}

std::string describe(size_t maxSize, size_t hotKeys) {
    std::string name = maxSize == 0
        ? "Set without size"
        : "Set with size " + std::to_string(maxSize);
    name += hotKeys == 0 ? ", keys N" : ", keys " + std::to_string(hotKeys);
    return name;
}

// ==================== Бенчмарки ====================

void benchmarkSet(size_t maxSize, size_t hotKeys, size_t numOperations) {
    auto cache = makePrefilledCache(maxSize);
    auto keys = makeKeys(numOperations, hotKeys, 42);

    double timeMs = measureMs([&]() {
        for (const auto& key : keys) {
            cache->set(key, "val");
        }
    });

    printResult(describe(maxSize, hotKeys), timeMs, numOperations);
}

void benchmarkParallelSet(size_t maxSize, size_t hotKeys, size_t numOperations, int numThreads) {
    auto cache = makePrefilledCache(maxSize);

    std::vector<std::vector<std::string>> keysPerThread;
    for (int t = 0; t < numThreads; ++t) {
        keysPerThread.push_back(makeKeys(numOperations / numThreads, hotKeys, 42 + t));
    }

    double timeMs = measureMs([&]() {
        std::vector<std::thread> threads;
        for (int t = 0; t < numThreads; ++t) {
            threads.emplace_back([&cache, &keys = keysPerThread[t]]() {
                for (const auto& key : keys) {
                    cache->set(key, "val");
                }
            });
        }
        for (auto& th : threads) {
            th.join();
        }
    });

    printResult(describe(maxSize, hotKeys) + " (" + std::to_string(numThreads) + " threads)",
                timeMs, numOperations);
}

void benchmarkCleanExpired(size_t numEntries) {
    TTLCache<int, int> cache(0ns, 0ns, 0);
    for (size_t i = 0; i < numEntries; ++i) {
        // Половина элементов истекает сразу
        cache.setWithTTL(static_cast<int>(i), 0, i % 2 == 0 ? ExpirationClock::Duration(1ns) : ExpirationClock::Duration(1h));
    }
    std::this_thread::sleep_for(1ms);

    size_t removed = 0;
    double timeMs = measureMs([&]() {
        removed = cache.cleanExpired();
    });

    printResult("cleanExpired (" + std::to_string(numEntries) + " entries)", timeMs, numEntries);
    std::cout << "   Removed: " << removed << "\n";
}

int main() {
    const size_t numOperations = 1'000'000;
    const int numThreads = static_cast<int>(
        std::max(2u, std::thread::hardware_concurrency()));

    std::cout << "\n=== Single thread ===\n\n";
    for (size_t maxSize : {size_t{0}, size_t{100}, size_t{10'000}}) {
        benchmarkSet(maxSize, 10, numOperations);
        benchmarkSet(maxSize, 0, numOperations);
    }

    std::cout << "\n=== " << numThreads << " threads ===\n\n";
    for (size_t maxSize : {size_t{0}, size_t{100}, size_t{10'000}}) {
        benchmarkParallelSet(maxSize, 10, numOperations, numThreads);
        benchmarkParallelSet(maxSize, 0, numOperations, numThreads);
    }

    std::cout << "\n=== Sweep ===\n\n";
    benchmarkCleanExpired(100'000);
    benchmarkCleanExpired(1'000'000);

    return 0;
}
