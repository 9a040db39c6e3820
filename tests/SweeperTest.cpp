#include <gtest/gtest.h>
#include <ttlcache/TTLCache.hpp>
#include <ttlcache/sweep/Sweeper.hpp>
#include <atomic>
#include <memory>
#include <thread>
#include <vector>
#include <chrono>

/**
 * @brief Тесты для фоновой очистки
 *
 * Проверяем:
 * - Sweeper: запуск, тики, идемпотентная остановка
 * - Исключение из задачи не убивает поток
 * - TTLCache с cleanupInterval > 0 сам удаляет просроченные элементы
 * - close() останавливает поток, повторный close() безопасен
 */

using namespace std::chrono_literals;

// ==================== Sweeper ====================

TEST(SweeperTest, ConstructorThrowsOnNonPositiveInterval) {
    EXPECT_THROW((Sweeper(0ns, []() {})), std::invalid_argument);
    EXPECT_THROW((Sweeper(-1s, []() {})), std::invalid_argument);
}

TEST(SweeperTest, ConstructorThrowsOnEmptyTask) {
    EXPECT_THROW((Sweeper(1s, nullptr)), std::invalid_argument);
}

TEST(SweeperTest, NotRunningUntilStarted) {
    Sweeper sweeper(10ms, []() {});

    EXPECT_FALSE(sweeper.running());
    EXPECT_FALSE(sweeper.stop());
}

TEST(SweeperTest, RunsTaskPeriodically) {
    std::atomic<int> ticks{0};
    Sweeper sweeper(10ms, [&ticks]() { ++ticks; });

    ASSERT_TRUE(sweeper.start());
    std::this_thread::sleep_for(120ms);
    sweeper.stop();

    EXPECT_GE(ticks.load(), 3);
}

TEST(SweeperTest, StartTwiceReturnsFalse) {
    Sweeper sweeper(10ms, []() {});

    EXPECT_TRUE(sweeper.start());
    EXPECT_FALSE(sweeper.start());
    EXPECT_TRUE(sweeper.running());

    sweeper.stop();
}

TEST(SweeperTest, StopIsIdempotent) {
    Sweeper sweeper(10ms, []() {});
    sweeper.start();

    EXPECT_TRUE(sweeper.stop());
    EXPECT_FALSE(sweeper.stop());
    EXPECT_FALSE(sweeper.running());
}

TEST(SweeperTest, StopIsPromptWithLongInterval) {
    Sweeper sweeper(1h, []() {});
    sweeper.start();

    auto start = std::chrono::steady_clock::now();
    sweeper.stop();
    auto elapsed = std::chrono::steady_clock::now() - start;

    // Поток будится сигналом, а не ждёт следующего тика
    EXPECT_LT(elapsed, 1s);
}

TEST(SweeperTest, NoTicksAfterStop) {
    std::atomic<int> ticks{0};
    Sweeper sweeper(5ms, [&ticks]() { ++ticks; });
    sweeper.start();
    std::this_thread::sleep_for(30ms);
    sweeper.stop();

    int afterStop = ticks.load();
    std::this_thread::sleep_for(30ms);

    EXPECT_EQ(ticks.load(), afterStop);
}

TEST(SweeperTest, StopFromTaskThenStopFromOutsideJoins) {
    std::atomic<bool> stoppedInside{false};
    std::atomic<bool> taskFinished{false};
    std::unique_ptr<Sweeper> sweeper;
    Sweeper* raw = nullptr;

    sweeper = std::make_unique<Sweeper>(5ms, [&]() {
        if (stoppedInside.exchange(true)) {
            return;
        }
        EXPECT_TRUE(raw->stop());
        std::this_thread::sleep_for(100ms);
        taskFinished = true;
    });
    raw = sweeper.get();
    sweeper->start();

    auto deadline = std::chrono::steady_clock::now() + 2s;
    while (!stoppedInside && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(1ms);
    }
    ASSERT_TRUE(stoppedInside.load());

    // Сигнал уже отправлен, но поток ещё в задаче: stop() его дожидается
    EXPECT_FALSE(sweeper->stop());
    EXPECT_TRUE(taskFinished.load());
}

TEST(SweeperTest, SurvivesThrowingTask) {
    std::atomic<int> ticks{0};
    Sweeper sweeper(5ms, [&ticks]() {
        ++ticks;
        throw std::runtime_error("boom");
    });

    sweeper.start();
    std::this_thread::sleep_for(60ms);
    sweeper.stop();

    EXPECT_GE(ticks.load(), 2);
}

TEST(SweeperTest, DestructorStopsThread) {
    std::atomic<int> ticks{0};
    {
        Sweeper sweeper(5ms, [&ticks]() { ++ticks; });
        sweeper.start();
        std::this_thread::sleep_for(20ms);
    }

    int afterDestroy = ticks.load();
    std::this_thread::sleep_for(20ms);

    EXPECT_EQ(ticks.load(), afterDestroy);
}

// ==================== Фоновая очистка в TTLCache ====================

TEST(BackgroundCleanupTest, NoSweeperWithoutInterval) {
    TTLCache<std::string, int> cache(10ms, 0ns, 0);

    EXPECT_FALSE(cache.cleanupRunning());

    cache.set("a", 1);
    std::this_thread::sleep_for(50ms);

    EXPECT_EQ(cache.size(), 1);  // Никто не чистит
}

TEST(BackgroundCleanupTest, SweeperRemovesExpiredEntries) {
    TTLCache<std::string, std::string> cache(50ms, 20ms, 0);
    ASSERT_TRUE(cache.cleanupRunning());

    cache.set("short", "x");
    cache.setWithTTL("long", "x", 1h);

    std::this_thread::sleep_for(200ms);

    EXPECT_EQ(cache.size(), 1);
    EXPECT_TRUE(cache.get("long").has_value());
}

TEST(BackgroundCleanupTest, ExampleScenario) {
    // TTL 100ms, очистка каждые 200ms, максимум 5 элементов
    TTLCache<std::string, std::string> cache(100ms, 200ms, 5);

    cache.set("key", "x");
    cache.setWithTTL("key_1h", "x", 1h);
    cache.setAll({
        {"key_map1", "x"},
        {"key_map2", "x"},
        {"key_map3", "x"},
    });
    EXPECT_EQ(cache.size(), 5);

    std::this_thread::sleep_for(600ms);

    EXPECT_EQ(cache.size(), 1);
    EXPECT_TRUE(cache.get("key_1h").has_value());
}

TEST(BackgroundCleanupTest, CloseStopsSweeper) {
    TTLCache<std::string, int> cache(10ms, 10ms, 0);
    ASSERT_TRUE(cache.cleanupRunning());

    cache.close();

    EXPECT_FALSE(cache.cleanupRunning());
    EXPECT_EQ(cache.size(), 0);

    // После close() очистка больше не работает
    cache.set("a", 1);
    std::this_thread::sleep_for(60ms);
    EXPECT_EQ(cache.size(), 1);
}

TEST(BackgroundCleanupTest, CloseTwiceWithSweeper) {
    TTLCache<std::string, int> cache(10ms, 10ms, 0);
    cache.set("a", 1);

    cache.close();
    EXPECT_EQ(cache.size(), 0);

    cache.close();  // Ни паники, ни взаимоблокировки
    EXPECT_EQ(cache.size(), 0);
}

TEST(BackgroundCleanupTest, ConcurrentCloseCalls) {
    TTLCache<int, int> cache(5ms, 5ms, 0);
    for (int i = 0; i < 100; ++i) {
        cache.set(i, i);
    }

    std::vector<std::thread> threads;
    for (int t = 0; t < 4; ++t) {
        threads.emplace_back([&cache]() { cache.close(); });
    }
    for (auto& th : threads) {
        th.join();
    }

    EXPECT_FALSE(cache.cleanupRunning());
    EXPECT_EQ(cache.size(), 0);
}

TEST(BackgroundCleanupTest, DestructorStopsSweeper) {
    // Кэш уничтожается без close() - поток не должен пережить его
    for (int i = 0; i < 10; ++i) {
        TTLCache<int, int> cache(1ms, 1ms, 0);
        cache.set(i, i);
    }
    SUCCEED();
}
