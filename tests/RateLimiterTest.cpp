#include <gtest/gtest.h>
#include <etfdata/fetch/RateLimiter.hpp>
#include <etfdata/time/ManualClock.hpp>

#include <memory>
#include <thread>
#include <vector>

/**
 * @brief Тесты для RateLimiter
 *
 * Проверяем:
 * - Первый вызов проходит без ожидания
 * - Подряд идущие вызовы разнесены на minDelay
 * - Паузы не нужны, если время уже прошло
 * - Общий лимит для нескольких потоков
 */

TEST(RateLimiterTest, FirstAcquireDoesNotWait) {
    auto clock = std::make_shared<ManualClock>();
    RateLimiter limiter(std::chrono::milliseconds(100), clock);

    limiter.acquire();

    EXPECT_TRUE(clock->sleeps().empty());
    EXPECT_EQ(limiter.acquisitions(), 1u);
}

TEST(RateLimiterTest, BackToBackCallsAreSpaced) {
    auto clock = std::make_shared<ManualClock>();
    RateLimiter limiter(std::chrono::milliseconds(100), clock);
    auto start = clock->now();

    for (int i = 0; i < 5; ++i) {
        limiter.acquire();
    }

    EXPECT_EQ(clock->now() - start, std::chrono::milliseconds(400));
    EXPECT_EQ(limiter.totalWaited(), std::chrono::milliseconds(400));
}

TEST(RateLimiterTest, NoWaitWhenDelayAlreadyPassed) {
    auto clock = std::make_shared<ManualClock>();
    RateLimiter limiter(std::chrono::milliseconds(100), clock);

    limiter.acquire();
    clock->advance(std::chrono::milliseconds(60));
    limiter.acquire();
    clock->advance(std::chrono::milliseconds(500));
    limiter.acquire();

    ASSERT_EQ(clock->sleeps().size(), 1u);
    EXPECT_EQ(clock->sleeps()[0], std::chrono::milliseconds(40));
}

TEST(RateLimiterTest, SharedAcrossThreads) {
    auto clock = std::make_shared<ManualClock>();
    RateLimiter limiter(std::chrono::milliseconds(100), clock);
    auto start = clock->now();

    std::vector<std::thread> threads;
    for (int t = 0; t < 4; ++t) {
        threads.emplace_back([&] {
            for (int i = 0; i < 5; ++i) {
                limiter.acquire();
            }
        });
    }
    for (auto& t : threads) {
        t.join();
    }

    EXPECT_EQ(limiter.acquisitions(), 20u);
    // 20 вызовов - 19 интервалов, независимо от потоков
    EXPECT_EQ(clock->now() - start, std::chrono::milliseconds(1900));
}

TEST(RateLimiterTest, NullClockRejected) {
    EXPECT_THROW(RateLimiter(std::chrono::milliseconds(100), nullptr), std::invalid_argument);
}
