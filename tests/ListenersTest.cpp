#include <gtest/gtest.h>
#include <etfdata/cache/DiskCache.hpp>
#include <etfdata/listeners/CacheLoggingListener.hpp>
#include <etfdata/listeners/CacheStatsListener.hpp>
#include <etfdata/listeners/FetchLoggingListener.hpp>
#include <etfdata/listeners/SchedulerLoggingListener.hpp>
#include "TestSupport.hpp"

#include <filesystem>
#include <sstream>

/**
 * @brief Тесты для слушателей
 *
 * Проверяем:
 * - CacheStatsListener корректно считает статистику
 * - Логирующие слушатели пишут строки "[prefix] EVENT: details"
 * - Несколько слушателей на одном кэше работают вместе
 */

// ==================== CacheStatsListener ====================

TEST(CacheStatsListenerTest, InitiallyZero) {
    CacheStatsListener stats;

    EXPECT_EQ(stats.hits(), 0u);
    EXPECT_EQ(stats.misses(), 0u);
    EXPECT_EQ(stats.writes(), 0u);
    EXPECT_EQ(stats.corrupt(), 0u);
    EXPECT_EQ(stats.evictions(), 0u);
    EXPECT_DOUBLE_EQ(stats.hitRate(), 0.0);
}

TEST(CacheStatsListenerTest, HitRatePerNamespace) {
    CacheStatsListener stats;

    stats.onHit(CacheNamespace::Historical, "510300_60d");
    stats.onHit(CacheNamespace::Historical, "510300_60d");
    stats.onHit(CacheNamespace::Historical, "510300_60d");
    stats.onMiss(CacheNamespace::Historical, "510500_60d");
    stats.onMiss(CacheNamespace::Current, "510300");

    EXPECT_EQ(stats.hits(), 3u);
    EXPECT_EQ(stats.misses(), 2u);
    EXPECT_DOUBLE_EQ(stats.hitRate(CacheNamespace::Historical), 0.75);
    EXPECT_DOUBLE_EQ(stats.hitRate(CacheNamespace::Current), 0.0);
    EXPECT_DOUBLE_EQ(stats.hitRate(), 0.6);
}

TEST(CacheStatsListenerTest, Reset) {
    CacheStatsListener stats;
    stats.onHit(CacheNamespace::Info, "x");
    stats.onWrite(CacheNamespace::Info, "x", 10);
    stats.onEvicted(CacheNamespace::Info, "x", 10);

    stats.reset();

    EXPECT_EQ(stats.hits(), 0u);
    EXPECT_EQ(stats.writes(), 0u);
    EXPECT_EQ(stats.evictions(), 0u);
}

// ==================== CacheLoggingListener ====================

TEST(CacheLoggingListenerTest, QuietByDefault) {
    std::ostringstream out;
    CacheLoggingListener logger("DiskCache", out);

    logger.onHit(CacheNamespace::Current, "510300");
    logger.onMiss(CacheNamespace::Current, "510300");
    logger.onWrite(CacheNamespace::Current, "510300", 120);
    logger.onExpiredRemoved(CacheNamespace::Current, 0);

    EXPECT_TRUE(out.str().empty());
}

TEST(CacheLoggingListenerTest, ProblemsAlwaysLogged) {
    std::ostringstream out;
    CacheLoggingListener logger("DiskCache", out);

    logger.onCorrupt(CacheNamespace::Historical, "510300_60d", "bad magic");
    logger.onExpiredRemoved(CacheNamespace::Info, 4);
    logger.onEvicted(CacheNamespace::Current, "510500", 256);

    EXPECT_EQ(out.str(),
              "[DiskCache] CORRUPT: historical/510300_60d bad magic (entry removed)\n"
              "[DiskCache] EXPIRED: info removed 4 entries\n"
              "[DiskCache] EVICT: current/510500 256 bytes\n");
}

TEST(CacheLoggingListenerTest, VerboseLogsReads) {
    std::ostringstream out;
    CacheLoggingListener logger("Cache", out, true);

    logger.onHit(CacheNamespace::Info, "510300_analysis");

    EXPECT_EQ(out.str(), "[Cache] HIT: info/510300_analysis\n");
}

TEST(CacheLoggingListenerTest, MultipleListenersOnOneCache) {
    auto directory = testsupport::uniqueDirectory("etf_listeners_test");
    std::ostringstream out;
    {
        DiskCache cache(testsupport::cacheSettings(directory));
        auto stats = std::make_shared<CacheStatsListener>();
        cache.addListener(stats);
        cache.addListener(std::make_shared<CacheLoggingListener>("DiskCache", out, true));

        cache.putSeries(testsupport::makeSeries("510300", 5));
        cache.getSeries("510300", "60d");
        cache.getSeries("510500", "60d");

        EXPECT_EQ(stats->writes(), 1u);
        EXPECT_EQ(stats->hits(CacheNamespace::Historical), 1u);
        EXPECT_EQ(stats->misses(CacheNamespace::Historical), 1u);
    }
    EXPECT_NE(out.str().find("[DiskCache] HIT: historical/"), std::string::npos);
    EXPECT_NE(out.str().find("[DiskCache] MISS: historical/"), std::string::npos);
    std::filesystem::remove_all(directory);
}

// ==================== FetchLoggingListener ====================

TEST(FetchLoggingListenerTest, RetryAndBatchLines) {
    std::ostringstream out;
    FetchLoggingListener logger("Fetcher", out);

    logger.onRetry("quote 510300", 1, 3, "timeout", std::chrono::milliseconds(1000));
    logger.onBatchCompleted("historical", 4, 4, 3);
    logger.onBatchCompleted("current", 5, 4, 0);

    EXPECT_EQ(out.str(),
              "[Fetcher] RETRY: quote 510300 attempt 1/3 failed: timeout, retry in 1000 ms\n"
              "[Fetcher] BATCH: historical 4/4 resolved, cache hits 3 (75.0%)\n"
              "[Fetcher] BATCH: current 4/5 resolved\n");
}

TEST(FetchLoggingListenerTest, ListAndDegradedLines) {
    std::ostringstream out;
    FetchLoggingListener logger("F", out);

    logger.onInstrumentListFailed(true);
    logger.onDegradedResult("513100");
    logger.onInvalidSymbol("ABC");

    EXPECT_EQ(out.str(),
              "[F] LIST FAILED: using previous copy\n"
              "[F] DEGRADED: 513100 resolved from metadata only, prices pending\n"
              "[F] INVALID: symbol 'ABC' rejected\n");
}

// ==================== SchedulerLoggingListener ====================

TEST(SchedulerLoggingListenerTest, TaskLifecycleLines) {
    std::ostringstream out;
    SchedulerLoggingListener logger("Scheduler", out);

    auto task = ScheduledTask::recurring("daily_data_update", "Update", DataUpdateTask{},
                                         TimeFormat::makeTime(2024, 1, 8, 9, 0),
                                         std::chrono::hours(24));
    task.nextDue = task.scheduledAt;
    task.runCount = 2;

    logger.onRegistered(task, false);
    logger.onTaskStarted(task);
    logger.onTaskFailed(task, "provider down");
    logger.onTaskRescheduled(task);
    logger.onWarning("scheduler is already running");

    EXPECT_EQ(out.str(),
              "[Scheduler] REGISTER: daily_data_update (data_update), due 2024-01-08 09:00:00\n"
              "[Scheduler] START: daily_data_update run #2\n"
              "[Scheduler] FAIL: daily_data_update: provider down\n"
              "[Scheduler] NEXT: daily_data_update at 2024-01-08 09:00:00\n"
              "[Scheduler] WARN: scheduler is already running\n");
}
