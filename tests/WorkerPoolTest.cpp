#include <gtest/gtest.h>
#include <etfdata/concurrency/WorkerPool.hpp>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

/**
 * @brief Тесты для WorkerPool
 *
 * Проверяем:
 * - Все задания выполняются до возврата join()
 * - Исключение задания (любого типа) изолировано и передаётся обработчику
 * - forEach не превышает заданную параллельность
 * - submit после join отклоняется
 */

TEST(WorkerPoolTest, RejectsZeroWorkers) {
    EXPECT_THROW(WorkerPool(0), std::invalid_argument);
}

TEST(WorkerPoolTest, RunsAllJobs) {
    std::atomic<int> sum{0};
    WorkerPool pool(3);

    for (int i = 1; i <= 100; ++i) {
        EXPECT_TRUE(pool.submit([&sum, i] { sum += i; }));
    }
    pool.join();

    EXPECT_EQ(sum.load(), 5050);
    EXPECT_EQ(pool.completedJobs(), 100u);
    EXPECT_EQ(pool.workerCount(), 3u);
}

TEST(WorkerPoolTest, FailingJobDoesNotStopOthers) {
    std::vector<std::string> errors;
    std::mutex errorsMutex;
    std::atomic<int> done{0};

    WorkerPool pool(2, [&](const std::string& error) {
        std::lock_guard<std::mutex> lock(errorsMutex);
        errors.push_back(error);
    });
    pool.submit([] { throw std::runtime_error("job failed"); });
    for (int i = 0; i < 10; ++i) {
        pool.submit([&] { ++done; });
    }
    pool.join();

    EXPECT_EQ(done.load(), 10);
    EXPECT_EQ(pool.failedJobs(), 1u);
    ASSERT_EQ(errors.size(), 1u);
    EXPECT_EQ(errors[0], "job failed");
}

TEST(WorkerPoolTest, NonStandardExceptionIsCounted) {
    std::vector<std::string> errors;
    std::mutex errorsMutex;
    std::atomic<int> done{0};

    WorkerPool pool(1, [&](const std::string& error) {
        std::lock_guard<std::mutex> lock(errorsMutex);
        errors.push_back(error);
    });
    pool.submit([] { throw 42; });
    pool.submit([&] { ++done; });
    pool.join();

    EXPECT_EQ(done.load(), 1);
    EXPECT_EQ(pool.failedJobs(), 1u);
    EXPECT_EQ(pool.completedJobs(), 1u);
    ASSERT_EQ(errors.size(), 1u);
    EXPECT_EQ(errors[0], "unknown error");
}

TEST(WorkerPoolTest, SubmitAfterJoinRejected) {
    WorkerPool pool(1);
    pool.join();

    EXPECT_FALSE(pool.submit([] {}));
}

TEST(WorkerPoolTest, ForEachRespectsConcurrency) {
    std::vector<int> items(20);
    std::atomic<int> active{0};
    std::atomic<int> peak{0};
    std::atomic<int> processed{0};

    WorkerPool::forEach(items, 3, [&](const int&) {
        int now = ++active;
        int seen = peak.load();
        while (now > seen && !peak.compare_exchange_weak(seen, now)) {
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
        --active;
        ++processed;
    });

    EXPECT_EQ(processed.load(), 20);
    EXPECT_LE(peak.load(), 3);
    EXPECT_GE(peak.load(), 1);
}

TEST(WorkerPoolTest, ForEachOnEmptyInputDoesNothing) {
    std::vector<int> items;
    int calls = 0;

    WorkerPool::forEach(items, 4, [&](const int&) { ++calls; });

    EXPECT_EQ(calls, 0);
}
