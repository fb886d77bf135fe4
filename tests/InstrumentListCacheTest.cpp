#include <gtest/gtest.h>
#include <etfdata/fetch/InstrumentListCache.hpp>
#include <etfdata/time/ManualClock.hpp>

#include <atomic>
#include <memory>
#include <thread>
#include <vector>

/**
 * @brief Тесты для InstrumentListCache
 *
 * Проверяем:
 * - Один вызов загрузчика в пределах TTL
 * - Перезагрузку на границе TTL и после invalidate()
 * - Возврат старой копии при неудачной перезагрузке
 * - Пустой результат без удачной копии
 * - Единственную загрузку при одновременных обращениях
 */

class InstrumentListCacheTest : public ::testing::Test {
protected:
    void SetUp() override {
        clock_ = std::make_shared<ManualClock>();
        cache_ = std::make_unique<InstrumentListCache>(std::chrono::hours(6), clock_);
    }

    InstrumentListCache::Loader loader(size_t rows) {
        return [this, rows]() -> std::optional<InstrumentTable> {
            ++loads_;
            InstrumentTable table;
            for (size_t i = 0; i < rows; ++i) {
                InstrumentSnapshot s;
                s.symbol = "51030" + std::to_string(i);
                table.rows[s.symbol] = s;
            }
            table.fetchedAt = clock_->now();
            return table;
        };
    }

    InstrumentListCache::Loader failing() {
        return [this]() -> std::optional<InstrumentTable> {
            ++loads_;
            return std::nullopt;
        };
    }

    std::shared_ptr<ManualClock> clock_;
    std::unique_ptr<InstrumentListCache> cache_;
    std::atomic<int> loads_{0};
};

TEST_F(InstrumentListCacheTest, LoadsOnceWithinTtl) {
    auto first = cache_->get(loader(3));
    clock_->advance(std::chrono::hours(5));
    auto second = cache_->get(loader(3));

    EXPECT_TRUE(first.refreshed);
    EXPECT_FALSE(second.refreshed);
    EXPECT_EQ(first.table, second.table);
    EXPECT_EQ(loads_.load(), 1);
}

TEST_F(InstrumentListCacheTest, ReloadsAtTtl) {
    cache_->get(loader(3));
    clock_->advance(std::chrono::hours(6));

    auto lookup = cache_->get(loader(4));

    EXPECT_TRUE(lookup.refreshed);
    EXPECT_EQ(lookup.table->size(), 4u);
    EXPECT_EQ(loads_.load(), 2);
}

TEST_F(InstrumentListCacheTest, InvalidateForcesReload) {
    cache_->get(loader(3));
    cache_->invalidate();

    EXPECT_TRUE(cache_->status().expired);
    EXPECT_TRUE(cache_->get(loader(3)).refreshed);
    EXPECT_EQ(loads_.load(), 2);
}

TEST_F(InstrumentListCacheTest, StaleCopyServedWhenReloadFails) {
    cache_->get(loader(3));
    clock_->advance(std::chrono::hours(7));

    auto lookup = cache_->get(failing());

    ASSERT_TRUE(lookup.table);
    EXPECT_EQ(lookup.table->size(), 3u);
    EXPECT_TRUE(lookup.stale);
    EXPECT_TRUE(lookup.failed);
    EXPECT_FALSE(lookup.refreshed);
}

TEST_F(InstrumentListCacheTest, NoTableWithoutSuccessfulLoad) {
    auto lookup = cache_->get(failing());

    EXPECT_FALSE(lookup.table);
    EXPECT_TRUE(lookup.failed);
    EXPECT_FALSE(lookup.stale);
    EXPECT_FALSE(cache_->status().cached);
}

TEST_F(InstrumentListCacheTest, RefreshKeepsOldCopyOnFailure) {
    cache_->get(loader(3));

    EXPECT_FALSE(cache_->refresh(failing()));
    EXPECT_EQ(cache_->peek()->size(), 3u);
    EXPECT_TRUE(cache_->refresh(loader(5)));
    EXPECT_EQ(cache_->peek()->size(), 5u);
}

TEST_F(InstrumentListCacheTest, StatusReportsAge) {
    cache_->get(loader(2));
    clock_->advance(std::chrono::minutes(90));

    auto status = cache_->status();

    EXPECT_TRUE(status.cached);
    EXPECT_EQ(status.size, 2u);
    EXPECT_EQ(status.age, std::chrono::minutes(90));
    EXPECT_FALSE(status.expired);
}

TEST_F(InstrumentListCacheTest, ConcurrentCallersShareOneLoad) {
    std::vector<std::thread> threads;
    std::atomic<int> withTable{0};
    for (int i = 0; i < 8; ++i) {
        threads.emplace_back([&] {
            if (cache_->get(loader(3)).table) {
                ++withTable;
            }
        });
    }
    for (auto& t : threads) {
        t.join();
    }

    EXPECT_EQ(loads_.load(), 1);
    EXPECT_EQ(withTable.load(), 8);
}

TEST(InstrumentListCacheConfigTest, RejectsZeroTtlAndNullClock) {
    EXPECT_THROW(InstrumentListCache(std::chrono::milliseconds(0), std::make_shared<ManualClock>()),
                 std::invalid_argument);
    EXPECT_THROW(InstrumentListCache(std::chrono::hours(1), nullptr), std::invalid_argument);
}
