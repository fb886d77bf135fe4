#include <gtest/gtest.h>
#include <etfdata/fetch/DataFetcher.hpp>
#include <etfdata/time/ManualClock.hpp>
#include "TestSupport.hpp"
#include "stub/StubMarketDataProvider.hpp"

#include <algorithm>
#include <filesystem>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

/**
 * @brief Тесты для DataFetcher на заглушке провайдера
 *
 * Проверяем:
 * - Некорректный символ не вызывает провайдера
 * - Один массовый вызов на пакет и его повторное использование
 * - Урезанный результат из справочных данных
 * - Поштучную загрузку при отказе массового вызова
 * - Старую копию списка при неудачном обновлении
 * - Историю через дисковый кэш и долю попаданий пакета
 * - Таймаут вызова провайдера
 */

namespace {

using Capability = StubMarketDataProvider::Capability;

class BatchRecorder : public IFetchListener {
public:
    struct Batch {
        std::string kind;
        size_t requested;
        size_t resolved;
        size_t cacheHits;
    };

    void onBatchCompleted(const std::string& kind, size_t requested, size_t resolved,
                          size_t cacheHits) override {
        std::lock_guard<std::mutex> lock(mutex);
        batches.push_back({kind, requested, resolved, cacheHits});
    }

    void onFallback(size_t symbols) override { fallbacks.push_back(symbols); }
    void onDegradedResult(const std::string& symbol) override {
        std::lock_guard<std::mutex> lock(mutex);
        degraded.push_back(symbol);
    }
    void onInvalidSymbol(const std::string& symbol) override { invalid.push_back(symbol); }

    std::mutex mutex;
    std::vector<Batch> batches;
    std::vector<size_t> fallbacks;
    std::vector<std::string> degraded;
    std::vector<std::string> invalid;
};

}  // namespace

class DataFetcherTest : public ::testing::Test {
protected:
    void SetUp() override {
        directory_ = testsupport::uniqueDirectory("etf_fetcher_test");
        clock_ = std::make_shared<ManualClock>();
        provider_ = std::make_shared<StubMarketDataProvider>(clock_, 1000);
        cache_ = std::make_shared<DiskCache>(testsupport::cacheSettings(directory_));
        recorder_ = std::make_shared<BatchRecorder>();
        makeFetcher(testsupport::fastFetcherSettings());
    }

    void TearDown() override {
        fetcher_.reset();
        cache_.reset();
        std::filesystem::remove_all(directory_);
    }

    void makeFetcher(FetcherSettings settings) {
        fetcher_ = std::make_unique<DataFetcher>(provider_, cache_, settings, clock_);
        fetcher_->setListener(recorder_);
    }

    std::string directory_;
    std::shared_ptr<ManualClock> clock_;
    std::shared_ptr<StubMarketDataProvider> provider_;
    std::shared_ptr<DiskCache> cache_;
    std::shared_ptr<BatchRecorder> recorder_;
    std::unique_ptr<DataFetcher> fetcher_;
};

// ==================== Конструктор ====================

TEST_F(DataFetcherTest, ConstructorRejectsNullCollaborators) {
    EXPECT_THROW(DataFetcher(nullptr, cache_, FetcherSettings(), clock_), std::invalid_argument);
    EXPECT_THROW(DataFetcher(provider_, nullptr, FetcherSettings(), clock_), std::invalid_argument);
    EXPECT_THROW(DataFetcher(provider_, cache_, FetcherSettings(), nullptr), std::invalid_argument);
}

TEST_F(DataFetcherTest, ConstructorRejectsZeroRetries) {
    FetcherSettings settings;
    settings.maxRetries = 0;

    EXPECT_THROW(DataFetcher(provider_, cache_, settings, clock_), std::invalid_argument);
}

// ==================== Некорректные символы ====================

TEST_F(DataFetcherTest, InvalidSymbolMakesNoProviderCalls) {
    EXPECT_FALSE(fetcher_->getCurrent("ABCDEF").has_value());
    EXPECT_FALSE(fetcher_->getHistorical("51030").has_value());
    EXPECT_FALSE(fetcher_->getInstrumentInfo("").has_value());

    EXPECT_EQ(provider_->totalRequests(), 0);
    EXPECT_EQ(recorder_->invalid.size(), 3u);
}

TEST_F(DataFetcherTest, BatchWithOnlyInvalidSymbolsIsEmpty) {
    auto result = fetcher_->batchGetCurrent({"ABC", "12345X"});

    EXPECT_TRUE(result.empty());
    EXPECT_EQ(provider_->totalRequests(), 0);
}

// ==================== Массовый список ====================

TEST_F(DataFetcherTest, BatchUsesSingleBulkCall) {
    auto result = fetcher_->batchGetCurrent({"510300", "510500", "159915", "510300"});

    EXPECT_EQ(result.size(), 3u);
    EXPECT_EQ(provider_->calls(Capability::List), 1);
    EXPECT_EQ(provider_->calls(Capability::Quote), 0);
    EXPECT_EQ(result.at("510300").name, "沪深300ETF");
    EXPECT_EQ(result.at("510300").currency, "CNY");
    EXPECT_GT(result.at("510300").lastPrice, 0.0);
}

TEST_F(DataFetcherTest, BulkListReusedAcrossCalls) {
    fetcher_->batchGetCurrent({"510300", "510500"});
    fetcher_->getCurrent("159915");
    fetcher_->batchGetCurrent({"588000"});

    EXPECT_EQ(provider_->calls(Capability::List), 1);
}

TEST_F(DataFetcherTest, BulkListReloadedAfterTtl) {
    fetcher_->batchGetCurrent({"510300"});
    clock_->advance(std::chrono::hours(6));
    fetcher_->batchGetCurrent({"510300"});

    EXPECT_EQ(provider_->calls(Capability::List), 2);
}

TEST_F(DataFetcherTest, RefreshAndInvalidate) {
    EXPECT_TRUE(fetcher_->refreshInstrumentList());
    EXPECT_EQ(provider_->calls(Capability::List), 1);
    EXPECT_TRUE(fetcher_->instrumentListStatus().cached);
    EXPECT_EQ(fetcher_->instrumentListStatus().size, 6u);

    fetcher_->invalidateInstrumentList();
    fetcher_->getCurrent("510300");

    EXPECT_EQ(provider_->calls(Capability::List), 2);
}

TEST_F(DataFetcherTest, StaleListUsedWhenRefreshFails) {
    fetcher_->batchGetCurrent({"510300"});
    fetcher_->invalidateInstrumentList();
    provider_->injectFailures(Capability::List, StubMarketDataProvider::ALWAYS);

    auto result = fetcher_->batchGetCurrent({"510300", "510500"});

    EXPECT_EQ(result.size(), 2u);
    EXPECT_EQ(provider_->calls(Capability::Quote), 0);
    EXPECT_TRUE(recorder_->fallbacks.empty());
}

// ==================== Урезанный результат ====================

TEST_F(DataFetcherTest, SymbolMissingFromListGetsMetadataOnlySnapshot) {
    provider_->hideFromList("513100");

    auto snapshot = fetcher_->getCurrent("513100");

    ASSERT_TRUE(snapshot.has_value());
    EXPECT_TRUE(snapshot->metadataOnly);
    EXPECT_EQ(snapshot->name, "纳指ETF");
    EXPECT_EQ(snapshot->currency, "CNY");
    EXPECT_DOUBLE_EQ(snapshot->lastPrice, 0.0);
    EXPECT_EQ(provider_->calls(Capability::Info), 1);
    ASSERT_EQ(recorder_->degraded.size(), 1u);
}

TEST_F(DataFetcherTest, UnknownSymbolResolvesToNothing) {
    // Корректный код, но провайдер о нём ничего не знает
    EXPECT_FALSE(fetcher_->getCurrent("999999").has_value());
    EXPECT_EQ(provider_->calls(Capability::Info), 3);
}

TEST_F(DataFetcherTest, InstrumentInfoIsDiskCached) {
    auto first = fetcher_->getInstrumentInfo("510300");
    auto second = fetcher_->getInstrumentInfo("510300");

    ASSERT_TRUE(first.has_value());
    ASSERT_TRUE(second.has_value());
    EXPECT_EQ(second->fieldOr("company", ""), "华泰柏瑞基金");
    EXPECT_EQ(provider_->calls(Capability::Info), 1);
}

// ==================== Поштучная загрузка ====================

TEST_F(DataFetcherTest, FallbackReturnsSubsetWhenBulkFails) {
    provider_->injectFailures(Capability::List, StubMarketDataProvider::ALWAYS);
    provider_->injectFailures(Capability::Quote, StubMarketDataProvider::ALWAYS, "159915");
    provider_->injectFailures(Capability::Info, StubMarketDataProvider::ALWAYS, "159915");

    auto result = fetcher_->batchGetCurrent({"510300", "510500", "159915", "588000"});

    EXPECT_EQ(provider_->calls(Capability::List), 3);
    ASSERT_EQ(recorder_->fallbacks.size(), 1u);
    EXPECT_EQ(recorder_->fallbacks[0], 4u);
    EXPECT_EQ(result.size(), 3u);
    EXPECT_EQ(result.count("159915"), 0u);
    EXPECT_FALSE(result.at("510300").metadataOnly);
}

TEST_F(DataFetcherTest, FallbackDegradesToMetadataWhenQuoteFails) {
    provider_->injectFailures(Capability::List, StubMarketDataProvider::ALWAYS);
    provider_->injectFailures(Capability::Quote, StubMarketDataProvider::ALWAYS, "510500");

    auto result = fetcher_->batchGetCurrent({"510300", "510500"});

    ASSERT_EQ(result.size(), 2u);
    EXPECT_TRUE(result.at("510500").metadataOnly);
    EXPECT_FALSE(result.at("510300").metadataOnly);
}

TEST_F(DataFetcherTest, FallbackPausesBetweenChunks) {
    auto settings = testsupport::fastFetcherSettings();
    settings.batchSize = 2;
    settings.chunkPause = std::chrono::milliseconds(777);
    makeFetcher(settings);
    provider_->injectFailures(Capability::List, StubMarketDataProvider::ALWAYS);

    auto result = fetcher_->batchGetCurrent({"510300", "510500", "159915", "512880", "513100"});

    EXPECT_EQ(result.size(), 5u);
    auto sleeps = clock_->sleeps();
    EXPECT_EQ(std::count(sleeps.begin(), sleeps.end(), std::chrono::milliseconds(777)), 2);
}

TEST_F(DataFetcherTest, BatchReportsResolvedCount) {
    fetcher_->batchGetCurrent({"510300", "999999", "BAD"});

    ASSERT_FALSE(recorder_->batches.empty());
    const auto& batch = recorder_->batches.back();
    EXPECT_EQ(batch.kind, "current");
    EXPECT_EQ(batch.requested, 3u);
    EXPECT_EQ(batch.resolved, 1u);
}

// ==================== История ====================

TEST_F(DataFetcherTest, HistoricalMissThenHit) {
    auto first = fetcher_->getHistorical("510300", "60d");
    auto second = fetcher_->getHistorical("510300", "60d");

    ASSERT_TRUE(first.has_value());
    ASSERT_TRUE(second.has_value());
    EXPECT_EQ(provider_->calls(Capability::History), 1);
    EXPECT_EQ(first->size(), second->size());
    EXPECT_GT(first->size(), 30u);
    EXPECT_TRUE(std::filesystem::exists(directory_ + "/historical/510300_60d.bin"));
}

TEST_F(DataFetcherTest, HistoricalDefaultPeriod) {
    auto series = fetcher_->getHistorical("510500");

    ASSERT_TRUE(series.has_value());
    EXPECT_EQ(series->period(), "60d");
}

TEST_F(DataFetcherTest, HistoricalEnglishColumns) {
    provider_->useEnglishColumns(true);

    EXPECT_TRUE(fetcher_->getHistorical("510300", "30d").has_value());
}

TEST_F(DataFetcherTest, EmptyHistoryIsRetriedThenAbsent) {
    provider_->respondEmpty(Capability::History, "510300");

    EXPECT_FALSE(fetcher_->getHistorical("510300").has_value());
    EXPECT_EQ(provider_->calls(Capability::History), 3);
    EXPECT_TRUE(clock_->totalSlept() >= std::chrono::seconds(3));
}

TEST_F(DataFetcherTest, BatchHistoricalFetchesOnlyMisses) {
    fetcher_->getHistorical("510300", "60d");
    fetcher_->getHistorical("510500", "60d");
    provider_->resetStats();

    auto result = fetcher_->batchGetHistorical({"510300", "510500", "159915", "588000", "XXX"}, "60d");

    EXPECT_EQ(result.size(), 4u);
    EXPECT_EQ(provider_->calls(Capability::History), 2);

    const auto& batch = recorder_->batches.back();
    EXPECT_EQ(batch.kind, "historical");
    EXPECT_EQ(batch.requested, 4u);
    EXPECT_EQ(batch.resolved, 4u);
    EXPECT_EQ(batch.cacheHits, 2u);
}

TEST_F(DataFetcherTest, BatchHistoricalOmitsFailures) {
    provider_->injectFailures(Capability::History, StubMarketDataProvider::ALWAYS, "159915");

    auto result = fetcher_->batchGetHistorical({"510300", "159915"}, "60d", 2);

    EXPECT_EQ(result.size(), 1u);
    EXPECT_EQ(result.count("510300"), 1u);
}

// ==================== Таймаут ====================

TEST_F(DataFetcherTest, SlowProviderTimesOut) {
    provider_->setLatency(std::chrono::seconds(15));

    EXPECT_FALSE(fetcher_->getHistorical("510300").has_value());

    auto settings = testsupport::fastFetcherSettings();
    settings.requestTimeout = std::chrono::seconds(30);
    makeFetcher(settings);

    EXPECT_TRUE(fetcher_->getHistorical("510300").has_value());
}

// ==================== Сводка ====================

TEST_F(DataFetcherTest, SummaryClassifiesSymbols) {
    fetcher_->batchGetCurrent({"510300"});

    auto summary = fetcher_->summary({"510300", "159915", "bad"});

    EXPECT_EQ(summary.validSymbols.size(), 2u);
    ASSERT_EQ(summary.invalidSymbols.size(), 1u);
    EXPECT_EQ(summary.markets.at("159915"), Market::Shenzhen);
    EXPECT_EQ(summary.dataSource, "stub");
    EXPECT_TRUE(summary.instrumentList.cached);
    EXPECT_EQ(summary.providerCalls, 1u);
}
