#include "analysis/MovingAverageAnalyzer.hpp"
#include "stub/StubMarketDataProvider.hpp"

#include <etfdata/cache/DiskCache.hpp>
#include <etfdata/fetch/DataFetcher.hpp>
#include <etfdata/listeners/CacheLoggingListener.hpp>
#include <etfdata/listeners/CacheStatsListener.hpp>
#include <etfdata/listeners/FetchLoggingListener.hpp>
#include <etfdata/listeners/SchedulerLoggingListener.hpp>
#include <etfdata/pipeline/DataPipeline.hpp>
#include <etfdata/pipeline/OstreamReportSink.hpp>
#include <etfdata/scheduler/DefaultTasks.hpp>
#include <etfdata/scheduler/TaskScheduler.hpp>
#include <etfdata/settings/CacheSettings.hpp>
#include <etfdata/settings/FetcherSettings.hpp>
#include <etfdata/settings/SchedulerSettings.hpp>
#include <etfdata/time/SystemClock.hpp>
#include <etfdata/time/TimeFormat.hpp>

#include <iomanip>
#include <iostream>
#include <thread>
#include <vector>

/**
 * @brief Демонстрация сборщика данных по ETF
 *
 * Сценарии:
 * 1. Один массовый вызов на весь пакет текущих цен
 * 2. Поштучная загрузка при отказе массового вызова
 * 3. Дисковый кэш истории
 * 4. Планировщик: обновление, анализ и отчёт в фоне
 *
 * Каталог кэша берётся из ETF_CACHE_DIR (по умолчанию data/cache)
 * и очищается в начале.
 */

namespace {

const std::vector<std::string> kSymbols = {
    "510300", "510500", "159915", "512880", "513100", "588000"
};

void printSeparator(const std::string& title) {
    std::cout << "\n" << std::string(60, '=') << "\n";
    std::cout << "  " << title << "\n";
    std::cout << std::string(60, '=') << "\n\n";
}

void printSnapshot(const InstrumentSnapshot& s) {
    std::cout << std::fixed << std::setprecision(3);
    std::cout << "  " << s.symbol << " " << s.name << ": ";
    if (s.metadataOnly) {
        std::cout << "metadata only (" << s.currency << ")\n";
        return;
    }
    std::cout << s.lastPrice << " (prev " << s.previousClose << ", "
              << std::setprecision(2) << s.changePercent << "%)\n";
}

FetcherSettings demoFetcherSettings() {
    auto settings = FetcherSettings::fromEnvironment();
    settings.rateLimitDelay = std::chrono::milliseconds(20);
    settings.backoffUnit = std::chrono::milliseconds(50);
    settings.chunkPause = std::chrono::milliseconds(100);
    settings.batchSize = 4;
    return settings;
}

/**
 * @brief Демо 1: пакет текущих цен
 *
 * Шесть инструментов, один вызов провайдера. Повторные запросы в
 * пределах TTL списка тоже обходятся без сети.
 */
void demoBulkReuse(const std::shared_ptr<DiskCache>& cache) {
    printSeparator("Demo 1: One bulk call per update cycle");

    auto clock = std::make_shared<SystemClock>();
    auto provider = std::make_shared<StubMarketDataProvider>(clock);
    DataFetcher fetcher(provider, cache, demoFetcherSettings(), clock);
    fetcher.setListener(std::make_shared<FetchLoggingListener>());

    auto snapshots = fetcher.batchGetCurrent(kSymbols);
    for (const auto& [symbol, snapshot] : snapshots) {
        printSnapshot(snapshot);
    }
    for (const auto& symbol : kSymbols) {
        fetcher.getCurrent(symbol);
    }

    std::cout << "\nResult: " << kSymbols.size() * 2 << " lookups, "
              << provider->totalRequests() << " provider call(s)\n";
}

/**
 * @brief Демо 2: массовый вызов недоступен
 *
 * Список не загружается ни с одной попытки, поэтому пакет уходит в
 * поштучную загрузку пачками. Инструмент, которого нет в списке,
 * получает урезанный результат из справочных данных.
 */
void demoFallback(const std::shared_ptr<DiskCache>& cache) {
    printSeparator("Demo 2: Per-symbol fallback");

    auto clock = std::make_shared<SystemClock>();
    auto provider = std::make_shared<StubMarketDataProvider>(clock);
    provider->injectFailures(StubMarketDataProvider::Capability::List, StubMarketDataProvider::ALWAYS);
    DataFetcher fetcher(provider, cache, demoFetcherSettings(), clock);
    fetcher.setListener(std::make_shared<FetchLoggingListener>());

    auto snapshots = fetcher.batchGetCurrent(kSymbols);
    for (const auto& [symbol, snapshot] : snapshots) {
        printSnapshot(snapshot);
    }
    std::cout << "  provider calls: " << provider->totalRequests() << "\n\n";

    auto healthy = std::make_shared<StubMarketDataProvider>(clock);
    healthy->hideFromList("588000");
    DataFetcher degraded(healthy, cache, demoFetcherSettings(), clock);
    degraded.setListener(std::make_shared<FetchLoggingListener>());
    if (auto snapshot = degraded.getCurrent("588000")) {
        printSnapshot(*snapshot);
    }
}

/**
 * @brief Демо 3: история через дисковый кэш
 */
void demoHistoricalCache(const std::shared_ptr<DiskCache>& cache) {
    printSeparator("Demo 3: Historical data cache");

    auto stats = std::make_shared<CacheStatsListener>();
    cache->addListener(stats);

    auto clock = std::make_shared<SystemClock>();
    auto provider = std::make_shared<StubMarketDataProvider>(clock);
    DataFetcher fetcher(provider, cache, demoFetcherSettings(), clock);
    fetcher.setListener(std::make_shared<FetchLoggingListener>());

    std::vector<std::string> symbols(kSymbols.begin(), kSymbols.begin() + 4);
    std::cout << "First pass (provider):\n";
    auto first = fetcher.batchGetHistorical(symbols, "60d");
    for (const auto& [symbol, series] : first) {
        std::cout << "  " << symbol << ": " << series.size() << " bars, mean close "
                  << std::setprecision(3) << series.meanClose() << "\n";
    }

    std::cout << "\nSecond pass (disk cache):\n";
    fetcher.batchGetHistorical(symbols, "60d");

    std::cout << "\n  provider calls: " << provider->totalRequests() << "\n";
    std::cout << "  historical hit rate: " << std::setprecision(1)
              << stats->hitRate(CacheNamespace::Historical) * 100.0 << "%\n";
}

/**
 * @brief Демо 4: задачи в фоне
 *
 * Разовые задачи обновления, анализа и отчёта плюс набор по умолчанию
 * (его первые запуски далеко в будущем и в демо не наступят).
 */
void demoScheduler(const std::shared_ptr<DiskCache>& cache) {
    printSeparator("Demo 4: Scheduled pipeline");

    auto clock = std::make_shared<SystemClock>();
    auto provider = std::make_shared<StubMarketDataProvider>(clock);
    auto fetcher = std::make_shared<DataFetcher>(provider, cache, demoFetcherSettings(), clock);

    auto settings = SchedulerSettings::fromEnvironment();
    settings.pollInterval = std::chrono::milliseconds(200);
    if (settings.universe.enabled.empty()) {
        settings.universe.enabled = kSymbols;
        settings.universe.priority = kSymbols;
    }

    auto logger = std::make_shared<SchedulerLoggingListener>();
    auto pipeline = std::make_shared<DataPipeline>(
        fetcher, cache, std::make_shared<MovingAverageAnalyzer>(),
        std::make_shared<OstreamReportSink>(), settings.universe, clock);
    pipeline->setListener(logger);

    TaskScheduler scheduler(pipeline, settings, clock);
    scheduler.setListener(logger);

    DefaultTasks::registerAll(scheduler, settings, fetcher);
    DefaultTasks::addPriorityInstrumentTask(scheduler, "510300");

    auto now = clock->now();
    scheduler.registerTask(ScheduledTask::oneShot("demo_update", "Demo update", DataUpdateTask{}));
    scheduler.registerTask(ScheduledTask::oneShot("demo_analysis", "Demo analysis", AnalysisTask{},
                                                  now + std::chrono::milliseconds(400)));
    scheduler.registerTask(ScheduledTask::oneShot("demo_report", "Demo report", ReportTask{},
                                                  now + std::chrono::milliseconds(800)));

    scheduler.start();
    std::this_thread::sleep_for(std::chrono::seconds(2));
    scheduler.stop();

    auto status = pipeline->optimizationStatus(&scheduler);
    std::cout << "\nStatus:\n";
    std::cout << "  monitored instruments: " << status.monitoredInstruments << "\n";
    std::cout << "  instrument list cached: " << std::boolalpha
              << status.fetcher.instrumentList.cached << "\n";
    std::cout << "  cache: " << status.cache.totalFiles << " files, "
              << status.cache.totalBytes << " bytes\n";
    if (status.scheduler) {
        for (const auto& [taskStatus, count] : status.scheduler->counts) {
            std::cout << "  tasks " << toString(taskStatus) << ": " << count << "\n";
        }
        if (status.scheduler->next) {
            std::cout << "  next: " << status.scheduler->next->id << " at "
                      << TimeFormat::formatDateTime(status.scheduler->next->due) << "\n";
        }
    }
}

}  // namespace

int main() {
    try {
        auto cache = std::make_shared<DiskCache>(CacheSettings::fromEnvironment());
        cache->addListener(std::make_shared<CacheLoggingListener>());
        cache->clear();

        demoBulkReuse(cache);
        demoFallback(cache);
        demoHistoricalCache(cache);
        demoScheduler(cache);
    } catch (const std::exception& e) {
        std::cerr << "Fatal: " << e.what() << "\n";
        return 1;
    }

    printSeparator("All demos completed!");
    return 0;
}
