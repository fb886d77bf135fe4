#pragma once

#include <etfdata/cache/DiskCache.hpp>
#include <etfdata/fetch/DataFetcher.hpp>
#include <etfdata/pipeline/IInstrumentAnalyzer.hpp>
#include <etfdata/pipeline/IReportSink.hpp>
#include <etfdata/scheduler/ISchedulerListener.hpp>
#include <etfdata/scheduler/ITaskHandlers.hpp>
#include <etfdata/scheduler/TaskScheduler.hpp>
#include <etfdata/settings/SchedulerSettings.hpp>
#include <etfdata/time/SystemClock.hpp>

#include <algorithm>
#include <map>
#include <memory>
#include <mutex>
#include <set>
#include <stdexcept>
#include <string>
#include <vector>

/**
 * @brief Сводка для статусного отчёта
 */
struct OptimizationStatus {
    size_t monitoredInstruments = 0;
    FetcherSummary fetcher;
    CacheStats cache;
    bool schedulerRunning = false;
    std::optional<SchedulerStatus> scheduler;
};

/**
 * @brief Обработчики задач планировщика
 *
 * - обновление: пакетная загрузка текущих данных в пространство current;
 *   для приоритетных инструментов (и явно перечисленных в задаче)
 *   ещё и история; если пакетный вызов бросил исключение, выполняется
 *   поштучный обход
 * - анализ: снимок и история (через кэш) -> анализатор -> запись
 *   "<symbol>_analysis" в пространстве info
 * - отчёт: сохранённые результаты анализа -> IReportSink
 * - очистка: invalidateExpired() и enforceSizeBudget()
 *
 * Обновление и анализ, не получившие ни одного результата при непустом
 * списке, бросают std::runtime_error: планировщик пометит задачу FAILED.
 */
class DataPipeline : public ITaskHandlers {
public:
    /**
     * @param reportSink Может быть пустым: отчёт тогда только логируется
     * @throws std::invalid_argument при пустом загрузчике, кэше, анализаторе или часах
     */
    DataPipeline(std::shared_ptr<DataFetcher> fetcher,
                 std::shared_ptr<DiskCache> cache,
                 std::shared_ptr<IInstrumentAnalyzer> analyzer,
                 std::shared_ptr<IReportSink> reportSink,
                 UniverseSettings universe,
                 std::shared_ptr<IClock> clock = std::make_shared<SystemClock>())
        : fetcher_(std::move(fetcher))
        , cache_(std::move(cache))
        , analyzer_(std::move(analyzer))
        , reportSink_(std::move(reportSink))
        , universe_(std::move(universe))
        , clock_(std::move(clock))
        , listener_(std::make_shared<ISchedulerListener>())
    {
        if (!fetcher_ || !cache_ || !analyzer_ || !clock_) {
            throw std::invalid_argument("DataPipeline: fetcher, cache, analyzer and clock are required");
        }
    }

    /// Сообщения конвейера идут через onInfo/onWarning слушателя планировщика
    void setListener(std::shared_ptr<ISchedulerListener> listener) {
        std::lock_guard<std::mutex> lock(mutex_);
        listener_ = listener ? std::move(listener) : std::make_shared<ISchedulerListener>();
    }

    // ==================== Обновление данных ====================

    void runDataUpdate(const DataUpdateTask& task) override {
        auto symbols = resolve(task.symbols);
        if (symbols.empty()) {
            warn("data update: no instruments configured");
            return;
        }

        std::map<std::string, InstrumentSnapshot> snapshots;
        try {
            snapshots = fetcher_->batchGetCurrent(symbols);
        } catch (const std::exception& e) {
            warn(std::string("batch update failed, updating one by one: ") + e.what());
            snapshots = sequentialCurrent(symbols);
        }

        size_t stored = 0;
        size_t degraded = 0;
        for (const auto& [symbol, snapshot] : snapshots) {
            if (snapshot.metadataOnly) {
                ++degraded;
                continue;
            }
            if (cache_->putSnapshot(snapshot)) {
                ++stored;
            }
        }

        auto withHistory = historyTargets(symbols, task.symbols);
        size_t historical = 0;
        if (!withHistory.empty()) {
            historical = fetcher_->batchGetHistorical(withHistory, fetcher_->settings().defaultPeriod).size();
        }

        info("data update: " + std::to_string(snapshots.size()) + "/" +
             std::to_string(symbols.size()) + " resolved, " + std::to_string(stored) +
             " stored, " + std::to_string(degraded) + " metadata only, " +
             std::to_string(historical) + "/" + std::to_string(withHistory.size()) + " histories");

        if (snapshots.empty()) {
            throw std::runtime_error("data update resolved none of " +
                                     std::to_string(symbols.size()) + " instruments");
        }
    }

    // ==================== Анализ ====================

    void runAnalysis(const AnalysisTask& task) override {
        auto symbols = resolve(task.symbols);
        if (symbols.empty()) {
            warn("analysis: no instruments configured");
            return;
        }

        size_t analyzed = 0;
        for (const auto& symbol : symbols) {
            auto snapshot = cache_->getSnapshot(symbol);
            if (!snapshot) {
                snapshot = fetcher_->getCurrent(symbol);
            }
            auto series = fetcher_->getHistorical(symbol);
            // Снимок без цен анализировать нечем
            if (!snapshot || snapshot->metadataOnly || !series) {
                warn("analysis: no data for " + symbol);
                continue;
            }

            std::optional<AnalysisResult> result;
            try {
                result = analyzer_->analyze(*snapshot, *series);
            } catch (const std::exception& e) {
                warn("analysis of " + symbol + " failed: " + e.what());
                continue;
            }
            if (!result) {
                continue;
            }
            result->symbol = symbol;
            if (!cache_->putInfo(DiskCache::analysisKey(symbol), result->toInfoRecord(clock_->now()))) {
                warn("analysis of " + symbol + " could not be stored");
                continue;
            }
            ++analyzed;
        }

        info("analysis: " + std::to_string(analyzed) + "/" + std::to_string(symbols.size()) +
             " instruments");
        if (analyzed == 0) {
            throw std::runtime_error("analysis produced no results for " +
                                     std::to_string(symbols.size()) + " instruments");
        }
    }

    // ==================== Отчёт ====================

    void runReport(const ReportTask&) override {
        auto summary = buildReport();
        info("report: " + std::to_string(summary.results.size()) + "/" +
             std::to_string(summary.monitored) + " instruments with analysis");
        if (summary.results.empty()) {
            warn("report: no analysis results available");
        }
        if (reportSink_) {
            reportSink_->publish(summary);
        }
    }

    ReportSummary buildReport() {
        ReportSummary summary;
        summary.generatedAt = clock_->now();
        summary.monitored = universe_.enabled.size();

        for (const auto& symbol : universe_.enabled) {
            auto record = cache_->getInfo(DiskCache::analysisKey(symbol));
            if (!record) {
                continue;
            }
            auto result = AnalysisResult::fromInfoRecord(*record);
            if (!result) {
                continue;
            }
            ++summary.counts[result->recommendation];
            summary.results.push_back(std::move(*result));
        }
        return summary;
    }

    // ==================== Очистка ====================

    void runCleanup(const CleanupTask& task) override {
        auto expired = cache_->invalidateExpired();
        auto report = cache_->enforceSizeBudget(std::nullopt, task.force);

        size_t expiredTotal = 0;
        for (const auto& [ns, count] : expired) {
            expiredTotal += count;
        }
        info("cleanup: " + std::to_string(expiredTotal) + " expired, " +
             std::to_string(report.evictedFiles) + " evicted, " +
             std::to_string(report.bytesAfter) + " bytes in use");

        if (!report.ok) {
            throw std::runtime_error("cache cleanup could not remove some files");
        }
    }

    // ==================== Статус ====================

    /**
     * @param scheduler Может быть nullptr
     */
    OptimizationStatus optimizationStatus(const TaskScheduler* scheduler) const {
        OptimizationStatus status;
        status.monitoredInstruments = universe_.enabled.size();
        status.fetcher = fetcher_->summary(universe_.enabled);
        status.cache = cache_->stats();
        if (scheduler) {
            status.scheduler = scheduler->statusSummary();
            status.schedulerRunning = status.scheduler->running;
        }
        return status;
    }

    const UniverseSettings& universe() const { return universe_; }

private:
    std::vector<std::string> resolve(const std::vector<std::string>& requested) const {
        return requested.empty() ? universe_.enabled : requested;
    }

    std::vector<std::string> historyTargets(const std::vector<std::string>& symbols,
                                            const std::vector<std::string>& explicitSymbols) const {
        std::set<std::string> priority(universe_.priority.begin(), universe_.priority.end());
        priority.insert(explicitSymbols.begin(), explicitSymbols.end());

        std::vector<std::string> result;
        for (const auto& symbol : symbols) {
            if (priority.count(symbol)) {
                result.push_back(symbol);
            }
        }
        return result;
    }

    std::map<std::string, InstrumentSnapshot> sequentialCurrent(const std::vector<std::string>& symbols) {
        std::map<std::string, InstrumentSnapshot> result;
        for (const auto& symbol : symbols) {
            try {
                if (auto snapshot = fetcher_->getCurrent(symbol)) {
                    result.emplace(symbol, std::move(*snapshot));
                }
            } catch (const std::exception& e) {
                warn("update of " + symbol + " failed: " + e.what());
            }
        }
        return result;
    }

    std::shared_ptr<ISchedulerListener> listener() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return listener_;
    }

    void info(const std::string& message) const { listener()->onInfo(message); }
    void warn(const std::string& message) const { listener()->onWarning(message); }

    std::shared_ptr<DataFetcher> fetcher_;
    std::shared_ptr<DiskCache> cache_;
    std::shared_ptr<IInstrumentAnalyzer> analyzer_;
    std::shared_ptr<IReportSink> reportSink_;
    UniverseSettings universe_;
    std::shared_ptr<IClock> clock_;

    mutable std::mutex mutex_;
    std::shared_ptr<ISchedulerListener> listener_;
};
