#pragma once

#include <etfdata/fetch/DataFetcher.hpp>
#include <etfdata/fetch/SymbolRules.hpp>
#include <etfdata/scheduler/TaskScheduler.hpp>
#include <etfdata/settings/SchedulerSettings.hpp>
#include <etfdata/time/TimeFormat.hpp>

#include <chrono>
#include <memory>
#include <stdexcept>
#include <string>

/**
 * @brief Набор задач по умолчанию
 *
 * | id                       | первый запуск     | период        |
 * |--------------------------|-------------------|---------------|
 * | instrument_list_refresh  | +30 мин           | 6 ч           |
 * | daily_data_update        | +1 мин            | 24 ч          |
 * | daily_analysis           | +5 мин            | 24 ч          |
 * | weekly_analysis          | пн 09:00          | 7 дней        |
 * | weekly_report            | +10 мин           | 168 ч         |
 * | data_cleanup             | +1 ч              | 24 ч          |
 *
 * Периоды берутся из SchedulerSettings, выключенные задачи не регистрируются.
 */
class DefaultTasks {
public:
    static constexpr const char* LIST_REFRESH_ID = "instrument_list_refresh";
    static constexpr const char* DATA_UPDATE_ID = "daily_data_update";
    static constexpr const char* ANALYSIS_ID = "daily_analysis";
    static constexpr const char* WEEKLY_ANALYSIS_ID = "weekly_analysis";
    static constexpr const char* REPORT_ID = "weekly_report";
    static constexpr const char* CLEANUP_ID = "data_cleanup";

    /**
     * @return Количество зарегистрированных задач
     */
    static size_t registerAll(TaskScheduler& scheduler, const SchedulerSettings& settings,
                              std::shared_ptr<DataFetcher> fetcher) {
        using namespace std::chrono;

        auto now = scheduler.now();
        size_t registered = 0;

        if (settings.instrumentListRefreshEnabled && fetcher) {
            auto task = ScheduledTask::recurring(
                LIST_REFRESH_ID, "Instrument list refresh",
                CustomTask{"refresh_instrument_list", [fetcher] {
                    if (!fetcher->refreshInstrumentList()) {
                        throw std::runtime_error("instrument list refresh failed");
                    }
                }},
                now + minutes(30), settings.instrumentListRefreshInterval);
            task.description = "Reload the bulk instrument list";
            scheduler.registerTask(std::move(task));
            ++registered;
        }

        if (settings.dataUpdateEnabled) {
            auto task = ScheduledTask::recurring(
                DATA_UPDATE_ID, "Daily data update", DataUpdateTask{},
                now + minutes(1), settings.dataUpdateInterval);
            task.description = "Fetch current data for enabled instruments";
            scheduler.registerTask(std::move(task));
            ++registered;
        }

        if (settings.analysisEnabled) {
            auto task = ScheduledTask::recurring(
                ANALYSIS_ID, "Daily analysis", AnalysisTask{},
                now + minutes(5), settings.analysisInterval);
            task.description = "Analyze enabled instruments";
            scheduler.registerTask(std::move(task));
            ++registered;
        }

        if (settings.weeklyAnalysisEnabled) {
            auto task = ScheduledTask::recurring(
                WEEKLY_ANALYSIS_ID, "Weekly analysis", AnalysisTask{},
                TimeFormat::nextWeekdayTime(now, 0, 9, 0), hours(24 * 7));
            task.description = "Full analysis every Monday at 09:00";
            scheduler.registerTask(std::move(task));
            ++registered;
        }

        if (settings.reportEnabled) {
            auto task = ScheduledTask::recurring(
                REPORT_ID, "Weekly report", ReportTask{},
                now + minutes(10), settings.reportInterval);
            task.description = "Summarize analysis results";
            scheduler.registerTask(std::move(task));
            ++registered;
        }

        if (settings.cleanupEnabled) {
            auto task = ScheduledTask::recurring(
                CLEANUP_ID, "Cache cleanup", CleanupTask{},
                now + hours(1), settings.cleanupInterval);
            task.description = "Remove expired entries and enforce the size budget";
            scheduler.registerTask(std::move(task));
            ++registered;
        }

        scheduler.info("registered " + std::to_string(registered) + " default tasks");
        return registered;
    }

    static std::string priorityTaskId(const std::string& symbol) {
        return "priority_" + symbol;
    }

    /**
     * @brief Частое обновление одного инструмента: через 5 минут, затем каждые 30
     * @throws std::invalid_argument при некорректном символе
     */
    static void addPriorityInstrumentTask(TaskScheduler& scheduler, const std::string& symbol,
                                          const std::string& name = "") {
        using namespace std::chrono;

        if (!SymbolRules::isValid(symbol)) {
            throw std::invalid_argument("Invalid instrument symbol: '" + symbol + "'");
        }
        auto task = ScheduledTask::recurring(
            priorityTaskId(symbol),
            name.empty() ? "Priority update " + symbol : name,
            DataUpdateTask{{symbol}},
            scheduler.now() + minutes(5), minutes(30));
        task.description = "Frequent update of " + symbol;
        scheduler.registerTask(std::move(task));
    }
};
