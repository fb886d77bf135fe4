#pragma once

#include <etfdata/settings/Environment.hpp>
#include <chrono>
#include <stdexcept>
#include <string>
#include <vector>

/**
 * @brief Отслеживаемые инструменты
 *
 * enabled - весь список для обновления, анализа и отчёта.
 * priority - подмножество, для которого при обновлении тянется ещё и история.
 *
 * ENV: ETF_ENABLED_SYMBOLS, ETF_PRIORITY_SYMBOLS (через запятую)
 */
struct UniverseSettings {
    std::vector<std::string> enabled;
    std::vector<std::string> priority;

    static UniverseSettings fromEnvironment() {
        UniverseSettings s;
        if (auto v = Environment::getList("ETF_ENABLED_SYMBOLS")) {
            s.enabled = *v;
        }
        if (auto v = Environment::getList("ETF_PRIORITY_SYMBOLS")) {
            s.priority = *v;
        }
        return s;
    }
};

/**
 * @brief Настройки планировщика и набора задач по умолчанию
 *
 * ENV:
 * - ETF_SCHEDULER_POLL_SECONDS (default: 30)
 * - ETF_SCHEDULER_DATA_UPDATE_ENABLED / ETF_SCHEDULER_DATA_UPDATE_HOURS (true / 24)
 * - ETF_SCHEDULER_ANALYSIS_ENABLED / ETF_SCHEDULER_ANALYSIS_HOURS (true / 24)
 * - ETF_SCHEDULER_REPORT_ENABLED / ETF_SCHEDULER_REPORT_HOURS (true / 168)
 * - ETF_SCHEDULER_CLEANUP_ENABLED (true)
 */
struct SchedulerSettings {
    std::chrono::milliseconds pollInterval = std::chrono::seconds(30);

    /// Сколько stop() ждёт завершения текущего прохода цикла
    std::chrono::milliseconds stopTimeout = std::chrono::seconds(5);

    bool instrumentListRefreshEnabled = true;
    std::chrono::minutes instrumentListRefreshInterval = std::chrono::hours(6);

    bool dataUpdateEnabled = true;
    std::chrono::minutes dataUpdateInterval = std::chrono::hours(24);

    bool analysisEnabled = true;
    std::chrono::minutes analysisInterval = std::chrono::hours(24);

    /// Еженедельный анализ: понедельник 09:00
    bool weeklyAnalysisEnabled = true;

    bool reportEnabled = true;
    std::chrono::minutes reportInterval = std::chrono::hours(168);

    bool cleanupEnabled = true;
    std::chrono::minutes cleanupInterval = std::chrono::hours(24);

    UniverseSettings universe;

    void validate() const {
        if (pollInterval.count() <= 0) {
            throw std::invalid_argument("pollInterval must be positive");
        }
        if (stopTimeout.count() <= 0) {
            throw std::invalid_argument("stopTimeout must be positive");
        }
        if (instrumentListRefreshInterval.count() <= 0 || dataUpdateInterval.count() <= 0 ||
            analysisInterval.count() <= 0 || reportInterval.count() <= 0 ||
            cleanupInterval.count() <= 0) {
            throw std::invalid_argument("Task intervals must be positive");
        }
    }

    static SchedulerSettings fromEnvironment() {
        SchedulerSettings s;
        if (auto v = Environment::getInt("ETF_SCHEDULER_POLL_SECONDS")) {
            s.pollInterval = std::chrono::seconds(*v);
        }
        if (auto v = Environment::getBool("ETF_SCHEDULER_DATA_UPDATE_ENABLED")) {
            s.dataUpdateEnabled = *v;
        }
        if (auto v = Environment::getInt("ETF_SCHEDULER_DATA_UPDATE_HOURS")) {
            s.dataUpdateInterval = std::chrono::hours(*v);
        }
        if (auto v = Environment::getBool("ETF_SCHEDULER_ANALYSIS_ENABLED")) {
            s.analysisEnabled = *v;
        }
        if (auto v = Environment::getInt("ETF_SCHEDULER_ANALYSIS_HOURS")) {
            s.analysisInterval = std::chrono::hours(*v);
        }
        if (auto v = Environment::getBool("ETF_SCHEDULER_REPORT_ENABLED")) {
            s.reportEnabled = *v;
        }
        if (auto v = Environment::getInt("ETF_SCHEDULER_REPORT_HOURS")) {
            s.reportInterval = std::chrono::hours(*v);
        }
        if (auto v = Environment::getBool("ETF_SCHEDULER_CLEANUP_ENABLED")) {
            s.cleanupEnabled = *v;
        }
        s.universe = UniverseSettings::fromEnvironment();
        s.validate();
        return s;
    }
};
