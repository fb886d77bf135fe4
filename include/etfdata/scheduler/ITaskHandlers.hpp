#pragma once

#include <etfdata/scheduler/ScheduledTask.hpp>

/**
 * @brief Обработчики встроенных видов задач
 *
 * CustomTask обработчика не требует: он несёт своё замыкание.
 * Исключение из обработчика помечает задачу FAILED и дальше не уходит.
 */
class ITaskHandlers {
public:
    virtual ~ITaskHandlers() = default;

    virtual void runDataUpdate(const DataUpdateTask& task) = 0;
    virtual void runAnalysis(const AnalysisTask& task) = 0;
    virtual void runReport(const ReportTask& task) = 0;
    virtual void runCleanup(const CleanupTask& task) = 0;
};
