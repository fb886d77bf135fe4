#pragma once

#include <etfdata/scheduler/TaskStatus.hpp>
#include <etfdata/time/IClock.hpp>

#include <chrono>
#include <functional>
#include <optional>
#include <string>
#include <variant>
#include <vector>

// ==================== Виды задач ====================

/// Обновление текущих данных; пустой список - все включённые инструменты
struct DataUpdateTask {
    std::vector<std::string> symbols;
};

/// Анализ; пустой список - все включённые инструменты
struct AnalysisTask {
    std::vector<std::string> symbols;
};

struct ReportTask {};

/// Очистка кэша; force - ужать до целевой доли даже в пределах бюджета
struct CleanupTask {
    bool force = false;
};

/// Произвольное действие; аргументы захватываются в замыкание
struct CustomTask {
    std::string label;
    std::function<void()> callback;
};

/**
 * @brief Закрытое множество видов задач
 *
 * Диспетчеризация через std::visit: новый вид без обработчика
 * не скомпилируется.
 */
using TaskKind = std::variant<DataUpdateTask, AnalysisTask, ReportTask, CleanupTask, CustomTask>;

template<class... Ts>
struct Overloaded : Ts... {
    using Ts::operator()...;
};
template<class... Ts>
Overloaded(Ts...) -> Overloaded<Ts...>;

inline const char* taskKindName(const TaskKind& kind) {
    return std::visit(Overloaded{
        [](const DataUpdateTask&) { return "data_update"; },
        [](const AnalysisTask&) { return "analysis"; },
        [](const ReportTask&) { return "report"; },
        [](const CleanupTask&) { return "cleanup"; },
        [](const CustomTask&) { return "custom"; },
    }, kind);
}

/**
 * @brief Задача планировщика
 *
 * interval без значения или равный нулю - разовая задача.
 * nextDue без значения вычисляется при регистрации из scheduledAt
 * (или текущего момента).
 */
struct ScheduledTask {
    using TimePoint = IClock::TimePoint;

    std::string id;
    std::string name;
    std::string description;
    TaskKind kind;

    std::optional<TimePoint> scheduledAt;
    std::optional<TimePoint> nextDue;
    std::optional<std::chrono::minutes> interval;

    size_t runCount = 0;
    std::optional<size_t> maxRuns;

    TaskStatus status = TaskStatus::Pending;

    /// Исход последнего запуска (COMPLETED или FAILED)
    std::optional<TaskStatus> lastResult;
    std::optional<TimePoint> lastRun;
    std::string lastError;

    TimePoint createdAt;
    TimePoint updatedAt;

    bool isRecurring() const {
        return interval && interval->count() > 0;
    }

    bool ceilingReached() const {
        return maxRuns && runCount >= *maxRuns;
    }

    static ScheduledTask recurring(std::string id, std::string name, TaskKind kind,
                                   TimePoint firstDue, std::chrono::minutes interval) {
        ScheduledTask task;
        task.id = std::move(id);
        task.name = std::move(name);
        task.kind = std::move(kind);
        task.scheduledAt = firstDue;
        task.interval = interval;
        return task;
    }

    /**
     * @param due Без значения - как можно скорее
     */
    static ScheduledTask oneShot(std::string id, std::string name, TaskKind kind,
                                 std::optional<TimePoint> due = std::nullopt) {
        ScheduledTask task;
        task.id = std::move(id);
        task.name = std::move(name);
        task.kind = std::move(kind);
        task.scheduledAt = due;
        return task;
    }
};
