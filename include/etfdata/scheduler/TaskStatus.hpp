#pragma once

#include <array>

/**
 * @brief Состояние задачи
 *
 * PENDING -> RUNNING -> COMPLETED / FAILED -> PENDING (периодическая задача)
 * COMPLETED / FAILED остаются конечными для разовой задачи и при
 * достижении лимита запусков. CANCELLED достижимо только из PENDING.
 */
enum class TaskStatus {
    Pending,
    Running,
    Completed,
    Failed,
    Cancelled
};

inline const char* toString(TaskStatus status) {
    switch (status) {
        case TaskStatus::Pending: return "pending";
        case TaskStatus::Running: return "running";
        case TaskStatus::Completed: return "completed";
        case TaskStatus::Failed: return "failed";
        case TaskStatus::Cancelled: return "cancelled";
    }
    return "unknown";
}

inline const std::array<TaskStatus, 5>& allTaskStatuses() {
    static const std::array<TaskStatus, 5> all = {
        TaskStatus::Pending, TaskStatus::Running, TaskStatus::Completed,
        TaskStatus::Failed, TaskStatus::Cancelled
    };
    return all;
}
