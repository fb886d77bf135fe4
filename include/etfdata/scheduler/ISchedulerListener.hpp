#pragma once

#include <etfdata/scheduler/ScheduledTask.hpp>
#include <chrono>
#include <string>

/**
 * @brief Интерфейс слушателя событий планировщика
 *
 * Методы по умолчанию пустые. Вызываются из фонового потока цикла
 * и из потока, регистрирующего задачи. onInfo/onWarning также
 * используются обработчиками задач (DataPipeline).
 */
class ISchedulerListener {
public:
    virtual ~ISchedulerListener() = default;

    virtual void onRegistered(const ScheduledTask& task, bool replaced) { (void)task; (void)replaced; }
    virtual void onRemoved(const std::string& id) { (void)id; }
    virtual void onCancelled(const ScheduledTask& task) { (void)task; }

    virtual void onTaskStarted(const ScheduledTask& task) { (void)task; }
    virtual void onTaskCompleted(const ScheduledTask& task, std::chrono::milliseconds elapsed) {
        (void)task; (void)elapsed;
    }
    virtual void onTaskFailed(const ScheduledTask& task, const std::string& error) {
        (void)task; (void)error;
    }
    virtual void onTaskRescheduled(const ScheduledTask& task) { (void)task; }

    virtual void onLoopStarted() {}
    virtual void onLoopStopped() {}

    virtual void onInfo(const std::string& message) { (void)message; }
    virtual void onWarning(const std::string& message) { (void)message; }
};
