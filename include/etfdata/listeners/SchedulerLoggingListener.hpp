#pragma once

#include <etfdata/scheduler/ISchedulerListener.hpp>
#include <etfdata/time/TimeFormat.hpp>
#include <iostream>
#include <mutex>
#include <string>

/**
 * @brief Логирование событий планировщика в поток
 *
 * Формат строки: "[prefix] EVENT: details".
 */
class SchedulerLoggingListener : public ISchedulerListener {
public:
    explicit SchedulerLoggingListener(const std::string& prefix = "Scheduler",
                                      std::ostream& os = std::cout)
        : prefix_(prefix)
        , os_(os)
    {}

    void onRegistered(const ScheduledTask& task, bool replaced) override {
        std::string due = task.nextDue ? TimeFormat::formatDateTime(*task.nextDue) : "-";
        line(replaced ? "REPLACE" : "REGISTER",
             task.id + " (" + taskKindName(task.kind) + "), due " + due);
    }

    void onRemoved(const std::string& id) override {
        line("REMOVE", id);
    }

    void onCancelled(const ScheduledTask& task) override {
        line("CANCEL", task.id);
    }

    void onTaskStarted(const ScheduledTask& task) override {
        line("START", task.id + " run #" + std::to_string(task.runCount));
    }

    void onTaskCompleted(const ScheduledTask& task, std::chrono::milliseconds elapsed) override {
        line("DONE", task.id + " in " + std::to_string(elapsed.count()) + " ms");
    }

    void onTaskFailed(const ScheduledTask& task, const std::string& error) override {
        line("FAIL", task.id + ": " + error);
    }

    void onTaskRescheduled(const ScheduledTask& task) override {
        line("NEXT", task.id + " at " + TimeFormat::formatDateTime(*task.nextDue));
    }

    void onLoopStarted() override { line("LOOP", "started"); }
    void onLoopStopped() override { line("LOOP", "stopped"); }

    void onInfo(const std::string& message) override { line("INFO", message); }
    void onWarning(const std::string& message) override { line("WARN", message); }

private:
    void line(const char* event, const std::string& details) {
        std::lock_guard<std::mutex> lock(mutex_);
        os_ << "[" << prefix_ << "] " << event << ": " << details << "\n";
    }

    std::string prefix_;
    std::ostream& os_;
    std::mutex mutex_;
};
