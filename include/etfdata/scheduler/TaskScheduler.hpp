#pragma once

#include <etfdata/scheduler/ISchedulerListener.hpp>
#include <etfdata/scheduler/ITaskHandlers.hpp>
#include <etfdata/scheduler/ScheduledTask.hpp>
#include <etfdata/settings/SchedulerSettings.hpp>
#include <etfdata/time/SystemClock.hpp>

#include <algorithm>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

/**
 * @brief Ближайшая ожидающая задача
 */
struct NextTaskInfo {
    std::string id;
    std::string name;
    IClock::TimePoint due;
};

/**
 * @brief Сводка состояния планировщика
 */
struct SchedulerStatus {
    bool running = false;
    size_t totalTasks = 0;
    std::map<TaskStatus, size_t> counts;
    std::optional<NextTaskInfo> next;
};

/**
 * @brief Планировщик задач с фоновым циклом опроса
 *
 * - runPending() выполняет все задачи в состоянии PENDING, срок которых
 *   наступил; сбой одной задачи не мешает остальным
 * - start() запускает фоновый поток, который вызывает runPending()
 *   каждые pollInterval; повторный start() только предупреждает
 * - stop() будит цикл и ждёт его завершения не дольше stopTimeout
 *
 * Реестр защищён мьютексом. Обработчики выполняются вне мьютекса,
 * поэтому задача может регистрировать или удалять другие задачи.
 * Если задачу заменили или удалили во время выполнения, результат
 * запуска отбрасывается.
 *
 * Пример:
 * @code
 *   TaskScheduler scheduler(pipeline, settings);
 *   scheduler.registerTask(ScheduledTask::recurring(
 *       "data_cleanup", "Cache cleanup", CleanupTask{}, now + 1h, 24h));
 *   scheduler.start();
 *   ...
 *   scheduler.stop();
 * @endcode
 */
class TaskScheduler {
public:
    using TimePoint = IClock::TimePoint;

    /**
     * @throws std::invalid_argument при пустых обработчиках или часах
     *         и при некорректных настройках
     */
    explicit TaskScheduler(std::shared_ptr<ITaskHandlers> handlers,
                           SchedulerSettings settings = SchedulerSettings(),
                           std::shared_ptr<IClock> clock = std::make_shared<SystemClock>())
        : handlers_(std::move(handlers))
        , settings_(std::move(settings))
        , clock_(std::move(clock))
        , listener_(std::make_shared<ISchedulerListener>())
    {
        if (!handlers_) {
            throw std::invalid_argument("TaskScheduler: handlers must not be null");
        }
        if (!clock_) {
            throw std::invalid_argument("TaskScheduler: clock must not be null");
        }
        settings_.validate();
    }

    ~TaskScheduler() {
        stop();
        // Если stop() не дождался, ждём текущую задачу до конца
        if (thread_.joinable()) {
            thread_.join();
        }
    }

    // Запрещаем копирование
    TaskScheduler(const TaskScheduler&) = delete;
    TaskScheduler& operator=(const TaskScheduler&) = delete;

    void setListener(std::shared_ptr<ISchedulerListener> listener) {
        std::lock_guard<std::mutex> lock(tasksMutex_);
        listener_ = listener ? std::move(listener) : std::make_shared<ISchedulerListener>();
    }

    // ==================== Реестр ====================

    /**
     * @brief Зарегистрировать задачу (задача с тем же id заменяется)
     * @return true для новой задачи, false если заменена существующая
     * @throws std::invalid_argument при пустом id или пустом CustomTask
     */
    bool registerTask(ScheduledTask task) {
        if (task.id.empty()) {
            throw std::invalid_argument("TaskScheduler: task id must not be empty");
        }
        if (const auto* custom = std::get_if<CustomTask>(&task.kind)) {
            if (!custom->callback) {
                throw std::invalid_argument("TaskScheduler: custom task '" + task.id +
                                            "' has no callback");
            }
        }
        if (task.name.empty()) {
            task.name = task.id;
        }

        auto now = clock_->now();
        if (!task.nextDue) {
            task.nextDue = task.scheduledAt.value_or(now);
        }
        task.status = TaskStatus::Pending;
        task.createdAt = now;
        task.updatedAt = now;

        bool replaced = false;
        std::shared_ptr<ISchedulerListener> listener;
        {
            std::lock_guard<std::mutex> lock(tasksMutex_);
            auto it = tasks_.find(task.id);
            replaced = it != tasks_.end();
            Entry entry{task, ++generation_};
            if (replaced) {
                it->second = std::move(entry);
            } else {
                tasks_.emplace(task.id, std::move(entry));
            }
            listener = listener_;
        }

        if (replaced) {
            listener->onWarning("task '" + task.id + "' replaced");
        }
        listener->onRegistered(task, replaced);
        return !replaced;
    }

    bool removeTask(const std::string& id) {
        std::shared_ptr<ISchedulerListener> listener;
        {
            std::lock_guard<std::mutex> lock(tasksMutex_);
            if (tasks_.erase(id) == 0) {
                return false;
            }
            listener = listener_;
        }
        listener->onRemoved(id);
        return true;
    }

    /**
     * @brief Отменить ожидающую задачу
     * @return false, если задачи нет или она не в состоянии PENDING
     */
    bool cancelTask(const std::string& id) {
        ScheduledTask snapshot;
        std::shared_ptr<ISchedulerListener> listener;
        {
            std::lock_guard<std::mutex> lock(tasksMutex_);
            auto it = tasks_.find(id);
            if (it == tasks_.end() || it->second.task.status != TaskStatus::Pending) {
                return false;
            }
            it->second.task.status = TaskStatus::Cancelled;
            it->second.task.updatedAt = clock_->now();
            snapshot = it->second.task;
            listener = listener_;
        }
        listener->onCancelled(snapshot);
        return true;
    }

    std::optional<ScheduledTask> getTask(const std::string& id) const {
        std::lock_guard<std::mutex> lock(tasksMutex_);
        auto it = tasks_.find(id);
        if (it == tasks_.end()) {
            return std::nullopt;
        }
        return it->second.task;
    }

    std::vector<ScheduledTask> listTasks() const {
        std::lock_guard<std::mutex> lock(tasksMutex_);
        std::vector<ScheduledTask> result;
        result.reserve(tasks_.size());
        for (const auto& [id, entry] : tasks_) {
            result.push_back(entry.task);
        }
        return result;
    }

    size_t taskCount() const {
        std::lock_guard<std::mutex> lock(tasksMutex_);
        return tasks_.size();
    }

    // ==================== Выполнение ====================

    /**
     * @brief Выполнить все задачи, срок которых наступил
     *
     * Задачи выполняются последовательно в порядке срока.
     * Задача, достигшая лимита запусков, переводится в COMPLETED
     * без выполнения.
     *
     * @return Количество запущенных задач
     */
    size_t runPending() {
        std::vector<DueTask> due;
        std::shared_ptr<ISchedulerListener> listener;
        {
            std::lock_guard<std::mutex> lock(tasksMutex_);
            auto now = clock_->now();
            for (auto& [id, entry] : tasks_) {
                auto& task = entry.task;
                if (task.status != TaskStatus::Pending) {
                    continue;
                }
                if (task.ceilingReached()) {
                    task.status = TaskStatus::Completed;
                    task.updatedAt = now;
                    continue;
                }
                if (!task.nextDue || *task.nextDue > now) {
                    continue;
                }
                task.status = TaskStatus::Running;
                task.lastRun = now;
                task.updatedAt = now;
                ++task.runCount;
                due.push_back(DueTask{entry.generation, task});
            }
            listener = listener_;
        }

        std::stable_sort(due.begin(), due.end(), [](const DueTask& a, const DueTask& b) {
            return *a.task.nextDue < *b.task.nextDue;
        });

        for (const auto& item : due) {
            listener->onTaskStarted(item.task);

            auto started = std::chrono::steady_clock::now();
            std::string error;
            bool ok = true;
            try {
                dispatch(item.task.kind);
            } catch (const std::exception& e) {
                ok = false;
                error = e.what();
                if (error.empty()) {
                    error = "unknown error";
                }
            } catch (...) {
                ok = false;
                error = "unknown error";
            }
            auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
                std::chrono::steady_clock::now() - started);

            finish(item, ok, error, elapsed, *listener);
        }
        return due.size();
    }

    // ==================== Фоновый цикл ====================

    /**
     * @return false, если цикл уже запущен (выводится предупреждение)
     */
    bool start() {
        {
            std::lock_guard<std::mutex> lock(loopMutex_);
            if (thread_.joinable()) {
                if (!loopFinished_) {
                    warn(stopRequested_ ? "scheduler is still stopping"
                                        : "scheduler is already running");
                    return false;
                }
                // Цикл завершился после stop() с истёкшим таймаутом
                thread_.join();
            }
            stopRequested_ = false;
            loopFinished_ = false;
            thread_ = std::thread(&TaskScheduler::loopMain, this);
        }
        info("scheduler started, poll interval " +
             std::to_string(settings_.pollInterval.count()) + " ms");
        return true;
    }

    /**
     * @brief Остановить фоновый цикл
     * @return false, если цикл не завершился за stopTimeout
     *         (поток будет дождан в деструкторе)
     */
    bool stop() {
        std::unique_lock<std::mutex> lock(loopMutex_);
        if (!thread_.joinable()) {
            return true;
        }
        stopRequested_ = true;
        loopCv_.notify_all();

        bool finished = loopCv_.wait_for(lock, settings_.stopTimeout,
                                         [this] { return loopFinished_; });
        if (!finished) {
            lock.unlock();
            warn("scheduler loop did not stop within " +
                 std::to_string(settings_.stopTimeout.count()) + " ms");
            return false;
        }
        thread_.join();
        lock.unlock();
        info("scheduler stopped");
        return true;
    }

    bool isRunning() const {
        std::lock_guard<std::mutex> lock(loopMutex_);
        return thread_.joinable() && !stopRequested_ && !loopFinished_;
    }

    // ==================== Статус ====================

    SchedulerStatus statusSummary() const {
        SchedulerStatus status;
        status.running = isRunning();
        for (auto s : allTaskStatuses()) {
            status.counts[s] = 0;
        }

        std::lock_guard<std::mutex> lock(tasksMutex_);
        status.totalTasks = tasks_.size();
        for (const auto& [id, entry] : tasks_) {
            const auto& task = entry.task;
            ++status.counts[task.status];
            if (task.status != TaskStatus::Pending || !task.nextDue) {
                continue;
            }
            if (!status.next || *task.nextDue < status.next->due) {
                status.next = NextTaskInfo{task.id, task.name, *task.nextDue};
            }
        }
        return status;
    }

    const SchedulerSettings& settings() const { return settings_; }

    TimePoint now() const { return clock_->now(); }

    /// Для обработчиков, которые пишут в тот же журнал
    void info(const std::string& message) const { currentListener()->onInfo(message); }
    void warn(const std::string& message) const { currentListener()->onWarning(message); }

private:
    struct Entry {
        ScheduledTask task;
        uint64_t generation = 0;
    };

    struct DueTask {
        uint64_t generation = 0;
        ScheduledTask task;
    };

    std::shared_ptr<ISchedulerListener> currentListener() const {
        std::lock_guard<std::mutex> lock(tasksMutex_);
        return listener_;
    }

    void dispatch(const TaskKind& kind) {
        std::visit(Overloaded{
            [this](const DataUpdateTask& task) { handlers_->runDataUpdate(task); },
            [this](const AnalysisTask& task) { handlers_->runAnalysis(task); },
            [this](const ReportTask& task) { handlers_->runReport(task); },
            [this](const CleanupTask& task) { handlers_->runCleanup(task); },
            [](const CustomTask& task) { task.callback(); },
        }, kind);
    }

    void finish(const DueTask& item, bool ok, const std::string& error,
                std::chrono::milliseconds elapsed, ISchedulerListener& listener) {
        ScheduledTask after;
        bool rescheduled = false;
        {
            std::lock_guard<std::mutex> lock(tasksMutex_);
            auto it = tasks_.find(item.task.id);
            if (it == tasks_.end() || it->second.generation != item.generation) {
                return;
            }
            auto& task = it->second.task;
            auto now = clock_->now();

            task.status = ok ? TaskStatus::Completed : TaskStatus::Failed;
            task.lastResult = task.status;
            task.lastError = ok ? std::string() : error;
            task.updatedAt = now;

            if (task.isRecurring() && !task.ceilingReached()) {
                task.nextDue = now + *task.interval;
                task.status = TaskStatus::Pending;
                rescheduled = true;
            }
            after = task;
        }

        if (ok) {
            listener.onTaskCompleted(after, elapsed);
        } else {
            listener.onTaskFailed(after, error);
        }
        if (rescheduled) {
            listener.onTaskRescheduled(after);
        }
    }

    void loopMain() {
        auto listener = currentListener();
        listener->onLoopStarted();

        std::unique_lock<std::mutex> lock(loopMutex_);
        while (!stopRequested_) {
            lock.unlock();
            try {
                runPending();
            } catch (const std::exception& e) {
                listener->onWarning(std::string("scheduler pass failed: ") + e.what());
            } catch (...) {
                listener->onWarning("scheduler pass failed: unknown error");
            }
            lock.lock();
            loopCv_.wait_for(lock, settings_.pollInterval, [this] { return stopRequested_; });
        }
        loopFinished_ = true;
        lock.unlock();
        loopCv_.notify_all();

        listener->onLoopStopped();
    }

    std::shared_ptr<ITaskHandlers> handlers_;
    SchedulerSettings settings_;
    std::shared_ptr<IClock> clock_;
    std::shared_ptr<ISchedulerListener> listener_;

    mutable std::mutex tasksMutex_;
    std::map<std::string, Entry> tasks_;
    uint64_t generation_ = 0;

    mutable std::mutex loopMutex_;
    std::condition_variable loopCv_;
    std::thread thread_;
    bool stopRequested_ = false;
    bool loopFinished_ = false;
};
