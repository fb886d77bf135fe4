#pragma once

#include <etfdata/concurrency/ThreadSafeQueue.hpp>

#include <algorithm>
#include <atomic>
#include <functional>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

/**
 * @brief Ограниченный пул потоков над закрываемой очередью заданий
 *
 * - submit() кладёт задание в очередь
 * - join() закрывает очередь, дожидается выполнения всех заданий и
 *   останавливает потоки (вызывается и из деструктора)
 * - исключение из задания не выходит за пределы пула: засчитывается
 *   в failedJobs() и передаётся в обработчик ошибок ("unknown error",
 *   если это не std::exception)
 *
 * Пример:
 * @code
 *   WorkerPool pool(3);
 *   for (const auto& symbol : symbols) {
 *       pool.submit([&, symbol] { fetchOne(symbol); });
 *   }
 *   pool.join();
 * @endcode
 */
class WorkerPool {
public:
    using Job = std::function<void()>;
    using ErrorHandler = std::function<void(const std::string&)>;

    /**
     * @throws std::invalid_argument если workers == 0
     */
    explicit WorkerPool(size_t workers, ErrorHandler onError = nullptr)
        : onError_(std::move(onError))
    {
        if (workers == 0) {
            throw std::invalid_argument("WorkerPool: workers must be positive");
        }
        threads_.reserve(workers);
        for (size_t i = 0; i < workers; ++i) {
            threads_.emplace_back(&WorkerPool::workerLoop, this);
        }
    }

    ~WorkerPool() {
        join();
    }

    // Запрещаем копирование
    WorkerPool(const WorkerPool&) = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;

    /**
     * @return false, если пул уже остановлен
     */
    bool submit(Job job) {
        if (!job) {
            return false;
        }
        return queue_.push(std::move(job));
    }

    void join() {
        queue_.close();
        for (auto& t : threads_) {
            if (t.joinable()) {
                t.join();
            }
        }
    }

    size_t workerCount() const { return threads_.size(); }
    size_t completedJobs() const { return completed_; }
    size_t failedJobs() const { return failed_; }

    /**
     * @brief Выполнить fn для каждого элемента не более чем в concurrency потоков
     */
    template<typename T, typename Fn>
    static void forEach(const std::vector<T>& items, size_t concurrency, Fn fn,
                        ErrorHandler onError = nullptr) {
        if (items.empty()) {
            return;
        }
        WorkerPool pool(std::max<size_t>(1, std::min(concurrency, items.size())),
                        std::move(onError));
        for (const auto& item : items) {
            pool.submit([&fn, &item] { fn(item); });
        }
        pool.join();
    }

private:
    void workerLoop() {
        Job job;
        while (queue_.pop(job)) {
            try {
                job();
                ++completed_;
            } catch (const std::exception& e) {
                ++failed_;
                if (onError_) {
                    onError_(e.what());
                }
            } catch (...) {
                ++failed_;
                if (onError_) {
                    onError_("unknown error");
                }
            }
        }
    }

    ErrorHandler onError_;
    ThreadSafeQueue<Job> queue_;
    std::vector<std::thread> threads_;
    std::atomic<size_t> completed_{0};
    std::atomic<size_t> failed_{0};
};
