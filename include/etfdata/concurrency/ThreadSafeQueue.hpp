#pragma once

#include <condition_variable>
#include <deque>
#include <mutex>

/**
 * @brief Закрываемая очередь с блокирующим извлечением
 * @tparam T Тип элементов (допускаются move-only)
 *
 * Очередь заданий WorkerPool:
 * - push() не блокирует и после close() отказывает
 * - pop() ждёт элемента; после close() выдаёт остаток, затем false
 */
template<typename T>
class ThreadSafeQueue {
public:
    ThreadSafeQueue() = default;

    ThreadSafeQueue(const ThreadSafeQueue&) = delete;
    ThreadSafeQueue& operator=(const ThreadSafeQueue&) = delete;

    /**
     * @return false, если очередь закрыта (элемент не добавлен)
     */
    bool push(T item) {
        std::unique_lock<std::mutex> lock(mutex_);
        if (closed_) {
            return false;
        }
        items_.push_back(std::move(item));
        lock.unlock();
        ready_.notify_one();
        return true;
    }

    /**
     * @return false, если очередь закрыта и пуста
     */
    bool pop(T& out) {
        std::unique_lock<std::mutex> lock(mutex_);
        ready_.wait(lock, [this] { return closed_ || !items_.empty(); });
        if (items_.empty()) {
            return false;
        }
        out = std::move(items_.front());
        items_.pop_front();
        return true;
    }

    /// Повторный вызов ничего не меняет
    void close() {
        std::unique_lock<std::mutex> lock(mutex_);
        closed_ = true;
        lock.unlock();
        ready_.notify_all();
    }

    bool isClosed() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return closed_;
    }

    /// Только для диагностики: значение устаревает сразу после возврата
    size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return items_.size();
    }

private:
    mutable std::mutex mutex_;
    std::condition_variable ready_;
    std::deque<T> items_;
    bool closed_ = false;
};
