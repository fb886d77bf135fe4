#pragma once

#include <etfdata/time/IClock.hpp>
#include <mutex>
#include <vector>

/**
 * @brief Управляемые часы для тестов
 *
 * sleepFor() не блокирует поток: сдвигает виртуальное время
 * и запоминает запрошенную паузу. Так тесты проверяют backoff и
 * rate limit без реальных задержек.
 *
 * Пример:
 * @code
 *   auto clock = std::make_shared<ManualClock>();
 *   clock->sleepFor(std::chrono::seconds(2));
 *   EXPECT_EQ(clock->sleeps().size(), 1u);
 * @endcode
 */
class ManualClock : public IClock {
public:
    explicit ManualClock(TimePoint start = TimePoint(std::chrono::hours(24 * 365 * 50)))
        : now_(start)
    {}

    TimePoint now() const override {
        std::lock_guard<std::mutex> lock(mutex_);
        return now_;
    }

    void sleepFor(Duration duration) override {
        std::lock_guard<std::mutex> lock(mutex_);
        sleeps_.push_back(duration);
        if (duration.count() > 0) {
            now_ += duration;
        }
    }

    /**
     * @brief Сдвинуть время без записи в журнал пауз
     */
    void advance(Duration duration) {
        std::lock_guard<std::mutex> lock(mutex_);
        now_ += duration;
    }

    void set(TimePoint value) {
        std::lock_guard<std::mutex> lock(mutex_);
        now_ = value;
    }

    std::vector<Duration> sleeps() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return sleeps_;
    }

    Duration totalSlept() const {
        std::lock_guard<std::mutex> lock(mutex_);
        Duration total{0};
        for (auto s : sleeps_) {
            total += s;
        }
        return total;
    }

    void clearSleeps() {
        std::lock_guard<std::mutex> lock(mutex_);
        sleeps_.clear();
    }

private:
    mutable std::mutex mutex_;
    TimePoint now_;
    std::vector<Duration> sleeps_;
};
