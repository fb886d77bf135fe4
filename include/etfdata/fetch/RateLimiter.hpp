#pragma once

#include <etfdata/time/IClock.hpp>
#include <memory>
#include <mutex>
#include <optional>
#include <stdexcept>

/**
 * @brief Глобальный минимальный интервал между вызовами провайдера
 *
 * Один экземпляр на загрузчик, общий для всех символов и попыток.
 * Потоки выстраиваются в очередь на мьютексе: пауза выдерживается
 * под блокировкой, поэтому два вызова не могут уйти ближе minDelay
 * друг к другу.
 */
class RateLimiter {
public:
    using Duration = IClock::Duration;

    RateLimiter(Duration minDelay, std::shared_ptr<IClock> clock)
        : minDelay_(minDelay)
        , clock_(std::move(clock))
    {
        if (!clock_) {
            throw std::invalid_argument("RateLimiter: clock cannot be null");
        }
    }

    /**
     * @brief Дождаться права на следующий вызов
     */
    void acquire() {
        std::lock_guard<std::mutex> lock(mutex_);

        if (last_) {
            auto elapsed = std::chrono::duration_cast<Duration>(clock_->now() - *last_);
            if (elapsed < minDelay_) {
                Duration wait = minDelay_ - elapsed;
                clock_->sleepFor(wait);
                totalWaited_ += wait;
            }
        }

        last_ = clock_->now();
        ++acquisitions_;
    }

    Duration minDelay() const { return minDelay_; }

    size_t acquisitions() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return acquisitions_;
    }

    Duration totalWaited() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return totalWaited_;
    }

private:
    Duration minDelay_;
    std::shared_ptr<IClock> clock_;

    mutable std::mutex mutex_;
    std::optional<IClock::TimePoint> last_;
    size_t acquisitions_ = 0;
    Duration totalWaited_{0};
};
