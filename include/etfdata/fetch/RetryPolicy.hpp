#pragma once

#include <etfdata/fetch/IFetchListener.hpp>
#include <etfdata/time/IClock.hpp>

#include <algorithm>
#include <functional>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <type_traits>

/**
 * @brief Повтор операции с экспоненциальной задержкой
 *
 * - Не больше maxAttempts попыток
 * - После неудачной попытки n (с нуля) пауза backoff(n), по умолчанию
 *   unit * 2^n; после последней попытки паузы нет
 * - Неудача - любая std::exception из операции
 * - Все паузы идут через IClock, поэтому тесты не ждут
 *
 * Пример:
 * @code
 *   RetryPolicy retry(3, std::chrono::seconds(1), clock);
 *   auto table = retry.run("instrument list", [&] {
 *       return provider->fetchInstrumentList();
 *   });
 *   if (!table) { ... все попытки исчерпаны ... }
 * @endcode
 */
class RetryPolicy {
public:
    using Duration = IClock::Duration;
    using BackoffFunction = std::function<Duration(size_t attempt)>;

    /**
     * @throws std::invalid_argument если maxAttempts == 0 или clock == nullptr
     */
    RetryPolicy(size_t maxAttempts, Duration unit, std::shared_ptr<IClock> clock)
        : RetryPolicy(maxAttempts, exponential(unit), std::move(clock))
    {}

    RetryPolicy(size_t maxAttempts, BackoffFunction backoff, std::shared_ptr<IClock> clock)
        : maxAttempts_(maxAttempts)
        , backoff_(std::move(backoff))
        , clock_(std::move(clock))
    {
        if (maxAttempts_ == 0) {
            throw std::invalid_argument("RetryPolicy: maxAttempts must be positive");
        }
        if (!backoff_) {
            throw std::invalid_argument("RetryPolicy: backoff function cannot be empty");
        }
        if (!clock_) {
            throw std::invalid_argument("RetryPolicy: clock cannot be null");
        }
    }

    static BackoffFunction exponential(Duration unit) {
        return [unit](size_t attempt) {
            return unit * (1LL << std::min<size_t>(attempt, 30));
        };
    }

    void setListener(std::shared_ptr<IFetchListener> listener) {
        listener_ = std::move(listener);
    }

    /**
     * @brief Выполнить операцию с повторами
     * @return Результат первой удачной попытки или nullopt
     */
    template<typename Operation>
    auto run(const std::string& name, Operation&& operation)
        -> std::optional<std::invoke_result_t<Operation&>>
    {
        std::string lastError;
        for (size_t attempt = 0; attempt < maxAttempts_; ++attempt) {
            try {
                return operation();
            } catch (const std::exception& e) {
                lastError = e.what();
            }

            if (attempt + 1 < maxAttempts_) {
                Duration delay = backoff_(attempt);
                if (listener_) {
                    listener_->onRetry(name, attempt + 1, maxAttempts_, lastError, delay);
                }
                clock_->sleepFor(delay);
            }
        }

        if (listener_) {
            listener_->onGiveUp(name, maxAttempts_, lastError);
        }
        return std::nullopt;
    }

    size_t maxAttempts() const { return maxAttempts_; }

    Duration backoffFor(size_t attempt) const { return backoff_(attempt); }

private:
    size_t maxAttempts_;
    BackoffFunction backoff_;
    std::shared_ptr<IClock> clock_;
    std::shared_ptr<IFetchListener> listener_;
};
