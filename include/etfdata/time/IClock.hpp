#pragma once

#include <chrono>

/**
 * @brief Источник времени и ожидания
 *
 * Все паузы (backoff, rate limit, пауза между пачками) и все проверки
 * "пора ли" идут через этот интерфейс. В тестах подставляется
 * ManualClock, и тесты не ждут реального времени.
 */
class IClock {
public:
    using TimePoint = std::chrono::system_clock::time_point;
    using Duration = std::chrono::milliseconds;

    virtual ~IClock() = default;

    virtual TimePoint now() const = 0;

    /**
     * @brief Заблокировать вызывающий поток на заданное время
     */
    virtual void sleepFor(Duration duration) = 0;
};
