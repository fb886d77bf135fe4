#pragma once

#include <etfdata/time/IClock.hpp>
#include <thread>

/**
 * @brief Реальные часы: system_clock + std::this_thread::sleep_for
 */
class SystemClock : public IClock {
public:
    TimePoint now() const override {
        return std::chrono::system_clock::now();
    }

    void sleepFor(Duration duration) override {
        if (duration.count() > 0) {
            std::this_thread::sleep_for(duration);
        }
    }
};
