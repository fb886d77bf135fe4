#pragma once

#include <etfdata/time/IClock.hpp>
#include <cstdint>

/**
 * @brief Один бар OHLCV
 *
 * Цена, которую не удалось распознать при нормализации, хранится как NaN.
 * Отсутствующий объём равен 0.
 */
struct PriceBar {
    IClock::TimePoint timestamp;
    double open = 0.0;
    double high = 0.0;
    double low = 0.0;
    double close = 0.0;
    int64_t volume = 0;
};
