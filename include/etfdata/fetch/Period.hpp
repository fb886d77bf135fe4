#pragma once

#include <etfdata/provider/IMarketDataProvider.hpp>
#include <cctype>
#include <string>

/**
 * @brief Разбор периода истории: "60d", "180d", "1y"
 *
 * "<N>d" - N дней, "<N>y" - 365*N дней, всё остальное - 60 дней.
 */
class Period {
public:
    static constexpr int DEFAULT_DAYS = 60;

    static int days(const std::string& period) {
        if (period.size() < 2) {
            return DEFAULT_DAYS;
        }
        char unit = period.back();
        std::string digits = period.substr(0, period.size() - 1);
        for (char c : digits) {
            if (!std::isdigit(static_cast<unsigned char>(c))) {
                return DEFAULT_DAYS;
            }
        }
        if (digits.size() > 6) {
            return DEFAULT_DAYS;
        }
        int n = std::stoi(digits);
        if (n <= 0) {
            return DEFAULT_DAYS;
        }
        if (unit == 'd' || unit == 'D') return n;
        if (unit == 'y' || unit == 'Y') return n * 365;
        return DEFAULT_DAYS;
    }

    /**
     * @brief Диапазон дат запроса: [now - days, now]
     */
    static DateRange rangeEndingAt(IClock::TimePoint now, const std::string& period) {
        return DateRange{now - std::chrono::hours(24) * days(period), now};
    }
};
