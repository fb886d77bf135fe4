#pragma once

#include <etfdata/time/IClock.hpp>
#include <cstdint>
#include <cstdio>
#include <optional>
#include <string>

/**
 * @brief Разбор и форматирование календарного времени (UTC)
 *
 * Провайдеры отдают даты строками ("2024-03-15", "2024-03-15 14:30:00"),
 * в кэше время хранится как миллисекунды от эпохи.
 * Календарная арифметика без зависимости от локали и TZ процесса.
 */
class TimeFormat {
public:
    using TimePoint = IClock::TimePoint;

    struct CivilDate {
        int64_t year;
        unsigned month;
        unsigned day;
    };

    // ==================== Миллисекунды ====================

    static int64_t toMillis(TimePoint tp) {
        return std::chrono::duration_cast<std::chrono::milliseconds>(
            tp.time_since_epoch()).count();
    }

    static TimePoint fromMillis(int64_t millis) {
        return TimePoint(std::chrono::duration_cast<TimePoint::duration>(
            std::chrono::milliseconds(millis)));
    }

    // ==================== Календарь ====================

    static int64_t daysFromCivil(int64_t y, unsigned m, unsigned d) {
        y -= m <= 2 ? 1 : 0;
        const int64_t era = (y >= 0 ? y : y - 399) / 400;
        const unsigned yoe = static_cast<unsigned>(y - era * 400);
        const unsigned doy = (153 * (m > 2 ? m - 3 : m + 9) + 2) / 5 + d - 1;
        const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
        return era * 146097 + static_cast<int64_t>(doe) - 719468;
    }

    static CivilDate civilFromDays(int64_t z) {
        z += 719468;
        const int64_t era = (z >= 0 ? z : z - 146096) / 146097;
        const unsigned doe = static_cast<unsigned>(z - era * 146097);
        const unsigned yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
        const int64_t y = static_cast<int64_t>(yoe) + era * 400;
        const unsigned doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
        const unsigned mp = (5 * doy + 2) / 153;
        const unsigned d = doy - (153 * mp + 2) / 5 + 1;
        const unsigned m = mp < 10 ? mp + 3 : mp - 9;
        return CivilDate{y + (m <= 2 ? 1 : 0), m, d};
    }

    static TimePoint makeTime(int64_t year, unsigned month, unsigned day,
                              unsigned hour = 0, unsigned minute = 0, unsigned second = 0) {
        int64_t days = daysFromCivil(year, month, day);
        int64_t seconds = days * 86400 + hour * 3600 + minute * 60 + second;
        return TimePoint(std::chrono::duration_cast<TimePoint::duration>(
            std::chrono::seconds(seconds)));
    }

    /**
     * @brief День недели: 0 = понедельник, 6 = воскресенье
     */
    static unsigned weekday(TimePoint tp) {
        int64_t days = floorDays(tp);
        // 1970-01-01 был четвергом (индекс 3)
        int64_t w = (days + 3) % 7;
        return static_cast<unsigned>(w < 0 ? w + 7 : w);
    }

    /**
     * @brief Ближайший момент weekday/hour:minute строго в будущем
     * @param weekday 0 = понедельник
     *
     * Если сегодня нужный день недели, берётся тот же день через неделю.
     */
    static TimePoint nextWeekdayTime(TimePoint now, unsigned weekday, unsigned hour, unsigned minute) {
        int64_t today = floorDays(now);
        int64_t daysAhead = static_cast<int64_t>(weekday % 7) -
                            static_cast<int64_t>(TimeFormat::weekday(now));
        if (daysAhead <= 0) {
            daysAhead += 7;
        }
        CivilDate date = civilFromDays(today + daysAhead);
        return makeTime(date.year, date.month, date.day, hour, minute);
    }

    // ==================== Форматирование ====================

    static std::string formatDate(TimePoint tp) {
        CivilDate date = civilFromDays(floorDays(tp));
        char buf[32];
        std::snprintf(buf, sizeof(buf), "%04lld-%02u-%02u",
                      static_cast<long long>(date.year), date.month, date.day);
        return buf;
    }

    static std::string formatDateTime(TimePoint tp) {
        int64_t secs = floorSeconds(tp);
        int64_t days = floorDiv(secs, 86400);
        int64_t rem = secs - days * 86400;
        CivilDate date = civilFromDays(days);
        char buf[48];
        std::snprintf(buf, sizeof(buf), "%04lld-%02u-%02u %02lld:%02lld:%02lld",
                      static_cast<long long>(date.year), date.month, date.day,
                      static_cast<long long>(rem / 3600),
                      static_cast<long long>((rem % 3600) / 60),
                      static_cast<long long>(rem % 60));
        return buf;
    }

    // ==================== Разбор ====================

    /**
     * @brief Разобрать строку даты/времени
     *
     * Поддерживаемые форматы:
     * - "YYYY-MM-DD", "YYYY/MM/DD", "YYYYMMDD"
     * - "YYYY-MM-DD HH:MM", "YYYY-MM-DD HH:MM:SS" (разделитель ' ' или 'T')
     *
     * @return nullopt, если строка не распознана или дата невалидна
     */
    static std::optional<TimePoint> parse(const std::string& raw) {
        std::string text = trim(raw);
        if (text.empty()) {
            return std::nullopt;
        }

        size_t pos = 0;
        unsigned year = 0;
        unsigned month = 0;
        unsigned day = 0;

        if (text.size() >= 8 && allDigits(text, 0, 8) &&
            (text.size() == 8 || !isDigit(text[8]))) {
            year = number(text, 0, 4);
            month = number(text, 4, 2);
            day = number(text, 6, 2);
            pos = 8;
        } else {
            if (text.size() < 10 || !allDigits(text, 0, 4) || !isDateSep(text[4]) ||
                !allDigits(text, 5, 2) || text[7] != text[4] || !allDigits(text, 8, 2)) {
                return std::nullopt;
            }
            year = number(text, 0, 4);
            month = number(text, 5, 2);
            day = number(text, 8, 2);
            pos = 10;
        }

        if (month < 1 || month > 12 || day < 1 || day > daysInMonth(year, month)) {
            return std::nullopt;
        }

        unsigned hour = 0;
        unsigned minute = 0;
        unsigned second = 0;

        if (pos < text.size()) {
            if (text[pos] != ' ' && text[pos] != 'T') {
                return std::nullopt;
            }
            ++pos;
            if (pos + 5 > text.size() || !allDigits(text, pos, 2) ||
                text[pos + 2] != ':' || !allDigits(text, pos + 3, 2)) {
                return std::nullopt;
            }
            hour = number(text, pos, 2);
            minute = number(text, pos + 3, 2);
            pos += 5;

            if (pos < text.size()) {
                if (text[pos] != ':' || pos + 3 > text.size() || !allDigits(text, pos + 1, 2)) {
                    return std::nullopt;
                }
                second = number(text, pos + 1, 2);
                pos += 3;
                // дробные секунды отбрасываем
                if (pos < text.size() && text[pos] == '.') {
                    ++pos;
                    while (pos < text.size() && isDigit(text[pos])) {
                        ++pos;
                    }
                }
            }
            if (pos != text.size() || hour > 23 || minute > 59 || second > 59) {
                return std::nullopt;
            }
        }

        return makeTime(year, month, day, hour, minute, second);
    }

private:
    static int64_t floorDiv(int64_t a, int64_t b) {
        int64_t q = a / b;
        if ((a % b != 0) && ((a < 0) != (b < 0))) {
            --q;
        }
        return q;
    }

    static int64_t floorSeconds(TimePoint tp) {
        return floorDiv(toMillis(tp), 1000);
    }

    static int64_t floorDays(TimePoint tp) {
        return floorDiv(floorSeconds(tp), 86400);
    }

    static bool isDigit(char c) {
        return c >= '0' && c <= '9';
    }

    static bool isDateSep(char c) {
        return c == '-' || c == '/';
    }

    static bool allDigits(const std::string& s, size_t from, size_t count) {
        if (from + count > s.size()) {
            return false;
        }
        for (size_t i = from; i < from + count; ++i) {
            if (!isDigit(s[i])) {
                return false;
            }
        }
        return true;
    }

    static unsigned number(const std::string& s, size_t from, size_t count) {
        unsigned value = 0;
        for (size_t i = from; i < from + count; ++i) {
            value = value * 10 + static_cast<unsigned>(s[i] - '0');
        }
        return value;
    }

    static unsigned daysInMonth(unsigned year, unsigned month) {
        static const unsigned days[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
        if (month == 2) {
            bool leap = (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
            return leap ? 29 : 28;
        }
        return days[month - 1];
    }

    static std::string trim(const std::string& s) {
        size_t begin = s.find_first_not_of(" \t\r\n");
        if (begin == std::string::npos) {
            return "";
        }
        size_t end = s.find_last_not_of(" \t\r\n");
        return s.substr(begin, end - begin + 1);
    }
};
