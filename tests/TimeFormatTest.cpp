#include <gtest/gtest.h>
#include <etfdata/time/ManualClock.hpp>
#include <etfdata/time/TimeFormat.hpp>

/**
 * @brief Тесты для TimeFormat и ManualClock
 *
 * Проверяем:
 * - Разбор форматов дат провайдера
 * - Отказ на мусоре и невалидных датах
 * - День недели и nextWeekdayTime
 * - Виртуальный сон ManualClock
 */

// ==================== Разбор ====================

TEST(TimeFormatTest, ParsesDateFormats) {
    auto expected = TimeFormat::makeTime(2024, 3, 5);

    EXPECT_EQ(TimeFormat::parse("2024-03-05"), expected);
    EXPECT_EQ(TimeFormat::parse("2024/03/05"), expected);
    EXPECT_EQ(TimeFormat::parse("20240305"), expected);
    EXPECT_EQ(TimeFormat::parse("  2024-03-05 "), expected);
}

TEST(TimeFormatTest, ParsesDateTime) {
    EXPECT_EQ(TimeFormat::parse("2024-03-05 14:30"), TimeFormat::makeTime(2024, 3, 5, 14, 30));
    EXPECT_EQ(TimeFormat::parse("2024-03-05T14:30:15"), TimeFormat::makeTime(2024, 3, 5, 14, 30, 15));
    EXPECT_EQ(TimeFormat::parse("2024-03-05 14:30:15.250"), TimeFormat::makeTime(2024, 3, 5, 14, 30, 15));
}

TEST(TimeFormatTest, RejectsGarbage) {
    EXPECT_FALSE(TimeFormat::parse("").has_value());
    EXPECT_FALSE(TimeFormat::parse("yesterday").has_value());
    EXPECT_FALSE(TimeFormat::parse("2024-13-01").has_value());
    EXPECT_FALSE(TimeFormat::parse("2023-02-29").has_value());
    EXPECT_FALSE(TimeFormat::parse("2024-03/05").has_value());
    EXPECT_FALSE(TimeFormat::parse("2024-03-05 25:00").has_value());
}

TEST(TimeFormatTest, LeapDay) {
    EXPECT_TRUE(TimeFormat::parse("2024-02-29").has_value());
}

TEST(TimeFormatTest, FormatRoundTrip) {
    auto tp = TimeFormat::makeTime(2024, 12, 31, 23, 59, 58);

    EXPECT_EQ(TimeFormat::formatDate(tp), "2024-12-31");
    EXPECT_EQ(TimeFormat::formatDateTime(tp), "2024-12-31 23:59:58");
}

// ==================== Дни недели ====================

TEST(TimeFormatTest, Weekday) {
    // 2024-01-01 - понедельник
    EXPECT_EQ(TimeFormat::weekday(TimeFormat::makeTime(2024, 1, 1)), 0u);
    EXPECT_EQ(TimeFormat::weekday(TimeFormat::makeTime(2024, 1, 7)), 6u);
}

TEST(TimeFormatTest, NextWeekdayLaterThisWeek) {
    // среда -> понедельник следующей недели
    auto now = TimeFormat::makeTime(2024, 1, 3, 12, 0);

    EXPECT_EQ(TimeFormat::nextWeekdayTime(now, 0, 9, 0), TimeFormat::makeTime(2024, 1, 8, 9, 0));
    EXPECT_EQ(TimeFormat::nextWeekdayTime(now, 4, 9, 0), TimeFormat::makeTime(2024, 1, 5, 9, 0));
}

TEST(TimeFormatTest, NextWeekdaySameDayMovesAWeek) {
    auto monday = TimeFormat::makeTime(2024, 1, 1, 8, 0);

    EXPECT_EQ(TimeFormat::nextWeekdayTime(monday, 0, 9, 0), TimeFormat::makeTime(2024, 1, 8, 9, 0));
}

// ==================== ManualClock ====================

TEST(TimeFormatTest, ManualClockSleepAdvancesTime) {
    ManualClock clock(TimeFormat::makeTime(2024, 1, 1));

    clock.sleepFor(std::chrono::seconds(2));
    clock.sleepFor(std::chrono::milliseconds(500));

    EXPECT_EQ(clock.now(), TimeFormat::makeTime(2024, 1, 1, 0, 0, 2) + std::chrono::milliseconds(500));
    ASSERT_EQ(clock.sleeps().size(), 2u);
    EXPECT_EQ(clock.totalSlept(), std::chrono::milliseconds(2500));

    clock.clearSleeps();
    EXPECT_TRUE(clock.sleeps().empty());
}
