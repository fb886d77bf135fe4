#pragma once

#include <etfdata/model/HistoricalSeries.hpp>
#include <etfdata/settings/CacheSettings.hpp>
#include <etfdata/settings/FetcherSettings.hpp>
#include <etfdata/time/TimeFormat.hpp>

#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <string>
#include <vector>

/**
 * @brief Общие заготовки для тестов
 */
namespace testsupport {

/// Уникальный каталог под /tmp (сам каталог не создаётся)
inline std::string uniqueDirectory(const std::string& prefix) {
    return "/tmp/" + prefix + "_" + std::to_string(std::rand()) + "_" +
           std::to_string(std::chrono::steady_clock::now().time_since_epoch().count());
}

inline CacheSettings cacheSettings(const std::string& directory) {
    CacheSettings settings;
    settings.directory = directory;
    return settings;
}

/// Без пауз между пачками и с короткой задержкой: время всё равно виртуальное
inline FetcherSettings fastFetcherSettings() {
    FetcherSettings settings;
    settings.backoffUnit = std::chrono::milliseconds(1000);
    settings.rateLimitDelay = std::chrono::milliseconds(100);
    settings.chunkPause = std::chrono::milliseconds(1000);
    return settings;
}

/// Дневные бары с 2024-01-01, close = first + i
inline HistoricalSeries makeSeries(const std::string& symbol, size_t count,
                                   double first = 1.0, const std::string& period = "60d") {
    std::vector<PriceBar> bars;
    auto start = TimeFormat::makeTime(2024, 1, 1);
    for (size_t i = 0; i < count; ++i) {
        PriceBar bar;
        bar.timestamp = start + std::chrono::hours(24 * static_cast<int64_t>(i));
        bar.close = first + static_cast<double>(i);
        bar.open = bar.close - 0.5;
        bar.high = bar.close + 1.0;
        bar.low = bar.close - 1.0;
        bar.volume = 1000 + static_cast<int64_t>(i);
        bars.push_back(bar);
    }
    return HistoricalSeries(symbol, period, std::move(bars));
}

/// Сдвинуть mtime файла в прошлое
inline void ageFile(const std::filesystem::path& path, std::chrono::seconds age) {
    std::filesystem::last_write_time(path, std::filesystem::file_time_type::clock::now() - age);
}

}  // namespace testsupport
