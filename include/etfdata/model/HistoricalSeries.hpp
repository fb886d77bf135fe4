#pragma once

#include <etfdata/model/PriceBar.hpp>
#include <cmath>
#include <limits>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

/**
 * @brief История баров одного инструмента за период ("60d", "1y", ...)
 *
 * Инвариант: метки времени строго возрастают, дубликатов нет.
 * Проверяется в конструкторе, дальше серия только читается.
 *
 * Производные величины (средняя цена, стандартное отклонение)
 * считаются по запросу и нигде не хранятся.
 */
class HistoricalSeries {
public:
    /**
     * @throws std::invalid_argument если символ пуст или метки не возрастают
     */
    HistoricalSeries(std::string symbol, std::string period, std::vector<PriceBar> bars)
        : symbol_(std::move(symbol))
        , period_(std::move(period))
        , bars_(std::move(bars))
    {
        if (symbol_.empty()) {
            throw std::invalid_argument("HistoricalSeries: symbol cannot be empty");
        }
        for (size_t i = 1; i < bars_.size(); ++i) {
            if (!(bars_[i - 1].timestamp < bars_[i].timestamp)) {
                throw std::invalid_argument(
                    "HistoricalSeries: timestamps must be strictly increasing (" +
                    symbol_ + ", bar " + std::to_string(i) + ")");
            }
        }
    }

    const std::string& symbol() const { return symbol_; }
    const std::string& period() const { return period_; }
    const std::vector<PriceBar>& bars() const { return bars_; }

    size_t size() const { return bars_.size(); }
    bool empty() const { return bars_.empty(); }

    std::optional<IClock::TimePoint> startTime() const {
        if (bars_.empty()) return std::nullopt;
        return bars_.front().timestamp;
    }

    std::optional<IClock::TimePoint> endTime() const {
        if (bars_.empty()) return std::nullopt;
        return bars_.back().timestamp;
    }

    /**
     * @brief Средняя цена закрытия по последним lastN барам
     * @param lastN Без значения (или больше размера) - вся серия
     * @return NaN, если нет ни одной валидной цены
     */
    double meanClose(std::optional<size_t> lastN = std::nullopt) const {
        double sum = 0.0;
        size_t count = 0;
        for (size_t i = firstIndex(lastN); i < bars_.size(); ++i) {
            if (!std::isnan(bars_[i].close)) {
                sum += bars_[i].close;
                ++count;
            }
        }
        if (count == 0) {
            return std::numeric_limits<double>::quiet_NaN();
        }
        return sum / static_cast<double>(count);
    }

    /**
     * @brief Выборочное стандартное отклонение цены закрытия (делитель n-1)
     * @return NaN, если валидных цен меньше двух
     */
    double closeStdDev(std::optional<size_t> lastN = std::nullopt) const {
        double mean = meanClose(lastN);
        if (std::isnan(mean)) {
            return std::numeric_limits<double>::quiet_NaN();
        }
        double sq = 0.0;
        size_t count = 0;
        for (size_t i = firstIndex(lastN); i < bars_.size(); ++i) {
            if (!std::isnan(bars_[i].close)) {
                double d = bars_[i].close - mean;
                sq += d * d;
                ++count;
            }
        }
        if (count < 2) {
            return std::numeric_limits<double>::quiet_NaN();
        }
        return std::sqrt(sq / static_cast<double>(count - 1));
    }

private:
    size_t firstIndex(std::optional<size_t> lastN) const {
        if (!lastN || *lastN >= bars_.size()) {
            return 0;
        }
        return bars_.size() - *lastN;
    }

    std::string symbol_;
    std::string period_;
    std::vector<PriceBar> bars_;
};
