#pragma once

#include <etfdata/fetch/ValueParser.hpp>
#include <etfdata/model/PriceBar.hpp>
#include <etfdata/provider/ProviderErrors.hpp>
#include <etfdata/provider/RawTable.hpp>
#include <etfdata/time/TimeFormat.hpp>

#include <algorithm>
#include <limits>
#include <vector>

/**
 * @brief Приведение сырых баров к каноническому виду
 *
 * - Колонки ищутся по синонимам (日期/时间/date, 开盘/open, ...)
 * - Цены приводятся к double, нераспознанные становятся NaN
 * - Объём приводится к целому, нераспознанный становится 0
 * - Строки с нераспознанной датой отбрасываются
 * - Результат отсортирован по времени, при одинаковой метке
 *   остаётся последняя строка
 *
 * @throws ProviderError если нет колонки времени или цены закрытия
 */
class BarNormalizer {
public:
    static std::vector<PriceBar> normalize(const RawTable& raw) {
        auto time = raw.findColumn({"日期", "时间", "date", "time", "datetime", "timestamp"});
        auto close = raw.findColumn({"收盘", "close", "收盘价"});
        if (!time || !close) {
            throw ProviderError("Historical bars: missing time or close column");
        }
        auto open = raw.findColumn({"开盘", "open", "开盘价"});
        auto high = raw.findColumn({"最高", "high", "最高价"});
        auto low = raw.findColumn({"最低", "low", "最低价"});
        auto volume = raw.findColumn({"成交量", "volume", "vol"});

        const double nan = std::numeric_limits<double>::quiet_NaN();

        std::vector<PriceBar> bars;
        bars.reserve(raw.rowCount());
        for (const auto& row : raw.rows()) {
            auto ts = TimeFormat::parse(row[*time]);
            if (!ts) {
                continue;
            }
            PriceBar bar;
            bar.timestamp = *ts;
            bar.close = ValueParser::toDoubleOrNaN(row[*close]);
            bar.open = open ? ValueParser::toDoubleOrNaN(row[*open]) : nan;
            bar.high = high ? ValueParser::toDoubleOrNaN(row[*high]) : nan;
            bar.low = low ? ValueParser::toDoubleOrNaN(row[*low]) : nan;
            bar.volume = volume ? ValueParser::toInt64(row[*volume]).value_or(0) : 0;
            bars.push_back(bar);
        }

        std::stable_sort(bars.begin(), bars.end(), [](const PriceBar& a, const PriceBar& b) {
            return a.timestamp < b.timestamp;
        });

        std::vector<PriceBar> result;
        result.reserve(bars.size());
        for (const auto& bar : bars) {
            if (!result.empty() && result.back().timestamp == bar.timestamp) {
                result.back() = bar;
            } else {
                result.push_back(bar);
            }
        }
        return result;
    }
};
