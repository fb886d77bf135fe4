#pragma once

#include <etfdata/fetch/ValueParser.hpp>
#include <etfdata/model/InstrumentTable.hpp>
#include <etfdata/provider/ProviderErrors.hpp>
#include <etfdata/provider/RawTable.hpp>

/**
 * @brief Приведение списка котировок к InstrumentTable
 *
 * Обязательны колонки кода и последней цены, иначе ProviderError
 * (схема уехала - считаем временным сбоем). Строки без кода или
 * без распознаваемой цены пропускаются. Отсутствующие закрытие и
 * изменение дают 0, объём - 0, капитализация - пусто.
 */
class InstrumentListNormalizer {
public:
    static InstrumentTable normalize(const RawTable& raw, const std::string& currency,
                                     IClock::TimePoint fetchedAt) {
        auto code = raw.findColumn({"代码", "code", "symbol", "ticker"});
        auto last = raw.findColumn({"最新价", "price", "last", "last_price", "current_price"});
        if (!code || !last) {
            throw ProviderError("Instrument list: missing code or last price column");
        }
        auto name = raw.findColumn({"名称", "name"});
        auto prev = raw.findColumn({"昨收", "prev_close", "previous_close", "pre_close"});
        auto change = raw.findColumn({"涨跌幅", "change_pct", "change_percent", "pct_change"});
        auto volume = raw.findColumn({"成交量", "volume", "vol"});
        auto cap = raw.findColumn({"总市值", "market_cap", "marketcap"});

        InstrumentTable table;
        table.fetchedAt = fetchedAt;

        for (const auto& row : raw.rows()) {
            const std::string& symbol = row[*code];
            auto price = ValueParser::toDouble(row[*last]);
            if (symbol.empty() || !price) {
                continue;
            }

            InstrumentSnapshot s;
            s.symbol = symbol;
            s.name = name ? row[*name] : symbol;
            s.lastPrice = *price;
            s.previousClose = prev ? ValueParser::toDouble(row[*prev]).value_or(0.0) : 0.0;
            s.changePercent = change ? ValueParser::toDouble(row[*change]).value_or(0.0) : 0.0;
            s.volume = volume ? ValueParser::toInt64(row[*volume]).value_or(0) : 0;
            if (cap) {
                s.marketCap = ValueParser::toDouble(row[*cap]);
            }
            s.currency = currency;
            s.observedAt = fetchedAt;

            table.rows[symbol] = std::move(s);
        }
        return table;
    }
};
