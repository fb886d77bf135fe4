#pragma once

#include <etfdata/time/IClock.hpp>
#include <cstdint>
#include <optional>
#include <string>

/**
 * @brief Текущее состояние одного инструмента
 *
 * Неизменяемый снимок: следующий запрос не меняет старый объект,
 * а порождает новый.
 *
 * metadataOnly = true означает деградированный результат: бумага
 * найдена только по справочным данным, цены нулевые, имя и валюта
 * настоящие.
 */
struct InstrumentSnapshot {
    std::string symbol;             // "510300"
    std::string name;               // "沪深300ETF"
    double lastPrice = 0.0;         // Цена последней сделки
    double previousClose = 0.0;     // Цена закрытия предыдущего дня
    double changePercent = 0.0;     // Изменение за день, %
    int64_t volume = 0;             // Объём торгов
    std::optional<double> marketCap;
    std::string currency;           // "CNY"

    /// Момент, на который провайдер отдал данные
    IClock::TimePoint observedAt;

    bool metadataOnly = false;
};
