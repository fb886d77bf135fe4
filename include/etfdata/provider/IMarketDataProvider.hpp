#pragma once

#include <etfdata/provider/RawTable.hpp>
#include <etfdata/time/IClock.hpp>
#include <chrono>
#include <string>

/**
 * @brief Диапазон дат для запроса истории
 */
struct DateRange {
    IClock::TimePoint start;
    IClock::TimePoint end;
};

/**
 * @brief Внешний источник рыночных данных
 *
 * Возможности:
 * - fetchInstrumentList() - все инструменты рынка одним вызовом
 *   (колонки: код, название, последняя цена, закрытие, изменение, объём)
 * - fetchInstrumentQuote() - то же для одного символа (одна строка)
 * - fetchHistoricalBars() - бары OHLCV символа за диапазон дат
 * - fetchInstrumentInfo() - справочные данные, колонки item/value
 *
 * Любой метод может блокировать, бросать ProviderError (или другую
 * std::exception) и менять имена колонок. Пустая таблица означает
 * "нет данных". Реализация обязана соблюдать таймаут из setRequestTimeout().
 */
class IMarketDataProvider {
public:
    virtual ~IMarketDataProvider() = default;

    virtual std::string name() const = 0;

    virtual void setRequestTimeout(std::chrono::milliseconds timeout) = 0;

    virtual RawTable fetchInstrumentList() = 0;
    virtual RawTable fetchInstrumentQuote(const std::string& symbol) = 0;
    virtual RawTable fetchHistoricalBars(const std::string& symbol, const DateRange& range) = 0;
    virtual RawTable fetchInstrumentInfo(const std::string& symbol) = 0;
};
