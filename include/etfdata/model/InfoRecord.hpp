#pragma once

#include <etfdata/time/IClock.hpp>
#include <map>
#include <optional>
#include <string>

/**
 * @brief Запись пространства info
 *
 * Плоский набор строковых полей. Используется для двух видов данных:
 * - справочные данные инструмента (name, full_name, fund_type, company, ...)
 * - результаты анализа (ключ кэша "<symbol>_analysis")
 */
struct InfoRecord {
    std::string symbol;
    std::map<std::string, std::string> fields;
    IClock::TimePoint updatedAt;

    std::optional<std::string> field(const std::string& name) const {
        auto it = fields.find(name);
        if (it == fields.end()) {
            return std::nullopt;
        }
        return it->second;
    }

    std::string fieldOr(const std::string& name, const std::string& fallback) const {
        auto it = fields.find(name);
        return it == fields.end() ? fallback : it->second;
    }
};
