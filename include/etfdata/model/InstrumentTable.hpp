#pragma once

#include <etfdata/model/InstrumentSnapshot.hpp>
#include <string>
#include <unordered_map>

/**
 * @brief Нормализованный ответ "все инструменты рынка" одним вызовом
 *
 * Индекс по символу, поиск O(1).
 */
struct InstrumentTable {
    std::unordered_map<std::string, InstrumentSnapshot> rows;
    IClock::TimePoint fetchedAt;

    const InstrumentSnapshot* find(const std::string& symbol) const {
        auto it = rows.find(symbol);
        return it == rows.end() ? nullptr : &it->second;
    }

    size_t size() const { return rows.size(); }
    bool empty() const { return rows.empty(); }
};
