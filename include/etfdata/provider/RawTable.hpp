#pragma once

#include <algorithm>
#include <cctype>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

/**
 * @brief Ответ провайдера в сыром виде: имена колонок + строковые ячейки
 *
 * Это единственная форма, которую ядро ожидает от провайдера.
 * Имена колонок не считаются стабильными: поиск идёт по списку
 * синонимов без учёта регистра (ASCII).
 */
class RawTable {
public:
    RawTable() = default;

    explicit RawTable(std::vector<std::string> columns)
        : columns_(std::move(columns))
    {}

    /**
     * @throws std::invalid_argument если число ячеек не совпадает с числом колонок
     */
    void addRow(std::vector<std::string> row) {
        if (row.size() != columns_.size()) {
            throw std::invalid_argument("RawTable: row has " + std::to_string(row.size()) +
                                        " cells, expected " + std::to_string(columns_.size()));
        }
        rows_.push_back(std::move(row));
    }

    const std::vector<std::string>& columns() const { return columns_; }
    const std::vector<std::vector<std::string>>& rows() const { return rows_; }

    size_t rowCount() const { return rows_.size(); }
    bool empty() const { return rows_.empty(); }

    /**
     * @brief Индекс первой колонки, совпавшей с одним из синонимов
     */
    std::optional<size_t> findColumn(const std::vector<std::string>& aliases) const {
        for (const auto& alias : aliases) {
            for (size_t i = 0; i < columns_.size(); ++i) {
                if (equalsIgnoreCase(trim(columns_[i]), alias)) {
                    return i;
                }
            }
        }
        return std::nullopt;
    }

private:
    static std::string trim(const std::string& s) {
        size_t b = s.find_first_not_of(" \t\r\n");
        if (b == std::string::npos) return "";
        size_t e = s.find_last_not_of(" \t\r\n");
        return s.substr(b, e - b + 1);
    }

    static bool equalsIgnoreCase(const std::string& a, const std::string& b) {
        if (a.size() != b.size()) return false;
        for (size_t i = 0; i < a.size(); ++i) {
            auto ca = static_cast<unsigned char>(a[i]);
            auto cb = static_cast<unsigned char>(b[i]);
            if (std::tolower(ca) != std::tolower(cb)) return false;
        }
        return true;
    }

    std::vector<std::string> columns_;
    std::vector<std::vector<std::string>> rows_;
};
