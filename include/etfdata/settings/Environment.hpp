#pragma once

#include <cstdlib>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

/**
 * @brief Чтение переменных окружения для классов настроек
 *
 * Отсутствующая или пустая переменная - nullopt (остаётся значение
 * по умолчанию). Нечисловое значение там, где ожидается число, -
 * std::invalid_argument с именем переменной.
 */
class Environment {
public:
    static std::optional<std::string> get(const char* name) {
        const char* val = std::getenv(name);
        if (val == nullptr || *val == '\0') {
            return std::nullopt;
        }
        return std::string(val);
    }

    static std::optional<long long> getInt(const char* name) {
        auto raw = get(name);
        if (!raw) return std::nullopt;
        try {
            size_t used = 0;
            long long value = std::stoll(*raw, &used);
            if (used != raw->size()) {
                throw std::invalid_argument("trailing characters");
            }
            return value;
        } catch (const std::exception&) {
            throw std::invalid_argument(std::string(name) + ": expected integer, got '" + *raw + "'");
        }
    }

    static std::optional<double> getDouble(const char* name) {
        auto raw = get(name);
        if (!raw) return std::nullopt;
        try {
            size_t used = 0;
            double value = std::stod(*raw, &used);
            if (used != raw->size()) {
                throw std::invalid_argument("trailing characters");
            }
            return value;
        } catch (const std::exception&) {
            throw std::invalid_argument(std::string(name) + ": expected number, got '" + *raw + "'");
        }
    }

    static std::optional<bool> getBool(const char* name) {
        auto raw = get(name);
        if (!raw) return std::nullopt;
        const std::string& v = *raw;
        if (v == "1" || v == "true" || v == "TRUE" || v == "yes" || v == "on") return true;
        if (v == "0" || v == "false" || v == "FALSE" || v == "no" || v == "off") return false;
        throw std::invalid_argument(std::string(name) + ": expected boolean, got '" + v + "'");
    }

    /**
     * @brief Список через запятую, пробелы по краям элементов отбрасываются
     */
    static std::optional<std::vector<std::string>> getList(const char* name) {
        auto raw = get(name);
        if (!raw) return std::nullopt;
        return splitList(*raw);
    }

    static std::vector<std::string> splitList(const std::string& raw) {
        std::vector<std::string> result;
        size_t start = 0;
        while (start <= raw.size()) {
            size_t comma = raw.find(',', start);
            if (comma == std::string::npos) comma = raw.size();
            std::string item = raw.substr(start, comma - start);
            size_t b = item.find_first_not_of(" \t");
            if (b != std::string::npos) {
                size_t e = item.find_last_not_of(" \t");
                result.push_back(item.substr(b, e - b + 1));
            }
            start = comma + 1;
        }
        return result;
    }
};
