#pragma once

#include <cmath>
#include <cstdint>
#include <cstdlib>
#include <limits>
#include <optional>
#include <string>

/**
 * @brief Приведение строковых ячеек провайдера к числам
 *
 * Пустые ячейки, "-", "nan", "None" и мусор дают nullopt.
 * Разделители тысяч (',') отбрасываются.
 */
class ValueParser {
public:
    static std::optional<double> toDouble(const std::string& raw) {
        std::string text;
        text.reserve(raw.size());
        for (char c : raw) {
            if (c != ',' && c != ' ' && c != '\t') text.push_back(c);
        }
        if (text.empty() || text == "-" || text == "--" || text == "None" ||
            text == "null" || text == "nan" || text == "NaN") {
            return std::nullopt;
        }

        char* end = nullptr;
        double value = std::strtod(text.c_str(), &end);
        if (end == text.c_str() || *end != '\0' || !std::isfinite(value)) {
            return std::nullopt;
        }
        return value;
    }

    static std::optional<int64_t> toInt64(const std::string& raw) {
        auto value = toDouble(raw);
        if (!value || *value < static_cast<double>(std::numeric_limits<int64_t>::min()) ||
            *value > static_cast<double>(std::numeric_limits<int64_t>::max())) {
            return std::nullopt;
        }
        return static_cast<int64_t>(std::llround(*value));
    }

    static double toDoubleOrNaN(const std::string& raw) {
        return toDouble(raw).value_or(std::numeric_limits<double>::quiet_NaN());
    }
};
