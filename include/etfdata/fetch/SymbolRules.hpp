#pragma once

#include <string>

/**
 * @brief Биржа, на которой торгуется инструмент
 */
enum class Market {
    Shanghai,   ///< SH
    Shenzhen,   ///< SZ
    Unknown
};

inline const char* marketCode(Market market) {
    switch (market) {
        case Market::Shanghai: return "SH";
        case Market::Shenzhen: return "SZ";
        case Market::Unknown: return "UNKNOWN";
    }
    return "UNKNOWN";
}

/**
 * @brief Правила для кодов инструментов
 *
 * Код - ровно 6 цифр. Биржа определяется по префиксу:
 * - SH: 510-513, 515-518, 588 (ETF); иначе ведущие 6 или 9
 * - SZ: 159, 160-169 (ETF/LOF); иначе ведущие 0, 2 или 3
 */
class SymbolRules {
public:
    static bool isValid(const std::string& symbol) {
        if (symbol.size() != 6) {
            return false;
        }
        for (char c : symbol) {
            if (c < '0' || c > '9') {
                return false;
            }
        }
        return true;
    }

    static Market marketOf(const std::string& symbol) {
        if (!isValid(symbol)) {
            return Market::Unknown;
        }

        static const char* shanghaiPrefixes[] = {
            "510", "511", "512", "513", "515", "516", "517", "518", "588"
        };
        std::string prefix = symbol.substr(0, 3);
        for (const char* p : shanghaiPrefixes) {
            if (prefix == p) return Market::Shanghai;
        }
        if (prefix == "159" || (prefix >= "160" && prefix <= "169")) {
            return Market::Shenzhen;
        }

        switch (symbol[0]) {
            case '0':
            case '2':
            case '3':
                return Market::Shenzhen;
            default:
                return Market::Shanghai;
        }
    }
};
