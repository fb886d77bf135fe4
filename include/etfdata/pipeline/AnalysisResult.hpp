#pragma once

#include <etfdata/fetch/ValueParser.hpp>
#include <etfdata/model/InfoRecord.hpp>
#include <etfdata/time/IClock.hpp>

#include <cstdio>
#include <map>
#include <optional>
#include <string>

enum class Recommendation {
    StrongBuy,
    Buy,
    Hold,
    Sell,
    StrongSell
};

inline const char* toString(Recommendation r) {
    switch (r) {
        case Recommendation::StrongBuy: return "STRONG_BUY";
        case Recommendation::Buy: return "BUY";
        case Recommendation::Hold: return "HOLD";
        case Recommendation::Sell: return "SELL";
        case Recommendation::StrongSell: return "STRONG_SELL";
    }
    return "HOLD";
}

inline std::optional<Recommendation> parseRecommendation(const std::string& raw) {
    for (auto r : {Recommendation::StrongBuy, Recommendation::Buy, Recommendation::Hold,
                   Recommendation::Sell, Recommendation::StrongSell}) {
        if (raw == toString(r)) {
            return r;
        }
    }
    return std::nullopt;
}

/**
 * @brief Результат анализа одного инструмента
 *
 * Хранится в пространстве info под ключом "<symbol>_analysis":
 * поля recommendation, score, comment и indicator.<имя>.
 */
struct AnalysisResult {
    std::string symbol;
    Recommendation recommendation = Recommendation::Hold;
    double score = 0.0;
    std::map<std::string, double> indicators;
    std::string comment;

    InfoRecord toInfoRecord(IClock::TimePoint updatedAt) const {
        InfoRecord record;
        record.symbol = symbol;
        record.updatedAt = updatedAt;
        record.fields["recommendation"] = toString(recommendation);
        record.fields["score"] = number(score);
        if (!comment.empty()) {
            record.fields["comment"] = comment;
        }
        for (const auto& [name, value] : indicators) {
            record.fields[INDICATOR_PREFIX + name] = number(value);
        }
        return record;
    }

    /**
     * @return nullopt, если запись не похожа на результат анализа
     */
    static std::optional<AnalysisResult> fromInfoRecord(const InfoRecord& record) {
        auto rawRecommendation = record.field("recommendation");
        if (!rawRecommendation) {
            return std::nullopt;
        }
        auto recommendation = parseRecommendation(*rawRecommendation);
        if (!recommendation) {
            return std::nullopt;
        }

        AnalysisResult result;
        result.symbol = record.symbol;
        result.recommendation = *recommendation;
        result.score = ValueParser::toDouble(record.fieldOr("score", "")).value_or(0.0);
        result.comment = record.fieldOr("comment", "");

        const std::string prefix = INDICATOR_PREFIX;
        for (const auto& [key, value] : record.fields) {
            if (key.compare(0, prefix.size(), prefix) != 0) {
                continue;
            }
            if (auto parsed = ValueParser::toDouble(value)) {
                result.indicators[key.substr(prefix.size())] = *parsed;
            }
        }
        return result;
    }

private:
    static constexpr const char* INDICATOR_PREFIX = "indicator.";

    static std::string number(double value) {
        char buf[64];
        std::snprintf(buf, sizeof(buf), "%.6g", value);
        return buf;
    }
};
