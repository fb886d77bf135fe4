#pragma once

#include <etfdata/pipeline/IInstrumentAnalyzer.hpp>

#include <cmath>
#include <cstdio>

/**
 * @brief Простейший анализатор для демо: пересечение средних
 *
 * score = (MA5 / MA20 - 1) * 100. Выше +2% - STRONG_BUY, выше +0.5% - BUY,
 * симметрично для продажи, иначе HOLD.
 */
class MovingAverageAnalyzer : public IInstrumentAnalyzer {
public:
    std::optional<AnalysisResult> analyze(const InstrumentSnapshot& snapshot,
                                          const HistoricalSeries& series) override {
        if (series.size() < 20) {
            return std::nullopt;
        }
        double fast = series.meanClose(5);
        double slow = series.meanClose(20);
        if (std::isnan(fast) || std::isnan(slow) || slow <= 0.0) {
            return std::nullopt;
        }

        AnalysisResult result;
        result.symbol = snapshot.symbol;
        result.score = (fast / slow - 1.0) * 100.0;
        result.indicators["ma5"] = fast;
        result.indicators["ma20"] = slow;
        result.indicators["volatility"] = series.closeStdDev(20);
        result.recommendation = classify(result.score);

        char comment[96];
        std::snprintf(comment, sizeof(comment), "MA5 %.3f vs MA20 %.3f, last %.3f",
                      fast, slow, snapshot.lastPrice);
        result.comment = comment;
        return result;
    }

private:
    static Recommendation classify(double score) {
        if (score > 2.0) return Recommendation::StrongBuy;
        if (score > 0.5) return Recommendation::Buy;
        if (score < -2.0) return Recommendation::StrongSell;
        if (score < -0.5) return Recommendation::Sell;
        return Recommendation::Hold;
    }
};
