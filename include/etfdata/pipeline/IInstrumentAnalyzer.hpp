#pragma once

#include <etfdata/model/HistoricalSeries.hpp>
#include <etfdata/model/InstrumentSnapshot.hpp>
#include <etfdata/pipeline/AnalysisResult.hpp>
#include <optional>

/**
 * @brief Аналитика и выработка рекомендации
 *
 * Индикаторы и скоринг находятся вне библиотеки: конвейер только
 * подаёт данные и сохраняет результат.
 *
 * @return nullopt, если данных недостаточно для вывода
 */
class IInstrumentAnalyzer {
public:
    virtual ~IInstrumentAnalyzer() = default;

    virtual std::optional<AnalysisResult> analyze(const InstrumentSnapshot& snapshot,
                                                  const HistoricalSeries& series) = 0;
};
