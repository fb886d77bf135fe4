#pragma once

#include <etfdata/pipeline/AnalysisResult.hpp>
#include <etfdata/time/IClock.hpp>

#include <map>
#include <vector>

/**
 * @brief Сводка для отчёта
 */
struct ReportSummary {
    IClock::TimePoint generatedAt;
    size_t monitored = 0;
    std::map<Recommendation, size_t> counts;
    std::vector<AnalysisResult> results;
};

/**
 * @brief Получатель отчёта (презентация вне библиотеки)
 */
class IReportSink {
public:
    virtual ~IReportSink() = default;

    virtual void publish(const ReportSummary& summary) = 0;
};
