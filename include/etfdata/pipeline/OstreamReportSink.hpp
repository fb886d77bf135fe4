#pragma once

#include <etfdata/pipeline/IReportSink.hpp>
#include <etfdata/time/TimeFormat.hpp>

#include <iomanip>
#include <iostream>
#include <mutex>

/**
 * @brief Текстовый отчёт в поток
 */
class OstreamReportSink : public IReportSink {
public:
    explicit OstreamReportSink(std::ostream& os = std::cout)
        : os_(os)
    {}

    void publish(const ReportSummary& summary) override {
        std::lock_guard<std::mutex> lock(mutex_);
        os_ << "=== ETF report " << TimeFormat::formatDateTime(summary.generatedAt) << " ===\n";
        os_ << "analyzed " << summary.results.size() << " of " << summary.monitored << "\n";
        for (const auto& [recommendation, count] : summary.counts) {
            os_ << "  " << std::left << std::setw(12) << toString(recommendation)
                << count << "\n";
        }
        for (const auto& result : summary.results) {
            os_ << "  " << result.symbol << "  " << toString(result.recommendation)
                << "  score " << std::fixed << std::setprecision(2) << result.score;
            if (!result.comment.empty()) {
                os_ << "  " << result.comment;
            }
            os_ << "\n";
        }
        os_.unsetf(std::ios::floatfield);
    }

private:
    std::ostream& os_;
    std::mutex mutex_;
};
