#pragma once

#include <etfdata/fetch/IFetchListener.hpp>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>
#include <string>

/**
 * @brief Логирование событий загрузчика в поток
 *
 * Формат строки: "[prefix] EVENT: details".
 * Запись под мьютексом: события приходят из рабочих потоков.
 */
class FetchLoggingListener : public IFetchListener {
public:
    explicit FetchLoggingListener(const std::string& prefix = "Fetcher",
                                  std::ostream& os = std::cout)
        : prefix_(prefix)
        , os_(os)
    {}

    void onInvalidSymbol(const std::string& symbol) override {
        line("INVALID", "symbol '" + symbol + "' rejected");
    }

    void onRetry(const std::string& operation, size_t attempt, size_t maxAttempts,
                 const std::string& error, std::chrono::milliseconds delay) override {
        std::ostringstream ss;
        ss << operation << " attempt " << attempt << "/" << maxAttempts
           << " failed: " << error << ", retry in " << delay.count() << " ms";
        line("RETRY", ss.str());
    }

    void onGiveUp(const std::string& operation, size_t attempts, const std::string& error) override {
        line("GIVE UP", operation + " after " + std::to_string(attempts) + " attempts: " + error);
    }

    void onInstrumentListRefreshed(size_t rows) override {
        line("LIST", "refreshed, " + std::to_string(rows) + " instruments");
    }

    void onInstrumentListFailed(bool staleAvailable) override {
        line("LIST FAILED", staleAvailable ? "using previous copy" : "no copy available");
    }

    void onFallback(size_t symbols) override {
        line("FALLBACK", "per-symbol fetch for " + std::to_string(symbols) + " symbols");
    }

    void onDegradedResult(const std::string& symbol) override {
        line("DEGRADED", symbol + " resolved from metadata only, prices pending");
    }

    void onBatchCompleted(const std::string& kind, size_t requested, size_t resolved,
                          size_t cacheHits) override {
        std::ostringstream ss;
        ss << kind << " " << resolved << "/" << requested << " resolved";
        if (kind == "historical") {
            double ratio = requested == 0 ? 0.0
                : static_cast<double>(cacheHits) / static_cast<double>(requested);
            ss << ", cache hits " << cacheHits << " (" << std::fixed << std::setprecision(1)
               << ratio * 100.0 << "%)";
        }
        line("BATCH", ss.str());
    }

private:
    void line(const char* event, const std::string& details) {
        std::lock_guard<std::mutex> lock(mutex_);
        os_ << "[" << prefix_ << "] " << event << ": " << details << "\n";
    }

    std::string prefix_;
    std::ostream& os_;
    std::mutex mutex_;
};
