#pragma once

#include <etfdata/settings/Environment.hpp>
#include <chrono>
#include <stdexcept>
#include <string>

/**
 * @brief Настройки загрузчика данных
 *
 * Читает из ENV (fromEnvironment):
 * - ETF_REQUEST_TIMEOUT_SECONDS (default: 10)
 * - ETF_MAX_RETRIES (default: 3)
 * - ETF_BACKOFF_UNIT_MS (default: 1000)
 * - ETF_RATE_LIMIT_DELAY_MS (default: 100)
 * - ETF_BATCH_SIZE (default: 10)
 * - ETF_FALLBACK_CONCURRENCY (default: 3)
 * - ETF_CHUNK_PAUSE_MS (default: 1000)
 * - ETF_INSTRUMENT_LIST_TTL_MINUTES (default: 360)
 */
struct FetcherSettings {
    std::chrono::milliseconds requestTimeout = std::chrono::seconds(10);

    /// Число попыток на один сетевой шаг
    size_t maxRetries = 3;

    /// Пауза после неудачной попытки n (с нуля): backoffUnit * 2^n
    std::chrono::milliseconds backoffUnit = std::chrono::seconds(1);

    /// Минимальный интервал между любыми двумя вызовами провайдера
    std::chrono::milliseconds rateLimitDelay = std::chrono::milliseconds(100);

    /// Размер пачки в режиме поштучной загрузки
    size_t batchSize = 10;
    size_t fallbackConcurrency = 3;
    std::chrono::milliseconds chunkPause = std::chrono::seconds(1);

    size_t historicalConcurrency = 3;

    std::chrono::minutes instrumentListTtl = std::chrono::hours(6);

    std::string currency = "CNY";
    std::string defaultPeriod = "60d";

    /**
     * @throws std::invalid_argument при нулевых ретраях, размере пачки
     *         или параллельности
     */
    void validate() const {
        if (maxRetries == 0) {
            throw std::invalid_argument("maxRetries must be positive");
        }
        if (batchSize == 0) {
            throw std::invalid_argument("batchSize must be positive");
        }
        if (fallbackConcurrency == 0 || historicalConcurrency == 0) {
            throw std::invalid_argument("Worker concurrency must be positive");
        }
        if (requestTimeout.count() <= 0) {
            throw std::invalid_argument("requestTimeout must be positive");
        }
        if (instrumentListTtl.count() <= 0) {
            throw std::invalid_argument("instrumentListTtl must be positive");
        }
        if (backoffUnit.count() < 0 || rateLimitDelay.count() < 0 || chunkPause.count() < 0) {
            throw std::invalid_argument("Delays cannot be negative");
        }
    }

    static FetcherSettings fromEnvironment() {
        FetcherSettings s;
        if (auto v = Environment::getInt("ETF_REQUEST_TIMEOUT_SECONDS")) {
            s.requestTimeout = std::chrono::seconds(*v);
        }
        if (auto v = Environment::getInt("ETF_MAX_RETRIES")) {
            s.maxRetries = toCount("ETF_MAX_RETRIES", *v);
        }
        if (auto v = Environment::getInt("ETF_BACKOFF_UNIT_MS")) {
            s.backoffUnit = std::chrono::milliseconds(*v);
        }
        if (auto v = Environment::getInt("ETF_RATE_LIMIT_DELAY_MS")) {
            s.rateLimitDelay = std::chrono::milliseconds(*v);
        }
        if (auto v = Environment::getInt("ETF_BATCH_SIZE")) {
            s.batchSize = toCount("ETF_BATCH_SIZE", *v);
        }
        if (auto v = Environment::getInt("ETF_FALLBACK_CONCURRENCY")) {
            s.fallbackConcurrency = toCount("ETF_FALLBACK_CONCURRENCY", *v);
        }
        if (auto v = Environment::getInt("ETF_CHUNK_PAUSE_MS")) {
            s.chunkPause = std::chrono::milliseconds(*v);
        }
        if (auto v = Environment::getInt("ETF_INSTRUMENT_LIST_TTL_MINUTES")) {
            s.instrumentListTtl = std::chrono::minutes(*v);
        }
        s.validate();
        return s;
    }

private:
    static size_t toCount(const char* name, long long value) {
        if (value <= 0) {
            throw std::invalid_argument(std::string(name) + " must be positive");
        }
        return static_cast<size_t>(value);
    }
};
