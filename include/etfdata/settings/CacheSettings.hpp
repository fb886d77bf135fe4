#pragma once

#include <etfdata/cache/CacheNamespace.hpp>
#include <etfdata/settings/Environment.hpp>
#include <chrono>
#include <cstdint>
#include <stdexcept>
#include <string>

/**
 * @brief Настройки дискового кэша
 *
 * Читает из ENV (fromEnvironment):
 * - ETF_CACHE_DIR (default: data/cache)
 * - ETF_CACHE_CURRENT_TTL_HOURS (default: 24)
 * - ETF_CACHE_HISTORICAL_TTL_HOURS (default: 24)
 * - ETF_CACHE_INFO_TTL_HOURS (default: 168)
 * - ETF_CACHE_MAX_SIZE_MB (default: 100)
 */
struct CacheSettings {
    std::string directory = "data/cache";

    std::chrono::seconds currentTtl = std::chrono::hours(24);
    std::chrono::seconds historicalTtl = std::chrono::hours(24);
    std::chrono::seconds infoTtl = std::chrono::hours(168);

    /// Бюджеты отдельных пространств, 0 - без ограничения
    uint64_t currentMaxBytes = 0;
    uint64_t historicalMaxBytes = 0;
    uint64_t infoMaxBytes = 0;

    uint64_t maxTotalBytes = 100ull * 1024 * 1024;

    /// До какой доли бюджета ужимать кэш при вытеснении
    double targetFraction = 0.8;

    std::chrono::seconds ttlFor(CacheNamespace ns) const {
        switch (ns) {
            case CacheNamespace::Current: return currentTtl;
            case CacheNamespace::Historical: return historicalTtl;
            case CacheNamespace::Info: return infoTtl;
        }
        return currentTtl;
    }

    uint64_t budgetFor(CacheNamespace ns) const {
        switch (ns) {
            case CacheNamespace::Current: return currentMaxBytes;
            case CacheNamespace::Historical: return historicalMaxBytes;
            case CacheNamespace::Info: return infoMaxBytes;
        }
        return 0;
    }

    /**
     * @throws std::invalid_argument при неположительном TTL, пустом каталоге
     *         или доле вне (0, 1]
     */
    void validate() const {
        if (directory.empty()) {
            throw std::invalid_argument("Cache directory cannot be empty");
        }
        for (auto ns : allCacheNamespaces()) {
            if (ttlFor(ns).count() <= 0) {
                throw std::invalid_argument(std::string("TTL must be positive for namespace ") +
                                            directoryName(ns));
            }
        }
        if (maxTotalBytes == 0) {
            throw std::invalid_argument("Max cache size must be positive");
        }
        if (!(targetFraction > 0.0 && targetFraction <= 1.0)) {
            throw std::invalid_argument("Target fraction must be in (0, 1]");
        }
    }

    static CacheSettings fromEnvironment() {
        CacheSettings s;
        if (auto v = Environment::get("ETF_CACHE_DIR")) {
            s.directory = *v;
        }
        if (auto v = Environment::getInt("ETF_CACHE_CURRENT_TTL_HOURS")) {
            s.currentTtl = std::chrono::hours(*v);
        }
        if (auto v = Environment::getInt("ETF_CACHE_HISTORICAL_TTL_HOURS")) {
            s.historicalTtl = std::chrono::hours(*v);
        }
        if (auto v = Environment::getInt("ETF_CACHE_INFO_TTL_HOURS")) {
            s.infoTtl = std::chrono::hours(*v);
        }
        if (auto v = Environment::getInt("ETF_CACHE_MAX_SIZE_MB")) {
            if (*v <= 0) {
                throw std::invalid_argument("ETF_CACHE_MAX_SIZE_MB must be positive");
            }
            s.maxTotalBytes = static_cast<uint64_t>(*v) * 1024 * 1024;
        }
        s.validate();
        return s;
    }
};
