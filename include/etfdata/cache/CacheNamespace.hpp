#pragma once

#include <array>

/**
 * @brief Пространства дискового кэша
 *
 * У каждого свой подкаталог, свой TTL и свой бюджет по размеру.
 */
enum class CacheNamespace {
    Current,        ///< Снимки текущих цен
    Historical,     ///< Исторические серии
    Info            ///< Справочные данные и результаты анализа
};

inline const char* directoryName(CacheNamespace ns) {
    switch (ns) {
        case CacheNamespace::Current: return "current";
        case CacheNamespace::Historical: return "historical";
        case CacheNamespace::Info: return "info";
    }
    return "unknown";
}

inline const std::array<CacheNamespace, 3>& allCacheNamespaces() {
    static const std::array<CacheNamespace, 3> all = {
        CacheNamespace::Current, CacheNamespace::Historical, CacheNamespace::Info
    };
    return all;
}
