#pragma once

#include <etfdata/cache/CacheNamespace.hpp>
#include <cstddef>
#include <cstdint>
#include <string>

/**
 * @brief Интерфейс слушателя событий дискового кэша
 *
 * Все методы по умолчанию пустые - наследник переопределяет только нужные.
 * Вызываются из тех потоков, что работают с кэшем (в том числе из
 * рабочих потоков загрузчика).
 */
class ICacheListener {
public:
    virtual ~ICacheListener() = default;

    virtual void onHit(CacheNamespace ns, const std::string& key) { (void)ns; (void)key; }
    virtual void onMiss(CacheNamespace ns, const std::string& key) { (void)ns; (void)key; }

    /// Запись пропущена, потому что устарела (возраст >= TTL)
    virtual void onStale(CacheNamespace ns, const std::string& key) { (void)ns; (void)key; }

    virtual void onWrite(CacheNamespace ns, const std::string& key, uint64_t bytes) {
        (void)ns; (void)key; (void)bytes;
    }
    virtual void onWriteFailed(CacheNamespace ns, const std::string& key, const std::string& reason) {
        (void)ns; (void)key; (void)reason;
    }

    /// Повреждённая запись удалена, чтение засчитано как промах
    virtual void onCorrupt(CacheNamespace ns, const std::string& key, const std::string& reason) {
        (void)ns; (void)key; (void)reason;
    }

    virtual void onExpiredRemoved(CacheNamespace ns, size_t count) { (void)ns; (void)count; }

    virtual void onEvicted(CacheNamespace ns, const std::string& key, uint64_t bytes) {
        (void)ns; (void)key; (void)bytes;
    }
};
