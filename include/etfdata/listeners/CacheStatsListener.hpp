#pragma once

#include <etfdata/cache/ICacheListener.hpp>
#include <array>
#include <atomic>
#include <cstdint>

/**
 * @brief Слушатель для сбора статистики дискового кэша
 *
 * Считает попадания и промахи по каждому пространству, а также записи,
 * повреждённые записи и вытеснения.
 *
 * Использование:
 *   auto stats = std::make_shared<CacheStatsListener>();
 *   cache.addListener(stats);
 *   // ... работа с кэшем ...
 *   std::cout << "Hit rate: " << stats->hitRate() << std::endl;
 *
 * Примечание: счётчики atomic, события приходят из рабочих потоков.
 */
class CacheStatsListener : public ICacheListener {
public:
    void onHit(CacheNamespace ns, const std::string& key) override {
        (void)key;
        ++hits_[index(ns)];
    }

    void onMiss(CacheNamespace ns, const std::string& key) override {
        (void)key;
        ++misses_[index(ns)];
    }

    void onWrite(CacheNamespace ns, const std::string& key, uint64_t bytes) override {
        (void)ns; (void)key; (void)bytes;
        ++writes_;
    }

    void onCorrupt(CacheNamespace ns, const std::string& key, const std::string& reason) override {
        (void)ns; (void)key; (void)reason;
        ++corrupt_;
    }

    void onEvicted(CacheNamespace ns, const std::string& key, uint64_t bytes) override {
        (void)ns; (void)key; (void)bytes;
        ++evictions_;
    }

    // ==================== Геттеры ====================

    uint64_t hits(CacheNamespace ns) const { return hits_[index(ns)]; }
    uint64_t misses(CacheNamespace ns) const { return misses_[index(ns)]; }

    uint64_t hits() const { return hits_[0] + hits_[1] + hits_[2]; }
    uint64_t misses() const { return misses_[0] + misses_[1] + misses_[2]; }
    uint64_t writes() const { return writes_; }
    uint64_t corrupt() const { return corrupt_; }
    uint64_t evictions() const { return evictions_; }

    /**
     * @brief Доля попаданий (0.0 - 1.0), 0.0 если запросов не было
     */
    double hitRate() const {
        uint64_t total = hits() + misses();
        if (total == 0) return 0.0;
        return static_cast<double>(hits()) / static_cast<double>(total);
    }

    double hitRate(CacheNamespace ns) const {
        uint64_t total = hits(ns) + misses(ns);
        if (total == 0) return 0.0;
        return static_cast<double>(hits(ns)) / static_cast<double>(total);
    }

    void reset() {
        for (auto& h : hits_) h = 0;
        for (auto& m : misses_) m = 0;
        writes_ = 0;
        corrupt_ = 0;
        evictions_ = 0;
    }

private:
    static size_t index(CacheNamespace ns) {
        return static_cast<size_t>(ns);
    }

    std::array<std::atomic<uint64_t>, 3> hits_{};
    std::array<std::atomic<uint64_t>, 3> misses_{};
    std::atomic<uint64_t> writes_{0};
    std::atomic<uint64_t> corrupt_{0};
    std::atomic<uint64_t> evictions_{0};
};
