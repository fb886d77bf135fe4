#pragma once

#include <etfdata/cache/ICacheListener.hpp>
#include <iostream>
#include <mutex>
#include <string>

/**
 * @brief Логирование событий дискового кэша в поток
 *
 * Формат строки: "[prefix] EVENT: namespace/key ...".
 * Попадания и промахи пишутся только при verbose = true, иначе лог
 * забивается на каждом чтении.
 */
class CacheLoggingListener : public ICacheListener {
public:
    explicit CacheLoggingListener(const std::string& prefix = "DiskCache",
                                  std::ostream& os = std::cout,
                                  bool verbose = false)
        : prefix_(prefix)
        , os_(os)
        , verbose_(verbose)
    {}

    void onHit(CacheNamespace ns, const std::string& key) override {
        if (verbose_) line("HIT", ns, key, "");
    }

    void onMiss(CacheNamespace ns, const std::string& key) override {
        if (verbose_) line("MISS", ns, key, "");
    }

    void onStale(CacheNamespace ns, const std::string& key) override {
        if (verbose_) line("STALE", ns, key, "");
    }

    void onWrite(CacheNamespace ns, const std::string& key, uint64_t bytes) override {
        if (verbose_) line("WRITE", ns, key, std::to_string(bytes) + " bytes");
    }

    void onWriteFailed(CacheNamespace ns, const std::string& key, const std::string& reason) override {
        line("WRITE FAILED", ns, key, reason);
    }

    void onCorrupt(CacheNamespace ns, const std::string& key, const std::string& reason) override {
        line("CORRUPT", ns, key, reason + " (entry removed)");
    }

    void onExpiredRemoved(CacheNamespace ns, size_t count) override {
        if (count == 0) return;
        std::lock_guard<std::mutex> lock(mutex_);
        os_ << "[" << prefix_ << "] EXPIRED: " << directoryName(ns)
            << " removed " << count << " entries\n";
    }

    void onEvicted(CacheNamespace ns, const std::string& key, uint64_t bytes) override {
        line("EVICT", ns, key, std::to_string(bytes) + " bytes");
    }

private:
    void line(const char* event, CacheNamespace ns, const std::string& key,
              const std::string& details) {
        std::lock_guard<std::mutex> lock(mutex_);
        os_ << "[" << prefix_ << "] " << event << ": " << directoryName(ns) << "/" << key;
        if (!details.empty()) {
            os_ << " " << details;
        }
        os_ << "\n";
    }

    std::string prefix_;
    std::ostream& os_;
    bool verbose_;
    std::mutex mutex_;
};
