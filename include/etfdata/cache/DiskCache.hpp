#pragma once

#include <etfdata/cache/CacheNamespace.hpp>
#include <etfdata/cache/ICacheListener.hpp>
#include <etfdata/model/HistoricalSeries.hpp>
#include <etfdata/model/InfoRecord.hpp>
#include <etfdata/model/InstrumentSnapshot.hpp>
#include <etfdata/serialization/ByteBuffer.hpp>
#include <etfdata/serialization/InfoSerializer.hpp>
#include <etfdata/serialization/SeriesSerializer.hpp>
#include <etfdata/serialization/SnapshotSerializer.hpp>
#include <etfdata/settings/CacheSettings.hpp>
#include <etfdata/time/TimeFormat.hpp>

#include <algorithm>
#include <atomic>
#include <filesystem>
#include <fstream>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

/**
 * @brief Статистика дискового кэша (чистое чтение, без побочных эффектов)
 */
struct CacheStats {
    std::string directory;
    std::map<CacheNamespace, uint64_t> bytes;
    std::map<CacheNamespace, size_t> files;
    std::map<CacheNamespace, std::chrono::seconds> ttl;
    std::map<CacheNamespace, uint64_t> budgets;
    uint64_t totalBytes = 0;
    size_t totalFiles = 0;
    uint64_t maxTotalBytes = 0;
};

/**
 * @brief Результат enforceSizeBudget()
 */
struct EvictionReport {
    /// false, если какой-то файл не удалось удалить
    bool ok = true;
    std::map<CacheNamespace, size_t> expired;
    size_t evictedFiles = 0;
    uint64_t freedBytes = 0;
    uint64_t bytesBefore = 0;
    uint64_t bytesAfter = 0;
};

/**
 * @brief Файловый кэш с тремя пространствами, TTL по mtime и бюджетом по размеру
 *
 * Раскладка на диске:
 * @code
 *   <directory>/current/<symbol>.bin
 *   <directory>/historical/<symbol>_<period>.bin
 *   <directory>/info/<symbol>.bin, <symbol>_analysis.bin
 * @endcode
 *
 * Формат файла (конверт):
 * [4 байта: magic "ETFC"][4 байта: версия][1 байт: пространство]
 * [ключ][время записи, мс][полезная нагрузка сериализатора]
 *
 * Свойства:
 * - Свежесть определяется только по mtime файла: touch или удаление
 *   файла снаружи - штатный способ инвалидации. Время в конверте
 *   информационное.
 * - Запись атомарна: временный файл + rename, читатель никогда не видит
 *   половину записи.
 * - Чтение не бросает исключений: повреждённая запись удаляется и
 *   считается промахом (данные будут загружены заново).
 * - Вытеснение - LRU по mtime: без учёта обращений, зато горячий путь
 *   чтения ничего не пишет.
 *
 * Пример:
 * @code
 *   CacheSettings settings;
 *   settings.directory = "/var/lib/etf/cache";
 *   DiskCache cache(settings);
 *
 *   cache.putSnapshot(snapshot);
 *   auto cached = cache.getSnapshot("510300");
 * @endcode
 */
class DiskCache {
public:
    static constexpr uint32_t MAGIC = 0x43465445;  // "ETFC"
    static constexpr uint32_t VERSION = 1;

    /**
     * @throws std::invalid_argument при некорректных настройках
     * @throws std::runtime_error если каталог кэша нельзя создать
     */
    explicit DiskCache(CacheSettings settings)
        : settings_(std::move(settings))
    {
        settings_.validate();
        root_ = settings_.directory;

        for (auto ns : allCacheNamespaces()) {
            auto dir = directoryFor(ns);
            std::error_code ec;
            std::filesystem::create_directories(dir, ec);
            if (ec || !std::filesystem::is_directory(dir)) {
                throw std::runtime_error("Cache directory is not usable: " + dir.string() +
                                         (ec ? " (" + ec.message() + ")" : ""));
            }
        }
    }

    // Запрещаем копирование
    DiskCache(const DiskCache&) = delete;
    DiskCache& operator=(const DiskCache&) = delete;

    // ==================== Слушатели ====================

    /**
     * @brief Добавить слушателя
     * @note Вызывать до начала работы с кэшем из нескольких потоков
     */
    void addListener(std::shared_ptr<ICacheListener> listener) {
        if (listener) {
            listeners_.push_back(std::move(listener));
        }
    }

    // ==================== Обобщённые операции ====================

    /**
     * @brief Записать значение
     * @return false, если ключ пуст или запись на диск не удалась
     */
    template<typename V>
    bool put(CacheNamespace ns, const std::string& key, const V& value,
             const ISerializer<V>& serializer) {
        if (key.empty()) {
            notify([&](ICacheListener& l) { l.onWriteFailed(ns, key, "empty key"); });
            return false;
        }

        std::vector<uint8_t> payload;
        try {
            payload = serializer.serialize(value);
        } catch (const std::exception& e) {
            notify([&](ICacheListener& l) { l.onWriteFailed(ns, key, e.what()); });
            return false;
        }

        ByteWriter out;
        out.appendUint32(MAGIC);
        out.appendUint32(VERSION);
        out.appendUint8(static_cast<uint8_t>(ns));
        out.appendString(key);
        out.appendInt64(TimeFormat::toMillis(std::chrono::system_clock::now()));
        out.appendBytes(payload);

        std::string error;
        if (!writeAtomically(pathFor(ns, key), out.data(), error)) {
            notify([&](ICacheListener& l) { l.onWriteFailed(ns, key, error); });
            return false;
        }

        uint64_t size = out.data().size();
        notify([&](ICacheListener& l) { l.onWrite(ns, key, size); });
        return true;
    }

    /**
     * @brief Прочитать значение
     * @return nullopt при отсутствии, устаревании или повреждении записи
     *
     * Возраст проверяется до чтения содержимого.
     */
    template<typename V>
    std::optional<V> get(CacheNamespace ns, const std::string& key,
                         const ISerializer<V>& serializer) {
        if (key.empty()) {
            return std::nullopt;
        }

        auto path = pathFor(ns, key);
        auto age = ageOf(path);
        if (!age) {
            notify([&](ICacheListener& l) { l.onMiss(ns, key); });
            return std::nullopt;
        }
        if (*age >= settings_.ttlFor(ns)) {
            notify([&](ICacheListener& l) {
                l.onStale(ns, key);
                l.onMiss(ns, key);
            });
            return std::nullopt;
        }

        std::vector<uint8_t> data;
        if (!readFile(path, data)) {
            // файл исчез между проверкой и чтением
            notify([&](ICacheListener& l) { l.onMiss(ns, key); });
            return std::nullopt;
        }

        try {
            ByteReader in(data);
            in.expectHeader(MAGIC, VERSION);
            if (in.readUint8() != static_cast<uint8_t>(ns)) {
                throw std::runtime_error("namespace mismatch");
            }
            std::string storedKey = in.readString();
            in.readInt64();  // время записи
            std::vector<uint8_t> payload = in.readBytes();
            if (!in.atEnd()) {
                throw std::runtime_error("trailing bytes");
            }

            if (storedKey != key) {
                // Другой ключ, совпавший после санитизации имени файла
                notify([&](ICacheListener& l) { l.onMiss(ns, key); });
                return std::nullopt;
            }

            V value = serializer.deserialize(payload);
            notify([&](ICacheListener& l) { l.onHit(ns, key); });
            return value;
        } catch (const std::exception& e) {
            std::error_code ec;
            std::filesystem::remove(path, ec);
            std::string reason = e.what();
            notify([&](ICacheListener& l) {
                l.onCorrupt(ns, key, reason);
                l.onMiss(ns, key);
            });
            return std::nullopt;
        }
    }

    // ==================== Типизированные операции ====================

    bool putSnapshot(const InstrumentSnapshot& snapshot) {
        return put(CacheNamespace::Current, snapshot.symbol, snapshot, snapshotSerializer_);
    }

    std::optional<InstrumentSnapshot> getSnapshot(const std::string& symbol) {
        return get(CacheNamespace::Current, symbol, snapshotSerializer_);
    }

    bool putSeries(const HistoricalSeries& series) {
        return put(CacheNamespace::Historical, seriesKey(series.symbol(), series.period()),
                   series, seriesSerializer_);
    }

    std::optional<HistoricalSeries> getSeries(const std::string& symbol, const std::string& period) {
        return get(CacheNamespace::Historical, seriesKey(symbol, period), seriesSerializer_);
    }

    bool putInfo(const std::string& key, const InfoRecord& record) {
        return put(CacheNamespace::Info, key, record, infoSerializer_);
    }

    std::optional<InfoRecord> getInfo(const std::string& key) {
        return get(CacheNamespace::Info, key, infoSerializer_);
    }

    static std::string seriesKey(const std::string& symbol, const std::string& period) {
        return symbol + "_" + period;
    }

    static std::string analysisKey(const std::string& symbol) {
        return symbol + "_analysis";
    }

    // ==================== Обслуживание ====================

    /**
     * @brief Есть ли свежая запись (без чтения содержимого)
     */
    bool isValid(CacheNamespace ns, const std::string& key) const {
        if (key.empty()) return false;
        auto age = ageOf(pathFor(ns, key));
        return age && *age < settings_.ttlFor(ns);
    }

    bool remove(CacheNamespace ns, const std::string& key) {
        if (key.empty()) return false;
        std::error_code ec;
        return std::filesystem::remove(pathFor(ns, key), ec);
    }

    /**
     * @brief Удалить все записи одного или всех пространств
     * @return Количество удалённых файлов
     */
    size_t clear(std::optional<CacheNamespace> only = std::nullopt) {
        std::lock_guard<std::mutex> lock(maintenanceMutex_);
        size_t removed = 0;
        for (auto ns : allCacheNamespaces()) {
            if (only && *only != ns) continue;
            for (const auto& entry : listEntries(ns)) {
                std::error_code ec;
                if (std::filesystem::remove(entry.path, ec)) {
                    ++removed;
                }
            }
        }
        return removed;
    }

    /**
     * @brief Удалить все устаревшие записи
     * @return Количество удалённых записей по пространствам
     */
    std::map<CacheNamespace, size_t> invalidateExpired() {
        std::lock_guard<std::mutex> lock(maintenanceMutex_);
        return invalidateExpiredLocked();
    }

    /**
     * @brief Удалить устаревшие записи и ужать кэш до бюджета
     * @param maxTotalBytes Бюджет; без значения - из настроек
     * @param force Ужимать до целевой доли, даже если бюджет не превышен
     *
     * Если после удаления устаревших записей общий размер больше бюджета
     * (или задан force), записи удаляются от самых старых по mtime, пока
     * размер не станет <= targetFraction * бюджет. Затем то же правило
     * применяется к пространствам, у которых задан собственный бюджет.
     */
    EvictionReport enforceSizeBudget(std::optional<uint64_t> maxTotalBytes = std::nullopt,
                                     bool force = false) {
        std::lock_guard<std::mutex> lock(maintenanceMutex_);

        EvictionReport report;
        report.expired = invalidateExpiredLocked();

        std::vector<Entry> entries;
        for (auto ns : allCacheNamespaces()) {
            auto part = listEntries(ns);
            entries.insert(entries.end(), part.begin(), part.end());
        }

        uint64_t total = sumSizes(entries);
        report.bytesBefore = total;

        uint64_t budget = maxTotalBytes.value_or(settings_.maxTotalBytes);
        if (total > budget || force) {
            evictOldest(entries, total, targetFor(budget), report);
        }

        for (auto ns : allCacheNamespaces()) {
            uint64_t nsBudget = settings_.budgetFor(ns);
            if (nsBudget == 0) continue;

            auto nsEntries = listEntries(ns);
            uint64_t nsTotal = sumSizes(nsEntries);
            if (nsTotal > nsBudget) {
                uint64_t before = nsTotal;
                evictOldest(nsEntries, nsTotal, targetFor(nsBudget), report);
                total -= std::min(total, before - nsTotal);
            }
        }

        report.bytesAfter = total;
        return report;
    }

    CacheStats stats() const {
        CacheStats result;
        result.directory = root_.string();
        result.maxTotalBytes = settings_.maxTotalBytes;

        for (auto ns : allCacheNamespaces()) {
            auto entries = listEntries(ns);
            uint64_t bytes = sumSizes(entries);
            result.bytes[ns] = bytes;
            result.files[ns] = entries.size();
            result.ttl[ns] = settings_.ttlFor(ns);
            result.budgets[ns] = settings_.budgetFor(ns);
            result.totalBytes += bytes;
            result.totalFiles += entries.size();
        }
        return result;
    }

    const CacheSettings& settings() const { return settings_; }

    std::filesystem::path directoryFor(CacheNamespace ns) const {
        return root_ / directoryName(ns);
    }

    std::filesystem::path pathFor(CacheNamespace ns, const std::string& key) const {
        return directoryFor(ns) / (sanitizeKey(key) + ".bin");
    }

    /**
     * @brief Имя файла из ключа: всё кроме [A-Za-z0-9._-] заменяется на '_'
     */
    static std::string sanitizeKey(const std::string& key) {
        std::string result = key;
        for (auto& c : result) {
            bool allowed = (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') ||
                           (c >= '0' && c <= '9') || c == '.' || c == '_' || c == '-';
            if (!allowed) c = '_';
        }
        if (result == "." || result == "..") {
            result = "_";
        }
        return result;
    }

private:
    using FileClock = std::filesystem::file_time_type::clock;

    struct Entry {
        CacheNamespace ns;
        std::filesystem::path path;
        uint64_t size;
        std::filesystem::file_time_type mtime;
    };

    std::optional<FileClock::duration> ageOf(const std::filesystem::path& path) const {
        std::error_code ec;
        auto mtime = std::filesystem::last_write_time(path, ec);
        if (ec) {
            return std::nullopt;
        }
        return FileClock::now() - mtime;
    }

    /**
     * @brief Файлы записей пространства (временные файлы не учитываются)
     */
    std::vector<Entry> listEntries(CacheNamespace ns) const {
        std::vector<Entry> result;
        std::error_code ec;
        std::filesystem::directory_iterator it(directoryFor(ns), ec);
        if (ec) {
            return result;
        }
        for (const auto& item : it) {
            std::error_code itemEc;
            if (!item.is_regular_file(itemEc) || item.path().extension() != ".bin") {
                continue;
            }
            uint64_t size = item.file_size(itemEc);
            if (itemEc) continue;
            auto mtime = item.last_write_time(itemEc);
            if (itemEc) continue;
            result.push_back(Entry{ns, item.path(), size, mtime});
        }
        return result;
    }

    std::map<CacheNamespace, size_t> invalidateExpiredLocked() {
        std::map<CacheNamespace, size_t> counts;
        auto now = FileClock::now();

        for (auto ns : allCacheNamespaces()) {
            size_t removed = 0;
            auto ttl = settings_.ttlFor(ns);
            for (const auto& entry : listEntries(ns)) {
                if (now - entry.mtime >= ttl) {
                    std::error_code ec;
                    if (std::filesystem::remove(entry.path, ec)) {
                        ++removed;
                    }
                }
            }
            removeAbandonedTemps(ns, now, ttl);
            counts[ns] = removed;
            notify([&](ICacheListener& l) { l.onExpiredRemoved(ns, removed); });
        }
        return counts;
    }

    /**
     * @brief Удалить временные файлы, брошенные упавшей записью
     */
    void removeAbandonedTemps(CacheNamespace ns, FileClock::time_point now,
                              std::chrono::seconds ttl) {
        std::error_code ec;
        std::filesystem::directory_iterator it(directoryFor(ns), ec);
        if (ec) return;
        for (const auto& item : it) {
            if (item.path().filename().string().find(".bin.tmp.") == std::string::npos) {
                continue;
            }
            std::error_code itemEc;
            auto mtime = item.last_write_time(itemEc);
            if (!itemEc && now - mtime >= ttl) {
                std::filesystem::remove(item.path(), itemEc);
            }
        }
    }

    /**
     * @brief Удалять самые старые записи, пока total > target
     */
    void evictOldest(std::vector<Entry>& entries, uint64_t& total, uint64_t target,
                     EvictionReport& report) {
        std::sort(entries.begin(), entries.end(), [](const Entry& a, const Entry& b) {
            if (a.mtime != b.mtime) return a.mtime < b.mtime;
            return a.path < b.path;
        });

        for (const auto& entry : entries) {
            if (total <= target) break;

            std::error_code ec;
            bool removed = std::filesystem::remove(entry.path, ec);
            if (ec) {
                report.ok = false;
                continue;
            }
            if (!removed) continue;

            total -= std::min(total, entry.size);
            ++report.evictedFiles;
            report.freedBytes += entry.size;

            std::string key = entry.path.stem().string();
            notify([&](ICacheListener& l) { l.onEvicted(entry.ns, key, entry.size); });
        }
    }

    uint64_t targetFor(uint64_t budget) const {
        return static_cast<uint64_t>(static_cast<double>(budget) * settings_.targetFraction);
    }

    static uint64_t sumSizes(const std::vector<Entry>& entries) {
        uint64_t total = 0;
        for (const auto& e : entries) total += e.size;
        return total;
    }

    bool writeAtomically(const std::filesystem::path& target, const std::vector<uint8_t>& data,
                         std::string& error) {
        auto temp = target;
        temp += ".tmp." + std::to_string(std::hash<std::thread::id>{}(std::this_thread::get_id())) +
                "." + std::to_string(tempCounter_++);

        {
            std::ofstream file(temp, std::ios::binary | std::ios::trunc);
            if (!file) {
                error = "failed to open temp file " + temp.string();
                return false;
            }
            file.write(reinterpret_cast<const char*>(data.data()),
                       static_cast<std::streamsize>(data.size()));
            file.flush();
            if (!file) {
                error = "failed to write temp file " + temp.string();
                file.close();
                std::error_code ec;
                std::filesystem::remove(temp, ec);
                return false;
            }
        }

        // Атомарно заменяем файл
        std::error_code ec;
        std::filesystem::rename(temp, target, ec);
        if (ec) {
            error = "rename failed: " + ec.message();
            std::error_code removeEc;
            std::filesystem::remove(temp, removeEc);
            return false;
        }
        return true;
    }

    static bool readFile(const std::filesystem::path& path, std::vector<uint8_t>& data) {
        std::ifstream file(path, std::ios::binary);
        if (!file) {
            return false;
        }
        file.seekg(0, std::ios::end);
        auto size = file.tellg();
        if (size < 0) {
            return false;
        }
        file.seekg(0, std::ios::beg);
        data.resize(static_cast<size_t>(size));
        file.read(reinterpret_cast<char*>(data.data()), size);
        return static_cast<bool>(file) || data.empty();
    }

    template<typename Action>
    void notify(Action&& action) {
        if (listeners_.empty()) return;
        for (auto& listener : listeners_) {
            action(*listener);
        }
    }

    CacheSettings settings_;
    std::filesystem::path root_;

    SnapshotSerializer snapshotSerializer_;
    SeriesSerializer seriesSerializer_;
    InfoSerializer infoSerializer_;

    std::vector<std::shared_ptr<ICacheListener>> listeners_;
    std::mutex maintenanceMutex_;
    std::atomic<uint64_t> tempCounter_{0};
};
