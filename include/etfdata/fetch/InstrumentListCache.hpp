#pragma once

#include <etfdata/model/InstrumentTable.hpp>
#include <etfdata/time/IClock.hpp>

#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <stdexcept>

/**
 * @brief Состояние кэша массового списка
 */
struct InstrumentListStatus {
    bool cached = false;
    size_t size = 0;
    std::optional<IClock::TimePoint> fetchedAt;
    std::chrono::milliseconds age{0};
    bool expired = true;
};

/**
 * @brief Кэш массового списка инструментов в памяти
 *
 * Один экземпляр на загрузчик, никакого глобального состояния.
 * Пара (таблица, время загрузки) защищена мьютексом. Загрузка идёт
 * под тем же мьютексом: потоки, пришедшие во время обновления, ждут и
 * получают её результат, а не запускают свою.
 *
 * Правила:
 * - Первое обращение загружает список
 * - Устаревший (возраст >= TTL) или инвалидированный список перезагружается
 * - Если перезагрузка не удалась, возвращается последняя удачная копия
 * - Без удачной копии возвращается пустой указатель
 */
class InstrumentListCache {
public:
    using Table = std::shared_ptr<const InstrumentTable>;

    /// Загрузчик: nullopt, если все попытки исчерпаны
    using Loader = std::function<std::optional<InstrumentTable>()>;

    struct Lookup {
        Table table;
        bool refreshed = false;   ///< В этом вызове список загружен заново
        bool stale = false;       ///< Обновление не удалось, отдана старая копия
        bool failed = false;      ///< Была попытка загрузки, и она не удалась
    };

    InstrumentListCache(std::chrono::milliseconds ttl, std::shared_ptr<IClock> clock)
        : ttl_(ttl)
        , clock_(std::move(clock))
    {
        if (!clock_) {
            throw std::invalid_argument("InstrumentListCache: clock cannot be null");
        }
        if (ttl_.count() <= 0) {
            throw std::invalid_argument("InstrumentListCache: TTL must be positive");
        }
    }

    /**
     * @brief Получить список, при необходимости загрузив его
     */
    Lookup get(const Loader& loader) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (table_ && !expiredLocked()) {
            return Lookup{table_, false, false, false};
        }
        return loadLocked(loader);
    }

    /**
     * @brief Принудительно перезагрузить список
     * @return false, если загрузка не удалась (старая копия сохраняется)
     */
    bool refresh(const Loader& loader) {
        std::lock_guard<std::mutex> lock(mutex_);
        return loadLocked(loader).refreshed;
    }

    /**
     * @brief Пометить список устаревшим, копия остаётся запасной
     */
    void invalidate() {
        std::lock_guard<std::mutex> lock(mutex_);
        invalidated_ = true;
    }

    /**
     * @brief Текущая копия без загрузки (может быть устаревшей)
     */
    Table peek() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return table_;
    }

    InstrumentListStatus status() const {
        std::lock_guard<std::mutex> lock(mutex_);
        InstrumentListStatus s;
        s.cached = static_cast<bool>(table_);
        if (table_) {
            s.size = table_->size();
            s.fetchedAt = loadedAt_;
            s.age = std::chrono::duration_cast<std::chrono::milliseconds>(clock_->now() - loadedAt_);
        }
        s.expired = !table_ || expiredLocked();
        return s;
    }

    std::chrono::milliseconds ttl() const { return ttl_; }

private:
    bool expiredLocked() const {
        return invalidated_ || clock_->now() - loadedAt_ >= ttl_;
    }

    Lookup loadLocked(const Loader& loader) {
        std::optional<InstrumentTable> loaded = loader();
        if (loaded) {
            table_ = std::make_shared<const InstrumentTable>(std::move(*loaded));
            loadedAt_ = clock_->now();
            invalidated_ = false;
            return Lookup{table_, true, false, false};
        }
        return Lookup{table_, false, static_cast<bool>(table_), true};
    }

    std::chrono::milliseconds ttl_;
    std::shared_ptr<IClock> clock_;

    mutable std::mutex mutex_;
    Table table_;
    IClock::TimePoint loadedAt_;
    bool invalidated_ = false;
};
