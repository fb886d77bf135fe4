#pragma once

#include <etfdata/cache/DiskCache.hpp>
#include <etfdata/concurrency/WorkerPool.hpp>
#include <etfdata/fetch/BarNormalizer.hpp>
#include <etfdata/fetch/IFetchListener.hpp>
#include <etfdata/fetch/InfoNormalizer.hpp>
#include <etfdata/fetch/InstrumentListCache.hpp>
#include <etfdata/fetch/InstrumentListNormalizer.hpp>
#include <etfdata/fetch/Period.hpp>
#include <etfdata/fetch/RateLimiter.hpp>
#include <etfdata/fetch/RetryPolicy.hpp>
#include <etfdata/fetch/SymbolRules.hpp>
#include <etfdata/provider/IMarketDataProvider.hpp>
#include <etfdata/settings/FetcherSettings.hpp>
#include <etfdata/time/SystemClock.hpp>

#include <algorithm>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <stdexcept>
#include <string>
#include <vector>

/**
 * @brief Сводка загрузчика для статусных отчётов
 */
struct FetcherSummary {
    std::vector<std::string> validSymbols;
    std::vector<std::string> invalidSymbols;
    std::map<std::string, Market> markets;
    InstrumentListStatus instrumentList;
    std::string dataSource;
    size_t providerCalls = 0;
};

/**
 * @brief Загрузчик рыночных данных
 *
 * Стратегия для текущих данных:
 * - Один массовый вызов "все инструменты" на цикл обновления
 *   (кэш в памяти, TTL ~6 часов), дальше поиск строки по символу
 * - Если символа нет в списке или списка нет вообще, запрашиваются
 *   справочные данные, результат помечается metadataOnly
 * - Если массовый вызов не удался и старой копии нет, пакетный запрос
 *   переходит на поштучную загрузку: пачки по batchSize, внутри пачки
 *   не больше fallbackConcurrency параллельных вызовов, между пачками пауза
 *
 * Для истории: сначала дисковый кэш, при промахе провайдер, нормализация,
 * запись в кэш.
 *
 * Каждый сетевой шаг:
 * - проходит через общий RateLimiter (глобальный интервал, не по символу)
 * - обёрнут в RetryPolicy (maxRetries попыток, пауза unit * 2^n)
 *
 * Некорректный символ отклоняется до любого сетевого вызова.
 * Пакетные методы никогда не бросают из-за одного символа: в результате
 * только удачные символы, отсутствие значит "нет данных".
 *
 * Пример:
 * @code
 *   auto fetcher = std::make_shared<DataFetcher>(provider, cache);
 *   auto quotes = fetcher->batchGetCurrent({"510300", "159915"});
 *   auto series = fetcher->getHistorical("510300", "180d");
 * @endcode
 */
class DataFetcher {
public:
    /**
     * @throws std::invalid_argument при пустом провайдере, кэше или часах
     *         и при некорректных настройках
     */
    DataFetcher(std::shared_ptr<IMarketDataProvider> provider,
                std::shared_ptr<DiskCache> cache,
                FetcherSettings settings = FetcherSettings(),
                std::shared_ptr<IClock> clock = std::make_shared<SystemClock>())
        : provider_(std::move(provider))
        , cache_(std::move(cache))
        , settings_(std::move(settings))
        , clock_(std::move(clock))
        , listener_(std::make_shared<IFetchListener>())
        , retry_(settings_.maxRetries, settings_.backoffUnit, clock_)
        , rateLimiter_(settings_.rateLimitDelay, clock_)
        , instrumentList_(settings_.instrumentListTtl, clock_)
    {
        if (!provider_) {
            throw std::invalid_argument("Provider cannot be null");
        }
        if (!cache_) {
            throw std::invalid_argument("Cache cannot be null");
        }
        settings_.validate();
        retry_.setListener(listener_);
        provider_->setRequestTimeout(settings_.requestTimeout);
    }

    // Запрещаем копирование
    DataFetcher(const DataFetcher&) = delete;
    DataFetcher& operator=(const DataFetcher&) = delete;

    /**
     * @brief Установить слушателя (до начала работы)
     */
    void setListener(std::shared_ptr<IFetchListener> listener) {
        listener_ = listener ? std::move(listener) : std::make_shared<IFetchListener>();
        retry_.setListener(listener_);
    }

    // ==================== Текущие данные ====================

    /**
     * @brief Текущий снимок одного инструмента
     * @return nullopt для некорректного символа (без сетевых вызовов)
     *         или если данных нет ни в списке, ни в справочнике
     */
    std::optional<InstrumentSnapshot> getCurrent(const std::string& symbol) {
        if (!SymbolRules::isValid(symbol)) {
            listener_->onInvalidSymbol(symbol);
            return std::nullopt;
        }

        auto lookup = instrumentList();
        if (lookup.table) {
            if (const auto* row = lookup.table->find(symbol)) {
                return *row;
            }
        }
        return degradedSnapshot(symbol);
    }

    /**
     * @brief Текущие снимки для набора символов
     *
     * Обычно ровно один массовый вызов на любое число символов
     * (или ноль, если список ещё свежий).
     */
    std::map<std::string, InstrumentSnapshot> batchGetCurrent(const std::vector<std::string>& symbols) {
        std::map<std::string, InstrumentSnapshot> result;
        auto valid = validSymbols(symbols);
        if (valid.empty()) {
            listener_->onBatchCompleted("current", symbols.size(), 0, 0);
            return result;
        }

        auto lookup = instrumentList();
        if (!lookup.table) {
            listener_->onFallback(valid.size());
            result = fallbackGetCurrent(valid);
        } else {
            for (const auto& symbol : valid) {
                if (const auto* row = lookup.table->find(symbol)) {
                    result.emplace(symbol, *row);
                }
            }
        }

        listener_->onBatchCompleted("current", symbols.size(), result.size(), 0);
        return result;
    }

    // ==================== История ====================

    /**
     * @brief История за период: дисковый кэш, иначе провайдер
     */
    std::optional<HistoricalSeries> getHistorical(const std::string& symbol,
                                                  const std::string& period) {
        if (!SymbolRules::isValid(symbol)) {
            listener_->onInvalidSymbol(symbol);
            return std::nullopt;
        }
        if (auto cached = cache_->getSeries(symbol, period)) {
            return cached;
        }
        return fetchHistorical(symbol, period);
    }

    std::optional<HistoricalSeries> getHistorical(const std::string& symbol) {
        return getHistorical(symbol, settings_.defaultPeriod);
    }

    /**
     * @brief История для набора символов
     * @param maxConcurrency Потоков на промахи кэша; без значения - из настроек
     *
     * Сначала проверяется кэш по всем символам, к провайдеру идут только
     * промахи. Доля попаданий сообщается слушателю.
     */
    std::map<std::string, HistoricalSeries> batchGetHistorical(
            const std::vector<std::string>& symbols,
            const std::string& period,
            std::optional<size_t> maxConcurrency = std::nullopt) {
        std::map<std::string, HistoricalSeries> result;
        auto valid = validSymbols(symbols);

        std::vector<std::string> misses;
        for (const auto& symbol : valid) {
            if (auto cached = cache_->getSeries(symbol, period)) {
                result.emplace(symbol, std::move(*cached));
            } else {
                misses.push_back(symbol);
            }
        }
        size_t hits = result.size();

        std::mutex resultMutex;
        WorkerPool::forEach(misses, maxConcurrency.value_or(settings_.historicalConcurrency),
            [&](const std::string& symbol) {
                auto series = fetchHistorical(symbol, period);
                if (series) {
                    std::lock_guard<std::mutex> lock(resultMutex);
                    result.emplace(symbol, std::move(*series));
                }
            });

        listener_->onBatchCompleted("historical", valid.size(), result.size(), hits);
        return result;
    }

    // ==================== Справочные данные ====================

    /**
     * @brief Справочные данные инструмента (кэшируются в пространстве info)
     */
    std::optional<InfoRecord> getInstrumentInfo(const std::string& symbol) {
        if (!SymbolRules::isValid(symbol)) {
            listener_->onInvalidSymbol(symbol);
            return std::nullopt;
        }
        if (auto cached = cache_->getInfo(symbol)) {
            return cached;
        }

        auto record = retry_.run("info " + symbol, [&] {
            rateLimiter_.acquire();
            RawTable raw = provider_->fetchInstrumentInfo(symbol);
            return InfoNormalizer::normalize(symbol, raw, settings_.currency, clock_->now());
        });
        if (record) {
            cache_->putInfo(symbol, *record);
        }
        return record;
    }

    // ==================== Массовый список ====================

    /**
     * @brief Принудительно перезагрузить массовый список
     * @return false, если загрузка не удалась (старая копия сохраняется)
     */
    bool refreshInstrumentList() {
        bool ok = instrumentList_.refresh([this] { return loadInstrumentList(); });
        if (ok) {
            auto table = instrumentList_.peek();
            listener_->onInstrumentListRefreshed(table ? table->size() : 0);
        } else {
            listener_->onInstrumentListFailed(static_cast<bool>(instrumentList_.peek()));
        }
        return ok;
    }

    void invalidateInstrumentList() {
        instrumentList_.invalidate();
    }

    InstrumentListStatus instrumentListStatus() const {
        return instrumentList_.status();
    }

    // ==================== Сводка ====================

    FetcherSummary summary(const std::vector<std::string>& symbols) const {
        FetcherSummary s;
        for (const auto& symbol : symbols) {
            if (SymbolRules::isValid(symbol)) {
                s.validSymbols.push_back(symbol);
                s.markets[symbol] = SymbolRules::marketOf(symbol);
            } else {
                s.invalidSymbols.push_back(symbol);
            }
        }
        s.instrumentList = instrumentList_.status();
        s.dataSource = provider_->name();
        s.providerCalls = rateLimiter_.acquisitions();
        return s;
    }

    const FetcherSettings& settings() const { return settings_; }

    /// Число вызовов провайдера, прошедших через rate limiter
    size_t providerCalls() const { return rateLimiter_.acquisitions(); }

private:
    InstrumentListCache::Lookup instrumentList() {
        auto lookup = instrumentList_.get([this] { return loadInstrumentList(); });
        if (lookup.refreshed) {
            listener_->onInstrumentListRefreshed(lookup.table->size());
        }
        if (lookup.failed) {
            listener_->onInstrumentListFailed(lookup.stale);
        }
        return lookup;
    }

    std::optional<InstrumentTable> loadInstrumentList() {
        return retry_.run("instrument list", [this] {
            rateLimiter_.acquire();
            RawTable raw = provider_->fetchInstrumentList();
            if (raw.empty()) {
                throw ProviderError("Instrument list: empty response");
            }
            InstrumentTable table = InstrumentListNormalizer::normalize(
                raw, settings_.currency, clock_->now());
            if (table.empty()) {
                throw ProviderError("Instrument list: no usable rows");
            }
            return table;
        });
    }

    /**
     * @brief Поштучная загрузка пачками с ограниченной параллельностью
     */
    std::map<std::string, InstrumentSnapshot> fallbackGetCurrent(const std::vector<std::string>& symbols) {
        std::map<std::string, InstrumentSnapshot> result;
        std::mutex resultMutex;

        for (size_t start = 0; start < symbols.size(); start += settings_.batchSize) {
            size_t end = std::min(symbols.size(), start + settings_.batchSize);
            std::vector<std::string> chunk(symbols.begin() + start, symbols.begin() + end);

            WorkerPool::forEach(chunk, settings_.fallbackConcurrency,
                [&](const std::string& symbol) {
                    auto snapshot = fetchSingleCurrent(symbol);
                    if (snapshot) {
                        std::lock_guard<std::mutex> lock(resultMutex);
                        result.emplace(symbol, std::move(*snapshot));
                    }
                });

            if (end < symbols.size()) {
                clock_->sleepFor(settings_.chunkPause);
            }
        }
        return result;
    }

    /**
     * @brief Котировка одного символа в обход массового списка
     */
    std::optional<InstrumentSnapshot> fetchSingleCurrent(const std::string& symbol) {
        auto quote = retry_.run("quote " + symbol, [&] {
            rateLimiter_.acquire();
            RawTable raw = provider_->fetchInstrumentQuote(symbol);
            if (raw.empty()) {
                throw ProviderError("Quote: empty response for " + symbol);
            }
            InstrumentTable table = InstrumentListNormalizer::normalize(
                raw, settings_.currency, clock_->now());
            const auto* row = table.find(symbol);
            if (!row) {
                throw ProviderError("Quote: " + symbol + " missing from response");
            }
            return *row;
        });
        if (quote) {
            return quote;
        }
        return degradedSnapshot(symbol);
    }

    /**
     * @brief Снимок только из справочных данных: цены нулевые
     */
    std::optional<InstrumentSnapshot> degradedSnapshot(const std::string& symbol) {
        auto info = getInstrumentInfo(symbol);
        if (!info) {
            return std::nullopt;
        }

        InstrumentSnapshot snapshot;
        snapshot.symbol = symbol;
        snapshot.name = info->fieldOr("name", "Fund-" + symbol);
        snapshot.currency = info->fieldOr("currency", settings_.currency);
        snapshot.observedAt = clock_->now();
        snapshot.metadataOnly = true;

        listener_->onDegradedResult(symbol);
        return snapshot;
    }

    std::optional<HistoricalSeries> fetchHistorical(const std::string& symbol,
                                                    const std::string& period) {
        auto series = retry_.run("history " + symbol + " " + period, [&] {
            rateLimiter_.acquire();
            DateRange range = Period::rangeEndingAt(clock_->now(), period);
            RawTable raw = provider_->fetchHistoricalBars(symbol, range);
            if (raw.empty()) {
                throw ProviderError("Historical bars: empty response for " + symbol);
            }
            auto bars = BarNormalizer::normalize(raw);
            if (bars.empty()) {
                throw ProviderError("Historical bars: no usable rows for " + symbol);
            }
            return HistoricalSeries(symbol, period, std::move(bars));
        });
        if (series) {
            // Неудачная запись в кэш не мешает вернуть данные
            cache_->putSeries(*series);
        }
        return series;
    }

    /**
     * @brief Корректные символы без повторов, в исходном порядке
     */
    std::vector<std::string> validSymbols(const std::vector<std::string>& symbols) {
        std::vector<std::string> result;
        std::set<std::string> seen;
        for (const auto& symbol : symbols) {
            if (!SymbolRules::isValid(symbol)) {
                listener_->onInvalidSymbol(symbol);
                continue;
            }
            if (seen.insert(symbol).second) {
                result.push_back(symbol);
            }
        }
        return result;
    }

    std::shared_ptr<IMarketDataProvider> provider_;
    std::shared_ptr<DiskCache> cache_;
    FetcherSettings settings_;
    std::shared_ptr<IClock> clock_;
    std::shared_ptr<IFetchListener> listener_;

    RetryPolicy retry_;
    RateLimiter rateLimiter_;
    InstrumentListCache instrumentList_;
};
