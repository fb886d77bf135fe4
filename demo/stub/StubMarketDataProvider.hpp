#pragma once

#include <etfdata/provider/IMarketDataProvider.hpp>
#include <etfdata/provider/ProviderErrors.hpp>
#include <etfdata/time/IClock.hpp>
#include <etfdata/time/TimeFormat.hpp>

#include <algorithm>
#include <atomic>
#include <cmath>
#include <cstdio>
#include <limits>
#include <map>
#include <memory>
#include <mutex>
#include <random>
#include <set>
#include <stdexcept>
#include <string>
#include <vector>

/**
 * @brief Заглушка провайдера биржевых данных для демо и тестов
 *
 * Имитирует поведение реального источника:
 * - Rate limiting (N запросов в минуту по часам IClock)
 * - Сетевую задержку и таймаут вызова (через IClock::sleepFor)
 * - Правдоподобные данные для захардкоженных ETF
 * - Управляемые сбои: массовый список, отдельные символы, пустые ответы
 * - Смену схемы: английские имена колонок вместо китайских
 *
 * Захардкоженные инструменты:
 * - 510300 沪深300ETF  - ~3.90
 * - 510500 中证500ETF  - ~5.80
 * - 159915 创业板ETF   - ~2.10
 * - 512880 证券ETF     - ~0.95
 * - 513100 纳指ETF     - ~1.60
 * - 588000 科创50ETF   - ~0.98
 *
 * Текущие цены случайны в диапазоне ±3% от базовой, история
 * детерминирована (зависит только от символа и даты).
 */
class StubMarketDataProvider : public IMarketDataProvider {
public:
    enum class Capability { List, Quote, History, Info };

    static constexpr size_t ALWAYS = std::numeric_limits<size_t>::max();

    /**
     * @param clock Часы для задержек и окна rate limit
     * @param requestsPerMinute Лимит запросов
     * @param latency Имитируемая задержка каждого вызова
     */
    explicit StubMarketDataProvider(std::shared_ptr<IClock> clock,
                                    int requestsPerMinute = 100,
                                    std::chrono::milliseconds latency = std::chrono::milliseconds(0))
        : clock_(std::move(clock))
        , requestsPerMinute_(requestsPerMinute)
        , latency_(latency)
        , rng_(42)
    {
        if (!clock_) {
            throw std::invalid_argument("Clock cannot be null");
        }
        minuteStart_ = clock_->now();
        initializeInstruments();
    }

    std::string name() const override { return "stub"; }

    void setRequestTimeout(std::chrono::milliseconds timeout) override {
        std::lock_guard<std::mutex> lock(mutex_);
        timeout_ = timeout;
    }

    // ==================== IMarketDataProvider ====================

    RawTable fetchInstrumentList() override {
        beginCall(Capability::List, "");

        std::lock_guard<std::mutex> lock(mutex_);
        RawTable table(quoteColumns());
        for (const auto& [symbol, instrument] : instruments_) {
            if (hiddenFromList_.count(symbol)) continue;
            table.addRow(quoteRow(instrument));
        }
        return table;
    }

    RawTable fetchInstrumentQuote(const std::string& symbol) override {
        beginCall(Capability::Quote, symbol);

        std::lock_guard<std::mutex> lock(mutex_);
        RawTable table(quoteColumns());
        auto it = instruments_.find(symbol);
        if (it != instruments_.end() && !emptyFor(Capability::Quote, symbol)) {
            table.addRow(quoteRow(it->second));
        }
        return table;
    }

    RawTable fetchHistoricalBars(const std::string& symbol, const DateRange& range) override {
        beginCall(Capability::History, symbol);

        std::lock_guard<std::mutex> lock(mutex_);
        RawTable table(englishColumns_
            ? std::vector<std::string>{"date", "open", "close", "high", "low", "volume"}
            : std::vector<std::string>{"日期", "开盘", "收盘", "最高", "最低", "成交量"});

        auto it = instruments_.find(symbol);
        if (it == instruments_.end() || emptyFor(Capability::History, symbol)) {
            return table;
        }

        auto toDay = [](IClock::TimePoint tp) {
            return std::chrono::duration_cast<std::chrono::hours>(tp.time_since_epoch()).count() / 24;
        };
        int64_t first = toDay(range.start);
        int64_t last = toDay(range.end);

        for (int64_t day = first; day <= last; ++day) {
            auto date = TimeFormat::civilFromDays(day);
            auto tp = TimeFormat::makeTime(date.year, date.month, date.day);
            if (TimeFormat::weekday(tp) >= 5) continue;  // выходные

            double close = barPrice(it->second, day);
            double open = barPrice(it->second, day - 1);
            double high = std::max(open, close) * 1.01;
            double low = std::min(open, close) * 0.99;
            int64_t volume = 1000000 + (day % 50) * 10000;

            table.addRow({TimeFormat::formatDate(tp), format(open), format(close),
                          format(high), format(low), std::to_string(volume)});
        }
        return table;
    }

    RawTable fetchInstrumentInfo(const std::string& symbol) override {
        beginCall(Capability::Info, symbol);

        std::lock_guard<std::mutex> lock(mutex_);
        RawTable table({"item", "value"});
        auto it = instruments_.find(symbol);
        if (it == instruments_.end() || emptyFor(Capability::Info, symbol)) {
            return table;
        }
        const auto& i = it->second;
        table.addRow({"基金代码", i.symbol});
        table.addRow({"基金名称", i.name});
        table.addRow({"基金全称", i.fullName});
        table.addRow({"基金类型", i.fundType});
        table.addRow({"基金公司", i.company});
        table.addRow({"基金经理", i.manager});
        table.addRow({"成立时间", i.established});
        table.addRow({"最新规模", i.scale});
        return table;
    }

    // ==================== Управление сбоями ====================

    /**
     * @brief Следующие count вызовов возможности бросят ProviderError
     * @param symbol Пустой - для любого символа
     */
    void injectFailures(Capability capability, size_t count, const std::string& symbol = "") {
        std::lock_guard<std::mutex> lock(mutex_);
        failures_[{capability, symbol}] = count;
    }

    /**
     * @brief Возможность для символа будет отвечать пустой таблицей
     */
    void respondEmpty(Capability capability, const std::string& symbol) {
        std::lock_guard<std::mutex> lock(mutex_);
        empty_.insert({capability, symbol});
    }

    /**
     * @brief Убрать символ из массового списка (поштучные вызовы работают)
     */
    void hideFromList(const std::string& symbol) {
        std::lock_guard<std::mutex> lock(mutex_);
        hiddenFromList_.insert(symbol);
    }

    /**
     * @brief Отдавать английские имена колонок (смена схемы)
     */
    void useEnglishColumns(bool value) {
        std::lock_guard<std::mutex> lock(mutex_);
        englishColumns_ = value;
    }

    void setLatency(std::chrono::milliseconds latency) {
        std::lock_guard<std::mutex> lock(mutex_);
        latency_ = latency;
    }

    // ==================== Статистика для демо ====================

    int calls(Capability capability) const { return calls_[static_cast<size_t>(capability)]; }

    int totalRequests() const {
        return calls_[0] + calls_[1] + calls_[2] + calls_[3];
    }

    int rateLimitHits() const { return rateLimitHits_; }

    void resetStats() {
        for (auto& c : calls_) c = 0;
        rateLimitHits_ = 0;
    }

    std::vector<std::string> availableSymbols() const {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<std::string> result;
        for (const auto& [symbol, _] : instruments_) {
            result.push_back(symbol);
        }
        return result;
    }

private:
    struct StubInstrument {
        std::string symbol;
        std::string name;
        std::string fullName;
        std::string fundType;
        std::string company;
        std::string manager;
        std::string established;
        std::string scale;
        double basePrice;
    };

    using FailureKey = std::pair<Capability, std::string>;

    std::shared_ptr<IClock> clock_;
    int requestsPerMinute_;
    std::chrono::milliseconds latency_;
    std::chrono::milliseconds timeout_{std::chrono::seconds(10)};
    std::mt19937 rng_;

    mutable std::mutex mutex_;

    // Rate limiting
    IClock::TimePoint minuteStart_;
    int requestsInCurrentMinute_ = 0;

    // Статистика
    std::atomic<int> calls_[4] = {{0}, {0}, {0}, {0}};
    std::atomic<int> rateLimitHits_{0};

    std::map<std::string, StubInstrument> instruments_;
    std::map<FailureKey, size_t> failures_;
    std::set<FailureKey> empty_;
    std::set<std::string> hiddenFromList_;
    bool englishColumns_ = false;

    void initializeInstruments() {
        add({"510300", "沪深300ETF", "华泰柏瑞沪深300交易型开放式指数证券投资基金",
             "股票型", "华泰柏瑞基金", "柳军", "2012-05-04", "1700亿", 3.90});
        add({"510500", "中证500ETF", "南方中证500交易型开放式指数证券投资基金",
             "股票型", "南方基金", "罗文杰", "2013-02-06", "600亿", 5.80});
        add({"159915", "创业板ETF", "易方达创业板交易型开放式指数证券投资基金",
             "股票型", "易方达基金", "成曦", "2011-09-20", "350亿", 2.10});
        add({"512880", "证券ETF", "国泰中证全指证券公司交易型开放式指数证券投资基金",
             "股票型", "国泰基金", "艾小军", "2016-07-26", "380亿", 0.95});
        add({"513100", "纳指ETF", "国泰纳斯达克100交易型开放式指数证券投资基金",
             "QDII", "国泰基金", "梁杏", "2013-04-25", "150亿", 1.60});
        add({"588000", "科创50ETF", "华夏上证科创板50成份交易型开放式指数证券投资基金",
             "股票型", "华夏基金", "荣膺", "2020-09-28", "700亿", 0.98});
    }

    void add(StubInstrument instrument) {
        instruments_[instrument.symbol] = std::move(instrument);
    }

    /**
     * @brief Общий пролог вызова: счётчик, rate limit, задержка, сбои
     */
    void beginCall(Capability capability, const std::string& symbol) {
        ++calls_[static_cast<size_t>(capability)];

        std::chrono::milliseconds latency;
        std::chrono::milliseconds timeout;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            checkRateLimit();
            latency = latency_;
            timeout = timeout_;
        }

        if (latency > timeout) {
            clock_->sleepFor(timeout);
            throw ProviderTimeout("Request timed out after " +
                                  std::to_string(timeout.count()) + " ms");
        }
        clock_->sleepFor(latency);

        std::lock_guard<std::mutex> lock(mutex_);
        if (consumeFailure({capability, symbol}) || consumeFailure({capability, ""})) {
            throw ProviderError("Injected failure" + (symbol.empty() ? "" : " for " + symbol));
        }
    }

    /**
     * @brief Сбрасывает счётчик каждую минуту, при превышении бросает исключение
     * @note Вызывать под lock!
     */
    void checkRateLimit() {
        auto now = clock_->now();
        if (now - minuteStart_ >= std::chrono::minutes(1)) {
            minuteStart_ = now;
            requestsInCurrentMinute_ = 0;
        }

        ++requestsInCurrentMinute_;

        if (requestsInCurrentMinute_ > requestsPerMinute_) {
            ++rateLimitHits_;
            throw RateLimitExceeded(
                "Rate limit exceeded: " + std::to_string(requestsPerMinute_) +
                " requests per minute");
        }
    }

    bool consumeFailure(const FailureKey& key) {
        auto it = failures_.find(key);
        if (it == failures_.end() || it->second == 0) {
            return false;
        }
        if (it->second != ALWAYS) {
            --it->second;
        }
        return true;
    }

    bool emptyFor(Capability capability, const std::string& symbol) const {
        return empty_.count({capability, symbol}) > 0;
    }

    std::vector<std::string> quoteColumns() const {
        if (englishColumns_) {
            return {"code", "name", "price", "prev_close", "change_pct", "volume", "market_cap"};
        }
        return {"代码", "名称", "最新价", "昨收", "涨跌幅", "成交量", "总市值"};
    }

    /**
     * @brief Строка котировки с ценой ±3% от базовой
     * @note Вызывать под lock!
     */
    std::vector<std::string> quoteRow(const StubInstrument& instrument) {
        std::uniform_real_distribution<double> priceDist(-0.03, 0.03);
        double price = instrument.basePrice * (1.0 + priceDist(rng_));
        double change = (price - instrument.basePrice) / instrument.basePrice * 100.0;

        std::uniform_int_distribution<int64_t> volumeDist(100000, 5000000);

        return {instrument.symbol, instrument.name, format(price), format(instrument.basePrice),
                format(change), std::to_string(volumeDist(rng_)),
                format(instrument.basePrice * 1.0e10)};
    }

    static double barPrice(const StubInstrument& instrument, int64_t day) {
        double wave = 0.05 * std::sin(static_cast<double>(day) / 7.0);
        double noise = static_cast<double>((day * 7919 + static_cast<int64_t>(instrument.basePrice * 1000)) % 100) / 5000.0;
        return instrument.basePrice * (1.0 + wave + noise - 0.01);
    }

    static std::string format(double value) {
        char buf[64];
        std::snprintf(buf, sizeof(buf), "%.4f", value);
        return buf;
    }
};
