#pragma once

#include <chrono>
#include <cstddef>
#include <string>

/**
 * @brief Интерфейс слушателя событий загрузчика
 *
 * Методы по умолчанию пустые. Вызываются в том числе из рабочих потоков
 * поштучной загрузки, реализация должна быть потокобезопасной.
 */
class IFetchListener {
public:
    virtual ~IFetchListener() = default;

    virtual void onInvalidSymbol(const std::string& symbol) { (void)symbol; }

    /// Попытка attempt (с 1) не удалась, следующая через delay
    virtual void onRetry(const std::string& operation, size_t attempt, size_t maxAttempts,
                         const std::string& error, std::chrono::milliseconds delay) {
        (void)operation; (void)attempt; (void)maxAttempts; (void)error; (void)delay;
    }

    virtual void onGiveUp(const std::string& operation, size_t attempts, const std::string& error) {
        (void)operation; (void)attempts; (void)error;
    }

    virtual void onInstrumentListRefreshed(size_t rows) { (void)rows; }

    /// Обновление списка не удалось; staleAvailable - есть старая копия
    virtual void onInstrumentListFailed(bool staleAvailable) { (void)staleAvailable; }

    /// Массовый список недоступен, включена поштучная загрузка
    virtual void onFallback(size_t symbols) { (void)symbols; }

    /// Вместо котировки вернулись только справочные данные
    virtual void onDegradedResult(const std::string& symbol) { (void)symbol; }

    virtual void onBatchCompleted(const std::string& kind, size_t requested, size_t resolved,
                                  size_t cacheHits) {
        (void)kind; (void)requested; (void)resolved; (void)cacheHits;
    }
};
