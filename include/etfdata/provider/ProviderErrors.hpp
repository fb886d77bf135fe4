#pragma once

#include <stdexcept>
#include <string>

/**
 * @brief Временный сбой провайдера данных
 *
 * Всё, что бросает провайдер (и любая std::exception из сетевого шага),
 * считается временным сбоем и повторяется RetryPolicy.
 */
class ProviderError : public std::runtime_error {
public:
    explicit ProviderError(const std::string& message)
        : std::runtime_error(message) {}
};

/**
 * @brief Превышен лимит запросов провайдера
 */
class RateLimitExceeded : public ProviderError {
public:
    explicit RateLimitExceeded(const std::string& message)
        : ProviderError(message) {}
};

/**
 * @brief Вызов не уложился в таймаут
 */
class ProviderTimeout : public ProviderError {
public:
    explicit ProviderTimeout(const std::string& message)
        : ProviderError(message) {}
};
