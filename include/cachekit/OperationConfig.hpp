#pragma once

#include <cachekit/Types.hpp>

#include <cstdint>
#include <optional>

/**
 * @brief Настройки одного вызова движка
 *
 * @code
 *   auto config = OperationConfig()
 *       .withTtl(std::chrono::minutes(5))
 *       .withRetry(3);
 *   service.executeWithConfig(feeder, provider, CacheStrategy::Refresh, config);
 * @endcode
 *
 * По умолчанию: TTL из политики, без повторов.
 */
struct OperationConfig {
    /// Перекрывает ITtlPolicy для записей этого вызова
    std::optional<Duration> ttlOverride;

    /// Число дополнительных попыток после первой неудачной
    uint32_t retryCount = 0;

    OperationConfig& withTtl(Duration ttl) {
        ttlOverride = ttl;
        return *this;
    }

    OperationConfig& withRetry(uint32_t count) {
        retryCount = count;
        return *this;
    }
};
