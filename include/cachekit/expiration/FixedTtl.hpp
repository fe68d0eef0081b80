#pragma once

#include "ITtlPolicy.hpp"
#include <cachekit/CacheError.hpp>

#include <cstdint>

/**
 * @brief Единый TTL для всех пространств имён
 *
 * @code
 *   auto expander = CacheExpander(store,
 *       std::make_shared<FixedTtl>(std::chrono::minutes(5)));
 * @endcode
 */
class FixedTtl : public ITtlPolicy {
public:
    /**
     * @param ttl Время жизни записей
     * @throws CacheError(Config) если ttl <= 0
     */
    explicit FixedTtl(Duration ttl) : ttl_(ttl) {
        if (ttl <= Duration::zero()) {
            throw CacheError(ErrorKind::Config, "Fixed TTL must be positive");
        }
    }

    /**
     * @brief Конструктор с TTL в секундах (удобство)
     */
    explicit FixedTtl(int64_t seconds)
        : FixedTtl(std::chrono::duration_cast<Duration>(std::chrono::seconds(seconds)))
    {}

    std::optional<Duration> resolve(const std::string& ns) const override {
        (void)ns;
        return ttl_;
    }

    Duration ttl() const { return ttl_; }

private:
    Duration ttl_;
};
