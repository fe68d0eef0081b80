#pragma once

#include "ITtlPolicy.hpp"

/**
 * @brief TTL не задаётся — срок жизни определяет хранилище
 *
 * Политика по умолчанию. Для InMemoryStore это означает "вечно",
 * для Redis — настройки самого сервера.
 *
 * @note Null-object: безопасная замена nullptr.
 */
class StoreDefaultTtl : public ITtlPolicy {
public:
    std::optional<Duration> resolve(const std::string& ns) const override {
        (void)ns;
        return std::nullopt;
    }
};
