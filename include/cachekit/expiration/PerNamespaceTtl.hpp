#pragma once

#include "ITtlPolicy.hpp"
#include <cachekit/CacheError.hpp>

#include <functional>
#include <unordered_map>

/**
 * @brief TTL в зависимости от пространства имён сущности
 *
 * Два способа задать соответствие:
 * @code
 *   // Функцией
 *   auto policy = std::make_shared<PerNamespaceTtl>([](const std::string& ns) {
 *       if (ns == "user") return Duration(std::chrono::hours(1));
 *       if (ns == "session") return Duration(std::chrono::minutes(30));
 *       return Duration(std::chrono::minutes(10));
 *   });
 *
 *   // Таблицей с TTL для остальных
 *   auto policy = std::make_shared<PerNamespaceTtl>(
 *       PerNamespaceTtl::Table{{"user", std::chrono::hours(1)},
 *                              {"session", std::chrono::minutes(30)}},
 *       std::chrono::minutes(10));
 * @endcode
 *
 * Функция всегда возвращает длительность: resolve() никогда не отдаёт
 * std::nullopt для этой политики.
 */
class PerNamespaceTtl : public ITtlPolicy {
public:
    using Mapping = std::function<Duration(const std::string& ns)>;
    using Table = std::unordered_map<std::string, Duration>;

    /**
     * @throws CacheError(Config) если mapping пустой
     */
    explicit PerNamespaceTtl(Mapping mapping)
        : mapping_(std::move(mapping))
    {
        if (!mapping_) {
            throw CacheError(ErrorKind::Config, "Per-namespace TTL mapping cannot be empty");
        }
    }

    /**
     * @param table TTL для известных пространств имён
     * @param fallback TTL для остальных
     */
    PerNamespaceTtl(Table table, Duration fallback)
        : PerNamespaceTtl([table = std::move(table), fallback](const std::string& ns) {
              auto it = table.find(ns);
              return it != table.end() ? it->second : fallback;
          })
    {}

    std::optional<Duration> resolve(const std::string& ns) const override {
        return mapping_(ns);
    }

private:
    Mapping mapping_;
};
