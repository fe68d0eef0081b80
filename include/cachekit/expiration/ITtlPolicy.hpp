#pragma once

#include <cachekit/Types.hpp>

#include <optional>
#include <string>

/**
 * @brief Политика времени жизни записей, которые пишет движок
 *
 * Решает, с каким TTL записывать значение для заданного пространства
 * имён сущности. Задаётся один раз при создании CacheExpander и дальше
 * не меняется; OperationConfig::ttlOverride перекрывает её для одного
 * вызова, не изменяя саму политику.
 *
 * Порядок выбора TTL при записи:
 * 1. OperationConfig::ttlOverride, если задан
 * 2. resolve(namespace), если вернул значение
 * 3. без явного TTL — решает хранилище
 *
 * Реализации:
 * - StoreDefaultTtl — TTL выбирает хранилище (по умолчанию)
 * - InfiniteTtl — записи без срока жизни
 * - FixedTtl — одинаковый TTL для всех
 * - PerNamespaceTtl — TTL по пространству имён
 *
 * @note Реализации неизменяемы и безопасны для одновременного чтения
 *       из многих потоков.
 */
class ITtlPolicy {
public:
    virtual ~ITtlPolicy() = default;

    /**
     * @brief TTL для записи сущности из пространства имён ns
     * @return Длительность или std::nullopt ("явный TTL не задаётся")
     */
    virtual std::optional<Duration> resolve(const std::string& ns) const = 0;
};
