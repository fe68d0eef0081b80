#pragma once

#include <cachekit/CacheError.hpp>

#include <cstdint>
#include <optional>
#include <vector>

/**
 * @brief Источник истины для сущностей типа T (БД, внешний API)
 * @tparam T Кэшируемая сущность
 *
 * Отсутствие записи — не ошибка: fetchById возвращает std::nullopt.
 * Недоступность источника сообщается через CacheError(Repository)
 * или CacheError(Timeout) — такие ошибки движок повторяет.
 *
 * Методы const и могут вызываться из многих потоков одновременно.
 */
template<typename T>
class IDataProvider {
public:
    using Key = typename T::Key;

    virtual ~IDataProvider() = default;

    virtual std::optional<T> fetchById(const Key& id) const = 0;

    /**
     * @brief Пакетная загрузка
     * @return Результаты в порядке ids, отсутствующие — std::nullopt
     */
    virtual std::vector<std::optional<T>> fetchByIds(const std::vector<Key>& ids) const {
        std::vector<std::optional<T>> results;
        results.reserve(ids.size());
        for (const auto& id : ids) {
            results.push_back(fetchById(id));
        }
        return results;
    }

    virtual uint64_t count() const {
        throw CacheError(ErrorKind::NotImplemented, "count not implemented");
    }

    virtual std::vector<T> fetchAll() const {
        throw CacheError(ErrorKind::NotImplemented, "fetchAll not implemented for this provider");
    }
};
