#pragma once

#include <optional>
#include <string>

/**
 * @brief Приёмник результата операции кэша
 * @tparam T Кэшируемая сущность
 *
 * Вызывающий код сообщает, какой идентификатор нужен (entityId),
 * и получает результат через feed(). Остальные методы — необязательные
 * хуки; реализации по умолчанию ничего не делают.
 *
 * Порядок вызовов движком:
 * 1. validate()
 * 2. entityId()
 * 3. при найденном значении: onHit(key) → onLoaded(entity) → feed(entity)
 *    при отсутствии: onMiss(key) → feed(std::nullopt)
 *
 * Хуки могут бросать CacheError — ошибка уйдёт вызывающему коду.
 *
 * @note Объект принадлежит вызывающему и живёт один вызов;
 *       движок его не хранит.
 */
template<typename T>
class ICacheFeed {
public:
    using Key = typename T::Key;

    virtual ~ICacheFeed() = default;

    virtual Key entityId() = 0;

    virtual void feed(std::optional<T> entity) = 0;

    /**
     * @brief Самопроверка перед операцией (например, пустой id)
     * @throws CacheError(Validation)
     */
    virtual void validate() const {}

    virtual void onHit(const std::string& key) { (void)key; }
    virtual void onMiss(const std::string& key) { (void)key; }
    virtual void onLoaded(const T& entity) { (void)entity; }
};
