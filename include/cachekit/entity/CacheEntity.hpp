#pragma once

#include <cachekit/CacheKey.hpp>
#include <cachekit/Types.hpp>
#include <cachekit/serialization/BinaryCodec.hpp>
#include <cachekit/serialization/Envelope.hpp>

#include <string>
#include <type_traits>
#include <utility>

/**
 * @brief Контракт кэшируемой сущности
 *
 * Сущность описывается прямо в своём типе, без наследования:
 * @code
 *   struct User {
 *       using Key = std::string;
 *
 *       std::string id;
 *       std::string name;
 *
 *       Key cacheKey() const { return id; }
 *       static constexpr const char* cachePrefix() { return "user"; }
 *
 *       void writeTo(BinaryWriter& w) const { w.write(id); w.write(name); }
 *       static User readFrom(BinaryReader& r) {
 *           User u;
 *           r.read(u.id);
 *           r.read(u.name);
 *           return u;
 *       }
 *
 *       // Опционально: вызывается для каждого значения, прошедшего через движок
 *       void validate() const {
 *           if (id.empty()) throw CacheError(ErrorKind::Validation, "empty id");
 *       }
 *   };
 * @endcode
 *
 * Требования:
 * - Key поддерживается KeyCodec (std::string, целые или своя специализация)
 * - тип default-constructible и копируемый
 * - cachePrefix() не содержит ':'
 *
 * Кодирование в кэш всегда идёт через конверт (encodeForCache /
 * decodeFromCache), переопределить его для отдельного типа нельзя.
 */
template<typename T, typename = void>
struct IsCacheEntity : std::false_type {};

template<typename T>
struct IsCacheEntity<T, std::void_t<
    typename T::Key,
    decltype(std::declval<const T&>().cacheKey()),
    decltype(T::cachePrefix()),
    decltype(std::declval<const T&>().writeTo(std::declval<BinaryWriter&>())),
    decltype(T::readFrom(std::declval<BinaryReader&>()))>> : std::true_type {};

template<typename T, typename = void>
struct HasEntityValidate : std::false_type {};

template<typename T>
struct HasEntityValidate<T, std::void_t<decltype(std::declval<const T&>().validate())>>
    : std::true_type {};

/**
 * @brief Полный ключ кэша для сущности
 */
template<typename T>
std::string cacheKeyOf(const T& entity) {
    static_assert(IsCacheEntity<T>::value, "T does not satisfy the cache entity contract");
    return CacheKeyBuilder::build<T>(entity.cacheKey());
}

template<typename T>
Bytes encodeForCache(const T& entity) {
    static_assert(IsCacheEntity<T>::value, "T does not satisfy the cache entity contract");
    return encodeEnvelope(entity);
}

template<typename T>
T decodeFromCache(const Bytes& bytes) {
    static_assert(IsCacheEntity<T>::value, "T does not satisfy the cache entity contract");
    return decodeEnvelope<T>(bytes);
}

/**
 * @brief Самопроверка сущности (если тип её объявил)
 */
template<typename T>
typename std::enable_if<HasEntityValidate<T>::value>::type
validateEntity(const T& entity) {
    entity.validate();
}

template<typename T>
typename std::enable_if<!HasEntityValidate<T>::value>::type
validateEntity(const T& entity) {
    (void)entity;
}
