#pragma once

#include <cachekit/CacheError.hpp>

#include <charconv>
#include <functional>
#include <optional>
#include <string>
#include <system_error>
#include <type_traits>
#include <unordered_map>
#include <vector>

/// Разделитель пространства имён и идентификатора в ключе
constexpr char kKeySeparator = ':';

/**
 * @brief Текстовое представление идентификатора сущности
 * @tparam K Тип идентификатора
 *
 * parse(toString(id)) обязан вернуть id без потерь: движок восстанавливает
 * типизированный идентификатор из составного ключа перед запросом
 * к источнику данных.
 *
 * Из коробки: std::string и целые типы. Для своих типов (UUID и т.п.)
 * достаточно добавить специализацию:
 * @code
 *   template<>
 *   struct KeyCodec<Uuid> {
 *       static std::string toString(const Uuid& id) { return id.str(); }
 *       static std::optional<Uuid> parse(const std::string& text) {
 *           return Uuid::fromString(text);
 *       }
 *   };
 * @endcode
 */
template<typename K, typename Enable = void>
struct KeyCodec;

template<>
struct KeyCodec<std::string> {
    static std::string toString(const std::string& id) { return id; }
    static std::optional<std::string> parse(const std::string& text) { return text; }
};

template<typename K>
struct KeyCodec<K, typename std::enable_if<std::is_integral<K>::value &&
                                           !std::is_same<K, bool>::value>::type> {
    static std::string toString(K id) { return std::to_string(id); }

    static std::optional<K> parse(const std::string& text) {
        K value{};
        const char* begin = text.data();
        const char* end = begin + text.size();
        auto [ptr, ec] = std::from_chars(begin, end, value);
        if (ec != std::errc() || ptr != end) {
            return std::nullopt;
        }
        return value;
    }
};

/**
 * @brief Построение и разбор ключей вида "{namespace}:{id}"
 *
 * @code
 *   CacheKeyBuilder::build<User>("42");              // "user:42"
 *   CacheKeyBuilder::buildComposite({"a", "b"});     // "a:b"
 *   CacheKeyBuilder::extractId<User>("user:a:b");    // "a:b"
 * @endcode
 */
class CacheKeyBuilder {
public:
    /**
     * @brief Ключ для сущности T с идентификатором id
     */
    template<typename T>
    static std::string build(const typename T::Key& id) {
        return buildWithPrefix(T::cachePrefix(), KeyCodec<typename T::Key>::toString(id));
    }

    static std::string buildWithPrefix(const std::string& prefix, const std::string& id) {
        return prefix + kKeySeparator + id;
    }

    static std::string buildComposite(const std::vector<std::string>& parts) {
        std::string result;
        for (size_t i = 0; i < parts.size(); ++i) {
            if (i > 0) {
                result += kKeySeparator;
            }
            result += parts[i];
        }
        return result;
    }

    /**
     * @brief Разбить ключ на все сегменты
     */
    static std::vector<std::string> parse(const std::string& key) {
        std::vector<std::string> parts;
        size_t start = 0;
        while (true) {
            size_t pos = key.find(kKeySeparator, start);
            if (pos == std::string::npos) {
                parts.push_back(key.substr(start));
                return parts;
            }
            parts.push_back(key.substr(start, pos - start));
            start = pos + 1;
        }
    }

    /**
     * @brief Восстановить идентификатор из ключа
     *
     * Идентификатор — всё после первого разделителя, поэтому
     * идентификаторы с ':' внутри переживают круг build → extractId.
     *
     * @throws CacheError(Validation) если разделителя нет или
     *         текст не разбирается в T::Key
     */
    template<typename T>
    static typename T::Key extractId(const std::string& key) {
        size_t pos = key.find(kKeySeparator);
        if (pos == std::string::npos) {
            throw CacheError(ErrorKind::Validation, "Invalid cache key format: " + key);
        }

        auto id = KeyCodec<typename T::Key>::parse(key.substr(pos + 1));
        if (!id.has_value()) {
            throw CacheError(ErrorKind::Validation, "Failed to parse ID from cache key: " + key);
        }
        return *id;
    }
};

/**
 * @brief Реестр генераторов ключей по имени типа
 *
 * Нужен там, где тип сущности известен только строкой
 * (конфигурация, админские утилиты).
 *
 * @note Заполняется при старте, не потокобезопасен на запись.
 */
class KeyRegistry {
public:
    using Generator = std::function<std::string(const std::string& id)>;

    void registerGenerator(const std::string& typeName, Generator generator) {
        if (!generator) {
            throw CacheError(ErrorKind::Config, "Key generator for '" + typeName + "' is empty");
        }
        generators_[typeName] = std::move(generator);
    }

    /**
     * @brief Зарегистрировать генератор "{prefix}:{id}" для сущности T
     */
    template<typename T>
    void registerEntity() {
        std::string prefix = T::cachePrefix();
        generators_[prefix] = [prefix](const std::string& id) {
            return CacheKeyBuilder::buildWithPrefix(prefix, id);
        };
    }

    bool contains(const std::string& typeName) const {
        return generators_.find(typeName) != generators_.end();
    }

    std::optional<std::string> generate(const std::string& typeName, const std::string& id) const {
        auto it = generators_.find(typeName);
        if (it == generators_.end()) {
            return std::nullopt;
        }
        return it->second(id);
    }

    size_t size() const { return generators_.size(); }

private:
    std::unordered_map<std::string, Generator> generators_;
};
