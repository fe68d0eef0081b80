#pragma once

#include <cachekit/CacheError.hpp>
#include <cachekit/Types.hpp>

#include <optional>
#include <string>
#include <vector>

/**
 * @brief Интерфейс байтового хранилища ключ-значение
 *
 * Хранилище ничего не знает о сущностях и конвертах — только строки
 * и байты. Обязательны get/set/remove, остальное имеет реализацию
 * по умолчанию и переопределяется, если бэкенд умеет лучше
 * (MGET в Redis и т.п.).
 *
 * Потокобезопасность: любой метод может вызываться одновременно
 * из многих потоков. Синхронизация — забота реализации, движок
 * не держит блокировок вокруг вызовов хранилища.
 *
 * Ошибки бэкенда сообщаются через CacheError(Backend) или
 * CacheError(Timeout). Отсутствие ключа ошибкой не является.
 */
class ICacheStore {
public:
    virtual ~ICacheStore() = default;

    /**
     * @brief Получить байты по ключу
     * @return Байты или std::nullopt, если ключа нет (или он истёк)
     */
    virtual std::optional<Bytes> get(const std::string& key) = 0;

    /**
     * @brief Записать байты, перезаписывая старое значение
     * @param ttl Время жизни; std::nullopt — решает хранилище
     */
    virtual void set(const std::string& key, Bytes value, std::optional<Duration> ttl) = 0;

    /**
     * @brief Удалить ключ (отсутствие ключа — не ошибка)
     */
    virtual void remove(const std::string& key) = 0;

    virtual bool exists(const std::string& key) {
        return get(key).has_value();
    }

    /**
     * @brief Пакетное чтение
     * @return Вектор той же длины и в том же порядке, что keys;
     *         отсутствующие ключи — std::nullopt на своей позиции
     */
    virtual std::vector<std::optional<Bytes>> getMany(const std::vector<std::string>& keys) {
        std::vector<std::optional<Bytes>> results;
        results.reserve(keys.size());
        for (const auto& key : keys) {
            results.push_back(get(key));
        }
        return results;
    }

    virtual void removeMany(const std::vector<std::string>& keys) {
        for (const auto& key : keys) {
            remove(key);
        }
    }

    virtual bool healthCheck() {
        return true;
    }

    /**
     * @brief Удалить всё содержимое хранилища
     * @throws CacheError(NotImplemented) если бэкенд этого не умеет
     */
    virtual void clearAll() {
        throw CacheError(ErrorKind::NotImplemented, "clearAll not implemented for this store");
    }
};
