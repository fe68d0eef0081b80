#pragma once

#include <cachekit/CacheError.hpp>
#include <cachekit/CacheKey.hpp>
#include <cachekit/CacheStrategy.hpp>
#include <cachekit/OperationConfig.hpp>
#include <cachekit/Types.hpp>
#include <cachekit/entity/CacheEntity.hpp>
#include <cachekit/expiration/ITtlPolicy.hpp>
#include <cachekit/expiration/StoreDefaultTtl.hpp>
#include <cachekit/feed/GenericFeeder.hpp>
#include <cachekit/feed/ICacheFeed.hpp>
#include <cachekit/metrics/ICacheMetrics.hpp>
#include <cachekit/metrics/NoOpMetrics.hpp>
#include <cachekit/provider/IDataProvider.hpp>
#include <cachekit/store/ICacheStore.hpp>

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <thread>
#include <utility>

/**
 * @brief Движок cache-aside: стратегия, повторы, TTL, метрики
 *
 * Связывает хранилище (байты), источник данных (сущности) и приёмник
 * результата. Сам ничего не хранит между вызовами и не держит
 * блокировок: один экземпляр можно вызывать из многих потоков,
 * синхронизацию обеспечивает хранилище.
 *
 * Использование:
 * @code
 *   auto store = std::make_shared<InMemoryStore<>>();
 *   CacheExpander expander(store, std::make_shared<FixedTtl>(std::chrono::minutes(10)));
 *
 *   GenericFeeder<User> feeder("42");
 *   expander.execute(feeder, userProvider, CacheStrategy::Refresh);
 *   if (feeder.data) {
 *       std::cout << feeder.data->name << std::endl;
 *   }
 * @endcode
 *
 * Ход вызова execute:
 * 1. feeder.validate(), затем ключ "{prefix}:{id}" — один раз, без повторов
 * 2. попытки 1..retryCount+1, между ними пауза 100ms * 2^(attempt-1);
 *    повторяется любая CacheError, остальные исключения уходят сразу
 * 3. хуки приёмника и feed() — один раз, после успешной попытки
 *
 * Ошибка хранилища при записи после успешной загрузки из источника не
 * считается ошибкой операции: значение всё равно доставляется, а в метрики
 * уходит recordError. Ошибка кодирования сущности (Serialization) прерывает
 * попытку, как и любая другая CacheError.
 *
 * @note Одновременные промахи по одному ключу не объединяются: каждый
 *       поток сходит в источник и запишет своё значение, побеждает
 *       последняя запись.
 */
class CacheExpander {
public:
    /// Пауза перед второй попыткой, дальше удваивается
    static constexpr std::chrono::milliseconds kRetryBaseDelay{100};

    /// Предел удвоений паузы (100ms * 2^16 ~ 1.8 часа)
    static constexpr uint32_t kMaxBackoffShift = 16;

    /**
     * @param store Хранилище (обязательно)
     * @param ttlPolicy Политика TTL; nullptr — StoreDefaultTtl
     * @param metrics Приёмник метрик; nullptr — NoOpMetrics
     * @throws CacheError(Config) если store == nullptr
     */
    explicit CacheExpander(std::shared_ptr<ICacheStore> store,
                           std::shared_ptr<const ITtlPolicy> ttlPolicy = nullptr,
                           std::shared_ptr<ICacheMetrics> metrics = nullptr)
        : store_(std::move(store))
        , ttlPolicy_(std::move(ttlPolicy))
        , metrics_(std::move(metrics))
    {
        if (!store_) {
            throw CacheError(ErrorKind::Config, "Cache store cannot be null");
        }
        if (!ttlPolicy_) {
            ttlPolicy_ = std::make_shared<StoreDefaultTtl>();
        }
        if (!metrics_) {
            metrics_ = std::make_shared<NoOpMetrics>();
        }
    }

    /**
     * @brief Выполнить операцию и доставить результат в feeder
     *
     * Повторяется только CacheError. Прочие исключения (из источника,
     * приёмника, хранилища) не повторяются, не попадают в метрики и
     * выходят из execute как есть.
     *
     * @throws CacheError последней неудачной попытки, ошибку
     *         feeder.validate() или ключа (в метриках с ключом prefix)
     */
    template<typename T>
    void execute(ICacheFeed<T>& feeder,
                 const IDataProvider<T>& provider,
                 CacheStrategy strategy = CacheStrategy::Refresh,
                 const OperationConfig& config = OperationConfig()) const {
        static_assert(IsCacheEntity<T>::value, "T does not satisfy the cache entity contract");

        std::string key;
        try {
            feeder.validate();
            key = CacheKeyBuilder::build<T>(feeder.entityId());
        } catch (const CacheError& e) {
            metrics_->recordError(T::cachePrefix(), e.what());
            throw;
        }

        std::optional<T> result;
        Duration elapsed = Duration::zero();

        for (uint32_t attempt = 1; ; ++attempt) {
            auto start = Clock::now();
            try {
                result = executeOnce(key, provider, strategy, config);
                elapsed = Clock::now() - start;
                break;
            } catch (const CacheError& e) {
                metrics_->recordError(key, e.what());
                if (attempt > config.retryCount) {
                    throw;
                }
                std::this_thread::sleep_for(retryDelay(attempt));
            }
        }

        if (result.has_value()) {
            feeder.onHit(key);
            feeder.onLoaded(*result);
            feeder.feed(std::move(result));
            metrics_->recordHit(key, elapsed);
        } else {
            feeder.onMiss(key);
            feeder.feed(std::nullopt);
            metrics_->recordMiss(key, elapsed);
        }
    }

    /**
     * @brief Достать сущность только из кэша
     *
     * Стратегия Fresh: источник данных не используется.
     *
     * @throws CacheError(CacheMiss) если записи нет
     */
    template<typename T>
    T require(const typename T::Key& id, const OperationConfig& config = OperationConfig()) const {
        GenericFeeder<T> feeder(id);
        NullProvider<T> provider;
        execute(feeder, provider, CacheStrategy::Fresh, config);
        if (!feeder.data.has_value()) {
            throw CacheError(ErrorKind::CacheMiss, CacheKeyBuilder::build<T>(id));
        }
        return std::move(*feeder.data);
    }

    /**
     * @brief TTL для записи в пространство имён ns
     *
     * ttlOverride вызова > политика > std::nullopt (решает хранилище).
     */
    std::optional<Duration> resolveTtl(const std::string& ns, const OperationConfig& config) const {
        if (config.ttlOverride.has_value()) {
            return config.ttlOverride;
        }
        return ttlPolicy_->resolve(ns);
    }

    /**
     * @brief Пауза перед попыткой attempt + 1
     */
    static Duration retryDelay(uint32_t attempt) {
        uint32_t shift = std::min(attempt > 0 ? attempt - 1 : 0u, kMaxBackoffShift);
        return kRetryBaseDelay * (int64_t{1} << shift);
    }

    // ==================== Геттеры ====================

    const std::shared_ptr<ICacheStore>& store() const { return store_; }
    const std::shared_ptr<const ITtlPolicy>& ttlPolicy() const { return ttlPolicy_; }
    const std::shared_ptr<ICacheMetrics>& metrics() const { return metrics_; }

private:
    /// Источник без данных для операций только по кэшу
    template<typename T>
    class NullProvider : public IDataProvider<T> {
    public:
        std::optional<T> fetchById(const typename T::Key& id) const override {
            (void)id;
            return std::nullopt;
        }
    };

    // ==================== Одна попытка ====================

    template<typename T>
    std::optional<T> executeOnce(const std::string& key,
                                 const IDataProvider<T>& provider,
                                 CacheStrategy strategy,
                                 const OperationConfig& config) const {
        switch (strategy) {
            case CacheStrategy::Fresh:
                return readCached<T>(key);

            case CacheStrategy::Refresh: {
                auto cached = readCached<T>(key);
                if (cached.has_value()) {
                    return cached;
                }
                return loadAndStore(key, provider, config);
            }

            case CacheStrategy::Invalidate: {
                auto start = Clock::now();
                store_->remove(key);
                metrics_->recordDelete(key, Clock::now() - start);
                return loadAndStore(key, provider, config);
            }

            case CacheStrategy::Bypass:
                return loadAndStore(key, provider, config);
        }
        throw CacheError(ErrorKind::Other, "Unknown cache strategy");
    }

    template<typename T>
    std::optional<T> readCached(const std::string& key) const {
        auto bytes = store_->get(key);
        if (!bytes.has_value()) {
            return std::nullopt;
        }
        T value = decodeFromCache<T>(*bytes);
        validateEntity(value);
        return value;
    }

    template<typename T>
    std::optional<T> loadAndStore(const std::string& key,
                                  const IDataProvider<T>& provider,
                                  const OperationConfig& config) const {
        auto id = CacheKeyBuilder::extractId<T>(key);
        auto value = provider.fetchById(id);
        if (!value.has_value()) {
            return std::nullopt;
        }
        validateEntity(*value);
        writeThrough(key, *value, config);
        return value;
    }

    /**
     * @brief Записать значение в кэш, не прерывая операцию при ошибке хранилища
     *
     * @throws CacheError(Serialization) если сущность не кодируется
     */
    template<typename T>
    void writeThrough(const std::string& key, const T& value, const OperationConfig& config) const {
        Bytes bytes = encodeForCache(value);
        try {
            auto start = Clock::now();
            store_->set(key, std::move(bytes), resolveTtl(T::cachePrefix(), config));
            metrics_->recordSet(key, Clock::now() - start);
        } catch (const CacheError& e) {
            metrics_->recordError(key, e.what());
        }
    }

    std::shared_ptr<ICacheStore> store_;
    std::shared_ptr<const ITtlPolicy> ttlPolicy_;
    std::shared_ptr<ICacheMetrics> metrics_;
};
