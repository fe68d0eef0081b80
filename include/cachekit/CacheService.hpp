#pragma once

#include <cachekit/CacheExpander.hpp>

#include <memory>
#include <utility>

/**
 * @brief Лёгкий копируемый фасад над CacheExpander
 *
 * Копии разделяют один движок, поэтому сервис удобно раздавать
 * по значению в обработчики и потоки.
 *
 * @code
 *   CacheService cache(std::make_shared<InMemoryStore<>>());
 *
 *   GenericFeeder<User> feeder("42");
 *   cache.execute(feeder, provider);                       // Refresh
 *   cache.executeWithConfig(feeder, provider, CacheStrategy::Bypass,
 *                           OperationConfig().withRetry(2));
 *   User user = cache.require<User>("42");                 // только кэш
 * @endcode
 */
class CacheService {
public:
    /**
     * @throws CacheError(Config) если expander == nullptr
     */
    explicit CacheService(std::shared_ptr<const CacheExpander> expander)
        : expander_(std::move(expander))
    {
        if (!expander_) {
            throw CacheError(ErrorKind::Config, "Cache expander cannot be null");
        }
    }

    /**
     * @brief Создать движок на месте
     */
    explicit CacheService(std::shared_ptr<ICacheStore> store,
                          std::shared_ptr<const ITtlPolicy> ttlPolicy = nullptr,
                          std::shared_ptr<ICacheMetrics> metrics = nullptr)
        : expander_(std::make_shared<CacheExpander>(
              std::move(store), std::move(ttlPolicy), std::move(metrics)))
    {}

    template<typename T>
    void execute(ICacheFeed<T>& feeder,
                 const IDataProvider<T>& provider,
                 CacheStrategy strategy = CacheStrategy::Refresh) const {
        expander_->execute(feeder, provider, strategy);
    }

    template<typename T>
    void executeWithConfig(ICacheFeed<T>& feeder,
                           const IDataProvider<T>& provider,
                           CacheStrategy strategy,
                           const OperationConfig& config) const {
        expander_->execute(feeder, provider, strategy, config);
    }

    template<typename T>
    T require(const typename T::Key& id, const OperationConfig& config = OperationConfig()) const {
        return expander_->template require<T>(id, config);
    }

    const std::shared_ptr<const CacheExpander>& expander() const { return expander_; }

private:
    std::shared_ptr<const CacheExpander> expander_;
};
