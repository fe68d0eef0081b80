#pragma once

#include <cachekit/store/ICacheStore.hpp>

#include <memory>
#include <mutex>
#include <shared_mutex>

/**
 * @brief Потокобезопасный декоратор хранилища
 *
 * Для бэкендов без собственной синхронизации (однопоточный клиент,
 * простая обёртка над std::map и т.п.):
 * - healthCheck — shared lock
 * - все остальные операции — exclusive lock
 *
 * Чтения (get, exists, getMany) тоже берут exclusive lock: реализация
 * может менять состояние при чтении (ленивое удаление истёкших записей).
 *
 * @code
 *   auto store = std::make_shared<ThreadSafeStore>(
 *       std::make_unique<SingleThreadedStore>());
 * @endcode
 *
 * @note InMemoryStore синхронизирован сам, оборачивать его не нужно.
 */
class ThreadSafeStore : public ICacheStore {
public:
    /**
     * @param inner Внутреннее хранилище (ownership передаётся)
     * @throws CacheError(Config) если inner == nullptr
     */
    explicit ThreadSafeStore(std::unique_ptr<ICacheStore> inner)
        : inner_(std::move(inner))
    {
        if (!inner_) {
            throw CacheError(ErrorKind::Config, "Inner store cannot be null");
        }
    }

    std::optional<Bytes> get(const std::string& key) override {
        std::unique_lock lock(mutex_);
        return inner_->get(key);
    }

    void set(const std::string& key, Bytes value, std::optional<Duration> ttl) override {
        std::unique_lock lock(mutex_);
        inner_->set(key, std::move(value), ttl);
    }

    void remove(const std::string& key) override {
        std::unique_lock lock(mutex_);
        inner_->remove(key);
    }

    bool exists(const std::string& key) override {
        std::unique_lock lock(mutex_);
        return inner_->exists(key);
    }

    std::vector<std::optional<Bytes>> getMany(const std::vector<std::string>& keys) override {
        std::unique_lock lock(mutex_);
        return inner_->getMany(keys);
    }

    void removeMany(const std::vector<std::string>& keys) override {
        std::unique_lock lock(mutex_);
        inner_->removeMany(keys);
    }

    bool healthCheck() override {
        std::shared_lock lock(mutex_);
        return inner_->healthCheck();
    }

    void clearAll() override {
        std::unique_lock lock(mutex_);
        inner_->clearAll();
    }

private:
    std::unique_ptr<ICacheStore> inner_;
    mutable std::shared_mutex mutex_;
};
