#pragma once

#include <cachekit/CacheKey.hpp>
#include <cachekit/provider/IDataProvider.hpp>

#include <mutex>
#include <string>
#include <unordered_map>

/**
 * @brief Источник данных в памяти (для тестов, демо и прототипов)
 * @tparam T Кэшируемая сущность
 *
 * Хранит сущности по текстовому представлению идентификатора.
 * Потокобезопасен: чтение и запись под одним mutex.
 */
template<typename T>
class InMemoryProvider : public IDataProvider<T> {
public:
    using Key = typename IDataProvider<T>::Key;

    void insert(const Key& id, T value) {
        std::lock_guard<std::mutex> lock(mutex_);
        data_[KeyCodec<Key>::toString(id)] = std::move(value);
    }

    bool erase(const Key& id) {
        std::lock_guard<std::mutex> lock(mutex_);
        return data_.erase(KeyCodec<Key>::toString(id)) > 0;
    }

    void clear() {
        std::lock_guard<std::mutex> lock(mutex_);
        data_.clear();
    }

    size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return data_.size();
    }

    bool empty() const {
        return size() == 0;
    }

    std::optional<T> fetchById(const Key& id) const override {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = data_.find(KeyCodec<Key>::toString(id));
        if (it == data_.end()) {
            return std::nullopt;
        }
        return it->second;
    }

    std::vector<std::optional<T>> fetchByIds(const std::vector<Key>& ids) const override {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<std::optional<T>> results;
        results.reserve(ids.size());
        for (const auto& id : ids) {
            auto it = data_.find(KeyCodec<Key>::toString(id));
            if (it == data_.end()) {
                results.emplace_back(std::nullopt);
            } else {
                results.emplace_back(it->second);
            }
        }
        return results;
    }

    uint64_t count() const override {
        return size();
    }

    std::vector<T> fetchAll() const override {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<T> result;
        result.reserve(data_.size());
        for (const auto& [id, value] : data_) {
            (void)id;
            result.push_back(value);
        }
        return result;
    }

private:
    std::unordered_map<std::string, T> data_;
    mutable std::mutex mutex_;
};
