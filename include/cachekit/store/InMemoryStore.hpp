#pragma once

#include <cachekit/store/ICacheStore.hpp>

#include <array>
#include <functional>
#include <mutex>
#include <ostream>
#include <shared_mutex>
#include <stdexcept>
#include <unordered_map>

/**
 * @brief Статистика содержимого InMemoryStore
 */
struct InMemoryStoreStats {
    size_t totalEntries = 0;     ///< Физически хранимые записи (включая истёкшие)
    size_t expiredEntries = 0;   ///< Истёкшие, но ещё не удалённые
    size_t totalBytes = 0;       ///< Сумма размеров значений
};

/**
 * @brief Эталонное потокобезопасное хранилище в памяти
 * @tparam ShardCount Количество шардов (рекомендуется степень 2)
 *
 * Ключи распределяются по шардам через std::hash, у каждого шарда свой
 * shared_mutex — потоки, работающие с разными шардами, не мешают друг другу.
 *
 * Истечение TTL ленивое, фонового потока нет:
 * - get(): истёкшая запись удаляется и возвращается nullopt
 * - getMany(): истёкшие записи возвращаются как nullopt, но НЕ удаляются
 * - exists(): только проверка, без удаления
 * - remove/removeMany/clearAll: физическое удаление
 *
 * Истёкшая запись, которую никто не читает через get(), остаётся в памяти
 * до явного удаления или clearAll(). Это поведение — часть контракта,
 * которому должны соответствовать остальные реализации ICacheStore.
 *
 * @code
 *   auto store = std::make_shared<InMemoryStore<>>();
 *   store->set("user:1", bytes, std::chrono::seconds(30));
 *   auto value = store->get("user:1");
 * @endcode
 */
template<size_t ShardCount = 16>
class InMemoryStore : public ICacheStore {
public:
    static_assert(ShardCount > 0, "ShardCount must be greater than 0");

    std::optional<Bytes> get(const std::string& key) override {
        auto& shard = getShard(key);
        {
            std::shared_lock lock(shard.mutex);
            auto it = shard.entries.find(key);
            if (it == shard.entries.end()) {
                return std::nullopt;
            }
            if (!it->second.isExpired(Clock::now())) {
                return it->second.data;
            }
        }

        // Запись истекла — удаляем под exclusive lock, перепроверив:
        // за время между блокировками её могли перезаписать
        std::unique_lock lock(shard.mutex);
        auto it = shard.entries.find(key);
        if (it != shard.entries.end()) {
            if (!it->second.isExpired(Clock::now())) {
                return it->second.data;
            }
            shard.entries.erase(it);
        }
        return std::nullopt;
    }

    void set(const std::string& key, Bytes value, std::optional<Duration> ttl) override {
        Entry entry;
        entry.data = std::move(value);
        if (ttl.has_value()) {
            entry.expiresAt = Clock::now() + *ttl;
        }

        auto& shard = getShard(key);
        std::unique_lock lock(shard.mutex);
        shard.entries[key] = std::move(entry);
    }

    void remove(const std::string& key) override {
        auto& shard = getShard(key);
        std::unique_lock lock(shard.mutex);
        shard.entries.erase(key);
    }

    bool exists(const std::string& key) override {
        const auto& shard = getShard(key);
        std::shared_lock lock(shard.mutex);
        auto it = shard.entries.find(key);
        return it != shard.entries.end() && !it->second.isExpired(Clock::now());
    }

    /**
     * @brief Пакетное чтение без удаления истёкших записей
     */
    std::vector<std::optional<Bytes>> getMany(const std::vector<std::string>& keys) override {
        std::vector<std::optional<Bytes>> results;
        results.reserve(keys.size());
        TimePoint now = Clock::now();

        for (const auto& key : keys) {
            const auto& shard = getShard(key);
            std::shared_lock lock(shard.mutex);
            auto it = shard.entries.find(key);
            if (it == shard.entries.end() || it->second.isExpired(now)) {
                results.emplace_back(std::nullopt);
            } else {
                results.emplace_back(it->second.data);
            }
        }
        return results;
    }

    void removeMany(const std::vector<std::string>& keys) override {
        for (const auto& key : keys) {
            remove(key);
        }
    }

    bool healthCheck() override {
        return true;
    }

    /**
     * @brief Очистить все шарды
     * @note Шарды блокируются последовательно, не атомарный снимок
     */
    void clearAll() override {
        for (auto& shard : shards_) {
            std::unique_lock lock(shard.mutex);
            shard.entries.clear();
        }
    }

    // ==================== Диагностика ====================

    /**
     * @brief Количество физически хранимых записей (включая истёкшие)
     */
    size_t size() const {
        size_t total = 0;
        for (const auto& shard : shards_) {
            std::shared_lock lock(shard.mutex);
            total += shard.entries.size();
        }
        return total;
    }

    bool empty() const {
        return size() == 0;
    }

    InMemoryStoreStats stats() const {
        InMemoryStoreStats result;
        TimePoint now = Clock::now();

        for (const auto& shard : shards_) {
            std::shared_lock lock(shard.mutex);
            for (const auto& [key, entry] : shard.entries) {
                (void)key;
                ++result.totalEntries;
                result.totalBytes += entry.data.size();
                if (entry.isExpired(now)) {
                    ++result.expiredEntries;
                }
            }
        }
        return result;
    }

    void logStats(std::ostream& os) const {
        auto current = stats();
        os << "[InMemoryStore] " << current.totalEntries << " entries ("
           << current.expiredEntries << " expired), "
           << current.totalBytes << " bytes\n";
    }

    static constexpr size_t shardCount() { return ShardCount; }

    size_t shardSize(size_t shardIndex) const {
        if (shardIndex >= ShardCount) {
            throw std::out_of_range("Shard index out of range");
        }
        std::shared_lock lock(shards_[shardIndex].mutex);
        return shards_[shardIndex].entries.size();
    }

private:
    struct Entry {
        Bytes data;
        std::optional<TimePoint> expiresAt;

        bool isExpired(TimePoint now) const {
            return expiresAt.has_value() && now > *expiresAt;
        }
    };

    struct Shard {
        std::unordered_map<std::string, Entry> entries;
        mutable std::shared_mutex mutex;
    };

    std::array<Shard, ShardCount> shards_;

    Shard& getShard(const std::string& key) {
        return shards_[getShardIndex(key)];
    }

    const Shard& getShard(const std::string& key) const {
        return shards_[getShardIndex(key)];
    }

    size_t getShardIndex(const std::string& key) const {
        std::hash<std::string> hasher;
        return hasher(key) % ShardCount;
    }
};
