#include <gtest/gtest.h>
#include <cachekit/CacheExpander.hpp>
#include <cachekit/feed/GenericFeeder.hpp>
#include <cachekit/metrics/StatsMetrics.hpp>
#include <cachekit/store/InMemoryStore.hpp>
#include <cachekit/store/ThreadSafeStore.hpp>
#include "TestEntities.hpp"

#include <atomic>
#include <memory>
#include <thread>
#include <vector>

/**
 * @brief Многопоточные тесты хранилищ и движка
 *
 * Проверяем:
 * - InMemoryStore и ThreadSafeStore при конкурентном доступе
 * - Один CacheExpander из многих потоков
 * - Согласованность счётчиков метрик
 */

namespace {

Bytes bytesOf(const std::string& text) {
    return Bytes(text.begin(), text.end());
}

constexpr int kThreads = 8;
constexpr int kOpsPerThread = 1000;

} // namespace

// ==================== Хранилища ====================

TEST(ConcurrencyTest, InMemoryStoreConcurrentWrites) {
    InMemoryStore<> store;
    std::vector<std::thread> threads;

    for (int t = 0; t < kThreads; ++t) {
        threads.emplace_back([&store, t]() {
            for (int i = 0; i < kOpsPerThread; ++i) {
                store.set("t" + std::to_string(t) + ":" + std::to_string(i),
                          bytesOf("v"), std::nullopt);
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    EXPECT_EQ(store.size(), static_cast<size_t>(kThreads * kOpsPerThread));
}

TEST(ConcurrencyTest, InMemoryStoreMixedReadWrite) {
    InMemoryStore<> store;
    for (int i = 0; i < 100; ++i) {
        store.set("k" + std::to_string(i), bytesOf("init"), std::nullopt);
    }

    std::atomic<int> reads{0};
    std::vector<std::thread> threads;

    for (int t = 0; t < kThreads; ++t) {
        threads.emplace_back([&store, &reads, t]() {
            for (int i = 0; i < kOpsPerThread; ++i) {
                std::string key = "k" + std::to_string(i % 100);
                if (t % 2 == 0) {
                    store.set(key, bytesOf("t" + std::to_string(t)), std::chrono::seconds(60));
                } else if (store.get(key).has_value()) {
                    ++reads;
                }
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    // Ключи никто не удалял: каждое чтение находит значение
    EXPECT_EQ(reads.load(), (kThreads / 2) * kOpsPerThread);
    EXPECT_EQ(store.size(), 100u);
}

TEST(ConcurrencyTest, ThreadSafeStoreOverPlainMap) {
    ThreadSafeStore store(std::make_unique<MapStore>());
    std::vector<std::thread> threads;

    for (int t = 0; t < kThreads; ++t) {
        threads.emplace_back([&store, t]() {
            for (int i = 0; i < kOpsPerThread; ++i) {
                std::string key = "t" + std::to_string(t) + ":" + std::to_string(i % 50);
                store.set(key, bytesOf("v"), std::nullopt);
                store.exists(key);
                store.getMany({key});
                if (i % 10 == 0) {
                    store.remove(key);
                }
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    EXPECT_TRUE(store.healthCheck());
}

// ==================== Движок ====================

TEST(ConcurrencyTest, SharedExpanderRefreshFromManyThreads) {
    auto store = std::make_shared<InMemoryStore<>>();
    auto stats = std::make_shared<StatsMetrics>();
    CacheExpander expander(store, nullptr, stats);

    CountingProvider<User> provider;
    for (int i = 0; i < 20; ++i) {
        provider.insert(std::to_string(i), makeUser(std::to_string(i), "user" + std::to_string(i)));
    }

    std::atomic<int> delivered{0};
    std::vector<std::thread> threads;

    for (int t = 0; t < kThreads; ++t) {
        threads.emplace_back([&, t]() {
            for (int i = 0; i < 200; ++i) {
                GenericFeeder<User> feeder(std::to_string((i + t) % 20));
                expander.execute(feeder, provider);
                if (feeder.data.has_value() && feeder.data->id == feeder.id) {
                    ++delivered;
                }
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    EXPECT_EQ(delivered.load(), kThreads * 200);
    EXPECT_EQ(stats->hits(), static_cast<uint64_t>(kThreads * 200));
    EXPECT_EQ(stats->errors(), 0u);

    // Без объединения промахов источник мог быть вызван больше 20 раз,
    // но не больше числа промахов в первом проходе каждого потока
    EXPECT_GE(provider.calls(), 20);
    EXPECT_LE(provider.calls(), kThreads * 20);
    EXPECT_EQ(store->size(), 20u);
}
