#include <cachekit/CacheExpander.hpp>
#include <cachekit/feed/GenericFeeder.hpp>
#include <cachekit/metrics/StatsMetrics.hpp>
#include <cachekit/provider/InMemoryProvider.hpp>
#include <cachekit/store/InMemoryStore.hpp>

#include <atomic>
#include <chrono>
#include <iomanip>
#include <iostream>
#include <random>
#include <string>
#include <thread>
#include <vector>

/**
 * @brief Бенчмарк cachekit
 *
 * Измеряем:
 * - Кодирование/декодирование конверта
 * - Throughput InMemoryStore (set/get)
 * - Refresh: путь промаха и путь попадания
 * - Один CacheExpander из нескольких потоков
 */

// ==================== Сущность ====================

struct Account {
    using Key = int64_t;

    int64_t id = 0;
    std::string owner;
    double balance = 0.0;
    std::vector<std::string> tags;

    Key cacheKey() const { return id; }
    static constexpr const char* cachePrefix() { return "account"; }

    void writeTo(BinaryWriter& w) const {
        w.write(id);
        w.write(owner);
        w.write(balance);
        w.write(tags);
    }

    static Account readFrom(BinaryReader& r) {
        Account account;
        r.read(account.id);
        r.read(account.owner);
        r.read(account.balance);
        r.read(account.tags);
        return account;
    }
};

// ==================== Утилиты ====================

template<typename Func>
double measureMs(Func&& func) {
    auto start = std::chrono::high_resolution_clock::now();
    func();
    auto end = std::chrono::high_resolution_clock::now();

    std::chrono::duration<double, std::milli> duration = end - start;
    return duration.count();
}

void printResult(const std::string& name, double timeMs, size_t operations) {
    double opsPerSec = (operations / timeMs) * 1000.0;
    std::cout << std::left << std::setw(45) << name
              << std::right << std::setw(10) << std::fixed << std::setprecision(2)
              << timeMs << " ms"
              << std::setw(15) << std::fixed << std::setprecision(0)
              << opsPerSec << " ops/sec\n";
}

Account makeAccount(int64_t id) {
    Account account;
    account.id = id;
    account.owner = "owner-" + std::to_string(id);
    account.balance = static_cast<double>(id) * 1.5;
    account.tags = {"retail", "rub"};
    return account;
}

void fillProvider(InMemoryProvider<Account>& provider, size_t count) {
    for (size_t i = 0; i < count; ++i) {
        auto id = static_cast<int64_t>(i);
        provider.insert(id, makeAccount(id));
    }
}

// ==================== Конверт ====================

void benchmarkEnvelope(size_t numOperations) {
    Account account = makeAccount(42);
    size_t totalBytes = 0;

    double encodeMs = measureMs([&]() {
        for (size_t i = 0; i < numOperations; ++i) {
            totalBytes += encodeForCache(account).size();
        }
    });
    printResult("Envelope encode", encodeMs, numOperations);

    Bytes bytes = encodeForCache(account);
    double checksum = 0.0;

    double decodeMs = measureMs([&]() {
        for (size_t i = 0; i < numOperations; ++i) {
            checksum += decodeFromCache<Account>(bytes).balance;
        }
    });
    printResult("Envelope decode", decodeMs, numOperations);

    std::cout << "   Entry size: " << bytes.size() << " bytes"
              << " (checksum " << std::setprecision(0) << checksum + totalBytes << ")\n";
}

// ==================== Хранилище ====================

void benchmarkStore(size_t numOperations) {
    InMemoryStore<> store;
    Bytes value = encodeForCache(makeAccount(1));

    std::vector<std::string> keys;
    keys.reserve(numOperations);
    for (size_t i = 0; i < numOperations; ++i) {
        keys.push_back("account:" + std::to_string(i));
    }

    double setMs = measureMs([&]() {
        for (const auto& key : keys) {
            store.set(key, value, std::nullopt);
        }
    });
    printResult("InMemoryStore set", setMs, numOperations);

    size_t found = 0;
    double getMs = measureMs([&]() {
        for (const auto& key : keys) {
            if (store.get(key).has_value()) {
                ++found;
            }
        }
    });
    printResult("InMemoryStore get (100% hit)", getMs, numOperations);

    std::cout << "   ";
    store.logStats(std::cout);
}

// ==================== Движок ====================

void benchmarkRefresh(size_t keyCount, size_t numOperations) {
    auto store = std::make_shared<InMemoryStore<>>();
    auto stats = std::make_shared<StatsMetrics>();
    CacheExpander expander(store, nullptr, stats);

    InMemoryProvider<Account> provider;
    fillProvider(provider, keyCount);

    double missMs = measureMs([&]() {
        for (size_t i = 0; i < keyCount; ++i) {
            GenericFeeder<Account> feeder(static_cast<int64_t>(i));
            expander.execute(feeder, provider);
        }
    });
    printResult("Refresh miss (fetch + write)", missMs, keyCount);

    std::mt19937 rng(42);
    std::uniform_int_distribution<int64_t> dist(0, static_cast<int64_t>(keyCount - 1));

    double hitMs = measureMs([&]() {
        for (size_t i = 0; i < numOperations; ++i) {
            GenericFeeder<Account> feeder(dist(rng));
            expander.execute(feeder, provider);
        }
    });
    printResult("Refresh hit (read + decode)", hitMs, numOperations);

    std::cout << "   Hit rate: " << std::fixed << std::setprecision(2)
              << (stats->hitRate() * 100) << "%\n";
}

void benchmarkConcurrentReaders(size_t keyCount, size_t opsPerThread, size_t numThreads) {
    auto store = std::make_shared<InMemoryStore<>>();
    CacheExpander expander(store);

    InMemoryProvider<Account> provider;
    fillProvider(provider, keyCount);

    std::atomic<size_t> delivered{0};
    double timeMs = measureMs([&]() {
        std::vector<std::thread> threads;
        for (size_t t = 0; t < numThreads; ++t) {
            threads.emplace_back([&, t]() {
                std::mt19937 rng(static_cast<unsigned>(t));
                std::uniform_int_distribution<int64_t> dist(0, static_cast<int64_t>(keyCount - 1));
                for (size_t i = 0; i < opsPerThread; ++i) {
                    GenericFeeder<Account> feeder(dist(rng));
                    expander.execute(feeder, provider);
                    if (feeder.data.has_value()) {
                        ++delivered;
                    }
                }
            });
        }
        for (auto& thread : threads) {
            thread.join();
        }
    });

    printResult("Concurrent Refresh (" + std::to_string(numThreads) + " threads)",
                timeMs, numThreads * opsPerThread);
    std::cout << "   Delivered: " << delivered.load() << "\n";
}

int main() {
    std::cout << "=== cachekit Benchmark ===\n\n";

    const size_t numOperations = 200000;
    const size_t keyCount = 10000;

    std::cout << "--- Envelope ---\n";
    benchmarkEnvelope(numOperations);

    std::cout << "\n--- Store ---\n";
    benchmarkStore(numOperations);

    std::cout << "\n--- Expander ---\n";
    benchmarkRefresh(keyCount, numOperations);

    std::cout << "\n--- Concurrency ---\n";
    unsigned hardware = std::thread::hardware_concurrency();
    size_t threads = hardware > 0 ? hardware : 4;
    benchmarkConcurrentReaders(keyCount, numOperations / threads, threads);

    return 0;
}
