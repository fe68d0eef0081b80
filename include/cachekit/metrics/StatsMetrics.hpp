#pragma once

#include "ICacheMetrics.hpp"

#include <atomic>
#include <cstdint>

/**
 * @brief Счётчики событий движка
 *
 * Собирает:
 * - hits/misses — для расчёта hit rate
 * - sets/deletes — активность записи
 * - errors — неудачные попытки (каждая попытка при повторах)
 * - суммарное время hit/miss операций
 *
 * Использование:
 * @code
 *   auto stats = std::make_shared<StatsMetrics>();
 *   CacheExpander expander(store, nullptr, stats);
 *   // ... работа ...
 *   std::cout << "Hit rate: " << stats->hitRate() << std::endl;
 * @endcode
 *
 * Примечание: счётчики atomic для потокобезопасности.
 */
class StatsMetrics : public ICacheMetrics {
public:
    void recordHit(const std::string& key, Duration elapsed) override {
        (void)key;
        ++hits_;
        addLatency(elapsed);
    }

    void recordMiss(const std::string& key, Duration elapsed) override {
        (void)key;
        ++misses_;
        addLatency(elapsed);
    }

    void recordSet(const std::string& key, Duration elapsed) override {
        (void)key; (void)elapsed;
        ++sets_;
    }

    void recordDelete(const std::string& key, Duration elapsed) override {
        (void)key; (void)elapsed;
        ++deletes_;
    }

    void recordError(const std::string& key, const std::string& error) override {
        (void)key; (void)error;
        ++errors_;
    }

    // ==================== Геттеры ====================

    uint64_t hits() const { return hits_; }
    uint64_t misses() const { return misses_; }
    uint64_t sets() const { return sets_; }
    uint64_t deletes() const { return deletes_; }
    uint64_t errors() const { return errors_; }

    /**
     * @brief Количество завершённых операций (hit + miss)
     */
    uint64_t totalRequests() const {
        return hits_ + misses_;
    }

    /**
     * @brief Доля операций, вернувших значение (0.0 - 1.0)
     * @return hit rate или 0.0 если операций не было
     */
    double hitRate() const {
        uint64_t total = totalRequests();
        if (total == 0) return 0.0;
        return static_cast<double>(hits_) / static_cast<double>(total);
    }

    Duration totalLatency() const {
        return Duration(latencyTicks_.load());
    }

    /**
     * @brief Среднее время hit/miss операции
     */
    Duration averageLatency() const {
        uint64_t total = totalRequests();
        if (total == 0) return Duration::zero();
        return Duration(latencyTicks_.load() / static_cast<Duration::rep>(total));
    }

    void reset() {
        hits_ = 0;
        misses_ = 0;
        sets_ = 0;
        deletes_ = 0;
        errors_ = 0;
        latencyTicks_ = 0;
    }

private:
    void addLatency(Duration elapsed) {
        latencyTicks_ += elapsed.count();
    }

    std::atomic<uint64_t> hits_{0};
    std::atomic<uint64_t> misses_{0};
    std::atomic<uint64_t> sets_{0};
    std::atomic<uint64_t> deletes_{0};
    std::atomic<uint64_t> errors_{0};
    std::atomic<Duration::rep> latencyTicks_{0};
};
