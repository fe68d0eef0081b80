#include <gtest/gtest.h>
#include <cachekit/CacheExpander.hpp>
#include <cachekit/metrics/CompositeMetrics.hpp>
#include <cachekit/metrics/LoggingMetrics.hpp>
#include <cachekit/metrics/NoOpMetrics.hpp>
#include <cachekit/metrics/StatsMetrics.hpp>
#include <cachekit/store/InMemoryStore.hpp>
#include "TestEntities.hpp"

#include <chrono>
#include <sstream>

/**
 * @brief Тесты для приёмников метрик
 *
 * Проверяем:
 * - StatsMetrics корректно считает события и hit rate
 * - LoggingMetrics выводит по строке на событие
 * - CompositeMetrics рассылает события всем приёмникам
 * - Подключение к CacheExpander
 */

using namespace std::chrono_literals;

// ==================== StatsMetrics ====================

TEST(StatsMetricsTest, InitiallyZero) {
    StatsMetrics stats;

    EXPECT_EQ(stats.hits(), 0u);
    EXPECT_EQ(stats.misses(), 0u);
    EXPECT_EQ(stats.sets(), 0u);
    EXPECT_EQ(stats.deletes(), 0u);
    EXPECT_EQ(stats.errors(), 0u);
    EXPECT_DOUBLE_EQ(stats.hitRate(), 0.0);
    EXPECT_EQ(stats.averageLatency(), Duration::zero());
}

TEST(StatsMetricsTest, HitRateCalculation) {
    StatsMetrics stats;

    stats.recordHit("k", 1ms);
    stats.recordHit("k", 1ms);
    stats.recordHit("k", 1ms);
    stats.recordMiss("k", 1ms);

    // 3 hits, 1 miss = 75% hit rate
    EXPECT_DOUBLE_EQ(stats.hitRate(), 0.75);
    EXPECT_EQ(stats.totalRequests(), 4u);
}

TEST(StatsMetricsTest, AccumulatesLatency) {
    StatsMetrics stats;

    stats.recordHit("k", 10ms);
    stats.recordMiss("k", 30ms);
    stats.recordSet("k", 100ms);  // запись не входит в latency операций

    EXPECT_EQ(stats.totalLatency(), Duration(40ms));
    EXPECT_EQ(stats.averageLatency(), Duration(20ms));
}

TEST(StatsMetricsTest, Reset) {
    StatsMetrics stats;

    stats.recordHit("k", 1ms);
    stats.recordMiss("k", 1ms);
    stats.recordSet("k", 1ms);
    stats.recordDelete("k", 1ms);
    stats.recordError("k", "boom");

    stats.reset();

    EXPECT_EQ(stats.hits(), 0u);
    EXPECT_EQ(stats.misses(), 0u);
    EXPECT_EQ(stats.sets(), 0u);
    EXPECT_EQ(stats.deletes(), 0u);
    EXPECT_EQ(stats.errors(), 0u);
    EXPECT_EQ(stats.totalLatency(), Duration::zero());
}

TEST(StatsMetricsTest, CountsExpanderEvents) {
    auto stats = std::make_shared<StatsMetrics>();
    CacheExpander expander(std::make_shared<InMemoryStore<>>(), nullptr, stats);

    InMemoryProvider<User> provider;
    provider.insert("1", makeUser("1", "Alice"));

    GenericFeeder<User> miss("1");
    expander.execute(miss, provider);                                // set + hit
    GenericFeeder<User> hit("1");
    expander.execute(hit, provider);                                 // hit
    GenericFeeder<User> invalidate("1");
    expander.execute(invalidate, provider, CacheStrategy::Invalidate); // delete + set + hit
    GenericFeeder<User> absent("2");
    expander.execute(absent, provider, CacheStrategy::Fresh);       // miss

    EXPECT_EQ(stats->hits(), 3u);
    EXPECT_EQ(stats->misses(), 1u);
    EXPECT_EQ(stats->sets(), 2u);
    EXPECT_EQ(stats->deletes(), 1u);
    EXPECT_EQ(stats->errors(), 0u);
}

// ==================== LoggingMetrics ====================

TEST(LoggingMetricsTest, WritesOneLinePerEvent) {
    std::ostringstream out;
    LoggingMetrics log("users", out);

    log.recordHit("user:1", 12us);
    log.recordMiss("user:2", 3ms);
    log.recordSet("user:1", 0us);
    log.recordDelete("user:1", 1us);
    log.recordError("user:3", "Backend error: connection refused");

    EXPECT_EQ(out.str(),
              "[users] HIT: user:1 (12us)\n"
              "[users] MISS: user:2 (3000us)\n"
              "[users] SET: user:1 (0us)\n"
              "[users] DELETE: user:1 (1us)\n"
              "[users] ERROR: user:3 Backend error: connection refused\n");
}

TEST(LoggingMetricsTest, DefaultPrefix) {
    std::ostringstream out;
    LoggingMetrics log("cachekit", out);

    log.recordMiss("k", 0us);

    EXPECT_EQ(out.str(), "[cachekit] MISS: k (0us)\n");
}

// ==================== NoOpMetrics ====================

TEST(NoOpMetricsTest, AcceptsEverything) {
    NoOpMetrics metrics;
    EXPECT_NO_THROW(metrics.recordHit("k", 1ms));
    EXPECT_NO_THROW(metrics.recordError("k", "boom"));
}

// ==================== CompositeMetrics ====================

TEST(CompositeMetricsTest, FansOutToAllSinks) {
    auto first = std::make_shared<StatsMetrics>();
    auto second = std::make_shared<RecordingMetrics>();
    CompositeMetrics composite({first, second});

    composite.recordHit("user:1", 1ms);
    composite.recordDelete("user:1", 1ms);
    composite.recordError("user:1", "boom");

    EXPECT_EQ(composite.size(), 2u);
    EXPECT_EQ(first->hits(), 1u);
    EXPECT_EQ(first->deletes(), 1u);
    EXPECT_EQ(first->errors(), 1u);
    EXPECT_EQ(second->events(),
              (std::vector<std::string>{"hit:user:1", "delete:user:1", "error:user:1"}));
}

TEST(CompositeMetricsTest, IgnoresNullSinks) {
    CompositeMetrics composite;
    composite.add(nullptr);
    composite.add(std::make_shared<NoOpMetrics>());

    EXPECT_EQ(composite.size(), 1u);
    EXPECT_NO_THROW(composite.recordMiss("k", 1ms));
}

TEST(CompositeMetricsTest, StatsAndLogTogether) {
    std::ostringstream out;
    auto stats = std::make_shared<StatsMetrics>();
    auto composite = std::make_shared<CompositeMetrics>();
    composite->add(stats);
    composite->add(std::make_shared<LoggingMetrics>("svc", out));

    CacheExpander expander(std::make_shared<InMemoryStore<>>(), nullptr, composite);
    InMemoryProvider<User> provider;

    GenericFeeder<User> feeder("9");
    expander.execute(feeder, provider, CacheStrategy::Fresh);

    EXPECT_EQ(stats->misses(), 1u);
    EXPECT_EQ(out.str().rfind("[svc] MISS: user:9 (", 0), 0u);
}
