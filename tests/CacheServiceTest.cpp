#include <gtest/gtest.h>
#include <cachekit/CacheService.hpp>
#include <cachekit/expiration/FixedTtl.hpp>
#include <cachekit/metrics/StatsMetrics.hpp>
#include <cachekit/store/InMemoryStore.hpp>
#include "TestEntities.hpp"

#include <chrono>
#include <memory>

/**
 * @brief Тесты для CacheService
 *
 * Проверяем:
 * - Копии разделяют один движок
 * - execute / executeWithConfig / require делегируют движку
 * - Отказ на nullptr
 */

using namespace std::chrono_literals;

TEST(CacheServiceTest, ConstructorThrowsOnNullExpander) {
    EXPECT_THROW(
        (CacheService(std::shared_ptr<const CacheExpander>())),
        CacheError
    );
}

TEST(CacheServiceTest, CopiesShareExpander) {
    CacheService service(std::make_shared<InMemoryStore<>>());
    CacheService copy = service;

    EXPECT_EQ(copy.expander(), service.expander());
    EXPECT_EQ(service.expander().use_count(), 2);
}

TEST(CacheServiceTest, CopyServesWhatOriginalCached) {
    auto stats = std::make_shared<StatsMetrics>();
    CacheService service(std::make_shared<InMemoryStore<>>(), nullptr, stats);
    CacheService copy = service;

    CountingProvider<User> provider;
    provider.insert("1", makeUser("1", "Alice"));

    GenericFeeder<User> first("1");
    service.execute(first, provider);

    User cached = copy.require<User>("1");
    EXPECT_EQ(cached, makeUser("1", "Alice"));
    EXPECT_EQ(provider.calls(), 1);
    EXPECT_EQ(stats->hits(), 2u);
}

TEST(CacheServiceTest, ExecuteWithConfigAppliesTtlOverride) {
    auto store = std::make_shared<FlakyStore>();
    CacheService service(store, std::make_shared<FixedTtl>(1h));

    InMemoryProvider<User> provider;
    provider.insert("1", makeUser("1", "Alice"));

    GenericFeeder<User> feeder("1");
    service.executeWithConfig(feeder, provider, CacheStrategy::Bypass,
                              OperationConfig().withTtl(15s));

    EXPECT_TRUE(feeder.data.has_value());
    EXPECT_EQ(store->lastTtl(), std::optional<Duration>(15s));
}

TEST(CacheServiceTest, RequireMissThrows) {
    CacheService service(std::make_shared<InMemoryStore<>>());

    try {
        service.require<User>("missing");
        FAIL() << "expected CacheError";
    } catch (const CacheError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::CacheMiss);
    }
}

TEST(CacheServiceTest, WrapsExistingExpander) {
    auto expander = std::make_shared<CacheExpander>(std::make_shared<InMemoryStore<>>());
    CacheService service(expander);

    EXPECT_EQ(service.expander(), expander);
}
