#pragma once

#include "ExchangeProviders.hpp"

#include <cachekit/CacheService.hpp>
#include <cachekit/expiration/PerNamespaceTtl.hpp>
#include <cachekit/feed/GenericFeeder.hpp>
#include <cachekit/metrics/CompositeMetrics.hpp>
#include <cachekit/metrics/LoggingMetrics.hpp>
#include <cachekit/metrics/StatsMetrics.hpp>
#include <cachekit/store/InMemoryStore.hpp>

#include <chrono>
#include <iomanip>
#include <iostream>
#include <memory>
#include <optional>

/**
 * @brief Сервис справочных и рыночных данных с кэшированием
 *
 * Один CacheService на оба типа данных, TTL по пространству имён:
 * - instrument: 24 часа (справочник меняется редко)
 * - quote: короткий, задаётся при создании
 *
 * Стратегии по сценариям:
 * - getInstrument / getPrice — Refresh (cache-aside)
 * - refreshPrice — Invalidate (принудительное обновление)
 * - livePrice — Bypass (всегда из API, кэш обновляется попутно)
 * - cachedPrice — Fresh (только кэш, для graceful degradation)
 */
class InstrumentService {
public:
    /**
     * @param api Клиент API (заглушка)
     * @param quoteTtl Время жизни цены в кэше
     * @param log Поток для журнала событий кэша (nullptr — без журнала)
     */
    explicit InstrumentService(std::shared_ptr<StubExchangeApi> api,
                               std::chrono::milliseconds quoteTtl = std::chrono::milliseconds(1000),
                               std::ostream* log = nullptr)
        : api_(api)
        , instruments_(api)
        , quotes_(api)
        , store_(std::make_shared<InMemoryStore<>>())
        , stats_(std::make_shared<StatsMetrics>())
        , cache_(makeCache(quoteTtl, log))
    {}

    std::optional<Instrument> getInstrument(const std::string& figi) const {
        GenericFeeder<Instrument> feeder(figi);
        cache_.execute(feeder, instruments_);
        return feeder.data;
    }

    std::optional<Quote> getPrice(const std::string& figi) const {
        return quote(figi, CacheStrategy::Refresh);
    }

    /**
     * @brief Цена с повторами при сбоях API
     */
    std::optional<Quote> getPriceWithRetry(const std::string& figi, uint32_t retries) const {
        return quote(figi, CacheStrategy::Refresh, OperationConfig().withRetry(retries));
    }

    std::optional<Quote> refreshPrice(const std::string& figi) const {
        return quote(figi, CacheStrategy::Invalidate);
    }

    std::optional<Quote> livePrice(const std::string& figi) const {
        return quote(figi, CacheStrategy::Bypass);
    }

    /**
     * @brief Цена только из кэша
     *
     * Используется при graceful degradation: API недоступен
     * или превышен rate limit — лучше показать закэшированную цену,
     * чем ничего.
     */
    std::optional<Quote> cachedPrice(const std::string& figi) const {
        return quote(figi, CacheStrategy::Fresh);
    }

    // ==================== Статистика ====================

    void printStats() const {
        std::cout << "\n=== InstrumentService Statistics ===\n\n";

        std::cout << "Cache:\n";
        std::cout << "  Hits:     " << stats_->hits() << "\n";
        std::cout << "  Misses:   " << stats_->misses() << "\n";
        std::cout << "  Writes:   " << stats_->sets() << "\n";
        std::cout << "  Deletes:  " << stats_->deletes() << "\n";
        std::cout << "  Errors:   " << stats_->errors() << "\n";
        std::cout << "  Hit Rate: " << std::fixed << std::setprecision(1)
                  << (stats_->hitRate() * 100) << "%\n";
        std::cout << "  ";
        store_->logStats(std::cout);

        std::cout << "\nAPI Statistics:\n";
        std::cout << "  Total Requests:   " << api_->getTotalRequests() << "\n";
        std::cout << "  Rate Limit Hits:  " << api_->getRateLimitHits() << "\n";
        std::cout << "  Failures:         " << api_->getFailures() << "\n";
    }

    void resetStats() {
        stats_->reset();
        api_->resetStats();
    }

    const StatsMetrics& stats() const { return *stats_; }

private:
    std::optional<Quote> quote(const std::string& figi,
                               CacheStrategy strategy,
                               const OperationConfig& config = OperationConfig()) const {
        GenericFeeder<Quote> feeder(figi);
        cache_.executeWithConfig(feeder, quotes_, strategy, config);
        return feeder.data;
    }

    CacheService makeCache(std::chrono::milliseconds quoteTtl, std::ostream* log) const {
        auto policy = std::make_shared<PerNamespaceTtl>(
            PerNamespaceTtl::Table{
                {Instrument::cachePrefix(), std::chrono::hours(24)},
                {Quote::cachePrefix(), quoteTtl}},
            std::chrono::minutes(5));

        auto metrics = std::make_shared<CompositeMetrics>();
        metrics->add(stats_);
        if (log != nullptr) {
            metrics->add(std::make_shared<LoggingMetrics>("instruments", *log));
        }

        return CacheService(store_, policy, metrics);
    }

    std::shared_ptr<StubExchangeApi> api_;
    InstrumentProvider instruments_;
    QuoteProvider quotes_;
    std::shared_ptr<InMemoryStore<>> store_;
    std::shared_ptr<StatsMetrics> stats_;
    CacheService cache_;
};
