#pragma once

#include "../models/InstrumentModels.hpp"

#include <cachekit/CacheError.hpp>

#include <chrono>
#include <cmath>
#include <mutex>
#include <optional>
#include <random>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

/**
 * @brief Заглушка биржевого API для демонстрации
 *
 * Имитирует поведение реального API:
 * - Rate limiting (N запросов в минуту)
 * - Сетевые задержки (50-150 мс)
 * - Временные сбои по запросу (failNext)
 *
 * Захардкоженные инструменты:
 * - SBER (Сбербанк) — ~300 руб
 * - GAZP (Газпром) — ~150 руб
 * - LKOH (Лукойл) — ~7000 руб
 *
 * Цены генерируются случайно в диапазоне ±3% от базовой цены.
 * Недоступность API сообщается через CacheError(Repository) —
 * такие ошибки движок кэша умеет повторять.
 */
class StubExchangeApi {
public:
    /**
     * @param requestsPerMinute Лимит запросов
     * @param simulateDelay Имитировать сетевые задержки
     */
    explicit StubExchangeApi(int requestsPerMinute = 100, bool simulateDelay = true)
        : requestsPerMinute_(requestsPerMinute)
        , simulateDelay_(simulateDelay)
        , rng_(std::random_device{}())
        , minuteStart_(std::chrono::steady_clock::now())
    {
        initializeInstruments();
    }

    /**
     * @brief Справочные данные по FIGI
     * @return std::nullopt если инструмент неизвестен
     * @throws CacheError(Repository) при rate limit или сбое
     */
    std::optional<Instrument> getInstrumentByFigi(const std::string& figi) {
        std::lock_guard<std::mutex> lock(mutex_);
        beginRequest();

        auto it = instruments_.find(figi);
        if (it == instruments_.end()) {
            return std::nullopt;
        }
        return it->second;
    }

    /**
     * @brief Текущая цена
     * @return std::nullopt если инструмент неизвестен
     * @throws CacheError(Repository) при rate limit или сбое
     */
    std::optional<Quote> getLastPrice(const std::string& figi) {
        std::lock_guard<std::mutex> lock(mutex_);
        beginRequest();

        auto it = basePrices_.find(figi);
        if (it == basePrices_.end()) {
            return std::nullopt;
        }
        return generateQuote(figi, it->second);
    }

    /**
     * @brief Следующие count запросов завершатся сбоем соединения
     */
    void failNext(int count) {
        std::lock_guard<std::mutex> lock(mutex_);
        failuresLeft_ = count;
    }

    // ==================== Статистика для демо ====================

    int getTotalRequests() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return totalRequests_;
    }

    int getRateLimitHits() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return rateLimitHits_;
    }

    int getFailures() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return failures_;
    }

    void resetStats() {
        std::lock_guard<std::mutex> lock(mutex_);
        totalRequests_ = 0;
        rateLimitHits_ = 0;
        failures_ = 0;
    }

    std::vector<std::string> getAvailableFigis() const {
        std::vector<std::string> result;
        for (const auto& [figi, _] : instruments_) {
            result.push_back(figi);
        }
        return result;
    }

private:
    int requestsPerMinute_;
    bool simulateDelay_;
    std::mt19937 rng_;
    mutable std::mutex mutex_;

    // Rate limiting
    std::chrono::steady_clock::time_point minuteStart_;
    int requestsInCurrentMinute_ = 0;

    // Статистика
    int totalRequests_ = 0;
    int rateLimitHits_ = 0;
    int failures_ = 0;
    int failuresLeft_ = 0;

    std::unordered_map<std::string, Instrument> instruments_;
    std::unordered_map<std::string, double> basePrices_;

    void initializeInstruments() {
        addInstrument({"BBG004730N88", "SBER", "Сбербанк", "RUB", 10, 0.01, "TQBR"}, 300.0);
        addInstrument({"BBG004730RP0", "GAZP", "Газпром", "RUB", 10, 0.01, "TQBR"}, 150.0);
        addInstrument({"BBG004731032", "LKOH", "Лукойл", "RUB", 1, 0.5, "TQBR"}, 7000.0);
    }

    void addInstrument(const Instrument& info, double basePrice) {
        instruments_[info.figi] = info;
        basePrices_[info.figi] = basePrice;
    }

    /**
     * @brief Учёт запроса: сбой, rate limit, задержка
     *
     * Счётчик rate limit сбрасывается каждую минуту.
     */
    void beginRequest() {
        ++totalRequests_;

        if (failuresLeft_ > 0) {
            --failuresLeft_;
            ++failures_;
            throw CacheError(ErrorKind::Repository, "connection reset by peer");
        }

        auto now = std::chrono::steady_clock::now();
        auto elapsed = std::chrono::duration_cast<std::chrono::seconds>(now - minuteStart_);
        if (elapsed.count() >= 60) {
            minuteStart_ = now;
            requestsInCurrentMinute_ = 0;
        }

        ++requestsInCurrentMinute_;
        if (requestsInCurrentMinute_ > requestsPerMinute_) {
            ++rateLimitHits_;
            throw CacheError(ErrorKind::Repository,
                             "rate limit exceeded: " + std::to_string(requestsPerMinute_) +
                             " requests per minute");
        }

        if (simulateDelay_) {
            std::uniform_int_distribution<int> dist(50, 150);
            std::this_thread::sleep_for(std::chrono::milliseconds(dist(rng_)));
        }
    }

    /**
     * @brief Цена ±3% от базовой, округлённая до шага цены
     */
    Quote generateQuote(const std::string& figi, double basePrice) {
        std::uniform_real_distribution<double> priceDist(-0.03, 0.03);
        double increment = instruments_[figi].minPriceIncrement;
        double currentPrice = basePrice * (1.0 + priceDist(rng_));
        currentPrice = std::round(currentPrice / increment) * increment;

        std::uniform_int_distribution<int64_t> volumeDist(100000, 5000000);
        auto now = std::chrono::system_clock::now().time_since_epoch();

        Quote quote;
        quote.figi = figi;
        quote.lastPrice = currentPrice;
        quote.closePrice = basePrice;
        quote.dayHigh = basePrice * 1.02;
        quote.dayLow = basePrice * 0.98;
        quote.volume = volumeDist(rng_);
        quote.timestampMs = std::chrono::duration_cast<std::chrono::milliseconds>(now).count();
        return quote;
    }
};
