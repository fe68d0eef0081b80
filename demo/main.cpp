#include "services/InstrumentService.hpp"

#include <iomanip>
#include <iostream>
#include <thread>
#include <vector>

/**
 * @brief Демонстрация cachekit на примере биржевых данных
 *
 * Сценарии:
 * 1. Экономия API-запросов (Refresh)
 * 2. TTL по пространству имён
 * 3. Стратегии Invalidate / Bypass / Fresh
 * 4. Graceful degradation при rate limit
 * 5. Повторы при сбоях API
 * 6. Журнал событий кэша
 */

namespace {

const std::string kSber = "BBG004730N88";
const std::string kGazp = "BBG004730RP0";
const std::string kLkoh = "BBG004731032";

void printSeparator(const std::string& title) {
    std::cout << "\n" << std::string(60, '=') << "\n";
    std::cout << "  " << title << "\n";
    std::cout << std::string(60, '=') << "\n\n";
}

void printPrice(const std::string& ticker, const std::optional<Quote>& quote) {
    if (!quote.has_value()) {
        std::cout << "  " << ticker << ": no data\n";
        return;
    }
    std::cout << std::fixed << std::setprecision(2);
    std::cout << "  " << ticker << ": " << quote->lastPrice << " "
              << "(close: " << quote->closePrice << ", "
              << "high: " << quote->dayHigh << ", "
              << "low: " << quote->dayLow << ")\n";
}

} // namespace

/**
 * @brief Демо 1: Экономия API-запросов
 *
 * Без кэша 50 запросов = 50 обращений к API.
 * С кэшем 50 запросов = 1 обращение (при TTL > времени теста).
 */
void demoApiSavings() {
    printSeparator("Demo 1: API Request Savings");

    auto api = std::make_shared<StubExchangeApi>(100, false);
    InstrumentService service(api, std::chrono::seconds(5));

    const int requestCount = 50;
    std::cout << "Requesting price for SBER " << requestCount << " times...\n\n";

    for (int i = 0; i < requestCount; ++i) {
        auto price = service.getPrice(kSber);
        if (i == 0) {
            std::cout << "First request (API call):\n";
            printPrice("SBER", price);
        }
    }

    service.printStats();

    std::cout << "\nResult: " << requestCount << " price requests, but only "
              << api->getTotalRequests() << " API call(s)!\n";
}

/**
 * @brief Демо 2: TTL по пространству имён
 *
 * Цены живут 500 мс, справочник — сутки.
 */
void demoTtlBehavior() {
    printSeparator("Demo 2: Per-Namespace TTL");

    auto api = std::make_shared<StubExchangeApi>(100, false);
    InstrumentService service(api, std::chrono::milliseconds(500));

    std::cout << "Quote TTL 500ms, instrument TTL 24h\n\n";

    service.getInstrument(kSber);
    service.getPrice(kSber);
    std::cout << "t=0ms:   API calls: " << api->getTotalRequests() << "\n";

    std::this_thread::sleep_for(std::chrono::milliseconds(200));
    service.getInstrument(kSber);
    service.getPrice(kSber);
    std::cout << "t=200ms: API calls: " << api->getTotalRequests() << " (both from cache)\n";

    std::this_thread::sleep_for(std::chrono::milliseconds(400));
    service.getInstrument(kSber);
    service.getPrice(kSber);
    std::cout << "t=600ms: API calls: " << api->getTotalRequests()
              << " (quote expired, instrument still cached)\n";
}

/**
 * @brief Демо 3: Стратегии
 */
void demoStrategies() {
    printSeparator("Demo 3: Strategies");

    auto api = std::make_shared<StubExchangeApi>(100, false);
    InstrumentService service(api, std::chrono::seconds(60));

    std::cout << "Fresh before anything is cached:\n";
    printPrice("GAZP", service.cachedPrice(kGazp));

    std::cout << "\nRefresh (loads and caches):\n";
    printPrice("GAZP", service.getPrice(kGazp));

    std::cout << "\nFresh (cache only):\n";
    printPrice("GAZP", service.cachedPrice(kGazp));

    std::cout << "\nInvalidate (drop and reload):\n";
    printPrice("GAZP", service.refreshPrice(kGazp));

    std::cout << "\nBypass (always API, cache updated):\n";
    printPrice("GAZP", service.livePrice(kGazp));

    std::cout << "\nUnknown instrument:\n";
    printPrice("????", service.getPrice("BBG000000000"));

    service.printStats();
}

/**
 * @brief Демо 4: Graceful Degradation при Rate Limit
 *
 * При превышении лимита отдаём закэшированную цену.
 */
void demoRateLimitHandling() {
    printSeparator("Demo 4: Rate Limit Handling");

    auto api = std::make_shared<StubExchangeApi>(5, false);
    InstrumentService service(api, std::chrono::seconds(60));

    std::cout << "API rate limit set to 5 requests per minute\n";
    std::cout << "Forcing 10 live requests...\n\n";

    int rateLimitCount = 0;
    for (int i = 0; i < 10; ++i) {
        try {
            auto price = service.livePrice(kSber);
            std::cout << "Request " << (i + 1) << ": live "
                      << std::fixed << std::setprecision(2) << price->lastPrice << "\n";
        } catch (const CacheError& e) {
            ++rateLimitCount;
            auto stale = service.cachedPrice(kSber);
            if (stale.has_value()) {
                std::cout << "Request " << (i + 1) << ": " << e.what()
                          << ", using cached " << stale->lastPrice << "\n";
            } else {
                std::cout << "Request " << (i + 1) << ": " << e.what()
                          << ", no cached data available\n";
            }
        }
    }

    std::cout << "\nRate limit hits: " << rateLimitCount << "\n";
    std::cout << "Cache allowed to continue serving requests despite rate limit!\n";
}

/**
 * @brief Демо 5: Повторы при сбоях API
 */
void demoRetries() {
    printSeparator("Demo 5: Retries");

    auto api = std::make_shared<StubExchangeApi>(100, false);
    InstrumentService service(api, std::chrono::seconds(60));

    api->failNext(2);
    std::cout << "API will fail the next 2 requests\n\n";

    try {
        service.getPrice(kLkoh);
    } catch (const CacheError& e) {
        std::cout << "Without retry: " << e.what() << "\n";
    }

    auto price = service.getPriceWithRetry(kLkoh, 2);
    std::cout << "With 2 retries (100ms, 200ms backoff):\n";
    printPrice("LKOH", price);

    service.printStats();
}

/**
 * @brief Демо 6: Журнал событий кэша
 */
void demoLogging() {
    printSeparator("Demo 6: Cache Event Log");

    auto api = std::make_shared<StubExchangeApi>(100, false);
    InstrumentService service(api, std::chrono::seconds(60), &std::cout);

    for (const auto& figi : {kSber, kGazp, kLkoh}) {
        auto info = service.getInstrument(figi);
        if (info.has_value()) {
            std::cout << "  " << info->ticker << " (" << info->name << "), lot "
                      << info->lot << "\n";
        }
    }

    std::cout << "\nSecond pass:\n";
    for (const auto& figi : {kSber, kGazp, kLkoh}) {
        service.getInstrument(figi);
    }
}

int main() {
    std::cout << "=== cachekit Demo: Stock Market Data ===\n";

    try {
        demoApiSavings();
        demoTtlBehavior();
        demoStrategies();
        demoRateLimitHandling();
        demoRetries();
        demoLogging();

        std::cout << "\n" << std::string(60, '=') << "\n";
        std::cout << "  Demo Complete!\n";
        std::cout << std::string(60, '=') << "\n";

    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    return 0;
}
