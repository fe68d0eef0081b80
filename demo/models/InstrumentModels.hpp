#pragma once

#include <cachekit/CacheError.hpp>
#include <cachekit/serialization/BinaryCodec.hpp>

#include <cstdint>
#include <string>

/**
 * @brief Модели справочных и рыночных данных биржи
 *
 * Обе модели — кэшируемые сущности: ключ, пространство имён
 * и бинарная раскладка полей описаны прямо в структуре.
 *
 * - FIGI (Financial Instrument Global Identifier) — глобальный идентификатор
 * - Ticker — короткое биржевое обозначение (SBER, GAZP)
 */

/**
 * @brief Справочные данные инструмента
 *
 * Меняются редко (раз в день или реже), рекомендуемый TTL — 24 часа.
 */
struct Instrument {
    using Key = std::string;

    std::string figi;               // "BBG004730N88"
    std::string ticker;             // "SBER"
    std::string name;               // "Сбербанк"
    std::string currency;           // "RUB"
    int32_t lot = 0;                // 10 — количество бумаг в 1 лоте
    double minPriceIncrement = 0.0; // 0.01 — минимальный шаг цены
    std::string classCode;          // "TQBR" — режим торгов

    Key cacheKey() const { return figi; }
    static constexpr const char* cachePrefix() { return "instrument"; }

    void writeTo(BinaryWriter& w) const {
        w.write(figi);
        w.write(ticker);
        w.write(name);
        w.write(currency);
        w.write(lot);
        w.write(minPriceIncrement);
        w.write(classCode);
    }

    static Instrument readFrom(BinaryReader& r) {
        Instrument info;
        r.read(info.figi);
        r.read(info.ticker);
        r.read(info.name);
        r.read(info.currency);
        r.read(info.lot);
        r.read(info.minPriceIncrement);
        r.read(info.classCode);
        return info;
    }

    void validate() const {
        if (lot <= 0) {
            throw CacheError(ErrorKind::Validation, "instrument " + figi + " has non-positive lot");
        }
    }
};

/**
 * @brief Последняя цена инструмента
 *
 * Меняется постоянно во время торговой сессии, рекомендуемый TTL — 1-5 секунд.
 *
 * @note Для высокочастотной торговли кэширование цен неприемлемо —
 *       нужны данные в реальном времени через WebSocket.
 */
struct Quote {
    using Key = std::string;

    std::string figi;
    double lastPrice = 0.0;     // Цена последней сделки
    double closePrice = 0.0;    // Цена закрытия предыдущего дня
    double dayHigh = 0.0;
    double dayLow = 0.0;
    int64_t volume = 0;         // Объём торгов (в лотах)
    int64_t timestampMs = 0;    // Время получения, мс от эпохи

    Key cacheKey() const { return figi; }
    static constexpr const char* cachePrefix() { return "quote"; }

    void writeTo(BinaryWriter& w) const {
        w.write(figi);
        w.write(lastPrice);
        w.write(closePrice);
        w.write(dayHigh);
        w.write(dayLow);
        w.write(volume);
        w.write(timestampMs);
    }

    static Quote readFrom(BinaryReader& r) {
        Quote quote;
        r.read(quote.figi);
        r.read(quote.lastPrice);
        r.read(quote.closePrice);
        r.read(quote.dayHigh);
        r.read(quote.dayLow);
        r.read(quote.volume);
        r.read(quote.timestampMs);
        return quote;
    }
};
