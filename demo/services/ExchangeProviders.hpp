#pragma once

#include "../models/InstrumentModels.hpp"
#include "../stub/StubExchangeApi.hpp"

#include <cachekit/provider/IDataProvider.hpp>

#include <memory>

/**
 * @brief Источники данных для движка кэша поверх биржевого API
 */
class InstrumentProvider : public IDataProvider<Instrument> {
public:
    explicit InstrumentProvider(std::shared_ptr<StubExchangeApi> api)
        : api_(std::move(api))
    {}

    std::optional<Instrument> fetchById(const std::string& figi) const override {
        return api_->getInstrumentByFigi(figi);
    }

    uint64_t count() const override {
        return api_->getAvailableFigis().size();
    }

private:
    std::shared_ptr<StubExchangeApi> api_;
};

class QuoteProvider : public IDataProvider<Quote> {
public:
    explicit QuoteProvider(std::shared_ptr<StubExchangeApi> api)
        : api_(std::move(api))
    {}

    std::optional<Quote> fetchById(const std::string& figi) const override {
        return api_->getLastPrice(figi);
    }

private:
    std::shared_ptr<StubExchangeApi> api_;
};
