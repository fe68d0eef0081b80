#pragma once

#include "ICacheMetrics.hpp"

#include <memory>
#include <vector>

/**
 * @brief Рассылает каждое событие нескольким приёмникам
 *
 * Набор приёмников фиксируется до передачи в CacheExpander: после этого
 * объект только читается и безопасен для многих потоков.
 *
 * @code
 *   auto stats = std::make_shared<StatsMetrics>();
 *   auto composite = std::make_shared<CompositeMetrics>();
 *   composite->add(stats);
 *   composite->add(std::make_shared<LoggingMetrics>("users"));
 *   CacheExpander expander(store, nullptr, composite);
 * @endcode
 */
class CompositeMetrics : public ICacheMetrics {
public:
    CompositeMetrics() = default;

    explicit CompositeMetrics(std::vector<std::shared_ptr<ICacheMetrics>> sinks) {
        for (auto& sink : sinks) {
            add(std::move(sink));
        }
    }

    void add(std::shared_ptr<ICacheMetrics> sink) {
        if (sink) {
            sinks_.push_back(std::move(sink));
        }
    }

    size_t size() const { return sinks_.size(); }

    void recordHit(const std::string& key, Duration elapsed) override {
        for (auto& sink : sinks_) {
            sink->recordHit(key, elapsed);
        }
    }

    void recordMiss(const std::string& key, Duration elapsed) override {
        for (auto& sink : sinks_) {
            sink->recordMiss(key, elapsed);
        }
    }

    void recordSet(const std::string& key, Duration elapsed) override {
        for (auto& sink : sinks_) {
            sink->recordSet(key, elapsed);
        }
    }

    void recordDelete(const std::string& key, Duration elapsed) override {
        for (auto& sink : sinks_) {
            sink->recordDelete(key, elapsed);
        }
    }

    void recordError(const std::string& key, const std::string& error) override {
        for (auto& sink : sinks_) {
            sink->recordError(key, error);
        }
    }

private:
    std::vector<std::shared_ptr<ICacheMetrics>> sinks_;
};
