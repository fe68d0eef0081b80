#pragma once

#include "ICacheMetrics.hpp"

#include <chrono>
#include <iostream>
#include <mutex>
#include <string>

/**
 * @brief Журнал событий движка в поток вывода
 *
 * Одна строка на событие:
 * @code
 *   [cachekit] HIT: user:42 (12us)
 *   [cachekit] ERROR: user:42 Backend error: connection refused
 * @endcode
 *
 * Использование:
 * @code
 *   auto log = std::make_shared<LoggingMetrics>("users", std::clog);
 *   CacheExpander expander(store, nullptr, log);
 * @endcode
 *
 * Для отключения журнала (бенчмарки) просто не подключаем этот приёмник.
 * Строки из разных потоков не перемешиваются: запись под mutex.
 */
class LoggingMetrics : public ICacheMetrics {
public:
    /**
     * @param prefix Префикс всех строк (например, имя сервиса)
     * @param os Поток вывода (по умолчанию std::cout)
     */
    explicit LoggingMetrics(const std::string& prefix = "cachekit",
                            std::ostream& os = std::cout)
        : prefix_(prefix)
        , os_(os)
    {}

    void recordHit(const std::string& key, Duration elapsed) override {
        write("HIT", key, elapsed);
    }

    void recordMiss(const std::string& key, Duration elapsed) override {
        write("MISS", key, elapsed);
    }

    void recordSet(const std::string& key, Duration elapsed) override {
        write("SET", key, elapsed);
    }

    void recordDelete(const std::string& key, Duration elapsed) override {
        write("DELETE", key, elapsed);
    }

    void recordError(const std::string& key, const std::string& error) override {
        std::lock_guard<std::mutex> lock(mutex_);
        os_ << "[" << prefix_ << "] ERROR: " << key << " " << error << "\n";
    }

private:
    void write(const char* event, const std::string& key, Duration elapsed) {
        auto us = std::chrono::duration_cast<std::chrono::microseconds>(elapsed).count();
        std::lock_guard<std::mutex> lock(mutex_);
        os_ << "[" << prefix_ << "] " << event << ": " << key << " (" << us << "us)\n";
    }

    std::string prefix_;
    std::ostream& os_;
    std::mutex mutex_;
};
