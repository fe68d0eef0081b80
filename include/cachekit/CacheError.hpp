#pragma once

#include <cstdint>
#include <ostream>
#include <stdexcept>
#include <string>

/**
 * @brief Категория ошибки кэш-слоя
 *
 * Категория определяет реакцию вызывающего кода:
 * - Deserialization / InvalidCacheEntry / VersionMismatch — удалить запись
 *   и пересчитать её из источника данных
 * - Backend / Repository / Timeout — временная недоступность, можно повторить
 * - Validation / Serialization / Config / NotImplemented — ошибка в коде
 *   или конфигурации, повтор не поможет
 */
enum class ErrorKind {
    Serialization,
    Deserialization,
    Validation,
    CacheMiss,
    Backend,
    Repository,
    Timeout,
    Config,
    NotImplemented,
    InvalidCacheEntry,
    VersionMismatch,
    Other
};

inline const char* toString(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::Serialization:     return "Serialization error";
        case ErrorKind::Deserialization:   return "Deserialization error";
        case ErrorKind::Validation:        return "Validation error";
        case ErrorKind::CacheMiss:         return "Cache miss";
        case ErrorKind::Backend:           return "Backend error";
        case ErrorKind::Repository:        return "Repository error";
        case ErrorKind::Timeout:           return "Timeout";
        case ErrorKind::Config:            return "Config error";
        case ErrorKind::NotImplemented:    return "Not implemented";
        case ErrorKind::InvalidCacheEntry: return "Invalid cache entry";
        case ErrorKind::VersionMismatch:   return "Cache version mismatch";
        case ErrorKind::Other:             return "Error";
    }
    return "Error";
}

inline std::ostream& operator<<(std::ostream& os, ErrorKind kind) {
    return os << toString(kind);
}

/**
 * @brief Исключение кэш-слоя
 *
 * Все операции библиотеки сообщают об ошибках через CacheError.
 * what() содержит "<категория>: <подробности>", например
 * "Backend error: connection refused".
 *
 * @code
 *   try {
 *       expander.execute(feeder, provider, CacheStrategy::Refresh);
 *   } catch (const CacheError& e) {
 *       if (e.kind() == ErrorKind::VersionMismatch) {
 *           // ожидаемо во время rolling-деплоя
 *       }
 *   }
 * @endcode
 */
class CacheError : public std::runtime_error {
public:
    CacheError(ErrorKind kind, const std::string& detail)
        : std::runtime_error(format(kind, detail))
        , kind_(kind)
        , detail_(detail)
    {}

    /**
     * @brief Ошибка без подробностей (например, CacheMiss)
     */
    explicit CacheError(ErrorKind kind)
        : std::runtime_error(toString(kind))
        , kind_(kind)
    {}

    ErrorKind kind() const noexcept { return kind_; }

    /**
     * @brief Текст без префикса категории
     */
    const std::string& detail() const noexcept { return detail_; }

    /**
     * @brief Имеет ли смысл повторять операцию
     */
    bool isRetryable() const noexcept {
        return kind_ == ErrorKind::Backend
            || kind_ == ErrorKind::Repository
            || kind_ == ErrorKind::Timeout;
    }

private:
    static std::string format(ErrorKind kind, const std::string& detail) {
        if (detail.empty()) {
            return toString(kind);
        }
        return std::string(toString(kind)) + ": " + detail;
    }

    ErrorKind kind_;
    std::string detail_;
};

/**
 * @brief Версия схемы в конверте не совпадает с текущей
 *
 * Штатная ситуация при rolling-деплое: старые экземпляры пишут
 * записи старой версии, новые их отвергают и пересчитывают.
 */
class VersionMismatchError : public CacheError {
public:
    VersionMismatchError(uint32_t expected, uint32_t found)
        : CacheError(ErrorKind::VersionMismatch,
                     "expected " + std::to_string(expected) +
                     ", found " + std::to_string(found))
        , expected_(expected)
        , found_(found)
    {}

    uint32_t expected() const noexcept { return expected_; }
    uint32_t found() const noexcept { return found_; }

private:
    uint32_t expected_;
    uint32_t found_;
};
