#pragma once

#include <ostream>

/**
 * @brief Стратегия выполнения операции кэша
 *
 * | Стратегия  | Читает кэш | Идёт в источник   | Пишет в кэш        |
 * |------------|------------|-------------------|--------------------|
 * | Fresh      | да         | никогда           | нет                |
 * | Refresh    | да         | при промахе       | после загрузки     |
 * | Invalidate | нет        | всегда            | удаляет, затем пишет |
 * | Bypass     | нет        | всегда            | после загрузки     |
 *
 * Refresh — классический cache-aside и стратегия по умолчанию.
 */
enum class CacheStrategy {
    Fresh,
    Refresh,
    Invalidate,
    Bypass
};

inline const char* toString(CacheStrategy strategy) {
    switch (strategy) {
        case CacheStrategy::Fresh:      return "Fresh";
        case CacheStrategy::Refresh:    return "Refresh";
        case CacheStrategy::Invalidate: return "Invalidate";
        case CacheStrategy::Bypass:     return "Bypass";
    }
    return "Unknown";
}

inline std::ostream& operator<<(std::ostream& os, CacheStrategy strategy) {
    return os << toString(strategy);
}
