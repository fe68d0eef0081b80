#pragma once

#include "ITtlPolicy.hpp"

/**
 * @brief Записи без срока жизни
 *
 * На уровне движка ведёт себя как StoreDefaultTtl (явный TTL не
 * передаётся); отдельный тип документирует намерение — справочные
 * данные, которые живут до явной инвалидации.
 */
class InfiniteTtl : public ITtlPolicy {
public:
    std::optional<Duration> resolve(const std::string& ns) const override {
        (void)ns;
        return std::nullopt;
    }
};
