#pragma once

#include "ICacheMetrics.hpp"

/**
 * @brief Метрики по умолчанию — все события игнорируются
 */
class NoOpMetrics : public ICacheMetrics {};
