#pragma once

#include <chrono>
#include <cstdint>
#include <vector>

/// Сырые байты записи в хранилище
using Bytes = std::vector<uint8_t>;

/// Часы для TTL и замеров времени операций
using Clock = std::chrono::steady_clock;
using TimePoint = Clock::time_point;
using Duration = Clock::duration;
