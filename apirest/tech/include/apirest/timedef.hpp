#pragma once

#include <chrono>

namespace apirest {

/// Monotonic clock used for all deadlines (drain, polling, test timeouts).
using SteadyClock = std::chrono::steady_clock;
using SteadyTimePoint = SteadyClock::time_point;

}  // namespace apirest
