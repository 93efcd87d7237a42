#pragma once
/**
 * @file clock.hpp
 * @brief Time sources. Wall time stamps messages; steady time drives timeouts.
 *
 * Components never read a clock behind your back for timing decisions: the
 * tick loop passes `now_ms` (steady) in. Wall time is injected as a callable
 * so tests can freeze it.
 */

#include <chrono>
#include <cstdint>
#include <functional>

namespace beacon {

using WallClock = std::function<uint64_t()>;

/// Milliseconds since the Unix epoch (UTC).
inline uint64_t wall_clock_ms() {
  using namespace std::chrono;
  return static_cast<uint64_t>(
      duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count());
}

/// Monotonic milliseconds, for tick(now_ms).
inline uint64_t steady_clock_ms() {
  using namespace std::chrono;
  return static_cast<uint64_t>(
      duration_cast<milliseconds>(steady_clock::now().time_since_epoch()).count());
}

} // namespace beacon
