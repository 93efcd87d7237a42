#pragma once
/**
 * @file backoff.hpp
 * @brief Bounded exponential backoff for socket bind/connect attempts.
 *
 * Attempt numbering is 1-based. delay_before(n) is the wait before attempt n:
 * zero for the first attempt, then base, 2*base, 4*base ... capped at max_delay_ms.
 */

#include <cstdint>

namespace beacon {

struct RetryPolicy {
  uint32_t max_attempts{3};
  uint32_t base_delay_ms{1000};
  uint32_t max_delay_ms{4000};

  uint32_t delay_before(uint32_t attempt) const {
    if (attempt <= 1) return 0;
    uint64_t d = base_delay_ms;
    for (uint32_t i = 2; i < attempt && d < max_delay_ms; ++i) d *= 2;
    return d > max_delay_ms ? max_delay_ms : static_cast<uint32_t>(d);
  }

  bool exhausted(uint32_t attempts_made) const { return attempts_made >= max_attempts; }
};

} // namespace beacon
