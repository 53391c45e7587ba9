#pragma once

#include <chrono>
#include <cstdint>

namespace twiper::upload {

/*
  Bounded exponential backoff:

      delay(n) = min(base * 2^(n-1), cap) + jitter * max_jitter

  `attempt` is the 1-based number of the attempt that just failed.
*/
struct RetryPolicy {
  std::chrono::milliseconds base{5'000};
  std::chrono::milliseconds cap{60'000};
  std::chrono::milliseconds max_jitter{500};

  std::chrono::milliseconds Delay(std::uint32_t attempt, double jitter_unit) const;
};

} // namespace twiper::upload
