#include "retry_policy.hpp"

#include <algorithm>

namespace twiper::upload {

std::chrono::milliseconds RetryPolicy::Delay(std::uint32_t attempt, double jitter_unit) const {
  auto delay = base;
  for (std::uint32_t i = 1; i < attempt && delay < cap; ++i) {
    delay *= 2;
  }
  delay = std::min(delay, cap);

  jitter_unit = std::clamp(jitter_unit, 0.0, 1.0);
  const auto jitter = std::chrono::milliseconds(static_cast<std::int64_t>(jitter_unit * static_cast<double>(max_jitter.count())));
  return delay + jitter;
}

} // namespace twiper::upload
