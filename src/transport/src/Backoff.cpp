/**
 * @file Backoff.cpp
 * @brief Capped exponential backoff.
 */

#include "src/transport/inc/Backoff.hpp"

#include <algorithm> // std::clamp, std::max

namespace vigil {

namespace transport {

BackoffPolicy::BackoffPolicy(std::chrono::milliseconds base, std::chrono::milliseconds max,
                             double jitter, std::uint64_t seed)
    : base_(std::max(base, std::chrono::milliseconds(0))), max_(std::max(max, base_)),
      jitter_(std::clamp(jitter, 0.0, 1.0)), rng_(seed) {}

std::chrono::milliseconds BackoffPolicy::nominalDelay(std::uint32_t attempt) const noexcept {
  if (attempt == 0 || base_.count() == 0) {
    return std::chrono::milliseconds(0);
  }
  std::int64_t delay = base_.count();
  for (std::uint32_t i = 1; i < attempt; ++i) {
    if (delay >= max_.count()) {
      break;
    }
    delay *= 2;
  }
  return std::chrono::milliseconds(std::min<std::int64_t>(delay, max_.count()));
}

std::chrono::milliseconds BackoffPolicy::delayFor(std::uint32_t attempt) {
  const std::chrono::milliseconds NOMINAL = nominalDelay(attempt);
  if (jitter_ == 0.0 || NOMINAL.count() == 0) {
    return NOMINAL;
  }
  std::uniform_real_distribution<double> dist(1.0 - jitter_, 1.0 + jitter_);
  const double SCALED = static_cast<double>(NOMINAL.count()) * dist(rng_);
  return std::chrono::milliseconds(static_cast<std::int64_t>(SCALED + 0.5));
}

} // namespace transport

} // namespace vigil
