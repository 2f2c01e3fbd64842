#ifndef VIGIL_TRANSPORT_BACKOFF_HPP
#define VIGIL_TRANSPORT_BACKOFF_HPP
/**
 * @file Backoff.hpp
 * @brief Capped exponential backoff with symmetric jitter.
 *
 * nominal(n) = min(max, base * 2^(n-1)) for the n-th failed attempt;
 * delayFor(n) = nominal(n) scaled by a uniform factor in [1 - jitter, 1 + jitter].
 *
 * @note Not thread-safe: owns a random engine.
 */

#include <chrono>
#include <cstdint>
#include <random>

namespace vigil {

namespace transport {

class BackoffPolicy {
public:
  /// Default jitter fraction (+/-20 %).
  static constexpr double DEFAULT_JITTER = 0.2;

  BackoffPolicy(std::chrono::milliseconds base, std::chrono::milliseconds max,
                double jitter = DEFAULT_JITTER, std::uint64_t seed = std::random_device{}());

  /// @brief Un-jittered delay after the n-th failed attempt (n >= 1).
  [[nodiscard]] std::chrono::milliseconds nominalDelay(std::uint32_t attempt) const noexcept;

  /// @brief Jittered delay after the n-th failed attempt (n >= 1).
  [[nodiscard]] std::chrono::milliseconds delayFor(std::uint32_t attempt);

  [[nodiscard]] std::chrono::milliseconds base() const noexcept { return base_; }
  [[nodiscard]] std::chrono::milliseconds max() const noexcept { return max_; }
  [[nodiscard]] double jitter() const noexcept { return jitter_; }

private:
  std::chrono::milliseconds base_;
  std::chrono::milliseconds max_;
  double jitter_;
  std::mt19937_64 rng_;
};

} // namespace transport

} // namespace vigil

#endif // VIGIL_TRANSPORT_BACKOFF_HPP
