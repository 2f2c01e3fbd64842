#ifndef VIGIL_HELPERS_CLOCK_HPP
#define VIGIL_HELPERS_CLOCK_HPP
/**
 * @file Clock.hpp
 * @brief Wall-clock time helpers.
 *
 * Wall-clock milliseconds stamp snapshots and alerts.
 */

#include <chrono>
#include <cstdint>

namespace vigil {
namespace helpers {
namespace clock {

/// Wall-clock instant at millisecond precision (UTC).
using WallTime = std::chrono::time_point<std::chrono::system_clock, std::chrono::milliseconds>;

/* ----------------------------- API ----------------------------- */

/**
 * @brief Current wall-clock time truncated to milliseconds.
 */
[[nodiscard]] inline WallTime wallNow() noexcept {
  return std::chrono::time_point_cast<std::chrono::milliseconds>(
      std::chrono::system_clock::now());
}

/**
 * @brief Milliseconds since the Unix epoch.
 */
[[nodiscard]] inline std::int64_t toUnixMillis(WallTime t) noexcept {
  return t.time_since_epoch().count();
}

/**
 * @brief Wall time from milliseconds since the Unix epoch.
 */
[[nodiscard]] inline WallTime fromUnixMillis(std::int64_t ms) noexcept {
  return WallTime{std::chrono::milliseconds{ms}};
}

} // namespace clock
} // namespace helpers
} // namespace vigil

#endif // VIGIL_HELPERS_CLOCK_HPP
