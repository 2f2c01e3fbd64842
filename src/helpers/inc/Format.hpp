#ifndef VIGIL_HELPERS_FORMAT_HPP
#define VIGIL_HELPERS_FORMAT_HPP
/**
 * @file Format.hpp
 * @brief Human-readable formatting for bytes and durations.
 *
 * Used by toString() methods, log lines and alert messages.
 */

#include <chrono>
#include <cstdint>
#include <string>

#include <fmt/core.h>
#include <fmt/format.h>

namespace vigil {
namespace helpers {
namespace format {

/* ----------------------------- API ----------------------------- */

/**
 * @brief Format bytes using binary units (KiB, MiB, GiB, TiB).
 * @param bytes Byte count.
 * @return Formatted string (e.g., "1.5 GiB").
 */
[[nodiscard]] inline std::string bytesBinary(std::uint64_t bytes) {
  if (bytes == 0) {
    return "0 B";
  }

  static constexpr std::uint64_t KIB = 1024ULL;
  static constexpr std::uint64_t MIB = KIB * 1024ULL;
  static constexpr std::uint64_t GIB = MIB * 1024ULL;
  static constexpr std::uint64_t TIB = GIB * 1024ULL;

  if (bytes >= TIB) {
    return fmt::format("{:.1f} TiB", static_cast<double>(bytes) / static_cast<double>(TIB));
  }
  if (bytes >= GIB) {
    return fmt::format("{:.1f} GiB", static_cast<double>(bytes) / static_cast<double>(GIB));
  }
  if (bytes >= MIB) {
    return fmt::format("{:.1f} MiB", static_cast<double>(bytes) / static_cast<double>(MIB));
  }
  if (bytes >= KIB) {
    return fmt::format("{:.1f} KiB", static_cast<double>(bytes) / static_cast<double>(KIB));
  }

  return fmt::format("{} B", bytes);
}

/**
 * @brief Format a duration with the largest whole unit ("250ms", "1.5s", "5m").
 */
[[nodiscard]] inline std::string duration(std::chrono::milliseconds d) {
  const std::int64_t MS = d.count();
  if (MS < 1000) {
    return fmt::format("{}ms", MS);
  }
  if (MS < 60'000) {
    return fmt::format("{:.3g}s", static_cast<double>(MS) / 1000.0);
  }
  if (MS % 60'000 == 0) {
    return fmt::format("{}m", MS / 60'000);
  }
  return fmt::format("{:.3g}m", static_cast<double>(MS) / 60'000.0);
}

} // namespace format
} // namespace helpers
} // namespace vigil

#endif // VIGIL_HELPERS_FORMAT_HPP
