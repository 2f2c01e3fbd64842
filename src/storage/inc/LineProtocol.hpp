#ifndef VIGIL_STORAGE_LINE_PROTOCOL_HPP
#define VIGIL_STORAGE_LINE_PROTOCOL_HPP
/**
 * @file LineProtocol.hpp
 * @brief InfluxDB line protocol encoding of snapshots.
 *
 * One snapshot becomes one batch: a run of points sharing the same
 * nanosecond timestamp, then a commit marker comment:
 *
 *   cpu_usage,hostname=web-01,type=overall percent=12.5,core_count_logical=8u 1714564800000000000
 *   cpu_usage,hostname=web-01,type=per_core,core=0 percent=10 1714564800000000000
 *   load_average,hostname=web-01 load_1m=0.5,load_5m=0.4,load_15m=0.3 1714564800000000000
 *   memory_usage,... / swap_usage,... / disk_usage,...,mount_point=/ ... / network_io,...
 *   # commit hostname=web-01 ts=1714564800000000000 points=7
 *
 * Influx treats '#' lines as comments, so the file stays importable as-is.
 * A batch without its commit marker was torn by a crash and is discarded.
 */

#include "src/model/inc/MetricSnapshot.hpp"
#include "src/storage/inc/StorageBackend.hpp"

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace vigil {

namespace storage {

/* ----------------------------- Point ----------------------------- */

/**
 * @brief One decoded line-protocol point. Field values keep their type suffix.
 */
struct Point {
  std::string measurement{};
  std::vector<std::pair<std::string, std::string>> tags{};
  std::vector<std::pair<std::string, std::string>> fields{};
  std::int64_t timestampNs{0};

  /// @brief Tag value, nullptr if absent.
  [[nodiscard]] const std::string* tag(std::string_view key) const noexcept;
  /// @brief Raw field value, nullptr if absent.
  [[nodiscard]] const std::string* field(std::string_view key) const noexcept;
};

/**
 * @brief Header carried by a commit marker.
 */
struct BatchHeader {
  std::string hostname{};
  std::int64_t tsMillis{0};
  std::size_t points{0};
};

/* ----------------------------- API ----------------------------- */

/// @brief Escape a measurement, tag key or tag value (comma, space, equals, backslash).
[[nodiscard]] std::string escapeTag(std::string_view raw);

/// @brief Reverse escapeTag().
[[nodiscard]] std::string unescapeTag(std::string_view escaped);

/**
 * @brief Encode the points of one snapshot (no commit marker).
 * @param points Set to the number of lines emitted.
 */
[[nodiscard]] std::string encodePoints(const model::MetricSnapshot& snapshot, std::size_t& points);

/// @brief Commit marker line, newline-terminated.
[[nodiscard]] std::string encodeCommit(const std::string& hostname, std::int64_t tsMillis,
                                       std::size_t points);

/// @brief True if @p line (no newline) is a commit marker; fills @p out.
[[nodiscard]] bool parseCommit(std::string_view line, BatchHeader& out);

/// @brief Parse one point line (no newline).
[[nodiscard]] bool parsePoint(std::string_view line, Point& out, std::string& error);

/**
 * @brief Rebuild a snapshot from the point lines of one batch.
 * @return OK, or CORRUPT with @p reason.
 */
[[nodiscard]] StorageStatus decodePoints(std::string_view text, model::MetricSnapshot& out,
                                         std::string& reason);

} // namespace storage

} // namespace vigil

#endif // VIGIL_STORAGE_LINE_PROTOCOL_HPP
