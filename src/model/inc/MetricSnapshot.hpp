#ifndef VIGIL_MODEL_METRIC_SNAPSHOT_HPP
#define VIGIL_MODEL_METRIC_SNAPSHOT_HPP
/**
 * @file MetricSnapshot.hpp
 * @brief One sampling round of host metrics.
 *
 * A snapshot is built once by the collector, then shared read-only
 * (SnapshotPtr) between the sampler, the transmission queue, storage and the
 * alert engine.
 *
 * Invariants (checked by validateSnapshot, not by construction):
 *  - all percentages lie in [0, 100]
 *  - usedBytes + freeBytes <= totalBytes for memory, swap and each filesystem
 *  - filesystem mount points are unique
 */

#include "src/helpers/inc/Clock.hpp"

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace vigil {

namespace model {

/// Collection instant (UTC, millisecond precision).
using Timestamp = vigil::helpers::clock::WallTime;

/* ----------------------------- CPU ----------------------------- */

/**
 * @brief 1/5/15-minute run-queue load averages.
 */
struct LoadAverage {
  double one{0.0};     ///< 1-minute load average
  double five{0.0};    ///< 5-minute load average
  double fifteen{0.0}; ///< 15-minute load average

  bool operator==(const LoadAverage&) const = default;
};

/**
 * @brief CPU utilization over the last sampling interval.
 */
struct CpuMetrics {
  double overallPercent{0.0};         ///< Active time across all CPUs (0-100)
  std::vector<double> perCorePercent; ///< Active time per logical CPU, indexed by CPU id
  LoadAverage loadAvg{};              ///< Load averages
  std::uint32_t coreCountLogical{0};  ///< Logical CPUs seen in /proc/stat

  bool operator==(const CpuMetrics&) const = default;
};

/* ----------------------------- Memory ----------------------------- */

/**
 * @brief RAM usage from /proc/meminfo.
 */
struct MemoryMetrics {
  std::uint64_t totalBytes{0};     ///< MemTotal
  std::uint64_t usedBytes{0};      ///< Total - free - buffers - cached
  std::uint64_t freeBytes{0};      ///< MemFree
  std::uint64_t availableBytes{0}; ///< MemAvailable
  std::uint64_t buffersBytes{0};   ///< Buffers
  std::uint64_t cachedBytes{0};    ///< Cached + SReclaimable
  double percentUsed{0.0};         ///< usedBytes / totalBytes (0-100)

  bool operator==(const MemoryMetrics&) const = default;
};

/**
 * @brief Swap usage from /proc/meminfo.
 */
struct SwapMetrics {
  std::uint64_t totalBytes{0}; ///< SwapTotal
  std::uint64_t usedBytes{0};  ///< SwapTotal - SwapFree
  std::uint64_t freeBytes{0};  ///< SwapFree
  double percentUsed{0.0};     ///< 0 when swap is disabled

  bool operator==(const SwapMetrics&) const = default;
};

/* ----------------------------- Disk ----------------------------- */

/**
 * @brief Capacity of one mounted filesystem.
 */
struct FilesystemMetrics {
  std::string mountPoint{};     ///< Mount point, unique within a snapshot
  std::string device{};         ///< Backing device (e.g. "/dev/nvme0n1p2")
  std::string filesystemType{}; ///< e.g. "ext4"
  std::uint64_t totalBytes{0};  ///< f_blocks * f_frsize
  std::uint64_t usedBytes{0};   ///< (f_blocks - f_bfree) * f_frsize
  std::uint64_t freeBytes{0};   ///< f_bavail * f_frsize
  double percentUsed{0.0};      ///< used / (used + free), as df reports it

  bool operator==(const FilesystemMetrics&) const = default;
};

/**
 * @brief All sampled filesystems.
 */
struct DiskMetrics {
  std::vector<FilesystemMetrics> filesystems;

  /// @brief Find a filesystem by mount point, nullptr if absent.
  [[nodiscard]] const FilesystemMetrics* find(std::string_view mountPoint) const noexcept;

  bool operator==(const DiskMetrics&) const = default;
};

/* ----------------------------- Network ----------------------------- */

/**
 * @brief Cumulative counters summed over non-loopback interfaces.
 */
struct NetworkMetrics {
  std::uint64_t bytesSent{0};   ///< tx_bytes
  std::uint64_t bytesRecv{0};   ///< rx_bytes
  std::uint64_t packetsSent{0}; ///< tx_packets
  std::uint64_t packetsRecv{0}; ///< rx_packets
  std::uint64_t errorsIn{0};    ///< rx_errors
  std::uint64_t errorsOut{0};   ///< tx_errors
  std::uint64_t dropsIn{0};     ///< rx_dropped
  std::uint64_t dropsOut{0};    ///< tx_dropped

  bool operator==(const NetworkMetrics&) const = default;
};

/* ----------------------------- MetricSnapshot ----------------------------- */

/**
 * @brief Complete point-in-time metric set from one host.
 */
struct MetricSnapshot {
  std::string hostname{};  ///< Stable identifier of the origin host
  Timestamp timestamp{};   ///< Collection time; epoch means "missing"
  CpuMetrics cpu{};        ///< CPU group
  MemoryMetrics memory{};  ///< RAM group
  SwapMetrics swap{};      ///< Swap group
  DiskMetrics disk{};      ///< Filesystem group
  NetworkMetrics network{}; ///< Network group

  /// @brief True when a collection timestamp has been set.
  [[nodiscard]] bool hasTimestamp() const noexcept;

  /// @brief One-line human-readable summary for logs.
  [[nodiscard]] std::string toString() const;

  bool operator==(const MetricSnapshot&) const = default;
};

/// Immutable shared snapshot handed between pipeline stages.
using SnapshotPtr = std::shared_ptr<const MetricSnapshot>;

/* ----------------------------- Helpers ----------------------------- */

/**
 * @brief Percentage of used over total, 0 when total is 0, clamped to [0, 100].
 */
[[nodiscard]] double percentOf(std::uint64_t used, std::uint64_t total) noexcept;

} // namespace model

} // namespace vigil

#endif // VIGIL_MODEL_METRIC_SNAPSHOT_HPP
