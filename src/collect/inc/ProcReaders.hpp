#ifndef VIGIL_COLLECT_PROC_READERS_HPP
#define VIGIL_COLLECT_PROC_READERS_HPP
/**
 * @file ProcReaders.hpp
 * @brief Readers for /proc and /sys host metrics (Linux).
 *
 * Every reader takes a HostPaths so the agent can run in a container with the
 * host's /proc, /sys and / bind-mounted elsewhere (e.g. /host/proc).
 *
 * @note Thread-safe: All functions are stateless.
 */

#include "src/model/inc/MetricSnapshot.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace vigil {

namespace collect {

/* ----------------------------- HostPaths ----------------------------- */

/**
 * @brief Filesystem roots the readers resolve against.
 */
struct HostPaths {
  std::string procRoot{"/proc"}; ///< procfs mount
  std::string sysRoot{"/sys"};   ///< sysfs mount
  std::string rootfs{"/"};       ///< Prefix prepended to mount points for statvfs
};

/* ----------------------------- CPU ----------------------------- */

/**
 * @brief Cumulative jiffies from one /proc/stat cpu line.
 */
struct CpuTimes {
  std::uint64_t user{0};
  std::uint64_t nice{0};
  std::uint64_t system{0};
  std::uint64_t idle{0};
  std::uint64_t iowait{0};
  std::uint64_t irq{0};
  std::uint64_t softirq{0};
  std::uint64_t steal{0};
  std::uint64_t guest{0};     ///< Already included in user
  std::uint64_t guestNice{0}; ///< Already included in nice

  /// @brief Total time (guest fields excluded, the kernel counts them in user/nice).
  [[nodiscard]] std::uint64_t total() const noexcept;

  /// @brief Non-idle time (total minus idle and iowait).
  [[nodiscard]] std::uint64_t active() const noexcept;
};

/**
 * @brief Aggregate and per-CPU counters.
 */
struct CpuTimesTable {
  CpuTimes aggregate{};
  std::vector<CpuTimes> perCore; ///< Indexed by CPU id; offline gaps stay zero
};

/**
 * @brief Read <procRoot>/stat.
 * @return false if the file is unreadable or has no aggregate "cpu" line.
 */
[[nodiscard]] bool readCpuTimes(const HostPaths& paths, CpuTimesTable& out);

/**
 * @brief Active share of elapsed time between two readings.
 * @return Percent in [0, 100]; 0 when no time elapsed or counters went backwards.
 */
[[nodiscard]] double computeCpuPercent(const CpuTimes& before, const CpuTimes& after) noexcept;

/* ----------------------------- Memory ----------------------------- */

/**
 * @brief Raw /proc/meminfo fields in bytes.
 */
struct MemInfo {
  std::uint64_t totalBytes{0};
  std::uint64_t freeBytes{0};
  std::uint64_t availableBytes{0};
  std::uint64_t buffersBytes{0};
  std::uint64_t cachedBytes{0}; ///< Cached + SReclaimable
  std::uint64_t swapTotalBytes{0};
  std::uint64_t swapFreeBytes{0};
};

/**
 * @brief Read <procRoot>/meminfo.
 * @return false if unreadable or MemTotal is missing.
 */
[[nodiscard]] bool readMemInfo(const HostPaths& paths, MemInfo& out) noexcept;

/// @brief RAM group derived from meminfo (used = total - free - buffers - cached).
[[nodiscard]] model::MemoryMetrics toMemoryMetrics(const MemInfo& info) noexcept;

/// @brief Swap group derived from meminfo.
[[nodiscard]] model::SwapMetrics toSwapMetrics(const MemInfo& info) noexcept;

/* ----------------------------- Load ----------------------------- */

/**
 * @brief Read <procRoot>/loadavg.
 * @return false if unreadable or malformed.
 */
[[nodiscard]] bool readLoadAverage(const HostPaths& paths, model::LoadAverage& out) noexcept;

/* ----------------------------- Filesystems ----------------------------- */

/**
 * @brief One line of /proc/mounts (octal escapes decoded).
 */
struct MountEntry {
  std::string device{};
  std::string mountPoint{};
  std::string fsType{};

  /// @brief Backed by a real block device ("/dev/..." but not a loop image).
  [[nodiscard]] bool isBlockDevice() const noexcept;
};

/**
 * @brief Read <procRoot>/mounts.
 * @return false if the file cannot be opened.
 */
[[nodiscard]] bool readMountTable(const HostPaths& paths, std::vector<MountEntry>& out);

/**
 * @brief Mounts worth reporting: block devices, first occurrence of each mount point.
 */
[[nodiscard]] std::vector<MountEntry> selectPhysicalMounts(const std::vector<MountEntry>& mounts);

/**
 * @brief statvfs() the mount point under paths.rootfs.
 * @return false if statvfs fails or reports zero blocks.
 */
[[nodiscard]] bool readFilesystemUsage(const HostPaths& paths, const MountEntry& mount,
                                       model::FilesystemMetrics& out);

/* ----------------------------- Network ----------------------------- */

/**
 * @brief Sum statistics counters of every interface in <sysRoot>/class/net except "lo".
 * @return false if the interface directory cannot be listed.
 */
[[nodiscard]] bool readNetworkTotals(const HostPaths& paths, model::NetworkMetrics& out);

} // namespace collect

} // namespace vigil

#endif // VIGIL_COLLECT_PROC_READERS_HPP
