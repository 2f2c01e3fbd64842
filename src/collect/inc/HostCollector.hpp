#ifndef VIGIL_COLLECT_HOST_COLLECTOR_HPP
#define VIGIL_COLLECT_HOST_COLLECTOR_HPP
/**
 * @file HostCollector.hpp
 * @brief Assembles one MetricSnapshot per call from the /proc and /sys readers.
 *
 * A failing sub-metric (unreadable file, statvfs error on one mount) is
 * omitted or zero-filled, logged as event=collection_error and reported in
 * CollectionResult::omitted; it never aborts the snapshot.
 */

#include "src/collect/inc/ProcReaders.hpp"
#include "src/model/inc/MetricSnapshot.hpp"

#include <spdlog/logger.h>

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace vigil {

namespace collect {

/* ----------------------------- CollectionStatus ----------------------------- */

/**
 * @brief Completeness of one collection round.
 */
enum class CollectionStatus : std::uint8_t {
  OK = 0,
  PARTIAL, ///< At least one sub-metric was omitted
};

/// @brief Human-readable status string.
[[nodiscard]] const char* toString(CollectionStatus status) noexcept;

/**
 * @brief Snapshot plus the list of omitted sub-metrics ("cpu", "disk:/data", ...).
 */
struct CollectionResult {
  model::SnapshotPtr snapshot{};
  CollectionStatus status{CollectionStatus::OK};
  std::vector<std::string> omitted{};
};

/* ----------------------------- ISnapshotSource ----------------------------- */

/**
 * @brief Anything that can produce snapshots on demand.
 */
class ISnapshotSource {
public:
  virtual ~ISnapshotSource() = default;

  /// @brief Produce one snapshot. Must not throw.
  virtual CollectionResult collect() = 0;
};

/* ----------------------------- HostCollector ----------------------------- */

/**
 * @brief Reads the local host.
 *
 * CPU percentages are computed against the previous call; the first call
 * reports the average since boot.
 *
 * @note Not thread-safe: call collect() from one thread (the sampler).
 */
class HostCollector final : public ISnapshotSource {
public:
  /// Collection counters.
  struct Stats {
    std::uint64_t rounds{0};        ///< collect() calls
    std::uint64_t partialRounds{0}; ///< Rounds with at least one omission
    std::uint64_t omissions{0};     ///< Omitted sub-metrics in total
  };

  HostCollector(std::string hostname, HostPaths paths);

  CollectionResult collect() override;

  [[nodiscard]] const Stats& stats() const noexcept { return stats_; }
  [[nodiscard]] const std::string& hostname() const noexcept { return hostname_; }

private:
  void collectCpu(model::MetricSnapshot& snap, std::vector<std::string>& omitted);
  void collectMemory(model::MetricSnapshot& snap, std::vector<std::string>& omitted);
  void collectDisk(model::MetricSnapshot& snap, std::vector<std::string>& omitted);
  void collectNetwork(model::MetricSnapshot& snap, std::vector<std::string>& omitted);

  std::string hostname_;
  HostPaths paths_;
  CpuTimesTable prevCpu_{};
  bool havePrevCpu_{false};
  Stats stats_{};
  std::shared_ptr<spdlog::logger> log_;
};

/* ----------------------------- API ----------------------------- */

/**
 * @brief gethostname() of this machine, "localhost" if unavailable.
 */
[[nodiscard]] std::string localHostname();

} // namespace collect

} // namespace vigil

#endif // VIGIL_COLLECT_HOST_COLLECTOR_HPP
