#ifndef VIGIL_STORAGE_TIME_SERIES_BACKEND_HPP
#define VIGIL_STORAGE_TIME_SERIES_BACKEND_HPP
/**
 * @file TimeSeriesBackend.hpp
 * @brief Tagged time-series points in an append-only line protocol file.
 *
 * Layout: `<directory>/<bucket>.lp`, one batch per snapshot (see
 * LineProtocol.hpp). open() scans the file once to build a (timestamp,
 * hostname) index of committed batches; a torn batch at the tail is cut off.
 * Queries read batch ranges with pread() under a shared lock; writes append,
 * fdatasync() and index under an exclusive lock.
 */

#include "src/storage/inc/StorageBackend.hpp"

#include <spdlog/logger.h>

#include <cstdint>
#include <memory>
#include <shared_mutex>
#include <string>
#include <vector>

namespace vigil {

namespace storage {

/**
 * @brief Line protocol file implementation of StorageBackend.
 */
class TimeSeriesBackend final : public StorageBackend {
public:
  /// @param directory Data directory, created when missing (single level).
  /// @param bucket Series file stem.
  TimeSeriesBackend(std::string directory, std::string bucket);
  ~TimeSeriesBackend() override;

  TimeSeriesBackend(const TimeSeriesBackend&) = delete;
  TimeSeriesBackend& operator=(const TimeSeriesBackend&) = delete;

  StorageResult open() override;
  StorageResult write(const model::MetricSnapshot& snapshot) override;
  [[nodiscard]] QueryResult query(const QueryFilter& filter) override;
  [[nodiscard]] StorageResult ping() override;
  void close() noexcept override;
  [[nodiscard]] const char* name() const noexcept override { return "tsdb"; }

  /// @brief Full path of the series file.
  [[nodiscard]] const std::string& filePath() const noexcept { return file_; }

  /// @brief Committed batches currently indexed.
  [[nodiscard]] std::size_t batchCount() const;

private:
  /// Location of one committed batch's point lines.
  struct IndexEntry {
    std::int64_t tsMillis{0};
    std::string hostname{};
    std::uint64_t offset{0};
    std::uint64_t length{0};
  };

  StorageResult loadIndex();
  void closeLocked() noexcept;

  std::string dir_;
  std::string bucket_;
  std::string file_;
  int fd_{-1};
  std::uint64_t end_{0};
  std::vector<IndexEntry> index_; ///< Sorted by (tsMillis, hostname)
  mutable std::shared_mutex mtx_;
  std::shared_ptr<spdlog::logger> log_;
};

} // namespace storage

} // namespace vigil

#endif // VIGIL_STORAGE_TIME_SERIES_BACKEND_HPP
