#ifndef VIGIL_STORAGE_STORAGE_BACKEND_HPP
#define VIGIL_STORAGE_STORAGE_BACKEND_HPP
/**
 * @file StorageBackend.hpp
 * @brief Capability interface shared by all durable snapshot stores.
 *
 * Contract every backend satisfies:
 *  - write() is append-only and atomic per snapshot; a concurrent reader
 *    never observes part of a snapshot
 *  - a second write of the same (hostname, timestamp) at millisecond
 *    precision stores nothing and returns DUPLICATE
 *  - query() returns whole snapshots ordered by timestamp ascending, ties by
 *    hostname, identical across backends for the same write sequence
 *
 * @note Implementations are thread-safe once open() has succeeded.
 */

#include "src/model/inc/MetricSnapshot.hpp"

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace vigil {

namespace storage {

/* ----------------------------- StorageStatus ----------------------------- */

/**
 * @brief Outcome of a storage operation.
 */
enum class StorageStatus : std::uint8_t {
  OK = 0,
  DUPLICATE,  ///< Snapshot with the same (hostname, timestamp) already stored
  NOT_OPEN,   ///< open() not called or close() already called
  IO_ERROR,   ///< Backend I/O failed; nothing was stored
  CORRUPT,    ///< Stored data could not be decoded
  BAD_CONFIG, ///< Backend misconfigured (unknown name, empty path)
};

/// @brief Human-readable status string.
[[nodiscard]] const char* toString(StorageStatus status) noexcept;

/**
 * @brief Status plus diagnostic text.
 */
struct StorageResult {
  StorageStatus status{StorageStatus::OK};
  std::string reason{};

  /// @brief True when the snapshot is durably stored (new or duplicate).
  [[nodiscard]] bool ok() const noexcept {
    return status == StorageStatus::OK || status == StorageStatus::DUPLICATE;
  }
};

/* ----------------------------- Query ----------------------------- */

/**
 * @brief Host and time-range selection. Bounds are inclusive.
 */
struct QueryFilter {
  std::string hostname{};                 ///< Empty selects every host
  std::optional<model::Timestamp> since{}; ///< Lower bound
  std::optional<model::Timestamp> until{}; ///< Upper bound
  std::size_t limit{0};                   ///< Max records, 0 for no limit
};

/// @brief True when a snapshot header falls inside the filter.
[[nodiscard]] bool matches(const QueryFilter& filter, const std::string& hostname,
                           std::int64_t tsMillis) noexcept;

/**
 * @brief Query outcome with the matching snapshots.
 */
struct QueryResult {
  StorageStatus status{StorageStatus::OK};
  std::string reason{};
  std::vector<model::MetricSnapshot> records{};

  [[nodiscard]] bool ok() const noexcept { return status == StorageStatus::OK; }
};

/* ----------------------------- StorageBackend ----------------------------- */

/**
 * @brief Durable snapshot store.
 */
class StorageBackend {
public:
  virtual ~StorageBackend() = default;

  /// @brief Create or attach to the store. Idempotent.
  virtual StorageResult open() = 0;

  /// @brief Persist one snapshot atomically.
  virtual StorageResult write(const model::MetricSnapshot& snapshot) = 0;

  /// @brief Read snapshots matching @p filter.
  [[nodiscard]] virtual QueryResult query(const QueryFilter& filter) = 0;

  /// @brief Cheap reachability probe for health checks.
  [[nodiscard]] virtual StorageResult ping() = 0;

  /// @brief Release resources. Further calls return NOT_OPEN until open().
  virtual void close() noexcept = 0;

  /// @brief Backend identifier ("sqlite", "tsdb").
  [[nodiscard]] virtual const char* name() const noexcept = 0;
};

/* ----------------------------- Factory ----------------------------- */

/**
 * @brief Backend selection and connection parameters.
 */
struct StorageConfig {
  std::string backend{};              ///< "sqlite" or "tsdb"
  std::string sqlitePath{};           ///< Database file for sqlite
  std::string tsdbPath{};             ///< Data directory for tsdb
  std::string tsdbBucket{"metrics"};  ///< Series file name within tsdbPath
};

/**
 * @brief Construct (but do not open) the configured backend.
 * @param reason Set when nullptr is returned.
 * @return nullptr on BAD_CONFIG.
 */
[[nodiscard]] std::unique_ptr<StorageBackend> makeBackend(const StorageConfig& config,
                                                          std::string& reason);

} // namespace storage

} // namespace vigil

#endif // VIGIL_STORAGE_STORAGE_BACKEND_HPP
