#ifndef VIGIL_INGEST_INGESTION_SERVICE_HPP
#define VIGIL_INGEST_INGESTION_SERVICE_HPP
/**
 * @file IngestionService.hpp
 * @brief Validates incoming snapshots and routes them to storage and alerting.
 *
 * ingest():
 *   validate -> hand off to the alert pool (async) -> storage write (sync)
 *
 * Rejected snapshots reach neither consumer. The alert hand-off happens before
 * the write so a storage stall never delays evaluation, and evaluation runs on
 * its own threads so it never delays the write. A duplicate write is
 * acknowledged as accepted.
 *
 * shutdown() refuses new writes, waits for in-flight writes, drains the alert
 * pool and then closes the storage backend.
 */

#include "src/alert/inc/AlertDispatcher.hpp"
#include "src/alert/inc/AlertEngine.hpp"
#include "src/model/inc/MetricSnapshot.hpp"
#include "src/storage/inc/StorageBackend.hpp"

#include <boost/asio/thread_pool.hpp>

#include <spdlog/logger.h>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace vigil {

namespace ingest {

/* ----------------------------- IngestStatus ----------------------------- */

enum class IngestStatus : std::uint8_t {
  ACCEPTED = 0,   ///< Stored (or already stored)
  REJECTED,       ///< Failed validation; nothing stored
  STORAGE_FAILED, ///< Backend write failed; caller should retry
  SHUTTING_DOWN,  ///< Service no longer accepts writes
};

/// @brief Human-readable status string.
[[nodiscard]] const char* toString(IngestStatus status) noexcept;

struct IngestResult {
  IngestStatus status{IngestStatus::ACCEPTED};
  std::string reason{};
  bool duplicate{false}; ///< Accepted as an idempotent retry

  [[nodiscard]] bool ok() const noexcept { return status == IngestStatus::ACCEPTED; }
};

/* ----------------------------- Summary ----------------------------- */

/**
 * @brief Aggregates over a query window.
 */
struct Summary {
  std::uint64_t samples{0};
  double avgCpu{0.0};
  double maxCpu{0.0};
  double avgMemory{0.0};
  double maxMemory{0.0};
};

struct SummaryResult {
  storage::StorageStatus status{storage::StorageStatus::OK};
  std::string reason{};
  Summary summary{};

  [[nodiscard]] bool ok() const noexcept { return status == storage::StorageStatus::OK; }
};

/// @brief Aggregate already-queried records.
[[nodiscard]] Summary summarize(const std::vector<model::MetricSnapshot>& records) noexcept;

/* ----------------------------- IngestionService ----------------------------- */

struct IngestConfig {
  std::size_t alertThreads{1};       ///< Evaluation threads (1 keeps per-host order)
  std::size_t alertBacklog{1024};    ///< Pending evaluations before new ones are dropped
};

/// Service counters.
struct IngestStats {
  std::uint64_t accepted{0};
  std::uint64_t duplicates{0};      ///< Subset of accepted
  std::uint64_t rejected{0};
  std::uint64_t storageFailures{0};
  std::uint64_t refused{0};         ///< Calls after shutdown
  std::uint64_t alertEvents{0};     ///< Events handed to the dispatcher
  std::uint64_t alertDropped{0};    ///< Evaluations skipped because of backlog
};

class IngestionService {
public:
  /**
   * @param storage Opened backend; closed by shutdown().
   * @param engine Threshold engine, nullptr disables alerting.
   * @param dispatcher Channel fan-out, nullptr logs events only.
   */
  IngestionService(storage::StorageBackend& storage, alert::AlertEngine* engine,
                   alert::AlertDispatcher* dispatcher, IngestConfig config = {});
  ~IngestionService();

  IngestionService(const IngestionService&) = delete;
  IngestionService& operator=(const IngestionService&) = delete;

  /**
   * @brief Validate and store one snapshot. Safe to call concurrently.
   * @param hostname Reporting host; overrides snapshot.hostname.
   */
  IngestResult ingest(const std::string& hostname, const model::MetricSnapshot& snapshot);

  /// @brief Stored snapshots, ordered by timestamp then hostname.
  [[nodiscard]] storage::QueryResult query(const storage::QueryFilter& filter);

  /// @brief CPU and memory aggregates over the matching snapshots.
  [[nodiscard]] SummaryResult summary(const storage::QueryFilter& filter);

  /// @brief Accepting writes and storage reachable.
  [[nodiscard]] bool healthy();

  /// @brief Stop accepting, finish in-flight work and close storage. Idempotent.
  void shutdown();

  /// @brief Block until queued alert evaluations have run (tests and shutdown).
  bool waitAlertsIdle(std::chrono::milliseconds timeout);

  [[nodiscard]] IngestStats stats() const noexcept;
  [[nodiscard]] const char* backendName() const noexcept { return storage_.name(); }

private:
  void evaluate(const model::SnapshotPtr& snapshot);

  storage::StorageBackend& storage_;
  alert::AlertEngine* engine_;
  alert::AlertDispatcher* dispatcher_;
  IngestConfig config_;
  boost::asio::thread_pool alertPool_;

  std::mutex mtx_;
  std::condition_variable cv_;
  bool accepting_{true};
  bool closed_{false};
  std::size_t inFlight_{0};
  std::size_t alertPending_{0};

  std::atomic<std::uint64_t> accepted_{0};
  std::atomic<std::uint64_t> duplicates_{0};
  std::atomic<std::uint64_t> rejected_{0};
  std::atomic<std::uint64_t> storageFailures_{0};
  std::atomic<std::uint64_t> refused_{0};
  std::atomic<std::uint64_t> alertEvents_{0};
  std::atomic<std::uint64_t> alertDropped_{0};

  std::shared_ptr<spdlog::logger> log_;
};

} // namespace ingest

} // namespace vigil

#endif // VIGIL_INGEST_INGESTION_SERVICE_HPP
