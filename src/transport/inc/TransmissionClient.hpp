#ifndef VIGIL_TRANSPORT_TRANSMISSION_CLIENT_HPP
#define VIGIL_TRANSPORT_TRANSMISSION_CLIENT_HPP
/**
 * @file TransmissionClient.hpp
 * @brief Reliable snapshot delivery to the ingestion endpoint.
 *
 * Sampler --submit()--> [bounded queue, drop-oldest] --worker--> deliver()
 *
 * deliver() drives one DeliveryAttempt through
 *   IDLE -> ATTEMPTING -> (SUCCEEDED | BACKOFF -> ATTEMPTING ... | EXHAUSTED)
 * Connect failures, timeouts, I/O errors and 5xx are retried; 4xx is final.
 * maxAttempts bounds total calls per snapshot. Backoff waits on a condition
 * variable so stop() interrupts them immediately.
 *
 * At most one delivery is in flight; snapshots arriving meanwhile queue up to
 * queueDepth, evicting the oldest on overflow.
 */

#include "src/collect/inc/Sampler.hpp"
#include "src/transport/inc/Backoff.hpp"
#include "src/transport/inc/HttpClient.hpp"

#include <spdlog/logger.h>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

namespace vigil {

namespace transport {

/* ----------------------------- DeliveryStatus ----------------------------- */

enum class DeliveryStatus : std::uint8_t {
  DELIVERED = 0, ///< Endpoint acknowledged (2xx)
  REJECTED,      ///< Endpoint refused (4xx); not retried
  EXHAUSTED,     ///< All attempts failed; snapshot dropped
  CANCELLED,     ///< Shutdown interrupted the delivery
};

/// @brief Human-readable status string.
[[nodiscard]] const char* toString(DeliveryStatus status) noexcept;

/**
 * @brief Outcome of deliver().
 */
struct DeliveryResult {
  DeliveryStatus status{DeliveryStatus::DELIVERED};
  std::uint32_t attempts{0}; ///< Calls made to the endpoint
  int httpStatus{0};         ///< Last HTTP status, 0 if none received
  std::string lastError{};   ///< Last failure description
};

/// Delivery state machine states.
enum class DeliveryState : std::uint8_t {
  IDLE = 0,
  ATTEMPTING,
  BACKOFF,
  SUCCEEDED,
  EXHAUSTED,
};

/// @brief Human-readable state string.
[[nodiscard]] const char* toString(DeliveryState state) noexcept;

/* ----------------------------- IngestTransport ----------------------------- */

/**
 * @brief One ingest call; the seam for tests.
 */
class IngestTransport {
public:
  virtual ~IngestTransport() = default;

  /// @brief POST body to the ingest endpoint; must return within its own timeout.
  virtual HttpResponse post(const std::string& body) = 0;
};

/**
 * @brief IngestTransport over HttpClient.
 */
class HttpIngestTransport final : public IngestTransport {
public:
  HttpIngestTransport(std::string url, std::chrono::milliseconds timeout, bool verifyTls = true);

  HttpResponse post(const std::string& body) override;

private:
  HttpClient client_;
  std::string url_;
  std::chrono::milliseconds timeout_;
};

/* ----------------------------- TransmissionClient ----------------------------- */

struct TransmissionConfig {
  std::uint32_t maxAttempts{3};                    ///< Total calls per snapshot (>= 1)
  std::chrono::milliseconds backoffBase{1000};     ///< Delay after the first failure
  std::chrono::milliseconds backoffMax{30'000};    ///< Cap on the nominal delay
  double jitter{BackoffPolicy::DEFAULT_JITTER};    ///< +/- fraction
  std::size_t queueDepth{2};                       ///< Pending snapshots (>= 1)
  std::chrono::milliseconds shutdownGrace{2000};   ///< stop() wait before cancelling
};

/**
 * @brief Delivery counters.
 */
struct TransmissionStats {
  std::uint64_t submitted{0};       ///< submit() calls accepted into the queue
  std::uint64_t attempts{0};        ///< Endpoint calls
  std::uint64_t delivered{0};       ///< Snapshots acknowledged
  std::uint64_t rejected{0};        ///< Snapshots refused with 4xx
  std::uint64_t exhausted{0};       ///< Snapshots dropped after maxAttempts
  std::uint64_t cancelled{0};       ///< Deliveries interrupted by stop()
  std::uint64_t overflowDropped{0}; ///< Snapshots evicted from a full queue
};

class TransmissionClient final : public collect::SnapshotSink {
public:
  TransmissionClient(IngestTransport& transport, TransmissionConfig config,
                     std::uint64_t jitterSeed = std::random_device{}());
  ~TransmissionClient() override;

  TransmissionClient(const TransmissionClient&) = delete;
  TransmissionClient& operator=(const TransmissionClient&) = delete;

  /**
   * @brief Deliver one snapshot synchronously with retry and backoff.
   * @note Call from one thread at a time (the worker does when started).
   */
  DeliveryResult deliver(const model::MetricSnapshot& snapshot);

  /// @brief Queue for the worker; never blocks. Drops the oldest entry when full.
  void submit(model::SnapshotPtr snapshot) override;

  /// @brief Start the delivery worker.
  bool start();

  /**
   * @brief Stop accepting and join the worker.
   *
   * A request already on the wire gets up to shutdownGrace to finish; a
   * delivery waiting in backoff is cancelled at once. Queued snapshots are
   * discarded.
   */
  void stop();

  [[nodiscard]] TransmissionStats stats() const noexcept;
  [[nodiscard]] DeliveryState state() const noexcept { return state_.load(); }
  [[nodiscard]] std::size_t queued() const;

private:
  void run();
  bool waitBackoff(std::chrono::milliseconds delay);

  IngestTransport& transport_;
  TransmissionConfig config_;
  BackoffPolicy backoff_;

  mutable std::mutex mtx_;
  std::condition_variable cv_;     ///< Queue, cancellation and idle signalling
  std::deque<model::SnapshotPtr> queue_;
  bool accepting_{true};
  bool cancel_{false};
  bool busy_{false};
  std::thread worker_;

  std::atomic<DeliveryState> state_{DeliveryState::IDLE};
  std::atomic<std::uint64_t> submitted_{0};
  std::atomic<std::uint64_t> attempts_{0};
  std::atomic<std::uint64_t> delivered_{0};
  std::atomic<std::uint64_t> rejected_{0};
  std::atomic<std::uint64_t> exhausted_{0};
  std::atomic<std::uint64_t> cancelled_{0};
  std::atomic<std::uint64_t> overflowDropped_{0};

  std::shared_ptr<spdlog::logger> log_;
};

} // namespace transport

} // namespace vigil

#endif // VIGIL_TRANSPORT_TRANSMISSION_CLIENT_HPP
