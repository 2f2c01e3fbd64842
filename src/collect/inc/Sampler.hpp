#ifndef VIGIL_COLLECT_SAMPLER_HPP
#define VIGIL_COLLECT_SAMPLER_HPP
/**
 * @file Sampler.hpp
 * @brief Fixed-rate sampling loop.
 *
 * Ticks are scheduled at start + k * interval on the steady clock. A slow
 * collection round never shifts later ticks; ticks that have already passed
 * are skipped (counted in missedTicks) rather than run back to back.
 *
 * Each snapshot is passed to SnapshotSink::submit(), which must return
 * without waiting for network I/O.
 */

#include "src/collect/inc/HostCollector.hpp"

#include <spdlog/logger.h>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <thread>

namespace vigil {

namespace collect {

/* ----------------------------- SnapshotSink ----------------------------- */

/**
 * @brief Consumer of sampled snapshots.
 */
class SnapshotSink {
public:
  virtual ~SnapshotSink() = default;

  /// @brief Accept a snapshot. Must not block on delivery.
  virtual void submit(model::SnapshotPtr snapshot) = 0;
};

/* ----------------------------- Sampler ----------------------------- */

/**
 * @brief Runs source.collect() on its own thread once per interval.
 */
class Sampler {
public:
  Sampler(ISnapshotSource& source, SnapshotSink& sink, std::chrono::milliseconds interval);
  ~Sampler();

  Sampler(const Sampler&) = delete;
  Sampler& operator=(const Sampler&) = delete;

  /**
   * @brief Start the loop; the first tick fires immediately.
   * @return false if already running or the interval is not positive.
   */
  bool start();

  /// @brief Cancel the timer and join. Idempotent; interrupts the inter-tick wait promptly.
  void stop();

  [[nodiscard]] bool running() const noexcept { return running_.load(); }

  /// @brief Completed collection rounds.
  [[nodiscard]] std::uint64_t ticks() const noexcept { return ticks_.load(); }

  /// @brief Ticks skipped because a round overran its slot.
  [[nodiscard]] std::uint64_t missedTicks() const noexcept { return missed_.load(); }

private:
  void run();

  ISnapshotSource& source_;
  SnapshotSink& sink_;
  std::chrono::milliseconds interval_;

  std::thread thread_;
  std::mutex mtx_;
  std::condition_variable cv_;
  bool stopRequested_{false};

  std::atomic<bool> running_{false};
  std::atomic<std::uint64_t> ticks_{0};
  std::atomic<std::uint64_t> missed_{0};
  std::shared_ptr<spdlog::logger> log_;
};

} // namespace collect

} // namespace vigil

#endif // VIGIL_COLLECT_SAMPLER_HPP
