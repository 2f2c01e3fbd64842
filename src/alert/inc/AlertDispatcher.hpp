#ifndef VIGIL_ALERT_ALERT_DISPATCHER_HPP
#define VIGIL_ALERT_ALERT_DISPATCHER_HPP
/**
 * @file AlertDispatcher.hpp
 * @brief Fan-out of AlertEvents to notification channels.
 *
 * Every channel owns a lane: a bounded queue (drop-oldest) and one worker
 * thread. A slow or failing channel only delays its own lane. Retryable
 * failures are retried up to `retries` more times with a fixed delay, then the
 * event is dropped and logged as event=channel_failed.
 */

#include "src/alert/inc/Channels.hpp"
#include "src/model/inc/AlertTypes.hpp"

#include <spdlog/logger.h>

#include <chrono>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace vigil {

namespace alert {

struct DispatcherConfig {
  std::uint32_t retries{2};                   ///< Extra attempts after the first (alerts.channel_retries)
  std::chrono::milliseconds retryDelay{1000}; ///< Wait between attempts
  std::size_t queueDepth{64};                 ///< Pending events per channel (>= 1)
};

/// Per-channel delivery counters.
struct ChannelStats {
  std::string channel{};
  std::uint64_t sent{0};    ///< Events delivered
  std::uint64_t failed{0};  ///< Events given up on
  std::uint64_t retries{0}; ///< Repeat attempts made
  std::uint64_t dropped{0}; ///< Events evicted from a full queue or discarded at stop
};

class AlertDispatcher {
public:
  AlertDispatcher(std::vector<std::unique_ptr<NotificationChannel>> channels,
                  DispatcherConfig config);
  ~AlertDispatcher();

  AlertDispatcher(const AlertDispatcher&) = delete;
  AlertDispatcher& operator=(const AlertDispatcher&) = delete;

  /// @brief Start one worker per channel. Events dispatched earlier are delivered.
  bool start();

  /**
   * @brief Stop all lanes.
   *
   * Retry waits are interrupted, queued events are discarded and counted as
   * dropped. A send already in progress finishes first.
   */
  void stop();

  /// @brief Queue the event on every channel; never blocks on delivery.
  void dispatch(const model::AlertEvent& event);

  /// @brief Wait until every lane is empty and idle.
  bool waitIdle(std::chrono::milliseconds timeout);

  [[nodiscard]] std::vector<ChannelStats> stats() const;
  [[nodiscard]] std::size_t channelCount() const noexcept { return lanes_.size(); }

private:
  struct Lane;

  void run(Lane& lane);
  void deliver(Lane& lane, const model::AlertEvent& event);

  DispatcherConfig config_;
  std::vector<std::unique_ptr<Lane>> lanes_;
  std::shared_ptr<spdlog::logger> log_;
};

} // namespace alert

} // namespace vigil

#endif // VIGIL_ALERT_ALERT_DISPATCHER_HPP
