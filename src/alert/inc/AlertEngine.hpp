#ifndef VIGIL_ALERT_ALERT_ENGINE_HPP
#define VIGIL_ALERT_ALERT_ENGINE_HPP
/**
 * @file AlertEngine.hpp
 * @brief Threshold evaluation with per-key cooldown state.
 *
 * Per AlertKey (host, metric, mount point):
 *
 *   NORMAL   --value >= threshold-------------------------> FIRING   (event)
 *   FIRING   --next evaluation---------------------------> COOLDOWN
 *   COOLDOWN --window elapsed, value >= threshold---------> FIRING   (event)
 *   COOLDOWN --window elapsed, value < recovery-----------> NORMAL   (info event if enabled)
 *   COOLDOWN --otherwise----------------------------------> COOLDOWN (suppressed)
 *
 * Time is the snapshot's collection timestamp. A snapshot not newer than the
 * last one evaluated for a key is ignored for that key.
 *
 * @note Thread-safe. Keys are locked individually; unrelated keys evaluate in parallel.
 */

#include "src/alert/inc/ThresholdConfig.hpp"
#include "src/model/inc/AlertTypes.hpp"
#include "src/model/inc/MetricSnapshot.hpp"

#include <spdlog/logger.h>

#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <unordered_map>
#include <vector>

namespace vigil {

namespace alert {

/* ----------------------------- AlertPhase ----------------------------- */

/**
 * @brief Position of one key in the alert state machine.
 */
enum class AlertPhase : std::uint8_t {
  NORMAL = 0,
  FIRING,   ///< Fired on the latest evaluation
  COOLDOWN, ///< Fired earlier; notifications suppressed until the window ends
};

/// @brief Human-readable phase string.
[[nodiscard]] const char* toString(AlertPhase phase) noexcept;

/**
 * @brief Mutable per-key record.
 */
struct AlertState {
  AlertPhase phase{AlertPhase::NORMAL};
  std::optional<model::Timestamp> lastFiredAt{};
  std::optional<model::Timestamp> lastEvaluatedAt{};
  double lastValue{0.0};
  bool active{false};     ///< Fired and not yet recovered
  bool recovering{false}; ///< Dropped below recovery inside the window
};

/* ----------------------------- AlertEngine ----------------------------- */

class AlertEngine {
public:
  /// Evaluation counters.
  struct Stats {
    std::uint64_t evaluations{0}; ///< Key evaluations performed
    std::uint64_t fired{0};       ///< Breach events emitted
    std::uint64_t suppressed{0};  ///< Breaches inside a cooldown window
    std::uint64_t recovered{0};   ///< Keys returned to NORMAL
    std::uint64_t stale{0};       ///< Out-of-order snapshots ignored
  };

  /// @param recoveryEvents Emit an INFO event when a key returns to NORMAL.
  explicit AlertEngine(ThresholdConfig config, bool recoveryEvents = false);

  /**
   * @brief Evaluate every configured metric in @p snapshot.
   * @return Events to dispatch, possibly empty.
   */
  [[nodiscard]] std::vector<model::AlertEvent> evaluate(const model::MetricSnapshot& snapshot);

  /// @brief Copy of one key's state, nullopt if never breached.
  [[nodiscard]] std::optional<AlertState> state(const model::AlertKey& key) const;

  [[nodiscard]] Stats stats() const noexcept;

  [[nodiscard]] const ThresholdConfig& config() const noexcept { return config_; }

private:
  struct Slot {
    mutable std::mutex mtx;
    AlertState state;
  };

  Slot* slotFor(const model::AlertKey& key);
  [[nodiscard]] const Slot* findSlot(const model::AlertKey& key) const;
  std::optional<model::AlertEvent> evaluateKey(const model::AlertKey& key,
                                               const MetricThreshold& threshold, double value,
                                               model::Timestamp at);

  ThresholdConfig config_;
  bool recoveryEvents_;
  std::unordered_map<model::AlertKey, std::unique_ptr<Slot>, model::AlertKeyHash> slots_;
  mutable std::shared_mutex tableMtx_;
  std::atomic<std::uint64_t> evaluations_{0};
  std::atomic<std::uint64_t> fired_{0};
  std::atomic<std::uint64_t> suppressed_{0};
  std::atomic<std::uint64_t> recovered_{0};
  std::atomic<std::uint64_t> stale_{0};
  std::shared_ptr<spdlog::logger> log_;
};

/**
 * @brief Event text, e.g. "cpu usage on web-01 is 92.0% (threshold 80.0%)".
 */
[[nodiscard]] std::string describe(const model::AlertKey& key, double value, double threshold,
                                   bool recovered);

} // namespace alert

} // namespace vigil

#endif // VIGIL_ALERT_ALERT_ENGINE_HPP
