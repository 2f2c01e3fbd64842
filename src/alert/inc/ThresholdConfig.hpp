#ifndef VIGIL_ALERT_THRESHOLD_CONFIG_HPP
#define VIGIL_ALERT_THRESHOLD_CONFIG_HPP
/**
 * @file ThresholdConfig.hpp
 * @brief Per-metric alert thresholds, loaded once at startup and read-only after.
 *
 * Levels for one metric (all percentages):
 *   recovery <= value <= midpoint(value, critical) <= critical
 * A value at or above `value` fires; `recovery` is the level a firing key
 * must drop below to return to normal.
 */

#include "src/model/inc/AlertTypes.hpp"

#include <array>
#include <chrono>
#include <map>
#include <optional>
#include <string>
#include <string_view>

namespace vigil {

namespace alert {

/// Metrics the engine knows how to extract from a snapshot.
inline constexpr std::array<std::string_view, 4> KNOWN_METRICS{"cpu", "memory", "disk", "swap"};

/// Default minimum interval between notifications for one key.
inline constexpr std::chrono::minutes DEFAULT_COOLDOWN{5};

/// Distance of the default critical level above the firing threshold.
inline constexpr double DEFAULT_CRITICAL_MARGIN = 15.0;

/* ----------------------------- MetricThreshold ----------------------------- */

/**
 * @brief Threshold policy for one metric.
 */
struct MetricThreshold {
  double value{0.0};                              ///< Fires when observed >= value
  std::chrono::milliseconds cooldown{DEFAULT_COOLDOWN}; ///< Suppression window after a fire
  std::optional<double> recovery{};               ///< Defaults to value
  std::optional<double> critical{};               ///< Defaults to min(100, value + 15)

  /// @brief Level below which a firing key recovers.
  [[nodiscard]] double recoveryLevel() const noexcept;

  /// @brief Level from which events are CRITICAL.
  [[nodiscard]] double criticalLevel() const noexcept;

  /// @brief Severity of a breaching value (WARNING, ERROR or CRITICAL).
  [[nodiscard]] model::Severity severityFor(double observed) const noexcept;
};

/* ----------------------------- ThresholdConfig ----------------------------- */

/**
 * @brief Thresholds keyed by metric name. Metrics without an entry never alert.
 */
struct ThresholdConfig {
  std::map<std::string, MetricThreshold, std::less<>> metrics{};

  /// @brief Threshold for @p metric, nullptr when not configured.
  [[nodiscard]] const MetricThreshold* find(std::string_view metric) const noexcept;

  /**
   * @brief Check level ordering and metric names.
   * @param reason Set on failure, naming the offending metric.
   */
  [[nodiscard]] bool validate(std::string& reason) const;
};

} // namespace alert

} // namespace vigil

#endif // VIGIL_ALERT_THRESHOLD_CONFIG_HPP
