#ifndef VIGIL_MODEL_ALERT_TYPES_HPP
#define VIGIL_MODEL_ALERT_TYPES_HPP
/**
 * @file AlertTypes.hpp
 * @brief Alert identity and event records shared by the alert engine and channels.
 */

#include "src/model/inc/MetricSnapshot.hpp"

#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>

namespace vigil {

namespace model {

/* ----------------------------- Severity ----------------------------- */

/**
 * @brief Alert severity, ordered from least to most severe.
 */
enum class Severity : std::uint8_t {
  INFO = 0,
  WARNING,
  ERROR,
  CRITICAL,
};

/// @brief Lower-case name ("info", "warning", ...).
[[nodiscard]] const char* toString(Severity severity) noexcept;

/* ----------------------------- AlertKey ----------------------------- */

/**
 * @brief Identity of one alertable condition.
 *
 * subResource is empty for host-wide metrics and holds the mount point for
 * per-filesystem disk alerts.
 */
struct AlertKey {
  std::string hostname{};
  std::string metric{};      ///< "cpu", "memory", "swap", "disk"
  std::string subResource{}; ///< Mount point for disk, else empty

  /// @brief "host/metric" or "host/metric[sub]".
  [[nodiscard]] std::string toString() const;

  bool operator==(const AlertKey&) const = default;
};

/// Hash for unordered containers keyed by AlertKey.
struct AlertKeyHash {
  std::size_t operator()(const AlertKey& key) const noexcept;
};

/* ----------------------------- AlertEvent ----------------------------- */

/**
 * @brief Immutable notification record emitted by the alert engine.
 */
struct AlertEvent {
  AlertKey key{};
  Severity severity{Severity::WARNING};
  double value{0.0};     ///< Observed value that triggered the event
  double threshold{0.0}; ///< Configured firing threshold
  Timestamp firedAt{};   ///< Timestamp of the triggering snapshot
  std::string message{}; ///< Human-readable summary

  bool operator==(const AlertEvent&) const = default;
};

} // namespace model

} // namespace vigil

#endif // VIGIL_MODEL_ALERT_TYPES_HPP
