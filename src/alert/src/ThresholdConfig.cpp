/**
 * @file ThresholdConfig.cpp
 * @brief Threshold level derivation and validation.
 */

#include "src/alert/inc/ThresholdConfig.hpp"

#include <fmt/core.h>

#include <algorithm>
#include <cmath>

namespace vigil {

namespace alert {

/* ----------------------------- MetricThreshold ----------------------------- */

double MetricThreshold::recoveryLevel() const noexcept { return recovery.value_or(value); }

double MetricThreshold::criticalLevel() const noexcept {
  return critical.value_or(std::min(100.0, value + DEFAULT_CRITICAL_MARGIN));
}

model::Severity MetricThreshold::severityFor(double observed) const noexcept {
  const double CRIT = criticalLevel();
  if (observed >= CRIT) {
    return model::Severity::CRITICAL;
  }
  if (observed >= value + (CRIT - value) / 2.0) {
    return model::Severity::ERROR;
  }
  return model::Severity::WARNING;
}

/* ----------------------------- ThresholdConfig ----------------------------- */

const MetricThreshold* ThresholdConfig::find(std::string_view metric) const noexcept {
  const auto IT = metrics.find(metric);
  return IT == metrics.end() ? nullptr : &IT->second;
}

bool ThresholdConfig::validate(std::string& reason) const {
  for (const auto& [name, t] : metrics) {
    if (std::find(KNOWN_METRICS.begin(), KNOWN_METRICS.end(), name) == KNOWN_METRICS.end()) {
      reason = fmt::format("thresholds.{}: unknown metric", name);
      return false;
    }
    if (!std::isfinite(t.value) || t.value < 0.0 || t.value > 100.0) {
      reason = fmt::format("thresholds.{}: value must be within [0, 100]", name);
      return false;
    }
    if (t.cooldown.count() < 0) {
      reason = fmt::format("thresholds.{}: cooldown must not be negative", name);
      return false;
    }
    if (t.recovery && (!std::isfinite(*t.recovery) || *t.recovery > t.value)) {
      reason = fmt::format("thresholds.{}: recovery must be <= value", name);
      return false;
    }
    if (t.critical && (!std::isfinite(*t.critical) || *t.critical < t.value)) {
      reason = fmt::format("thresholds.{}: critical must be >= value", name);
      return false;
    }
  }
  return true;
}

} // namespace alert

} // namespace vigil
