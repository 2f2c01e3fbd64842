/**
 * @file AlertEngine.cpp
 * @brief Per-key Normal/Firing/Cooldown state machine.
 */

#include "src/alert/inc/AlertEngine.hpp"
#include "src/helpers/inc/Clock.hpp"
#include "src/helpers/inc/Logging.hpp"

#include <fmt/core.h>

#include <utility>

namespace vigil {

namespace alert {

using model::AlertEvent;
using model::AlertKey;
using model::Severity;
using model::Timestamp;

/* ----------------------------- Helpers ----------------------------- */

const char* toString(AlertPhase phase) noexcept {
  switch (phase) {
  case AlertPhase::NORMAL:
    return "NORMAL";
  case AlertPhase::FIRING:
    return "FIRING";
  case AlertPhase::COOLDOWN:
    return "COOLDOWN";
  }
  return "UNKNOWN";
}

std::string describe(const AlertKey& key, double value, double threshold, bool recovered) {
  const std::string WHERE = key.subResource.empty()
                                ? fmt::format("{} usage on {}", key.metric, key.hostname)
                                : fmt::format("{} usage on {} at {}", key.metric, key.hostname,
                                              key.subResource);
  if (recovered) {
    return fmt::format("{} recovered to {:.1f}% (threshold {:.1f}%)", WHERE, value, threshold);
  }
  return fmt::format("{} is {:.1f}% (threshold {:.1f}%)", WHERE, value, threshold);
}

/* ----------------------------- AlertEngine ----------------------------- */

AlertEngine::AlertEngine(ThresholdConfig config, bool recoveryEvents)
    : config_(std::move(config)), recoveryEvents_(recoveryEvents),
      log_(vigil::helpers::logging::get("alert")) {}

std::vector<AlertEvent> AlertEngine::evaluate(const model::MetricSnapshot& snapshot) {
  std::vector<AlertEvent> events;

  auto check = [&](std::string_view metric, const std::string& sub, double value) {
    const MetricThreshold* threshold = config_.find(metric);
    if (threshold == nullptr) {
      return;
    }
    AlertKey key{snapshot.hostname, std::string(metric), sub};
    if (auto event = evaluateKey(key, *threshold, value, snapshot.timestamp)) {
      events.push_back(std::move(*event));
    }
  };

  check("cpu", {}, snapshot.cpu.overallPercent);
  check("memory", {}, snapshot.memory.percentUsed);
  if (snapshot.swap.totalBytes > 0) {
    check("swap", {}, snapshot.swap.percentUsed);
  }
  for (const model::FilesystemMetrics& fs : snapshot.disk.filesystems) {
    check("disk", fs.mountPoint, fs.percentUsed);
  }
  return events;
}

std::optional<AlertEvent> AlertEngine::evaluateKey(const AlertKey& key,
                                                   const MetricThreshold& threshold, double value,
                                                   Timestamp at) {
  evaluations_.fetch_add(1, std::memory_order_relaxed);
  const bool BREACH = value >= threshold.value;
  if (!BREACH && findSlot(key) == nullptr) {
    return std::nullopt; // never breached, nothing to track
  }

  Slot* slot = slotFor(key);
  std::lock_guard<std::mutex> lock(slot->mtx);
  AlertState& st = slot->state;

  if (st.lastEvaluatedAt && at <= *st.lastEvaluatedAt) {
    stale_.fetch_add(1, std::memory_order_relaxed);
    log_->debug("event=alert_stale_snapshot key={} ts_ms={}", key.toString(),
                vigil::helpers::clock::toUnixMillis(at));
    return std::nullopt;
  }
  st.lastEvaluatedAt = at;
  st.lastValue = value;

  auto fire = [&]() {
    st.phase = AlertPhase::FIRING;
    st.lastFiredAt = at;
    st.active = true;
    st.recovering = false;
    fired_.fetch_add(1, std::memory_order_relaxed);

    AlertEvent event{};
    event.key = key;
    event.severity = threshold.severityFor(value);
    event.value = value;
    event.threshold = threshold.value;
    event.firedAt = at;
    event.message = describe(key, value, threshold.value, false);
    log_->warn("event=alert_fired key={} severity={} value={:.2f} threshold={:.2f}",
               key.toString(), model::toString(event.severity), value, threshold.value);
    return event;
  };

  if (st.phase == AlertPhase::NORMAL) {
    if (!BREACH) {
      return std::nullopt;
    }
    return fire();
  }

  const bool IN_WINDOW = st.lastFiredAt && (at - *st.lastFiredAt) < threshold.cooldown;
  const bool BELOW_RECOVERY = value < threshold.recoveryLevel();

  if (IN_WINDOW) {
    st.phase = AlertPhase::COOLDOWN;
    if (BREACH) {
      suppressed_.fetch_add(1, std::memory_order_relaxed);
      log_->debug("event=alert_suppressed key={} value={:.2f}", key.toString(), value);
    } else if (BELOW_RECOVERY && !st.recovering) {
      log_->info("event=alert_recovering key={} value={:.2f} recovery={:.2f}", key.toString(),
                 value, threshold.recoveryLevel());
    }
    st.recovering = BELOW_RECOVERY;
    return std::nullopt;
  }

  if (BREACH) {
    return fire();
  }
  if (!BELOW_RECOVERY) {
    st.phase = AlertPhase::COOLDOWN;
    st.recovering = false;
    return std::nullopt;
  }

  st.phase = AlertPhase::NORMAL;
  st.active = false;
  st.recovering = false;
  recovered_.fetch_add(1, std::memory_order_relaxed);
  log_->info("event=alert_recovered key={} value={:.2f}", key.toString(), value);
  if (!recoveryEvents_) {
    return std::nullopt;
  }
  AlertEvent event{};
  event.key = key;
  event.severity = Severity::INFO;
  event.value = value;
  event.threshold = threshold.value;
  event.firedAt = at;
  event.message = describe(key, value, threshold.value, true);
  return event;
}

AlertEngine::Slot* AlertEngine::slotFor(const AlertKey& key) {
  {
    std::shared_lock<std::shared_mutex> lock(tableMtx_);
    const auto IT = slots_.find(key);
    if (IT != slots_.end()) {
      return IT->second.get();
    }
  }
  std::unique_lock<std::shared_mutex> lock(tableMtx_);
  auto& slot = slots_[key];
  if (!slot) {
    slot = std::make_unique<Slot>();
  }
  return slot.get();
}

const AlertEngine::Slot* AlertEngine::findSlot(const AlertKey& key) const {
  std::shared_lock<std::shared_mutex> lock(tableMtx_);
  const auto IT = slots_.find(key);
  return IT == slots_.end() ? nullptr : IT->second.get();
}

std::optional<AlertState> AlertEngine::state(const AlertKey& key) const {
  const Slot* slot = findSlot(key);
  if (slot == nullptr) {
    return std::nullopt;
  }
  std::lock_guard<std::mutex> lock(slot->mtx);
  return slot->state;
}

AlertEngine::Stats AlertEngine::stats() const noexcept {
  Stats s{};
  s.evaluations = evaluations_.load(std::memory_order_relaxed);
  s.fired = fired_.load(std::memory_order_relaxed);
  s.suppressed = suppressed_.load(std::memory_order_relaxed);
  s.recovered = recovered_.load(std::memory_order_relaxed);
  s.stale = stale_.load(std::memory_order_relaxed);
  return s;
}

} // namespace alert

} // namespace vigil
