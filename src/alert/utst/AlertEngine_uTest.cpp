/**
 * @file AlertEngine_uTest.cpp
 * @brief Unit tests for vigil::alert::AlertEngine.
 *
 * Notes:
 *  - Time is driven by snapshot timestamps, so no test sleeps.
 */

#include "src/alert/inc/AlertEngine.hpp"
#include "src/helpers/inc/Logging.hpp"

#include <gtest/gtest.h>
#include <spdlog/sinks/ringbuffer_sink.h>

#include <algorithm>
#include <atomic>
#include <thread>
#include <vector>

using vigil::alert::AlertEngine;
using vigil::alert::AlertPhase;
using vigil::alert::ThresholdConfig;
using vigil::model::AlertKey;
using vigil::model::MetricSnapshot;
using vigil::model::Severity;
using vigil::model::Timestamp;
using namespace std::chrono_literals;

namespace {

const Timestamp T0{std::chrono::milliseconds(1'700'000'000'000)};

ThresholdConfig cpuAt(double value) {
  ThresholdConfig cfg{};
  cfg.metrics["cpu"].value = value;
  cfg.metrics["cpu"].cooldown = 5min;
  return cfg;
}

MetricSnapshot snap(const std::string& host, Timestamp at, double cpu) {
  MetricSnapshot s{};
  s.hostname = host;
  s.timestamp = at;
  s.cpu.overallPercent = cpu;
  return s;
}

const AlertKey CPU_KEY{"web-01", "cpu", ""};

/// Captures formatted lines from the "alert" logger for the test's lifetime.
class AlertLogCapture {
public:
  AlertLogCapture()
      : log_(vigil::helpers::logging::get("alert")),
        sink_(std::make_shared<spdlog::sinks::ringbuffer_sink_mt>(256)) {
    log_->sinks().push_back(sink_);
  }
  ~AlertLogCapture() {
    auto& sinks = log_->sinks();
    sinks.erase(std::remove(sinks.begin(), sinks.end(), sink_), sinks.end());
  }

  [[nodiscard]] std::size_t count(const std::string& needle) const {
    const auto LINES = sink_->last_formatted();
    return static_cast<std::size_t>(std::count_if(
        LINES.begin(), LINES.end(),
        [&](const std::string& l) { return l.find(needle) != std::string::npos; }));
  }

private:
  std::shared_ptr<spdlog::logger> log_;
  std::shared_ptr<spdlog::sinks::ringbuffer_sink_mt> sink_;
};

} // namespace

/* ----------------------------- Firing ----------------------------- */

/** @test The threshold is a closed lower bound. */
TEST(AlertEngineTest, ThresholdInclusive) {
  AlertEngine engine(cpuAt(80.0));
  EXPECT_TRUE(engine.evaluate(snap("web-01", T0, 79.99)).empty());
  const auto EVENTS = engine.evaluate(snap("web-01", T0 + 1s, 80.0));
  ASSERT_EQ(EVENTS.size(), 1U);
  EXPECT_EQ(EVENTS[0].key, CPU_KEY);
  EXPECT_EQ(EVENTS[0].severity, Severity::WARNING);
  EXPECT_DOUBLE_EQ(EVENTS[0].threshold, 80.0);
  EXPECT_EQ(EVENTS[0].firedAt, T0 + 1s);
  EXPECT_EQ(EVENTS[0].message, "cpu usage on web-01 is 80.0% (threshold 80.0%)");
}

/** @test Below-threshold keys are not tracked at all. */
TEST(AlertEngineTest, QuietKeysHaveNoState) {
  AlertEngine engine(cpuAt(80.0));
  (void)engine.evaluate(snap("web-01", T0, 10.0));
  EXPECT_FALSE(engine.state(CPU_KEY).has_value());
  EXPECT_EQ(engine.stats().evaluations, 1U);
}

/** @test A sustained breach fires exactly once per cooldown window. */
TEST(AlertEngineTest, OneFirePerWindow) {
  AlertEngine engine(cpuAt(80.0));
  std::size_t fired = 0;
  // One sample every 10 s for 12 minutes: fires at 0, 5 min, 10 min.
  for (int i = 0; i <= 72; ++i) {
    fired += engine.evaluate(snap("web-01", T0 + i * 10s, 95.0)).size();
  }
  EXPECT_EQ(fired, 3U);
  EXPECT_EQ(engine.stats().fired, 3U);
  EXPECT_EQ(engine.stats().suppressed, 70U);
}

/** @test FIRING moves to COOLDOWN on the next evaluation inside the window. */
TEST(AlertEngineTest, PhaseProgression) {
  AlertEngine engine(cpuAt(80.0));
  (void)engine.evaluate(snap("web-01", T0, 90.0));
  ASSERT_TRUE(engine.state(CPU_KEY).has_value());
  EXPECT_EQ(engine.state(CPU_KEY)->phase, AlertPhase::FIRING);
  EXPECT_TRUE(engine.state(CPU_KEY)->active);

  (void)engine.evaluate(snap("web-01", T0 + 30s, 91.0));
  EXPECT_EQ(engine.state(CPU_KEY)->phase, AlertPhase::COOLDOWN);
  EXPECT_DOUBLE_EQ(engine.state(CPU_KEY)->lastValue, 91.0);
}

/** @test cpu 92 fires, 95 one minute later is suppressed, 30 after six minutes recovers. */
TEST(AlertEngineTest, BreachSuppressRecover) {
  AlertLogCapture capture;
  AlertEngine engine(cpuAt(80.0));

  const auto FIRST = engine.evaluate(snap("web-01", T0, 92.0));
  ASSERT_EQ(FIRST.size(), 1U);
  EXPECT_EQ(FIRST[0].severity, Severity::ERROR);

  EXPECT_TRUE(engine.evaluate(snap("web-01", T0 + 1min, 95.0)).empty());
  EXPECT_EQ(engine.stats().suppressed, 1U);

  EXPECT_TRUE(engine.evaluate(snap("web-01", T0 + 6min, 30.0)).empty());
  EXPECT_EQ(engine.state(CPU_KEY)->phase, AlertPhase::NORMAL);
  EXPECT_FALSE(engine.state(CPU_KEY)->active);
  EXPECT_EQ(engine.stats().recovered, 1U);
  EXPECT_EQ(capture.count("event=alert_recovered key=web-01/cpu"), 1U);

  // A fresh breach after recovery fires immediately.
  EXPECT_EQ(engine.evaluate(snap("web-01", T0 + 6min + 10s, 85.0)).size(), 1U);
}

/** @test Recovery inside the window is logged once; the next breach after the window refires. */
TEST(AlertEngineTest, RecoveringInsideWindow) {
  AlertLogCapture capture;
  AlertEngine engine(cpuAt(80.0));
  ASSERT_EQ(engine.evaluate(snap("web-01", T0, 90.0)).size(), 1U);
  EXPECT_TRUE(engine.evaluate(snap("web-01", T0 + 1min, 40.0)).empty());
  EXPECT_TRUE(engine.evaluate(snap("web-01", T0 + 2min, 35.0)).empty());
  EXPECT_TRUE(engine.state(CPU_KEY)->recovering);
  EXPECT_EQ(capture.count("event=alert_recovering key=web-01/cpu"), 1U);

  const auto AGAIN = engine.evaluate(snap("web-01", T0 + 5min, 88.0));
  ASSERT_EQ(AGAIN.size(), 1U);
  EXPECT_EQ(engine.stats().fired, 2U);
  EXPECT_FALSE(engine.state(CPU_KEY)->recovering);
}

/** @test With a lower recovery level, values in between keep the key active. */
TEST(AlertEngineTest, HysteresisBand) {
  ThresholdConfig cfg = cpuAt(80.0);
  cfg.metrics["cpu"].recovery = 70.0;
  AlertEngine engine(cfg);

  ASSERT_EQ(engine.evaluate(snap("web-01", T0, 85.0)).size(), 1U);
  EXPECT_TRUE(engine.evaluate(snap("web-01", T0 + 6min, 75.0)).empty());
  EXPECT_EQ(engine.state(CPU_KEY)->phase, AlertPhase::COOLDOWN);
  EXPECT_TRUE(engine.state(CPU_KEY)->active);

  EXPECT_TRUE(engine.evaluate(snap("web-01", T0 + 7min, 69.0)).empty());
  EXPECT_EQ(engine.state(CPU_KEY)->phase, AlertPhase::NORMAL);
}

/** @test Recovery produces an INFO event only when enabled. */
TEST(AlertEngineTest, RecoveryEvents) {
  AlertEngine engine(cpuAt(80.0), true);
  ASSERT_EQ(engine.evaluate(snap("web-01", T0, 85.0)).size(), 1U);
  const auto EVENTS = engine.evaluate(snap("web-01", T0 + 10min, 20.0));
  ASSERT_EQ(EVENTS.size(), 1U);
  EXPECT_EQ(EVENTS[0].severity, Severity::INFO);
  EXPECT_EQ(EVENTS[0].message, "cpu usage on web-01 recovered to 20.0% (threshold 80.0%)");
}

/* ----------------------------- Keys ----------------------------- */

/** @test Hosts and mount points are tracked independently. */
TEST(AlertEngineTest, IndependentKeys) {
  ThresholdConfig cfg = cpuAt(80.0);
  cfg.metrics["disk"].value = 90.0;
  AlertEngine engine(cfg);

  MetricSnapshot s = snap("web-01", T0, 85.0);
  vigil::model::FilesystemMetrics root{};
  root.mountPoint = "/";
  root.percentUsed = 50.0;
  vigil::model::FilesystemMetrics data{};
  data.mountPoint = "/data";
  data.percentUsed = 97.0;
  s.disk.filesystems = {root, data};

  const auto EVENTS = engine.evaluate(s);
  ASSERT_EQ(EVENTS.size(), 2U);
  EXPECT_EQ(EVENTS[1].key, (AlertKey{"web-01", "disk", "/data"}));
  EXPECT_EQ(EVENTS[1].severity, Severity::CRITICAL);
  EXPECT_EQ(EVENTS[1].message, "disk usage on web-01 at /data is 97.0% (threshold 90.0%)");

  EXPECT_EQ(engine.evaluate(snap("db-01", T0, 99.0)).size(), 1U);
}

/** @test Swap is only evaluated on hosts that have swap. */
TEST(AlertEngineTest, SwapRequiresSwap) {
  ThresholdConfig cfg{};
  cfg.metrics["swap"].value = 50.0;
  AlertEngine engine(cfg);

  MetricSnapshot s = snap("web-01", T0, 0.0);
  s.swap.percentUsed = 90.0;
  EXPECT_TRUE(engine.evaluate(s).empty());

  s.timestamp = T0 + 1s;
  s.swap.totalBytes = 1024;
  EXPECT_EQ(engine.evaluate(s).size(), 1U);
}

/** @test Snapshots not newer than the last evaluated one are ignored. */
TEST(AlertEngineTest, StaleSnapshotIgnored) {
  AlertEngine engine(cpuAt(80.0));
  ASSERT_EQ(engine.evaluate(snap("web-01", T0 + 10min, 90.0)).size(), 1U);
  EXPECT_TRUE(engine.evaluate(snap("web-01", T0, 99.0)).empty());
  EXPECT_TRUE(engine.evaluate(snap("web-01", T0 + 10min, 99.0)).empty());
  EXPECT_EQ(engine.stats().stale, 2U);
  EXPECT_EQ(engine.state(CPU_KEY)->lastEvaluatedAt, T0 + 10min);
}

/* ----------------------------- Concurrency ----------------------------- */

/** @test Concurrent evaluations of one key fire at most once per window. */
TEST(AlertEngineTest, ConcurrentSameKeySingleFire) {
  AlertEngine engine(cpuAt(80.0));
  std::atomic<std::size_t> fired{0};
  std::vector<std::thread> threads;
  for (int t = 0; t < 8; ++t) {
    threads.emplace_back([&, t] {
      for (int i = 0; i < 100; ++i) {
        fired += engine.evaluate(snap("web-01", T0 + std::chrono::milliseconds(t * 100 + i), 95.0))
                     .size();
      }
    });
  }
  for (auto& th : threads) {
    th.join();
  }
  EXPECT_EQ(fired.load(), 1U);
  EXPECT_EQ(engine.stats().fired, 1U);
}
