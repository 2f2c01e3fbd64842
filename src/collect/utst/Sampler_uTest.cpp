/**
 * @file Sampler_uTest.cpp
 * @brief Unit tests for vigil::collect::Sampler.
 *
 * Notes:
 *  - Timing assertions use generous bounds to tolerate loaded CI hosts.
 */

#include "src/collect/inc/Sampler.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <mutex>
#include <thread>
#include <vector>

using vigil::collect::CollectionResult;
using vigil::collect::ISnapshotSource;
using vigil::collect::Sampler;
using vigil::collect::SnapshotSink;
using vigil::model::MetricSnapshot;
using vigil::model::SnapshotPtr;
using namespace std::chrono_literals;

namespace {

class FakeSource final : public ISnapshotSource {
public:
  explicit FakeSource(std::chrono::milliseconds delay = 0ms) : delay_(delay) {}

  CollectionResult collect() override {
    if (delay_.count() > 0) {
      std::this_thread::sleep_for(delay_);
    }
    auto snap = std::make_shared<MetricSnapshot>();
    snap->hostname = "fake";
    snap->timestamp = vigil::helpers::clock::wallNow();
    CollectionResult r{};
    r.snapshot = snap;
    return r;
  }

private:
  std::chrono::milliseconds delay_;
};

class RecordingSink final : public SnapshotSink {
public:
  void submit(SnapshotPtr snapshot) override {
    std::lock_guard<std::mutex> lock(mtx_);
    times_.push_back(std::chrono::steady_clock::now());
    last_ = std::move(snapshot);
  }

  std::vector<std::chrono::steady_clock::time_point> times() {
    std::lock_guard<std::mutex> lock(mtx_);
    return times_;
  }

private:
  std::mutex mtx_;
  std::vector<std::chrono::steady_clock::time_point> times_;
  SnapshotPtr last_;
};

} // namespace

/** @test Ticks arrive at roughly the configured cadence. */
TEST(SamplerTest, FixedCadence) {
  FakeSource src;
  RecordingSink sink;
  Sampler sampler(src, sink, 50ms);
  ASSERT_TRUE(sampler.start());
  std::this_thread::sleep_for(330ms);
  sampler.stop();

  const auto TIMES = sink.times();
  ASSERT_GE(TIMES.size(), 4U);
  ASSERT_LE(TIMES.size(), 9U);
  // Fixed-rate: the n-th tick is anchored to the first, not to the previous one
  const auto SPAN = TIMES.back() - TIMES.front();
  const auto EXPECTED = 50ms * static_cast<long>(TIMES.size() - 1);
  EXPECT_LT(std::chrono::abs(SPAN - EXPECTED), 40ms);
}

/** @test A round longer than the interval skips ticks instead of bursting. */
TEST(SamplerTest, OverrunSkipsTicks) {
  FakeSource src(120ms);
  RecordingSink sink;
  Sampler sampler(src, sink, 50ms);
  ASSERT_TRUE(sampler.start());
  std::this_thread::sleep_for(500ms);
  sampler.stop();

  EXPECT_GE(sampler.missedTicks(), 2U);
  const auto TIMES = sink.times();
  for (std::size_t i = 1; i < TIMES.size(); ++i) {
    EXPECT_GE(TIMES[i] - TIMES[i - 1], 100ms);
  }
}

/** @test stop() interrupts a long inter-tick wait promptly. */
TEST(SamplerTest, StopIsPrompt) {
  FakeSource src;
  RecordingSink sink;
  Sampler sampler(src, sink, std::chrono::milliseconds(60'000));
  ASSERT_TRUE(sampler.start());
  std::this_thread::sleep_for(20ms);

  const auto T0 = std::chrono::steady_clock::now();
  sampler.stop();
  EXPECT_LT(std::chrono::steady_clock::now() - T0, 500ms);
  EXPECT_FALSE(sampler.running());
  EXPECT_EQ(sampler.ticks(), 1U);
}

/** @test start() refuses a second start and a non-positive interval. */
TEST(SamplerTest, StartGuards) {
  FakeSource src;
  RecordingSink sink;
  Sampler bad(src, sink, 0ms);
  EXPECT_FALSE(bad.start());

  Sampler sampler(src, sink, 1000ms);
  EXPECT_TRUE(sampler.start());
  EXPECT_FALSE(sampler.start());
  sampler.stop();
  sampler.stop();
}
