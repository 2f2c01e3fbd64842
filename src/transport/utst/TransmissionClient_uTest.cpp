/**
 * @file TransmissionClient_uTest.cpp
 * @brief Unit tests for vigil::transport::TransmissionClient.
 *
 * Notes:
 *  - A scripted IngestTransport stands in for the network.
 *  - Backoff delays are a few milliseconds so retry tests run fast.
 */

#include "src/transport/inc/TransmissionClient.hpp"
#include "src/model/inc/SnapshotJson.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <mutex>
#include <thread>
#include <vector>

using vigil::model::MetricSnapshot;
using vigil::model::SnapshotPtr;
using vigil::transport::DeliveryResult;
using vigil::transport::DeliveryState;
using vigil::transport::DeliveryStatus;
using vigil::transport::HttpResponse;
using vigil::transport::IngestTransport;
using vigil::transport::TransmissionClient;
using vigil::transport::TransmissionConfig;
using vigil::transport::TransportStatus;
using namespace std::chrono_literals;

namespace {

HttpResponse httpStatus(int code) {
  HttpResponse r{};
  r.statusCode = code;
  return r;
}

HttpResponse transportError(TransportStatus status) {
  HttpResponse r{};
  r.status = status;
  r.error = "scripted";
  return r;
}

/// Replays a script of responses (the last one repeats) and records bodies.
class ScriptedTransport final : public IngestTransport {
public:
  explicit ScriptedTransport(std::vector<HttpResponse> script,
                             std::chrono::milliseconds latency = 0ms)
      : script_(std::move(script)), latency_(latency) {}

  HttpResponse post(const std::string& body) override {
    if (latency_.count() > 0) {
      std::this_thread::sleep_for(latency_);
    }
    std::lock_guard<std::mutex> lock(mtx_);
    bodies_.push_back(body);
    const std::size_t I = calls_ < script_.size() ? calls_ : script_.size() - 1;
    ++calls_;
    return script_[I];
  }

  std::size_t calls() {
    std::lock_guard<std::mutex> lock(mtx_);
    return calls_;
  }

  std::vector<std::string> bodies() {
    std::lock_guard<std::mutex> lock(mtx_);
    return bodies_;
  }

private:
  std::vector<HttpResponse> script_;
  std::chrono::milliseconds latency_;
  std::mutex mtx_;
  std::size_t calls_{0};
  std::vector<std::string> bodies_;
};

TransmissionConfig fastConfig() {
  TransmissionConfig c{};
  c.maxAttempts = 3;
  c.backoffBase = 2ms;
  c.backoffMax = 10ms;
  c.queueDepth = 2;
  c.shutdownGrace = 1000ms;
  return c;
}

SnapshotPtr makeSnapshot(std::int64_t ms, const std::string& host = "h1") {
  auto s = std::make_shared<MetricSnapshot>();
  s->hostname = host;
  s->timestamp = vigil::helpers::clock::fromUnixMillis(ms);
  s->cpu.overallPercent = 12.0;
  return s;
}

template <typename Pred> bool waitFor(Pred pred, std::chrono::milliseconds limit = 2000ms) {
  const auto END = std::chrono::steady_clock::now() + limit;
  while (std::chrono::steady_clock::now() < END) {
    if (pred()) {
      return true;
    }
    std::this_thread::sleep_for(2ms);
  }
  return pred();
}

} // namespace

/* ----------------------------- deliver() ----------------------------- */

/** @test An always-failing endpoint gets exactly maxAttempts calls and one exhaustion. */
TEST(TransmissionClientTest, RetryBoundExactlyThree) {
  ScriptedTransport t({httpStatus(503)});
  TransmissionClient client(t, fastConfig(), 1);

  const DeliveryResult R = client.deliver(*makeSnapshot(1000));
  EXPECT_EQ(R.status, DeliveryStatus::EXHAUSTED);
  EXPECT_EQ(R.attempts, 3U);
  EXPECT_EQ(R.httpStatus, 503);
  EXPECT_EQ(t.calls(), 3U);
  EXPECT_EQ(client.stats().exhausted, 1U);
  EXPECT_EQ(client.stats().attempts, 3U);
  EXPECT_EQ(client.state(), DeliveryState::EXHAUSTED);
}

/** @test Transport failures are retried until success. */
TEST(TransmissionClientTest, RetriesTransportErrors) {
  ScriptedTransport t({transportError(TransportStatus::CONNECT_FAILED),
                       transportError(TransportStatus::TIMEOUT), httpStatus(202)});
  TransmissionClient client(t, fastConfig(), 1);

  const DeliveryResult R = client.deliver(*makeSnapshot(1000));
  EXPECT_EQ(R.status, DeliveryStatus::DELIVERED);
  EXPECT_EQ(R.attempts, 3U);
  EXPECT_EQ(client.stats().delivered, 1U);
  EXPECT_EQ(client.stats().exhausted, 0U);
  EXPECT_EQ(client.state(), DeliveryState::SUCCEEDED);
}

/** @test 4xx is final: one call, no retry. */
TEST(TransmissionClientTest, ClientErrorNotRetried) {
  ScriptedTransport t({httpStatus(400), httpStatus(202)});
  TransmissionClient client(t, fastConfig(), 1);

  const DeliveryResult R = client.deliver(*makeSnapshot(1000));
  EXPECT_EQ(R.status, DeliveryStatus::REJECTED);
  EXPECT_EQ(R.attempts, 1U);
  EXPECT_EQ(t.calls(), 1U);
  EXPECT_EQ(client.stats().rejected, 1U);
}

/** @test maxAttempts of 1 means no retry at all. */
TEST(TransmissionClientTest, SingleAttempt) {
  ScriptedTransport t({httpStatus(500)});
  TransmissionConfig c = fastConfig();
  c.maxAttempts = 1;
  TransmissionClient client(t, c, 1);
  EXPECT_EQ(client.deliver(*makeSnapshot(1)).attempts, 1U);
  EXPECT_EQ(t.calls(), 1U);
}

/** @test The same body is sent on every attempt and decodes as an ingest payload. */
TEST(TransmissionClientTest, BodyIsIdempotentPayload) {
  ScriptedTransport t({httpStatus(502), httpStatus(200)});
  TransmissionClient client(t, fastConfig(), 1);
  ASSERT_EQ(client.deliver(*makeSnapshot(1714564800000LL, "web-01")).status,
            DeliveryStatus::DELIVERED);

  const auto BODIES = t.bodies();
  ASSERT_EQ(BODIES.size(), 2U);
  EXPECT_EQ(BODIES[0], BODIES[1]);
  MetricSnapshot decoded{};
  ASSERT_TRUE(vigil::model::ingestPayloadFromJson(BODIES[0], decoded).ok());
  EXPECT_EQ(decoded.hostname, "web-01");
  EXPECT_EQ(decoded.cpu.overallPercent, 12.0);
}

/* ----------------------------- Queue ----------------------------- */

/** @test A full queue evicts the oldest snapshot. */
TEST(TransmissionClientTest, DropOldestOnOverflow) {
  ScriptedTransport t({httpStatus(202)});
  TransmissionClient client(t, fastConfig(), 1);

  client.submit(makeSnapshot(1000));
  client.submit(makeSnapshot(2000));
  client.submit(makeSnapshot(3000));
  EXPECT_EQ(client.queued(), 2U);
  EXPECT_EQ(client.stats().overflowDropped, 1U);

  ASSERT_TRUE(client.start());
  ASSERT_TRUE(waitFor([&] { return client.stats().delivered == 2; }));
  client.stop();

  const auto BODIES = t.bodies();
  ASSERT_EQ(BODIES.size(), 2U);
  MetricSnapshot first{};
  MetricSnapshot second{};
  ASSERT_TRUE(vigil::model::ingestPayloadFromJson(BODIES[0], first).ok());
  ASSERT_TRUE(vigil::model::ingestPayloadFromJson(BODIES[1], second).ok());
  EXPECT_EQ(vigil::helpers::clock::toUnixMillis(first.timestamp), 2000);
  EXPECT_EQ(vigil::helpers::clock::toUnixMillis(second.timestamp), 3000);
}

/** @test submit() returns immediately while a slow delivery is in flight. */
TEST(TransmissionClientTest, SubmitNeverBlocks) {
  ScriptedTransport t({httpStatus(202)}, 300ms);
  TransmissionClient client(t, fastConfig(), 1);
  ASSERT_TRUE(client.start());

  client.submit(makeSnapshot(1000));
  ASSERT_TRUE(waitFor([&] { return client.state() == DeliveryState::ATTEMPTING; }));

  const auto T0 = std::chrono::steady_clock::now();
  for (int i = 0; i < 10; ++i) {
    client.submit(makeSnapshot(2000 + i));
  }
  EXPECT_LT(std::chrono::steady_clock::now() - T0, 50ms);
  EXPECT_LE(client.queued(), 2U);
  client.stop();
}

/* ----------------------------- Shutdown ----------------------------- */

/** @test stop() interrupts a long backoff promptly and counts a cancellation. */
TEST(TransmissionClientTest, StopInterruptsBackoff) {
  ScriptedTransport t({httpStatus(503)});
  TransmissionConfig c = fastConfig();
  c.backoffBase = 60'000ms;
  c.backoffMax = 60'000ms;
  TransmissionClient client(t, c, 1);
  ASSERT_TRUE(client.start());
  client.submit(makeSnapshot(1000));
  ASSERT_TRUE(waitFor([&] { return client.state() == DeliveryState::BACKOFF; }));

  const auto T0 = std::chrono::steady_clock::now();
  client.stop();
  EXPECT_LT(std::chrono::steady_clock::now() - T0, 500ms);
  EXPECT_EQ(client.stats().cancelled, 1U);
  EXPECT_EQ(t.calls(), 1U);
}

/** @test An in-flight request is allowed to finish within the grace period. */
TEST(TransmissionClientTest, StopWaitsForInFlight) {
  ScriptedTransport t({httpStatus(202)}, 150ms);
  TransmissionClient client(t, fastConfig(), 1);
  ASSERT_TRUE(client.start());
  client.submit(makeSnapshot(1000));
  ASSERT_TRUE(waitFor([&] { return client.state() == DeliveryState::ATTEMPTING; }));

  client.stop();
  EXPECT_EQ(client.stats().delivered, 1U);
}

/** @test Submissions after stop are ignored. */
TEST(TransmissionClientTest, SubmitAfterStopIgnored) {
  ScriptedTransport t({httpStatus(202)});
  TransmissionClient client(t, fastConfig(), 1);
  ASSERT_TRUE(client.start());
  client.stop();
  client.submit(makeSnapshot(1000));
  EXPECT_EQ(client.queued(), 0U);
  EXPECT_EQ(t.calls(), 0U);
}

/* ----------------------------- With Sampler ----------------------------- */

namespace {

class TickSource final : public vigil::collect::ISnapshotSource {
public:
  vigil::collect::CollectionResult collect() override {
    vigil::collect::CollectionResult r{};
    r.snapshot = makeSnapshot(1000 + static_cast<std::int64_t>(n_++));
    return r;
  }

private:
  std::atomic<int> n_{0};
};

} // namespace

/** @test Slow delivery does not delay sampling ticks. */
TEST(TransmissionClientTest, SlowDeliveryDoesNotStallSampler) {
  ScriptedTransport t({httpStatus(202)}, 400ms);
  TransmissionClient client(t, fastConfig(), 1);
  TickSource src;
  vigil::collect::Sampler sampler(src, client, 50ms);

  ASSERT_TRUE(client.start());
  ASSERT_TRUE(sampler.start());
  std::this_thread::sleep_for(420ms);
  sampler.stop();

  EXPECT_GE(sampler.ticks(), 7U);
  EXPECT_EQ(sampler.missedTicks(), 0U);
  EXPECT_LE(t.calls(), 2U);
  EXPECT_GE(client.stats().overflowDropped, 3U);
  client.stop();
}
