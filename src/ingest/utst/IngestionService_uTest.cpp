/**
 * @file IngestionService_uTest.cpp
 * @brief Unit tests for vigil::ingest::IngestionService.
 */

#include "src/ingest/inc/IngestionService.hpp"
#include "src/ingest/utst/IngestTestSupport.hpp"
#include "src/storage/inc/SqliteBackend.hpp"
#include "src/storage/utst/StorageTestData.hpp"

#include <gtest/gtest.h>

#include <future>
#include <memory>
#include <thread>
#include <vector>

using vigil::alert::AlertDispatcher;
using vigil::alert::AlertEngine;
using vigil::alert::DispatcherConfig;
using vigil::alert::NotificationChannel;
using vigil::alert::ThresholdConfig;
using vigil::ingest::IngestionService;
using vigil::ingest::IngestStatus;
using vigil::ingest::summarize;
using vigil::ingest::test::MemoryBackend;
using vigil::ingest::test::RecordingChannel;
using vigil::storage::QueryFilter;
using vigil::storage::test::makeSnapshot;
using namespace std::chrono_literals;

namespace {

constexpr std::int64_t TS = 1'714'564'800'000;

ThresholdConfig cpuAt80() {
  ThresholdConfig cfg{};
  cfg.metrics["cpu"].value = 80.0;
  return cfg;
}

} // namespace

class IngestionServiceTest : public ::testing::Test {
protected:
  MemoryBackend storage_{};
  AlertEngine engine_{cpuAt80()};
  RecordingChannel* channel_{nullptr};
  std::unique_ptr<AlertDispatcher> dispatcher_{};
  std::unique_ptr<IngestionService> service_{};

  void SetUp() override {
    ASSERT_TRUE(storage_.open().ok());
    auto ch = std::make_unique<RecordingChannel>();
    channel_ = ch.get();
    std::vector<std::unique_ptr<NotificationChannel>> channels;
    channels.push_back(std::move(ch));
    dispatcher_ = std::make_unique<AlertDispatcher>(std::move(channels), DispatcherConfig{});
    ASSERT_TRUE(dispatcher_->start());
    service_ = std::make_unique<IngestionService>(storage_, &engine_, dispatcher_.get());
  }

  void TearDown() override {
    service_.reset();
    dispatcher_.reset();
  }

  /// Wait for alert evaluation and channel delivery to settle.
  void settle() {
    ASSERT_TRUE(service_->waitAlertsIdle(2s));
    ASSERT_TRUE(dispatcher_->waitIdle(2s));
  }
};

/* ----------------------------- Accept / Reject ----------------------------- */

/** @test A valid snapshot is stored under the reporting host name. */
TEST_F(IngestionServiceTest, AcceptsAndStores) {
  auto snap = makeSnapshot("ignored", TS);
  const auto R = service_->ingest("web-01", snap);
  ASSERT_EQ(R.status, IngestStatus::ACCEPTED) << R.reason;
  EXPECT_FALSE(R.duplicate);

  const auto Q = service_->query(QueryFilter{});
  ASSERT_TRUE(Q.ok());
  ASSERT_EQ(Q.records.size(), 1U);
  EXPECT_EQ(Q.records[0].hostname, "web-01");
  EXPECT_EQ(service_->stats().accepted, 1U);
}

/** @test Out-of-range snapshots reach neither storage nor the alert engine. */
TEST_F(IngestionServiceTest, RejectsInvalid) {
  auto snap = makeSnapshot("web-01", TS);
  snap.cpu.overallPercent = 120.0;
  const auto R = service_->ingest("web-01", snap);
  EXPECT_EQ(R.status, IngestStatus::REJECTED);
  EXPECT_NE(R.reason.find("cpu"), std::string::npos);

  auto anon = makeSnapshot("", TS);
  EXPECT_EQ(service_->ingest("", anon).status, IngestStatus::REJECTED);

  settle();
  EXPECT_EQ(storage_.size(), 0U);
  EXPECT_EQ(engine_.stats().evaluations, 0U);
  EXPECT_EQ(service_->stats().rejected, 2U);
}

/** @test Re-sending the same snapshot is acknowledged without a second row or alert. */
TEST_F(IngestionServiceTest, DuplicateIsIdempotent) {
  auto snap = makeSnapshot("web-01", TS);
  snap.cpu.overallPercent = 95.0;
  ASSERT_TRUE(service_->ingest("web-01", snap).ok());
  const auto AGAIN = service_->ingest("web-01", snap);
  EXPECT_TRUE(AGAIN.ok());
  EXPECT_TRUE(AGAIN.duplicate);

  settle();
  EXPECT_EQ(storage_.size(), 1U);
  EXPECT_EQ(channel_->events().size(), 1U);
  EXPECT_EQ(service_->stats().duplicates, 1U);
}

/* ----------------------------- Failures ----------------------------- */

/** @test A failed write is reported, never acknowledged. */
TEST_F(IngestionServiceTest, StorageFailureSurfaced) {
  storage_.failWrites = true;
  const auto R = service_->ingest("web-01", makeSnapshot("web-01", TS));
  EXPECT_EQ(R.status, IngestStatus::STORAGE_FAILED);
  EXPECT_EQ(R.reason, "disk on fire");
  EXPECT_EQ(service_->stats().storageFailures, 1U);
  EXPECT_EQ(service_->stats().accepted, 0U);
}

/** @test A stalled backend does not hold up alert delivery. */
TEST_F(IngestionServiceTest, StorageStallDoesNotBlockAlerts) {
  storage_.writeDelay = 800ms;
  auto snap = makeSnapshot("web-01", TS);
  snap.cpu.overallPercent = 95.0;

  auto pending = std::async(std::launch::async, [&] { return service_->ingest("web-01", snap); });
  const auto T0 = std::chrono::steady_clock::now();
  while (channel_->events().empty() && std::chrono::steady_clock::now() - T0 < 2s) {
    std::this_thread::sleep_for(5ms);
  }
  EXPECT_EQ(channel_->events().size(), 1U);
  EXPECT_LT(std::chrono::steady_clock::now() - T0, 600ms);
  EXPECT_TRUE(pending.get().ok());
}

/* ----------------------------- Health / Shutdown ----------------------------- */

/** @test Health follows storage reachability. */
TEST_F(IngestionServiceTest, HealthTracksStorage) {
  EXPECT_TRUE(service_->healthy());
  storage_.failPing = true;
  EXPECT_FALSE(service_->healthy());
}

/** @test Shutdown waits for an in-flight write, then refuses new ones and closes storage. */
TEST_F(IngestionServiceTest, ShutdownDrainsInFlight) {
  storage_.writeDelay = 300ms;
  auto pending = std::async(std::launch::async,
                            [&] { return service_->ingest("web-01", makeSnapshot("web-01", TS)); });
  std::this_thread::sleep_for(50ms);

  service_->shutdown();
  EXPECT_TRUE(pending.get().ok());
  EXPECT_EQ(storage_.size(), 1U);
  EXPECT_FALSE(storage_.isOpen());

  storage_.writeDelay = 0ms;
  const auto LATE = service_->ingest("web-01", makeSnapshot("web-01", TS + 1000));
  EXPECT_EQ(LATE.status, IngestStatus::SHUTTING_DOWN);
  EXPECT_FALSE(service_->healthy());
  service_->shutdown(); // idempotent
}

/* ----------------------------- Concurrency ----------------------------- */

/** @test Concurrent hosts are all stored. */
TEST_F(IngestionServiceTest, ConcurrentHosts) {
  std::vector<std::thread> threads;
  for (int h = 0; h < 8; ++h) {
    threads.emplace_back([&, h] {
      const std::string HOST = "host-" + std::to_string(h);
      for (int i = 0; i < 25; ++i) {
        EXPECT_TRUE(service_->ingest(HOST, makeSnapshot(HOST, TS + i * 1000)).ok());
      }
    });
  }
  for (auto& t : threads) {
    t.join();
  }
  EXPECT_EQ(storage_.size(), 200U);
  QueryFilter f{};
  f.hostname = "host-3";
  EXPECT_EQ(service_->query(f).records.size(), 25U);
}

/* ----------------------------- Summary ----------------------------- */

/** @test Averages and maxima over the selected window. */
TEST_F(IngestionServiceTest, Summary) {
  for (int i = 0; i < 4; ++i) {
    auto s = makeSnapshot("web-01", TS + i * 1000);
    s.cpu.overallPercent = 10.0 * (i + 1);
    s.memory.percentUsed = 50.0 + i;
    ASSERT_TRUE(service_->ingest("web-01", s).ok());
  }
  QueryFilter f{};
  f.since = vigil::helpers::clock::fromUnixMillis(TS + 1000);
  const auto R = service_->summary(f);
  ASSERT_TRUE(R.ok());
  EXPECT_EQ(R.summary.samples, 3U);
  EXPECT_DOUBLE_EQ(R.summary.avgCpu, 30.0);
  EXPECT_DOUBLE_EQ(R.summary.maxCpu, 40.0);
  EXPECT_DOUBLE_EQ(R.summary.avgMemory, 52.0);
  EXPECT_DOUBLE_EQ(R.summary.maxMemory, 53.0);

  EXPECT_EQ(summarize({}).samples, 0U);
}

/* ----------------------------- Real Backend ----------------------------- */

class IngestSqliteTest : public vigil::storage::test::TempDirTest {};

/** @test End to end against SQLite: stored rows survive a reopen. */
TEST_F(IngestSqliteTest, PersistsThroughSqlite) {
  const std::string PATH = dir_ + "/vigil.db";
  {
    vigil::storage::SqliteBackend db(PATH);
    ASSERT_TRUE(db.open().ok());
    IngestionService service(db, nullptr, nullptr);
    ASSERT_TRUE(service.ingest("web-01", makeSnapshot("web-01", TS)).ok());
    ASSERT_TRUE(service.ingest("web-02", makeSnapshot("web-02", TS)).ok());
  }
  vigil::storage::SqliteBackend db(PATH);
  ASSERT_TRUE(db.open().ok());
  const auto Q = db.query(QueryFilter{});
  ASSERT_TRUE(Q.ok());
  ASSERT_EQ(Q.records.size(), 2U);
  EXPECT_EQ(Q.records[0].hostname, "web-01");
  EXPECT_EQ(Q.records[1].hostname, "web-02");
}

/* ----------------------------- Both Backends ----------------------------- */

class IngestBackendTest : public vigil::storage::test::TempDirTest,
                          public ::testing::WithParamInterface<std::string> {
protected:
  std::unique_ptr<vigil::storage::StorageBackend> open() const {
    vigil::storage::StorageConfig c{};
    c.backend = GetParam();
    c.sqlitePath = dir_ + "/vigil.db";
    c.tsdbPath = dir_ + "/tsdb";
    std::string reason;
    auto backend = vigil::storage::makeBackend(c, reason);
    EXPECT_NE(backend, nullptr) << reason;
    if (backend != nullptr) {
      EXPECT_TRUE(backend->open().ok());
    }
    return backend;
  }
};

/** @test Names with line breaks are rejected before storage; later samples stay readable. */
TEST_P(IngestBackendTest, ControlCharsRejectedBeforeStorage) {
  {
    auto backend = open();
    ASSERT_NE(backend, nullptr);
    IngestionService service(*backend, nullptr, nullptr);
    ASSERT_TRUE(service.ingest("good", makeSnapshot("good", TS)).ok());

    const auto HOST = service.ingest("evil\nhost", makeSnapshot("x", TS + 1000));
    EXPECT_EQ(HOST.status, IngestStatus::REJECTED);
    EXPECT_NE(HOST.reason.find("hostname"), std::string::npos);

    auto snap = makeSnapshot("good", TS + 2000);
    snap.disk.filesystems[1].mountPoint = "/mnt/a\nb";
    EXPECT_EQ(service.ingest("good", snap).status, IngestStatus::REJECTED);

    ASSERT_TRUE(service.ingest("good", makeSnapshot("good", TS + 3000)).ok());
    const auto Q = service.query(QueryFilter{});
    ASSERT_TRUE(Q.ok()) << Q.reason;
    EXPECT_EQ(Q.records.size(), 2U);
    service.shutdown();
  }
  auto reopened = open();
  ASSERT_NE(reopened, nullptr);
  const auto Q = reopened->query(QueryFilter{});
  ASSERT_TRUE(Q.ok()) << Q.reason;
  EXPECT_EQ(Q.records.size(), 2U);
}

INSTANTIATE_TEST_SUITE_P(Backends, IngestBackendTest, ::testing::Values("sqlite", "tsdb"),
                         [](const ::testing::TestParamInfo<std::string>& info) {
                           return info.param;
                         });
