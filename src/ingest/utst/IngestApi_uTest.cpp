/**
 * @file IngestApi_uTest.cpp
 * @brief Unit tests for vigil::ingest::IngestApi routes and query parsing.
 */

#include "src/ingest/inc/IngestApi.hpp"
#include "src/ingest/utst/IngestTestSupport.hpp"
#include "src/model/inc/SnapshotJson.hpp"
#include "src/storage/utst/StorageTestData.hpp"

#include <gtest/gtest.h>

#include <string>

using vigil::ingest::IngestApi;
using vigil::ingest::IngestionService;
using vigil::ingest::parseQueryFilter;
using vigil::ingest::ServerReply;
using vigil::ingest::ServerRequest;
using vigil::ingest::test::MemoryBackend;
using vigil::storage::QueryFilter;
using vigil::storage::test::makeSnapshot;

namespace {

constexpr std::int64_t TS = 1'714'564'800'000;

ServerRequest request(const std::string& method, const std::string& target,
                      std::string body = {}) {
  ServerRequest r{};
  r.head.method = method;
  r.head.target = target;
  const std::size_t Q = target.find('?');
  r.head.path = target.substr(0, Q);
  r.head.query = (Q == std::string::npos) ? std::string{} : target.substr(Q + 1);
  r.body = std::move(body);
  return r;
}

Json::Value parse(const ServerReply& reply) {
  Json::Value v;
  std::string err;
  EXPECT_TRUE(vigil::model::parseJson(reply.body, v, err)) << err << ": " << reply.body;
  return v;
}

std::string payload(const std::string& host, std::int64_t ts, double cpu = 12.5) {
  auto s = makeSnapshot(host, ts);
  s.cpu.overallPercent = cpu;
  return vigil::model::toCompactString(vigil::model::ingestPayloadToJson(s));
}

} // namespace

class IngestApiTest : public ::testing::Test {
protected:
  MemoryBackend storage_{};
  std::unique_ptr<IngestionService> service_{};
  std::unique_ptr<IngestApi> api_{};

  void SetUp() override {
    ASSERT_TRUE(storage_.open().ok());
    service_ = std::make_unique<IngestionService>(storage_, nullptr, nullptr);
    api_ = std::make_unique<IngestApi>(*service_);
  }
};

/* ----------------------------- POST /ingest ----------------------------- */

/** @test Valid payloads get 202 {"status":"accepted"}. */
TEST_F(IngestApiTest, IngestAccepted) {
  const ServerReply R = api_->handle(request("POST", "/ingest", payload("web-01", TS)));
  EXPECT_EQ(R.status, 202);
  EXPECT_EQ(parse(R)["status"].asString(), "accepted");
  EXPECT_EQ(storage_.size(), 1U);

  const ServerReply AGAIN = api_->handle(request("POST", "/ingest", payload("web-01", TS)));
  EXPECT_EQ(AGAIN.status, 202);
  EXPECT_TRUE(parse(AGAIN)["duplicate"].asBool());
}

/** @test Malformed and out-of-range payloads get 400 with a reason. */
TEST_F(IngestApiTest, IngestRejected) {
  ServerReply r = api_->handle(request("POST", "/ingest", "{not json"));
  EXPECT_EQ(r.status, 400);
  EXPECT_EQ(parse(r)["status"].asString(), "rejected");
  EXPECT_FALSE(parse(r)["reason"].asString().empty());

  r = api_->handle(request("POST", "/ingest", payload("web-01", TS, 150.0)));
  EXPECT_EQ(r.status, 400);
  EXPECT_EQ(storage_.size(), 0U);
}

/** @test Storage failures map to 503 so the client retries. */
TEST_F(IngestApiTest, IngestStorageFailure) {
  storage_.failWrites = true;
  const ServerReply R = api_->handle(request("POST", "/ingest", payload("web-01", TS)));
  EXPECT_EQ(R.status, 503);
  EXPECT_EQ(parse(R)["status"].asString(), "unavailable");
}

/* ----------------------------- GET routes ----------------------------- */

/** @test /health mirrors storage reachability. */
TEST_F(IngestApiTest, Health) {
  ServerReply r = api_->handle(request("GET", "/health"));
  EXPECT_EQ(r.status, 200);
  EXPECT_EQ(parse(r)["status"].asString(), "ok");
  EXPECT_EQ(parse(r)["backend"].asString(), "memory");

  storage_.failPing = true;
  r = api_->handle(request("GET", "/health"));
  EXPECT_EQ(r.status, 503);
}

/** @test /metrics returns the filtered snapshots oldest first. */
TEST_F(IngestApiTest, MetricsQuery) {
  ASSERT_EQ(api_->handle(request("POST", "/ingest", payload("b", TS + 2000))).status, 202);
  ASSERT_EQ(api_->handle(request("POST", "/ingest", payload("a", TS + 1000))).status, 202);
  ASSERT_EQ(api_->handle(request("POST", "/ingest", payload("a", TS + 3000))).status, 202);

  ServerReply r = api_->handle(request("GET", "/metrics"));
  ASSERT_EQ(r.status, 200);
  Json::Value all = parse(r);
  ASSERT_EQ(all.size(), 3U);
  EXPECT_EQ(all[0]["hostname"].asString(), "a");
  EXPECT_EQ(all[1]["hostname"].asString(), "b");

  r = api_->handle(request("GET", "/metrics?host=a&since=2024-05-01T12:00:02Z"));
  ASSERT_EQ(r.status, 200);
  Json::Value some = parse(r);
  ASSERT_EQ(some.size(), 1U);
  EXPECT_EQ(some[0]["timestamp"].asString(), "2024-05-01T12:00:03.000Z");

  r = api_->handle(request("GET", "/metrics?since=yesterday"));
  EXPECT_EQ(r.status, 400);
}

/** @test /summary aggregates CPU and memory. */
TEST_F(IngestApiTest, SummaryRoute) {
  ASSERT_EQ(api_->handle(request("POST", "/ingest", payload("a", TS, 20.0))).status, 202);
  ASSERT_EQ(api_->handle(request("POST", "/ingest", payload("a", TS + 1000, 40.0))).status, 202);
  const ServerReply R = api_->handle(request("GET", "/summary?host=a"));
  ASSERT_EQ(R.status, 200);
  const Json::Value V = parse(R);
  EXPECT_EQ(V["samples"].asUInt64(), 2U);
  EXPECT_DOUBLE_EQ(V["avg_cpu"].asDouble(), 30.0);
  EXPECT_DOUBLE_EQ(V["max_cpu"].asDouble(), 40.0);
  EXPECT_EQ(V["host"].asString(), "a");
}

/** @test Unknown paths and wrong methods. */
TEST_F(IngestApiTest, RoutingErrors) {
  EXPECT_EQ(api_->handle(request("GET", "/nope")).status, 404);
  EXPECT_EQ(api_->handle(request("GET", "/ingest")).status, 405);
  EXPECT_EQ(api_->handle(request("POST", "/health")).status, 405);
}

/* ----------------------------- Query parsing ----------------------------- */

/** @test Both time forms, limit and inverted ranges. */
TEST(QueryFilterParseTest, Forms) {
  QueryFilter f{};
  std::string reason;
  ASSERT_TRUE(parseQueryFilter("host=web%2D01&since=1714564800000&until=2024-05-01T13:00:00Z&limit=5",
                               f, reason))
      << reason;
  EXPECT_EQ(f.hostname, "web-01");
  ASSERT_TRUE(f.since.has_value());
  EXPECT_EQ(vigil::helpers::clock::toUnixMillis(*f.since), TS);
  EXPECT_EQ(vigil::helpers::clock::toUnixMillis(*f.until), TS + 3'600'000);
  EXPECT_EQ(f.limit, 5U);

  EXPECT_FALSE(parseQueryFilter("limit=-1", f, reason));
  EXPECT_NE(reason.find("limit"), std::string::npos);
  EXPECT_FALSE(parseQueryFilter("since=2024-05-02T00:00:00Z&until=2024-05-01T00:00:00Z", f, reason));
  EXPECT_TRUE(parseQueryFilter("", f, reason));
  EXPECT_TRUE(f.hostname.empty());
  EXPECT_FALSE(f.since.has_value());
}

/** @test Millisecond counts a timestamp cannot hold are refused rather than wrapped. */
TEST(QueryFilterParseTest, InstantOutOfRange) {
  QueryFilter f{};
  std::string reason;
  EXPECT_FALSE(parseQueryFilter("since=9223372036854775808", f, reason));
  EXPECT_NE(reason.find("since"), std::string::npos);
  EXPECT_NE(reason.find("out of range"), std::string::npos);
  EXPECT_FALSE(parseQueryFilter("until=18446744073709551615", f, reason));
  EXPECT_NE(reason.find("until"), std::string::npos);

  EXPECT_TRUE(parseQueryFilter("until=4102444800000", f, reason)) << reason;
  EXPECT_EQ(vigil::helpers::clock::toUnixMillis(*f.until), 4'102'444'800'000);
}

/** @test An out-of-range bound on /metrics answers 400. */
TEST_F(IngestApiTest, MetricsRangeOverflow) {
  const ServerReply R = api_->handle(request("GET", "/metrics?since=99999999999999999999"));
  EXPECT_EQ(R.status, 400);
  const ServerReply BIG = api_->handle(request("GET", "/summary?until=9223372036854775808"));
  EXPECT_EQ(BIG.status, 400);
}
