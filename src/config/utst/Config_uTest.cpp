/**
 * @file Config_uTest.cpp
 * @brief Unit tests for vigil::config loaders.
 */

#include "src/config/inc/Config.hpp"

#include <gtest/gtest.h>

#include <cstdlib>
#include <fstream>
#include <string>

using vigil::config::AgentSettings;
using vigil::config::ConfigStatus;
using vigil::config::loadAgentConfig;
using vigil::config::loadServerConfig;
using vigil::config::parseAgentConfig;
using vigil::config::parseDuration;
using vigil::config::parseServerConfig;
using vigil::config::ServerSettings;
using namespace std::chrono_literals;

/* ----------------------------- Durations ----------------------------- */

/** @test Bare numbers are seconds; suffixed strings use their unit. */
TEST(DurationTest, Forms) {
  std::chrono::milliseconds d{};
  ASSERT_TRUE(parseDuration(Json::Value(5), d));
  EXPECT_EQ(d, 5000ms);
  ASSERT_TRUE(parseDuration(Json::Value(0.25), d));
  EXPECT_EQ(d, 250ms);
  ASSERT_TRUE(parseDuration(Json::Value("500ms"), d));
  EXPECT_EQ(d, 500ms);
  ASSERT_TRUE(parseDuration(Json::Value("30s"), d));
  EXPECT_EQ(d, 30s);
  ASSERT_TRUE(parseDuration(Json::Value("5m"), d));
  EXPECT_EQ(d, 5min);
  ASSERT_TRUE(parseDuration(Json::Value("1.5h"), d));
  EXPECT_EQ(d, 90min);
  ASSERT_TRUE(parseDuration(Json::Value("7"), d));
  EXPECT_EQ(d, 7s);
}

/** @test Negative, unitless garbage and other types are refused. */
TEST(DurationTest, Rejects) {
  std::chrono::milliseconds d{};
  EXPECT_FALSE(parseDuration(Json::Value(-1), d));
  EXPECT_FALSE(parseDuration(Json::Value("-3s"), d));
  EXPECT_FALSE(parseDuration(Json::Value("soon"), d));
  EXPECT_FALSE(parseDuration(Json::Value("5d"), d));
  EXPECT_FALSE(parseDuration(Json::Value(true), d));
  EXPECT_FALSE(parseDuration(Json::Value(Json::arrayValue), d));
}

/* ----------------------------- Agent ----------------------------- */

/** @test Minimal agent config picks up every default. */
TEST(AgentConfigTest, Defaults) {
  AgentSettings s{};
  const auto R = parseAgentConfig(
      R"({"interval_seconds": 30, "endpoint": {"url": "http://ingest:8000/ingest"}})", s);
  ASSERT_TRUE(R.ok()) << R.reason;
  EXPECT_EQ(s.interval, 30s);
  EXPECT_EQ(s.endpointUrl, "http://ingest:8000/ingest");
  EXPECT_EQ(s.endpointTimeout, 5s);
  EXPECT_EQ(s.transmission.maxAttempts, 3U);
  EXPECT_EQ(s.transmission.backoffBase, 1s);
  EXPECT_EQ(s.transmission.backoffMax, 30s);
  EXPECT_EQ(s.transmission.queueDepth, 2U);
  EXPECT_EQ(s.paths.procRoot, "/proc");
  EXPECT_EQ(s.logging.level, "info");
  EXPECT_FALSE(s.hostname.empty());
}

/** @test Every recognised agent key is applied; unknown keys are ignored. */
TEST(AgentConfigTest, FullConfig) {
  AgentSettings s{};
  const auto R = parseAgentConfig(R"({
      "hostname": "web-01", "interval_seconds": 10,
      "endpoint": {"url": "https://ingest.example.com/ingest", "timeout": "2s",
                   "max_retries": 5, "backoff_base": "200ms", "backoff_max": "10s",
                   "queue_depth": 1, "verify_tls": false},
      "collector": {"proc_root": "/host/proc", "sys_root": "/host/sys", "rootfs": "/host"},
      "logging": {"level": "debug", "file": "/var/log/vigil-agent.log"},
      "dashboard": {"theme": "dark"}})",
                                  s);
  ASSERT_TRUE(R.ok()) << R.reason;
  EXPECT_EQ(s.hostname, "web-01");
  EXPECT_EQ(s.interval, 10s);
  EXPECT_EQ(s.endpointTimeout, 2s);
  EXPECT_EQ(s.transmission.maxAttempts, 5U);
  EXPECT_EQ(s.transmission.backoffBase, 200ms);
  EXPECT_EQ(s.transmission.queueDepth, 1U);
  EXPECT_FALSE(s.verifyTls);
  EXPECT_EQ(s.paths.rootfs, "/host");
  EXPECT_EQ(s.logging.file, "/var/log/vigil-agent.log");
}

/** @test Missing and invalid keys name the dotted key. */
TEST(AgentConfigTest, Errors) {
  AgentSettings s{};
  auto r = parseAgentConfig(R"({"endpoint": {"url": "http://x/ingest"}})", s);
  EXPECT_EQ(r.status, ConfigStatus::MISSING_KEY);
  EXPECT_EQ(r.reason, "interval_seconds: required");

  r = parseAgentConfig(R"({"interval_seconds": 30})", s);
  EXPECT_EQ(r.status, ConfigStatus::MISSING_KEY);
  EXPECT_EQ(r.reason, "endpoint.url: required");

  r = parseAgentConfig(R"({"interval_seconds": 0, "endpoint": {"url": "http://x/"}})", s);
  EXPECT_EQ(r.status, ConfigStatus::INVALID_VALUE);

  r = parseAgentConfig(R"({"interval_seconds": 30, "endpoint": {"url": "ftp://x/"}})", s);
  EXPECT_EQ(r.status, ConfigStatus::INVALID_VALUE);
  EXPECT_EQ(r.reason.rfind("endpoint.url:", 0), 0U);

  r = parseAgentConfig(
      R"({"interval_seconds": 30, "endpoint": {"url": "http://x/", "queue_depth": 99}})", s);
  EXPECT_EQ(r.status, ConfigStatus::INVALID_VALUE);
  EXPECT_EQ(r.reason.rfind("endpoint.queue_depth:", 0), 0U);

  r = parseAgentConfig(
      R"({"interval_seconds": 30, "endpoint": {"url": "http://x/"}, "logging": {"level": "loud"}})",
      s);
  EXPECT_EQ(r.status, ConfigStatus::INVALID_VALUE);

  r = parseAgentConfig("{\"interval_seconds\": ", s);
  EXPECT_EQ(r.status, ConfigStatus::PARSE_ERROR);
  r = parseAgentConfig("[1, 2]", s);
  EXPECT_EQ(r.status, ConfigStatus::PARSE_ERROR);
}

/* ----------------------------- Server ----------------------------- */

/** @test Thresholds as numbers or objects, channel settings and defaults. */
TEST(ServerConfigTest, FullConfig) {
  ServerSettings s{};
  const auto R = parseServerConfig(R"({
      "server": {"port": 9000, "threads": 8},
      "storage": {"backend": "sqlite", "sqlite": {"path": "/var/lib/vigil/metrics.db"}},
      "thresholds": {"cpu": 80, "memory": {"value": 90, "cooldown_minutes": 10,
                                           "recovery": 85, "critical": 98},
                     "gpu": 50},
      "alerts": {"cooldown_minutes": 2, "channels": ["log", "webhook", "email"],
                 "recovery_events": true, "channel_retries": 1,
                 "webhook": {"url": "https://hooks.example.com/a",
                             "headers": {"Authorization": "Bearer t"}},
                 "email": {"smtp_server": "smtp.example.com", "smtp_port": 587,
                           "use_tls": true, "username": "alerts@example.com",
                           "password": "pw", "to_addresses": ["ops@example.com"]}}})",
                                   s);
  ASSERT_TRUE(R.ok()) << R.reason;
  EXPECT_EQ(s.server.port, 9000);
  EXPECT_EQ(s.server.threads, 8U);
  EXPECT_EQ(s.server.bind, "0.0.0.0");
  EXPECT_EQ(s.storage.backend, "sqlite");
  EXPECT_EQ(s.storage.sqlitePath, "/var/lib/vigil/metrics.db");

  ASSERT_NE(s.thresholds.find("cpu"), nullptr);
  EXPECT_DOUBLE_EQ(s.thresholds.find("cpu")->value, 80.0);
  EXPECT_EQ(s.thresholds.find("cpu")->cooldown, 2min);
  const auto* MEM = s.thresholds.find("memory");
  ASSERT_NE(MEM, nullptr);
  EXPECT_EQ(MEM->cooldown, 10min);
  EXPECT_DOUBLE_EQ(MEM->recoveryLevel(), 85.0);
  EXPECT_DOUBLE_EQ(MEM->criticalLevel(), 98.0);
  EXPECT_EQ(s.thresholds.find("gpu"), nullptr);

  EXPECT_TRUE(s.recoveryEvents);
  EXPECT_EQ(s.dispatcher.retries, 1U);
  ASSERT_EQ(s.channels.enabled.size(), 3U);
  ASSERT_EQ(s.channels.webhookHeaders.size(), 1U);
  EXPECT_EQ(s.channels.webhookHeaders[0].first, "Authorization");
  EXPECT_EQ(s.channels.email.to.size(), 1U);
}

/** @test Backend selection requires its own path key. */
TEST(ServerConfigTest, StorageKeys) {
  ServerSettings s{};
  auto r = parseServerConfig(R"({})", s);
  EXPECT_EQ(r.status, ConfigStatus::MISSING_KEY);
  EXPECT_EQ(r.reason, "storage.backend: required");

  r = parseServerConfig(R"({"storage": {"backend": "tsdb"}})", s);
  EXPECT_EQ(r.status, ConfigStatus::MISSING_KEY);
  EXPECT_EQ(r.reason, "storage.tsdb.path: required");

  r = parseServerConfig(R"({"storage": {"backend": "mongo"}})", s);
  EXPECT_EQ(r.status, ConfigStatus::INVALID_VALUE);

  r = parseServerConfig(R"({"storage": {"backend": "tsdb", "tsdb": {"path": "/data"}}})", s);
  ASSERT_TRUE(r.ok()) << r.reason;
  EXPECT_EQ(s.storage.tsdbBucket, "metrics");
  ASSERT_EQ(s.channels.enabled.size(), 1U);
  EXPECT_EQ(s.channels.enabled[0], "log");
  EXPECT_EQ(s.dispatcher.retries, 2U);
}

/** @test An enabled channel without its settings fails startup. */
TEST(ServerConfigTest, ChannelKeysRequired) {
  ServerSettings s{};
  auto r = parseServerConfig(
      R"({"storage": {"backend": "sqlite", "sqlite": {"path": "x.db"}},
          "alerts": {"channels": ["log", "slack"]}})",
      s);
  EXPECT_EQ(r.status, ConfigStatus::MISSING_KEY);
  EXPECT_NE(r.reason.find("alerts.slack.webhook_url"), std::string::npos);

  r = parseServerConfig(
      R"({"storage": {"backend": "sqlite", "sqlite": {"path": "x.db"}},
          "alerts": {"channels": ["pager"]}})",
      s);
  EXPECT_EQ(r.status, ConfigStatus::INVALID_VALUE);
  EXPECT_NE(r.reason.find("'pager'"), std::string::npos);
}

/** @test Threshold ordering errors name the metric. */
TEST(ServerConfigTest, ThresholdErrors) {
  ServerSettings s{};
  auto r = parseServerConfig(
      R"({"storage": {"backend": "sqlite", "sqlite": {"path": "x.db"}},
          "thresholds": {"disk": {"value": 90, "recovery": 95}}})",
      s);
  EXPECT_EQ(r.status, ConfigStatus::INVALID_VALUE);
  EXPECT_EQ(r.reason.rfind("thresholds.disk:", 0), 0U);

  r = parseServerConfig(
      R"({"storage": {"backend": "sqlite", "sqlite": {"path": "x.db"}},
          "thresholds": {"cpu": "high"}})",
      s);
  EXPECT_EQ(r.status, ConfigStatus::INVALID_VALUE);
  EXPECT_EQ(r.reason, "thresholds.cpu: expected a number");
}

/* ----------------------------- Files ----------------------------- */

/** @test File loaders read from disk and report unreadable paths. */
TEST(ConfigFileTest, LoadFromDisk) {
  char tmpl[] = "/tmp/vigil_config_XXXXXX";
  const char* dir = ::mkdtemp(tmpl);
  ASSERT_NE(dir, nullptr);
  const std::string PATH = std::string(dir) + "/agent.json";
  std::ofstream(PATH) << R"({"interval_seconds": 15, "endpoint": {"url": "http://a/ingest"}})";

  AgentSettings a{};
  const auto R = loadAgentConfig(PATH, a);
  EXPECT_TRUE(R.ok()) << R.reason;
  EXPECT_EQ(a.interval, 15s);

  ServerSettings srv{};
  const auto MISSING = loadServerConfig(std::string(dir) + "/nope.json", srv);
  EXPECT_EQ(MISSING.status, ConfigStatus::UNREADABLE);
  EXPECT_NE(MISSING.reason.find("nope.json"), std::string::npos);

  const std::string CMD = std::string("rm -rf '") + dir + "'";
  EXPECT_EQ(std::system(CMD.c_str()), 0);
}

/** @test The example files shipped under config/ load cleanly. */
TEST(ConfigFileTest, ExamplesLoad) {
  const std::string ROOT = VIGIL_SOURCE_DIR;

  AgentSettings a{};
  const auto AGENT = loadAgentConfig(ROOT + "/config/agent.example.json", a);
  EXPECT_TRUE(AGENT.ok()) << AGENT.reason;

  ServerSettings s{};
  const auto SERVER = loadServerConfig(ROOT + "/config/ingestd.example.json", s);
  ASSERT_TRUE(SERVER.ok()) << SERVER.reason;
  EXPECT_EQ(s.thresholds.find("swap")->cooldown, 5min);
  EXPECT_DOUBLE_EQ(s.thresholds.find("memory")->recoveryLevel(), 80.0);
}
