/**
 * @file Config.cpp
 * @brief Dotted-key readers and the agent/server settings loaders.
 */

#include "src/config/inc/Config.hpp"
#include "src/collect/inc/HostCollector.hpp"
#include "src/helpers/inc/Files.hpp"
#include "src/helpers/inc/Strings.hpp"
#include "src/model/inc/SnapshotJson.hpp"
#include "src/transport/inc/HttpMessage.hpp"

#include <fmt/core.h>

#include <algorithm>
#include <cmath>
#include <limits>
#include <memory>
#include <utility>
#include <vector>

namespace vigil {

namespace config {

namespace {

/**
 * @brief Looks up dotted keys and records the first failure.
 *
 * Every accessor leaves @p out untouched when the key is absent and not
 * required, so callers pre-load defaults.
 */
class KeyReader {
public:
  explicit KeyReader(const Json::Value& root) : root_(root) {}

  [[nodiscard]] const Json::Value* find(std::string_view dotted) const {
    const Json::Value* cur = &root_;
    while (!dotted.empty()) {
      const std::size_t DOT = dotted.find('.');
      const std::string PART(dotted.substr(0, DOT));
      dotted = (DOT == std::string_view::npos) ? std::string_view{} : dotted.substr(DOT + 1);
      if (!cur->isObject()) {
        return nullptr;
      }
      cur = cur->find(PART.data(), PART.data() + PART.size());
      if (cur == nullptr || cur->isNull()) {
        return nullptr;
      }
    }
    return cur;
  }

  [[nodiscard]] bool failed() const noexcept { return !result_.ok(); }
  [[nodiscard]] const ConfigResult& result() const noexcept { return result_; }

  void fail(ConfigStatus status, std::string_view key, std::string_view what) {
    if (!failed()) {
      result_.status = status;
      result_.reason = fmt::format("{}: {}", key, what);
    }
  }

  void failWith(ConfigStatus status, std::string reason) {
    if (!failed()) {
      result_.status = status;
      result_.reason = std::move(reason);
    }
  }

  const Json::Value* get(std::string_view key, bool required) {
    const Json::Value* v = find(key);
    if (v == nullptr && required) {
      fail(ConfigStatus::MISSING_KEY, key, "required");
    }
    return v;
  }

  void string(std::string_view key, std::string& out, bool required = false) {
    if (const Json::Value* v = get(key, required)) {
      if (!v->isString()) {
        fail(ConfigStatus::INVALID_VALUE, key, "expected a string");
        return;
      }
      out = v->asString();
      if (required && out.empty()) {
        fail(ConfigStatus::MISSING_KEY, key, "must not be empty");
      }
    }
  }

  void boolean(std::string_view key, bool& out) {
    if (const Json::Value* v = get(key, false)) {
      if (!v->isBool()) {
        fail(ConfigStatus::INVALID_VALUE, key, "expected true or false");
        return;
      }
      out = v->asBool();
    }
  }

  void number(std::string_view key, double& out, double lo, double hi, bool required = false) {
    if (const Json::Value* v = get(key, required)) {
      if (!v->isNumeric() || v->isBool()) {
        fail(ConfigStatus::INVALID_VALUE, key, "expected a number");
        return;
      }
      const double D = v->asDouble();
      if (!std::isfinite(D) || D < lo || D > hi) {
        fail(ConfigStatus::INVALID_VALUE, key, fmt::format("must be within [{}, {}]", lo, hi));
        return;
      }
      out = D;
    }
  }

  template <typename Int>
  void integer(std::string_view key, Int& out, std::int64_t lo, std::int64_t hi,
               bool required = false) {
    if (const Json::Value* v = get(key, required)) {
      if (!v->isIntegral() || v->isBool()) {
        fail(ConfigStatus::INVALID_VALUE, key, "expected an integer");
        return;
      }
      const std::int64_t N = v->isUInt64() && !v->isInt64()
                                 ? std::numeric_limits<std::int64_t>::max()
                                 : v->asInt64();
      if (N < lo || N > hi) {
        fail(ConfigStatus::INVALID_VALUE, key, fmt::format("must be within [{}, {}]", lo, hi));
        return;
      }
      out = static_cast<Int>(N);
    }
  }

  void duration(std::string_view key, std::chrono::milliseconds& out, bool required = false) {
    if (const Json::Value* v = get(key, required)) {
      if (!parseDuration(*v, out)) {
        fail(ConfigStatus::INVALID_VALUE, key,
             "expected seconds or a duration such as \"500ms\", \"30s\", \"5m\"");
      }
    }
  }

  void stringList(std::string_view key, std::vector<std::string>& out) {
    if (const Json::Value* v = get(key, false)) {
      if (!v->isArray()) {
        fail(ConfigStatus::INVALID_VALUE, key, "expected an array of strings");
        return;
      }
      std::vector<std::string> items;
      for (const Json::Value& item : *v) {
        if (!item.isString()) {
          fail(ConfigStatus::INVALID_VALUE, key, "expected an array of strings");
          return;
        }
        items.push_back(item.asString());
      }
      out = std::move(items);
    }
  }

  void logging(helpers::logging::LogSettings& out) {
    string("logging.level", out.level);
    spdlog::level::level_enum level{};
    if (!failed() && !helpers::logging::parseLevel(out.level, level)) {
      fail(ConfigStatus::INVALID_VALUE, "logging.level",
           "expected trace, debug, info, warn, error, critical or off");
    }
    string("logging.file", out.file);
  }

private:
  const Json::Value& root_;
  ConfigResult result_{};
};

ConfigResult parseRoot(std::string_view text, Json::Value& root) {
  std::string error;
  if (!model::parseJson(text, root, error)) {
    return {ConfigStatus::PARSE_ERROR, "invalid JSON: " + error};
  }
  if (!root.isObject()) {
    return {ConfigStatus::PARSE_ERROR, "top level must be a JSON object"};
  }
  return {};
}

ConfigResult readFile(const std::string& path, std::string& text) {
  auto content = helpers::files::readTextFile(path);
  if (!content) {
    return {ConfigStatus::UNREADABLE, "cannot read config file " + path};
  }
  text = std::move(*content);
  return {};
}

std::chrono::milliseconds minutes(double m) {
  return std::chrono::milliseconds(static_cast<std::int64_t>(std::llround(m * 60'000.0)));
}

void readThresholds(KeyReader& r, alert::ThresholdConfig& out,
                    std::chrono::milliseconds defaultCooldown) {
  const Json::Value* node = r.find("thresholds");
  if (node == nullptr) {
    return;
  }
  if (!node->isObject()) {
    r.fail(ConfigStatus::INVALID_VALUE, "thresholds", "expected an object");
    return;
  }
  for (const std::string& NAME : node->getMemberNames()) {
    if (std::find(alert::KNOWN_METRICS.begin(), alert::KNOWN_METRICS.end(), NAME) ==
        alert::KNOWN_METRICS.end()) {
      helpers::logging::get("config")->warn("event=config_unknown_metric key=thresholds.{}",
                                            NAME);
      continue;
    }
    const std::string KEY = "thresholds." + NAME;
    alert::MetricThreshold t{};
    t.cooldown = defaultCooldown;
    if ((*node)[NAME].isObject()) {
      r.number(KEY + ".value", t.value, 0.0, 100.0, true);
      double cooldownMinutes = -1.0;
      r.number(KEY + ".cooldown_minutes", cooldownMinutes, 0.0, 1e6);
      if (cooldownMinutes >= 0.0) {
        t.cooldown = minutes(cooldownMinutes);
      }
      double level = 0.0;
      if (r.find(KEY + ".recovery") != nullptr) {
        r.number(KEY + ".recovery", level, 0.0, 100.0);
        t.recovery = level;
      }
      if (r.find(KEY + ".critical") != nullptr) {
        r.number(KEY + ".critical", level, 0.0, 100.0);
        t.critical = level;
      }
    } else {
      r.number(KEY, t.value, 0.0, 100.0, true);
    }
    out.metrics[NAME] = t;
  }
}

void readChannels(KeyReader& r, alert::ChannelSettings& out) {
  r.stringList("alerts.channels", out.enabled);
  for (const std::string& NAME : out.enabled) {
    if (NAME != "log" && NAME != "slack" && NAME != "email" && NAME != "webhook") {
      r.fail(ConfigStatus::INVALID_VALUE, "alerts.channels",
             fmt::format("unknown channel '{}' (expected log, slack, email or webhook)", NAME));
    }
  }
  r.string("alerts.slack.webhook_url", out.slackWebhookUrl);
  r.string("alerts.webhook.url", out.webhookUrl);
  if (const Json::Value* headers = r.find("alerts.webhook.headers")) {
    if (!headers->isObject()) {
      r.fail(ConfigStatus::INVALID_VALUE, "alerts.webhook.headers", "expected an object");
    } else {
      for (const std::string& NAME : headers->getMemberNames()) {
        const Json::Value& V = (*headers)[NAME];
        if (!V.isString()) {
          r.fail(ConfigStatus::INVALID_VALUE, "alerts.webhook.headers." + NAME,
                 "expected a string");
          return;
        }
        out.webhookHeaders.emplace_back(NAME, V.asString());
      }
    }
  }
  r.duration("alerts.http_timeout", out.httpTimeout);

  transport::SmtpSettings& e = out.email;
  r.string("alerts.email.smtp_server", e.server);
  r.integer("alerts.email.smtp_port", e.port, 1, 65535);
  r.boolean("alerts.email.use_tls", e.useTls);
  r.boolean("alerts.email.verify_tls", e.verifyTls);
  r.string("alerts.email.username", e.username);
  r.string("alerts.email.password", e.password);
  r.string("alerts.email.from", e.from);
  r.stringList("alerts.email.to_addresses", e.to);
}

} // namespace

/* ----------------------------- Status Helpers ----------------------------- */

const char* toString(ConfigStatus status) noexcept {
  switch (status) {
  case ConfigStatus::OK:
    return "OK";
  case ConfigStatus::UNREADABLE:
    return "UNREADABLE";
  case ConfigStatus::PARSE_ERROR:
    return "PARSE_ERROR";
  case ConfigStatus::MISSING_KEY:
    return "MISSING_KEY";
  case ConfigStatus::INVALID_VALUE:
    return "INVALID_VALUE";
  }
  return "UNKNOWN";
}

/* ----------------------------- Durations ----------------------------- */

bool parseDuration(const Json::Value& value, std::chrono::milliseconds& out) {
  if (value.isNumeric() && !value.isBool()) {
    const double S = value.asDouble();
    if (!std::isfinite(S) || S < 0.0) {
      return false;
    }
    out = std::chrono::milliseconds(static_cast<std::int64_t>(std::llround(S * 1000.0)));
    return true;
  }
  if (!value.isString()) {
    return false;
  }
  const std::string TEXT = value.asString();
  const std::string_view SV = helpers::strings::trim(TEXT);

  struct Unit {
    std::string_view suffix;
    double toMillis;
  };
  // "ms" before "m" and "s".
  static constexpr Unit UNITS[] = {{"ms", 1.0}, {"h", 3'600'000.0}, {"m", 60'000.0}, {"s", 1000.0}};
  for (const Unit& U : UNITS) {
    if (SV.size() > U.suffix.size() && SV.substr(SV.size() - U.suffix.size()) == U.suffix) {
      double n = 0.0;
      if (!helpers::strings::parseDouble(SV.substr(0, SV.size() - U.suffix.size()), n) ||
          !std::isfinite(n) || n < 0.0) {
        return false;
      }
      out = std::chrono::milliseconds(static_cast<std::int64_t>(std::llround(n * U.toMillis)));
      return true;
    }
  }
  double seconds = 0.0;
  if (helpers::strings::parseDouble(SV, seconds) && std::isfinite(seconds) && seconds >= 0.0) {
    out = std::chrono::milliseconds(static_cast<std::int64_t>(std::llround(seconds * 1000.0)));
    return true;
  }
  return false;
}

/* ----------------------------- Agent ----------------------------- */

ConfigResult parseAgentConfig(std::string_view text, AgentSettings& out) {
  Json::Value root;
  if (ConfigResult r = parseRoot(text, root); !r.ok()) {
    return r;
  }
  KeyReader r(root);
  AgentSettings s{};

  s.hostname = collect::localHostname();
  r.string("hostname", s.hostname);

  std::int64_t intervalSeconds = 0;
  r.integer("interval_seconds", intervalSeconds, 1, 86'400, true);
  s.interval = std::chrono::seconds(intervalSeconds);

  r.string("endpoint.url", s.endpointUrl, true);
  if (!r.failed()) {
    transport::Url url{};
    std::string error;
    if (!transport::parseUrl(s.endpointUrl, url, error)) {
      r.fail(ConfigStatus::INVALID_VALUE, "endpoint.url", error);
    }
  }
  r.duration("endpoint.timeout", s.endpointTimeout);
  r.boolean("endpoint.verify_tls", s.verifyTls);
  r.integer("endpoint.max_retries", s.transmission.maxAttempts, 1, 100);
  r.duration("endpoint.backoff_base", s.transmission.backoffBase);
  r.duration("endpoint.backoff_max", s.transmission.backoffMax);
  r.integer("endpoint.queue_depth", s.transmission.queueDepth, 1, 16);
  if (!r.failed() && s.transmission.backoffMax < s.transmission.backoffBase) {
    r.fail(ConfigStatus::INVALID_VALUE, "endpoint.backoff_max", "must be >= endpoint.backoff_base");
  }
  if (!r.failed() && s.endpointTimeout.count() == 0) {
    r.fail(ConfigStatus::INVALID_VALUE, "endpoint.timeout", "must be positive");
  }

  r.string("collector.proc_root", s.paths.procRoot);
  r.string("collector.sys_root", s.paths.sysRoot);
  r.string("collector.rootfs", s.paths.rootfs);
  r.logging(s.logging);

  if (r.failed()) {
    return r.result();
  }
  out = std::move(s);
  return {};
}

ConfigResult loadAgentConfig(const std::string& path, AgentSettings& out) {
  std::string text;
  if (ConfigResult r = readFile(path, text); !r.ok()) {
    return r;
  }
  return parseAgentConfig(text, out);
}

/* ----------------------------- Server ----------------------------- */

ConfigResult parseServerConfig(std::string_view text, ServerSettings& out) {
  Json::Value root;
  if (ConfigResult r = parseRoot(text, root); !r.ok()) {
    return r;
  }
  KeyReader r(root);
  ServerSettings s{};

  r.string("server.bind", s.server.bind);
  r.integer("server.port", s.server.port, 1, 65535);
  r.integer("server.threads", s.server.threads, 1, 256);
  r.duration("server.io_timeout", s.server.ioTimeout);

  r.string("storage.backend", s.storage.backend, true);
  if (!r.failed()) {
    if (s.storage.backend == "sqlite") {
      r.string("storage.sqlite.path", s.storage.sqlitePath, true);
    } else if (s.storage.backend == "tsdb") {
      r.string("storage.tsdb.path", s.storage.tsdbPath, true);
      r.string("storage.tsdb.bucket", s.storage.tsdbBucket);
    } else {
      r.fail(ConfigStatus::INVALID_VALUE, "storage.backend", "expected sqlite or tsdb");
    }
  }

  double cooldownMinutes = static_cast<double>(alert::DEFAULT_COOLDOWN.count());
  r.number("alerts.cooldown_minutes", cooldownMinutes, 0.0, 1e6);
  readThresholds(r, s.thresholds, minutes(cooldownMinutes));
  if (!r.failed()) {
    std::string reason;
    if (!s.thresholds.validate(reason)) {
      r.failWith(ConfigStatus::INVALID_VALUE, reason);
    }
  }

  r.boolean("alerts.recovery_events", s.recoveryEvents);
  r.integer("alerts.channel_retries", s.dispatcher.retries, 0, 10);
  r.duration("alerts.retry_delay", s.dispatcher.retryDelay);
  readChannels(r, s.channels);
  if (!r.failed()) {
    std::vector<std::unique_ptr<alert::NotificationChannel>> probe;
    std::string reason;
    if (alert::makeChannels(s.channels, probe, reason) != alert::ChannelStatus::OK) {
      r.failWith(ConfigStatus::MISSING_KEY, reason);
    }
  }
  r.logging(s.logging);

  if (r.failed()) {
    return r.result();
  }
  out = std::move(s);
  return {};
}

ConfigResult loadServerConfig(const std::string& path, ServerSettings& out) {
  std::string text;
  if (ConfigResult r = readFile(path, text); !r.ok()) {
    return r;
  }
  return parseServerConfig(text, out);
}

} // namespace config

} // namespace vigil
