/**
 * @file IngestApi.cpp
 * @brief Route table and JSON bodies for the ingestion daemon.
 */

#include "src/ingest/inc/IngestApi.hpp"
#include "src/helpers/inc/Clock.hpp"
#include "src/helpers/inc/Strings.hpp"
#include "src/model/inc/SnapshotJson.hpp"
#include "src/model/inc/TimeFormat.hpp"

#include <fmt/core.h>
#include <json/json.h>

#include <cstdint>
#include <chrono>

namespace vigil {

namespace ingest {

namespace {

ServerReply statusReply(int code, const char* status, const std::string& reason = {}) {
  Json::Value body(Json::objectValue);
  body["status"] = status;
  if (!reason.empty()) {
    body["reason"] = reason;
  }
  return jsonReply(code, model::toCompactString(body));
}

/// Largest Unix millisecond count a model::Timestamp can hold.
const std::uint64_t MAX_UNIX_MILLIS = static_cast<std::uint64_t>(
    std::chrono::duration_cast<std::chrono::milliseconds>(model::Timestamp::duration::max())
        .count());

/// @return false with @p reason set when @p text is not a usable instant.
bool parseInstant(std::string_view key, std::string_view text, model::Timestamp& out,
                  std::string& reason) {
  std::uint64_t ms = 0;
  if (vigil::helpers::strings::parseUint64(text, ms)) {
    if (ms > MAX_UNIX_MILLIS) {
      reason = fmt::format("{}: {} is out of range", key, text);
      return false;
    }
    out = vigil::helpers::clock::fromUnixMillis(static_cast<std::int64_t>(ms));
    return true;
  }
  if (const auto T = model::parseIso8601(text)) {
    out = *T;
    return true;
  }
  reason = fmt::format("{}: expected ISO-8601 or Unix milliseconds", key);
  return false;
}

} // namespace

bool parseQueryFilter(std::string_view query, storage::QueryFilter& out, std::string& reason) {
  out = storage::QueryFilter{};
  if (auto host = transport::queryParam(query, "host")) {
    out.hostname = *host;
  }
  for (const char* KEY : {"since", "until"}) {
    const auto RAW = transport::queryParam(query, KEY);
    if (!RAW || RAW->empty()) {
      continue;
    }
    model::Timestamp t{};
    if (!parseInstant(KEY, *RAW, t, reason)) {
      return false;
    }
    (std::string_view(KEY) == "since" ? out.since : out.until) = t;
  }
  if (const auto LIMIT = transport::queryParam(query, "limit")) {
    std::uint64_t n = 0;
    if (!vigil::helpers::strings::parseUint64(*LIMIT, n)) {
      reason = "limit: expected a non-negative integer";
      return false;
    }
    out.limit = static_cast<std::size_t>(n);
  }
  if (out.since && out.until && *out.until < *out.since) {
    reason = "until is before since";
    return false;
  }
  return true;
}

/* ----------------------------- Routing ----------------------------- */

ServerReply IngestApi::handle(const ServerRequest& req) {
  const std::string& PATH = req.head.path;
  const std::string& METHOD = req.head.method;

  if (PATH == "/ingest") {
    return METHOD == "POST" ? postIngest(req) : statusReply(405, "error", "use POST");
  }
  if (PATH == "/health" || PATH == "/metrics" || PATH == "/summary") {
    if (METHOD != "GET") {
      return statusReply(405, "error", "use GET");
    }
    if (PATH == "/health") {
      return getHealth();
    }
    return PATH == "/metrics" ? getMetrics(req) : getSummary(req);
  }
  return statusReply(404, "error", "no route for " + PATH);
}

ServerReply IngestApi::postIngest(const ServerRequest& req) {
  model::MetricSnapshot snap{};
  const model::ValidationResult DECODED = model::ingestPayloadFromJson(req.body, snap);
  if (!DECODED.ok()) {
    return statusReply(400, "rejected", DECODED.reason);
  }

  const IngestResult R = service_.ingest(snap.hostname, snap);
  switch (R.status) {
  case IngestStatus::ACCEPTED: {
    Json::Value body(Json::objectValue);
    body["status"] = "accepted";
    if (R.duplicate) {
      body["duplicate"] = true;
    }
    return jsonReply(202, model::toCompactString(body));
  }
  case IngestStatus::REJECTED:
    return statusReply(400, "rejected", R.reason);
  case IngestStatus::STORAGE_FAILED:
  case IngestStatus::SHUTTING_DOWN:
    break;
  }
  return statusReply(503, "unavailable", R.reason);
}

ServerReply IngestApi::getHealth() {
  if (!service_.healthy()) {
    return statusReply(503, "unavailable", std::string("storage backend ") +
                                               service_.backendName() + " unreachable");
  }
  Json::Value body(Json::objectValue);
  body["status"] = "ok";
  body["backend"] = service_.backendName();
  return jsonReply(200, model::toCompactString(body));
}

ServerReply IngestApi::getMetrics(const ServerRequest& req) {
  storage::QueryFilter filter{};
  std::string reason;
  if (!parseQueryFilter(req.head.query, filter, reason)) {
    return statusReply(400, "rejected", reason);
  }
  const storage::QueryResult R = service_.query(filter);
  if (!R.ok()) {
    return statusReply(503, "unavailable", R.reason);
  }
  Json::Value body(Json::arrayValue);
  for (const model::MetricSnapshot& s : R.records) {
    body.append(model::snapshotToJson(s));
  }
  return jsonReply(200, model::toCompactString(body));
}

ServerReply IngestApi::getSummary(const ServerRequest& req) {
  storage::QueryFilter filter{};
  std::string reason;
  if (!parseQueryFilter(req.head.query, filter, reason)) {
    return statusReply(400, "rejected", reason);
  }
  const SummaryResult R = service_.summary(filter);
  if (!R.ok()) {
    return statusReply(503, "unavailable", R.reason);
  }
  Json::Value body(Json::objectValue);
  body["samples"] = static_cast<Json::UInt64>(R.summary.samples);
  body["avg_cpu"] = R.summary.avgCpu;
  body["max_cpu"] = R.summary.maxCpu;
  body["avg_memory"] = R.summary.avgMemory;
  body["max_memory"] = R.summary.maxMemory;
  if (!filter.hostname.empty()) {
    body["host"] = filter.hostname;
  }
  return jsonReply(200, model::toCompactString(body));
}

} // namespace ingest

} // namespace vigil
