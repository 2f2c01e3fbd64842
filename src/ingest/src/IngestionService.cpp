/**
 * @file IngestionService.cpp
 * @brief Validation, storage write and asynchronous alert hand-off.
 */

#include "src/ingest/inc/IngestionService.hpp"
#include "src/helpers/inc/Logging.hpp"
#include "src/model/inc/TimeFormat.hpp"
#include "src/model/inc/Validation.hpp"

#include <boost/asio/post.hpp>

#include <algorithm>
#include <exception>
#include <utility>

namespace vigil {

namespace ingest {

/* ----------------------------- Status Helpers ----------------------------- */

const char* toString(IngestStatus status) noexcept {
  switch (status) {
  case IngestStatus::ACCEPTED:
    return "ACCEPTED";
  case IngestStatus::REJECTED:
    return "REJECTED";
  case IngestStatus::STORAGE_FAILED:
    return "STORAGE_FAILED";
  case IngestStatus::SHUTTING_DOWN:
    return "SHUTTING_DOWN";
  }
  return "UNKNOWN";
}

Summary summarize(const std::vector<model::MetricSnapshot>& records) noexcept {
  Summary s{};
  if (records.empty()) {
    return s;
  }
  double cpuSum = 0.0;
  double memSum = 0.0;
  for (const model::MetricSnapshot& r : records) {
    cpuSum += r.cpu.overallPercent;
    memSum += r.memory.percentUsed;
    s.maxCpu = std::max(s.maxCpu, r.cpu.overallPercent);
    s.maxMemory = std::max(s.maxMemory, r.memory.percentUsed);
  }
  s.samples = records.size();
  s.avgCpu = cpuSum / static_cast<double>(records.size());
  s.avgMemory = memSum / static_cast<double>(records.size());
  return s;
}

/* ----------------------------- IngestionService ----------------------------- */

IngestionService::IngestionService(storage::StorageBackend& storage, alert::AlertEngine* engine,
                                   alert::AlertDispatcher* dispatcher, IngestConfig config)
    : storage_(storage), engine_(engine), dispatcher_(dispatcher), config_(config),
      alertPool_(std::max<std::size_t>(config.alertThreads, 1)),
      log_(vigil::helpers::logging::get("ingest")) {}

IngestionService::~IngestionService() { shutdown(); }

IngestResult IngestionService::ingest(const std::string& hostname,
                                      const model::MetricSnapshot& snapshot) {
  IngestResult result{};

  auto snap = std::make_shared<model::MetricSnapshot>(snapshot);
  if (!hostname.empty()) {
    snap->hostname = hostname;
  }
  const model::ValidationResult V = model::validateSnapshot(*snap);
  if (!V.ok()) {
    rejected_.fetch_add(1);
    log_->warn("event=snapshot_rejected host={} status={} reason=\"{}\"", snap->hostname,
               model::toString(V.status), V.reason);
    result.status = IngestStatus::REJECTED;
    result.reason = V.reason;
    return result;
  }

  {
    std::lock_guard<std::mutex> lock(mtx_);
    if (!accepting_) {
      refused_.fetch_add(1);
      result.status = IngestStatus::SHUTTING_DOWN;
      result.reason = "service is shutting down";
      return result;
    }
    ++inFlight_;
  }

  if (engine_ != nullptr) {
    bool queued = false;
    {
      std::lock_guard<std::mutex> lock(mtx_);
      if (alertPending_ < config_.alertBacklog) {
        ++alertPending_;
        queued = true;
      }
    }
    if (queued) {
      model::SnapshotPtr shared = snap;
      boost::asio::post(alertPool_, [this, shared] { evaluate(shared); });
    } else {
      alertDropped_.fetch_add(1);
      log_->warn("event=alert_backlog_full host={} backlog={}", snap->hostname,
                 config_.alertBacklog);
    }
  }

  const storage::StorageResult W = storage_.write(*snap);
  if (W.ok()) {
    accepted_.fetch_add(1);
    if (W.status == storage::StorageStatus::DUPLICATE) {
      duplicates_.fetch_add(1);
      result.duplicate = true;
    }
    log_->debug("event=snapshot_accepted host={} ts={} duplicate={}", snap->hostname,
                model::formatIso8601(snap->timestamp), result.duplicate);
  } else {
    storageFailures_.fetch_add(1);
    log_->error("event=storage_write_failed host={} ts={} backend={} status={} reason=\"{}\"",
                snap->hostname, model::formatIso8601(snap->timestamp), storage_.name(),
                storage::toString(W.status), W.reason);
    result.status = IngestStatus::STORAGE_FAILED;
    result.reason = W.reason.empty() ? storage::toString(W.status) : W.reason;
  }

  {
    std::lock_guard<std::mutex> lock(mtx_);
    --inFlight_;
  }
  cv_.notify_all();
  return result;
}

void IngestionService::evaluate(const model::SnapshotPtr& snapshot) {
  try {
    const std::vector<model::AlertEvent> EVENTS = engine_->evaluate(*snapshot);
    for (const model::AlertEvent& ev : EVENTS) {
      alertEvents_.fetch_add(1);
      if (dispatcher_ != nullptr) {
        dispatcher_->dispatch(ev);
      } else {
        log_->warn("event=alert_undispatched key={} msg=\"{}\"", ev.key.toString(), ev.message);
      }
    }
  } catch (const std::exception& e) {
    log_->error("event=alert_evaluation_failed host={} error=\"{}\"", snapshot->hostname,
                e.what());
  }
  {
    std::lock_guard<std::mutex> lock(mtx_);
    --alertPending_;
  }
  cv_.notify_all();
}

storage::QueryResult IngestionService::query(const storage::QueryFilter& filter) {
  storage::QueryResult r = storage_.query(filter);
  if (!r.ok()) {
    log_->error("event=storage_query_failed backend={} status={} reason=\"{}\"", storage_.name(),
                storage::toString(r.status), r.reason);
  }
  return r;
}

SummaryResult IngestionService::summary(const storage::QueryFilter& filter) {
  SummaryResult out{};
  storage::QueryResult r = query(filter);
  out.status = r.status;
  out.reason = std::move(r.reason);
  if (r.ok()) {
    out.summary = summarize(r.records);
  }
  return out;
}

bool IngestionService::healthy() {
  {
    std::lock_guard<std::mutex> lock(mtx_);
    if (!accepting_) {
      return false;
    }
  }
  const storage::StorageResult P = storage_.ping();
  if (!P.ok()) {
    log_->warn("event=health_degraded backend={} status={} reason=\"{}\"", storage_.name(),
               storage::toString(P.status), P.reason);
  }
  return P.ok();
}

bool IngestionService::waitAlertsIdle(std::chrono::milliseconds timeout) {
  std::unique_lock<std::mutex> lock(mtx_);
  return cv_.wait_for(lock, timeout, [this] { return alertPending_ == 0; });
}

void IngestionService::shutdown() {
  {
    std::unique_lock<std::mutex> lock(mtx_);
    if (closed_) {
      return;
    }
    accepting_ = false;
    if (inFlight_ > 0) {
      log_->info("event=shutdown_waiting in_flight={}", inFlight_);
    }
    cv_.wait(lock, [this] { return inFlight_ == 0; });
    closed_ = true;
  }
  alertPool_.join();
  storage_.close();
  log_->info("event=ingest_stopped accepted={} rejected={} storage_failures={}", accepted_.load(),
             rejected_.load(), storageFailures_.load());
}

IngestStats IngestionService::stats() const noexcept {
  IngestStats s{};
  s.accepted = accepted_.load();
  s.duplicates = duplicates_.load();
  s.rejected = rejected_.load();
  s.storageFailures = storageFailures_.load();
  s.refused = refused_.load();
  s.alertEvents = alertEvents_.load();
  s.alertDropped = alertDropped_.load();
  return s;
}

} // namespace ingest

} // namespace vigil
