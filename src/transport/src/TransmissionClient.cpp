/**
 * @file TransmissionClient.cpp
 * @brief Retrying delivery worker.
 */

#include "src/transport/inc/TransmissionClient.hpp"
#include "src/helpers/inc/Format.hpp"
#include "src/helpers/inc/Logging.hpp"
#include "src/model/inc/SnapshotJson.hpp"
#include "src/model/inc/TimeFormat.hpp"

#include <fmt/core.h>

#include <algorithm>
#include <utility>

namespace vigil {

namespace transport {

namespace {

/// Transient per-snapshot delivery bookkeeping.
struct DeliveryAttempt {
  std::uint32_t attemptCount{0};
  std::chrono::milliseconds nextBackoff{0};
  std::string lastError{};
};

bool isClientError(const HttpResponse& resp) noexcept {
  return resp.status == TransportStatus::OK && resp.statusCode >= 400 && resp.statusCode < 500;
}

std::string describe(const HttpResponse& resp) {
  if (resp.status == TransportStatus::OK) {
    return fmt::format("HTTP {}", resp.statusCode);
  }
  return fmt::format("{}: {}", toString(resp.status), resp.error);
}

} // namespace

/* ----------------------------- Status Helpers ----------------------------- */

const char* toString(DeliveryStatus status) noexcept {
  switch (status) {
  case DeliveryStatus::DELIVERED:
    return "DELIVERED";
  case DeliveryStatus::REJECTED:
    return "REJECTED";
  case DeliveryStatus::EXHAUSTED:
    return "EXHAUSTED";
  case DeliveryStatus::CANCELLED:
    return "CANCELLED";
  }
  return "UNKNOWN";
}

const char* toString(DeliveryState state) noexcept {
  switch (state) {
  case DeliveryState::IDLE:
    return "IDLE";
  case DeliveryState::ATTEMPTING:
    return "ATTEMPTING";
  case DeliveryState::BACKOFF:
    return "BACKOFF";
  case DeliveryState::SUCCEEDED:
    return "SUCCEEDED";
  case DeliveryState::EXHAUSTED:
    return "EXHAUSTED";
  }
  return "UNKNOWN";
}

/* ----------------------------- HttpIngestTransport ----------------------------- */

HttpIngestTransport::HttpIngestTransport(std::string url, std::chrono::milliseconds timeout,
                                         bool verifyTls)
    : client_(verifyTls), url_(std::move(url)), timeout_(timeout) {}

HttpResponse HttpIngestTransport::post(const std::string& body) {
  return client_.postJson(url_, body, timeout_);
}

/* ----------------------------- TransmissionClient ----------------------------- */

TransmissionClient::TransmissionClient(IngestTransport& transport, TransmissionConfig config,
                                       std::uint64_t jitterSeed)
    : transport_(transport), config_(config),
      backoff_(config.backoffBase, config.backoffMax, config.jitter, jitterSeed),
      log_(vigil::helpers::logging::get("transport")) {
  config_.maxAttempts = std::max<std::uint32_t>(config_.maxAttempts, 1);
  config_.queueDepth = std::max<std::size_t>(config_.queueDepth, 1);
}

TransmissionClient::~TransmissionClient() { stop(); }

DeliveryResult TransmissionClient::deliver(const model::MetricSnapshot& snapshot) {
  const std::string BODY = model::toCompactString(model::ingestPayloadToJson(snapshot));
  const std::string TS = model::formatIso8601(snapshot.timestamp);

  DeliveryAttempt attempt{};
  DeliveryResult result{};

  for (;;) {
    {
      std::lock_guard<std::mutex> lock(mtx_);
      if (cancel_) {
        cancelled_.fetch_add(1);
        state_.store(DeliveryState::IDLE);
        result.status = DeliveryStatus::CANCELLED;
        return result;
      }
    }

    state_.store(DeliveryState::ATTEMPTING);
    ++attempt.attemptCount;
    attempts_.fetch_add(1);
    const HttpResponse RESP = transport_.post(BODY);
    result.attempts = attempt.attemptCount;
    result.httpStatus = RESP.statusCode;

    if (RESP.success()) {
      delivered_.fetch_add(1);
      state_.store(DeliveryState::SUCCEEDED);
      log_->debug("event=delivered host={} ts={} attempts={} status={}", snapshot.hostname, TS,
                  attempt.attemptCount, RESP.statusCode);
      result.status = DeliveryStatus::DELIVERED;
      return result;
    }

    attempt.lastError = describe(RESP);
    result.lastError = attempt.lastError;

    if (isClientError(RESP)) {
      rejected_.fetch_add(1);
      state_.store(DeliveryState::IDLE);
      log_->warn("event=delivery_rejected host={} ts={} status={} body={}", snapshot.hostname, TS,
                 RESP.statusCode, RESP.body);
      result.status = DeliveryStatus::REJECTED;
      return result;
    }

    if (attempt.attemptCount >= config_.maxAttempts) {
      exhausted_.fetch_add(1);
      state_.store(DeliveryState::EXHAUSTED);
      log_->error("event=delivery_exhausted host={} ts={} attempts={} last_error=\"{}\"",
                  snapshot.hostname, TS, attempt.attemptCount, attempt.lastError);
      result.status = DeliveryStatus::EXHAUSTED;
      return result;
    }

    attempt.nextBackoff = backoff_.delayFor(attempt.attemptCount);
    log_->warn("event=delivery_retry host={} ts={} attempt={}/{} error=\"{}\" backoff={}",
               snapshot.hostname, TS, attempt.attemptCount, config_.maxAttempts,
               attempt.lastError, vigil::helpers::format::duration(attempt.nextBackoff));

    state_.store(DeliveryState::BACKOFF);
    cv_.notify_all();
    if (!waitBackoff(attempt.nextBackoff)) {
      cancelled_.fetch_add(1);
      state_.store(DeliveryState::IDLE);
      log_->info("event=delivery_cancelled host={} ts={} attempts={}", snapshot.hostname, TS,
                 attempt.attemptCount);
      result.status = DeliveryStatus::CANCELLED;
      return result;
    }
  }
}

bool TransmissionClient::waitBackoff(std::chrono::milliseconds delay) {
  std::unique_lock<std::mutex> lock(mtx_);
  return !cv_.wait_for(lock, delay, [this] { return cancel_; });
}

void TransmissionClient::submit(model::SnapshotPtr snapshot) {
  if (!snapshot) {
    return;
  }
  {
    std::lock_guard<std::mutex> lock(mtx_);
    if (!accepting_) {
      log_->debug("event=submit_after_stop host={}", snapshot->hostname);
      return;
    }
    if (queue_.size() >= config_.queueDepth) {
      const model::SnapshotPtr OLDEST = queue_.front();
      queue_.pop_front();
      overflowDropped_.fetch_add(1);
      log_->warn("event=queue_overflow dropped_ts={} depth={}",
                 model::formatIso8601(OLDEST->timestamp), config_.queueDepth);
    }
    queue_.push_back(std::move(snapshot));
    submitted_.fetch_add(1);
  }
  cv_.notify_all();
}

bool TransmissionClient::start() {
  std::lock_guard<std::mutex> lock(mtx_);
  if (worker_.joinable()) {
    return false;
  }
  accepting_ = true;
  cancel_ = false;
  worker_ = std::thread([this] { run(); });
  return true;
}

void TransmissionClient::stop() {
  std::unique_lock<std::mutex> lock(mtx_);
  accepting_ = false;
  if (!queue_.empty()) {
    log_->info("event=queue_discarded count={}", queue_.size());
    queue_.clear();
  }
  if (!worker_.joinable()) {
    return;
  }
  cv_.notify_all();

  // Only a request on the wire gets the grace period; a backoff is cancelled at once.
  if (!cv_.wait_for(lock, config_.shutdownGrace, [this] {
        return !busy_ || state_.load() == DeliveryState::BACKOFF;
      })) {
    log_->warn("event=delivery_abandoned grace={}",
               vigil::helpers::format::duration(config_.shutdownGrace));
  }
  cancel_ = true;
  lock.unlock();
  cv_.notify_all();
  worker_.join();
}

void TransmissionClient::run() {
  for (;;) {
    model::SnapshotPtr next;
    {
      std::unique_lock<std::mutex> lock(mtx_);
      busy_ = false;
      cv_.notify_all();
      cv_.wait(lock, [this] { return cancel_ || !accepting_ || !queue_.empty(); });
      if (cancel_ || queue_.empty()) {
        return;
      }
      next = queue_.front();
      queue_.pop_front();
      busy_ = true;
    }
    (void)deliver(*next);
  }
}

TransmissionStats TransmissionClient::stats() const noexcept {
  TransmissionStats s{};
  s.submitted = submitted_.load();
  s.attempts = attempts_.load();
  s.delivered = delivered_.load();
  s.rejected = rejected_.load();
  s.exhausted = exhausted_.load();
  s.cancelled = cancelled_.load();
  s.overflowDropped = overflowDropped_.load();
  return s;
}

std::size_t TransmissionClient::queued() const {
  std::lock_guard<std::mutex> lock(mtx_);
  return queue_.size();
}

} // namespace transport

} // namespace vigil
