/**
 * @file Sampler.cpp
 * @brief Fixed-rate sampling loop.
 */

#include "src/collect/inc/Sampler.hpp"
#include "src/helpers/inc/Logging.hpp"

#include <utility>

namespace vigil {

namespace collect {

using Clock = std::chrono::steady_clock;

Sampler::Sampler(ISnapshotSource& source, SnapshotSink& sink, std::chrono::milliseconds interval)
    : source_(source), sink_(sink), interval_(interval),
      log_(vigil::helpers::logging::get("sampler")) {}

Sampler::~Sampler() { stop(); }

bool Sampler::start() {
  if (interval_.count() <= 0) {
    return false;
  }
  std::lock_guard<std::mutex> lock(mtx_);
  if (thread_.joinable()) {
    return false;
  }
  stopRequested_ = false;
  running_.store(true);
  thread_ = std::thread([this] { run(); });
  log_->info("event=sampler_started interval_ms={}", interval_.count());
  return true;
}

void Sampler::stop() {
  {
    std::lock_guard<std::mutex> lock(mtx_);
    if (!thread_.joinable()) {
      return;
    }
    stopRequested_ = true;
  }
  cv_.notify_all();
  thread_.join();
  running_.store(false);
  log_->info("event=sampler_stopped ticks={} missed={}", ticks_.load(), missed_.load());
}

void Sampler::run() {
  Clock::time_point next = Clock::now();

  for (;;) {
    CollectionResult result = source_.collect();
    ticks_.fetch_add(1);
    if (result.status != CollectionStatus::OK) {
      log_->info("event=snapshot_partial omitted={}", result.omitted.size());
    }
    if (result.snapshot) {
      sink_.submit(std::move(result.snapshot));
    }

    next += interval_;
    const Clock::time_point NOW = Clock::now();
    if (NOW >= next) {
      const auto BEHIND = NOW - next;
      const std::uint64_t SKIPPED = static_cast<std::uint64_t>(BEHIND / interval_) + 1;
      missed_.fetch_add(SKIPPED);
      next += interval_ * static_cast<long>(SKIPPED);
      log_->warn("event=tick_overrun skipped={}", SKIPPED);
    }

    std::unique_lock<std::mutex> lock(mtx_);
    if (cv_.wait_until(lock, next, [this] { return stopRequested_; })) {
      return;
    }
  }
}

} // namespace collect

} // namespace vigil
