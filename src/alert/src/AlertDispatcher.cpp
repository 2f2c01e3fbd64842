/**
 * @file AlertDispatcher.cpp
 * @brief Per-channel worker lanes with bounded retry.
 */

#include "src/alert/inc/AlertDispatcher.hpp"
#include "src/helpers/inc/Logging.hpp"

#include <algorithm>
#include <atomic>
#include <condition_variable>
#include <deque>
#include <exception>
#include <mutex>
#include <thread>
#include <utility>

namespace vigil {

namespace alert {

struct AlertDispatcher::Lane {
  std::unique_ptr<NotificationChannel> channel;
  std::mutex mtx;
  std::condition_variable cv;
  std::deque<model::AlertEvent> queue;
  bool stopping{false};
  bool busy{false};
  std::thread worker;

  std::atomic<std::uint64_t> sent{0};
  std::atomic<std::uint64_t> failed{0};
  std::atomic<std::uint64_t> retries{0};
  std::atomic<std::uint64_t> dropped{0};
};

AlertDispatcher::AlertDispatcher(std::vector<std::unique_ptr<NotificationChannel>> channels,
                                 DispatcherConfig config)
    : config_(config), log_(vigil::helpers::logging::get("channel")) {
  config_.queueDepth = std::max<std::size_t>(config_.queueDepth, 1);
  lanes_.reserve(channels.size());
  for (auto& ch : channels) {
    auto lane = std::make_unique<Lane>();
    lane->channel = std::move(ch);
    lanes_.push_back(std::move(lane));
  }
}

AlertDispatcher::~AlertDispatcher() { stop(); }

bool AlertDispatcher::start() {
  bool started = false;
  for (auto& lane : lanes_) {
    std::lock_guard<std::mutex> lock(lane->mtx);
    if (lane->worker.joinable()) {
      continue;
    }
    lane->stopping = false;
    Lane* raw = lane.get();
    lane->worker = std::thread([this, raw] { run(*raw); });
    started = true;
  }
  return started;
}

void AlertDispatcher::stop() {
  for (auto& lane : lanes_) {
    {
      std::lock_guard<std::mutex> lock(lane->mtx);
      lane->stopping = true;
      if (!lane->queue.empty()) {
        lane->dropped.fetch_add(lane->queue.size());
        log_->warn("event=channel_dropped channel={} count={} reason=shutdown",
                   lane->channel->name(), lane->queue.size());
        lane->queue.clear();
      }
    }
    lane->cv.notify_all();
  }
  for (auto& lane : lanes_) {
    if (lane->worker.joinable()) {
      lane->worker.join();
    }
  }
}

void AlertDispatcher::dispatch(const model::AlertEvent& event) {
  for (auto& lane : lanes_) {
    {
      std::lock_guard<std::mutex> lock(lane->mtx);
      if (lane->stopping) {
        continue;
      }
      if (lane->queue.size() >= config_.queueDepth) {
        lane->queue.pop_front();
        lane->dropped.fetch_add(1);
        log_->warn("event=channel_dropped channel={} count=1 reason=queue_full depth={}",
                   lane->channel->name(), config_.queueDepth);
      }
      lane->queue.push_back(event);
    }
    lane->cv.notify_all();
  }
}

bool AlertDispatcher::waitIdle(std::chrono::milliseconds timeout) {
  const auto DEADLINE = std::chrono::steady_clock::now() + timeout;
  for (auto& lane : lanes_) {
    std::unique_lock<std::mutex> lock(lane->mtx);
    if (!lane->cv.wait_until(lock, DEADLINE,
                             [&] { return lane->queue.empty() && !lane->busy; })) {
      return false;
    }
  }
  return true;
}

void AlertDispatcher::run(Lane& lane) {
  for (;;) {
    model::AlertEvent event;
    {
      std::unique_lock<std::mutex> lock(lane.mtx);
      lane.busy = false;
      lane.cv.notify_all();
      lane.cv.wait(lock, [&] { return lane.stopping || !lane.queue.empty(); });
      if (lane.stopping) {
        return;
      }
      event = std::move(lane.queue.front());
      lane.queue.pop_front();
      lane.busy = true;
    }
    deliver(lane, event);
  }
}

void AlertDispatcher::deliver(Lane& lane, const model::AlertEvent& event) {
  const std::uint32_t MAX_ATTEMPTS = config_.retries + 1;
  const std::string KEY = event.key.toString();
  for (std::uint32_t attempt = 1;; ++attempt) {
    ChannelResult r{};
    try {
      r = lane.channel->send(event);
    } catch (const std::exception& e) {
      r.status = ChannelStatus::TRANSPORT_ERROR;
      r.reason = e.what();
      r.retryable = true;
    }

    if (r.ok()) {
      lane.sent.fetch_add(1);
      log_->debug("event=channel_sent channel={} key={} attempts={}", lane.channel->name(), KEY,
                  attempt);
      return;
    }

    if (!r.retryable || attempt >= MAX_ATTEMPTS) {
      lane.failed.fetch_add(1);
      log_->error("event=channel_failed channel={} key={} attempts={} status={} reason=\"{}\"",
                  lane.channel->name(), KEY, attempt, toString(r.status), r.reason);
      return;
    }

    log_->warn("event=channel_retry channel={} key={} attempt={}/{} reason=\"{}\"",
               lane.channel->name(), KEY, attempt, MAX_ATTEMPTS, r.reason);
    std::unique_lock<std::mutex> lock(lane.mtx);
    if (lane.cv.wait_for(lock, config_.retryDelay, [&] { return lane.stopping; })) {
      lane.failed.fetch_add(1);
      log_->warn("event=channel_failed channel={} key={} attempts={} reason=shutdown",
                 lane.channel->name(), KEY, attempt);
      return;
    }
    lane.retries.fetch_add(1);
  }
}

std::vector<ChannelStats> AlertDispatcher::stats() const {
  std::vector<ChannelStats> out;
  out.reserve(lanes_.size());
  for (const auto& lane : lanes_) {
    ChannelStats s{};
    s.channel = lane->channel->name();
    s.sent = lane->sent.load();
    s.failed = lane->failed.load();
    s.retries = lane->retries.load();
    s.dropped = lane->dropped.load();
    out.push_back(std::move(s));
  }
  return out;
}

} // namespace alert

} // namespace vigil
