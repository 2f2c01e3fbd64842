#ifndef VIGIL_INGEST_TEST_SUPPORT_HPP
#define VIGIL_INGEST_TEST_SUPPORT_HPP
/**
 * @file IngestTestSupport.hpp
 * @brief In-memory storage backend and recording channel for ingest tests.
 */

#include "src/alert/inc/Channels.hpp"
#include "src/helpers/inc/Clock.hpp"
#include "src/storage/inc/StorageBackend.hpp"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <mutex>
#include <string>
#include <thread>
#include <tuple>
#include <vector>

namespace vigil {

namespace ingest {

namespace test {

/// StorageBackend over a vector with injectable failures and latency.
class MemoryBackend final : public storage::StorageBackend {
public:
  storage::StorageResult open() override {
    std::lock_guard<std::mutex> lock(mtx_);
    open_ = true;
    return {};
  }

  storage::StorageResult write(const model::MetricSnapshot& snapshot) override {
    if (writeDelay.count() > 0) {
      std::this_thread::sleep_for(writeDelay);
    }
    std::lock_guard<std::mutex> lock(mtx_);
    if (!open_) {
      return {storage::StorageStatus::NOT_OPEN, "closed"};
    }
    if (failWrites.load()) {
      return {storage::StorageStatus::IO_ERROR, "disk on fire"};
    }
    for (const auto& r : rows_) {
      if (r.hostname == snapshot.hostname && r.timestamp == snapshot.timestamp) {
        return {storage::StorageStatus::DUPLICATE, {}};
      }
    }
    rows_.push_back(snapshot);
    return {};
  }

  storage::QueryResult query(const storage::QueryFilter& filter) override {
    std::lock_guard<std::mutex> lock(mtx_);
    storage::QueryResult out{};
    if (!open_) {
      out.status = storage::StorageStatus::NOT_OPEN;
      return out;
    }
    for (const auto& r : rows_) {
      if (storage::matches(filter, r.hostname,
                           vigil::helpers::clock::toUnixMillis(r.timestamp))) {
        out.records.push_back(r);
      }
    }
    std::sort(out.records.begin(), out.records.end(), [](const auto& a, const auto& b) {
      return std::tie(a.timestamp, a.hostname) < std::tie(b.timestamp, b.hostname);
    });
    if (filter.limit != 0 && out.records.size() > filter.limit) {
      out.records.resize(filter.limit);
    }
    return out;
  }

  storage::StorageResult ping() override {
    std::lock_guard<std::mutex> lock(mtx_);
    if (!open_ || failPing.load()) {
      return {storage::StorageStatus::IO_ERROR, "unreachable"};
    }
    return {};
  }

  void close() noexcept override {
    std::lock_guard<std::mutex> lock(mtx_);
    open_ = false;
  }

  [[nodiscard]] const char* name() const noexcept override { return "memory"; }

  [[nodiscard]] std::size_t size() {
    std::lock_guard<std::mutex> lock(mtx_);
    return rows_.size();
  }

  [[nodiscard]] bool isOpen() {
    std::lock_guard<std::mutex> lock(mtx_);
    return open_;
  }

  std::atomic<bool> failWrites{false};
  std::atomic<bool> failPing{false};
  std::chrono::milliseconds writeDelay{0};

private:
  std::mutex mtx_;
  bool open_{false};
  std::vector<model::MetricSnapshot> rows_;
};

/// Channel that records every event it is given.
class RecordingChannel final : public alert::NotificationChannel {
public:
  [[nodiscard]] const std::string& name() const noexcept override { return name_; }

  alert::ChannelResult send(const model::AlertEvent& event) override {
    std::lock_guard<std::mutex> lock(mtx_);
    events_.push_back(event);
    return {};
  }

  [[nodiscard]] std::vector<model::AlertEvent> events() {
    std::lock_guard<std::mutex> lock(mtx_);
    return events_;
  }

private:
  std::string name_{"recording"};
  std::mutex mtx_;
  std::vector<model::AlertEvent> events_;
};

} // namespace test

} // namespace ingest

} // namespace vigil

#endif // VIGIL_INGEST_TEST_SUPPORT_HPP
