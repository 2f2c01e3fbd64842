#ifndef VIGIL_STORAGE_SQLITE_BACKEND_HPP
#define VIGIL_STORAGE_SQLITE_BACKEND_HPP
/**
 * @file SqliteBackend.hpp
 * @brief Relational store: one row per snapshot plus one table per metric group.
 *
 * Schema:
 *  - samples(id, hostname, ts_ms, UNIQUE(hostname, ts_ms))
 *  - cpu_usage, memory_usage, swap_usage, network_io: one row per sample
 *  - cpu_cores: one row per logical CPU
 *  - disk_usage: one row per filesystem, ordinal keeps collection order
 *
 * Each write is a single IMMEDIATE transaction, so readers see all groups
 * of a snapshot or none.
 */

#include "src/storage/inc/StorageBackend.hpp"

#include <spdlog/logger.h>

#include <memory>
#include <mutex>
#include <string>

struct sqlite3;

namespace vigil {

namespace storage {

/**
 * @brief SQLite implementation of StorageBackend.
 *
 * @note One connection guarded by a mutex; WAL journal, 5 s busy timeout.
 */
class SqliteBackend final : public StorageBackend {
public:
  /// @param path Database file, created when missing (":memory:" for tests).
  explicit SqliteBackend(std::string path);
  ~SqliteBackend() override;

  SqliteBackend(const SqliteBackend&) = delete;
  SqliteBackend& operator=(const SqliteBackend&) = delete;

  StorageResult open() override;
  StorageResult write(const model::MetricSnapshot& snapshot) override;
  [[nodiscard]] QueryResult query(const QueryFilter& filter) override;
  [[nodiscard]] StorageResult ping() override;
  void close() noexcept override;
  [[nodiscard]] const char* name() const noexcept override { return "sqlite"; }

  [[nodiscard]] const std::string& path() const noexcept { return path_; }

private:
  std::string path_;
  sqlite3* db_{nullptr};
  std::mutex mtx_;
  std::shared_ptr<spdlog::logger> log_;
};

} // namespace storage

} // namespace vigil

#endif // VIGIL_STORAGE_SQLITE_BACKEND_HPP
