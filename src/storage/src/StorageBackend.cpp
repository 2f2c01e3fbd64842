/**
 * @file StorageBackend.cpp
 * @brief Status strings, filter matching and backend selection.
 */

#include "src/storage/inc/StorageBackend.hpp"
#include "src/helpers/inc/Clock.hpp"
#include "src/storage/inc/SqliteBackend.hpp"
#include "src/storage/inc/TimeSeriesBackend.hpp"

#include <fmt/core.h>

namespace vigil {

namespace storage {

/* ----------------------------- Status Helpers ----------------------------- */

const char* toString(StorageStatus status) noexcept {
  switch (status) {
  case StorageStatus::OK:
    return "OK";
  case StorageStatus::DUPLICATE:
    return "DUPLICATE";
  case StorageStatus::NOT_OPEN:
    return "NOT_OPEN";
  case StorageStatus::IO_ERROR:
    return "IO_ERROR";
  case StorageStatus::CORRUPT:
    return "CORRUPT";
  case StorageStatus::BAD_CONFIG:
    return "BAD_CONFIG";
  }
  return "UNKNOWN";
}

/* ----------------------------- Query ----------------------------- */

bool matches(const QueryFilter& filter, const std::string& hostname,
             std::int64_t tsMillis) noexcept {
  using vigil::helpers::clock::toUnixMillis;
  if (!filter.hostname.empty() && filter.hostname != hostname) {
    return false;
  }
  if (filter.since && tsMillis < toUnixMillis(*filter.since)) {
    return false;
  }
  if (filter.until && tsMillis > toUnixMillis(*filter.until)) {
    return false;
  }
  return true;
}

/* ----------------------------- Factory ----------------------------- */

std::unique_ptr<StorageBackend> makeBackend(const StorageConfig& config, std::string& reason) {
  if (config.backend == "sqlite") {
    if (config.sqlitePath.empty()) {
      reason = "storage.sqlite.path is required for the sqlite backend";
      return nullptr;
    }
    return std::make_unique<SqliteBackend>(config.sqlitePath);
  }
  if (config.backend == "tsdb") {
    if (config.tsdbPath.empty()) {
      reason = "storage.tsdb.path is required for the tsdb backend";
      return nullptr;
    }
    return std::make_unique<TimeSeriesBackend>(config.tsdbPath, config.tsdbBucket);
  }
  reason = fmt::format("unknown storage backend '{}' (expected sqlite or tsdb)", config.backend);
  return nullptr;
}

} // namespace storage

} // namespace vigil
