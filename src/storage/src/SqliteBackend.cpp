/**
 * @file SqliteBackend.cpp
 * @brief SQLite schema, transactional writes and ordered reads.
 */

#include "src/storage/inc/SqliteBackend.hpp"
#include "src/helpers/inc/Clock.hpp"
#include "src/helpers/inc/Logging.hpp"

#include <sqlite3.h>

#include <fmt/core.h>

#include <cstdint>
#include <initializer_list>
#include <limits>
#include <utility>

namespace vigil {

namespace storage {

using vigil::helpers::clock::fromUnixMillis;
using vigil::helpers::clock::toUnixMillis;

namespace {

/* ----------------------------- Schema ----------------------------- */

constexpr const char* SCHEMA = R"sql(
CREATE TABLE IF NOT EXISTS samples (
  id       INTEGER PRIMARY KEY AUTOINCREMENT,
  hostname TEXT    NOT NULL,
  ts_ms    INTEGER NOT NULL,
  UNIQUE (hostname, ts_ms)
);
CREATE INDEX IF NOT EXISTS samples_by_time ON samples (ts_ms, hostname);
CREATE TABLE IF NOT EXISTS cpu_usage (
  sample_id          INTEGER PRIMARY KEY REFERENCES samples (id),
  overall_percent    REAL    NOT NULL,
  core_count_logical INTEGER NOT NULL,
  load_1m            REAL    NOT NULL,
  load_5m            REAL    NOT NULL,
  load_15m           REAL    NOT NULL
);
CREATE TABLE IF NOT EXISTS cpu_cores (
  sample_id INTEGER NOT NULL REFERENCES samples (id),
  core      INTEGER NOT NULL,
  percent   REAL    NOT NULL,
  PRIMARY KEY (sample_id, core)
);
CREATE TABLE IF NOT EXISTS memory_usage (
  sample_id       INTEGER PRIMARY KEY REFERENCES samples (id),
  total_bytes     INTEGER NOT NULL,
  used_bytes      INTEGER NOT NULL,
  free_bytes      INTEGER NOT NULL,
  available_bytes INTEGER NOT NULL,
  buffers_bytes   INTEGER NOT NULL,
  cached_bytes    INTEGER NOT NULL,
  percent_used    REAL    NOT NULL
);
CREATE TABLE IF NOT EXISTS swap_usage (
  sample_id    INTEGER PRIMARY KEY REFERENCES samples (id),
  total_bytes  INTEGER NOT NULL,
  used_bytes   INTEGER NOT NULL,
  free_bytes   INTEGER NOT NULL,
  percent_used REAL    NOT NULL
);
CREATE TABLE IF NOT EXISTS disk_usage (
  sample_id       INTEGER NOT NULL REFERENCES samples (id),
  ordinal         INTEGER NOT NULL,
  mount_point     TEXT    NOT NULL,
  device          TEXT    NOT NULL,
  filesystem_type TEXT    NOT NULL,
  total_bytes     INTEGER NOT NULL,
  used_bytes      INTEGER NOT NULL,
  free_bytes      INTEGER NOT NULL,
  percent_used    REAL    NOT NULL,
  PRIMARY KEY (sample_id, ordinal)
);
CREATE TABLE IF NOT EXISTS network_io (
  sample_id    INTEGER PRIMARY KEY REFERENCES samples (id),
  bytes_sent   INTEGER NOT NULL,
  bytes_recv   INTEGER NOT NULL,
  packets_sent INTEGER NOT NULL,
  packets_recv INTEGER NOT NULL,
  errors_in    INTEGER NOT NULL,
  errors_out   INTEGER NOT NULL,
  drops_in     INTEGER NOT NULL,
  drops_out    INTEGER NOT NULL
);
)sql";

/* ----------------------------- Statement ----------------------------- */

/// Prepared statement with sticky error state. Counters are stored as the
/// two's-complement int64 image of the uint64 value.
class Statement {
public:
  Statement(sqlite3* db, const char* sql) noexcept {
    rc_ = sqlite3_prepare_v2(db, sql, -1, &stmt_, nullptr);
  }
  ~Statement() { sqlite3_finalize(stmt_); }

  Statement(const Statement&) = delete;
  Statement& operator=(const Statement&) = delete;

  [[nodiscard]] bool ok() const noexcept { return rc_ == SQLITE_OK; }
  [[nodiscard]] int rc() const noexcept { return rc_; }

  Statement& bindInt(int idx, std::int64_t v) noexcept {
    if (rc_ == SQLITE_OK) {
      rc_ = sqlite3_bind_int64(stmt_, idx, v);
    }
    return *this;
  }
  Statement& bindU64(int idx, std::uint64_t v) noexcept {
    return bindInt(idx, static_cast<std::int64_t>(v));
  }
  Statement& bindReal(int idx, double v) noexcept {
    if (rc_ == SQLITE_OK) {
      rc_ = sqlite3_bind_double(stmt_, idx, v);
    }
    return *this;
  }
  Statement& bindText(int idx, const std::string& v) noexcept {
    if (rc_ == SQLITE_OK) {
      rc_ = sqlite3_bind_text(stmt_, idx, v.data(), static_cast<int>(v.size()), SQLITE_TRANSIENT);
    }
    return *this;
  }

  /// Run an INSERT to completion; false leaves the error in rc().
  bool run() noexcept {
    if (rc_ != SQLITE_OK) {
      return false;
    }
    const int STEP = sqlite3_step(stmt_);
    if (STEP != SQLITE_DONE) {
      rc_ = STEP;
      return false;
    }
    sqlite3_reset(stmt_);
    sqlite3_clear_bindings(stmt_);
    return true;
  }

  /// Advance a SELECT; true while a row is available.
  bool next() noexcept {
    if (rc_ != SQLITE_OK) {
      return false;
    }
    const int STEP = sqlite3_step(stmt_);
    if (STEP == SQLITE_ROW) {
      return true;
    }
    if (STEP != SQLITE_DONE) {
      rc_ = STEP;
    }
    return false;
  }

  void reset() noexcept {
    sqlite3_reset(stmt_);
    sqlite3_clear_bindings(stmt_);
  }

  [[nodiscard]] std::int64_t columnInt(int col) const noexcept {
    return sqlite3_column_int64(stmt_, col);
  }
  [[nodiscard]] std::uint64_t columnU64(int col) const noexcept {
    return static_cast<std::uint64_t>(sqlite3_column_int64(stmt_, col));
  }
  [[nodiscard]] double columnReal(int col) const noexcept {
    return sqlite3_column_double(stmt_, col);
  }
  [[nodiscard]] std::string columnText(int col) const {
    const auto* text = sqlite3_column_text(stmt_, col);
    if (text == nullptr) {
      return {};
    }
    return std::string(reinterpret_cast<const char*>(text),
                       static_cast<std::size_t>(sqlite3_column_bytes(stmt_, col)));
  }

private:
  sqlite3_stmt* stmt_{nullptr};
  int rc_{SQLITE_OK};
};

/* ----------------------------- Helpers ----------------------------- */

StorageStatus statusFor(int rc) noexcept {
  const int PRIMARY = rc & 0xff;
  if (PRIMARY == SQLITE_CORRUPT || PRIMARY == SQLITE_NOTADB) {
    return StorageStatus::CORRUPT;
  }
  return StorageStatus::IO_ERROR;
}

StorageResult failure(sqlite3* db, int rc, const char* what) {
  return {statusFor(rc), fmt::format("{}: {} ({})", what, sqlite3_errmsg(db), sqlite3_errstr(rc))};
}

int exec(sqlite3* db, const char* sql, std::string& error) {
  char* msg = nullptr;
  const int RC = sqlite3_exec(db, sql, nullptr, nullptr, &msg);
  if (RC != SQLITE_OK) {
    error = (msg != nullptr) ? msg : sqlite3_errstr(RC);
  }
  sqlite3_free(msg);
  return RC;
}

/// Insert every group of one snapshot. Caller owns the transaction.
StorageResult insertSnapshot(sqlite3* db, const model::MetricSnapshot& s) {
  Statement sample(db, "INSERT OR IGNORE INTO samples (hostname, ts_ms) VALUES (?1, ?2)");
  if (!sample.bindText(1, s.hostname).bindInt(2, toUnixMillis(s.timestamp)).run()) {
    return failure(db, sample.rc(), "insert samples");
  }
  if (sqlite3_changes(db) == 0) {
    return {StorageStatus::DUPLICATE, "sample already stored"};
  }
  const std::int64_t ID = sqlite3_last_insert_rowid(db);

  Statement cpu(db, "INSERT INTO cpu_usage VALUES (?1, ?2, ?3, ?4, ?5, ?6)");
  cpu.bindInt(1, ID)
      .bindReal(2, s.cpu.overallPercent)
      .bindInt(3, s.cpu.coreCountLogical)
      .bindReal(4, s.cpu.loadAvg.one)
      .bindReal(5, s.cpu.loadAvg.five)
      .bindReal(6, s.cpu.loadAvg.fifteen);
  if (!cpu.run()) {
    return failure(db, cpu.rc(), "insert cpu_usage");
  }

  Statement core(db, "INSERT INTO cpu_cores VALUES (?1, ?2, ?3)");
  for (std::size_t i = 0; i < s.cpu.perCorePercent.size(); ++i) {
    core.bindInt(1, ID).bindInt(2, static_cast<std::int64_t>(i)).bindReal(3, s.cpu.perCorePercent[i]);
    if (!core.run()) {
      return failure(db, core.rc(), "insert cpu_cores");
    }
  }

  Statement mem(db, "INSERT INTO memory_usage VALUES (?1, ?2, ?3, ?4, ?5, ?6, ?7, ?8)");
  mem.bindInt(1, ID)
      .bindU64(2, s.memory.totalBytes)
      .bindU64(3, s.memory.usedBytes)
      .bindU64(4, s.memory.freeBytes)
      .bindU64(5, s.memory.availableBytes)
      .bindU64(6, s.memory.buffersBytes)
      .bindU64(7, s.memory.cachedBytes)
      .bindReal(8, s.memory.percentUsed);
  if (!mem.run()) {
    return failure(db, mem.rc(), "insert memory_usage");
  }

  Statement swap(db, "INSERT INTO swap_usage VALUES (?1, ?2, ?3, ?4, ?5)");
  swap.bindInt(1, ID)
      .bindU64(2, s.swap.totalBytes)
      .bindU64(3, s.swap.usedBytes)
      .bindU64(4, s.swap.freeBytes)
      .bindReal(5, s.swap.percentUsed);
  if (!swap.run()) {
    return failure(db, swap.rc(), "insert swap_usage");
  }

  Statement disk(db, "INSERT INTO disk_usage VALUES (?1, ?2, ?3, ?4, ?5, ?6, ?7, ?8, ?9)");
  for (std::size_t i = 0; i < s.disk.filesystems.size(); ++i) {
    const model::FilesystemMetrics& fs = s.disk.filesystems[i];
    disk.bindInt(1, ID)
        .bindInt(2, static_cast<std::int64_t>(i))
        .bindText(3, fs.mountPoint)
        .bindText(4, fs.device)
        .bindText(5, fs.filesystemType)
        .bindU64(6, fs.totalBytes)
        .bindU64(7, fs.usedBytes)
        .bindU64(8, fs.freeBytes)
        .bindReal(9, fs.percentUsed);
    if (!disk.run()) {
      return failure(db, disk.rc(), "insert disk_usage");
    }
  }

  Statement net(db, "INSERT INTO network_io VALUES (?1, ?2, ?3, ?4, ?5, ?6, ?7, ?8, ?9)");
  net.bindInt(1, ID)
      .bindU64(2, s.network.bytesSent)
      .bindU64(3, s.network.bytesRecv)
      .bindU64(4, s.network.packetsSent)
      .bindU64(5, s.network.packetsRecv)
      .bindU64(6, s.network.errorsIn)
      .bindU64(7, s.network.errorsOut)
      .bindU64(8, s.network.dropsIn)
      .bindU64(9, s.network.dropsOut);
  if (!net.run()) {
    return failure(db, net.rc(), "insert network_io");
  }
  return {};
}

/// Per-group readers prepared once per query.
struct GroupReaders {
  explicit GroupReaders(sqlite3* db)
      : cpu(db, "SELECT overall_percent, core_count_logical, load_1m, load_5m, load_15m "
                "FROM cpu_usage WHERE sample_id = ?1"),
        cores(db, "SELECT core, percent FROM cpu_cores WHERE sample_id = ?1 ORDER BY core"),
        mem(db, "SELECT total_bytes, used_bytes, free_bytes, available_bytes, buffers_bytes, "
                "cached_bytes, percent_used FROM memory_usage WHERE sample_id = ?1"),
        swap(db, "SELECT total_bytes, used_bytes, free_bytes, percent_used "
                 "FROM swap_usage WHERE sample_id = ?1"),
        disk(db, "SELECT mount_point, device, filesystem_type, total_bytes, used_bytes, "
                 "free_bytes, percent_used FROM disk_usage WHERE sample_id = ?1 ORDER BY ordinal"),
        net(db, "SELECT bytes_sent, bytes_recv, packets_sent, packets_recv, errors_in, "
                "errors_out, drops_in, drops_out FROM network_io WHERE sample_id = ?1") {}

  Statement cpu;
  Statement cores;
  Statement mem;
  Statement swap;
  Statement disk;
  Statement net;
};

/// Step a single-row group reader; a missing row means a torn sample.
StorageResult requireRow(sqlite3* db, Statement& st, std::int64_t id, const char* table) {
  if (st.next()) {
    return {};
  }
  if (!st.ok()) {
    return failure(db, st.rc(), table);
  }
  return {StorageStatus::CORRUPT, fmt::format("sample {} has no {} row", id, table)};
}

StorageResult loadGroups(sqlite3* db, GroupReaders& r, std::int64_t id, model::MetricSnapshot& s) {
  for (Statement* st : {&r.cpu, &r.cores, &r.mem, &r.swap, &r.disk, &r.net}) {
    st->reset();
    st->bindInt(1, id);
  }

  if (StorageResult row = requireRow(db, r.cpu, id, "cpu_usage"); !row.ok()) {
    return row;
  }
  s.cpu.overallPercent = r.cpu.columnReal(0);
  s.cpu.coreCountLogical = static_cast<std::uint32_t>(r.cpu.columnInt(1));
  s.cpu.loadAvg = {r.cpu.columnReal(2), r.cpu.columnReal(3), r.cpu.columnReal(4)};

  while (r.cores.next()) {
    const auto CORE = static_cast<std::size_t>(r.cores.columnInt(0));
    if (CORE != s.cpu.perCorePercent.size()) {
      return {StorageStatus::CORRUPT, fmt::format("sample {} has a gap in cpu_cores", id)};
    }
    s.cpu.perCorePercent.push_back(r.cores.columnReal(1));
  }
  if (!r.cores.ok()) {
    return failure(db, r.cores.rc(), "read cpu_cores");
  }

  if (StorageResult row = requireRow(db, r.mem, id, "memory_usage"); !row.ok()) {
    return row;
  }
  s.memory = {r.mem.columnU64(0), r.mem.columnU64(1), r.mem.columnU64(2), r.mem.columnU64(3),
              r.mem.columnU64(4), r.mem.columnU64(5), r.mem.columnReal(6)};

  if (StorageResult row = requireRow(db, r.swap, id, "swap_usage"); !row.ok()) {
    return row;
  }
  s.swap = {r.swap.columnU64(0), r.swap.columnU64(1), r.swap.columnU64(2), r.swap.columnReal(3)};

  while (r.disk.next()) {
    model::FilesystemMetrics fs{};
    fs.mountPoint = r.disk.columnText(0);
    fs.device = r.disk.columnText(1);
    fs.filesystemType = r.disk.columnText(2);
    fs.totalBytes = r.disk.columnU64(3);
    fs.usedBytes = r.disk.columnU64(4);
    fs.freeBytes = r.disk.columnU64(5);
    fs.percentUsed = r.disk.columnReal(6);
    s.disk.filesystems.push_back(std::move(fs));
  }
  if (!r.disk.ok()) {
    return failure(db, r.disk.rc(), "read disk_usage");
  }

  if (StorageResult row = requireRow(db, r.net, id, "network_io"); !row.ok()) {
    return row;
  }
  s.network = {r.net.columnU64(0), r.net.columnU64(1), r.net.columnU64(2), r.net.columnU64(3),
               r.net.columnU64(4), r.net.columnU64(5), r.net.columnU64(6), r.net.columnU64(7)};
  return {};
}

} // namespace

/* ----------------------------- SqliteBackend ----------------------------- */

SqliteBackend::SqliteBackend(std::string path)
    : path_(std::move(path)), log_(vigil::helpers::logging::get("storage")) {}

SqliteBackend::~SqliteBackend() { close(); }

StorageResult SqliteBackend::open() {
  std::lock_guard<std::mutex> lock(mtx_);
  if (db_ != nullptr) {
    return {};
  }
  if (path_.empty()) {
    return {StorageStatus::BAD_CONFIG, "sqlite path is empty"};
  }

  sqlite3* db = nullptr;
  const int RC = sqlite3_open_v2(path_.c_str(), &db,
                                 SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_NOMUTEX,
                                 nullptr);
  if (RC != SQLITE_OK) {
    StorageResult r{statusFor(RC), fmt::format("open {}: {}", path_,
                                               db != nullptr ? sqlite3_errmsg(db)
                                                             : sqlite3_errstr(RC))};
    sqlite3_close_v2(db);
    log_->error("event=storage_open_failed backend=sqlite path={} reason=\"{}\"", path_, r.reason);
    return r;
  }
  sqlite3_busy_timeout(db, 5000);

  std::string error;
  int rc = exec(db, "PRAGMA journal_mode=WAL", error);
  if (rc == SQLITE_OK) {
    rc = exec(db, "PRAGMA foreign_keys=ON", error);
  }
  if (rc == SQLITE_OK) {
    rc = exec(db, SCHEMA, error);
  }
  if (rc != SQLITE_OK) {
    sqlite3_close_v2(db);
    log_->error("event=storage_open_failed backend=sqlite path={} reason=\"{}\"", path_, error);
    return {statusFor(rc), fmt::format("initialise {}: {}", path_, error)};
  }

  db_ = db;
  log_->info("event=storage_open backend=sqlite path={}", path_);
  return {};
}

StorageResult SqliteBackend::write(const model::MetricSnapshot& snapshot) {
  std::lock_guard<std::mutex> lock(mtx_);
  if (db_ == nullptr) {
    return {StorageStatus::NOT_OPEN, "sqlite backend not open"};
  }

  std::string error;
  int rc = exec(db_, "BEGIN IMMEDIATE", error);
  if (rc != SQLITE_OK) {
    log_->error("event=storage_write_failed backend=sqlite host={} reason=\"{}\"",
                snapshot.hostname, error);
    return {statusFor(rc), "begin: " + error};
  }

  StorageResult result = insertSnapshot(db_, snapshot);
  if (result.status == StorageStatus::OK) {
    rc = exec(db_, "COMMIT", error);
    if (rc != SQLITE_OK) {
      result = {statusFor(rc), "commit: " + error};
    }
  }
  if (result.status != StorageStatus::OK) {
    std::string rollbackError;
    if (exec(db_, "ROLLBACK", rollbackError) != SQLITE_OK) {
      log_->warn("event=storage_rollback_failed backend=sqlite reason=\"{}\"", rollbackError);
    }
  }

  if (result.status == StorageStatus::DUPLICATE) {
    log_->debug("event=storage_duplicate backend=sqlite host={} ts_ms={}", snapshot.hostname,
                toUnixMillis(snapshot.timestamp));
  } else if (result.status != StorageStatus::OK) {
    log_->error("event=storage_write_failed backend=sqlite host={} reason=\"{}\"",
                snapshot.hostname, result.reason);
  }
  return result;
}

QueryResult SqliteBackend::query(const QueryFilter& filter) {
  std::lock_guard<std::mutex> lock(mtx_);
  QueryResult out{};
  if (db_ == nullptr) {
    out.status = StorageStatus::NOT_OPEN;
    out.reason = "sqlite backend not open";
    return out;
  }

  Statement rows(db_, "SELECT id, hostname, ts_ms FROM samples "
                      "WHERE (?1 = '' OR hostname = ?1) AND ts_ms >= ?2 AND ts_ms <= ?3 "
                      "ORDER BY ts_ms, hostname LIMIT ?4");
  rows.bindText(1, filter.hostname)
      .bindInt(2, filter.since ? toUnixMillis(*filter.since)
                               : std::numeric_limits<std::int64_t>::min())
      .bindInt(3, filter.until ? toUnixMillis(*filter.until)
                               : std::numeric_limits<std::int64_t>::max())
      .bindInt(4, filter.limit == 0 ? -1 : static_cast<std::int64_t>(filter.limit));

  std::vector<std::int64_t> ids;
  while (rows.next()) {
    ids.push_back(rows.columnInt(0));
    model::MetricSnapshot s{};
    s.hostname = rows.columnText(1);
    s.timestamp = fromUnixMillis(rows.columnInt(2));
    out.records.push_back(std::move(s));
  }
  if (!rows.ok()) {
    const StorageResult F = failure(db_, rows.rc(), "select samples");
    out.status = F.status;
    out.reason = F.reason;
    out.records.clear();
    return out;
  }

  GroupReaders readers(db_);
  for (std::size_t i = 0; i < ids.size(); ++i) {
    const StorageResult R = loadGroups(db_, readers, ids[i], out.records[i]);
    if (R.status != StorageStatus::OK) {
      log_->error("event=storage_read_failed backend=sqlite sample_id={} reason=\"{}\"", ids[i],
                  R.reason);
      out.status = R.status;
      out.reason = R.reason;
      out.records.clear();
      return out;
    }
  }
  return out;
}

StorageResult SqliteBackend::ping() {
  std::lock_guard<std::mutex> lock(mtx_);
  if (db_ == nullptr) {
    return {StorageStatus::NOT_OPEN, "sqlite backend not open"};
  }
  Statement probe(db_, "SELECT 1 FROM samples LIMIT 1");
  probe.next();
  if (!probe.ok()) {
    return failure(db_, probe.rc(), "ping");
  }
  return {};
}

void SqliteBackend::close() noexcept {
  std::lock_guard<std::mutex> lock(mtx_);
  if (db_ != nullptr) {
    sqlite3_close_v2(db_);
    db_ = nullptr;
    log_->info("event=storage_closed backend=sqlite path={}", path_);
  }
}

} // namespace storage

} // namespace vigil
