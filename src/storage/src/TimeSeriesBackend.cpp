/**
 * @file TimeSeriesBackend.cpp
 * @brief Append-only line protocol store with an in-memory batch index.
 */

#include "src/storage/inc/TimeSeriesBackend.hpp"
#include "src/helpers/inc/Clock.hpp"
#include "src/helpers/inc/Files.hpp"
#include "src/helpers/inc/Logging.hpp"
#include "src/storage/inc/LineProtocol.hpp"

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

#include <fmt/core.h>

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <mutex>
#include <tuple>
#include <utility>

namespace vigil {

namespace storage {

using vigil::helpers::clock::toUnixMillis;

namespace {

std::string errnoText(const char* what) {
  return fmt::format("{}: {}", what, std::strerror(errno));
}

/// Read exactly @p len bytes at @p offset.
bool preadAll(int fd, std::uint64_t offset, std::uint64_t len, std::string& out) {
  out.resize(len);
  std::uint64_t done = 0;
  while (done < len) {
    const ssize_t N = ::pread(fd, out.data() + done, len - done,
                              static_cast<off_t>(offset + done));
    if (N < 0 && errno == EINTR) {
      continue;
    }
    if (N <= 0) {
      return false;
    }
    done += static_cast<std::uint64_t>(N);
  }
  return true;
}

bool writeAll(int fd, const std::string& data) {
  std::size_t done = 0;
  while (done < data.size()) {
    const ssize_t N = ::write(fd, data.data() + done, data.size() - done);
    if (N < 0 && errno == EINTR) {
      continue;
    }
    if (N <= 0) {
      return false;
    }
    done += static_cast<std::size_t>(N);
  }
  return true;
}

template <typename Entry> bool entryLess(const Entry& e, std::int64_t ts, const std::string& host) {
  return std::tie(e.tsMillis, e.hostname) < std::tie(ts, host);
}

} // namespace

/* ----------------------------- TimeSeriesBackend ----------------------------- */

TimeSeriesBackend::TimeSeriesBackend(std::string directory, std::string bucket)
    : dir_(std::move(directory)), bucket_(std::move(bucket)),
      file_(vigil::helpers::files::joinPath(dir_, bucket_ + ".lp")),
      log_(vigil::helpers::logging::get("storage")) {}

TimeSeriesBackend::~TimeSeriesBackend() { close(); }

StorageResult TimeSeriesBackend::open() {
  std::unique_lock<std::shared_mutex> lock(mtx_);
  if (fd_ >= 0) {
    return {};
  }
  if (dir_.empty()) {
    return {StorageStatus::BAD_CONFIG, "tsdb path is empty"};
  }
  if (bucket_.empty() || bucket_.find('/') != std::string::npos) {
    return {StorageStatus::BAD_CONFIG, fmt::format("invalid tsdb bucket '{}'", bucket_)};
  }

  if (!vigil::helpers::files::isDirectory(dir_.c_str()) && ::mkdir(dir_.c_str(), 0755) != 0 &&
      errno != EEXIST) {
    StorageResult r{StorageStatus::IO_ERROR, errnoText(dir_.c_str())};
    log_->error("event=storage_open_failed backend=tsdb path={} reason=\"{}\"", dir_, r.reason);
    return r;
  }

  fd_ = ::open(file_.c_str(), O_RDWR | O_CREAT | O_APPEND | O_CLOEXEC, 0644);
  if (fd_ < 0) {
    StorageResult r{StorageStatus::IO_ERROR, errnoText(file_.c_str())};
    log_->error("event=storage_open_failed backend=tsdb path={} reason=\"{}\"", file_, r.reason);
    return r;
  }

  StorageResult r = loadIndex();
  if (r.status != StorageStatus::OK) {
    log_->error("event=storage_open_failed backend=tsdb path={} reason=\"{}\"", file_, r.reason);
    closeLocked();
    return r;
  }
  log_->info("event=storage_open backend=tsdb path={} batches={}", file_, index_.size());
  return {};
}

StorageResult TimeSeriesBackend::loadIndex() {
  struct stat st {};
  if (::fstat(fd_, &st) != 0) {
    return {StorageStatus::IO_ERROR, errnoText("fstat")};
  }
  std::string data;
  if (!preadAll(fd_, 0, static_cast<std::uint64_t>(st.st_size), data)) {
    return {StorageStatus::IO_ERROR, errnoText("read series file")};
  }

  index_.clear();
  std::uint64_t batchStart = 0;
  std::uint64_t committedEnd = 0;
  std::size_t pointLines = 0;
  std::uint64_t pos = 0;
  while (pos < data.size()) {
    const std::size_t EOL = data.find('\n', pos);
    if (EOL == std::string::npos) {
      break; // unterminated tail, torn
    }
    const std::string_view LINE(data.data() + pos, EOL - pos);
    BatchHeader header;
    if (parseCommit(LINE, header)) {
      if (header.points != pointLines) {
        return {StorageStatus::CORRUPT,
                fmt::format("batch at offset {} has {} points, commit says {}", batchStart,
                            pointLines, header.points)};
      }
      index_.push_back({header.tsMillis, std::move(header.hostname), batchStart, pos - batchStart});
      committedEnd = EOL + 1;
      batchStart = committedEnd;
      pointLines = 0;
    } else if (!LINE.empty() && LINE.front() != '#') {
      ++pointLines;
    }
    pos = EOL + 1;
  }

  if (committedEnd < data.size()) {
    if (::ftruncate(fd_, static_cast<off_t>(committedEnd)) != 0) {
      return {StorageStatus::IO_ERROR, errnoText("truncate torn batch")};
    }
    log_->warn("event=tsdb_torn_batch_discarded path={} bytes={}", file_,
               data.size() - committedEnd);
  }
  end_ = committedEnd;

  std::stable_sort(index_.begin(), index_.end(), [](const IndexEntry& a, const IndexEntry& b) {
    return std::tie(a.tsMillis, a.hostname) < std::tie(b.tsMillis, b.hostname);
  });
  const auto DUP = std::adjacent_find(index_.begin(), index_.end(),
                                      [](const IndexEntry& a, const IndexEntry& b) {
                                        return a.tsMillis == b.tsMillis && a.hostname == b.hostname;
                                      });
  if (DUP != index_.end()) {
    return {StorageStatus::CORRUPT, fmt::format("duplicate batch for host {} at {}",
                                                DUP->hostname, DUP->tsMillis)};
  }
  return {};
}

StorageResult TimeSeriesBackend::write(const model::MetricSnapshot& snapshot) {
  std::unique_lock<std::shared_mutex> lock(mtx_);
  if (fd_ < 0) {
    return {StorageStatus::NOT_OPEN, "tsdb backend not open"};
  }

  const std::int64_t TS = toUnixMillis(snapshot.timestamp);
  const auto POS = std::lower_bound(index_.begin(), index_.end(), TS,
                                    [&snapshot](const IndexEntry& e, std::int64_t ts) {
                                      return entryLess(e, ts, snapshot.hostname);
                                    });
  if (POS != index_.end() && POS->tsMillis == TS && POS->hostname == snapshot.hostname) {
    log_->debug("event=storage_duplicate backend=tsdb host={} ts_ms={}", snapshot.hostname, TS);
    return {StorageStatus::DUPLICATE, "sample already stored"};
  }

  std::size_t points = 0;
  std::string batch = encodePoints(snapshot, points);
  const std::uint64_t POINTS_BYTES = batch.size();
  batch += encodeCommit(snapshot.hostname, TS, points);

  if (!writeAll(fd_, batch) || ::fdatasync(fd_) != 0) {
    StorageResult r{StorageStatus::IO_ERROR, errnoText("append batch")};
    if (::ftruncate(fd_, static_cast<off_t>(end_)) != 0) {
      log_->error("event=tsdb_rollback_failed path={} reason=\"{}\"", file_,
                  errnoText("ftruncate"));
    }
    log_->error("event=storage_write_failed backend=tsdb host={} reason=\"{}\"",
                snapshot.hostname, r.reason);
    return r;
  }

  index_.insert(POS, IndexEntry{TS, snapshot.hostname, end_, POINTS_BYTES});
  end_ += batch.size();
  return {};
}

QueryResult TimeSeriesBackend::query(const QueryFilter& filter) {
  std::shared_lock<std::shared_mutex> lock(mtx_);
  QueryResult out{};
  if (fd_ < 0) {
    out.status = StorageStatus::NOT_OPEN;
    out.reason = "tsdb backend not open";
    return out;
  }

  std::string text;
  for (const IndexEntry& e : index_) {
    if (filter.limit != 0 && out.records.size() >= filter.limit) {
      break;
    }
    if (!matches(filter, e.hostname, e.tsMillis)) {
      continue;
    }
    model::MetricSnapshot snap{};
    std::string reason;
    if (!preadAll(fd_, e.offset, e.length, text)) {
      out.status = StorageStatus::IO_ERROR;
      out.reason = errnoText("read batch");
    } else if (decodePoints(text, snap, reason) != StorageStatus::OK) {
      out.status = StorageStatus::CORRUPT;
      out.reason = fmt::format("batch at offset {}: {}", e.offset, reason);
    }
    if (out.status != StorageStatus::OK) {
      log_->error("event=storage_read_failed backend=tsdb path={} reason=\"{}\"", file_,
                  out.reason);
      out.records.clear();
      return out;
    }
    out.records.push_back(std::move(snap));
  }
  return out;
}

StorageResult TimeSeriesBackend::ping() {
  std::shared_lock<std::shared_mutex> lock(mtx_);
  if (fd_ < 0) {
    return {StorageStatus::NOT_OPEN, "tsdb backend not open"};
  }
  struct stat st {};
  if (::fstat(fd_, &st) != 0) {
    return {StorageStatus::IO_ERROR, errnoText("fstat")};
  }
  if (st.st_nlink == 0) {
    return {StorageStatus::IO_ERROR, fmt::format("{} was removed", file_)};
  }
  return {};
}

void TimeSeriesBackend::close() noexcept {
  std::unique_lock<std::shared_mutex> lock(mtx_);
  if (fd_ >= 0) {
    closeLocked();
    log_->info("event=storage_closed backend=tsdb path={}", file_);
  }
}

void TimeSeriesBackend::closeLocked() noexcept {
  if (fd_ >= 0) {
    ::close(fd_);
    fd_ = -1;
  }
  index_.clear();
  end_ = 0;
}

std::size_t TimeSeriesBackend::batchCount() const {
  std::shared_lock<std::shared_mutex> lock(mtx_);
  return index_.size();
}

} // namespace storage

} // namespace vigil
