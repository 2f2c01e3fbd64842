/**
 * @file Validation.cpp
 * @brief Snapshot validation.
 */

#include "src/model/inc/Validation.hpp"

#include <fmt/core.h>

#include <cmath> // std::isfinite
#include <set>
#include <initializer_list>
#include <string_view>
#include <utility> // std::move

namespace vigil {

namespace model {

namespace {

ValidationResult fail(ValidationStatus status, std::string reason) {
  return ValidationResult{status, std::move(reason)};
}

bool percentOk(double v) noexcept { return std::isfinite(v) && v >= 0.0 && v <= 100.0; }

ValidationResult checkPercent(std::string_view field, double v) {
  if (!percentOk(v)) {
    return fail(ValidationStatus::OUT_OF_RANGE, fmt::format("{} = {} not in [0, 100]", field, v));
  }
  return {};
}

ValidationResult checkUsage(std::string_view group, std::uint64_t used, std::uint64_t free,
                            std::uint64_t total) {
  // Guard the sum against wrap before comparing.
  if (used > total || free > total || used + free > total) {
    return fail(ValidationStatus::INCONSISTENT,
                fmt::format("{}: used ({}) + free ({}) exceeds total ({})", group, used, free,
                            total));
  }
  return {};
}

} // namespace

/* ----------------------------- Status Helpers ----------------------------- */

const char* toString(ValidationStatus status) noexcept {
  switch (status) {
  case ValidationStatus::OK:
    return "OK";
  case ValidationStatus::MISSING_FIELD:
    return "MISSING_FIELD";
  case ValidationStatus::OUT_OF_RANGE:
    return "OUT_OF_RANGE";
  case ValidationStatus::INCONSISTENT:
    return "INCONSISTENT";
  case ValidationStatus::MALFORMED:
    return "MALFORMED";
  }
  return "UNKNOWN";
}

/* ----------------------------- API ----------------------------- */

bool hasControlChars(std::string_view text) noexcept {
  for (const char C : text) {
    const auto U = static_cast<unsigned char>(C);
    if (U < 0x20 || U == 0x7F) {
      return true;
    }
  }
  return false;
}

ValidationResult validateSnapshot(const MetricSnapshot& snap) {
  if (snap.hostname.empty()) {
    return fail(ValidationStatus::MISSING_FIELD, "hostname is missing");
  }
  if (hasControlChars(snap.hostname)) {
    return fail(ValidationStatus::MALFORMED, "hostname contains control characters");
  }
  if (!snap.hasTimestamp()) {
    return fail(ValidationStatus::MISSING_FIELD, "timestamp is missing");
  }

  ValidationResult r = checkPercent("cpu.overall_percent", snap.cpu.overallPercent);
  if (!r.ok()) {
    return r;
  }
  for (std::size_t i = 0; i < snap.cpu.perCorePercent.size(); ++i) {
    r = checkPercent(fmt::format("cpu.per_core_percent[{}]", i), snap.cpu.perCorePercent[i]);
    if (!r.ok()) {
      return r;
    }
  }

  const LoadAverage& LA = snap.cpu.loadAvg;
  for (const double V : {LA.one, LA.five, LA.fifteen}) {
    if (!std::isfinite(V) || V < 0.0) {
      return fail(ValidationStatus::OUT_OF_RANGE, fmt::format("cpu.load_avg value {} is negative", V));
    }
  }

  r = checkPercent("memory.percent_used", snap.memory.percentUsed);
  if (!r.ok()) {
    return r;
  }
  r = checkUsage("memory", snap.memory.usedBytes, snap.memory.freeBytes, snap.memory.totalBytes);
  if (!r.ok()) {
    return r;
  }
  if (snap.memory.availableBytes > snap.memory.totalBytes) {
    return fail(ValidationStatus::INCONSISTENT, "memory.available_bytes exceeds total_bytes");
  }

  r = checkPercent("swap.percent_used", snap.swap.percentUsed);
  if (!r.ok()) {
    return r;
  }
  r = checkUsage("swap", snap.swap.usedBytes, snap.swap.freeBytes, snap.swap.totalBytes);
  if (!r.ok()) {
    return r;
  }

  std::set<std::string_view> mounts;
  for (const FilesystemMetrics& fs : snap.disk.filesystems) {
    if (fs.mountPoint.empty()) {
      return fail(ValidationStatus::MISSING_FIELD, "disk.filesystems[].mount_point is missing");
    }
    if (hasControlChars(fs.mountPoint) || hasControlChars(fs.device) ||
        hasControlChars(fs.filesystemType)) {
      return fail(ValidationStatus::MALFORMED,
                  "disk.filesystems[]: mount_point, device or filesystem_type contains control "
                  "characters");
    }
    if (!mounts.insert(fs.mountPoint).second) {
      return fail(ValidationStatus::INCONSISTENT,
                  fmt::format("disk: duplicate mount point {}", fs.mountPoint));
    }
    r = checkPercent(fmt::format("disk[{}].percent_used", fs.mountPoint), fs.percentUsed);
    if (!r.ok()) {
      return r;
    }
    r = checkUsage(fmt::format("disk[{}]", fs.mountPoint), fs.usedBytes, fs.freeBytes,
                   fs.totalBytes);
    if (!r.ok()) {
      return r;
    }
  }

  return {};
}

} // namespace model

} // namespace vigil
