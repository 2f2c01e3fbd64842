/**
 * @file MetricSnapshot.cpp
 * @brief MetricSnapshot helpers.
 */

#include "src/model/inc/MetricSnapshot.hpp"
#include "src/helpers/inc/Format.hpp"
#include "src/model/inc/TimeFormat.hpp"

#include <fmt/core.h>

namespace vigil {

namespace model {

using vigil::helpers::format::bytesBinary;

/* ----------------------------- DiskMetrics ----------------------------- */

const FilesystemMetrics* DiskMetrics::find(std::string_view mountPoint) const noexcept {
  for (const FilesystemMetrics& fs : filesystems) {
    if (fs.mountPoint == mountPoint) {
      return &fs;
    }
  }
  return nullptr;
}

/* ----------------------------- MetricSnapshot ----------------------------- */

bool MetricSnapshot::hasTimestamp() const noexcept {
  return timestamp.time_since_epoch().count() != 0;
}

std::string MetricSnapshot::toString() const {
  std::string out = fmt::format("{} @ {}: cpu={:.1f}% mem={:.1f}% ({} / {}) swap={:.1f}%",
                                hostname, formatIso8601(timestamp), cpu.overallPercent,
                                memory.percentUsed, bytesBinary(memory.usedBytes),
                                bytesBinary(memory.totalBytes), swap.percentUsed);
  for (const FilesystemMetrics& fs : disk.filesystems) {
    out += fmt::format(" {}={:.1f}%", fs.mountPoint, fs.percentUsed);
  }
  out += fmt::format(" net rx={} tx={}", bytesBinary(network.bytesRecv),
                     bytesBinary(network.bytesSent));
  return out;
}

/* ----------------------------- Helpers ----------------------------- */

double percentOf(std::uint64_t used, std::uint64_t total) noexcept {
  if (total == 0) {
    return 0.0;
  }
  const double PCT = 100.0 * static_cast<double>(used) / static_cast<double>(total);
  if (PCT < 0.0) {
    return 0.0;
  }
  return (PCT > 100.0) ? 100.0 : PCT;
}

} // namespace model

} // namespace vigil
