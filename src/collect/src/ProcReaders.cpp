/**
 * @file ProcReaders.cpp
 * @brief /proc/stat, /proc/meminfo, /proc/loadavg, /proc/mounts and
 *        /sys/class/net parsing.
 */

#include "src/collect/inc/ProcReaders.hpp"
#include "src/helpers/inc/Files.hpp"
#include "src/helpers/inc/Strings.hpp"
#include "src/model/inc/Validation.hpp"

#include <dirent.h>      // opendir, readdir
#include <sys/statvfs.h> // statvfs

#include <array>   // std::array
#include <cstdio>  // fopen, fgets, sscanf
#include <cstdlib> // strtoull
#include <cstring> // strncmp, strchr
#include <optional>
#include <set>
#include <string_view>

namespace vigil {

namespace collect {

using vigil::helpers::files::joinPath;
using vigil::helpers::files::readFileToBuffer;
using vigil::helpers::files::readFileUint64;
using vigil::helpers::files::readTextFile;
using vigil::helpers::strings::startsWith;
using vigil::helpers::strings::unescapeOctal;

namespace {

/* ----------------------------- Constants ----------------------------- */

constexpr std::size_t MEMINFO_BUF_SIZE = 8192;
constexpr std::size_t LOADAVG_BUF_SIZE = 128;
constexpr std::size_t MOUNT_LINE_SIZE = 4096;
constexpr std::size_t MOUNT_FIELD_SIZE = 1024;
constexpr std::size_t MAX_CPU_ID = 8192;

/* ----------------------------- /proc/stat ----------------------------- */

/// Parse "cpu[N] user nice system idle iowait irq softirq steal guest guest_nice".
/// cpuId is -1 for the aggregate line.
bool parseCpuLine(const char* line, CpuTimes& out, long& cpuId) noexcept {
  if (std::strncmp(line, "cpu", 3) != 0) {
    return false;
  }

  const char* ptr = line + 3;
  if (*ptr == ' ') {
    cpuId = -1;
  } else if (*ptr >= '0' && *ptr <= '9') {
    char* end = nullptr;
    cpuId = std::strtol(ptr, &end, 10);
    if (end == ptr || cpuId < 0) {
      return false;
    }
    ptr = end;
  } else {
    return false;
  }

  std::array<std::uint64_t, 10> vals{};
  std::size_t parsed = 0;
  for (; parsed < vals.size(); ++parsed) {
    char* end = nullptr;
    vals[parsed] = std::strtoull(ptr, &end, 10);
    if (end == ptr) {
      // Older kernels report fewer columns
      break;
    }
    ptr = end;
  }
  if (parsed < 4) {
    return false;
  }

  out.user = vals[0];
  out.nice = vals[1];
  out.system = vals[2];
  out.idle = vals[3];
  out.iowait = vals[4];
  out.irq = vals[5];
  out.softirq = vals[6];
  out.steal = vals[7];
  out.guest = vals[8];
  out.guestNice = vals[9];
  return true;
}

/* ----------------------------- /proc/meminfo ----------------------------- */

/// Parse "FieldName:    12345 kB", return bytes.
std::uint64_t parseMemInfoKb(const char* line) noexcept {
  const char* colon = std::strchr(line, ':');
  if (colon == nullptr) {
    return 0;
  }
  char* end = nullptr;
  const unsigned long long KB = std::strtoull(colon + 1, &end, 10);
  if (end == colon + 1) {
    return 0;
  }
  return static_cast<std::uint64_t>(KB) * 1024ULL;
}

bool lineStartsWith(const char* line, const char* prefix) noexcept {
  return std::strncmp(line, prefix, std::strlen(prefix)) == 0;
}

} // namespace

/* ----------------------------- CpuTimes ----------------------------- */

std::uint64_t CpuTimes::total() const noexcept {
  return user + nice + system + idle + iowait + irq + softirq + steal;
}

std::uint64_t CpuTimes::active() const noexcept {
  const std::uint64_t TOTAL = total();
  const std::uint64_t INACTIVE = idle + iowait;
  return (TOTAL >= INACTIVE) ? (TOTAL - INACTIVE) : 0;
}

/* ----------------------------- CPU ----------------------------- */

bool readCpuTimes(const HostPaths& paths, CpuTimesTable& out) {
  const std::optional<std::string> TEXT = readTextFile(joinPath(paths.procRoot, "stat"));
  if (!TEXT) {
    return false;
  }

  out = CpuTimesTable{};
  bool haveAggregate = false;
  vigil::helpers::strings::forEachLine(*TEXT, [&](std::string_view line) {
    if (!startsWith(line, "cpu")) {
      return;
    }
    const std::string LINE(line);
    CpuTimes times{};
    long cpuId = -1;
    if (!parseCpuLine(LINE.c_str(), times, cpuId)) {
      return;
    }
    if (cpuId < 0) {
      out.aggregate = times;
      haveAggregate = true;
    } else if (static_cast<std::size_t>(cpuId) < MAX_CPU_ID) {
      const std::size_t IDX = static_cast<std::size_t>(cpuId);
      if (out.perCore.size() <= IDX) {
        out.perCore.resize(IDX + 1);
      }
      out.perCore[IDX] = times;
    }
  });
  return haveAggregate;
}

double computeCpuPercent(const CpuTimes& before, const CpuTimes& after) noexcept {
  const std::uint64_t TOTAL_BEFORE = before.total();
  const std::uint64_t TOTAL_AFTER = after.total();
  if (TOTAL_AFTER <= TOTAL_BEFORE) {
    // No time elapsed, or the counters were reset
    return 0.0;
  }
  const std::uint64_t ACTIVE_BEFORE = before.active();
  const std::uint64_t ACTIVE_AFTER = after.active();
  if (ACTIVE_AFTER <= ACTIVE_BEFORE) {
    return 0.0;
  }

  const double PCT = 100.0 * static_cast<double>(ACTIVE_AFTER - ACTIVE_BEFORE) /
                     static_cast<double>(TOTAL_AFTER - TOTAL_BEFORE);
  return (PCT > 100.0) ? 100.0 : PCT;
}

/* ----------------------------- Memory ----------------------------- */

bool readMemInfo(const HostPaths& paths, MemInfo& out) noexcept {
  out = MemInfo{};

  std::array<char, MEMINFO_BUF_SIZE> buf{};
  const std::string PATH = joinPath(paths.procRoot, "meminfo");
  if (readFileToBuffer(PATH.c_str(), buf.data(), buf.size()) == 0) {
    return false;
  }

  bool haveTotal = false;
  bool haveAvailable = false;
  const char* ptr = buf.data();
  while (*ptr != '\0') {
    const char* eol = ptr;
    while (*eol != '\0' && *eol != '\n') {
      ++eol;
    }

    if (lineStartsWith(ptr, "MemTotal:")) {
      out.totalBytes = parseMemInfoKb(ptr);
      haveTotal = true;
    } else if (lineStartsWith(ptr, "MemFree:")) {
      out.freeBytes = parseMemInfoKb(ptr);
    } else if (lineStartsWith(ptr, "MemAvailable:")) {
      out.availableBytes = parseMemInfoKb(ptr);
      haveAvailable = true;
    } else if (lineStartsWith(ptr, "Buffers:")) {
      out.buffersBytes = parseMemInfoKb(ptr);
    } else if (lineStartsWith(ptr, "Cached:")) {
      out.cachedBytes += parseMemInfoKb(ptr);
    } else if (lineStartsWith(ptr, "SReclaimable:")) {
      out.cachedBytes += parseMemInfoKb(ptr);
    } else if (lineStartsWith(ptr, "SwapTotal:")) {
      out.swapTotalBytes = parseMemInfoKb(ptr);
    } else if (lineStartsWith(ptr, "SwapFree:")) {
      out.swapFreeBytes = parseMemInfoKb(ptr);
    }

    ptr = (*eol == '\0') ? eol : eol + 1;
  }

  // Pre-3.14 kernels have no MemAvailable
  if (!haveAvailable) {
    out.availableBytes = out.freeBytes + out.buffersBytes + out.cachedBytes;
    if (out.availableBytes > out.totalBytes) {
      out.availableBytes = out.totalBytes;
    }
  }
  return haveTotal && out.totalBytes > 0;
}

model::MemoryMetrics toMemoryMetrics(const MemInfo& info) noexcept {
  model::MemoryMetrics m{};
  m.totalBytes = info.totalBytes;
  m.freeBytes = (info.freeBytes <= info.totalBytes) ? info.freeBytes : info.totalBytes;
  m.availableBytes = (info.availableBytes <= info.totalBytes) ? info.availableBytes : info.totalBytes;
  m.buffersBytes = info.buffersBytes;
  m.cachedBytes = info.cachedBytes;

  const std::uint64_t RECLAIMABLE = m.freeBytes + info.buffersBytes + info.cachedBytes;
  m.usedBytes = (info.totalBytes > RECLAIMABLE) ? (info.totalBytes - RECLAIMABLE) : 0;
  m.percentUsed = model::percentOf(m.usedBytes, m.totalBytes);
  return m;
}

model::SwapMetrics toSwapMetrics(const MemInfo& info) noexcept {
  model::SwapMetrics s{};
  s.totalBytes = info.swapTotalBytes;
  s.freeBytes = (info.swapFreeBytes <= info.swapTotalBytes) ? info.swapFreeBytes : info.swapTotalBytes;
  s.usedBytes = s.totalBytes - s.freeBytes;
  s.percentUsed = model::percentOf(s.usedBytes, s.totalBytes);
  return s;
}

/* ----------------------------- Load ----------------------------- */

bool readLoadAverage(const HostPaths& paths, model::LoadAverage& out) noexcept {
  std::array<char, LOADAVG_BUF_SIZE> buf{};
  const std::string PATH = joinPath(paths.procRoot, "loadavg");
  if (readFileToBuffer(PATH.c_str(), buf.data(), buf.size()) == 0) {
    return false;
  }

  double one = 0.0;
  double five = 0.0;
  double fifteen = 0.0;
  if (std::sscanf(buf.data(), "%lf %lf %lf", &one, &five, &fifteen) != 3) {
    return false;
  }
  if (one < 0.0 || five < 0.0 || fifteen < 0.0) {
    return false;
  }
  out = model::LoadAverage{one, five, fifteen};
  return true;
}

/* ----------------------------- Filesystems ----------------------------- */

bool MountEntry::isBlockDevice() const noexcept {
  return startsWith(device, "/dev/") && !startsWith(device, "/dev/loop");
}

bool readMountTable(const HostPaths& paths, std::vector<MountEntry>& out) {
  out.clear();
  const std::string PATH = joinPath(paths.procRoot, "mounts");
  std::FILE* fp = std::fopen(PATH.c_str(), "r");
  if (fp == nullptr) {
    return false;
  }

  char line[MOUNT_LINE_SIZE];
  while (std::fgets(line, sizeof(line), fp) != nullptr) {
    // Parse: device mountpoint fstype options dump pass
    char device[MOUNT_FIELD_SIZE];
    char mountPoint[MOUNT_FIELD_SIZE];
    char fsType[64];
    const int FIELDS = std::sscanf(line, "%1023s %1023s %63s", device, mountPoint, fsType);
    if (FIELDS < 3) {
      continue;
    }
    out.push_back(MountEntry{unescapeOctal(device), unescapeOctal(mountPoint), fsType});
  }

  std::fclose(fp);
  return true;
}

std::vector<MountEntry> selectPhysicalMounts(const std::vector<MountEntry>& mounts) {
  std::vector<MountEntry> out;
  std::set<std::string> seen;
  for (const MountEntry& m : mounts) {
    if (!m.isBlockDevice()) {
      continue;
    }
    // Octal escapes in /proc/mounts can decode to newlines.
    if (model::hasControlChars(m.mountPoint) || model::hasControlChars(m.device) ||
        model::hasControlChars(m.fsType)) {
      continue;
    }
    if (!seen.insert(m.mountPoint).second) {
      continue;
    }
    out.push_back(m);
  }
  return out;
}

bool readFilesystemUsage(const HostPaths& paths, const MountEntry& mount,
                         model::FilesystemMetrics& out) {
  const std::string TARGET = joinPath(paths.rootfs, mount.mountPoint);
  struct statvfs st{};
  if (::statvfs(TARGET.c_str(), &st) != 0 || st.f_blocks == 0) {
    return false;
  }

  const std::uint64_t FRSIZE = (st.f_frsize != 0) ? st.f_frsize : st.f_bsize;
  out = model::FilesystemMetrics{};
  out.mountPoint = mount.mountPoint;
  out.device = mount.device;
  out.filesystemType = mount.fsType;
  out.totalBytes = static_cast<std::uint64_t>(st.f_blocks) * FRSIZE;
  const std::uint64_t BFREE = (st.f_bfree <= st.f_blocks) ? st.f_bfree : st.f_blocks;
  out.usedBytes = (static_cast<std::uint64_t>(st.f_blocks) - BFREE) * FRSIZE;
  const std::uint64_t BAVAIL = (st.f_bavail <= BFREE) ? st.f_bavail : BFREE;
  out.freeBytes = static_cast<std::uint64_t>(BAVAIL) * FRSIZE;
  // df semantics: blocks reserved for root are neither used nor available
  out.percentUsed = model::percentOf(out.usedBytes, out.usedBytes + out.freeBytes);
  return true;
}

/* ----------------------------- Network ----------------------------- */

bool readNetworkTotals(const HostPaths& paths, model::NetworkMetrics& out) {
  const std::string BASE = joinPath(paths.sysRoot, "class/net");
  DIR* dir = ::opendir(BASE.c_str());
  if (dir == nullptr) {
    return false;
  }

  out = model::NetworkMetrics{};
  struct dirent* entry = nullptr;
  while ((entry = ::readdir(dir)) != nullptr) {
    if (entry->d_name[0] == '.' || std::strcmp(entry->d_name, "lo") == 0) {
      continue;
    }
    const std::string STATS = BASE + "/" + entry->d_name + "/statistics/";
    auto counter = [&STATS](const char* name) {
      return readFileUint64((STATS + name).c_str());
    };
    out.bytesRecv += counter("rx_bytes");
    out.bytesSent += counter("tx_bytes");
    out.packetsRecv += counter("rx_packets");
    out.packetsSent += counter("tx_packets");
    out.errorsIn += counter("rx_errors");
    out.errorsOut += counter("tx_errors");
    out.dropsIn += counter("rx_dropped");
    out.dropsOut += counter("tx_dropped");
  }

  ::closedir(dir);
  return true;
}

} // namespace collect

} // namespace vigil
