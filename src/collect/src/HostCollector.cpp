/**
 * @file HostCollector.cpp
 * @brief Snapshot assembly with per-sub-metric failure isolation.
 */

#include "src/collect/inc/HostCollector.hpp"
#include "src/helpers/inc/Clock.hpp"
#include "src/helpers/inc/Logging.hpp"

#include <unistd.h> // gethostname

#include <array>
#include <utility>

namespace vigil {

namespace collect {

/* ----------------------------- Status Helpers ----------------------------- */

const char* toString(CollectionStatus status) noexcept {
  switch (status) {
  case CollectionStatus::OK:
    return "OK";
  case CollectionStatus::PARTIAL:
    return "PARTIAL";
  }
  return "UNKNOWN";
}

/* ----------------------------- HostCollector ----------------------------- */

HostCollector::HostCollector(std::string hostname, HostPaths paths)
    : hostname_(std::move(hostname)), paths_(std::move(paths)),
      log_(vigil::helpers::logging::get("sampler")) {}

CollectionResult HostCollector::collect() {
  auto snap = std::make_shared<model::MetricSnapshot>();
  snap->hostname = hostname_;
  snap->timestamp = vigil::helpers::clock::wallNow();

  std::vector<std::string> omitted;
  collectCpu(*snap, omitted);
  collectMemory(*snap, omitted);
  collectDisk(*snap, omitted);
  collectNetwork(*snap, omitted);

  ++stats_.rounds;
  CollectionResult result{};
  if (!omitted.empty()) {
    ++stats_.partialRounds;
    stats_.omissions += omitted.size();
    result.status = CollectionStatus::PARTIAL;
  }
  result.snapshot = std::move(snap);
  result.omitted = std::move(omitted);
  return result;
}

void HostCollector::collectCpu(model::MetricSnapshot& snap, std::vector<std::string>& omitted) {
  CpuTimesTable now{};
  if (!readCpuTimes(paths_, now)) {
    log_->warn("event=collection_error metric=cpu path={}/stat reason=unreadable",
               paths_.procRoot);
    omitted.emplace_back("cpu");
  } else {
    const CpuTimesTable BEFORE = havePrevCpu_ ? prevCpu_ : CpuTimesTable{};
    snap.cpu.overallPercent = computeCpuPercent(BEFORE.aggregate, now.aggregate);
    snap.cpu.perCorePercent.reserve(now.perCore.size());
    for (std::size_t i = 0; i < now.perCore.size(); ++i) {
      const CpuTimes PREV = (i < BEFORE.perCore.size()) ? BEFORE.perCore[i] : CpuTimes{};
      snap.cpu.perCorePercent.push_back(computeCpuPercent(PREV, now.perCore[i]));
    }
    snap.cpu.coreCountLogical = static_cast<std::uint32_t>(now.perCore.size());
    prevCpu_ = std::move(now);
    havePrevCpu_ = true;
  }

  if (!readLoadAverage(paths_, snap.cpu.loadAvg)) {
    log_->warn("event=collection_error metric=load_avg path={}/loadavg reason=unreadable",
               paths_.procRoot);
    omitted.emplace_back("load_avg");
  }
}

void HostCollector::collectMemory(model::MetricSnapshot& snap,
                                  std::vector<std::string>& omitted) {
  MemInfo info{};
  if (!readMemInfo(paths_, info)) {
    log_->warn("event=collection_error metric=memory path={}/meminfo reason=unreadable",
               paths_.procRoot);
    omitted.emplace_back("memory");
    omitted.emplace_back("swap");
    return;
  }
  snap.memory = toMemoryMetrics(info);
  snap.swap = toSwapMetrics(info);
}

void HostCollector::collectDisk(model::MetricSnapshot& snap, std::vector<std::string>& omitted) {
  std::vector<MountEntry> mounts;
  if (!readMountTable(paths_, mounts)) {
    log_->warn("event=collection_error metric=disk path={}/mounts reason=unreadable",
               paths_.procRoot);
    omitted.emplace_back("disk");
    return;
  }

  for (const MountEntry& mount : selectPhysicalMounts(mounts)) {
    model::FilesystemMetrics fs{};
    if (!readFilesystemUsage(paths_, mount, fs)) {
      log_->warn("event=collection_error metric=disk mount={} device={} reason=statvfs_failed",
                 mount.mountPoint, mount.device);
      omitted.push_back("disk:" + mount.mountPoint);
      continue;
    }
    snap.disk.filesystems.push_back(std::move(fs));
  }
}

void HostCollector::collectNetwork(model::MetricSnapshot& snap,
                                   std::vector<std::string>& omitted) {
  if (!readNetworkTotals(paths_, snap.network)) {
    log_->warn("event=collection_error metric=network path={}/class/net reason=unreadable",
               paths_.sysRoot);
    omitted.emplace_back("network");
  }
}

/* ----------------------------- API ----------------------------- */

std::string localHostname() {
  std::array<char, 256> buf{};
  if (::gethostname(buf.data(), buf.size() - 1) != 0 || buf[0] == '\0') {
    return "localhost";
  }
  return std::string(buf.data());
}

} // namespace collect

} // namespace vigil
