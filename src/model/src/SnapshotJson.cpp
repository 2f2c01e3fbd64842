/**
 * @file SnapshotJson.cpp
 * @brief jsoncpp encoding and decoding of the wire format.
 */

#include "src/model/inc/SnapshotJson.hpp"
#include "src/model/inc/TimeFormat.hpp"

#include <fmt/core.h>

#include <cmath>  // std::isfinite
#include <memory> // std::unique_ptr
#include <utility>

namespace vigil {

namespace model {

namespace {

Json::Value u64(std::uint64_t v) { return Json::Value(static_cast<Json::UInt64>(v)); }

/* ----------------------------- Field Reader ----------------------------- */

/**
 * Reads typed members out of one JSON object, remembering the first failure.
 * Absent or null members leave the destination untouched.
 */
class FieldReader {
public:
  FieldReader(const Json::Value& obj, std::string path, ValidationResult& result)
      : obj_(obj), path_(std::move(path)), result_(result) {}

  bool uint(const char* key, std::uint64_t& out) {
    const Json::Value* v = member(key);
    if (v == nullptr) {
      return result_.ok();
    }
    if (!v->isNumeric()) {
      return fail(ValidationStatus::MALFORMED, key, "is not a number");
    }
    if (v->isUInt64()) {
      out = v->asUInt64();
      return true;
    }
    const double D = v->asDouble();
    if (!std::isfinite(D) || D < 0.0) {
      return fail(ValidationStatus::OUT_OF_RANGE, key, "is negative");
    }
    // 2^64: the first double that does not convert.
    if (D >= 18446744073709551616.0) {
      return fail(ValidationStatus::OUT_OF_RANGE, key, "exceeds uint64");
    }
    out = static_cast<std::uint64_t>(D);
    return true;
  }

  bool real(const char* key, double& out) {
    const Json::Value* v = member(key);
    if (v == nullptr) {
      return result_.ok();
    }
    if (!v->isNumeric()) {
      return fail(ValidationStatus::MALFORMED, key, "is not a number");
    }
    out = v->asDouble();
    return true;
  }

  bool text(const char* key, std::string& out) {
    const Json::Value* v = member(key);
    if (v == nullptr) {
      return result_.ok();
    }
    if (!v->isString()) {
      return fail(ValidationStatus::MALFORMED, key, "is not a string");
    }
    out = v->asString();
    return true;
  }

  bool fail(ValidationStatus status, const char* key, const char* what) {
    if (result_.ok()) {
      result_.status = status;
      result_.reason = fmt::format("{}.{} {}", path_, key, what);
    }
    return false;
  }

  [[nodiscard]] const Json::Value* member(const char* key) const {
    const Json::Value* v = obj_.find(key, key + std::char_traits<char>::length(key));
    return (v == nullptr || v->isNull()) ? nullptr : v;
  }

private:
  const Json::Value& obj_;
  std::string path_;
  ValidationResult& result_;
};

ValidationResult malformed(std::string reason) {
  return ValidationResult{ValidationStatus::MALFORMED, std::move(reason)};
}

/* ----------------------------- Group Decoders ----------------------------- */

bool decodeCpu(const Json::Value& v, CpuMetrics& cpu, ValidationResult& r) {
  // Bare number: overall percent only.
  if (v.isNumeric()) {
    cpu.overallPercent = v.asDouble();
    return true;
  }
  if (!v.isObject()) {
    r = malformed("cpu is not an object");
    return false;
  }

  FieldReader f(v, "cpu", r);
  if (!f.real("overall_percent", cpu.overallPercent)) {
    return false;
  }

  if (const Json::Value* cores = f.member("per_core_percent")) {
    if (!cores->isArray()) {
      r = malformed("cpu.per_core_percent is not an array");
      return false;
    }
    cpu.perCorePercent.clear();
    cpu.perCorePercent.reserve(cores->size());
    for (const Json::Value& c : *cores) {
      if (!c.isNumeric()) {
        r = malformed("cpu.per_core_percent has a non-numeric entry");
        return false;
      }
      cpu.perCorePercent.push_back(c.asDouble());
    }
  }

  if (const Json::Value* la = f.member("load_avg")) {
    if (!la->isArray() || la->size() != 3 || !(*la)[0].isNumeric() || !(*la)[1].isNumeric() ||
        !(*la)[2].isNumeric()) {
      r = malformed("cpu.load_avg must be an array of three numbers");
      return false;
    }
    cpu.loadAvg.one = (*la)[0].asDouble();
    cpu.loadAvg.five = (*la)[1].asDouble();
    cpu.loadAvg.fifteen = (*la)[2].asDouble();
  }

  std::uint64_t cores = cpu.coreCountLogical;
  if (!f.uint("core_count_logical", cores)) {
    return false;
  }
  cpu.coreCountLogical = static_cast<std::uint32_t>(cores);
  if (cpu.coreCountLogical == 0) {
    cpu.coreCountLogical = static_cast<std::uint32_t>(cpu.perCorePercent.size());
  }
  return true;
}

bool decodeMemory(const Json::Value& v, MemoryMetrics& mem, ValidationResult& r) {
  if (!v.isObject()) {
    r = malformed("memory is not an object");
    return false;
  }
  FieldReader f(v, "memory", r);
  return f.uint("total_bytes", mem.totalBytes) && f.uint("used_bytes", mem.usedBytes) &&
         f.uint("free_bytes", mem.freeBytes) && f.uint("available_bytes", mem.availableBytes) &&
         f.uint("buffers_bytes", mem.buffersBytes) && f.uint("cached_bytes", mem.cachedBytes) &&
         f.real("percent_used", mem.percentUsed);
}

bool decodeSwap(const Json::Value& v, SwapMetrics& swap, ValidationResult& r) {
  if (!v.isObject()) {
    r = malformed("swap is not an object");
    return false;
  }
  FieldReader f(v, "swap", r);
  return f.uint("total_bytes", swap.totalBytes) && f.uint("used_bytes", swap.usedBytes) &&
         f.uint("free_bytes", swap.freeBytes) && f.real("percent_used", swap.percentUsed);
}

bool decodeDisk(const Json::Value& v, DiskMetrics& disk, ValidationResult& r) {
  const Json::Value* list = &v;
  if (v.isObject()) {
    list = v.find("filesystems", "filesystems" + 11);
    if (list == nullptr || list->isNull()) {
      disk.filesystems.clear();
      return true;
    }
  }
  if (!list->isArray()) {
    r = malformed("disk.filesystems is not an array");
    return false;
  }

  disk.filesystems.clear();
  disk.filesystems.reserve(list->size());
  for (Json::ArrayIndex i = 0; i < list->size(); ++i) {
    const Json::Value& e = (*list)[i];
    if (!e.isObject()) {
      r = malformed(fmt::format("disk.filesystems[{}] is not an object", i));
      return false;
    }
    FilesystemMetrics fs{};
    FieldReader f(e, fmt::format("disk.filesystems[{}]", i), r);
    if (!(f.text("mount_point", fs.mountPoint) && f.text("device", fs.device) &&
          f.text("filesystem_type", fs.filesystemType) && f.uint("total_bytes", fs.totalBytes) &&
          f.uint("used_bytes", fs.usedBytes) && f.uint("free_bytes", fs.freeBytes) &&
          f.real("percent_used", fs.percentUsed))) {
      return false;
    }
    disk.filesystems.push_back(std::move(fs));
  }
  return true;
}

bool decodeNetwork(const Json::Value& v, NetworkMetrics& net, ValidationResult& r) {
  if (!v.isObject()) {
    r = malformed("network is not an object");
    return false;
  }
  FieldReader f(v, "network", r);
  return f.uint("bytes_sent", net.bytesSent) && f.uint("bytes_recv", net.bytesRecv) &&
         f.uint("packets_sent", net.packetsSent) && f.uint("packets_recv", net.packetsRecv) &&
         f.uint("errors_in", net.errorsIn) && f.uint("errors_out", net.errorsOut) &&
         f.uint("drops_in", net.dropsIn) && f.uint("drops_out", net.dropsOut);
}

} // namespace

/* ----------------------------- Encoding ----------------------------- */

Json::Value snapshotToJson(const MetricSnapshot& snap) {
  Json::Value root(Json::objectValue);
  root["hostname"] = snap.hostname;
  root["timestamp"] = formatIso8601(snap.timestamp);

  Json::Value cpu(Json::objectValue);
  cpu["overall_percent"] = snap.cpu.overallPercent;
  Json::Value cores(Json::arrayValue);
  for (const double P : snap.cpu.perCorePercent) {
    cores.append(P);
  }
  cpu["per_core_percent"] = std::move(cores);
  Json::Value la(Json::arrayValue);
  la.append(snap.cpu.loadAvg.one);
  la.append(snap.cpu.loadAvg.five);
  la.append(snap.cpu.loadAvg.fifteen);
  cpu["load_avg"] = std::move(la);
  cpu["core_count_logical"] = Json::Value(static_cast<Json::UInt>(snap.cpu.coreCountLogical));
  root["cpu"] = std::move(cpu);

  Json::Value mem(Json::objectValue);
  mem["total_bytes"] = u64(snap.memory.totalBytes);
  mem["used_bytes"] = u64(snap.memory.usedBytes);
  mem["free_bytes"] = u64(snap.memory.freeBytes);
  mem["available_bytes"] = u64(snap.memory.availableBytes);
  mem["buffers_bytes"] = u64(snap.memory.buffersBytes);
  mem["cached_bytes"] = u64(snap.memory.cachedBytes);
  mem["percent_used"] = snap.memory.percentUsed;
  root["memory"] = std::move(mem);

  Json::Value swap(Json::objectValue);
  swap["total_bytes"] = u64(snap.swap.totalBytes);
  swap["used_bytes"] = u64(snap.swap.usedBytes);
  swap["free_bytes"] = u64(snap.swap.freeBytes);
  swap["percent_used"] = snap.swap.percentUsed;
  root["swap"] = std::move(swap);

  Json::Value fsList(Json::arrayValue);
  for (const FilesystemMetrics& fs : snap.disk.filesystems) {
    Json::Value e(Json::objectValue);
    e["mount_point"] = fs.mountPoint;
    e["device"] = fs.device;
    e["filesystem_type"] = fs.filesystemType;
    e["total_bytes"] = u64(fs.totalBytes);
    e["used_bytes"] = u64(fs.usedBytes);
    e["free_bytes"] = u64(fs.freeBytes);
    e["percent_used"] = fs.percentUsed;
    fsList.append(std::move(e));
  }
  Json::Value disk(Json::objectValue);
  disk["filesystems"] = std::move(fsList);
  root["disk"] = std::move(disk);

  Json::Value net(Json::objectValue);
  net["bytes_sent"] = u64(snap.network.bytesSent);
  net["bytes_recv"] = u64(snap.network.bytesRecv);
  net["packets_sent"] = u64(snap.network.packetsSent);
  net["packets_recv"] = u64(snap.network.packetsRecv);
  net["errors_in"] = u64(snap.network.errorsIn);
  net["errors_out"] = u64(snap.network.errorsOut);
  net["drops_in"] = u64(snap.network.dropsIn);
  net["drops_out"] = u64(snap.network.dropsOut);
  root["network"] = std::move(net);

  return root;
}

Json::Value ingestPayloadToJson(const MetricSnapshot& snap) {
  Json::Value root(Json::objectValue);
  root["hostname"] = snap.hostname;
  root["metrics"] = snapshotToJson(snap);
  return root;
}

Json::Value alertEventToJson(const AlertEvent& event) {
  Json::Value root(Json::objectValue);
  root["hostname"] = event.key.hostname;
  root["metric"] = event.key.metric;
  if (!event.key.subResource.empty()) {
    root["resource"] = event.key.subResource;
  }
  root["severity"] = toString(event.severity);
  root["value"] = event.value;
  root["threshold"] = event.threshold;
  root["fired_at"] = formatIso8601(event.firedAt);
  root["message"] = event.message;
  return root;
}

std::string toCompactString(const Json::Value& value) {
  Json::StreamWriterBuilder builder;
  builder["indentation"] = "";
  builder["emitUTF8"] = true;
  return Json::writeString(builder, value);
}

/* ----------------------------- Decoding ----------------------------- */

bool parseJson(std::string_view text, Json::Value& out, std::string& error) {
  Json::CharReaderBuilder builder;
  builder["collectComments"] = false;
  const std::unique_ptr<Json::CharReader> READER(builder.newCharReader());
  error.clear();
  return READER->parse(text.data(), text.data() + text.size(), &out, &error);
}

ValidationResult snapshotFromJson(const Json::Value& value, MetricSnapshot& out) {
  if (!value.isObject()) {
    return malformed("metrics is not an object");
  }

  ValidationResult r{};
  FieldReader f(value, "metrics", r);
  if (!f.text("hostname", out.hostname)) {
    return r;
  }

  const Json::Value* ts = f.member("timestamp");
  if (ts == nullptr) {
    return ValidationResult{ValidationStatus::MISSING_FIELD, "metrics.timestamp is missing"};
  }
  if (!ts->isString()) {
    return malformed("metrics.timestamp is not a string");
  }
  const std::optional<Timestamp> PARSED = parseIso8601(ts->asString());
  if (!PARSED) {
    return malformed(fmt::format("metrics.timestamp '{}' is not ISO-8601", ts->asString()));
  }
  out.timestamp = *PARSED;

  if (const Json::Value* v = f.member("cpu"); v != nullptr && !decodeCpu(*v, out.cpu, r)) {
    return r;
  }
  if (const Json::Value* v = f.member("memory"); v != nullptr && !decodeMemory(*v, out.memory, r)) {
    return r;
  }
  if (const Json::Value* v = f.member("swap"); v != nullptr && !decodeSwap(*v, out.swap, r)) {
    return r;
  }
  if (const Json::Value* v = f.member("disk"); v != nullptr && !decodeDisk(*v, out.disk, r)) {
    return r;
  }
  if (const Json::Value* v = f.member("network");
      v != nullptr && !decodeNetwork(*v, out.network, r)) {
    return r;
  }
  return r;
}

ValidationResult ingestPayloadFromJson(std::string_view body, MetricSnapshot& out) {
  Json::Value root;
  std::string error;
  if (!parseJson(body, root, error)) {
    return malformed(fmt::format("invalid JSON: {}", error));
  }
  if (!root.isObject()) {
    return malformed("body is not a JSON object");
  }

  const Json::Value& HOST = root["hostname"];
  if (HOST.isNull()) {
    return ValidationResult{ValidationStatus::MISSING_FIELD, "hostname is missing"};
  }
  if (!HOST.isString()) {
    return malformed("hostname is not a string");
  }
  const Json::Value& METRICS = root["metrics"];
  if (METRICS.isNull()) {
    return ValidationResult{ValidationStatus::MISSING_FIELD, "metrics is missing"};
  }

  out = MetricSnapshot{};
  ValidationResult r = snapshotFromJson(METRICS, out);
  if (!r.ok()) {
    return r;
  }

  const std::string OUTER = HOST.asString();
  if (!out.hostname.empty() && out.hostname != OUTER) {
    return malformed(
        fmt::format("metrics.hostname '{}' does not match hostname '{}'", out.hostname, OUTER));
  }
  out.hostname = OUTER;
  return r;
}

} // namespace model

} // namespace vigil
