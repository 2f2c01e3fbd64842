/**
 * @file LineProtocol.cpp
 * @brief Line protocol writer and the subset parser needed to read it back.
 */

#include "src/storage/inc/LineProtocol.hpp"
#include "src/helpers/inc/Clock.hpp"
#include "src/helpers/inc/Strings.hpp"

#include <fmt/format.h>

#include <iterator>

namespace vigil {

namespace storage {

using vigil::helpers::strings::forEachLine;
using vigil::helpers::strings::parseDouble;
using vigil::helpers::strings::parseUint64;
using vigil::helpers::strings::startsWith;

namespace {

constexpr std::int64_t NS_PER_MS = 1'000'000;
constexpr std::size_t MAX_CORES = 4096;
constexpr std::string_view COMMIT_PREFIX = "# commit ";

/// Split on separators not preceded by a backslash.
std::vector<std::string_view> splitUnescaped(std::string_view s, char sep) {
  std::vector<std::string_view> out;
  std::size_t start = 0;
  bool escaped = false;
  for (std::size_t i = 0; i < s.size(); ++i) {
    if (escaped) {
      escaped = false;
    } else if (s[i] == '\\') {
      escaped = true;
    } else if (s[i] == sep) {
      out.push_back(s.substr(start, i - start));
      start = i + 1;
    }
  }
  out.push_back(s.substr(start));
  return out;
}

bool parseInt64(std::string_view s, std::int64_t& out) noexcept {
  const bool NEG = !s.empty() && s.front() == '-';
  if (NEG) {
    s.remove_prefix(1);
  }
  std::uint64_t mag = 0;
  if (!parseUint64(s, mag) || mag > static_cast<std::uint64_t>(INT64_MAX)) {
    return false;
  }
  out = NEG ? -static_cast<std::int64_t>(mag) : static_cast<std::int64_t>(mag);
  return true;
}

bool splitKeyValue(std::string_view kv, std::string& key, std::string& value) {
  const std::vector<std::string_view> PARTS = splitUnescaped(kv, '=');
  if (PARTS.size() != 2 || PARTS[0].empty() || PARTS[1].empty()) {
    return false;
  }
  key = unescapeTag(PARTS[0]);
  value = unescapeTag(PARTS[1]);
  return true;
}

/// Appends one point: measurement, tags, fields, timestamp.
class LineBuilder {
public:
  LineBuilder(std::string& out, std::string_view measurement, const std::string& hostname)
      : out_(out) {
    out_ += measurement;
    tag("hostname", hostname);
  }

  LineBuilder& tag(std::string_view key, std::string_view value) {
    if (!value.empty()) {
      out_ += ',';
      out_ += key;
      out_ += '=';
      out_ += escapeTag(value);
    }
    return *this;
  }

  LineBuilder& real(std::string_view key, double value) {
    separate();
    fmt::format_to(std::back_inserter(out_), "{}={}", key, value);
    return *this;
  }

  LineBuilder& counter(std::string_view key, std::uint64_t value) {
    separate();
    fmt::format_to(std::back_inserter(out_), "{}={}u", key, value);
    return *this;
  }

  void end(std::int64_t timestampNs) {
    fmt::format_to(std::back_inserter(out_), " {}\n", timestampNs);
  }

private:
  void separate() {
    out_ += firstField_ ? ' ' : ',';
    firstField_ = false;
  }

  std::string& out_;
  bool firstField_{true};
};

/* ----------------------------- Field Readers ----------------------------- */

bool readReal(const Point& p, std::string_view key, double& out) {
  const std::string* v = p.field(key);
  if (v == nullptr || v->empty() || v->back() == 'u' || v->back() == 'i') {
    return false;
  }
  return parseDouble(*v, out);
}

bool readCounter(const Point& p, std::string_view key, std::uint64_t& out) {
  const std::string* v = p.field(key);
  if (v == nullptr || v->size() < 2 || v->back() != 'u') {
    return false;
  }
  return parseUint64(std::string_view(*v).substr(0, v->size() - 1), out);
}

bool decodeCpu(const Point& p, model::CpuMetrics& cpu, std::vector<bool>& coreSeen,
               bool& haveOverall, std::string& error) {
  const std::string* type = p.tag("type");
  if (type == nullptr) {
    error = "cpu_usage without type tag";
    return false;
  }
  if (*type == "overall") {
    std::uint64_t cores = 0;
    if (!readReal(p, "percent", cpu.overallPercent) ||
        !readCounter(p, "core_count_logical", cores) || cores > UINT32_MAX) {
      error = "bad overall cpu_usage fields";
      return false;
    }
    cpu.coreCountLogical = static_cast<std::uint32_t>(cores);
    haveOverall = true;
    return true;
  }
  if (*type == "per_core") {
    const std::string* coreTag = p.tag("core");
    std::uint64_t core = 0;
    double pct = 0.0;
    if (coreTag == nullptr || !parseUint64(*coreTag, core) || core >= MAX_CORES ||
        !readReal(p, "percent", pct)) {
      error = "bad per_core cpu_usage point";
      return false;
    }
    if (core >= cpu.perCorePercent.size()) {
      cpu.perCorePercent.resize(core + 1, 0.0);
      coreSeen.resize(core + 1, false);
    }
    cpu.perCorePercent[core] = pct;
    coreSeen[core] = true;
    return true;
  }
  error = "unknown cpu_usage type '" + *type + "'";
  return false;
}

} // namespace

/* ----------------------------- Point ----------------------------- */

const std::string* Point::tag(std::string_view key) const noexcept {
  for (const auto& [k, v] : tags) {
    if (k == key) {
      return &v;
    }
  }
  return nullptr;
}

const std::string* Point::field(std::string_view key) const noexcept {
  for (const auto& [k, v] : fields) {
    if (k == key) {
      return &v;
    }
  }
  return nullptr;
}

/* ----------------------------- Escaping ----------------------------- */

std::string escapeTag(std::string_view raw) {
  std::string out;
  out.reserve(raw.size());
  for (const char C : raw) {
    if (C == ',' || C == ' ' || C == '=' || C == '\\') {
      out += '\\';
    }
    out += C;
  }
  return out;
}

std::string unescapeTag(std::string_view escaped) {
  std::string out;
  out.reserve(escaped.size());
  for (std::size_t i = 0; i < escaped.size(); ++i) {
    if (escaped[i] == '\\' && i + 1 < escaped.size()) {
      ++i;
    }
    out += escaped[i];
  }
  return out;
}

/* ----------------------------- Encoding ----------------------------- */

std::string encodePoints(const model::MetricSnapshot& s, std::size_t& points) {
  const std::int64_t TS = vigil::helpers::clock::toUnixMillis(s.timestamp) * NS_PER_MS;
  std::string out;
  out.reserve(512 + 96 * (s.cpu.perCorePercent.size() + s.disk.filesystems.size()));

  LineBuilder(out, "cpu_usage", s.hostname)
      .tag("type", "overall")
      .real("percent", s.cpu.overallPercent)
      .counter("core_count_logical", s.cpu.coreCountLogical)
      .end(TS);
  for (std::size_t i = 0; i < s.cpu.perCorePercent.size(); ++i) {
    LineBuilder(out, "cpu_usage", s.hostname)
        .tag("type", "per_core")
        .tag("core", std::to_string(i))
        .real("percent", s.cpu.perCorePercent[i])
        .end(TS);
  }
  LineBuilder(out, "load_average", s.hostname)
      .real("load_1m", s.cpu.loadAvg.one)
      .real("load_5m", s.cpu.loadAvg.five)
      .real("load_15m", s.cpu.loadAvg.fifteen)
      .end(TS);
  LineBuilder(out, "memory_usage", s.hostname)
      .counter("total_bytes", s.memory.totalBytes)
      .counter("used_bytes", s.memory.usedBytes)
      .counter("free_bytes", s.memory.freeBytes)
      .counter("available_bytes", s.memory.availableBytes)
      .counter("buffers_bytes", s.memory.buffersBytes)
      .counter("cached_bytes", s.memory.cachedBytes)
      .real("percent_used", s.memory.percentUsed)
      .end(TS);
  LineBuilder(out, "swap_usage", s.hostname)
      .counter("total_bytes", s.swap.totalBytes)
      .counter("used_bytes", s.swap.usedBytes)
      .counter("free_bytes", s.swap.freeBytes)
      .real("percent_used", s.swap.percentUsed)
      .end(TS);
  for (const model::FilesystemMetrics& fs : s.disk.filesystems) {
    LineBuilder(out, "disk_usage", s.hostname)
        .tag("device", fs.device)
        .tag("filesystem_type", fs.filesystemType)
        .tag("mount_point", fs.mountPoint)
        .counter("total_bytes", fs.totalBytes)
        .counter("used_bytes", fs.usedBytes)
        .counter("free_bytes", fs.freeBytes)
        .real("percent_used", fs.percentUsed)
        .end(TS);
  }
  LineBuilder(out, "network_io", s.hostname)
      .counter("bytes_sent", s.network.bytesSent)
      .counter("bytes_recv", s.network.bytesRecv)
      .counter("packets_sent", s.network.packetsSent)
      .counter("packets_recv", s.network.packetsRecv)
      .counter("errors_in", s.network.errorsIn)
      .counter("errors_out", s.network.errorsOut)
      .counter("drops_in", s.network.dropsIn)
      .counter("drops_out", s.network.dropsOut)
      .end(TS);

  points = 5 + s.cpu.perCorePercent.size() + s.disk.filesystems.size();
  return out;
}

std::string encodeCommit(const std::string& hostname, std::int64_t tsMillis, std::size_t points) {
  return fmt::format("{}hostname={} ts={} points={}\n", COMMIT_PREFIX, escapeTag(hostname),
                     tsMillis * NS_PER_MS, points);
}

/* ----------------------------- Decoding ----------------------------- */

bool parseCommit(std::string_view line, BatchHeader& out) {
  if (!startsWith(line, COMMIT_PREFIX)) {
    return false;
  }
  const std::vector<std::string_view> TOKENS =
      splitUnescaped(line.substr(COMMIT_PREFIX.size()), ' ');
  if (TOKENS.size() != 3) {
    return false;
  }
  BatchHeader h{};
  bool haveHost = false;
  bool haveTs = false;
  bool havePoints = false;
  for (const std::string_view TOKEN : TOKENS) {
    std::string key;
    std::string value;
    if (!splitKeyValue(TOKEN, key, value)) {
      return false;
    }
    if (key == "hostname") {
      h.hostname = std::move(value);
      haveHost = true;
    } else if (key == "ts") {
      std::int64_t ns = 0;
      if (!parseInt64(value, ns) || ns % NS_PER_MS != 0) {
        return false;
      }
      h.tsMillis = ns / NS_PER_MS;
      haveTs = true;
    } else if (key == "points") {
      std::uint64_t n = 0;
      if (!parseUint64(value, n)) {
        return false;
      }
      h.points = static_cast<std::size_t>(n);
      havePoints = true;
    }
  }
  if (!haveHost || !haveTs || !havePoints) {
    return false;
  }
  out = std::move(h);
  return true;
}

bool parsePoint(std::string_view line, Point& out, std::string& error) {
  const std::vector<std::string_view> SECTIONS = splitUnescaped(line, ' ');
  if (SECTIONS.size() != 3) {
    error = "expected 'series fields timestamp'";
    return false;
  }

  Point p{};
  const std::vector<std::string_view> SERIES = splitUnescaped(SECTIONS[0], ',');
  if (SERIES[0].empty()) {
    error = "empty measurement";
    return false;
  }
  p.measurement = unescapeTag(SERIES[0]);
  for (std::size_t i = 1; i < SERIES.size(); ++i) {
    std::string key;
    std::string value;
    if (!splitKeyValue(SERIES[i], key, value)) {
      error = fmt::format("bad tag '{}'", SERIES[i]);
      return false;
    }
    p.tags.emplace_back(std::move(key), std::move(value));
  }

  for (const std::string_view KV : splitUnescaped(SECTIONS[1], ',')) {
    std::string key;
    std::string value;
    if (!splitKeyValue(KV, key, value)) {
      error = fmt::format("bad field '{}'", KV);
      return false;
    }
    p.fields.emplace_back(std::move(key), std::move(value));
  }

  if (!parseInt64(SECTIONS[2], p.timestampNs)) {
    error = "bad timestamp";
    return false;
  }
  out = std::move(p);
  return true;
}

StorageStatus decodePoints(std::string_view text, model::MetricSnapshot& out,
                           std::string& reason) {
  model::MetricSnapshot s{};
  std::vector<bool> coreSeen;
  bool haveOverall = false;
  bool haveLoad = false;
  bool haveMemory = false;
  bool haveSwap = false;
  bool haveNetwork = false;
  bool first = true;
  std::int64_t tsNs = 0;
  std::size_t lineNo = 0;
  std::string error;

  forEachLine(text, [&](std::string_view line) {
    if (!error.empty()) {
      return;
    }
    ++lineNo;
    if (line.empty() || line.front() == '#') {
      return;
    }
    Point p;
    if (!parsePoint(line, p, error)) {
      return;
    }
    const std::string* host = p.tag("hostname");
    if (host == nullptr) {
      error = "point without hostname tag";
      return;
    }
    if (first) {
      s.hostname = *host;
      tsNs = p.timestampNs;
      first = false;
    } else if (*host != s.hostname || p.timestampNs != tsNs) {
      error = "batch mixes hosts or timestamps";
      return;
    }

    bool good = true;
    if (p.measurement == "cpu_usage") {
      good = decodeCpu(p, s.cpu, coreSeen, haveOverall, error);
    } else if (p.measurement == "load_average") {
      good = readReal(p, "load_1m", s.cpu.loadAvg.one) &&
             readReal(p, "load_5m", s.cpu.loadAvg.five) &&
             readReal(p, "load_15m", s.cpu.loadAvg.fifteen);
      haveLoad = good;
    } else if (p.measurement == "memory_usage") {
      good = readCounter(p, "total_bytes", s.memory.totalBytes) &&
             readCounter(p, "used_bytes", s.memory.usedBytes) &&
             readCounter(p, "free_bytes", s.memory.freeBytes) &&
             readCounter(p, "available_bytes", s.memory.availableBytes) &&
             readCounter(p, "buffers_bytes", s.memory.buffersBytes) &&
             readCounter(p, "cached_bytes", s.memory.cachedBytes) &&
             readReal(p, "percent_used", s.memory.percentUsed);
      haveMemory = good;
    } else if (p.measurement == "swap_usage") {
      good = readCounter(p, "total_bytes", s.swap.totalBytes) &&
             readCounter(p, "used_bytes", s.swap.usedBytes) &&
             readCounter(p, "free_bytes", s.swap.freeBytes) &&
             readReal(p, "percent_used", s.swap.percentUsed);
      haveSwap = good;
    } else if (p.measurement == "disk_usage") {
      model::FilesystemMetrics fs{};
      const std::string* mount = p.tag("mount_point");
      good = mount != nullptr && readCounter(p, "total_bytes", fs.totalBytes) &&
             readCounter(p, "used_bytes", fs.usedBytes) &&
             readCounter(p, "free_bytes", fs.freeBytes) &&
             readReal(p, "percent_used", fs.percentUsed);
      if (good) {
        fs.mountPoint = *mount;
        if (const std::string* dev = p.tag("device")) {
          fs.device = *dev;
        }
        if (const std::string* type = p.tag("filesystem_type")) {
          fs.filesystemType = *type;
        }
        s.disk.filesystems.push_back(std::move(fs));
      }
    } else if (p.measurement == "network_io") {
      good = readCounter(p, "bytes_sent", s.network.bytesSent) &&
             readCounter(p, "bytes_recv", s.network.bytesRecv) &&
             readCounter(p, "packets_sent", s.network.packetsSent) &&
             readCounter(p, "packets_recv", s.network.packetsRecv) &&
             readCounter(p, "errors_in", s.network.errorsIn) &&
             readCounter(p, "errors_out", s.network.errorsOut) &&
             readCounter(p, "drops_in", s.network.dropsIn) &&
             readCounter(p, "drops_out", s.network.dropsOut);
      haveNetwork = good;
    } else {
      error = "unknown measurement '" + p.measurement + "'";
      return;
    }
    if (!good && error.empty()) {
      error = "bad " + p.measurement + " fields";
    }
  });

  if (error.empty() && first) {
    error = "empty batch";
  }
  if (error.empty() && !(haveOverall && haveLoad && haveMemory && haveSwap && haveNetwork)) {
    error = "batch is missing a metric group";
  }
  if (error.empty()) {
    for (std::size_t i = 0; i < coreSeen.size(); ++i) {
      if (!coreSeen[i]) {
        error = fmt::format("per_core point for core {} missing", i);
        break;
      }
    }
  }
  if (!error.empty()) {
    reason = fmt::format("line {}: {}", lineNo, error);
    return StorageStatus::CORRUPT;
  }

  s.timestamp = vigil::helpers::clock::fromUnixMillis(tsNs / NS_PER_MS);
  out = std::move(s);
  return StorageStatus::OK;
}

} // namespace storage

} // namespace vigil
