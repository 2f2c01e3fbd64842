/**
 * @file Logging.cpp
 * @brief spdlog registry management for component loggers.
 */

#include "src/helpers/inc/Logging.hpp"

#include <mutex>
#include <vector>

#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace vigil {
namespace helpers {
namespace logging {

namespace {

/// Serializes get-or-create against concurrent callers (spdlog::register_logger throws on dupes).
std::mutex& registryMutex() {
  static std::mutex mtx;
  return mtx;
}

} // namespace

/* ----------------------------- API ----------------------------- */

bool parseLevel(std::string_view name, spdlog::level::level_enum& out) noexcept {
  if (name == "trace") {
    out = spdlog::level::trace;
  } else if (name == "debug") {
    out = spdlog::level::debug;
  } else if (name == "info") {
    out = spdlog::level::info;
  } else if (name == "warn" || name == "warning") {
    out = spdlog::level::warn;
  } else if (name == "error") {
    out = spdlog::level::err;
  } else if (name == "critical") {
    out = spdlog::level::critical;
  } else if (name == "off") {
    out = spdlog::level::off;
  } else {
    return false;
  }
  return true;
}

std::shared_ptr<spdlog::logger> get(const std::string& name) {
  std::lock_guard<std::mutex> lock(registryMutex());

  std::shared_ptr<spdlog::logger> existing = spdlog::get(name);
  if (existing) {
    return existing;
  }

  std::shared_ptr<spdlog::logger> logger = spdlog::default_logger()->clone(name);
  spdlog::register_logger(logger);
  return logger;
}

bool init(const LogSettings& settings, std::string& error) {
  spdlog::level::level_enum level = spdlog::level::info;
  if (!parseLevel(settings.level, level)) {
    error = "unknown log level '" + settings.level + "'";
    return false;
  }

  std::vector<spdlog::sink_ptr> sinks;
  try {
    sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());
    if (!settings.file.empty()) {
      sinks.push_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
          settings.file, settings.maxFileBytes, settings.maxFiles));
    }
  } catch (const spdlog::spdlog_ex& ex) {
    error = std::string("cannot open log sink: ") + ex.what();
    return false;
  }

  std::lock_guard<std::mutex> lock(registryMutex());

  auto root = std::make_shared<spdlog::logger>("vigil", sinks.begin(), sinks.end());
  spdlog::set_default_logger(root);

  spdlog::apply_all([&sinks](const std::shared_ptr<spdlog::logger>& logger) {
    logger->sinks() = sinks;
  });
  spdlog::set_level(level);
  spdlog::set_pattern(LOG_PATTERN);
  return true;
}

} // namespace logging
} // namespace helpers
} // namespace vigil
