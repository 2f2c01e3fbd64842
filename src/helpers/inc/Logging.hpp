#ifndef VIGIL_HELPERS_LOGGING_HPP
#define VIGIL_HELPERS_LOGGING_HPP
/**
 * @file Logging.hpp
 * @brief Named spdlog loggers shared by all vigil components.
 *
 * Components fetch their logger with get("sampler"), get("transport"), ...
 * Loggers are cloned from the default logger on first use, so library code and
 * tests work without init(). init() swaps the sinks of every registered logger.
 *
 * Log bodies are structured as "event=<name> key=value ...".
 */

#include <cstddef>
#include <memory>
#include <string>
#include <string_view>

#include <spdlog/spdlog.h>

namespace vigil {
namespace helpers {
namespace logging {

/* ----------------------------- Constants ----------------------------- */

/// Line pattern used by every sink.
inline constexpr const char* LOG_PATTERN = "[%Y-%m-%dT%H:%M:%S.%e] [%n] [%l] %v";

/* ----------------------------- LogSettings ----------------------------- */

/**
 * @brief Sink and level selection (config keys logging.level / logging.file).
 */
struct LogSettings {
  std::string level{"info"};                   ///< trace|debug|info|warn|error|critical|off
  std::string file{};                          ///< Rotating file sink path, empty for none
  std::size_t maxFileBytes{5 * 1024 * 1024};   ///< Rotation size
  std::size_t maxFiles{3};                     ///< Rotated files kept
};

/* ----------------------------- API ----------------------------- */

/**
 * @brief Parse a level name.
 * @param name Level name (case-sensitive, spdlog spelling; "warning" also accepted).
 * @param out Parsed level.
 * @return false if the name is unknown.
 */
[[nodiscard]] bool parseLevel(std::string_view name, spdlog::level::level_enum& out) noexcept;

/**
 * @brief Get (or lazily create) a named component logger.
 * @note Thread-safe.
 */
[[nodiscard]] std::shared_ptr<spdlog::logger> get(const std::string& name);

/**
 * @brief Install sinks and level for all current and future loggers.
 * @param settings Level and optional file sink.
 * @param error Failure reason (unknown level, unwritable log file).
 * @return true on success.
 */
[[nodiscard]] bool init(const LogSettings& settings, std::string& error);

} // namespace logging
} // namespace helpers
} // namespace vigil

#endif // VIGIL_HELPERS_LOGGING_HPP
