#ifndef VIGIL_CONFIG_CONFIG_HPP
#define VIGIL_CONFIG_CONFIG_HPP
/**
 * @file Config.hpp
 * @brief JSON configuration for vigil-agent and vigil-ingestd (jsoncpp).
 *
 * Dotted keys map to nested objects: "endpoint.url" is {"endpoint": {"url": ...}}.
 * Unknown keys are ignored. Durations are a number of seconds or a string
 * with an ms/s/m/h suffix ("250ms", "30s", "5m").
 *
 * Example agent file:
 * @code
 * {"interval_seconds": 30,
 *  "endpoint": {"url": "http://ingest:8000/ingest", "timeout": "5s", "max_retries": 3},
 *  "logging": {"level": "info"}}
 * @endcode
 */

#include "src/alert/inc/AlertDispatcher.hpp"
#include "src/alert/inc/Channels.hpp"
#include "src/alert/inc/ThresholdConfig.hpp"
#include "src/collect/inc/ProcReaders.hpp"
#include "src/helpers/inc/Logging.hpp"
#include "src/ingest/inc/HttpServer.hpp"
#include "src/storage/inc/StorageBackend.hpp"
#include "src/transport/inc/TransmissionClient.hpp"

#include <json/json.h>

#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>

namespace vigil {

namespace config {

/* ----------------------------- ConfigStatus ----------------------------- */

enum class ConfigStatus : std::uint8_t {
  OK = 0,
  UNREADABLE,    ///< File missing or unreadable
  PARSE_ERROR,   ///< Not valid JSON or not an object
  MISSING_KEY,   ///< Required key absent
  INVALID_VALUE, ///< Wrong type or out of range
};

/// @brief Human-readable status string.
[[nodiscard]] const char* toString(ConfigStatus status) noexcept;

struct ConfigResult {
  ConfigStatus status{ConfigStatus::OK};
  std::string reason{}; ///< Names the dotted key, e.g. "endpoint.url: required"

  [[nodiscard]] bool ok() const noexcept { return status == ConfigStatus::OK; }
};

/* ----------------------------- Settings ----------------------------- */

/**
 * @brief Everything vigil-agent needs.
 */
struct AgentSettings {
  std::string hostname{};                          ///< Defaults to gethostname()
  std::chrono::milliseconds interval{30'000};      ///< interval_seconds (required)
  std::string endpointUrl{};                       ///< endpoint.url (required)
  std::chrono::milliseconds endpointTimeout{5000}; ///< endpoint.timeout
  bool verifyTls{true};                            ///< endpoint.verify_tls
  transport::TransmissionConfig transmission{};    ///< endpoint.max_retries, backoff_*, queue_depth
  collect::HostPaths paths{};                      ///< collector.*
  helpers::logging::LogSettings logging{};         ///< logging.*
};

/**
 * @brief Everything vigil-ingestd needs.
 */
struct ServerSettings {
  ingest::ServerConfig server{};              ///< server.*
  storage::StorageConfig storage{};           ///< storage.*
  alert::ThresholdConfig thresholds{};        ///< thresholds.*
  alert::ChannelSettings channels{};          ///< alerts.channels and per-channel keys
  alert::DispatcherConfig dispatcher{};       ///< alerts.channel_retries
  bool recoveryEvents{false};                 ///< alerts.recovery_events
  helpers::logging::LogSettings logging{};    ///< logging.*
};

/* ----------------------------- API ----------------------------- */

/**
 * @brief Parse a duration: number of seconds or "<n>ms|s|m|h".
 * @return false on a negative, non-finite or unrecognised value.
 */
[[nodiscard]] bool parseDuration(const Json::Value& value, std::chrono::milliseconds& out);

/// @brief Parse agent settings from JSON text.
[[nodiscard]] ConfigResult parseAgentConfig(std::string_view text, AgentSettings& out);

/// @brief Read and parse an agent config file.
[[nodiscard]] ConfigResult loadAgentConfig(const std::string& path, AgentSettings& out);

/// @brief Parse server settings from JSON text.
[[nodiscard]] ConfigResult parseServerConfig(std::string_view text, ServerSettings& out);

/// @brief Read and parse a server config file.
[[nodiscard]] ConfigResult loadServerConfig(const std::string& path, ServerSettings& out);

} // namespace config

} // namespace vigil

#endif // VIGIL_CONFIG_CONFIG_HPP
