#ifndef VIGIL_ALERT_CHANNELS_HPP
#define VIGIL_ALERT_CHANNELS_HPP
/**
 * @file Channels.hpp
 * @brief Notification channels that deliver AlertEvents.
 *
 * Channels:
 *  - log:     writes the event to the "channel" logger at a level matching its severity
 *  - slack:   POSTs {"text": ":rotating_light: ALERT: <message>"} to an incoming webhook
 *  - webhook: POSTs the AlertEvent JSON with configured extra headers
 *  - email:   SMTP submission to every configured recipient
 *
 * send() makes exactly one attempt; retry policy belongs to AlertDispatcher.
 */

#include "src/model/inc/AlertTypes.hpp"
#include "src/transport/inc/HttpClient.hpp"
#include "src/transport/inc/SmtpClient.hpp"

#include <spdlog/logger.h>

#include <chrono>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace vigil {

namespace alert {

/* ----------------------------- ChannelStatus ----------------------------- */

enum class ChannelStatus : std::uint8_t {
  OK = 0,
  NOT_CONFIGURED,  ///< Required setting missing or unknown channel name
  TRANSPORT_ERROR, ///< Could not reach the remote side
  REMOTE_ERROR,    ///< Remote side answered with an error
};

/// @brief Human-readable status string.
[[nodiscard]] const char* toString(ChannelStatus status) noexcept;

struct ChannelResult {
  ChannelStatus status{ChannelStatus::OK};
  std::string reason{};
  bool retryable{false}; ///< A later attempt may succeed

  [[nodiscard]] bool ok() const noexcept { return status == ChannelStatus::OK; }
};

/* ----------------------------- NotificationChannel ----------------------------- */

class NotificationChannel {
public:
  virtual ~NotificationChannel() = default;

  /// @brief Channel identifier ("log", "slack", ...).
  [[nodiscard]] virtual const std::string& name() const noexcept = 0;

  /// @brief One delivery attempt. Must not throw.
  virtual ChannelResult send(const model::AlertEvent& event) = 0;
};

/* ----------------------------- Channels ----------------------------- */

class LogChannel final : public NotificationChannel {
public:
  LogChannel();

  [[nodiscard]] const std::string& name() const noexcept override { return name_; }
  ChannelResult send(const model::AlertEvent& event) override;

private:
  std::string name_{"log"};
  std::shared_ptr<spdlog::logger> log_;
};

class SlackChannel final : public NotificationChannel {
public:
  SlackChannel(std::string webhookUrl, std::chrono::milliseconds timeout, bool verifyTls = true);

  [[nodiscard]] const std::string& name() const noexcept override { return name_; }
  ChannelResult send(const model::AlertEvent& event) override;

private:
  std::string name_{"slack"};
  transport::HttpClient client_;
  std::string url_;
  std::chrono::milliseconds timeout_;
};

class WebhookChannel final : public NotificationChannel {
public:
  WebhookChannel(std::string url, transport::HeaderList headers,
                 std::chrono::milliseconds timeout, bool verifyTls = true);

  [[nodiscard]] const std::string& name() const noexcept override { return name_; }
  ChannelResult send(const model::AlertEvent& event) override;

private:
  std::string name_{"webhook"};
  transport::HttpClient client_;
  std::string url_;
  transport::HeaderList headers_;
  std::chrono::milliseconds timeout_;
};

class EmailChannel final : public NotificationChannel {
public:
  explicit EmailChannel(transport::SmtpSettings settings);

  [[nodiscard]] const std::string& name() const noexcept override { return name_; }
  ChannelResult send(const model::AlertEvent& event) override;

private:
  std::string name_{"email"};
  transport::SmtpClient client_;
};

/* ----------------------------- Factory ----------------------------- */

/**
 * @brief Channel selection and per-channel settings (config keys alerts.*).
 */
struct ChannelSettings {
  std::vector<std::string> enabled{"log"};    ///< alerts.channels, in dispatch order
  std::string slackWebhookUrl{};              ///< alerts.slack.webhook_url
  std::string webhookUrl{};                   ///< alerts.webhook.url
  transport::HeaderList webhookHeaders{};     ///< alerts.webhook.headers
  transport::SmtpSettings email{};            ///< alerts.email.*
  std::chrono::milliseconds httpTimeout{5000};
  bool verifyTls{true};
};

/**
 * @brief Build every enabled channel.
 * @param settings Channel configuration.
 * @param out Built channels, in enabled order (cleared first).
 * @param reason Names the missing key or unknown channel on failure.
 * @return OK, or NOT_CONFIGURED if any enabled channel lacks required settings.
 */
[[nodiscard]] ChannelStatus makeChannels(const ChannelSettings& settings,
                                         std::vector<std::unique_ptr<NotificationChannel>>& out,
                                         std::string& reason);

/// @brief Mail subject for an event: "[vigil] WARNING cpu on web-01".
[[nodiscard]] std::string emailSubject(const model::AlertEvent& event);

} // namespace alert

} // namespace vigil

#endif // VIGIL_ALERT_CHANNELS_HPP
