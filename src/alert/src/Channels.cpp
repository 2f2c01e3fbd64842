/**
 * @file Channels.cpp
 * @brief Log, Slack, webhook and email channels plus the channel factory.
 */

#include "src/alert/inc/Channels.hpp"
#include "src/helpers/inc/Logging.hpp"
#include "src/model/inc/SnapshotJson.hpp"
#include "src/model/inc/TimeFormat.hpp"

#include <fmt/core.h>
#include <json/json.h>

#include <algorithm>
#include <cctype>
#include <utility>

namespace vigil {

namespace alert {

namespace {

/// Map an HTTP exchange to a channel result. 5xx and transport failures are retryable.
ChannelResult fromHttp(const transport::HttpResponse& resp) {
  ChannelResult r{};
  if (resp.status != transport::TransportStatus::OK) {
    r.status = ChannelStatus::TRANSPORT_ERROR;
    r.reason = fmt::format("{}: {}", transport::toString(resp.status), resp.error);
    r.retryable = true;
    return r;
  }
  if (!resp.success()) {
    r.status = ChannelStatus::REMOTE_ERROR;
    r.reason = fmt::format("HTTP {}", resp.statusCode);
    r.retryable = resp.statusCode >= 500 || resp.statusCode == 429;
  }
  return r;
}

std::string upper(const char* s) {
  std::string out(s);
  std::transform(out.begin(), out.end(), out.begin(),
                 [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
  return out;
}

} // namespace

/* ----------------------------- Status Helpers ----------------------------- */

const char* toString(ChannelStatus status) noexcept {
  switch (status) {
  case ChannelStatus::OK:
    return "OK";
  case ChannelStatus::NOT_CONFIGURED:
    return "NOT_CONFIGURED";
  case ChannelStatus::TRANSPORT_ERROR:
    return "TRANSPORT_ERROR";
  case ChannelStatus::REMOTE_ERROR:
    return "REMOTE_ERROR";
  }
  return "UNKNOWN";
}

/* ----------------------------- LogChannel ----------------------------- */

LogChannel::LogChannel() : log_(vigil::helpers::logging::get("channel")) {}

ChannelResult LogChannel::send(const model::AlertEvent& event) {
  spdlog::level::level_enum level = spdlog::level::warn;
  switch (event.severity) {
  case model::Severity::INFO:
    level = spdlog::level::info;
    break;
  case model::Severity::WARNING:
    level = spdlog::level::warn;
    break;
  case model::Severity::ERROR:
    level = spdlog::level::err;
    break;
  case model::Severity::CRITICAL:
    level = spdlog::level::critical;
    break;
  }
  log_->log(level, "event=alert severity={} key={} value={:.1f} threshold={:.1f} fired_at={} msg=\"{}\"",
            model::toString(event.severity), event.key.toString(), event.value, event.threshold,
            model::formatIso8601(event.firedAt), event.message);
  return {};
}

/* ----------------------------- SlackChannel ----------------------------- */

SlackChannel::SlackChannel(std::string webhookUrl, std::chrono::milliseconds timeout,
                           bool verifyTls)
    : client_(verifyTls), url_(std::move(webhookUrl)), timeout_(timeout) {}

ChannelResult SlackChannel::send(const model::AlertEvent& event) {
  Json::Value payload(Json::objectValue);
  payload["text"] = ":rotating_light: ALERT: " + event.message;
  return fromHttp(client_.postJson(url_, model::toCompactString(payload), timeout_));
}

/* ----------------------------- WebhookChannel ----------------------------- */

WebhookChannel::WebhookChannel(std::string url, transport::HeaderList headers,
                               std::chrono::milliseconds timeout, bool verifyTls)
    : client_(verifyTls), url_(std::move(url)), headers_(std::move(headers)), timeout_(timeout) {}

ChannelResult WebhookChannel::send(const model::AlertEvent& event) {
  const std::string BODY = model::toCompactString(model::alertEventToJson(event));
  return fromHttp(client_.postJson(url_, BODY, timeout_, headers_));
}

/* ----------------------------- EmailChannel ----------------------------- */

EmailChannel::EmailChannel(transport::SmtpSettings settings) : client_(std::move(settings)) {}

std::string emailSubject(const model::AlertEvent& event) {
  std::string subject = fmt::format("[vigil] {} {} on {}", upper(model::toString(event.severity)),
                                    event.key.metric, event.key.hostname);
  if (!event.key.subResource.empty()) {
    subject += " (" + event.key.subResource + ")";
  }
  return subject;
}

ChannelResult EmailChannel::send(const model::AlertEvent& event) {
  transport::MailMessage msg{};
  msg.subject = emailSubject(event);
  msg.body = fmt::format("{}\n\nhost:      {}\nmetric:    {}\nseverity:  {}\nvalue:     "
                         "{:.1f}\nthreshold: {:.1f}\ntime:      {}\n",
                         event.message, event.key.hostname, event.key.toString(),
                         model::toString(event.severity), event.value, event.threshold,
                         model::formatIso8601(event.firedAt));
  if (!event.key.subResource.empty()) {
    msg.body += "mount:     " + event.key.subResource + "\n";
  }

  const transport::SmtpResult R = client_.send(msg);
  ChannelResult out{};
  switch (R.status) {
  case transport::SmtpStatus::OK:
    return out;
  case transport::SmtpStatus::BAD_CONFIG:
    out.status = ChannelStatus::NOT_CONFIGURED;
    break;
  case transport::SmtpStatus::AUTH_FAILED:
  case transport::SmtpStatus::REJECTED:
    out.status = ChannelStatus::REMOTE_ERROR;
    out.retryable = R.replyCode >= 400 && R.replyCode < 500;
    break;
  case transport::SmtpStatus::CONNECT_FAILED:
  case transport::SmtpStatus::TIMEOUT:
  case transport::SmtpStatus::IO_ERROR:
  case transport::SmtpStatus::TLS_FAILED:
    out.status = ChannelStatus::TRANSPORT_ERROR;
    out.retryable = true;
    break;
  }
  out.reason = fmt::format("{}: {}", transport::toString(R.status), R.error);
  return out;
}

/* ----------------------------- Factory ----------------------------- */

ChannelStatus makeChannels(const ChannelSettings& settings,
                           std::vector<std::unique_ptr<NotificationChannel>>& out,
                           std::string& reason) {
  out.clear();
  for (const std::string& NAME : settings.enabled) {
    if (std::any_of(out.begin(), out.end(), [&](const auto& c) { return c->name() == NAME; })) {
      continue; // listed twice
    }
    if (NAME == "log") {
      out.push_back(std::make_unique<LogChannel>());
    } else if (NAME == "slack") {
      if (settings.slackWebhookUrl.empty()) {
        reason = "alerts.slack.webhook_url is required when the slack channel is enabled";
        out.clear();
        return ChannelStatus::NOT_CONFIGURED;
      }
      out.push_back(std::make_unique<SlackChannel>(settings.slackWebhookUrl, settings.httpTimeout,
                                                   settings.verifyTls));
    } else if (NAME == "webhook") {
      if (settings.webhookUrl.empty()) {
        reason = "alerts.webhook.url is required when the webhook channel is enabled";
        out.clear();
        return ChannelStatus::NOT_CONFIGURED;
      }
      out.push_back(std::make_unique<WebhookChannel>(settings.webhookUrl, settings.webhookHeaders,
                                                     settings.httpTimeout, settings.verifyTls));
    } else if (NAME == "email") {
      const transport::SmtpSettings& E = settings.email;
      const char* missing = nullptr;
      if (E.server.empty()) {
        missing = "alerts.email.smtp_server";
      } else if (E.to.empty()) {
        missing = "alerts.email.to_addresses";
      } else if (E.from.empty() && E.username.empty()) {
        missing = "alerts.email.from";
      }
      if (missing != nullptr) {
        reason = fmt::format("{} is required when the email channel is enabled", missing);
        out.clear();
        return ChannelStatus::NOT_CONFIGURED;
      }
      transport::SmtpSettings smtp = E;
      if (smtp.from.empty()) {
        smtp.from = smtp.username;
      }
      out.push_back(std::make_unique<EmailChannel>(std::move(smtp)));
    } else {
      reason = fmt::format("unknown alert channel '{}' (expected log, slack, email or webhook)",
                           NAME);
      out.clear();
      return ChannelStatus::NOT_CONFIGURED;
    }
  }
  return ChannelStatus::OK;
}

} // namespace alert

} // namespace vigil
