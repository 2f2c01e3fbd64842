#ifndef VIGIL_TRANSPORT_SMTP_CLIENT_HPP
#define VIGIL_TRANSPORT_SMTP_CLIENT_HPP
/**
 * @file SmtpClient.hpp
 * @brief Minimal SMTP submission client (EHLO, STARTTLS, AUTH LOGIN, one message).
 *
 * One connection per message, bounded end to end by SmtpSettings::timeout.
 *
 * @note Thread-safe: send() keeps all state on the stack.
 */

#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace vigil {

namespace transport {

/* ----------------------------- SmtpStatus ----------------------------- */

enum class SmtpStatus : std::uint8_t {
  OK = 0,
  BAD_CONFIG,     ///< Missing server, sender or recipients
  CONNECT_FAILED, ///< Resolve or TCP connect failed
  TIMEOUT,        ///< Deadline expired
  IO_ERROR,       ///< Connection broke mid-dialogue
  TLS_FAILED,     ///< STARTTLS refused or handshake failed
  AUTH_FAILED,    ///< Server rejected the credentials
  REJECTED,       ///< Server refused sender, recipient or message
};

/// @brief Human-readable status string.
[[nodiscard]] const char* toString(SmtpStatus status) noexcept;

/* ----------------------------- Settings ----------------------------- */

struct SmtpSettings {
  std::string server{};
  std::uint16_t port{587};
  bool useTls{true}; ///< Upgrade with STARTTLS before authenticating
  bool verifyTls{true};
  std::string username{}; ///< Empty skips AUTH
  std::string password{};
  std::string from{};
  std::vector<std::string> to{};
  std::chrono::milliseconds timeout{10000};
};

struct MailMessage {
  std::string subject{};
  std::string body{};
};

struct SmtpResult {
  SmtpStatus status{SmtpStatus::OK};
  int replyCode{0};    ///< Last server reply code, 0 if none
  std::string error{}; ///< Diagnostic text for non-OK status

  [[nodiscard]] bool ok() const noexcept { return status == SmtpStatus::OK; }
};

/* ----------------------------- SmtpClient ----------------------------- */

class SmtpClient {
public:
  explicit SmtpClient(SmtpSettings settings) : settings_(std::move(settings)) {}

  /// @brief Deliver one message to every recipient; never throws.
  [[nodiscard]] SmtpResult send(const MailMessage& message) const;

  [[nodiscard]] const SmtpSettings& settings() const noexcept { return settings_; }

private:
  SmtpSettings settings_;
};

/* ----------------------------- Helpers ----------------------------- */

/// @brief RFC 4648 base64 without line breaks.
[[nodiscard]] std::string base64Encode(std::string_view data);

/**
 * @brief Normalize line endings to CRLF and double leading dots (RFC 5321 4.5.2).
 */
[[nodiscard]] std::string dotStuff(std::string_view body);

} // namespace transport

} // namespace vigil

#endif // VIGIL_TRANSPORT_SMTP_CLIENT_HPP
