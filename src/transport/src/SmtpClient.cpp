/**
 * @file SmtpClient.cpp
 * @brief SMTP dialogue over Boost.Asio with optional STARTTLS upgrade.
 */

#include "src/transport/inc/SmtpClient.hpp"
#include "src/helpers/inc/Logging.hpp"
#include "src/transport/inc/AsioDeadline.hpp"

#include <boost/asio/connect.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/read_until.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/asio/write.hpp>
#include <boost/system/system_error.hpp>

#include <openssl/evp.h>

#include <fmt/core.h>

#include <ctime>
#include <functional>
#include <optional>
#include <utility>

namespace vigil {

namespace transport {

namespace asio = boost::asio;
using tcp = asio::ip::tcp;
using boost::system::error_code;

namespace {

constexpr std::size_t MAX_REPLY_BYTES = 64 * 1024;

SmtpResult fail(SmtpStatus status, std::string error, int code = 0) {
  SmtpResult r{};
  r.status = status;
  r.replyCode = code;
  r.error = std::move(error);
  return r;
}

std::string rfc5322Date() {
  const std::time_t NOW = std::time(nullptr);
  std::tm tm{};
  ::gmtime_r(&NOW, &tm);
  char buf[64];
  const std::size_t N = std::strftime(buf, sizeof(buf), "%a, %d %b %Y %H:%M:%S +0000", &tm);
  return std::string(buf, N);
}

/**
 * One SMTP connection. The ssl stream is used raw until STARTTLS succeeds.
 */
class Session {
public:
  Session(const SmtpSettings& settings, DeadlineClock::time_point deadline)
      : settings_(settings), deadline_(deadline), ctx_(asio::ssl::context::tls_client),
        stream_(ioc_, ctx_) {}

  std::optional<SmtpResult> connect() {
    tcp::resolver resolver(ioc_);
    tcp::resolver::results_type endpoints;
    error_code ec;
    if (!runWithDeadline(
            ioc_, deadline_,
            [&](auto handler) {
              resolver.async_resolve(
                  settings_.server, std::to_string(settings_.port),
                  [&endpoints, handler](const error_code& e,
                                        tcp::resolver::results_type results) mutable {
                    endpoints = std::move(results);
                    handler(e);
                  });
            },
            [&resolver] { resolver.cancel(); }, ec)) {
      return fail(SmtpStatus::TIMEOUT, "timed out resolving " + settings_.server);
    }
    if (ec) {
      return fail(SmtpStatus::CONNECT_FAILED,
                  fmt::format("resolve {}: {}", settings_.server, ec.message()));
    }
    if (!runWithDeadline(
            ioc_, deadline_,
            [&](auto handler) {
              asio::async_connect(stream_.lowest_layer(), endpoints, std::move(handler));
            },
            cancelFn(), ec)) {
      return fail(SmtpStatus::TIMEOUT, "timed out connecting to " + settings_.server);
    }
    if (ec) {
      return fail(SmtpStatus::CONNECT_FAILED,
                  fmt::format("connect {}:{}: {}", settings_.server, settings_.port,
                              ec.message()));
    }
    return expect(220, SmtpStatus::REJECTED, "greeting");
  }

  /// Send @p line (CRLF appended) and require reply @p code.
  std::optional<SmtpResult> command(const std::string& line, int code, SmtpStatus onMismatch,
                                    std::string_view what) {
    if (auto err = writeRaw(line + "\r\n")) {
      return err;
    }
    return expect(code, onMismatch, what);
  }

  std::optional<SmtpResult> writeRaw(const std::string& data) {
    error_code ec;
    const bool DONE = secure_ ? writeOn(stream_, data, ec) : writeOn(stream_.next_layer(), data, ec);
    if (!DONE) {
      return fail(SmtpStatus::TIMEOUT, "timed out sending");
    }
    if (ec) {
      return fail(SmtpStatus::IO_ERROR, "send: " + ec.message());
    }
    return std::nullopt;
  }

  std::optional<SmtpResult> expect(int code, SmtpStatus onMismatch, std::string_view what) {
    int got = 0;
    std::string text;
    if (auto err = readReply(got, text)) {
      return err;
    }
    if (got != code && !(code == 250 && got == 251)) {
      return fail(onMismatch, fmt::format("{}: {} {}", what, got, text), got);
    }
    lastCode_ = got;
    return std::nullopt;
  }

  std::optional<SmtpResult> startTls() {
    if (auto err = command("STARTTLS", 220, SmtpStatus::TLS_FAILED, "STARTTLS")) {
      return err;
    }
    error_code ec;
    if (settings_.verifyTls) {
      ctx_.set_default_verify_paths(ec);
      if (ec) {
        return fail(SmtpStatus::TLS_FAILED, "trust store: " + ec.message());
      }
      stream_.set_verify_mode(asio::ssl::verify_peer);
      stream_.set_verify_callback(asio::ssl::host_name_verification(settings_.server));
    } else {
      stream_.set_verify_mode(asio::ssl::verify_none);
    }
    if (SSL_set_tlsext_host_name(stream_.native_handle(), settings_.server.c_str()) != 1) {
      return fail(SmtpStatus::TLS_FAILED, "cannot set SNI host name");
    }
    if (!runWithDeadline(
            ioc_, deadline_,
            [&](auto handler) {
              stream_.async_handshake(asio::ssl::stream_base::client, std::move(handler));
            },
            cancelFn(), ec)) {
      return fail(SmtpStatus::TIMEOUT, "timed out in TLS handshake");
    }
    if (ec) {
      return fail(SmtpStatus::TLS_FAILED, "handshake: " + ec.message());
    }
    secure_ = true;
    buf_.clear();
    return std::nullopt;
  }

  [[nodiscard]] int lastCode() const noexcept { return lastCode_; }

private:
  std::function<void()> cancelFn() {
    return [this] {
      error_code ignored;
      stream_.lowest_layer().close(ignored);
    };
  }

  template <typename Stream> bool writeOn(Stream& s, const std::string& data, error_code& ec) {
    return runWithDeadline(
        ioc_, deadline_,
        [&](auto handler) { asio::async_write(s, asio::buffer(data), std::move(handler)); },
        cancelFn(), ec);
  }

  template <typename Stream> bool readLineOn(Stream& s, std::size_t& n, error_code& ec) {
    return runWithDeadline(
        ioc_, deadline_,
        [&](auto handler) {
          asio::async_read_until(s, asio::dynamic_buffer(buf_, MAX_REPLY_BYTES), "\r\n",
                                 [&n, handler](const error_code& e, std::size_t bytes) mutable {
                                   n = bytes;
                                   handler(e);
                                 });
        },
        cancelFn(), ec);
  }

  /// Read a possibly multi-line reply ("250-...", "250 ...").
  std::optional<SmtpResult> readReply(int& code, std::string& text) {
    text.clear();
    for (;;) {
      std::size_t n = 0;
      error_code ec;
      const bool DONE = secure_ ? readLineOn(stream_, n, ec) : readLineOn(stream_.next_layer(), n, ec);
      if (!DONE) {
        return fail(SmtpStatus::TIMEOUT, "timed out awaiting reply");
      }
      if (ec) {
        return fail(SmtpStatus::IO_ERROR, "receive: " + ec.message());
      }
      const std::string LINE = buf_.substr(0, n - 2);
      buf_.erase(0, n);
      if (LINE.size() < 3 || LINE[0] < '1' || LINE[0] > '5' || LINE[1] < '0' || LINE[1] > '9' ||
          LINE[2] < '0' || LINE[2] > '9') {
        return fail(SmtpStatus::IO_ERROR, "malformed reply: " + LINE);
      }
      code = (LINE[0] - '0') * 100 + (LINE[1] - '0') * 10 + (LINE[2] - '0');
      if (LINE.size() > 4) {
        if (!text.empty()) {
          text += ' ';
        }
        text += LINE.substr(4);
      }
      if (LINE.size() == 3 || LINE[3] != '-') {
        return std::nullopt;
      }
    }
  }

  const SmtpSettings& settings_;
  DeadlineClock::time_point deadline_;
  asio::io_context ioc_;
  asio::ssl::context ctx_;
  asio::ssl::stream<tcp::socket> stream_;
  bool secure_{false};
  std::string buf_;
  int lastCode_{0};
};

} // namespace

/* ----------------------------- Status Helpers ----------------------------- */

const char* toString(SmtpStatus status) noexcept {
  switch (status) {
  case SmtpStatus::OK:
    return "OK";
  case SmtpStatus::BAD_CONFIG:
    return "BAD_CONFIG";
  case SmtpStatus::CONNECT_FAILED:
    return "CONNECT_FAILED";
  case SmtpStatus::TIMEOUT:
    return "TIMEOUT";
  case SmtpStatus::IO_ERROR:
    return "IO_ERROR";
  case SmtpStatus::TLS_FAILED:
    return "TLS_FAILED";
  case SmtpStatus::AUTH_FAILED:
    return "AUTH_FAILED";
  case SmtpStatus::REJECTED:
    return "REJECTED";
  }
  return "UNKNOWN";
}

/* ----------------------------- Helpers ----------------------------- */

std::string base64Encode(std::string_view data) {
  std::string out(4 * ((data.size() + 2) / 3), '\0');
  const int N = EVP_EncodeBlock(reinterpret_cast<unsigned char*>(out.data()),
                                reinterpret_cast<const unsigned char*>(data.data()),
                                static_cast<int>(data.size()));
  out.resize(static_cast<std::size_t>(N));
  return out;
}

std::string dotStuff(std::string_view body) {
  std::string out;
  out.reserve(body.size() + 16);
  bool lineStart = true;
  for (std::size_t i = 0; i < body.size(); ++i) {
    const char C = body[i];
    if (C == '\r') {
      continue; // re-emitted with the following '\n'
    }
    if (C == '\n') {
      out += "\r\n";
      lineStart = true;
      continue;
    }
    if (lineStart && C == '.') {
      out += '.';
    }
    out += C;
    lineStart = false;
  }
  return out;
}

/* ----------------------------- SmtpClient ----------------------------- */

SmtpResult SmtpClient::send(const MailMessage& message) const {
  const SmtpSettings& s = settings_;
  if (s.server.empty() || s.from.empty() || s.to.empty()) {
    return fail(SmtpStatus::BAD_CONFIG, "smtp server, sender and recipients are required");
  }

  const DeadlineClock::time_point DEADLINE = DeadlineClock::now() + s.timeout;
  try {
    Session session(s, DEADLINE);
    if (auto err = session.connect()) {
      return *err;
    }
    if (auto err = session.command("EHLO vigil", 250, SmtpStatus::REJECTED, "EHLO")) {
      return *err;
    }
    if (s.useTls) {
      if (auto err = session.startTls()) {
        return *err;
      }
      if (auto err = session.command("EHLO vigil", 250, SmtpStatus::REJECTED, "EHLO")) {
        return *err;
      }
    }
    if (!s.username.empty()) {
      if (auto err = session.command("AUTH LOGIN", 334, SmtpStatus::AUTH_FAILED, "AUTH")) {
        return *err;
      }
      if (auto err = session.command(base64Encode(s.username), 334, SmtpStatus::AUTH_FAILED,
                                     "AUTH username")) {
        return *err;
      }
      if (auto err = session.command(base64Encode(s.password), 235, SmtpStatus::AUTH_FAILED,
                                     "AUTH password")) {
        return *err;
      }
    }
    if (auto err = session.command("MAIL FROM:<" + s.from + ">", 250, SmtpStatus::REJECTED,
                                   "MAIL FROM")) {
      return *err;
    }
    std::string toHeader;
    for (const std::string& rcpt : s.to) {
      if (auto err = session.command("RCPT TO:<" + rcpt + ">", 250, SmtpStatus::REJECTED,
                                     "RCPT TO " + rcpt)) {
        return *err;
      }
      toHeader += toHeader.empty() ? rcpt : ", " + rcpt;
    }
    if (auto err = session.command("DATA", 354, SmtpStatus::REJECTED, "DATA")) {
      return *err;
    }

    const std::string CONTENT =
        fmt::format("From: {}\r\nTo: {}\r\nSubject: {}\r\nDate: {}\r\nMIME-Version: 1.0\r\n"
                    "Content-Type: text/plain; charset=utf-8\r\n"
                    "Content-Transfer-Encoding: 8bit\r\n\r\n{}\r\n.\r\n",
                    s.from, toHeader, message.subject, rfc5322Date(), dotStuff(message.body));
    if (auto err = session.writeRaw(CONTENT)) {
      return *err;
    }
    if (auto err = session.expect(250, SmtpStatus::REJECTED, "message")) {
      return *err;
    }
    SmtpResult ok{};
    ok.replyCode = session.lastCode();

    if (auto err = session.command("QUIT", 221, SmtpStatus::REJECTED, "QUIT")) {
      vigil::helpers::logging::get("channel")->debug("event=smtp_quit_failed server={} error={}",
                                                     s.server, err->error);
    }
    return ok;
  } catch (const boost::system::system_error& ex) {
    vigil::helpers::logging::get("channel")->debug("event=smtp_error server={} error={}", s.server,
                                                   ex.what());
    return fail(SmtpStatus::IO_ERROR, ex.what());
  }
}

} // namespace transport

} // namespace vigil
