#ifndef VIGIL_TRANSPORT_HTTP_CLIENT_HPP
#define VIGIL_TRANSPORT_HTTP_CLIENT_HPP
/**
 * @file HttpClient.hpp
 * @brief Blocking HTTP/1.1 client over Boost.Asio with an overall deadline.
 *
 * Each request opens one connection ("Connection: close"), bounded end to end
 * (resolve, connect, TLS handshake, write, read) by HttpRequest::timeout.
 * https uses OpenSSL via asio::ssl with SNI and host name verification.
 *
 * @note Thread-safe: request() keeps all state on the stack.
 */

#include "src/transport/inc/HttpMessage.hpp"

#include <chrono>
#include <cstdint>
#include <string>

namespace vigil {

namespace transport {

/* ----------------------------- TransportStatus ----------------------------- */

/**
 * @brief Outcome of one HTTP exchange at the transport level.
 *
 * OK means a complete response was received, whatever its status code.
 */
enum class TransportStatus : std::uint8_t {
  OK = 0,
  CONNECT_FAILED, ///< Resolve or TCP connect failed
  TIMEOUT,        ///< Deadline expired
  IO_ERROR,       ///< Send/receive failed mid-exchange
  BAD_RESPONSE,   ///< Unparseable or truncated response
  BAD_URL,        ///< URL could not be parsed
  TLS_FAILED,     ///< TLS setup or handshake failed
};

/// @brief Human-readable status string.
[[nodiscard]] const char* toString(TransportStatus status) noexcept;

/* ----------------------------- Request/Response ----------------------------- */

struct HttpRequest {
  std::string method{"POST"};
  std::string url{};
  HeaderList headers{};
  std::string body{};
  std::chrono::milliseconds timeout{5000};
};

struct HttpResponse {
  TransportStatus status{TransportStatus::OK};
  int statusCode{0};   ///< HTTP status, 0 unless status is OK
  std::string body{};  ///< Response body
  std::string error{}; ///< Diagnostic text for non-OK transport status

  /// @brief Transport OK and 2xx.
  [[nodiscard]] bool success() const noexcept {
    return status == TransportStatus::OK && statusCode >= 200 && statusCode < 300;
  }
};

/* ----------------------------- HttpClient ----------------------------- */

/**
 * @brief One-shot HTTP(S) requests.
 */
class HttpClient {
public:
  /// @param verifyTls Verify server certificates against the system trust store.
  explicit HttpClient(bool verifyTls = true) noexcept : verifyTls_(verifyTls) {}

  /// @brief Perform one exchange; never throws.
  [[nodiscard]] HttpResponse request(const HttpRequest& req) const;

  /// @brief POST a JSON body.
  [[nodiscard]] HttpResponse postJson(const std::string& url, const std::string& body,
                                      std::chrono::milliseconds timeout,
                                      const HeaderList& extraHeaders = {}) const;

private:
  bool verifyTls_;
};

} // namespace transport

} // namespace vigil

#endif // VIGIL_TRANSPORT_HTTP_CLIENT_HPP
