#ifndef VIGIL_TRANSPORT_HTTP_MESSAGE_HPP
#define VIGIL_TRANSPORT_HTTP_MESSAGE_HPP
/**
 * @file HttpMessage.hpp
 * @brief Minimal HTTP/1.1 message framing shared by the client and the ingest server.
 *
 * Only what the ingest protocol needs: request/status lines, headers,
 * Content-Length and chunked bodies. No pipelining, no trailers.
 */

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace vigil {

namespace transport {

/* ----------------------------- Constants ----------------------------- */

/// Largest accepted header block.
inline constexpr std::size_t MAX_HEADER_BYTES = 16 * 1024;

/// Largest accepted body (requests and responses).
inline constexpr std::size_t MAX_BODY_BYTES = 8 * 1024 * 1024;

/* ----------------------------- Types ----------------------------- */

using HeaderList = std::vector<std::pair<std::string, std::string>>;

/**
 * @brief Absolute http(s) URL split into connection parts.
 */
struct Url {
  std::string scheme{};    ///< "http" or "https"
  std::string host{};      ///< Host name or address (IPv6 without brackets)
  std::uint16_t port{0};   ///< Explicit or scheme default
  std::string target{"/"}; ///< Path plus query

  [[nodiscard]] bool tls() const noexcept { return scheme == "https"; }

  /// @brief "host:port" as used in the Host header (port omitted when default).
  [[nodiscard]] std::string hostHeader() const;
};

/**
 * @brief Parsed request line and headers.
 */
struct RequestHead {
  std::string method{};
  std::string target{}; ///< Raw target including query
  std::string path{};   ///< Target without query
  std::string query{};  ///< Text after '?', undecoded
  HeaderList headers{};
};

/**
 * @brief Parsed status line, headers and body.
 */
struct ResponseMessage {
  int statusCode{0};
  std::string reason{};
  HeaderList headers{};
  std::string body{};
};

/* ----------------------------- API ----------------------------- */

/**
 * @brief Parse "http://host[:port]/path?query" or https.
 * @return false with error set on unsupported scheme, empty host or bad port.
 */
[[nodiscard]] bool parseUrl(std::string_view text, Url& out, std::string& error);

/// @brief Case-insensitive header lookup, nullptr if absent.
[[nodiscard]] const std::string* findHeader(const HeaderList& headers,
                                            std::string_view name) noexcept;

/// @brief Offset just past "\r\n\r\n", or npos if the header block is incomplete.
[[nodiscard]] std::size_t findHeaderEnd(std::string_view data) noexcept;

/**
 * @brief Parse a request line plus header lines (without the terminating blank line).
 * @return false on a malformed request line or header.
 */
[[nodiscard]] bool parseRequestHead(std::string_view head, RequestHead& out);

/**
 * @brief Parse a complete response read until connection close.
 * @return false with error set when framing is invalid or the body is truncated.
 */
[[nodiscard]] bool parseResponse(std::string_view raw, ResponseMessage& out, std::string& error);

/**
 * @brief Decode a chunked transfer-encoded body.
 * @return Decoded body, std::nullopt if truncated or malformed.
 */
[[nodiscard]] std::optional<std::string> decodeChunked(std::string_view data);

/**
 * @brief Percent-decode a query component ('+' becomes space).
 */
[[nodiscard]] std::string urlDecode(std::string_view s);

/**
 * @brief Value of key in an "a=1&b=2" query string, std::nullopt if absent.
 */
[[nodiscard]] std::optional<std::string> queryParam(std::string_view query, std::string_view key);

/**
 * @brief Serialize a request with Host, Content-Length and "Connection: close".
 */
[[nodiscard]] std::string buildRequest(std::string_view method, const Url& url,
                                       const HeaderList& headers, std::string_view body);

/**
 * @brief Serialize a response with Content-Length and "Connection: close".
 */
[[nodiscard]] std::string buildResponse(int statusCode, std::string_view contentType,
                                        std::string_view body);

/// @brief Standard reason phrase ("OK", "Accepted", ...).
[[nodiscard]] const char* reasonPhrase(int statusCode) noexcept;

} // namespace transport

} // namespace vigil

#endif // VIGIL_TRANSPORT_HTTP_MESSAGE_HPP
