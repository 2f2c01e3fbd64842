/**
 * @file HttpMessage.cpp
 * @brief HTTP/1.1 framing helpers.
 */

#include "src/transport/inc/HttpMessage.hpp"
#include "src/helpers/inc/Strings.hpp"

#include <fmt/core.h>

#include <cctype>  // std::tolower, std::isxdigit
#include <cstdlib> // std::strtoul

namespace vigil {

namespace transport {

using vigil::helpers::strings::parseUint64;
using vigil::helpers::strings::toLower;
using vigil::helpers::strings::trim;

namespace {

bool iequals(std::string_view a, std::string_view b) noexcept {
  if (a.size() != b.size()) {
    return false;
  }
  for (std::size_t i = 0; i < a.size(); ++i) {
    if (std::tolower(static_cast<unsigned char>(a[i])) !=
        std::tolower(static_cast<unsigned char>(b[i]))) {
      return false;
    }
  }
  return true;
}

/// Split header lines ("Name: value") after the first line.
bool parseHeaderLines(std::string_view block, HeaderList& out) {
  while (!block.empty()) {
    const std::size_t EOL = block.find("\r\n");
    const std::string_view LINE = block.substr(0, EOL);
    block = (EOL == std::string_view::npos) ? std::string_view{} : block.substr(EOL + 2);
    if (LINE.empty()) {
      continue;
    }
    const std::size_t COLON = LINE.find(':');
    if (COLON == std::string_view::npos || COLON == 0) {
      return false;
    }
    out.emplace_back(std::string(trim(LINE.substr(0, COLON))),
                     std::string(trim(LINE.substr(COLON + 1))));
  }
  return true;
}

int hexValue(char c) noexcept {
  if (c >= '0' && c <= '9') {
    return c - '0';
  }
  if (c >= 'a' && c <= 'f') {
    return c - 'a' + 10;
  }
  if (c >= 'A' && c <= 'F') {
    return c - 'A' + 10;
  }
  return -1;
}

} // namespace

/* ----------------------------- Url ----------------------------- */

std::string Url::hostHeader() const {
  const bool DEFAULT_PORT = (tls() && port == 443) || (!tls() && port == 80);
  const bool IPV6 = host.find(':') != std::string::npos;
  const std::string H = IPV6 ? "[" + host + "]" : host;
  return DEFAULT_PORT ? H : fmt::format("{}:{}", H, port);
}

bool parseUrl(std::string_view text, Url& out, std::string& error) {
  out = Url{};
  const std::size_t SEP = text.find("://");
  if (SEP == std::string_view::npos) {
    error = "missing scheme";
    return false;
  }
  out.scheme = toLower(text.substr(0, SEP));
  if (out.scheme != "http" && out.scheme != "https") {
    error = fmt::format("unsupported scheme '{}'", out.scheme);
    return false;
  }
  out.port = out.tls() ? 443 : 80;

  std::string_view rest = text.substr(SEP + 3);
  const std::size_t SLASH = rest.find_first_of("/?");
  std::string_view authority = rest.substr(0, SLASH);
  if (SLASH != std::string_view::npos) {
    out.target = std::string(rest.substr(SLASH));
    if (out.target.front() == '?') {
      out.target.insert(out.target.begin(), '/');
    }
  }

  const std::size_t AT = authority.rfind('@');
  if (AT != std::string_view::npos) {
    authority.remove_prefix(AT + 1);
  }

  std::string_view portText{};
  if (!authority.empty() && authority.front() == '[') {
    const std::size_t CLOSE = authority.find(']');
    if (CLOSE == std::string_view::npos) {
      error = "unterminated IPv6 literal";
      return false;
    }
    out.host = std::string(authority.substr(1, CLOSE - 1));
    const std::string_view AFTER = authority.substr(CLOSE + 1);
    if (!AFTER.empty()) {
      if (AFTER.front() != ':') {
        error = "garbage after IPv6 literal";
        return false;
      }
      portText = AFTER.substr(1);
    }
  } else {
    const std::size_t COLON = authority.rfind(':');
    out.host = std::string(authority.substr(0, COLON));
    if (COLON != std::string_view::npos) {
      portText = authority.substr(COLON + 1);
    }
  }

  if (out.host.empty()) {
    error = "empty host";
    return false;
  }
  if (!portText.empty()) {
    std::uint64_t port = 0;
    if (!parseUint64(portText, port) || port == 0 || port > 65535) {
      error = fmt::format("bad port '{}'", portText);
      return false;
    }
    out.port = static_cast<std::uint16_t>(port);
  }
  return true;
}

/* ----------------------------- Headers ----------------------------- */

const std::string* findHeader(const HeaderList& headers, std::string_view name) noexcept {
  for (const auto& h : headers) {
    if (iequals(h.first, name)) {
      return &h.second;
    }
  }
  return nullptr;
}

std::size_t findHeaderEnd(std::string_view data) noexcept {
  const std::size_t POS = data.find("\r\n\r\n");
  return (POS == std::string_view::npos) ? POS : POS + 4;
}

/* ----------------------------- Requests ----------------------------- */

bool parseRequestHead(std::string_view head, RequestHead& out) {
  out = RequestHead{};
  const std::size_t EOL = head.find("\r\n");
  const std::string_view LINE = head.substr(0, EOL);

  const std::size_t SP1 = LINE.find(' ');
  const std::size_t SP2 = (SP1 == std::string_view::npos) ? SP1 : LINE.find(' ', SP1 + 1);
  if (SP1 == std::string_view::npos || SP2 == std::string_view::npos || SP1 == 0 ||
      SP2 == SP1 + 1) {
    return false;
  }
  if (LINE.substr(SP2 + 1).rfind("HTTP/1.", 0) != 0) {
    return false;
  }

  out.method = std::string(LINE.substr(0, SP1));
  out.target = std::string(LINE.substr(SP1 + 1, SP2 - SP1 - 1));
  const std::size_t Q = out.target.find('?');
  out.path = out.target.substr(0, Q);
  if (Q != std::string::npos) {
    out.query = out.target.substr(Q + 1);
  }

  if (EOL == std::string_view::npos) {
    return true;
  }
  return parseHeaderLines(head.substr(EOL + 2), out.headers);
}

std::string buildRequest(std::string_view method, const Url& url, const HeaderList& headers,
                         std::string_view body) {
  std::string out = fmt::format("{} {} HTTP/1.1\r\nHost: {}\r\n", method, url.target,
                                url.hostHeader());
  for (const auto& h : headers) {
    out += fmt::format("{}: {}\r\n", h.first, h.second);
  }
  out += fmt::format("Content-Length: {}\r\nConnection: close\r\n\r\n", body.size());
  out.append(body);
  return out;
}

/* ----------------------------- Responses ----------------------------- */

std::optional<std::string> decodeChunked(std::string_view data) {
  std::string out;
  for (;;) {
    const std::size_t EOL = data.find("\r\n");
    if (EOL == std::string_view::npos) {
      return std::nullopt;
    }
    std::string_view sizeText = data.substr(0, EOL);
    const std::size_t EXT = sizeText.find(';');
    sizeText = trim(sizeText.substr(0, EXT));
    if (sizeText.empty()) {
      return std::nullopt;
    }

    std::size_t size = 0;
    for (const char C : sizeText) {
      const int V = hexValue(C);
      if (V < 0 || size > (MAX_BODY_BYTES >> 4)) {
        return std::nullopt;
      }
      size = size * 16 + static_cast<std::size_t>(V);
    }
    data.remove_prefix(EOL + 2);

    if (size == 0) {
      return out;
    }
    if (data.size() < size + 2 || out.size() + size > MAX_BODY_BYTES) {
      return std::nullopt;
    }
    out.append(data.substr(0, size));
    data.remove_prefix(size + 2);
  }
}

bool parseResponse(std::string_view raw, ResponseMessage& out, std::string& error) {
  out = ResponseMessage{};
  const std::size_t HEAD_END = findHeaderEnd(raw);
  if (HEAD_END == std::string_view::npos) {
    error = "incomplete response header";
    return false;
  }

  const std::string_view HEAD = raw.substr(0, HEAD_END - 4);
  const std::size_t EOL = HEAD.find("\r\n");
  const std::string_view STATUS_LINE = HEAD.substr(0, EOL);
  if (STATUS_LINE.rfind("HTTP/1.", 0) != 0 || STATUS_LINE.size() < 12) {
    error = "bad status line";
    return false;
  }
  std::uint64_t code = 0;
  if (!parseUint64(STATUS_LINE.substr(9, 3), code) || code < 100 || code > 599) {
    error = "bad status code";
    return false;
  }
  out.statusCode = static_cast<int>(code);
  if (STATUS_LINE.size() > 13) {
    out.reason = std::string(STATUS_LINE.substr(13));
  }
  if (EOL != std::string_view::npos && !parseHeaderLines(HEAD.substr(EOL + 2), out.headers)) {
    error = "bad header line";
    return false;
  }

  const std::string_view BODY = raw.substr(HEAD_END);
  const std::string* te = findHeader(out.headers, "Transfer-Encoding");
  if (te != nullptr && toLower(*te).find("chunked") != std::string::npos) {
    std::optional<std::string> decoded = decodeChunked(BODY);
    if (!decoded) {
      error = "bad chunked body";
      return false;
    }
    out.body = std::move(*decoded);
    return true;
  }

  const std::string* cl = findHeader(out.headers, "Content-Length");
  if (cl != nullptr) {
    std::uint64_t len = 0;
    if (!parseUint64(*cl, len)) {
      error = "bad Content-Length";
      return false;
    }
    if (BODY.size() < len) {
      error = fmt::format("truncated body ({} of {} bytes)", BODY.size(), len);
      return false;
    }
    out.body = std::string(BODY.substr(0, static_cast<std::size_t>(len)));
    return true;
  }

  out.body = std::string(BODY);
  return true;
}

std::string buildResponse(int statusCode, std::string_view contentType, std::string_view body) {
  std::string out = fmt::format("HTTP/1.1 {} {}\r\n"
                                "Content-Type: {}\r\n"
                                "Content-Length: {}\r\n"
                                "Connection: close\r\n\r\n",
                                statusCode, reasonPhrase(statusCode), contentType, body.size());
  out.append(body);
  return out;
}

const char* reasonPhrase(int statusCode) noexcept {
  switch (statusCode) {
  case 200:
    return "OK";
  case 202:
    return "Accepted";
  case 204:
    return "No Content";
  case 400:
    return "Bad Request";
  case 404:
    return "Not Found";
  case 405:
    return "Method Not Allowed";
  case 408:
    return "Request Timeout";
  case 411:
    return "Length Required";
  case 413:
    return "Payload Too Large";
  case 500:
    return "Internal Server Error";
  case 503:
    return "Service Unavailable";
  default:
    return "Unknown";
  }
}

/* ----------------------------- Query Strings ----------------------------- */

std::string urlDecode(std::string_view s) {
  std::string out;
  out.reserve(s.size());
  for (std::size_t i = 0; i < s.size(); ++i) {
    if (s[i] == '+') {
      out.push_back(' ');
    } else if (s[i] == '%' && i + 2 < s.size() && hexValue(s[i + 1]) >= 0 &&
               hexValue(s[i + 2]) >= 0) {
      out.push_back(static_cast<char>(hexValue(s[i + 1]) * 16 + hexValue(s[i + 2])));
      i += 2;
    } else {
      out.push_back(s[i]);
    }
  }
  return out;
}

std::optional<std::string> queryParam(std::string_view query, std::string_view key) {
  while (!query.empty()) {
    const std::size_t AMP = query.find('&');
    const std::string_view PAIR = query.substr(0, AMP);
    query = (AMP == std::string_view::npos) ? std::string_view{} : query.substr(AMP + 1);

    const std::size_t EQ = PAIR.find('=');
    if (urlDecode(PAIR.substr(0, EQ)) == key) {
      return (EQ == std::string_view::npos) ? std::string{} : urlDecode(PAIR.substr(EQ + 1));
    }
  }
  return std::nullopt;
}

} // namespace transport

} // namespace vigil
