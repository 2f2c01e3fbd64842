/**
 * @file HttpClient.cpp
 * @brief Boost.Asio HTTP(S) client.
 */

#include "src/transport/inc/HttpClient.hpp"
#include "src/helpers/inc/Logging.hpp"
#include "src/transport/inc/AsioDeadline.hpp"

#include <boost/asio/connect.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/read.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/asio/write.hpp>
#include <boost/system/system_error.hpp>

#include <fmt/core.h>

#include <exception>
#include <utility>

namespace vigil {

namespace transport {

namespace asio = boost::asio;
using tcp = asio::ip::tcp;
using boost::system::error_code;

namespace {

HttpResponse fail(TransportStatus status, std::string error) {
  HttpResponse r{};
  r.status = status;
  r.error = std::move(error);
  return r;
}

bool isCleanEof(const error_code& ec) noexcept {
  return ec == asio::error::eof || ec == asio::ssl::error::stream_truncated;
}

/// Write the request and read the response until the peer closes.
template <typename Stream>
HttpResponse exchange(asio::io_context& ioc, Stream& stream, DeadlineClock::time_point deadline,
                      const std::string& wire) {
  auto cancel = [&stream] {
    error_code ignored;
    stream.lowest_layer().close(ignored);
  };

  error_code ec;
  if (!runWithDeadline(
          ioc, deadline,
          [&](auto handler) { asio::async_write(stream, asio::buffer(wire), std::move(handler)); },
          cancel, ec)) {
    return fail(TransportStatus::TIMEOUT, "timed out sending request");
  }
  if (ec) {
    return fail(TransportStatus::IO_ERROR, "send: " + ec.message());
  }

  std::string raw;
  if (!runWithDeadline(
          ioc, deadline,
          [&](auto handler) {
            asio::async_read(stream, asio::dynamic_buffer(raw, MAX_HEADER_BYTES + MAX_BODY_BYTES),
                             std::move(handler));
          },
          cancel, ec)) {
    return fail(TransportStatus::TIMEOUT, "timed out awaiting response");
  }
  if (ec && !isCleanEof(ec)) {
    return fail(TransportStatus::IO_ERROR, "receive: " + ec.message());
  }

  ResponseMessage msg;
  std::string error;
  if (!parseResponse(raw, msg, error)) {
    return fail(TransportStatus::BAD_RESPONSE, error);
  }

  HttpResponse r{};
  r.statusCode = msg.statusCode;
  r.body = std::move(msg.body);
  return r;
}

} // namespace

/* ----------------------------- Status Helpers ----------------------------- */

const char* toString(TransportStatus status) noexcept {
  switch (status) {
  case TransportStatus::OK:
    return "OK";
  case TransportStatus::CONNECT_FAILED:
    return "CONNECT_FAILED";
  case TransportStatus::TIMEOUT:
    return "TIMEOUT";
  case TransportStatus::IO_ERROR:
    return "IO_ERROR";
  case TransportStatus::BAD_RESPONSE:
    return "BAD_RESPONSE";
  case TransportStatus::BAD_URL:
    return "BAD_URL";
  case TransportStatus::TLS_FAILED:
    return "TLS_FAILED";
  }
  return "UNKNOWN";
}

/* ----------------------------- HttpClient ----------------------------- */

HttpResponse HttpClient::request(const HttpRequest& req) const {
  Url url;
  std::string error;
  if (!parseUrl(req.url, url, error)) {
    return fail(TransportStatus::BAD_URL, fmt::format("{}: {}", req.url, error));
  }

  const DeadlineClock::time_point DEADLINE = DeadlineClock::now() + req.timeout;
  const std::string WIRE = buildRequest(req.method, url, req.headers, req.body);

  try {
    asio::io_context ioc;
    tcp::resolver resolver(ioc);
    tcp::resolver::results_type endpoints;
    error_code ec;

    if (!runWithDeadline(
            ioc, DEADLINE,
            [&](auto handler) {
              resolver.async_resolve(
                  url.host, std::to_string(url.port),
                  [&endpoints, handler](const error_code& e,
                                        tcp::resolver::results_type results) mutable {
                    endpoints = std::move(results);
                    handler(e);
                  });
            },
            [&resolver] { resolver.cancel(); }, ec)) {
      return fail(TransportStatus::TIMEOUT, fmt::format("timed out resolving {}", url.host));
    }
    if (ec) {
      return fail(TransportStatus::CONNECT_FAILED,
                  fmt::format("resolve {}: {}", url.host, ec.message()));
    }

    if (!url.tls()) {
      tcp::socket socket(ioc);
      auto cancel = [&socket] {
        error_code ignored;
        socket.close(ignored);
      };
      if (!runWithDeadline(
              ioc, DEADLINE,
              [&](auto handler) { asio::async_connect(socket, endpoints, std::move(handler)); },
              cancel, ec)) {
        return fail(TransportStatus::TIMEOUT, fmt::format("timed out connecting to {}",
                                                          url.hostHeader()));
      }
      if (ec) {
        return fail(TransportStatus::CONNECT_FAILED,
                    fmt::format("connect {}: {}", url.hostHeader(), ec.message()));
      }
      return exchange(ioc, socket, DEADLINE, WIRE);
    }

    asio::ssl::context ctx(asio::ssl::context::tls_client);
    if (verifyTls_) {
      ctx.set_default_verify_paths(ec);
      if (ec) {
        return fail(TransportStatus::TLS_FAILED, "trust store: " + ec.message());
      }
    }
    asio::ssl::stream<tcp::socket> stream(ioc, ctx);
    if (verifyTls_) {
      stream.set_verify_mode(asio::ssl::verify_peer);
      stream.set_verify_callback(asio::ssl::host_name_verification(url.host));
    } else {
      stream.set_verify_mode(asio::ssl::verify_none);
    }
    if (SSL_set_tlsext_host_name(stream.native_handle(), url.host.c_str()) != 1) {
      return fail(TransportStatus::TLS_FAILED, "cannot set SNI host name");
    }

    auto cancel = [&stream] {
      error_code ignored;
      stream.lowest_layer().close(ignored);
    };
    if (!runWithDeadline(
            ioc, DEADLINE,
            [&](auto handler) {
              asio::async_connect(stream.lowest_layer(), endpoints, std::move(handler));
            },
            cancel, ec)) {
      return fail(TransportStatus::TIMEOUT,
                  fmt::format("timed out connecting to {}", url.hostHeader()));
    }
    if (ec) {
      return fail(TransportStatus::CONNECT_FAILED,
                  fmt::format("connect {}: {}", url.hostHeader(), ec.message()));
    }

    if (!runWithDeadline(
            ioc, DEADLINE,
            [&](auto handler) {
              stream.async_handshake(asio::ssl::stream_base::client, std::move(handler));
            },
            cancel, ec)) {
      return fail(TransportStatus::TIMEOUT, "timed out in TLS handshake");
    }
    if (ec) {
      return fail(TransportStatus::TLS_FAILED, "handshake: " + ec.message());
    }
    return exchange(ioc, stream, DEADLINE, WIRE);
  } catch (const boost::system::system_error& ex) {
    vigil::helpers::logging::get("http")->debug("event=http_client_error url={} error={}",
                                                req.url, ex.what());
    return fail(TransportStatus::IO_ERROR, ex.what());
  }
}

HttpResponse HttpClient::postJson(const std::string& url, const std::string& body,
                                  std::chrono::milliseconds timeout,
                                  const HeaderList& extraHeaders) const {
  HttpRequest req{};
  req.method = "POST";
  req.url = url;
  req.body = body;
  req.timeout = timeout;
  req.headers.emplace_back("Content-Type", "application/json");
  req.headers.emplace_back("User-Agent", "vigil/1.0");
  for (const auto& h : extraHeaders) {
    req.headers.push_back(h);
  }
  return request(req);
}

} // namespace transport

} // namespace vigil
