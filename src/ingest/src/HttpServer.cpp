/**
 * @file HttpServer.cpp
 * @brief Acceptor loop and blocking per-connection request handling.
 */

#include "src/ingest/inc/HttpServer.hpp"
#include "src/helpers/inc/Logging.hpp"

#include <boost/asio/post.hpp>

#include <sys/socket.h>
#include <sys/time.h>

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <exception>
#include <string_view>
#include <utility>

namespace vigil {

namespace ingest {

namespace asio = boost::asio;
using asio::ip::tcp;

namespace {

void setTimeouts(int fd, std::chrono::milliseconds timeout) {
  timeval tv{};
  tv.tv_sec = static_cast<time_t>(timeout.count() / 1000);
  tv.tv_usec = static_cast<suseconds_t>((timeout.count() % 1000) * 1000);
  (void)::setsockopt(fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));
  (void)::setsockopt(fd, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv));
}

bool sendAll(int fd, std::string_view data) {
  std::size_t off = 0;
  while (off < data.size()) {
    const ssize_t N = ::send(fd, data.data() + off, data.size() - off, MSG_NOSIGNAL);
    if (N < 0 && errno == EINTR) {
      continue;
    }
    if (N <= 0) {
      return false;
    }
    off += static_cast<std::size_t>(N);
  }
  return true;
}

enum class ReadOutcome : std::uint8_t { OK, CLOSED, TIMEOUT, MALFORMED, TOO_LARGE };

/// Read one request (head plus Content-Length body) from a blocking socket.
ReadOutcome readRequest(int fd, ServerRequest& out) {
  std::string data;
  char buf[8192];
  std::size_t headEnd = std::string::npos;
  std::size_t want = 0;
  for (;;) {
    if (headEnd == std::string::npos) {
      headEnd = transport::findHeaderEnd(data);
      if (headEnd != std::string::npos) {
        if (!transport::parseRequestHead(std::string_view(data).substr(0, headEnd - 4),
                                         out.head)) {
          return ReadOutcome::MALFORMED;
        }
        if (const std::string* cl = transport::findHeader(out.head.headers, "Content-Length")) {
          std::uint64_t n = 0;
          try {
            n = std::stoull(*cl);
          } catch (const std::exception&) {
            return ReadOutcome::MALFORMED;
          }
          if (n > transport::MAX_BODY_BYTES) {
            return ReadOutcome::TOO_LARGE;
          }
          want = static_cast<std::size_t>(n);
        }
      } else if (data.size() > transport::MAX_HEADER_BYTES) {
        return ReadOutcome::TOO_LARGE;
      }
    }
    if (headEnd != std::string::npos && data.size() >= headEnd + want) {
      out.body = data.substr(headEnd, want);
      return ReadOutcome::OK;
    }
    const ssize_t N = ::recv(fd, buf, sizeof(buf), 0);
    if (N < 0 && errno == EINTR) {
      continue;
    }
    if (N < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
      return ReadOutcome::TIMEOUT;
    }
    if (N <= 0) {
      return ReadOutcome::CLOSED;
    }
    data.append(buf, static_cast<std::size_t>(N));
  }
}

} // namespace

ServerReply jsonReply(int status, std::string body) {
  ServerReply r{};
  r.status = status;
  r.body = std::move(body);
  return r;
}

/* ----------------------------- HttpServer ----------------------------- */

HttpServer::HttpServer(ServerConfig config, RequestHandler handler)
    : config_(std::move(config)), handler_(std::move(handler)), acceptor_(ioc_),
      log_(vigil::helpers::logging::get("http")) {}

HttpServer::~HttpServer() { stop(); }

bool HttpServer::start(std::string& error) {
  std::lock_guard<std::mutex> lock(lifecycleMtx_);
  if (acceptThread_.joinable()) {
    error = "already started";
    return false;
  }

  boost::system::error_code ec;
  const asio::ip::address ADDR = asio::ip::make_address(config_.bind, ec);
  if (ec) {
    error = "bad bind address '" + config_.bind + "': " + ec.message();
    return false;
  }
  const tcp::endpoint EP(ADDR, config_.port);
  acceptor_.open(EP.protocol(), ec);
  if (!ec) {
    acceptor_.set_option(asio::socket_base::reuse_address(true), ec);
  }
  if (!ec) {
    acceptor_.bind(EP, ec);
  }
  if (!ec) {
    acceptor_.listen(asio::socket_base::max_listen_connections, ec);
  }
  if (ec) {
    error = "listen on " + config_.bind + ":" + std::to_string(config_.port) + ": " + ec.message();
    boost::system::error_code ignored;
    acceptor_.close(ignored);
    return false;
  }
  boundPort_.store(acceptor_.local_endpoint(ec).port());

  pool_ = std::make_unique<asio::thread_pool>(std::max<std::size_t>(config_.threads, 1));
  ioc_.restart();
  acceptNext();
  acceptThread_ = std::thread([this] { ioc_.run(); });
  log_->info("event=http_listening bind={} port={} threads={}", config_.bind, boundPort_.load(),
             config_.threads);
  return true;
}

void HttpServer::acceptNext() {
  acceptor_.async_accept([this](const boost::system::error_code& ec, tcp::socket socket) {
    if (ec) {
      if (ec != asio::error::operation_aborted) {
        log_->warn("event=accept_failed error=\"{}\"", ec.message());
      }
      if (!acceptor_.is_open()) {
        return;
      }
    } else {
      connections_.fetch_add(1);
      auto shared = std::make_shared<tcp::socket>(std::move(socket));
      asio::post(*pool_, [this, shared] { handle(std::move(*shared)); });
    }
    acceptNext();
  });
}

void HttpServer::stop() {
  std::lock_guard<std::mutex> lock(lifecycleMtx_);
  if (!acceptThread_.joinable()) {
    return;
  }
  asio::post(ioc_, [this] {
    boost::system::error_code ignored;
    acceptor_.close(ignored);
  });
  acceptThread_.join();
  pool_->join();
  pool_.reset();
  log_->info("event=http_stopped connections={} requests={}", connections_.load(),
             requests_.load());
}

void HttpServer::handle(tcp::socket socket) {
  const int FD = socket.native_handle();
  setTimeouts(FD, config_.ioTimeout);

  ServerRequest req{};
  ServerReply reply{};
  switch (readRequest(FD, req)) {
  case ReadOutcome::OK:
    requests_.fetch_add(1);
    try {
      reply = handler_(req);
    } catch (const std::exception& e) {
      log_->error("event=handler_failed method={} path={} error=\"{}\"", req.head.method,
                  req.head.path, e.what());
      reply = jsonReply(500, R"({"status":"error","reason":"internal error"})");
    }
    break;
  case ReadOutcome::MALFORMED:
    badRequests_.fetch_add(1);
    reply = jsonReply(400, R"({"status":"rejected","reason":"malformed HTTP request"})");
    break;
  case ReadOutcome::TOO_LARGE:
    badRequests_.fetch_add(1);
    reply = jsonReply(413, R"({"status":"rejected","reason":"request too large"})");
    break;
  case ReadOutcome::TIMEOUT:
    log_->debug("event=client_timeout timeout_ms={}", config_.ioTimeout.count());
    return;
  case ReadOutcome::CLOSED:
    return;
  }

  const std::string WIRE = transport::buildResponse(reply.status, reply.contentType, reply.body);
  if (!sendAll(FD, WIRE)) {
    log_->debug("event=reply_failed status={} error=\"{}\"", reply.status, std::strerror(errno));
  }
  log_->debug("event=http_request method={} path={} status={}", req.head.method, req.head.path,
              reply.status);
}

ServerStats HttpServer::stats() const noexcept {
  ServerStats s{};
  s.connections = connections_.load();
  s.requests = requests_.load();
  s.badRequests = badRequests_.load();
  return s;
}

} // namespace ingest

} // namespace vigil
