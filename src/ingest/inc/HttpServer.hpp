#ifndef VIGIL_INGEST_HTTP_SERVER_HPP
#define VIGIL_INGEST_HTTP_SERVER_HPP
/**
 * @file HttpServer.hpp
 * @brief Minimal HTTP/1.1 server: one acceptor thread, a worker pool for requests.
 *
 * Every connection carries exactly one request and is closed after the reply.
 * Workers read with SO_RCVTIMEO/SO_SNDTIMEO so a stalled client frees its
 * thread after ioTimeout.
 */

#include "src/transport/inc/HttpMessage.hpp"

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/thread_pool.hpp>

#include <spdlog/logger.h>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

namespace vigil {

namespace ingest {

struct ServerRequest {
  transport::RequestHead head{};
  std::string body{};
};

struct ServerReply {
  int status{200};
  std::string contentType{"application/json"};
  std::string body{};
};

/// Route a parsed request to a reply. Must not throw.
using RequestHandler = std::function<ServerReply(const ServerRequest&)>;

struct ServerConfig {
  std::string bind{"0.0.0.0"};
  std::uint16_t port{8000};            ///< 0 picks an ephemeral port
  std::size_t threads{4};              ///< Request workers
  std::chrono::milliseconds ioTimeout{5000};
};

/// Server counters.
struct ServerStats {
  std::uint64_t connections{0};
  std::uint64_t requests{0};   ///< Requests routed to the handler
  std::uint64_t badRequests{0}; ///< Unparseable or oversized requests
};

class HttpServer {
public:
  HttpServer(ServerConfig config, RequestHandler handler);
  ~HttpServer();

  HttpServer(const HttpServer&) = delete;
  HttpServer& operator=(const HttpServer&) = delete;

  /**
   * @brief Bind, listen and start accepting.
   * @param error Bind/listen failure text.
   */
  [[nodiscard]] bool start(std::string& error);

  /// @brief Stop accepting and wait for in-flight requests. Idempotent.
  void stop();

  /// @brief Bound port (useful with port 0).
  [[nodiscard]] std::uint16_t port() const noexcept { return boundPort_.load(); }

  [[nodiscard]] ServerStats stats() const noexcept;

private:
  void acceptNext();
  void handle(boost::asio::ip::tcp::socket socket);

  ServerConfig config_;
  RequestHandler handler_;
  boost::asio::io_context ioc_;
  boost::asio::ip::tcp::acceptor acceptor_;
  std::unique_ptr<boost::asio::thread_pool> pool_;
  std::thread acceptThread_;
  std::mutex lifecycleMtx_;
  std::atomic<std::uint16_t> boundPort_{0};

  std::atomic<std::uint64_t> connections_{0};
  std::atomic<std::uint64_t> requests_{0};
  std::atomic<std::uint64_t> badRequests_{0};

  std::shared_ptr<spdlog::logger> log_;
};

/// @brief JSON reply helper.
[[nodiscard]] ServerReply jsonReply(int status, std::string body);

} // namespace ingest

} // namespace vigil

#endif // VIGIL_INGEST_HTTP_SERVER_HPP
