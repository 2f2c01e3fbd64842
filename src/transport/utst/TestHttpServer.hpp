#ifndef VIGIL_TRANSPORT_TEST_HTTP_SERVER_HPP
#define VIGIL_TRANSPORT_TEST_HTTP_SERVER_HPP
/**
 * @file TestHttpServer.hpp
 * @brief Scripted loopback HTTP server for client tests.
 *
 * Accepts connections on 127.0.0.1:<ephemeral>, captures each request and
 * answers with the next canned raw response (the last one repeats).
 */

#include "src/transport/inc/HttpMessage.hpp"

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace vigil {

namespace transport {

namespace test {

class TestHttpServer {
public:
  explicit TestHttpServer(std::vector<std::string> responses,
                          std::chrono::milliseconds responseDelay = std::chrono::milliseconds(0))
      : responses_(std::move(responses)), delay_(responseDelay) {
    fd_ = ::socket(AF_INET, SOCK_STREAM | SOCK_CLOEXEC, 0);
    const int ONE = 1;
    ::setsockopt(fd_, SOL_SOCKET, SO_REUSEADDR, &ONE, sizeof(ONE));
    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
    addr.sin_port = 0;
    ::bind(fd_, reinterpret_cast<sockaddr*>(&addr), sizeof(addr));
    ::listen(fd_, 16);
    socklen_t len = sizeof(addr);
    ::getsockname(fd_, reinterpret_cast<sockaddr*>(&addr), &len);
    port_ = ntohs(addr.sin_port);
    thread_ = std::thread([this] { loop(); });
  }

  ~TestHttpServer() {
    stop_.store(true);
    ::shutdown(fd_, SHUT_RDWR);
    ::close(fd_);
    thread_.join();
  }

  [[nodiscard]] std::uint16_t port() const noexcept { return port_; }

  [[nodiscard]] std::string url(const std::string& path = "/ingest") const {
    return "http://127.0.0.1:" + std::to_string(port_) + path;
  }

  [[nodiscard]] std::vector<std::string> requests() {
    std::lock_guard<std::mutex> lock(mtx_);
    return requests_;
  }

private:
  void loop() {
    std::size_t served = 0;
    while (!stop_.load()) {
      const int CFD = ::accept4(fd_, nullptr, nullptr, SOCK_CLOEXEC);
      if (CFD < 0) {
        return;
      }
      std::string req = readRequest(CFD);
      {
        std::lock_guard<std::mutex> lock(mtx_);
        requests_.push_back(req);
      }
      if (delay_.count() > 0) {
        std::this_thread::sleep_for(delay_);
      }
      const std::string& RESP =
          responses_[served < responses_.size() ? served : responses_.size() - 1];
      ++served;
      std::size_t off = 0;
      while (off < RESP.size()) {
        const ssize_t N = ::send(CFD, RESP.data() + off, RESP.size() - off, MSG_NOSIGNAL);
        if (N <= 0) {
          break;
        }
        off += static_cast<std::size_t>(N);
      }
      ::close(CFD);
    }
  }

  static std::string readRequest(int fd) {
    std::string data;
    char buf[4096];
    for (;;) {
      const std::size_t HEAD_END = findHeaderEnd(data);
      if (HEAD_END != std::string::npos) {
        RequestHead head;
        if (!parseRequestHead(std::string_view(data).substr(0, HEAD_END - 4), head)) {
          return data;
        }
        const std::string* cl = findHeader(head.headers, "Content-Length");
        const std::size_t WANT = (cl == nullptr) ? 0 : std::stoul(*cl);
        if (data.size() >= HEAD_END + WANT) {
          return data;
        }
      }
      const ssize_t N = ::recv(fd, buf, sizeof(buf), 0);
      if (N <= 0) {
        return data;
      }
      data.append(buf, static_cast<std::size_t>(N));
    }
  }

  std::vector<std::string> responses_;
  std::chrono::milliseconds delay_;
  int fd_{-1};
  std::uint16_t port_{0};
  std::atomic<bool> stop_{false};
  std::mutex mtx_;
  std::vector<std::string> requests_;
  std::thread thread_;
};

} // namespace test

} // namespace transport

} // namespace vigil

#endif // VIGIL_TRANSPORT_TEST_HTTP_SERVER_HPP
