#ifndef VIGIL_TRANSPORT_TEST_SMTP_SERVER_HPP
#define VIGIL_TRANSPORT_TEST_SMTP_SERVER_HPP
/**
 * @file TestSmtpServer.hpp
 * @brief Loopback SMTP responder for client and email channel tests.
 *
 * Speaks just enough ESMTP (EHLO, AUTH LOGIN, MAIL, RCPT, DATA, QUIT) and
 * records every client line. STARTTLS is always refused.
 */

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

#include <atomic>
#include <cstdint>
#include <mutex>
#include <set>
#include <string>
#include <thread>
#include <vector>

namespace vigil {

namespace transport {

namespace test {

class TestSmtpServer {
public:
  /// @param password Expected AUTH LOGIN password (base64-encoded form).
  /// @param rejectRecipients Addresses answered with 550.
  explicit TestSmtpServer(std::string passwordB64 = {}, std::set<std::string> rejectRecipients = {})
      : passwordB64_(std::move(passwordB64)), reject_(std::move(rejectRecipients)) {
    fd_ = ::socket(AF_INET, SOCK_STREAM | SOCK_CLOEXEC, 0);
    const int ONE = 1;
    ::setsockopt(fd_, SOL_SOCKET, SO_REUSEADDR, &ONE, sizeof(ONE));
    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
    ::bind(fd_, reinterpret_cast<sockaddr*>(&addr), sizeof(addr));
    ::listen(fd_, 8);
    socklen_t len = sizeof(addr);
    ::getsockname(fd_, reinterpret_cast<sockaddr*>(&addr), &len);
    port_ = ntohs(addr.sin_port);
    thread_ = std::thread([this] { loop(); });
  }

  ~TestSmtpServer() {
    ::shutdown(fd_, SHUT_RDWR);
    ::close(fd_);
    thread_.join();
  }

  [[nodiscard]] std::uint16_t port() const noexcept { return port_; }

  /// Client lines, CRLF stripped.
  [[nodiscard]] std::vector<std::string> transcript() {
    std::lock_guard<std::mutex> lock(mtx_);
    return lines_;
  }

  /// DATA payloads (without the terminating dot).
  [[nodiscard]] std::vector<std::string> messages() {
    std::lock_guard<std::mutex> lock(mtx_);
    return messages_;
  }

private:
  void loop() {
    for (;;) {
      const int CFD = ::accept4(fd_, nullptr, nullptr, SOCK_CLOEXEC);
      if (CFD < 0) {
        return;
      }
      serve(CFD);
      ::close(CFD);
    }
  }

  void serve(int cfd) {
    std::string pending;
    reply(cfd, "220 test.local ESMTP\r\n");
    enum class Mode { COMMAND, AUTH_USER, AUTH_PASS, DATA } mode = Mode::COMMAND;
    std::string data;
    std::string line;
    while (readLine(cfd, pending, line)) {
      {
        std::lock_guard<std::mutex> lock(mtx_);
        lines_.push_back(line);
      }
      if (mode == Mode::DATA) {
        if (line == ".") {
          {
            std::lock_guard<std::mutex> lock(mtx_);
            messages_.push_back(data);
          }
          data.clear();
          mode = Mode::COMMAND;
          reply(cfd, "250 2.0.0 queued\r\n");
        } else {
          data += line + "\r\n";
        }
        continue;
      }
      if (mode == Mode::AUTH_USER) {
        mode = Mode::AUTH_PASS;
        reply(cfd, "334 UGFzc3dvcmQ6\r\n");
        continue;
      }
      if (mode == Mode::AUTH_PASS) {
        mode = Mode::COMMAND;
        reply(cfd, line == passwordB64_ ? "235 2.7.0 accepted\r\n" : "535 5.7.8 bad credentials\r\n");
        continue;
      }
      if (line.rfind("EHLO", 0) == 0) {
        reply(cfd, "250-test.local\r\n250-AUTH LOGIN\r\n250 8BITMIME\r\n");
      } else if (line == "STARTTLS") {
        reply(cfd, "454 4.7.0 TLS not available\r\n");
      } else if (line == "AUTH LOGIN") {
        mode = Mode::AUTH_USER;
        reply(cfd, "334 VXNlcm5hbWU6\r\n");
      } else if (line.rfind("MAIL FROM:", 0) == 0) {
        reply(cfd, "250 2.1.0 ok\r\n");
      } else if (line.rfind("RCPT TO:<", 0) == 0) {
        const std::string ADDR = line.substr(9, line.size() - 10);
        reply(cfd, reject_.count(ADDR) != 0 ? "550 5.1.1 no such user\r\n" : "250 2.1.5 ok\r\n");
      } else if (line == "DATA") {
        mode = Mode::DATA;
        reply(cfd, "354 end with .\r\n");
      } else if (line == "QUIT") {
        reply(cfd, "221 2.0.0 bye\r\n");
        return;
      } else {
        reply(cfd, "500 5.5.1 unrecognized\r\n");
      }
    }
  }

  static bool readLine(int fd, std::string& pending, std::string& line) {
    for (;;) {
      const std::size_t EOL = pending.find("\r\n");
      if (EOL != std::string::npos) {
        line = pending.substr(0, EOL);
        pending.erase(0, EOL + 2);
        return true;
      }
      char buf[1024];
      const ssize_t N = ::recv(fd, buf, sizeof(buf), 0);
      if (N <= 0) {
        return false;
      }
      pending.append(buf, static_cast<std::size_t>(N));
    }
  }

  static void reply(int fd, const std::string& text) {
    ::send(fd, text.data(), text.size(), MSG_NOSIGNAL);
  }

  std::string passwordB64_;
  std::set<std::string> reject_;
  int fd_{-1};
  std::uint16_t port_{0};
  std::mutex mtx_;
  std::vector<std::string> lines_;
  std::vector<std::string> messages_;
  std::thread thread_;
};

} // namespace test

} // namespace transport

} // namespace vigil

#endif // VIGIL_TRANSPORT_TEST_SMTP_SERVER_HPP
