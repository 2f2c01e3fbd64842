/**
 * @file HttpClient_uTest.cpp
 * @brief Unit tests for vigil::transport::HttpClient against a loopback server.
 */

#include "src/transport/inc/HttpClient.hpp"
#include "src/transport/utst/TestHttpServer.hpp"

#include <gtest/gtest.h>

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

#include <chrono>

using vigil::transport::HttpClient;
using vigil::transport::HttpRequest;
using vigil::transport::HttpResponse;
using vigil::transport::RequestHead;
using vigil::transport::TransportStatus;
using vigil::transport::test::TestHttpServer;
using namespace std::chrono_literals;

namespace {

const std::string ACCEPTED =
    "HTTP/1.1 202 Accepted\r\nContent-Type: application/json\r\nContent-Length: 15\r\n"
    "Connection: close\r\n\r\n{\"status\":\"ok\"}";

/// Port that was bound then released, so nothing listens on it.
std::uint16_t closedPort() {
  const int FD = ::socket(AF_INET, SOCK_STREAM, 0);
  sockaddr_in addr{};
  addr.sin_family = AF_INET;
  addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
  ::bind(FD, reinterpret_cast<sockaddr*>(&addr), sizeof(addr));
  socklen_t len = sizeof(addr);
  ::getsockname(FD, reinterpret_cast<sockaddr*>(&addr), &len);
  ::close(FD);
  return ntohs(addr.sin_port);
}

} // namespace

/* ----------------------------- Success ----------------------------- */

/** @test A POST reaches the server with framing headers and gets the status back. */
TEST(HttpClientTest, PostJsonAccepted) {
  TestHttpServer server({ACCEPTED});
  const HttpClient CLIENT(false);

  const HttpResponse R = CLIENT.postJson(server.url(), R"({"hostname":"h1"})", 2000ms,
                                         {{"X-Api-Key", "secret"}});
  ASSERT_EQ(R.status, TransportStatus::OK) << R.error;
  EXPECT_EQ(R.statusCode, 202);
  EXPECT_TRUE(R.success());
  EXPECT_EQ(R.body, "{\"status\":\"ok\"}");

  const auto REQS = server.requests();
  ASSERT_EQ(REQS.size(), 1U);
  const std::size_t END = vigil::transport::findHeaderEnd(REQS[0]);
  ASSERT_NE(END, std::string::npos);
  RequestHead head;
  ASSERT_TRUE(vigil::transport::parseRequestHead(std::string_view(REQS[0]).substr(0, END - 4),
                                                 head));
  EXPECT_EQ(head.method, "POST");
  EXPECT_EQ(head.path, "/ingest");
  ASSERT_NE(vigil::transport::findHeader(head.headers, "host"), nullptr);
  ASSERT_NE(vigil::transport::findHeader(head.headers, "content-length"), nullptr);
  EXPECT_EQ(*vigil::transport::findHeader(head.headers, "content-length"), "17");
  ASSERT_NE(vigil::transport::findHeader(head.headers, "content-type"), nullptr);
  EXPECT_EQ(*vigil::transport::findHeader(head.headers, "content-type"), "application/json");
  ASSERT_NE(vigil::transport::findHeader(head.headers, "x-api-key"), nullptr);
  EXPECT_EQ(REQS[0].substr(END), R"({"hostname":"h1"})");
}

/** @test Server errors are a complete response, not a transport failure. */
TEST(HttpClientTest, ServerErrorIsTransportOk) {
  TestHttpServer server({"HTTP/1.1 503 Service Unavailable\r\nContent-Length: 0\r\n\r\n"});
  const HttpClient CLIENT(false);
  const HttpResponse R = CLIENT.postJson(server.url(), "{}", 2000ms);
  EXPECT_EQ(R.status, TransportStatus::OK);
  EXPECT_EQ(R.statusCode, 503);
  EXPECT_FALSE(R.success());
}

/** @test Chunked bodies are decoded. */
TEST(HttpClientTest, ChunkedResponse) {
  TestHttpServer server({"HTTP/1.1 200 OK\r\nTransfer-Encoding: chunked\r\n\r\n"
                         "4\r\nWiki\r\n5\r\npedia\r\n0\r\n\r\n"});
  const HttpClient CLIENT(false);
  HttpRequest req{};
  req.method = "GET";
  req.url = server.url("/health");
  req.timeout = 2000ms;
  const HttpResponse R = CLIENT.request(req);
  ASSERT_EQ(R.status, TransportStatus::OK) << R.error;
  EXPECT_EQ(R.statusCode, 200);
  EXPECT_EQ(R.body, "Wikipedia");
}

/* ----------------------------- Failures ----------------------------- */

/** @test Nothing listening yields CONNECT_FAILED. */
TEST(HttpClientTest, ConnectionRefused) {
  const HttpClient CLIENT(false);
  const std::string URL = "http://127.0.0.1:" + std::to_string(closedPort()) + "/ingest";
  const HttpResponse R = CLIENT.postJson(URL, "{}", 2000ms);
  EXPECT_EQ(R.status, TransportStatus::CONNECT_FAILED);
  EXPECT_FALSE(R.error.empty());
  EXPECT_FALSE(R.success());
}

/** @test A server slower than the deadline yields TIMEOUT near the deadline. */
TEST(HttpClientTest, DeadlineExceeded) {
  TestHttpServer server({ACCEPTED}, 600ms);
  const HttpClient CLIENT(false);

  const auto T0 = std::chrono::steady_clock::now();
  const HttpResponse R = CLIENT.postJson(server.url(), "{}", 150ms);
  const auto ELAPSED = std::chrono::steady_clock::now() - T0;

  EXPECT_EQ(R.status, TransportStatus::TIMEOUT);
  EXPECT_GE(ELAPSED, 100ms);
  EXPECT_LT(ELAPSED, 550ms);
}

/** @test Unusable URLs are rejected before any I/O. */
TEST(HttpClientTest, BadUrl) {
  const HttpClient CLIENT(false);
  EXPECT_EQ(CLIENT.postJson("collector:8000/ingest", "{}", 500ms).status,
            TransportStatus::BAD_URL);
  EXPECT_EQ(CLIENT.postJson("ftp://host/ingest", "{}", 500ms).status, TransportStatus::BAD_URL);
  EXPECT_EQ(CLIENT.postJson("http:///ingest", "{}", 500ms).status, TransportStatus::BAD_URL);
}

/** @test Garbage instead of HTTP yields BAD_RESPONSE. */
TEST(HttpClientTest, MalformedResponse) {
  TestHttpServer server({"this is not http\r\n\r\n"});
  const HttpClient CLIENT(false);
  EXPECT_EQ(CLIENT.postJson(server.url(), "{}", 2000ms).status, TransportStatus::BAD_RESPONSE);
}
