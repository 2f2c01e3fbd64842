/**
 * @file HttpMessage_uTest.cpp
 * @brief Unit tests for vigil::transport HTTP framing helpers.
 */

#include "src/transport/inc/HttpMessage.hpp"

#include <gtest/gtest.h>

#include <string>

using vigil::transport::buildRequest;
using vigil::transport::buildResponse;
using vigil::transport::decodeChunked;
using vigil::transport::findHeader;
using vigil::transport::findHeaderEnd;
using vigil::transport::parseRequestHead;
using vigil::transport::parseResponse;
using vigil::transport::parseUrl;
using vigil::transport::queryParam;
using vigil::transport::RequestHead;
using vigil::transport::ResponseMessage;
using vigil::transport::Url;

/* ----------------------------- parseUrl ----------------------------- */

/** @test Scheme defaults and explicit ports. */
TEST(ParseUrlTest, SchemesAndPorts) {
  Url u;
  std::string err;
  ASSERT_TRUE(parseUrl("http://collector.example:8000/ingest", u, err)) << err;
  EXPECT_EQ(u.host, "collector.example");
  EXPECT_EQ(u.port, 8000);
  EXPECT_EQ(u.target, "/ingest");
  EXPECT_FALSE(u.tls());

  ASSERT_TRUE(parseUrl("HTTPS://hooks.slack.com/services/T0/B0/x", u, err)) << err;
  EXPECT_TRUE(u.tls());
  EXPECT_EQ(u.port, 443);
  EXPECT_EQ(u.hostHeader(), "hooks.slack.com");

  ASSERT_TRUE(parseUrl("http://[::1]:9000?x=1", u, err)) << err;
  EXPECT_EQ(u.host, "::1");
  EXPECT_EQ(u.target, "/?x=1");
  EXPECT_EQ(u.hostHeader(), "[::1]:9000");

  ASSERT_TRUE(parseUrl("http://localhost", u, err));
  EXPECT_EQ(u.target, "/");
}

/** @test Bad URLs are refused with a reason. */
TEST(ParseUrlTest, Rejects) {
  Url u;
  std::string err;
  EXPECT_FALSE(parseUrl("ftp://x/", u, err));
  EXPECT_FALSE(parseUrl("collector:8000", u, err));
  EXPECT_FALSE(parseUrl("http://:80/", u, err));
  EXPECT_FALSE(parseUrl("http://host:99999/", u, err));
  EXPECT_FALSE(parseUrl("http://host:abc/", u, err));
  EXPECT_FALSE(err.empty());
}

/* ----------------------------- Requests ----------------------------- */

/** @test Request line, query split and headers. */
TEST(RequestHeadTest, Parses) {
  RequestHead h;
  ASSERT_TRUE(parseRequestHead("GET /metrics?host=h1&since=2024 HTTP/1.1\r\n"
                               "Host: x\r\ncontent-length: 0",
                               h));
  EXPECT_EQ(h.method, "GET");
  EXPECT_EQ(h.path, "/metrics");
  EXPECT_EQ(h.query, "host=h1&since=2024");
  ASSERT_NE(findHeader(h.headers, "Content-Length"), nullptr);
  EXPECT_EQ(*findHeader(h.headers, "CONTENT-LENGTH"), "0");
}

/** @test Garbage request lines are refused. */
TEST(RequestHeadTest, Rejects) {
  RequestHead h;
  EXPECT_FALSE(parseRequestHead("GARBAGE", h));
  EXPECT_FALSE(parseRequestHead("GET /x SPDY/3", h));
  EXPECT_FALSE(parseRequestHead("GET /x HTTP/1.1\r\nno colon here", h));
}

/** @test Built requests carry Host and Content-Length. */
TEST(RequestHeadTest, BuildRequest) {
  Url u;
  std::string err;
  ASSERT_TRUE(parseUrl("http://h:81/ingest", u, err));
  const std::string WIRE = buildRequest("POST", u, {{"Content-Type", "application/json"}}, "{}");
  EXPECT_EQ(WIRE.rfind("POST /ingest HTTP/1.1\r\nHost: h:81\r\n", 0), 0U);
  EXPECT_NE(WIRE.find("Content-Length: 2\r\n"), std::string::npos);
  EXPECT_EQ(WIRE.substr(findHeaderEnd(WIRE)), "{}");
}

/* ----------------------------- Responses ----------------------------- */

/** @test Content-Length bodies are cut to length. */
TEST(ResponseTest, ContentLength) {
  ResponseMessage m;
  std::string err;
  ASSERT_TRUE(parseResponse("HTTP/1.1 202 Accepted\r\nContent-Length: 5\r\n\r\nhello", m, err))
      << err;
  EXPECT_EQ(m.statusCode, 202);
  EXPECT_EQ(m.reason, "Accepted");
  EXPECT_EQ(m.body, "hello");
}

/** @test Truncated bodies are an error. */
TEST(ResponseTest, Truncated) {
  ResponseMessage m;
  std::string err;
  EXPECT_FALSE(parseResponse("HTTP/1.1 200 OK\r\nContent-Length: 10\r\n\r\nabc", m, err));
  EXPECT_FALSE(parseResponse("HTTP/1.1 200 OK\r\nContent", m, err));
  EXPECT_FALSE(parseResponse("SMTP 250 ok\r\n\r\n", m, err));
}

/** @test Chunked bodies are decoded. */
TEST(ResponseTest, Chunked) {
  ResponseMessage m;
  std::string err;
  ASSERT_TRUE(parseResponse("HTTP/1.1 200 OK\r\nTransfer-Encoding: chunked\r\n\r\n"
                            "4\r\nWiki\r\n5;ext=1\r\npedia\r\n0\r\n\r\n",
                            m, err))
      << err;
  EXPECT_EQ(m.body, "Wikipedia");
  EXPECT_FALSE(decodeChunked("5\r\nabc").has_value());
}

/** @test Responses without length run to end of data. */
TEST(ResponseTest, CloseDelimited) {
  ResponseMessage m;
  std::string err;
  ASSERT_TRUE(parseResponse("HTTP/1.0 200 OK\r\n\r\nok", m, err));
  EXPECT_EQ(m.body, "ok");
}

/** @test buildResponse frames the body. */
TEST(ResponseTest, BuildResponse) {
  const std::string WIRE = buildResponse(503, "application/json", "{}");
  ResponseMessage m;
  std::string err;
  ASSERT_TRUE(parseResponse(WIRE, m, err));
  EXPECT_EQ(m.statusCode, 503);
  EXPECT_EQ(m.reason, "Service Unavailable");
  EXPECT_EQ(m.body, "{}");
}

/* ----------------------------- Query ----------------------------- */

/** @test Query parameters are percent-decoded. */
TEST(QueryTest, Params) {
  const std::string Q = "host=web%2D01&since=2024-05-01T00%3A00%3A00Z&flag";
  EXPECT_EQ(queryParam(Q, "host").value_or(""), "web-01");
  EXPECT_EQ(queryParam(Q, "since").value_or(""), "2024-05-01T00:00:00Z");
  EXPECT_EQ(queryParam(Q, "flag").value_or("x"), "");
  EXPECT_FALSE(queryParam(Q, "until").has_value());
}
