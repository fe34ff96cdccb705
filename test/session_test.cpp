#include <gtest/gtest.h>
#include <sys/socket.h>
#include <unistd.h>

#include <chrono>
#include <memory>
#include <string>
#include <thread>

#include "httpd/config.hpp"
#include "httpd/content_source.hpp"
#include "httpd/encoding.hpp"
#include "httpd/resolver.hpp"
#include "httpd/response.hpp"
#include "httpd/session.hpp"
#include "httpd/socket.hpp"
#include "test_util.hpp"

using namespace std::chrono_literals;
using namespace httpd;
using namespace httpd::test;

namespace {

// Runs a session on one end of a socketpair and talks to it through the other
class SessionTest : public ::testing::Test {
 protected:
  void SetUp() override {
    source.add("/index.html", "<html><body>hello</body></html>");
    source.add("/big.txt", std::string(20000, 'x'));
    config.read_timeout = 2s;
    config.write_timeout = 2s;
  }

  void Start() {
    int fds[2];
    ASSERT_EQ(::socketpair(AF_UNIX, SOCK_STREAM, 0, fds), 0);
    client = fds[0];
    SetRecvTimeout(client, 5s);
    res = std::make_unique<resolver>(source, config.gzip);
    worker = std::thread([this, fd = fds[1]] { session{httpd::socket{fd}, *res, config}(); });
  }

  void TearDown() override {
    if (client >= 0) ::close(client);
    if (worker.joinable()) worker.join();
  }

  response Exchange(const std::string& request, bool has_body = true) {
    EXPECT_TRUE(SendAll(client, request));
    return parse_response(ReadResponse(client, has_body), has_body);
  }

  memory_source source;
  server_config config;
  std::unique_ptr<resolver> res;
  int client = -1;
  std::thread worker;
};

}  // namespace

TEST_F(SessionTest, ServesKnownPath) {
  Start();
  auto r = Exchange("GET /index.html HTTP/1.1\r\nHost: x\r\n\r\n");
  EXPECT_EQ(r.code, 200);
  EXPECT_EQ(r.reason, "OK");
  EXPECT_EQ(r.body, "<html><body>hello</body></html>");
  EXPECT_EQ(r.headers.get("Content-Length"), std::to_string(r.body.size()));
  EXPECT_EQ(r.headers.get("Connection"), "keep-alive");
  EXPECT_EQ(r.headers.get("Server"), "httpd");
  EXPECT_TRUE(r.headers.contains("Date"));
}

TEST_F(SessionTest, Http11KeepsConnectionOpen) {
  Start();
  EXPECT_EQ(Exchange("GET /index.html HTTP/1.1\r\nHost: x\r\n\r\n").code, 200);
  auto missing = Exchange("GET /missing HTTP/1.1\r\nHost: x\r\n\r\n");
  EXPECT_EQ(missing.code, 404);
  EXPECT_EQ(missing.reason, "Not Found");
  EXPECT_EQ(missing.headers.get("Connection"), "keep-alive");
  // A resolver error does not cost the connection
  EXPECT_EQ(Exchange("GET /index.html HTTP/1.1\r\n\r\n").code, 200);
}

TEST_F(SessionTest, ConnectionCloseIsHonoured) {
  Start();
  auto r = Exchange("GET /index.html HTTP/1.1\r\nHost: x\r\nConnection: close\r\n\r\n");
  EXPECT_EQ(r.code, 200);
  EXPECT_EQ(r.headers.get("Connection"), "close");
  EXPECT_TRUE(ClosedByPeer(client));
}

TEST_F(SessionTest, Http10ClosesByDefault) {
  Start();
  auto r = Exchange("GET /index.html HTTP/1.0\r\n\r\n");
  EXPECT_EQ(r.code, 200);
  EXPECT_EQ(r.headers.get("Connection"), "close");
  EXPECT_TRUE(ClosedByPeer(client));
}

TEST_F(SessionTest, Http10KeepAliveOnRequest) {
  Start();
  auto r = Exchange("GET /index.html HTTP/1.0\r\nConnection: keep-alive\r\n\r\n");
  EXPECT_EQ(r.headers.get("Connection"), "keep-alive");
  EXPECT_EQ(Exchange("HEAD /index.html HTTP/1.0\r\nConnection: keep-alive\r\n\r\n", false).code, 200);
}

TEST_F(SessionTest, TruncatedRequestLineIs400AndCloses) {
  Start();
  auto r = Exchange("GET /\r\n");
  EXPECT_EQ(r.code, 400);
  EXPECT_EQ(r.reason, "Bad Request");
  EXPECT_EQ(r.headers.get("Connection"), "close");
  EXPECT_TRUE(ClosedByPeer(client));
}

TEST_F(SessionTest, MalformedHeaderIs400) {
  Start();
  auto r = Exchange("GET / HTTP/1.1\r\nthis is not a header\r\n\r\n");
  EXPECT_EQ(r.code, 400);
  EXPECT_TRUE(ClosedByPeer(client));
}

TEST_F(SessionTest, OversizedHeadIsRejected) {
  config.limits.max_header_bytes = 256;
  Start();
  auto r = Exchange("GET / HTTP/1.1\r\nX-Filler: " + std::string(1024, 'f') + "\r\n\r\n");
  EXPECT_EQ(r.code, 431);
  EXPECT_TRUE(ClosedByPeer(client));
}

TEST_F(SessionTest, UnsupportedMethodIs405AndKeepsConnection) {
  Start();
  auto r = Exchange("DELETE /index.html HTTP/1.1\r\n\r\n");
  EXPECT_EQ(r.code, 405);
  EXPECT_EQ(r.headers.get("Allow"), "GET, HEAD");
  EXPECT_EQ(r.headers.get("Connection"), "keep-alive");
  EXPECT_EQ(Exchange("GET /index.html HTTP/1.1\r\n\r\n").code, 200);
}

TEST_F(SessionTest, RequestBodyIsConsumed) {
  Start();
  EXPECT_EQ(Exchange("POST /index.html HTTP/1.1\r\nContent-Length: 4\r\n\r\nabcd").code, 405);
  // The body bytes were not mistaken for the next request line
  EXPECT_EQ(Exchange("GET /index.html HTTP/1.1\r\n\r\n").code, 200);
}

TEST_F(SessionTest, FragmentedRequest) {
  Start();
  ASSERT_TRUE(SendAll(client, "GET /inde"));
  std::this_thread::sleep_for(20ms);
  ASSERT_TRUE(SendAll(client, "x.html HTTP/1.1\r\nHo"));
  std::this_thread::sleep_for(20ms);
  ASSERT_TRUE(SendAll(client, "st: x\r\n\r\n"));
  auto r = parse_response(ReadResponse(client));
  EXPECT_EQ(r.code, 200);
}

TEST_F(SessionTest, HeadHasHeadersOnly) {
  Start();
  auto r = Exchange("HEAD /big.txt HTTP/1.1\r\n\r\n", false);
  EXPECT_EQ(r.code, 200);
  EXPECT_EQ(r.headers.get("Content-Length"), "20000");
  // Nothing follows the head: the next response starts right away
  EXPECT_EQ(Exchange("GET /index.html HTTP/1.1\r\n\r\n").code, 200);
}

TEST_F(SessionTest, GzipWhenAccepted) {
  Start();
  auto r = Exchange("GET /big.txt HTTP/1.1\r\nAccept-Encoding: gzip\r\n\r\n");
  EXPECT_EQ(r.code, 200);
  EXPECT_EQ(r.headers.get("Content-Encoding"), "gzip");
  EXPECT_EQ(gzip_decompress(r.body), std::string(20000, 'x'));
}

TEST_F(SessionTest, HeadAndGetShareHeadersUnderGzip) {
  Start();
  auto get = Exchange("GET /big.txt HTTP/1.1\r\nAccept-Encoding: gzip\r\n\r\n");
  auto head = Exchange("HEAD /big.txt HTTP/1.1\r\nAccept-Encoding: gzip\r\n\r\n", false);
  EXPECT_EQ(head.code, 200);
  EXPECT_TRUE(head.body.empty());
  EXPECT_EQ(head.headers.get("Content-Encoding"), get.headers.get("Content-Encoding"));
  EXPECT_EQ(head.headers.get("Content-Length"), get.headers.get("Content-Length"));
  EXPECT_EQ(head.headers.get("Vary"), "Accept-Encoding");
  EXPECT_EQ(head.headers.get("Content-Length"), std::to_string(get.body.size()));
}

TEST_F(SessionTest, GzipRefusedWithZeroQuality) {
  Start();
  auto r = Exchange("GET /big.txt HTTP/1.1\r\nAccept-Encoding: gzip;q=0, identity\r\n\r\n");
  EXPECT_FALSE(r.headers.contains("Content-Encoding"));
  EXPECT_EQ(r.body.size(), 20000U);
}

TEST_F(SessionTest, GzipCanBeDisabled) {
  config.gzip = false;
  Start();
  auto r = Exchange("GET /big.txt HTTP/1.1\r\nAccept-Encoding: gzip\r\n\r\n");
  EXPECT_FALSE(r.headers.contains("Content-Encoding"));
  EXPECT_EQ(r.body.size(), 20000U);
}

TEST_F(SessionTest, IdleConnectionTimesOutWithoutResponse) {
  config.read_timeout = 200ms;
  Start();
  auto started = std::chrono::steady_clock::now();
  EXPECT_TRUE(ClosedByPeer(client));
  EXPECT_LT(std::chrono::steady_clock::now() - started, 4s);
}

TEST_F(SessionTest, IdleAfterKeepAliveTimesOut) {
  config.read_timeout = 200ms;
  Start();
  EXPECT_EQ(Exchange("GET /index.html HTTP/1.1\r\n\r\n").code, 200);
  EXPECT_TRUE(ClosedByPeer(client));
}

TEST_F(SessionTest, PeerDisconnectMidRequestEndsSession) {
  Start();
  ASSERT_TRUE(SendAll(client, "GET /index.html HTTP/1.1\r\nHost"));
  ::close(client);
  client = -1;
  worker.join();
}
