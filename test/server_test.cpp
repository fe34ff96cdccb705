#include <arpa/inet.h>
#include <gtest/gtest.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

#include <atomic>
#include <cerrno>
#include <memory>
#include <chrono>
#include <stdexcept>
#include <string>
#include <system_error>
#include <thread>
#include <vector>

#include "httpd/content_source.hpp"
#include "httpd/response.hpp"
#include "httpd/server.hpp"
#include "test_util.hpp"

using namespace std::chrono_literals;
using namespace httpd;
using namespace httpd::test;

namespace {

int ConnectLoopback(unsigned short port) {
  int fd = ::socket(AF_INET, SOCK_STREAM, 0);
  if (fd < 0) return -1;
  sockaddr_in addr{};
  addr.sin_family = AF_INET;
  addr.sin_port = htons(port);
  addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
  if (::connect(fd, reinterpret_cast<const sockaddr*>(&addr), sizeof(addr)) != 0) {
    ::close(fd);
    return -1;
  }
  SetRecvTimeout(fd, 5s);
  return fd;
}

server_config LoopbackConfig(int workers) {
  server_config config;
  config.host = "127.0.0.1";
  config.port = 0;
  config.workers = workers;
  config.read_timeout = 2s;
  config.write_timeout = 2s;
  return config;
}

// Listener on an ephemeral port with its accept loop on a background thread
class ServerTest : public ::testing::TestWithParam<int> {
 protected:
  void SetUp() override {
    source.add("/index.html", "<p>index</p>");
    srv = std::make_unique<server>(LoopbackConfig(GetParam()), source);
    loop = std::thread([this] { srv->serve_forever(); });
  }

  void TearDown() override {
    srv->stop();
    loop.join();
    srv.reset();
  }

  void WaitForIdle() {
    auto deadline = std::chrono::steady_clock::now() + 5s;
    while (srv->live_connections() != 0 && std::chrono::steady_clock::now() < deadline) {
      std::this_thread::sleep_for(10ms);
    }
  }

  memory_source source;
  std::unique_ptr<server> srv;
  std::thread loop;
};

}  // namespace

TEST_P(ServerTest, ServesOverTcp) {
  int fd = ConnectLoopback(srv->port());
  ASSERT_GE(fd, 0);
  ASSERT_TRUE(SendAll(fd, "GET /index.html HTTP/1.1\r\nHost: x\r\n\r\n"));
  auto r = parse_response(ReadResponse(fd));
  EXPECT_EQ(r.code, 200);
  EXPECT_EQ(r.body, "<p>index</p>");

  ASSERT_TRUE(SendAll(fd, "GET /missing HTTP/1.1\r\nHost: x\r\nConnection: close\r\n\r\n"));
  auto missing = parse_response(ReadResponse(fd));
  EXPECT_EQ(missing.code, 404);
  EXPECT_TRUE(ClosedByPeer(fd));
  ::close(fd);

  WaitForIdle();
  EXPECT_EQ(srv->live_connections(), 0U);
  EXPECT_EQ(srv->total_connections(), 1U);
}

TEST_P(ServerTest, ConcurrentClientsAreIndependent) {
  constexpr int kClients = 16;
  std::atomic<int> ok{0};
  std::vector<std::thread> clients;
  for (int i = 0; i < kClients; ++i) {
    clients.emplace_back([&, i] {
      int fd = ConnectLoopback(srv->port());
      if (fd < 0) return;
      // Half the clients send garbage; their errors must not leak into the others
      std::string request = i % 2 == 0 ? "GET /index.html HTTP/1.1\r\nConnection: close\r\n\r\n" : "NONSENSE\r\n";
      if (SendAll(fd, request)) {
        try {
          auto r = parse_response(ReadResponse(fd));
          if (r.code == (i % 2 == 0 ? 200 : 400)) ok++;
        } catch (const std::exception& err) {
          ADD_FAILURE() << "client " << i << ": " << err.what();
        }
      }
      ::close(fd);
    });
  }
  for (auto& t : clients) t.join();
  EXPECT_EQ(ok.load(), kClients);

  WaitForIdle();
  EXPECT_EQ(srv->total_connections(), static_cast<std::size_t>(kClients));
}

TEST_P(ServerTest, SlowClientAndFastClient) {
  int slow = ConnectLoopback(srv->port());
  ASSERT_GE(slow, 0);
  ASSERT_TRUE(SendAll(slow, "GET /index.html HTTP/1.1\r\n"));
  // Let the slow connection reach its worker first
  std::this_thread::sleep_for(50ms);

  int fast = ConnectLoopback(srv->port());
  ASSERT_GE(fast, 0);
  ASSERT_TRUE(SendAll(fast, "GET /index.html HTTP/1.1\r\nConnection: close\r\n\r\n"));

  if (GetParam() == 1) {
    // The only pooled worker is pinned by the slow connection; the fast one waits in the queue
    SetRecvTimeout(fast, 300ms);
    EXPECT_TRUE(ReadResponse(fast).empty());
    SetRecvTimeout(fast, 5s);

    ASSERT_TRUE(SendAll(slow, "Connection: close\r\n\r\n"));
    EXPECT_EQ(parse_response(ReadResponse(slow)).code, 200);
    ::close(slow);

    EXPECT_EQ(parse_response(ReadResponse(fast)).code, 200);
    ::close(fast);
    return;
  }

  // Otherwise the slow connection does not hold up the fast one
  EXPECT_EQ(parse_response(ReadResponse(fast)).code, 200);
  ::close(fast);

  ASSERT_TRUE(SendAll(slow, "Connection: close\r\n\r\n"));
  EXPECT_EQ(parse_response(ReadResponse(slow)).code, 200);
  ::close(slow);
}

// 0: thread per connection, 1 and 4: bounded pools
INSTANTIATE_TEST_SUITE_P(Dispatch, ServerTest, ::testing::Values(0, 1, 4));

TEST(Server, BindFailureIsFatal) {
  memory_source source;
  server first{LoopbackConfig(0), source};
  auto config = LoopbackConfig(0);
  config.port = first.port();
  EXPECT_THROW((server{config, source}), std::system_error);
}

TEST(Server, RejectsBadBindAddress) {
  memory_source source;
  auto config = LoopbackConfig(0);
  config.host = "not-an-address";
  EXPECT_THROW((server{config, source}), std::invalid_argument);
}

TEST(Server, AcceptBackoff) {
  EXPECT_GE(accept_backoff(EMFILE), 100ms);
  EXPECT_GE(accept_backoff(ENFILE), 100ms);
  EXPECT_GE(accept_backoff(ENOBUFS), 100ms);
  EXPECT_GT(accept_backoff(EINVAL), 0ms);
  EXPECT_EQ(accept_backoff(ECONNABORTED), 0ms);
  EXPECT_EQ(accept_backoff(EINTR), 0ms);
}

TEST(Server, StopBeforeServeReturnsImmediately) {
  memory_source source;
  server srv{LoopbackConfig(0), source};
  srv.stop();
  srv.serve_forever();
  EXPECT_EQ(srv.total_connections(), 0U);
}
