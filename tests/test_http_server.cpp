#include "minitest.hpp"
#include "app/HttpServer.hpp"

#ifdef VIPERVAULT_HAVE_URING

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>
#include <atomic>
#include <chrono>
#include <stdexcept>
#include <thread>

using namespace vipervault;
using namespace std::chrono_literals;

static int open_request(uint16_t port, const std::string& request) {
  int fd = ::socket(AF_INET, SOCK_STREAM | SOCK_CLOEXEC, 0);
  if (fd < 0) throw mini::AssertionError("socket() failed");
  struct timeval tv{.tv_sec = 5, .tv_usec = 0};
  (void)::setsockopt(fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));
  struct sockaddr_in addr{};
  addr.sin_family = AF_INET;
  addr.sin_port = htons(port);
  addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
  if (::connect(fd, reinterpret_cast<struct sockaddr*>(&addr), sizeof(addr)) < 0) {
    ::close(fd);
    throw mini::AssertionError("connect() failed");
  }
  (void)::send(fd, request.data(), request.size(), MSG_NOSIGNAL);
  return fd;
}

static std::string read_reply(int fd) {
  std::string out;
  char buf[4096];
  for (;;) {
    ssize_t n = ::recv(fd, buf, sizeof(buf), 0);
    if (n <= 0) break;
    out.append(buf, static_cast<size_t>(n));
  }
  ::close(fd);
  return out;
}

static std::string roundtrip(uint16_t port, const std::string& request) {
  return read_reply(open_request(port, request));
}

static app::HttpServer::Handler echo_handler(std::atomic<int>& calls) {
  return [&calls](const http::HttpRequest& req) {
    ++calls;
    if (req.path == "/throw") throw std::runtime_error("handler exploded");
    auto r = http::HttpResponse::text(200, req.method + " " + req.param("v").value_or("-") + " " + req.peer.substr(0, 9));
    return r;
  };
}

TEST(server_serves_get) {
  std::atomic<int> calls{0};
  app::HttpServer srv(echo_handler(calls), "127.0.0.1", 0, 2);
  ASSERT_TRUE(srv.start());
  ASSERT_NE(srv.port(), 0);
  auto resp = roundtrip(srv.port(), "GET /?v=hello HTTP/1.1\r\nHost: x\r\n\r\n");
  ASSERT_TRUE(resp.starts_with("HTTP/1.1 200 OK\r\n"));
  ASSERT_TRUE(resp.ends_with("\r\n\r\nGET hello 127.0.0.1"));
  srv.stop();
  ASSERT_EQ(calls.load(), 1);
}

TEST(server_reads_post_body) {
  std::atomic<int> calls{0};
  app::HttpServer srv(echo_handler(calls), "127.0.0.1", 0, 1);
  ASSERT_TRUE(srv.start());
  auto resp = roundtrip(srv.port(), "POST / HTTP/1.1\r\n"
                                    "Content-Type: application/x-www-form-urlencoded\r\n"
                                    "Content-Length: 5\r\n\r\nv=abc");
  ASSERT_CONTAINS(resp, "POST abc");
}

TEST(server_head_omits_body) {
  std::atomic<int> calls{0};
  app::HttpServer srv(echo_handler(calls), "127.0.0.1", 0, 1);
  ASSERT_TRUE(srv.start());
  auto resp = roundtrip(srv.port(), "HEAD / HTTP/1.1\r\n\r\n");
  ASSERT_TRUE(resp.starts_with("HTTP/1.1 200 OK\r\n"));
  ASSERT_CONTAINS(resp, "Content-Length: ");
  ASSERT_TRUE(resp.ends_with("\r\n\r\n"));
}

TEST(server_rejects_garbage_and_oversize) {
  std::atomic<int> calls{0};
  app::HttpServer srv(echo_handler(calls), "127.0.0.1", 0, 1);
  ASSERT_TRUE(srv.start());
  ASSERT_TRUE(roundtrip(srv.port(), "NONSENSE\r\n\r\n").starts_with("HTTP/1.1 400 "));
  ASSERT_TRUE(roundtrip(srv.port(), "POST / HTTP/1.1\r\nContent-Length: 99999999\r\n\r\n").starts_with("HTTP/1.1 413 "));
  ASSERT_TRUE(roundtrip(srv.port(), "GET /throw HTTP/1.1\r\n\r\n").starts_with("HTTP/1.1 500 "));
  ASSERT_EQ(calls.load(), 1);
}

TEST(server_rejects_when_queue_full) {
  std::atomic<bool> entered{false};
  std::atomic<bool> release{false};
  app::HttpServer::Handler slow = [&](const http::HttpRequest&) {
    entered = true;
    while (!release.load()) std::this_thread::sleep_for(5ms);
    return http::HttpResponse::text(200, "done");
  };
  app::ServerLimits limits;
  limits.max_queue = 1;
  app::HttpServer srv(slow, "127.0.0.1", 0, 1, limits);
  ASSERT_TRUE(srv.start());

  int busy = open_request(srv.port(), "GET / HTTP/1.1\r\n\r\n");
  for (int i = 0; i < 400 && !entered.load(); ++i) std::this_thread::sleep_for(5ms);
  ASSERT_TRUE(entered.load());
  int queued = open_request(srv.port(), "GET / HTTP/1.1\r\n\r\n");

  auto rejected = roundtrip(srv.port(), "GET / HTTP/1.1\r\n\r\n");
  ASSERT_TRUE(rejected.starts_with("HTTP/1.1 503 Service Unavailable\r\n"));

  release = true;
  ASSERT_TRUE(read_reply(busy).ends_with("done"));
  ASSERT_TRUE(read_reply(queued).ends_with("done"));
  srv.stop();
}

TEST(server_bind_failure_reported) {
  std::atomic<int> calls{0};
  app::HttpServer a(echo_handler(calls), "127.0.0.1", 0, 1);
  ASSERT_TRUE(a.start());
  app::HttpServer b(echo_handler(calls), "127.0.0.1", a.port(), 1);
  ASSERT_FALSE(b.start());
  app::HttpServer c(echo_handler(calls), "not-an-address", 0, 1);
  ASSERT_FALSE(c.start());
}

#else

TEST(server_stub_refuses_to_start) {
  vipervault::app::HttpServer srv([](const vipervault::http::HttpRequest&) {
    return vipervault::http::HttpResponse::text(200, "x");
  }, "127.0.0.1", 0, 1);
  ASSERT_FALSE(srv.start());
}

#endif
