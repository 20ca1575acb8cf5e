#ifdef VIPERVAULT_HAVE_URING

#include "app/HttpServer.hpp"
#include <liburing.h>
#include <sys/socket.h>
#include <sys/eventfd.h>
#include <sys/time.h>
#include <sys/uio.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <arpa/inet.h>
#include <poll.h>
#include <unistd.h>
#include <cerrno>
#include <cstdio>
#include <cstring>
#include <exception>
#include <utility>

namespace vipervault::app {

// Tags for distinguishing CQE sources
enum class UringTag : uint64_t { ListenPoll = 1, StopPoll = 2 };

HttpServer::HttpServer(Handler handler, std::string address, uint16_t port, int workers, ServerLimits limits)
    : handler_(std::move(handler)), address_(std::move(address)), port_(port),
      workers_(workers < 1 ? 1 : workers), limits_(limits) {
  if (limits_.max_queue == 0) limits_.max_queue = static_cast<size_t>(workers_) * 64;
}

HttpServer::~HttpServer() { stop(); }

bool HttpServer::start() {
  struct sockaddr_in addr{};
  addr.sin_family = AF_INET;
  addr.sin_port = htons(port_);
  if (::inet_pton(AF_INET, address_.c_str(), &addr.sin_addr) != 1) {
    std::fprintf(stderr, "vipervault: server: invalid listen address '%s'\n", address_.c_str());
    return false;
  }

  listen_fd_ = ::socket(AF_INET, SOCK_STREAM | SOCK_CLOEXEC | SOCK_NONBLOCK, 0);
  if (listen_fd_ < 0) {
    std::fprintf(stderr, "vipervault: server: socket() failed: %s\n", std::strerror(errno));
    return false;
  }

  int optval = 1;
  (void)::setsockopt(listen_fd_, SOL_SOCKET, SO_REUSEADDR, &optval, sizeof(optval));

  if (::bind(listen_fd_, reinterpret_cast<struct sockaddr*>(&addr), sizeof(addr)) < 0) {
    std::fprintf(stderr, "vipervault: server: bind(%s:%d) failed: %s\n", address_.c_str(), port_, std::strerror(errno));
    ::close(listen_fd_);
    listen_fd_ = -1;
    return false;
  }

  if (::listen(listen_fd_, 64) < 0) {
    std::fprintf(stderr, "vipervault: server: listen() failed: %s\n", std::strerror(errno));
    ::close(listen_fd_);
    listen_fd_ = -1;
    return false;
  }

  socklen_t len = sizeof(addr);
  if (::getsockname(listen_fd_, reinterpret_cast<struct sockaddr*>(&addr), &len) == 0) {
    port_ = ntohs(addr.sin_port);
  }

  // Create eventfd for clean shutdown
  stop_eventfd_ = ::eventfd(0, EFD_CLOEXEC | EFD_NONBLOCK);
  if (stop_eventfd_ < 0) {
    std::fprintf(stderr, "vipervault: server: eventfd() failed: %s\n", std::strerror(errno));
    ::close(listen_fd_);
    listen_fd_ = -1;
    return false;
  }

  pool_.reserve(static_cast<size_t>(workers_));
  for (int i = 0; i < workers_; ++i) {
    pool_.emplace_back([this](std::stop_token st){ worker(st); });
  }
  thread_ = std::jthread([this](std::stop_token st){ run(st); });
  return true;
}

void HttpServer::stop() {
  if (stop_eventfd_ >= 0) {
    uint64_t val = 1;
    (void)::write(stop_eventfd_, &val, sizeof(val));
  }
  if (thread_.joinable()) {
    thread_.request_stop();
    thread_.join();
  }
  for (auto& t : pool_) t.request_stop();
  cv_.notify_all();
  for (auto& t : pool_) {
    if (t.joinable()) t.join();
  }
  pool_.clear();

  {
    std::lock_guard<std::mutex> lk(mu_);
    for (auto& p : queue_) ::close(p.fd);
    queue_.clear();
  }
  if (stop_eventfd_ >= 0) { ::close(stop_eventfd_); stop_eventfd_ = -1; }
  if (listen_fd_ >= 0) { ::close(listen_fd_); listen_fd_ = -1; }
}

static bool send_all(int fd, std::string& head, std::string& body) {
  struct iovec iov[2] = {
    {.iov_base = head.data(), .iov_len = head.size()},
    {.iov_base = body.data(), .iov_len = body.size()}
  };
  struct iovec* cur = iov;
  size_t count = body.empty() ? 1 : 2;
  while (count > 0) {
    struct msghdr msg{};
    msg.msg_iov = cur;
    msg.msg_iovlen = count;
    ssize_t n = ::sendmsg(fd, &msg, MSG_NOSIGNAL);
    if (n < 0) {
      if (errno == EINTR) continue;
      return false;
    }
    auto left = static_cast<size_t>(n);
    while (count > 0 && left >= cur->iov_len) {
      left -= cur->iov_len;
      ++cur;
      --count;
    }
    if (count > 0) {
      cur->iov_base = static_cast<char*>(cur->iov_base) + left;
      cur->iov_len -= left;
    }
  }
  return true;
}

static void reply(int fd, http::HttpResponse resp, bool head_only) {
  std::string head = resp.serialize_head();
  if (head_only) resp.body.clear();
  if (!send_all(fd, head, resp.body)) {
    std::fprintf(stderr, "vipervault: server: send failed: %s\n", std::strerror(errno));
  }
}

bool HttpServer::enqueue(int fd, std::string peer) {
  {
    std::lock_guard<std::mutex> lk(mu_);
    if (queue_.size() >= limits_.max_queue) return false;
    queue_.push_back(Pending{fd, std::move(peer)});
  }
  cv_.notify_one();
  return true;
}

void HttpServer::run(std::stop_token st) {
  struct io_uring ring{};
  if (io_uring_queue_init(16, &ring, 0) < 0) {
    std::fprintf(stderr, "vipervault: server: io_uring_queue_init() failed: %s\n", std::strerror(errno));
    return;
  }

  // Submit poll requests for listen_fd and stop_eventfd
  auto submit_poll = [&](int fd, UringTag tag) {
    struct io_uring_sqe* sqe = io_uring_get_sqe(&ring);
    io_uring_prep_poll_add(sqe, fd, POLLIN);
    io_uring_sqe_set_data64(sqe, static_cast<uint64_t>(tag));
  };

  submit_poll(listen_fd_, UringTag::ListenPoll);
  submit_poll(stop_eventfd_, UringTag::StopPoll);
  io_uring_submit(&ring);

  while (!st.stop_requested()) {
    struct io_uring_cqe* cqe = nullptr;
    int ret = io_uring_wait_cqe(&ring, &cqe);
    if (ret < 0) {
      if (ret == -EINTR) continue;
      std::fprintf(stderr, "vipervault: server: io_uring_wait_cqe() failed: %s\n", std::strerror(-ret));
      break;
    }

    auto tag = static_cast<UringTag>(io_uring_cqe_get_data64(cqe));
    int res = cqe->res;
    io_uring_cqe_seen(&ring, cqe);

    if (tag == UringTag::StopPoll || st.stop_requested()) {
      break;
    }

    if (tag == UringTag::ListenPoll && res >= 0) {
      // Drain the backlog; the listen socket is non-blocking.
      for (;;) {
        struct sockaddr_in peer{};
        socklen_t plen = sizeof(peer);
        int client_fd = ::accept4(listen_fd_, reinterpret_cast<struct sockaddr*>(&peer), &plen, SOCK_CLOEXEC);
        if (client_fd < 0) {
          if (errno == EINTR) continue;
          if (errno != EAGAIN && errno != EWOULDBLOCK) {
            std::fprintf(stderr, "vipervault: server: accept4() failed: %s\n", std::strerror(errno));
          }
          break;
        }
        char ip[INET_ADDRSTRLEN] = "?";
        (void)::inet_ntop(AF_INET, &peer.sin_addr, ip, sizeof(ip));
        std::string who = std::string(ip) + ":" + std::to_string(ntohs(peer.sin_port));
        if (!enqueue(client_fd, who)) {
          std::fprintf(stderr, "vipervault: server: queue full, rejecting %s\n", who.c_str());
          struct timeval tv{.tv_sec = 1, .tv_usec = 0};
          (void)::setsockopt(client_fd, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv));
          reply(client_fd, http::HttpResponse::text(503, "Service Unavailable\n"), false);
          ::close(client_fd);
        }
      }
      // Re-arm listen poll
      submit_poll(listen_fd_, UringTag::ListenPoll);
      io_uring_submit(&ring);
    }
  }

  io_uring_queue_exit(&ring);
}

void HttpServer::worker(std::stop_token st) {
  while (!st.stop_requested()) {
    Pending p;
    {
      std::unique_lock<std::mutex> lk(mu_);
      if (!cv_.wait(lk, st, [&]{ return !queue_.empty(); })) return;
      p = std::move(queue_.front());
      queue_.pop_front();
    }
    handle_client(p.fd, p.peer);
    ::close(p.fd);
  }
}

void HttpServer::handle_client(int fd, const std::string& peer) {
  // Set timeouts to prevent slow clients from blocking a worker
  struct timeval tv{.tv_sec = limits_.io_timeout_sec, .tv_usec = 0};
  (void)::setsockopt(fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));
  (void)::setsockopt(fd, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv));
  int one = 1;
  (void)::setsockopt(fd, IPPROTO_TCP, TCP_NODELAY, &one, sizeof(one));

  std::string raw;
  size_t head_end = std::string::npos;
  size_t want = 0;
  char buf[8192];
  for (;;) {
    if (head_end != std::string::npos && raw.size() >= want) break;
    ssize_t nr = ::recv(fd, buf, sizeof(buf), 0);
    if (nr < 0 && errno == EINTR) continue;
    if (nr < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
      reply(fd, http::HttpResponse::text(408, "Request Timeout\n"), false);
      return;
    }
    if (nr <= 0) {
      if (head_end == std::string::npos) return;
      break; // peer closed early; take what arrived
    }
    raw.append(buf, static_cast<size_t>(nr));

    if (head_end == std::string::npos) {
      head_end = http::find_head_end(raw);
      if (head_end == std::string::npos) {
        if (raw.size() > limits_.max_head_bytes) {
          reply(fd, http::HttpResponse::text(431, "Request Header Fields Too Large\n"), false);
          return;
        }
        continue;
      }
      auto head_req = http::parse_request(std::string_view(raw).substr(0, head_end));
      if (!head_req) {
        reply(fd, http::HttpResponse::text(400, "Bad Request\n"), false);
        return;
      }
      size_t body_len = head_req->content_length();
      if (body_len > limits_.max_body_bytes) {
        reply(fd, http::HttpResponse::text(413, "Payload Too Large\n"), false);
        return;
      }
      want = head_end + body_len;
    }
  }

  auto req = http::parse_request(raw);
  if (!req) {
    reply(fd, http::HttpResponse::text(400, "Bad Request\n"), false);
    return;
  }
  req->peer = peer;

  http::HttpResponse resp;
  try {
    resp = handler_(*req);
  } catch (const std::exception& e) {
    std::fprintf(stderr, "vipervault: server: handler failed for %s: %s\n", peer.c_str(), e.what());
    resp = http::HttpResponse::text(500, "Internal Server Error\n");
  }
  reply(fd, std::move(resp), req->method == "HEAD");
}

} // namespace vipervault::app

#endif // VIPERVAULT_HAVE_URING
