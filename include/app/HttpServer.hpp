#pragma once

#include "http/HttpRequest.hpp"
#include "http/HttpResponse.hpp"

#include <condition_variable>
#include <cstdint>
#include <deque>
#include <functional>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace vipervault::app {

struct ServerLimits {
  size_t max_head_bytes{16 * 1024};
  size_t max_body_bytes{64 * 1024};
  int io_timeout_sec{5};
  // Accepted connections waiting for a worker; 0 means 64 per worker.
  // Beyond it new connections get 503.
  size_t max_queue{0};
};

// One request per connection. An io_uring loop accepts, workers read,
// dispatch to the handler, reply and close.
class HttpServer {
public:
  using Handler = std::function<http::HttpResponse(const http::HttpRequest&)>;

  HttpServer(Handler handler, std::string address, uint16_t port, int workers, ServerLimits limits = {});
  ~HttpServer();
  HttpServer(const HttpServer&) = delete;
  HttpServer& operator=(const HttpServer&) = delete;

  // Bind and listen before returning; false if the socket cannot be set up.
  [[nodiscard]] bool start();
  void stop();

  // Bound port; differs from the requested one when that was 0.
  [[nodiscard]] uint16_t port() const { return port_; }

private:
  void run(std::stop_token st);
  void worker(std::stop_token st);
  void handle_client(int client_fd, const std::string& peer);
  bool enqueue(int fd, std::string peer);

  Handler handler_;
  std::string address_;
  uint16_t port_;
  int workers_;
  ServerLimits limits_;
  int listen_fd_{-1};
  int stop_eventfd_{-1};

  struct Pending {
    int fd;
    std::string peer;
  };
  std::mutex mu_;
  std::condition_variable_any cv_;
  std::deque<Pending> queue_;

  std::jthread thread_;
  std::vector<std::jthread> pool_;
};

} // namespace vipervault::app
