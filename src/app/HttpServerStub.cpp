#include "app/HttpServer.hpp"

#include <cstdio>
#include <utility>

namespace vipervault::app {

HttpServer::HttpServer(Handler handler, std::string address, uint16_t port, int workers, ServerLimits limits)
    : handler_(std::move(handler)), address_(std::move(address)), port_(port),
      workers_(workers), limits_(limits) {}

HttpServer::~HttpServer() = default;

bool HttpServer::start() {
  std::fprintf(stderr, "vipervault: server: built without io_uring support\n");
  return false;
}

void HttpServer::stop() {}

} // namespace vipervault::app
