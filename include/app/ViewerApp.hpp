#pragma once

#include "auth/SessionStore.hpp"
#include "config/Config.hpp"
#include "exec/CommandRunner.hpp"
#include "http/HttpRequest.hpp"
#include "http/HttpResponse.hpp"

#include <functional>
#include <optional>
#include <string>

namespace vipervault::app {

// Routes requests for "/" by their action parameter.
// Safe to call from several server workers at once.
class ViewerApp {
public:
  // Runs a view command. Replaced in tests.
  using Runner = std::function<exec::CommandResult(const std::string&, const exec::RunOptions&)>;

  ViewerApp(const config::Config& cfg, auth::SessionStore& sessions, Runner runner = {});

  [[nodiscard]] http::HttpResponse handle(const http::HttpRequest& req);

private:
  http::HttpResponse route(const http::HttpRequest& req);
  http::HttpResponse do_login(const http::HttpRequest& req);
  http::HttpResponse do_logout(const http::HttpRequest& req);
  http::HttpResponse do_check_session(const http::HttpRequest& req);
  http::HttpResponse do_get_log(const http::HttpRequest& req);
  http::HttpResponse do_view_info(const http::HttpRequest& req);
  http::HttpResponse do_index();

  // True if the session cookie names a live session. Refreshes its activity.
  [[nodiscard]] bool authenticated(const http::HttpRequest& req);
  [[nodiscard]] bool secure_cookie(const http::HttpRequest& req) const;
  [[nodiscard]] exec::RunOptions run_options() const;

  const config::Config& cfg_;
  auth::SessionStore& sessions_;
  Runner runner_;
};

} // namespace vipervault::app
