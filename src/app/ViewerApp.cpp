#include "app/ViewerApp.hpp"
#include "auth/Cookies.hpp"
#include "util/Strings.hpp"
#include "web/Html.hpp"

#include <nlohmann/json.hpp>

#include <cstdio>
#include <exception>
#include <utility>

namespace vipervault::app {

using http::HttpRequest;
using http::HttpResponse;

static const char* kUnauthorized = "Unauthorized: Invalid or expired session.";
static const char* kBadView = "Invalid or missing log view selection.";

static const char* peer_of(const HttpRequest& req) {
  return req.peer.empty() ? "-" : req.peer.c_str();
}

ViewerApp::ViewerApp(const config::Config& cfg, auth::SessionStore& sessions, Runner runner)
    : cfg_(cfg), sessions_(sessions), runner_(std::move(runner)) {
  if (!runner_) {
    runner_ = [](const std::string& cmd, const exec::RunOptions& opts) { return exec::run_command(cmd, opts); };
  }
}

HttpResponse ViewerApp::handle(const HttpRequest& req) {
  HttpResponse resp;
  try {
    resp = route(req);
  } catch (const std::exception& e) {
    std::fprintf(stderr, "vipervault: app: %s %s failed: %s\n", req.method.c_str(), req.path.c_str(), e.what());
    resp = HttpResponse::text(500, "Internal Server Error\n");
  }
  resp.set_header("X-Content-Type-Options", "nosniff");
  return resp;
}

HttpResponse ViewerApp::route(const HttpRequest& req) {
  if (req.method != "GET" && req.method != "POST" && req.method != "HEAD") {
    auto r = HttpResponse::text(405, "Method Not Allowed\n");
    r.set_header("Allow", "GET, POST, HEAD");
    return r;
  }
  if (req.path != "/") return HttpResponse::text(404, "Not Found\n");

  auto action = req.param("action").value_or(std::string());
  if (action == "login") return do_login(req);
  if (action == "logout") return do_logout(req);
  if (action == "check_session") return do_check_session(req);
  if (action == "get_log") return do_get_log(req);
  if (action == "view_info") return do_view_info(req);
  return do_index();
}

bool ViewerApp::authenticated(const HttpRequest& req) {
  auto cookie = req.header("cookie");
  if (!cookie) return false;
  auto token = auth::extract_session_token(*cookie);
  return token && sessions_.validate(*token);
}

bool ViewerApp::secure_cookie(const HttpRequest& req) const {
  return cfg_.secure_cookie || req.is_https();
}

exec::RunOptions ViewerApp::run_options() const {
  exec::RunOptions opts;
  opts.timeout = std::chrono::seconds(cfg_.command_timeout);
  opts.max_output_bytes = cfg_.max_output_bytes;
  return opts;
}

HttpResponse ViewerApp::do_login(const HttpRequest& req) {
  auto attempt = req.param("password").value_or(std::string());
  if (!auth::password_matches(attempt, cfg_.password)) {
    std::fprintf(stderr, "vipervault: app: failed login from %s\n", peer_of(req));
    return HttpResponse::json(200, {{"success", false}});
  }
  auto token = sessions_.create();
  if (!token) {
    std::fprintf(stderr, "vipervault: app: could not create session for %s\n", peer_of(req));
    return HttpResponse::json(500, {{"success", false}, {"error", "session store unavailable"}});
  }
  std::fprintf(stderr, "vipervault: app: login from %s (session %s)\n", peer_of(req), util::redact(*token).c_str());
  auto r = HttpResponse::json(200, {{"success", true}});
  r.add_header("Set-Cookie", auth::make_session_cookie(*token, cfg_.session_duration, secure_cookie(req)));
  return r;
}

HttpResponse ViewerApp::do_logout(const HttpRequest& req) {
  if (auto cookie = req.header("cookie")) {
    if (auto token = auth::extract_session_token(*cookie)) {
      sessions_.destroy(*token);
      std::fprintf(stderr, "vipervault: app: logout from %s (session %s)\n", peer_of(req), util::redact(*token).c_str());
    }
  }
  auto r = HttpResponse::json(200, {{"success", true}});
  r.add_header("Set-Cookie", auth::make_clear_cookie(secure_cookie(req)));
  return r;
}

HttpResponse ViewerApp::do_check_session(const HttpRequest& req) {
  auto r = HttpResponse::json(200, {{"authenticated", authenticated(req)}});
  r.set_header("Cache-Control", "no-store");
  return r;
}

HttpResponse ViewerApp::do_get_log(const HttpRequest& req) {
  HttpResponse r;
  if (!authenticated(req)) {
    r = HttpResponse::text(401, kUnauthorized);
  } else {
    auto name = req.param("view");
    const config::ViewConfig* view = name ? config::find_view(cfg_, *name) : nullptr;
    if (!view) {
      r = HttpResponse::text(400, kBadView);
    } else {
      auto opts = run_options();
      auto text = exec::render_command_output(runner_(view->cmd, opts), opts);
      r = HttpResponse::text(200, view->safe_output ? web::html_escape(text) : std::move(text));
    }
  }
  r.set_header("Cache-Control", "no-store");
  return r;
}

HttpResponse ViewerApp::do_view_info(const HttpRequest& req) {
  if (!authenticated(req)) return HttpResponse::json(401, {{"error", "unauthorized"}});
  auto name = req.param("view");
  const config::ViewConfig* view = name ? config::find_view(cfg_, *name) : nullptr;
  if (!view) return HttpResponse::json(400, {{"error", kBadView}});
  auto r = HttpResponse::json(200, {{"name", view->name},
                                    {"cmd", view->cmd},
                                    {"refresh", view->refresh},
                                    {"safe_output", view->safe_output},
                                    {"bottom", view->bottom}});
  r.set_header("Cache-Control", "no-store");
  return r;
}

HttpResponse ViewerApp::do_index() {
  auto nonce = web::generate_nonce();
  if (!nonce) return HttpResponse::text(500, "Internal Server Error\n");
  auto r = HttpResponse::html(web::render_index_page(cfg_, *nonce));
  r.set_header("Content-Security-Policy", web::content_security_policy(*nonce));
  r.set_header("Referrer-Policy", "no-referrer");
  r.set_header("Cache-Control", "no-store");
  return r;
}

} // namespace vipervault::app
