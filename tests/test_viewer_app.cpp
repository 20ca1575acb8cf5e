#include "minitest.hpp"
#include "app/ViewerApp.hpp"
#include "auth/Cookies.hpp"
#include <nlohmann/json.hpp>
#include <filesystem>
#include <fstream>
#include <memory>
#include <stdexcept>
#include <unistd.h>

using namespace vipervault;
using http::HttpRequest;
using http::HttpResponse;
namespace fs = std::filesystem;

namespace {

struct Fixture {
  fs::path root;
  config::Config cfg;
  std::unique_ptr<auth::SessionStore> store;
  std::unique_ptr<app::ViewerApp> app;
  std::vector<std::string> ran;

  explicit Fixture(const char* tag) {
    root = fs::temp_directory_path() / (std::string("vipervault_test_app_") + tag + "_" + std::to_string(::getpid()));
    fs::remove_all(root);
    auto r = config::parse_config(R"({
      "password": "s3cret",
      "log_views": {
        "raw": {"cmd": "echo raw", "safe_output": false, "refresh": 0},
        "safe": "echo safe",
        "broken": "exit 2",
        "boom": "throw"
      }})", root.string());
    cfg = *r.config;
    store = std::make_unique<auth::SessionStore>(cfg.session_dir, auth::SessionPolicy{86400.0, 3600.0});
    app = std::make_unique<app::ViewerApp>(cfg, *store,
        [this](const std::string& cmd, const exec::RunOptions&) {
          ran.push_back(cmd);
          exec::CommandResult res;
          if (cmd == "throw") throw std::runtime_error("runner failed");
          if (cmd == "exit 2") { res.exit_code = 2; res.err = "bad <thing>"; return res; }
          res.exit_code = 0;
          res.out = "<b>" + cmd + "</b>\n";
          return res;
        });
  }
  ~Fixture() { fs::remove_all(root); }

  HttpResponse get(const std::string& target, const std::string& cookie = {}) {
    std::string raw = "GET " + target + " HTTP/1.1\r\nHost: t\r\n";
    if (!cookie.empty()) raw += "Cookie: " + cookie + "\r\n";
    raw += "\r\n";
    return app->handle(*http::parse_request(raw));
  }

  HttpResponse post_form(const std::string& target, const std::string& body) {
    std::string raw = "POST " + target + " HTTP/1.1\r\n"
                      "Content-Type: application/x-www-form-urlencoded\r\n"
                      "Content-Length: " + std::to_string(body.size()) + "\r\n\r\n" + body;
    auto req = *http::parse_request(raw);
    req.peer = "127.0.0.1:5555";
    return app->handle(req);
  }

  // Cookie pair from a login response, e.g. "session_token=abc".
  std::string login() {
    auto r = post_form("/?action=login", "password=s3cret");
    const std::string* sc = r.find_header("Set-Cookie");
    if (!sc) throw std::runtime_error("no Set-Cookie on login");
    return sc->substr(0, sc->find(';'));
  }
};

} // namespace

TEST(app_login_success_sets_cookie) {
  Fixture f("login_ok");
  auto r = f.post_form("/?action=login", "password=s3cret");
  ASSERT_EQ(r.status, 200);
  ASSERT_EQ(nlohmann::json::parse(r.body)["success"].get<bool>(), true);
  const std::string* sc = r.find_header("Set-Cookie");
  ASSERT_TRUE(sc != nullptr);
  ASSERT_CONTAINS(*sc, "session_token=");
  ASSERT_CONTAINS(*sc, "HttpOnly");
  ASSERT_CONTAINS(*sc, "Max-Age=86400");
  ASSERT_TRUE(sc->find("Secure") == std::string::npos);
}

TEST(app_login_failure) {
  Fixture f("login_bad");
  auto r = f.post_form("/?action=login", "password=wrong");
  ASSERT_EQ(r.status, 200);
  ASSERT_EQ(nlohmann::json::parse(r.body)["success"].get<bool>(), false);
  ASSERT_TRUE(r.find_header("Set-Cookie") == nullptr);
  auto missing = f.post_form("/?action=login", "");
  ASSERT_EQ(nlohmann::json::parse(missing.body)["success"].get<bool>(), false);
}

TEST(app_login_reports_unavailable_session_store) {
  Fixture f("login_nostore");
  fs::create_directories(f.root);
  { std::ofstream(f.root / "blocker") << "not a directory"; }
  auth::SessionStore broken(f.root / "blocker" / "sessions", auth::SessionPolicy{86400.0, 3600.0});
  f.app = std::make_unique<app::ViewerApp>(f.cfg, broken);
  auto r = f.post_form("/?action=login", "password=s3cret");
  ASSERT_EQ(r.status, 500);
  auto body = nlohmann::json::parse(r.body);
  ASSERT_EQ(body["success"].get<bool>(), false);
  ASSERT_EQ(body["error"].get<std::string>(), std::string("session store unavailable"));
  ASSERT_TRUE(r.find_header("Set-Cookie") == nullptr);
}

TEST(app_login_behind_tls_proxy_sets_secure) {
  Fixture f("login_tls");
  std::string body = "password=s3cret";
  auto req = *http::parse_request("POST /?action=login HTTP/1.1\r\n"
                                  "X-Forwarded-Proto: https\r\n"
                                  "Content-Type: application/x-www-form-urlencoded\r\n"
                                  "Content-Length: 15\r\n\r\n" + body);
  auto r = f.app->handle(req);
  ASSERT_CONTAINS(*r.find_header("Set-Cookie"), "; Secure");
}

TEST(app_check_session) {
  Fixture f("check");
  auto anon = f.get("/?action=check_session");
  ASSERT_EQ(nlohmann::json::parse(anon.body)["authenticated"].get<bool>(), false);
  auto cookie = f.login();
  auto authed = f.get("/?action=check_session", cookie);
  ASSERT_EQ(nlohmann::json::parse(authed.body)["authenticated"].get<bool>(), true);
  auto bogus = f.get("/?action=check_session", "session_token=../../etc/passwd");
  ASSERT_EQ(nlohmann::json::parse(bogus.body)["authenticated"].get<bool>(), false);
}

TEST(app_get_log_requires_session) {
  Fixture f("unauth");
  auto r = f.get("/?action=get_log&view=safe");
  ASSERT_EQ(r.status, 401);
  ASSERT_EQ(r.body, std::string("Unauthorized: Invalid or expired session."));
  ASSERT_TRUE(f.ran.empty());
}

TEST(app_get_log_unknown_view) {
  Fixture f("badview");
  auto cookie = f.login();
  auto r = f.get("/?action=get_log&view=nope", cookie);
  ASSERT_EQ(r.status, 400);
  ASSERT_EQ(r.body, std::string("Invalid or missing log view selection."));
  auto missing = f.get("/?action=get_log", cookie);
  ASSERT_EQ(missing.status, 400);
  ASSERT_TRUE(f.ran.empty());
}

TEST(app_get_log_escapes_safe_output) {
  Fixture f("safe");
  auto cookie = f.login();
  auto r = f.get("/?action=get_log&view=safe", cookie);
  ASSERT_EQ(r.status, 200);
  ASSERT_EQ(r.body, std::string("&lt;b&gt;echo safe&lt;/b&gt;\n"));
  ASSERT_EQ(*r.find_header("Content-Type"), std::string("text/plain; charset=utf-8"));
  ASSERT_EQ(*r.find_header("Cache-Control"), std::string("no-store"));
  ASSERT_EQ(f.ran.size(), 1u);
}

TEST(app_get_log_raw_output) {
  Fixture f("raw");
  auto cookie = f.login();
  auto r = f.get("/?action=get_log&view=raw", cookie);
  ASSERT_EQ(r.body, std::string("<b>echo raw</b>\n"));
}

TEST(app_get_log_command_failure_is_body) {
  Fixture f("fail");
  auto cookie = f.login();
  auto r = f.get("/?action=get_log&view=broken", cookie);
  ASSERT_EQ(r.status, 200);
  ASSERT_EQ(r.body, std::string("Error running command: bad &lt;thing&gt;\nReturn code: 2"));
}

TEST(app_handler_exception_is_500) {
  Fixture f("throw");
  auto cookie = f.login();
  auto r = f.get("/?action=get_log&view=boom", cookie);
  ASSERT_EQ(r.status, 500);
  ASSERT_EQ(*r.find_header("X-Content-Type-Options"), std::string("nosniff"));
}

TEST(app_logout_invalidates_session) {
  Fixture f("logout");
  auto cookie = f.login();
  auto out = f.get("/?action=logout", cookie);
  ASSERT_EQ(nlohmann::json::parse(out.body)["success"].get<bool>(), true);
  ASSERT_CONTAINS(*out.find_header("Set-Cookie"), "Max-Age=0");
  auto r = f.get("/?action=get_log&view=safe", cookie);
  ASSERT_EQ(r.status, 401);
  auto anon = f.get("/?action=logout");
  ASSERT_EQ(anon.status, 200);
}

TEST(app_view_info) {
  Fixture f("info");
  ASSERT_EQ(f.get("/?action=view_info&view=raw").status, 401);
  auto cookie = f.login();
  auto r = f.get("/?action=view_info&view=raw", cookie);
  ASSERT_EQ(r.status, 200);
  auto j = nlohmann::json::parse(r.body);
  ASSERT_EQ(j["cmd"].get<std::string>(), std::string("echo raw"));
  ASSERT_EQ(j["refresh"].get<int>(), 0);
  ASSERT_EQ(j["safe_output"].get<bool>(), false);
  ASSERT_EQ(f.get("/?action=view_info&view=zzz", cookie).status, 400);
}

TEST(app_index_page_headers) {
  Fixture f("index");
  auto r = f.get("/");
  ASSERT_EQ(r.status, 200);
  ASSERT_CONTAINS(*r.find_header("Content-Type"), "text/html");
  const std::string* csp = r.find_header("Content-Security-Policy");
  ASSERT_TRUE(csp != nullptr);
  auto at = csp->find("'nonce-");
  ASSERT_TRUE(at != std::string::npos);
  auto nonce = csp->substr(at + 7, csp->find('\'', at + 7) - (at + 7));
  ASSERT_CONTAINS(r.body, "<script nonce=\"" + nonce + "\">");
  ASSERT_EQ(*r.find_header("X-Content-Type-Options"), std::string("nosniff"));
  ASSERT_EQ(*r.find_header("Referrer-Policy"), std::string("no-referrer"));
  ASSERT_TRUE(r.body.find("echo safe") == std::string::npos);

  auto again = f.get("/?action=unknown");
  ASSERT_NE(*again.find_header("Content-Security-Policy"), *csp);
}

TEST(app_routing_errors) {
  Fixture f("routing");
  ASSERT_EQ(f.get("/other").status, 404);
  auto del = f.app->handle(*http::parse_request("DELETE / HTTP/1.1\r\n\r\n"));
  ASSERT_EQ(del.status, 405);
}

TEST(app_sessions_persist_across_instances) {
  Fixture f("persist");
  auto cookie = f.login();
  auth::SessionStore other(f.cfg.session_dir, {});
  app::ViewerApp second(f.cfg, other);
  std::string raw = "GET /?action=check_session HTTP/1.1\r\nCookie: " + cookie + "\r\n\r\n";
  auto r = second.handle(*http::parse_request(raw));
  ASSERT_EQ(nlohmann::json::parse(r.body)["authenticated"].get<bool>(), true);
}
