#include "app/HttpServer.hpp"
#include "app/ViewerApp.hpp"
#include "auth/SessionStore.hpp"
#include "config/Config.hpp"

#include <atomic>
#include <charconv>
#include <chrono>
#include <csignal>
#include <cstdio>
#include <iostream>
#include <string>
#include <string_view>
#include <thread>
#include <utility>

using namespace std::chrono_literals;

static std::atomic<bool> g_stop{false};
static void on_signal(int) { g_stop.store(true); }

static void print_usage() {
  std::cout << "Usage: vipervault [--config PATH] [--bind ADDR] [--port N] [--check-config]\n";
  std::cout << "Notes: serves the log viewer until SIGINT/SIGTERM.\n";
}

static bool parse_port(const char* s, int& out) {
  std::string_view sv(s);
  auto [ptr, ec] = std::from_chars(sv.data(), sv.data() + sv.size(), out);
  return ec == std::errc{} && ptr == sv.data() + sv.size() && out >= 0 && out <= 65535;
}

static void print_summary(const vipervault::config::Config& cfg) {
  std::cout << "config: " << cfg.source_path << "\n";
  std::cout << "title: " << cfg.title << "\n";
  std::cout << "listen: " << cfg.listen_address << ":" << cfg.port << "\n";
  std::cout << "session dir: " << cfg.session_dir << "\n";
  std::cout << "views: " << cfg.views.size() << "\n";
  for (const auto& v : cfg.views) {
    std::cout << "  " << v.name << "  refresh=";
    if (v.refresh > 0) std::cout << v.refresh << "s"; else std::cout << "off";
    std::cout << (v.safe_output ? "  escaped" : "  raw") << "  cmd=" << v.cmd << "\n";
  }
}

int main(int argc, char** argv) {
  std::string config_arg;
  std::string bind_arg;
  int port_arg = -1;
  bool check_only = false;
  for (int i = 1; i < argc; ++i) {
    std::string a = argv[i];
    if (a == "--config" && i + 1 < argc) config_arg = argv[++i];
    else if (a == "--bind" && i + 1 < argc) bind_arg = argv[++i];
    else if (a == "--port" && i + 1 < argc) {
      if (!parse_port(argv[++i], port_arg)) {
        std::fprintf(stderr, "vipervault: invalid port '%s'\n", argv[i]);
        return 1;
      }
    }
    else if (a == "--check-config") check_only = true;
    else if (a == "-h" || a == "--help") {
      print_usage();
      return 0;
    } else {
      std::fprintf(stderr, "vipervault: unknown argument '%s'\n", a.c_str());
      print_usage();
      return 1;
    }
  }

  auto path = vipervault::config::config_file_path(config_arg);
  auto loaded = vipervault::config::load_config(path);
  if (!loaded.config) {
    std::fprintf(stderr, "vipervault: config: %s\n", loaded.error.c_str());
    return 1;
  }
  auto cfg = std::move(*loaded.config);
  vipervault::config::apply_env_overrides(cfg);
  if (!bind_arg.empty()) cfg.listen_address = bind_arg;
  if (port_arg >= 0) cfg.port = static_cast<uint16_t>(port_arg);

  if (check_only) {
    print_summary(cfg);
    return 0;
  }

  if (vipervault::config::uses_default_password(cfg)) {
    std::fprintf(stderr, "vipervault: config: WARNING: using the default password; set \"password\" in %s\n",
                 cfg.source_path.c_str());
  }
  if (cfg.views.empty()) {
    std::fprintf(stderr, "vipervault: config: no log_views configured\n");
  }

  vipervault::auth::SessionStore sessions(
      cfg.session_dir,
      vipervault::auth::SessionPolicy{static_cast<double>(cfg.session_duration),
                                      static_cast<double>(cfg.inactivity_timeout)});
  if (!sessions.ensure_dir()) return 1;
  (void)sessions.cleanup();

  vipervault::app::ViewerApp viewer(cfg, sessions);
  vipervault::app::HttpServer server(
      [&viewer](const vipervault::http::HttpRequest& req) { return viewer.handle(req); },
      cfg.listen_address, cfg.port, cfg.workers);

  std::signal(SIGINT, on_signal);
  std::signal(SIGTERM, on_signal);
  std::signal(SIGPIPE, SIG_IGN);

  if (!server.start()) return 1;
  std::fprintf(stderr, "vipervault: server: listening on %s:%u (%d workers, %zu views)\n",
               cfg.listen_address.c_str(), static_cast<unsigned>(server.port()), cfg.workers, cfg.views.size());

  while (!g_stop.load()) {
    std::this_thread::sleep_for(200ms);
  }
  std::fprintf(stderr, "vipervault: server: shutting down\n");
  server.stop();
  return 0;
}
