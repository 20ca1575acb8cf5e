#include "config/Config.hpp"
#include "util/Strings.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <exception>
#include <filesystem>
#include <fstream>
#include <limits>
#include <sstream>

namespace vipervault::config {

using json = nlohmann::json;

const char* getenv_compat(const char* name) {
  const char* v = std::getenv(name);
  if (v && *v) return v;
  std::string alt;
  std::string n(name);
  if (n.rfind("VIPERVAULT_", 0) == 0) {
    alt = std::string("vipervault_") + n.substr(11);
  } else if (n.rfind("vipervault_", 0) == 0) {
    alt = std::string("VIPERVAULT_") + n.substr(11);
  }
  if (!alt.empty()) {
    v = std::getenv(alt.c_str());
    if (v && *v) return v;
  }
  return nullptr;
}

int getenv_int(const char* name, int defv) {
  const char* v = getenv_compat(name);
  if (!v || !*v) return defv;
  try { return std::stoi(v); } catch (const std::exception&) { return defv; }
}

static bool read_int(const json& j, const char* key, int& out, std::string& err) {
  auto it = j.find(key);
  if (it == j.end() || it->is_null()) return true;
  if (!it->is_number()) {
    err = std::string("'") + key + "' must be a number";
    return false;
  }
  constexpr auto lo = std::numeric_limits<int>::min();
  constexpr auto hi = std::numeric_limits<int>::max();
  bool in_range = false;
  if (it->is_number_unsigned()) {
    auto u = it->get<std::uint64_t>();
    in_range = u <= static_cast<std::uint64_t>(hi);
    if (in_range) out = static_cast<int>(u);
  } else if (it->is_number_integer()) {
    auto v = it->get<std::int64_t>();
    in_range = v >= lo && v <= hi;
    if (in_range) out = static_cast<int>(v);
  } else {
    // 30.0 is accepted; 0.5 or 1e12 are not.
    double d = it->get<double>();
    in_range = std::isfinite(d) && std::trunc(d) == d && d >= lo && d <= hi;
    if (in_range) out = static_cast<int>(d);
  }
  if (!in_range) {
    err = std::string("'") + key + "' must be an integer in range";
    return false;
  }
  return true;
}

static bool read_bool(const json& j, const char* key, bool& out, std::string& err) {
  auto it = j.find(key);
  if (it == j.end() || it->is_null()) return true;
  if (it->is_boolean()) { out = it->get<bool>(); return true; }
  if (it->is_number_integer()) { out = it->get<long long>() != 0; return true; }
  err = std::string("'") + key + "' must be a boolean";
  return false;
}

static bool read_string(const json& j, const char* key, std::string& out, std::string& err) {
  auto it = j.find(key);
  if (it == j.end() || it->is_null()) return true;
  if (!it->is_string()) {
    err = std::string("'") + key + "' must be a string";
    return false;
  }
  out = it->get<std::string>();
  return true;
}

static bool parse_views(const json& j, Config& c, std::string& err) {
  auto it = j.find("log_views");
  if (it == j.end() || it->is_null()) return true;
  if (!it->is_object()) {
    err = "'log_views' must be an object";
    return false;
  }
  for (const auto& [name, entry] : it->items()) {
    ViewConfig v;
    v.name = name;
    v.refresh = c.refresh_interval;
    if (entry.is_string()) {
      v.cmd = entry.get<std::string>();
    } else if (entry.is_object()) {
      std::string field_err;
      if (!read_string(entry, "cmd", v.cmd, field_err) ||
          !read_int(entry, "refresh", v.refresh, field_err) ||
          !read_bool(entry, "safe_output", v.safe_output, field_err) ||
          !read_bool(entry, "bottom", v.bottom, field_err)) {
        err = "log view '" + name + "': " + field_err;
        return false;
      }
    } else {
      err = "log view '" + name + "' must be a command string or an object";
      return false;
    }
    if (v.cmd.empty()) {
      std::fprintf(stderr, "vipervault: config: log view '%s' has an empty command\n", name.c_str());
    }
    c.views.push_back(std::move(v));
  }
  std::stable_sort(c.views.begin(), c.views.end(), [](const ViewConfig& a, const ViewConfig& b){
    auto la = util::to_lower_copy(a.name);
    auto lb = util::to_lower_copy(b.name);
    if (la != lb) return la < lb;
    return a.name < b.name;
  });
  return true;
}

auto parse_config(std::string_view json_text, const std::string& base_dir) -> ConfigResult {
  ConfigResult r;
  json j;
  try {
    j = json::parse(json_text.begin(), json_text.end());
  } catch (const json::parse_error& e) {
    r.error = std::string("invalid JSON in configuration file: ") + e.what();
    return r;
  }
  if (!j.is_object()) {
    r.error = "configuration root must be a JSON object";
    return r;
  }

  Config c{};
  std::string err;
  int port = c.port;
  int max_output = static_cast<int>(c.max_output_bytes);
  bool ok = read_string(j, "password", c.password, err) &&
            read_int(j, "refresh_interval", c.refresh_interval, err) &&
            read_int(j, "session_duration", c.session_duration, err) &&
            read_int(j, "inactivity_timeout", c.inactivity_timeout, err) &&
            read_string(j, "title", c.title, err) &&
            read_string(j, "listen_address", c.listen_address, err) &&
            read_int(j, "port", port, err) &&
            read_string(j, "session_dir", c.session_dir, err) &&
            read_int(j, "command_timeout", c.command_timeout, err) &&
            read_int(j, "max_output_bytes", max_output, err) &&
            read_int(j, "workers", c.workers, err) &&
            read_bool(j, "secure_cookie", c.secure_cookie, err) &&
            parse_views(j, c, err);
  if (!ok) {
    r.error = err;
    return r;
  }
  if (port < 0 || port > 65535) {
    r.error = "'port' must be between 0 and 65535";
    return r;
  }
  if (max_output <= 0) {
    r.error = "'max_output_bytes' must be positive";
    return r;
  }
  c.port = static_cast<uint16_t>(port);
  c.max_output_bytes = static_cast<size_t>(max_output);
  c.workers = std::clamp(c.workers, 1, 64);

  std::filesystem::path sd(c.session_dir);
  if (sd.is_relative() && !base_dir.empty()) {
    c.session_dir = (std::filesystem::path(base_dir) / sd).lexically_normal().string();
  }

  r.config = std::move(c);
  return r;
}

auto load_config(const std::string& path) -> ConfigResult {
  std::ifstream in(path);
  if (!in.is_open()) {
    ConfigResult r;
    r.error = "configuration file '" + path + "' not found";
    return r;
  }
  std::ostringstream ss;
  ss << in.rdbuf();

  std::error_code ec;
  auto abs = std::filesystem::absolute(path, ec);
  std::string base_dir = ec ? std::string() : abs.parent_path().string();

  auto r = parse_config(ss.str(), base_dir);
  if (r.config) r.config->source_path = ec ? path : abs.string();
  return r;
}

void apply_env_overrides(Config& cfg) {
  if (const char* v = getenv_compat("VIPERVAULT_LISTEN_ADDRESS")) cfg.listen_address = v;
  if (const char* v = getenv_compat("VIPERVAULT_SESSION_DIR")) cfg.session_dir = v;
  int port = getenv_int("VIPERVAULT_PORT", -1);
  if (port >= 0 && port <= 65535) cfg.port = static_cast<uint16_t>(port);
  int workers = getenv_int("VIPERVAULT_WORKERS", 0);
  if (workers > 0) cfg.workers = std::clamp(workers, 1, 64);
}

auto find_view(const Config& cfg, std::string_view name) -> const ViewConfig* {
  for (const auto& v : cfg.views)
    if (v.name == name) return &v;
  return nullptr;
}

auto config_file_path(const std::string& cli_override) -> std::string {
  if (!cli_override.empty()) return cli_override;
  if (const char* env = getenv_compat("VIPERVAULT_CONFIG")) return env;
  std::error_code ec;
  if (const char* xdg = std::getenv("XDG_CONFIG_HOME"); xdg && *xdg) {
    std::string p = std::string(xdg) + "/vipervault/config.json";
    if (std::filesystem::exists(p, ec)) return p;
  }
  if (const char* home = std::getenv("HOME"); home && *home) {
    std::string p = std::string(home) + "/.config/vipervault/config.json";
    if (std::filesystem::exists(p, ec)) return p;
  }
  return "vipervault.json";
}

bool uses_default_password(const Config& cfg) {
  return cfg.password == kDefaultPassword;
}

} // namespace vipervault::config
