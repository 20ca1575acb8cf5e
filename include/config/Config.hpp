#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace vipervault::config {

struct ViewConfig {
  std::string name;
  std::string cmd;
  int refresh{30};        // seconds; <= 0 disables auto-refresh
  bool safe_output{true}; // HTML-escape command output
  bool bottom{true};      // scroll to the end after each refresh
};

inline constexpr const char* kDefaultPassword = "correct horse battery staple";

struct Config {
  std::string password{kDefaultPassword};
  int refresh_interval{30};
  int session_duration{86400};
  int inactivity_timeout{3600};
  std::string title{"Log Viewer"};

  std::string listen_address{"127.0.0.1"};
  uint16_t port{8080};
  std::string session_dir{".sessions"};
  int command_timeout{30};
  size_t max_output_bytes{4u * 1024u * 1024u};
  int workers{4};
  bool secure_cookie{false};

  std::string source_path;
  // Sorted by name, case-insensitive.
  std::vector<ViewConfig> views;
};

struct ConfigResult {
  std::optional<Config> config;
  std::string error;
};

// Parse configuration JSON. Relative session_dir is resolved against base_dir.
[[nodiscard]] auto parse_config(std::string_view json_text, const std::string& base_dir) -> ConfigResult;

// Read and parse a configuration file.
[[nodiscard]] auto load_config(const std::string& path) -> ConfigResult;

// VIPERVAULT_LISTEN_ADDRESS, VIPERVAULT_PORT, VIPERVAULT_SESSION_DIR, VIPERVAULT_WORKERS.
void apply_env_overrides(Config& cfg);

[[nodiscard]] auto find_view(const Config& cfg, std::string_view name) -> const ViewConfig*;

// Resolve the config path: CLI override, VIPERVAULT_CONFIG, XDG, HOME, ./vipervault.json.
[[nodiscard]] auto config_file_path(const std::string& cli_override = {}) -> std::string;

[[nodiscard]] bool uses_default_password(const Config& cfg);

// Environment variable helpers
const char* getenv_compat(const char* name);
int getenv_int(const char* name, int defv);

} // namespace vipervault::config
