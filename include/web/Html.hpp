#pragma once

#include "config/Config.hpp"

#include <nlohmann/json_fwd.hpp>

#include <optional>
#include <string>
#include <string_view>

namespace vipervault::web {

// Same replacements as Python's html.escape.
[[nodiscard]] auto html_escape(std::string_view s, bool quote = false) -> std::string;

// JSON safe to embed inside a <script> element.
[[nodiscard]] auto json_for_script(const nlohmann::json& j) -> std::string;

// 16 random bytes, base64url. nullopt if the RNG fails.
[[nodiscard]] auto generate_nonce() -> std::optional<std::string>;

[[nodiscard]] auto content_security_policy(std::string_view nonce) -> std::string;

// Client-side view settings. Commands are left out.
[[nodiscard]] auto client_view_config(const config::Config& cfg) -> nlohmann::json;

[[nodiscard]] auto render_index_page(const config::Config& cfg, std::string_view nonce) -> std::string;

} // namespace vipervault::web
