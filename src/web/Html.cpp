#include "web/Html.hpp"
#include "util/Crypto.hpp"

#include <nlohmann/json.hpp>

namespace vipervault::web {

auto html_escape(std::string_view s, bool quote) -> std::string {
  std::string out;
  out.reserve(s.size() + s.size() / 8);
  for (char c : s) {
    switch (c) {
      case '&': out += "&amp;"; break;
      case '<': out += "&lt;"; break;
      case '>': out += "&gt;"; break;
      case '"': if (quote) out += "&quot;"; else out.push_back(c); break;
      case '\'': if (quote) out += "&#x27;"; else out.push_back(c); break;
      default: out.push_back(c);
    }
  }
  return out;
}

auto json_for_script(const nlohmann::json& j) -> std::string {
  std::string raw = j.dump();
  std::string out;
  out.reserve(raw.size());
  for (char c : raw) {
    switch (c) {
      case '<': out += "\\u003c"; break;
      case '>': out += "\\u003e"; break;
      case '&': out += "\\u0026"; break;
      default: out.push_back(c);
    }
  }
  return out;
}

auto generate_nonce() -> std::optional<std::string> {
  return util::random_token(16);
}

auto content_security_policy(std::string_view nonce) -> std::string {
  return "default-src 'self'; script-src 'self' 'nonce-" + std::string(nonce) +
         "'; style-src 'self' 'unsafe-inline';";
}

auto client_view_config(const config::Config& cfg) -> nlohmann::json {
  nlohmann::json j = nlohmann::json::object();
  for (const auto& v : cfg.views) {
    j[v.name] = {{"refresh", v.refresh}, {"bottom", v.bottom}, {"safe_output", v.safe_output}};
  }
  return j;
}

} // namespace vipervault::web
