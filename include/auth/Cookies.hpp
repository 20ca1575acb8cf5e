#pragma once

#include <optional>
#include <string>
#include <string_view>

namespace vipervault::auth {

inline constexpr std::string_view kSessionCookie = "session_token";

// Value of a named cookie from a Cookie request header.
[[nodiscard]] auto find_cookie(std::string_view header, std::string_view name) -> std::optional<std::string>;

[[nodiscard]] inline auto extract_session_token(std::string_view header) -> std::optional<std::string> {
  return find_cookie(header, kSessionCookie);
}

[[nodiscard]] auto make_session_cookie(std::string_view token, int max_age, bool secure) -> std::string;
[[nodiscard]] auto make_clear_cookie(bool secure) -> std::string;

// Compare a login attempt against the configured password.
[[nodiscard]] bool password_matches(std::string_view attempt, std::string_view expected);

} // namespace vipervault::auth
