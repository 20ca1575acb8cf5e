#include "auth/Cookies.hpp"
#include "util/Crypto.hpp"
#include "util/Strings.hpp"

namespace vipervault::auth {

auto find_cookie(std::string_view header, std::string_view name) -> std::optional<std::string> {
  while (!header.empty()) {
    auto semi = header.find(';');
    std::string_view pair = util::trim(header.substr(0, semi));
    header = (semi == std::string_view::npos) ? std::string_view{} : header.substr(semi + 1);

    auto eq = pair.find('=');
    if (eq == std::string_view::npos) continue;
    if (util::trim(pair.substr(0, eq)) != name) continue;

    std::string_view val = util::trim(pair.substr(eq + 1));
    if (val.size() >= 2 && val.front() == '"' && val.back() == '"')
      val = val.substr(1, val.size() - 2);
    return std::string(val);
  }
  return std::nullopt;
}

static std::string cookie_attrs(int max_age, bool secure) {
  std::string s = "; Path=/; Max-Age=" + std::to_string(max_age) + "; HttpOnly; SameSite=Lax";
  if (secure) s += "; Secure";
  return s;
}

auto make_session_cookie(std::string_view token, int max_age, bool secure) -> std::string {
  return std::string(kSessionCookie) + "=" + std::string(token) + cookie_attrs(max_age, secure);
}

auto make_clear_cookie(bool secure) -> std::string {
  return std::string(kSessionCookie) + "=" + cookie_attrs(0, secure);
}

bool password_matches(std::string_view attempt, std::string_view expected) {
  return util::constant_time_equals(attempt, expected);
}

} // namespace vipervault::auth
