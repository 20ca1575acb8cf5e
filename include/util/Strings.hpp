#pragma once

#include <string>
#include <string_view>

namespace vipervault::util {

[[nodiscard]] inline char ascii_lower(unsigned char c) {
  return (c >= 'A' && c <= 'Z') ? static_cast<char>(c - 'A' + 'a') : static_cast<char>(c);
}

[[nodiscard]] inline std::string to_lower_copy(std::string_view s) {
  std::string out;
  out.reserve(s.size());
  for (unsigned char c : s) out.push_back(ascii_lower(c));
  return out;
}

[[nodiscard]] inline bool iequals(std::string_view a, std::string_view b) {
  if (a.size() != b.size()) return false;
  for (size_t i = 0; i < a.size(); ++i)
    if (ascii_lower(a[i]) != ascii_lower(b[i])) return false;
  return true;
}

[[nodiscard]] inline std::string_view trim(std::string_view sv) {
  while (!sv.empty() && (sv.front() == ' ' || sv.front() == '\t' || sv.front() == '\r' || sv.front() == '\n'))
    sv.remove_prefix(1);
  while (!sv.empty() && (sv.back() == ' ' || sv.back() == '\t' || sv.back() == '\r' || sv.back() == '\n'))
    sv.remove_suffix(1);
  return sv;
}

// First 6 characters of a secret, for log lines.
[[nodiscard]] inline std::string redact(std::string_view secret) {
  if (secret.size() <= 6) return std::string(secret.size(), '*');
  return std::string(secret.substr(0, 6)) + "...";
}

} // namespace vipervault::util
