#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace vipervault::http {

using Params = std::vector<std::pair<std::string, std::string>>;

struct HttpRequest {
  std::string method;
  std::string target;  // raw request-target
  std::string path;    // target without the query string, percent-decoded
  Params query;
  std::vector<std::pair<std::string, std::string>> headers; // names lowercased
  std::string body;
  std::string peer;    // "addr:port" when known

  [[nodiscard]] auto header(std::string_view name) const -> std::optional<std::string>;
  // Query string first, then a form-urlencoded body.
  [[nodiscard]] auto param(std::string_view name) const -> std::optional<std::string>;
  [[nodiscard]] size_t content_length() const;
  // Forwarded by a TLS-terminating proxy
  [[nodiscard]] bool is_https() const;
};

// Parse a complete request (head and any body bytes read so far).
[[nodiscard]] auto parse_request(std::string_view raw) -> std::optional<HttpRequest>;

// Offset just past the blank line ending the head, or npos.
[[nodiscard]] size_t find_head_end(std::string_view raw);

[[nodiscard]] auto url_decode(std::string_view s) -> std::string;
[[nodiscard]] auto parse_query(std::string_view qs) -> Params;

} // namespace vipervault::http
