#pragma once

#include <nlohmann/json_fwd.hpp>

#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace vipervault::http {

struct HttpResponse {
  int status{200};
  std::vector<std::pair<std::string, std::string>> headers;
  std::string body;

  HttpResponse& set_header(std::string name, std::string value);
  HttpResponse& add_header(std::string name, std::string value);
  [[nodiscard]] const std::string* find_header(std::string_view name) const;

  // Status line, headers, Content-Length and Connection: close.
  [[nodiscard]] std::string serialize_head() const;

  [[nodiscard]] static HttpResponse text(int status, std::string body);
  [[nodiscard]] static HttpResponse json(int status, const nlohmann::json& j);
  [[nodiscard]] static HttpResponse html(std::string body);
};

[[nodiscard]] const char* reason_phrase(int status);

} // namespace vipervault::http
