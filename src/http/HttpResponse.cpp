#include "http/HttpResponse.hpp"
#include "util/Strings.hpp"

#include <nlohmann/json.hpp>

#include <charconv>

namespace vipervault::http {

const char* reason_phrase(int status) {
  switch (status) {
    case 200: return "OK";
    case 204: return "No Content";
    case 400: return "Bad Request";
    case 401: return "Unauthorized";
    case 403: return "Forbidden";
    case 404: return "Not Found";
    case 405: return "Method Not Allowed";
    case 408: return "Request Timeout";
    case 413: return "Payload Too Large";
    case 431: return "Request Header Fields Too Large";
    case 500: return "Internal Server Error";
    case 503: return "Service Unavailable";
    default:  return "Unknown";
  }
}

HttpResponse& HttpResponse::set_header(std::string name, std::string value) {
  for (auto& [k, v] : headers) {
    if (util::iequals(k, name)) { v = std::move(value); return *this; }
  }
  headers.emplace_back(std::move(name), std::move(value));
  return *this;
}

HttpResponse& HttpResponse::add_header(std::string name, std::string value) {
  headers.emplace_back(std::move(name), std::move(value));
  return *this;
}

const std::string* HttpResponse::find_header(std::string_view name) const {
  for (const auto& [k, v] : headers)
    if (util::iequals(k, name)) return &v;
  return nullptr;
}

std::string HttpResponse::serialize_head() const {
  std::string out = "HTTP/1.1 " + std::to_string(status) + " " + reason_phrase(status) + "\r\n";
  for (const auto& [k, v] : headers) {
    out += k;
    out += ": ";
    out += v;
    out += "\r\n";
  }
  out += "Content-Length: ";
  char len_buf[24];
  auto [ptr, ec] = std::to_chars(len_buf, len_buf + sizeof(len_buf), body.size());
  out.append(len_buf, ptr);
  out += "\r\nConnection: close\r\n\r\n";
  return out;
}

HttpResponse HttpResponse::text(int status, std::string body) {
  HttpResponse r;
  r.status = status;
  r.body = std::move(body);
  r.set_header("Content-Type", "text/plain; charset=utf-8");
  return r;
}

HttpResponse HttpResponse::json(int status, const nlohmann::json& j) {
  HttpResponse r;
  r.status = status;
  r.body = j.dump();
  r.set_header("Content-Type", "application/json");
  return r;
}

HttpResponse HttpResponse::html(std::string body) {
  HttpResponse r;
  r.status = 200;
  r.body = std::move(body);
  r.set_header("Content-Type", "text/html; charset=utf-8");
  return r;
}

} // namespace vipervault::http
