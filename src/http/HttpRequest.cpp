#include "http/HttpRequest.hpp"
#include "util/Strings.hpp"

#include <charconv>

namespace vipervault::http {

static int hex_value(char c) {
  if (c >= '0' && c <= '9') return c - '0';
  if (c >= 'a' && c <= 'f') return c - 'a' + 10;
  if (c >= 'A' && c <= 'F') return c - 'A' + 10;
  return -1;
}

auto url_decode(std::string_view s) -> std::string {
  std::string out;
  out.reserve(s.size());
  for (size_t i = 0; i < s.size(); ++i) {
    char c = s[i];
    if (c == '+') {
      out.push_back(' ');
    } else if (c == '%' && i + 2 < s.size()) {
      int hi = hex_value(s[i + 1]), lo = hex_value(s[i + 2]);
      if (hi < 0 || lo < 0) { out.push_back(c); continue; }
      out.push_back(static_cast<char>(hi * 16 + lo));
      i += 2;
    } else {
      out.push_back(c);
    }
  }
  return out;
}

auto parse_query(std::string_view qs) -> Params {
  Params out;
  while (!qs.empty()) {
    auto amp = qs.find('&');
    std::string_view pair = qs.substr(0, amp);
    qs = (amp == std::string_view::npos) ? std::string_view{} : qs.substr(amp + 1);
    if (pair.empty()) continue;
    auto eq = pair.find('=');
    if (eq == std::string_view::npos) {
      out.emplace_back(url_decode(pair), std::string());
    } else {
      out.emplace_back(url_decode(pair.substr(0, eq)), url_decode(pair.substr(eq + 1)));
    }
  }
  return out;
}

size_t find_head_end(std::string_view raw) {
  auto crlf = raw.find("\r\n\r\n");
  auto lf = raw.find("\n\n");
  if (crlf == std::string_view::npos && lf == std::string_view::npos) return std::string_view::npos;
  if (lf == std::string_view::npos || (crlf != std::string_view::npos && crlf < lf)) return crlf + 4;
  return lf + 2;
}

auto parse_request(std::string_view raw) -> std::optional<HttpRequest> {
  size_t head_end = find_head_end(raw);
  if (head_end == std::string_view::npos) return std::nullopt;
  std::string_view head = raw.substr(0, head_end);

  auto line_end = head.find('\n');
  std::string_view request_line = util::trim(head.substr(0, line_end));
  head = head.substr(line_end + 1);

  // METHOD SP target SP version
  auto sp1 = request_line.find(' ');
  if (sp1 == std::string_view::npos) return std::nullopt;
  auto sp2 = request_line.find(' ', sp1 + 1);
  if (sp2 == std::string_view::npos) return std::nullopt;
  std::string_view method = request_line.substr(0, sp1);
  std::string_view target = request_line.substr(sp1 + 1, sp2 - sp1 - 1);
  std::string_view version = request_line.substr(sp2 + 1);
  if (method.empty() || target.empty() || !version.starts_with("HTTP/")) return std::nullopt;
  if (version.find(' ') != std::string_view::npos) return std::nullopt;

  HttpRequest req;
  req.method = std::string(method);
  req.target = std::string(target);
  auto qpos = target.find('?');
  req.path = url_decode(target.substr(0, qpos));
  if (qpos != std::string_view::npos) req.query = parse_query(target.substr(qpos + 1));

  while (!head.empty()) {
    auto nl = head.find('\n');
    std::string_view line = util::trim(head.substr(0, nl));
    head = (nl == std::string_view::npos) ? std::string_view{} : head.substr(nl + 1);
    if (line.empty()) continue;
    auto colon = line.find(':');
    if (colon == std::string_view::npos || colon == 0) return std::nullopt;
    req.headers.emplace_back(util::to_lower_copy(util::trim(line.substr(0, colon))),
                             std::string(util::trim(line.substr(colon + 1))));
  }

  req.body = std::string(raw.substr(head_end));
  size_t len = req.content_length();
  if (req.body.size() > len) req.body.resize(len);
  return req;
}

auto HttpRequest::header(std::string_view name) const -> std::optional<std::string> {
  for (const auto& [k, v] : headers)
    if (util::iequals(k, name)) return v;
  return std::nullopt;
}

auto HttpRequest::param(std::string_view name) const -> std::optional<std::string> {
  for (const auto& [k, v] : query)
    if (k == name) return v;
  auto ct = header("content-type");
  if (ct && util::to_lower_copy(*ct).starts_with("application/x-www-form-urlencoded")) {
    for (const auto& [k, v] : parse_query(body))
      if (k == name) return v;
  }
  return std::nullopt;
}

size_t HttpRequest::content_length() const {
  auto v = header("content-length");
  if (!v) return 0;
  size_t n = 0;
  auto [ptr, ec] = std::from_chars(v->data(), v->data() + v->size(), n);
  if (ec != std::errc{} || ptr != v->data() + v->size()) return 0;
  return n;
}

bool HttpRequest::is_https() const {
  if (auto proto = header("x-forwarded-proto")) {
    auto first = util::trim(std::string_view(*proto).substr(0, proto->find(',')));
    if (util::iequals(first, "https")) return true;
  }
  if (auto ssl = header("x-forwarded-ssl")) {
    if (util::iequals(util::trim(*ssl), "on")) return true;
  }
  return false;
}

} // namespace vipervault::http
