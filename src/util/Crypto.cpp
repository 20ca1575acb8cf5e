#include "util/Crypto.hpp"

#include <openssl/crypto.h>
#include <openssl/err.h>
#include <openssl/evp.h>
#include <openssl/rand.h>

#include <cstdio>
#include <vector>

namespace vipervault::util {

auto base64url_encode(const unsigned char* data, size_t len) -> std::string {
  if (len == 0) return {};
  std::vector<unsigned char> buf(4 * ((len + 2) / 3) + 1);
  int n = EVP_EncodeBlock(buf.data(), data, static_cast<int>(len));
  std::string out;
  out.reserve(static_cast<size_t>(n));
  for (int i = 0; i < n; ++i) {
    char c = static_cast<char>(buf[static_cast<size_t>(i)]);
    if (c == '=') break;
    if (c == '+') c = '-';
    else if (c == '/') c = '_';
    out.push_back(c);
  }
  return out;
}

auto random_token(size_t nbytes) -> std::optional<std::string> {
  std::vector<unsigned char> raw(nbytes);
  if (RAND_bytes(raw.data(), static_cast<int>(raw.size())) != 1) {
    char err[256];
    ERR_error_string_n(ERR_get_error(), err, sizeof(err));
    std::fprintf(stderr, "vipervault: crypto: RAND_bytes failed: %s\n", err);
    return std::nullopt;
  }
  auto token = base64url_encode(raw.data(), raw.size());
  OPENSSL_cleanse(raw.data(), raw.size());
  return token;
}

bool constant_time_equals(std::string_view a, std::string_view b) {
  if (a.size() != b.size()) return false;
  if (a.empty()) return true;
  return CRYPTO_memcmp(a.data(), b.data(), a.size()) == 0;
}

} // namespace vipervault::util
