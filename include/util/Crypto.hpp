#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>

namespace vipervault::util {

// RFC 4648 base64url, no padding.
[[nodiscard]] auto base64url_encode(const unsigned char* data, size_t len) -> std::string;

// nbytes from the OpenSSL CSPRNG, base64url encoded. nullopt if RAND_bytes fails.
[[nodiscard]] auto random_token(size_t nbytes) -> std::optional<std::string>;

// Constant-time for equal lengths; unequal lengths compare false.
[[nodiscard]] bool constant_time_equals(std::string_view a, std::string_view b);

} // namespace vipervault::util
