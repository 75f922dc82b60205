#pragma once

#include <cstddef>
#include <string>

namespace shellgate::common {

[[nodiscard]] std::string sha256_hex(const std::string &text);

// Hex string of `bytes` random bytes from the OpenSSL CSPRNG. Falls back to
// std::random_device only when RAND_bytes reports failure.
[[nodiscard]] std::string random_hex(std::size_t bytes);

} // namespace shellgate::common
