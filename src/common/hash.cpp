#include "shellgate/common/hash.hpp"

#include <iomanip>
#include <openssl/rand.h>
#include <openssl/sha.h>
#include <random>
#include <sstream>
#include <vector>

namespace shellgate::common {

namespace {

std::string to_hex(const unsigned char *data, std::size_t size) {
  std::ostringstream stream;
  stream << std::hex << std::setfill('0');
  for (std::size_t i = 0; i < size; ++i) {
    stream << std::setw(2) << static_cast<int>(data[i]);
  }
  return stream.str();
}

} // namespace

std::string sha256_hex(const std::string &text) {
  unsigned char digest[SHA256_DIGEST_LENGTH];
  SHA256(reinterpret_cast<const unsigned char *>(text.data()), text.size(), digest);
  return to_hex(digest, sizeof(digest));
}

std::string random_hex(std::size_t bytes) {
  std::vector<unsigned char> buffer(bytes);
  if (RAND_bytes(buffer.data(), static_cast<int>(buffer.size())) != 1) {
    std::random_device rd;
    for (auto &byte : buffer) {
      byte = static_cast<unsigned char>(rd() & 0xFF);
    }
  }
  return to_hex(buffer.data(), buffer.size());
}

} // namespace shellgate::common
