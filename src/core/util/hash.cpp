#include "core/util/hash.hpp"

#include <array>
#include <cctype>

#include <sodium.h>

#include "core/util/canonical.hpp"

namespace regen::util {

Result init_hashing() {
  if (sodium_init() < 0) {
    return Result::configuration("sodium-init", "libsodium initialization failed.");
  }
  return Result::success();
}

std::string sha256_hex(std::string_view payload) {
  std::array<unsigned char, crypto_hash_sha256_BYTES> digest{};
  crypto_hash_sha256(digest.data(), reinterpret_cast<const unsigned char*>(payload.data()),
                     static_cast<unsigned long long>(payload.size()));
  return to_hex(std::string_view{reinterpret_cast<const char*>(digest.data()), digest.size()});
}

bool looks_like_content_hash(std::string_view value, std::size_t max_length) {
  if (value.empty() || value.size() > max_length) {
    return false;
  }
  for (unsigned char c : value) {
    if (std::isalnum(c) == 0 && c != '-' && c != '_' && c != ':') {
      return false;
    }
  }
  return true;
}

}  // namespace regen::util
