#include "model_cache/integrity.hpp"

#include <openssl/sha.h>

namespace model_cache {

std::string sha256_hex(const std::vector<std::uint8_t> &payload) {
  unsigned char digest[SHA256_DIGEST_LENGTH];
  SHA256(payload.data(), payload.size(), digest);
  static const char *hex = "0123456789abcdef";
  std::string out(kChecksumHexLen, '0');
  for (std::size_t i = 0; i < SHA256_DIGEST_LENGTH; ++i) {
    out[2 * i] = hex[(digest[i] >> 4) & 0xF];
    out[2 * i + 1] = hex[digest[i] & 0xF];
  }
  return out;
}

bool verify_checksum(const CacheEntry &entry) {
  if (entry.meta.size_bytes != entry.payload.size())
    return false;
  return entry.meta.checksum == sha256_hex(entry.payload);
}

} // namespace model_cache
