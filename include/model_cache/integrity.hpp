#pragma once

#include "model_cache/types.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace model_cache {

constexpr std::size_t kChecksumHexLen = 64;

// Lowercase hex SHA-256 of the payload.
std::string sha256_hex(const std::vector<std::uint8_t> &payload);

// True when the entry's recorded size and checksum match its payload.
bool verify_checksum(const CacheEntry &entry);

} // namespace model_cache
