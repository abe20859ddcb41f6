#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

namespace model_cache {

using Clock = std::chrono::system_clock;
using TimePoint = Clock::time_point;

struct ModelMeta {
  std::string id;
  std::size_t size_bytes{0};
  TimePoint created_at{};
  TimePoint last_accessed{};
  std::string version{"1.0.0"};
  std::string checksum;
};

struct CacheEntry {
  ModelMeta meta;
  std::vector<std::uint8_t> payload;
};

enum class ErrorCode {
  None,
  InvalidArgument,
  Capacity,
  Integrity,
  BackendUnavailable,
  Backend,
  Config
};

struct CacheError {
  ErrorCode code{ErrorCode::None};
  std::string message;
};

const char *error_code_name(ErrorCode code);

inline void set_error(CacheError *err, ErrorCode code, std::string message) {
  if (err) {
    err->code = code;
    err->message = std::move(message);
  }
}

inline std::int64_t to_epoch_ms(TimePoint t) {
  return static_cast<std::int64_t>(
      std::chrono::duration_cast<std::chrono::milliseconds>(t.time_since_epoch())
          .count());
}

inline TimePoint from_epoch_ms(std::int64_t ms) {
  return TimePoint(std::chrono::duration_cast<Clock::duration>(
      std::chrono::milliseconds(ms)));
}

} // namespace model_cache
