#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace model_cache {

// Field lookups on flat, single-level JSON objects such as the config and
// stats records this library writes itself.
std::optional<std::string> json_string(const std::string &json,
                                       const std::string &key);
std::optional<std::uint64_t> json_u64(const std::string &json,
                                      const std::string &key);
std::optional<std::int64_t> json_i64(const std::string &json,
                                     const std::string &key);
std::optional<bool> json_bool(const std::string &json, const std::string &key);

bool looks_like_json_object(const std::string &text);
std::string json_escape(const std::string &s);

} // namespace model_cache
