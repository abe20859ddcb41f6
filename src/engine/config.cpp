#include "model_cache/config.hpp"
#include "model_cache/json_fields.hpp"

#include <algorithm>
#include <fstream>
#include <sstream>

namespace model_cache {

const char *storage_kind_name(StorageKind kind) {
  switch (kind) {
  case StorageKind::Memory:
    return "memory";
  case StorageKind::DurableKv:
    return "durable-kv";
  case StorageKind::BlobCache:
    return "blob-cache";
  }
  return "memory";
}

std::optional<StorageKind> parse_storage_kind(const std::string &name) {
  if (name == "memory")
    return StorageKind::Memory;
  if (name == "durable-kv" || name == "sqlite")
    return StorageKind::DurableKv;
  if (name == "blob-cache" || name == "blob")
    return StorageKind::BlobCache;
  return std::nullopt;
}

void apply_update(CacheConfig &cfg, const ConfigUpdate &update) {
  if (update.max_size_bytes)
    cfg.max_size_bytes = *update.max_size_bytes;
  if (update.max_age)
    cfg.max_age = *update.max_age;
  if (update.storage)
    cfg.storage = *update.storage;
  if (update.compression_enabled)
    cfg.compression_enabled = *update.compression_enabled;
  if (update.sweep_interval)
    cfg.sweep_interval = *update.sweep_interval;
  if (update.verify_on_retrieve)
    cfg.verify_on_retrieve = *update.verify_on_retrieve;
}

bool load_config_file(const std::string &path, CacheConfig *out,
                      std::string *err) {
  std::ifstream in(path);
  if (!in.is_open()) {
    if (err)
      *err = "config file not found: " + path;
    return false;
  }
  std::stringstream ss;
  ss << in.rdbuf();
  const std::string text = ss.str();
  if (!looks_like_json_object(text)) {
    if (err)
      *err = "invalid schema";
    return false;
  }

  CacheConfig cfg = *out;
  constexpr std::uint64_t kMaxBytes = 1ULL << 44;
  constexpr std::uint64_t kMaxAgeMs = 10ULL * 365 * 24 * 60 * 60 * 1000;
  constexpr std::uint64_t kMinSweepMs = 10;

  if (auto v = json_u64(text, "max_size_bytes"))
    cfg.max_size_bytes = static_cast<std::size_t>(
        std::clamp<std::uint64_t>(*v, 1, kMaxBytes));
  if (auto v = json_u64(text, "max_age_ms"))
    cfg.max_age = std::chrono::milliseconds(
        std::clamp<std::uint64_t>(*v, 1, kMaxAgeMs));
  if (auto v = json_string(text, "storage")) {
    auto kind = parse_storage_kind(*v);
    if (!kind) {
      if (err)
        *err = "unknown storage type: " + *v;
      return false;
    }
    cfg.storage = *kind;
  }
  if (auto v = json_bool(text, "compression_enabled"))
    cfg.compression_enabled = *v;
  if (auto v = json_string(text, "data_dir"))
    cfg.data_dir = *v;
  if (auto v = json_string(text, "cache_name")) {
    if (v->empty() || v->find('/') != std::string::npos) {
      if (err)
        *err = "invalid cache_name";
      return false;
    }
    cfg.cache_name = *v;
  }
  if (auto v = json_u64(text, "sweep_interval_ms"))
    cfg.sweep_interval = std::chrono::milliseconds(
        std::clamp<std::uint64_t>(*v, kMinSweepMs, kMaxAgeMs));
  if (auto v = json_bool(text, "verify_on_retrieve"))
    cfg.verify_on_retrieve = *v;

  *out = cfg;
  return true;
}

} // namespace model_cache
