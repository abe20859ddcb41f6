#pragma once

#include <chrono>
#include <cstddef>
#include <optional>
#include <string>

namespace model_cache {

enum class StorageKind { Memory, DurableKv, BlobCache };

const char *storage_kind_name(StorageKind kind);
std::optional<StorageKind> parse_storage_kind(const std::string &name);

struct CacheConfig {
  std::size_t max_size_bytes{500ULL * 1024 * 1024};
  std::chrono::milliseconds max_age{std::chrono::hours(7 * 24)};
  StorageKind storage{StorageKind::DurableKv};
  // Advisory; payloads are stored as handed in.
  bool compression_enabled{true};
  std::string data_dir{"./model_cache_data"};
  std::string cache_name{"ml-model-cache"};
  std::chrono::milliseconds sweep_interval{std::chrono::hours(1)};
  bool verify_on_retrieve{false};
};

// Partial update; unset fields keep their current value.
struct ConfigUpdate {
  std::optional<std::size_t> max_size_bytes;
  std::optional<std::chrono::milliseconds> max_age;
  std::optional<StorageKind> storage;
  std::optional<bool> compression_enabled;
  std::optional<std::chrono::milliseconds> sweep_interval;
  std::optional<bool> verify_on_retrieve;
};

void apply_update(CacheConfig &cfg, const ConfigUpdate &update);

bool load_config_file(const std::string &path, CacheConfig *out,
                      std::string *err = nullptr);

} // namespace model_cache
