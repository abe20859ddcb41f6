#pragma once

#include "model_cache/backend.hpp"

#include <unordered_map>

namespace model_cache {

// Process-local map; contents are lost when the process exits.
class MemoryBackend final : public IStorageBackend {
public:
  StorageKind kind() const override { return StorageKind::Memory; }
  std::string name() const override { return "memory"; }

  bool put(const CacheEntry &entry, std::string *err = nullptr) override;
  std::optional<CacheEntry> get(const std::string &id,
                                std::string *err = nullptr) override;
  std::optional<ModelMeta> stat(const std::string &id,
                                std::string *err = nullptr) override;
  bool remove(const std::string &id, std::string *err = nullptr) override;
  bool touch(const std::string &id, TimePoint at,
             std::string *err = nullptr) override;
  bool list_all(std::vector<ModelMeta> *out,
                std::string *err = nullptr) override;

  std::size_t size() const { return entries_.size(); }

private:
  std::unordered_map<std::string, CacheEntry> entries_;
};

} // namespace model_cache
