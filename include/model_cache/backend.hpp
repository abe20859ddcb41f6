#pragma once

#include "model_cache/config.hpp"
#include "model_cache/types.hpp"

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace model_cache {

// Storage contract shared by every backend variant. An absent id is never an
// error: get/stat return std::nullopt with *err untouched, and remove of an
// absent id succeeds. Failures set *err and return false / std::nullopt.
class IStorageBackend {
public:
  virtual ~IStorageBackend() = default;
  virtual StorageKind kind() const = 0;
  virtual std::string name() const = 0;

  // Inserts or fully replaces the entry stored under entry.meta.id.
  virtual bool put(const CacheEntry &entry, std::string *err = nullptr) = 0;
  virtual std::optional<CacheEntry> get(const std::string &id,
                                        std::string *err = nullptr) = 0;
  // Metadata only; does not read the payload.
  virtual std::optional<ModelMeta> stat(const std::string &id,
                                        std::string *err = nullptr) = 0;
  virtual bool remove(const std::string &id, std::string *err = nullptr) = 0;
  // Updates last_accessed of an existing entry; false if absent or failed.
  virtual bool touch(const std::string &id, TimePoint at,
                     std::string *err = nullptr) = 0;
  virtual bool list_all(std::vector<ModelMeta> *out,
                        std::string *err = nullptr) = 0;

  // Oldest-accessed entries first, skipping `exclude`, stopping as soon as
  // their sizes add up to `bytes` (or the entries run out). The default
  // sorts list_all; backends with an ordered index walk it instead.
  virtual bool scan_lru(std::size_t bytes, const std::string &exclude,
                        std::vector<ModelMeta> *out,
                        std::string *err = nullptr);
};

// Opens the backend selected by cfg.storage under cfg.data_dir. Returns
// nullptr with *err set when the variant cannot initialize here.
std::unique_ptr<IStorageBackend> open_backend(StorageKind kind,
                                              const CacheConfig &cfg,
                                              std::string *err = nullptr);

} // namespace model_cache
