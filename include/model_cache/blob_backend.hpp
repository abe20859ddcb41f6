#pragma once

#include "model_cache/backend.hpp"

#include <cstddef>
#include <cstdint>
#include <unordered_map>

namespace model_cache {

enum class FsyncMode { Never, Always };

struct BlobStoreConfig {
  std::string dir{"./model_cache_data/ml-model-cache.blobs"};
  FsyncMode fsync{FsyncMode::Always};
};

struct BlobStoreStats {
  std::uint64_t gets{0};
  std::uint64_t puts{0};
  std::uint64_t torn_records_dropped{0};
  double read_mb{0.0};
  double write_mb{0.0};
  std::size_t index_rebuild_ms{0};
};

// Request/response style blob cache. Each entry is one response object
// addressed by the request path "/models/{id}"; the structured fields travel
// beside the body as a metadata header, the way a response carries headers.
//
// On-disk record: BlobHeader | metadata json | payload bytes.
class BlobBackend final : public IStorageBackend {
public:
  explicit BlobBackend(BlobStoreConfig cfg);

  // Creates the directory tree and rebuilds the metadata index from the
  // record headers, dropping torn or corrupt records left by a crash.
  bool init(std::string *err = nullptr);

  StorageKind kind() const override { return StorageKind::BlobCache; }
  std::string name() const override { return "blob-cache"; }

  bool put(const CacheEntry &entry, std::string *err = nullptr) override;
  std::optional<CacheEntry> get(const std::string &id,
                                std::string *err = nullptr) override;
  std::optional<ModelMeta> stat(const std::string &id,
                                std::string *err = nullptr) override;
  bool remove(const std::string &id, std::string *err = nullptr) override;
  // No in-place metadata update: rewrites the whole response.
  bool touch(const std::string &id, TimePoint at,
             std::string *err = nullptr) override;
  bool list_all(std::vector<ModelMeta> *out,
                std::string *err = nullptr) override;

  static std::string request_path(const std::string &id);
  static std::string meta_to_header(const ModelMeta &meta);
  static bool parse_meta_header(const std::string &header, ModelMeta *out);

  const BlobStoreStats &stats() const { return stats_; }
  std::size_t size() const { return index_.size(); }

private:
  std::string models_dir() const;
  std::string file_path(const std::string &id) const;
  bool write_record(const std::string &path, const std::string &header,
                    const std::vector<std::uint8_t> &payload,
                    std::string *err);
  bool read_record(const std::string &path, ModelMeta *meta,
                   std::vector<std::uint8_t> *payload, std::string *err);
  bool scan_models_dir(std::string *err);

  BlobStoreConfig cfg_;
  BlobStoreStats stats_;
  bool ready_{false};
  std::unordered_map<std::string, ModelMeta> index_;
};

} // namespace model_cache
