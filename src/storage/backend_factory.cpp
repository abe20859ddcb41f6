#include "model_cache/backend.hpp"
#include "model_cache/blob_backend.hpp"
#include "model_cache/memory_backend.hpp"
#include "model_cache/policy.hpp"
#include "model_cache/sqlite_backend.hpp"

#include <filesystem>

namespace model_cache {
namespace {
bool ensure_dir(const std::string &dir, std::string *err) {
  std::error_code ec;
  std::filesystem::create_directories(dir, ec);
  if (ec) {
    if (err)
      *err = "cannot create " + dir + ": " + ec.message();
    return false;
  }
  return true;
}
} // namespace

bool IStorageBackend::scan_lru(std::size_t bytes, const std::string &exclude,
                               std::vector<ModelMeta> *out, std::string *err) {
  out->clear();
  std::vector<ModelMeta> all;
  if (!list_all(&all, err))
    return false;
  sort_by_recency(all);
  std::size_t covered = 0;
  for (auto &m : all) {
    if (covered >= bytes)
      break;
    if (m.id == exclude)
      continue;
    covered += m.size_bytes;
    out->push_back(std::move(m));
  }
  return true;
}

std::unique_ptr<IStorageBackend> open_backend(StorageKind kind,
                                              const CacheConfig &cfg,
                                              std::string *err) {
  switch (kind) {
  case StorageKind::Memory:
    return std::make_unique<MemoryBackend>();
  case StorageKind::DurableKv: {
    if (!ensure_dir(cfg.data_dir, err))
      return nullptr;
    auto db = std::make_unique<SqliteBackend>(cfg.data_dir + "/" +
                                              cfg.cache_name + ".sqlite3");
    if (!db->open(err))
      return nullptr;
    return db;
  }
  case StorageKind::BlobCache: {
    BlobStoreConfig bc;
    bc.dir = cfg.data_dir + "/" + cfg.cache_name + ".blobs";
    auto blobs = std::make_unique<BlobBackend>(bc);
    if (!blobs->init(err))
      return nullptr;
    return blobs;
  }
  }
  if (err)
    *err = "unknown storage kind";
  return nullptr;
}

} // namespace model_cache
