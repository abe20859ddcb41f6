#pragma once

#include "model_cache/backend.hpp"

struct sqlite3;

namespace model_cache {

// Durable key-value backend: one SQLite table keyed by id with a secondary
// index on (last_accessed, created_at, id), so list_all returns entries
// oldest-accessed first straight from the index.
class SqliteBackend final : public IStorageBackend {
public:
  explicit SqliteBackend(std::string db_path);
  ~SqliteBackend() override;

  SqliteBackend(const SqliteBackend &) = delete;
  SqliteBackend &operator=(const SqliteBackend &) = delete;

  bool open(std::string *err = nullptr);
  bool is_open() const { return db_ != nullptr; }
  const std::string &path() const { return path_; }
  // Caps the size of one stored value (SQLITE_LIMIT_LENGTH); returns the
  // previous cap. Larger payloads are rejected by put.
  std::size_t limit_value_size(std::size_t max_bytes);

  StorageKind kind() const override { return StorageKind::DurableKv; }
  std::string name() const override { return "durable-kv"; }

  bool put(const CacheEntry &entry, std::string *err = nullptr) override;
  std::optional<CacheEntry> get(const std::string &id,
                                std::string *err = nullptr) override;
  std::optional<ModelMeta> stat(const std::string &id,
                                std::string *err = nullptr) override;
  bool remove(const std::string &id, std::string *err = nullptr) override;
  // Updates the row in place; the payload is not rewritten.
  bool touch(const std::string &id, TimePoint at,
             std::string *err = nullptr) override;
  bool list_all(std::vector<ModelMeta> *out,
                std::string *err = nullptr) override;
  // Walks idx_models_last_accessed and stops once `bytes` are covered.
  bool scan_lru(std::size_t bytes, const std::string &exclude,
                std::vector<ModelMeta> *out,
                std::string *err = nullptr) override;

private:
  bool exec(const char *sql, std::string *err);
  std::string last_error() const;

  std::string path_;
  sqlite3 *db_{nullptr};
};

} // namespace model_cache
