#pragma once

#include "model_cache/backend.hpp"
#include "model_cache/config.hpp"
#include "model_cache/policy.hpp"
#include "model_cache/stats.hpp"
#include "model_cache/types.hpp"

#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace model_cache {

// Preferred -> Fallback happens at most once and is never undone.
enum class BackendState { Preferred, Fallback };

// Content-addressed artifact cache. Every public operation runs under one
// mutex, so space reservation, eviction and the write are a single critical
// section and the tracked size always matches the live entry set.
class ModelCache {
public:
  using ClockFn = std::function<TimePoint()>;

  // Opens cfg.storage (falling back to memory if it cannot initialize) and
  // persists stats to <data_dir>/<cache_name>.stats.json.
  explicit ModelCache(CacheConfig cfg, ClockFn clock = {});
  ModelCache(CacheConfig cfg, std::unique_ptr<IStatsStore> stats_store,
             ClockFn clock = {});
  // Uses the given backend as-is; cfg.storage is overwritten by its kind.
  ModelCache(CacheConfig cfg, std::unique_ptr<IStorageBackend> backend,
             std::unique_ptr<IStatsStore> stats_store, ClockFn clock = {});

  ModelCache(const ModelCache &) = delete;
  ModelCache &operator=(const ModelCache &) = delete;

  // Fails with ErrorCode::Capacity only when the payload alone exceeds
  // max_size_bytes; any other space pressure is resolved by eviction.
  bool store(const std::string &id, const std::vector<std::uint8_t> &payload,
             const std::string &version = "1.0.0", CacheError *err = nullptr);
  std::optional<std::vector<std::uint8_t>> retrieve(const std::string &id,
                                                    CacheError *err = nullptr);
  bool remove(const std::string &id, CacheError *err = nullptr);
  // Same side effects as retrieve (expiry check, recency, hit/miss).
  bool has(const std::string &id, CacheError *err = nullptr);
  // Recomputes the checksum; a corrupt entry is removed and false returned.
  bool verify(const std::string &id, CacheError *err = nullptr);
  bool clear(CacheError *err = nullptr);

  // Removes every entry older than max_age and resyncs size/count with the
  // scanned live set. Per-entry failures are logged and skipped.
  std::size_t sweep_expired();

  // Live, unexpired entries, oldest-accessed first.
  std::vector<ModelMeta> list();

  StatsSnapshot stats() const;
  CacheConfig config() const;
  void update_config(const ConfigUpdate &update);

  std::string info() const;
  std::string backend_name() const;
  BackendState backend_state() const;
  bool fell_back() const { return backend_state() == BackendState::Fallback; }

private:
  void init_locked();
  void open_storage_locked(StorageKind kind);
  TimePoint now() const;
  bool is_expired(const ModelMeta &meta, TimePoint now) const;
  bool ensure_space_locked(std::size_t bytes, const std::string &replacing,
                           std::size_t replacing_size, CacheError *err);
  // Removes policy-chosen victims from `candidates` until `need` bytes are
  // freed; returns the bytes actually freed.
  std::uint64_t evict_locked(const std::vector<ModelMeta> &candidates,
                             std::uint64_t need);
  bool erase_locked(const ModelMeta &meta, RemovalCause cause,
                    std::string *err);
  bool reconcile_locked();
  std::optional<CacheEntry> lookup_locked(const std::string &id,
                                          CacheError *err);

  mutable std::mutex mu_;
  CacheConfig cfg_;
  ClockFn clock_;
  std::unique_ptr<IStorageBackend> backend_;
  std::unique_ptr<IEvictionPolicy> policy_;
  StatsTracker stats_;
  BackendState state_{BackendState::Preferred};
};

} // namespace model_cache
