#include "model_cache/model_cache.hpp"
#include "model_cache/integrity.hpp"
#include "model_cache/log.hpp"
#include "model_cache/memory_backend.hpp"

#include <algorithm>
#include <sstream>
#include <unordered_map>

namespace model_cache {
namespace {
std::unique_ptr<IStatsStore> default_stats_store(const CacheConfig &cfg) {
  return std::make_unique<FileStatsStore>(cfg.data_dir + "/" + cfg.cache_name +
                                          ".stats.json");
}

ModelCache::ClockFn or_system_clock(ModelCache::ClockFn clock) {
  if (clock)
    return clock;
  return [] { return Clock::now(); };
}
} // namespace

const char *error_code_name(ErrorCode code) {
  switch (code) {
  case ErrorCode::None:
    return "none";
  case ErrorCode::InvalidArgument:
    return "invalid_argument";
  case ErrorCode::Capacity:
    return "capacity";
  case ErrorCode::Integrity:
    return "integrity";
  case ErrorCode::BackendUnavailable:
    return "backend_unavailable";
  case ErrorCode::Backend:
    return "backend";
  case ErrorCode::Config:
    return "config";
  }
  return "unknown";
}

ModelCache::ModelCache(CacheConfig cfg, ClockFn clock)
    : ModelCache(cfg, default_stats_store(cfg), std::move(clock)) {}

ModelCache::ModelCache(CacheConfig cfg, std::unique_ptr<IStatsStore> stats_store,
                       ClockFn clock)
    : ModelCache(std::move(cfg), std::unique_ptr<IStorageBackend>(),
                 std::move(stats_store), std::move(clock)) {}

ModelCache::ModelCache(CacheConfig cfg, std::unique_ptr<IStorageBackend> backend,
                       std::unique_ptr<IStatsStore> stats_store, ClockFn clock)
    : cfg_(std::move(cfg)), clock_(or_system_clock(std::move(clock))),
      backend_(std::move(backend)), policy_(make_policy_by_name("lru")),
      stats_(std::move(stats_store)) {
  std::lock_guard<std::mutex> lock(mu_);
  if (backend_)
    cfg_.storage = backend_->kind();
  else
    open_storage_locked(cfg_.storage);
  init_locked();
}

bool ModelCache::store(const std::string &id,
                       const std::vector<std::uint8_t> &payload,
                       const std::string &version, CacheError *err) {
  if (id.empty()) {
    set_error(err, ErrorCode::InvalidArgument, "empty model id");
    return false;
  }
  const std::size_t size = payload.size();
  // Hashing is the expensive part of a store; keep it outside the lock.
  const std::string checksum = sha256_hex(payload);

  std::lock_guard<std::mutex> lock(mu_);
  if (size > cfg_.max_size_bytes) {
    set_error(err, ErrorCode::Capacity,
              "payload of " + std::to_string(size) +
                  " bytes exceeds max_size_bytes " +
                  std::to_string(cfg_.max_size_bytes));
    return false;
  }

  std::string backend_err;
  auto existing = backend_->stat(id, &backend_err);
  if (!backend_err.empty()) {
    set_error(err, ErrorCode::Backend, backend_err);
    return false;
  }
  if (!ensure_space_locked(size, id, existing ? existing->size_bytes : 0, err))
    return false;

  const auto t = now();
  CacheEntry entry;
  entry.meta.id = id;
  entry.meta.size_bytes = size;
  entry.meta.created_at = t;
  entry.meta.last_accessed = t;
  entry.meta.version = version;
  entry.meta.checksum = checksum;
  entry.payload = payload;
  if (!backend_->put(entry, &backend_err)) {
    set_error(err, ErrorCode::Backend, backend_err);
    return false;
  }
  if (existing)
    stats_.on_replace(existing->size_bytes, size);
  else
    stats_.on_insert(size);
  logger()->debug("stored {} ({} bytes, version {})", id, size, version);
  return true;
}

std::optional<std::vector<std::uint8_t>>
ModelCache::retrieve(const std::string &id, CacheError *err) {
  std::lock_guard<std::mutex> lock(mu_);
  auto entry = lookup_locked(id, err);
  if (!entry)
    return std::nullopt;
  return std::move(entry->payload);
}

bool ModelCache::has(const std::string &id, CacheError *err) {
  std::lock_guard<std::mutex> lock(mu_);
  return lookup_locked(id, err).has_value();
}

bool ModelCache::remove(const std::string &id, CacheError *err) {
  std::lock_guard<std::mutex> lock(mu_);
  std::string backend_err;
  auto existing = backend_->stat(id, &backend_err);
  if (!backend_err.empty()) {
    set_error(err, ErrorCode::Backend, backend_err);
    return false;
  }
  if (!existing)
    return true;
  if (!erase_locked(*existing, RemovalCause::Explicit, &backend_err)) {
    set_error(err, ErrorCode::Backend, backend_err);
    return false;
  }
  return true;
}

bool ModelCache::verify(const std::string &id, CacheError *err) {
  std::lock_guard<std::mutex> lock(mu_);
  std::string backend_err;
  auto entry = backend_->get(id, &backend_err);
  if (!backend_err.empty()) {
    set_error(err, ErrorCode::Backend, backend_err);
    return false;
  }
  if (!entry)
    return false;
  if (verify_checksum(*entry))
    return true;
  logger()->warn("checksum mismatch for {}, dropping entry", id);
  if (!erase_locked(entry->meta, RemovalCause::Corruption, &backend_err))
    logger()->warn("cannot drop corrupt entry {}: {}", id, backend_err);
  stats_.record_miss();
  set_error(err, ErrorCode::Integrity, "checksum mismatch for " + id);
  return false;
}

bool ModelCache::clear(CacheError *err) {
  std::lock_guard<std::mutex> lock(mu_);
  std::vector<ModelMeta> all;
  std::string backend_err;
  if (!backend_->list_all(&all, &backend_err)) {
    set_error(err, ErrorCode::Backend, backend_err);
    return false;
  }
  bool ok = true;
  for (const auto &m : all) {
    std::string rm_err;
    if (backend_->remove(m.id, &rm_err))
      continue;
    logger()->warn("clear: cannot remove {}: {}", m.id, rm_err);
    if (ok)
      set_error(err, ErrorCode::Backend, rm_err);
    ok = false;
  }
  stats_.reset();
  if (!ok)
    reconcile_locked();
  logger()->info("cleared {} entries from {}", all.size(), backend_->name());
  return ok;
}

std::size_t ModelCache::sweep_expired() {
  std::vector<ModelMeta> expired;
  {
    std::lock_guard<std::mutex> lock(mu_);
    std::vector<ModelMeta> all;
    std::string backend_err;
    if (!backend_->list_all(&all, &backend_err)) {
      logger()->warn("sweep: cannot list entries: {}", backend_err);
      return 0;
    }
    const auto t = now();
    for (auto &m : all)
      if (is_expired(m, t))
        expired.push_back(std::move(m));
  }

  std::size_t removed = 0;
  for (const auto &candidate : expired) {
    // Relock per entry so foreground callers interleave with a long sweep.
    std::lock_guard<std::mutex> lock(mu_);
    std::string backend_err;
    auto current = backend_->stat(candidate.id, &backend_err);
    if (!backend_err.empty()) {
      logger()->warn("sweep: cannot stat {}: {}", candidate.id, backend_err);
      continue;
    }
    // Already gone, or replaced by a fresh store since the listing.
    if (!current || !is_expired(*current, now()))
      continue;
    if (!erase_locked(*current, RemovalCause::Expiration, &backend_err)) {
      logger()->warn("sweep: cannot remove {}: {}", candidate.id, backend_err);
      continue;
    }
    ++removed;
  }

  std::lock_guard<std::mutex> lock(mu_);
  reconcile_locked();
  if (removed > 0)
    logger()->info("sweep removed {} expired entries", removed);
  return removed;
}

std::vector<ModelMeta> ModelCache::list() {
  std::lock_guard<std::mutex> lock(mu_);
  std::vector<ModelMeta> all;
  std::string backend_err;
  if (!backend_->list_all(&all, &backend_err)) {
    logger()->warn("list: {}", backend_err);
    return {};
  }
  const auto t = now();
  all.erase(std::remove_if(all.begin(), all.end(),
                           [&](const ModelMeta &m) { return is_expired(m, t); }),
            all.end());
  sort_by_recency(all);
  return all;
}

StatsSnapshot ModelCache::stats() const {
  std::lock_guard<std::mutex> lock(mu_);
  return stats_.snapshot();
}

CacheConfig ModelCache::config() const {
  std::lock_guard<std::mutex> lock(mu_);
  return cfg_;
}

void ModelCache::update_config(const ConfigUpdate &update) {
  std::lock_guard<std::mutex> lock(mu_);
  CacheConfig next = cfg_;
  apply_update(next, update);
  const bool switch_storage =
      update.storage.has_value() && *update.storage != backend_->kind();
  if (switch_storage && state_ == BackendState::Fallback) {
    logger()->warn("storage is pinned to memory after fallback; ignoring "
                   "switch to {}",
                   storage_kind_name(*update.storage));
    next.storage = backend_->kind();
    cfg_ = next;
  } else if (switch_storage) {
    // Entries under the previous backend are orphaned, not migrated.
    cfg_ = next;
    open_storage_locked(*update.storage);
    reconcile_locked();
  } else {
    cfg_ = next;
  }
  logger()->info("config updated: max_size_bytes={} max_age_ms={} storage={}",
                 cfg_.max_size_bytes, cfg_.max_age.count(),
                 storage_kind_name(cfg_.storage));
}

std::string ModelCache::info() const {
  std::lock_guard<std::mutex> lock(mu_);
  const auto s = stats_.snapshot();
  std::ostringstream os;
  os << "backend:" << backend_->name() << "\n";
  os << "backend_state:"
     << (state_ == BackendState::Fallback ? "fallback" : "preferred") << "\n";
  os << "max_size_bytes:" << cfg_.max_size_bytes << "\n";
  os << "max_age_ms:" << cfg_.max_age.count() << "\n";
  os << "compression_enabled:" << (cfg_.compression_enabled ? 1 : 0) << "\n";
  os << "verify_on_retrieve:" << (cfg_.verify_on_retrieve ? 1 : 0) << "\n";
  os << "total_size:" << s.total_size << "\n";
  os << "entry_count:" << s.entry_count << "\n";
  os << "hits:" << s.hit_count << "\n";
  os << "misses:" << s.miss_count << "\n";
  os << "hit_rate:" << s.hit_rate << "\n";
  os << "miss_rate:" << s.miss_rate << "\n";
  os << "evictions:" << s.eviction_count << "\n";
  os << "expirations:" << s.expiration_count << "\n";
  os << "stats_persist_failures:" << stats_.persist_failures() << "\n";
  return os.str();
}

std::string ModelCache::backend_name() const {
  std::lock_guard<std::mutex> lock(mu_);
  return backend_->name();
}

BackendState ModelCache::backend_state() const {
  std::lock_guard<std::mutex> lock(mu_);
  return state_;
}

void ModelCache::init_locked() {
  std::string err;
  if (!stats_.load(&err))
    logger()->warn("starting with empty stats: {}", err);
  reconcile_locked();
  const auto &c = stats_.counters();
  logger()->info("model cache ready: backend={} entries={} bytes={}",
                 backend_->name(), c.entry_count, c.total_size);
}

void ModelCache::open_storage_locked(StorageKind kind) {
  std::string err;
  auto backend = open_backend(kind, cfg_, &err);
  if (backend) {
    backend_ = std::move(backend);
    cfg_.storage = kind;
    logger()->info("opened {} storage under {}", backend_->name(),
                   cfg_.data_dir);
    return;
  }
  logger()->warn("{} storage unavailable ({}); falling back to memory",
                 storage_kind_name(kind), err);
  backend_ = std::make_unique<MemoryBackend>();
  cfg_.storage = StorageKind::Memory;
  state_ = BackendState::Fallback;
}

// Durable backends store whole milliseconds, so every timestamp the cache
// hands out or compares is floored to match.
TimePoint ModelCache::now() const {
  return std::chrono::floor<std::chrono::milliseconds>(clock_());
}

bool ModelCache::is_expired(const ModelMeta &meta, TimePoint t) const {
  return t - meta.created_at > cfg_.max_age;
}

bool ModelCache::ensure_space_locked(std::size_t bytes,
                                     const std::string &replacing,
                                     std::size_t replacing_size,
                                     CacheError *err) {
  const std::uint64_t max = cfg_.max_size_bytes;
  const std::uint64_t tracked = stats_.counters().total_size;
  const std::uint64_t tracked_used =
      tracked - std::min<std::uint64_t>(tracked, replacing_size);
  if (tracked_used + bytes <= max)
    return true;

  // The counters are exact under mu_, so the backend only has to produce
  // the oldest entries covering the shortfall.
  const std::uint64_t need = tracked_used + bytes - max;
  std::vector<ModelMeta> candidates;
  std::string backend_err;
  if (!backend_->scan_lru(static_cast<std::size_t>(need), replacing,
                          &candidates, &backend_err)) {
    set_error(err, ErrorCode::Backend, "scan for eviction: " + backend_err);
    return false;
  }
  if (evict_locked(candidates, need) >= need)
    return true;

  // Short after the fast pass (drifted counters or failed removals): work
  // from the backend's full view.
  std::vector<ModelMeta> all;
  if (!backend_->list_all(&all, &backend_err)) {
    set_error(err, ErrorCode::Backend, "list for eviction: " + backend_err);
    return false;
  }
  std::uint64_t live = 0;
  for (const auto &m : all)
    live += m.size_bytes;
  if (stats_.reconcile(live, all.size()))
    logger()->warn("repaired stats drift: total_size={} entry_count={}", live,
                   all.size());

  candidates.clear();
  std::uint64_t used = 0;
  for (auto &m : all) {
    if (m.id == replacing)
      continue;
    used += m.size_bytes;
    candidates.push_back(std::move(m));
  }
  if (used + bytes <= max)
    return true;
  const std::uint64_t still_needed = used + bytes - max;
  if (evict_locked(candidates, still_needed) < still_needed) {
    set_error(err, ErrorCode::Backend,
              "could not free " + std::to_string(still_needed) + " bytes");
    return false;
  }
  return true;
}

std::uint64_t ModelCache::evict_locked(const std::vector<ModelMeta> &candidates,
                                       std::uint64_t need) {
  std::unordered_map<std::string, const ModelMeta *> by_id;
  for (const auto &m : candidates)
    by_id[m.id] = &m;
  std::uint64_t freed = 0;
  for (const auto &id : policy_->select_victims(
           candidates, static_cast<std::size_t>(need))) {
    if (freed >= need)
      break;
    const ModelMeta &victim = *by_id.at(id);
    std::string rm_err;
    if (!erase_locked(victim, RemovalCause::Eviction, &rm_err)) {
      logger()->warn("evict {} failed: {}", id, rm_err);
      continue;
    }
    freed += victim.size_bytes;
  }
  return freed;
}

bool ModelCache::erase_locked(const ModelMeta &meta, RemovalCause cause,
                              std::string *err) {
  if (!backend_->remove(meta.id, err))
    return false;
  stats_.on_remove(meta.size_bytes, cause);
  logger()->debug("removed {} ({} bytes)", meta.id, meta.size_bytes);
  return true;
}

bool ModelCache::reconcile_locked() {
  std::vector<ModelMeta> all;
  std::string backend_err;
  if (!backend_->list_all(&all, &backend_err)) {
    logger()->warn("cannot list entries to check stats: {}", backend_err);
    return false;
  }
  std::uint64_t total = 0;
  for (const auto &m : all)
    total += m.size_bytes;
  if (stats_.reconcile(total, all.size()))
    logger()->warn("repaired stats drift: total_size={} entry_count={}", total,
                   all.size());
  return true;
}

std::optional<CacheEntry> ModelCache::lookup_locked(const std::string &id,
                                                    CacheError *err) {
  std::string backend_err;
  auto entry = backend_->get(id, &backend_err);
  if (!backend_err.empty()) {
    stats_.record_miss();
    set_error(err, ErrorCode::Backend, backend_err);
    return std::nullopt;
  }
  if (!entry) {
    stats_.record_miss();
    return std::nullopt;
  }
  const auto t = now();
  if (is_expired(entry->meta, t)) {
    if (!erase_locked(entry->meta, RemovalCause::Expiration, &backend_err))
      logger()->warn("cannot drop expired entry {}: {}", id, backend_err);
    stats_.record_miss();
    return std::nullopt;
  }
  if (cfg_.verify_on_retrieve && !verify_checksum(*entry)) {
    logger()->warn("checksum mismatch for {}, dropping entry", id);
    if (!erase_locked(entry->meta, RemovalCause::Corruption, &backend_err))
      logger()->warn("cannot drop corrupt entry {}: {}", id, backend_err);
    stats_.record_miss();
    set_error(err, ErrorCode::Integrity, "checksum mismatch for " + id);
    return std::nullopt;
  }
  const auto accessed = std::max(t, entry->meta.created_at);
  if (!backend_->touch(id, accessed, &backend_err))
    logger()->warn("cannot update last access for {}: {}", id, backend_err);
  entry->meta.last_accessed = accessed;
  stats_.record_hit();
  return entry;
}

} // namespace model_cache
