#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>

namespace model_cache {

// The record that survives restarts.
struct PersistedStats {
  std::uint64_t hit_count{0};
  std::uint64_t miss_count{0};
  std::uint64_t total_size{0};
  std::uint64_t entry_count{0};
  std::uint64_t eviction_count{0};
  std::uint64_t expiration_count{0};
};

struct StatsSnapshot {
  std::uint64_t total_size{0};
  std::uint64_t entry_count{0};
  double hit_rate{0.0};
  double miss_rate{0.0};
  std::uint64_t eviction_count{0};
  std::uint64_t hit_count{0};
  std::uint64_t miss_count{0};
  std::uint64_t expiration_count{0};
};

enum class RemovalCause { Explicit, Eviction, Expiration, Corruption };

class IStatsStore {
public:
  virtual ~IStatsStore() = default;
  // A store that has never been written loads as an empty record.
  virtual bool load(PersistedStats *out, std::string *err = nullptr) = 0;
  virtual bool save(const PersistedStats &stats, std::string *err = nullptr) = 0;
};

class MemoryStatsStore final : public IStatsStore {
public:
  bool load(PersistedStats *out, std::string *err = nullptr) override;
  bool save(const PersistedStats &stats, std::string *err = nullptr) override;
  std::uint64_t saves() const { return saves_; }

private:
  PersistedStats record_{};
  std::uint64_t saves_{0};
};

// Flat JSON record replaced atomically (temp file, fsync, rename).
class FileStatsStore final : public IStatsStore {
public:
  explicit FileStatsStore(std::string path);
  bool load(PersistedStats *out, std::string *err = nullptr) override;
  bool save(const PersistedStats &stats, std::string *err = nullptr) override;
  const std::string &path() const { return path_; }

private:
  std::string path_;
};

std::string stats_to_json(const PersistedStats &s);
bool stats_from_json(const std::string &json, PersistedStats *out);

// Running counters with write-through persistence. Not synchronized; the
// owning cache serializes access.
class StatsTracker {
public:
  explicit StatsTracker(std::unique_ptr<IStatsStore> store);

  bool load(std::string *err = nullptr);

  void record_hit();
  void record_miss();
  void on_insert(std::size_t size);
  void on_replace(std::size_t old_size, std::size_t new_size);
  void on_remove(std::size_t size, RemovalCause cause);
  void reset();
  // Overwrites size/count with the observed live set. Returns true when the
  // tracked values had drifted.
  bool reconcile(std::uint64_t total_size, std::uint64_t entry_count);

  StatsSnapshot snapshot() const;
  const PersistedStats &counters() const { return counters_; }
  std::uint64_t persist_failures() const { return persist_failures_; }

private:
  void persist();

  std::unique_ptr<IStatsStore> store_;
  PersistedStats counters_{};
  std::uint64_t persist_failures_{0};
};

} // namespace model_cache
