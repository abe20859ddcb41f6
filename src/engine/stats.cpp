#include "model_cache/stats.hpp"
#include "model_cache/json_fields.hpp"
#include "model_cache/log.hpp"

#include <algorithm>
#include <cerrno>
#include <cstdio>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <sstream>

#include <fcntl.h>
#include <unistd.h>

namespace model_cache {
namespace {
bool fsync_path(const std::string &path, int flags) {
  int fd = open(path.c_str(), flags);
  if (fd < 0)
    return false;
  bool ok = ::fsync(fd) == 0;
  close(fd);
  return ok;
}
} // namespace

bool MemoryStatsStore::load(PersistedStats *out, std::string *) {
  *out = record_;
  return true;
}

bool MemoryStatsStore::save(const PersistedStats &stats, std::string *) {
  record_ = stats;
  ++saves_;
  return true;
}

std::string stats_to_json(const PersistedStats &s) {
  std::ostringstream os;
  os << "{\"hitCount\":" << s.hit_count << ",\"missCount\":" << s.miss_count
     << ",\"totalSize\":" << s.total_size << ",\"entryCount\":"
     << s.entry_count << ",\"evictionCount\":" << s.eviction_count
     << ",\"expirationCount\":" << s.expiration_count << "}";
  return os.str();
}

bool stats_from_json(const std::string &json, PersistedStats *out) {
  if (!looks_like_json_object(json))
    return false;
  PersistedStats s;
  s.hit_count = json_u64(json, "hitCount").value_or(0);
  s.miss_count = json_u64(json, "missCount").value_or(0);
  s.total_size = json_u64(json, "totalSize").value_or(0);
  s.entry_count = json_u64(json, "entryCount").value_or(0);
  s.eviction_count = json_u64(json, "evictionCount").value_or(0);
  s.expiration_count = json_u64(json, "expirationCount").value_or(0);
  *out = s;
  return true;
}

FileStatsStore::FileStatsStore(std::string path) : path_(std::move(path)) {}

bool FileStatsStore::load(PersistedStats *out, std::string *err) {
  std::ifstream in(path_);
  if (!in.is_open()) {
    *out = PersistedStats{};
    return true;
  }
  std::stringstream ss;
  ss << in.rdbuf();
  if (!stats_from_json(ss.str(), out)) {
    if (err)
      *err = "corrupt stats record " + path_;
    return false;
  }
  return true;
}

bool FileStatsStore::save(const PersistedStats &stats, std::string *err) {
  const std::filesystem::path final_path(path_);
  const std::string dir = final_path.has_parent_path()
                              ? final_path.parent_path().string()
                              : std::string(".");
  std::error_code ec;
  std::filesystem::create_directories(dir, ec);
  if (ec) {
    if (err)
      *err = "cannot create " + dir + ": " + ec.message();
    return false;
  }
  const std::string tmp = path_ + ".tmp";
  {
    std::ofstream out(tmp, std::ios::trunc);
    if (!out.is_open()) {
      if (err)
        *err = "cannot write " + tmp;
      return false;
    }
    out << stats_to_json(stats) << "\n";
    out.flush();
    if (!out) {
      if (err)
        *err = "short write " + tmp;
      return false;
    }
  }
  if (!fsync_path(tmp, O_RDONLY)) {
    if (err)
      *err = "fsync " + tmp + ": " + std::strerror(errno);
    return false;
  }
  if (std::rename(tmp.c_str(), path_.c_str()) != 0) {
    if (err)
      *err = "rename " + tmp + ": " + std::strerror(errno);
    return false;
  }
  fsync_path(dir, O_RDONLY | O_DIRECTORY);
  return true;
}

StatsTracker::StatsTracker(std::unique_ptr<IStatsStore> store)
    : store_(std::move(store)) {}

bool StatsTracker::load(std::string *err) {
  PersistedStats loaded;
  if (!store_->load(&loaded, err))
    return false;
  counters_ = loaded;
  return true;
}

void StatsTracker::record_hit() {
  ++counters_.hit_count;
  persist();
}

void StatsTracker::record_miss() {
  ++counters_.miss_count;
  persist();
}

void StatsTracker::on_insert(std::size_t size) {
  counters_.total_size += size;
  ++counters_.entry_count;
  persist();
}

void StatsTracker::on_replace(std::size_t old_size, std::size_t new_size) {
  counters_.total_size -= std::min<std::uint64_t>(counters_.total_size, old_size);
  counters_.total_size += new_size;
  persist();
}

void StatsTracker::on_remove(std::size_t size, RemovalCause cause) {
  counters_.total_size -= std::min<std::uint64_t>(counters_.total_size, size);
  if (counters_.entry_count > 0)
    --counters_.entry_count;
  if (cause == RemovalCause::Eviction || cause == RemovalCause::Expiration)
    ++counters_.eviction_count;
  if (cause == RemovalCause::Expiration)
    ++counters_.expiration_count;
  persist();
}

void StatsTracker::reset() {
  counters_ = PersistedStats{};
  persist();
}

bool StatsTracker::reconcile(std::uint64_t total_size,
                             std::uint64_t entry_count) {
  if (counters_.total_size == total_size &&
      counters_.entry_count == entry_count)
    return false;
  counters_.total_size = total_size;
  counters_.entry_count = entry_count;
  persist();
  return true;
}

StatsSnapshot StatsTracker::snapshot() const {
  StatsSnapshot s;
  s.total_size = counters_.total_size;
  s.entry_count = counters_.entry_count;
  s.eviction_count = counters_.eviction_count;
  s.hit_count = counters_.hit_count;
  s.miss_count = counters_.miss_count;
  s.expiration_count = counters_.expiration_count;
  const auto total = counters_.hit_count + counters_.miss_count;
  if (total > 0) {
    s.hit_rate = static_cast<double>(counters_.hit_count) /
                 static_cast<double>(total);
    s.miss_rate = 1.0 - s.hit_rate;
  }
  return s;
}

void StatsTracker::persist() {
  std::string err;
  if (!store_->save(counters_, &err)) {
    ++persist_failures_;
    logger()->warn("failed to persist cache stats: {}", err);
  }
}

} // namespace model_cache
