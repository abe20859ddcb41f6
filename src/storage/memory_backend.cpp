#include "model_cache/memory_backend.hpp"

namespace model_cache {

bool MemoryBackend::put(const CacheEntry &entry, std::string *) {
  entries_[entry.meta.id] = entry;
  return true;
}

std::optional<CacheEntry> MemoryBackend::get(const std::string &id,
                                             std::string *) {
  auto it = entries_.find(id);
  if (it == entries_.end())
    return std::nullopt;
  return it->second;
}

std::optional<ModelMeta> MemoryBackend::stat(const std::string &id,
                                             std::string *) {
  auto it = entries_.find(id);
  if (it == entries_.end())
    return std::nullopt;
  return it->second.meta;
}

bool MemoryBackend::remove(const std::string &id, std::string *) {
  entries_.erase(id);
  return true;
}

bool MemoryBackend::touch(const std::string &id, TimePoint at, std::string *) {
  auto it = entries_.find(id);
  if (it == entries_.end())
    return false;
  it->second.meta.last_accessed = at;
  return true;
}

bool MemoryBackend::list_all(std::vector<ModelMeta> *out, std::string *) {
  out->clear();
  out->reserve(entries_.size());
  for (const auto &[_, e] : entries_)
    out->push_back(e.meta);
  return true;
}

} // namespace model_cache
