#include "model_cache/policy.hpp"

#include <algorithm>

namespace model_cache {
namespace {

class LruPolicy final : public IEvictionPolicy {
public:
  std::string name() const override { return "lru"; }

  std::vector<std::string> select_victims(const std::vector<ModelMeta> &entries,
                                          std::size_t bytes_to_free) const override {
    std::vector<std::string> victims;
    if (bytes_to_free == 0 || entries.empty())
      return victims;
    std::vector<const ModelMeta *> order;
    order.reserve(entries.size());
    for (const auto &e : entries)
      order.push_back(&e);
    std::sort(order.begin(), order.end(),
              [](const ModelMeta *a, const ModelMeta *b) { return lru_before(*a, *b); });
    std::size_t freed = 0;
    for (const auto *e : order) {
      if (freed >= bytes_to_free)
        break;
      victims.push_back(e->id);
      freed += e->size_bytes;
    }
    return victims;
  }
};

} // namespace

bool lru_before(const ModelMeta &a, const ModelMeta &b) {
  if (a.last_accessed != b.last_accessed)
    return a.last_accessed < b.last_accessed;
  if (a.created_at != b.created_at)
    return a.created_at < b.created_at;
  return a.id < b.id;
}

void sort_by_recency(std::vector<ModelMeta> &entries) {
  std::sort(entries.begin(), entries.end(), lru_before);
}

std::unique_ptr<IEvictionPolicy> make_policy_by_name(const std::string &mode) {
  if (mode == "lru")
    return std::make_unique<LruPolicy>();
  return nullptr;
}

} // namespace model_cache
