#pragma once

#include "model_cache/types.hpp"

#include <cstddef>
#include <memory>
#include <string>
#include <vector>

namespace model_cache {

// Pure victim selection. Implementations never delete anything; the caller
// removes the returned ids in order and stops once enough space is free.
class IEvictionPolicy {
public:
  virtual ~IEvictionPolicy() = default;
  virtual std::string name() const = 0;
  // Ids ordered by eviction preference whose cumulative size reaches
  // bytes_to_free, or every candidate when the total is not enough.
  virtual std::vector<std::string>
  select_victims(const std::vector<ModelMeta> &entries,
                 std::size_t bytes_to_free) const = 0;
};

// Oldest-accessed first; ties by created_at, then by id.
bool lru_before(const ModelMeta &a, const ModelMeta &b);
void sort_by_recency(std::vector<ModelMeta> &entries);

// "lru" is the only policy; returns nullptr for unknown names.
std::unique_ptr<IEvictionPolicy> make_policy_by_name(const std::string &mode);

} // namespace model_cache
