#include "sl/scene/ResourceRegistry.hpp"

namespace sl {

Id ResourceRegistry::allocate(ResourceKind kind) {
  while (kinds_.count(next_) > 0) next_++;
  const Id id = next_++;
  kinds_.emplace(id, kind);
  counts_[static_cast<std::size_t>(kind)]++;
  return id;
}

bool ResourceRegistry::reserve(Id id, ResourceKind kind) {
  if (id == kInvalidId) return false;
  if (!kinds_.emplace(id, kind).second) return false;
  counts_[static_cast<std::size_t>(kind)]++;
  return true;
}

std::optional<ResourceKind> ResourceRegistry::kindOf(Id id) const {
  auto it = kinds_.find(id);
  if (it == kinds_.end()) return std::nullopt;
  return it->second;
}

bool ResourceRegistry::release(Id id) {
  auto it = kinds_.find(id);
  if (it == kinds_.end()) return false;
  counts_[static_cast<std::size_t>(it->second)]--;
  kinds_.erase(it);
  return true;
}

void ResourceRegistry::clear() {
  kinds_.clear();
  counts_.fill(0);
  next_ = kFirstAllocatedId;
}

std::vector<Id> ResourceRegistry::list(ResourceKind kind) const {
  std::vector<Id> out;
  out.reserve(count(kind));
  for (const auto& kv : kinds_) {
    if (kv.second == kind) out.push_back(kv.first);
  }
  return out;
}

} // namespace sl
