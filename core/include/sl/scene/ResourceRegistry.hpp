#pragma once
#include "sl/scene/Types.hpp"
#include <array>
#include <cstddef>
#include <map>
#include <optional>
#include <vector>

namespace sl {

// Id -> kind for every live scene resource. Explicit ids come from the
// chart's fixed plan; ids for commands that omit one are allocated from
// kFirstAllocatedId upward.
class ResourceRegistry {
public:
  Id allocate(ResourceKind kind);
  bool reserve(Id id, ResourceKind kind);  // false if the id is taken

  bool exists(Id id) const { return kinds_.count(id) > 0; }
  std::optional<ResourceKind> kindOf(Id id) const;

  bool release(Id id);
  void clear();

  // Ascending.
  std::vector<Id> list(ResourceKind kind) const;
  std::size_t count(ResourceKind kind) const {
    return counts_[static_cast<std::size_t>(kind)];
  }
  std::size_t size() const { return kinds_.size(); }

private:
  Id next_{kFirstAllocatedId};
  std::map<Id, ResourceKind> kinds_;
  std::array<std::size_t, kResourceKindCount> counts_{};
};

} // namespace sl
