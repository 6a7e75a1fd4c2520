#pragma once

#include "core.hpp"
#include "sync_target.hpp"

#include <entt/container/dense_map.hpp>
#include <entt/entity/registry.hpp>

#include <cstdint>
#include <string>
#include <vector>

namespace state_sync {

// Components of the entities backing registered targets
struct target_handle {
  sync_target* target = nullptr;
};

struct registration_order {
  std::uint64_t value = 0;
};

// Live targets of a session, looked up by their stable unique id. Targets are
// owned by the surrounding session; the registry only stores non-owning
// handles and must be told when a target goes away.
class target_registry {
public:
  // Fails with an error log when the id is empty or already taken
  bool register_target(sync_target& target);

  bool unregister_target(std::string const& unique_id);
  bool unregister_target(sync_target const& target);

  // Pure lookup; nullptr when the id is not known locally (yet)
  sync_target* resolve(std::string const& unique_id) const;

  bool contains(std::string const& unique_id) const {
    return ids_.contains(unique_id);
  }

  std::size_t size() const noexcept {
    return ids_.size();
  }

  // Snapshot enumeration, in registration order
  std::vector<sync_target*> targets() const;

private:
  entt::registry                       registry_;
  entt::dense_map<std::string, entity> ids_;
  std::uint64_t                        next_order_ = 0;
};

} // namespace state_sync
