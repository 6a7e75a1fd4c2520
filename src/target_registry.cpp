#include "state_sync/target_registry.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <utility>

namespace state_sync {

bool target_registry::register_target(sync_target& target) {
  auto const& id = target.unique_id();
  if (id.empty()) {
    spdlog::error("Cannot register a sync target without a unique id");
    return false;
  }

  if (ids_.contains(id)) {
    spdlog::error("Sync target id {} is already registered", id);
    return false;
  }

  auto const e = registry_.create();
  registry_.emplace<target_handle>(e, &target);
  registry_.emplace<registration_order>(e, next_order_++);
  ids_.emplace(id, e);

  spdlog::debug("Registered sync target {} as entity {}", id, static_cast<std::uint64_t>(e));
  return true;
}

bool target_registry::unregister_target(std::string const& unique_id) {
  auto it = ids_.find(unique_id);
  if (it == ids_.end()) {
    return false;
  }

  registry_.destroy(it->second);
  ids_.erase(it);
  spdlog::debug("Unregistered sync target {}", unique_id);
  return true;
}

bool target_registry::unregister_target(sync_target const& target) {
  auto it = ids_.find(target.unique_id());
  if (it == ids_.end() || registry_.get<target_handle>(it->second).target != &target) {
    return false;
  }
  return unregister_target(target.unique_id());
}

sync_target* target_registry::resolve(std::string const& unique_id) const {
  auto it = ids_.find(unique_id);
  if (it == ids_.end()) {
    return nullptr;
  }
  return registry_.get<target_handle>(it->second).target;
}

std::vector<sync_target*> target_registry::targets() const {
  std::vector<std::pair<std::uint64_t, sync_target*>> ordered;
  ordered.reserve(ids_.size());

  for (auto [e, handle, order] : registry_.view<target_handle, registration_order>().each()) {
    ordered.emplace_back(order.value, handle.target);
  }

  std::sort(ordered.begin(), ordered.end(), [](auto const& lhs, auto const& rhs) {
    return lhs.first < rhs.first;
  });

  std::vector<sync_target*> result;
  result.reserve(ordered.size());
  for (auto const& [order, target] : ordered) {
    result.push_back(target);
  }
  return result;
}

} // namespace state_sync
