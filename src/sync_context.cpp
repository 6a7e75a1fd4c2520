#include "state_sync/sync_context.hpp"
#include "state_sync/sync_target.hpp"

#include <spdlog/spdlog.h>

#include <vector>

namespace state_sync {

bool sync_context::should_surface(sync_event const& event) const noexcept {
  if (is_inside_state_sync()) {
    return false;
  }
  return call_depth_ == 1 || !use_top_level_state_changes_only_ || has_flag(event.options(), sync_options::ignore_nesting_check);
}

void sync_context::surface(sync_target const& source, sync_event& event) {
  if (!should_surface(event)) {
    spdlog::trace("Coalesced state change on {} at depth {}: {}", source.unique_id(), call_depth_, event.to_string());
    return;
  }

  // Handlers may subscribe or unsubscribe while being notified
  std::vector<state_changed_handler> handlers;
  handlers.reserve(handlers_.size());
  for (auto const& [id, handler] : handlers_) {
    handlers.push_back(handler);
  }

  for (auto const& handler : handlers) {
    try {
      handler(source, event);
    } catch (std::exception const& ex) {
      spdlog::error("State change handler failed for {} ({}): {}", source.unique_id(), event.to_string(), ex.what());
    }
  }
}

handler_id sync_context::subscribe(state_changed_handler handler) {
  auto const id = next_handler_id_++;
  handlers_.emplace(id, std::move(handler));
  return id;
}

bool sync_context::unsubscribe(handler_id id) {
  return handlers_.erase(id) > 0;
}

} // namespace state_sync
