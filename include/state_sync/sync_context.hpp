#pragma once

#include "core.hpp"
#include "sync_event.hpp"

#include <entt/container/dense_map.hpp>

#include <functional>

namespace state_sync {

class sync_target;

using state_changed_handler = std::function<void(sync_target const&, sync_event&)>;

// Session-wide coalescing state shared by every target of one session.
//
// The call depth counts open scopes across all targets, so a scope opened on
// one target suppresses events closed on another while it is open. Not thread
// safe: all begin/end calls happen on the session's logical thread.
class sync_context {
public:
  static constexpr std::size_t default_nesting_error_threshold = 100;

  std::size_t call_depth() const noexcept {
    return call_depth_;
  }

  bool use_top_level_state_changes_only() const noexcept {
    return use_top_level_state_changes_only_;
  }

  void set_use_top_level_state_changes_only(bool value) noexcept {
    use_top_level_state_changes_only_ = value;
  }

  std::size_t nesting_error_threshold() const noexcept {
    return nesting_error_threshold_;
  }

  void set_nesting_error_threshold(std::size_t value) noexcept {
    nesting_error_threshold_ = value;
  }

  // True while a received event is being re-applied
  bool is_inside_state_sync() const noexcept {
    return inside_state_sync_ > 0;
  }

  // Marks the context as replaying a received event for its lifetime
  class replay_guard {
  public:
    explicit replay_guard(sync_context& context)
      : context_(context) {
      ++context_.inside_state_sync_;
    }

    ~replay_guard() {
      --context_.inside_state_sync_;
    }

    replay_guard(replay_guard const&)            = delete;
    replay_guard& operator=(replay_guard const&) = delete;

  private:
    sync_context& context_;
  };

  // Returns true when the new depth exceeds the nesting error threshold
  bool open_scope() noexcept {
    return ++call_depth_ > nesting_error_threshold_;
  }

  void close_scope() noexcept {
    if (call_depth_ > 0) {
      --call_depth_;
    }
  }

  // Decision taken when a scope closes, while its depth is still counted
  bool should_surface(sync_event const& event) const noexcept;

  // Notifies subscribers if should_surface() holds. Handler exceptions are
  // logged and do not reach the target that closed the scope.
  void surface(sync_target const& source, sync_event& event);

  handler_id subscribe(state_changed_handler handler);
  bool       unsubscribe(handler_id id);

  std::size_t subscriber_count() const noexcept {
    return handlers_.size();
  }

private:
  std::size_t call_depth_                       = 0;
  std::size_t inside_state_sync_                = 0;
  std::size_t nesting_error_threshold_          = default_nesting_error_threshold;
  bool        use_top_level_state_changes_only_ = true;

  handler_id                                          next_handler_id_ = 1;
  entt::dense_map<handler_id, state_changed_handler> handlers_;
};

} // namespace state_sync
