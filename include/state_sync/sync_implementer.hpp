#pragma once

#include "dispatch.hpp"
#include "member_table.hpp"
#include "sync_context.hpp"
#include "sync_event.hpp"
#include "sync_scope.hpp"
#include "sync_target.hpp"

#include <spdlog/spdlog.h>

#include <string>
#include <type_traits>
#include <vector>

namespace state_sync {

// Coalescing and replay helper owned by one target of type T.
//
// Business logic wraps each state change in begin_sync() / end_sync_*():
//
//   void set_life(float value) {
//     begin_sync();
//     life_ = value;
//     end_sync_property("life", life_);
//   }
//
// and sync_state() re-applies a received event through T's member table.
template <typename T>
class sync_implementer {
public:
  sync_implementer(T& target, sync_context& context)
    : target_(target)
    , context_(context) {
  }

  sync_context& context() const noexcept {
    return context_;
  }

  std::size_t depth() const noexcept {
    return scope_.depth();
  }

  void begin_sync(sync_options options = sync_options::default_options) {
    scope_.push(options);
    if (context_.open_scope()) {
      spdlog::error("begin_sync/end_sync mismatch when calling begin_sync on {}: call depth {} exceeds {}. Is an end_sync call missing?",
                    target_.unique_id(),
                    context_.call_depth(),
                    context_.nesting_error_threshold());
    }
  }

  void cancel_sync() {
    if (scope_.empty()) {
      spdlog::error("begin_sync/cancel_sync mismatch when calling cancel_sync on {}: no open scope. Is a begin_sync call missing?",
                    target_.unique_id());
      return;
    }
    scope_.pop();
    context_.close_scope();
  }

  void end_sync_property(std::string property_name, var value) {
    property_changed_event event(std::move(property_name), std::move(value));
    end_sync_state(event);
  }

  void end_sync_method(std::string method_name, std::vector<var> parameters = {}) {
    method_invoked_event event(std::move(method_name), std::move(parameters));
    end_sync_state(event);
  }

  // Assigns the options of the closing scope to the event, surfaces it if it
  // is the outermost one, then closes the scope
  void end_sync_state(sync_event& event) {
    if (scope_.empty()) {
      spdlog::error("begin_sync/end_sync mismatch when calling end_sync on {}: no open scope. Is a begin_sync call missing? Event: {}",
                    target_.unique_id(),
                    event.to_string());
      return;
    }

    event.set_options(scope_.pop());
    context_.surface(target_, event);
    context_.close_scope();
  }

  // Re-applies a decoded event. Built-in kinds go through the member table,
  // anything else to the fallback, a callable bool(sync_event const&) that
  // returns false when it does not handle the event.
  template <typename FallbackT>
  dispatch_result sync_state(sync_event const& event, FallbackT&& fallback) {
    if (auto const* property = dynamic_cast<property_changed_event const*>(&event); property != nullptr) {
      return sync_property(*property);
    }
    if (auto const* method = dynamic_cast<method_invoked_event const*>(&event); method != nullptr) {
      return sync_method(*method);
    }

    try {
      if (!fallback(event)) {
        return report(dispatch_result::failure(dispatch_status::member_not_found, fmt::format("No handler for custom event {}", event.to_string())));
      }
    } catch (std::exception const& ex) {
      return report(dispatch_result::failure(dispatch_status::fallback_failed,
                                             fmt::format("Error trying to sync state. {}. Exception: {}", event.to_string(), ex.what())));
    }
    return dispatch_result::ok();
  }

private:
  dispatch_result sync_property(property_changed_event const& event) {
    auto const* entry = members_of<T>().find_property(event.property_name());
    if (entry == nullptr || !entry->setter) {
      return report(dispatch_result::failure(dispatch_status::member_not_found,
                                             fmt::format("No writable property {} on {}", event.property_name(), type_name<T>())));
    }

    try {
      entry->setter(target_, event.value());
    } catch (std::exception const& ex) {
      return report(dispatch_result::failure(
          dispatch_status::invocation_failed,
          fmt::format("Error trying to sync property {} to value {}. Exception: {}", event.property_name(), event.value().to_string(), ex.what())));
    }
    return dispatch_result::ok();
  }

  dispatch_result sync_method(method_invoked_event const& event) {
    auto const resolution = members_of<T>().resolve_method(event.method_name(), event.parameters());
    if (resolution.entry == nullptr) {
      return report(dispatch_result::failure(resolution.status, fmt::format("{}. {}", resolution.error_message, event.to_string())));
    }

    try {
      resolution.entry->invoker(target_, event.parameters());
    } catch (std::exception const& ex) {
      return report(dispatch_result::failure(dispatch_status::invocation_failed,
                                             fmt::format("Error trying to sync method. The method threw or was called with the wrong "
                                                         "parameters. {}. Exception: {}",
                                                         event.to_string(),
                                                         ex.what())));
    }
    return dispatch_result::ok();
  }

  dispatch_result report(dispatch_result result) const {
    switch (result.status) {
    case dispatch_status::ambiguous_match:
      spdlog::error("Trying to sync a method that has an ambiguous call on {}: {}", target_.unique_id(), result.error_message);
      break;
    case dispatch_status::member_not_found:
      spdlog::error("Member not found while syncing {}: {}", target_.unique_id(), result.error_message);
      break;
    default:
      spdlog::error("Sync failed on {} ({}): {}", target_.unique_id(), to_string(result.status), result.error_message);
      break;
    }
    return result;
  }

  T&            target_;
  sync_context& context_;
  sync_scope    scope_;
};

} // namespace state_sync
