#pragma once

#include "core.hpp"
#include "dispatch.hpp"
#include "event_type_registry.hpp"
#include "settings.hpp"
#include "sync_context.hpp"
#include "sync_event.hpp"
#include "sync_target.hpp"
#include "target_registry.hpp"

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace state_sync {

struct decode_result {
  bool                        success = false;
  dispatch_status             status  = dispatch_status::decode_failed;
  std::uint16_t               version = 0;
  std::unique_ptr<sync_event> event;            // Set once the type is known, possibly partially populated
  sync_target*                target = nullptr; // Set when the id resolves locally
  std::string                 target_id;
  std::string                 error_message;
};

struct sync_result {
  bool            success = false;
  dispatch_status status  = dispatch_status::decode_failed;
  std::string     target_id;
  std::string     event_description;
  std::string     error_message;

  std::string to_string() const;
};

struct snapshot_result {
  bool        success = false;
  std::size_t applied = 0;
  std::size_t failed  = 0;
  std::string error_message;
};

// Central entry point of a session: encodes surfaced events, decodes and
// re-applies received ones, and saves / loads full-state snapshots.
//
// Envelope layout:
//   version (uint16) | type name | module | target (object_ref var) | payload
class sync_manager {
public:
  explicit sync_manager(target_registry& targets, sync_settings const& settings = {});

  void apply(sync_settings const& settings);

  sync_settings const& settings() const noexcept {
    return settings_;
  }

  sync_context& context() noexcept {
    return context_;
  }

  sync_context const& context() const noexcept {
    return context_;
  }

  event_type_registry& event_types() noexcept {
    return event_types_;
  }

  target_registry& targets() noexcept {
    return targets_;
  }

  // Empty buffer (and an error log) when the event kind is not registered
  buffer_type encode(sync_event& event, sync_target const& source) const;
  buffer_type encode(sync_event& event, std::string const& source_id) const;

  decode_result decode(buffer_type const& bytes) const;

  // Decodes and re-applies one event. Changes the targets make while replaying
  // are not surfaced again.
  sync_result execute_state_sync_event(buffer_type const& bytes);

  bool is_inside_state_sync() const noexcept {
    return context_.is_inside_state_sync();
  }

  // Every registered target's captured state, in registration order, minus
  // the excluded ids
  buffer_type save_state_changes(std::vector<std::string> const& exclude = {}) const;

  // Only the given targets; unknown ids are skipped with a warning
  buffer_type save_state_changes_of(std::vector<std::string> const& target_ids) const;

  // Replays every frame in order. A failed frame is skipped and counted.
  snapshot_result load_state_changes(buffer_type const& bytes);

  handler_id subscribe(state_changed_handler handler) {
    return context_.subscribe(std::move(handler));
  }

  bool unsubscribe(handler_id id) {
    return context_.unsubscribe(id);
  }

private:
  buffer_type save_targets(std::vector<sync_target*> const& targets) const;

  target_registry&    targets_;
  sync_settings       settings_;
  sync_context        context_;
  event_type_registry event_types_;
};

} // namespace state_sync
