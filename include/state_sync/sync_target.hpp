#pragma once

#include "dispatch.hpp"
#include "sync_event.hpp"

#include <memory>
#include <string>
#include <vector>

namespace state_sync {

// Anything that can be named on the wire, replay a decoded event and describe
// its own full state for late-joining peers.
class sync_target {
public:
  virtual ~sync_target() = default;

  // Stable within the session, carried inside every envelope naming this target
  virtual std::string const& unique_id() const = 0;

  // Re-applies an event. Never throws; failures come back in the result.
  virtual dispatch_result sync_state(sync_event const& event) = 0;

  // Events that rebuild the current state from scratch when replayed in order
  virtual std::vector<std::unique_ptr<sync_event>> capture_state() const = 0;
};

} // namespace state_sync
