#pragma once

#include "sync_event.hpp"

#include <vector>

namespace state_sync {

// Per-target open scopes: one pushed option set per begin_sync. The depth is
// the stack size, so the two can never drift apart.
class sync_scope {
public:
  std::size_t depth() const noexcept {
    return options_.size();
  }

  bool empty() const noexcept {
    return options_.empty();
  }

  void push(sync_options options) {
    options_.push_back(options);
  }

  // Caller checks empty() first
  sync_options pop() {
    auto const options = options_.back();
    options_.pop_back();
    return options;
  }

private:
  std::vector<sync_options> options_;
};

} // namespace state_sync
