#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <utility>

namespace state_sync {

enum class dispatch_status : std::uint8_t {
  success,
  member_not_found,
  ambiguous_match,
  invocation_failed,
  fallback_failed,
  unresolved_target,
  decode_failed,
  ignored
};

std::string_view to_string(dispatch_status status);

// Outcome of re-applying one event to one target
struct dispatch_result {
  bool            success = false;
  dispatch_status status  = dispatch_status::success;
  std::string     error_message;

  static dispatch_result ok() {
    return dispatch_result{.success = true, .status = dispatch_status::success, .error_message = ""};
  }

  static dispatch_result failure(dispatch_status status, std::string error_message) {
    return dispatch_result{.success = false, .status = status, .error_message = std::move(error_message)};
  }
};

} // namespace state_sync
