#include "state_sync/dispatch.hpp"

namespace state_sync {

std::string_view to_string(dispatch_status status) {
  switch (status) {
  case dispatch_status::success:
    return "success";
  case dispatch_status::member_not_found:
    return "member_not_found";
  case dispatch_status::ambiguous_match:
    return "ambiguous_match";
  case dispatch_status::invocation_failed:
    return "invocation_failed";
  case dispatch_status::fallback_failed:
    return "fallback_failed";
  case dispatch_status::unresolved_target:
    return "unresolved_target";
  case dispatch_status::decode_failed:
    return "decode_failed";
  case dispatch_status::ignored:
    return "ignored";
  }
  return "unknown";
}

} // namespace state_sync
