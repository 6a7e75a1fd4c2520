#include "state_sync/sync_event.hpp"
#include "state_sync/serializer.hpp"

#include <spdlog/spdlog.h>

namespace state_sync {

std::string to_string(sync_options options) {
  if (options == sync_options::none) {
    return "none";
  }

  std::string result;
  auto const  append = [&](sync_options flag, std::string_view name) {
    if (has_flag(options, flag)) {
      if (!result.empty()) {
        result += '|';
      }
      result += name;
    }
  };

  append(sync_options::network, "network");
  append(sync_options::replay, "replay");
  append(sync_options::generate_new_frame, "generate_new_frame");
  append(sync_options::ignore_nesting_check, "ignore_nesting_check");
  return result;
}

std::string property_changed_event::to_string() const {
  return fmt::format("Property change {} = {}", property_name_, value_.to_string());
}

void property_changed_event::serialize_event(serializer& s) {
  s(property_name_, value_);
}

std::string method_invoked_event::to_string() const {
  if (method_name_.empty() && parameters_.empty()) {
    return "Unknown method call";
  }

  std::string rendered;
  for (std::size_t i = 0; i < parameters_.size(); ++i) {
    if (i > 0) {
      rendered += ", ";
    }
    rendered += parameters_[i].to_parameter_string();
  }
  return fmt::format("Method call {}({})", method_name_.empty() ? "unknown" : method_name_, rendered);
}

void method_invoked_event::serialize_event(serializer& s) {
  bool method_known = false;

  try {
    s(method_name_);
    method_known = true;
    s(parameters_);
  } catch (std::exception const& ex) {
    if (s.is_reading() && method_known) {
      spdlog::error("Error deserializing invoked method {}(): {}", method_name_, ex.what());
    }
    throw;
  }
}

} // namespace state_sync
