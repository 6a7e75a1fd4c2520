#include "state_sync/sync_manager.hpp"
#include "state_sync/buffer_stream.hpp"
#include "state_sync/serializer.hpp"

#include <cereal/archives/portable_binary.hpp>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <typeinfo>

namespace state_sync {

namespace {

// Reads the version header and checks it is one this build understands
std::uint16_t read_version(cereal::PortableBinaryInputArchive& archive) {
  serializer    header(archive, 0);
  std::uint16_t version = 0;
  header(version);

  if (version < protocol::min_supported_version || version > protocol::current_version) {
    throw decode_error(fmt::format("Unsupported serialization version {} (supported {}..{})",
                                   version,
                                   protocol::min_supported_version,
                                   protocol::current_version));
  }
  return version;
}

} // namespace

std::string sync_result::to_string() const {
  if (success) {
    return fmt::format("Successful state change event for {}, {}.", target_id, event_description);
  }

  switch (status) {
  case dispatch_status::unresolved_target:
    return fmt::format("Event for unresolved target: {}. Error is: {}", event_description, error_message);
  case dispatch_status::decode_failed:
    if (!event_description.empty()) {
      return fmt::format("Could not decode state change event {}. Error is: {}", event_description, error_message);
    }
    return fmt::format("Could not decode state change event. Error is: {}", error_message);
  case dispatch_status::ignored:
    return fmt::format("Ignored state change event for {}, {}.", target_id, event_description);
  default:
    return fmt::format("Could not execute state change event for {}, {}. Error is: {}", target_id, event_description, error_message);
  }
}

sync_manager::sync_manager(target_registry& targets, sync_settings const& settings)
  : targets_(targets) {
  apply(settings);
}

void sync_manager::apply(sync_settings const& settings) {
  settings_ = settings;
  context_.set_use_top_level_state_changes_only(settings.use_top_level_state_changes_only);
  context_.set_nesting_error_threshold(settings.nesting_error_threshold);
}

buffer_type sync_manager::encode(sync_event& event, sync_target const& source) const {
  return encode(event, source.unique_id());
}

buffer_type sync_manager::encode(sync_event& event, std::string const& source_id) const {
  auto const* key = event_types_.key_of(event);
  if (key == nullptr) {
    spdlog::error("Cannot encode event of unregistered kind {}: {}", typeid(event).name(), event.to_string());
    return {};
  }

  buffer_type bytes;
  try {
    buffer_ostream                      os(bytes);
    cereal::PortableBinaryOutputArchive archive(os);
    serializer                          s(archive);

    std::uint16_t version   = protocol::current_version;
    std::string   type_name = key->type_name;
    std::string   module    = key->module;
    var           target    = var::make(object_ref{source_id});
    s(version, type_name, module, target);
    event.serialize_event(s);
  } catch (std::exception const& ex) {
    spdlog::error("Failed to encode {} for {}: {}", event.to_string(), source_id, ex.what());
    return {};
  }

  if (settings_.verbose_traffic) {
    spdlog::debug("Encoded {} bytes for {}: {}", bytes.size(), source_id, event.to_string());
  }
  return bytes;
}

decode_result sync_manager::decode(buffer_type const& bytes) const {
  decode_result result;
  if (bytes.empty()) {
    result.error_message = "Serialized event buffer is empty";
    spdlog::error("{}", result.error_message);
    return result;
  }

  try {
    buffer_istream                     is(bytes);
    cereal::PortableBinaryInputArchive archive(is);
    result.version = read_version(archive);
    serializer s(archive, result.version);

    std::string type_name;
    std::string module;
    s(type_name, module);

    result.event = event_types_.create(type_name, module);
    if (!result.event) {
      result.error_message = fmt::format("Unknown event class ({}, {})", type_name, module);
      spdlog::error("Error creating event: {}", result.error_message);
      return result;
    }

    var target;
    s(target);
    auto const* ref = target.get_if<object_ref>();
    if (ref == nullptr) {
      throw decode_error(fmt::format("Event target is not an object reference but {}", target.to_parameter_string()));
    }
    result.target_id = ref->id;

    // An unknown target does not stop decoding, the event is still rendered in diagnostics
    result.target = targets_.resolve(result.target_id);
    result.event->serialize_event(s);
  } catch (std::exception const& ex) {
    result.target = nullptr;
    if (result.event) {
      result.error_message = fmt::format("Error deserializing event {}: {}", result.event->to_string(), ex.what());
    } else {
      result.error_message = fmt::format("Error creating/deserializing event: {}", ex.what());
    }
    spdlog::error("{}", result.error_message);
    return result;
  }

  if (result.target == nullptr) {
    result.status        = dispatch_status::unresolved_target;
    result.error_message = fmt::format("Target {} is not registered locally", result.target_id);
    spdlog::warn("Event for unresolved target {}: {}", result.target_id, result.event->to_string());
    return result;
  }

  result.success = true;
  result.status  = dispatch_status::success;
  return result;
}

sync_result sync_manager::execute_state_sync_event(buffer_type const& bytes) {
  auto decoded = decode(bytes);

  sync_result result{.success           = false,
                     .status            = decoded.status,
                     .target_id         = decoded.target_id,
                     .event_description = decoded.event ? decoded.event->to_string() : std::string{},
                     .error_message     = decoded.error_message};

  if (decoded.success) {
    sync_context::replay_guard guard(context_);
    try {
      auto const dispatched = decoded.target->sync_state(*decoded.event);
      result.success        = dispatched.success;
      result.status         = dispatched.status;
      result.error_message  = dispatched.error_message;
    } catch (std::exception const& ex) {
      result.status        = dispatch_status::invocation_failed;
      result.error_message = ex.what();
      spdlog::error("Sync target {} threw while replaying {}: {}", result.target_id, result.event_description, ex.what());
    }
  }

  if (settings_.verbose_traffic) {
    spdlog::debug("Deserialized and processed {} bytes of event data: {}", bytes.size(), result.to_string());
  } else {
    spdlog::trace("Deserialized and processed {} bytes of event data: {}", bytes.size(), result.to_string());
  }
  return result;
}

buffer_type sync_manager::save_state_changes(std::vector<std::string> const& exclude) const {
  std::vector<sync_target*> selected;
  for (auto* target : targets_.targets()) {
    if (std::find(exclude.begin(), exclude.end(), target->unique_id()) == exclude.end()) {
      selected.push_back(target);
    }
  }
  return save_targets(selected);
}

buffer_type sync_manager::save_state_changes_of(std::vector<std::string> const& target_ids) const {
  std::vector<sync_target*> selected;
  for (auto const& id : target_ids) {
    if (auto* target = targets_.resolve(id); target != nullptr) {
      selected.push_back(target);
    } else {
      spdlog::warn("Cannot save state of unknown target {}", id);
    }
  }
  return save_targets(selected);
}

buffer_type sync_manager::save_targets(std::vector<sync_target*> const& targets) const {
  std::vector<buffer_type> frames;
  for (auto* target : targets) {
    try {
      for (auto& event : target->capture_state()) {
        auto frame = encode(*event, *target);
        if (!frame.empty()) {
          frames.push_back(std::move(frame));
        }
      }
    } catch (std::exception const& ex) {
      spdlog::error("Failed to capture the state of {}: {}", target->unique_id(), ex.what());
    }
  }

  buffer_type bytes;
  {
    buffer_ostream                      os(bytes);
    cereal::PortableBinaryOutputArchive archive(os);
    serializer                          s(archive);

    std::uint16_t version = protocol::current_version;
    std::uint64_t count   = frames.size();
    s(version, count);
    for (auto& frame : frames) {
      s(frame);
    }
  }

  spdlog::debug("Saved {} state changes of {} targets in {} bytes", frames.size(), targets.size(), bytes.size());
  return bytes;
}

snapshot_result sync_manager::load_state_changes(buffer_type const& bytes) {
  snapshot_result result;
  if (bytes.empty()) {
    result.error_message = "State snapshot buffer is empty";
    spdlog::error("{}", result.error_message);
    return result;
  }

  std::vector<buffer_type> frames;
  try {
    buffer_istream                     is(bytes);
    cereal::PortableBinaryInputArchive archive(is);
    serializer                         s(archive, read_version(archive));

    std::uint64_t count = 0;
    s(count);
    if (count > serializer::max_sequence_length) {
      throw decode_error(fmt::format("State snapshot claims {} entries", count));
    }

    frames.reserve(std::min<std::uint64_t>(count, 1024));
    for (std::uint64_t i = 0; i < count; ++i) {
      s(frames.emplace_back());
    }
  } catch (std::exception const& ex) {
    result.error_message = fmt::format("Malformed state snapshot: {}", ex.what());
    spdlog::error("{}", result.error_message);
    return result;
  }

  for (auto const& frame : frames) {
    auto const executed = execute_state_sync_event(frame);
    if (executed.success) {
      ++result.applied;
    } else {
      ++result.failed;
      spdlog::warn("Skipping state change while loading snapshot: {}", executed.to_string());
    }
  }

  result.success = result.failed == 0;
  if (!result.success) {
    result.error_message = fmt::format("{} of {} state changes could not be applied", result.failed, frames.size());
  }
  spdlog::debug("Loaded state snapshot: {} applied, {} failed", result.applied, result.failed);
  return result;
}

} // namespace state_sync
