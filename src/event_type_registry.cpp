#include "state_sync/event_type_registry.hpp"

#include <spdlog/spdlog.h>

namespace state_sync {

event_type_registry::event_type_registry() {
  register_event<property_changed_event>(protocol::builtin_module, "property_changed_event");
  register_event<method_invoked_event>(protocol::builtin_module, "method_invoked_event");
}

bool event_type_registry::add(std::type_index type, event_type_key key, factory_type factory) {
  if (keys_.contains(type)) {
    spdlog::error("Event kind {} is already registered as {} ({})", type.name(), keys_.at(type).type_name, keys_.at(type).module);
    return false;
  }

  auto [it, inserted] = factories_.emplace(std::make_pair(key.type_name, key.module), std::move(factory));
  if (!inserted) {
    spdlog::error("Event type name {} ({}) is already taken by another kind", key.type_name, key.module);
    return false;
  }

  spdlog::debug("Registered event kind {} ({})", key.type_name, key.module);
  keys_.emplace(type, std::move(key));
  return true;
}

std::unique_ptr<sync_event> event_type_registry::create(std::string_view type_name, std::string_view module) const {
  auto it = factories_.find(std::make_pair(std::string(type_name), std::string(module)));
  if (it == factories_.end()) {
    return nullptr;
  }
  return it->second();
}

event_type_key const* event_type_registry::key_of(sync_event const& event) const {
  auto it = keys_.find(std::type_index(typeid(event)));
  return it != keys_.end() ? &it->second : nullptr;
}

bool event_type_registry::contains(std::string_view type_name, std::string_view module) const {
  return factories_.contains(std::make_pair(std::string(type_name), std::string(module)));
}

} // namespace state_sync
