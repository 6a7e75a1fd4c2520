#pragma once

#include "sync_event.hpp"
#include "type_name.hpp"

#include <functional>
#include <map>
#include <memory>
#include <string>
#include <string_view>
#include <type_traits>
#include <typeindex>
#include <unordered_map>
#include <utility>

namespace state_sync {

// Wire discriminator of an event kind
struct event_type_key {
  std::string type_name;
  std::string module;

  bool operator==(event_type_key const& other) const = default;
};

// Maps event kinds to side-effect-free factories. Decoding looks kinds up by
// (type name, module); encoding looks the key up by the dynamic C++ type.
class event_type_registry {
public:
  using factory_type = std::function<std::unique_ptr<sync_event>()>;

  // Registers property_changed_event and method_invoked_event under the built-in module
  event_type_registry();

  // The name defaults to the compiler-independent spelling of EventT
  template <typename EventT>
  bool register_event(std::string_view module, std::string name = wire_type_name<EventT>()) {
    static_assert(std::is_base_of_v<sync_event, EventT>, "Event kinds must derive from sync_event");
    static_assert(std::is_default_constructible_v<EventT>, "Event kinds need a default constructor for decoding");

    return add(std::type_index(typeid(EventT)), event_type_key{std::move(name), std::string(module)}, []() -> std::unique_ptr<sync_event> {
      return std::make_unique<EventT>();
    });
  }

  // Returns nullptr when the kind is unknown
  std::unique_ptr<sync_event> create(std::string_view type_name, std::string_view module) const;

  // Returns nullptr when the event's dynamic type was never registered
  event_type_key const* key_of(sync_event const& event) const;

  bool contains(std::string_view type_name, std::string_view module) const;

  std::size_t size() const noexcept {
    return factories_.size();
  }

private:
  bool add(std::type_index type, event_type_key key, factory_type factory);

  std::map<std::pair<std::string, std::string>, factory_type> factories_;
  std::unordered_map<std::type_index, event_type_key>         keys_;
};

} // namespace state_sync
