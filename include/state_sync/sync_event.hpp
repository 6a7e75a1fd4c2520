#pragma once

#include "core.hpp"
#include "var.hpp"

#include <cstdint>
#include <string>
#include <type_traits>
#include <vector>

namespace state_sync {

class serializer;

// Environments an event is meant for, plus per-event coalescing switches.
// Options are assigned locally when a scope surfaces and are not part of the
// wire format.
enum class sync_options : std::uint32_t {
  none                 = 0,
  network              = 1u << 0,
  replay               = 1u << 1,
  generate_new_frame   = 1u << 8,
  ignore_nesting_check = 1u << 9,
  default_options      = network | replay
};

constexpr sync_options operator|(sync_options lhs, sync_options rhs) noexcept {
  using underlying = std::underlying_type_t<sync_options>;
  return static_cast<sync_options>(static_cast<underlying>(lhs) | static_cast<underlying>(rhs));
}

constexpr sync_options operator&(sync_options lhs, sync_options rhs) noexcept {
  using underlying = std::underlying_type_t<sync_options>;
  return static_cast<sync_options>(static_cast<underlying>(lhs) & static_cast<underlying>(rhs));
}

constexpr sync_options operator~(sync_options value) noexcept {
  using underlying = std::underlying_type_t<sync_options>;
  return static_cast<sync_options>(~static_cast<underlying>(value));
}

constexpr sync_options& operator|=(sync_options& lhs, sync_options rhs) noexcept {
  return lhs = lhs | rhs;
}

constexpr bool has_flag(sync_options options, sync_options flag) noexcept {
  return (options & flag) == flag && flag != sync_options::none;
}

std::string to_string(sync_options options);

// One discrete, replayable state change. Concrete kinds describe their payload
// once in serialize_event(), which both writes and reads.
//
// Kinds must be default constructible without side effects: the event type
// registry creates the instance that decoding populates.
class sync_event {
public:
  virtual ~sync_event() = default;

  sync_options options() const noexcept {
    return options_;
  }

  void set_options(sync_options options) noexcept {
    options_ = options;
  }

  // Events returning false are recorded for replay but never sent to peers
  virtual bool should_sync_network_event() const {
    return true;
  }

  virtual std::string to_string() const = 0;

  virtual void serialize_event(serializer& s) = 0;

protected:
  sync_event() = default;

private:
  sync_options options_ = sync_options::default_options;
};

class property_changed_event : public sync_event {
public:
  property_changed_event() = default;

  property_changed_event(std::string property_name, var value)
    : property_name_(std::move(property_name))
    , value_(std::move(value)) {
  }

  std::string const& property_name() const noexcept {
    return property_name_;
  }

  var const& value() const noexcept {
    return value_;
  }

  std::string to_string() const override;

  void serialize_event(serializer& s) override;

private:
  std::string property_name_;
  var         value_;
};

class method_invoked_event : public sync_event {
public:
  method_invoked_event() = default;

  method_invoked_event(std::string method_name, std::vector<var> parameters)
    : method_name_(std::move(method_name))
    , parameters_(std::move(parameters)) {
  }

  template <typename... ArgsT>
  static method_invoked_event make(std::string method_name, ArgsT&&... args) {
    return method_invoked_event(std::move(method_name), std::vector<var>{var(std::forward<ArgsT>(args))...});
  }

  std::string const& method_name() const noexcept {
    return method_name_;
  }

  std::vector<var> const& parameters() const noexcept {
    return parameters_;
  }

  std::string to_string() const override;

  void serialize_event(serializer& s) override;

private:
  std::string      method_name_;
  std::vector<var> parameters_;
};

} // namespace state_sync

template <>
struct fmt::formatter<state_sync::sync_event> : fmt::formatter<std::string> {
  template <typename FormatContext>
  auto format(state_sync::sync_event const& event, FormatContext& ctx) const {
    return fmt::formatter<std::string>::format(event.to_string(), ctx);
  }
};
