#pragma once

#include "member_table.hpp"
#include "sync_context.hpp"
#include "sync_implementer.hpp"
#include "sync_target.hpp"

#include <memory>
#include <string>
#include <vector>

namespace state_sync {

// CRTP base for synchronizable types. Derived provides
//   static void register_members(member_table<Derived>&);
// and wraps its mutating members in begin_sync() / end_sync_*().
template <typename Derived>
class sync_component : public sync_target {
public:
  sync_component(sync_context& context, std::string unique_id)
    : unique_id_(std::move(unique_id))
    , implementer_(static_cast<Derived&>(*this), context) {
  }

  sync_component(sync_component const&)            = delete;
  sync_component& operator=(sync_component const&) = delete;

  std::string const& unique_id() const override {
    return unique_id_;
  }

  dispatch_result sync_state(sync_event const& event) override {
    return implementer_.sync_state(event, [this](sync_event const& custom) {
      return sync_custom_state(custom);
    });
  }

  // One property change per readable registered property, in registration order
  std::vector<std::unique_ptr<sync_event>> capture_state() const override {
    std::vector<std::unique_ptr<sync_event>> events;
    for (auto const& [name, entry] : members_of<Derived>().properties()) {
      if (entry.getter) {
        events.push_back(std::make_unique<property_changed_event>(name, entry.getter(static_cast<Derived const&>(*this))));
      }
    }
    return events;
  }

  sync_context& context() const noexcept {
    return implementer_.context();
  }

  std::size_t sync_depth() const noexcept {
    return implementer_.depth();
  }

protected:
  void begin_sync(sync_options options = sync_options::default_options) {
    implementer_.begin_sync(options);
  }

  void cancel_sync() {
    implementer_.cancel_sync();
  }

  void end_sync_property(std::string property_name, var value) {
    implementer_.end_sync_property(std::move(property_name), std::move(value));
  }

  template <typename... ArgsT>
  void end_sync_method(std::string method_name, ArgsT&&... args) {
    implementer_.end_sync_method(std::move(method_name), std::vector<var>{var(std::forward<ArgsT>(args))...});
  }

  void end_sync_state(sync_event& event) {
    implementer_.end_sync_state(event);
  }

  // Replays custom event kinds. Returns false when the kind is not handled.
  virtual bool sync_custom_state(sync_event const& event) {
    (void)event;
    return false;
  }

private:
  std::string                unique_id_;
  sync_implementer<Derived>  implementer_;
};

} // namespace state_sync
