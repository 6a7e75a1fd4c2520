#pragma once

#include "core.hpp"
#include "dispatch.hpp"
#include "type_name.hpp"
#include "var.hpp"

#include <entt/container/dense_map.hpp>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <functional>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

namespace state_sync {

// Picks one member function out of an overload set:
//   table.method("fire", overload<int, float>(&weapon::fire));
template <typename... ArgsT>
struct overload_t {
  template <typename C, typename R>
  constexpr auto operator()(R (C::*fn)(ArgsT...)) const noexcept {
    return fn;
  }

  template <typename C, typename R>
  constexpr auto operator()(R (C::*fn)(ArgsT...) const) const noexcept {
    return fn;
  }
};

template <typename... ArgsT>
inline constexpr overload_t<ArgsT...> overload{};

// Per-type table of members that can be set or invoked by name. Replaces
// runtime reflection: every entry is a typed closure converting vars into the
// member's C++ types.
//
// Types opt in with a static register_members(member_table<T>&) function,
// which may register private members and members of base classes.
template <typename T>
class member_table {
public:
  struct property_entry {
    var_type                            type = var_type::any;
    std::function<void(T&, var const&)> setter;
    std::function<var(T const&)>        getter;
  };

  struct method_entry {
    std::vector<var_type>                            parameter_types;
    std::function<void(T&, std::vector<var> const&)> invoker;
  };

  // Outcome of the overload policy for one method call
  struct method_resolution {
    method_entry const* entry  = nullptr;
    dispatch_status     status = dispatch_status::success;
    std::string         error_message;
  };

  template <typename C, typename V>
  member_table& property(std::string name, V C::*member) {
    static_assert(std::is_base_of_v<C, T>, "Member must belong to the table's type or one of its bases");
    static_assert(!std::is_function_v<V>, "Use method() to register member functions");

    return add_property(std::move(name),
                        property_entry{.type   = var_type_of<V>,
                                       .setter = [member](T& target, var const& value) { target.*member = value.template as<V>(); },
                                       .getter = [member](T const& target) { return var_traits<V>::to_var(target.*member); }});
  }

  template <typename C, typename G, typename S>
  member_table& property(std::string name, G (C::*getter)() const, void (C::*setter)(S)) {
    static_assert(std::is_base_of_v<C, T>, "Member must belong to the table's type or one of its bases");
    using value_type = std::remove_cvref_t<S>;
    using get_type   = std::remove_cvref_t<G>;

    return add_property(std::move(name),
                        property_entry{.type   = var_type_of<value_type>,
                                       .setter = [setter](T& target, var const& value) { (target.*setter)(value.template as<value_type>()); },
                                       .getter = [getter](T const& target) { return var_traits<get_type>::to_var((target.*getter)()); }});
  }

  template <typename C, typename R, typename... ArgsT>
  member_table& method(std::string name, R (C::*fn)(ArgsT...)) {
    static_assert(std::is_base_of_v<C, T>, "Member must belong to the table's type or one of its bases");
    return add_method<ArgsT...>(std::move(name), [fn](T& target, std::vector<var> const& parameters) {
      invoke<ArgsT...>(target, fn, parameters, std::index_sequence_for<ArgsT...>{});
    });
  }

  template <typename C, typename R, typename... ArgsT>
  member_table& method(std::string name, R (C::*fn)(ArgsT...) const) {
    static_assert(std::is_base_of_v<C, T>, "Member must belong to the table's type or one of its bases");
    return add_method<ArgsT...>(std::move(name), [fn](T& target, std::vector<var> const& parameters) {
      invoke<ArgsT...>(target, fn, parameters, std::index_sequence_for<ArgsT...>{});
    });
  }

  property_entry const* find_property(std::string const& name) const {
    auto it = properties_.find(name);
    return it != properties_.end() ? &it->second : nullptr;
  }

  std::vector<method_entry> const* find_methods(std::string const& name) const {
    auto it = methods_.find(name);
    return it != methods_.end() ? &it->second : nullptr;
  }

  // Properties in registration order
  entt::dense_map<std::string, property_entry> const& properties() const noexcept {
    return properties_;
  }

  // Overload policy:
  //  1. a single method with that name is called regardless of parameter kinds
  //  2. without null parameters, the overload whose declared kinds match the
  //     supplied kinds (exact matches win over 'any' declarations)
  //  3. otherwise the unique overload with a matching parameter count
  method_resolution resolve_method(std::string const& name, std::vector<var> const& parameters) const {
    auto const* overloads = find_methods(name);
    if (overloads == nullptr || overloads->empty()) {
      return {nullptr, dispatch_status::member_not_found, fmt::format("No method named {} on {}", name, type_name<T>())};
    }

    if (overloads->size() == 1) {
      return {&overloads->front(), dispatch_status::success, ""};
    }

    bool const any_null = std::any_of(parameters.begin(), parameters.end(), [](var const& p) {
      return p.is_null();
    });

    if (!any_null) {
      std::vector<method_entry const*> compatible;
      std::vector<method_entry const*> exact;
      for (auto const& entry : *overloads) {
        if (entry.parameter_types.size() != parameters.size()) {
          continue;
        }

        bool is_compatible = true;
        bool is_exact      = true;
        for (std::size_t i = 0; i < parameters.size(); ++i) {
          auto const declared = entry.parameter_types[i];
          if (declared == var_type::any) {
            is_exact = false;
          } else if (declared != parameters[i].type()) {
            is_compatible = false;
            break;
          }
        }

        if (is_compatible) {
          compatible.push_back(&entry);
          if (is_exact) {
            exact.push_back(&entry);
          }
        }
      }

      if (exact.size() == 1) {
        return {exact.front(), dispatch_status::success, ""};
      }
      if (exact.empty() && compatible.size() == 1) {
        return {compatible.front(), dispatch_status::success, ""};
      }
      if (compatible.empty()) {
        return {nullptr,
                dispatch_status::member_not_found,
                fmt::format("No overload of {} on {} accepts ({})", name, type_name<T>(), describe_kinds(parameters))};
      }
      return {nullptr,
              dispatch_status::ambiguous_match,
              fmt::format("{} overloads of {} on {} accept ({})", compatible.size(), name, type_name<T>(), describe_kinds(parameters))};
    }

    method_entry const* match   = nullptr;
    std::size_t         matches = 0;
    for (auto const& entry : *overloads) {
      if (entry.parameter_types.size() == parameters.size()) {
        match = &entry;
        ++matches;
      }
    }

    if (matches == 1) {
      return {match, dispatch_status::success, ""};
    }
    if (matches == 0) {
      return {nullptr,
              dispatch_status::member_not_found,
              fmt::format("Could not find a method {} on {} with {} parameters", name, type_name<T>(), parameters.size())};
    }
    return {nullptr,
            dispatch_status::ambiguous_match,
            fmt::format("{} overloads of {} on {} take {} parameters and a null argument hides the kinds",
                        matches,
                        name,
                        type_name<T>(),
                        parameters.size())};
  }

private:
  template <typename... ArgsT, typename FnT, std::size_t... Is>
  static void invoke(T& target, FnT fn, std::vector<var> const& parameters, std::index_sequence<Is...>) {
    if (parameters.size() != sizeof...(ArgsT)) {
      throw conversion_error(fmt::format("Method expects {} parameters but {} were supplied", sizeof...(ArgsT), parameters.size()));
    }
    (target.*fn)(parameters[Is].template as<std::remove_cvref_t<ArgsT>>()...);
  }

  static std::string describe_kinds(std::vector<var> const& parameters) {
    std::string result;
    for (std::size_t i = 0; i < parameters.size(); ++i) {
      if (i > 0) {
        result += ", ";
      }
      result += to_string(parameters[i].type());
    }
    return result;
  }

  member_table& add_property(std::string name, property_entry entry) {
    if (properties_.contains(name)) {
      spdlog::error("Property {} is registered twice on {}", name, type_name<T>());
      return *this;
    }
    properties_.emplace(std::move(name), std::move(entry));
    return *this;
  }

  template <typename... ArgsT>
  member_table& add_method(std::string name, std::function<void(T&, std::vector<var> const&)> invoker) {
    static_assert((!(std::is_lvalue_reference_v<ArgsT> && !std::is_const_v<std::remove_reference_t<ArgsT>>) && ...),
                  "Replayable methods cannot take non-const lvalue references");

    method_entry entry{.parameter_types = {var_type_of<ArgsT>...}, .invoker = std::move(invoker)};

    auto& overloads = methods_[name];
    for (auto const& existing : overloads) {
      if (existing.parameter_types == entry.parameter_types) {
        spdlog::error("Overload of {} on {} is indistinguishable from one already registered", name, type_name<T>());
        return *this;
      }
    }
    overloads.push_back(std::move(entry));
    return *this;
  }

  entt::dense_map<std::string, property_entry>            properties_;
  entt::dense_map<std::string, std::vector<method_entry>> methods_;
};

// Table of T, built once from T::register_members
template <typename T>
member_table<T> const& members_of() {
  static member_table<T> const table = [] {
    member_table<T> result;
    T::register_members(result);
    return result;
  }();
  return table;
}

} // namespace state_sync
