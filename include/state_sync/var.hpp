#pragma once

#include "core.hpp"
#include "type_name.hpp"

#include <boost/uuid/uuid.hpp>

#include <spdlog/fmt/fmt.h>

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <type_traits>
#include <unordered_map>
#include <variant>
#include <vector>

namespace state_sync {

// Wire kinds of a var. The numeric value is the tag byte written before every
// var and matches the alternative index in var::value_type.
enum class var_type : std::uint8_t {
  null = 0,
  boolean,
  int8,
  uint8,
  character,
  int16,
  uint16,
  int32,
  uint32,
  int64,
  uint64,
  float32,
  float64,
  decimal,
  string,
  enumeration,
  guid,
  object_ref,
  array,
  list,
  map,

  // Declaration-only marker used by member tables for parameters accepting any kind
  any = 0xff
};

std::string_view to_string(var_type type);

// Exact base-10 number: mantissa * 10^-scale
struct decimal {
  std::int64_t mantissa = 0;
  std::uint8_t scale    = 0;

  decimal normalized() const;
  double      to_double() const;
  std::string to_string() const;
};

bool operator==(decimal const& lhs, decimal const& rhs);

struct enum_value {
  std::string  type_name;
  std::int64_t value = 0;

  bool operator==(enum_value const& other) const = default;
};

// Reference to a synchronizable entity by its stable unique id
struct object_ref {
  std::string id;

  bool operator==(object_ref const& other) const = default;
};

class var;

// Homogeneous sequence, every item is of element_type
struct var_array {
  var_type         element_type = var_type::any;
  std::vector<var> items;
};

struct var_map {
  var_type         key_type   = var_type::any;
  var_type         value_type = var_type::any;
  std::vector<var> keys;
  std::vector<var> values;
};

bool operator==(var_array const& lhs, var_array const& rhs);
bool operator==(var_map const& lhs, var_map const& rhs);

template <typename T, typename = void>
struct var_traits;

class var {
public:
  using value_type = std::variant<std::monostate,
                                  bool,
                                  std::int8_t,
                                  std::uint8_t,
                                  char16_t,
                                  std::int16_t,
                                  std::uint16_t,
                                  std::int32_t,
                                  std::uint32_t,
                                  std::int64_t,
                                  std::uint64_t,
                                  float,
                                  double,
                                  decimal,
                                  std::string,
                                  enum_value,
                                  boost::uuids::uuid,
                                  object_ref,
                                  var_array,
                                  std::vector<var>,
                                  var_map>;

  var() = default;

  template <typename T, typename = std::enable_if_t<!std::is_same_v<std::decay_t<T>, var>>>
  var(T&& value)
    : var(var_traits<std::decay_t<T>>::to_var(std::forward<T>(value))) {
  }

  template <typename T>
  static var make(T&& value) {
    var result;
    result.value_.template emplace<std::decay_t<T>>(std::forward<T>(value));
    return result;
  }

  var_type type() const noexcept {
    return static_cast<var_type>(value_.index());
  }

  bool is_null() const noexcept {
    return std::holds_alternative<std::monostate>(value_);
  }

  template <typename T>
  T const* get_if() const noexcept {
    return std::get_if<T>(&value_);
  }

  template <typename T>
  T* get_if() noexcept {
    return std::get_if<T>(&value_);
  }

  template <typename T>
  T as() const {
    return var_traits<T>::from_var(*this);
  }

  value_type const& value() const noexcept {
    return value_;
  }

  // Plain rendering used in logs: strings are not quoted
  std::string to_string() const;

  // Rendering used inside method call descriptions: strings and characters are quoted
  std::string to_parameter_string() const;

  friend bool operator==(var const& lhs, var const& rhs);

private:
  value_type value_;
};

static_assert(std::variant_size_v<var::value_type> == static_cast<std::size_t>(var_type::map) + 1,
              "var_type tags must match var::value_type alternatives");

// ============================================================================
// C++ type <-> var mapping
// ============================================================================

namespace detail {

template <typename T>
struct native_kind;

template <var_type Kind>
struct native_kind_constant {
  static constexpr var_type value = Kind;
};

// clang-format off
template <> struct native_kind<bool>               : native_kind_constant<var_type::boolean> {};
template <> struct native_kind<std::int8_t>        : native_kind_constant<var_type::int8> {};
template <> struct native_kind<std::uint8_t>       : native_kind_constant<var_type::uint8> {};
template <> struct native_kind<char16_t>           : native_kind_constant<var_type::character> {};
template <> struct native_kind<std::int16_t>       : native_kind_constant<var_type::int16> {};
template <> struct native_kind<std::uint16_t>      : native_kind_constant<var_type::uint16> {};
template <> struct native_kind<std::int32_t>       : native_kind_constant<var_type::int32> {};
template <> struct native_kind<std::uint32_t>      : native_kind_constant<var_type::uint32> {};
template <> struct native_kind<std::int64_t>       : native_kind_constant<var_type::int64> {};
template <> struct native_kind<std::uint64_t>      : native_kind_constant<var_type::uint64> {};
template <> struct native_kind<float>              : native_kind_constant<var_type::float32> {};
template <> struct native_kind<double>             : native_kind_constant<var_type::float64> {};
template <> struct native_kind<decimal>            : native_kind_constant<var_type::decimal> {};
template <> struct native_kind<std::string>        : native_kind_constant<var_type::string> {};
template <> struct native_kind<enum_value>         : native_kind_constant<var_type::enumeration> {};
template <> struct native_kind<boost::uuids::uuid> : native_kind_constant<var_type::guid> {};
template <> struct native_kind<object_ref>         : native_kind_constant<var_type::object_ref> {};
template <> struct native_kind<var_array>          : native_kind_constant<var_type::array> {};
template <> struct native_kind<var_map>            : native_kind_constant<var_type::map> {};
// clang-format on

template <typename T, typename = void>
inline constexpr bool has_native_kind = false;

template <typename T>
inline constexpr bool has_native_kind<T, std::void_t<decltype(native_kind<T>::value)>> = true;

[[noreturn]] void throw_conversion_error(var const& value, var_type expected, std::string_view cpp_type);

} // namespace detail

template <typename T>
struct var_traits<T, std::enable_if_t<detail::has_native_kind<T>>> {
  static constexpr var_type type = detail::native_kind<T>::value;

  static var to_var(T value) {
    return var::make(std::move(value));
  }

  static T from_var(var const& value) {
    if (auto const* native = value.template get_if<T>(); native != nullptr) {
      return *native;
    }
    detail::throw_conversion_error(value, type, state_sync::type_name<T>());
  }
};

template <>
struct var_traits<var> {
  static constexpr var_type type = var_type::any;

  static var to_var(var value) {
    return value;
  }

  static var from_var(var const& value) {
    return value;
  }
};

template <>
struct var_traits<char const*> {
  static constexpr var_type type = var_type::string;

  static var to_var(char const* value) {
    return var::make(std::string(value != nullptr ? value : ""));
  }
};

template <typename E>
struct var_traits<E, std::enable_if_t<std::is_enum_v<E>>> {
  static constexpr var_type type = var_type::enumeration;

  static var to_var(E value) {
    return var::make(enum_value{std::string(state_sync::type_name<E>()), static_cast<std::int64_t>(value)});
  }

  static E from_var(var const& value) {
    auto const* native = value.template get_if<enum_value>();
    if (native == nullptr || (!native->type_name.empty() && native->type_name != state_sync::type_name<E>())) {
      detail::throw_conversion_error(value, type, state_sync::type_name<E>());
    }
    return static_cast<E>(native->value);
  }
};

template <typename T>
struct var_traits<std::optional<T>> {
  static constexpr var_type type = var_traits<T>::type;

  static var to_var(std::optional<T> const& value) {
    return value ? var_traits<T>::to_var(*value) : var{};
  }

  static std::optional<T> from_var(var const& value) {
    if (value.is_null()) {
      return std::nullopt;
    }
    return var_traits<T>::from_var(value);
  }
};

template <typename T>
struct var_traits<std::vector<T>> {
  static constexpr var_type type = std::is_same_v<T, var> ? var_type::list : var_type::array;

  static var to_var(std::vector<T> const& values) {
    if constexpr (std::is_same_v<T, var>) {
      return var::make(values);
    } else {
      var_array array{.element_type = var_traits<T>::type, .items = {}};
      array.items.reserve(values.size());
      for (auto const& value : values) {
        array.items.push_back(var_traits<T>::to_var(value));
      }
      return var::make(std::move(array));
    }
  }

  static std::vector<T> from_var(var const& value) {
    std::vector<var> const* items = value.template get_if<std::vector<var>>();
    if (auto const* array = value.template get_if<var_array>(); array != nullptr) {
      if constexpr (!std::is_same_v<T, var>) {
        if (array->element_type != var_traits<T>::type) {
          detail::throw_conversion_error(value, type, state_sync::type_name<std::vector<T>>());
        }
      }
      items = &array->items;
    }
    if (items == nullptr) {
      detail::throw_conversion_error(value, type, state_sync::type_name<std::vector<T>>());
    }

    std::vector<T> result;
    result.reserve(items->size());
    for (auto const& item : *items) {
      result.push_back(var_traits<T>::from_var(item));
    }
    return result;
  }
};

namespace detail {

template <typename MapT>
struct map_var_traits {
  using key_type    = typename MapT::key_type;
  using mapped_type = typename MapT::mapped_type;

  static constexpr var_type type = var_type::map;

  static var to_var(MapT const& values) {
    var_map map{.key_type = var_traits<key_type>::type, .value_type = var_traits<mapped_type>::type, .keys = {}, .values = {}};
    map.keys.reserve(values.size());
    map.values.reserve(values.size());
    for (auto const& [key, value] : values) {
      map.keys.push_back(var_traits<key_type>::to_var(key));
      map.values.push_back(var_traits<mapped_type>::to_var(value));
    }
    return var::make(std::move(map));
  }

  static MapT from_var(var const& value) {
    auto const* map = value.template get_if<var_map>();
    if (map == nullptr) {
      throw_conversion_error(value, type, state_sync::type_name<MapT>());
    }

    MapT result;
    for (std::size_t i = 0; i < map->keys.size() && i < map->values.size(); ++i) {
      result.emplace(var_traits<key_type>::from_var(map->keys[i]), var_traits<mapped_type>::from_var(map->values[i]));
    }
    return result;
  }
};

} // namespace detail

template <typename K, typename V>
struct var_traits<std::map<K, V>> : detail::map_var_traits<std::map<K, V>> {};

template <typename K, typename V>
struct var_traits<std::unordered_map<K, V>> : detail::map_var_traits<std::unordered_map<K, V>> {};

// Kind a C++ type is transmitted as
template <typename T>
inline constexpr var_type var_type_of = var_traits<std::remove_cv_t<std::remove_reference_t<T>>>::type;

} // namespace state_sync

template <>
struct fmt::formatter<state_sync::var> : fmt::formatter<std::string> {
  template <typename FormatContext>
  auto format(state_sync::var const& value, FormatContext& ctx) const {
    return fmt::formatter<std::string>::format(value.to_string(), ctx);
  }
};
