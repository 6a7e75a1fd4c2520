#include "state_sync/var.hpp"

#include <boost/uuid/uuid_io.hpp>

#include <cmath>
#include <cstdlib>

namespace state_sync {

std::string_view to_string(var_type type) {
  switch (type) {
  case var_type::null:
    return "null";
  case var_type::boolean:
    return "bool";
  case var_type::int8:
    return "int8";
  case var_type::uint8:
    return "uint8";
  case var_type::character:
    return "char";
  case var_type::int16:
    return "int16";
  case var_type::uint16:
    return "uint16";
  case var_type::int32:
    return "int32";
  case var_type::uint32:
    return "uint32";
  case var_type::int64:
    return "int64";
  case var_type::uint64:
    return "uint64";
  case var_type::float32:
    return "float";
  case var_type::float64:
    return "double";
  case var_type::decimal:
    return "decimal";
  case var_type::string:
    return "string";
  case var_type::enumeration:
    return "enum";
  case var_type::guid:
    return "guid";
  case var_type::object_ref:
    return "object_ref";
  case var_type::array:
    return "array";
  case var_type::list:
    return "list";
  case var_type::map:
    return "map";
  case var_type::any:
    return "any";
  }
  return "unknown";
}

decimal decimal::normalized() const {
  decimal result = *this;
  while (result.scale > 0 && result.mantissa % 10 == 0) {
    result.mantissa /= 10;
    --result.scale;
  }
  return result;
}

double decimal::to_double() const {
  return static_cast<double>(mantissa) / std::pow(10.0, scale);
}

std::string decimal::to_string() const {
  bool const          negative  = mantissa < 0;
  std::uint64_t const magnitude = negative ? 0u - static_cast<std::uint64_t>(mantissa) : static_cast<std::uint64_t>(mantissa);
  std::string         digits    = std::to_string(magnitude);
  if (scale > 0) {
    if (digits.size() <= scale) {
      digits.insert(0, scale - digits.size() + 1, '0');
    }
    digits.insert(digits.size() - scale, 1, '.');
  }
  return negative ? "-" + digits : digits;
}

bool operator==(decimal const& lhs, decimal const& rhs) {
  auto const a = lhs.normalized();
  auto const b = rhs.normalized();
  return a.mantissa == b.mantissa && a.scale == b.scale;
}

bool operator==(var_array const& lhs, var_array const& rhs) {
  return lhs.element_type == rhs.element_type && lhs.items == rhs.items;
}

bool operator==(var_map const& lhs, var_map const& rhs) {
  return lhs.key_type == rhs.key_type && lhs.value_type == rhs.value_type && lhs.keys == rhs.keys && lhs.values == rhs.values;
}

bool operator==(var const& lhs, var const& rhs) {
  return lhs.value_ == rhs.value_;
}

namespace {

std::string render_character(char16_t value) {
  if (value >= 0x20 && value < 0x7f) {
    return std::string(1, static_cast<char>(value));
  }
  return fmt::format("\\u{:04x}", static_cast<unsigned>(value));
}

template <typename RenderT>
std::string join_items(std::vector<var> const& items, RenderT&& render) {
  std::string result;
  for (std::size_t i = 0; i < items.size(); ++i) {
    if (i > 0) {
      result += ", ";
    }
    result += render(items[i]);
  }
  return result;
}

std::string render(var const& value, bool quote_strings) {
  auto const item_renderer = [](var const& item) {
    return item.to_parameter_string();
  };

  return std::visit(
      [&](auto const& v) -> std::string {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, std::monostate>) {
          return "null";
        } else if constexpr (std::is_same_v<T, bool>) {
          return v ? "true" : "false";
        } else if constexpr (std::is_same_v<T, char16_t>) {
          return quote_strings ? "'" + render_character(v) + "'" : render_character(v);
        } else if constexpr (std::is_same_v<T, std::int8_t> || std::is_same_v<T, std::uint8_t>) {
          return std::to_string(static_cast<int>(v));
        } else if constexpr (std::is_integral_v<T> || std::is_floating_point_v<T>) {
          return fmt::format("{}", v);
        } else if constexpr (std::is_same_v<T, decimal>) {
          return v.to_string();
        } else if constexpr (std::is_same_v<T, std::string>) {
          return quote_strings ? "\"" + v + "\"" : v;
        } else if constexpr (std::is_same_v<T, enum_value>) {
          return fmt::format("{}({})", v.type_name, v.value);
        } else if constexpr (std::is_same_v<T, boost::uuids::uuid>) {
          return boost::uuids::to_string(v);
        } else if constexpr (std::is_same_v<T, object_ref>) {
          return v.id.empty() ? "null" : fmt::format("ref({})", v.id);
        } else if constexpr (std::is_same_v<T, var_array>) {
          return "[" + join_items(v.items, item_renderer) + "]";
        } else if constexpr (std::is_same_v<T, std::vector<var>>) {
          return "[" + join_items(v, item_renderer) + "]";
        } else if constexpr (std::is_same_v<T, var_map>) {
          std::string result = "{";
          for (std::size_t i = 0; i < v.keys.size() && i < v.values.size(); ++i) {
            if (i > 0) {
              result += ", ";
            }
            result += v.keys[i].to_parameter_string() + ": " + v.values[i].to_parameter_string();
          }
          return result + "}";
        }
      },
      value.value());
}

} // namespace

std::string var::to_string() const {
  return render(*this, false);
}

std::string var::to_parameter_string() const {
  return render(*this, true);
}

namespace detail {

void throw_conversion_error(var const& value, var_type expected, std::string_view cpp_type) {
  throw conversion_error(fmt::format("Cannot convert {} value {} to {} (expected wire kind {})",
                                     state_sync::to_string(value.type()),
                                     value.to_parameter_string(),
                                     cpp_type,
                                     state_sync::to_string(expected)));
}

} // namespace detail

} // namespace state_sync
