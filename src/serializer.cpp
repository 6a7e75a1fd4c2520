#include "state_sync/serializer.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>

namespace state_sync {

serializer::serializer(cereal::PortableBinaryOutputArchive& archive, std::uint16_t version)
  : output_(&archive)
  , version_(version) {
}

serializer::serializer(cereal::PortableBinaryInputArchive& archive, std::uint16_t version)
  : input_(&archive)
  , version_(version) {
}

template <typename T>
void serializer::raw(T& value) {
  if (output_ != nullptr) {
    (*output_)(value);
    return;
  }

  try {
    (*input_)(value);
  } catch (cereal::Exception const& ex) {
    throw decode_error(ex.what());
  }
}

void serializer::write_varint(std::uint64_t value) {
  while (value >= 0x80u) {
    auto byte = static_cast<std::uint8_t>(value | 0x80u);
    raw(byte);
    value >>= 7;
  }
  auto byte = static_cast<std::uint8_t>(value);
  raw(byte);
}

std::uint64_t serializer::read_varint(unsigned max_bits) {
  std::uint64_t result = 0;
  for (unsigned shift = 0; shift < max_bits; shift += 7) {
    std::uint8_t byte = 0;
    raw(byte);
    result |= static_cast<std::uint64_t>(byte & 0x7fu) << shift;
    if ((byte & 0x80u) == 0) {
      return result;
    }
  }
  throw decode_error(fmt::format("Compressed {}-bit integer has bad format", max_bits));
}

std::uint64_t serializer::read_length() {
  auto const length = read_varint(64);
  if (length > max_sequence_length) {
    throw decode_error(fmt::format("Length prefix {} exceeds the limit of {}", length, max_sequence_length));
  }
  return length;
}

void serializer::serialize(bool& value) {
  std::uint8_t byte = value ? 1 : 0;
  raw(byte);
  if (byte > 1) {
    throw decode_error(fmt::format("Byte {} is not a boolean", byte));
  }
  value = byte != 0;
}

void serializer::serialize(std::int8_t& value) {
  raw(value);
}

void serializer::serialize(std::uint8_t& value) {
  raw(value);
}

void serializer::serialize(char16_t& value) {
  raw(value);
}

void serializer::serialize(std::int16_t& value) {
  raw(value);
}

void serializer::serialize(std::uint16_t& value) {
  raw(value);
}

void serializer::serialize(std::int32_t& value) {
  if (is_reading()) {
    value = static_cast<std::int32_t>(static_cast<std::uint32_t>(read_varint(35)));
  } else {
    write_varint(static_cast<std::uint32_t>(value));
  }
}

void serializer::serialize(std::uint32_t& value) {
  if (is_reading()) {
    value = static_cast<std::uint32_t>(read_varint(35));
  } else {
    write_varint(value);
  }
}

void serializer::serialize(std::int64_t& value) {
  if (is_reading()) {
    value = static_cast<std::int64_t>(read_varint(64));
  } else {
    write_varint(static_cast<std::uint64_t>(value));
  }
}

void serializer::serialize(std::uint64_t& value) {
  if (is_reading()) {
    value = read_varint(64);
  } else {
    write_varint(value);
  }
}

void serializer::serialize(float& value) {
  raw(value);
}

void serializer::serialize(double& value) {
  raw(value);
}

void serializer::serialize(decimal& value) {
  serialize(value.mantissa);
  raw(value.scale);
}

void serializer::serialize(std::string& value) {
  if (is_reading()) {
    value.resize(read_length());
    if (!value.empty()) {
      try {
        (*input_)(cereal::binary_data(value.data(), value.size()));
      } catch (cereal::Exception const& ex) {
        throw decode_error(ex.what());
      }
    }
  } else {
    write_varint(value.size());
    (*output_)(cereal::binary_data(value.data(), value.size()));
  }
}

void serializer::serialize(boost::uuids::uuid& value) {
  if (is_reading()) {
    try {
      (*input_)(cereal::binary_data(value.begin(), value.size()));
    } catch (cereal::Exception const& ex) {
      throw decode_error(ex.what());
    }
  } else {
    (*output_)(cereal::binary_data(value.begin(), value.size()));
  }
}

void serializer::serialize(buffer_type& bytes) {
  if (is_reading()) {
    bytes.resize(read_length());
    if (!bytes.empty()) {
      try {
        (*input_)(cereal::binary_data(bytes.data(), bytes.size()));
      } catch (cereal::Exception const& ex) {
        throw decode_error(ex.what());
      }
    }
  } else {
    write_bytes(bytes);
  }
}

void serializer::write_bytes(buffer_type const& bytes) {
  if (output_ == nullptr) {
    throw sync_error("write_bytes on a reading serializer");
  }
  write_varint(bytes.size());
  (*output_)(cereal::binary_data(bytes.data(), bytes.size()));
}

void serializer::serialize(var& value) {
  if (is_reading()) {
    value = read_var(0);
  } else {
    write_var(value);
  }
}

void serializer::serialize(std::vector<var>& values) {
  if (is_reading()) {
    values.clear();
    read_sequence(var_type::any, values, 0);
  } else {
    write_sequence(var_type::any, values);
  }
}

void serializer::serialize(std::vector<std::string>& values) {
  if (is_reading()) {
    auto const count = read_length();
    values.clear();
    values.reserve(std::min<std::uint64_t>(count, 1024));
    for (std::uint64_t i = 0; i < count; ++i) {
      serialize(values.emplace_back());
    }
    return;
  }

  write_varint(values.size());
  for (auto& value : values) {
    serialize(value);
  }
}

// ============================================================================
// var encoding: tag byte followed by the kind payload
// ============================================================================

void serializer::write_var(var const& value) {
  auto tag = static_cast<std::uint8_t>(value.type());
  raw(tag);
  write_payload(value);
}

void serializer::write_payload(var const& value) {
  std::visit(
      [this](auto const& v) {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, std::monostate>) {
          // No payload
        } else if constexpr (std::is_same_v<T, bool> || std::is_same_v<T, std::int32_t> || std::is_same_v<T, std::uint32_t> || std::is_same_v<T, std::int64_t> ||
                             std::is_same_v<T, std::uint64_t> || std::is_same_v<T, decimal> || std::is_same_v<T, std::string> ||
                             std::is_same_v<T, boost::uuids::uuid>) {
          T copy = v;
          serialize(copy);
        } else if constexpr (std::is_arithmetic_v<T>) {
          T copy = v;
          raw(copy);
        } else if constexpr (std::is_same_v<T, enum_value>) {
          enum_value copy = v;
          serialize(copy.type_name);
          serialize(copy.value);
        } else if constexpr (std::is_same_v<T, object_ref>) {
          std::string id = v.id;
          serialize(id);
        } else if constexpr (std::is_same_v<T, var_array>) {
          // A declared kind that some item does not honour (e.g. nulls in an
          // optional array) falls back to tagged items. Null is never declared:
          // its payload is empty, so a count alone could not bound the reader.
          bool const typed = v.element_type != var_type::null && std::all_of(v.items.begin(), v.items.end(), [&](var const& item) {
            return item.type() == v.element_type;
          });
          auto tag = static_cast<std::uint8_t>(typed ? v.element_type : var_type::any);
          raw(tag);
          write_sequence(static_cast<var_type>(tag), v.items);
        } else if constexpr (std::is_same_v<T, std::vector<var>>) {
          write_sequence(var_type::any, v);
        } else if constexpr (std::is_same_v<T, var_map>) {
          auto const count = std::min(v.keys.size(), v.values.size());
          bool const typed_keys = v.key_type != var_type::null && std::all_of(v.keys.begin(), v.keys.begin() + count, [&](var const& key) {
            return key.type() == v.key_type;
          });
          bool const typed_values = v.value_type != var_type::null && std::all_of(v.values.begin(), v.values.begin() + count, [&](var const& item) {
            return item.type() == v.value_type;
          });

          auto key_tag   = static_cast<std::uint8_t>(typed_keys ? v.key_type : var_type::any);
          auto value_tag = static_cast<std::uint8_t>(typed_values ? v.value_type : var_type::any);
          raw(key_tag);
          raw(value_tag);
          write_varint(count);
          for (std::size_t i = 0; i < count; ++i) {
            typed_keys ? write_payload(v.keys[i]) : write_var(v.keys[i]);
            typed_values ? write_payload(v.values[i]) : write_var(v.values[i]);
          }
        }
      },
      value.value());
}

// Items of a known element kind skip the per-item tag
void serializer::write_sequence(var_type element_type, std::vector<var> const& items) {
  write_varint(items.size());
  for (auto const& item : items) {
    element_type == var_type::any ? write_var(item) : write_payload(item);
  }
}

void serializer::read_sequence(var_type element_type, std::vector<var>& items, std::uint32_t depth) {
  auto const count = read_length();
  items.reserve(std::min<std::uint64_t>(count, 1024));
  for (std::uint64_t i = 0; i < count; ++i) {
    items.push_back(element_type == var_type::any ? read_var(depth + 1) : read_payload(element_type, depth + 1));
  }
}

var serializer::read_var(std::uint32_t depth) {
  std::uint8_t tag = 0;
  raw(tag);
  return read_payload(static_cast<var_type>(tag), depth);
}

var serializer::read_payload(var_type type, std::uint32_t depth) {
  if (depth > max_nesting_depth) {
    throw decode_error(fmt::format("var nesting exceeds {} levels", max_nesting_depth));
  }

  auto const read_native = [this]<typename T>() {
    T value{};
    serialize(value);
    return var::make(std::move(value));
  };

  auto const read_tag = [this]() {
    std::uint8_t tag = 0;
    raw(tag);
    auto const type = static_cast<var_type>(tag);
    if (type != var_type::any && type > var_type::map) {
      throw decode_error(fmt::format("Unknown element tag {}", tag));
    }
    if (type == var_type::null) {
      throw decode_error("Null is not a valid element kind");
    }
    return type;
  };

  switch (type) {
  case var_type::null:
    return var{};
  case var_type::boolean:
    return read_native.template operator()<bool>();
  case var_type::int8:
    return read_native.template operator()<std::int8_t>();
  case var_type::uint8:
    return read_native.template operator()<std::uint8_t>();
  case var_type::character:
    return read_native.template operator()<char16_t>();
  case var_type::int16:
    return read_native.template operator()<std::int16_t>();
  case var_type::uint16:
    return read_native.template operator()<std::uint16_t>();
  case var_type::int32:
    return read_native.template operator()<std::int32_t>();
  case var_type::uint32:
    return read_native.template operator()<std::uint32_t>();
  case var_type::int64:
    return read_native.template operator()<std::int64_t>();
  case var_type::uint64:
    return read_native.template operator()<std::uint64_t>();
  case var_type::float32:
    return read_native.template operator()<float>();
  case var_type::float64:
    return read_native.template operator()<double>();
  case var_type::decimal:
    return read_native.template operator()<decimal>();
  case var_type::string:
    return read_native.template operator()<std::string>();
  case var_type::guid:
    return read_native.template operator()<boost::uuids::uuid>();
  case var_type::enumeration: {
    enum_value value;
    serialize(value.type_name);
    serialize(value.value);
    return var::make(std::move(value));
  }
  case var_type::object_ref: {
    object_ref value;
    serialize(value.id);
    return var::make(std::move(value));
  }
  case var_type::array: {
    var_array array;
    array.element_type = read_tag();
    read_sequence(array.element_type, array.items, depth);
    return var::make(std::move(array));
  }
  case var_type::list: {
    std::vector<var> items;
    read_sequence(var_type::any, items, depth);
    return var::make(std::move(items));
  }
  case var_type::map: {
    var_map map;
    map.key_type   = read_tag();
    map.value_type = read_tag();
    auto const count = read_length();
    map.keys.reserve(std::min<std::uint64_t>(count, 1024));
    map.values.reserve(std::min<std::uint64_t>(count, 1024));
    for (std::uint64_t i = 0; i < count; ++i) {
      map.keys.push_back(map.key_type == var_type::any ? read_var(depth + 1) : read_payload(map.key_type, depth + 1));
      map.values.push_back(map.value_type == var_type::any ? read_var(depth + 1) : read_payload(map.value_type, depth + 1));
    }
    return var::make(std::move(map));
  }
  case var_type::any:
    break;
  }

  throw decode_error(fmt::format("Unknown var tag {}", static_cast<unsigned>(type)));
}

} // namespace state_sync
