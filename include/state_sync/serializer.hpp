#pragma once

#include "core.hpp"
#include "var.hpp"

#include <cereal/archives/portable_binary.hpp>

#include <boost/uuid/uuid.hpp>

#include <string>
#include <type_traits>
#include <vector>

namespace state_sync {

// Symmetric binary serializer. The same serialize() calls read or write
// depending on the archive it was constructed with, so every event kind
// describes its layout once.
//
// 32 and 64-bit integers are written as compressed 7-bit varints, strings as
// varint length + UTF-8 bytes, everything else through the portable binary
// archive (fixed width, little endian on the wire).
class serializer {
public:
  // Guards against corrupt length prefixes and runaway recursion
  static constexpr std::uint64_t max_sequence_length = 1u << 24;
  static constexpr std::uint32_t max_nesting_depth   = 64;

  explicit serializer(cereal::PortableBinaryOutputArchive& archive, std::uint16_t version = protocol::current_version);
  serializer(cereal::PortableBinaryInputArchive& archive, std::uint16_t version);

  std::uint16_t version() const noexcept {
    return version_;
  }

  bool is_reading() const noexcept {
    return input_ != nullptr;
  }

  void serialize(bool& value);
  void serialize(std::int8_t& value);
  void serialize(std::uint8_t& value);
  void serialize(char16_t& value);
  void serialize(std::int16_t& value);
  void serialize(std::uint16_t& value);
  void serialize(std::int32_t& value);
  void serialize(std::uint32_t& value);
  void serialize(std::int64_t& value);
  void serialize(std::uint64_t& value);
  void serialize(float& value);
  void serialize(double& value);
  void serialize(decimal& value);
  void serialize(std::string& value);
  void serialize(boost::uuids::uuid& value);
  void serialize(var& value);
  void serialize(std::vector<var>& values);
  void serialize(std::vector<std::string>& values);

  // Length-prefixed opaque bytes
  void serialize(buffer_type& bytes);

  // Writes bytes laid out like serialize(buffer_type&) without a mutable copy
  void write_bytes(buffer_type const& bytes);

  template <typename E, typename = std::enable_if_t<std::is_enum_v<E>>>
  void serialize(E& value) {
    auto raw = static_cast<std::int64_t>(value);
    serialize(raw);
    value = static_cast<E>(raw);
  }

  template <typename... T>
  void operator()(T&... values) {
    (serialize(values), ...);
  }

private:
  template <typename T>
  void raw(T& value);

  void          write_varint(std::uint64_t value);
  std::uint64_t read_varint(unsigned max_bits);
  std::uint64_t read_length();

  void write_var(var const& value);
  void write_payload(var const& value);
  var  read_var(std::uint32_t depth);
  var  read_payload(var_type type, std::uint32_t depth);
  void write_sequence(var_type element_type, std::vector<var> const& items);
  void read_sequence(var_type element_type, std::vector<var>& items, std::uint32_t depth);

  cereal::PortableBinaryOutputArchive* output_ = nullptr;
  cereal::PortableBinaryInputArchive*  input_  = nullptr;
  std::uint16_t                        version_;
};

} // namespace state_sync
