#pragma once

#ifdef ENTT_ID_TYPE
#undef ENTT_ID_TYPE
#endif

#include <cstdint>
#define ENTT_ID_TYPE std::uint64_t

#include <entt/entity/entity.hpp>

#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace state_sync {

using entity      = entt::entity;
using buffer_type = std::vector<std::uint8_t>;
using handler_id  = std::size_t;

namespace protocol {
// Envelope layout version. Every field after it is read according to this value.
inline constexpr std::uint16_t current_version       = 1;
inline constexpr std::uint16_t min_supported_version = 1;

// Module name under which the built-in event kinds are registered
inline constexpr std::string_view builtin_module = "state_sync";
} // namespace protocol

class sync_error : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

// Corrupt, truncated or otherwise unreadable wire data
class decode_error : public sync_error {
public:
  using sync_error::sync_error;
};

// A var does not hold the kind a C++ member expects
class conversion_error : public sync_error {
public:
  using sync_error::sync_error;
};

} // namespace state_sync
