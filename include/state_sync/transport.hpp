#pragma once

#include "core.hpp"

#include <cstdint>
#include <functional>
#include <vector>

namespace state_sync {

using peer_id         = std::uint32_t;
using receive_handler = std::function<void(peer_id from, buffer_type const& bytes)>;

inline constexpr peer_id invalid_peer = 0;

// Byte transport between peers. Implementations must deliver the messages of
// one sender in the order they were sent.
class transport {
public:
  virtual ~transport() = default;

  virtual peer_id              local_peer() const   = 0;
  virtual std::vector<peer_id> remote_peers() const = 0;

  // False when the peer is not reachable
  virtual bool send(peer_id to, buffer_type bytes) = 0;
  virtual void broadcast(buffer_type bytes)        = 0;

  // Replaces the current handler; an empty handler drops incoming messages
  virtual void on_receive(receive_handler handler) = 0;
};

} // namespace state_sync
