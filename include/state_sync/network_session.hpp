#pragma once

#include "core.hpp"
#include "sync_manager.hpp"
#include "transport.hpp"

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace state_sync {

enum class session_role : std::uint8_t { host, client };

enum class message_kind : std::uint8_t {
  state_event = 0,       // One encoded envelope
  initial_state_request, // Joining client's own target ids and their state
  initial_state,         // Host snapshot without the joining client's targets
  peer_state             // A newly joined client's targets, forwarded to the other clients
};

struct session_stats {
  std::size_t sent     = 0;
  std::size_t received = 0;
  std::size_t applied  = 0;
  std::size_t failed   = 0;
  std::size_t ignored  = 0;
};

// Replicates surfaced state changes over a transport in a star topology:
// clients talk to the host, the host applies and relays to the other clients.
//
// Join flow: the client sends its own targets' state, the host loads it,
// answers with the global state minus those targets and forwards the
// client's state to every other client.
class network_session {
public:
  network_session(sync_manager& manager, std::shared_ptr<transport> transport, session_role role);
  ~network_session();

  network_session(network_session const&)            = delete;
  network_session& operator=(network_session const&) = delete;

  void start();
  void stop();

  // Client only: asks the host for the initial state
  bool join(peer_id host, std::vector<std::string> owned_target_ids = {});

  session_role role() const noexcept {
    return role_;
  }

  bool initial_state_loaded() const noexcept {
    return initial_state_loaded_;
  }

  session_stats const& stats() const noexcept {
    return stats_;
  }

private:
  void on_state_changed(sync_target const& source, sync_event& event);
  void on_receive(peer_id from, buffer_type const& bytes);

  void handle_state_event(peer_id from, buffer_type const& envelope);
  void handle_initial_state_request(peer_id from, std::vector<std::string> const& owned_target_ids, buffer_type const& state);
  void handle_initial_state(buffer_type const& snapshot);
  void handle_peer_state(peer_id from, buffer_type const& snapshot);

  bool send(peer_id to, buffer_type bytes);
  void apply_snapshot(buffer_type const& snapshot);

  sync_manager&              manager_;
  std::shared_ptr<transport> transport_;
  session_role               role_;
  peer_id                    host_                 = invalid_peer;
  handler_id                 subscription_         = 0;
  bool                       initial_state_loaded_ = false;
  session_stats              stats_;
};

} // namespace state_sync
