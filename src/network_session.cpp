#include "state_sync/network_session.hpp"
#include "state_sync/buffer_stream.hpp"
#include "state_sync/serializer.hpp"

#include <cereal/archives/portable_binary.hpp>

#include <spdlog/spdlog.h>

namespace state_sync {

namespace {

// Kind tag, the owned target ids of an initial state request, then the payload
buffer_type make_message(message_kind kind, buffer_type const& payload, std::vector<std::string> owned_target_ids = {}) {
  buffer_type bytes;
  {
    buffer_ostream                      os(bytes);
    cereal::PortableBinaryOutputArchive archive(os);
    serializer                          s(archive);

    auto tag = static_cast<std::uint8_t>(kind);
    s(tag);
    if (kind == message_kind::initial_state_request) {
      s(owned_target_ids);
    }
    s.write_bytes(payload);
  }
  return bytes;
}

} // namespace

network_session::network_session(sync_manager& manager, std::shared_ptr<transport> transport, session_role role)
  : manager_(manager)
  , transport_(std::move(transport))
  , role_(role) {
}

network_session::~network_session() {
  stop();
}

void network_session::start() {
  if (subscription_ != 0) {
    return;
  }

  subscription_ = manager_.subscribe([this](sync_target const& source, sync_event& event) {
    on_state_changed(source, event);
  });
  transport_->on_receive([this](peer_id from, buffer_type const& bytes) {
    on_receive(from, bytes);
  });

  // The host owns the reference state
  if (role_ == session_role::host) {
    initial_state_loaded_ = true;
  }
  spdlog::info("Network session started as {} on peer {}", role_ == session_role::host ? "host" : "client", transport_->local_peer());
}

void network_session::stop() {
  if (subscription_ == 0) {
    return;
  }
  manager_.unsubscribe(subscription_);
  subscription_ = 0;
  transport_->on_receive({});
  spdlog::info("Network session stopped on peer {}", transport_->local_peer());
}

bool network_session::join(peer_id host, std::vector<std::string> owned_target_ids) {
  if (role_ != session_role::client) {
    spdlog::error("Only client sessions can join a host");
    return false;
  }

  host_      = host;
  auto state = manager_.save_state_changes_of(owned_target_ids);
  spdlog::info("Peer {} joining host {} with {} own targets", transport_->local_peer(), host, owned_target_ids.size());
  return send(host_, make_message(message_kind::initial_state_request, state, std::move(owned_target_ids)));
}

void network_session::on_state_changed(sync_target const& source, sync_event& event) {
  if (!has_flag(event.options(), sync_options::network) || !event.should_sync_network_event()) {
    return;
  }

  if (role_ == session_role::client && host_ == invalid_peer) {
    spdlog::trace("Not joined yet, keeping {} local", event.to_string());
    return;
  }

  auto envelope = manager_.encode(event, source);
  if (envelope.empty()) {
    return;
  }

  auto message = make_message(message_kind::state_event, envelope);
  if (role_ == session_role::host) {
    for (auto const peer : transport_->remote_peers()) {
      send(peer, message);
    }
  } else {
    send(host_, std::move(message));
  }
}

void network_session::on_receive(peer_id from, buffer_type const& bytes) {
  ++stats_.received;

  std::uint8_t             tag = 0;
  buffer_type              payload;
  std::vector<std::string> owned_target_ids;
  try {
    buffer_istream                     is(bytes);
    cereal::PortableBinaryInputArchive archive(is);
    serializer                         s(archive, protocol::current_version);

    s(tag);
    if (static_cast<message_kind>(tag) == message_kind::initial_state_request) {
      s(owned_target_ids);
    }
    s(payload);
  } catch (std::exception const& ex) {
    ++stats_.failed;
    spdlog::error("Malformed message from peer {}: {}", from, ex.what());
    return;
  }

  switch (static_cast<message_kind>(tag)) {
  case message_kind::state_event:
    handle_state_event(from, payload);
    return;
  case message_kind::initial_state_request:
    handle_initial_state_request(from, owned_target_ids, payload);
    return;
  case message_kind::initial_state:
    handle_initial_state(payload);
    return;
  case message_kind::peer_state:
    handle_peer_state(from, payload);
    return;
  }

  ++stats_.failed;
  spdlog::error("Unknown message kind {} from peer {}", tag, from);
}

void network_session::handle_state_event(peer_id from, buffer_type const& envelope) {
  if (!initial_state_loaded_ && manager_.settings().ignore_events_until_initial_state_loaded) {
    ++stats_.ignored;
    spdlog::debug("Ignoring state event from peer {} until the initial state is loaded", from);
    return;
  }

  auto const result = manager_.execute_state_sync_event(envelope);
  if (result.success) {
    ++stats_.applied;
  } else {
    ++stats_.failed;
    spdlog::warn("State event from peer {} not applied: {}", from, result.to_string());
  }

  if (role_ == session_role::host) {
    auto const message = make_message(message_kind::state_event, envelope);
    for (auto const peer : transport_->remote_peers()) {
      if (peer != from) {
        send(peer, message);
      }
    }
  }
}

void network_session::handle_initial_state_request(peer_id from, std::vector<std::string> const& owned_target_ids, buffer_type const& state) {
  if (role_ != session_role::host) {
    ++stats_.ignored;
    spdlog::warn("Client peer {} received an initial state request from {}", transport_->local_peer(), from);
    return;
  }

  apply_snapshot(state);

  auto snapshot = manager_.save_state_changes(owned_target_ids);
  spdlog::info("Sending initial state ({} bytes) to peer {}", snapshot.size(), from);
  send(from, make_message(message_kind::initial_state, snapshot));

  auto const message = make_message(message_kind::peer_state, state);
  for (auto const peer : transport_->remote_peers()) {
    if (peer != from) {
      send(peer, message);
    }
  }
}

void network_session::handle_initial_state(buffer_type const& snapshot) {
  if (role_ == session_role::host) {
    ++stats_.ignored;
    spdlog::warn("Host peer {} received an initial state", transport_->local_peer());
    return;
  }

  apply_snapshot(snapshot);
  initial_state_loaded_ = true;
  spdlog::info("Initial state loaded on peer {}", transport_->local_peer());
}

void network_session::handle_peer_state(peer_id from, buffer_type const& snapshot) {
  spdlog::debug("Loading state of a new peer forwarded by {}", from);
  apply_snapshot(snapshot);
}

bool network_session::send(peer_id to, buffer_type bytes) {
  if (!transport_->send(to, std::move(bytes))) {
    spdlog::warn("Peer {} could not send to peer {}", transport_->local_peer(), to);
    return false;
  }
  ++stats_.sent;
  return true;
}

void network_session::apply_snapshot(buffer_type const& snapshot) {
  auto const result = manager_.load_state_changes(snapshot);
  stats_.applied += result.applied;
  stats_.failed += result.failed;
  if (!result.success) {
    spdlog::warn("State snapshot partially applied: {}", result.error_message);
  }
}

} // namespace state_sync
