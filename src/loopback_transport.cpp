#include "state_sync/loopback_transport.hpp"

#include <boost/asio/post.hpp>

#include <spdlog/spdlog.h>

namespace state_sync {

std::vector<peer_id> loopback_hub::peers() const {
  std::vector<peer_id> result;
  result.reserve(peers_.size());
  for (auto const& [peer, transport] : peers_) {
    result.push_back(peer);
  }
  return result;
}

peer_id loopback_hub::attach(std::weak_ptr<loopback_transport> transport) {
  auto const peer = next_peer_++;
  peers_.emplace(peer, std::move(transport));
  return peer;
}

void loopback_hub::detach(peer_id peer) {
  peers_.erase(peer);
}

bool loopback_hub::deliver(peer_id from, peer_id to, buffer_type bytes) {
  auto it = peers_.find(to);
  if (it == peers_.end()) {
    return false;
  }

  auto target = it->second.lock();
  if (!target) {
    return false;
  }
  target->post(from, std::move(bytes));
  return true;
}

std::shared_ptr<loopback_transport> loopback_transport::create(loopback_hub& hub, asio::io_context& io_context) {
  std::shared_ptr<loopback_transport> transport(new loopback_transport(hub, io_context));
  transport->peer_ = hub.attach(transport);
  spdlog::debug("Loopback peer {} attached", transport->peer_);
  return transport;
}

loopback_transport::loopback_transport(loopback_hub& hub, asio::io_context& io_context)
  : hub_(hub)
  , io_context_(io_context) {
}

loopback_transport::~loopback_transport() {
  hub_.detach(peer_);
}

std::vector<peer_id> loopback_transport::remote_peers() const {
  auto peers = hub_.peers();
  std::erase(peers, peer_);
  return peers;
}

bool loopback_transport::send(peer_id to, buffer_type bytes) {
  if (!hub_.deliver(peer_, to, std::move(bytes))) {
    spdlog::warn("Loopback peer {} cannot reach peer {}", peer_, to);
    return false;
  }
  return true;
}

void loopback_transport::broadcast(buffer_type bytes) {
  for (auto const peer : remote_peers()) {
    if (!hub_.deliver(peer_, peer, bytes)) {
      spdlog::debug("Loopback peer {} went away during broadcast from {}", peer, peer_);
    }
  }
}

void loopback_transport::on_receive(receive_handler handler) {
  handler_ = std::move(handler);
}

void loopback_transport::post(peer_id from, buffer_type bytes) {
  asio::post(io_context_, [weak = weak_from_this(), from, bytes = std::move(bytes)]() {
    auto self = weak.lock();
    if (!self || !self->handler_) {
      return;
    }
    self->handler_(from, bytes);
  });
}

} // namespace state_sync
