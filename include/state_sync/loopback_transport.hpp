#pragma once

#include "transport.hpp"

#include <boost/asio/io_context.hpp>

#include <map>
#include <memory>

namespace state_sync {

namespace asio = boost::asio;

class loopback_transport;

// In-process switchboard connecting loopback transports
class loopback_hub {
public:
  std::vector<peer_id> peers() const;

private:
  friend class loopback_transport;

  peer_id attach(std::weak_ptr<loopback_transport> transport);
  void    detach(peer_id peer);
  bool    deliver(peer_id from, peer_id to, buffer_type bytes);

  peer_id                                              next_peer_ = 1;
  std::map<peer_id, std::weak_ptr<loopback_transport>> peers_;
};

// Transport whose messages are posted onto the receiving peer's io_context,
// so delivery happens when that peer polls its context, one frame at a time.
class loopback_transport : public transport, public std::enable_shared_from_this<loopback_transport> {
public:
  static std::shared_ptr<loopback_transport> create(loopback_hub& hub, asio::io_context& io_context);

  ~loopback_transport() override;

  peer_id local_peer() const override {
    return peer_;
  }

  std::vector<peer_id> remote_peers() const override;

  bool send(peer_id to, buffer_type bytes) override;
  void broadcast(buffer_type bytes) override;
  void on_receive(receive_handler handler) override;

private:
  loopback_transport(loopback_hub& hub, asio::io_context& io_context);

  void post(peer_id from, buffer_type bytes);

  loopback_hub&     hub_;
  asio::io_context& io_context_;
  peer_id           peer_ = invalid_peer;
  receive_handler   handler_;
};

} // namespace state_sync
