// Example replicating a small scene between a host and a client, then replaying it
#include <state_sync/loopback_transport.hpp>
#include <state_sync/network_session.hpp>
#include <state_sync/replay.hpp>
#include <state_sync/settings.hpp>
#include <state_sync/sync_component.hpp>

#include <boost/asio/io_context.hpp>

#include <iostream>
#include <memory>

using namespace state_sync;

// Example synchronizable object
class Door : public sync_component<Door> {
public:
  Door(sync_context& context, std::string id)
    : sync_component(context, std::move(id)) {
  }

  static void register_members(member_table<Door>& table) {
    table.property("Open", &Door::open_).property("Label", &Door::label_).method("Slam", &Door::slam);
  }

  void set_open(bool value) {
    begin_sync();
    open_ = value;
    end_sync_property("Open", open_);
  }

  void set_label(std::string value) {
    begin_sync();
    label_ = std::move(value);
    end_sync_property("Label", label_);
  }

  // Closing and relabelling in one action: only the Slam call is replicated
  void slam(std::string label) {
    begin_sync(sync_options::default_options | sync_options::generate_new_frame);
    set_open(false);
    set_label(label);
    end_sync_method("Slam", label);
  }

  bool is_open() const {
    return open_;
  }

  std::string const& label() const {
    return label_;
  }

private:
  bool        open_  = false;
  std::string label_ = "door";
};

struct Instance {
  Instance(loopback_hub& hub, asio::io_context& io_context, session_role role, sync_settings const& settings)
    : manager(registry, settings)
    , transport(loopback_transport::create(hub, io_context))
    , session(manager, transport, role) {
    registry.register_target(front);
    registry.register_target(back);
    session.start();
  }

  target_registry                     registry;
  sync_manager                        manager;
  Door                                front{manager.context(), "door-front"};
  Door                                back{manager.context(), "door-back"};
  std::shared_ptr<loopback_transport> transport;
  network_session                     session;
};

void pump(asio::io_context& io_context) {
  for (;;) {
    io_context.restart();
    if (io_context.poll() == 0) {
      break;
    }
  }
}

void print_doors(char const* name, Instance const& instance) {
  std::cout << name << ": front " << (instance.front.is_open() ? "open" : "closed") << " '" << instance.front.label() << "', back "
            << (instance.back.is_open() ? "open" : "closed") << " '" << instance.back.label() << "'\n";
}

// Example 1: Joining a host and receiving its state
void example_join(Instance& host, Instance& client, asio::io_context& io_context) {
  std::cout << "\n=== Example 1: Join ===\n";

  host.front.set_open(true);
  host.front.set_label("entrance");

  if (!client.session.join(host.transport->local_peer(), {"door-back"})) {
    std::cout << "Join failed\n";
    return;
  }
  pump(io_context);

  print_doors("host  ", host);
  print_doors("client", client);
}

// Example 2: Nested changes coalesce into the outermost action
void example_replication(Instance& host, Instance& client, asio::io_context& io_context) {
  std::cout << "\n=== Example 2: Replication ===\n";

  client.back.slam("storage");
  pump(io_context);

  std::cout << "Host received " << host.session.stats().received << " messages, applied " << host.session.stats().applied << "\n";
  print_doors("host  ", host);
}

// Example 3: Recording and replaying
void example_replay(Instance& host, asio::io_context& io_context, loopback_hub& hub, sync_settings const& settings) {
  std::cout << "\n=== Example 3: Replay ===\n";

  replay_recorder recorder(host.manager);
  recorder.start();
  host.front.slam("exit");
  host.back.set_open(true);
  recorder.stop();

  Instance viewer(hub, io_context, session_role::client, settings);
  viewer.session.stop();

  replay_player player(viewer.manager);
  if (!player.load(recorder.save())) {
    std::cout << "Recording could not be loaded\n";
    return;
  }
  while (!player.finished()) {
    auto const frame  = player.next_frame().value_or(0);
    auto const result = player.play_next_frame();
    std::cout << "Frame " << frame << ": " << result.applied << " applied, " << result.failed << " failed\n";
  }
  print_doors("viewer", viewer);
}

int main() {
  auto const settings = load_settings("state_sync.json");
  apply_logging(settings);

  asio::io_context io_context;
  loopback_hub     hub;
  Instance         host(hub, io_context, session_role::host, settings);
  Instance         client(hub, io_context, session_role::client, settings);

  example_join(host, client, io_context);
  example_replication(host, client, io_context);
  example_replay(host, io_context, hub, settings);

  std::cout << "\nSnapshot of the host: " << host.manager.save_state_changes().size() << " bytes\n";
  return 0;
}
