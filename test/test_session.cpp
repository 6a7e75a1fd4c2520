#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <state_sync/loopback_transport.hpp>
#include <state_sync/network_session.hpp>

#include "test_targets.hpp"

#include <boost/asio/io_context.hpp>

#include <memory>

using namespace state_sync;

// One application instance: its own targets, manager, transport and session
struct Peer {
  Peer(loopback_hub& hub, asio::io_context& io_context, session_role role, sync_settings const& settings = {})
    : manager(registry, settings)
    , transport(loopback_transport::create(hub, io_context))
    , session(manager, transport, role) {
    register_test_events(manager.event_types());
    registry.register_target(host_avatar);
    registry.register_target(avatar_1);
    registry.register_target(avatar_2);
    session.start();
  }

  peer_id id() const {
    return transport->local_peer();
  }

  target_registry                     registry;
  sync_manager                        manager;
  Actor                               host_avatar{manager.context(), "host-avatar"};
  Actor                               avatar_1{manager.context(), "avatar-1"};
  Actor                               avatar_2{manager.context(), "avatar-2"};
  std::shared_ptr<loopback_transport> transport;
  network_session                     session;
};

class SessionTest : public ::testing::Test {
protected:
  void SetUp() override {
    host = std::make_unique<Peer>(hub, io_context, session_role::host);
    one  = std::make_unique<Peer>(hub, io_context, session_role::client);
    two  = std::make_unique<Peer>(hub, io_context, session_role::client);
  }

  // Delivers everything in flight, including messages sent while delivering
  void pump() {
    for (;;) {
      io_context.restart();
      if (io_context.poll() == 0) {
        break;
      }
    }
  }

  void join_all() {
    ASSERT_TRUE(one->session.join(host->id(), {"avatar-1"}));
    pump();
    ASSERT_TRUE(two->session.join(host->id(), {"avatar-2"}));
    pump();
  }

  asio::io_context      io_context;
  loopback_hub          hub;
  std::unique_ptr<Peer> host;
  std::unique_ptr<Peer> one;
  std::unique_ptr<Peer> two;
};

TEST_F(SessionTest, HostStartsWithItsOwnState) {
  EXPECT_TRUE(host->session.initial_state_loaded());
  EXPECT_FALSE(one->session.initial_state_loaded());
  EXPECT_EQ(host->session.role(), session_role::host);
  EXPECT_THAT(hub.peers(), ::testing::ElementsAre(host->id(), one->id(), two->id()));
}

TEST_F(SessionTest, OnlyClientsJoin) {
  EXPECT_FALSE(host->session.join(one->id()));
}

TEST_F(SessionTest, JoinExchangesState) {
  host->host_avatar.set_life(50.0f);
  one->avatar_1.set_name("One");
  pump();

  // Not joined yet: nothing left the client
  EXPECT_EQ(host->avatar_1.name(), "unnamed");

  ASSERT_TRUE(one->session.join(host->id(), {"avatar-1"}));
  pump();

  EXPECT_TRUE(one->session.initial_state_loaded());
  EXPECT_FLOAT_EQ(one->host_avatar.life(), 50.0f);
  EXPECT_EQ(host->avatar_1.name(), "One");
  EXPECT_EQ(one->avatar_1.name(), "One");
}

TEST_F(SessionTest, JoiningClientStateIsForwardedToOthers) {
  ASSERT_TRUE(one->session.join(host->id(), {"avatar-1"}));
  pump();

  two->avatar_2.set_name("Two");
  ASSERT_TRUE(two->session.join(host->id(), {"avatar-2"}));
  pump();

  EXPECT_EQ(host->avatar_2.name(), "Two");
  EXPECT_EQ(one->avatar_2.name(), "Two");
}

TEST_F(SessionTest, ClientChangesAreRelayedByTheHost) {
  join_all();

  one->avatar_1.move(4);
  pump();

  EXPECT_EQ(host->avatar_1.position(), 4);
  EXPECT_EQ(two->avatar_1.position(), 4);
  EXPECT_EQ(two->avatar_1.speed(), 4);
  EXPECT_EQ(one->avatar_1.position(), 4);
  // Six snapshot frames from the two joins, then the move
  EXPECT_EQ(host->session.stats().applied, 7u);
}

TEST_F(SessionTest, HostChangesReachEveryClient) {
  join_all();

  host->host_avatar.teleport(3.0f, 4.0f);
  pump();

  EXPECT_FLOAT_EQ(one->host_avatar.x(), 3.0f);
  EXPECT_FLOAT_EQ(two->host_avatar.y(), 4.0f);
}

TEST_F(SessionTest, ReplayedChangesAreNotEchoed) {
  join_all();
  auto const sent_before = host->session.stats().sent;

  one->avatar_1.set_life(10.0f);
  pump();

  // Relayed once to the other client, never sent back to its origin
  EXPECT_EQ(host->session.stats().sent, sent_before + 1);
  EXPECT_FLOAT_EQ(two->avatar_1.life(), 10.0f);
}

TEST_F(SessionTest, EventsBeforeInitialStateAreIgnored) {
  ASSERT_TRUE(one->session.join(host->id(), {"avatar-1"}));
  pump();

  host->host_avatar.set_life(5.0f);
  pump();

  EXPECT_FLOAT_EQ(one->host_avatar.life(), 5.0f);
  EXPECT_FLOAT_EQ(two->host_avatar.life(), 100.0f);
  EXPECT_EQ(two->session.stats().ignored, 1u);
}

TEST_F(SessionTest, GatingCanBeDisabled) {
  sync_settings settings;
  settings.ignore_events_until_initial_state_loaded = false;
  auto late = std::make_unique<Peer>(hub, io_context, session_role::client, settings);

  host->host_avatar.set_life(5.0f);
  pump();

  EXPECT_FLOAT_EQ(late->host_avatar.life(), 5.0f);
  EXPECT_EQ(late->session.stats().ignored, 0u);
}

TEST_F(SessionTest, LocalOnlyEventsStayLocal) {
  join_all();
  auto const received_before = host->session.stats().received;

  one->avatar_1.shake_camera(1.0f);
  one->avatar_1.teleport(1.0f, 1.0f, sync_options::replay);
  pump();

  EXPECT_EQ(host->session.stats().received, received_before);
  EXPECT_FLOAT_EQ(host->avatar_1.x(), 0.0f);
}

TEST_F(SessionTest, MalformedMessagesAreCounted) {
  auto const failed_before = host->session.stats().failed;
  ASSERT_TRUE(one->transport->send(host->id(), buffer_type{0x01, 0x00, 0xff}));
  pump();

  EXPECT_EQ(host->session.stats().failed, failed_before + 1);
}

TEST_F(SessionTest, StoppedSessionNeitherSendsNorReceives) {
  join_all();
  two->session.stop();

  one->avatar_1.set_life(33.0f);
  pump();

  EXPECT_FLOAT_EQ(host->avatar_1.life(), 33.0f);
  EXPECT_FLOAT_EQ(two->avatar_1.life(), 100.0f);

  auto const host_received = host->session.stats().received;
  two->avatar_2.set_life(1.0f);
  pump();
  EXPECT_EQ(host->session.stats().received, host_received);
}
