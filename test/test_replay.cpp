#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <state_sync/replay.hpp>

#include "test_targets.hpp"

#include <filesystem>
#include <fstream>

using namespace state_sync;

class ReplayTest : public ::testing::Test {
protected:
  void SetUp() override {
    register_test_events(recorded.event_types());
    register_test_events(replayed.event_types());

    recorded_registry.register_target(recorded_actor);
    replayed_registry.register_target(replayed_actor);

    replay_file = std::filesystem::temp_directory_path() / "state_sync_replay_test.bin";
    std::filesystem::remove(replay_file);
  }

  void TearDown() override {
    std::filesystem::remove(replay_file);
  }

  target_registry recorded_registry;
  sync_manager    recorded{recorded_registry};
  Actor           recorded_actor{recorded.context(), "actor-1"};

  target_registry replayed_registry;
  sync_manager    replayed{replayed_registry};
  Actor           replayed_actor{replayed.context(), "actor-1"};

  replay_recorder       recorder{recorded};
  std::filesystem::path replay_file;
};

TEST_F(ReplayTest, RecordsOnlyWhileStarted) {
  recorded_actor.set_life(90.0f);
  recorder.start();
  EXPECT_TRUE(recorder.is_recording());
  recorded_actor.set_life(80.0f);
  recorder.stop();
  recorded_actor.set_life(70.0f);

  EXPECT_FALSE(recorder.is_recording());
  ASSERT_EQ(recorder.entries().size(), 1u);
  EXPECT_EQ(recorded.decode(recorder.entries()[0].bytes).event->to_string(), "Property change Life = 80");
}

TEST_F(ReplayTest, NetworkOnlyEventsAreNotRecorded) {
  recorder.start();
  recorded_actor.teleport(1.0f, 1.0f, sync_options::network);
  recorded_actor.shake_camera(0.5f);

  ASSERT_EQ(recorder.entries().size(), 1u);
  EXPECT_EQ(recorded.decode(recorder.entries()[0].bytes).event->to_string(), "Camera shake 0.5");
}

TEST_F(ReplayTest, FramesAdvance) {
  recorder.start();
  recorded_actor.set_life(1.0f);
  recorded_actor.set_life(2.0f);
  recorder.next_frame();
  recorded_actor.set_life(3.0f);
  recorded_actor.teleport(5.0f, 6.0f, sync_options::replay | sync_options::generate_new_frame);

  std::vector<std::uint64_t> frames;
  for (auto const& entry : recorder.entries()) {
    frames.push_back(entry.frame);
  }
  EXPECT_THAT(frames, ::testing::ElementsAre(0u, 0u, 1u, 2u));
  EXPECT_EQ(recorder.current_frame(), 2u);

  recorder.clear();
  EXPECT_TRUE(recorder.entries().empty());
  EXPECT_EQ(recorder.current_frame(), 0u);
}

TEST_F(ReplayTest, PlaysFrameByFrame) {
  recorder.start();
  recorded_actor.set_life(10.0f);
  recorded_actor.move(2);
  recorder.next_frame();
  recorded_actor.teleport(7.0f, 8.0f);

  replay_player player(replayed);
  ASSERT_TRUE(player.load(recorder.save()));
  EXPECT_EQ(player.size(), 3u);
  EXPECT_EQ(player.next_frame(), std::optional<std::uint64_t>(0));

  auto const first = player.play_next_frame();
  ASSERT_TRUE(first.success) << first.error_message;
  EXPECT_EQ(first.applied, 2u);
  EXPECT_FLOAT_EQ(replayed_actor.life(), 10.0f);
  EXPECT_EQ(replayed_actor.position(), 2);
  EXPECT_FLOAT_EQ(replayed_actor.x(), 0.0f);
  EXPECT_EQ(player.next_frame(), std::optional<std::uint64_t>(1));

  auto const second = player.play_next_frame();
  EXPECT_EQ(second.applied, 1u);
  EXPECT_FLOAT_EQ(replayed_actor.x(), 7.0f);
  EXPECT_TRUE(player.finished());
  EXPECT_FALSE(player.next_frame().has_value());

  auto const done = player.play_next_frame();
  EXPECT_TRUE(done.success);
  EXPECT_EQ(done.applied, 0u);
}

TEST_F(ReplayTest, RewindPlaysAgain) {
  recorder.start();
  recorded_actor.move(3);

  replay_player player(replayed);
  ASSERT_TRUE(player.load(recorder.save()));
  EXPECT_EQ(player.play_all().applied, 1u);
  player.rewind();
  EXPECT_EQ(player.play_all().applied, 1u);
  EXPECT_EQ(replayed_actor.position(), 6);
}

TEST_F(ReplayTest, FileRoundTrip) {
  recorder.start();
  recorded_actor.set_name("Rec");
  recorded_actor.teleport(1.5f, 2.5f);
  ASSERT_TRUE(recorder.save_to_file(replay_file));

  replay_player player(replayed);
  ASSERT_TRUE(player.load_from_file(replay_file));
  auto const result = player.play_all();
  ASSERT_TRUE(result.success) << result.error_message;
  EXPECT_EQ(replayed_actor.name(), "Rec");
  EXPECT_FLOAT_EQ(replayed_actor.y(), 2.5f);
}

TEST_F(ReplayTest, MissingFileIsRejected) {
  replay_player player(replayed);
  EXPECT_FALSE(player.load_from_file(replay_file));
  EXPECT_EQ(player.size(), 0u);
}

TEST_F(ReplayTest, MalformedRecordingLoadsNothing) {
  recorder.start();
  recorded_actor.set_life(1.0f);
  recorded_actor.set_life(2.0f);

  auto bytes = recorder.save();
  bytes.pop_back();

  replay_player player(replayed);
  EXPECT_FALSE(player.load(bytes));
  EXPECT_EQ(player.size(), 0u);
  EXPECT_TRUE(player.finished());
}

TEST_F(ReplayTest, FailedEntriesAreCounted) {
  recorder.start();
  recorded_actor.set_life(1.0f);
  recorded_actor.set_life(2.0f);

  replayed_registry.unregister_target(replayed_actor);

  replay_player player(replayed);
  ASSERT_TRUE(player.load(recorder.save()));
  auto const result = player.play_all();
  EXPECT_FALSE(result.success);
  EXPECT_EQ(result.failed, 2u);
  EXPECT_TRUE(player.finished());
}
