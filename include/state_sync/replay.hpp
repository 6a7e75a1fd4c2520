#pragma once

#include "core.hpp"
#include "sync_manager.hpp"

#include <cstdint>
#include <filesystem>
#include <optional>
#include <vector>

namespace state_sync {

struct replay_entry {
  std::uint64_t frame = 0;
  buffer_type   bytes; // Encoded envelope
};

// Records surfaced events carrying the replay option. Events flagged with
// generate_new_frame open a new frame; next_frame() does the same from the
// host's update loop.
//
// Recording layout: version (uint16) | count | count x (frame, envelope)
class replay_recorder {
public:
  explicit replay_recorder(sync_manager& manager);
  ~replay_recorder();

  replay_recorder(replay_recorder const&)            = delete;
  replay_recorder& operator=(replay_recorder const&) = delete;

  void start();
  void stop();

  bool is_recording() const noexcept {
    return subscription_ != 0;
  }

  void next_frame() noexcept {
    ++frame_;
  }

  std::uint64_t current_frame() const noexcept {
    return frame_;
  }

  std::vector<replay_entry> const& entries() const noexcept {
    return entries_;
  }

  void clear() noexcept;

  buffer_type save() const;
  bool        save_to_file(std::filesystem::path const& path) const;

private:
  void record(sync_target const& source, sync_event& event);

  sync_manager&             manager_;
  handler_id                subscription_ = 0;
  std::uint64_t             frame_        = 0;
  std::vector<replay_entry> entries_;
};

// Replays a recording frame by frame through the manager
class replay_player {
public:
  explicit replay_player(sync_manager& manager)
    : manager_(manager) {
  }

  // False (and an error log) when the recording is malformed; nothing is loaded then
  bool load(buffer_type const& bytes);
  bool load_from_file(std::filesystem::path const& path);

  std::size_t size() const noexcept {
    return entries_.size();
  }

  bool finished() const noexcept {
    return position_ >= entries_.size();
  }

  void rewind() noexcept {
    position_ = 0;
  }

  // Frame of the next entry to be played, empty once finished
  std::optional<std::uint64_t> next_frame() const noexcept {
    if (finished()) {
      return std::nullopt;
    }
    return entries_[position_].frame;
  }

  // Executes every entry of the next frame
  snapshot_result play_next_frame();

  // Executes everything left
  snapshot_result play_all();

private:
  sync_manager&             manager_;
  std::vector<replay_entry> entries_;
  std::size_t               position_ = 0;
};

} // namespace state_sync
