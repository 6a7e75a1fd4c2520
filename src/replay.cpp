#include "state_sync/replay.hpp"
#include "state_sync/buffer_stream.hpp"
#include "state_sync/serializer.hpp"

#include <cereal/archives/portable_binary.hpp>

#include <spdlog/spdlog.h>

#include <fstream>
#include <iterator>

namespace state_sync {

replay_recorder::replay_recorder(sync_manager& manager)
  : manager_(manager) {
}

replay_recorder::~replay_recorder() {
  stop();
}

void replay_recorder::start() {
  if (is_recording()) {
    return;
  }
  subscription_ = manager_.subscribe([this](sync_target const& source, sync_event& event) {
    record(source, event);
  });
  spdlog::debug("Replay recording started at frame {}", frame_);
}

void replay_recorder::stop() {
  if (!is_recording()) {
    return;
  }
  manager_.unsubscribe(subscription_);
  subscription_ = 0;
  spdlog::debug("Replay recording stopped with {} entries", entries_.size());
}

void replay_recorder::clear() noexcept {
  entries_.clear();
  frame_ = 0;
}

void replay_recorder::record(sync_target const& source, sync_event& event) {
  if (!has_flag(event.options(), sync_options::replay)) {
    return;
  }

  if (has_flag(event.options(), sync_options::generate_new_frame)) {
    next_frame();
  }

  auto bytes = manager_.encode(event, source);
  if (bytes.empty()) {
    return;
  }
  entries_.push_back(replay_entry{.frame = frame_, .bytes = std::move(bytes)});
}

buffer_type replay_recorder::save() const {
  buffer_type bytes;
  {
    buffer_ostream                      os(bytes);
    cereal::PortableBinaryOutputArchive archive(os);
    serializer                          s(archive);

    std::uint16_t version = protocol::current_version;
    std::uint64_t count   = entries_.size();
    s(version, count);
    for (auto const& entry : entries_) {
      auto frame = entry.frame;
      s(frame);
      s.write_bytes(entry.bytes);
    }
  }
  return bytes;
}

bool replay_recorder::save_to_file(std::filesystem::path const& path) const {
  std::ofstream out(path, std::ios::binary);
  if (!out) {
    spdlog::error("Failed to open replay file {} for writing", path.string());
    return false;
  }

  auto const bytes = save();
  out.write(reinterpret_cast<char const*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
  if (!out) {
    spdlog::error("Failed to write replay file {}", path.string());
    return false;
  }
  spdlog::info("Saved {} replay entries to {}", entries_.size(), path.string());
  return true;
}

bool replay_player::load(buffer_type const& bytes) {
  std::vector<replay_entry> entries;
  try {
    buffer_istream                     is(bytes);
    cereal::PortableBinaryInputArchive archive(is);

    serializer    header(archive, 0);
    std::uint16_t version = 0;
    header(version);
    if (version < protocol::min_supported_version || version > protocol::current_version) {
      throw decode_error(fmt::format("Unsupported replay version {}", version));
    }

    serializer    s(archive, version);
    std::uint64_t count = 0;
    s(count);
    if (count > serializer::max_sequence_length) {
      throw decode_error(fmt::format("Replay claims {} entries", count));
    }

    std::uint64_t previous_frame = 0;
    for (std::uint64_t i = 0; i < count; ++i) {
      auto& entry = entries.emplace_back();
      s(entry.frame, entry.bytes);
      if (entry.frame < previous_frame) {
        throw decode_error(fmt::format("Replay entry {} goes back from frame {} to {}", i, previous_frame, entry.frame));
      }
      previous_frame = entry.frame;
    }
  } catch (std::exception const& ex) {
    spdlog::error("Malformed replay recording: {}", ex.what());
    return false;
  }

  entries_  = std::move(entries);
  position_ = 0;
  return true;
}

bool replay_player::load_from_file(std::filesystem::path const& path) {
  std::ifstream in(path, std::ios::binary);
  if (!in) {
    spdlog::error("Failed to open replay file {}", path.string());
    return false;
  }

  buffer_type bytes{std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>()};
  return load(bytes);
}

snapshot_result replay_player::play_next_frame() {
  snapshot_result result;
  if (finished()) {
    result.success = true;
    return result;
  }

  auto const frame = entries_[position_].frame;
  while (!finished() && entries_[position_].frame == frame) {
    auto const executed = manager_.execute_state_sync_event(entries_[position_].bytes);
    if (executed.success) {
      ++result.applied;
    } else {
      ++result.failed;
      spdlog::warn("Replay frame {}: {}", frame, executed.to_string());
    }
    ++position_;
  }

  result.success = result.failed == 0;
  if (!result.success) {
    result.error_message = fmt::format("{} events of frame {} could not be replayed", result.failed, frame);
  }
  return result;
}

snapshot_result replay_player::play_all() {
  snapshot_result total;
  while (!finished()) {
    auto const frame = play_next_frame();
    total.applied += frame.applied;
    total.failed += frame.failed;
  }

  total.success = total.failed == 0;
  if (!total.success) {
    total.error_message = fmt::format("{} events could not be replayed", total.failed);
  }
  return total;
}

} // namespace state_sync
