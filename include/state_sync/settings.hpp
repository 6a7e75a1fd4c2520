#pragma once

#include "core.hpp"

#include <cereal/archives/json.hpp>
#include <cereal/cereal.hpp>
#include <cereal/types/string.hpp>

#include <cstdint>
#include <filesystem>
#include <string>

namespace state_sync {
struct settings_header {

  std::uint32_t version     = 0;
  std::string   app_version = "0.0.0";

  template <typename ArchiveT>
  void serialize(ArchiveT& ar, std::uint32_t const class_version) {
    if (class_version > 0) {
      ar(CEREAL_NVP(version));
      ar(CEREAL_NVP(app_version));
    }
  }
};

struct sync_settings {
  // spdlog level name: trace, debug, info, warning, error, critical, off
  std::string   log_level                                = "info";
  bool          use_top_level_state_changes_only         = true;
  std::uint32_t nesting_error_threshold                  = 100;
  bool          ignore_events_until_initial_state_loaded = true;
  bool          verbose_traffic                          = false;

  template <typename ArchiveT>
  void serialize(ArchiveT& ar, std::uint32_t const class_version) {
    ar(CEREAL_NVP(log_level));
    ar(CEREAL_NVP(use_top_level_state_changes_only));
    ar(CEREAL_NVP(nesting_error_threshold));
    if (class_version > 1) {
      ar(CEREAL_NVP(ignore_events_until_initial_state_loaded));
      ar(CEREAL_NVP(verbose_traffic));
    }
  }
};
} // namespace state_sync

CEREAL_CLASS_VERSION(state_sync::settings_header, 1);
CEREAL_CLASS_VERSION(state_sync::sync_settings, 2);

namespace state_sync {

inline constexpr std::uint32_t settings_file_version = 1;

// Defaults when the file is missing; defaults and an error log when it is malformed
sync_settings load_settings(std::filesystem::path const& path);

bool save_settings(std::filesystem::path const& path, sync_settings const& settings, std::string const& app_version = "0.0.0");

// Applies log_level to the default spdlog logger
void apply_logging(sync_settings const& settings);

} // namespace state_sync
