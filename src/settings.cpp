#include "state_sync/settings.hpp"

#include <spdlog/spdlog.h>

#include <fstream>

namespace state_sync {

sync_settings load_settings(std::filesystem::path const& path) {
  std::error_code ec;
  if (!std::filesystem::exists(path, ec)) {
    spdlog::debug("No settings file at {}, using defaults", path.string());
    return {};
  }

  std::ifstream in(path);
  if (!in) {
    spdlog::error("Failed to open settings file {}", path.string());
    return {};
  }

  settings_header header;
  sync_settings   settings;
  try {
    cereal::JSONInputArchive archive(in);
    archive(cereal::make_nvp("header", header));
    archive(cereal::make_nvp("settings", settings));
  } catch (std::exception const& ex) {
    // cereal::Exception for missing fields, cereal::RapidJSONException for bad syntax or types
    spdlog::error("Malformed settings file {}: {}", path.string(), ex.what());
    return {};
  }

  if (header.version > settings_file_version) {
    spdlog::warn("Settings file {} has version {}, newer than {}", path.string(), header.version, settings_file_version);
  }

  spdlog::debug("Loaded settings from {} (app version {})", path.string(), header.app_version);
  return settings;
}

bool save_settings(std::filesystem::path const& path, sync_settings const& settings, std::string const& app_version) {
  std::ofstream out(path);
  if (!out) {
    spdlog::error("Failed to open settings file {} for writing", path.string());
    return false;
  }

  try {
    cereal::JSONOutputArchive archive(out);
    archive(cereal::make_nvp("header", settings_header{.version = settings_file_version, .app_version = app_version}));
    archive(cereal::make_nvp("settings", settings));
  } catch (std::exception const& ex) {
    spdlog::error("Failed to write settings file {}: {}", path.string(), ex.what());
    return false;
  }
  return true;
}

void apply_logging(sync_settings const& settings) {
  auto const level = spdlog::level::from_str(settings.log_level);
  if (level == spdlog::level::off && settings.log_level != "off") {
    spdlog::warn("Unknown log level '{}', keeping the current level", settings.log_level);
    return;
  }
  spdlog::set_level(level);
}

} // namespace state_sync
