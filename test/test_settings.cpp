#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <state_sync/settings.hpp>
#include <state_sync/sync_manager.hpp>

#include <spdlog/spdlog.h>

#include <filesystem>
#include <fstream>

using namespace state_sync;

class SettingsTest : public ::testing::Test {
protected:
  void SetUp() override {
    path = std::filesystem::temp_directory_path() / "state_sync_settings_test.json";
    std::filesystem::remove(path);
    previous_level = spdlog::get_level();
  }

  void TearDown() override {
    std::filesystem::remove(path);
    spdlog::set_level(previous_level);
  }

  void write_file(std::string const& text) {
    std::ofstream out(path);
    out << text;
  }

  std::filesystem::path     path;
  spdlog::level::level_enum previous_level = spdlog::level::info;
};

TEST_F(SettingsTest, MissingFileGivesDefaults) {
  auto const settings = load_settings(path);
  EXPECT_EQ(settings.log_level, "info");
  EXPECT_TRUE(settings.use_top_level_state_changes_only);
  EXPECT_EQ(settings.nesting_error_threshold, 100u);
  EXPECT_TRUE(settings.ignore_events_until_initial_state_loaded);
  EXPECT_FALSE(settings.verbose_traffic);
}

TEST_F(SettingsTest, SaveAndLoad) {
  sync_settings settings;
  settings.log_level                                = "debug";
  settings.use_top_level_state_changes_only         = false;
  settings.nesting_error_threshold                  = 12;
  settings.ignore_events_until_initial_state_loaded = false;
  settings.verbose_traffic                          = true;
  ASSERT_TRUE(save_settings(path, settings, "1.2.3"));

  auto const loaded = load_settings(path);
  EXPECT_EQ(loaded.log_level, "debug");
  EXPECT_FALSE(loaded.use_top_level_state_changes_only);
  EXPECT_EQ(loaded.nesting_error_threshold, 12u);
  EXPECT_FALSE(loaded.ignore_events_until_initial_state_loaded);
  EXPECT_TRUE(loaded.verbose_traffic);
}

TEST_F(SettingsTest, MalformedFileGivesDefaults) {
  write_file("{ \"header\": { \"version\": ");
  EXPECT_NO_THROW(EXPECT_EQ(load_settings(path).log_level, "info"));

  write_file("{ \"settings\": { \"log_level\": \"trace\" } }");
  EXPECT_EQ(load_settings(path).log_level, "info");
}

TEST_F(SettingsTest, WrongFieldTypesGiveDefaults) {
  write_file(R"({
    "header": { "cereal_class_version": 1, "version": 1, "app_version": "1.0.0" },
    "settings": {
      "cereal_class_version": 2,
      "log_level": "debug",
      "use_top_level_state_changes_only": false,
      "nesting_error_threshold": "x",
      "ignore_events_until_initial_state_loaded": true,
      "verbose_traffic": false
    }
  })");

  sync_settings loaded;
  EXPECT_NO_THROW(loaded = load_settings(path));
  EXPECT_EQ(loaded.log_level, "info");
  EXPECT_TRUE(loaded.use_top_level_state_changes_only);
  EXPECT_EQ(loaded.nesting_error_threshold, 100u);
}

TEST_F(SettingsTest, FirstVersionFilesKeepNewFieldsAtDefaults) {
  write_file(R"({
    "header": { "cereal_class_version": 1, "version": 1, "app_version": "0.9.0" },
    "settings": {
      "cereal_class_version": 1,
      "log_level": "warning",
      "use_top_level_state_changes_only": false,
      "nesting_error_threshold": 50
    }
  })");

  auto const loaded = load_settings(path);
  EXPECT_EQ(loaded.log_level, "warning");
  EXPECT_FALSE(loaded.use_top_level_state_changes_only);
  EXPECT_EQ(loaded.nesting_error_threshold, 50u);
  EXPECT_TRUE(loaded.ignore_events_until_initial_state_loaded);
  EXPECT_FALSE(loaded.verbose_traffic);
}

TEST_F(SettingsTest, ApplyLogging) {
  sync_settings settings;
  settings.log_level = "error";
  apply_logging(settings);
  EXPECT_EQ(spdlog::get_level(), spdlog::level::err);

  settings.log_level = "chatty";
  apply_logging(settings);
  EXPECT_EQ(spdlog::get_level(), spdlog::level::err);

  settings.log_level = "off";
  apply_logging(settings);
  EXPECT_EQ(spdlog::get_level(), spdlog::level::off);
}

TEST_F(SettingsTest, ManagerAppliesCoalescingSettings) {
  sync_settings settings;
  settings.use_top_level_state_changes_only = false;
  settings.nesting_error_threshold          = 7;

  target_registry registry;
  sync_manager    manager(registry, settings);
  EXPECT_FALSE(manager.context().use_top_level_state_changes_only());
  EXPECT_EQ(manager.context().nesting_error_threshold(), 7u);

  manager.apply(sync_settings{});
  EXPECT_TRUE(manager.context().use_top_level_state_changes_only());
  EXPECT_EQ(manager.context().nesting_error_threshold(), sync_context::default_nesting_error_threshold);
}
