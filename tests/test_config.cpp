/**
 * @file test_config.cpp
 * @brief Tests for configuration loading from JSON and environment.
 */

#include "models/Config.hpp"

#include <gtest/gtest.h>

#include <cstdlib>
#include <filesystem>
#include <fstream>

namespace Songbook {
namespace {

std::string writeTempFile(const std::string& name, const std::string& content) {
  auto path = std::filesystem::temp_directory_path() / name;
  std::ofstream out(path);
  out << content;
  return path.string();
}

TEST(ConfigTest, Defaults) {
  Config config;
  EXPECT_EQ(config.presentation.maxLinesPerSlide, 4);
  EXPECT_FALSE(config.presentation.keepPartTogether);
  EXPECT_TRUE(config.presentation.expandRepeats);
  EXPECT_EQ(config.parser.tabWidth, 4);
  EXPECT_EQ(config.parser.dialect, "auto");
  EXPECT_TRUE(config.sheet.showChords);
  EXPECT_EQ(config.logLevel, "info");
}

TEST(ConfigTest, LoadsSectionsFromJson) {
  Config config;
  json j = {
      {"parser", {{"tab_width", 8}, {"dialect", "classic"}}},
      {"presentation", {{"max_lines_per_slide", 2}, {"keep_part_together", true},
                        {"meta_template", "{{title}}"}}},
      {"sheet", {{"lines_per_page", 60}, {"show_chords", false}}},
      {"log_level", "debug"},
  };

  ASSERT_TRUE(config.loadFromJson(j));
  EXPECT_EQ(config.parser.tabWidth, 8);
  EXPECT_EQ(config.parser.dialect, "classic");
  EXPECT_EQ(config.presentation.maxLinesPerSlide, 2);
  EXPECT_TRUE(config.presentation.keepPartTogether);
  EXPECT_EQ(config.presentation.metaTemplate, "{{title}}");
  EXPECT_EQ(config.sheet.linesPerPage, 60);
  EXPECT_FALSE(config.sheet.showChords);
  EXPECT_EQ(config.logLevel, "debug");

  // untouched keys keep their defaults
  EXPECT_TRUE(config.presentation.expandRepeats);
  EXPECT_EQ(config.parser.chordColumnTolerance, 2);
}

TEST(ConfigTest, RejectsWrongTypes) {
  Config config;
  json j = {{"presentation", {{"max_lines_per_slide", "many"}}}};
  EXPECT_FALSE(config.loadFromJson(j));
  EXPECT_FALSE(config.loadFromJson(json::array({1, 2})));
}

TEST(ConfigTest, LoadFromFile) {
  std::string good = writeTempFile("songbook_config_good.json",
                                   R"({"presentation": {"max_lines_per_slide": 6}})");
  std::string bad = writeTempFile("songbook_config_bad.json", "{ not json");

  Config config;
  EXPECT_TRUE(config.loadFromFile(good));
  EXPECT_EQ(config.presentation.maxLinesPerSlide, 6);

  EXPECT_FALSE(config.loadFromFile(bad));
  EXPECT_FALSE(config.loadFromFile("/nonexistent/songbook.json"));

  std::filesystem::remove(good);
  std::filesystem::remove(bad);
}

TEST(ConfigTest, EnvironmentOverlay) {
  setenv("SONGBOOK_MAX_LINES", "3", 1);
  setenv("SONGBOOK_KEEP_PART_TOGETHER", "yes", 1);
  setenv("SONGBOOK_EXPAND_REPEATS", "0", 1);
  setenv("SONGBOOK_TAB_WIDTH", "eight", 1);
  setenv("SONGBOOK_LOG_LEVEL", "warn", 1);

  Config config;
  config.loadFromEnvironment();

  EXPECT_EQ(config.presentation.maxLinesPerSlide, 3);
  EXPECT_TRUE(config.presentation.keepPartTogether);
  EXPECT_FALSE(config.presentation.expandRepeats);
  EXPECT_EQ(config.parser.tabWidth, 4);   // not a number, default kept
  EXPECT_EQ(config.logLevel, "warn");

  unsetenv("SONGBOOK_MAX_LINES");
  unsetenv("SONGBOOK_KEEP_PART_TOGETHER");
  unsetenv("SONGBOOK_EXPAND_REPEATS");
  unsetenv("SONGBOOK_TAB_WIDTH");
  unsetenv("SONGBOOK_LOG_LEVEL");
}

TEST(ConfigTest, ToJsonMirrorsFileLayout) {
  Config config;
  config.presentation.maxLinesPerSlide = 5;

  json j = config.toJson();
  EXPECT_EQ(j["presentation"]["max_lines_per_slide"], 5);
  EXPECT_EQ(j["parser"]["tab_width"], 4);
  EXPECT_EQ(j["sheet"]["lines_per_page"], 0);

  Config copy;
  ASSERT_TRUE(copy.loadFromJson(j));
  EXPECT_EQ(copy.presentation.maxLinesPerSlide, 5);
}

}  // namespace
}  // namespace Songbook
