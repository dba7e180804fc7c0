/**
 * @file test_logger.cpp
 * @brief Tests for logger access while the logging system is reconfigured.
 */

#include "utils/Logger.hpp"
#include "parser/SongParser.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <thread>

namespace Songbook {
namespace {

TEST(LoggerTest, GettersAlwaysReturnALogger) {
  EXPECT_NE(Logger::getSongbookLogger(), nullptr);
  EXPECT_NE(Logger::getParserLogger(), nullptr);
  EXPECT_NE(Logger::getPlannerLogger(), nullptr);
  EXPECT_EQ(Logger::getParserLogger()->name(), "parser");
}

TEST(LoggerTest, ReinitializeWhileParsing) {
  const std::string text = "[Verse 1]\nC       G\nAmazing grace\n\n[Chorus]\nmy chains are gone\nrepeat chorus";
  std::atomic<bool> done{false};

  std::thread reconfigure([&done] {
    for (int i = 0; i < 200; ++i) {
      Logger::initialize(i % 2 == 0 ? "warn" : "error", "");
    }
    done = true;
  });

  StandardDialect dialect;
  size_t parses = 0;
  while (!done || parses < 10) {
    auto result = SongParser().parseText(text, dialect);
    EXPECT_EQ(result.song.getDefinitions().size(), 2u);
    EXPECT_FALSE(result.hasErrors());
    ++parses;
  }
  reconfigure.join();

  Logger::initialize("warn", "");
  EXPECT_NE(Logger::getParserLogger(), nullptr);
}

}  // namespace
}  // namespace Songbook
