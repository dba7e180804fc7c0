/**
 * @file test_song.cpp
 * @brief Tests for song model invariants and JSON interchange.
 */

#include "models/Song.hpp"

#include <gtest/gtest.h>

#include <stdexcept>

namespace Songbook {
namespace {

Song makeSong() {
  SongMetadata meta;
  meta.title = "Amazing Grace";
  meta.author = "John Newton";
  meta.tags["ccli"] = "22025";

  LyricLine first({
      Segment::makeChord("C", 0),
      Segment::makeText("Amazing ", 0),
      Segment::makeChord("G", 8),
      Segment::makeText("grace", 8),
  });

  std::vector<PartDefinition> defs = {
      PartDefinition("Verse 1", PartKind::Verse, {first, LyricLine::fromText("how sweet")}, 1),
      PartDefinition("Chorus", PartKind::Chorus, {LyricLine::fromText("my chains are gone")}, 4),
  };
  std::vector<PartInstance> order = {
      PartInstance("Verse 1"),
      PartInstance("Chorus", 2, std::string("softly")),
  };
  return Song(meta, defs, order);
}

TEST(SongTest, PartKindWords) {
  EXPECT_EQ(partKindFromWord("Refrain"), PartKind::Chorus);
  EXPECT_EQ(partKindFromWord("pre-chorus"), PartKind::PreChorus);
  EXPECT_EQ(partKindFromWord("coda"), PartKind::Outro);
  EXPECT_FALSE(partKindFromWord("banana").has_value());

  EXPECT_EQ(stringToPartKind("banana"), PartKind::Other);
  EXPECT_EQ(partKindToString(PartKind::PreChorus), "PreChorus");
}

TEST(SongTest, TextWithoutChordsRoundTrips) {
  LyricLine line = LyricLine::fromText("through many dangers");
  EXPECT_EQ(line.getText(), "through many dangers");
  EXPECT_FALSE(line.hasChords());

  EXPECT_TRUE(LyricLine::fromText("").isEmpty());
}

TEST(SongTest, LyricLineRejectsBrokenAnchors) {
  // decreasing offsets
  EXPECT_THROW(LyricLine({Segment::makeChord("G", 3), Segment::makeChord("C", 1),
                          Segment::makeText("abc", 0)}),
               std::invalid_argument);

  // anchor past the end of the text
  EXPECT_THROW(LyricLine({Segment::makeText("abc", 0), Segment::makeChord("G", 9)}),
               std::invalid_argument);

  // gap between text segments
  EXPECT_THROW(LyricLine({Segment::makeText("ab", 0), Segment::makeText("cd", 5)}),
               std::invalid_argument);

  EXPECT_NO_THROW(LyricLine({Segment::makeText("abc", 0), Segment::makeChord("G", 3)}));
}

TEST(SongTest, PartInstanceRequiresPositiveCount) {
  EXPECT_THROW(PartInstance("Chorus", 0), std::invalid_argument);
  EXPECT_THROW(PartInstance("Chorus", -2), std::invalid_argument);
  EXPECT_EQ(PartInstance("Chorus").getEffectiveRepeatCount(), 1);
  EXPECT_EQ(PartInstance("Chorus", 3).getEffectiveRepeatCount(), 3);
}

TEST(SongTest, RejectsUndefinedInstance) {
  std::vector<PartDefinition> defs = {PartDefinition("Verse 1", PartKind::Verse, {})};
  std::vector<PartInstance> order = {PartInstance("Chorus")};
  EXPECT_THROW(Song(SongMetadata(), defs, order), std::invalid_argument);
}

TEST(SongTest, RejectsDuplicateNames) {
  std::vector<PartDefinition> defs = {
      PartDefinition("Chorus", PartKind::Chorus, {}),
      PartDefinition("chorus", PartKind::Chorus, {}),
  };
  EXPECT_THROW(Song(SongMetadata(), defs, {}), std::invalid_argument);
}

TEST(SongTest, LookupIsCaseInsensitive) {
  Song song = makeSong();

  ASSERT_NE(song.findDefinition("verse 1"), nullptr);
  EXPECT_EQ(song.findDefinition("VERSE  1")->getName(), "Verse 1");
  EXPECT_EQ(song.findDefinition("Bridge"), nullptr);
  EXPECT_EQ(song.countParts(PartKind::Chorus), 1u);

  for (const auto& instance : song.getInstances()) {
    EXPECT_TRUE(song.hasDefinition(instance.getPartName()));
  }
}

TEST(SongTest, JsonFieldNames) {
  json j = makeSong().toJson();

  EXPECT_EQ(j["metadata"]["title"], "Amazing Grace");
  EXPECT_EQ(j["metadata"]["tags"]["ccli"], "22025");
  ASSERT_EQ(j["parts"].size(), 2u);
  EXPECT_EQ(j["parts"][0]["kind"], "Verse");
  EXPECT_EQ(j["parts"][0]["source_line"], 1);
  EXPECT_EQ(j["parts"][0]["lines"][0]["segments"][0]["type"], "chord");

  ASSERT_EQ(j["order"].size(), 2u);
  EXPECT_EQ(j["order"][1]["part"], "Chorus");
  EXPECT_EQ(j["order"][1]["repeat_count"], 2);
  EXPECT_EQ(j["order"][1]["override_text"], "softly");
  EXPECT_FALSE(j["order"][0].contains("repeat_count"));
}

TEST(SongTest, FromJsonRestoresSong) {
  Song original = makeSong();
  Song restored = Song::fromJson(original.toJson());

  EXPECT_EQ(restored.toJson(), original.toJson());
  EXPECT_EQ(restored.getDefinitions()[0].getLines()[0], original.getDefinitions()[0].getLines()[0]);
}

TEST(SongTest, FromJsonValidates) {
  json j = {
      {"parts", json::array()},
      {"order", json::array({json{{"part", "Ghost"}}})},
  };
  EXPECT_THROW(Song::fromJson(j), std::invalid_argument);

  json badSegment = {{"segments", json::array({json{{"type", "melody"}, {"text", "x"}}})}};
  EXPECT_THROW(LyricLine::fromJson(badSegment), std::invalid_argument);
}

TEST(SongTest, ToStringSummary) {
  EXPECT_EQ(makeSong().toString(), "Amazing Grace - John Newton (2 parts, 2 in order)");
  EXPECT_EQ(Song().toString(), "(untitled) (0 parts, 0 in order)");
}

}  // namespace
}  // namespace Songbook
