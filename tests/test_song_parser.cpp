/**
 * @file test_song_parser.cpp
 * @brief Tests for part grouping, chord merging, references and diagnostics.
 */

#include "parser/SongParser.hpp"

#include <gtest/gtest.h>

#include <algorithm>

namespace Songbook {
namespace {

std::vector<std::string> instanceNames(const Song& song) {
  std::vector<std::string> names;
  for (const auto& instance : song.getInstances()) {
    names.push_back(instance.getPartName());
  }
  return names;
}

size_t countCategory(const ParseResult& result, DiagnosticCategory category) {
  return static_cast<size_t>(std::count_if(
      result.diagnostics.begin(), result.diagnostics.end(),
      [category](const ParseDiagnostic& d) { return d.category == category; }));
}

ParseResult parseStandard(const std::string& text, ParserOptions options = ParserOptions()) {
  StandardDialect dialect;
  return SongParser(options).parseText(text, dialect);
}

TEST(SongParserTest, ChordLineAboveLyricAnchorsChords) {
  auto result = parseStandard("C       G\nAmazing grace");
  ASSERT_EQ(result.song.getDefinitions().size(), 1u);

  const auto& lines = result.song.getDefinitions()[0].getLines();
  ASSERT_EQ(lines.size(), 1u);
  EXPECT_EQ(lines[0].getText(), "Amazing grace");

  auto chords = lines[0].getChords();
  ASSERT_EQ(chords.size(), 2u);
  EXPECT_EQ(chords[0].text, "C");
  EXPECT_EQ(chords[0].offset, 0u);
  EXPECT_EQ(chords[1].text, "G");
  EXPECT_EQ(chords[1].offset, 8u);

  EXPECT_TRUE(result.diagnostics.empty());
}

TEST(SongParserTest, LeadingContentBecomesIntro) {
  auto result = parseStandard("hum along\n[Verse 1]\nfirst line");
  ASSERT_EQ(result.song.getDefinitions().size(), 2u);

  const auto& intro = result.song.getDefinitions()[0];
  EXPECT_EQ(intro.getName(), "Intro");
  EXPECT_EQ(intro.getKind(), PartKind::Other);
}

TEST(SongParserTest, UnresolvedReferenceIsDroppedWithError) {
  auto result = parseStandard("Verse 1\nWe sing\nrepeat chorus");

  EXPECT_EQ(instanceNames(result.song), (std::vector<std::string>{"Verse 1"}));
  ASSERT_EQ(result.diagnostics.size(), 1u);
  EXPECT_EQ(result.diagnostics[0].severity, Severity::Error);
  EXPECT_EQ(result.diagnostics[0].category, DiagnosticCategory::StructuralError);
  EXPECT_EQ(result.diagnostics[0].line, 3);
  EXPECT_TRUE(result.hasErrors());
}

TEST(SongParserTest, ParsesTokensDirectly) {
  std::vector<Token> tokens = {
    Token::marker(1, PartKind::Verse, "Verse 1"),
    Token::lyric(2, "only line", 0),
    Token::reference(3, "Chorus", 1, ""),
  };

  auto result = SongParser().parse(tokens);
  EXPECT_EQ(result.song.getInstances().size(), 1u);
  EXPECT_EQ(result.errorCount(), 1u);
}

TEST(SongParserTest, ForwardReferenceResolves) {
  auto result = parseStandard("[Verse 1]\nline a\nrepeat chorus\n[Chorus]\nline b");

  EXPECT_EQ(instanceNames(result.song),
            (std::vector<std::string>{"Verse 1", "Chorus", "Chorus"}));
  EXPECT_FALSE(result.hasErrors());
}

TEST(SongParserTest, EmptyHeadingRepeatsDefinedPart) {
  auto result = parseStandard(
      "Verse 1:\nline1\nline2\n\nChorus:\nline1\n\nVerse 1\n\nChorus");

  EXPECT_EQ(result.song.getDefinitions().size(), 2u);
  EXPECT_EQ(instanceNames(result.song),
            (std::vector<std::string>{"Verse 1", "Chorus", "Verse 1", "Chorus"}));
  EXPECT_TRUE(result.diagnostics.empty());
}

TEST(SongParserTest, DuplicateDefinitionFirstWins) {
  auto result = parseStandard("[Chorus]\nfirst\n\n[Chorus]\nsecond");

  ASSERT_EQ(result.song.getDefinitions().size(), 1u);
  EXPECT_EQ(result.song.getDefinitions()[0].getLines()[0].getText(), "first");

  ASSERT_EQ(result.errorCount(), 1u);
  EXPECT_EQ(result.diagnostics[0].line, 4);
  EXPECT_NE(result.diagnostics[0].message.find("Duplicate"), std::string::npos);
}

TEST(SongParserTest, IdenticalRepeatIsNotDuplicate) {
  auto result = parseStandard("[Chorus]\nsame words\n[Chorus]\nsame words");

  EXPECT_EQ(result.song.getDefinitions().size(), 1u);
  EXPECT_EQ(result.song.getInstances().size(), 2u);
  EXPECT_FALSE(result.hasErrors());
}

TEST(SongParserTest, UnusedPartWarns) {
  auto result = parseStandard("[Verse 1]\na\n[Bridge]\nb\n#order: Verse 1");

  EXPECT_EQ(instanceNames(result.song), (std::vector<std::string>{"Verse 1"}));
  ASSERT_EQ(result.warningCount(), 1u);
  EXPECT_EQ(result.diagnostics[0].category, DiagnosticCategory::StructuralWarning);
  EXPECT_EQ(result.diagnostics[0].line, 3);
  EXPECT_NE(result.diagnostics[0].message.find("Bridge"), std::string::npos);
  EXPECT_FALSE(result.hasErrors());
}

TEST(SongParserTest, OrderDirectiveWithRepeatCount) {
  auto result = parseStandard("[Verse 1]\na\n[Chorus]\nb\n#order: Chorus x2, Verse 1, Chorus");

  ASSERT_EQ(result.song.getInstances().size(), 3u);
  EXPECT_EQ(result.song.getInstances()[0].getPartName(), "Chorus");
  EXPECT_EQ(result.song.getInstances()[0].getEffectiveRepeatCount(), 2);
  EXPECT_EQ(result.song.getInstances()[1].getPartName(), "Verse 1");
  EXPECT_TRUE(result.diagnostics.empty());
}

TEST(SongParserTest, DiagnosticsSortedByLine) {
  auto result = parseStandard("[Bridge]\nb\n[Verse 1]\na\n#order: Verse 1, Missing");

  ASSERT_EQ(result.diagnostics.size(), 2u);
  EXPECT_EQ(result.diagnostics[0].line, 1);
  EXPECT_EQ(result.diagnostics[0].severity, Severity::Warning);
  EXPECT_EQ(result.diagnostics[1].line, 5);
  EXPECT_EQ(result.diagnostics[1].severity, Severity::Error);
}

TEST(SongParserTest, ReferenceByKindFindsRefrain) {
  auto result = parseStandard("[Refrain]\nhallelujah\n[Verse 1]\nline\nrepeat chorus");

  EXPECT_EQ(instanceNames(result.song),
            (std::vector<std::string>{"Refrain", "Verse 1", "Refrain"}));
  EXPECT_FALSE(result.hasErrors());
}

TEST(SongParserTest, NumbersUnnamedVerses) {
  auto result = parseStandard("Verse\nfirst\n\nVerse\nsecond");

  ASSERT_EQ(result.song.getDefinitions().size(), 2u);
  EXPECT_EQ(result.song.getDefinitions()[0].getName(), "Verse 1");
  EXPECT_EQ(result.song.getDefinitions()[1].getName(), "Verse 2");
}

TEST(SongParserTest, MetadataDirectives) {
  auto result = parseStandard(
      "#title: Amazing Grace\n#author: John Newton\n#ccli: 22025\n[Verse 1]\nline");

  const auto& meta = result.song.getMetadata();
  EXPECT_EQ(meta.title, "Amazing Grace");
  ASSERT_TRUE(meta.author.has_value());
  EXPECT_EQ(*meta.author, "John Newton");
  EXPECT_EQ(meta.tags.at("ccli"), "22025");
}

TEST(SongParserTest, UnrecognizedDirectiveIsAnomaly) {
  auto result = parseStandard("[Verse 1]\nline\n[Something odd]");

  ASSERT_EQ(result.diagnostics.size(), 1u);
  EXPECT_EQ(result.diagnostics[0].category, DiagnosticCategory::TokenizeAnomaly);
  EXPECT_EQ(result.diagnostics[0].severity, Severity::Warning);
  EXPECT_EQ(result.diagnostics[0].line, 3);
}

TEST(SongParserTest, ChordsWithoutLyricKeepRow) {
  auto result = parseStandard("[Intro]\nG  D  Em");

  const auto& lines = result.song.getDefinitions()[0].getLines();
  ASSERT_EQ(lines.size(), 1u);
  EXPECT_FALSE(lines[0].hasText());
  ASSERT_EQ(lines[0].getChords().size(), 1u);
  EXPECT_EQ(lines[0].getChords()[0].text, "G  D  Em");
}

TEST(SongParserTest, IndentedPairAnchorsRelativeToLyric) {
  auto result = parseStandard("[Verse 1]\n    C\n    Amazing");

  auto chords = result.song.getDefinitions()[0].getLines()[0].getChords();
  ASSERT_EQ(chords.size(), 1u);
  EXPECT_EQ(chords[0].offset, 0u);
}

TEST(SongParserTest, ChordPastLyricEndWarns) {
  auto result = parseStandard("[Verse 1]\nC           G\nShort");

  auto chords = result.song.getDefinitions()[0].getLines()[0].getChords();
  ASSERT_EQ(chords.size(), 2u);
  EXPECT_EQ(chords[1].offset, 5u);

  ASSERT_EQ(result.warningCount(), 1u);
  EXPECT_EQ(result.diagnostics[0].line, 2);
}

TEST(SongParserTest, AnchorsCountCharactersInUtf8Lyrics) {
  // D written above the "w" of "Grüße wie"
  auto result = parseStandard("[Verse 1]\n      D\nGr\xC3\xBC\xC3\x9F" "e wie");

  const auto& segments = result.song.getDefinitions()[0].getLines()[0].getSegments();
  ASSERT_EQ(segments.size(), 3u);
  EXPECT_EQ(segments[0].text, "Gr\xC3\xBC\xC3\x9F" "e ");
  EXPECT_EQ(segments[1].type, SegmentType::Chord);
  EXPECT_EQ(segments[1].offset, 6u);
  EXPECT_EQ(segments[2].text, "wie");
  EXPECT_EQ(segments[2].offset, 6u);
  EXPECT_TRUE(result.diagnostics.empty());

  auto umlaut = parseStandard("[Verse 1]\n G\n\xC3\x9C" "ber alles");
  const auto& split = umlaut.song.getDefinitions()[0].getLines()[0].getSegments();
  ASSERT_EQ(split.size(), 3u);
  EXPECT_EQ(split[0].text, "\xC3\x9C");
  EXPECT_EQ(split[2].text, "ber alles");
  EXPECT_NO_THROW(umlaut.toJson().dump());
}

TEST(SongParserTest, Latin1LineIsRepairedWithAnomaly) {
  auto result = parseStandard("[Verse 1]\ncaf\xE9 line");

  EXPECT_EQ(result.song.getDefinitions()[0].getLines()[0].getText(), "caf\xC3\xA9 line");
  ASSERT_EQ(result.diagnostics.size(), 1u);
  EXPECT_EQ(result.diagnostics[0].category, DiagnosticCategory::TokenizeAnomaly);
  EXPECT_EQ(result.diagnostics[0].line, 2);
  EXPECT_FALSE(result.hasErrors());

  std::string dumped;
  EXPECT_NO_THROW(dumped = result.toJson().dump());
  EXPECT_NE(dumped.find("caf\xC3\xA9"), std::string::npos);
}

TEST(SongParserTest, ClassicRepeatedBlockIsChorus) {
  ClassicDialect dialect;
  auto result = SongParser().parseText(
      "#title: Hymn\nfirst verse line\n\nchorus line\n\nsecond verse line\n\nchorus line",
      dialect);

  EXPECT_EQ(result.song.getTitle(), "Hymn");

  const auto& defs = result.song.getDefinitions();
  ASSERT_EQ(defs.size(), 3u);
  EXPECT_EQ(defs[0].getName(), "Verse 1");
  EXPECT_EQ(defs[1].getName(), "Chorus");
  EXPECT_EQ(defs[1].getKind(), PartKind::Chorus);
  EXPECT_EQ(defs[2].getName(), "Verse 2");

  EXPECT_EQ(instanceNames(result.song),
            (std::vector<std::string>{"Verse 1", "Chorus", "Verse 2", "Chorus"}));
  EXPECT_TRUE(result.diagnostics.empty());
}

TEST(SongParserTest, ChordProEnvironmentsAndReferences) {
  ChordProDialect dialect;
  auto result = SongParser().parseText(
      "{title: Song}\n{start_of_chorus}\n[G]Glory\n{end_of_chorus}\n\nVerse line\n\n{chorus}",
      dialect);

  EXPECT_EQ(result.dialect, "chordpro");
  EXPECT_EQ(instanceNames(result.song),
            (std::vector<std::string>{"Chorus", "Verse 1", "Chorus"}));

  const auto* chorus = result.song.findDefinition("chorus");
  ASSERT_NE(chorus, nullptr);
  ASSERT_EQ(chorus->getLines().size(), 1u);
  EXPECT_EQ(chorus->getLines()[0].getText(), "Glory");
  EXPECT_EQ(chorus->getLines()[0].getChords()[0].text, "G");
  EXPECT_TRUE(result.diagnostics.empty());
}

TEST(SongParserTest, DetectsDialectWhenAuto) {
  auto result = SongParser().parseText("{title: X}\n{soc}\nla la\n{eoc}");
  EXPECT_EQ(result.dialect, "chordpro");
  EXPECT_EQ(result.song.getTitle(), "X");
}

TEST(SongParserTest, EmptyInputIsValidSong) {
  auto result = SongParser().parseText("");
  EXPECT_TRUE(result.song.isEmpty());
  EXPECT_TRUE(result.diagnostics.empty());
}

TEST(SongParserTest, MalformedInputNeverThrows) {
  SongParser parser;
  EXPECT_NO_THROW(parser.parseText("{{{\n[[[\n]]]\n#\nrepeat\ngo to (\n[Chorus]\n{chorus}"));
}

TEST(SongParserTest, ResultSerializesToJson) {
  auto result = parseStandard("Verse 1\nWe sing\nrepeat chorus");
  json j = result.toJson();

  EXPECT_EQ(j["dialect"], "standard");
  EXPECT_EQ(j["song"]["parts"].size(), 1u);
  ASSERT_EQ(j["diagnostics"].size(), 1u);
  EXPECT_EQ(j["diagnostics"][0]["line"], 3);
  EXPECT_EQ(j["diagnostics"][0]["severity"], "error");
}

}  // namespace
}  // namespace Songbook
