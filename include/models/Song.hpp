#pragma once

#include <string>
#include <optional>
#include <vector>
#include <map>
#include <nlohmann/json.hpp>

namespace Songbook {

using json = nlohmann::json;

/**
 * Part kind enumeration
 */
enum class PartKind {
    Verse,
    Chorus,
    PreChorus,
    Bridge,
    Intro,
    Outro,
    Interlude,
    Instrumental,
    Tag,
    Other
};

/**
 * Convert a heading word to a PartKind ("refrain" -> Chorus, "pre-chorus" -> PreChorus)
 * Returns nullopt if the word does not name a part kind
 */
std::optional<PartKind> partKindFromWord(const std::string& word);

/**
 * Convert string to PartKind, Other when unknown
 */
PartKind stringToPartKind(const std::string& str);

/**
 * Convert PartKind to string
 */
std::string partKindToString(PartKind kind);

enum class SegmentType {
    Text,
    Chord,
    Annotation
};

std::string segmentTypeToString(SegmentType type);
SegmentType stringToSegmentType(const std::string& str);

/**
 * One unit of a lyric line.
 * Text segments carry the offset where they start in the rendered text,
 * chord and annotation segments the offset they are anchored at.
 * Offsets count characters (code points), not bytes.
 */
struct Segment {
    SegmentType type;
    std::string text;
    size_t offset;

    static Segment makeText(const std::string& text, size_t offset);
    static Segment makeChord(const std::string& chord, size_t offset);
    static Segment makeAnnotation(const std::string& note, size_t offset);

    json toJson() const;
    static Segment fromJson(const json& j);

    bool operator==(const Segment& other) const;
    bool operator!=(const Segment& other) const { return !(*this == other); }
};

/**
 * A line of lyrics with anchored chords.
 * Offsets are non-decreasing and never exceed the rendered text length;
 * the constructor throws std::invalid_argument otherwise.
 */
class LyricLine {
public:
    LyricLine() = default;
    explicit LyricLine(std::vector<Segment> segments);

    // Line with a single text segment
    static LyricLine fromText(const std::string& text);

    const std::vector<Segment>& getSegments() const { return segments; }

    // Concatenated text segments (chords and annotations left out)
    std::string getText() const;

    std::vector<Segment> getChords() const;
    std::vector<Segment> getAnnotations() const;

    bool hasChords() const;
    bool hasText() const;
    bool isEmpty() const { return segments.empty(); }

    json toJson() const;
    static LyricLine fromJson(const json& j);

    bool operator==(const LyricLine& other) const { return segments == other.segments; }
    bool operator!=(const LyricLine& other) const { return !(*this == other); }

private:
    std::vector<Segment> segments;
};

/**
 * The unique content of a named part
 */
class PartDefinition {
public:
    PartDefinition(std::string name, PartKind kind,
                   std::vector<LyricLine> lines, int sourceLine = 0);

    const std::string& getName() const { return name; }
    PartKind getKind() const { return kind; }
    const std::vector<LyricLine>& getLines() const { return lines; }
    int getSourceLine() const { return sourceLine; }

    bool isEmpty() const { return lines.empty(); }

    json toJson() const;
    static PartDefinition fromJson(const json& j);

private:
    std::string name;
    PartKind kind;
    std::vector<LyricLine> lines;
    int sourceLine;
};

/**
 * One occurrence of a part in performance order
 */
class PartInstance {
public:
    // Throws std::invalid_argument when repeatCount is not positive
    explicit PartInstance(std::string partName,
                          std::optional<int> repeatCount = std::nullopt,
                          std::optional<std::string> overrideText = std::nullopt,
                          int sourceLine = 0);

    const std::string& getPartName() const { return partName; }
    std::optional<int> getRepeatCount() const { return repeatCount; }
    int getEffectiveRepeatCount() const { return repeatCount.value_or(1); }
    const std::optional<std::string>& getOverrideText() const { return overrideText; }
    int getSourceLine() const { return sourceLine; }

    json toJson() const;
    static PartInstance fromJson(const json& j);

private:
    std::string partName;
    std::optional<int> repeatCount;
    std::optional<std::string> overrideText;
    int sourceLine;
};

/**
 * Song metadata (plain data)
 */
struct SongMetadata {
    std::string title;
    std::optional<std::string> author;
    std::optional<std::string> language;          // e.g. "en", "de"
    std::optional<std::string> key;               // tonality, e.g. "G", "Em"
    std::optional<std::string> tempo;             // tempo hint, e.g. "92" or "slow"
    std::map<std::string, std::string> tags;      // any other tag, lower-cased keys

    // Flat key/value view used by templates (title, author, ... plus tags)
    std::map<std::string, std::string> toTemplateValues() const;

    json toJson() const;
    static SongMetadata fromJson(const json& j);
};

/**
 * Validated, immutable song.
 * Every PartInstance names an existing PartDefinition; definition names are
 * unique (compared case-insensitively). The constructor throws
 * std::invalid_argument when either rule is broken.
 */
class Song {
public:
    Song() = default;
    Song(SongMetadata metadata,
         std::vector<PartDefinition> definitions,
         std::vector<PartInstance> instances);

    const std::string& getTitle() const { return metadata.title; }
    const SongMetadata& getMetadata() const { return metadata; }

    // Definitions in source (definition) order
    const std::vector<PartDefinition>& getDefinitions() const { return definitions; }

    // Performance order
    const std::vector<PartInstance>& getInstances() const { return instances; }

    // Name-keyed lookup, nullptr when not defined
    const PartDefinition* findDefinition(const std::string& name) const;
    bool hasDefinition(const std::string& name) const;

    // Number of definitions of the given kind
    size_t countParts(PartKind kind) const;

    bool isEmpty() const { return definitions.empty(); }

    // JSON serialization
    json toJson() const;
    static Song fromJson(const json& j);

    // String representation
    std::string toString() const;

private:
    SongMetadata metadata;
    std::vector<PartDefinition> definitions;
    std::vector<PartInstance> instances;
    std::map<std::string, size_t> definitionIndex;  // normalized name -> position
};

} // namespace Songbook
