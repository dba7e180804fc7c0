#pragma once

#include "parser/Token.hpp"
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace Songbook {

/**
 * A part heading such as "Verse 2", "Refrain" or "Chorus x2"
 */
struct Heading {
    PartKind kind;
    std::string name;        // display name as written, title-cased
    bool numbered;           // an explicit number followed the kind word
    int repeatCount;         // "x2" / "2x" suffix, 1 otherwise
};

/**
 * Marker-recognition rules of one song markup dialect.
 * The Tokenizer and SongParser are shared by all dialects; a dialect only
 * classifies single trimmed lines and declares which structural
 * capabilities the parser should apply.
 */
class Dialect {
public:
    virtual ~Dialect() = default;

    virtual std::string getName() const = 0;

    // Part heading on this line, if any
    virtual std::optional<Token> recognizeMarker(const std::string& trimmed, int line) const = 0;

    // Metadata, reference or control directive on this line, if any.
    // Lines that look like directives but are not understood come back
    // as unrecognized directives.
    virtual std::optional<Token> recognizeDirective(const std::string& trimmed, int line) const = 0;

    // "[C]Amazing [G]grace" inline chords are split into a chord line and a lyric line
    virtual bool splitInlineChords() const { return false; }

    // Blank-line separated blocks outside a heading become parts of their own
    virtual bool blocksAreParts() const { return false; }

    // A block repeating an earlier block's text is a chorus occurrence
    virtual bool detectRepeatedBlocks() const { return false; }

    /**
     * Parse heading text ("Verse 1", "pre-chorus", "Chorus x2")
     * Returns nullopt when the text does not start with a part kind word
     */
    static std::optional<Heading> parseHeading(const std::string& text);

    // Single chord symbol such as "C", "F#m7", "Bb/D", "Dsus4"
    static bool isChordSymbol(const std::string& symbol);

protected:
    // Marker token for a heading; an unnumbered verse is left for the parser to number
    static Token headingMarker(const Heading& heading, int line);
};

/**
 * Headings in brackets, with a colon or bare ("[Verse 1]", "Chorus:", "Bridge"),
 * "#key: value" and "{key: value}" metadata, "repeat chorus" / "go to verse 1"
 * references and inline chords.
 */
class StandardDialect : public Dialect {
public:
    std::string getName() const override { return "standard"; }
    std::optional<Token> recognizeMarker(const std::string& trimmed, int line) const override;
    std::optional<Token> recognizeDirective(const std::string& trimmed, int line) const override;
    bool splitInlineChords() const override { return true; }
};

/**
 * ChordPro environments ({start_of_chorus} ... {end_of_chorus}), {chorus}
 * references, {title:} style metadata, {comment:} lines and inline chords.
 * Paragraphs outside environments are verses.
 */
class ChordProDialect : public Dialect {
public:
    std::string getName() const override { return "chordpro"; }
    std::optional<Token> recognizeMarker(const std::string& trimmed, int line) const override;
    std::optional<Token> recognizeDirective(const std::string& trimmed, int line) const override;
    bool splitInlineChords() const override { return true; }
    bool blocksAreParts() const override { return true; }
};

/**
 * Plain song files: "#title: ..." tag lines followed by blank-line separated
 * blocks. Part kinds are derived from the text: a block that comes back is
 * the chorus, the others are verses.
 */
class ClassicDialect : public Dialect {
public:
    std::string getName() const override { return "classic"; }
    std::optional<Token> recognizeMarker(const std::string& trimmed, int line) const override;
    std::optional<Token> recognizeDirective(const std::string& trimmed, int line) const override;
    bool blocksAreParts() const override { return true; }
    bool detectRepeatedBlocks() const override { return true; }
};

/**
 * Create a dialect by name ("standard", "chordpro", "classic")
 * Returns nullptr for unknown names
 */
std::unique_ptr<Dialect> createDialect(const std::string& name);

/**
 * Guess the dialect of a song text
 */
std::string detectDialect(const std::string& text);

/**
 * Dialect for a file extension (".song" -> classic, ".cho" -> chordpro)
 * Returns nullopt for extensions that are not song files
 */
std::optional<std::string> dialectForExtension(const std::string& extension);

} // namespace Songbook
