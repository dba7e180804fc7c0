#pragma once

#include "models/Song.hpp"
#include <string>
#include <vector>

namespace Songbook {

enum class TokenType {
    StructuralMarker,
    ChordLine,
    LyricLine,
    Directive,
    BlankLine
};

std::string tokenTypeToString(TokenType type);

/**
 * A chord found on a chord line and the column it starts at
 */
struct ChordPosition {
    size_t column;
    std::string chord;

    bool operator==(const ChordPosition& other) const {
        return column == other.column && chord == other.chord;
    }
};

/**
 * One classified source line.
 * Only the fields of the matching TokenType are meaningful.
 */
struct Token {
    TokenType type = TokenType::BlankLine;
    int line = 0;                       // 1-indexed source line
    bool encodingRepaired = false;      // source line was not valid UTF-8

    // ChordLine / LyricLine
    std::string text;                   // lyric: trimmed; chord line: tab-expanded, right-trimmed
    size_t indent = 0;                  // leading columns stripped from a lyric line
    std::vector<ChordPosition> chords;  // ChordLine only, columns in code points

    // StructuralMarker
    PartKind markerKind = PartKind::Other;
    std::string markerName;             // empty = let the parser number it

    // Directive ("title", "repeat", "order", "end_of_part", "comment", ...)
    std::string key;
    std::string value;
    bool recognized = true;             // false: syntax looked like a directive but was not understood

    // StructuralMarker / "repeat" directive
    int repeatCount = 1;
    std::string note;

    static Token blank(int line);
    static Token lyric(int line, const std::string& text, size_t indent);
    static Token chordLine(int line, const std::string& text, std::vector<ChordPosition> chords);
    static Token marker(int line, PartKind kind, const std::string& name, int repeatCount = 1);
    static Token directive(int line, const std::string& key, const std::string& value);
    static Token reference(int line, const std::string& target, int repeatCount, const std::string& note);
    static Token unrecognized(int line, const std::string& raw);
};

} // namespace Songbook
