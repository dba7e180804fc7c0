#pragma once

#include "parser/Dialect.hpp"
#include "parser/Token.hpp"
#include "utils/TextUtils.hpp"
#include <string>
#include <vector>

namespace Songbook {

/**
 * Splits raw song text into typed lines.
 * Never fails: anything not recognized as a marker, directive or chord
 * line is a lyric line.
 */
class Tokenizer {
public:
    explicit Tokenizer(const Dialect& dialect, int tabWidth = TextUtils::kDefaultTabWidth);

    std::vector<Token> tokenize(const std::string& rawText) const;

    // All whitespace separated words are chord symbols (bar lines allowed)
    static bool isChordLine(const std::string& trimmed);

    // Columns where the chords of a (tab-expanded) chord line start
    static std::vector<ChordPosition> chordPositions(const std::string& chordLine);

private:
    const Dialect& dialect;
    int tabWidth;

    // Repair the encoding, drop control characters and turn non-breaking spaces into spaces
    static std::string clean(const std::string& line, bool& repaired);

    // Append the token(s) for one cleaned, tab-expanded line
    void classify(const std::string& expanded, int lineNumber, std::vector<Token>& out) const;

    // "[C]Amazing [G]grace" -> chord line + lyric line; false when no inline chords
    bool splitInline(const std::string& expanded, int lineNumber, std::vector<Token>& out) const;
};

} // namespace Songbook
