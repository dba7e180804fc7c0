#pragma once

#include "models/Diagnostic.hpp"
#include "models/Song.hpp"
#include "parser/Dialect.hpp"
#include "parser/Token.hpp"
#include "utils/TextUtils.hpp"
#include <string>
#include <vector>

namespace Songbook {

/**
 * Tunables of the tokenizer and parser
 */
struct ParserOptions {
    int tabWidth = TextUtils::kDefaultTabWidth;

    // How many columns a chord may stand past the end of the lyric below it
    // before the pairing is reported as ambiguous
    int chordColumnTolerance = 2;

    // "auto", "standard", "chordpro" or "classic"
    std::string dialect = "auto";

    json toJson() const;
};

/**
 * Song plus everything noticed while building it
 */
struct ParseResult {
    Song song;
    std::vector<ParseDiagnostic> diagnostics;
    std::string dialect;

    bool hasErrors() const;
    size_t errorCount() const;
    size_t warningCount() const;

    json toJson() const;
};

/**
 * Structural parser
 * Builds a validated Song from a token stream. Never throws on malformed
 * input: problems become diagnostics and the best-effort Song is returned.
 */
class SongParser {
public:
    explicit SongParser(ParserOptions options = ParserOptions());

    /**
     * Parse tokens produced with the given dialect
     */
    ParseResult parse(const std::vector<Token>& tokens, const Dialect& dialect) const;

    /**
     * Parse tokens with the capabilities of the standard dialect
     */
    ParseResult parse(const std::vector<Token>& tokens) const;

    /**
     * Tokenize and parse; the dialect comes from the options or is detected
     */
    ParseResult parseText(const std::string& text) const;

    ParseResult parseText(const std::string& text, const Dialect& dialect) const;

    const ParserOptions& getOptions() const { return options; }

private:
    ParserOptions options;
};

} // namespace Songbook
