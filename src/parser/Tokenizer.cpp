#include "parser/Tokenizer.hpp"
#include "utils/Logger.hpp"
#include <algorithm>
#include <cctype>
#include <sstream>

namespace Songbook {

namespace {

bool isFiller(const std::string& word) {
    static const std::vector<std::string> fillers = {
        "|", "||", "|:", ":|", "/", "-", "%", "N.C.", "NC", "n.c."
    };
    if (std::find(fillers.begin(), fillers.end(), word) != fillers.end()) {
        return true;
    }
    // "x2" repeat hints on chord lines
    return word.size() >= 2 && (word[0] == 'x' || word[0] == 'X') &&
           std::all_of(word.begin() + 1, word.end(), [](unsigned char c) { return std::isdigit(c); });
}

} // anonymous namespace

Tokenizer::Tokenizer(const Dialect& d, int width)
    : dialect(d)
    , tabWidth(width > 0 ? width : TextUtils::kDefaultTabWidth) {
}

std::vector<Token> Tokenizer::tokenize(const std::string& rawText) const {
    std::vector<Token> tokens;
    std::vector<std::string> lines = TextUtils::splitLines(rawText);
    tokens.reserve(lines.size());

    int lineNumber = 0;
    for (const auto& raw : lines) {
        ++lineNumber;

        bool repaired = false;
        std::string expanded = TextUtils::trimRight(TextUtils::expandTabs(clean(raw, repaired), tabWidth));

        size_t first = tokens.size();
        classify(expanded, lineNumber, tokens);

        for (size_t i = first; i < tokens.size(); ++i) {
            tokens[i].encodingRepaired = repaired;
            LOG_PARSER_DEBUG("Line {}: {}", lineNumber, tokenTypeToString(tokens[i].type));
        }
    }

    LOG_PARSER_DEBUG("Tokenized {} lines with dialect '{}'", lines.size(), dialect.getName());
    return tokens;
}

void Tokenizer::classify(const std::string& expanded, int lineNumber, std::vector<Token>& out) const {
    std::string trimmed = TextUtils::trim(expanded);

    if (trimmed.empty()) {
        out.push_back(Token::blank(lineNumber));
        return;
    }

    if (auto marker = dialect.recognizeMarker(trimmed, lineNumber)) {
        out.push_back(*marker);
        return;
    }

    if (auto directive = dialect.recognizeDirective(trimmed, lineNumber)) {
        if (!directive->recognized) {
            LOG_PARSER_DEBUG("Line {}: unrecognized directive '{}'", lineNumber, trimmed);
        }
        out.push_back(*directive);
        return;
    }

    if (isChordLine(trimmed)) {
        out.push_back(Token::chordLine(lineNumber, expanded, chordPositions(expanded)));
        return;
    }

    if (dialect.splitInlineChords() && splitInline(expanded, lineNumber, out)) {
        return;
    }

    out.push_back(Token::lyric(lineNumber, trimmed, TextUtils::leadingSpaces(expanded)));
}

bool Tokenizer::isChordLine(const std::string& trimmed) {
    std::istringstream stream(trimmed);
    std::string word;
    bool sawChord = false;

    while (stream >> word) {
        if (Dialect::isChordSymbol(word)) {
            sawChord = true;
        } else if (!isFiller(word)) {
            return false;
        }
    }

    return sawChord;
}

std::vector<ChordPosition> Tokenizer::chordPositions(const std::string& chordLine) {
    std::vector<ChordPosition> positions;
    size_t pos = 0;

    while (pos < chordLine.size()) {
        size_t start = chordLine.find_first_not_of(' ', pos);
        if (start == std::string::npos) {
            break;
        }
        size_t end = chordLine.find(' ', start);
        if (end == std::string::npos) {
            end = chordLine.size();
        }

        std::string word = chordLine.substr(start, end - start);
        if (Dialect::isChordSymbol(word)) {
            positions.push_back(ChordPosition{TextUtils::columnCount(chordLine.substr(0, start)), word});
        }
        pos = end;
    }

    return positions;
}

std::string Tokenizer::clean(const std::string& line, bool& repaired) {
    std::string source = line;
    repaired = TextUtils::repairUtf8(source);

    std::string result;
    result.reserve(source.size());

    for (size_t i = 0; i < source.size(); ++i) {
        unsigned char c = static_cast<unsigned char>(source[i]);

        // U+00A0 no-break space
        if (c == 0xC2 && i + 1 < source.size() && static_cast<unsigned char>(source[i + 1]) == 0xA0) {
            result += ' ';
            ++i;
            continue;
        }
        if (c < 0x20 && c != '\t') {
            continue;
        }
        if (c == 0x7F) {
            continue;
        }
        result += static_cast<char>(c);
    }

    return result;
}

bool Tokenizer::splitInline(const std::string& expanded, int lineNumber, std::vector<Token>& out) const {
    size_t indent = TextUtils::leadingSpaces(expanded);
    std::string lyric;
    std::vector<ChordPosition> chords;

    size_t pos = indent;
    while (pos < expanded.size()) {
        char c = expanded[pos];
        if (c == '[') {
            size_t close = expanded.find(']', pos + 1);
            if (close != std::string::npos) {
                std::string symbol = TextUtils::trim(expanded.substr(pos + 1, close - pos - 1));
                if (Dialect::isChordSymbol(symbol)) {
                    chords.push_back(ChordPosition{TextUtils::columnCount(lyric), symbol});
                    pos = close + 1;
                    continue;
                }
            }
        }
        lyric += c;
        ++pos;
    }

    if (chords.empty()) {
        return false;
    }

    // Chord row as it would be written above the lyric; chords that would
    // collide are pushed right on the row but keep their own anchor column
    std::string row;
    for (const auto& chord : chords) {
        size_t width = TextUtils::columnCount(row);
        size_t column = chord.column;
        if (!row.empty() && column <= width) {
            column = width + 1;
        }
        row.append(column - width, ' ');
        row += chord.chord;
    }

    std::string trimmedLyric = TextUtils::trimRight(lyric);
    size_t lyricIndent = TextUtils::leadingSpaces(trimmedLyric);
    out.push_back(Token::chordLine(lineNumber, row, std::move(chords)));
    if (!TextUtils::trim(trimmedLyric).empty()) {
        out.push_back(Token::lyric(lineNumber, TextUtils::trim(trimmedLyric), lyricIndent));
    }
    return true;
}

} // namespace Songbook
