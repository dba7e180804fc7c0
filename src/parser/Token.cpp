#include "parser/Token.hpp"

namespace Songbook {

std::string tokenTypeToString(TokenType type) {
    switch (type) {
        case TokenType::StructuralMarker: return "StructuralMarker";
        case TokenType::ChordLine: return "ChordLine";
        case TokenType::LyricLine: return "LyricLine";
        case TokenType::Directive: return "Directive";
        default: return "BlankLine";
    }
}

Token Token::blank(int line) {
    Token token;
    token.type = TokenType::BlankLine;
    token.line = line;
    return token;
}

Token Token::lyric(int line, const std::string& text, size_t indent) {
    Token token;
    token.type = TokenType::LyricLine;
    token.line = line;
    token.text = text;
    token.indent = indent;
    return token;
}

Token Token::chordLine(int line, const std::string& text, std::vector<ChordPosition> chords) {
    Token token;
    token.type = TokenType::ChordLine;
    token.line = line;
    token.text = text;
    token.chords = std::move(chords);
    return token;
}

Token Token::marker(int line, PartKind kind, const std::string& name, int repeatCount) {
    Token token;
    token.type = TokenType::StructuralMarker;
    token.line = line;
    token.markerKind = kind;
    token.markerName = name;
    token.repeatCount = repeatCount;
    return token;
}

Token Token::directive(int line, const std::string& key, const std::string& value) {
    Token token;
    token.type = TokenType::Directive;
    token.line = line;
    token.key = key;
    token.value = value;
    return token;
}

Token Token::reference(int line, const std::string& target, int repeatCount, const std::string& note) {
    Token token = directive(line, "repeat", target);
    token.repeatCount = repeatCount;
    token.note = note;
    return token;
}

Token Token::unrecognized(int line, const std::string& raw) {
    Token token = directive(line, "", raw);
    token.recognized = false;
    return token;
}

} // namespace Songbook
