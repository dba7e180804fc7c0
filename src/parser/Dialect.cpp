#include "parser/Dialect.hpp"
#include "utils/TextUtils.hpp"
#include <algorithm>
#include <regex>

namespace Songbook {

namespace {

// kind word, optional number, optional repeat suffix ("x2", "2x", "(2x)")
const std::regex headingPattern(
    R"(^(pre[- ]?chorus|verse|strophe|chorus|refrain|bridge|intro|outro|ending|coda|interlude|instrumental|solo|tag)\.?)"
    R"((?:\s*(\d+)\b(?!\s*x\b))?)"
    R"((?:\s*(?:x|\xC3\x97)\s*(\d+)|\s*\(\s*(\d+)\s*x\s*\)|\s+(\d+)\s*x)?$)",
    std::regex::icase
);

const std::regex chordPattern(
    R"(^\(?[A-H](?:#|b|\xE2\x99\xAF|\xE2\x99\xAD)?)"
    R"((?:maj|min|m|M|dim|aug|sus|add|\+|-|\xC2\xB0|\xC3\xB8)?)"
    R"((?:\d+|maj\d*|sus\d*|add\d*|dim\d*|aug|b\d+|#\d+|\+\d*|\(\w+\))*)"
    R"((?:/[A-H](?:#|b)?)?\)?\*?$)"
);

const std::regex referencePattern(
    R"(^(?:repeat|go\s*to|goto)\s+(?:the\s+)?(.+?)$)",
    std::regex::icase
);

const std::regex hashTagPattern(R"(^#\s*([A-Za-z][\w-]*)\s*:\s*(.*)$)");

const std::regex braceTagPattern(R"(^\{\s*([A-Za-z][\w-]*)\s*(?::\s*(.*?))?\s*\}$)");

int toRepeatCount(const std::string& digits) {
    try {
        int count = std::stoi(digits);
        return count > 0 ? count : 1;
    } catch (const std::exception&) {
        return 1;
    }
}

// "Chorus x2: softly" -> ("Chorus x2", "softly")
std::pair<std::string, std::string> splitNote(const std::string& text) {
    size_t colon = text.find(':');
    if (colon == std::string::npos) {
        return {TextUtils::trim(text), ""};
    }
    return {TextUtils::trim(text.substr(0, colon)), TextUtils::trim(text.substr(colon + 1))};
}

// Strip one pair of surrounding brackets or parentheses
bool unwrap(const std::string& text, std::string& inner) {
    if (text.size() >= 2 &&
        ((text.front() == '[' && text.back() == ']') ||
         (text.front() == '(' && text.back() == ')'))) {
        inner = TextUtils::trim(text.substr(1, text.size() - 2));
        return true;
    }
    return false;
}

std::optional<Token> referenceTo(const std::string& target, int line, bool wrapped) {
    auto [name, note] = splitNote(target);
    if (name.empty()) {
        return std::nullopt;
    }

    auto heading = Dialect::parseHeading(name);
    if (heading) {
        return Token::reference(line, heading->name, heading->repeatCount, note);
    }

    // Custom part names are only trusted inside brackets or parentheses
    if (wrapped) {
        return Token::reference(line, name, 1, note);
    }
    return std::nullopt;
}

} // anonymous namespace

std::optional<Heading> Dialect::parseHeading(const std::string& text) {
    std::string candidate = TextUtils::trim(text);
    while (!candidate.empty() && candidate.back() == ':') {
        candidate = TextUtils::trimRight(candidate.substr(0, candidate.size() - 1));
    }

    std::smatch match;
    if (!std::regex_match(candidate, match, headingPattern)) {
        return std::nullopt;
    }

    Heading heading;
    std::string word = TextUtils::toLower(match[1].str());
    heading.kind = stringToPartKind(word);
    heading.numbered = match[2].matched;
    heading.name = TextUtils::titleCase(word);
    if (heading.numbered) {
        heading.name += " " + match[2].str();
    }

    heading.repeatCount = 1;
    for (int group = 3; group <= 5; ++group) {
        if (match[group].matched) {
            heading.repeatCount = toRepeatCount(match[group].str());
        }
    }

    return heading;
}

bool Dialect::isChordSymbol(const std::string& symbol) {
    if (symbol.empty() || symbol.size() > 16) {
        return false;
    }
    return std::regex_match(symbol, chordPattern);
}

Token Dialect::headingMarker(const Heading& heading, int line) {
    std::string name = heading.name;
    if (heading.kind == PartKind::Verse && !heading.numbered) {
        name.clear();
    }
    return Token::marker(line, heading.kind, name, heading.repeatCount);
}

// StandardDialect

std::optional<Token> StandardDialect::recognizeMarker(const std::string& trimmed, int line) const {
    if (trimmed.size() >= 2 && trimmed.front() == '[' && trimmed.back() == ']') {
        auto heading = parseHeading(trimmed.substr(1, trimmed.size() - 2));
        if (heading) {
            return headingMarker(*heading, line);
        }
        return std::nullopt;
    }

    // "Verse 1:" and bare "Chorus"
    auto heading = parseHeading(trimmed);
    if (heading) {
        return headingMarker(*heading, line);
    }

    return std::nullopt;
}

std::optional<Token> StandardDialect::recognizeDirective(const std::string& trimmed, int line) const {
    std::smatch match;

    if (std::regex_match(trimmed, match, hashTagPattern)) {
        return Token::directive(line, TextUtils::toLower(match[1].str()), TextUtils::trim(match[2].str()));
    }

    std::string inner;
    bool wrapped = unwrap(trimmed, inner);
    const std::string& body = wrapped ? inner : trimmed;

    if (std::regex_match(body, match, referencePattern)) {
        auto reference = referenceTo(match[1].str(), line, wrapped);
        if (reference) {
            return reference;
        }
    }

    if (wrapped) {
        // "(Chorus)" / "(Chorus 2x)" stands for the part being sung again
        if (trimmed.front() == '(') {
            auto reference = referenceTo(inner, line, false);
            if (reference) {
                return reference;
            }
            return std::nullopt;   // parenthesized lyric line
        }

        // "[G]" alone is an inline chord, not a directive
        if (isChordSymbol(inner) || inner.empty()) {
            return std::nullopt;
        }
        if (inner.find('[') != std::string::npos) {
            return std::nullopt;   // "[C]Amazing [G]grace"
        }
        return Token::unrecognized(line, trimmed);
    }

    if (std::regex_match(trimmed, match, braceTagPattern)) {
        if (match[2].matched) {
            return Token::directive(line, TextUtils::toLower(match[1].str()), match[2].str());
        }
        return Token::unrecognized(line, trimmed);
    }

    if (trimmed.front() == '#' || trimmed.front() == '{') {
        return Token::unrecognized(line, trimmed);
    }

    return std::nullopt;
}

// ChordProDialect

std::optional<Token> ChordProDialect::recognizeMarker(const std::string& trimmed, int line) const {
    static const std::regex startPattern(
        R"(^\{\s*(start_of_([a-z_]+)|so([cvbt]))\s*(?::\s*(.*?))?\s*\}$)",
        std::regex::icase
    );

    std::smatch match;
    if (!std::regex_match(trimmed, match, startPattern)) {
        return std::nullopt;
    }

    std::string environment = TextUtils::toLower(match[2].matched ? match[2].str() : match[3].str());
    PartKind kind;
    if (environment == "c" || environment == "chorus") {
        kind = PartKind::Chorus;
    } else if (environment == "v" || environment == "verse") {
        kind = PartKind::Verse;
    } else if (environment == "b" || environment == "bridge") {
        kind = PartKind::Bridge;
    } else if (environment == "t" || environment == "tab" || environment == "grid") {
        kind = PartKind::Instrumental;
    } else {
        kind = stringToPartKind(environment);
    }

    std::string label = match[4].matched ? TextUtils::trim(match[4].str()) : "";
    if (!label.empty()) {
        return Token::marker(line, kind, label);
    }

    std::string name;
    if (kind != PartKind::Verse) {
        name = TextUtils::titleCase(environment.size() == 1 ? partKindToString(kind) : environment);
    }
    return Token::marker(line, kind, name);
}

std::optional<Token> ChordProDialect::recognizeDirective(const std::string& trimmed, int line) const {
    static const std::regex endPattern(
        R"(^\{\s*(end_of_[a-z_]+|eo[cvbtg])\s*\}$)",
        std::regex::icase
    );
    static const std::regex chorusPattern(
        R"(^\{\s*chorus\s*(?::\s*(.*?))?\s*\}$)",
        std::regex::icase
    );
    static const std::regex commentPattern(
        R"(^\{\s*(comment|c|comment_italic|ci|comment_box|cb|highlight)\s*:\s*(.*?)\s*\}$)",
        std::regex::icase
    );

    std::smatch match;

    if (std::regex_match(trimmed, match, endPattern)) {
        return Token::directive(line, "end_of_part", "");
    }

    if (std::regex_match(trimmed, match, chorusPattern)) {
        std::string label = match[1].matched ? TextUtils::trim(match[1].str()) : "";
        return Token::reference(line, label.empty() ? "Chorus" : label, 1, "");
    }

    if (std::regex_match(trimmed, match, commentPattern)) {
        return Token::directive(line, "comment", match[2].str());
    }

    if (std::regex_match(trimmed, match, braceTagPattern)) {
        std::string key = TextUtils::toLower(match[1].str());
        std::string value = match[2].matched ? TextUtils::trim(match[2].str()) : "";

        if (key == "t") key = "title";
        if (key == "st") key = "subtitle";

        if (key == "meta") {
            // {meta: name value}
            size_t space = value.find(' ');
            if (space == std::string::npos) {
                return Token::unrecognized(line, trimmed);
            }
            return Token::directive(line, TextUtils::toLower(value.substr(0, space)),
                                    TextUtils::trim(value.substr(space + 1)));
        }

        // Layout directives carry no song content
        static const std::vector<std::string> layoutKeys = {
            "new_page", "np", "new_physical_page", "npp", "column_break", "colb",
            "columns", "col", "pagetype", "textfont", "textsize", "textcolour",
            "chordfont", "chordsize", "chordcolour", "grid", "g", "no_grid", "ng"
        };
        if (std::find(layoutKeys.begin(), layoutKeys.end(), key) != layoutKeys.end()) {
            return Token::directive(line, "remark", trimmed);
        }

        if (!value.empty()) {
            return Token::directive(line, key, value);
        }
        return Token::unrecognized(line, trimmed);
    }

    if (trimmed.front() == '#') {
        return Token::directive(line, "remark", TextUtils::trim(trimmed.substr(1)));
    }

    if (trimmed.front() == '{') {
        return Token::unrecognized(line, trimmed);
    }

    return std::nullopt;
}

// ClassicDialect

std::optional<Token> ClassicDialect::recognizeMarker(const std::string& trimmed, int line) const {
    (void)trimmed;
    (void)line;
    return std::nullopt;
}

std::optional<Token> ClassicDialect::recognizeDirective(const std::string& trimmed, int line) const {
    std::smatch match;
    if (std::regex_match(trimmed, match, hashTagPattern)) {
        return Token::directive(line, TextUtils::toLower(match[1].str()), TextUtils::trim(match[2].str()));
    }
    if (trimmed.front() == '#') {
        return Token::unrecognized(line, trimmed);
    }
    return std::nullopt;
}

// Factory and detection

std::unique_ptr<Dialect> createDialect(const std::string& name) {
    std::string lower = TextUtils::toLower(TextUtils::trim(name));

    if (lower == "standard") return std::make_unique<StandardDialect>();
    if (lower == "chordpro") return std::make_unique<ChordProDialect>();
    if (lower == "classic") return std::make_unique<ClassicDialect>();

    return nullptr;
}

std::string detectDialect(const std::string& text) {
    static const std::regex chordProHint(
        R"(\{\s*(start_of_\w+|so[cvb]|title\s*:|t\s*:|chorus\s*[:}]))",
        std::regex::icase
    );

    if (std::regex_search(text, chordProHint)) {
        return "chordpro";
    }

    StandardDialect standard;
    int lineNumber = 0;
    for (const auto& raw : TextUtils::splitLines(text)) {
        ++lineNumber;
        std::string trimmed = TextUtils::trim(raw);
        if (trimmed.empty()) {
            continue;
        }
        if (standard.recognizeMarker(trimmed, lineNumber)) {
            return "standard";
        }
        auto directive = standard.recognizeDirective(trimmed, lineNumber);
        if (directive && directive->key == "repeat") {
            return "standard";
        }
    }

    // No headings at all: blocks carry the structure
    return "classic";
}

std::optional<std::string> dialectForExtension(const std::string& extension) {
    std::string ext = TextUtils::toLower(extension);
    if (!ext.empty() && ext.front() != '.') {
        ext = "." + ext;
    }

    if (ext == ".song") return std::string("classic");
    if (ext == ".cho" || ext == ".crd" || ext == ".chopro" || ext == ".chordpro" || ext == ".pro") {
        return std::string("chordpro");
    }
    if (ext == ".txt" || ext == ".sng" || ext == ".lyrics") return std::string("standard");

    return std::nullopt;
}

} // namespace Songbook
