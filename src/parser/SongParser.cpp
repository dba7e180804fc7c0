#include "parser/SongParser.hpp"
#include "parser/Tokenizer.hpp"
#include "utils/Logger.hpp"
#include <algorithm>
#include <map>
#include <optional>
#include <set>
#include <stdexcept>

namespace Songbook {

namespace {

enum class PartRole {
    Pending,
    Definition,
    Reference
};

/**
 * A heading (or an unmarked block) and the tokens up to the next one
 */
struct RawPart {
    PartKind kind = PartKind::Other;
    std::string name;                      // empty until numbered
    int line = 0;
    bool explicitMarker = false;
    bool leading = false;                  // content before the first heading
    int repeatCount = 1;
    std::vector<Token> body;

    std::optional<size_t> repeatOf;        // classic blocks: earlier block with the same text
    std::vector<LyricLine> lines;
    PartRole role = PartRole::Pending;
};

/**
 * Performance order as written: a part occurrence or a reference
 */
struct OrderEvent {
    bool isReference = false;
    size_t part = 0;
    std::string target;
    int repeatCount = 1;
    std::string note;
    int line = 0;
};

class ParseState {
public:
    ParseState(const ParserOptions& opts, const Dialect& d)
        : options(opts)
        , dialect(d) {
    }

    ParseResult run(const std::vector<Token>& tokens) {
        group(tokens);
        if (dialect.detectRepeatedBlocks()) {
            detectRepeats();
        }
        nameParts();
        for (auto& part : parts) {
            part.lines = buildLines(part);
        }
        buildDefinitions();
        buildInstances();
        reportUnused();
        return finish();
    }

private:
    const ParserOptions& options;
    const Dialect& dialect;

    SongMetadata metadata;
    std::vector<ParseDiagnostic> diagnostics;
    std::vector<RawPart> parts;
    std::vector<OrderEvent> events;
    std::optional<std::pair<std::string, int>> orderDirective;
    std::optional<size_t> current;
    bool sawMarker = false;

    std::vector<PartDefinition> definitions;
    std::map<std::string, size_t> definitionIndex;   // normalized name -> definitions
    std::vector<PartInstance> instances;

    // Step 1: split tokens into parts at headings (and at blank lines for block dialects)

    void group(const std::vector<Token>& tokens) {
        int lastRepairedLine = 0;
        for (const auto& token : tokens) {
            if (token.encodingRepaired && token.line != lastRepairedLine) {
                diagnostics.push_back(ParseDiagnostic::anomaly(
                    "Line is not valid UTF-8, stray bytes read as Latin-1", token.line));
                lastRepairedLine = token.line;
            }

            switch (token.type) {
                case TokenType::BlankLine:
                    if (current && dialect.blocksAreParts() && !parts[*current].explicitMarker) {
                        current.reset();
                    } else if (current) {
                        parts[*current].body.push_back(token);
                    }
                    break;

                case TokenType::StructuralMarker:
                    openPart(token.markerKind, token.markerName, token.line, true, token.repeatCount);
                    sawMarker = true;
                    break;

                case TokenType::Directive:
                    handleDirective(token);
                    break;

                case TokenType::ChordLine:
                case TokenType::LyricLine:
                    if (!current) {
                        bool leading = !sawMarker && parts.empty() && !dialect.blocksAreParts();
                        openPart(leading ? PartKind::Other : PartKind::Verse, "", token.line, false, 1);
                        parts.back().leading = leading;
                    }
                    parts[*current].body.push_back(token);
                    break;
            }
        }
    }

    void openPart(PartKind kind, const std::string& name, int line, bool explicitMarker, int repeatCount) {
        RawPart part;
        part.kind = kind;
        part.name = name;
        part.line = line;
        part.explicitMarker = explicitMarker;
        part.repeatCount = repeatCount;
        parts.push_back(part);
        current = parts.size() - 1;

        OrderEvent event;
        event.part = *current;
        event.line = line;
        events.push_back(event);
    }

    void handleDirective(const Token& token) {
        if (!token.recognized) {
            diagnostics.push_back(ParseDiagnostic::anomaly(
                "Unrecognized directive '" + token.value + "' ignored", token.line));
            return;
        }

        const std::string& key = token.key;

        if (key == "repeat") {
            OrderEvent event;
            event.isReference = true;
            event.target = token.value;
            event.repeatCount = token.repeatCount;
            event.note = token.note;
            event.line = token.line;
            events.push_back(event);
            current.reset();
        } else if (key == "end_of_part") {
            current.reset();
        } else if (key == "comment") {
            if (current) {
                parts[*current].body.push_back(token);
            } else {
                LOG_PARSER_DEBUG("Line {}: comment outside of a part ignored", token.line);
            }
        } else if (key == "remark") {
            // source comment, no content
        } else if (key == "order") {
            if (orderDirective) {
                diagnostics.push_back(ParseDiagnostic::anomaly(
                    "Second order directive ignored, the one at line " +
                    std::to_string(orderDirective->second) + " is kept", token.line));
            } else {
                orderDirective = std::make_pair(token.value, token.line);
            }
        } else {
            applyMetadata(key, token.value);
        }
    }

    void applyMetadata(const std::string& key, const std::string& value) {
        if (value.empty()) {
            return;
        }
        if (key == "title") {
            metadata.title = value;
        } else if (key == "author" || key == "artist") {
            metadata.author = value;
        } else if (key == "language" || key == "lang") {
            metadata.language = value;
        } else if (key == "key") {
            metadata.key = value;
        } else if (key == "tempo" || key == "bpm") {
            metadata.tempo = value;
        } else {
            metadata.tags[key] = value;
        }
    }

    // Step 2 (block dialects): a block that repeats earlier text is the chorus coming back

    static std::string blockText(const RawPart& part) {
        std::string text;
        for (const auto& token : part.body) {
            if (token.type == TokenType::LyricLine) {
                text += TextUtils::normalizeName(token.text);
                text += '\n';
            }
        }
        return text;
    }

    void detectRepeats() {
        std::vector<std::string> texts;
        texts.reserve(parts.size());
        for (const auto& part : parts) {
            texts.push_back(blockText(part));
        }

        for (size_t i = 0; i < parts.size(); ++i) {
            if (parts[i].explicitMarker || texts[i].empty()) {
                continue;
            }
            for (size_t j = 0; j < i; ++j) {
                if (parts[j].explicitMarker || parts[j].repeatOf || texts[j] != texts[i]) {
                    continue;
                }
                parts[i].repeatOf = j;
                parts[j].kind = PartKind::Chorus;
                LOG_PARSER_DEBUG("Block at line {} repeats block at line {}", parts[i].line, parts[j].line);
                break;
            }
        }
    }

    // Step 3: give every part a name

    void nameParts() {
        std::set<std::string> taken;
        for (const auto& part : parts) {
            if (!part.name.empty()) {
                taken.insert(TextUtils::normalizeName(part.name));
            }
        }

        auto claim = [&taken](const std::string& name) {
            taken.insert(TextUtils::normalizeName(name));
            return name;
        };

        auto numbered = [&taken, &claim](PartKind kind) {
            std::string base = partKindToString(kind);
            for (int n = 1;; ++n) {
                std::string candidate = base + " " + std::to_string(n);
                if (taken.count(TextUtils::normalizeName(candidate)) == 0) {
                    return claim(candidate);
                }
            }
        };

        auto blockChoruses = std::count_if(parts.begin(), parts.end(), [](const RawPart& part) {
            return !part.explicitMarker && !part.repeatOf && part.kind == PartKind::Chorus;
        });

        for (auto& part : parts) {
            if (!part.name.empty() || part.repeatOf) {
                continue;
            }
            if (part.leading) {
                part.name = claim(taken.count("intro") ? "Prelude" : "Intro");
            } else if (part.kind == PartKind::Chorus && blockChoruses == 1 && taken.count("chorus") == 0) {
                part.name = claim("Chorus");
            } else {
                part.name = numbered(part.kind);
            }
        }

        for (auto& part : parts) {
            if (part.repeatOf) {
                part.name = parts[*part.repeatOf].name;
            }
        }
    }

    // Step 4: pair chord lines with the lyric line below them

    std::vector<LyricLine> buildLines(const RawPart& part) {
        std::vector<LyricLine> lines;
        const auto& body = part.body;

        for (size_t i = 0; i < body.size(); ++i) {
            const Token& token = body[i];

            if (token.type == TokenType::ChordLine) {
                if (i + 1 < body.size() && body[i + 1].type == TokenType::LyricLine) {
                    lines.push_back(mergeChords(token, body[i + 1]));
                    ++i;
                } else {
                    // chords with no lyric below them
                    lines.push_back(LyricLine({Segment::makeChord(TextUtils::trim(token.text), 0)}));
                }
            } else if (token.type == TokenType::LyricLine) {
                lines.push_back(LyricLine::fromText(token.text));
            } else if (token.type == TokenType::Directive && token.key == "comment" && !token.value.empty()) {
                lines.push_back(LyricLine({Segment::makeAnnotation(token.value, 0)}));
            }
        }

        return lines;
    }

    LyricLine mergeChords(const Token& chordLine, const Token& lyricLine) {
        // anchors and offsets are columns (code points), slicing is by byte
        const std::string& text = lyricLine.text;
        const size_t length = TextUtils::columnCount(text);
        const size_t tolerance = static_cast<size_t>(std::max(0, options.chordColumnTolerance));

        std::vector<Segment> segments;
        size_t cursor = 0;
        size_t lastAnchor = 0;
        bool ambiguous = false;

        for (const auto& chord : chordLine.chords) {
            size_t anchor = chord.column >= lyricLine.indent ? chord.column - lyricLine.indent : 0;
            if (anchor > length) {
                if (anchor - length > tolerance) {
                    ambiguous = true;
                }
                anchor = length;
            }
            anchor = std::max(anchor, lastAnchor);

            if (anchor > cursor) {
                size_t from = TextUtils::byteOffset(text, cursor);
                size_t to = TextUtils::byteOffset(text, anchor);
                segments.push_back(Segment::makeText(text.substr(from, to - from), cursor));
                cursor = anchor;
            }
            segments.push_back(Segment::makeChord(chord.chord, anchor));
            lastAnchor = anchor;
        }

        if (cursor < length) {
            segments.push_back(Segment::makeText(text.substr(TextUtils::byteOffset(text, cursor)), cursor));
        }

        if (ambiguous) {
            diagnostics.push_back(ParseDiagnostic::warning(
                "Chords at line " + std::to_string(chordLine.line) +
                " extend past the lyric below them; anchored at the end of the line",
                chordLine.line));
        }

        return LyricLine(std::move(segments));
    }

    // Step 5: one definition per name, first content wins

    void buildDefinitions() {
        std::map<std::string, size_t> firstWithContent;
        for (size_t i = 0; i < parts.size(); ++i) {
            if (parts[i].repeatOf || parts[i].lines.empty()) {
                continue;
            }
            firstWithContent.emplace(TextUtils::normalizeName(parts[i].name), i);
        }

        for (size_t i = 0; i < parts.size(); ++i) {
            RawPart& part = parts[i];
            if (part.repeatOf) {
                part.role = PartRole::Reference;
                continue;
            }

            std::string key = TextUtils::normalizeName(part.name);
            auto existing = definitionIndex.find(key);

            if (existing == definitionIndex.end()) {
                auto content = firstWithContent.find(key);
                if (part.lines.empty() && content != firstWithContent.end() && content->second > i) {
                    // empty heading of a part written out later on
                    part.role = PartRole::Reference;
                    continue;
                }
                definitionIndex[key] = definitions.size();
                definitions.emplace_back(part.name, part.kind, part.lines, part.line);
                part.role = PartRole::Definition;
                continue;
            }

            const PartDefinition& first = definitions[existing->second];
            part.role = PartRole::Reference;
            if (part.lines.empty() || part.lines == first.getLines()) {
                continue;
            }

            diagnostics.push_back(ParseDiagnostic::error(
                "Duplicate definition of part '" + part.name + "'; the definition at line " +
                std::to_string(first.getSourceLine()) + " is kept", part.line));
        }
    }

    // Step 6: performance order

    const PartDefinition* resolve(const std::string& target) const {
        auto exact = definitionIndex.find(TextUtils::normalizeName(target));
        if (exact != definitionIndex.end()) {
            return &definitions[exact->second];
        }

        // "repeat chorus" finds the part called "Refrain"
        auto heading = Dialect::parseHeading(target);
        if (heading && !heading->numbered) {
            for (const auto& def : definitions) {
                if (def.getKind() == heading->kind) {
                    return &def;
                }
            }
        }
        return nullptr;
    }

    static std::optional<int> countOf(int repeatCount) {
        if (repeatCount > 1) {
            return repeatCount;
        }
        return std::nullopt;
    }

    std::optional<PartInstance> resolveReference(const std::string& target, int repeatCount,
                                                 const std::string& note, int line,
                                                 const std::string& context) {
        const PartDefinition* def = resolve(target);
        if (!def) {
            diagnostics.push_back(ParseDiagnostic::error(
                "Unresolved reference to part '" + target + "'" + context, line));
            return std::nullopt;
        }

        std::optional<std::string> overrideText;
        if (!note.empty()) {
            overrideText = note;
        }
        LOG_PARSER_DEBUG("Line {}: reference '{}' resolved to '{}'", line, target, def->getName());
        return PartInstance(def->getName(), countOf(repeatCount), overrideText, line);
    }

    void buildInstances() {
        std::vector<PartInstance> derived;

        for (const auto& event : events) {
            if (event.isReference) {
                auto instance = resolveReference(event.target, event.repeatCount, event.note, event.line, "");
                if (instance) {
                    derived.push_back(*instance);
                }
                continue;
            }

            const RawPart& part = parts[event.part];
            const PartDefinition* def = resolve(part.name);
            if (!def) {
                // only an empty heading whose content was dropped can get here
                continue;
            }
            derived.push_back(PartInstance(def->getName(), countOf(part.repeatCount), std::nullopt, part.line));
        }

        if (!orderDirective) {
            instances = std::move(derived);
            return;
        }

        const auto& [value, line] = *orderDirective;
        for (const auto& entry : TextUtils::splitList(value, ',')) {
            std::string target = entry;
            int repeatCount = 1;
            if (auto heading = Dialect::parseHeading(entry)) {
                target = heading->name;
                repeatCount = heading->repeatCount;
            }

            auto instance = resolveReference(target, repeatCount, "", line, " in order directive");
            if (instance) {
                instances.push_back(*instance);
            }
        }
        LOG_PARSER_DEBUG("Order directive replaced {} derived entries with {}", derived.size(), instances.size());
    }

    // Step 7: warnings for parts nobody sings

    void reportUnused() {
        std::set<std::string> used;
        for (const auto& instance : instances) {
            used.insert(TextUtils::normalizeName(instance.getPartName()));
        }

        for (const auto& def : definitions) {
            if (used.count(TextUtils::normalizeName(def.getName())) == 0) {
                diagnostics.push_back(ParseDiagnostic::warning(
                    "Part '" + def.getName() + "' is defined but never used", def.getSourceLine()));
            }
        }
    }

    ParseResult finish() {
        ParseResult result;
        result.dialect = dialect.getName();

        try {
            result.song = Song(metadata, definitions, instances);
        } catch (const std::invalid_argument& e) {
            LOG_PARSER_ERROR("Inconsistent song structure: {}", e.what());
            diagnostics.push_back(ParseDiagnostic::error(
                std::string("Song structure could not be built: ") + e.what(), 0));
            result.song = Song(metadata, {}, {});
        }

        std::stable_sort(diagnostics.begin(), diagnostics.end(),
                         [](const ParseDiagnostic& a, const ParseDiagnostic& b) { return a.line < b.line; });
        result.diagnostics = std::move(diagnostics);
        return result;
    }
};

} // anonymous namespace

json ParserOptions::toJson() const {
    json j;
    j["tab_width"] = tabWidth;
    j["chord_column_tolerance"] = chordColumnTolerance;
    j["dialect"] = dialect;
    return j;
}

bool ParseResult::hasErrors() const {
    return errorCount() > 0;
}

size_t ParseResult::errorCount() const {
    return static_cast<size_t>(std::count_if(diagnostics.begin(), diagnostics.end(),
        [](const ParseDiagnostic& d) { return d.isError(); }));
}

size_t ParseResult::warningCount() const {
    return diagnostics.size() - errorCount();
}

json ParseResult::toJson() const {
    json j;
    j["dialect"] = dialect;
    j["song"] = song.toJson();

    json diags = json::array();
    for (const auto& diagnostic : diagnostics) {
        diags.push_back(diagnostic.toJson());
    }
    j["diagnostics"] = diags;
    return j;
}

SongParser::SongParser(ParserOptions opts)
    : options(std::move(opts)) {
}

ParseResult SongParser::parse(const std::vector<Token>& tokens, const Dialect& dialect) const {
    ParseState state(options, dialect);
    ParseResult result = state.run(tokens);

    LOG_PARSER_INFO("Parsed '{}': {} parts, {} in order, {} errors, {} warnings",
                    result.song.getTitle(),
                    result.song.getDefinitions().size(),
                    result.song.getInstances().size(),
                    result.errorCount(),
                    result.warningCount());
    return result;
}

ParseResult SongParser::parse(const std::vector<Token>& tokens) const {
    StandardDialect standard;
    return parse(tokens, standard);
}

ParseResult SongParser::parseText(const std::string& text) const {
    std::string name = TextUtils::toLower(options.dialect);
    std::unique_ptr<Dialect> dialect;

    if (name != "auto") {
        dialect = createDialect(name);
        if (!dialect) {
            LOG_PARSER_WARN("Unknown dialect '{}', detecting from content", options.dialect);
        }
    }
    if (!dialect) {
        name = detectDialect(text);
        dialect = createDialect(name);
        LOG_PARSER_DEBUG("Detected dialect '{}'", name);
    }

    return parseText(text, *dialect);
}

ParseResult SongParser::parseText(const std::string& text, const Dialect& dialect) const {
    Tokenizer tokenizer(dialect, options.tabWidth);
    return parse(tokenizer.tokenize(text), dialect);
}

} // namespace Songbook
