#include "models/Song.hpp"
#include "utils/TextUtils.hpp"
#include <algorithm>
#include <sstream>
#include <stdexcept>

namespace Songbook {

std::optional<PartKind> partKindFromWord(const std::string& word) {
    std::string lower = TextUtils::normalizeName(word);

    if (lower == "verse" || lower == "strophe" || lower == "v") return PartKind::Verse;
    if (lower == "chorus" || lower == "refrain" || lower == "c") return PartKind::Chorus;
    if (lower == "pre-chorus" || lower == "prechorus" || lower == "pre chorus") return PartKind::PreChorus;
    if (lower == "bridge" || lower == "b") return PartKind::Bridge;
    if (lower == "intro") return PartKind::Intro;
    if (lower == "outro" || lower == "ending" || lower == "coda") return PartKind::Outro;
    if (lower == "interlude") return PartKind::Interlude;
    if (lower == "instrumental" || lower == "solo") return PartKind::Instrumental;
    if (lower == "tag") return PartKind::Tag;

    return std::nullopt;
}

PartKind stringToPartKind(const std::string& str) {
    return partKindFromWord(str).value_or(PartKind::Other);
}

std::string partKindToString(PartKind kind) {
    switch (kind) {
        case PartKind::Verse: return "Verse";
        case PartKind::Chorus: return "Chorus";
        case PartKind::PreChorus: return "PreChorus";
        case PartKind::Bridge: return "Bridge";
        case PartKind::Intro: return "Intro";
        case PartKind::Outro: return "Outro";
        case PartKind::Interlude: return "Interlude";
        case PartKind::Instrumental: return "Instrumental";
        case PartKind::Tag: return "Tag";
        default: return "Other";
    }
}

std::string segmentTypeToString(SegmentType type) {
    switch (type) {
        case SegmentType::Chord: return "chord";
        case SegmentType::Annotation: return "annotation";
        default: return "text";
    }
}

SegmentType stringToSegmentType(const std::string& str) {
    if (str == "chord") return SegmentType::Chord;
    if (str == "annotation") return SegmentType::Annotation;
    if (str == "text") return SegmentType::Text;
    throw std::invalid_argument("Unknown segment type: " + str);
}

// Segment

Segment Segment::makeText(const std::string& text, size_t offset) {
    return Segment{SegmentType::Text, text, offset};
}

Segment Segment::makeChord(const std::string& chord, size_t offset) {
    return Segment{SegmentType::Chord, chord, offset};
}

Segment Segment::makeAnnotation(const std::string& note, size_t offset) {
    return Segment{SegmentType::Annotation, note, offset};
}

json Segment::toJson() const {
    json j;
    j["type"] = segmentTypeToString(type);
    j["text"] = text;
    j["offset"] = offset;
    return j;
}

Segment Segment::fromJson(const json& j) {
    return Segment{
        stringToSegmentType(j.at("type").get<std::string>()),
        j.at("text").get<std::string>(),
        j.value("offset", static_cast<size_t>(0))
    };
}

bool Segment::operator==(const Segment& other) const {
    return type == other.type && text == other.text && offset == other.offset;
}

// LyricLine

LyricLine::LyricLine(std::vector<Segment> segs)
    : segments(std::move(segs)) {
    size_t textLength = 0;
    size_t lastOffset = 0;

    for (const auto& seg : segments) {
        if (seg.offset < lastOffset) {
            throw std::invalid_argument("Segment offsets must be non-decreasing");
        }
        if (seg.type == SegmentType::Text) {
            if (seg.offset != textLength) {
                throw std::invalid_argument("Text segment offset " + std::to_string(seg.offset) +
                                            " does not continue the line at " +
                                            std::to_string(textLength));
            }
            textLength += TextUtils::columnCount(seg.text);
        }
        lastOffset = seg.offset;
    }

    for (const auto& seg : segments) {
        if (seg.offset > textLength) {
            throw std::invalid_argument("Anchor offset " + std::to_string(seg.offset) +
                                        " beyond line length " + std::to_string(textLength));
        }
    }
}

LyricLine LyricLine::fromText(const std::string& text) {
    if (text.empty()) {
        return LyricLine();
    }
    return LyricLine({Segment::makeText(text, 0)});
}

std::string LyricLine::getText() const {
    std::string result;
    for (const auto& seg : segments) {
        if (seg.type == SegmentType::Text) {
            result += seg.text;
        }
    }
    return result;
}

std::vector<Segment> LyricLine::getChords() const {
    std::vector<Segment> chords;
    std::copy_if(segments.begin(), segments.end(), std::back_inserter(chords),
                 [](const Segment& seg) { return seg.type == SegmentType::Chord; });
    return chords;
}

std::vector<Segment> LyricLine::getAnnotations() const {
    std::vector<Segment> notes;
    std::copy_if(segments.begin(), segments.end(), std::back_inserter(notes),
                 [](const Segment& seg) { return seg.type == SegmentType::Annotation; });
    return notes;
}

bool LyricLine::hasChords() const {
    return std::any_of(segments.begin(), segments.end(),
                       [](const Segment& seg) { return seg.type == SegmentType::Chord; });
}

bool LyricLine::hasText() const {
    return std::any_of(segments.begin(), segments.end(),
                       [](const Segment& seg) {
                           return seg.type == SegmentType::Text && !seg.text.empty();
                       });
}

json LyricLine::toJson() const {
    json segs = json::array();
    for (const auto& seg : segments) {
        segs.push_back(seg.toJson());
    }
    return json{{"segments", segs}};
}

LyricLine LyricLine::fromJson(const json& j) {
    std::vector<Segment> segs;
    for (const auto& item : j.at("segments")) {
        segs.push_back(Segment::fromJson(item));
    }
    return LyricLine(std::move(segs));
}

// PartDefinition

PartDefinition::PartDefinition(std::string partName, PartKind partKind,
                               std::vector<LyricLine> partLines, int line)
    : name(std::move(partName))
    , kind(partKind)
    , lines(std::move(partLines))
    , sourceLine(line) {
}

json PartDefinition::toJson() const {
    json j;
    j["name"] = name;
    j["kind"] = partKindToString(kind);

    json linesArray = json::array();
    for (const auto& line : lines) {
        linesArray.push_back(line.toJson());
    }
    j["lines"] = linesArray;

    if (sourceLine > 0) {
        j["source_line"] = sourceLine;
    }
    return j;
}

PartDefinition PartDefinition::fromJson(const json& j) {
    std::vector<LyricLine> parsedLines;
    if (j.contains("lines")) {
        for (const auto& item : j["lines"]) {
            parsedLines.push_back(LyricLine::fromJson(item));
        }
    }
    return PartDefinition(
        j.at("name").get<std::string>(),
        stringToPartKind(j.value("kind", std::string("Other"))),
        std::move(parsedLines),
        j.value("source_line", 0)
    );
}

// PartInstance

PartInstance::PartInstance(std::string name, std::optional<int> count,
                           std::optional<std::string> text, int line)
    : partName(std::move(name))
    , repeatCount(count)
    , overrideText(std::move(text))
    , sourceLine(line) {
    if (repeatCount.has_value() && repeatCount.value() <= 0) {
        throw std::invalid_argument("Repeat count must be positive for part '" + partName + "'");
    }
}

json PartInstance::toJson() const {
    json j;
    j["part"] = partName;
    if (repeatCount.has_value()) {
        j["repeat_count"] = repeatCount.value();
    }
    if (overrideText.has_value()) {
        j["override_text"] = overrideText.value();
    }
    if (sourceLine > 0) {
        j["source_line"] = sourceLine;
    }
    return j;
}

PartInstance PartInstance::fromJson(const json& j) {
    std::optional<int> count;
    if (j.contains("repeat_count")) {
        count = j["repeat_count"].get<int>();
    }

    std::optional<std::string> text;
    if (j.contains("override_text")) {
        text = j["override_text"].get<std::string>();
    }

    return PartInstance(j.at("part").get<std::string>(), count, text, j.value("source_line", 0));
}

// SongMetadata

std::map<std::string, std::string> SongMetadata::toTemplateValues() const {
    std::map<std::string, std::string> values = tags;
    values["title"] = title;
    if (author) values["author"] = *author;
    if (language) values["language"] = *language;
    if (key) values["key"] = *key;
    if (tempo) values["tempo"] = *tempo;
    return values;
}

json SongMetadata::toJson() const {
    json j;
    j["title"] = title;
    if (author) j["author"] = *author;
    if (language) j["language"] = *language;
    if (key) j["key"] = *key;
    if (tempo) j["tempo"] = *tempo;
    if (!tags.empty()) j["tags"] = tags;
    return j;
}

SongMetadata SongMetadata::fromJson(const json& j) {
    SongMetadata meta;
    meta.title = j.value("title", "");

    if (j.contains("author")) meta.author = j["author"].get<std::string>();
    if (j.contains("language")) meta.language = j["language"].get<std::string>();
    if (j.contains("key")) meta.key = j["key"].get<std::string>();
    if (j.contains("tempo")) meta.tempo = j["tempo"].get<std::string>();
    if (j.contains("tags")) {
        meta.tags = j["tags"].get<std::map<std::string, std::string>>();
    }

    return meta;
}

// Song

Song::Song(SongMetadata meta,
           std::vector<PartDefinition> defs,
           std::vector<PartInstance> order)
    : metadata(std::move(meta))
    , definitions(std::move(defs))
    , instances(std::move(order)) {
    for (size_t i = 0; i < definitions.size(); ++i) {
        std::string key = TextUtils::normalizeName(definitions[i].getName());
        if (!definitionIndex.emplace(key, i).second) {
            throw std::invalid_argument("Duplicate part definition: " + definitions[i].getName());
        }
    }

    for (const auto& instance : instances) {
        if (!hasDefinition(instance.getPartName())) {
            throw std::invalid_argument("Part instance references undefined part: " +
                                        instance.getPartName());
        }
    }
}

const PartDefinition* Song::findDefinition(const std::string& name) const {
    auto it = definitionIndex.find(TextUtils::normalizeName(name));
    if (it == definitionIndex.end()) {
        return nullptr;
    }
    return &definitions[it->second];
}

bool Song::hasDefinition(const std::string& name) const {
    return findDefinition(name) != nullptr;
}

size_t Song::countParts(PartKind kind) const {
    return static_cast<size_t>(std::count_if(definitions.begin(), definitions.end(),
        [kind](const PartDefinition& def) { return def.getKind() == kind; }));
}

json Song::toJson() const {
    json j;
    j["metadata"] = metadata.toJson();

    json defs = json::array();
    for (const auto& def : definitions) {
        defs.push_back(def.toJson());
    }
    j["parts"] = defs;

    json order = json::array();
    for (const auto& instance : instances) {
        order.push_back(instance.toJson());
    }
    j["order"] = order;

    return j;
}

Song Song::fromJson(const json& j) {
    SongMetadata meta;
    if (j.contains("metadata")) {
        meta = SongMetadata::fromJson(j["metadata"]);
    }

    std::vector<PartDefinition> defs;
    if (j.contains("parts")) {
        for (const auto& item : j["parts"]) {
            defs.push_back(PartDefinition::fromJson(item));
        }
    }

    std::vector<PartInstance> order;
    if (j.contains("order")) {
        for (const auto& item : j["order"]) {
            order.push_back(PartInstance::fromJson(item));
        }
    }

    return Song(std::move(meta), std::move(defs), std::move(order));
}

std::string Song::toString() const {
    std::stringstream ss;
    ss << (metadata.title.empty() ? "(untitled)" : metadata.title);
    if (metadata.author) {
        ss << " - " << *metadata.author;
    }
    if (metadata.key) {
        ss << " [" << *metadata.key << "]";
    }
    ss << " (" << definitions.size() << " parts, " << instances.size() << " in order)";
    return ss.str();
}

} // namespace Songbook
