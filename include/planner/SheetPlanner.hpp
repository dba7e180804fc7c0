#pragma once

#include "models/Song.hpp"
#include "planner/PlannerConfigError.hpp"
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace Songbook {

using json = nlohmann::json;

struct SheetConfig {
    bool showChords = true;
    int linesPerPage = 0;        // 0 = one endless page
    bool includeHeader = true;   // title, author and key above the first block

    std::optional<std::string> validate() const;

    json toJson() const;
};

/**
 * A chord row (when the line has chords) above its lyric row
 */
struct SheetRow {
    std::optional<std::string> chords;
    std::string lyrics;
    bool isAnnotation = false;

    json toJson() const;

    bool operator==(const SheetRow& other) const {
        return chords == other.chords && lyrics == other.lyrics && isAnnotation == other.isAnnotation;
    }
};

/**
 * A later occurrence of a part in performance order
 */
struct CrossReference {
    size_t position;                       // 1-based index in the performance order
    int repeatCount;
    std::optional<std::string> note;

    json toJson() const;

    bool operator==(const CrossReference& other) const {
        return position == other.position && repeatCount == other.repeatCount && note == other.note;
    }
};

/**
 * One unique part, printed once
 */
struct SheetBlock {
    std::string partName;
    std::string label;
    PartKind kind = PartKind::Other;
    std::vector<SheetRow> rows;
    std::optional<size_t> firstPosition;   // first occurrence in performance order
    int firstRepeatCount = 1;
    std::vector<CrossReference> references;
    int page = 1;

    // Printed height: label line, rows (chord rows count separately) and a spacer
    int height() const;

    json toJson() const;
};

struct SheetPlan {
    std::string title;
    std::vector<std::string> header;
    std::vector<SheetBlock> blocks;
    int pageCount = 1;

    json toJson() const;

    // Monospaced rendering, pages separated by form feeds
    std::string toText() const;
};

/**
 * Lays out every part definition once, in definition order, with chords
 * re-expanded to the columns they were written at.
 */
class SheetPlanner {
public:
    explicit SheetPlanner(SheetConfig config = SheetConfig());

    /**
     * Build the sheet plan
     * Throws PlannerConfigError when the configuration is invalid
     */
    SheetPlan plan(const Song& song) const;

    const SheetConfig& getConfig() const { return config; }

    /**
     * Chord row for a line: each chord at its anchor column, pushed right
     * only where it would touch the previous chord
     */
    static std::string chordRow(const LyricLine& line);

private:
    SheetConfig config;

    std::vector<SheetRow> buildRows(const PartDefinition& part) const;
    void paginate(SheetPlan& plan) const;
};

} // namespace Songbook
