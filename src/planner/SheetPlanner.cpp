#include "planner/SheetPlanner.hpp"
#include "utils/Logger.hpp"
#include "utils/TextUtils.hpp"
#include <map>
#include <sstream>

namespace Songbook {

std::optional<std::string> SheetConfig::validate() const {
    if (linesPerPage < 0) {
        return "lines_per_page must not be negative (got " + std::to_string(linesPerPage) + ")";
    }
    return std::nullopt;
}

json SheetConfig::toJson() const {
    json j;
    j["show_chords"] = showChords;
    j["lines_per_page"] = linesPerPage;
    j["include_header"] = includeHeader;
    return j;
}

json SheetRow::toJson() const {
    json j;
    if (chords) {
        j["chords"] = *chords;
    }
    j["lyrics"] = lyrics;
    if (isAnnotation) {
        j["annotation"] = true;
    }
    return j;
}

json CrossReference::toJson() const {
    json j;
    j["position"] = position;
    if (repeatCount > 1) {
        j["repeat_count"] = repeatCount;
    }
    if (note) {
        j["note"] = *note;
    }
    return j;
}

int SheetBlock::height() const {
    int total = 2;   // label and spacer
    for (const auto& row : rows) {
        if (row.chords) {
            ++total;
        }
        if (!row.lyrics.empty() || !row.chords) {
            ++total;
        }
    }
    return total;
}

json SheetBlock::toJson() const {
    json j;
    j["part"] = partName;
    j["label"] = label;
    j["kind"] = partKindToString(kind);
    j["page"] = page;

    json rowList = json::array();
    for (const auto& row : rows) {
        rowList.push_back(row.toJson());
    }
    j["rows"] = rowList;

    if (firstPosition) {
        j["first_position"] = *firstPosition;
        if (firstRepeatCount > 1) {
            j["first_repeat_count"] = firstRepeatCount;
        }
    }

    json refs = json::array();
    for (const auto& ref : references) {
        refs.push_back(ref.toJson());
    }
    j["references"] = refs;
    return j;
}

json SheetPlan::toJson() const {
    json j;
    j["title"] = title;
    j["header"] = header;
    j["page_count"] = pageCount;

    json list = json::array();
    for (const auto& block : blocks) {
        list.push_back(block.toJson());
    }
    j["blocks"] = list;
    return j;
}

std::string SheetPlan::toText() const {
    std::stringstream ss;

    for (const auto& line : header) {
        ss << line << "\n";
    }
    if (!header.empty()) {
        ss << "\n";
    }

    int page = 1;
    for (const auto& block : blocks) {
        if (block.page != page) {
            ss << "\f";
            page = block.page;
        }

        ss << "[" << block.label << "]";
        if (block.firstRepeatCount > 1) {
            ss << " x" << block.firstRepeatCount;
        }
        ss << "\n";

        for (const auto& row : block.rows) {
            if (row.chords) {
                ss << *row.chords << "\n";
            }
            if (row.isAnnotation) {
                ss << "(" << row.lyrics << ")\n";
            } else if (!row.lyrics.empty() || !row.chords) {
                ss << row.lyrics << "\n";
            }
        }

        if (!block.references.empty()) {
            ss << "  * also at position ";
            for (size_t i = 0; i < block.references.size(); ++i) {
                const auto& ref = block.references[i];
                if (i > 0) {
                    ss << ", ";
                }
                ss << ref.position;
                if (ref.repeatCount > 1) {
                    ss << " (x" << ref.repeatCount << ")";
                }
                if (ref.note) {
                    ss << ": " << *ref.note;
                }
            }
            ss << "\n";
        }
        ss << "\n";
    }

    return ss.str();
}

SheetPlanner::SheetPlanner(SheetConfig cfg)
    : config(std::move(cfg)) {
}

SheetPlan SheetPlanner::plan(const Song& song) const {
    if (auto problem = config.validate()) {
        LOG_PLANNER_ERROR("Invalid sheet configuration: {}", *problem);
        throw PlannerConfigError(*problem);
    }

    SheetPlan result;
    const auto& metadata = song.getMetadata();
    result.title = metadata.title;

    if (config.includeHeader) {
        if (!metadata.title.empty()) result.header.push_back(metadata.title);
        if (metadata.author) result.header.push_back("Author: " + *metadata.author);
        if (metadata.key) result.header.push_back("Key: " + *metadata.key);
        if (metadata.tempo) result.header.push_back("Tempo: " + *metadata.tempo);
    }

    // Performance positions per part
    std::map<std::string, std::vector<size_t>> positions;
    const auto& instances = song.getInstances();
    for (size_t i = 0; i < instances.size(); ++i) {
        positions[TextUtils::normalizeName(instances[i].getPartName())].push_back(i);
    }

    for (const auto& part : song.getDefinitions()) {
        SheetBlock block;
        block.partName = part.getName();
        block.label = part.getName();
        block.kind = part.getKind();
        block.rows = buildRows(part);

        auto it = positions.find(TextUtils::normalizeName(part.getName()));
        if (it != positions.end() && !it->second.empty()) {
            const auto& occurrences = it->second;
            block.firstPosition = occurrences.front() + 1;
            block.firstRepeatCount = instances[occurrences.front()].getEffectiveRepeatCount();

            for (size_t k = 1; k < occurrences.size(); ++k) {
                const PartInstance& instance = instances[occurrences[k]];
                block.references.push_back(CrossReference{
                    occurrences[k] + 1,
                    instance.getEffectiveRepeatCount(),
                    instance.getOverrideText()
                });
            }
        }

        result.blocks.push_back(block);
    }

    paginate(result);

    LOG_PLANNER_DEBUG("Planned sheet for '{}': {} blocks on {} pages",
                      song.getTitle(), result.blocks.size(), result.pageCount);
    return result;
}

std::string SheetPlanner::chordRow(const LyricLine& line) {
    std::string row;
    for (const auto& seg : line.getSegments()) {
        if (seg.type != SegmentType::Chord) {
            continue;
        }
        size_t width = TextUtils::columnCount(row);
        size_t column = seg.offset;
        if (!row.empty() && column <= width) {
            column = width + 1;
        }
        row.append(column - width, ' ');
        row += seg.text;
    }
    return row;
}

std::vector<SheetRow> SheetPlanner::buildRows(const PartDefinition& part) const {
    std::vector<SheetRow> rows;

    for (const auto& line : part.getLines()) {
        if (!line.hasText() && !line.hasChords()) {
            auto notes = line.getAnnotations();
            if (notes.empty()) {
                continue;
            }
            SheetRow row;
            row.isAnnotation = true;
            for (const auto& note : notes) {
                if (!row.lyrics.empty()) {
                    row.lyrics += " ";
                }
                row.lyrics += note.text;
            }
            rows.push_back(row);
            continue;
        }

        if (!config.showChords && !line.hasText()) {
            continue;   // chord-only line
        }

        SheetRow row;
        row.lyrics = line.getText();
        if (config.showChords && line.hasChords()) {
            row.chords = chordRow(line);
        }
        rows.push_back(row);
    }

    return rows;
}

void SheetPlanner::paginate(SheetPlan& plan) const {
    if (config.linesPerPage == 0) {
        plan.pageCount = 1;
        return;
    }

    int used = static_cast<int>(plan.header.size());
    if (used > 0) {
        ++used;   // blank line after the header
    }

    int page = 1;
    for (auto& block : plan.blocks) {
        int height = block.height();
        // Blocks are never split; one taller than a page gets a page of its own
        if (used > 0 && used + height > config.linesPerPage) {
            ++page;
            used = 0;
        }
        block.page = page;
        used += height;
    }

    plan.pageCount = page;
}

} // namespace Songbook
