#include "planner/PresentationPlanner.hpp"
#include "utils/Logger.hpp"
#include "utils/TextUtils.hpp"
#include <algorithm>
#include <set>

namespace Songbook {

std::optional<std::string> PresentationConfig::validate() const {
    if (maxLinesPerSlide <= 0) {
        return "max_lines_per_slide must be greater than 0 (got " + std::to_string(maxLinesPerSlide) + ")";
    }
    return std::nullopt;
}

json PresentationConfig::toJson() const {
    json j;
    j["max_lines_per_slide"] = maxLinesPerSlide;
    j["keep_part_together"] = keepPartTogether;
    j["expand_repeats"] = expandRepeats;
    j["show_title_slide"] = showTitleSlide;
    j["empty_last_slide"] = emptyLastSlide;
    j["show_spoiler"] = showSpoiler;
    j["meta_template"] = metaTemplate;
    j["meta_on_first_slide"] = metaOnFirstSlide;
    j["meta_on_last_slide"] = metaOnLastSlide;
    return j;
}

std::string slideTypeToString(SlideType type) {
    switch (type) {
        case SlideType::Title: return "title";
        case SlideType::Empty: return "empty";
        default: return "content";
    }
}

json Slide::toJson() const {
    json j;
    j["type"] = slideTypeToString(type);
    if (type == SlideType::Content) {
        j["part"] = partName;
        j["kind"] = partKindToString(kind);
        j["is_repeat"] = isRepeat;
        j["chunk"] = chunkIndex;
        j["chunk_count"] = chunkCount;
        if (repeatCount > 1) {
            j["repeat_count"] = repeatCount;
        }
    }
    j["lines"] = lines;
    if (note) j["note"] = *note;
    if (spoiler) j["spoiler"] = *spoiler;
    if (metaText) j["meta"] = *metaText;
    return j;
}

bool Slide::operator==(const Slide& other) const {
    return type == other.type &&
           partName == other.partName &&
           kind == other.kind &&
           lines == other.lines &&
           isRepeat == other.isRepeat &&
           repeatCount == other.repeatCount &&
           chunkIndex == other.chunkIndex &&
           chunkCount == other.chunkCount &&
           note == other.note &&
           spoiler == other.spoiler &&
           metaText == other.metaText;
}

json SlidePlan::toJson() const {
    json j;
    j["title"] = title;
    json list = json::array();
    for (const auto& slide : slides) {
        list.push_back(slide.toJson());
    }
    j["slides"] = list;
    return j;
}

PresentationPlanner::PresentationPlanner(PresentationConfig cfg)
    : config(std::move(cfg)) {
}

SlidePlan PresentationPlanner::plan(const Song& song) const {
    if (auto problem = config.validate()) {
        LOG_PLANNER_ERROR("Invalid presentation configuration: {}", *problem);
        throw PlannerConfigError(*problem);
    }

    SlidePlan result;
    result.title = song.getTitle();

    const auto& metadata = song.getMetadata();

    if (config.showTitleSlide) {
        Slide title;
        title.type = SlideType::Title;
        title.lines.push_back(song.getTitle());
        if (metadata.author) {
            title.metaText = *metadata.author;
        }
        result.slides.push_back(title);
    }

    std::set<std::string> shown;

    for (const auto& instance : song.getInstances()) {
        const PartDefinition* part = song.findDefinition(instance.getPartName());
        if (!part) {
            // cannot happen for a constructed Song
            LOG_PLANNER_WARN("Skipping instance of unknown part '{}'", instance.getPartName());
            continue;
        }

        const std::string key = TextUtils::normalizeName(part->getName());
        const int repetitions = config.expandRepeats ? instance.getEffectiveRepeatCount() : 1;
        const auto chunks = chunk(displayLines(*part));

        for (int rep = 0; rep < repetitions; ++rep) {
            const bool isRepeat = shown.count(key) > 0;

            for (size_t i = 0; i < chunks.size(); ++i) {
                Slide slide;
                slide.type = SlideType::Content;
                slide.partName = part->getName();
                slide.kind = part->getKind();
                slide.lines = chunks[i];
                slide.isRepeat = isRepeat;
                slide.repeatCount = config.expandRepeats ? 1 : instance.getEffectiveRepeatCount();
                slide.chunkIndex = static_cast<int>(i);
                slide.chunkCount = static_cast<int>(chunks.size());
                slide.note = instance.getOverrideText();
                result.slides.push_back(slide);
            }

            shown.insert(key);
        }
    }

    // Spoiler: first line of the following content slide
    if (config.showSpoiler) {
        for (size_t i = 0; i < result.slides.size(); ++i) {
            if (result.slides[i].type != SlideType::Content) {
                continue;
            }
            for (size_t j = i + 1; j < result.slides.size(); ++j) {
                const Slide& next = result.slides[j];
                if (next.type == SlideType::Content && !next.lines.empty()) {
                    result.slides[i].spoiler = next.lines.front();
                    break;
                }
            }
        }
    }

    if (!config.metaTemplate.empty()) {
        std::string meta = TextUtils::trim(TextUtils::renderTemplate(config.metaTemplate,
                                                                    metadata.toTemplateValues()));
        std::vector<Slide*> content;
        for (auto& slide : result.slides) {
            if (slide.type == SlideType::Content) {
                content.push_back(&slide);
            }
        }
        if (!meta.empty() && !content.empty()) {
            if (config.metaOnFirstSlide) {
                content.front()->metaText = meta;
            }
            if (config.metaOnLastSlide) {
                content.back()->metaText = meta;
            }
        }
    }

    if (config.emptyLastSlide) {
        Slide empty;
        empty.type = SlideType::Empty;
        result.slides.push_back(empty);
    }

    LOG_PLANNER_DEBUG("Planned {} slides for '{}' ({} instances)",
                      result.slides.size(), song.getTitle(), song.getInstances().size());
    return result;
}

std::vector<std::string> PresentationPlanner::displayLines(const PartDefinition& part) {
    std::vector<std::string> lines;
    for (const auto& line : part.getLines()) {
        if (line.hasText()) {
            lines.push_back(line.getText());
        }
    }
    return lines;
}

std::vector<std::vector<std::string>> PresentationPlanner::chunk(const std::vector<std::string>& lines) const {
    // A part without lines still gets one (label only) slide
    if (lines.empty() || config.keepPartTogether) {
        return {lines};
    }

    const size_t limit = static_cast<size_t>(config.maxLinesPerSlide);
    std::vector<std::vector<std::string>> chunks;
    for (size_t start = 0; start < lines.size(); start += limit) {
        size_t end = std::min(lines.size(), start + limit);
        chunks.emplace_back(lines.begin() + static_cast<std::ptrdiff_t>(start),
                            lines.begin() + static_cast<std::ptrdiff_t>(end));
    }
    return chunks;
}

} // namespace Songbook
