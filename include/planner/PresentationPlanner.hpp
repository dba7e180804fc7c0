#pragma once

#include "models/Song.hpp"
#include "planner/PlannerConfigError.hpp"
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace Songbook {

using json = nlohmann::json;

/**
 * Pagination and presentation settings.
 *
 * keepPartTogether favours readability over the size bound: a part longer
 * than maxLinesPerSlide is then shown on a single, oversized slide.
 */
struct PresentationConfig {
    int maxLinesPerSlide = 4;
    bool keepPartTogether = false;
    bool expandRepeats = true;

    bool showTitleSlide = false;
    bool emptyLastSlide = false;
    bool showSpoiler = false;          // preview of the next slide's first line
    std::string metaTemplate;          // e.g. "{{title}} ({{author}})"
    bool metaOnFirstSlide = true;
    bool metaOnLastSlide = false;

    // First problem found, nullopt when the configuration is usable
    std::optional<std::string> validate() const;

    json toJson() const;
};

enum class SlideType {
    Title,
    Content,
    Empty
};

std::string slideTypeToString(SlideType type);

/**
 * One projected slide
 */
struct Slide {
    SlideType type = SlideType::Content;
    std::string partName;
    PartKind kind = PartKind::Other;
    std::vector<std::string> lines;
    bool isRepeat = false;                    // the part was already shown earlier
    int repeatCount = 1;                      // > 1 only when repeats are not expanded
    int chunkIndex = 0;                       // position within the part's slides
    int chunkCount = 1;
    std::optional<std::string> note;          // override text of the part instance
    std::optional<std::string> spoiler;
    std::optional<std::string> metaText;

    json toJson() const;

    bool operator==(const Slide& other) const;
    bool operator!=(const Slide& other) const { return !(*this == other); }
};

struct SlidePlan {
    std::string title;
    std::vector<Slide> slides;

    size_t size() const { return slides.size(); }
    bool empty() const { return slides.empty(); }

    json toJson() const;

    bool operator==(const SlidePlan& other) const {
        return title == other.title && slides == other.slides;
    }
};

/**
 * Maps a Song's performance order onto slides.
 * Deterministic: the same Song and config always yield the same plan.
 */
class PresentationPlanner {
public:
    explicit PresentationPlanner(PresentationConfig config = PresentationConfig());

    /**
     * Build the slide plan
     * Throws PlannerConfigError when the configuration is invalid
     */
    SlidePlan plan(const Song& song) const;

    const PresentationConfig& getConfig() const { return config; }

private:
    PresentationConfig config;

    // Lyric lines shown on screen, chord-only and note-only lines left out
    static std::vector<std::string> displayLines(const PartDefinition& part);

    std::vector<std::vector<std::string>> chunk(const std::vector<std::string>& lines) const;
};

} // namespace Songbook
