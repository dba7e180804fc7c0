#include "models/Config.hpp"
#include "utils/Logger.hpp"
#include "utils/TextUtils.hpp"
#include <cstdlib>
#include <fstream>
#include <stdexcept>

namespace Songbook {

bool Config::loadFromFile(const std::string& filename) {
    std::ifstream file(filename);
    if (!file.is_open()) {
        LOG_SONGBOOK_WARN("Cannot open config file: {}", filename);
        return false;
    }

    try {
        json config;
        file >> config;
        return loadFromJson(config);
    } catch (const json::exception& e) {
        LOG_SONGBOOK_ERROR("Malformed config file {}: {}", filename, e.what());
        return false;
    }
}

bool Config::loadFromJson(const json& config) {
    if (!config.is_object()) {
        LOG_SONGBOOK_ERROR("Configuration must be a JSON object");
        return false;
    }

    try {
        if (config.contains("parser")) {
            const auto& p = config["parser"];
            parser.tabWidth = p.value("tab_width", parser.tabWidth);
            parser.chordColumnTolerance = p.value("chord_column_tolerance", parser.chordColumnTolerance);
            parser.dialect = p.value("dialect", parser.dialect);
        }

        if (config.contains("presentation")) {
            const auto& p = config["presentation"];
            presentation.maxLinesPerSlide = p.value("max_lines_per_slide", presentation.maxLinesPerSlide);
            presentation.keepPartTogether = p.value("keep_part_together", presentation.keepPartTogether);
            presentation.expandRepeats = p.value("expand_repeats", presentation.expandRepeats);
            presentation.showTitleSlide = p.value("show_title_slide", presentation.showTitleSlide);
            presentation.emptyLastSlide = p.value("empty_last_slide", presentation.emptyLastSlide);
            presentation.showSpoiler = p.value("show_spoiler", presentation.showSpoiler);
            presentation.metaTemplate = p.value("meta_template", presentation.metaTemplate);
            presentation.metaOnFirstSlide = p.value("meta_on_first_slide", presentation.metaOnFirstSlide);
            presentation.metaOnLastSlide = p.value("meta_on_last_slide", presentation.metaOnLastSlide);
        }

        if (config.contains("sheet")) {
            const auto& s = config["sheet"];
            sheet.showChords = s.value("show_chords", sheet.showChords);
            sheet.linesPerPage = s.value("lines_per_page", sheet.linesPerPage);
            sheet.includeHeader = s.value("include_header", sheet.includeHeader);
        }

        logLevel = config.value("log_level", logLevel);
        logFile = config.value("log_file", logFile);
    } catch (const json::exception& e) {
        LOG_SONGBOOK_ERROR("Invalid configuration value: {}", e.what());
        return false;
    }

    return true;
}

void Config::loadFromEnvironment() {
    presentation.maxLinesPerSlide = getEnvInt("SONGBOOK_MAX_LINES", presentation.maxLinesPerSlide);
    presentation.keepPartTogether = getEnvBool("SONGBOOK_KEEP_PART_TOGETHER", presentation.keepPartTogether);
    presentation.expandRepeats = getEnvBool("SONGBOOK_EXPAND_REPEATS", presentation.expandRepeats);
    parser.tabWidth = getEnvInt("SONGBOOK_TAB_WIDTH", parser.tabWidth);
    logLevel = getEnv("SONGBOOK_LOG_LEVEL", logLevel);
    logFile = getEnv("SONGBOOK_LOG_FILE", logFile);
}

json Config::toJson() const {
    json j;
    j["parser"] = parser.toJson();
    j["presentation"] = presentation.toJson();
    j["sheet"] = sheet.toJson();
    j["log_level"] = logLevel;
    j["log_file"] = logFile;
    return j;
}

std::string Config::getEnv(const std::string& key, const std::string& defaultValue) {
    const char* value = std::getenv(key.c_str());
    return value ? std::string(value) : defaultValue;
}

int Config::getEnvInt(const std::string& key, int defaultValue) {
    const char* value = std::getenv(key.c_str());
    if (!value) return defaultValue;

    try {
        return std::stoi(value);
    } catch (const std::exception&) {
        LOG_SONGBOOK_WARN("Ignoring non-numeric {}={}", key, value);
        return defaultValue;
    }
}

bool Config::getEnvBool(const std::string& key, bool defaultValue) {
    const char* value = std::getenv(key.c_str());
    if (!value) return defaultValue;

    std::string flag = TextUtils::toLower(TextUtils::trim(value));
    if (flag == "1" || flag == "true" || flag == "yes" || flag == "on") return true;
    if (flag == "0" || flag == "false" || flag == "no" || flag == "off") return false;

    LOG_SONGBOOK_WARN("Ignoring invalid boolean {}={}", key, value);
    return defaultValue;
}

} // namespace Songbook
