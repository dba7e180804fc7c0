#pragma once

#include "parser/SongParser.hpp"
#include "planner/PresentationPlanner.hpp"
#include "planner/SheetPlanner.hpp"
#include <string>
#include <nlohmann/json.hpp>

namespace Songbook {

using json = nlohmann::json;

/**
 * Configuration management class
 * Loads settings from a JSON file and SONGBOOK_* environment variables.
 * Plain value: every caller owns its own copy.
 */
class Config {
public:
    ParserOptions parser;
    PresentationConfig presentation;
    SheetConfig sheet;

    std::string logLevel = "info";
    std::string logFile;            // empty: console only

    // Load configuration; missing keys keep their current values
    bool loadFromFile(const std::string& filename);
    bool loadFromJson(const json& config);
    void loadFromEnvironment();

    json toJson() const;

private:
    static std::string getEnv(const std::string& key, const std::string& defaultValue = "");
    static int getEnvInt(const std::string& key, int defaultValue);
    static bool getEnvBool(const std::string& key, bool defaultValue);
};

} // namespace Songbook
