#include "models/Config.hpp"
#include "parser/SongParser.hpp"
#include "planner/PresentationPlanner.hpp"
#include "planner/SheetPlanner.hpp"
#include "utils/Logger.hpp"
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>

namespace {

struct Options {
    std::string songFile;
    std::string configFile;
    std::string dialect;
    std::string mode = "song";
    bool strict = false;
};

void printUsage(const char* program) {
    std::cerr << "Usage: " << program
              << " <file> [--config cfg.json] [--dialect standard|chordpro|classic]"
                 " [--mode song|slides|sheet|text] [--strict]\n";
}

bool parseArguments(int argc, char* argv[], Options& options) {
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        bool hasValue = i + 1 < argc;

        if (arg == "--config" && hasValue) {
            options.configFile = argv[++i];
        } else if (arg == "--dialect" && hasValue) {
            options.dialect = argv[++i];
        } else if (arg == "--mode" && hasValue) {
            options.mode = argv[++i];
        } else if (arg == "--strict") {
            options.strict = true;
        } else if (!arg.empty() && arg[0] != '-' && options.songFile.empty()) {
            options.songFile = arg;
        } else {
            std::cerr << "Unknown or incomplete argument: " << arg << "\n";
            return false;
        }
    }

    if (options.songFile.empty()) {
        return false;
    }
    return options.mode == "song" || options.mode == "slides" ||
           options.mode == "sheet" || options.mode == "text";
}

bool readFile(const std::string& path, std::string& content) {
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        return false;
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    content = buffer.str();
    return true;
}

} // namespace

int main(int argc, char* argv[]) {
    Options options;
    if (!parseArguments(argc, argv, options)) {
        printUsage(argv[0]);
        return 1;
    }

    Songbook::Config config;
    if (!options.configFile.empty() && !config.loadFromFile(options.configFile)) {
        std::cerr << "Error: Could not load configuration from " << options.configFile << "\n";
        return 1;
    }
    config.loadFromEnvironment();

    Songbook::Logger::initialize(config.logLevel, config.logFile);
    LOG_SONGBOOK_DEBUG("Configuration: {}", config.toJson().dump());

    try {
        // --dialect wins over the config file, the extension over detection
        if (!options.dialect.empty()) {
            config.parser.dialect = options.dialect;
        } else if (config.parser.dialect == "auto") {
            std::string ext = std::filesystem::path(options.songFile).extension().string();
            if (auto byExtension = Songbook::dialectForExtension(ext)) {
                config.parser.dialect = *byExtension;
            }
        }

        std::string text;
        if (!readFile(options.songFile, text)) {
            LOG_SONGBOOK_ERROR("Cannot read song file: {}", options.songFile);
            std::cerr << "Error: Cannot read " << options.songFile << "\n";
            Songbook::Logger::shutdown();
            return 1;
        }

        Songbook::SongParser parser(config.parser);
        Songbook::ParseResult result = parser.parseText(text);

        for (const auto& diagnostic : result.diagnostics) {
            if (diagnostic.isError()) {
                LOG_SONGBOOK_ERROR("{}: {}", options.songFile, diagnostic.toString());
            } else {
                LOG_SONGBOOK_WARN("{}: {}", options.songFile, diagnostic.toString());
            }
        }
        LOG_SONGBOOK_INFO("Parsed '{}' ({} dialect): {} parts, {} errors, {} warnings",
                          result.song.getTitle(), result.dialect,
                          result.song.getDefinitions().size(),
                          result.errorCount(), result.warningCount());

        if (options.mode == "song") {
            std::cout << result.toJson().dump(2) << std::endl;
        } else if (options.mode == "slides") {
            Songbook::PresentationPlanner planner(config.presentation);
            std::cout << planner.plan(result.song).toJson().dump(2) << std::endl;
        } else {
            Songbook::SheetPlanner planner(config.sheet);
            Songbook::SheetPlan sheet = planner.plan(result.song);
            if (options.mode == "text") {
                std::cout << sheet.toText();
            } else {
                std::cout << sheet.toJson().dump(2) << std::endl;
            }
        }

        if (options.strict && result.hasErrors()) {
            LOG_SONGBOOK_ERROR("Strict mode: {} error(s) in {}", result.errorCount(), options.songFile);
            Songbook::Logger::shutdown();
            return 2;
        }

    } catch (const Songbook::PlannerConfigError& e) {
        LOG_SONGBOOK_ERROR("Configuration error: {}", e.what());
        std::cerr << "Configuration error: " << e.what() << std::endl;
        Songbook::Logger::shutdown();
        return 1;
    } catch (const std::exception& e) {
        LOG_SONGBOOK_ERROR("Fatal error: {}", e.what());
        std::cerr << "Fatal error: " << e.what() << std::endl;
        Songbook::Logger::shutdown();
        return 1;
    }

    Songbook::Logger::shutdown();
    return 0;
}
