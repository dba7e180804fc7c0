#pragma once

#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <memory>
#include <string>

namespace Songbook {

/**
 * Logger utility class
 * Provides named loggers for the CLI, the parser and the planners
 */
class Logger {
public:
    // Initialize logging system (console only when logFile is empty)
    static void initialize(const std::string& level = "info",
                           const std::string& logFile = "");
    
    // Get loggers
    static std::shared_ptr<spdlog::logger> getSongbookLogger();
    static std::shared_ptr<spdlog::logger> getParserLogger();
    static std::shared_ptr<spdlog::logger> getPlannerLogger();
    
    // Shutdown logging system
    static void shutdown();
    
private:
    static std::shared_ptr<spdlog::logger> songbookLogger;
    static std::shared_ptr<spdlog::logger> parserLogger;
    static std::shared_ptr<spdlog::logger> plannerLogger;
    
    static void initializeLocked(const std::string& level, const std::string& logFile);
    static void ensureInitialized();
    static void createLogger(
        const std::string& name,
        const std::string& filename,
        spdlog::level::level_enum level,
        std::shared_ptr<spdlog::logger>& logger
    );
};

// Convenience macros
#define LOG_SONGBOOK_INFO(...)   Songbook::Logger::getSongbookLogger()->info(__VA_ARGS__)
#define LOG_SONGBOOK_WARN(...)   Songbook::Logger::getSongbookLogger()->warn(__VA_ARGS__)
#define LOG_SONGBOOK_ERROR(...)  Songbook::Logger::getSongbookLogger()->error(__VA_ARGS__)
#define LOG_SONGBOOK_DEBUG(...)  Songbook::Logger::getSongbookLogger()->debug(__VA_ARGS__)

#define LOG_PARSER_INFO(...)     Songbook::Logger::getParserLogger()->info(__VA_ARGS__)
#define LOG_PARSER_WARN(...)     Songbook::Logger::getParserLogger()->warn(__VA_ARGS__)
#define LOG_PARSER_ERROR(...)    Songbook::Logger::getParserLogger()->error(__VA_ARGS__)
#define LOG_PARSER_DEBUG(...)    Songbook::Logger::getParserLogger()->debug(__VA_ARGS__)

#define LOG_PLANNER_INFO(...)    Songbook::Logger::getPlannerLogger()->info(__VA_ARGS__)
#define LOG_PLANNER_WARN(...)    Songbook::Logger::getPlannerLogger()->warn(__VA_ARGS__)
#define LOG_PLANNER_ERROR(...)   Songbook::Logger::getPlannerLogger()->error(__VA_ARGS__)
#define LOG_PLANNER_DEBUG(...)   Songbook::Logger::getPlannerLogger()->debug(__VA_ARGS__)

} // namespace Songbook
