#include "utils/Logger.hpp"
#include <filesystem>
#include <initializer_list>
#include <iostream>
#include <memory>
#include <mutex>
#include <vector>

namespace Songbook {

std::shared_ptr<spdlog::logger> Logger::songbookLogger = nullptr;
std::shared_ptr<spdlog::logger> Logger::parserLogger = nullptr;
std::shared_ptr<spdlog::logger> Logger::plannerLogger = nullptr;

namespace {

// initialize() may swap the loggers while other threads log; the pointers
// are only read and written through std::atomic_load / std::atomic_store
std::mutex initMutex;
std::once_flag defaultInitFlag;
bool initialized = false;

} // anonymous namespace

void Logger::initialize(const std::string& level, const std::string& logFile) {
    std::lock_guard<std::mutex> lock(initMutex);
    initializeLocked(level, logFile);
}

void Logger::initializeLocked(const std::string& level, const std::string& logFile) {
    spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%n] [%^%l%$] %v");
    
    const auto lvl = spdlog::level::from_str(level);
    
    // Create log directory if it doesn't exist
    if (!logFile.empty()) {
        std::filesystem::path parent = std::filesystem::path(logFile).parent_path();
        if (!parent.empty()) {
            std::error_code ec;
            std::filesystem::create_directories(parent, ec);
            if (ec) {
                std::cerr << "Cannot create log directory " << parent << ": " << ec.message() << std::endl;
            }
        }
    }
    
    // Re-initialization replaces the registered loggers
    spdlog::drop_all();
    
    std::shared_ptr<spdlog::logger> songbook;
    std::shared_ptr<spdlog::logger> parser;
    std::shared_ptr<spdlog::logger> planner;
    createLogger("songbook", logFile, lvl, songbook);
    createLogger("parser", logFile, lvl, parser);
    createLogger("planner", logFile, lvl, planner);
    
    std::atomic_store(&songbookLogger, songbook);
    std::atomic_store(&parserLogger, parser);
    std::atomic_store(&plannerLogger, planner);
    
    initialized = true;
    songbook->debug("Logging system initialized (level {})", level);
}

void Logger::ensureInitialized() {
    // Lock only on first use; an explicit initialize() may already have run
    std::call_once(defaultInitFlag, [] {
        std::lock_guard<std::mutex> lock(initMutex);
        if (!initialized) {
            initializeLocked("info", "");
        }
    });
}

void Logger::createLogger(
    const std::string& name,
    const std::string& filename,
    spdlog::level::level_enum level,
    std::shared_ptr<spdlog::logger>& logger
) {
    try {
        // Diagnostics go to stderr so JSON output on stdout stays clean
        auto console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
        console_sink->set_level(level);
        
        std::vector<spdlog::sink_ptr> sinks{console_sink};
        
        if (!filename.empty()) {
            // Rotating file sink: 10MB max size, 3 backup files
            auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                filename, 1024 * 1024 * 10, 3
            );
            file_sink->set_level(spdlog::level::trace);
            sinks.push_back(file_sink);
        }
        
        logger = std::make_shared<spdlog::logger>(name, sinks.begin(), sinks.end());
        logger->set_level(level);
        
        spdlog::register_logger(logger);
    } catch (const spdlog::spdlog_ex& ex) {
        std::cerr << "Log initialization failed for " << name << ": " << ex.what() << std::endl;
        logger = std::make_shared<spdlog::logger>(name);
    }
}

std::shared_ptr<spdlog::logger> Logger::getSongbookLogger() {
    ensureInitialized();
    return std::atomic_load(&songbookLogger);
}

std::shared_ptr<spdlog::logger> Logger::getParserLogger() {
    ensureInitialized();
    return std::atomic_load(&parserLogger);
}

std::shared_ptr<spdlog::logger> Logger::getPlannerLogger() {
    ensureInitialized();
    return std::atomic_load(&plannerLogger);
}

void Logger::shutdown() {
    std::lock_guard<std::mutex> lock(initMutex);
    for (auto* slot : {&songbookLogger, &parserLogger, &plannerLogger}) {
        if (auto logger = std::atomic_load(slot)) {
            logger->flush();
        }
    }
    
    spdlog::shutdown();
}

} // namespace Songbook
