#pragma once
#include <atomic>
#include <fstream>
#include <iostream>
#include <mutex>
#include <string>

namespace algexpr::cli {

enum class LogLevel {
    Debug = 0,
    Info = 1,
    Warn = 2,
    Error = 3,
};

// Process-wide leveled logger for the command-line driver. The library itself
// never logs.
class Logger {
public:
    static Logger& instance();

    void set_level(LogLevel level) { level_.store(level); }
    LogLevel level() const { return level_.load(); }
    // Appends to path; keeps the current sink if the file cannot be opened.
    bool enable_file_logging(const std::string& path);

    void debug(const std::string& message) { log(LogLevel::Debug, message); }
    void info(const std::string& message) { log(LogLevel::Info, message); }
    void warn(const std::string& message) { log(LogLevel::Warn, message); }
    void error(const std::string& message) { log(LogLevel::Error, message); }

    static const char* level_name(LogLevel level);
    static bool parse_level(const std::string& text, LogLevel& level);

private:
    Logger() = default;
    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    void log(LogLevel level, const std::string& message);
    static std::string timestamp();

    std::atomic<LogLevel> level_{LogLevel::Warn};
    std::ostream* out_{&std::cerr};
    std::ofstream file_;
    std::mutex mutex_;
};

} // namespace algexpr::cli

#define ALGEXPR_LOG_DEBUG(msg) ::algexpr::cli::Logger::instance().debug(msg)
#define ALGEXPR_LOG_INFO(msg) ::algexpr::cli::Logger::instance().info(msg)
#define ALGEXPR_LOG_WARN(msg) ::algexpr::cli::Logger::instance().warn(msg)
#define ALGEXPR_LOG_ERROR(msg) ::algexpr::cli::Logger::instance().error(msg)
