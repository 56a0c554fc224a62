#include "logger.hpp"

#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace algexpr::cli {

Logger& Logger::instance() {
    static Logger logger;
    return logger;
}

bool Logger::enable_file_logging(const std::string& path) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (file_.is_open()) file_.close();
    file_.open(path, std::ios::app);
    if (!file_.is_open()) return false;
    out_ = &file_;
    return true;
}

std::string Logger::timestamp() {
    auto now = std::chrono::system_clock::now();
    auto time = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;

    std::ostringstream oss;
    oss << std::put_time(std::localtime(&time), "%Y-%m-%d %H:%M:%S");
    oss << '.' << std::setfill('0') << std::setw(3) << ms.count();
    return oss.str();
}

const char* Logger::level_name(LogLevel level) {
    switch (level) {
        case LogLevel::Debug: return "DEBUG";
        case LogLevel::Info:  return "INFO ";
        case LogLevel::Warn:  return "WARN ";
        case LogLevel::Error: return "ERROR";
    }
    return "?????";
}

bool Logger::parse_level(const std::string& text, LogLevel& level) {
    if (text == "debug") level = LogLevel::Debug;
    else if (text == "info") level = LogLevel::Info;
    else if (text == "warn") level = LogLevel::Warn;
    else if (text == "error") level = LogLevel::Error;
    else return false;
    return true;
}

void Logger::log(LogLevel level, const std::string& message) {
    if (level < level_.load()) return;

    std::lock_guard<std::mutex> lock(mutex_);
    *out_ << "[" << timestamp() << "] "
          << "[" << level_name(level) << "] "
          << message << std::endl;
}

} // namespace algexpr::cli
