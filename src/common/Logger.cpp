#include "fwdgate/common/Logger.h"

#include <iostream>
#include <chrono>
#include <iomanip>
#include <ctime>
#include <cctype>
#include <unistd.h>

namespace fwdgate {
namespace common {

namespace {

// Helper to get formatted timestamp
std::string GetCurrentTime() {
    auto now = std::chrono::system_clock::now();
    auto in_time_t = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()) % 1000;

    struct tm tmBuf;
    ::localtime_r(&in_time_t, &tmBuf);

    std::stringstream ss;
    ss << std::put_time(&tmBuf, "%Y-%m-%d %H:%M:%S");
    ss << '.' << std::setfill('0') << std::setw(3) << ms.count();
    return ss.str();
}

const char* LevelToString(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO:  return "INFO ";
        case LogLevel::WARN:  return "WARN ";
        case LogLevel::ERROR: return "ERROR";
        case LogLevel::FATAL: return "FATAL";
        default: return "UNKNOWN";
    }
}

// ANSI Color codes
const char* LevelToColor(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG: return "\033[36m"; // Cyan
        case LogLevel::INFO:  return "\033[32m"; // Green
        case LogLevel::WARN:  return "\033[33m"; // Yellow
        case LogLevel::ERROR: return "\033[31m"; // Red
        case LogLevel::FATAL: return "\033[35m"; // Magenta
        default: return "\033[0m";
    }
}

} // namespace

Logger& Logger::Instance() {
    static Logger instance;
    return instance;
}

Logger::Logger()
    : stdoutColor_(::isatty(STDOUT_FILENO) == 1),
      stderrColor_(::isatty(STDERR_FILENO) == 1) {
}

void Logger::SetLevel(LogLevel level) {
    level_.store(level, std::memory_order_relaxed);
}

bool Logger::ParseLevel(const std::string& levelStr, LogLevel* out) {
    std::string up;
    up.reserve(levelStr.size());
    for (unsigned char c : levelStr) up.push_back(static_cast<char>(std::toupper(c)));

    LogLevel level;
    if (up == "DEBUG") level = LogLevel::DEBUG;
    else if (up == "INFO") level = LogLevel::INFO;
    else if (up == "WARN" || up == "WARNING") level = LogLevel::WARN;
    else if (up == "ERROR") level = LogLevel::ERROR;
    else if (up == "FATAL") level = LogLevel::FATAL;
    else return false;

    if (out) *out = level;
    return true;
}

void Logger::Log(LogLevel level, const char* file, int line, const std::string& msg) {
    const bool toStderr = level >= LogLevel::ERROR;
    std::ostream& os = toStderr ? std::cerr : std::cout;
    const bool color = toStderr ? stderrColor_ : stdoutColor_;

    std::lock_guard<std::mutex> lock(mutex_);

    // Format: [Time] [Level] [File:Line] Message
    if (color) os << LevelToColor(level);
    os << "[" << GetCurrentTime() << "] "
       << "[" << LevelToString(level) << "] "
       << "[" << file << ":" << line << "] "
       << msg;
    if (color) os << "\033[0m"; // Reset color
    os << std::endl;
}

} // namespace common
} // namespace fwdgate
