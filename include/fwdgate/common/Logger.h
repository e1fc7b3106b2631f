#pragma once

#include <string>
#include <mutex>
#include <sstream>
#include <atomic>

namespace fwdgate {
namespace common {

enum class LogLevel {
    DEBUG,
    INFO,
    WARN,
    ERROR,
    FATAL
};

class Logger {
public:
    static Logger& Instance();

    void SetLevel(LogLevel level);
    LogLevel GetLevel() const { return level_.load(std::memory_order_relaxed); }

    // Accepts DEBUG/INFO/WARN/ERROR/FATAL (case-insensitive). Returns false for anything else.
    static bool ParseLevel(const std::string& levelStr, LogLevel* out);

    // DEBUG..WARN go to stdout, ERROR and FATAL to stderr.
    void Log(LogLevel level, const char* file, int line, const std::string& msg);

private:
    Logger();
    ~Logger() = default;
    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    std::atomic<LogLevel> level_{LogLevel::INFO};
    bool stdoutColor_{false};
    bool stderrColor_{false};
    std::mutex mutex_;
};

// Stream wrapper to allow usage like: LOG_INFO << "Message " << 123;
class LogStream {
public:
    LogStream(LogLevel level, const char* file, int line)
        : level_(level), file_(file), line_(line) {}

    ~LogStream() {
        Logger::Instance().Log(level_, file_, line_, ss_.str());
    }

    template <typename T>
    LogStream& operator<<(const T& val) {
        ss_ << val;
        return *this;
    }

private:
    LogLevel level_;
    const char* file_;
    int line_;
    std::stringstream ss_;
};

} // namespace common
} // namespace fwdgate

// Macros for easy usage
#define LOG_DEBUG \
    if (fwdgate::common::LogLevel::DEBUG >= fwdgate::common::Logger::Instance().GetLevel()) \
    fwdgate::common::LogStream(fwdgate::common::LogLevel::DEBUG, __FILE__, __LINE__)

#define LOG_INFO \
    if (fwdgate::common::LogLevel::INFO >= fwdgate::common::Logger::Instance().GetLevel()) \
    fwdgate::common::LogStream(fwdgate::common::LogLevel::INFO, __FILE__, __LINE__)

#define LOG_WARN \
    if (fwdgate::common::LogLevel::WARN >= fwdgate::common::Logger::Instance().GetLevel()) \
    fwdgate::common::LogStream(fwdgate::common::LogLevel::WARN, __FILE__, __LINE__)

#define LOG_ERROR \
    if (fwdgate::common::LogLevel::ERROR >= fwdgate::common::Logger::Instance().GetLevel()) \
    fwdgate::common::LogStream(fwdgate::common::LogLevel::ERROR, __FILE__, __LINE__)

#define LOG_FATAL \
    if (fwdgate::common::LogLevel::FATAL >= fwdgate::common::Logger::Instance().GetLevel()) \
    fwdgate::common::LogStream(fwdgate::common::LogLevel::FATAL, __FILE__, __LINE__)
