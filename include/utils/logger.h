#pragma once

#include <string>
#include <vector>
#include <cstdint>

namespace avatarcli {
namespace utils {

enum class LogLevel {
    TRACE = 0,
    DEBUG = 1,
    INFO = 2,
    WARN = 3,
    ERROR = 4,
    FATAL = 5,
    OFF = 6
};

struct LogEntry {
    LogLevel level;
    std::string message;
    std::string category;
    uint64_t timestamp;
};

class Logger {
public:
    static void init(const std::string& path);
    static void shutdown();
    static void setLevel(LogLevel level);
    static LogLevel getLevel();
    static bool parseLevel(const std::string& name, LogLevel& out);
    static void enableConsole(bool enable);
    
    static void trace(const std::string& msg);
    static void debug(const std::string& msg);
    static void info(const std::string& msg);
    static void warn(const std::string& msg);
    static void error(const std::string& msg);
    static void fatal(const std::string& msg);
    
    static void log(LogLevel level, const std::string& msg);
    static void log(LogLevel level, const std::string& category, const std::string& msg);

    static uint64_t getLogCount();
    static uint64_t getErrorCount();
    
    static std::vector<LogEntry> getRecentLogs(size_t count = 100);
    static void clearLogs();
    static void setAllowSensitiveLogging(bool allow);
    
    // Credentials are shown as "abcd...wxyz" unless sensitive logging is allowed.
    static std::string redactKey(const std::string& key);
};

#define LOG_TRACE(msg) avatarcli::utils::Logger::trace(msg)
#define LOG_DEBUG(msg) do { if (avatarcli::utils::Logger::getLevel() <= avatarcli::utils::LogLevel::DEBUG) avatarcli::utils::Logger::debug(msg); } while(0)
#define LOG_INFO(msg) avatarcli::utils::Logger::info(msg)
#define LOG_WARN(msg) avatarcli::utils::Logger::warn(msg)
#define LOG_ERROR(msg) avatarcli::utils::Logger::error(msg)
#define LOG_FATAL(msg) avatarcli::utils::Logger::fatal(msg)

}
}
