#include "utils/logger.h"
#include <fstream>
#include <ctime>
#include <iostream>
#include <mutex>
#include <atomic>
#include <cstdlib>
#include <sstream>
#include <filesystem>
#include <algorithm>
#include <vector>
#include <deque>

namespace avatarcli {
namespace utils {

static LogLevel currentLevel = LogLevel::INFO;
static std::ofstream logFile;
static std::string logPath;
static std::mutex logMutex;
static bool consoleEnabled = true;
static const uint64_t maxFileSize = 5 * 1024 * 1024;
static const uint32_t maxFiles = 3;
static std::atomic<uint64_t> logCount{0};
static std::atomic<uint64_t> errorCount{0};
static std::deque<LogEntry> recentLogs;
static size_t maxRecentLogs = 500;
static bool allowSensitive = false;

static void rotateLocked();

static const char* levelToString(LogLevel level) {
    switch (level) {
        case LogLevel::TRACE: return "TRACE";
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO:  return "INFO ";
        case LogLevel::WARN:  return "WARN ";
        case LogLevel::ERROR: return "ERROR";
        case LogLevel::FATAL: return "FATAL";
        default: return "?????";
    }
}

static std::string sanitize(const std::string& in) {
    std::string s = in;
    const std::vector<std::string> keys = {"x-api-key", "api_key", "apikey", "token", "password", "secret"};
    for (const auto& k : keys) {
        size_t pos = 0;
        while ((pos = s.find(k, pos)) != std::string::npos) {
            size_t i = pos + k.size();
            while (i < s.size() && (s[i] == ' ' || s[i] == '"' || s[i] == '\'' || s[i] == ':' || s[i] == '=')) i++;
            size_t sep = i;
            size_t end = sep;
            while (end < s.size() && s[end] != '"' && s[end] != '\'' && s[end] != ' ' && s[end] != ',' && s[end] != ')' && s[end] != ';' && s[end] != '\n') end++;
            if (sep < end) {
                s.replace(sep, end - sep, "[REDACTED]");
                pos = sep + 10;
            } else {
                pos += k.size();
            }
        }
    }
    return s;
}

static void writeLog(LogLevel level, const std::string& category, const std::string& msg) {
    if (level < currentLevel || currentLevel == LogLevel::OFF) return;
    
    std::lock_guard<std::mutex> lock(logMutex);
    
    time_t now = std::time(nullptr);
    char timeBuf[64];
    std::strftime(timeBuf, sizeof(timeBuf), "%Y-%m-%d %H:%M:%S", std::localtime(&now));
    
    std::string outMsg = allowSensitive ? msg : sanitize(msg);

    std::ostringstream oss;
    oss << timeBuf << " [" << levelToString(level) << "]";
    if (!category.empty()) {
        oss << " [" << category << "]";
    }
    oss << " " << outMsg << "\n";

    std::string line = oss.str();
    
    if (consoleEnabled) {
        if (level >= LogLevel::ERROR) {
            std::cerr << line;
        } else {
            std::cout << line;
        }
    }
    
    if (logFile.is_open()) {
        logFile << line;
        logFile.flush();
        
        if (logFile.tellp() > static_cast<std::streampos>(maxFileSize)) {
            rotateLocked();
        }
    }
    
    logCount++;
    if (level >= LogLevel::ERROR) errorCount++;
    
    LogEntry entry;
    entry.level = level;
    entry.message = outMsg;
    entry.category = category;
    entry.timestamp = static_cast<uint64_t>(now);
    
    recentLogs.push_back(entry);
    while (recentLogs.size() > maxRecentLogs) {
        recentLogs.pop_front();
    }
}

void Logger::init(const std::string& path) {
    std::lock_guard<std::mutex> lock(logMutex);
    logPath = path;
    
    std::filesystem::path p(path);
    if (p.has_parent_path()) {
        std::error_code ec;
        std::filesystem::create_directories(p.parent_path(), ec);
    }
    
    if (logFile.is_open()) logFile.close();
    logFile.open(path, std::ios::app);
    const char* env = std::getenv("AVATARCLI_ALLOW_SENSITIVE_LOGS");
    if (env && *env) {
        std::string v(env);
        if (v == "1" || v == "true" || v == "TRUE") allowSensitive = true;
    }
}

void Logger::shutdown() {
    std::lock_guard<std::mutex> lock(logMutex);
    if (logFile.is_open()) {
        logFile.flush();
        logFile.close();
    }
}

void Logger::setLevel(LogLevel level) {
    currentLevel = level;
}

LogLevel Logger::getLevel() {
    return currentLevel;
}

bool Logger::parseLevel(const std::string& name, LogLevel& out) {
    std::string v = name;
    std::transform(v.begin(), v.end(), v.begin(), ::tolower);
    if (v == "trace") out = LogLevel::TRACE;
    else if (v == "debug") out = LogLevel::DEBUG;
    else if (v == "info") out = LogLevel::INFO;
    else if (v == "warn" || v == "warning") out = LogLevel::WARN;
    else if (v == "error") out = LogLevel::ERROR;
    else if (v == "fatal") out = LogLevel::FATAL;
    else if (v == "off" || v == "none") out = LogLevel::OFF;
    else return false;
    return true;
}

void Logger::setAllowSensitiveLogging(bool allow) {
    allowSensitive = allow;
}

void Logger::enableConsole(bool enable) {
    consoleEnabled = enable;
}

void Logger::trace(const std::string& msg) {
    writeLog(LogLevel::TRACE, "", msg);
}

void Logger::debug(const std::string& msg) {
    writeLog(LogLevel::DEBUG, "", msg);
}

void Logger::info(const std::string& msg) {
    writeLog(LogLevel::INFO, "", msg);
}

void Logger::warn(const std::string& msg) {
    writeLog(LogLevel::WARN, "", msg);
}

void Logger::error(const std::string& msg) {
    writeLog(LogLevel::ERROR, "", msg);
}

void Logger::fatal(const std::string& msg) {
    writeLog(LogLevel::FATAL, "", msg);
}

void Logger::log(LogLevel level, const std::string& msg) {
    writeLog(level, "", msg);
}

void Logger::log(LogLevel level, const std::string& category, const std::string& msg) {
    writeLog(level, category, msg);
}

static void rotateLocked() {
    if (logPath.empty()) return;
    
    if (logFile.is_open()) {
        logFile.close();
    }
    
    std::error_code ec;
    for (int i = static_cast<int>(maxFiles) - 1; i >= 1; i--) {
        std::string oldPath = logPath + "." + std::to_string(i);
        std::string newPath = logPath + "." + std::to_string(i + 1);
        if (std::filesystem::exists(oldPath, ec)) {
            if (i == static_cast<int>(maxFiles) - 1) {
                std::filesystem::remove(oldPath, ec);
            } else {
                std::filesystem::rename(oldPath, newPath, ec);
            }
        }
    }
    
    if (std::filesystem::exists(logPath, ec)) {
        std::filesystem::rename(logPath, logPath + ".1", ec);
    }
    
    logFile.open(logPath, std::ios::app);
}

uint64_t Logger::getLogCount() {
    return logCount;
}

uint64_t Logger::getErrorCount() {
    return errorCount;
}

std::vector<LogEntry> Logger::getRecentLogs(size_t count) {
    std::lock_guard<std::mutex> lock(logMutex);
    std::vector<LogEntry> result;
    size_t start = recentLogs.size() > count ? recentLogs.size() - count : 0;
    for (size_t i = start; i < recentLogs.size(); i++) {
        result.push_back(recentLogs[i]);
    }
    return result;
}

void Logger::clearLogs() {
    std::lock_guard<std::mutex> lock(logMutex);
    recentLogs.clear();
    logCount = 0;
    errorCount = 0;
}

std::string Logger::redactKey(const std::string& key) {
    if (allowSensitive) return key;
    if (key.empty()) return "not set";
    if (key.length() > 8) {
        return key.substr(0, 4) + "..." + key.substr(key.length() - 4);
    }
    return "[REDACTED_KEY]";
}

}
}
