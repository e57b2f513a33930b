#pragma once

#include <string>
#include <vector>
#include <cstdint>

namespace codemend {
namespace utils {

enum class LogLevel {
    TRACE = 0,
    DEBUG = 1,
    INFO = 2,
    WARN = 3,
    ERROR = 4,
    OFF = 5
};

struct LogEntry {
    LogLevel level;
    std::string message;
    uint64_t timestamp;
};

// Process-wide logger. Lines go to stderr and, once open() succeeded, to a
// file that is rotated to "<path>.1" when it grows past maxBytes.
class Logger {
public:
    static bool open(const std::string& path, uint64_t maxBytes = 10 * 1024 * 1024);
    static void close();
    static bool isFileOpen();

    static void setLevel(LogLevel level);
    static LogLevel getLevel();
    static void setConsole(bool enable);

    static void debug(const std::string& msg);
    static void info(const std::string& msg);
    static void warn(const std::string& msg);
    static void error(const std::string& msg);
    static void flush();

    // The last entries written, oldest first. Bounded ring.
    static std::vector<LogEntry> recent(size_t count = 100);
    static void clearRecent();

    static LogLevel parseLevel(const std::string& name, LogLevel def = LogLevel::INFO);
    static const char* levelName(LogLevel level);

    // Environment values bound for the sandbox can hold API keys.
    static bool isSensitiveName(const std::string& name);
    static std::string redactSensitive(const std::string& name, const std::string& value);
};

#define LOG_DEBUG(msg) do { if (codemend::utils::Logger::getLevel() <= codemend::utils::LogLevel::DEBUG) codemend::utils::Logger::debug(msg); } while(0)
#define LOG_INFO(msg) codemend::utils::Logger::info(msg)
#define LOG_WARN(msg) codemend::utils::Logger::warn(msg)
#define LOG_ERROR(msg) codemend::utils::Logger::error(msg)

}
}
