#include "utils/logger.h"
#include "utils/utils.h"
#include <atomic>
#include <ctime>
#include <deque>
#include <filesystem>
#include <fstream>
#include <functional>
#include <iostream>
#include <mutex>
#include <sstream>
#include <thread>

namespace codemend {
namespace utils {

namespace {

constexpr size_t kRecentCapacity = 500;

struct LogSink {
    std::mutex mtx;
    std::ofstream file;
    std::string path;
    uint64_t maxBytes = 0;
    std::deque<LogEntry> recent;
};

std::atomic<LogLevel> g_level{LogLevel::INFO};
std::atomic<bool> g_console{true};

LogSink& sink() {
    static LogSink s;
    return s;
}

const char* levelTag(LogLevel level) {
    switch (level) {
        case LogLevel::TRACE: return "TRACE";
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO:  return "INFO ";
        case LogLevel::WARN:  return "WARN ";
        case LogLevel::ERROR: return "ERROR";
        default: return "?????";
    }
}

// Short per-thread tag so interleaved sandbox runs can be told apart.
std::string threadTag() {
    std::ostringstream oss;
    oss << std::hex << (std::hash<std::thread::id>{}(std::this_thread::get_id()) & 0xffff);
    return oss.str();
}

void rotateLocked(LogSink& s) {
    s.file.close();
    std::error_code ec;
    std::filesystem::rename(s.path, s.path + ".1", ec);
    s.file.open(s.path, std::ios::trunc);
}

void write(LogLevel level, const std::string& msg) {
    if (level < g_level.load()) return;

    time_t now = std::time(nullptr);
    std::tm local{};
    localtime_r(&now, &local);
    char timeBuf[32];
    std::strftime(timeBuf, sizeof(timeBuf), "%Y-%m-%d %H:%M:%S", &local);

    std::string line = std::string(timeBuf) + " [" + levelTag(level) + "] [" + threadTag() + "] " + msg + "\n";

    LogSink& s = sink();
    std::lock_guard<std::mutex> lock(s.mtx);
    if (g_console) std::cerr << line;
    if (s.file.is_open()) {
        s.file << line;
        s.file.flush();
        if (s.maxBytes > 0 && s.file.tellp() > static_cast<std::streamoff>(s.maxBytes)) {
            rotateLocked(s);
        }
    }

    s.recent.push_back(LogEntry{level, msg, static_cast<uint64_t>(now)});
    if (s.recent.size() > kRecentCapacity) s.recent.pop_front();
}

}

bool Logger::open(const std::string& path, uint64_t maxBytes) {
    LogSink& s = sink();
    std::lock_guard<std::mutex> lock(s.mtx);
    if (s.file.is_open()) s.file.close();

    std::filesystem::path p(path);
    if (p.has_parent_path()) {
        std::error_code ec;
        std::filesystem::create_directories(p.parent_path(), ec);
    }
    s.path = path;
    s.maxBytes = maxBytes;
    s.file.open(path, std::ios::app);
    return s.file.is_open();
}

void Logger::close() {
    LogSink& s = sink();
    std::lock_guard<std::mutex> lock(s.mtx);
    if (s.file.is_open()) s.file.close();
}

bool Logger::isFileOpen() {
    LogSink& s = sink();
    std::lock_guard<std::mutex> lock(s.mtx);
    return s.file.is_open();
}

void Logger::setLevel(LogLevel level) { g_level = level; }
LogLevel Logger::getLevel() { return g_level; }
void Logger::setConsole(bool enable) { g_console = enable; }

void Logger::debug(const std::string& msg) { write(LogLevel::DEBUG, msg); }
void Logger::info(const std::string& msg) { write(LogLevel::INFO, msg); }
void Logger::warn(const std::string& msg) { write(LogLevel::WARN, msg); }
void Logger::error(const std::string& msg) { write(LogLevel::ERROR, msg); }

void Logger::flush() {
    LogSink& s = sink();
    std::lock_guard<std::mutex> lock(s.mtx);
    if (s.file.is_open()) s.file.flush();
    std::cerr.flush();
}

std::vector<LogEntry> Logger::recent(size_t count) {
    LogSink& s = sink();
    std::lock_guard<std::mutex> lock(s.mtx);
    size_t start = s.recent.size() > count ? s.recent.size() - count : 0;
    return std::vector<LogEntry>(s.recent.begin() + static_cast<std::ptrdiff_t>(start), s.recent.end());
}

void Logger::clearRecent() {
    LogSink& s = sink();
    std::lock_guard<std::mutex> lock(s.mtx);
    s.recent.clear();
}

LogLevel Logger::parseLevel(const std::string& name, LogLevel def) {
    std::string lower = Formatter::toLower(Formatter::trim(name));
    if (lower == "trace") return LogLevel::TRACE;
    if (lower == "debug") return LogLevel::DEBUG;
    if (lower == "info") return LogLevel::INFO;
    if (lower == "warn" || lower == "warning") return LogLevel::WARN;
    if (lower == "error") return LogLevel::ERROR;
    if (lower == "off" || lower == "none") return LogLevel::OFF;
    return def;
}

const char* Logger::levelName(LogLevel level) {
    switch (level) {
        case LogLevel::TRACE: return "trace";
        case LogLevel::DEBUG: return "debug";
        case LogLevel::INFO: return "info";
        case LogLevel::WARN: return "warn";
        case LogLevel::ERROR: return "error";
        case LogLevel::OFF: return "off";
        default: return "unknown";
    }
}

bool Logger::isSensitiveName(const std::string& name) {
    static const char* const markers[] = {"KEY", "TOKEN", "SECRET", "PASSWORD", "PASSWD", "CREDENTIAL"};
    std::string upper = Formatter::toUpper(name);
    for (const char* marker : markers) {
        if (upper.find(marker) != std::string::npos) return true;
    }
    return false;
}

std::string Logger::redactSensitive(const std::string& name, const std::string& value) {
    return isSensitiveName(name) ? "[REDACTED]" : value;
}

}
}
