#pragma once

#include <string>
#include <vector>
#include <cstdint>

namespace codemend {
namespace utils {

class Formatter {
public:
    static std::string formatBytes(uint64_t bytes);
    static std::string formatDurationMs(uint64_t millis);
    static std::string truncate(const std::string& str, size_t maxLen, const std::string& suffix = "...");
    static std::string toUpper(const std::string& str);
    static std::string toLower(const std::string& str);
    static std::string trim(const std::string& str);
    static std::vector<std::string> split(const std::string& str, char delimiter);
    static std::vector<std::string> splitLines(const std::string& str);
    static std::string join(const std::vector<std::string>& parts, const std::string& delimiter);
    static bool endsWith(const std::string& str, const std::string& suffix);
    // At most maxBytes of str, cut back so no UTF-8 sequence is split.
    static std::string utf8Prefix(const std::string& str, size_t maxBytes);
    // POSIX single-quote escaping for `sh -c` command lines.
    static std::string shellQuote(const std::string& str);
};

}
}
