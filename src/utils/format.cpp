#include "utils/utils.h"
#include <sstream>
#include <iomanip>
#include <algorithm>

namespace codemend {
namespace utils {

std::string Formatter::formatBytes(uint64_t bytes) {
    const char* units[] = {"B", "KB", "MB", "GB", "TB", "PB"};
    int unit = 0;
    double size = static_cast<double>(bytes);
    while (size >= 1024 && unit < 5) { size /= 1024; unit++; }
    std::stringstream ss;
    ss << std::fixed << std::setprecision(2) << size << " " << units[unit];
    return ss.str();
}

std::string Formatter::formatDurationMs(uint64_t millis) {
    if (millis < 1000) return std::to_string(millis) + "ms";
    std::stringstream ss;
    ss << std::fixed << std::setprecision(2) << (static_cast<double>(millis) / 1000.0) << "s";
    return ss.str();
}

std::string Formatter::truncate(const std::string& str, size_t maxLen, const std::string& suffix) {
    if (str.length() <= maxLen) return str;
    if (maxLen <= suffix.length()) return str.substr(0, maxLen);
    return str.substr(0, maxLen - suffix.length()) + suffix;
}

std::string Formatter::toUpper(const std::string& str) {
    std::string result = str;
    std::transform(result.begin(), result.end(), result.begin(), ::toupper);
    return result;
}

std::string Formatter::toLower(const std::string& str) {
    std::string result = str;
    std::transform(result.begin(), result.end(), result.begin(), ::tolower);
    return result;
}

std::string Formatter::trim(const std::string& str) {
    size_t start = str.find_first_not_of(" \t\n\r");
    if (start == std::string::npos) return "";
    size_t end = str.find_last_not_of(" \t\n\r");
    return str.substr(start, end - start + 1);
}

std::vector<std::string> Formatter::split(const std::string& str, char delimiter) {
    std::vector<std::string> result;
    std::stringstream ss(str);
    std::string item;
    while (std::getline(ss, item, delimiter)) result.push_back(item);
    return result;
}

std::vector<std::string> Formatter::splitLines(const std::string& str) {
    std::vector<std::string> lines = split(str, '\n');
    for (auto& line : lines) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
    }
    return lines;
}

std::string Formatter::join(const std::vector<std::string>& parts, const std::string& delimiter) {
    std::string result;
    for (size_t i = 0; i < parts.size(); i++) {
        if (i > 0) result += delimiter;
        result += parts[i];
    }
    return result;
}

bool Formatter::endsWith(const std::string& str, const std::string& suffix) {
    return str.size() >= suffix.size() && str.compare(str.size() - suffix.size(), suffix.size(), suffix) == 0;
}

std::string Formatter::utf8Prefix(const std::string& str, size_t maxBytes) {
    if (str.size() <= maxBytes) return str;
    size_t cut = maxBytes;
    while (cut > 0 && (static_cast<unsigned char>(str[cut]) & 0xC0) == 0x80) cut--;
    return str.substr(0, cut);
}

std::string Formatter::shellQuote(const std::string& str) {
    std::string out;
    out.reserve(str.size() + 2);
    out.push_back('\'');
    for (char c : str) {
        if (c == '\'') out += "'\\''";
        else out.push_back(c);
    }
    out.push_back('\'');
    return out;
}

}
}
