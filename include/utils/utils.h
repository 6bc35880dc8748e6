#pragma once

#include <string>
#include <vector>
#include <optional>
#include <cstdint>

namespace avatarcli {
namespace utils {

class Formatter {
public:
    static std::string padLeft(const std::string& str, size_t width, char padChar = ' ');
    static std::string truncate(const std::string& str, size_t maxLen, const std::string& suffix = "...");
    static std::string preview(const std::string& str, size_t maxLen, const std::string& emptyText);
    static std::string toLower(const std::string& str);
    static std::string trim(const std::string& str);
    static bool isBlank(const std::string& str);
    static std::vector<std::string> split(const std::string& str, char delimiter);
    static std::string repeat(const std::string& str, int count);
    // "2024-05-01T12:30:00.123Z" -> "2024-05-01 12:30:00"; nullopt when unparseable.
    static std::optional<std::string> formatIsoTimestamp(const std::string& iso);
    static std::string urlEncode(const std::string& str);
    // "abcd...wxyz" for long secrets, "****" for short ones, "not set" when empty.
    static std::string maskSecret(const std::string& secret);
};

}
}
