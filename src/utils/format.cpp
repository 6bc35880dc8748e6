#include "utils/utils.h"
#include <sstream>
#include <iomanip>
#include <ctime>
#include <algorithm>
#include <cctype>

namespace avatarcli {
namespace utils {

std::string Formatter::padLeft(const std::string& str, size_t width, char padChar) {
    if (str.length() >= width) return str;
    return std::string(width - str.length(), padChar) + str;
}

std::string Formatter::truncate(const std::string& str, size_t maxLen, const std::string& suffix) {
    if (str.length() <= maxLen) return str;
    if (maxLen <= suffix.length()) return str.substr(0, maxLen);
    return str.substr(0, maxLen - suffix.length()) + suffix;
}

std::string Formatter::preview(const std::string& str, size_t maxLen, const std::string& emptyText) {
    if (str.empty()) return emptyText;
    if (str.length() <= maxLen) return str;
    return str.substr(0, maxLen) + "...";
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

bool Formatter::isBlank(const std::string& str) {
    return str.find_first_not_of(" \t\n\r") == std::string::npos;
}

std::vector<std::string> Formatter::split(const std::string& str, char delimiter) {
    std::vector<std::string> result;
    std::stringstream ss(str);
    std::string item;
    while (std::getline(ss, item, delimiter)) result.push_back(item);
    return result;
}

std::string Formatter::repeat(const std::string& str, int count) {
    std::string result;
    for (int i = 0; i < count; i++) result += str;
    return result;
}

std::optional<std::string> Formatter::formatIsoTimestamp(const std::string& iso) {
    if (iso.size() < 19) return std::nullopt;
    std::tm tm{};
    std::istringstream in(iso.substr(0, 19));
    in >> std::get_time(&tm, "%Y-%m-%dT%H:%M:%S");
    if (in.fail()) {
        in.clear();
        in.str(iso.substr(0, 19));
        in >> std::get_time(&tm, "%Y-%m-%d %H:%M:%S");
        if (in.fail()) return std::nullopt;
    }
    char buf[32];
    if (std::strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M:%S", &tm) == 0) return std::nullopt;
    return std::string(buf);
}

std::string Formatter::urlEncode(const std::string& str) {
    std::ostringstream out;
    out << std::hex << std::uppercase;
    for (unsigned char c : str) {
        if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~') {
            out << c;
        } else {
            out << '%' << std::setw(2) << std::setfill('0') << static_cast<int>(c);
        }
    }
    return out.str();
}

std::string Formatter::maskSecret(const std::string& secret) {
    if (secret.empty()) return "not set";
    if (secret.length() > 8) return secret.substr(0, 4) + "..." + secret.substr(secret.length() - 4);
    return "****";
}

}
}
