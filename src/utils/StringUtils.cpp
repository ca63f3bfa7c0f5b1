/**
 * StringUtils.cpp
 *
 * String manipulation, parsing and formatting.
 */

#include "StringUtils.hpp"

#include <algorithm>
#include <cctype>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace modelfetch::utils {

// -- Trimming --

std::string StringUtils::trim(const std::string& str) {
    auto start = str.find_first_not_of(" \t\n\r\f\v");
    if (start == std::string::npos) return "";
    auto end = str.find_last_not_of(" \t\n\r\f\v");
    return str.substr(start, end - start + 1);
}

// -- Case conversion --

std::string StringUtils::toLower(const std::string& str) {
    std::string result = str;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return result;
}

// -- Search --

bool StringUtils::startsWith(const std::string& str, const std::string& prefix) {
    return str.size() >= prefix.size() && str.compare(0, prefix.size(), prefix) == 0;
}

// -- Formatting --

std::string StringUtils::formatBytes(int64_t bytes) {
    const char* units[] = {"B", "KB", "MB", "GB", "TB"};
    double size = static_cast<double>(bytes);
    int unit = 0;
    while (size >= 1024.0 && unit < 4) { size /= 1024.0; ++unit; }
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(unit == 0 ? 0 : 1) << size << " " << units[unit];
    return oss.str();
}

std::string StringUtils::formatRate(double bytesPerSecond) {
    return formatBytes(static_cast<int64_t>(bytesPerSecond)) + "/s";
}

std::string StringUtils::formatMillis(double milliseconds) {
    std::ostringstream oss;
    if (milliseconds < 1000.0) {
        oss << std::fixed << std::setprecision(0) << milliseconds << " ms";
    } else {
        oss << std::fixed << std::setprecision(2) << milliseconds / 1000.0 << " s";
    }
    return oss.str();
}

// -- Validation --

bool StringUtils::isUrl(const std::string& str) {
    return startsWith(str, "http://") || startsWith(str, "https://");
}

bool StringUtils::isHex(const std::string& str) {
    return !str.empty() && std::all_of(str.begin(), str.end(), [](unsigned char c) {
        return std::isxdigit(c) != 0;
    });
}

// -- Parsing --

int StringUtils::parseInt(const std::string& str, int defaultValue) {
    try {
        size_t pos = 0;
        int value = std::stoi(trim(str), &pos);
        return pos == trim(str).size() ? value : defaultValue;
    } catch (const std::logic_error&) {
        return defaultValue;
    }
}

int64_t StringUtils::parseLong(const std::string& str, int64_t defaultValue) {
    try {
        size_t pos = 0;
        long long value = std::stoll(trim(str), &pos);
        return pos == trim(str).size() ? static_cast<int64_t>(value) : defaultValue;
    } catch (const std::logic_error&) {
        return defaultValue;
    }
}

} // namespace modelfetch::utils
