// ModelFetch - String Utilities
// String manipulation, parsing and formatting

#pragma once

#include <string>
#include <cstdint>

namespace modelfetch::utils {

/**
 * @brief String manipulation utilities
 */
class StringUtils {
public:
    // Trimming
    static std::string trim(const std::string& str);

    // Case conversion
    static std::string toLower(const std::string& str);

    // Search
    static bool startsWith(const std::string& str, const std::string& prefix);

    // Formatting
    static std::string formatBytes(int64_t bytes);
    static std::string formatRate(double bytesPerSecond);
    static std::string formatMillis(double milliseconds);

    // Validation
    static bool isUrl(const std::string& str);
    static bool isHex(const std::string& str);

    // Parsing
    static int parseInt(const std::string& str, int defaultValue = 0);
    static int64_t parseLong(const std::string& str, int64_t defaultValue = 0);
};

} // namespace modelfetch::utils
