/**
 * IntegrityVerifier.cpp
 */

#include "IntegrityVerifier.hpp"
#include "DownloadError.hpp"
#include "../Logger.hpp"
#include "../../utils/HashUtils.hpp"
#include "../../utils/StringUtils.hpp"

#include <filesystem>
#include <system_error>

namespace modelfetch::core::downloader {

using utils::StringUtils;
using utils::HashUtils;

std::string IntegrityVerifier::normalize(const std::string& hex) {
    return StringUtils::toLower(StringUtils::trim(hex));
}

bool IntegrityVerifier::matches(const std::string& actualHex, const std::string& expectedHex) {
    return !actualHex.empty() && normalize(actualHex) == normalize(expectedHex);
}

bool IntegrityVerifier::verify(const std::string& filePath, const std::string& expectedHex) {
    std::error_code ec;
    if (!std::filesystem::is_regular_file(filePath, ec)) {
        throw IntegrityError("cannot verify " + filePath + ": file does not exist");
    }

    std::string actual;
    try {
        actual = HashUtils::sha256File(filePath);
    } catch (const std::runtime_error& e) {
        throw IntegrityError("cannot verify " + filePath + ": " + e.what());
    }

    bool ok = matches(actual, expectedHex);
    if (!ok) {
        LOG_WARN("Checksum mismatch for {}: expected {}, got {}", filePath, normalize(expectedHex), actual);
    }
    return ok;
}

} // namespace modelfetch::core::downloader
