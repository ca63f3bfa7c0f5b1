#pragma once

/**
 * IntegrityVerifier.hpp
 *
 * SHA-256 verification of downloaded files.
 */

#include <string>

namespace modelfetch::core::downloader {

class IntegrityVerifier {
public:
    /**
     * Compare a file's SHA-256 with an expected hex digest
     * @param filePath File to hash
     * @param expectedHex Expected digest, any case
     * @return true iff the lowercase digests are equal
     * @throws IntegrityError if the file does not exist or cannot be read
     */
    static bool verify(const std::string& filePath, const std::string& expectedHex);

    /**
     * Compare an already computed digest (e.g. the rolling digest of a
     * finished transfer) without reading the file again
     */
    static bool matches(const std::string& actualHex, const std::string& expectedHex);

    /**
     * Lowercased, trimmed form of a user supplied digest
     */
    static std::string normalize(const std::string& hex);
};

} // namespace modelfetch::core::downloader
