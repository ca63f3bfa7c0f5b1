#pragma once

#include <string>
#include <cstdint>
#include <fstream>
#include <memory>
#include <stdexcept>
#include <sstream>
#include <iomanip>
#include <openssl/evp.h>

namespace modelfetch::utils {

/**
 * @brief Incremental SHA-256 over an OpenSSL EVP context.
 *
 * Fed chunk by chunk while a download is written, so the digest is ready
 * the moment the last byte lands on disk.
 */
class Sha256Hasher {
public:
    Sha256Hasher() : m_ctx(EVP_MD_CTX_new(), &EVP_MD_CTX_free) {
        if (!m_ctx) {
            throw std::runtime_error("EVP_MD_CTX_new failed");
        }
        reset();
    }

    Sha256Hasher(const Sha256Hasher&) = delete;
    Sha256Hasher& operator=(const Sha256Hasher&) = delete;

    /**
     * Start over from an empty message
     */
    void reset() {
        if (EVP_DigestInit_ex(m_ctx.get(), EVP_sha256(), nullptr) != 1) {
            throw std::runtime_error("EVP_DigestInit_ex(sha256) failed");
        }
        m_bytes = 0;
    }

    void update(const char* data, size_t len) {
        if (len == 0) return;
        if (EVP_DigestUpdate(m_ctx.get(), data, len) != 1) {
            throw std::runtime_error("EVP_DigestUpdate failed");
        }
        m_bytes += len;
    }

    /**
     * Digest of everything fed so far. The running state is left untouched
     * so more data may follow (a resumed transfer keeps hashing).
     * @return Lowercase hex digest
     */
    std::string hexDigest() const {
        std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)> copy(EVP_MD_CTX_new(), &EVP_MD_CTX_free);
        if (!copy || EVP_MD_CTX_copy_ex(copy.get(), m_ctx.get()) != 1) {
            throw std::runtime_error("EVP_MD_CTX_copy_ex failed");
        }

        unsigned char hash[EVP_MAX_MD_SIZE];
        unsigned int hashLen = 0;
        if (EVP_DigestFinal_ex(copy.get(), hash, &hashLen) != 1) {
            throw std::runtime_error("EVP_DigestFinal_ex failed");
        }
        return toHex(hash, hashLen);
    }

    /**
     * Number of bytes hashed since the last reset
     */
    uint64_t bytesHashed() const { return m_bytes; }

    static std::string toHex(const unsigned char* data, size_t len) {
        std::ostringstream oss;
        for (size_t i = 0; i < len; ++i) {
            oss << std::hex << std::setfill('0') << std::setw(2) << static_cast<int>(data[i]);
        }
        return oss.str();
    }

private:
    std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)> m_ctx;
    uint64_t m_bytes{0};
};

class HashUtils {
public:
    /**
     * SHA-256 of a file, streamed in 8 KiB blocks
     * @throws std::runtime_error if the file cannot be opened or read
     */
    static std::string sha256File(const std::string& filePath) {
        std::ifstream file(filePath, std::ios::binary);
        if (!file.is_open()) {
            throw std::runtime_error("Cannot open file for hashing: " + filePath);
        }

        Sha256Hasher hasher;
        char buffer[8192];
        while (file.read(buffer, sizeof(buffer)) || file.gcount() > 0) {
            hasher.update(buffer, static_cast<size_t>(file.gcount()));
        }
        if (file.bad()) {
            throw std::runtime_error("Read error while hashing: " + filePath);
        }
        return hasher.hexDigest();
    }

    static std::string sha256String(const std::string& data) {
        Sha256Hasher hasher;
        hasher.update(data.data(), data.size());
        return hasher.hexDigest();
    }
};

} // namespace modelfetch::utils
