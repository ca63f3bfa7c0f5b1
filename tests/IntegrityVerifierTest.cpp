#include "core/downloader/IntegrityVerifier.hpp"
#include "core/downloader/DownloadError.hpp"
#include "utils/HashUtils.hpp"
#include <cctype>

#include <filesystem>
#include <fstream>
#include <gtest/gtest.h>

namespace modelfetch::core::downloader {

class IntegrityVerifierTest : public ::testing::Test {
protected:
    void SetUp() override {
        tempDir = std::filesystem::temp_directory_path() / "modelfetch_verify_test";
        std::filesystem::create_directories(tempDir);
        filePath = (tempDir / "model.bin").string();
        writeFile("weights");
    }

    void TearDown() override {
        std::filesystem::remove_all(tempDir);
    }

    void writeFile(const std::string& content) {
        std::ofstream out(filePath, std::ios::binary | std::ios::trunc);
        out << content;
    }

    std::filesystem::path tempDir;
    std::string filePath;
};

TEST_F(IntegrityVerifierTest, MatchingDigest) {
    EXPECT_TRUE(IntegrityVerifier::verify(filePath, utils::HashUtils::sha256String("weights")));
}

TEST_F(IntegrityVerifierTest, UppercaseExpectedDigest) {
    std::string upper = utils::HashUtils::sha256String("weights");
    for (auto& c : upper) {
        c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    }
    EXPECT_TRUE(IntegrityVerifier::verify(filePath, upper));
}

TEST_F(IntegrityVerifierTest, MutatedContentIsMismatch) {
    std::string digest = utils::HashUtils::sha256String("weights");
    writeFile("weightz");

    EXPECT_FALSE(IntegrityVerifier::verify(filePath, digest));
}

TEST_F(IntegrityVerifierTest, MissingFileThrows) {
    std::string digest = utils::HashUtils::sha256String("weights");
    EXPECT_THROW(IntegrityVerifier::verify((tempDir / "nope.bin").string(), digest), IntegrityError);
}

TEST_F(IntegrityVerifierTest, DirectoryIsNotAFile) {
    EXPECT_THROW(IntegrityVerifier::verify(tempDir.string(), std::string(64, '0')), IntegrityError);
}

TEST_F(IntegrityVerifierTest, MatchesComparesNormalizedDigests) {
    EXPECT_TRUE(IntegrityVerifier::matches("abc123", " ABC123\n"));
    EXPECT_FALSE(IntegrityVerifier::matches("", ""));
    EXPECT_FALSE(IntegrityVerifier::matches("abc123", "abc124"));
}

} // namespace modelfetch::core::downloader
