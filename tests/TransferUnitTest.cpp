#include "core/downloader/TransferUnit.hpp"
#include "support/FakeClock.hpp"
#include "support/FakeTransport.hpp"
#include "utils/HashUtils.hpp"

#include <filesystem>
#include <fstream>
#include <gtest/gtest.h>
#include <sstream>

namespace modelfetch::core::downloader {

using test::FakeTransport;
using test::Route;
using test::makePayload;

class TransferUnitTest : public ::testing::Test {
protected:
    void SetUp() override {
        tempDir = std::filesystem::temp_directory_path() / "modelfetch_transfer_test";
        std::filesystem::remove_all(tempDir);
        std::filesystem::create_directories(tempDir);
    }

    void TearDown() override {
        std::filesystem::remove_all(tempDir);
    }

    TransferOutcome runOnce(TransferState& state, const std::string& url,
                            std::function<bool()> interrupted = {}) {
        TransferUnit unit(transport, clock, std::chrono::milliseconds(0));
        TransferRequest request;
        request.url = url;
        return unit.run(request, state, interrupted, [this](uint64_t bytes, int64_t total) {
            reports.emplace_back(bytes, total);
        });
    }

    static std::string readFile(const std::filesystem::path& path) {
        std::ifstream in(path, std::ios::binary);
        std::ostringstream content;
        content << in.rdbuf();
        return content.str();
    }

    std::filesystem::path tempDir;
    FakeTransport transport;
    test::FakeClock clock;
    std::vector<std::pair<uint64_t, int64_t>> reports;
};

TEST_F(TransferUnitTest, StreamsIntoNestedDirectory) {
    std::string payload = makePayload(1024);
    transport.addRoute("http://host/model.bin", Route{payload});

    TransferState state;
    state.destinationPath = (tempDir / "a" / "b" / "model.bin").string();

    auto outcome = runOnce(state, "http://host/model.bin");

    ASSERT_TRUE(outcome.success) << outcome.message;
    EXPECT_EQ(outcome.bytesOnDisk, 1024u);
    EXPECT_EQ(outcome.totalBytes, 1024);
    EXPECT_EQ(outcome.checksum, utils::HashUtils::sha256String(payload));
    EXPECT_EQ(readFile(state.destinationPath), payload);
}

TEST_F(TransferUnitTest, UnknownLengthStaysUnknown) {
    Route route{makePayload(600)};
    route.sendContentLength = false;
    transport.addRoute("http://host/stream", route);

    TransferState state;
    state.destinationPath = (tempDir / "stream.bin").string();

    auto outcome = runOnce(state, "http://host/stream");

    ASSERT_TRUE(outcome.success) << outcome.message;
    EXPECT_EQ(outcome.totalBytes, -1);
    EXPECT_EQ(outcome.bytesOnDisk, 600u);
    for (const auto& report : reports) {
        EXPECT_EQ(report.second, -1);
    }
}

TEST_F(TransferUnitTest, ProgressIsMonotonicAndEndsAtTotal) {
    Route route{makePayload(2048)};
    route.chunkSize = 100;
    transport.addRoute("http://host/model.bin", route);

    TransferState state;
    state.destinationPath = (tempDir / "model.bin").string();
    runOnce(state, "http://host/model.bin");

    ASSERT_FALSE(reports.empty());
    for (size_t i = 1; i < reports.size(); ++i) {
        EXPECT_GE(reports[i].first, reports[i - 1].first);
    }
    EXPECT_EQ(reports.back().first, 2048u);
    EXPECT_EQ(reports.back().second, 2048);
}

TEST_F(TransferUnitTest, ProgressIsThrottled) {
    Route route{makePayload(4096)};
    route.chunkSize = 16;
    transport.addRoute("http://host/model.bin", route);

    TransferState state;
    state.destinationPath = (tempDir / "model.bin").string();

    // A one hour interval leaves only the forced reports: head and end
    TransferUnit unit(transport, clock, std::chrono::hours(1));
    TransferRequest request;
    request.url = "http://host/model.bin";
    size_t count = 0;
    auto outcome = unit.run(request, state, {}, [&count](uint64_t, int64_t) { ++count; });

    ASSERT_TRUE(outcome.success);
    EXPECT_LE(count, 3u);
}

TEST_F(TransferUnitTest, NotFoundIsTerminalHttpError) {
    TransferState state;
    state.destinationPath = (tempDir / "missing.bin").string();

    auto outcome = runOnce(state, "http://host/unknown");

    EXPECT_FALSE(outcome.success);
    EXPECT_EQ(outcome.errorKind, DownloadErrorKind::HttpStatus);
    EXPECT_EQ(outcome.httpStatus, 404);
    EXPECT_NE(outcome.message.find("404"), std::string::npos);
    EXPECT_FALSE(outcome.retryable());
    EXPECT_FALSE(std::filesystem::exists(state.destinationPath));
}

TEST_F(TransferUnitTest, ServerErrorIsRetryable) {
    Route route{makePayload(10)};
    route.failures = 1;
    route.failure = Route::Failure::HttpStatus;
    route.failureStatus = 503;
    transport.addRoute("http://host/busy", route);

    TransferState state;
    state.destinationPath = (tempDir / "busy.bin").string();

    auto outcome = runOnce(state, "http://host/busy");

    EXPECT_EQ(outcome.errorKind, DownloadErrorKind::HttpStatus);
    EXPECT_TRUE(outcome.retryable());
}

TEST_F(TransferUnitTest, TimeoutIsRetryable) {
    Route route{makePayload(10)};
    route.failures = 1;
    route.failure = Route::Failure::Timeout;
    transport.addRoute("http://host/slow", route);

    TransferState state;
    state.destinationPath = (tempDir / "slow.bin").string();

    auto outcome = runOnce(state, "http://host/slow");

    EXPECT_EQ(outcome.errorKind, DownloadErrorKind::Timeout);
    EXPECT_TRUE(outcome.retryable());
    EXPECT_NE(outcome.message.find("timeout"), std::string::npos);
}

TEST_F(TransferUnitTest, UnwritableDestinationIsFilesystemError) {
    transport.addRoute("http://host/model.bin", Route{makePayload(64)});

    // The parent "directory" is a regular file
    auto blocker = tempDir / "blocker";
    std::ofstream(blocker) << "x";

    TransferState state;
    state.destinationPath = (blocker / "model.bin").string();

    auto outcome = runOnce(state, "http://host/model.bin");

    EXPECT_FALSE(outcome.success);
    EXPECT_EQ(outcome.errorKind, DownloadErrorKind::Filesystem);
    EXPECT_FALSE(outcome.retryable());
    EXPECT_NE(outcome.message.find("filesystem error"), std::string::npos);
}

TEST_F(TransferUnitTest, RangeRequestAppendsAndKeepsDigest) {
    std::string payload = makePayload(1000);
    Route route{payload};
    route.supportsRange = true;
    route.failures = 1;
    route.failure = Route::Failure::Truncate;
    transport.addRoute("http://host/model.bin", route);

    TransferState state;
    state.destinationPath = (tempDir / "model.bin").string();
    state.resumeSupport = true;

    auto first = runOnce(state, "http://host/model.bin");
    ASSERT_FALSE(first.success);
    EXPECT_EQ(first.errorKind, DownloadErrorKind::Network);
    EXPECT_EQ(state.bytesOnDisk, 500u);

    auto second = runOnce(state, "http://host/model.bin");
    ASSERT_TRUE(second.success) << second.message;

    auto requests = transport.requests();
    ASSERT_EQ(requests.size(), 2u);
    EXPECT_EQ(requests[1].rangeStart, 500u);
    EXPECT_EQ(second.bytesOnDisk, 1000u);
    EXPECT_EQ(second.checksum, utils::HashUtils::sha256String(payload));
    EXPECT_EQ(readFile(state.destinationPath), payload);
}

TEST_F(TransferUnitTest, IgnoredRangeRestartsFromZero) {
    std::string payload = makePayload(1000);
    Route route{payload};
    route.supportsRange = false;
    route.failures = 1;
    route.failure = Route::Failure::Truncate;
    transport.addRoute("http://host/model.bin", route);

    TransferState state;
    state.destinationPath = (tempDir / "model.bin").string();
    state.resumeSupport = true;

    runOnce(state, "http://host/model.bin");
    auto second = runOnce(state, "http://host/model.bin");

    ASSERT_TRUE(second.success) << second.message;
    EXPECT_EQ(transport.requests()[1].rangeStart, 500u);
    EXPECT_EQ(second.bytesOnDisk, 1000u);
    EXPECT_EQ(second.checksum, utils::HashUtils::sha256String(payload));
    EXPECT_EQ(readFile(state.destinationPath), payload);
}

TEST_F(TransferUnitTest, MisplacedRangeIsRejectedAndNextAttemptStartsOver) {
    std::string payload = makePayload(1000);
    Route route{payload};
    route.supportsRange = true;
    route.rangeSkew = -100;
    route.failures = 1;
    route.failure = Route::Failure::Truncate;
    transport.addRoute("http://host/model.bin", route);

    TransferState state;
    state.destinationPath = (tempDir / "model.bin").string();
    state.resumeSupport = true;

    runOnce(state, "http://host/model.bin");
    ASSERT_EQ(state.bytesOnDisk, 500u);

    auto second = runOnce(state, "http://host/model.bin");
    EXPECT_FALSE(second.success);
    EXPECT_EQ(second.errorKind, DownloadErrorKind::Network);
    EXPECT_TRUE(second.retryable());
    EXPECT_EQ(state.bytesOnDisk, 0u);

    auto third = runOnce(state, "http://host/model.bin");
    ASSERT_TRUE(third.success) << third.message;

    auto requests = transport.requests();
    ASSERT_EQ(requests.size(), 3u);
    EXPECT_EQ(requests[1].rangeStart, 500u);
    EXPECT_EQ(requests[2].rangeStart, 0u);
    EXPECT_EQ(third.checksum, utils::HashUtils::sha256String(payload));
    EXPECT_EQ(readFile(state.destinationPath), payload);
}

TEST_F(TransferUnitTest, WithoutResumeEveryAttemptStartsOver) {
    std::string payload = makePayload(1000);
    Route route{payload};
    route.supportsRange = true;
    route.failures = 1;
    route.failure = Route::Failure::Truncate;
    transport.addRoute("http://host/model.bin", route);

    TransferState state;
    state.destinationPath = (tempDir / "model.bin").string();

    runOnce(state, "http://host/model.bin");
    auto second = runOnce(state, "http://host/model.bin");

    ASSERT_TRUE(second.success);
    EXPECT_EQ(transport.requests()[1].rangeStart, 0u);
    EXPECT_EQ(readFile(state.destinationPath), payload);
}

TEST_F(TransferUnitTest, InterruptAbortsTransfer) {
    Route route{makePayload(4096)};
    route.chunkSize = 64;
    transport.addRoute("http://host/model.bin", route);

    TransferState state;
    state.destinationPath = (tempDir / "model.bin").string();

    auto outcome = runOnce(state, "http://host/model.bin", [&state]() {
        return state.bytesOnDisk >= 256;
    });

    EXPECT_FALSE(outcome.success);
    EXPECT_EQ(outcome.errorKind, DownloadErrorKind::Interrupted);
    EXPECT_LT(state.bytesOnDisk, 4096u);
}

TEST_F(TransferUnitTest, ShortBodyIsNetworkError) {
    Route route{makePayload(1000)};
    route.failures = 1;
    route.failure = Route::Failure::Truncate;
    transport.addRoute("http://host/model.bin", route);

    TransferState state;
    state.destinationPath = (tempDir / "model.bin").string();

    auto outcome = runOnce(state, "http://host/model.bin");

    EXPECT_EQ(outcome.errorKind, DownloadErrorKind::Network);
    EXPECT_TRUE(outcome.retryable());
}

} // namespace modelfetch::core::downloader
