#include "core/Logger.hpp"

#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <sstream>

namespace modelfetch::core {

class LoggerTest : public ::testing::Test {
protected:
    void SetUp() override {
        logDir = std::filesystem::temp_directory_path() / "modelfetch_logger_test";
        std::filesystem::remove_all(logDir);
    }

    void TearDown() override {
        Logger::instance().shutdown();
        std::filesystem::remove_all(logDir);
    }

    std::string readLog() const {
        std::ifstream in(logDir / "modelfetch.log");
        std::ostringstream content;
        content << in.rdbuf();
        return content.str();
    }

    std::filesystem::path logDir;
};

TEST_F(LoggerTest, SilentUntilInitialized) {
    Logger::instance().shutdown();
    EXPECT_FALSE(Logger::instance().isInitialized());
    EXPECT_NO_THROW(LOG_INFO("nobody hears this {}", 1));
}

TEST_F(LoggerTest, FileSinkRecordsTraceRegardlessOfConsoleLevel) {
    LogSettings settings;
    settings.level = LogLevel::Error;
    settings.console = false;
    settings.directory = logDir.string();
    Logger::instance().initialize(settings);

    LOG_TRACE("chunk of {} bytes", 256);
    LOG_WARN("retrying {}", "dl_1");
    Logger::instance().flush();

    std::string content = readLog();
    EXPECT_NE(content.find("chunk of 256 bytes"), std::string::npos);
    EXPECT_NE(content.find("retrying dl_1"), std::string::npos);
}

TEST_F(LoggerTest, ShutdownReturnsToSilence) {
    LogSettings settings;
    settings.console = false;
    settings.directory = logDir.string();
    Logger::instance().initialize(settings);
    ASSERT_TRUE(Logger::instance().isInitialized());

    Logger::instance().shutdown();
    LOG_ERROR("after shutdown");

    EXPECT_FALSE(Logger::instance().isInitialized());
    EXPECT_EQ(readLog().find("after shutdown"), std::string::npos);
}

TEST(LoggerLevelTest, ParsesConfigNames) {
    EXPECT_EQ(Logger::parseLevel("trace"), LogLevel::Trace);
    EXPECT_EQ(Logger::parseLevel("debug"), LogLevel::Debug);
    EXPECT_EQ(Logger::parseLevel("warning"), LogLevel::Warn);
    EXPECT_EQ(Logger::parseLevel("off"), LogLevel::Off);
    EXPECT_EQ(Logger::parseLevel("loud"), LogLevel::Info);
}

} // namespace modelfetch::core
