// =============================================================================
// cramdec - Logger Configuration Tests
// =============================================================================

#include <gtest/gtest.h>

#include <cstdlib>
#include <string>

#include "cramdec/common/logger.h"

namespace cramdec::common::test {

TEST(LoggerConfigTest, Validation) {
    log::Config config;
    EXPECT_TRUE(config.validate().has_value());

    config.loggerName.clear();
    auto unnamed = config.validate();
    ASSERT_FALSE(unnamed.has_value());
    EXPECT_EQ(unnamed.error().code(), ErrorCode::kInvalidArgument);

    config.loggerName = "cramdec";
    config.enableConsole = false;
    auto noSink = config.validate();
    ASSERT_FALSE(noSink.has_value());
    EXPECT_EQ(noSink.error().code(), ErrorCode::kInvalidArgument);

    config.logFile = "decode.log";
    EXPECT_TRUE(config.validate().has_value());
}

TEST(LoggerConfigTest, InvalidConfigDoesNotInitialize) {
    log::Config config;
    config.enableConsole = false;

    EXPECT_FALSE(log::init(config).has_value());
    EXPECT_FALSE(log::isInitialized());
    EXPECT_EQ(log::logger(), nullptr);

    // Macros are no-ops without a logger.
    CRAMDEC_LOG_INFO("not logged {}", 1);
}

TEST(LoggerLevelTest, ParsesNames) {
    EXPECT_EQ(log::levelFromString("TRACE"), log::Level::kTrace);
    EXPECT_EQ(log::levelFromString("debug"), log::Level::kDebug);
    EXPECT_EQ(log::levelFromString("Warn"), log::Level::kWarning);
    EXPECT_EQ(log::levelFromString("fatal"), log::Level::kCritical);
    EXPECT_EQ(log::levelFromString("verbose"), log::Level::kInfo);

    for (const auto level : {log::Level::kTrace, log::Level::kDebug, log::Level::kInfo,
                             log::Level::kWarning, log::Level::kError, log::Level::kCritical}) {
        EXPECT_EQ(log::levelFromString(log::levelToString(level)), level);
    }
}

TEST(LoggerConfigTest, ReadsEnvironment) {
    ::setenv(std::string(log::kLevelEnvVar).c_str(), "error", 1);
    ::setenv(std::string(log::kFileEnvVar).c_str(), "/tmp/cramdec.log", 1);

    const auto config = log::configFromEnvironment();
    EXPECT_EQ(config.level, log::Level::kError);
    EXPECT_EQ(config.logFile, "/tmp/cramdec.log");

    ::unsetenv(std::string(log::kLevelEnvVar).c_str());
    ::unsetenv(std::string(log::kFileEnvVar).c_str());

    const auto defaults = log::configFromEnvironment();
    EXPECT_EQ(defaults.level, log::Level::kInfo);
    EXPECT_TRUE(defaults.logFile.empty());
}

}  // namespace cramdec::common::test
