#include "utils/logging.hpp"

#include <gtest/gtest.h>

namespace warden::utils {
namespace {

TEST(LoggingTest, ParsesLevelsCaseInsensitively) {
    LogLevel level = LogLevel::kInfo;
    EXPECT_TRUE(ParseLogLevel("DEBUG", level));
    EXPECT_EQ(level, LogLevel::kDebug);
    EXPECT_TRUE(ParseLogLevel("warning", level));
    EXPECT_EQ(level, LogLevel::kWarn);
    EXPECT_FALSE(ParseLogLevel("verbose", level));
    EXPECT_EQ(level, LogLevel::kWarn);
}

TEST(LoggingTest, ConfigureSetsThreshold) {
    const auto previous = MinLogLevel();
    ConfigureLogging({LogLevel::kWarn});
    EXPECT_EQ(MinLogLevel(), LogLevel::kWarn);
    ConfigureLogging({previous});
}

TEST(LoggingTest, FormatsTagMessageAndFields) {
    EXPECT_EQ(FormatLogLine({LogLevel::kInfo, "coordinator", "request finished", {{"id", "7"}}}),
              "[coordinator] request finished id=7");
    EXPECT_EQ(FormatLogLine({LogLevel::kError, "worker", "failed", {{"stderr", "two words"}, {"empty", ""}}}),
              "[worker] ERROR failed stderr=\"two words\" empty=\"\"");
}

TEST(LoggingTest, FlattensMultilineValues) {
    EXPECT_EQ(FormatLogLine({LogLevel::kWarn, "t", "m", {{"detail", "a\n\"b\""}}}),
              "[t] WARN m detail=\"a \\\"b\\\"\"");
}

}  // namespace
}  // namespace warden::utils
