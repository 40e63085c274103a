#include <gtest/gtest.h>

#include "test_support.hpp"
#include "utils/logging.hpp"

using judgelink::utils::LogLevel;

// NOLINTNEXTLINE
TEST(logging, format_includes_component_level_and_fields) {
    const judgelink::utils::LogMessage message{
        LogLevel::kWarn, "judge0", "HTTP error", {{"status", "503"}, {"path", "/submissions"}}};
    EXPECT_EQ(judgelink::utils::FormatLogMessage(message), "[judge0] WARN HTTP error status=503 path=/submissions");
}

// NOLINTNEXTLINE
TEST(logging, messages_below_min_level_are_dropped) {
    judgelink::testing::LogCapture logs;
    judgelink::utils::Configure({.min_level = LogLevel::kWarn});
    judgelink::utils::LogInfo("test", "hidden");
    judgelink::utils::LogError("test", "shown");
    EXPECT_TRUE(logs.AtLevel(LogLevel::kInfo).empty());
    EXPECT_EQ(logs.AtLevel(LogLevel::kError).size(), 1u);
}

// NOLINTNEXTLINE
TEST(logging, parse_level) {
    EXPECT_EQ(judgelink::utils::ParseLogLevel("DEBUG", LogLevel::kInfo), LogLevel::kDebug);
    EXPECT_EQ(judgelink::utils::ParseLogLevel(" warning ", LogLevel::kInfo), LogLevel::kWarn);
    EXPECT_EQ(judgelink::utils::ParseLogLevel("loud", LogLevel::kError), LogLevel::kError);
}

// NOLINTNEXTLINE
TEST(logging, mask_secret) {
    EXPECT_EQ(judgelink::utils::MaskSecret("sk-abcdefghijkl"), "sk-a****ijkl");
    EXPECT_EQ(judgelink::utils::MaskSecret("short"), "****");
    EXPECT_EQ(judgelink::utils::MaskSecret(""), "(none)");
}
