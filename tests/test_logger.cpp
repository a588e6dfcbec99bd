#include <gtest/gtest.h>

#include "ferry/logger.hpp"

#include <string>

namespace {

TEST(LoggerTest, LevelsGoToTheirStreamsWithTags) {
    testing::internal::CaptureStdout();
    testing::internal::CaptureStderr();
    ferry::LogInfo("copied %d of %s", 3, "chunks");
    ferry::LogSuccess("done");
    ferry::LogWarn("retry %u/%u", 1u, 3u);
    ferry::LogError("gave up on %s", "rsync");
    const std::string out = testing::internal::GetCapturedStdout();
    const std::string err = testing::internal::GetCapturedStderr();

    EXPECT_EQ(out, "[INFO]  copied 3 of chunks\n[ OK  ] done\n");
    EXPECT_EQ(err, "[WARN]  retry 1/3\n[ERROR] gave up on rsync\n");
}

TEST(LoggerTest, DebugOnlyWhenVerbose) {
    testing::internal::CaptureStdout();
    ferry::LogDebug("hidden");
    ferry::SetVerbose(true);
    ferry::LogDebug("shown %d", 7);
    ferry::SetVerbose(false);
    EXPECT_EQ(testing::internal::GetCapturedStdout(), "[DEBUG] shown 7\n");
}

TEST(LoggerTest, LongMessagesAreNotTruncated) {
    const std::string long_text(3000, 'x');
    testing::internal::CaptureStdout();
    ferry::LogInfo("%s", long_text.c_str());
    EXPECT_EQ(testing::internal::GetCapturedStdout(), "[INFO]  " + long_text + "\n");
}

} // namespace
