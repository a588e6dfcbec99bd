#include <gtest/gtest.h>

#include "ferry/errors.hpp"
#include "ferry/retry.hpp"
#include "testing.hpp"

#include <chrono>
#include <vector>

namespace {

struct RetryFixture : public ::testing::Test {
    ferry::Retrier MakeRetrier(unsigned attempts) {
        return ferry::Retrier(ferry::RetryPolicy{attempts, std::chrono::seconds(2)},
                              [this](std::chrono::seconds d) { sleeps.push_back(d); });
    }

    std::vector<std::chrono::seconds> sleeps;
};

TEST_F(RetryFixture, SucceedsOnFinalAttempt) {
    auto retrier = MakeRetrier(3);
    int calls = 0;
    auto op = [&] {
        ++calls;
        return calls < 3 ? ferry::Result::Fail(255, "ssh src true") : ferry::Result::Ok();
    };

    EXPECT_NO_THROW(retrier.Run(op));
    EXPECT_EQ(calls, 3);
    EXPECT_EQ(retrier.state(), ferry::RetryState::Succeeded);
    EXPECT_EQ(retrier.last_attempts(), 3u);
    ASSERT_EQ(sleeps.size(), 2u);
    EXPECT_EQ(sleeps[0], std::chrono::seconds(2));
}

TEST_F(RetryFixture, SingleAttemptNeverSleeps) {
    auto retrier = MakeRetrier(1);
    int calls = 0;
    auto r = retrier.Attempt([&] {
        ++calls;
        return ferry::Result::Fail(1, "false");
    });

    EXPECT_FALSE(r.ok);
    EXPECT_EQ(calls, 1);
    EXPECT_TRUE(sleeps.empty());
    EXPECT_EQ(retrier.state(), ferry::RetryState::Exhausted);
}

TEST_F(RetryFixture, ZeroAttemptsIsTreatedAsOne) {
    auto retrier = MakeRetrier(0);
    EXPECT_EQ(retrier.policy().attempts, 1u);
}

TEST_F(RetryFixture, ExhaustionRunsCleanupWhenPolicyIsAlways) {
    auto retrier = MakeRetrier(2);
    int calls = 0;
    int cleanups = 0;
    retrier.SetEscalation(ferry::DeletePolicy::Always, nullptr, [&] { ++cleanups; });

    try {
        retrier.Run([&] {
            ++calls;
            return ferry::Result::Fail(255, "ssh dst docker load -i /tmp/x.tar");
        });
        FAIL() << "expected FatalExecutionError";
    } catch (const ferry::FatalExecutionError& e) {
        EXPECT_EQ(e.Attempts(), 2u);
        EXPECT_EQ(e.Command(), "ssh dst docker load -i /tmp/x.tar");
    }

    EXPECT_EQ(calls, 2);
    EXPECT_EQ(cleanups, 1);
    EXPECT_EQ(retrier.state(), ferry::RetryState::Terminated);
}

TEST_F(RetryFixture, AskPolicyDeclinedSkipsCleanup) {
    auto retrier = MakeRetrier(1);
    testutil::ScriptedPrompt prompt;
    prompt.answers = {false};
    int cleanups = 0;
    retrier.SetEscalation(ferry::DeletePolicy::Ask, &prompt, [&] { ++cleanups; });

    EXPECT_THROW(retrier.Run([] { return ferry::Result::Fail(1, "x"); }), ferry::FatalExecutionError);
    EXPECT_EQ(cleanups, 0);
    ASSERT_EQ(prompt.questions.size(), 1u);
}

TEST_F(RetryFixture, AskPolicyWithoutPromptDefaultsToNo) {
    auto retrier = MakeRetrier(1);
    int cleanups = 0;
    retrier.SetEscalation(ferry::DeletePolicy::Ask, nullptr, [&] { ++cleanups; });

    EXPECT_THROW(retrier.Run([] { return ferry::Result::Fail(1, "x"); }), ferry::FatalExecutionError);
    EXPECT_EQ(cleanups, 0);
}

TEST_F(RetryFixture, NeverPolicyDoesNotAsk) {
    auto retrier = MakeRetrier(1);
    testutil::ScriptedPrompt prompt;
    int cleanups = 0;
    retrier.SetEscalation(ferry::DeletePolicy::Never, &prompt, [&] { ++cleanups; });

    EXPECT_THROW(retrier.Run([] { return ferry::Result::Fail(1, "x"); }), ferry::FatalExecutionError);
    EXPECT_EQ(cleanups, 0);
    EXPECT_TRUE(prompt.questions.empty());
}

TEST_F(RetryFixture, FailureInsideCleanupDoesNotReenterCleanup) {
    auto retrier = MakeRetrier(1);
    int cleanups = 0;
    bool inner_threw = false;

    retrier.SetEscalation(ferry::DeletePolicy::Always, nullptr, [&] {
        ++cleanups;
        EXPECT_TRUE(retrier.in_cleanup());
        try {
            retrier.Run([] { return ferry::Result::Fail(255, "ssh src rm -f x"); });
        } catch (const ferry::FatalExecutionError&) {
            inner_threw = true;
        }
    });

    EXPECT_THROW(retrier.Run([] { return ferry::Result::Fail(255, "ssh src docker save"); }),
                 ferry::FatalExecutionError);
    EXPECT_EQ(cleanups, 1);
    EXPECT_TRUE(inner_threw);
    EXPECT_FALSE(retrier.in_cleanup());
}

} // namespace
