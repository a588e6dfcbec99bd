#pragma once

#include "ferry/prompt.hpp"
#include "ferry/result.hpp"
#include "ferry/types.hpp"

#include <chrono>
#include <functional>

namespace ferry {

//   Idle -> Attempting -> Succeeded
//                      -> Retrying -> Attempting ...
//                      -> Exhausted -> CleanupOffered -> CleanupRun | CleanupSkipped
//                                   -> Terminated
enum class RetryState {
    Idle,
    Attempting,
    Retrying,
    Succeeded,
    Exhausted,
    CleanupOffered,
    CleanupRun,
    CleanupSkipped,
    Terminated
};

const char* ToString(RetryState state);

struct RetryPolicy {
    unsigned attempts{1};
    std::chrono::seconds backoff{2};
};

class Retrier {
public:
    using Operation = std::function<Result()>;
    using Sleeper = std::function<void(std::chrono::seconds)>;
    using CleanupHook = std::function<void()>;

    explicit Retrier(RetryPolicy policy, Sleeper sleeper = {});

    // Consulted by Run() once the attempt ceiling is exhausted. prompt may be
    // null, which reads as a declined confirmation.
    void SetEscalation(DeletePolicy policy, IPrompt* prompt, CleanupHook cleanup);

    // Up to policy.attempts calls of op; returns the last result.
    Result Attempt(const Operation& op);

    // Attempt(), then on exhaustion: report, offer cleanup, throw
    // FatalExecutionError.
    void Run(const Operation& op);

    RetryState state() const { return state_; }
    unsigned last_attempts() const { return last_attempts_; }
    bool in_cleanup() const { return in_cleanup_; }
    const RetryPolicy& policy() const { return policy_; }

private:
    [[noreturn]] void Escalate(const Result& last);
    bool DecideCleanup();

    RetryPolicy policy_;
    Sleeper sleeper_;

    DeletePolicy delete_policy_{DeletePolicy::Ask};
    IPrompt* prompt_{nullptr};
    CleanupHook cleanup_;

    RetryState state_{RetryState::Idle};
    unsigned last_attempts_{0};
    bool in_cleanup_{false};
};

} // namespace ferry
