#include "ferry/retry.hpp"

#include "ferry/errors.hpp"
#include "ferry/logger.hpp"

#include <thread>

namespace ferry {

namespace {

class CleanupGuard {
public:
    explicit CleanupGuard(bool& flag) : flag_(flag) { flag_ = true; }
    ~CleanupGuard() { flag_ = false; }
    CleanupGuard(const CleanupGuard&) = delete;
    CleanupGuard& operator=(const CleanupGuard&) = delete;

private:
    bool& flag_;
};

} // namespace

const char* ToString(RetryState state) {
    switch (state) {
        case RetryState::Idle: return "idle";
        case RetryState::Attempting: return "attempting";
        case RetryState::Retrying: return "retrying";
        case RetryState::Succeeded: return "succeeded";
        case RetryState::Exhausted: return "exhausted";
        case RetryState::CleanupOffered: return "cleanup-offered";
        case RetryState::CleanupRun: return "cleanup-run";
        case RetryState::CleanupSkipped: return "cleanup-skipped";
        case RetryState::Terminated: return "terminated";
    }
    return "unknown";
}

Retrier::Retrier(RetryPolicy policy, Sleeper sleeper)
    : policy_(policy), sleeper_(std::move(sleeper)) {
    if (policy_.attempts == 0) policy_.attempts = 1;
    if (!sleeper_) {
        sleeper_ = [](std::chrono::seconds d) { std::this_thread::sleep_for(d); };
    }
}

void Retrier::SetEscalation(DeletePolicy policy, IPrompt* prompt, CleanupHook cleanup) {
    delete_policy_ = policy;
    prompt_ = prompt;
    cleanup_ = std::move(cleanup);
}

Result Retrier::Attempt(const Operation& op) {
    const unsigned attempts = policy_.attempts;
    Result last = Result::Fail(-1, "operation not attempted");

    for (unsigned attempt = 1; attempt <= attempts; ++attempt) {
        state_ = RetryState::Attempting;
        last_attempts_ = attempt;

        last = op();
        if (last.is_ok()) {
            state_ = RetryState::Succeeded;
            return last;
        }

        if (attempt < attempts) {
            state_ = RetryState::Retrying;
            LogWarn("Command failed (attempt %u/%u), retrying in %lld seconds...",
                    attempt, attempts, (long long)policy_.backoff.count());
            sleeper_(policy_.backoff);
        }
    }

    state_ = RetryState::Exhausted;
    return last;
}

void Retrier::Run(const Operation& op) {
    auto r = Attempt(op);
    if (r.is_ok()) return;
    Escalate(r);
}

bool Retrier::DecideCleanup() {
    switch (delete_policy_) {
        case DeletePolicy::Always:
            return true;
        case DeletePolicy::Never:
            return false;
        case DeletePolicy::Ask:
            break;
    }
    if (!prompt_) return false;
    return prompt_->Confirm("Attempt to clean up temporary artifacts now?", false);
}

void Retrier::Escalate(const Result& last) {
    const std::string command = last.msg.empty() ? std::string("<unknown command>") : last.msg;
    const unsigned attempts = last_attempts_;

    state_ = RetryState::Exhausted;
    LogError("Command failed after %u attempt(s): %s", attempts, command.c_str());
    LogWarn("Temporary artifacts may remain on source/destination/local.");

    if (!in_cleanup_ && cleanup_) {
        state_ = RetryState::CleanupOffered;
        if (DecideCleanup()) {
            state_ = RetryState::CleanupRun;
            CleanupGuard guard(in_cleanup_);
            cleanup_();
        } else {
            state_ = RetryState::CleanupSkipped;
            LogWarn("Skipping automatic cleanup.");
        }
    }

    state_ = RetryState::Terminated;
    throw FatalExecutionError(command, attempts);
}

} // namespace ferry
