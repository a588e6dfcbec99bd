#pragma once

#include <stdexcept>
#include <string>
#include <utility>

namespace ferry {

struct ConfigError : public std::runtime_error {
    using std::runtime_error::runtime_error;
};

struct CollisionError : public std::runtime_error {
    using std::runtime_error::runtime_error;
};

// Raised by the retry layer once the attempt ceiling is exhausted.
struct FatalExecutionError : public std::runtime_error {
    FatalExecutionError(std::string command, unsigned attempts)
        : std::runtime_error("Command failed after " + std::to_string(attempts) +
                             " attempt(s): " + command),
          command_(std::move(command)),
          attempts_(attempts) {}

    const std::string& Command() const { return command_; }
    unsigned Attempts() const { return attempts_; }

private:
    std::string command_;
    unsigned attempts_;
};

} // namespace ferry
