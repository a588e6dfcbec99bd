#pragma once

#include "ferry/result.hpp"

#include <string>
#include <vector>

namespace ferry {

class IProcessRunner {
public:
    virtual ~IProcessRunner() = default;

    // Runs argv to completion. ok iff the exit status is 0; code carries the
    // exit status (128 + signal number when the child was killed).
    virtual Result Run(const std::vector<std::string>& argv) = 0;
};

// fork/execvp based runner. Child output streams to our stdout/stderr; stdin
// is /dev/null so ssh never swallows input meant for the confirmation prompt.
class ProcessRunner final : public IProcessRunner {
public:
    Result Run(const std::vector<std::string>& argv) override;
};

} // namespace ferry
