#pragma once

#include <istream>
#include <ostream>
#include <string>

namespace ferry {

class IPrompt {
public:
    virtual ~IPrompt() = default;

    // Returns default_answer when no answer can be read.
    virtual bool Confirm(const std::string& question, bool default_answer) = 0;
};

// Reads a y/yes (case-insensitive) answer from a stream.
class StreamPrompt final : public IPrompt {
public:
    StreamPrompt(std::istream& in, std::ostream& out) : in_(in), out_(out) {}

    bool Confirm(const std::string& question, bool default_answer) override;

private:
    std::istream& in_;
    std::ostream& out_;
};

} // namespace ferry
