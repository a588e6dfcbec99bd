#include "ferry/prompt.hpp"

#include <algorithm>
#include <cctype>

namespace ferry {

bool StreamPrompt::Confirm(const std::string& question, bool default_answer) {
    out_ << question << (default_answer ? " [Y/n]: " : " [y/N]: ") << std::flush;

    std::string line;
    if (!std::getline(in_, line)) {
        out_ << "\n";
        return default_answer;
    }

    line.erase(std::remove_if(line.begin(), line.end(),
                              [](unsigned char c) { return std::isspace(c) != 0; }),
               line.end());
    std::transform(line.begin(), line.end(), line.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (line.empty()) return default_answer;
    if (line == "y" || line == "yes") return true;
    return false;
}

} // namespace ferry
