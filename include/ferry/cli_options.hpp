#pragma once

#include "ferry/config.hpp"

#include <cstdio>

namespace ferry {

struct CliParse {
    TransferConfig config;
    bool show_help{false};
};

// Parses and validates argv. Throws ConfigError on any invalid input; the
// caller prints usage. `--config <file>` values are applied first and
// explicit flags override them.
CliParse ParseCommandLine(int argc, char** argv);

void PrintUsage(const char* argv0, std::FILE* out = stderr);

} // namespace ferry
