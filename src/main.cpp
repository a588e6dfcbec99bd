#include "ferry/cli_options.hpp"
#include "ferry/errors.hpp"
#include "ferry/logger.hpp"
#include "ferry/migration_manager.hpp"
#include "ferry/process_runner.hpp"
#include "ferry/prompt.hpp"

#include <cstdio>
#include <exception>
#include <iostream>

int main(int argc, char **argv) {
    ferry::CliParse cli;
    try {
        cli = ferry::ParseCommandLine(argc, argv);
    } catch (const ferry::ConfigError& e) {
        ferry::PrintUsage(argv[0]);
        std::fprintf(stderr, "\nERROR: %s\n", e.what());
        return 1;
    }

    if (cli.show_help) {
        ferry::PrintUsage(argv[0], stdout);
        return 0;
    }

    ferry::SetVerbose(cli.config.verbose);

    ferry::ProcessRunner runner;
    ferry::StreamPrompt prompt(std::cin, std::cout);

    try {
        ferry::MigrationManager manager(cli.config, runner, &prompt);
        return manager.Run();
    } catch (const ferry::ConfigError& e) {
        ferry::PrintUsage(argv[0]);
        std::fprintf(stderr, "\nERROR: %s\n", e.what());
        return 1;
    } catch (const std::exception& e) {
        ferry::LogError("%s", e.what());
        return 1;
    }
}
