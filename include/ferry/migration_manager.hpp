#pragma once

#include "ferry/artifact_registry.hpp"
#include "ferry/cleanup.hpp"
#include "ferry/config.hpp"
#include "ferry/host.hpp"
#include "ferry/pipeline.hpp"
#include "ferry/process_runner.hpp"
#include "ferry/prompt.hpp"
#include "ferry/report.hpp"
#include "ferry/retry.hpp"
#include "ferry/transfer_state.hpp"
#include "ferry/transport.hpp"

#include <ctime>
#include <memory>
#include <optional>

namespace ferry {

// Owns one run: validated config, hosts, retry machine, registry, pipeline
// and cleanup. Nothing here is process-wide state.
class MigrationManager {
public:
    struct Options {
        std::time_t now = 0;                // 0 => current time
        Retrier::Sleeper sleeper;           // empty => real sleep
        bool print_banner = true;
    };

    // Throws ConfigError before any host is touched.
    MigrationManager(TransferConfig config, IProcessRunner& runner, IPrompt* prompt);
    MigrationManager(TransferConfig config, IProcessRunner& runner, IPrompt* prompt, Options opt);

    MigrationManager(const MigrationManager&) = delete;
    MigrationManager& operator=(const MigrationManager&) = delete;

    // 0 on success, 1 on collision or exhausted retries.
    int Run();

    const TransferConfig& config() const { return config_; }
    const TransferState& state() const { return state_; }
    const ArtifactRegistry& registry() const { return registry_; }
    const RunReport& run_report() const { return run_report_; }

private:
    void Finish();

    const TransferConfig config_;
    const Options opt_;
    TransferState state_;

    std::unique_ptr<Host> source_;
    std::unique_ptr<Host> destination_;
    std::unique_ptr<Host> local_;

    Retrier retrier_;
    ArtifactRegistry registry_;
    EndpointTransport transport_;
    CleanupCoordinator cleanup_;
    TransferPipeline pipeline_;

    RunReport run_report_;
};

} // namespace ferry
