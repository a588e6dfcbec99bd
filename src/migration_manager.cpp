#include "ferry/migration_manager.hpp"

#include "ferry/errors.hpp"
#include "ferry/logger.hpp"

#include <cstdio>

namespace ferry {

namespace {

TransferConfig Validated(TransferConfig cfg) {
    ValidateConfig(cfg);
    return cfg;
}

EndpointConfig LocalStaging() {
    EndpointConfig ep;
    ep.local = true;
    return ep;
}

} // namespace

MigrationManager::MigrationManager(TransferConfig config, IProcessRunner& runner, IPrompt* prompt)
    : MigrationManager(std::move(config), runner, prompt, Options{}) {}

MigrationManager::MigrationManager(TransferConfig config, IProcessRunner& runner, IPrompt* prompt,
                                   Options opt)
    : config_(Validated(std::move(config))),
      opt_(std::move(opt)),
      state_(TransferState::Create(config_, opt_.now != 0 ? opt_.now : std::time(nullptr))),
      source_(MakeHost(config_.source, runner)),
      destination_(MakeHost(config_.destination, runner)),
      local_(MakeHost(LocalStaging(), runner)),
      retrier_(RetryPolicy{config_.retry_attempts, std::chrono::seconds(2)}, opt_.sleeper),
      transport_(*source_, *destination_, *local_, retrier_),
      cleanup_(config_, transport_, prompt),
      pipeline_(config_, state_, transport_, registry_) {
    retrier_.SetEscalation(config_.delete_policy, prompt, [this] {
        run_report_.cleanup = cleanup_.Run(registry_, CleanupTrigger::Escalation);
    });
}

int MigrationManager::Run() {
    if (opt_.print_banner) PrintConfigBanner(config_);

    try {
        pipeline_.Run();
    } catch (const CollisionError& e) {
        LogError("%s", e.what());
        run_report_.outcome = RunOutcome::Collision;
        run_report_.error = e.what();
        if (!registry_.Empty()) {
            LogWarn("Artifacts created before the collision were left in place:");
            PrintCreatedPaths(config_, registry_);
        }
        Finish();
        return 1;
    } catch (const FatalExecutionError& e) {
        // Already reported by the retry layer, cleanup offer included.
        run_report_.outcome = RunOutcome::Failed;
        run_report_.error = e.what();
        Finish();
        return 1;
    }

    run_report_.outcome = RunOutcome::Success;
    PrintSummary(config_, registry_);
    run_report_.cleanup = cleanup_.Run(registry_, CleanupTrigger::Completion);

    std::printf("==================================================\nDone.\n");
    std::fflush(stdout);
    Finish();
    return 0;
}

void MigrationManager::Finish() {
    if (config_.report_path.empty()) return;
    WriteJsonReport(config_.report_path, config_, state_, registry_, run_report_);
}

} // namespace ferry
