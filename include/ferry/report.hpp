#pragma once

#include "ferry/artifact_registry.hpp"
#include "ferry/cleanup.hpp"
#include "ferry/config.hpp"
#include "ferry/transfer_state.hpp"

#include <cstdio>
#include <optional>
#include <string>

namespace ferry {

enum class RunOutcome { Success, Collision, Failed };

const char* ToString(RunOutcome outcome);

void PrintConfigBanner(const TransferConfig& cfg, std::FILE* out = stdout);

// Lists every created path per role, with host-qualified remote paths.
void PrintCreatedPaths(const TransferConfig& cfg, const ArtifactRegistry& registry, std::FILE* out = stdout);

void PrintSummary(const TransferConfig& cfg, const ArtifactRegistry& registry, std::FILE* out = stdout);

struct RunReport {
    RunOutcome outcome{RunOutcome::Success};
    std::string error;
    std::optional<CleanupReport> cleanup;
};

std::string RenderJsonReport(const TransferConfig& cfg,
                             const TransferState& state,
                             const ArtifactRegistry& registry,
                             const RunReport& run);

// Best-effort; a write failure is logged as a warning.
void WriteJsonReport(const std::string& path,
                     const TransferConfig& cfg,
                     const TransferState& state,
                     const ArtifactRegistry& registry,
                     const RunReport& run);

} // namespace ferry
