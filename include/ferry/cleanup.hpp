#pragma once

#include "ferry/artifact_registry.hpp"
#include "ferry/config.hpp"
#include "ferry/prompt.hpp"
#include "ferry/transport.hpp"

#include <string>
#include <vector>

namespace ferry {

enum class CleanupTrigger {
    Completion,     // end of a successful run; honours the delete policy
    Escalation      // the retry layer already confirmed the cleanup
};

struct CleanupReport {
    bool ran{false};
    std::vector<ArtifactRecord> deleted;
    std::vector<ArtifactRecord> refused;   // outside the declared base directory
    std::vector<ArtifactRecord> failed;
};

// Best-effort, exhaustive removal of registered paths. Never throws for a
// deletion problem; every refusal or failure is logged and reported.
class CleanupCoordinator {
public:
    CleanupCoordinator(const TransferConfig& config, EndpointTransport& transport, IPrompt* prompt)
        : config_(config), transport_(transport), prompt_(prompt) {}

    CleanupReport Run(const ArtifactRegistry& registry, CleanupTrigger trigger);

    // Base directory every registered path of this role must lie under.
    const std::string& BaseFor(EndpointRole role) const;

    // True iff path lies strictly below base, compared component-wise on the
    // lexically normalised absolute forms.
    static bool IsContained(const std::string& path, const std::string& base);

private:
    bool Decide(CleanupTrigger trigger);
    void RemoveAll(const ArtifactRegistry& registry, EndpointRole role, PathKind kind, CleanupReport& report);

    const TransferConfig& config_;
    EndpointTransport& transport_;
    IPrompt* prompt_;
};

} // namespace ferry
