#include "ferry/artifact_registry.hpp"

#include "ferry/logger.hpp"

namespace ferry {

const ArtifactRecord& ArtifactRegistry::Register(EndpointRole role, PathKind kind, const std::string& path) {
    records_.push_back(ArtifactRecord{role, kind, path, records_.size()});
    LogDebug("registered %s %s: %s", ToString(role), ToString(kind), path.c_str());
    return records_.back();
}

std::vector<ArtifactRecord> ArtifactRegistry::AllFor(EndpointRole role) const {
    std::vector<ArtifactRecord> out;
    for (const auto& r : records_) {
        if (r.role == role) out.push_back(r);
    }
    return out;
}

std::vector<ArtifactRecord> ArtifactRegistry::AllFor(EndpointRole role, PathKind kind) const {
    std::vector<ArtifactRecord> out;
    for (const auto& r : records_) {
        if (r.role == role && r.kind == kind) out.push_back(r);
    }
    return out;
}

} // namespace ferry
