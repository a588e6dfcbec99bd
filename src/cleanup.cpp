#include "ferry/cleanup.hpp"

#include "ferry/logger.hpp"

#include <filesystem>

namespace fs = std::filesystem;

namespace ferry {

namespace {

fs::path Normalize(const std::string& p) {
    std::string s = fs::path(p).lexically_normal().string();
    while (s.size() > 1 && s.back() == '/') s.pop_back();
    return fs::path(s);
}

std::string Label(EndpointRole role, PathKind kind) {
    std::string label = ToString(role);
    if (role == EndpointRole::Destination) label = "dest";
    label += kind == PathKind::ChunkDir ? " chunk dir" : " file";
    return label;
}

} // namespace

bool CleanupCoordinator::IsContained(const std::string& path, const std::string& base) {
    if (path.empty() || base.empty()) return false;
    if (path.front() != '/' || base.front() != '/') return false;

    const fs::path rel = Normalize(path).lexically_relative(Normalize(base));
    if (rel.empty() || rel == ".") return false;

    const auto first = *rel.begin();
    return first != "..";
}

const std::string& CleanupCoordinator::BaseFor(EndpointRole role) const {
    switch (role) {
        case EndpointRole::Source: return config_.source.tmp_path;
        case EndpointRole::Destination: return config_.destination.tmp_path;
        case EndpointRole::Local: break;
    }
    return config_.workdir;
}

bool CleanupCoordinator::Decide(CleanupTrigger trigger) {
    if (trigger == CleanupTrigger::Escalation) return true;

    switch (config_.delete_policy) {
        case DeletePolicy::Always:
            return true;
        case DeletePolicy::Never:
            return false;
        case DeletePolicy::Ask:
            break;
    }
    if (!prompt_) return false;
    return prompt_->Confirm(
        "Do you want to delete temporary artifacts (tar files and chunk dirs) on src/dst/local?", false);
}

CleanupReport CleanupCoordinator::Run(const ArtifactRegistry& registry, CleanupTrigger trigger) {
    CleanupReport report;
    if (registry.Empty()) {
        return report;
    }

    if (!Decide(trigger)) {
        LogInfo("Skipping deletion of temporary artifacts.");
        return report;
    }

    report.ran = true;
    LogInfo(">>> Deleting temporary artifacts ...");

    for (EndpointRole role : {EndpointRole::Local, EndpointRole::Source, EndpointRole::Destination}) {
        RemoveAll(registry, role, PathKind::File, report);
        RemoveAll(registry, role, PathKind::ChunkDir, report);
    }

    if (report.refused.empty() && report.failed.empty()) {
        LogInfo(">>> Temporary artifacts cleanup attempt completed.");
    } else {
        LogWarn(">>> Temporary artifacts cleanup attempt completed with %zu refusal(s) and %zu failure(s).",
                report.refused.size(), report.failed.size());
    }
    return report;
}

void CleanupCoordinator::RemoveAll(const ArtifactRegistry& registry, EndpointRole role, PathKind kind,
                                   CleanupReport& report) {
    const std::string& base = BaseFor(role);
    const std::string label = Label(role, kind);
    const Host& host = transport_.HostFor(role);

    for (const auto& rec : registry.AllFor(role, kind)) {
        const std::string shown = host.Qualify(rec.path);

        if (!IsContained(rec.path, base)) {
            LogWarn("Refusing to delete %s outside %s: %s", label.c_str(), base.c_str(), shown.c_str());
            report.refused.push_back(rec);
            continue;
        }

        auto r = transport_.Remove(role, rec.path, kind);
        if (!r.is_ok()) {
            LogWarn("Failed to delete %s %s: %s", label.c_str(), shown.c_str(), r.msg.c_str());
            report.failed.push_back(rec);
            continue;
        }

        LogDebug("deleted %s %s", label.c_str(), shown.c_str());
        report.deleted.push_back(rec);
    }
}

} // namespace ferry
