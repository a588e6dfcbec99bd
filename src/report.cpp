#include "ferry/report.hpp"

#include "ferry/logger.hpp"

#include <fstream>
#include <nlohmann/json.hpp>

namespace ferry {

namespace {

const char* YesNo(bool b) { return b ? "true" : "false"; }

std::string Where(const EndpointConfig& ep) {
    return ep.local ? std::string("<local>") : ep.host;
}

nlohmann::json RecordsToJson(const std::vector<ArtifactRecord>& records) {
    nlohmann::json arr = nlohmann::json::array();
    for (const auto& r : records) {
        arr.push_back({
            {"role", ToString(r.role)},
            {"kind", ToString(r.kind)},
            {"path", r.path},
            {"order", r.order},
        });
    }
    return arr;
}

void PrintRole(std::FILE* out, const char* heading, const EndpointConfig* ep,
               const std::vector<ArtifactRecord>& records) {
    if (records.empty()) return;

    std::fprintf(out, "%s\n", heading);
    for (PathKind kind : {PathKind::File, PathKind::ChunkDir}) {
        for (const auto& r : records) {
            if (r.kind != kind) continue;
            const std::string shown = (ep && !ep->local) ? ep->host + ":" + r.path : r.path;
            std::fprintf(out, "  %s: %s\n", kind == PathKind::File ? "FILE" : "CHUNK DIR", shown.c_str());
        }
    }
    std::fprintf(out, "\n");
}

} // namespace

const char* ToString(RunOutcome outcome) {
    switch (outcome) {
        case RunOutcome::Success: return "success";
        case RunOutcome::Collision: return "collision";
        case RunOutcome::Failed: return "failed";
    }
    return "unknown";
}

void PrintConfigBanner(const TransferConfig& cfg, std::FILE* out) {
    std::fprintf(out, "Mode          : %s\n", ToString(cfg.kind));
    std::fprintf(out, "Object        : %s\n", cfg.name.c_str());
    std::fprintf(out, "Source host   : %s (port %u)\n", Where(cfg.source).c_str(), (unsigned)cfg.source.port);
    std::fprintf(out, "Dest host     : %s (port %u)\n", Where(cfg.destination).c_str(), (unsigned)cfg.destination.port);
    std::fprintf(out, "Source tmp    : %s\n", cfg.source.tmp_path.c_str());
    std::fprintf(out, "Dest tmp      : %s\n", cfg.destination.tmp_path.c_str());
    std::fprintf(out, "Local workdir : %s\n", cfg.workdir.c_str());
    std::fprintf(out, "SRC docker sudo : %s\n", YesNo(cfg.source.docker_become));
    std::fprintf(out, "DST docker sudo : %s\n", YesNo(cfg.destination.docker_become));
    std::fprintf(out, "Local as src  : %s\n", YesNo(cfg.source.local));
    std::fprintf(out, "Local as dst  : %s\n", YesNo(cfg.destination.local));
    std::fprintf(out, "Chunking      : %s\n", YesNo(cfg.ChunkingEnabled()));
    if (cfg.ChunkingEnabled()) {
        if (cfg.chunk_size_bytes % kGiB == 0) {
            std::fprintf(out, "Chunk size    : %llu GiB (%llu bytes)\n",
                         (unsigned long long)(cfg.chunk_size_bytes / kGiB),
                         (unsigned long long)cfg.chunk_size_bytes);
        } else {
            std::fprintf(out, "Chunk size    : %llu bytes\n", (unsigned long long)cfg.chunk_size_bytes);
        }
    }
    std::fprintf(out, "Retry attempts: %u\n", cfg.retry_attempts);
    std::fprintf(out, "Auto delete   : %s\n", ToString(cfg.delete_policy));
    std::fprintf(out, "\n");
    std::fflush(out);
}

void PrintCreatedPaths(const TransferConfig& cfg, const ArtifactRegistry& registry, std::FILE* out) {
    const std::string src_heading = cfg.source.local
        ? std::string("On SOURCE (local machine):")
        : "On SOURCE host (" + cfg.source.host + "):";
    const std::string dst_heading = "On DEST host (" + Where(cfg.destination) + "):";

    PrintRole(out, src_heading.c_str(), &cfg.source, registry.AllFor(EndpointRole::Source));
    PrintRole(out, dst_heading.c_str(), &cfg.destination, registry.AllFor(EndpointRole::Destination));
    PrintRole(out, "On LOCAL machine (workdir artifacts):", nullptr, registry.AllFor(EndpointRole::Local));
    std::fflush(out);
}

void PrintSummary(const TransferConfig& cfg, const ArtifactRegistry& registry, std::FILE* out) {
    std::fprintf(out, "\n==================================================\n");
    std::fprintf(out, "Transfer complete. The following artifact paths were created:\n\n");
    PrintCreatedPaths(cfg, registry, out);
}

std::string RenderJsonReport(const TransferConfig& cfg,
                             const TransferState& state,
                             const ArtifactRegistry& registry,
                             const RunReport& run) {
    nlohmann::json j;
    j["kind"] = ToString(cfg.kind);
    j["name"] = cfg.name;
    j["timestamp"] = state.timestamp;
    j["outcome"] = ToString(run.outcome);
    if (!run.error.empty()) j["error"] = run.error;

    j["source"] = {{"host", Where(cfg.source)}, {"tmp_path", cfg.source.tmp_path}};
    j["destination"] = {{"host", Where(cfg.destination)}, {"tmp_path", cfg.destination.tmp_path}};
    j["workdir"] = cfg.workdir;
    j["chunk_size_bytes"] = cfg.chunk_size_bytes;
    j["records"] = RecordsToJson(registry.All());

    if (run.cleanup) {
        j["cleanup"] = {
            {"ran", run.cleanup->ran},
            {"deleted", RecordsToJson(run.cleanup->deleted)},
            {"refused", RecordsToJson(run.cleanup->refused)},
            {"failed", RecordsToJson(run.cleanup->failed)},
        };
    }
    return j.dump(2);
}

void WriteJsonReport(const std::string& path,
                     const TransferConfig& cfg,
                     const TransferState& state,
                     const ArtifactRegistry& registry,
                     const RunReport& run) {
    std::ofstream ofs(path, std::ios::trunc);
    if (!ofs) {
        LogWarn("Cannot write report file: %s", path.c_str());
        return;
    }
    ofs << RenderJsonReport(cfg, state, registry, run) << "\n";
    if (!ofs) {
        LogWarn("Failed writing report file: %s", path.c_str());
        return;
    }
    LogDebug("report written to %s", path.c_str());
}

} // namespace ferry
