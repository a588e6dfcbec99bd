#include "ferry/transfer_state.hpp"

#include <filesystem>

namespace ferry {

std::string SanitizeName(std::string_view name) {
    std::string out(name);
    for (char& c : out) {
        if (c == '/' || c == ':') c = '_';
    }
    return out;
}

std::string MakeTimestamp(std::time_t now) {
    std::tm tm{};
    ::localtime_r(&now, &tm);
    char buf[32];
    const size_t n = std::strftime(buf, sizeof(buf), "%Y%m%d%H%M%S", &tm);
    return std::string(buf, n);
}

std::string JoinPath(const std::string& dir, const std::string& name) {
    return (std::filesystem::path(dir) / name).lexically_normal().string();
}

TransferState TransferState::Create(const TransferConfig& cfg, std::time_t now) {
    TransferState s;
    s.timestamp = MakeTimestamp(now);
    s.sanitized_name = SanitizeName(cfg.name);
    return s;
}

std::string TransferState::ChunkDirName() const {
    return "docker-chunks-" + sanitized_name + "-" + timestamp;
}

ArtifactPaths ResolvePaths(const TransferConfig& cfg, const TransferState& state,
                           const std::string& file_name) {
    ArtifactPaths p;
    p.file_name = file_name;

    p.source_file = JoinPath(cfg.source.tmp_path, file_name);
    p.local_file = JoinPath(cfg.workdir, file_name);
    p.destination_file = JoinPath(cfg.destination.tmp_path, file_name);

    const std::string chunks = state.ChunkDirName();
    p.source_chunk_dir = JoinPath(cfg.source.tmp_path, chunks);
    p.local_chunk_dir = JoinPath(cfg.workdir, chunks);
    p.destination_chunk_dir = JoinPath(cfg.destination.tmp_path, chunks);
    return p;
}

} // namespace ferry
