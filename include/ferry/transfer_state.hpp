#pragma once

#include "ferry/config.hpp"

#include <ctime>
#include <string>
#include <string_view>

namespace ferry {

// Per-run naming state. Every generated filename carries the same
// timestamp so concurrent or repeated runs never share paths.
struct TransferState {
    std::string timestamp;        // YYYYmmddHHMMSS, local time
    std::string sanitized_name;   // '/' and ':' replaced by '_'

    static TransferState Create(const TransferConfig& cfg, std::time_t now);

    std::string ChunkDirName() const;
};

// Where one artifact lives on each side of the transfer.
struct ArtifactPaths {
    std::string file_name;

    std::string source_file;
    std::string local_file;
    std::string destination_file;

    std::string source_chunk_dir;
    std::string local_chunk_dir;
    std::string destination_chunk_dir;
};

ArtifactPaths ResolvePaths(const TransferConfig& cfg, const TransferState& state,
                           const std::string& file_name);

std::string SanitizeName(std::string_view name);
std::string MakeTimestamp(std::time_t now);
std::string JoinPath(const std::string& dir, const std::string& name);

} // namespace ferry
