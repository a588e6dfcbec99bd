#pragma once

#include "ferry/types.hpp"

#include <cstdint>
#include <string>
#include <string_view>

namespace ferry {

inline constexpr const char* kDefaultTmpPath = "/tmp/migrate-docker-objects";
inline constexpr const char* kDefaultHelperImage = "migrate-docker-objects:latest";
inline constexpr std::uint16_t kDefaultSshPort = 22;
inline constexpr std::uint64_t kGiB = 1024ULL * 1024ULL * 1024ULL;

struct EndpointConfig {
    bool local{false};
    std::string host;                       // user@host, unused when local
    std::uint16_t port{kDefaultSshPort};
    bool docker_become{false};              // run docker through sudo
    std::string tmp_path{kDefaultTmpPath};  // every path created here lives under it
};

struct TransferConfig {
    ArtifactKind kind{ArtifactKind::Image};
    std::string name;

    EndpointConfig source;
    EndpointConfig destination;

    std::string workdir;                    // local staging area
    std::uint64_t chunk_size_bytes{0};      // 0 => chunking disabled
    unsigned retry_attempts{1};
    DeletePolicy delete_policy{DeletePolicy::Ask};

    std::string helper_image{kDefaultHelperImage};
    std::string report_path;                // empty => no JSON report
    bool verbose{false};

    bool ChunkingEnabled() const { return chunk_size_bytes > 0; }
};

// Throws ConfigError describing the first violated rule.
void ValidateConfig(const TransferConfig& cfg);

// Seeds cfg from a JSON document. Keys that are absent leave cfg untouched.
void ApplyConfigJson(std::string_view json_text, TransferConfig& cfg);
void ApplyConfigFile(const std::string& path, TransferConfig& cfg);

} // namespace ferry
