#include "ferry/types.hpp"

namespace ferry {

const char* ToString(ArtifactKind kind) {
    switch (kind) {
        case ArtifactKind::Image: return "image";
        case ArtifactKind::Volume: return "volume";
    }
    return "unknown";
}

const char* ToString(DeletePolicy policy) {
    switch (policy) {
        case DeletePolicy::Ask: return "ask";
        case DeletePolicy::Always: return "always";
        case DeletePolicy::Never: return "never";
    }
    return "unknown";
}

const char* ToString(EndpointRole role) {
    switch (role) {
        case EndpointRole::Source: return "source";
        case EndpointRole::Destination: return "destination";
        case EndpointRole::Local: return "local";
    }
    return "unknown";
}

const char* ToString(PathKind kind) {
    switch (kind) {
        case PathKind::File: return "file";
        case PathKind::ChunkDir: return "chunk-dir";
    }
    return "unknown";
}

std::optional<ArtifactKind> ParseArtifactKind(std::string_view s) {
    if (s == "image") return ArtifactKind::Image;
    if (s == "volume") return ArtifactKind::Volume;
    return std::nullopt;
}

std::optional<DeletePolicy> ParseDeletePolicy(std::string_view s) {
    if (s == "ask") return DeletePolicy::Ask;
    if (s == "always") return DeletePolicy::Always;
    if (s == "never") return DeletePolicy::Never;
    return std::nullopt;
}

} // namespace ferry
