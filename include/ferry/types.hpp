#pragma once

#include <optional>
#include <string>
#include <string_view>

namespace ferry {

enum class ArtifactKind { Image, Volume };
enum class DeletePolicy { Ask, Always, Never };
enum class EndpointRole { Source, Destination, Local };
enum class PathKind { File, ChunkDir };

const char* ToString(ArtifactKind kind);
const char* ToString(DeletePolicy policy);
const char* ToString(EndpointRole role);
const char* ToString(PathKind kind);

std::optional<ArtifactKind> ParseArtifactKind(std::string_view s);
std::optional<DeletePolicy> ParseDeletePolicy(std::string_view s);

} // namespace ferry
