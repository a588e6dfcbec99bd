#pragma once

#include "ferry/artifact_registry.hpp"
#include "ferry/config.hpp"
#include "ferry/packer.hpp"
#include "ferry/transfer_state.hpp"
#include "ferry/transport.hpp"

#include <string>

namespace ferry {

// Sequences one transfer: pre-flight, produce, stage, deliver, consume.
// Every path is registered only after the step that created it succeeded.
class TransferPipeline {
public:
    TransferPipeline(const TransferConfig& config,
                     const TransferState& state,
                     EndpointTransport& transport,
                     ArtifactRegistry& registry)
        : config_(config), state_(state), transport_(transport), registry_(registry) {}

    // Dispatches on config.kind.
    void Run();

    void TransferImage();
    void TransferVolume();

    // Shared skeleton; exposed so alternative packers can be driven directly.
    void Transfer(IArtifactPacker& packer);

private:
    void PrepareSource();
    void MakeSourceReadable();
    void TransferChunked(const char* format);
    void TransferDirect(const char* format);

    // Throws CollisionError when path already exists on the role's host.
    void EnsureAbsent(EndpointRole role, const std::string& path, const char* what);

    const TransferConfig& config_;
    const TransferState& state_;
    EndpointTransport& transport_;
    ArtifactRegistry& registry_;
    ArtifactPaths paths_;
};

} // namespace ferry
