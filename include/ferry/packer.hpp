#pragma once

#include "ferry/config.hpp"
#include "ferry/transfer_state.hpp"
#include "ferry/transport.hpp"

#include <string>

namespace ferry {

struct PackContext {
    const TransferConfig& config;
    EndpointTransport& transport;
};

// Kind-specific half of a transfer: how the artifact is produced on the
// source and consumed on the destination. Sequencing stays in the pipeline.
class IArtifactPacker {
public:
    virtual ~IArtifactPacker() = default;

    virtual ArtifactKind Kind() const = 0;

    // "tar" or "tar.xz", used in step banners.
    virtual const char* Format() const = 0;

    virtual std::string FileName(const TransferState& state) const = 0;

    // Must leave a single file at source_file on the source endpoint.
    virtual void Produce(PackContext& ctx, const std::string& source_file) = 0;

    // Imports destination_file into the destination's container runtime.
    virtual void Consume(PackContext& ctx, const std::string& destination_file) = 0;
};

class ImagePacker final : public IArtifactPacker {
public:
    ArtifactKind Kind() const override { return ArtifactKind::Image; }
    const char* Format() const override { return "tar"; }
    std::string FileName(const TransferState& state) const override;
    void Produce(PackContext& ctx, const std::string& source_file) override;
    void Consume(PackContext& ctx, const std::string& destination_file) override;
};

class VolumePacker final : public IArtifactPacker {
public:
    ArtifactKind Kind() const override { return ArtifactKind::Volume; }
    const char* Format() const override { return "tar.xz"; }
    std::string FileName(const TransferState& state) const override;
    void Produce(PackContext& ctx, const std::string& source_file) override;
    void Consume(PackContext& ctx, const std::string& destination_file) override;

private:
    void EnsureHelperImage(PackContext& ctx, EndpointRole role);
};

} // namespace ferry
