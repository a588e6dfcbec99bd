#include "ferry/packer.hpp"

#include "ferry/logger.hpp"

#include <filesystem>

namespace ferry {

namespace {

std::string BaseName(const std::string& path) {
    return std::filesystem::path(path).filename().string();
}

std::string DirName(const std::string& path) {
    return std::filesystem::path(path).parent_path().string();
}

} // namespace

// ---------------------------------------------------------------------------
// ImagePacker

std::string ImagePacker::FileName(const TransferState& state) const {
    return "docker-image-" + state.sanitized_name + "-" + state.timestamp + ".tar";
}

void ImagePacker::Produce(PackContext& ctx, const std::string& source_file) {
    LogInfo(">>> Exporting Docker image on source via docker save ...");
    ctx.transport.RunOnSource(
        cmd::DockerSave(ctx.config.name, source_file, ctx.config.source.docker_become));
}

void ImagePacker::Consume(PackContext& ctx, const std::string& destination_file) {
    LogInfo(">>> Importing Docker image on dest via docker load ...");
    ctx.transport.RunOnDestination(
        cmd::DockerLoad(destination_file, ctx.config.destination.docker_become));
}

// ---------------------------------------------------------------------------
// VolumePacker

std::string VolumePacker::FileName(const TransferState& state) const {
    return "docker-volume-" + state.sanitized_name + "-" + state.timestamp + ".tar.xz";
}

void VolumePacker::EnsureHelperImage(PackContext& ctx, EndpointRole role) {
    const bool become = role == EndpointRole::Source ? ctx.config.source.docker_become
                                                     : ctx.config.destination.docker_become;
    LogDebug("ensuring helper image %s on %s", ctx.config.helper_image.c_str(), ToString(role));
    ctx.transport.RunOn(role, cmd::EnsureHelperImage(ctx.config.helper_image, become));
}

void VolumePacker::Produce(PackContext& ctx, const std::string& source_file) {
    LogInfo(">>> Exporting Docker volume on source via tar (xz compressed) ...");
    EnsureHelperImage(ctx, EndpointRole::Source);
    ctx.transport.RunOnSource(cmd::DockerVolumeExport(ctx.config.helper_image,
                                                      ctx.config.name,
                                                      DirName(source_file),
                                                      BaseName(source_file),
                                                      ctx.config.source.docker_become));
}

void VolumePacker::Consume(PackContext& ctx, const std::string& destination_file) {
    const bool become = ctx.config.destination.docker_become;

    LogInfo(">>> Creating Docker volume on dest if it does not exist ...");
    ctx.transport.RunOnDestination(cmd::DockerVolumeCreate(ctx.config.name, become));

    LogInfo(">>> Importing data into Docker volume on dest via tar xJvf ...");
    EnsureHelperImage(ctx, EndpointRole::Destination);
    ctx.transport.RunOnDestination(cmd::DockerVolumeImport(ctx.config.helper_image,
                                                           ctx.config.name,
                                                           DirName(destination_file),
                                                           BaseName(destination_file),
                                                           become));
}

} // namespace ferry
