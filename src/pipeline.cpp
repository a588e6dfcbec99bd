#include "ferry/pipeline.hpp"

#include "ferry/errors.hpp"
#include "ferry/logger.hpp"

namespace ferry {

void TransferPipeline::Run() {
    switch (config_.kind) {
        case ArtifactKind::Image:
            TransferImage();
            return;
        case ArtifactKind::Volume:
            TransferVolume();
            return;
    }
}

void TransferPipeline::TransferImage() {
    ImagePacker packer;
    Transfer(packer);
    LogSuccess("Docker image transfer completed successfully.");
}

void TransferPipeline::TransferVolume() {
    VolumePacker packer;
    Transfer(packer);
    LogSuccess("Docker volume transfer completed successfully.");
}

void TransferPipeline::Transfer(IArtifactPacker& packer) {
    paths_ = ResolvePaths(config_, state_, packer.FileName(state_));

    PrepareSource();

    PackContext ctx{config_, transport_};
    packer.Produce(ctx, paths_.source_file);
    registry_.Register(EndpointRole::Source, PathKind::File, paths_.source_file);
    MakeSourceReadable();

    if (config_.ChunkingEnabled()) {
        TransferChunked(packer.Format());
    } else {
        TransferDirect(packer.Format());
    }

    packer.Consume(ctx, paths_.destination_file);
}

void TransferPipeline::PrepareSource() {
    LogInfo(">>> Preparing source tmp directory ...");
    transport_.MakeDirectories(EndpointRole::Source, config_.source.tmp_path);

    // The staging area is the operator's directory; it is never registered.
    transport_.MakeDirectories(EndpointRole::Local, config_.workdir);

    LogInfo(">>> Ensuring source artifact does not already exist: %s", paths_.source_file.c_str());
    EnsureAbsent(EndpointRole::Source, paths_.source_file, "Source artifact file");
}

void TransferPipeline::MakeSourceReadable() {
    auto r = transport_.RunOnce(EndpointRole::Source,
                                cmd::MakeWorldReadable(paths_.source_file, config_.source.docker_become));
    if (!r.is_ok()) {
        LogDebug("chmod 644 on %s failed, continuing: %s", paths_.source_file.c_str(), r.msg.c_str());
    }
}

void TransferPipeline::TransferChunked(const char* format) {
    const bool local_source = transport_.HostFor(EndpointRole::Source).IsLocal();
    const std::string dst_name = transport_.HostFor(EndpointRole::Destination).Name();

    LogInfo(">>> Creating chunks directory and splitting %s on source ...", format);
    EnsureAbsent(EndpointRole::Source, paths_.source_chunk_dir, "Source chunk directory");
    transport_.MakeDirectories(EndpointRole::Source, paths_.source_chunk_dir);
    registry_.Register(EndpointRole::Source, PathKind::ChunkDir, paths_.source_chunk_dir);
    transport_.Split(EndpointRole::Source, paths_.source_file, paths_.source_chunk_dir,
                     config_.chunk_size_bytes);

    EnsureAbsent(EndpointRole::Local, paths_.local_chunk_dir, "Local chunk directory");
    LogInfo(local_source ? ">>> Copying chunks directory from source tmp -> local workdir ..."
                         : ">>> rsync chunks directory from source -> local ...");
    transport_.CopyFromSource(paths_.source_chunk_dir, paths_.local_chunk_dir, PathKind::ChunkDir);
    registry_.Register(EndpointRole::Local, PathKind::ChunkDir, paths_.local_chunk_dir);

    LogInfo(">>> Preparing dest tmp directory and chunks dir on %s ...", dst_name.c_str());
    EnsureAbsent(EndpointRole::Destination, paths_.destination_chunk_dir, "Dest chunk directory");
    transport_.MakeDirectories(EndpointRole::Destination, paths_.destination_chunk_dir);
    registry_.Register(EndpointRole::Destination, PathKind::ChunkDir, paths_.destination_chunk_dir);

    LogInfo(">>> rsync chunks directory from local -> dest ...");
    transport_.CopyToDestination(paths_.local_chunk_dir, paths_.destination_chunk_dir, PathKind::ChunkDir);

    LogInfo(">>> Ensuring dest %s file does not already exist: %s", format, paths_.destination_file.c_str());
    EnsureAbsent(EndpointRole::Destination, paths_.destination_file, "Dest artifact file");

    LogInfo(">>> Reassembling %s on dest via cat ...", format);
    transport_.Join(EndpointRole::Destination, paths_.destination_chunk_dir, paths_.destination_file);
    registry_.Register(EndpointRole::Destination, PathKind::File, paths_.destination_file);
}

void TransferPipeline::TransferDirect(const char* format) {
    const bool local_source = transport_.HostFor(EndpointRole::Source).IsLocal();
    const std::string dst_name = transport_.HostFor(EndpointRole::Destination).Name();

    LogInfo(">>> Ensuring local artifact does not already exist: %s", paths_.local_file.c_str());
    EnsureAbsent(EndpointRole::Local, paths_.local_file, "Local artifact file");

    if (local_source) {
        LogInfo(">>> Copying %s from source tmp -> local workdir ...", format);
    } else {
        LogInfo(">>> rsync %s from source -> local ...", format);
    }
    transport_.CopyFromSource(paths_.source_file, paths_.local_file, PathKind::File);
    registry_.Register(EndpointRole::Local, PathKind::File, paths_.local_file);

    LogInfo(">>> Preparing dest tmp directory on %s ...", dst_name.c_str());
    transport_.MakeDirectories(EndpointRole::Destination, config_.destination.tmp_path);

    LogInfo(">>> Ensuring dest artifact does not already exist: %s", paths_.destination_file.c_str());
    EnsureAbsent(EndpointRole::Destination, paths_.destination_file, "Dest artifact file");

    LogInfo(">>> rsync %s from local -> dest ...", format);
    transport_.CopyToDestination(paths_.local_file, paths_.destination_file, PathKind::File);
    registry_.Register(EndpointRole::Destination, PathKind::File, paths_.destination_file);
}

void TransferPipeline::EnsureAbsent(EndpointRole role, const std::string& path, const char* what) {
    if (!transport_.Exists(role, path)) return;

    const std::string shown = transport_.HostFor(role).Qualify(path);
    throw CollisionError(std::string(what) + " already exists: " + shown);
}

} // namespace ferry
