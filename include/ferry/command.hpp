#pragma once

#include "ferry/types.hpp"

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace ferry {

// An argv-style command. Quoting happens only when the command is rendered
// for a remote shell or for log output.
struct Command {
    std::vector<std::string> argv;
    bool elevated{false};   // prefix with sudo when executed

    // argv as it will be exec'd, including the sudo prefix.
    std::vector<std::string> FullArgv() const;

    // Single shell-safe line, suitable for `ssh host <line>`.
    std::string ToString() const;
};

std::string ShellQuote(std::string_view s);
std::string RenderShell(const std::vector<std::string>& argv);

namespace cmd {

Command MakeDirectories(const std::string& path);
Command TestExists(const std::string& path);
// chmod 644 that always exits 0; with try_sudo, sudo is tried first.
Command MakeWorldReadable(const std::string& path, bool try_sudo);
Command Remove(const std::string& path, PathKind kind);

// split(1) with the same naming scheme FileChunker uses locally.
Command Split(std::uint64_t chunk_bytes, const std::string& file, const std::string& chunk_dir);
Command JoinChunks(const std::string& chunk_dir, const std::string& out_file);

Command DockerSave(const std::string& image, const std::string& out_file, bool elevated);
Command DockerLoad(const std::string& in_file, bool elevated);
Command DockerVolumeCreate(const std::string& volume, bool elevated);
Command DockerVolumeExport(const std::string& helper_image,
                           const std::string& volume,
                           const std::string& backup_dir,
                           const std::string& file_name,
                           bool elevated);
Command DockerVolumeImport(const std::string& helper_image,
                           const std::string& volume,
                           const std::string& backup_dir,
                           const std::string& file_name,
                           bool elevated);

// Builds the helper image only if `docker image inspect` fails.
Command EnsureHelperImage(const std::string& helper_image, bool elevated);

} // namespace cmd

} // namespace ferry
