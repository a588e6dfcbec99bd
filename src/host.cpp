#include "ferry/host.hpp"

#include "ferry/file_chunker.hpp"

#include <cerrno>
#include <filesystem>

namespace fs = std::filesystem;

namespace ferry {

namespace {

std::string WithTrailingSlash(std::string p) {
    if (p.empty() || p.back() != '/') p.push_back('/');
    return p;
}

Result LocalCopy(const std::string& from, const std::string& to, PathKind kind) {
    std::error_code ec;
    if (kind == PathKind::ChunkDir) {
        fs::copy(from, to, fs::copy_options::recursive, ec);
    } else {
        fs::copy_file(from, to, fs::copy_options::none, ec);
    }
    if (ec) {
        return Result::Fail(ec.value(), "copy " + from + " -> " + to + ": " + ec.message());
    }
    return Result::Ok();
}

} // namespace

// ---------------------------------------------------------------------------
// LocalHost

Result LocalHost::Execute(const Command& cmd) {
    return runner_.Run(cmd.FullArgv());
}

Result LocalHost::Probe(const std::string& path, bool& exists) {
    std::error_code ec;
    const auto st = fs::symlink_status(path, ec);
    if (ec && st.type() != fs::file_type::not_found) {
        return Result::Fail(ec.value(), "stat " + path + ": " + ec.message());
    }
    exists = fs::exists(st);
    return Result::Ok();
}

Result LocalHost::MakeDirectories(const std::string& path) {
    std::error_code ec;
    fs::create_directories(path, ec);
    if (ec) {
        return Result::Fail(ec.value(), "mkdir -p " + path + ": " + ec.message());
    }
    return Result::Ok();
}

Result LocalHost::Split(const std::string& file, const std::string& chunk_dir,
                        std::uint64_t chunk_bytes) {
    FileChunker chunker(chunk_bytes);
    ChunkSet set;
    return chunker.Split(file, chunk_dir, set);
}

Result LocalHost::Join(const std::string& chunk_dir, const std::string& out_file) {
    return FileChunker::Join(chunk_dir, kChunkPrefix, out_file);
}

Result LocalHost::Remove(const std::string& path, PathKind kind) {
    std::error_code ec;
    if (kind == PathKind::ChunkDir) {
        fs::remove_all(path, ec);
    } else {
        fs::remove(path, ec);
    }
    if (ec && ec != std::errc::no_such_file_or_directory) {
        return Result::Fail(ec.value(), "remove " + path + ": " + ec.message());
    }
    return Result::Ok();
}

Result LocalHost::PullTo(const std::string& path, const std::string& local_path, PathKind kind) {
    return LocalCopy(path, local_path, kind);
}

Result LocalHost::PushFrom(const std::string& local_path, const std::string& path, PathKind kind) {
    return LocalCopy(local_path, path, kind);
}

// ---------------------------------------------------------------------------
// RemoteHost

std::vector<std::string> RemoteHost::SshArgv(const Command& cmd) const {
    return {"ssh", "-p", std::to_string(port_), host_, cmd.ToString()};
}

std::vector<std::string> RemoteHost::RsyncArgv(const std::string& from, const std::string& to) const {
    return {"rsync", "-avz", "--progress", "--partial", "--append-verify",
            "-e", "ssh -p " + std::to_string(port_), from, to};
}

Result RemoteHost::Execute(const Command& cmd) {
    return runner_.Run(SshArgv(cmd));
}

Result RemoteHost::Probe(const std::string& path, bool& exists) {
    auto r = Execute(cmd::TestExists(path));
    if (r.is_ok()) {
        exists = true;
        return r;
    }
    // test(1) exits 1 for "absent"; ssh reserves 255 for its own failures.
    if (r.code == 1) {
        exists = false;
        return Result::Ok();
    }
    return r;
}

Result RemoteHost::MakeDirectories(const std::string& path) {
    return Execute(cmd::MakeDirectories(path));
}

Result RemoteHost::Split(const std::string& file, const std::string& chunk_dir,
                         std::uint64_t chunk_bytes) {
    return Execute(cmd::Split(chunk_bytes, file, chunk_dir));
}

Result RemoteHost::Join(const std::string& chunk_dir, const std::string& out_file) {
    return Execute(cmd::JoinChunks(chunk_dir, out_file));
}

Result RemoteHost::Remove(const std::string& path, PathKind kind) {
    return Execute(cmd::Remove(path, kind));
}

Result RemoteHost::PullTo(const std::string& path, const std::string& local_path, PathKind kind) {
    if (kind == PathKind::ChunkDir) {
        return runner_.Run(RsyncArgv(Qualify(WithTrailingSlash(path)), WithTrailingSlash(local_path)));
    }
    return runner_.Run(RsyncArgv(Qualify(path), local_path));
}

Result RemoteHost::PushFrom(const std::string& local_path, const std::string& path, PathKind kind) {
    if (kind == PathKind::ChunkDir) {
        return runner_.Run(RsyncArgv(WithTrailingSlash(local_path), Qualify(WithTrailingSlash(path))));
    }
    return runner_.Run(RsyncArgv(local_path, Qualify(path)));
}

std::unique_ptr<Host> MakeHost(const EndpointConfig& endpoint, IProcessRunner& runner) {
    if (endpoint.local) {
        return std::make_unique<LocalHost>(runner);
    }
    return std::make_unique<RemoteHost>(runner, endpoint.host, endpoint.port);
}

} // namespace ferry
