#pragma once

#include "ferry/command.hpp"
#include "ferry/config.hpp"
#include "ferry/process_runner.hpp"
#include "ferry/result.hpp"
#include "ferry/types.hpp"

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace ferry {

// An execution domain: the machine we run on, or a remote machine reached
// over ssh. Every method is a single attempt; retry lives one layer up.
class Host {
public:
    virtual ~Host() = default;

    virtual bool IsLocal() const = 0;

    // "<local>" or user@host.
    virtual std::string Name() const = 0;

    // Path as shown to the operator ("user@host:/path" for remote hosts).
    virtual std::string Qualify(const std::string& path) const = 0;

    virtual Result Execute(const Command& cmd) = 0;

    // ok with `exists` set when the answer is definitive.
    virtual Result Probe(const std::string& path, bool& exists) = 0;

    virtual Result MakeDirectories(const std::string& path) = 0;
    virtual Result Split(const std::string& file, const std::string& chunk_dir,
                         std::uint64_t chunk_bytes) = 0;
    virtual Result Join(const std::string& chunk_dir, const std::string& out_file) = 0;

    // A path that is already gone counts as removed.
    virtual Result Remove(const std::string& path, PathKind kind) = 0;

    // Copies between this host and the local machine. Directories are copied
    // by content into local_path / path.
    virtual Result PullTo(const std::string& path, const std::string& local_path, PathKind kind) = 0;
    virtual Result PushFrom(const std::string& local_path, const std::string& path, PathKind kind) = 0;
};

class LocalHost final : public Host {
public:
    explicit LocalHost(IProcessRunner& runner) : runner_(runner) {}

    bool IsLocal() const override { return true; }
    std::string Name() const override { return "<local>"; }
    std::string Qualify(const std::string& path) const override { return path; }

    Result Execute(const Command& cmd) override;
    Result Probe(const std::string& path, bool& exists) override;
    Result MakeDirectories(const std::string& path) override;
    Result Split(const std::string& file, const std::string& chunk_dir,
                 std::uint64_t chunk_bytes) override;
    Result Join(const std::string& chunk_dir, const std::string& out_file) override;
    Result Remove(const std::string& path, PathKind kind) override;
    Result PullTo(const std::string& path, const std::string& local_path, PathKind kind) override;
    Result PushFrom(const std::string& local_path, const std::string& path, PathKind kind) override;

private:
    IProcessRunner& runner_;
};

class RemoteHost final : public Host {
public:
    RemoteHost(IProcessRunner& runner, std::string host, std::uint16_t port)
        : runner_(runner), host_(std::move(host)), port_(port) {}

    bool IsLocal() const override { return false; }
    std::string Name() const override { return host_; }
    std::string Qualify(const std::string& path) const override { return host_ + ":" + path; }

    Result Execute(const Command& cmd) override;
    Result Probe(const std::string& path, bool& exists) override;
    Result MakeDirectories(const std::string& path) override;
    Result Split(const std::string& file, const std::string& chunk_dir,
                 std::uint64_t chunk_bytes) override;
    Result Join(const std::string& chunk_dir, const std::string& out_file) override;
    Result Remove(const std::string& path, PathKind kind) override;
    Result PullTo(const std::string& path, const std::string& local_path, PathKind kind) override;
    Result PushFrom(const std::string& local_path, const std::string& path, PathKind kind) override;

    std::vector<std::string> SshArgv(const Command& cmd) const;
    std::vector<std::string> RsyncArgv(const std::string& from, const std::string& to) const;

private:
    IProcessRunner& runner_;
    std::string host_;
    std::uint16_t port_;
};

std::unique_ptr<Host> MakeHost(const EndpointConfig& endpoint, IProcessRunner& runner);

} // namespace ferry
