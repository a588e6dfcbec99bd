#include "ferry/transport.hpp"

#include "ferry/logger.hpp"

namespace ferry {

Host& EndpointTransport::HostFor(EndpointRole role) {
    switch (role) {
        case EndpointRole::Source: return source_;
        case EndpointRole::Destination: return destination_;
        case EndpointRole::Local: break;
    }
    return local_;
}

const Host& EndpointTransport::HostFor(EndpointRole role) const {
    switch (role) {
        case EndpointRole::Source: return source_;
        case EndpointRole::Destination: return destination_;
        case EndpointRole::Local: break;
    }
    return local_;
}

void EndpointTransport::RunOn(EndpointRole role, const Command& cmd) {
    Host& host = HostFor(role);
    retrier_.Run([&] { return host.Execute(cmd); });
}

Result EndpointTransport::RunOnce(EndpointRole role, const Command& cmd) {
    return HostFor(role).Execute(cmd);
}

bool EndpointTransport::Exists(EndpointRole role, const std::string& path) {
    Host& host = HostFor(role);
    bool exists = false;
    retrier_.Run([&] { return host.Probe(path, exists); });
    return exists;
}

void EndpointTransport::MakeDirectories(EndpointRole role, const std::string& path) {
    Host& host = HostFor(role);
    retrier_.Run([&] { return host.MakeDirectories(path); });
}

void EndpointTransport::Split(EndpointRole role, const std::string& file, const std::string& chunk_dir,
                              std::uint64_t chunk_bytes) {
    Host& host = HostFor(role);
    retrier_.Run([&] { return host.Split(file, chunk_dir, chunk_bytes); });
}

void EndpointTransport::Join(EndpointRole role, const std::string& chunk_dir, const std::string& out_file) {
    Host& host = HostFor(role);
    retrier_.Run([&] { return host.Join(chunk_dir, out_file); });
}

void EndpointTransport::CopyFromSource(const std::string& source_path, const std::string& local_path,
                                       PathKind kind) {
    LogDebug("copy %s -> %s", source_.Qualify(source_path).c_str(), local_path.c_str());
    retrier_.Run([&] { return source_.PullTo(source_path, local_path, kind); });
}

void EndpointTransport::CopyToDestination(const std::string& local_path, const std::string& destination_path,
                                          PathKind kind) {
    LogDebug("copy %s -> %s", local_path.c_str(), destination_.Qualify(destination_path).c_str());
    retrier_.Run([&] { return destination_.PushFrom(local_path, destination_path, kind); });
}

Result EndpointTransport::Remove(EndpointRole role, const std::string& path, PathKind kind) {
    Host& host = HostFor(role);
    return retrier_.Attempt([&] { return host.Remove(path, kind); });
}

} // namespace ferry
