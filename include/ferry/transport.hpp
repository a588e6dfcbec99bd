#pragma once

#include "ferry/command.hpp"
#include "ferry/host.hpp"
#include "ferry/retry.hpp"
#include "ferry/types.hpp"

#include <cstdint>
#include <string>

namespace ferry {

// Endpoint-aware operations. Each call resolves the host for a role once and
// runs the operation under the retry discipline. Methods returning void
// escalate through Retrier::Run (FatalExecutionError) on exhaustion.
class EndpointTransport {
public:
    EndpointTransport(Host& source, Host& destination, Host& local, Retrier& retrier)
        : source_(source), destination_(destination), local_(local), retrier_(retrier) {}

    Host& HostFor(EndpointRole role);
    const Host& HostFor(EndpointRole role) const;

    void RunOnSource(const Command& cmd) { RunOn(EndpointRole::Source, cmd); }
    void RunOnDestination(const Command& cmd) { RunOn(EndpointRole::Destination, cmd); }
    void RunOn(EndpointRole role, const Command& cmd);

    // Single attempt outside the retry discipline.
    Result RunOnce(EndpointRole role, const Command& cmd);

    bool Exists(EndpointRole role, const std::string& path);
    void MakeDirectories(EndpointRole role, const std::string& path);
    void Split(EndpointRole role, const std::string& file, const std::string& chunk_dir,
               std::uint64_t chunk_bytes);
    void Join(EndpointRole role, const std::string& chunk_dir, const std::string& out_file);

    void CopyFromSource(const std::string& source_path, const std::string& local_path, PathKind kind);
    void CopyToDestination(const std::string& local_path, const std::string& destination_path,
                           PathKind kind);

    // Used by cleanup: retried, never escalated.
    Result Remove(EndpointRole role, const std::string& path, PathKind kind);

private:
    Host& source_;
    Host& destination_;
    Host& local_;
    Retrier& retrier_;
};

} // namespace ferry
