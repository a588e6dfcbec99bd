#pragma once

#include "ferry/types.hpp"

#include <cstddef>
#include <string>
#include <vector>

namespace ferry {

struct ArtifactRecord {
    EndpointRole role;
    PathKind kind;
    std::string path;
    std::size_t order;      // creation order across all roles, from 0
};

// Append-only ledger of every path this run created. Nothing that is not
// registered here is ever deleted.
class ArtifactRegistry {
public:
    // Call only after the creating operation has succeeded.
    const ArtifactRecord& Register(EndpointRole role, PathKind kind, const std::string& path);

    std::vector<ArtifactRecord> AllFor(EndpointRole role) const;
    std::vector<ArtifactRecord> AllFor(EndpointRole role, PathKind kind) const;
    const std::vector<ArtifactRecord>& All() const { return records_; }

    bool Empty() const { return records_.empty(); }
    std::size_t Size() const { return records_.size(); }

private:
    std::vector<ArtifactRecord> records_;
};

} // namespace ferry
