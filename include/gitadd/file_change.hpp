#pragma once

#include <cstdint>
#include <string>

#include "gitadd/status_code.hpp"

namespace gitadd {

struct FileChange {
    std::string path; // destination name for renames
    StatusCode index_status { StatusCode::Clean };
    StatusCode worktree_status { StatusCode::Clean };
    std::uint64_t added { 0 };
    std::uint64_t deleted { 0 };
    bool binary { false };

    bool operator==(const FileChange&) const = default;
};

} // namespace gitadd
