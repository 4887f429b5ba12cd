#pragma once

#include <string>
#include <string_view>
#include <vector>

#include "gitadd/status_code.hpp"

namespace gitadd {

struct StatusEntry {
    std::string path;
    StatusCode index_status { StatusCode::Clean };
    StatusCode worktree_status { StatusCode::Clean };

    bool operator==(const StatusEntry&) const = default;
};

// Parses `git status --porcelain` output. Malformed lines are skipped and the
// result keeps the order of the report.
[[nodiscard]] std::vector<StatusEntry> parse_short_status(std::string_view report);

// Parses a single line; returns false when the line is blank or too short.
bool parse_status_line(std::string_view line, StatusEntry& entry);

} // namespace gitadd
