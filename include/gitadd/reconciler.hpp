#pragma once

#include <vector>

#include "gitadd/file_change.hpp"
#include "gitadd/numstat.hpp"
#include "gitadd/status_parser.hpp"

namespace gitadd {

class Repository;

// One FileChange per status entry, in status order. Paths missing from the
// totals get zero counts; totals-only paths are ignored.
[[nodiscard]] std::vector<FileChange> reconcile(const std::vector<StatusEntry>& entries, const NumstatTotals& totals);

// Runs a full load cycle: status, staged numstat, unstaged numstat.
// Throws RepositoryUnavailable when the status query fails and
// ExternalToolError when a numstat query fails.
[[nodiscard]] std::vector<FileChange> load_file_changes(Repository& repository);

} // namespace gitadd
