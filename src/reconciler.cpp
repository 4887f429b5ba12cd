#include "gitadd/reconciler.hpp"

#include "gitadd/errors.hpp"
#include "gitadd/perf.hpp"
#include "gitadd/repository.hpp"

#include <algorithm>
#include <format>
#include <string>
#include <utility>

namespace gitadd {
namespace {

template <typename Map>
typename Map::mapped_type lookup(const Map& map, const std::string& key) {
    auto it = map.find(key);
    return it == map.end() ? typename Map::mapped_type{} : it->second;
}

} // namespace

std::vector<FileChange> reconcile(const std::vector<StatusEntry>& entries, const NumstatTotals& totals) {
    std::vector<FileChange> files;
    files.reserve(entries.size());
    for (const auto& entry : entries) {
        FileChange change;
        change.path = entry.path;
        change.index_status = entry.index_status;
        change.worktree_status = entry.worktree_status;
        change.added = lookup(totals.added, entry.path);
        change.deleted = lookup(totals.deleted, entry.path);
        change.binary = lookup(totals.binary, entry.path);
        files.push_back(std::move(change));
    }
    return files;
}

std::vector<FileChange> load_file_changes(Repository& repository) {
    ScopedTimer timer{"load cycle"};

    std::string status_report;
    try {
        status_report = repository.short_status();
    } catch (const ExternalToolError& error) {
        throw RepositoryUnavailable(error);
    }
    auto entries = parse_short_status(status_report);

    const auto staged = repository.staged_numstat();
    const auto unstaged = repository.unstaged_numstat();
    const auto totals = aggregate_numstat(staged, unstaged);

    auto files = reconcile(entries, totals);
    timer.set_detail(std::format("{} paths, {} staged", files.size(),
        std::count_if(files.begin(), files.end(), [](const FileChange& f) {
            return f.index_status != StatusCode::Clean && f.index_status != StatusCode::Untracked;
        })));
    return files;
}

} // namespace gitadd
