#include "gitadd/status_parser.hpp"

#include "gitadd/string_utils.hpp"

#include <utility>

namespace gitadd {
namespace {
constexpr std::string_view kRenameSeparator = " -> ";
}

bool parse_status_line(std::string_view line, StatusEntry& entry) {
    if (string_utils::trim(line).empty() || line.size() < 3) {
        return false;
    }

    auto path = string_utils::trim(line.substr(3));
    if (auto arrow = path.rfind(kRenameSeparator); arrow != std::string_view::npos) {
        path = string_utils::trim(path.substr(arrow + kRenameSeparator.size()));
    }

    entry.path = string_utils::unquote_path(path);
    entry.index_status = status_from_char(line[0]);
    entry.worktree_status = status_from_char(line[1]);
    return true;
}

std::vector<StatusEntry> parse_short_status(std::string_view report) {
    std::vector<StatusEntry> entries;
    for (auto line : string_utils::split_lines(report)) {
        StatusEntry entry;
        if (parse_status_line(line, entry)) {
            entries.push_back(std::move(entry));
        }
    }
    return entries;
}

} // namespace gitadd
