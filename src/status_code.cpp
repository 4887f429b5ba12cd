#include "gitadd/status_code.hpp"

#include <array>

namespace gitadd {

StatusCode status_from_char(char ch) noexcept {
    switch (ch) {
    case ' ':
        return StatusCode::Clean;
    case 'M':
        return StatusCode::Modified;
    case 'A':
        return StatusCode::Added;
    case 'D':
        return StatusCode::Deleted;
    case 'R':
        return StatusCode::Renamed;
    case 'C':
        return StatusCode::Copied;
    case 'U':
        return StatusCode::Unmerged;
    case '?':
        return StatusCode::Untracked;
    case '!':
        return StatusCode::Ignored;
    default:
        return StatusCode::Unknown;
    }
}

char to_indicator(StatusCode code) noexcept {
    switch (code) {
    case StatusCode::Clean:
        return ' ';
    case StatusCode::Modified:
        return 'M';
    case StatusCode::Added:
        return 'A';
    case StatusCode::Deleted:
        return 'D';
    case StatusCode::Renamed:
        return 'R';
    case StatusCode::Copied:
        return 'C';
    case StatusCode::Unmerged:
        return 'U';
    case StatusCode::Untracked:
        return '?';
    case StatusCode::Ignored:
        return '!';
    case StatusCode::Unknown:
    default:
        return '*';
    }
}

std::string_view describe(StatusCode code) noexcept {
    switch (code) {
    case StatusCode::Clean: return "clean";
    case StatusCode::Modified: return "modified";
    case StatusCode::Added: return "added";
    case StatusCode::Deleted: return "deleted";
    case StatusCode::Renamed: return "renamed";
    case StatusCode::Copied: return "copied";
    case StatusCode::Unmerged: return "unmerged";
    case StatusCode::Untracked: return "untracked";
    case StatusCode::Ignored: return "ignored";
    case StatusCode::Unknown: return "unknown";
    }
    return "unknown";
}

std::string status_legend() {
    constexpr std::array kShown{
        StatusCode::Modified,
        StatusCode::Added,
        StatusCode::Deleted,
        StatusCode::Renamed,
        StatusCode::Copied,
        StatusCode::Unmerged,
        StatusCode::Untracked,
    };
    std::string legend;
    for (auto code : kShown) {
        if (!legend.empty()) {
            legend += ", ";
        }
        legend += to_indicator(code);
        legend += '=';
        legend += describe(code);
    }
    return legend;
}

} // namespace gitadd
