#include "gitadd/status_parser.hpp"

#include <iostream>
#include <string>
#include <vector>

using gitadd::StatusCode;
using gitadd::StatusEntry;

static bool same(const StatusEntry& e, std::string_view path, StatusCode index, StatusCode worktree) {
    return e.path == path && e.index_status == index && e.worktree_status == worktree;
}

int main() {
    // 1) Plain and rename forms
    {
        auto entries = gitadd::parse_short_status("M  old.go -> new.go\n M src/main.cpp\n?? notes.txt\n");
        if (entries.size() != 3) {
            std::cerr << "expected 3 entries, got " << entries.size() << "\n";
            return 1;
        }
        if (!same(entries[0], "new.go", StatusCode::Modified, StatusCode::Clean)) {
            std::cerr << "rename should key on destination, got '" << entries[0].path << "'\n";
            return 1;
        }
        if (!same(entries[1], "src/main.cpp", StatusCode::Clean, StatusCode::Modified)) {
            std::cerr << "worktree-only modification parsed wrong\n";
            return 1;
        }
        if (!same(entries[2], "notes.txt", StatusCode::Untracked, StatusCode::Untracked)) {
            std::cerr << "untracked line parsed wrong\n";
            return 1;
        }
    }

    // 2) Short and blank lines are dropped without disturbing neighbours
    {
        auto entries = gitadd::parse_short_status("A  first.txt\nM\n\n   \nD  last.txt\n");
        if (entries.size() != 2 || entries[0].path != "first.txt" || entries[1].path != "last.txt") {
            std::cerr << "short/blank lines should be skipped\n";
            return 1;
        }
        if (entries[1].index_status != StatusCode::Deleted) {
            std::cerr << "expected staged deletion for last.txt\n";
            return 1;
        }
    }

    // 3) Last separator wins; order is the report's, not sorted
    {
        auto entries = gitadd::parse_short_status("R  a -> b -> c\nAM zeta\nA  alpha\n");
        if (entries.size() != 3 || entries[0].path != "c" || entries[1].path != "zeta" || entries[2].path != "alpha") {
            std::cerr << "rename with several separators or ordering broken\n";
            return 1;
        }
        if (entries[1].worktree_status != StatusCode::Modified) {
            std::cerr << "AM should carry a worktree modification\n";
            return 1;
        }
    }

    // 4) Quoted paths, CRLF endings, unknown codes
    {
        auto entries = gitadd::parse_short_status("?? \"with space\\tand tab.txt\"\r\nR  \"old name\" -> \"new name\"\r\nXY odd\n");
        if (entries.size() != 3) {
            std::cerr << "expected 3 quoted entries\n";
            return 1;
        }
        if (entries[0].path != "with space\tand tab.txt") {
            std::cerr << "quoted path not unescaped: '" << entries[0].path << "'\n";
            return 1;
        }
        if (entries[1].path != "new name") {
            std::cerr << "quoted rename destination wrong: '" << entries[1].path << "'\n";
            return 1;
        }
        if (entries[2].index_status != StatusCode::Unknown || entries[2].worktree_status != StatusCode::Unknown) {
            std::cerr << "unknown status characters should map to Unknown\n";
            return 1;
        }
    }

    // 5) Octal escapes (non-ASCII names)
    {
        auto entries = gitadd::parse_short_status("?? \"caf\\303\\251.txt\"\n");
        if (entries.size() != 1 || entries[0].path != "caf\xc3\xa9.txt") {
            std::cerr << "octal escapes not decoded\n";
            return 1;
        }
    }

    // 6) Empty report
    if (!gitadd::parse_short_status("").empty() || !gitadd::parse_short_status("\n\n").empty()) {
        std::cerr << "empty report should yield nothing\n";
        return 1;
    }

    std::cout << "status_parser OK\n";
    return 0;
}
