#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <unordered_map>

namespace gitadd {

// Per-path line totals keyed by destination path.
struct NumstatTotals {
    std::unordered_map<std::string, std::uint64_t> added;
    std::unordered_map<std::string, std::uint64_t> deleted;
    std::unordered_map<std::string, bool> binary;

    [[nodiscard]] bool empty() const noexcept { return added.empty() && deleted.empty() && binary.empty(); }
};

// Adds one `git diff --numstat` report into `totals`. Lines with fewer than
// three tab-separated fields are ignored; "-" marks a binary side.
void accumulate_numstat(std::string_view report, NumstatTotals& totals);

[[nodiscard]] NumstatTotals aggregate_numstat(std::string_view staged_report, std::string_view unstaged_report);

// "a => b" -> "b", "dir/{a => b}/f" -> "dir/b/f".
[[nodiscard]] std::string resolve_rename_target(std::string_view field);

} // namespace gitadd
