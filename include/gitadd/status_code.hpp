#pragma once

#include <cstdint>
#include <string>
#include <string_view>

namespace gitadd {

// One column of a short-status line.
enum class StatusCode : std::uint8_t {
    Clean,
    Modified,
    Added,
    Deleted,
    Renamed,
    Copied,
    Unmerged,
    Untracked,
    Ignored,
    Unknown,
};

[[nodiscard]] StatusCode status_from_char(char ch) noexcept;
[[nodiscard]] char to_indicator(StatusCode code) noexcept;
[[nodiscard]] std::string_view describe(StatusCode code) noexcept;

// "M=modified, A=added, ..." for the codes a short-status line can carry.
[[nodiscard]] std::string status_legend();

} // namespace gitadd
