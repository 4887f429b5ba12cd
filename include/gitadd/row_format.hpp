#pragma once

#include <cstddef>
#include <optional>
#include <string>

#include "gitadd/file_change.hpp"

namespace gitadd {

enum class RowTone {
    Index,    // only staged changes
    Worktree, // anything pending in the worktree
};

// Pieces of one list row, kept apart so the renderer can style each one.
struct RowSegments {
    std::string marker;  // "   *" when selected, "    " otherwise
    std::string icons;   // " -›" staged, "‹- " unstaged, joined by a space
    std::string path;
    std::string added;   // "+N", empty when zero or binary
    std::string deleted; // "-N", empty when zero or binary
    bool binary{false};
    RowTone tone{RowTone::Index};
    bool selected{false};
};

[[nodiscard]] RowSegments format_row(const FileChange& change, bool selected);

// Unstyled rendition of a row, as it appears on screen.
[[nodiscard]] std::string row_text(const RowSegments& row);

// First row of a `height`-row window over `count` rows. The window only moves
// when the cursor would leave it, and never runs past the last row.
[[nodiscard]] std::size_t scroll_top(std::size_t top, std::optional<std::size_t> cursor, std::size_t height,
    std::size_t count);

} // namespace gitadd
