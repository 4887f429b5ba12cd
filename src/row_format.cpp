#include "gitadd/row_format.hpp"

#include <algorithm>

namespace gitadd {

namespace {
constexpr const char* kStagedIcon = " -›";
constexpr const char* kUnstagedIcon = "‹- ";
constexpr const char* kBinaryTag = "(bin)";
}

RowSegments format_row(const FileChange& change, bool selected) {
    RowSegments row;
    row.selected = selected;
    row.marker = selected ? "   *" : "    ";
    row.path = change.path;

    if (change.index_status != StatusCode::Clean) {
        row.icons = kStagedIcon;
    }
    if (change.worktree_status != StatusCode::Clean) {
        row.tone = RowTone::Worktree;
        if (!row.icons.empty()) {
            row.icons += ' ';
        }
        row.icons += kUnstagedIcon;
    }

    row.binary = change.binary;
    if (!change.binary) {
        if (change.added > 0) {
            row.added = "+" + std::to_string(change.added);
        }
        if (change.deleted > 0) {
            row.deleted = "-" + std::to_string(change.deleted);
        }
    }
    return row;
}

std::string row_text(const RowSegments& row) {
    std::string text = row.marker;
    if (!row.icons.empty()) {
        text += row.icons;
        text += ' ';
    }
    text += row.path;
    if (row.binary) {
        text += ' ';
        text += kBinaryTag;
        return text;
    }
    if (!row.added.empty()) {
        text += ' ';
        text += row.added;
    }
    if (!row.deleted.empty()) {
        text += ' ';
        text += row.deleted;
    }
    return text;
}

std::size_t scroll_top(std::size_t top, std::optional<std::size_t> cursor, std::size_t height,
    std::size_t count) {
    if (height == 0 || count <= height) {
        return 0;
    }
    top = std::min(top, count - height);
    if (cursor) {
        if (*cursor < top) {
            top = *cursor;
        } else if (*cursor >= top + height) {
            top = *cursor - height + 1;
        }
    }
    return top;
}

} // namespace gitadd
