#include "gitadd/renderer.hpp"

#include "gitadd/status_code.hpp"

#include <algorithm>
#include <vector>

#include <ncurses.h>

namespace gitadd {
namespace {

constexpr const char* kTitle = "gitadd — interactive add/reset";
constexpr const char* kKeysLegend =
    "↑/↓ move  •  ← unstage  •  → stage  •  a stage all  •  u unstage all  •  / filter  •  r refresh  •  q quit";
constexpr int kLegendLines = 2;

bool shows_filter_line(const SelectionState& state) {
    return state.filter_editing || !state.filter.empty();
}

std::string single_line(std::string text) {
    while (!text.empty() && (text.back() == '\n' || text.back() == '\r')) {
        text.pop_back();
    }
    std::replace(text.begin(), text.end(), '\n', ' ');
    std::replace(text.begin(), text.end(), '\r', ' ');
    return text;
}

} // namespace

Renderer::Renderer(Terminal& terminal, const Theme& theme)
    : terminal_(terminal)
    , theme_(theme) {}

std::size_t Renderer::list_height(const SelectionState& state) const {
    int reserved = 1 + kLegendLines;
    if (shows_filter_line(state)) {
        ++reserved;
    }
    if (state.error) {
        ++reserved;
    }
    return static_cast<std::size_t>(std::max(1, terminal_.rows() - reserved));
}

void Renderer::draw(const SelectionState& state) {
    werase(stdscr);

    int y = 0;
    put(y++, 0, kTitle, Role::Title);

    const auto visible = visible_indices(state);
    const auto height = list_height(state);
    top_ = scroll_top(top_, state.cursor, height, visible.size());
    const std::size_t offset = top_;

    if (visible.empty()) {
        put(y, 0, state.files.empty() ? "    nothing to stage, working tree clean" : "    no paths match the filter",
            Role::Legend);
    }
    for (std::size_t i = offset; i < visible.size() && i < offset + height; ++i) {
        const bool selected = state.cursor && *state.cursor == i;
        draw_row(y + static_cast<int>(i - offset), format_row(state.files[visible[i]], selected));
    }
    y += static_cast<int>(height);

    if (shows_filter_line(state)) {
        put(y++, 0, "Filter: " + state.filter + (state.filter_editing ? "_" : ""), Role::Plain);
    }
    if (state.error) {
        put(y++, 0, "Error: " + single_line(*state.error), Role::Error);
    }
    put(y++, 0, kKeysLegend, Role::Legend);
    put(y, 0, "[Index|Work] legend: " + status_legend() + "  •  counts show total +adds/-dels", Role::Legend);

    wrefresh(stdscr);
}

void Renderer::draw_row(int y, const RowSegments& row) {
    const auto tone = theme_.attribute(row.tone == RowTone::Worktree ? Role::WorktreeRow : Role::IndexRow);
    const auto emphasis = row.selected ? static_cast<Theme::Attribute>(A_BOLD) : Theme::Attribute{0};

    wmove(stdscr, y, 0);
    append(row.marker, tone | emphasis);
    if (!row.icons.empty()) {
        append(row.icons + " ", tone | emphasis);
    }
    append(row.path, tone | emphasis);

    if (row.binary) {
        append(" ", A_NORMAL);
        append("(bin)", theme_.attribute(Role::Binary));
        return;
    }
    if (!row.added.empty()) {
        append(" ", A_NORMAL);
        append(row.added, theme_.attribute(Role::Added));
    }
    if (!row.deleted.empty()) {
        append(" ", A_NORMAL);
        append(row.deleted, theme_.attribute(Role::Deleted));
    }
}

void Renderer::put(int y, int x, const std::string& text, Role role) {
    if (y >= terminal_.rows()) {
        return;
    }
    wmove(stdscr, y, x);
    append(text, theme_.attribute(role));
}

void Renderer::append(const std::string& text, Theme::Attribute attribute) {
    const int remaining = terminal_.cols() - getcurx(stdscr);
    if (remaining <= 0 || text.empty()) {
        return;
    }
    // Clipped by bytes, never inside a UTF-8 sequence.
    int length = std::min(static_cast<int>(text.size()), remaining);
    while (length > 0 && length < static_cast<int>(text.size())
        && (static_cast<unsigned char>(text[static_cast<std::size_t>(length)]) & 0xC0) == 0x80) {
        --length;
    }
    wattron(stdscr, static_cast<int>(attribute));
    waddnstr(stdscr, text.c_str(), length);
    wattroff(stdscr, static_cast<int>(attribute));
}

} // namespace gitadd
