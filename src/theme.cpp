#include "gitadd/theme.hpp"

#include <ncurses.h>

namespace gitadd {

namespace {
// index side and insertions are green, worktree side and deletions red
constexpr short kPairGreen = 1;
constexpr short kPairRed = 2;
}

Theme::Theme(bool use_color)
    : use_color_{use_color} {
    if (!use_color_) {
        return;
    }
    init_pair(kPairGreen, COLOR_GREEN, -1);
    init_pair(kPairRed, COLOR_RED, -1);
}

Theme::Attribute Theme::attribute(Role role) const {
    switch (role) {
    case Role::Plain:
        return A_NORMAL;
    case Role::Title:
        return A_BOLD;
    case Role::Legend:
    case Role::Binary:
        return A_DIM;
    case Role::Error:
        return use_color_ ? COLOR_PAIR(kPairRed) | A_BOLD : A_BOLD;
    case Role::IndexRow:
    case Role::Added:
        return use_color_ ? COLOR_PAIR(kPairGreen) : A_NORMAL;
    case Role::WorktreeRow:
    case Role::Deleted:
        return use_color_ ? COLOR_PAIR(kPairRed) : A_NORMAL;
    }
    return A_NORMAL;
}

} // namespace gitadd
