#pragma once

namespace gitadd {

enum class Role {
    Plain,
    Title,
    Legend,
    Error,
    IndexRow,
    WorktreeRow,
    Added,
    Deleted,
    Binary,
};

// Maps display roles to curses attributes.
class Theme {
public:
    using Attribute = unsigned long;

    // Must be constructed after the Terminal so color pairs can be registered.
    explicit Theme(bool use_color);

    [[nodiscard]] Attribute attribute(Role role) const;

private:
    bool use_color_{false};
};

} // namespace gitadd
