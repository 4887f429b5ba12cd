#pragma once

#include <cstddef>
#include <string>

#include "gitadd/row_format.hpp"
#include "gitadd/selection.hpp"
#include "gitadd/terminal.hpp"
#include "gitadd/theme.hpp"

namespace gitadd {

class Renderer {
public:
    Renderer(Terminal& terminal, const Theme& theme);

    void draw(const SelectionState& state);

    // Rows available for the file list once header, filter, error and legend are placed.
    [[nodiscard]] std::size_t list_height(const SelectionState& state) const;

private:
    void draw_row(int y, const RowSegments& row);
    void put(int y, int x, const std::string& text, Role role);
    void append(const std::string& text, Theme::Attribute attribute);

    Terminal& terminal_;
    const Theme& theme_;
    std::size_t top_{0}; // first visible row of the list window
};

} // namespace gitadd
