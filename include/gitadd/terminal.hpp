#pragma once

#include "gitadd/key_event.hpp"

namespace gitadd {

// Owns the curses screen for its lifetime; the destructor restores the terminal.
class Terminal {
public:
    explicit Terminal(bool want_color);
    ~Terminal();

    Terminal(const Terminal&) = delete;
    Terminal& operator=(const Terminal&) = delete;

    [[nodiscard]] int rows() const;
    [[nodiscard]] int cols() const;
    [[nodiscard]] bool color_enabled() const noexcept { return color_enabled_; }

    // Blocks until a key arrives.
    [[nodiscard]] KeyEvent read_key();

private:
    bool color_enabled_{false};
};

} // namespace gitadd
