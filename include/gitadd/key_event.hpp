#pragma once

namespace gitadd {

enum class Key {
    None,
    Char,
    Up,
    Down,
    Left,
    Right,
    Home,
    End,
    PageUp,
    PageDown,
    Enter,
    Escape,
    Backspace,
    Resize,
    Interrupt,
};

struct KeyEvent {
    Key key { Key::None };
    char ch { '\0' }; // set for Key::Char

    static constexpr KeyEvent of(Key key) noexcept { return KeyEvent{key, '\0'}; }
    static constexpr KeyEvent character(char ch) noexcept { return KeyEvent{Key::Char, ch}; }
};

} // namespace gitadd
