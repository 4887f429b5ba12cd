#include "gitadd/terminal.hpp"

#include "gitadd/logger.hpp"

#include <stdexcept>

#include <ncurses.h>

namespace gitadd {

namespace {
constexpr int kEscape = 27;
constexpr int kDelete = 127;
constexpr int kCtrlC = 3;
constexpr int kEscapeDelayMs = 25;
}

Terminal::Terminal(bool want_color) {
    if (initscr() == nullptr) {
        throw std::runtime_error("cannot initialize terminal");
    }
    raw();
    noecho();
    keypad(stdscr, TRUE);
    curs_set(0);
    set_escdelay(kEscapeDelayMs);

    if (want_color && has_colors()) {
        start_color();
        use_default_colors();
        color_enabled_ = true;
    }
    Logger::instance().debug("terminal {}x{}, color {}", cols(), rows(), color_enabled_);
}

Terminal::~Terminal() {
    endwin();
}

int Terminal::rows() const {
    return getmaxy(stdscr);
}

int Terminal::cols() const {
    return getmaxx(stdscr);
}

KeyEvent Terminal::read_key() {
    const int ch = wgetch(stdscr);
    switch (ch) {
    case ERR:
        return KeyEvent::of(Key::None);
    case KEY_UP:
        return KeyEvent::of(Key::Up);
    case KEY_DOWN:
        return KeyEvent::of(Key::Down);
    case KEY_LEFT:
        return KeyEvent::of(Key::Left);
    case KEY_RIGHT:
        return KeyEvent::of(Key::Right);
    case KEY_HOME:
        return KeyEvent::of(Key::Home);
    case KEY_END:
        return KeyEvent::of(Key::End);
    case KEY_PPAGE:
        return KeyEvent::of(Key::PageUp);
    case KEY_NPAGE:
        return KeyEvent::of(Key::PageDown);
    case KEY_ENTER:
    case '\n':
    case '\r':
        return KeyEvent::of(Key::Enter);
    case kEscape:
        return KeyEvent::of(Key::Escape);
    case KEY_BACKSPACE:
    case kDelete:
    case '\b':
        return KeyEvent::of(Key::Backspace);
    case KEY_RESIZE:
        return KeyEvent::of(Key::Resize);
    case kCtrlC:
        return KeyEvent::of(Key::Interrupt);
    default:
        break;
    }
    if (ch >= 0 && ch <= 0xff) {
        return KeyEvent::character(static_cast<char>(ch));
    }
    return KeyEvent::of(Key::None);
}

} // namespace gitadd
