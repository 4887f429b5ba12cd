#include "gitadd/selection.hpp"

#include "gitadd/logger.hpp"
#include "gitadd/reconciler.hpp"
#include "gitadd/repository.hpp"
#include "gitadd/string_utils.hpp"

#include <algorithm>
#include <exception>
#include <utility>

namespace gitadd {
namespace {

void clamp_cursor(SelectionState& state) {
    const auto count = visible_indices(state).size();
    if (count == 0) {
        state.cursor.reset();
    } else if (!state.cursor) {
        state.cursor = 0;
    } else if (*state.cursor >= count) {
        state.cursor = count - 1;
    }
}

void reset_cursor(SelectionState& state) {
    state.cursor.reset();
    clamp_cursor(state);
}

void move_cursor(SelectionState& state, long delta) {
    const auto count = visible_indices(state).size();
    if (count == 0) {
        state.cursor.reset();
        return;
    }
    const long current = state.cursor ? static_cast<long>(*state.cursor) : 0;
    const long last = static_cast<long>(count) - 1;
    state.cursor = static_cast<std::size_t>(std::clamp(current + delta, 0L, last));
}

bool is_filter_byte(char ch) noexcept {
    const auto byte = static_cast<unsigned char>(ch);
    return byte >= 0x80 || (byte >= 0x20 && byte != 0x7f);
}

} // namespace

std::vector<std::size_t> visible_indices(const SelectionState& state) {
    std::vector<std::size_t> indices;
    indices.reserve(state.files.size());
    for (std::size_t i = 0; i < state.files.size(); ++i) {
        if (string_utils::fuzzy_contains(state.files[i].path, state.filter)) {
            indices.push_back(i);
        }
    }
    return indices;
}

std::vector<std::string> visible_paths(const SelectionState& state) {
    std::vector<std::string> paths;
    for (auto index : visible_indices(state)) {
        paths.push_back(state.files[index].path);
    }
    return paths;
}

const FileChange* selected_file(const SelectionState& state) {
    if (!state.cursor) {
        return nullptr;
    }
    const auto indices = visible_indices(state);
    if (*state.cursor >= indices.size()) {
        return nullptr;
    }
    return &state.files[indices[*state.cursor]];
}

Command command_for(const KeyEvent& event, bool filter_applied) noexcept {
    switch (event.key) {
    case Key::Up: return Command::MoveUp;
    case Key::Down: return Command::MoveDown;
    case Key::Home: return Command::MoveTop;
    case Key::End: return Command::MoveBottom;
    case Key::PageUp: return Command::PageUp;
    case Key::PageDown: return Command::PageDown;
    case Key::Right: return Command::StageSelected;
    case Key::Left: return Command::UnstageSelected;
    case Key::Escape: return filter_applied ? Command::ClearFilter : Command::Quit;
    case Key::Char:
        switch (event.ch) {
        case 'k': return Command::MoveUp;
        case 'j': return Command::MoveDown;
        case 'g': return Command::MoveTop;
        case 'G': return Command::MoveBottom;
        case 'l':
        case ' ': return Command::StageSelected;
        case 'h': return Command::UnstageSelected;
        case 'a': return Command::StageAll;
        case 'u': return Command::UnstageAll;
        case 'r': return Command::Refresh;
        case '/': return Command::StartFilter;
        case 'q': return Command::Quit;
        default: return Command::None;
        }
    default:
        return Command::None;
    }
}

SelectionMachine::SelectionMachine(Repository& repository)
    : repository_(repository)
    , actions_(repository) {}

SelectionState SelectionMachine::initial_state() {
    SelectionState state;
    state.files = load_file_changes(repository_);
    clamp_cursor(state);
    return state;
}

SelectionState SelectionMachine::update(SelectionState state, const KeyEvent& event) {
    if (event.key == Key::Interrupt) {
        return apply(std::move(state), Command::Quit);
    }
    if (state.filter_editing) {
        return edit_filter(std::move(state), event);
    }
    const auto command = command_for(event, !state.filter.empty());
    return apply(std::move(state), command);
}

SelectionState SelectionMachine::apply(SelectionState state, Command command) {
    switch (command) {
    case Command::None:
        break;
    case Command::MoveUp:
        move_cursor(state, -1);
        break;
    case Command::MoveDown:
        move_cursor(state, 1);
        break;
    case Command::MoveTop:
        reset_cursor(state);
        break;
    case Command::MoveBottom:
        move_cursor(state, static_cast<long>(state.files.size()));
        break;
    case Command::PageUp:
        move_cursor(state, -static_cast<long>(std::max<std::size_t>(state.page_size, 1)));
        break;
    case Command::PageDown:
        move_cursor(state, static_cast<long>(std::max<std::size_t>(state.page_size, 1)));
        break;
    case Command::Refresh:
        return refresh(std::move(state));
    case Command::StageSelected:
        if (const auto* file = selected_file(state)) {
            auto path = file->path;
            return stage(std::move(state), {std::move(path)});
        }
        break;
    case Command::UnstageSelected:
        if (const auto* file = selected_file(state)) {
            auto path = file->path;
            return unstage(std::move(state), {std::move(path)});
        }
        break;
    case Command::StageAll: {
        auto paths = visible_paths(state);
        if (!paths.empty()) {
            return stage(std::move(state), std::move(paths));
        }
        break;
    }
    case Command::UnstageAll: {
        auto paths = visible_paths(state);
        if (!paths.empty()) {
            return unstage(std::move(state), std::move(paths));
        }
        break;
    }
    case Command::StartFilter:
        state.filter_editing = true;
        break;
    case Command::ClearFilter:
        state.filter.clear();
        state.filter_editing = false;
        reset_cursor(state);
        break;
    case Command::Quit:
        state.quit = true;
        break;
    }
    return state;
}

SelectionState SelectionMachine::edit_filter(SelectionState state, const KeyEvent& event) {
    switch (event.key) {
    case Key::Enter:
        state.filter_editing = false;
        break;
    case Key::Escape:
        return apply(std::move(state), Command::ClearFilter);
    case Key::Backspace:
        string_utils::pop_code_point(state.filter);
        reset_cursor(state);
        break;
    case Key::Char:
        if (is_filter_byte(event.ch)) {
            state.filter.push_back(event.ch);
            reset_cursor(state);
        }
        break;
    case Key::Up:
        move_cursor(state, -1);
        break;
    case Key::Down:
        move_cursor(state, 1);
        break;
    default:
        break;
    }
    return state;
}

SelectionState SelectionMachine::refresh(SelectionState state) {
    try {
        state.files = load_file_changes(repository_);
    } catch (const std::exception& error) {
        Logger::instance().warn("refresh failed: {}", error.what());
        state.error = error.what();
        return state;
    }
    state.error.reset();
    clamp_cursor(state);
    return state;
}

SelectionState SelectionMachine::stage(SelectionState state, std::vector<std::string> paths) {
    try {
        actions_.stage(paths);
    } catch (const std::exception& error) {
        Logger::instance().warn("stage failed: {}", error.what());
        state.error = error.what();
        return state;
    }
    return refresh(std::move(state));
}

SelectionState SelectionMachine::unstage(SelectionState state, std::vector<std::string> paths) {
    try {
        actions_.unstage(paths);
    } catch (const std::exception& error) {
        Logger::instance().warn("unstage failed: {}", error.what());
        state.error = error.what();
        return state;
    }
    return refresh(std::move(state));
}

} // namespace gitadd
