#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

#include "gitadd/action_engine.hpp"
#include "gitadd/file_change.hpp"
#include "gitadd/key_event.hpp"

namespace gitadd {

class Repository;

// Everything the interactive list shows. Threaded through the event loop by
// value; a load cycle replaces `files` wholesale.
struct SelectionState {
    std::vector<FileChange> files;
    std::optional<std::size_t> cursor; // index into visible_indices()
    std::string filter;
    bool filter_editing { false };
    std::optional<std::string> error;
    std::size_t page_size { 10 };
    bool quit { false };
};

enum class Command {
    None,
    MoveUp,
    MoveDown,
    MoveTop,
    MoveBottom,
    PageUp,
    PageDown,
    Refresh,
    StageSelected,
    UnstageSelected,
    StageAll,
    UnstageAll,
    StartFilter,
    ClearFilter,
    Quit,
};

[[nodiscard]] std::vector<std::size_t> visible_indices(const SelectionState& state);
[[nodiscard]] std::vector<std::string> visible_paths(const SelectionState& state);
[[nodiscard]] const FileChange* selected_file(const SelectionState& state);

// Key bindings while browsing (not while typing a filter).
[[nodiscard]] Command command_for(const KeyEvent& event, bool filter_applied) noexcept;

class SelectionMachine {
public:
    explicit SelectionMachine(Repository& repository);

    // Startup load. Unlike refresh, failures propagate to the caller.
    [[nodiscard]] SelectionState initial_state();

    [[nodiscard]] SelectionState update(SelectionState state, const KeyEvent& event);
    [[nodiscard]] SelectionState apply(SelectionState state, Command command);

private:
    SelectionState edit_filter(SelectionState state, const KeyEvent& event);
    SelectionState refresh(SelectionState state);
    SelectionState stage(SelectionState state, std::vector<std::string> paths);
    SelectionState unstage(SelectionState state, std::vector<std::string> paths);

    Repository& repository_;
    ActionEngine actions_;
};

} // namespace gitadd
