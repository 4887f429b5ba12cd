#include "gitadd/selection.hpp"

#include "fake_repository.hpp"

#include <iostream>
#include <string>
#include <string_view>
#include <vector>

using gitadd::Command;
using gitadd::Key;
using gitadd::KeyEvent;
using gitadd::SelectionMachine;
using gitadd::SelectionState;
using gitadd::StatusCode;

static std::vector<std::string> paths_of(const SelectionState& state) {
    std::vector<std::string> out;
    for (const auto& f : state.files) {
        out.push_back(f.path);
    }
    return out;
}

static SelectionState type(SelectionMachine& machine, SelectionState state, std::string_view text) {
    for (char ch : text) {
        state = machine.update(std::move(state), KeyEvent::character(ch));
    }
    return state;
}

int main() {
    // 1) Startup load and navigation
    {
        FakeRepository repo;
        repo.status_report = " M a\n M b\n M c\n";
        SelectionMachine machine{repo};
        auto state = machine.initial_state();
        if (state.files.size() != 3 || state.cursor != 0u) {
            std::cerr << "initial state should select the first of three files\n";
            return 1;
        }
        state = machine.update(std::move(state), KeyEvent::of(Key::Up));
        if (state.cursor != 0u) {
            std::cerr << "cursor must not move above the first row\n";
            return 1;
        }
        state = machine.update(std::move(state), KeyEvent::character('j'));
        state = machine.update(std::move(state), KeyEvent::of(Key::Down));
        state = machine.update(std::move(state), KeyEvent::of(Key::Down));
        if (state.cursor != 2u) {
            std::cerr << "cursor must stop at the last row\n";
            return 1;
        }
        state = machine.update(std::move(state), KeyEvent::of(Key::Home));
        if (state.cursor != 0u) {
            std::cerr << "home should select the first row\n";
            return 1;
        }
        state = machine.update(std::move(state), KeyEvent::character('G'));
        if (state.cursor != 2u) {
            std::cerr << "G should select the last row\n";
            return 1;
        }
        state.page_size = 2;
        state = machine.update(std::move(state), KeyEvent::of(Key::PageUp));
        if (state.cursor != 0u) {
            std::cerr << "page up should clamp at the top\n";
            return 1;
        }
        if (repo.status_calls != 1 || !repo.add_calls.empty()) {
            std::cerr << "navigation must not touch the repository\n";
            return 1;
        }
    }

    // 2) Refresh shrinking the list clamps the cursor
    {
        FakeRepository repo;
        repo.status_report = " M a\n M b\n M c\n M d\n";
        SelectionMachine machine{repo};
        auto state = machine.initial_state();
        state = machine.apply(std::move(state), Command::MoveBottom);
        repo.status_report = " M a\n M b\n";
        state = machine.update(std::move(state), KeyEvent::character('r'));
        if (state.files.size() != 2 || state.cursor != 1u) {
            std::cerr << "cursor should clamp to M-1 after shrink\n";
            return 1;
        }
        repo.status_report = "";
        state = machine.update(std::move(state), KeyEvent::character('r'));
        if (!state.files.empty() || state.cursor.has_value()) {
            std::cerr << "empty list should leave no selection\n";
            return 1;
        }
        // actions on an empty list are no-ops
        state = machine.update(std::move(state), KeyEvent::of(Key::Right));
        state = machine.update(std::move(state), KeyEvent::character('a'));
        if (!repo.add_calls.empty()) {
            std::cerr << "staging with nothing selected must not call git\n";
            return 1;
        }
    }

    // 3) Staging an untracked file, then reload reflects the index
    {
        FakeRepository repo;
        repo.status_report = "M  a.go\n?? b.txt\n";
        repo.staged_report = "4\t2\ta.go\n";
        repo.on_add = [](FakeRepository& r, const std::vector<std::string>& paths) {
            if (paths == std::vector<std::string>{"b.txt"}) {
                r.status_report = "M  a.go\nA  b.txt\n";
                r.staged_report = "4\t2\ta.go\n10\t0\tb.txt\n";
            }
        };
        SelectionMachine machine{repo};
        auto state = machine.initial_state();
        state = machine.update(std::move(state), KeyEvent::of(Key::Down));
        state = machine.update(std::move(state), KeyEvent::of(Key::Right));
        if (repo.add_calls.size() != 1 || repo.add_calls[0] != std::vector<std::string>{"b.txt"}) {
            std::cerr << "stage-selected should add exactly the selected path\n";
            return 1;
        }
        const auto& b = state.files.at(1);
        if (b.path != "b.txt" || b.index_status != StatusCode::Added || b.worktree_status != StatusCode::Clean
            || b.added != 10) {
            std::cerr << "reload after stage should show b.txt as added and clean\n";
            return 1;
        }
        if (state.cursor != 1u || state.error) {
            std::cerr << "cursor or error overlay wrong after stage\n";
            return 1;
        }
    }

    // 4) Unstage-selected and unstage-all
    {
        FakeRepository repo;
        repo.status_report = "A  one\nM  two\n";
        SelectionMachine machine{repo};
        auto state = machine.initial_state();
        state = machine.update(std::move(state), KeyEvent::of(Key::Left));
        state = machine.update(std::move(state), KeyEvent::character('u'));
        if (repo.reset_calls.size() != 2 || repo.reset_calls[0] != std::vector<std::string>{"one"}
            || repo.reset_calls[1] != std::vector<std::string>{"one", "two"}) {
            std::cerr << "unstage calls wrong\n";
            return 1;
        }
        if (repo.status_calls != 3) {
            std::cerr << "every successful mutation must reload\n";
            return 1;
        }
    }

    // 5) Failed mutation: overlay set, no reload, list untouched
    {
        FakeRepository repo;
        repo.status_report = " M keep\n";
        SelectionMachine machine{repo};
        auto state = machine.initial_state();
        repo.fail_add = true;
        repo.status_report = " M changed\n";
        state = machine.update(std::move(state), KeyEvent::character('a'));
        if (!state.error || state.error->find("index.lock") == std::string::npos) {
            std::cerr << "failed stage should set the error overlay\n";
            return 1;
        }
        if (repo.status_calls != 1 || paths_of(state) != std::vector<std::string>{"keep"}) {
            std::cerr << "failed stage must not reload\n";
            return 1;
        }
        if (state.quit) {
            std::cerr << "errors never end the loop\n";
            return 1;
        }
    }

    // 6) Mutation succeeds but the refresh fails: pre-mutation list stays
    {
        FakeRepository repo;
        repo.status_report = "?? new.txt\n";
        repo.on_add = [](FakeRepository& r, const std::vector<std::string>&) { r.fail_staged = true; };
        SelectionMachine machine{repo};
        auto state = machine.initial_state();
        state = machine.update(std::move(state), KeyEvent::of(Key::Right));
        if (!state.error || state.files.size() != 1 || state.files[0].index_status != StatusCode::Untracked) {
            std::cerr << "failed post-mutation refresh should keep the old list and set the overlay\n";
            return 1;
        }
        // a later successful refresh clears the overlay
        repo.fail_staged = false;
        repo.status_report = "A  new.txt\n";
        state = machine.update(std::move(state), KeyEvent::character('r'));
        if (state.error || state.files[0].index_status != StatusCode::Added) {
            std::cerr << "successful refresh should clear the overlay\n";
            return 1;
        }
    }

    // 7) Refresh failure keeps the previous list
    {
        FakeRepository repo;
        repo.status_report = " M a\n M b\n";
        SelectionMachine machine{repo};
        auto state = machine.initial_state();
        state = machine.update(std::move(state), KeyEvent::of(Key::Down));
        repo.fail_status = true;
        state = machine.update(std::move(state), KeyEvent::character('r'));
        if (!state.error || state.error->find("not a git repo") == std::string::npos) {
            std::cerr << "refresh failure should report a repository error\n";
            return 1;
        }
        if (state.files.size() != 2 || state.cursor != 1u) {
            std::cerr << "refresh failure must keep the list and cursor\n";
            return 1;
        }
    }

    // 8) Filter: bulk actions honour it, escape clears it
    {
        FakeRepository repo;
        repo.status_report = " M src/app.cpp\n M src/cli.cpp\n M README.md\n";
        SelectionMachine machine{repo};
        auto state = machine.initial_state();
        state = machine.update(std::move(state), KeyEvent::character('/'));
        state = type(machine, std::move(state), "srcx");
        if (!gitadd::visible_paths(state).empty() || state.cursor.has_value()) {
            std::cerr << "non-matching filter should hide everything\n";
            return 1;
        }
        state = machine.update(std::move(state), KeyEvent::of(Key::Backspace));
        state = machine.update(std::move(state), KeyEvent::of(Key::Enter));
        if (state.filter != "src" || state.filter_editing) {
            std::cerr << "enter should keep the filter and leave typing mode\n";
            return 1;
        }
        state = machine.update(std::move(state), KeyEvent::character('a'));
        if (repo.add_calls.size() != 1
            || repo.add_calls[0] != std::vector<std::string>{"src/app.cpp", "src/cli.cpp"}) {
            std::cerr << "stage-all must only use the filtered paths\n";
            return 1;
        }
        state = machine.update(std::move(state), KeyEvent::of(Key::Escape));
        if (!state.filter.empty() || state.quit || gitadd::visible_paths(state).size() != 3) {
            std::cerr << "escape should clear an applied filter first\n";
            return 1;
        }
        state = machine.update(std::move(state), KeyEvent::of(Key::Escape));
        if (!state.quit) {
            std::cerr << "escape without a filter should quit\n";
            return 1;
        }
    }

    // 9) Filter typing does not trigger bindings; fuzzy match is case-insensitive
    {
        FakeRepository repo;
        repo.status_report = " M Makefile\n M main.cpp\n";
        SelectionMachine machine{repo};
        auto state = machine.initial_state();
        state = machine.update(std::move(state), KeyEvent::character('/'));
        state = type(machine, std::move(state), "qmkf");
        if (state.quit || !repo.add_calls.empty() || state.filter != "qmkf") {
            std::cerr << "keys typed into the filter must not act\n";
            return 1;
        }
        state = machine.update(std::move(state), KeyEvent::of(Key::Escape));
        state = machine.update(std::move(state), KeyEvent::character('/'));
        state = type(machine, std::move(state), "mkf");
        auto visible = gitadd::visible_paths(state);
        if (visible != std::vector<std::string>{"Makefile"}) {
            std::cerr << "fuzzy filter should match Makefile only\n";
            return 1;
        }
        if (gitadd::selected_file(state) == nullptr || gitadd::selected_file(state)->path != "Makefile") {
            std::cerr << "filter change should select the first match\n";
            return 1;
        }
    }

    // 10) Quit and interrupt
    {
        FakeRepository repo;
        SelectionMachine machine{repo};
        auto state = machine.initial_state();
        if (state.cursor.has_value()) {
            std::cerr << "empty repository should have no selection\n";
            return 1;
        }
        state = machine.update(std::move(state), KeyEvent::character('q'));
        if (!state.quit) {
            std::cerr << "q should quit\n";
            return 1;
        }
        auto other = machine.initial_state();
        other.filter_editing = true;
        other = machine.update(std::move(other), KeyEvent::of(Key::Interrupt));
        if (!other.quit) {
            std::cerr << "interrupt should quit even while typing a filter\n";
            return 1;
        }
    }

    // 11) Startup failure propagates
    {
        FakeRepository repo;
        repo.fail_status = true;
        SelectionMachine machine{repo};
        try {
            (void)machine.initial_state();
            std::cerr << "initial load failure should throw\n";
            return 1;
        } catch (const gitadd::RepositoryUnavailable&) {
        }
    }

    std::cout << "selection OK\n";
    return 0;
}
