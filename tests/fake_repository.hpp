#pragma once

#include "gitadd/errors.hpp"
#include "gitadd/repository.hpp"

#include <functional>
#include <string>
#include <vector>

// In-memory stand-in for a git working tree: canned reports, recorded calls.
class FakeRepository final : public gitadd::Repository {
public:
    using Hook = std::function<void(FakeRepository&, const std::vector<std::string>&)>;

    std::string status_report;
    std::string staged_report;
    std::string unstaged_report;

    bool fail_status{false};
    bool fail_staged{false};
    bool fail_unstaged{false};
    bool fail_add{false};
    bool fail_reset{false};

    int status_calls{0};
    int numstat_calls{0};
    std::vector<std::vector<std::string>> add_calls;
    std::vector<std::vector<std::string>> reset_calls;

    Hook on_add;
    Hook on_reset;

    std::string short_status() override {
        ++status_calls;
        if (fail_status) {
            throw gitadd::ExternalToolError("git", {"status", "--porcelain"}, 128,
                "fatal: not a git repository (or any of the parent directories): .git\n");
        }
        return status_report;
    }

    std::string staged_numstat() override {
        ++numstat_calls;
        if (fail_staged) {
            throw gitadd::ExternalToolError("git", {"diff", "--cached", "--numstat"}, 129, "error: staged\n");
        }
        return staged_report;
    }

    std::string unstaged_numstat() override {
        ++numstat_calls;
        if (fail_unstaged) {
            throw gitadd::ExternalToolError("git", {"diff", "--numstat"}, 129, "error: unstaged\n");
        }
        return unstaged_report;
    }

    void add(const std::vector<std::string>& paths) override {
        add_calls.push_back(paths);
        if (fail_add) {
            auto arguments = std::vector<std::string>{"add", "--"};
            arguments.insert(arguments.end(), paths.begin(), paths.end());
            throw gitadd::ExternalToolError("git", arguments, 128, "fatal: Unable to create index.lock\n");
        }
        if (on_add) {
            on_add(*this, paths);
        }
    }

    void reset(const std::vector<std::string>& paths) override {
        reset_calls.push_back(paths);
        if (fail_reset) {
            auto arguments = std::vector<std::string>{"reset", "-q", "--"};
            arguments.insert(arguments.end(), paths.begin(), paths.end());
            throw gitadd::ExternalToolError("git", arguments, 128, "fatal: reset failed\n");
        }
        if (on_reset) {
            on_reset(*this, paths);
        }
    }
};
