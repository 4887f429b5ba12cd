#pragma once

#include <filesystem>
#include <string>
#include <vector>

namespace gitadd {

// Query/mutation provider for one working tree. Queries return the raw report
// text; every method throws ExternalToolError when the underlying tool fails.
class Repository {
public:
    virtual ~Repository() = default;

    virtual std::string short_status() = 0;
    // HEAD -> index
    virtual std::string staged_numstat() = 0;
    // index -> worktree
    virtual std::string unstaged_numstat() = 0;

    virtual void add(const std::vector<std::string>& paths) = 0;
    virtual void reset(const std::vector<std::string>& paths) = 0;
};

// Pathspec naming exactly `path`, taken from the top of the work tree.
[[nodiscard]] std::string literal_pathspec(const std::string& path);

class GitRepository final : public Repository {
public:
    struct Settings {
        std::string executable { "git" };
        std::filesystem::path work_tree {};
        std::string untracked_files { "normal" };
    };

    explicit GitRepository(Settings settings);

    std::string short_status() override;
    std::string staged_numstat() override;
    std::string unstaged_numstat() override;

    void add(const std::vector<std::string>& paths) override;
    void reset(const std::vector<std::string>& paths) override;

private:
    std::string git(std::vector<std::string> arguments) const;

    Settings settings_;
};

} // namespace gitadd
