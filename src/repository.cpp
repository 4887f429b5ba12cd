#include "gitadd/repository.hpp"

#include "gitadd/process.hpp"

#include <utility>

namespace gitadd {

namespace {

// Porcelain paths are relative to the top of the work tree and must not be
// expanded as globs, whatever directory git runs in.
void append_pathspecs(std::vector<std::string>& arguments, const std::vector<std::string>& paths) {
    arguments.reserve(arguments.size() + paths.size());
    for (const auto& path : paths) {
        arguments.push_back(literal_pathspec(path));
    }
}

} // namespace

std::string literal_pathspec(const std::string& path) {
    return ":(top,literal)" + path;
}

GitRepository::GitRepository(Settings settings)
    : settings_(std::move(settings)) {}

std::string GitRepository::git(std::vector<std::string> arguments) const {
    if (!settings_.work_tree.empty()) {
        arguments.insert(arguments.begin(), {"-C", settings_.work_tree.string()});
    }
    return run_checked(settings_.executable, arguments);
}

std::string GitRepository::short_status() {
    std::vector<std::string> arguments{"status", "--porcelain"};
    if (!settings_.untracked_files.empty() && settings_.untracked_files != "normal") {
        arguments.push_back("--untracked-files=" + settings_.untracked_files);
    }
    return git(std::move(arguments));
}

std::string GitRepository::staged_numstat() {
    return git({"diff", "--cached", "--numstat"});
}

std::string GitRepository::unstaged_numstat() {
    return git({"diff", "--numstat"});
}

void GitRepository::add(const std::vector<std::string>& paths) {
    std::vector<std::string> arguments{"add", "--"};
    append_pathspecs(arguments, paths);
    git(std::move(arguments));
}

void GitRepository::reset(const std::vector<std::string>& paths) {
    std::vector<std::string> arguments{"reset", "-q", "--"};
    append_pathspecs(arguments, paths);
    git(std::move(arguments));
}

} // namespace gitadd
