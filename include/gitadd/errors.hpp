#pragma once

#include <stdexcept>
#include <string>
#include <vector>

namespace gitadd {

// A git invocation exited non-zero or could not be started.
class ExternalToolError : public std::runtime_error {
public:
    ExternalToolError(std::string command, std::vector<std::string> arguments, int exit_code,
        std::string stderr_text);

    [[nodiscard]] const std::string& command() const noexcept { return command_; }
    [[nodiscard]] const std::vector<std::string>& arguments() const noexcept { return arguments_; }
    [[nodiscard]] int exit_code() const noexcept { return exit_code_; }
    [[nodiscard]] const std::string& stderr_text() const noexcept { return stderr_text_; }

protected:
    ExternalToolError(const ExternalToolError& cause, const std::string& prefix);

private:
    std::string command_;
    std::vector<std::string> arguments_;
    int exit_code_;
    std::string stderr_text_;
};

// The status query failed, usually because the directory is not a repository.
class RepositoryUnavailable : public ExternalToolError {
public:
    explicit RepositoryUnavailable(const ExternalToolError& cause);
};

[[nodiscard]] std::string format_command_line(const std::string& command, const std::vector<std::string>& arguments);

} // namespace gitadd
