#include "gitadd/errors.hpp"

#include "gitadd/string_utils.hpp"

#include <format>
#include <utility>

namespace gitadd {
namespace {

std::string describe_failure(const std::string& command, const std::vector<std::string>& arguments,
    int exit_code, const std::string& stderr_text) {
    auto message = std::format("{}: exit status {}", format_command_line(command, arguments), exit_code);
    auto detail = string_utils::trim(stderr_text);
    if (!detail.empty()) {
        message += '\n';
        message += detail;
    }
    return message;
}

} // namespace

std::string format_command_line(const std::string& command, const std::vector<std::string>& arguments) {
    std::string line = command;
    for (const auto& argument : arguments) {
        line += ' ';
        line += argument;
    }
    return line;
}

ExternalToolError::ExternalToolError(std::string command, std::vector<std::string> arguments, int exit_code,
    std::string stderr_text)
    : std::runtime_error(describe_failure(command, arguments, exit_code, stderr_text))
    , command_(std::move(command))
    , arguments_(std::move(arguments))
    , exit_code_(exit_code)
    , stderr_text_(std::move(stderr_text)) {}

ExternalToolError::ExternalToolError(const ExternalToolError& cause, const std::string& prefix)
    : std::runtime_error(prefix + cause.what())
    , command_(cause.command_)
    , arguments_(cause.arguments_)
    , exit_code_(cause.exit_code_)
    , stderr_text_(cause.stderr_text_) {}

RepositoryUnavailable::RepositoryUnavailable(const ExternalToolError& cause)
    : ExternalToolError(cause, "not a git repo or git error: ") {}

} // namespace gitadd
