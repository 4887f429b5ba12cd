#pragma once

#include <filesystem>
#include <string>
#include <vector>

namespace gitadd {

struct ProcessResult {
    int exit_code { -1 };
    std::string stdout_data;
    std::string stderr_data;
};

// Runs `command` with `arguments` (no shell) and waits for it. Output streams are
// captured separately. A command that cannot be started reports exit code 127.
[[nodiscard]] ProcessResult run_process(const std::string& command, const std::vector<std::string>& arguments,
    const std::filesystem::path& working_directory = {});

// Like run_process but throws ExternalToolError on a non-zero exit and returns stdout.
std::string run_checked(const std::string& command, const std::vector<std::string>& arguments,
    const std::filesystem::path& working_directory = {});

} // namespace gitadd
