#pragma once

#include <filesystem>
#include <optional>
#include <string>

#include "gitadd/logger.hpp"

namespace gitadd {

enum class ColorPolicy {
    Auto,
    Always,
    Never
};

struct Options {
    std::filesystem::path repository{};
    std::string git_executable{"git"};
    std::string untracked_files{"normal"};

    ColorPolicy color_policy{ColorPolicy::Auto};

    LogLevel log_level{LogLevel::Error};
    std::optional<std::filesystem::path> log_file{};
};

} // namespace gitadd
