#include "gitadd/config.hpp"

#include <filesystem>
#include <utility>

namespace gitadd {

Config& Config::instance() {
    static Config instance;
    return instance;
}

void Config::set_options(Options options) {
    options_ = std::move(options);
}

const Options& Config::options() const noexcept {
    return options_;
}

void Config::set_program_name(std::string_view name) {
    auto stem = std::filesystem::path(name).filename().string();
    program_name_ = stem.empty() ? std::string{"gitadd"} : stem;
}

std::string_view Config::program_name() const noexcept {
    return program_name_;
}

} // namespace gitadd
