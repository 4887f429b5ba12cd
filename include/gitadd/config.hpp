#pragma once

#include <string>
#include <string_view>

#include "gitadd/options.hpp"

namespace gitadd {

class Config {
public:
    static Config& instance();

    void set_options(Options options);
    [[nodiscard]] const Options& options() const noexcept;

    void set_program_name(std::string_view name);
    [[nodiscard]] std::string_view program_name() const noexcept;

private:
    Config() = default;

    Options options_{};
    std::string program_name_{"gitadd"};
};

} // namespace gitadd
