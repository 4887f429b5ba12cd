#pragma once

#include <CLI/CLI.hpp>

#include <iosfwd>
#include <memory>
#include <optional>

#include "gitadd/config.hpp"

namespace gitadd {

class Cli {
public:
    Cli();
    ~Cli();

    // Fills `config`. Returns an exit code when the program should stop right
    // away (help, version, markdown dump, parse error).
    [[nodiscard]] std::optional<int> parse(int argc, char** argv, Config& config);

    void print_markdown(std::ostream& os) const;

private:
    std::unique_ptr<CLI::App> app_;
};

} // namespace gitadd
