#pragma once

#include <fstream>

#include "gitadd/cli.hpp"
#include "gitadd/config.hpp"

namespace gitadd {

class App {
public:
    App();
    int run(int argc, char** argv);

private:
    void configure_logging(const Options& options);

    Cli cli_;
    std::ofstream log_file_;
};

} // namespace gitadd
