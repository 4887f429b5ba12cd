#include "gitadd/app.hpp"

#include "gitadd/logger.hpp"
#include "gitadd/platform.hpp"
#include "gitadd/renderer.hpp"
#include "gitadd/repository.hpp"
#include "gitadd/selection.hpp"
#include "gitadd/terminal.hpp"
#include "gitadd/theme.hpp"

#include <exception>
#include <iostream>
#include <optional>
#include <string>
#include <utility>

namespace gitadd {

App::App() = default;

void App::configure_logging(const Options& options) {
    auto& logger = Logger::instance();
    logger.set_level(options.log_level);
    if (!options.log_file) {
        logger.set_output_stream(nullptr);
        return;
    }
    log_file_.open(*options.log_file, std::ios::app);
    if (!log_file_) {
        std::cerr << Config::instance().program_name() << ": cannot open log file " << options.log_file->string()
                  << '\n';
        logger.set_output_stream(nullptr);
        return;
    }
    logger.set_output_stream(&log_file_);
}

int App::run(int argc, char** argv) {
    Config& config = Config::instance();
    config.set_program_name(argc > 0 && argv ? argv[0] : "gitadd");
    if (auto exit_code = cli_.parse(argc, argv, config)) {
        return *exit_code;
    }

    const Options& options = config.options();
    const auto program = std::string{config.program_name()};
    configure_logging(options);
    auto& logger = Logger::instance();

    if (!platform::stdin_is_tty() || !platform::stdout_is_tty()) {
        std::cerr << program << ": standard input and output must be a terminal\n";
        return 1;
    }

    GitRepository repository{GitRepository::Settings{
        options.git_executable,
        options.repository,
        options.untracked_files,
    }};
    SelectionMachine machine{repository};

    SelectionState state;
    try {
        state = machine.initial_state();
    } catch (const std::exception& error) {
        logger.error("startup failed: {}", error.what());
        std::cerr << program << ": " << error.what() << '\n';
        return 1;
    }

    std::optional<std::string> fatal;
    platform::use_system_locale();
    try {
        Terminal terminal{platform::supports_color(options.color_policy)};
        Theme theme{terminal.color_enabled()};
        Renderer renderer{terminal, theme};

        while (!state.quit) {
            state.page_size = renderer.list_height(state);
            renderer.draw(state);
            const auto event = terminal.read_key();
            state = machine.update(std::move(state), event);
        }
    } catch (const std::exception& error) {
        logger.error("terminal failure: {}", error.what());
        fatal = error.what();
    }

    if (fatal) {
        std::cerr << program << ": " << *fatal << '\n';
        return 1;
    }
    return 0;
}

} // namespace gitadd
