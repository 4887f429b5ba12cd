#include "gitadd/cli.hpp"

#include "gitadd/logger.hpp"
#include "gitadd/version.hpp"

#include <iostream>
#include <map>
#include <string>
#include <utility>

namespace gitadd {

namespace {
constexpr const char* kDescription = "gitadd - interactive staging of working tree changes";

struct CliState {
    Options options;
    std::string repository;
    std::string color{"auto"};
    std::string log_level{"error"};
    std::string log_file;
    bool markdown{false};
};

ColorPolicy parse_color_policy(const std::string& value) {
    static const std::map<std::string, ColorPolicy, std::less<>> table{
        {"auto", ColorPolicy::Auto},
        {"always", ColorPolicy::Always},
        {"never", ColorPolicy::Never},
    };
    auto it = table.find(value);
    return it == table.end() ? ColorPolicy::Auto : it->second;
}

} // namespace

Cli::Cli()
    : app_(std::make_unique<CLI::App>(kDescription, "gitadd")) {}

Cli::~Cli() = default;

std::optional<int> Cli::parse(int argc, char** argv, Config& config) {
    CliState state{};
    app_ = std::make_unique<CLI::App>(kDescription, "gitadd");
    app_->set_version_flag("-V,--version", std::string{Version::String()});
    app_->set_config("--config", "", "Read options from an INI or TOML file");
    app_->footer("Keys: up/down move, right stage, left unstage, a stage all, u unstage all,\n"
                 "r refresh, / filter, q quit.");

    auto* markdown_flag = app_->add_flag("--help-markdown", state.markdown,
        "Print CLI options in Markdown table format");
    markdown_flag->configurable(false);

    app_->add_option("-C,--repo", state.repository, "Run as if started in this directory")
        ->type_name("DIR")
        ->check(CLI::ExistingDirectory);

    app_->add_option("--git", state.options.git_executable, "git executable to invoke")
        ->type_name("PATH")
        ->envname("GITADD_GIT")
        ->capture_default_str();

    app_->add_option("--untracked-files", state.options.untracked_files,
        "Untracked file listing (normal, all, no)")
        ->type_name("MODE")
        ->check(CLI::IsMember({"normal", "all", "no"}))
        ->capture_default_str();

    app_->add_option("--color", state.color, "Use colors (auto, always, never)")
        ->type_name("WHEN")
        ->check(CLI::IsMember({"auto", "always", "never"}))
        ->default_str("auto");

    app_->add_option("-v,--log-level", state.log_level, "Set log verbosity")
        ->type_name("LEVEL")
        ->envname("GITADD_LOG_LEVEL")
        ->check(CLI::IsMember({"error", "warn", "warning", "info", "debug", "trace"}))
        ->default_str("error");

    app_->add_option("--log-file", state.log_file, "Append log output to this file")->type_name("PATH");

    try {
        app_->parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        return app_->exit(e);
    }

    if (state.markdown) {
        print_markdown(std::cout);
        return 0;
    }

    state.options.color_policy = parse_color_policy(state.color);
    state.options.log_level = parse_log_level(state.log_level).value_or(LogLevel::Error);
    if (!state.repository.empty()) {
        state.options.repository = state.repository;
    }
    if (!state.log_file.empty()) {
        state.options.log_file = state.log_file;
    }

    config.set_options(std::move(state.options));
    return std::nullopt;
}

void Cli::print_markdown(std::ostream& os) const {
    os << "| Option | Description |\n";
    os << "|--------|-------------|\n";
    for (const auto* option : app_->get_options()) {
        if (option->get_lnames().empty() && option->get_snames().empty()) {
            continue;
        }
        if (option->get_description().empty()) {
            continue;
        }
        std::string names;
        for (const auto& sname : option->get_snames()) {
            if (!names.empty()) {
                names += ", ";
            }
            names += "-" + sname;
        }
        for (const auto& lname : option->get_lnames()) {
            if (!names.empty()) {
                names += ", ";
            }
            names += "--" + lname;
        }
        os << "| " << names << " | " << option->get_description() << " |\n";
    }
}

} // namespace gitadd
