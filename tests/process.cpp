#include "gitadd/errors.hpp"
#include "gitadd/process.hpp"

#include <filesystem>
#include <iostream>
#include <string>

int main() {
    // Separate streams and exit status
    {
        auto result = gitadd::run_process("/bin/sh", {"-c", "printf out; printf err >&2; exit 3"});
        if (result.exit_code != 3 || result.stdout_data != "out" || result.stderr_data != "err") {
            std::cerr << "unexpected result: " << result.exit_code << " [" << result.stdout_data << "] ["
                      << result.stderr_data << "]\n";
            return 1;
        }
    }

    // Arguments are passed verbatim, no shell expansion
    {
        auto result = gitadd::run_process("printf", {"%s|", "a b", "$HOME", "*"});
        if (result.exit_code != 0 || result.stdout_data != "a b|$HOME|*|") {
            std::cerr << "arguments were altered: [" << result.stdout_data << "]\n";
            return 1;
        }
    }

    // Working directory
    {
        auto dir = std::filesystem::temp_directory_path();
        auto result = gitadd::run_process("pwd", {}, dir);
        auto expected = std::filesystem::canonical(dir).string();
        if (result.exit_code != 0 || result.stdout_data.find(expected) == std::string::npos) {
            std::cerr << "working directory not honoured: [" << result.stdout_data << "]\n";
            return 1;
        }
    }

    // Large output does not deadlock
    {
        auto result = gitadd::run_process("/bin/sh", {"-c", "i=0; while [ $i -lt 20000 ]; do echo line $i; echo e $i >&2; i=$((i+1)); done"});
        if (result.exit_code != 0 || result.stdout_data.size() < 100000 || result.stderr_data.size() < 50000) {
            std::cerr << "large output was truncated\n";
            return 1;
        }
    }

    // Missing command
    {
        auto result = gitadd::run_process("gitadd-no-such-command", {});
        if (result.exit_code != 127) {
            std::cerr << "missing command should report 127, got " << result.exit_code << "\n";
            return 1;
        }
    }

    // run_checked
    {
        if (gitadd::run_checked("/bin/sh", {"-c", "echo ok"}) != "ok\n") {
            std::cerr << "run_checked should return stdout\n";
            return 1;
        }
        try {
            (void)gitadd::run_checked("/bin/sh", {"-c", "echo boom >&2; exit 2"});
            std::cerr << "run_checked should throw on failure\n";
            return 1;
        } catch (const gitadd::ExternalToolError& error) {
            if (error.exit_code() != 2 || std::string(error.what()).find("boom") == std::string::npos) {
                std::cerr << "error lacks details: " << error.what() << "\n";
                return 1;
            }
        }
    }

    std::cout << "process OK\n";
    return 0;
}
