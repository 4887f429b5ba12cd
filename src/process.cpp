#include "gitadd/process.hpp"

#include "gitadd/errors.hpp"
#include "gitadd/logger.hpp"

#include <algorithm>
#include <array>
#include <cerrno>
#include <cstring>
#include <string_view>
#include <utility>

#include <fcntl.h>
#include <sys/select.h>
#include <sys/wait.h>
#include <unistd.h>

namespace gitadd {
namespace {

constexpr int kExecFailed = 127;

class Pipe {
public:
    Pipe() {
        if (::pipe(fds_.data()) != 0) {
            fds_ = {-1, -1};
        }
    }
    ~Pipe() {
        close_read();
        close_write();
    }
    Pipe(const Pipe&) = delete;
    Pipe& operator=(const Pipe&) = delete;

    [[nodiscard]] bool valid() const noexcept { return fds_[0] >= 0 && fds_[1] >= 0; }
    [[nodiscard]] int read_end() const noexcept { return fds_[0]; }
    [[nodiscard]] int write_end() const noexcept { return fds_[1]; }

    void close_read() noexcept { close_fd(fds_[0]); }
    void close_write() noexcept { close_fd(fds_[1]); }

private:
    static void close_fd(int& fd) noexcept {
        if (fd >= 0) {
            ::close(fd);
            fd = -1;
        }
    }

    std::array<int, 2> fds_ { -1, -1 };
};

void write_all(int fd, std::string_view text) noexcept {
    while (!text.empty()) {
        const auto written = ::write(fd, text.data(), text.size());
        if (written <= 0) {
            return;
        }
        text.remove_prefix(static_cast<std::size_t>(written));
    }
}

[[noreturn]] void exec_child(const std::string& command, const std::vector<std::string>& arguments,
    const std::filesystem::path& working_directory, Pipe& out, Pipe& err) {
    ::dup2(out.write_end(), STDOUT_FILENO);
    ::dup2(err.write_end(), STDERR_FILENO);
    out.close_read();
    out.close_write();
    err.close_read();
    err.close_write();

    const int devnull = ::open("/dev/null", O_RDONLY);
    if (devnull >= 0) {
        ::dup2(devnull, STDIN_FILENO);
        ::close(devnull);
    }

    if (!working_directory.empty() && ::chdir(working_directory.c_str()) != 0) {
        write_all(STDERR_FILENO, std::string{"cannot change directory to "} + working_directory.string() + ": "
                + std::strerror(errno) + '\n');
        ::_exit(kExecFailed);
    }

    std::vector<char*> argv;
    argv.reserve(arguments.size() + 2);
    argv.push_back(const_cast<char*>(command.c_str()));
    for (const auto& argument : arguments) {
        argv.push_back(const_cast<char*>(argument.c_str()));
    }
    argv.push_back(nullptr);

    ::execvp(command.c_str(), argv.data());
    write_all(STDERR_FILENO, command + ": " + std::strerror(errno) + '\n');
    ::_exit(kExecFailed);
}

void drain(int out_fd, int err_fd, ProcessResult& result) {
    std::array<char, 4096> buffer{};
    while (out_fd >= 0 || err_fd >= 0) {
        fd_set read_fds;
        FD_ZERO(&read_fds);
        if (out_fd >= 0) {
            FD_SET(out_fd, &read_fds);
        }
        if (err_fd >= 0) {
            FD_SET(err_fd, &read_fds);
        }
        const int max_fd = std::max(out_fd, err_fd) + 1;
        if (::select(max_fd, &read_fds, nullptr, nullptr, nullptr) < 0) {
            if (errno == EINTR) {
                continue;
            }
            break;
        }

        auto pump = [&](int& fd, std::string& sink) {
            if (fd < 0 || !FD_ISSET(fd, &read_fds)) {
                return;
            }
            const auto count = ::read(fd, buffer.data(), buffer.size());
            if (count > 0) {
                sink.append(buffer.data(), static_cast<std::size_t>(count));
            } else if (count == 0 || errno != EINTR) {
                fd = -1;
            }
        };
        pump(out_fd, result.stdout_data);
        pump(err_fd, result.stderr_data);
    }
}

} // namespace

ProcessResult run_process(const std::string& command, const std::vector<std::string>& arguments,
    const std::filesystem::path& working_directory) {
    auto& logger = Logger::instance();
    logger.debug("exec: {}", format_command_line(command, arguments));

    ProcessResult result;
    Pipe out;
    Pipe err;
    if (!out.valid() || !err.valid()) {
        result.exit_code = kExecFailed;
        result.stderr_data = std::string{"cannot create pipe: "} + std::strerror(errno);
        return result;
    }

    const pid_t pid = ::fork();
    if (pid < 0) {
        result.exit_code = kExecFailed;
        result.stderr_data = std::string{"fork failed: "} + std::strerror(errno);
        return result;
    }
    if (pid == 0) {
        exec_child(command, arguments, working_directory, out, err);
    }

    out.close_write();
    err.close_write();
    drain(out.read_end(), err.read_end(), result);

    int status = 0;
    while (::waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR) {
            status = -1;
            break;
        }
    }
    if (status >= 0 && WIFEXITED(status)) {
        result.exit_code = WEXITSTATUS(status);
    } else if (status >= 0 && WIFSIGNALED(status)) {
        result.exit_code = 128 + WTERMSIG(status);
    } else {
        result.exit_code = -1;
    }

    logger.debug("exit {} ({} bytes out, {} bytes err)", result.exit_code, result.stdout_data.size(),
        result.stderr_data.size());
    return result;
}

std::string run_checked(const std::string& command, const std::vector<std::string>& arguments,
    const std::filesystem::path& working_directory) {
    auto result = run_process(command, arguments, working_directory);
    if (result.exit_code != 0) {
        throw ExternalToolError(command, arguments, result.exit_code, std::move(result.stderr_data));
    }
    return std::move(result.stdout_data);
}

} // namespace gitadd
