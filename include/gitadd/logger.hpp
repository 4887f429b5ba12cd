#pragma once

#include <atomic>
#include <format>
#include <mutex>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>

namespace gitadd {

enum class LogLevel {
    Error = 0,
    Warn,
    Info,
    Debug,
    Trace,
};

[[nodiscard]] std::optional<LogLevel> parse_log_level(std::string_view value);

class Logger {
public:
    static Logger& instance();

    void set_level(LogLevel level) noexcept;
    [[nodiscard]] bool enabled(LogLevel level) const noexcept;

    // nullptr silences the logger; the terminal belongs to the UI.
    void set_output_stream(std::ostream* stream);

    template <typename... Args>
    void log(LogLevel level, std::format_string<Args...> fmt, Args&&... args) {
        if (!enabled(level)) {
            return;
        }
        write(level, std::format(fmt, std::forward<Args>(args)...));
    }

    template <typename... Args>
    void error(std::format_string<Args...> fmt, Args&&... args) {
        log(LogLevel::Error, fmt, std::forward<Args>(args)...);
    }

    template <typename... Args>
    void warn(std::format_string<Args...> fmt, Args&&... args) {
        log(LogLevel::Warn, fmt, std::forward<Args>(args)...);
    }

    template <typename... Args>
    void info(std::format_string<Args...> fmt, Args&&... args) {
        log(LogLevel::Info, fmt, std::forward<Args>(args)...);
    }

    template <typename... Args>
    void debug(std::format_string<Args...> fmt, Args&&... args) {
        log(LogLevel::Debug, fmt, std::forward<Args>(args)...);
    }

private:
    Logger() = default;

    void write(LogLevel level, std::string_view message);

    [[nodiscard]] static constexpr std::string_view to_string(LogLevel level) noexcept {
        switch (level) {
        case LogLevel::Error: return "ERROR";
        case LogLevel::Warn: return "WARN";
        case LogLevel::Info: return "INFO";
        case LogLevel::Debug: return "DEBUG";
        case LogLevel::Trace: return "TRACE";
        }
        return "INFO";
    }

    std::atomic<LogLevel> level_ { LogLevel::Error };
    std::ostream* stream_ { nullptr };
    std::mutex mutex_;
};

} // namespace gitadd
