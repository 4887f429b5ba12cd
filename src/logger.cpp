#include "gitadd/logger.hpp"

#include <map>

namespace gitadd {

std::optional<LogLevel> parse_log_level(std::string_view value) {
    static const std::map<std::string, LogLevel, std::less<>> table{
        {"error", LogLevel::Error},
        {"warn", LogLevel::Warn},
        {"warning", LogLevel::Warn},
        {"info", LogLevel::Info},
        {"debug", LogLevel::Debug},
        {"trace", LogLevel::Trace},
    };
    auto it = table.find(value);
    if (it == table.end()) {
        return std::nullopt;
    }
    return it->second;
}

Logger& Logger::instance() {
    static Logger logger;
    return logger;
}

void Logger::set_level(LogLevel level) noexcept {
    level_.store(level, std::memory_order_relaxed);
}

bool Logger::enabled(LogLevel level) const noexcept {
    return level <= level_.load(std::memory_order_relaxed);
}

void Logger::set_output_stream(std::ostream* stream) {
    std::scoped_lock lock(mutex_);
    stream_ = stream;
}

void Logger::write(LogLevel level, std::string_view message) {
    std::scoped_lock lock(mutex_);
    if (!stream_) {
        return;
    }
    *stream_ << '[' << to_string(level) << "] " << message << '\n';
    stream_->flush();
}

} // namespace gitadd
