#pragma once

#include <chrono>
#include <string>
#include <utility>

#include "gitadd/logger.hpp"

namespace gitadd {

// Logs how long a scope took, e.g. "load cycle (12 paths) took 840 us".
class ScopedTimer {
public:
    explicit ScopedTimer(std::string label, LogLevel level = LogLevel::Debug)
        : label_(std::move(label))
        , level_(level)
        , start_(std::chrono::steady_clock::now()) {}

    ~ScopedTimer() {
        const auto elapsed = std::chrono::duration_cast<std::chrono::microseconds>(
            std::chrono::steady_clock::now() - start_);
        if (detail_.empty()) {
            Logger::instance().log(level_, "{} took {} us", label_, elapsed.count());
        } else {
            Logger::instance().log(level_, "{} ({}) took {} us", label_, detail_, elapsed.count());
        }
    }

    ScopedTimer(const ScopedTimer&) = delete;
    ScopedTimer& operator=(const ScopedTimer&) = delete;

    // What the scope produced; reported next to the label.
    void set_detail(std::string detail) { detail_ = std::move(detail); }

private:
    std::string label_;
    std::string detail_;
    LogLevel level_;
    std::chrono::steady_clock::time_point start_;
};

} // namespace gitadd
