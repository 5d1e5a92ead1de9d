#pragma once

#include "util/LogSink.hpp"
#include "util/Logger.hpp"

#include <iostream>

namespace util {

// Writes "[LEVEL][tag] message" lines to stderr, dropping records below min_level.
class ConsoleLogSink final : public ILogSink {
public:
    explicit ConsoleLogSink(LogLevel min_level = LogLevel::Warning) : min_level_(min_level) {}

    void log(LogLevel level, std::string_view message, std::string_view tag) override {
        if (level < min_level_) return;
        std::cerr << "[" << Logger::level_to_string(level) << "]";
        if (!tag.empty()) std::cerr << "[" << tag << "]";
        std::cerr << " " << message << "\n";
    }

private:
    LogLevel min_level_;
};

} // namespace util
