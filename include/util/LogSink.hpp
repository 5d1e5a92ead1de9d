#pragma once

#include <string_view>

namespace util {

enum class LogLevel {
    Debug,
    Info,
    Warning,
    Error
};

// Destination for log records (console, file, ...). Implementations must be
// safe to call from several threads; Logger serializes calls anyway.
struct ILogSink {
    virtual ~ILogSink() = default;

    virtual void log(LogLevel level, std::string_view message, std::string_view tag) = 0;
};

} // namespace util
