#pragma once

#include "util/LogSink.hpp"

#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <vector>

namespace util {

// Static logging facade. Records go to every registered sink; with no sink
// registered logging is a no-op.
class Logger {
public:
    static void add_sink(std::unique_ptr<ILogSink> sink);
    static void clear_sinks();

    static void log(LogLevel level, std::string_view msg, std::string_view tag = "wim");

    static void debug(std::string_view msg, std::string_view tag = "wim") { log(LogLevel::Debug, msg, tag); }
    static void info(std::string_view msg, std::string_view tag = "wim") { log(LogLevel::Info, msg, tag); }
    static void warn(std::string_view msg, std::string_view tag = "wim") { log(LogLevel::Warning, msg, tag); }
    static void error(std::string_view msg, std::string_view tag = "wim") { log(LogLevel::Error, msg, tag); }

    static const char* level_to_string(LogLevel level) {
        switch (level) {
            case LogLevel::Debug:   return "DEBUG";
            case LogLevel::Info:    return "INFO";
            case LogLevel::Warning: return "WARN";
            case LogLevel::Error:   return "ERROR";
        }
        return "";
    }

    // Case-sensitive; anything unknown maps to Error.
    static LogLevel string_to_level(const std::string& level) {
        if (level == "DEBUG") return LogLevel::Debug;
        if (level == "INFO") return LogLevel::Info;
        if (level == "WARN" || level == "WARNING") return LogLevel::Warning;
        return LogLevel::Error;
    }

private:
    static std::vector<std::unique_ptr<ILogSink>> sinks_;
    static std::mutex mtx_;
};

} // namespace util
