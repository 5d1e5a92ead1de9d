#pragma once

#include "util/LogSink.hpp"
#include "util/Logger.hpp"

#include <fstream>
#include <mutex>
#include <stdexcept>
#include <string>

namespace util {

class FileLogSink final : public ILogSink {
public:
    explicit FileLogSink(const std::string& filename, bool append = true)
        : out_(filename, append ? std::ios::app : std::ios::trunc) {
        if (!out_) throw std::runtime_error("failed to open log file: " + filename);
    }

    void log(LogLevel level, std::string_view message, std::string_view tag) override {
        std::lock_guard<std::mutex> lock(mtx_);
        out_ << "[" << Logger::level_to_string(level) << "]";
        if (!tag.empty()) out_ << "[" << tag << "]";
        out_ << " " << message << "\n";
        out_.flush();
    }

private:
    std::ofstream out_;
    std::mutex mtx_;
};

} // namespace util
