#include "util/Logger.hpp"

namespace util {

std::vector<std::unique_ptr<ILogSink>> Logger::sinks_;
std::mutex Logger::mtx_;

void Logger::add_sink(std::unique_ptr<ILogSink> sink) {
    std::lock_guard<std::mutex> lock(mtx_);
    if (sink) sinks_.push_back(std::move(sink));
}

void Logger::clear_sinks() {
    std::lock_guard<std::mutex> lock(mtx_);
    sinks_.clear();
}

void Logger::log(LogLevel level, std::string_view msg, std::string_view tag) {
    std::lock_guard<std::mutex> lock(mtx_);
    for (const auto& sink : sinks_) {
        if (sink) sink->log(level, msg, tag);
    }
}

} // namespace util
