#include "wim/ProcessRunner.hpp"

#include <utility>

namespace wim {

procutil::ProcResult SystemProcessRunner::run(const std::vector<std::string>& argv) {
    return procutil::run_capture(argv);
}

DryRunProcessRunner::DryRunProcessRunner(std::ostream& out, std::string canned_output)
    : out_(out), canned_output_(std::move(canned_output)) {}

procutil::ProcResult DryRunProcessRunner::run(const std::vector<std::string>& argv) {
    {
        std::lock_guard<std::mutex> lock(mtx_);
        out_ << format_command_line(argv) << "\n";
    }
    procutil::ProcResult res;
    res.exit_code = 0;
    res.out = canned_output_;
    return res;
}

static bool needs_quoting(const std::string& s) {
    if (s.empty()) return true;
    for (char c : s) {
        switch (c) {
            case ' ': case '\t': case '\n': case '"': case '\'': case '\\':
            case '$': case '`': case '*': case '?': case '&': case '|':
            case ';': case '<': case '>': case '(': case ')':
                return true;
            default:
                break;
        }
    }
    return false;
}

std::string format_command_line(const std::vector<std::string>& argv) {
    std::string out;
    for (size_t i = 0; i < argv.size(); ++i) {
        if (i) out += ' ';
        const std::string& a = argv[i];
        if (!needs_quoting(a)) {
            out += a;
            continue;
        }
        out += '\'';
        for (char c : a) {
            if (c == '\'') out += "'\\''";
            else out += c;
        }
        out += '\'';
    }
    return out;
}

} // namespace wim
