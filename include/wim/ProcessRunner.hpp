#pragma once

#include "proc/ProcUtil.hpp"

#include <mutex>
#include <ostream>
#include <string>
#include <vector>

namespace wim {

// Seam between the adapter and the operating system. argv[0] is the program.
class ProcessRunner {
public:
    virtual ~ProcessRunner() = default;

    virtual procutil::ProcResult run(const std::vector<std::string>& argv) = 0;
};

// Spawns for real through procutil::run_capture. Stateless.
class SystemProcessRunner final : public ProcessRunner {
public:
    procutil::ProcResult run(const std::vector<std::string>& argv) override;
};

// Prints the command line it would run and reports success with a canned
// stdout (empty by default). Used by `wim-adapter --dry-run`.
class DryRunProcessRunner final : public ProcessRunner {
    std::ostream& out_;
    std::string canned_output_;
    std::mutex mtx_;

public:
    explicit DryRunProcessRunner(std::ostream& out, std::string canned_output = {});

    procutil::ProcResult run(const std::vector<std::string>& argv) override;
};

// Shell-style rendering of argv, for logs and dry runs.
std::string format_command_line(const std::vector<std::string>& argv);

} // namespace wim
