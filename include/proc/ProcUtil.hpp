#pragma once

#include <string>
#include <vector>

namespace procutil {

struct ProcResult {
    int exit_code = 0;  // child exit status; 128 + signal number if it was killed
    std::string out;    // raw stdout bytes
};

// Runs argv[0] (searched on PATH) with argv[1..] and blocks until it exits,
// capturing stdout. stderr is inherited from the caller.
// Throws std::system_error if the process cannot be started or its output
// cannot be read; throws std::invalid_argument on an empty argv.
ProcResult run_capture(const std::vector<std::string>& argv);

// Quotes one argument for a Win32 command line (CommandLineToArgvW rules).
std::string quote_windows_arg(const std::string& arg);

} // namespace procutil
