#pragma once

#include "wim/Options.hpp"

#include <stdexcept>
#include <string>
#include <vector>

// Bad command line; main() prints the usage text and exits with 2.
struct UsageError : std::runtime_error {
    using std::runtime_error::runtime_error;
};

struct CommandArgs {
    std::vector<std::string> positional;
    wim::Options options;
};

// argv[0] is the subcommand name. Recognizes every wimlib option flag;
// which ones make sense for a given command is left to wimlib-imagex.
CommandArgs parse_command_args(int argc, char** argv);

int parse_positive_int(const std::string& s, const std::string& what);
