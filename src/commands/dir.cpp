#include "commands/dir.hpp"
#include "commands/CommandArgs.hpp"

#include <iostream>

int cmd_dir(wim::Wim& w, int argc, char** argv) {
    const CommandArgs args = parse_command_args(argc, argv);
    if (args.positional.size() != 1) throw UsageError("dir expects <input.wim>");

    std::cout << w.dir(args.positional[0]);
    return 0;
}
