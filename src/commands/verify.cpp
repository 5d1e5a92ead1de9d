#include "commands/verify.hpp"
#include "commands/CommandArgs.hpp"

#include <iostream>

int cmd_verify(wim::Wim& w, int argc, char** argv) {
    const CommandArgs args = parse_command_args(argc, argv);
    if (args.positional.size() != 1) throw UsageError("verify expects <input.wim>");

    w.verify(args.positional[0]);

    std::cout << "VERIFY: pass\n";
    return 0;
}
