#include "commands/info.hpp"
#include "commands/CommandArgs.hpp"

#include <iostream>

int cmd_info(wim::Wim& w, int argc, char** argv) {
    const CommandArgs args = parse_command_args(argc, argv);
    if (args.positional.size() != 1) throw UsageError("info expects <input.wim>");

    const nlohmann::json meta = w.info(args.positional[0]);
    std::cout << meta.dump(2) << "\n";
    return 0;
}
