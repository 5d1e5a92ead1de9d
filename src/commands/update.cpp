#include "commands/update.hpp"
#include "commands/CommandArgs.hpp"

#include <iostream>

int cmd_update(wim::Wim& w, int argc, char** argv) {
    const CommandArgs args = parse_command_args(argc, argv);
    if (args.positional.size() < 3 || args.positional.size() > 4) {
        throw UsageError("update expects <input.wim> <add|delete|rename> <input> [<output>]");
    }

    wim::UpdateCommand cmd;
    cmd.kind = wim::parse_update_kind(args.positional[1]);
    cmd.input = args.positional[2];
    if (args.positional.size() == 4) cmd.output = args.positional[3];

    if (cmd.kind != wim::UpdateKind::Delete && cmd.output.empty()) {
        throw UsageError(std::string(wim::update_kind_name(cmd.kind)) + " needs both <input> and <output>");
    }

    w.update(args.positional[0], cmd, args.options);

    std::cout << "UPDATED: " << args.positional[0] << "\n";
    return 0;
}
