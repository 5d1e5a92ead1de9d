#include "commands/capture.hpp"
#include "commands/CommandArgs.hpp"

#include <iostream>

int cmd_capture(wim::Wim& w, int argc, char** argv) {
    const CommandArgs args = parse_command_args(argc, argv);
    if (args.positional.size() != 2) throw UsageError("capture expects <source> <output.wim>");

    const std::string& source = args.positional[0];
    const std::string& out_wim = args.positional[1];

    w.capture(out_wim, source, args.options);

    std::cout << "OUT_WIM: " << out_wim << "\n";
    return 0;
}
