#include "commands/extract.hpp"
#include "commands/CommandArgs.hpp"

#include <iostream>

int cmd_extract(wim::Wim& w, int argc, char** argv) {
    const CommandArgs args = parse_command_args(argc, argv);
    if (args.positional.size() != 2) throw UsageError("extract expects <input.wim> <path>");

    const std::string out = w.extract(args.positional[0], args.positional[1], {}, args.options);

    // with --to-stdout this is the file content itself
    std::cout.write(out.data(), static_cast<std::streamsize>(out.size()));
    std::cout.flush();
    return 0;
}
