#include "commands/CommandArgs.hpp"
#include "commands/capture.hpp"
#include "commands/dir.hpp"
#include "commands/extract.hpp"
#include "commands/info.hpp"
#include "commands/update.hpp"
#include "commands/verify.hpp"

#include "util/ConsoleLogSink.hpp"
#include "util/FileLogSink.hpp"
#include "util/Logger.hpp"
#include "wim/ProcessRunner.hpp"
#include "wim/Wim.hpp"

#include <cstdlib>
#include <iostream>
#include <memory>
#include <string>

static int print_usage() {
    std::cerr
        << "usage:\n"
        << "  wim-adapter [global options] <command> [args]\n"
        << "\n"
        << "commands:\n"
        << "  capture <source> <output.wim>       [--compress <level>] [--source-list]\n"
        << "                                      [--no-acls] [--unix-data] [--rebuild] [--check]\n"
        << "  extract <input.wim> <path>          [--dest-dir <dir>] [--to-stdout] [--image <n>]\n"
        << "                                      [--no-globs] [--no-acls] [--unix-data] [--check]\n"
        << "  info <input.wim>                    print image metadata as JSON\n"
        << "  update <input.wim> <add|delete|rename> <input> [<output>]\n"
        << "                                      [--image <n>] [--no-acls] [--rebuild] [--check]\n"
        << "  verify <input.wim>\n"
        << "  dir <input.wim>\n"
        << "  help\n"
        << "\n"
        << "global options:\n"
        << "  --imagex <path>              default: $WIMLIB_IMAGEX, else wimlib-imagex\n"
        << "  --verbose                    debug logging to stderr\n"
        << "  --log-level <LEVEL>          stderr logging from LEVEL up: DEBUG, INFO, WARN, ERROR\n"
        << "  --log-file <path>            append log records to a file\n"
        << "  --dry-run                    print the wimlib-imagex command line instead of running it\n";
    return 2;
}

int main(int argc, char** argv) {
    std::string imagex;
    if (const char* env = std::getenv("WIMLIB_IMAGEX")) imagex = env;

    bool verbose = false;
    std::string log_level;
    bool dry_run = false;
    std::string log_file;

    int i = 1;
    for (; i < argc; ++i) {
        const std::string a = argv[i];
        if (a.compare(0, 2, "--") != 0) break;

        if (a == "--help") return print_usage();
        if (a == "--verbose") { verbose = true; continue; }
        if (a == "--dry-run") { dry_run = true; continue; }
        if (a == "--imagex" || a == "--log-file" || a == "--log-level") {
            if (i + 1 >= argc) {
                std::cerr << "error: " << a << " requires a value\n";
                return 2;
            }
            if (a == "--imagex") imagex = argv[++i];
            else if (a == "--log-file") log_file = argv[++i];
            else log_level = argv[++i];
            continue;
        }

        std::cerr << "error: unknown arg: " << a << "\n";
        return print_usage();
    }

    if (i >= argc) return print_usage();

    const std::string cmd = argv[i];
    if (cmd == "help") return print_usage();

    // --verbose wins over --log-level
    if (verbose) {
        util::Logger::add_sink(std::make_unique<util::ConsoleLogSink>(util::LogLevel::Debug));
    } else if (!log_level.empty()) {
        util::Logger::add_sink(std::make_unique<util::ConsoleLogSink>(util::Logger::string_to_level(log_level)));
    }
    if (!log_file.empty()) {
        try {
            util::Logger::add_sink(std::make_unique<util::FileLogSink>(log_file));
        } catch (const std::exception& e) {
            std::cerr << "error: " << e.what() << "\n";
            return 2;
        }
    }

    wim::SystemProcessRunner system_runner;
    wim::DryRunProcessRunner dry_runner(std::cout);
    wim::ProcessRunner* runner = dry_run ? static_cast<wim::ProcessRunner*>(&dry_runner) : &system_runner;

    wim::Wim w(imagex.empty() ? wim::kDefaultImagexBin : imagex, runner);

    // subcommands see their own name as argv[0]
    const int sub_argc = argc - i;
    char** sub_argv = argv + i;

    try {
        if (cmd == "capture") return cmd_capture(w, sub_argc, sub_argv);
        if (cmd == "extract") return cmd_extract(w, sub_argc, sub_argv);
        if (cmd == "info")    return cmd_info(w, sub_argc, sub_argv);
        if (cmd == "update")  return cmd_update(w, sub_argc, sub_argv);
        if (cmd == "verify")  return cmd_verify(w, sub_argc, sub_argv);
        if (cmd == "dir")     return cmd_dir(w, sub_argc, sub_argv);
    } catch (const UsageError& e) {
        std::cerr << "error: " << e.what() << "\n";
        return print_usage();
    } catch (const std::exception& e) {
        util::Logger::error(std::string(cmd) + " failed: " + e.what());
        std::cerr << "error: " << e.what() << "\n";
        return 1;
    }

    std::cerr << "unknown command: " << cmd << "\n";
    return print_usage();
}
