#include "wim/Options.hpp"

namespace wim {

std::vector<std::string> build_option_args(const Options& opt) {
    std::vector<std::string> args;
    if (!opt.dest_dir.empty()) args.push_back("--dest-dir=" + opt.dest_dir);
    if (opt.to_stdout) args.push_back("--to-stdout");
    if (opt.source_list) args.push_back("--source-list");
    if (!opt.compress.empty()) args.push_back("--compress=" + opt.compress);
    if (opt.no_acls) args.push_back("--no-acls");
    if (opt.unix_data) args.push_back("--unix-data");
    if (opt.rebuild) args.push_back("--rebuild");
    if (opt.check) args.push_back("--check");
    if (opt.no_globs) args.push_back("--no-globs");
    return args;
}

} // namespace wim
