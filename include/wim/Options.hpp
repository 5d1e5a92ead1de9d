#pragma once

#include <string>
#include <vector>

namespace wim {

// Switches forwarded to wimlib-imagex. Empty strings and false mean "absent".
struct Options {
    std::string dest_dir;
    bool to_stdout = false;   // only meaningful for extract of single files
    bool source_list = false;
    std::string compress;     // e.g. "none", "fast", "maximum", "LZMS"
    bool no_acls = false;
    bool unix_data = false;
    bool rebuild = false;
    bool check = false;
    bool no_globs = false;

    // 1-based image index; 0 = unset (extract/update default to 1).
    // Passed positionally, never as a flag.
    int image = 0;
};

// Flags in a fixed order: dest-dir, to-stdout, source-list, compress, no-acls,
// unix-data, rebuild, check, no-globs. Combinations are not validated.
std::vector<std::string> build_option_args(const Options& opt);

} // namespace wim
