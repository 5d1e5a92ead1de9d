#include "commands/CommandArgs.hpp"

static std::string require_value(int argc, char** argv, int& i, const std::string& key) {
    if (i + 1 >= argc) throw UsageError(key + " requires a value");
    return argv[++i];
}

int parse_positive_int(const std::string& s, const std::string& what) {
    size_t used = 0;
    int v = 0;
    try {
        v = std::stoi(s, &used);
    } catch (const std::exception&) {
        throw UsageError(what + " must be a number: " + s);
    }
    if (used != s.size() || v < 1) throw UsageError(what + " must be a positive number: " + s);
    return v;
}

CommandArgs parse_command_args(int argc, char** argv) {
    CommandArgs out;

    for (int i = 1; i < argc; ++i) {
        const std::string a = argv[i];

        if (a == "--dest-dir")         { out.options.dest_dir = require_value(argc, argv, i, a); continue; }
        if (a == "--compress")         { out.options.compress = require_value(argc, argv, i, a); continue; }
        if (a == "--image") {
            out.options.image = parse_positive_int(require_value(argc, argv, i, a), "--image");
            continue;
        }
        if (a == "--to-stdout")        { out.options.to_stdout = true; continue; }
        if (a == "--source-list")      { out.options.source_list = true; continue; }
        if (a == "--no-acls")          { out.options.no_acls = true; continue; }
        if (a == "--unix-data")        { out.options.unix_data = true; continue; }
        if (a == "--rebuild")          { out.options.rebuild = true; continue; }
        if (a == "--check")            { out.options.check = true; continue; }
        if (a == "--no-globs")         { out.options.no_globs = true; continue; }

        if (a.size() > 2 && a.compare(0, 2, "--") == 0) throw UsageError("unknown arg: " + a);

        out.positional.push_back(a);
    }
    return out;
}
