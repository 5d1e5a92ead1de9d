#include "wim/UpdateCommand.hpp"

#include "wim/Errors.hpp"

namespace wim {

static std::string quote_path(const std::string& path) {
    const bool has_double = path.find('"') != std::string::npos;
    const bool has_single = path.find('\'') != std::string::npos;

    if (!has_double) return "\"" + path + "\"";
    if (!has_single) return "'" + path + "'";
    throw UnsupportedCommandError("cannot quote path containing both quote characters: " + path);
}

UpdateKind parse_update_kind(const std::string& s) {
    if (s == "add") return UpdateKind::Add;
    if (s == "delete") return UpdateKind::Delete;
    if (s == "rename") return UpdateKind::Rename;
    throw UnsupportedCommandError("command " + s + " not supported");
}

const char* update_kind_name(UpdateKind kind) {
    switch (kind) {
        case UpdateKind::Add:    return "add";
        case UpdateKind::Delete: return "delete";
        case UpdateKind::Rename: return "rename";
    }
    return "";
}

std::string render_update_command(const UpdateCommand& cmd) {
    switch (cmd.kind) {
        case UpdateKind::Add:
            return "add " + quote_path(cmd.input) + " " + quote_path(cmd.output);
        case UpdateKind::Delete:
            return "delete " + quote_path(cmd.input);
        case UpdateKind::Rename:
            return "rename " + quote_path(cmd.input) + " " + quote_path(cmd.output);
    }
    throw UnsupportedCommandError("command " + std::to_string(static_cast<int>(cmd.kind)) + " not supported");
}

} // namespace wim
