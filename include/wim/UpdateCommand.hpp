#pragma once

#include <string>

namespace wim {

enum class UpdateKind {
    Add,
    Delete,
    Rename
};

// add:    input = file on disk,       output = destination in the image
// delete: input = path in the image,  output unused
// rename: input = old path,           output = new path
struct UpdateCommand {
    UpdateKind kind = UpdateKind::Add;
    std::string input;
    std::string output;
};

// "add" | "delete" | "rename"; anything else throws UnsupportedCommandError.
UpdateKind parse_update_kind(const std::string& s);
const char* update_kind_name(UpdateKind kind);

// Renders the single textual instruction understood by `wimlib-imagex update`,
// e.g. add "a" "b". Paths containing '"' are wrapped in single quotes instead;
// a path holding both quote characters throws UnsupportedCommandError.
std::string render_update_command(const UpdateCommand& cmd);

} // namespace wim
