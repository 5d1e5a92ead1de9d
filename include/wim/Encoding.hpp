#pragma once

#include <string>

namespace wim {

enum class Platform {
    Posix,
    Windows
};

enum class CaptureEncoding {
    Utf8,    // raw 8-bit bytes
    Utf16le
};

Platform host_platform();

// wimlib-imagex writes its XML as UTF-16LE. It can be read as such everywhere
// except on Windows consoles, where the stream arrives mangled and has to be
// taken as 8-bit text and cleaned.
CaptureEncoding choose_capture_encoding(Platform platform, bool xml_requested);

// Decodes UTF-16LE bytes to UTF-8. Drops a leading BOM and an odd trailing
// byte; unpaired surrogates become U+FFFD.
std::string utf16le_to_utf8(const std::string& bytes);

// Cleanup for an 8-bit capture of XML output: drop the first two characters
// (BOM remnant), take the next one as the noise marker and remove every
// occurrence of it. Heuristic: a payload character equal to the marker is
// removed too. Inputs shorter than three characters come back empty.
std::string clean_mis_encoded_xml(const std::string& raw);

// Full post-processing pass for one invocation's stdout.
std::string normalize_output(const std::string& raw, CaptureEncoding enc, bool xml_requested);

} // namespace wim
