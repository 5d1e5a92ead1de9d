#include "wim/Encoding.hpp"

#include <algorithm>
#include <cstdint>

namespace wim {

Platform host_platform() {
#if defined(_WIN32) || defined(__CYGWIN__)
    return Platform::Windows;
#else
    return Platform::Posix;
#endif
}

CaptureEncoding choose_capture_encoding(Platform platform, bool xml_requested) {
    if (platform != Platform::Windows && xml_requested) return CaptureEncoding::Utf16le;
    return CaptureEncoding::Utf8;
}

static void append_utf8(std::string& out, uint32_t cp) {
    if (cp < 0x80) {
        out += static_cast<char>(cp);
    } else if (cp < 0x800) {
        out += static_cast<char>(0xC0 | (cp >> 6));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    } else if (cp < 0x10000) {
        out += static_cast<char>(0xE0 | (cp >> 12));
        out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    } else {
        out += static_cast<char>(0xF0 | (cp >> 18));
        out += static_cast<char>(0x80 | ((cp >> 12) & 0x3F));
        out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    }
}

std::string utf16le_to_utf8(const std::string& bytes) {
    const size_t units = bytes.size() / 2;
    auto unit_at = [&bytes](size_t i) -> uint32_t {
        return static_cast<unsigned char>(bytes[2 * i]) |
               (static_cast<uint32_t>(static_cast<unsigned char>(bytes[2 * i + 1])) << 8);
    };

    std::string out;
    out.reserve(units);

    size_t i = 0;
    if (units > 0 && unit_at(0) == 0xFEFF) i = 1;

    for (; i < units; ++i) {
        const uint32_t u = unit_at(i);
        if (u >= 0xD800 && u <= 0xDBFF) {
            if (i + 1 < units) {
                const uint32_t lo = unit_at(i + 1);
                if (lo >= 0xDC00 && lo <= 0xDFFF) {
                    append_utf8(out, 0x10000 + ((u - 0xD800) << 10) + (lo - 0xDC00));
                    ++i;
                    continue;
                }
            }
            append_utf8(out, 0xFFFD);
        } else if (u >= 0xDC00 && u <= 0xDFFF) {
            append_utf8(out, 0xFFFD);
        } else {
            append_utf8(out, u);
        }
    }
    return out;
}

std::string clean_mis_encoded_xml(const std::string& raw) {
    if (raw.size() < 3) return std::string();

    std::string out = raw.substr(2);
    const char noise = out[0];
    out.erase(std::remove(out.begin(), out.end(), noise), out.end());
    return out;
}

std::string normalize_output(const std::string& raw, CaptureEncoding enc, bool xml_requested) {
    if (enc == CaptureEncoding::Utf16le) return utf16le_to_utf8(raw);
    if (xml_requested) return clean_mis_encoded_xml(raw);
    return raw;
}

} // namespace wim
