#include <tprefix/text.hpp>

namespace tprefix {

static const char hex_chars[] = "0123456789abcdef";

std::string escape(const std::string& raw) {
    std::string out;
    out.reserve(raw.size());
    for (char c : raw) {
        auto b = static_cast<unsigned char>(c);
        if (c == '\\' || c == '\'' || c == '"') {
            out += '\\';
            out += c;
        } else if (b >= 0x20 && b < 0x7f) {
            out += c;
        } else {
            out += "\\x";
            out += hex_chars[b >> 4];
            out += hex_chars[b & 0x0F];
        }
    }
    return out;
}

} // namespace tprefix
