#include <tprefix/sanitize.hpp>
#include <tprefix/validate.hpp>
#include <algorithm>

namespace tprefix {

static char fold_ascii(char c) {
    if (c >= 'A' && c <= 'Z') {
        return static_cast<char>(c - 'A' + 'a');
    }
    return c;
}

static bool is_separator(char c) {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r' ||
           c == '\v' || c == '\f';
}

std::string sanitize_string(const std::string& input) {
    std::string out;
    out.reserve(std::min(input.size(), kMaxPrefixLength));
    bool pending_separator = false;

    for (char raw : input) {
        if (is_separator(raw)) {
            pending_separator = true;
            continue;
        }
        char c = fold_ascii(raw);
        if (!is_prefix_char(c)) continue;

        if (pending_separator && !out.empty() && out.back() != '_' && c != '_') {
            out += '_';
            if (out.size() == kMaxPrefixLength) break;
        }
        pending_separator = false;

        // Leading underscores are trimmed as they arrive
        if (out.empty() && c == '_') continue;

        out += c;
        // Truncate; a trailing '_' exposed by the cut is trimmed below
        if (out.size() == kMaxPrefixLength) break;
    }

    while (!out.empty() && out.back() == '_') {
        out.pop_back();
    }

    return out;
}

} // namespace tprefix
