#pragma once

#include <tprefix/validation_error.hpp>
#include <cstddef>
#include <optional>
#include <string>

namespace tprefix {

// Prefix grammar: empty, or [a-z]([a-z_]{0,61}[a-z])?
inline constexpr std::size_t kMaxPrefixLength = 63;

inline bool is_prefix_char(char c) {
    return (c >= 'a' && c <= 'z') || c == '_';
}

// First rule `input` breaks and the byte offset where it broke.
// For ExceedsMaxLength the position is the first byte past the limit.
struct Violation {
    ValidationError kind;
    std::size_t position;

    bool operator==(const Violation& o) const {
        return kind == o.kind && position == o.position;
    }
    bool operator!=(const Violation& o) const { return !(*this == o); }
};

// Checks length, then character set, then start, then end. The empty string
// passes; callers that need a non-empty prefix check for that themselves.
std::optional<Violation> find_violation(const std::string& input);

bool is_valid_prefix(const std::string& input);

} // namespace tprefix
