#pragma once

#include <string>

namespace tprefix {

// Best-effort coercion into the prefix grammar:
//   1. fold A-Z to a-z
//   2. a run of ASCII whitespace between words becomes one '_', unless an
//      underscore already sits on either side of it
//   3. drop everything else outside [a-z_] (digits, punctuation, bytes >= 0x80)
//   4. trim leading and trailing underscores
//   5. keep at most 63 characters, then trim underscores the cut exposed
// Existing underscore runs are kept as-is. The result always satisfies
// find_violation() and may be empty.
//
// Whitespace is a word separator here, where the Rust typeid_prefix crate
// drops it: "Invalid String 123!@#" gives "invalid_string", not
// "invalidstring".
std::string sanitize_string(const std::string& input);

} // namespace tprefix
