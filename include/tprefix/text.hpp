#pragma once

#include <string>

namespace tprefix {

// Render arbitrary bytes for a log line or error message: printable ASCII is
// kept, everything else becomes \xNN. Backslashes and quotes are escaped.
std::string escape(const std::string& raw);

} // namespace tprefix
