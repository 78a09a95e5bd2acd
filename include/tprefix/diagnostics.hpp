#pragma once

#include <tprefix/validation_error.hpp>
#include <functional>
#include <optional>
#include <string>

namespace tprefix {

// Emitted by TypeIdPrefix::parse when it rejects an input, and by
// TypeIdPrefix::sanitize when the cleaned prefix differs from the input.
struct DiagnosticEvent {
    enum Kind { Rejected, Sanitized };

    Kind kind;
    std::string input;
    std::string output;                    // Sanitized only
    std::optional<ValidationError> error;  // Rejected only
};

// Optional observer; an empty hook means no diagnostics. Hooks must not
// throw and must be safe to call from whichever thread is validating.
using DiagnosticHook = std::function<void(const DiagnosticEvent&)>;

const char* event_kind_name(DiagnosticEvent::Kind k);

// Hook that reports rejections at debug level and alterations at info level
// through tprefix::log.
DiagnosticHook log_diagnostics();

} // namespace tprefix
