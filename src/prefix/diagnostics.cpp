#include <tprefix/diagnostics.hpp>
#include <tprefix/log.hpp>
#include <tprefix/text.hpp>

namespace tprefix {

const char* event_kind_name(DiagnosticEvent::Kind k) {
    switch (k) {
        case DiagnosticEvent::Rejected:  return "rejected";
        case DiagnosticEvent::Sanitized: return "sanitized";
    }
    return "unknown";
}

DiagnosticHook log_diagnostics() {
    return [](const DiagnosticEvent& ev) {
        std::string in = escape(ev.input);
        switch (ev.kind) {
            case DiagnosticEvent::Rejected:
                log::debug("rejected prefix '%s': %s", in.c_str(),
                           ev.error ? validation_error_name(*ev.error) : "unknown");
                break;
            case DiagnosticEvent::Sanitized:
                if (ev.output.empty()) {
                    log::info("sanitized prefix '%s' to the empty prefix", in.c_str());
                } else {
                    log::info("sanitized prefix '%s' to '%s'", in.c_str(),
                              ev.output.c_str());
                }
                break;
        }
    };
}

} // namespace tprefix
