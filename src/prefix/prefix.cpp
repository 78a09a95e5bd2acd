#include <tprefix/prefix.hpp>
#include <tprefix/sanitize.hpp>
#include <ostream>

namespace tprefix {

TypeIdPrefix::ParseResult TypeIdPrefix::parse(const std::string& input,
                                              const DiagnosticHook& hook) {
    auto violation = find_violation(input);
    if (violation) {
        if (hook) {
            hook(DiagnosticEvent{DiagnosticEvent::Rejected, input, "",
                                 violation->kind});
        }
        return violation->kind;
    }
    return ParseResult::ok(TypeIdPrefix(input));
}

TypeIdPrefix::ParseResult TypeIdPrefix::parse_required(const std::string& input,
                                                       const DiagnosticHook& hook) {
    if (input.empty()) {
        if (hook) {
            hook(DiagnosticEvent{DiagnosticEvent::Rejected, input, "",
                                 ValidationError::IsEmpty});
        }
        return ValidationError::IsEmpty;
    }
    return parse(input, hook);
}

TypeIdPrefix TypeIdPrefix::sanitize(const std::string& input,
                                    const DiagnosticHook& hook) {
    TypeIdPrefix result(sanitize_string(input));
    if (hook && result.value_ != input) {
        hook(DiagnosticEvent{DiagnosticEvent::Sanitized, input, result.value_,
                             std::nullopt});
    }
    return result;
}

std::ostream& operator<<(std::ostream& os, const TypeIdPrefix& p) {
    return os << p.str();
}

} // namespace tprefix
