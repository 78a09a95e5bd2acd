#include <tprefix/error.hpp>
#include <tprefix/text.hpp>

namespace tprefix {

const char* Error::code_name(Code c) {
    switch (c) {
        case IO:         return "IO";
        case Parse:      return "Parse";
        case Config:     return "Config";
        case InvalidArg: return "InvalidArg";
        case Validation: return "Validation";
    }
    return "Unknown";
}

std::string Error::format() const {
    std::string result = "error[";
    result += code_name(code);
    result += "]: ";
    result += message;

    if (!hint.empty()) {
        result += "\n  hint: ";
        result += hint;
    }

    if (!file.empty()) {
        result += "\n  --> ";
        result += file;
        if (line > 0) {
            result += ":";
            result += std::to_string(line);
        }
    }

    return result;
}

static const char* validation_hint(ValidationError e) {
    switch (e) {
        case ValidationError::IsEmpty:
            return "a non-empty prefix is required here";
        case ValidationError::ExceedsMaxLength:
            return "prefixes are at most 63 characters";
        case ValidationError::ContainsInvalidCharacters:
            return "allowed: [a-z_]";
        case ValidationError::InvalidStartCharacter:
        case ValidationError::InvalidEndCharacter:
            return "underscores are only allowed between letters";
    }
    return "";
}

Error Error::from_validation(ValidationError e, const std::string& input) {
    return Error{Validation,
        "invalid prefix '" + escape(input) + "': " +
            validation_error_message(e),
        validation_hint(e)};
}

} // namespace tprefix
