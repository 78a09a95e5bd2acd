#include <tprefix/validation_error.hpp>

namespace tprefix {

const char* validation_error_name(ValidationError e) {
    switch (e) {
        case ValidationError::IsEmpty:                   return "IsEmpty";
        case ValidationError::ExceedsMaxLength:          return "ExceedsMaxLength";
        case ValidationError::ContainsInvalidCharacters: return "ContainsInvalidCharacters";
        case ValidationError::InvalidStartCharacter:     return "InvalidStartCharacter";
        case ValidationError::InvalidEndCharacter:       return "InvalidEndCharacter";
    }
    return "Unknown";
}

const char* validation_error_message(ValidationError e) {
    switch (e) {
        case ValidationError::IsEmpty:
            return "input is empty";
        case ValidationError::ExceedsMaxLength:
            return "input exceeds 63 characters";
        case ValidationError::ContainsInvalidCharacters:
            return "input contains invalid characters: only lowercase ASCII "
                   "letters and underscores are allowed";
        case ValidationError::InvalidStartCharacter:
            return "input must start with a lowercase alphabetic character";
        case ValidationError::InvalidEndCharacter:
            return "input must end with a lowercase alphabetic character";
    }
    return "unknown validation error";
}

} // namespace tprefix
