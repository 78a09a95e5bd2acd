#pragma once

namespace tprefix {

// Why a candidate string is not a legal prefix. Closed set.
enum class ValidationError {
    IsEmpty,
    ExceedsMaxLength,
    ContainsInvalidCharacters,
    InvalidStartCharacter,
    InvalidEndCharacter
};

// Stable identifier, e.g. "ExceedsMaxLength"
const char* validation_error_name(ValidationError e);

// Human-readable explanation of the violated rule
const char* validation_error_message(ValidationError e);

} // namespace tprefix
