#include <tprefix/validate.hpp>

namespace tprefix {

std::optional<Violation> find_violation(const std::string& input) {
    if (input.size() > kMaxPrefixLength) {
        return Violation{ValidationError::ExceedsMaxLength, kMaxPrefixLength};
    }

    for (std::size_t i = 0; i < input.size(); ++i) {
        if (!is_prefix_char(input[i])) {
            return Violation{ValidationError::ContainsInvalidCharacters, i};
        }
    }

    if (input.empty()) {
        return std::nullopt;
    }

    // Only letters and underscores remain, so "not a letter" means '_'
    if (input.front() == '_') {
        return Violation{ValidationError::InvalidStartCharacter, 0};
    }
    if (input.back() == '_') {
        return Violation{ValidationError::InvalidEndCharacter, input.size() - 1};
    }

    return std::nullopt;
}

bool is_valid_prefix(const std::string& input) {
    return !find_violation(input).has_value();
}

} // namespace tprefix
