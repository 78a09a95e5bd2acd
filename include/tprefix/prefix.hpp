#pragma once

#include <tprefix/diagnostics.hpp>
#include <tprefix/result.hpp>
#include <tprefix/validate.hpp>
#include <tprefix/validation_error.hpp>
#include <cstddef>
#include <functional>
#include <iosfwd>
#include <string>

namespace tprefix {

// The prefix segment of a TypeID, e.g. "user" in "user_2x4y6z8a0b1c2d3e4f5g6h7j8k".
// Every instance satisfies the prefix grammar (see validate.hpp); the only
// ways to obtain one are parse(), parse_required(), sanitize() and the
// default constructor, which yields the empty prefix.
class TypeIdPrefix {
public:
    static constexpr std::size_t max_length = kMaxPrefixLength;

    using ParseResult = Result<TypeIdPrefix, ValidationError>;

    TypeIdPrefix() = default;

    // Accepts `input` unchanged or reports the first rule it breaks.
    // The empty string is accepted as the empty prefix.
    static ParseResult parse(const std::string& input,
                             const DiagnosticHook& hook = {});

    // Like parse(), but the empty string is rejected with IsEmpty
    static ParseResult parse_required(const std::string& input,
                                      const DiagnosticHook& hook = {});

    // Never fails; see sanitize_string() for the transformation
    static TypeIdPrefix sanitize(const std::string& input,
                                 const DiagnosticHook& hook = {});

    const std::string& str() const { return value_; }
    const char* c_str() const { return value_.c_str(); }
    std::size_t size() const { return value_.size(); }
    bool empty() const { return value_.empty(); }

    bool operator==(const TypeIdPrefix& o) const { return value_ == o.value_; }
    bool operator!=(const TypeIdPrefix& o) const { return value_ != o.value_; }
    bool operator<(const TypeIdPrefix& o) const { return value_ < o.value_; }
    bool operator>(const TypeIdPrefix& o) const { return value_ > o.value_; }
    bool operator<=(const TypeIdPrefix& o) const { return value_ <= o.value_; }
    bool operator>=(const TypeIdPrefix& o) const { return value_ >= o.value_; }

    friend bool operator==(const TypeIdPrefix& p, const std::string& s) { return p.value_ == s; }
    friend bool operator==(const std::string& s, const TypeIdPrefix& p) { return p.value_ == s; }
    friend bool operator!=(const TypeIdPrefix& p, const std::string& s) { return p.value_ != s; }
    friend bool operator!=(const std::string& s, const TypeIdPrefix& p) { return p.value_ != s; }
    friend bool operator==(const TypeIdPrefix& p, const char* s) { return p.value_ == s; }
    friend bool operator==(const char* s, const TypeIdPrefix& p) { return p.value_ == s; }
    friend bool operator!=(const TypeIdPrefix& p, const char* s) { return p.value_ != s; }
    friend bool operator!=(const char* s, const TypeIdPrefix& p) { return p.value_ != s; }

private:
    explicit TypeIdPrefix(std::string value) : value_(std::move(value)) {}

    std::string value_;
};

std::ostream& operator<<(std::ostream& os, const TypeIdPrefix& p);

// Free-function spellings of TypeIdPrefix::parse / TypeIdPrefix::sanitize
inline TypeIdPrefix::ParseResult validate_prefix(const std::string& input,
                                                 const DiagnosticHook& hook = {}) {
    return TypeIdPrefix::parse(input, hook);
}

inline TypeIdPrefix sanitize_prefix(const std::string& input,
                                    const DiagnosticHook& hook = {}) {
    return TypeIdPrefix::sanitize(input, hook);
}

} // namespace tprefix

namespace std {

template<>
struct hash<tprefix::TypeIdPrefix> {
    size_t operator()(const tprefix::TypeIdPrefix& p) const noexcept {
        return hash<string>{}(p.str());
    }
};

} // namespace std
