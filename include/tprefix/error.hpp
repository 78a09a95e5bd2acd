#pragma once

#include <tprefix/validation_error.hpp>
#include <string>

namespace tprefix {

struct Error {
    enum Code {
        IO,
        Parse,
        Config,
        InvalidArg,
        Validation
    };

    Code code;
    std::string message;
    std::string hint;
    std::string file;
    int line = 0;

    Error() = default;
    Error(Code c, std::string msg)
        : code(c), message(std::move(msg)) {}
    Error(Code c, std::string msg, std::string h)
        : code(c), message(std::move(msg)), hint(std::move(h)) {}
    Error(Code c, std::string msg, std::string h, std::string f, int l)
        : code(c), message(std::move(msg)), hint(std::move(h)),
          file(std::move(f)), line(l) {}

    std::string format() const;
    static const char* code_name(Code c);

    // Wrap a prefix validation failure for application-level reporting
    static Error from_validation(ValidationError e, const std::string& input);
};

} // namespace tprefix
