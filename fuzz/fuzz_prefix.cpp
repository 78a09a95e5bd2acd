// libFuzzer entry point: every byte string must classify without crashing,
// and the sanitizer's output must always validate.
//
//     cmake -B build-fuzz -DTPREFIX_BUILD_FUZZ=ON -DCMAKE_CXX_COMPILER=clang++
//     ./build-fuzz/fuzz_prefix -max_len=256

#include <tprefix/prefix.hpp>
#include <tprefix/sanitize.hpp>
#include <tprefix/validate.hpp>

#include <cstddef>
#include <cstdint>
#include <cstdlib>
#include <string>

using namespace tprefix;

extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size) {
    std::string input(reinterpret_cast<const char*>(data), size);

    auto parsed = TypeIdPrefix::parse(input);
    if (parsed.is_ok() && parsed.value().str() != input) std::abort();

    auto sanitized = TypeIdPrefix::sanitize(input);
    if (!is_valid_prefix(sanitized.str())) std::abort();
    if (sanitized.size() > TypeIdPrefix::max_length) std::abort();
    if (TypeIdPrefix::sanitize(sanitized.str()) != sanitized) std::abort();

    // A string the validator accepts is left alone by the sanitizer
    if (parsed.is_ok() && sanitized != parsed.value()) std::abort();

    return 0;
}
