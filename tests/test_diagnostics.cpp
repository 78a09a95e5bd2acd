#include <catch2/catch.hpp>
#include <tprefix/diagnostics.hpp>
#include <tprefix/log.hpp>
#include <tprefix/prefix.hpp>
#include "capture_stderr.hpp"
#include <string>
#include <vector>

using namespace tprefix;

namespace {

struct Recorder {
    std::vector<DiagnosticEvent> events;

    DiagnosticHook hook() {
        return [this](const DiagnosticEvent& ev) { events.push_back(ev); };
    }
};

} // namespace

TEST_CASE("no hook means no diagnostics and same result", "[diagnostics]") {
    auto r = TypeIdPrefix::parse("Bad");
    REQUIRE(r.error() == ValidationError::ContainsInvalidCharacters);
}

TEST_CASE("rejection fires one Rejected event", "[diagnostics]") {
    Recorder rec;
    auto r = TypeIdPrefix::parse("bad_", rec.hook());
    REQUIRE(r.error() == ValidationError::InvalidEndCharacter);
    REQUIRE(rec.events.size() == 1);
    REQUIRE(rec.events[0].kind == DiagnosticEvent::Rejected);
    REQUIRE(rec.events[0].input == "bad_");
    REQUIRE(rec.events[0].error == ValidationError::InvalidEndCharacter);
}

TEST_CASE("acceptance fires nothing", "[diagnostics]") {
    Recorder rec;
    REQUIRE(TypeIdPrefix::parse("fine", rec.hook()).is_ok());
    REQUIRE(TypeIdPrefix::parse("", rec.hook()).is_ok());
    REQUIRE(rec.events.empty());
}

TEST_CASE("parse_required reports IsEmpty", "[diagnostics]") {
    Recorder rec;
    REQUIRE(TypeIdPrefix::parse_required("", rec.hook()).is_err());
    REQUIRE(rec.events.size() == 1);
    REQUIRE(rec.events[0].error == ValidationError::IsEmpty);
}

TEST_CASE("sanitize fires only when the input changed", "[diagnostics]") {
    Recorder rec;
    auto same = TypeIdPrefix::sanitize("already_fine", rec.hook());
    REQUIRE(rec.events.empty());

    auto changed = TypeIdPrefix::sanitize("Not Fine!", rec.hook());
    REQUIRE(rec.events.size() == 1);
    REQUIRE(rec.events[0].kind == DiagnosticEvent::Sanitized);
    REQUIRE(rec.events[0].input == "Not Fine!");
    REQUIRE(rec.events[0].output == "not_fine");
    REQUIRE_FALSE(rec.events[0].error.has_value());

    // The hook observes; it never changes what is returned
    REQUIRE(same == TypeIdPrefix::sanitize("already_fine"));
    REQUIRE(changed == TypeIdPrefix::sanitize("Not Fine!"));
}

TEST_CASE("event_kind_name", "[diagnostics]") {
    REQUIRE(std::string(event_kind_name(DiagnosticEvent::Rejected)) == "rejected");
    REQUIRE(std::string(event_kind_name(DiagnosticEvent::Sanitized)) == "sanitized");
}

TEST_CASE("log_diagnostics writes rejections at debug", "[diagnostics][log]") {
    auto saved = log::get_level();
    log::set_level(log::Debug);
    log::set_color_enabled(false);

    auto hook = log_diagnostics();
    auto r = TypeIdPrefix::ParseResult::ok(TypeIdPrefix{});
    auto output = capture_stderr([&] { r = TypeIdPrefix::parse("bad\xff", hook); });
    REQUIRE(r.error() == ValidationError::ContainsInvalidCharacters);
    REQUIRE(output == "debug: rejected prefix 'bad\\xff': ContainsInvalidCharacters\n");

    log::set_level(saved);
}

TEST_CASE("log_diagnostics writes sanitizations at info", "[diagnostics][log]") {
    auto saved = log::get_level();
    log::set_level(log::Debug);
    log::set_color_enabled(false);

    auto hook = log_diagnostics();
    auto changed = capture_stderr([&] {
        TypeIdPrefix::sanitize("Not Fine!", hook);
    });
    REQUIRE(changed == "info: sanitized prefix 'Not Fine!' to 'not_fine'\n");

    TypeIdPrefix cleaned = TypeIdPrefix::sanitize("x");
    auto emptied = capture_stderr([&] { cleaned = TypeIdPrefix::sanitize("###", hook); });
    REQUIRE(cleaned.empty());
    REQUIRE(emptied == "info: sanitized prefix '###' to the empty prefix\n");

    auto unchanged = capture_stderr([&] {
        TypeIdPrefix::sanitize("already_fine", hook);
    });
    REQUIRE(unchanged.empty());

    log::set_level(saved);
}

TEST_CASE("log_diagnostics keeps the error kind for long inputs", "[diagnostics][log]") {
    auto saved = log::get_level();
    log::set_level(log::Debug);
    log::set_color_enabled(false);

    std::string input(300, '\xff');
    input[0] = 'A';
    auto hook = log_diagnostics();
    auto r = TypeIdPrefix::ParseResult::ok(TypeIdPrefix{});
    auto output = capture_stderr([&] { r = TypeIdPrefix::parse(input, hook); });
    REQUIRE(r.error() == ValidationError::ExceedsMaxLength);

    std::string escaped = "A";
    for (int i = 0; i < 299; ++i) escaped += "\\xff";
    REQUIRE(output == "debug: rejected prefix '" + escaped + "': ExceedsMaxLength\n");

    log::set_level(saved);
}

TEST_CASE("log_diagnostics is silent above the threshold", "[diagnostics][log]") {
    auto saved = log::get_level();
    log::set_level(log::Error);
    log::set_color_enabled(false);

    auto hook = log_diagnostics();
    auto output = capture_stderr([&] {
        TypeIdPrefix::parse("\xff", hook);
        TypeIdPrefix::sanitize("###", hook);
    });
    REQUIRE(output.empty());

    log::set_level(saved);
}
