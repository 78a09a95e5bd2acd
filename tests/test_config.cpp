#include <catch2/catch.hpp>
#include <tprefix/config.hpp>
#include <cstdio>
#include <fstream>

using namespace tprefix;

// ===== Parsing =====

TEST_CASE("parse config with log section", "[config]") {
    auto r = Config::parse(R"(
[log]
level = "debug"
color = true
)");
    REQUIRE(r.is_ok());
    REQUIRE(r.value().log_level == log::Debug);
    REQUIRE(r.value().log_level_set);
    REQUIRE(r.value().log_color == true);
    REQUIRE(r.value().log_color_set);
}

TEST_CASE("parse config with prefix section", "[config]") {
    auto r = Config::parse(R"(
[prefix]
mode = "sanitize"
require-non-empty = true
)");
    REQUIRE(r.is_ok());
    REQUIRE(r.value().mode == Config::Sanitize);
    REQUIRE(r.value().require_non_empty == true);
    REQUIRE_FALSE(r.value().log_level_set);
}

TEST_CASE("parse empty config", "[config]") {
    auto r = Config::parse("");
    REQUIRE(r.is_ok());
    REQUIRE(r.value().mode == Config::Validate);
    REQUIRE(r.value().log_level == log::Warn);
    REQUIRE_FALSE(r.value().mode_set);
    REQUIRE_FALSE(r.value().require_non_empty_set);
}

TEST_CASE("parse invalid TOML config", "[config]") {
    auto r = Config::parse("not valid [toml");
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == Error::Parse);
}

TEST_CASE("unknown log level is a config error", "[config]") {
    auto r = Config::parse(R"(
[log]
level = "loud"
)");
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == Error::Config);
}

TEST_CASE("unknown mode is a config error", "[config]") {
    auto r = Config::parse(R"(
[prefix]
mode = "repair"
)");
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == Error::Config);
    REQUIRE(r.error().message.find("repair") != std::string::npos);
}

TEST_CASE("wrongly typed value reports its line", "[config]") {
    auto r = Config::parse("[prefix]\nrequire-non-empty = \"yes\"\n");
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == Error::Config);
    REQUIRE(r.error().message.find("prefix.require-non-empty") != std::string::npos);
    REQUIRE(r.error().line == 2);
}

TEST_CASE("mode_name / parse_mode roundtrip", "[config]") {
    for (auto m : {Config::Validate, Config::Sanitize}) {
        auto r = Config::parse_mode(Config::mode_name(m));
        REQUIRE(r.is_ok());
        REQUIRE(r.value() == m);
    }
}

// ===== Merge =====

TEST_CASE("merge overrides only explicitly-set fields", "[config]") {
    auto base = Config::parse(R"(
[log]
level = "info"
color = true

[prefix]
mode = "sanitize"
)").value();

    auto overlay = Config::parse(R"(
[log]
level = "error"
)").value();

    base.merge(overlay);
    REQUIRE(base.log_level == log::Error);       // overridden
    REQUIRE(base.log_color == true);             // preserved
    REQUIRE(base.mode == Config::Sanitize);      // preserved
}

TEST_CASE("merge can turn a flag back off", "[config]") {
    auto base = Config::parse("[prefix]\nrequire-non-empty = true\n").value();
    auto overlay = Config::parse("[prefix]\nrequire-non-empty = false\n").value();

    base.merge(overlay);
    REQUIRE(base.require_non_empty == false);
    REQUIRE(base.require_non_empty_set);
}

// ===== Effective config =====

TEST_CASE("effective config layering", "[config]") {
    auto global = Config::parse(R"(
[log]
level = "warn"

[prefix]
mode = "sanitize"
require-non-empty = true
)").value();

    auto local = Config::parse(R"(
[prefix]
mode = "validate"
)").value();

    auto eff = Config::effective(global, local);

    // mode: global=sanitize, local=validate -> validate
    REQUIRE(eff.mode == Config::Validate);
    // require-non-empty only set globally
    REQUIRE(eff.require_non_empty == true);
    REQUIRE(eff.log_level == log::Warn);
}

TEST_CASE("effective with no layers", "[config]") {
    auto eff = Config::effective({}, {});
    REQUIRE(eff.mode == Config::Validate);
    REQUIRE_FALSE(eff.require_non_empty);
}

// ===== Loading =====

TEST_CASE("load config from file", "[config]") {
    std::string path = "test_config_load.toml";
    {
        std::ofstream out(path);
        out << "[prefix]\nmode = \"sanitize\"\n";
    }
    auto r = Config::load(path);
    std::remove(path.c_str());

    REQUIRE(r.is_ok());
    REQUIRE(r.value().mode == Config::Sanitize);
}

TEST_CASE("load missing file is an IO error", "[config]") {
    auto r = Config::load("does/not/exist/tprefix.toml");
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == Error::IO);
}

TEST_CASE("load error names the file", "[config]") {
    std::string path = "test_config_bad.toml";
    {
        std::ofstream out(path);
        out << "[log]\nlevel = \"loud\"\n";
    }
    auto r = Config::load(path);
    std::remove(path.c_str());

    REQUIRE(r.is_err());
    REQUIRE(r.error().file == path);
}

// ===== Paths =====

TEST_CASE("global config path contains .tprefix", "[config]") {
    auto path = global_config_path();
    // May be empty if HOME is not set, but if set, should contain .tprefix
    if (!path.empty()) {
        REQUIRE(path.find(".tprefix/config.toml") != std::string::npos);
    }
}

TEST_CASE("local config path", "[config]") {
    REQUIRE(local_config_path() == "tprefix.toml");
}
