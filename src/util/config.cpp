#include <tprefix/config.hpp>
#include <toml++/toml.hpp>
#include <fstream>
#include <sstream>
#include <cstdlib>

namespace tprefix {

const char* Config::mode_name(Mode m) {
    switch (m) {
        case Validate: return "validate";
        case Sanitize: return "sanitize";
    }
    return "unknown";
}

Result<Config::Mode> Config::parse_mode(const std::string& name) {
    if (name == "validate") return Result<Mode>::ok(Validate);
    if (name == "sanitize") return Result<Mode>::ok(Sanitize);
    return Error{Error::Config,
        "unknown prefix mode '" + name + "'",
        "expected one of: validate, sanitize"};
}

static Error type_error(const std::string& key, const char* expected,
                        const toml::node_view<toml::node>& node) {
    return Error{Error::Config,
        "config key '" + key + "' must be a " + expected, "",
        "", static_cast<int>(node.node()->source().begin.line)};
}

Result<Config> Config::parse(const std::string& toml_str) {
    toml::table doc;
    try {
        doc = toml::parse(toml_str);
    } catch (const toml::parse_error& e) {
        return Error{Error::Parse,
            std::string("config TOML parse error: ") + e.what()};
    }

    Config cfg;

    // [log] section
    if (auto log_tbl = doc["log"].as_table()) {
        if (auto node = (*log_tbl)["level"]) {
            auto name = node.value<std::string>();
            if (!name) return type_error("log.level", "string", node);
            auto lvl = log::parse_level(*name);
            TPREFIX_TRY(lvl);
            cfg.log_level = lvl.value();
            cfg.log_level_set = true;
        }
        if (auto node = (*log_tbl)["color"]) {
            auto v = node.value<bool>();
            if (!v) return type_error("log.color", "boolean", node);
            cfg.log_color = *v;
            cfg.log_color_set = true;
        }
    }

    // [prefix] section
    if (auto prefix_tbl = doc["prefix"].as_table()) {
        if (auto node = (*prefix_tbl)["mode"]) {
            auto name = node.value<std::string>();
            if (!name) return type_error("prefix.mode", "string", node);
            auto mode = parse_mode(*name);
            TPREFIX_TRY(mode);
            cfg.mode = mode.value();
            cfg.mode_set = true;
        }
        if (auto node = (*prefix_tbl)["require-non-empty"]) {
            auto v = node.value<bool>();
            if (!v) return type_error("prefix.require-non-empty", "boolean", node);
            cfg.require_non_empty = *v;
            cfg.require_non_empty_set = true;
        }
    }

    return Result<Config>::ok(std::move(cfg));
}

Result<Config> Config::load(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return Error{Error::IO,
            "cannot open config file: " + path};
    }
    std::ostringstream ss;
    ss << file.rdbuf();
    auto cfg = Config::parse(ss.str());
    if (cfg.is_err() && cfg.error().file.empty()) {
        cfg.error().file = path;
    }
    return cfg;
}

void Config::merge(const Config& other) {
    if (other.log_level_set) {
        log_level = other.log_level;
        log_level_set = true;
    }
    if (other.log_color_set) {
        log_color = other.log_color;
        log_color_set = true;
    }
    if (other.mode_set) {
        mode = other.mode;
        mode_set = true;
    }
    if (other.require_non_empty_set) {
        require_non_empty = other.require_non_empty;
        require_non_empty_set = true;
    }
}

Config Config::effective(const std::optional<Config>& global,
                         const std::optional<Config>& local) {
    Config result;
    if (global.has_value()) result.merge(global.value());
    if (local.has_value()) result.merge(local.value());
    return result;
}

std::string global_config_path() {
    const char* home = std::getenv("HOME");
    if (!home) home = std::getenv("USERPROFILE");
    if (!home) return "";
    return std::string(home) + "/.tprefix/config.toml";
}

std::string local_config_path() {
    return "tprefix.toml";
}

} // namespace tprefix
