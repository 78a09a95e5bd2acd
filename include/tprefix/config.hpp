#pragma once

#include <tprefix/log.hpp>
#include <tprefix/result.hpp>
#include <optional>
#include <string>

namespace tprefix {

// Layered configuration: global > local > --config file
// Later layers override only the fields they set.
struct Config {
    enum Mode { Validate, Sanitize };

    log::Level log_level = log::Warn;
    bool log_color = false;
    Mode mode = Validate;
    bool require_non_empty = false;

    // Track which fields were explicitly set (for merge)
    bool log_level_set = false;
    bool log_color_set = false;
    bool mode_set = false;
    bool require_non_empty_set = false;

    // Load from a TOML config file
    static Result<Config> load(const std::string& path);

    // Parse from TOML string
    static Result<Config> parse(const std::string& toml_str);

    // Merge another config on top (other's explicitly-set values win)
    void merge(const Config& other);

    static Config effective(const std::optional<Config>& global,
                            const std::optional<Config>& local);

    static const char* mode_name(Mode m);
    static Result<Mode> parse_mode(const std::string& name);
};

// ~/.tprefix/config.toml, or "" when no home directory is known
std::string global_config_path();

// tprefix.toml in the current directory
std::string local_config_path();

} // namespace tprefix
