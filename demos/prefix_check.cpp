// prefix_check.cpp
//
// Command-line front end for the prefix validator and sanitizer.
//
//     ./prefix_check user order_item            # validate arguments
//     ./prefix_check --sanitize "Order Item!"   # prints "order_item"
//     printf 'user\n_bad\n' | ./prefix_check    # one prefix per stdin line
//
// Settings come from ~/.tprefix/config.toml, then ./tprefix.toml, then
// --config FILE, then the flags below.  Exit status is 1 if any input was
// rejected in validate mode, 2 on a usage or config error.

#include <tprefix/config.hpp>
#include <tprefix/diagnostics.hpp>
#include <tprefix/log.hpp>
#include <tprefix/prefix.hpp>
#include <tprefix/result.hpp>

#include <filesystem>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

namespace fs = std::filesystem;
using namespace tprefix;

struct Options {
    std::optional<Config::Mode> mode;
    bool require_non_empty = false;
    bool verbose = false;
    std::string config_path;
    std::vector<std::string> inputs;
};

static const char* usage =
    "usage: prefix_check [--validate|--sanitize] [--require-non-empty]\n"
    "                    [--config FILE] [--verbose] [prefix...]";

static Result<Options> parse_args(int argc, char** argv) {
    Options opts;
    bool only_inputs = false;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (only_inputs || arg.empty() || arg[0] != '-') {
            opts.inputs.push_back(arg);
        } else if (arg == "--") {
            only_inputs = true;
        } else if (arg == "--validate") {
            opts.mode = Config::Validate;
        } else if (arg == "--sanitize") {
            opts.mode = Config::Sanitize;
        } else if (arg == "--require-non-empty") {
            opts.require_non_empty = true;
        } else if (arg == "--verbose" || arg == "-v") {
            opts.verbose = true;
        } else if (arg == "--config") {
            if (i + 1 >= argc) {
                return Error{Error::InvalidArg, "--config needs a file argument", usage};
            }
            opts.config_path = argv[++i];
        } else {
            return Error{Error::InvalidArg, "unknown option '" + arg + "'", usage};
        }
    }
    return Result<Options>::ok(std::move(opts));
}

// Load a config layer if its file exists; a missing file is not an error
static Result<std::optional<Config>> load_layer(const std::string& path) {
    std::error_code ec;
    if (path.empty() || !fs::exists(path, ec)) {
        return Result<std::optional<Config>>::ok(std::nullopt);
    }
    auto cfg = Config::load(path);
    TPREFIX_TRY(cfg);
    log::debug("loaded config %s", path.c_str());
    return Result<std::optional<Config>>::ok(std::move(cfg).value());
}

static Result<Config> resolve_config(const Options& opts) {
    auto global = load_layer(global_config_path());
    TPREFIX_TRY(global);
    auto local = load_layer(local_config_path());
    TPREFIX_TRY(local);

    Config cfg = Config::effective(global.value(), local.value());

    if (!opts.config_path.empty()) {
        auto explicit_cfg = Config::load(opts.config_path);
        TPREFIX_TRY(explicit_cfg);
        cfg.merge(explicit_cfg.value());
    }

    if (opts.mode) cfg.mode = *opts.mode;
    if (opts.require_non_empty) cfg.require_non_empty = true;
    if (opts.verbose) cfg.log_level = log::Debug;
    return Result<Config>::ok(cfg);
}

static bool check_one(const std::string& input, const Config& cfg,
                      const DiagnosticHook& hook) {
    if (cfg.mode == Config::Sanitize) {
        std::cout << TypeIdPrefix::sanitize(input, hook) << "\n";
        return true;
    }

    auto r = cfg.require_non_empty
        ? TypeIdPrefix::parse_required(input, hook)
        : TypeIdPrefix::parse(input, hook);
    if (r.is_err()) {
        std::cerr << Error::from_validation(r.error(), input).format() << "\n";
        return false;
    }
    if (r.value().empty()) {
        std::cout << "ok (empty prefix)\n";
    } else {
        std::cout << "ok " << r.value() << "\n";
    }
    return true;
}

int main(int argc, char** argv) {
    auto opts = parse_args(argc, argv);
    if (opts.is_err()) {
        std::cerr << opts.error().format() << "\n";
        return 2;
    }

    // Flags are applied before config is read so --verbose covers config loading
    if (opts.value().verbose) log::set_level(log::Debug);

    auto cfg = resolve_config(opts.value());
    if (cfg.is_err()) {
        std::cerr << cfg.error().format() << "\n";
        return 2;
    }

    log::set_level(cfg.value().log_level);
    if (cfg.value().log_color_set) log::set_color_enabled(cfg.value().log_color);
    log::debug("mode: %s", Config::mode_name(cfg.value().mode));

    DiagnosticHook hook = log_diagnostics();
    bool all_ok = true;

    if (opts.value().inputs.empty()) {
        std::string line;
        while (std::getline(std::cin, line)) {
            if (!line.empty() && line.back() == '\r') line.pop_back();
            all_ok = check_one(line, cfg.value(), hook) && all_ok;
        }
    } else {
        for (const auto& input : opts.value().inputs) {
            all_ok = check_one(input, cfg.value(), hook) && all_ok;
        }
    }

    return all_ok ? 0 : 1;
}
