/**
 * sweep CLI - Common utilities and types
 */

#pragma once

#include <sweep/sweep.hpp>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <string>
#include <optional>
#include <iostream>
#include <memory>
#include <vector>

namespace sweep::cli {

/**
 * Global options available to all commands.
 */
struct GlobalOptions {
    std::string root;              // --root
    std::string config;            // --config
    bool json = false;             // --json
    bool verbose = false;          // -v, --verbose
    bool quiet = false;            // -q, --quiet
    std::vector<std::string> warn; // --warn <key>=<action>
};

/**
 * Resolve the state root directory.
 * Priority: --root flag > SWEEP_ROOT env > %ProgramData%\sweep > ~/.sweep
 */
inline std::string resolve_sweep_root(const std::string& override_root) {
    if (!override_root.empty()) {
        return override_root;
    }

    if (auto env_root = get_env("SWEEP_ROOT")) {
        if (!env_root->empty()) return *env_root;
    }

#ifdef _WIN32
    if (auto program_data = get_env("ProgramData")) {
        if (!program_data->empty()) return join_path(*program_data, "sweep");
    }
#endif

    if (auto home = get_env("HOME")) {
        if (!home->empty()) return join_path(*home, ".sweep");
    }

    if (auto userprofile = get_env("USERPROFILE")) {
        if (!userprofile->empty()) return join_path(*userprofile, ".sweep");
    }

    return ".sweep";
}

/**
 * Configure the default logger. Logs go to stderr so that --json output
 * on stdout stays parseable.
 * Priority: -v/-q > SWEEP_LOG_LEVEL env > config log_level
 */
inline void setup_logging(const GlobalOptions& opts, const std::string& config_level) {
    static bool sink_installed = false;
    if (!sink_installed) {
        spdlog::set_default_logger(spdlog::stderr_color_mt("sweep"));
        spdlog::set_pattern("[%H:%M:%S] [%^%l%$] %v");
        sink_installed = true;
    }

    std::string level = config_level;
    if (auto env_level = get_env("SWEEP_LOG_LEVEL")) {
        if (!env_level->empty()) level = fold_case(*env_level);
    }
    if (opts.verbose) level = "debug";
    if (opts.quiet) level = "error";

    if (level == "debug") {
        spdlog::set_level(spdlog::level::debug);
    } else if (level == "warn") {
        spdlog::set_level(spdlog::level::warn);
    } else if (level == "error") {
        spdlog::set_level(spdlog::level::err);
    } else {
        spdlog::set_level(spdlog::level::info);
    }
}

struct LoadedConfig {
    bool ok = false;
    std::string error;
    Config config;
};

/**
 * Load the configuration for a run.
 *
 * --config names the file explicitly and must exist. Otherwise
 * <root>/sweep.json is used if present, else the built-in defaults.
 * --warn overrides are applied first; parse warnings are emitted under the
 * loaded config's policy.
 */
inline LoadedConfig load_config(const GlobalOptions& opts, WarningCollector& collector) {
    LoadedConfig loaded;

    for (const auto& text : opts.warn) {
        auto parsed = parse_warning_override(text);
        if (!parsed) {
            loaded.error = "invalid --warn value: " + text + " (expected <warning>=<warn|ignore|error>)";
            return loaded;
        }
        collector.apply_override(warning_to_string(parsed->first), parsed->second);
    }

    std::string root = resolve_sweep_root(opts.root);
    std::string path = opts.config.empty() ? join_path(root, "sweep.json") : opts.config;

    auto content = read_file(path);
    if (!content) {
        if (!opts.config.empty()) {
            loaded.error = "cannot read config file: " + path;
            return loaded;
        }
        loaded.config = get_builtin_config();
        collector.set_policy(loaded.config.warnings);
        collector.emit(Warning::config_missing, {{"path", path}});
    } else {
        auto parsed = parse_config_full(*content, path);
        if (!parsed.ok) {
            loaded.error = path + ": " + parsed.error;
            return loaded;
        }
        loaded.config = std::move(parsed.config);
        // The file's own policy governs its parse warnings
        collector.set_policy(loaded.config.warnings);
        for (const auto& w : parsed.warnings) {
            collector.emit(Warning::invalid_configuration, warnings::invalid_configuration(w, path));
        }
    }

    resolve_state_paths(loaded.config, root);
    loaded.ok = true;
    return loaded;
}

/**
 * Collaborators for one command invocation: the process runner, the
 * configured inventory sources, the default method table and the
 * source-backed verifier.
 */
struct Session {
    ProcessCommandRunner runner;
    std::vector<std::unique_ptr<InventorySource>> sources;
    MethodTable methods;
    std::unique_ptr<SourceVerifier> verifier;

    explicit Session(const Config& config)
        : sources(make_sources(config, runner)),
          methods(default_method_table(runner, config.timeouts)),
          verifier(std::make_unique<SourceVerifier>(sources)) {}

    Session(const Session&) = delete;
    Session& operator=(const Session&) = delete;
};

/**
 * Output utilities.
 */
inline void print_error(const std::string& msg, bool json_mode) {
    if (json_mode) {
        nlohmann::json j;
        j["ok"] = false;
        j["error"] = msg;
        std::cout << j.dump(2, ' ', false, nlohmann::json::error_handler_t::replace) << std::endl;
    } else {
        std::cerr << "Error: " << msg << std::endl;
    }
}

inline void output_json(const nlohmann::json& j) {
    std::cout << j.dump(2, ' ', false, nlohmann::json::error_handler_t::replace) << std::endl;
}

inline nlohmann::json warnings_to_json(const WarningCollector& warnings) {
    nlohmann::json list = nlohmann::json::array();
    for (const auto& w : warnings.get_warnings()) {
        list.push_back({{"key", w.key}, {"action", w.action}, {"fields", w.fields}});
    }
    return list;
}

} // namespace sweep::cli
