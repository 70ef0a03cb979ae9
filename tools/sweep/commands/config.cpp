/**
 * sweep CLI - config command
 *
 * Print the effective configuration after defaults and custom entries are
 * merged.
 */

#include "../common.hpp"
#include <CLI/CLI.hpp>

namespace sweep::cli::commands {

namespace {

int cmd_config_show(const GlobalOptions& opts) {
    setup_logging(opts, "warn");

    WarningCollector warnings;
    auto loaded = load_config(opts, warnings);
    if (!loaded.ok) {
        print_error(loaded.error, opts.json);
        return 1;
    }

    auto config = nlohmann::json::parse(config_to_json(loaded.config));
    if (opts.json) {
        nlohmann::json j;
        j["ok"] = true;
        j["source"] = loaded.config.source_path.empty() ? "builtin" : loaded.config.source_path;
        j["config"] = config;
        j["warnings"] = warnings_to_json(warnings);
        output_json(j);
    } else {
        if (!opts.quiet) {
            std::cout << "# source: "
                      << (loaded.config.source_path.empty() ? "builtin" : loaded.config.source_path)
                      << std::endl;
        }
        std::cout << config.dump(2, ' ', false, nlohmann::json::error_handler_t::replace) << std::endl;
    }
    return 0;
}

} // anonymous namespace

void setup_config(CLI::App* app, GlobalOptions& opts) {
    app->require_subcommand(1);

    auto* show = app->add_subcommand("show", "Print the effective configuration");
    show->callback([&opts]() {
        std::exit(cmd_config_show(opts));
    });
}

} // namespace sweep::cli::commands
