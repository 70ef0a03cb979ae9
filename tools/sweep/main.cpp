/**
 * sweep CLI - Entry Point
 *
 * Software inventory reconciliation: removes unwanted packages and
 * installs missing essentials.
 */

#include <CLI/CLI.hpp>
#include "common.hpp"

// Forward declarations for commands
namespace sweep::cli::commands {
    void setup_run(CLI::App* app, GlobalOptions& opts);
    void setup_plan(CLI::App* app, GlobalOptions& opts);
    void setup_inventory(CLI::App* app, GlobalOptions& opts);
    void setup_snapshot(CLI::App* app, GlobalOptions& opts);
    void setup_config(CLI::App* app, GlobalOptions& opts);
}

int main(int argc, char** argv) {
    using namespace sweep::cli;

    CLI::App app{"sweep - software inventory reconciliation"};
    app.set_version_flag("-V,--version", SWEEP_VERSION);
    app.require_subcommand(0, 1);

    GlobalOptions opts;

    // Global options
    app.add_option("--root", opts.root, "State root directory");
    app.add_option("--config", opts.config, "Configuration file");
    app.add_flag("--json", opts.json, "Machine-readable output");
    app.add_flag("-v,--verbose", opts.verbose, "Detailed progress");
    app.add_flag("-q,--quiet", opts.quiet, "Minimal output");
    app.add_option("--warn", opts.warn, "Override a warning action, e.g. source_unavailable=error")
        ->type_name("KEY=ACTION");

    // Commands
    auto* run_cmd = app.add_subcommand("run", "Remove bloatware and install essential apps");
    commands::setup_run(run_cmd, opts);

    auto* plan_cmd = app.add_subcommand("plan", "Show what a run would do");
    commands::setup_plan(plan_cmd, opts);

    auto* inventory_cmd = app.add_subcommand("inventory", "Print the normalized inventory");
    commands::setup_inventory(inventory_cmd, opts);

    auto* snapshot_cmd = app.add_subcommand("snapshot", "Inspect or clear snapshots");
    commands::setup_snapshot(snapshot_cmd, opts);

    auto* config_cmd = app.add_subcommand("config", "Inspect the effective configuration");
    commands::setup_config(config_cmd, opts);

    CLI11_PARSE(app, argc, argv);

    // If no subcommand, show help
    if (app.get_subcommands().empty()) {
        std::cout << app.help() << std::endl;
    }

    return 0;
}
