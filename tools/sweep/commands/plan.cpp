/**
 * sweep CLI - plan command
 *
 * Inventory, diff and match without taking any action or touching the
 * snapshots.
 */

#include "../common.hpp"
#include <CLI/CLI.hpp>

namespace sweep::cli::commands {

int execute_run(const GlobalOptions& opts, RunOptions run_opts, const std::string& audit_override);

namespace {

struct PlanOptions {
    bool remove_only = false;
    bool install_only = false;
    bool full_scan = false;
};

} // anonymous namespace

void setup_plan(CLI::App* app, GlobalOptions& opts) {
    static PlanOptions plan_opts;

    auto* remove_only = app->add_flag("--remove-only", plan_opts.remove_only, "Only plan bloatware removal");
    auto* install_only = app->add_flag("--install-only", plan_opts.install_only, "Only plan essential apps");
    remove_only->excludes(install_only);
    app->add_flag("--full-scan", plan_opts.full_scan, "Match every item, ignoring the snapshot diff");

    app->callback([&opts]() {
        RunOptions options;
        options.remove = !plan_opts.install_only;
        options.install = !plan_opts.remove_only;
        options.force_full_scan = plan_opts.full_scan;
        options.plan_only = true;
        std::exit(execute_run(opts, options, ""));
    });
}

} // namespace sweep::cli::commands
