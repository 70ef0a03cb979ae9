/**
 * sweep CLI - run command
 *
 * Collect the inventory, remove matched bloatware, install missing
 * essentials and persist the snapshots.
 */

#include "../common.hpp"
#include <CLI/CLI.hpp>
#include <csignal>

namespace sweep::cli::commands {

namespace {

struct RunCommandOptions {
    bool remove_only = false;
    bool install_only = false;
    bool dry_run = false;
    bool full_scan = false;
    std::string audit;
};

// Set by SIGINT; in-flight items finish their current method
CancellationToken g_cancel;

void handle_interrupt(int) {
    g_cancel.cancel();
}

void print_pass(const PassReport& pass) {
    std::cout << pass.name << " [" << pass.status() << "]" << std::endl;
    std::cout << "  inventory: " << pass.diff.current << " identifiers, "
              << pass.diff.newly_observed << " new, "
              << pass.diff.previously_observed << " gone"
              << (pass.diff.first_run ? " (first run)" : "") << std::endl;
    std::cout << "  scope: " << scan_scope_to_string(pass.scope)
              << " (" << pass.candidates << " items)" << std::endl;

    for (const auto& m : pass.matches) {
        std::cout << "  match: " << m.item.primary_name << " <- " << m.pattern
                  << " (" << match_strategy_to_string(m.strategy) << ")" << std::endl;
    }
    for (const auto& missing : pass.missing) {
        std::cout << "  missing: " << missing << std::endl;
    }
    for (const auto& outcome : pass.outcomes) {
        std::cout << "  " << outcome_status_to_string(outcome.status) << ": "
                  << outcome.item.primary_name;
        if (!outcome.method_used.empty()) {
            std::cout << " via " << outcome.method_used;
        }
        if (outcome.error) {
            std::cout << " (" << *outcome.error << ")";
        }
        std::cout << std::endl;
    }

    const auto& s = pass.summary;
    std::cout << "  " << s.succeeded << " succeeded, " << s.partial << " partial, "
              << s.failed << " failed, " << s.skipped << " skipped" << std::endl;
}

int exit_code_for(const RunReport& report, const WarningCollector& warnings) {
    for (const auto& pass : report.passes) {
        if (pass.summary.failed > 0) return 2;
    }
    return warnings.has_errors() ? 2 : 0;
}

} // anonymous namespace

int execute_run(const GlobalOptions& opts, RunOptions run_opts, const std::string& audit_override) {
    setup_logging(opts, "info");

    WarningCollector warnings;
    auto loaded = load_config(opts, warnings);
    if (!loaded.ok) {
        print_error(loaded.error, opts.json);
        return 1;
    }
    setup_logging(opts, loaded.config.log_level);

    Session session(loaded.config);
    if (session.sources.empty()) {
        print_error("no inventory sources configured", opts.json);
        return 1;
    }

    if (!run_opts.plan_only) {
        std::signal(SIGINT, handle_interrupt);
    }

    RunContext ctx{loaded.config, session.sources, session.methods, *session.verifier, warnings,
                   &g_cancel, run_opts};
    auto result = run(ctx);
    if (result.isErr()) {
        print_error(result.error().toString(), opts.json);
        return 1;
    }
    RunReport& report = result.value();

    std::string audit_path = audit_override.empty() ? loaded.config.paths.audit : audit_override;
    if (!audit_path.empty() && !run_opts.plan_only) {
        auto written = write_audit(report, audit_path);
        if (written.isErr()) {
            warnings.emit(Warning::audit_write_failed,
                          {{"path", audit_path}, {"reason", written.error().message()}});
            report.warnings = warnings.get_warnings();
        }
    }

    if (opts.json) {
        nlohmann::json j = report_to_json(report);
        j["ok"] = true;
        output_json(j);
    } else if (!opts.quiet) {
        for (const auto& pass : report.passes) {
            print_pass(pass);
        }
        if (report.dry_run) {
            std::cout << "(dry run: no changes made, snapshots not updated)" << std::endl;
        }
    }

    return exit_code_for(report, warnings);
}

void setup_run(CLI::App* app, GlobalOptions& opts) {
    static RunCommandOptions run_opts;

    auto* remove_only = app->add_flag("--remove-only", run_opts.remove_only, "Only remove bloatware");
    auto* install_only = app->add_flag("--install-only", run_opts.install_only, "Only install essential apps");
    remove_only->excludes(install_only);
    app->add_flag("--dry-run", run_opts.dry_run, "Match and report without changing anything");
    app->add_flag("--full-scan", run_opts.full_scan, "Match every item, ignoring the snapshot diff");
    app->add_option("--audit", run_opts.audit, "Write a JSON audit report to this path");

    app->callback([&opts]() {
        RunOptions options;
        options.remove = !run_opts.install_only;
        options.install = !run_opts.remove_only;
        options.dry_run = run_opts.dry_run;
        options.force_full_scan = run_opts.full_scan;
        std::exit(execute_run(opts, options, run_opts.audit));
    });
}

} // namespace sweep::cli::commands
