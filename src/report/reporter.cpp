#include "sweep/reporter.hpp"
#include "sweep/platform.hpp"
#include "sweep/warnings.hpp"

#include <spdlog/spdlog.h>

namespace sweep {

Summary summarize(const std::vector<ActionOutcome>& outcomes) {
    Summary summary;
    for (const auto& outcome : outcomes) {
        switch (outcome.status) {
            case OutcomeStatus::Success:
                summary.succeeded++;
                summary.by_method[outcome.method_used]++;
                break;
            case OutcomeStatus::Partial:
                summary.partial++;
                break;
            case OutcomeStatus::Failed:
                summary.failed++;
                break;
            case OutcomeStatus::Skipped:
                summary.skipped++;
                break;
        }
    }
    return summary;
}

DiffStats diff_stats(const CanonicalIdentifierSet& current, const DiffResult& diff) {
    DiffStats stats;
    stats.current = current.size();
    stats.newly_observed = diff.newly_observed.size();
    stats.previously_observed = diff.previously_observed.size();
    stats.unchanged = diff.unchanged.size();
    stats.first_run = diff.first_run;
    return stats;
}

std::string PassReport::status() const {
    if (summary.failed > 0) return "error";
    if (summary.partial > 0) return "warning";
    return "success";
}

// ============================================================================
// JSON
// ============================================================================

nlohmann::json outcome_to_json(const ActionOutcome& outcome) {
    nlohmann::json j;
    j["item"] = outcome.item.primary_name;
    j["origin"] = origin_to_string(outcome.item.origin);
    j["status"] = outcome_status_to_string(outcome.status);
    j["method"] = outcome.method_used;
    if (outcome.error) {
        j["error"] = *outcome.error;
    }
    j["elapsed_seconds"] = outcome.elapsed_seconds;

    nlohmann::json attempts = nlohmann::json::array();
    for (const auto& attempt : outcome.attempts) {
        nlohmann::json a;
        a["method"] = attempt.method;
        a["reported_ok"] = attempt.reported_ok;
        a["verified"] = attempt.verified;
        if (!attempt.error.empty()) {
            a["error"] = attempt.error;
        }
        attempts.push_back(a);
    }
    j["attempts"] = attempts;
    return j;
}

nlohmann::json pass_to_json(const PassReport& pass) {
    nlohmann::json j;
    j["module"] = pass.name;
    j["mode"] = action_mode_to_string(pass.mode);
    j["status"] = pass.status();
    j["duration_seconds"] = pass.duration_seconds;

    j["diff"] = {
        {"current", pass.diff.current},
        {"newly_observed", pass.diff.newly_observed},
        {"previously_observed", pass.diff.previously_observed},
        {"unchanged", pass.diff.unchanged},
        {"first_run", pass.diff.first_run},
    };
    j["scope"] = scan_scope_to_string(pass.scope);
    j["inventory_size"] = pass.inventory_size;
    j["candidates"] = pass.candidates;

    nlohmann::json matches = nlohmann::json::array();
    for (const auto& m : pass.matches) {
        matches.push_back({
            {"pattern", m.pattern},
            {"item", m.item.primary_name},
            {"origin", origin_to_string(m.item.origin)},
            {"strategy", match_strategy_to_string(m.strategy)},
            {"identifier", m.matched_identifier},
        });
    }
    j["matches"] = matches;

    if (pass.mode == ActionMode::Install) {
        j["missing"] = pass.missing;
    }

    nlohmann::json outcomes = nlohmann::json::array();
    for (const auto& outcome : pass.outcomes) {
        outcomes.push_back(outcome_to_json(outcome));
    }
    j["items"] = outcomes;

    j["counts"] = {
        {"total", pass.summary.total()},
        {"succeeded", pass.summary.succeeded},
        {"partial", pass.summary.partial},
        {"failed", pass.summary.failed},
        {"skipped", pass.summary.skipped},
    };
    j["by_method"] = pass.summary.by_method;
    j["persisted"] = pass.persisted;
    return j;
}

nlohmann::json report_to_json(const RunReport& report) {
    nlohmann::json j;
    j["started_at"] = report.started_at;
    j["finished_at"] = report.finished_at;
    j["dry_run"] = report.dry_run;
    j["sources"] = {
        {"total", report.sources_total},
        {"available", report.sources_available},
    };

    Summary overall;
    nlohmann::json modules = nlohmann::json::array();
    for (const auto& pass : report.passes) {
        modules.push_back(pass_to_json(pass));
        overall.succeeded += pass.summary.succeeded;
        overall.partial += pass.summary.partial;
        overall.failed += pass.summary.failed;
        overall.skipped += pass.summary.skipped;
    }
    j["modules"] = modules;
    j["summary"] = {
        {"total", overall.total()},
        {"succeeded", overall.succeeded},
        {"partial", overall.partial},
        {"failed", overall.failed},
        {"skipped", overall.skipped},
    };

    nlohmann::json warnings = nlohmann::json::array();
    for (const auto& w : report.warnings) {
        nlohmann::json wj;
        wj["key"] = w.key;
        wj["action"] = w.action;
        wj["fields"] = w.fields;
        warnings.push_back(wj);
    }
    j["warnings"] = warnings;
    return j;
}

Result<void> write_audit(const RunReport& report, const std::string& path) {
    // Identifiers come from external tools; invalid UTF-8 is replaced, not fatal
    std::string text = report_to_json(report).dump(2, ' ', false, nlohmann::json::error_handler_t::replace);
    auto result = atomic_write_file(path, text + "\n");
    if (!result.ok) {
        return Result<void>::err(Error(ErrorCode::IO_ERROR, result.error).withContext(path));
    }
    spdlog::info("Audit written to {}", path);
    return Result<void>::ok();
}

// ============================================================================
// ConvergenceReporter
// ============================================================================

bool ConvergenceReporter::persist(const CanonicalIdentifierSet& current) {
    auto saved = store_.save(current);
    if (saved.isErr()) {
        warnings_.emit(Warning::persistence_failed,
                       warnings::snapshot_state(snapshot_purpose_to_string(store_.purpose()),
                                                store_.path(), saved.error().message()));
        return false;
    }
    spdlog::debug("Saved {} snapshot ({} identifiers)",
                  snapshot_purpose_to_string(store_.purpose()), current.size());
    return true;
}

} // namespace sweep
