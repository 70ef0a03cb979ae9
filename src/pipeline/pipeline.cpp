#include "sweep/pipeline.hpp"
#include "sweep/diff.hpp"
#include "sweep/matcher.hpp"
#include "sweep/platform.hpp"
#include "sweep/snapshot.hpp"

#include <spdlog/spdlog.h>

#include <chrono>

namespace sweep {

namespace {

double seconds_since(std::chrono::steady_clock::time_point started) {
    return std::chrono::duration<double>(std::chrono::steady_clock::now() - started).count();
}

bool cancelled(const RunContext& ctx) {
    return ctx.cancel && ctx.cancel->is_cancelled();
}

// Load a snapshot, turning missing/corrupt into warnings
std::optional<CanonicalIdentifierSet> load_previous(RunContext& ctx, const SnapshotStore& store) {
    SnapshotLoadResult loaded = store.load_detailed();
    const char* purpose = snapshot_purpose_to_string(store.purpose());

    switch (loaded.state) {
        case SnapshotLoadResult::State::Loaded:
            spdlog::debug("Loaded {} snapshot from {} ({} identifiers, captured {})", purpose,
                          store.path(), loaded.identifiers->size(), loaded.captured_at);
            break;
        case SnapshotLoadResult::State::Missing:
            ctx.warnings.emit(Warning::snapshot_missing,
                              warnings::snapshot_state(purpose, store.path()));
            break;
        case SnapshotLoadResult::State::Corrupt:
            ctx.warnings.emit(Warning::snapshot_corrupt,
                              warnings::snapshot_state(purpose, store.path(), loaded.error));
            break;
    }
    return loaded.identifiers;
}

// Turn per-item results into warnings; runs on the orchestrating thread
void report_outcomes(RunContext& ctx, const std::vector<ActionOutcome>& outcomes) {
    for (const auto& outcome : outcomes) {
        const std::string origin = origin_to_string(outcome.item.origin);

        for (const auto& attempt : outcome.attempts) {
            if (!attempt.reported_ok && !attempt.verified) {
                WarningFields fields = warnings::item_outcome(outcome.item.primary_name, origin, attempt.error);
                fields["method"] = attempt.method;
                ctx.warnings.emit(Warning::method_failed, fields);
            }
        }

        std::string error = outcome.error.value_or("");
        if (outcome.status == OutcomeStatus::Failed) {
            ctx.warnings.emit(Warning::item_failed,
                              warnings::item_outcome(outcome.item.primary_name, origin, error));
        } else if (outcome.status == OutcomeStatus::Partial) {
            ctx.warnings.emit(Warning::item_partial,
                              warnings::item_outcome(outcome.item.primary_name, origin, error));
        }
    }
}

bool acting(const RunContext& ctx) {
    return !ctx.options.plan_only && !ctx.options.dry_run && !ctx.config.execution.dry_run;
}

std::vector<ActionOutcome> execute(RunContext& ctx, const std::vector<MatchRecord>& matches,
                                   ActionMode mode) {
    if (ctx.options.plan_only || matches.empty()) {
        return {};
    }

    ExecutorOptions options;
    options.max_workers = ctx.config.execution.max_workers;
    options.dry_run = !acting(ctx);

    ActionExecutor executor(ctx.methods, ctx.verifier, options, ctx.cancel);
    auto outcomes = executor.execute_all(matches, mode);
    report_outcomes(ctx, outcomes);
    return outcomes;
}

// Saves the full collected set unless the run made no changes by request
// or was cancelled
void persist(RunContext& ctx, const SnapshotStore& store, const CanonicalIdentifierSet& current,
             PassReport& report) {
    if (!acting(ctx)) {
        return;
    }
    if (cancelled(ctx)) {
        spdlog::warn("Run cancelled; {} snapshot left unchanged", snapshot_purpose_to_string(store.purpose()));
        return;
    }
    ConvergenceReporter reporter(store, ctx.warnings);
    report.persisted = reporter.persist(current);
}

} // namespace

InventoryItem install_target(const std::string& pattern) {
    InventoryItem item;
    item.primary_name = trim(pattern);
    item.origin = Origin::PackageManagerA;
    item.origin_metadata["Id"] = item.primary_name;
    return item;
}

Result<CollectedInventory> collect_inventory(RunContext& ctx) {
    CollectionSummary collected = collect_all(ctx.sources, ctx.warnings);
    if (!collected.any_available()) {
        return Result<CollectedInventory>::err(
            Error(ErrorCode::NO_INVENTORY_SOURCE,
                  "none of the " + std::to_string(collected.sources_total) + " inventory sources could be read"));
    }

    NormalizeResult normalized = normalize(collected.per_source, &ctx.warnings);

    CollectedInventory inventory;
    inventory.identifiers = CanonicalIdentifierSet::from_items(normalized.items);
    inventory.items = std::move(normalized.items);
    inventory.sources_total = collected.sources_total;
    inventory.sources_available = collected.sources_available;
    inventory.records_skipped = normalized.skipped;

    spdlog::info("Inventory: {} items, {} identifiers from {}/{} sources", inventory.items.size(),
                 inventory.identifiers.size(), inventory.sources_available, inventory.sources_total);
    return Result<CollectedInventory>::ok(std::move(inventory));
}

PassReport run_removal_pass(RunContext& ctx, const CollectedInventory& inventory) {
    auto started = std::chrono::steady_clock::now();

    PassReport report;
    report.name = "bloatware_removal";
    report.mode = ActionMode::Remove;
    report.inventory_size = inventory.items.size();

    SnapshotStore store(ctx.config.paths.removal_snapshot, SnapshotPurpose::Removal);
    auto previous = load_previous(ctx, store);

    DiffResult delta = diff(inventory.identifiers, previous);
    report.diff = diff_stats(inventory.identifiers, delta);

    ScanPolicy policy;
    policy.force_full_scan = ctx.options.force_full_scan || ctx.config.diff.force_full_scan;
    policy.empty_diff_policy = ctx.config.diff.empty_diff_policy;
    report.scope = choose_scan_scope(delta, policy);

    auto candidates = select_for_matching(inventory.items, delta, report.scope);
    report.candidates = candidates.size();
    spdlog::info("Removal: {} new, {} gone, {} unchanged; scanning {} ({} items)",
                 report.diff.newly_observed, report.diff.previously_observed, report.diff.unchanged,
                 scan_scope_to_string(report.scope), report.candidates);

    report.matches = match(candidates, ctx.config.bloatware.patterns, ctx.config.bloatware.protected_patterns);
    for (const auto& m : report.matches) {
        spdlog::info("Matched {} ({}) by {} [{}]", m.item.primary_name, origin_to_string(m.item.origin),
                     m.pattern, match_strategy_to_string(m.strategy));
    }

    report.outcomes = execute(ctx, report.matches, ActionMode::Remove);
    report.summary = summarize(report.outcomes);

    persist(ctx, store, inventory.identifiers, report);
    report.duration_seconds = seconds_since(started);
    return report;
}

PassReport run_requirement_pass(RunContext& ctx, const CollectedInventory& inventory) {
    auto started = std::chrono::steady_clock::now();

    PassReport report;
    report.name = "essential_apps";
    report.mode = ActionMode::Install;
    report.inventory_size = inventory.items.size();

    SnapshotStore store(ctx.config.paths.requirement_snapshot, SnapshotPurpose::Requirement);
    auto previous = load_previous(ctx, store);

    DiffResult delta = diff(inventory.identifiers, previous);
    report.diff = diff_stats(inventory.identifiers, delta);

    // Presence needs the whole inventory, not just what changed
    report.scope = ScanScope::Full;
    report.candidates = inventory.items.size();

    const auto& patterns = ctx.config.essential_apps.patterns;
    report.matches = match(inventory.items, patterns);
    report.missing = find_unmatched_patterns(inventory.items, patterns);

    spdlog::info("Essential apps: {} present, {} missing", patterns.size() - report.missing.size(),
                 report.missing.size());

    std::vector<MatchRecord> installs;
    for (const auto& pattern : report.missing) {
        if (is_wildcard_pattern(pattern)) {
            ctx.warnings.emit(Warning::pattern_invalid,
                              {{"pattern", pattern}, {"reason", "wildcard cannot be installed"}});
            continue;
        }
        MatchRecord record;
        record.pattern = pattern;
        record.item = install_target(pattern);
        record.strategy = MatchStrategy::Exact;
        record.matched_identifier = record.item.primary_name;
        installs.push_back(std::move(record));
    }

    report.outcomes = execute(ctx, installs, ActionMode::Install);
    report.summary = summarize(report.outcomes);

    persist(ctx, store, inventory.identifiers, report);
    report.duration_seconds = seconds_since(started);
    return report;
}

Result<RunReport> run(RunContext& ctx) {
    RunReport report;
    report.started_at = get_current_timestamp();
    report.dry_run = !acting(ctx);

    auto inventory = collect_inventory(ctx);
    if (inventory.isErr()) {
        return Result<RunReport>::err(inventory.error());
    }
    report.sources_total = inventory.value().sources_total;
    report.sources_available = inventory.value().sources_available;

    if (ctx.options.remove) {
        report.passes.push_back(run_removal_pass(ctx, inventory.value()));
    }
    if (ctx.options.install && !cancelled(ctx)) {
        report.passes.push_back(run_requirement_pass(ctx, inventory.value()));
    }

    if (cancelled(ctx)) {
        ctx.warnings.emit(Warning::run_cancelled);
    }

    report.finished_at = get_current_timestamp();
    report.warnings = ctx.warnings.get_warnings();
    return Result<RunReport>::ok(std::move(report));
}

} // namespace sweep
