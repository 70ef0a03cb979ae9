#pragma once

/**
 * @file reporter.hpp
 * @brief Outcome summaries, snapshot persistence and the audit artifact
 */

#include "sweep/diff.hpp"
#include "sweep/result.hpp"
#include "sweep/snapshot.hpp"
#include "sweep/types.hpp"

#include <nlohmann/json.hpp>

#include <map>
#include <string>
#include <vector>

namespace sweep {

class WarningCollector;

// ============================================================================
// Summary
// ============================================================================

struct Summary {
    size_t succeeded = 0;
    size_t partial = 0;
    size_t failed = 0;
    size_t skipped = 0;

    // method name -> number of verified successes
    std::map<std::string, size_t> by_method;

    size_t total() const { return succeeded + partial + failed + skipped; }
};

Summary summarize(const std::vector<ActionOutcome>& outcomes);

// ============================================================================
// Run report
// ============================================================================

struct DiffStats {
    size_t current = 0;
    size_t newly_observed = 0;
    size_t previously_observed = 0;
    size_t unchanged = 0;
    bool first_run = false;
};

DiffStats diff_stats(const CanonicalIdentifierSet& current, const DiffResult& diff);

// One pass of a run: bloatware removal or essential-app installation
struct PassReport {
    std::string name;  // "bloatware_removal" | "essential_apps"
    ActionMode mode = ActionMode::Remove;
    DiffStats diff;
    ScanScope scope = ScanScope::Full;
    size_t inventory_size = 0;
    size_t candidates = 0;                 // items handed to the matcher
    std::vector<MatchRecord> matches;
    std::vector<std::string> missing;      // essential apps with no match
    std::vector<ActionOutcome> outcomes;
    Summary summary;
    bool persisted = false;
    double duration_seconds = 0.0;

    // "error" if any item failed, "warning" if any is partial, else "success"
    std::string status() const;
};

struct RunReport {
    std::string started_at;
    std::string finished_at;
    bool dry_run = false;
    size_t sources_total = 0;
    size_t sources_available = 0;
    std::vector<PassReport> passes;
    std::vector<WarningObject> warnings;
};

nlohmann::json outcome_to_json(const ActionOutcome& outcome);
nlohmann::json pass_to_json(const PassReport& pass);
nlohmann::json report_to_json(const RunReport& report);

// Write the audit artifact through the atomic write path
Result<void> write_audit(const RunReport& report, const std::string& path);

// ============================================================================
// Convergence Reporter
// ============================================================================

/**
 * Records the post-action inventory as the new snapshot.
 *
 * The full current set is saved even when items failed, so the next run
 * reprocesses only new identifiers. A failed save becomes a
 * persistence_failed warning; actions already taken are not rolled back.
 */
class ConvergenceReporter {
public:
    ConvergenceReporter(const SnapshotStore& store, WarningCollector& warnings)
        : store_(store), warnings_(warnings) {}

    bool persist(const CanonicalIdentifierSet& current);

private:
    const SnapshotStore& store_;
    WarningCollector& warnings_;
};

} // namespace sweep
