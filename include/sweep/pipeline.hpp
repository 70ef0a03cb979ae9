#pragma once

/**
 * @file pipeline.hpp
 * @brief One reconciliation run: inventory, diff, match, act, persist
 */

#include "sweep/config.hpp"
#include "sweep/executor.hpp"
#include "sweep/identifier_set.hpp"
#include "sweep/inventory.hpp"
#include "sweep/reporter.hpp"
#include "sweep/result.hpp"
#include "sweep/warnings.hpp"

#include <memory>
#include <vector>

namespace sweep {

struct RunOptions {
    bool remove = true;           // run the bloatware removal pass
    bool install = true;          // run the essential-app pass
    bool dry_run = false;         // match and report; no actions, no snapshot
    bool force_full_scan = false;
    bool plan_only = false;       // like dry_run, but outcomes are omitted
};

/**
 * Everything one run needs. Built by the caller for each run; nothing here
 * outlives it.
 */
struct RunContext {
    const Config& config;
    const std::vector<std::unique_ptr<InventorySource>>& sources;
    const MethodTable& methods;
    Verifier& verifier;
    WarningCollector& warnings;
    const CancellationToken* cancel = nullptr;
    RunOptions options = {};
};

struct CollectedInventory {
    std::vector<InventoryItem> items;
    CanonicalIdentifierSet identifiers;
    size_t sources_total = 0;
    size_t sources_available = 0;
    size_t records_skipped = 0;
};

// Collect and normalize. Fails with NO_INVENTORY_SOURCE when no source
// could be read; partial availability only produces warnings.
Result<CollectedInventory> collect_inventory(RunContext& ctx);

// Diff against the removal snapshot, match bloatware patterns on the
// selected items, remove the matches and persist the current set.
PassReport run_removal_pass(RunContext& ctx, const CollectedInventory& inventory);

// Match essential-app patterns against the full inventory, install the
// ones that are missing and persist the requirement snapshot.
PassReport run_requirement_pass(RunContext& ctx, const CollectedInventory& inventory);

// Both passes in order (as selected by ctx.options)
Result<RunReport> run(RunContext& ctx);

// Synthetic install target for an essential-app pattern with no match
InventoryItem install_target(const std::string& pattern);

} // namespace sweep
