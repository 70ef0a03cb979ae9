#pragma once

#include "sweep/config.hpp"
#include "sweep/identifier_set.hpp"
#include "sweep/types.hpp"

#include <optional>
#include <vector>

namespace sweep {

// ============================================================================
// Diff Engine
// ============================================================================

struct DiffResult {
    CanonicalIdentifierSet newly_observed;      // current - previous
    CanonicalIdentifierSet previously_observed; // previous - current
    CanonicalIdentifierSet unchanged;           // current & previous
    bool first_run = false;                     // no previous snapshot
};

/**
 * Compare this run's identifiers with the previous snapshot.
 *
 * Without a previous snapshot everything is newly observed. Linear in
 * |current| + |previous|. Makes no decision about what to scan.
 */
DiffResult diff(const CanonicalIdentifierSet& current,
                const std::optional<CanonicalIdentifierSet>& previous);

// ============================================================================
// Diff filter
// ============================================================================

enum class ScanScope {
    NewlyObserved,  // only items carrying a newly observed identifier
    Full,           // every item
    Nothing         // empty diff under the "skip" policy
};

inline const char* scan_scope_to_string(ScanScope s) {
    switch (s) {
        case ScanScope::NewlyObserved: return "newly_observed";
        case ScanScope::Full: return "full";
        case ScanScope::Nothing: return "nothing";
        default: return "full";
    }
}

struct ScanPolicy {
    bool force_full_scan = false;
    EmptyDiffPolicy empty_diff_policy = EmptyDiffPolicy::Skip;
};

// Decide which part of the inventory the matcher sees
ScanScope choose_scan_scope(const DiffResult& diff, const ScanPolicy& policy);

// The single boundary between diffing and matching: returns the items the
// matcher should see for the chosen scope
std::vector<InventoryItem> select_for_matching(const std::vector<InventoryItem>& items,
                                               const DiffResult& diff,
                                               ScanScope scope);

} // namespace sweep
