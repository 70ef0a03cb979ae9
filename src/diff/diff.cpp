#include "sweep/diff.hpp"

#include <spdlog/spdlog.h>

namespace sweep {

DiffResult diff(const CanonicalIdentifierSet& current,
                const std::optional<CanonicalIdentifierSet>& previous) {
    DiffResult result;

    if (!previous) {
        result.first_run = true;
        result.newly_observed = current;
        return result;
    }

    for (const auto& [folded, display] : current.entries()) {
        if (previous->contains_folded(folded)) {
            result.unchanged.insert(display);
        } else {
            result.newly_observed.insert(display);
        }
    }

    for (const auto& [folded, display] : previous->entries()) {
        if (!current.contains_folded(folded)) {
            result.previously_observed.insert(display);
        }
    }

    return result;
}

ScanScope choose_scan_scope(const DiffResult& diff, const ScanPolicy& policy) {
    if (policy.force_full_scan || diff.first_run) {
        return ScanScope::Full;
    }
    if (!diff.newly_observed.empty()) {
        return ScanScope::NewlyObserved;
    }
    if (policy.empty_diff_policy == EmptyDiffPolicy::FullScan) {
        spdlog::info("No new identifiers since last snapshot; full scan by policy");
        return ScanScope::Full;
    }
    return ScanScope::Nothing;
}

std::vector<InventoryItem> select_for_matching(const std::vector<InventoryItem>& items,
                                               const DiffResult& diff,
                                               ScanScope scope) {
    switch (scope) {
        case ScanScope::Full:
            return items;
        case ScanScope::Nothing:
            return {};
        case ScanScope::NewlyObserved:
            break;
    }

    std::vector<InventoryItem> selected;
    for (const auto& item : items) {
        for (const auto& id : item.identifiers()) {
            if (diff.newly_observed.contains(id)) {
                selected.push_back(item);
                break;
            }
        }
    }
    return selected;
}

} // namespace sweep
