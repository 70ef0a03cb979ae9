#pragma once

#include "sweep/types.hpp"

#include <optional>
#include <string>
#include <utility>
#include <unordered_map>
#include <vector>

namespace sweep {

using WarningFields = std::unordered_map<std::string, std::string>;

// ============================================================================
// Warning Collector
// ============================================================================

/**
 * Collects non-fatal run conditions and applies the configured policy.
 *
 * Every emitted warning is also logged through spdlog at the level matching
 * its effective action. Not thread-safe: emit from the orchestrating thread.
 */
class WarningCollector {
public:
    WarningCollector() = default;

    explicit WarningCollector(const std::unordered_map<std::string, WarningAction>& policy)
        : policy_(policy) {}

    // Replaces the policy. Warnings already collected are re-evaluated, so
    // conditions found while loading the config follow that config.
    void set_policy(const std::unordered_map<std::string, WarningAction>& policy);

    void emit(Warning warning, const WarningFields& fields);
    void emit(Warning warning);

    // Per-run override from --warn; wins over the configured policy
    void apply_override(const std::string& warning_key, WarningAction action);

    // Warnings after policy application; "ignore" entries are excluded
    std::vector<WarningObject> get_warnings() const;

    // Number of emitted warnings with this key, regardless of action
    size_t count(Warning warning) const;

    bool has_errors() const;

private:
    struct CollectedWarning {
        std::string key;
        WarningFields fields;
        WarningAction effective_action;
    };

    std::unordered_map<std::string, WarningAction> policy_;
    std::vector<CollectedWarning> warnings_;
    std::unordered_map<std::string, WarningAction> overrides_;

    WarningAction get_effective_action(const std::string& key) const;
};

// Parse a "<warning_key>=<warn|ignore|error>" override; nullopt if either
// side is unknown
std::optional<std::pair<Warning, WarningAction>> parse_warning_override(const std::string& text);

// ============================================================================
// Field builders for specific warnings
// ============================================================================

namespace warnings {

inline WarningFields source_unavailable(const std::string& source, const std::string& reason) {
    return {{"source", source}, {"reason", reason}};
}

inline WarningFields record_skipped(const std::string& origin, const std::string& reason) {
    return {{"origin", origin}, {"reason", reason}};
}

inline WarningFields snapshot_state(const std::string& purpose,
                                    const std::string& path,
                                    const std::string& reason = "") {
    WarningFields result = {{"purpose", purpose}, {"path", path}};
    if (!reason.empty()) {
        result["reason"] = reason;
    }
    return result;
}

inline WarningFields item_outcome(const std::string& item,
                                  const std::string& origin,
                                  const std::string& error) {
    return {{"item", item}, {"origin", origin}, {"error", error}};
}

inline WarningFields invalid_configuration(const std::string& reason,
                                           const std::string& source_path) {
    return {{"reason", reason}, {"source_path", source_path}};
}

} // namespace warnings

} // namespace sweep
