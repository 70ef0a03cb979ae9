#pragma once

#include <map>
#include <optional>
#include <set>
#include <string>
#include <unordered_map>
#include <vector>

namespace sweep {

// ============================================================================
// Warning System
// ============================================================================

enum class Warning {
    invalid_configuration,
    config_missing,
    pattern_invalid,
    source_unavailable,
    record_skipped,
    snapshot_missing,
    snapshot_corrupt,
    method_failed,
    item_partial,
    item_failed,
    persistence_failed,
    audit_write_failed,
    run_cancelled,
};

// Convert warning enum to canonical lowercase snake_case string
inline const char* warning_to_string(Warning w) {
    switch (w) {
        case Warning::invalid_configuration: return "invalid_configuration";
        case Warning::config_missing: return "config_missing";
        case Warning::pattern_invalid: return "pattern_invalid";
        case Warning::source_unavailable: return "source_unavailable";
        case Warning::record_skipped: return "record_skipped";
        case Warning::snapshot_missing: return "snapshot_missing";
        case Warning::snapshot_corrupt: return "snapshot_corrupt";
        case Warning::method_failed: return "method_failed";
        case Warning::item_partial: return "item_partial";
        case Warning::item_failed: return "item_failed";
        case Warning::persistence_failed: return "persistence_failed";
        case Warning::audit_write_failed: return "audit_write_failed";
        case Warning::run_cancelled: return "run_cancelled";
        default: return "unknown";
    }
}

// Parse warning key string to enum (case-insensitive)
std::optional<Warning> parse_warning_key(const std::string& key);

enum class WarningAction {
    Warn,
    Ignore,
    Error
};

inline const char* action_to_string(WarningAction a) {
    switch (a) {
        case WarningAction::Warn: return "warn";
        case WarningAction::Ignore: return "ignore";
        case WarningAction::Error: return "error";
        default: return "warn";
    }
}

std::optional<WarningAction> parse_warning_action(const std::string& s);

struct WarningObject {
    std::string key;                                      // lowercase snake_case
    std::string action;                                   // "warn" | "error"
    std::unordered_map<std::string, std::string> fields;  // warning-specific
};

// ============================================================================
// Origin
// ============================================================================

// Where an inventory item was observed. PackageManagerA is winget,
// PackageManagerB is Chocolatey.
enum class Origin {
    PackageManagerA,
    PackageManagerB,
    OSPackage,
    ProvisionedPackage,
    RegistryUninstall,
    WindowsFeature,
    Service,
    ScheduledTask,
    StartMenuShortcut,
    StartupEntry,
};

inline const char* origin_to_string(Origin o) {
    switch (o) {
        case Origin::PackageManagerA: return "PackageManagerA";
        case Origin::PackageManagerB: return "PackageManagerB";
        case Origin::OSPackage: return "OSPackage";
        case Origin::ProvisionedPackage: return "ProvisionedPackage";
        case Origin::RegistryUninstall: return "RegistryUninstall";
        case Origin::WindowsFeature: return "WindowsFeature";
        case Origin::Service: return "Service";
        case Origin::ScheduledTask: return "ScheduledTask";
        case Origin::StartMenuShortcut: return "StartMenuShortcut";
        case Origin::StartupEntry: return "StartupEntry";
        default: return "unknown";
    }
}

// Accepts the enum spelling as well as the short aliases used in config
// files ("winget", "choco", "appx", ...). Case-insensitive.
std::optional<Origin> parse_origin(const std::string& s);

// All origins in declaration order
const std::vector<Origin>& all_origins();

// ============================================================================
// Raw Record
// ============================================================================

// One record as an inventory source reported it. Field names are
// source-specific (e.g. "DisplayName", "PackageFullName", "Id").
struct RawRecord {
    Origin origin = Origin::RegistryUninstall;
    std::map<std::string, std::string> fields;
};

// ============================================================================
// Inventory Item
// ============================================================================

struct InventoryItem {
    std::string primary_name;
    std::set<std::string> alternate_identifiers;
    Origin origin = Origin::RegistryUninstall;
    std::map<std::string, std::string> origin_metadata;

    // True if the item carries at least one non-empty identifier
    bool has_identity() const;

    // primary_name followed by every alternate identifier, empties skipped
    std::vector<std::string> identifiers() const;

    // Stable key used for at-most-once processing: origin + every folded
    // identifier. Same-named entities with different ids stay distinct.
    std::string key() const;

    // Lookup helper for origin_metadata; empty string if absent
    std::string metadata(const std::string& name) const;
};

// ============================================================================
// Matching
// ============================================================================

enum class MatchStrategy {
    Exact,
    Normalized,
    PartialPublisher
};

inline const char* match_strategy_to_string(MatchStrategy s) {
    switch (s) {
        case MatchStrategy::Exact: return "exact";
        case MatchStrategy::Normalized: return "normalized";
        case MatchStrategy::PartialPublisher: return "partial_publisher";
        default: return "exact";
    }
}

struct MatchRecord {
    std::string pattern;
    InventoryItem item;
    MatchStrategy strategy = MatchStrategy::Exact;
    std::string matched_identifier;  // the identifier that satisfied the pattern
};

// ============================================================================
// Actions
// ============================================================================

enum class ActionMode {
    Remove,
    Install
};

inline const char* action_mode_to_string(ActionMode m) {
    switch (m) {
        case ActionMode::Remove: return "remove";
        case ActionMode::Install: return "install";
        default: return "remove";
    }
}

enum class OutcomeStatus {
    Success,
    Partial,
    Failed,
    Skipped
};

inline const char* outcome_status_to_string(OutcomeStatus s) {
    switch (s) {
        case OutcomeStatus::Success: return "success";
        case OutcomeStatus::Partial: return "partial";
        case OutcomeStatus::Failed: return "failed";
        case OutcomeStatus::Skipped: return "skipped";
        default: return "failed";
    }
}

struct MethodAttempt {
    std::string method;
    bool reported_ok = false;
    bool verified = false;
    std::string error;
};

struct ActionOutcome {
    InventoryItem item;
    OutcomeStatus status = OutcomeStatus::Failed;
    std::string method_used;
    std::optional<std::string> error;
    std::vector<MethodAttempt> attempts;
    double elapsed_seconds = 0.0;

    bool success() const { return status == OutcomeStatus::Success; }
};

} // namespace sweep
