#include "sweep/types.hpp"
#include "sweep/identifier_set.hpp"

#include <algorithm>
#include <cctype>
#include <optional>
#include <set>

namespace sweep {

std::optional<Warning> parse_warning_key(const std::string& key) {
    std::string lower = fold_case(key);

    if (lower == "invalid_configuration") return Warning::invalid_configuration;
    if (lower == "config_missing") return Warning::config_missing;
    if (lower == "pattern_invalid") return Warning::pattern_invalid;
    if (lower == "source_unavailable") return Warning::source_unavailable;
    if (lower == "record_skipped") return Warning::record_skipped;
    if (lower == "snapshot_missing") return Warning::snapshot_missing;
    if (lower == "snapshot_corrupt") return Warning::snapshot_corrupt;
    if (lower == "method_failed") return Warning::method_failed;
    if (lower == "item_partial") return Warning::item_partial;
    if (lower == "item_failed") return Warning::item_failed;
    if (lower == "persistence_failed") return Warning::persistence_failed;
    if (lower == "audit_write_failed") return Warning::audit_write_failed;
    if (lower == "run_cancelled") return Warning::run_cancelled;

    return std::nullopt;
}

std::optional<WarningAction> parse_warning_action(const std::string& s) {
    std::string lower = fold_case(s);
    if (lower == "warn") return WarningAction::Warn;
    if (lower == "ignore") return WarningAction::Ignore;
    if (lower == "error") return WarningAction::Error;
    return std::nullopt;
}

std::optional<Origin> parse_origin(const std::string& s) {
    std::string lower = fold_case(s);

    if (lower == "packagemanagera" || lower == "winget") return Origin::PackageManagerA;
    if (lower == "packagemanagerb" || lower == "choco" || lower == "chocolatey") {
        return Origin::PackageManagerB;
    }
    if (lower == "ospackage" || lower == "appx") return Origin::OSPackage;
    if (lower == "provisionedpackage" || lower == "provisioned") return Origin::ProvisionedPackage;
    if (lower == "registryuninstall" || lower == "registry") return Origin::RegistryUninstall;
    if (lower == "windowsfeature" || lower == "feature") return Origin::WindowsFeature;
    if (lower == "service") return Origin::Service;
    if (lower == "scheduledtask" || lower == "task") return Origin::ScheduledTask;
    if (lower == "startmenushortcut" || lower == "shortcut") return Origin::StartMenuShortcut;
    if (lower == "startupentry" || lower == "startup") return Origin::StartupEntry;

    return std::nullopt;
}

const std::vector<Origin>& all_origins() {
    static const std::vector<Origin> origins = {
        Origin::PackageManagerA,
        Origin::PackageManagerB,
        Origin::OSPackage,
        Origin::ProvisionedPackage,
        Origin::RegistryUninstall,
        Origin::WindowsFeature,
        Origin::Service,
        Origin::ScheduledTask,
        Origin::StartMenuShortcut,
        Origin::StartupEntry,
    };
    return origins;
}

bool InventoryItem::has_identity() const {
    if (!primary_name.empty()) return true;
    return std::any_of(alternate_identifiers.begin(), alternate_identifiers.end(),
                       [](const std::string& id) { return !id.empty(); });
}

std::vector<std::string> InventoryItem::identifiers() const {
    std::vector<std::string> result;
    if (!primary_name.empty()) {
        result.push_back(primary_name);
    }
    for (const auto& id : alternate_identifiers) {
        if (!id.empty()) {
            result.push_back(id);
        }
    }
    return result;
}

std::string InventoryItem::key() const {
    std::set<std::string> folded;
    for (const auto& id : identifiers()) {
        folded.insert(fold_case(id));
    }

    std::string key = origin_to_string(origin);
    key += ":";
    bool first = true;
    for (const auto& id : folded) {
        if (!first) key += "|";
        key += id;
        first = false;
    }
    return key;
}

std::string InventoryItem::metadata(const std::string& name) const {
    auto it = origin_metadata.find(name);
    if (it != origin_metadata.end()) {
        return it->second;
    }
    return "";
}

} // namespace sweep
