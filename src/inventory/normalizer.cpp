#include "sweep/inventory.hpp"
#include "sweep/identifier_set.hpp"
#include "sweep/warnings.hpp"

#include <spdlog/spdlog.h>

#include <unordered_map>

namespace sweep {

namespace {

// Fallback keys consulted for every origin after the origin-specific ones
const std::vector<std::string> kGenericNameKeys = {"DisplayName", "Name"};
const std::vector<std::string> kGenericIdentifierKeys = {"Id", "Identifier"};

// Case-insensitive field lookup; empty string if absent
std::string find_field(const std::map<std::string, std::string>& fields, const std::string& key) {
    auto it = fields.find(key);
    if (it != fields.end()) {
        return trim(it->second);
    }
    std::string folded = fold_case(key);
    for (const auto& [name, value] : fields) {
        if (fold_case(name) == folded) {
            return trim(value);
        }
    }
    return "";
}

} // namespace

const FieldMap& field_map_for(Origin origin) {
    static const std::unordered_map<int, FieldMap> maps = {
        {static_cast<int>(Origin::PackageManagerA),
         {{"Name"}, {"Id", "PackageIdentifier"}}},
        {static_cast<int>(Origin::PackageManagerB),
         {{"Title", "Name"}, {"Id"}}},
        {static_cast<int>(Origin::OSPackage),
         {{"Name"}, {"PackageFamilyName", "PackageFullName"}}},
        {static_cast<int>(Origin::ProvisionedPackage),
         {{"DisplayName"}, {"PackageName"}}},
        {static_cast<int>(Origin::RegistryUninstall),
         {{"DisplayName"}, {"PSChildName", "KeyName"}}},
        {static_cast<int>(Origin::WindowsFeature),
         {{"FeatureName"}, {"DisplayName"}}},
        {static_cast<int>(Origin::Service),
         {{"DisplayName"}, {"Name", "ServiceName"}}},
        {static_cast<int>(Origin::ScheduledTask),
         {{"TaskName"}, {"URI"}}},
        {static_cast<int>(Origin::StartMenuShortcut),
         {{"BaseName", "Name"}, {"FullName", "Path"}}},
        {static_cast<int>(Origin::StartupEntry),
         {{"Name"}, {"Command"}}},
    };
    return maps.at(static_cast<int>(origin));
}

std::optional<InventoryItem> normalize_record(const RawRecord& record) {
    const FieldMap& map = field_map_for(record.origin);

    InventoryItem item;
    item.origin = record.origin;

    std::vector<std::string> name_keys = map.name_keys;
    name_keys.insert(name_keys.end(), kGenericNameKeys.begin(), kGenericNameKeys.end());
    std::vector<std::string> id_keys = map.identifier_keys;
    id_keys.insert(id_keys.end(), kGenericIdentifierKeys.begin(), kGenericIdentifierKeys.end());

    // Most specific display name wins; the rest become alternates
    for (const auto& key : name_keys) {
        std::string value = find_field(record.fields, key);
        if (value.empty()) continue;
        if (item.primary_name.empty()) {
            item.primary_name = value;
        } else {
            item.alternate_identifiers.insert(value);
        }
    }

    for (const auto& key : id_keys) {
        std::string value = find_field(record.fields, key);
        if (!value.empty()) {
            item.alternate_identifiers.insert(value);
        }
    }

    // An alternate that only repeats the primary name adds nothing
    std::string folded_primary = fold_case(item.primary_name);
    for (auto it = item.alternate_identifiers.begin(); it != item.alternate_identifiers.end();) {
        if (fold_case(*it) == folded_primary) {
            it = item.alternate_identifiers.erase(it);
        } else {
            ++it;
        }
    }

    if (!item.has_identity()) {
        return std::nullopt;
    }

    item.origin_metadata = record.fields;
    return item;
}

std::vector<std::string> specific_identifiers(const InventoryItem& item) {
    std::vector<std::string> ids;
    for (const auto& key : field_map_for(item.origin).identifier_keys) {
        std::string value = find_field(item.origin_metadata, key);
        if (!value.empty()) {
            ids.push_back(value);
        }
    }
    if (ids.empty()) {
        return item.identifiers();
    }
    return ids;
}

NormalizeResult normalize(const std::vector<std::vector<RawRecord>>& raw_records,
                          WarningCollector* warnings) {
    NormalizeResult result;

    for (const auto& source_records : raw_records) {
        for (const auto& record : source_records) {
            auto item = normalize_record(record);
            if (!item) {
                ++result.skipped;
                if (warnings) {
                    warnings->emit(Warning::record_skipped,
                                   warnings::record_skipped(origin_to_string(record.origin),
                                                            "no identifying field"));
                }
                continue;
            }
            result.items.push_back(std::move(*item));
        }
    }

    spdlog::debug("Normalized {} items ({} skipped)", result.items.size(), result.skipped);
    return result;
}

} // namespace sweep
