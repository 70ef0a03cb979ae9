#pragma once

/**
 * @file inventory.hpp
 * @brief Inventory sources and the normalizer that turns raw records into
 *        InventoryItems
 */

#include "sweep/command.hpp"
#include "sweep/config.hpp"
#include "sweep/types.hpp"

#include <memory>
#include <string>
#include <vector>

namespace sweep {

class WarningCollector;

// ============================================================================
// Inventory Sources
// ============================================================================

struct CollectResult {
    bool ok = false;      // false: the source could not be read at all
    std::string error;
    std::vector<RawRecord> records;
};

/**
 * A read-only provider of raw installed-item records from one origin.
 *
 * collect() never throws for an unavailable source; it returns ok = false
 * with an empty record list.
 */
class InventorySource {
public:
    virtual ~InventorySource() = default;

    virtual const std::string& name() const = 0;
    virtual Origin origin() const = 0;
    virtual CollectResult collect() = 0;
};

// Parse tool output into records. Json accepts an array of objects or a
// single object; scalar values become strings and nulls are dropped.
CollectResult parse_json_records(const std::string& text, Origin origin);
CollectResult parse_pipe_records(const std::string& text, Origin origin,
                                 const std::vector<std::string>& columns);

/**
 * Runs a command and parses its stdout.
 */
class CommandInventorySource : public InventorySource {
public:
    CommandInventorySource(SourceDefinition definition,
                           CommandRunner& runner,
                           std::chrono::seconds timeout);

    const std::string& name() const override { return definition_.name; }
    Origin origin() const override { return definition_.origin; }
    CollectResult collect() override;

private:
    SourceDefinition definition_;
    CommandRunner& runner_;
    std::chrono::seconds timeout_;
};

/**
 * Reads records from a previously exported listing on disk.
 */
class JsonFileInventorySource : public InventorySource {
public:
    explicit JsonFileInventorySource(SourceDefinition definition);

    const std::string& name() const override { return definition_.name; }
    Origin origin() const override { return definition_.origin; }
    CollectResult collect() override;

private:
    SourceDefinition definition_;
};

// Build the enabled sources of a configuration
std::vector<std::unique_ptr<InventorySource>> make_sources(const Config& config,
                                                           CommandRunner& runner);

struct CollectionSummary {
    std::vector<std::vector<RawRecord>> per_source;
    size_t sources_total = 0;
    size_t sources_available = 0;

    bool any_available() const { return sources_available > 0; }
};

// Run every source; unavailable sources contribute nothing and emit
// source_unavailable
CollectionSummary collect_all(const std::vector<std::unique_ptr<InventorySource>>& sources,
                              WarningCollector& warnings);

// ============================================================================
// Inventory Normalizer
// ============================================================================

// Field names consulted for one origin, most specific first
struct FieldMap {
    std::vector<std::string> name_keys;
    std::vector<std::string> identifier_keys;
};

const FieldMap& field_map_for(Origin origin);

struct NormalizeResult {
    std::vector<InventoryItem> items;
    size_t skipped = 0;
};

// The origin-specific ids of an item (shortcut path, package full name,
// registry key, ...). Falls back to every identifier when the item carries
// none of them.
std::vector<std::string> specific_identifiers(const InventoryItem& item);

// Convert one raw record; nullopt if it carries no identifying field
std::optional<InventoryItem> normalize_record(const RawRecord& record);

// Convert every record of every source. Records from different sources are
// kept as separate items even when they describe the same entity.
NormalizeResult normalize(const std::vector<std::vector<RawRecord>>& raw_records,
                          WarningCollector* warnings = nullptr);

} // namespace sweep
