#pragma once

#include "sweep/types.hpp"

#include <chrono>
#include <string>
#include <unordered_map>
#include <vector>

namespace sweep {

// ============================================================================
// Configuration
// ============================================================================

inline constexpr const char* kConfigSchema = "sweep.config.v1";

enum class SourceFormat {
    Json,  // ConvertTo-Json style: an array of objects or a single object
    Pipe   // one record per line, fields separated by '|'
};

std::optional<SourceFormat> parse_source_format(const std::string& s);

/**
 * One inventory source. Either a command whose stdout is parsed, or a file
 * holding a previously exported listing (`path` set, `program` empty).
 */
struct SourceDefinition {
    std::string name;
    Origin origin = Origin::RegistryUninstall;
    std::string program;
    std::vector<std::string> args;
    std::string path;
    SourceFormat format = SourceFormat::Json;
    std::vector<std::string> columns;  // field names for SourceFormat::Pipe
    bool enabled = true;
};

struct Timeouts {
    std::chrono::seconds package{300};
    std::chrono::seconds servicing{3600};
    std::chrono::seconds query{60};
};

enum class EmptyDiffPolicy {
    Skip,      // nothing new since the last snapshot: match nothing
    FullScan   // nothing new since the last snapshot: match everything
};

inline const char* empty_diff_policy_to_string(EmptyDiffPolicy p) {
    switch (p) {
        case EmptyDiffPolicy::Skip: return "skip";
        case EmptyDiffPolicy::FullScan: return "full_scan";
        default: return "skip";
    }
}

std::optional<EmptyDiffPolicy> parse_empty_diff_policy(const std::string& s);

struct Config {
    std::string schema;
    std::string log_level = "info";

    struct {
        std::vector<std::string> patterns;            // built-in + custom, merged
        std::vector<std::string> protected_patterns;  // never removed
    } bloatware;

    struct {
        std::vector<std::string> patterns;            // built-in + custom, merged
    } essential_apps;

    Timeouts timeouts;

    struct {
        size_t max_workers = 8;
        bool dry_run = false;
    } execution;

    struct {
        EmptyDiffPolicy empty_diff_policy = EmptyDiffPolicy::Skip;
        bool force_full_scan = false;
    } diff;

    struct {
        std::string state_dir;
        std::string removal_snapshot;
        std::string requirement_snapshot;
        std::string audit;
    } paths;

    std::vector<SourceDefinition> sources;

    // warning key -> action
    std::unordered_map<std::string, WarningAction> warnings;

    // Source path for trace
    std::string source_path;
};

// Built-in configuration: default pattern lists and the Windows source set
Config get_builtin_config();

// Built-in pattern lists
const std::vector<std::string>& builtin_bloatware_patterns();
const std::vector<std::string>& builtin_protected_patterns();
const std::vector<std::string>& builtin_essential_apps();

// Default inventory sources (Windows tooling invoked through PowerShell)
std::vector<SourceDefinition> default_sources();

// Append custom entries after built-ins, dropping blanks and
// case-insensitive duplicates (first occurrence keeps its position)
std::vector<std::string> merge_patterns(const std::vector<std::string>& builtin,
                                        const std::vector<std::string>& custom);

// ============================================================================
// Configuration Parsing
// ============================================================================

struct ConfigParseResult {
    bool ok = false;
    std::string error;
    Config config;
    std::vector<std::string> warnings;
};

// Parse a configuration document. Sections that are absent keep the
// built-in defaults; invalid values produce warnings, not failures.
ConfigParseResult parse_config_full(const std::string& json_str,
                                    const std::string& source_path = "");

// Fill empty snapshot/audit paths from the state directory
void resolve_state_paths(Config& config, const std::string& root);

// Serialize the effective configuration (for `sweep config show`)
std::string config_to_json(const Config& config);

} // namespace sweep
