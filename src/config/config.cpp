#include "sweep/config.hpp"
#include "sweep/identifier_set.hpp"
#include "sweep/platform.hpp"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <optional>
#include <unordered_set>

namespace sweep {

namespace {

std::optional<std::string> get_string(const nlohmann::json& j, const std::string& key) {
    if (j.contains(key) && j[key].is_string()) {
        return j[key].get<std::string>();
    }
    return std::nullopt;
}

std::optional<bool> get_bool(const nlohmann::json& j, const std::string& key) {
    if (j.contains(key) && j[key].is_boolean()) {
        return j[key].get<bool>();
    }
    return std::nullopt;
}

std::optional<int64_t> get_int(const nlohmann::json& j, const std::string& key) {
    if (j.contains(key) && j[key].is_number_integer()) {
        return j[key].get<int64_t>();
    }
    return std::nullopt;
}

std::vector<std::string> get_string_array(const nlohmann::json& j, const std::string& key) {
    std::vector<std::string> result;
    if (j.contains(key) && j[key].is_array()) {
        for (const auto& elem : j[key]) {
            if (elem.is_string()) {
                result.push_back(elem.get<std::string>());
            }
        }
    }
    return result;
}

// Read a seconds value; non-positive values are rejected with a warning
void read_timeout(const nlohmann::json& j, const std::string& key,
                  std::chrono::seconds& out, std::vector<std::string>& warnings) {
    if (!j.contains(key)) return;
    auto value = get_int(j, key);
    if (!value || *value <= 0) {
        warnings.push_back("invalid_configuration:invalid_timeout:" + key);
        return;
    }
    out = std::chrono::seconds(*value);
}

std::string powershell_program() {
    return "powershell.exe";
}

SourceDefinition powershell_source(const std::string& name, Origin origin, const std::string& script) {
    SourceDefinition def;
    def.name = name;
    def.origin = origin;
    def.program = powershell_program();
    def.args = {"-NoProfile", "-NonInteractive", "-Command", script};
    def.format = SourceFormat::Json;
    return def;
}

} // namespace

std::optional<SourceFormat> parse_source_format(const std::string& s) {
    std::string lower = fold_case(s);
    if (lower == "json") return SourceFormat::Json;
    if (lower == "pipe") return SourceFormat::Pipe;
    return std::nullopt;
}

std::optional<EmptyDiffPolicy> parse_empty_diff_policy(const std::string& s) {
    std::string lower = fold_case(s);
    if (lower == "skip") return EmptyDiffPolicy::Skip;
    if (lower == "full_scan" || lower == "fullscan") return EmptyDiffPolicy::FullScan;
    return std::nullopt;
}

const std::vector<std::string>& builtin_bloatware_patterns() {
    static const std::vector<std::string> patterns = {
        "Microsoft.BingNews",
        "Microsoft.BingWeather",
        "Microsoft.BingFinance",
        "Microsoft.BingSports",
        "Microsoft.GetHelp",
        "Microsoft.Getstarted",
        "Microsoft.Messaging",
        "Microsoft.Microsoft3DViewer",
        "Microsoft.MicrosoftOfficeHub",
        "Microsoft.MicrosoftSolitaireCollection",
        "Microsoft.MixedReality.Portal",
        "Microsoft.OneConnect",
        "Microsoft.People",
        "Microsoft.Print3D",
        "Microsoft.SkypeApp",
        "Microsoft.Wallet",
        "Microsoft.WindowsFeedbackHub",
        "Microsoft.WindowsMaps",
        "Microsoft.XboxApp",
        "Microsoft.XboxGameOverlay",
        "Microsoft.XboxGamingOverlay",
        "Microsoft.XboxSpeechToTextOverlay",
        "Microsoft.Xbox.TCUI",
        "Microsoft.YourPhone",
        "Microsoft.ZuneMusic",
        "Microsoft.ZuneVideo",
        "Clipchamp.Clipchamp",
        "king.com.CandyCrushSaga",
        "king.com.CandyCrushSodaSaga",
        "king.com.BubbleWitch3Saga",
        "SpotifyAB.SpotifyMusic",
        "Disney.37853FC22B2CE",
        "Facebook.Facebook",
        "BytedancePte.Ltd.TikTok",
        "AmazonVideo.PrimeVideo",
        "McAfee*",
        "Norton*",
        "WildTangent*",
    };
    return patterns;
}

const std::vector<std::string>& builtin_protected_patterns() {
    static const std::vector<std::string> patterns = {
        "Microsoft.WindowsStore",
        "Microsoft.DesktopAppInstaller",
        "Microsoft.WindowsCalculator",
        "Microsoft.WindowsTerminal",
        "Microsoft.VCLibs*",
        "Microsoft.NET.*",
        "Microsoft.UI.Xaml*",
        "Microsoft.SecHealthUI",
    };
    return patterns;
}

const std::vector<std::string>& builtin_essential_apps() {
    static const std::vector<std::string> patterns = {
        "Google.Chrome",
        "Mozilla.Firefox",
        "7zip.7zip",
        "VideoLAN.VLC",
        "Notepad++.Notepad++",
        "Adobe.Acrobat.Reader.64-bit",
    };
    return patterns;
}

std::vector<SourceDefinition> default_sources() {
    std::vector<SourceDefinition> sources;

    sources.push_back(powershell_source(
        "winget", Origin::PackageManagerA,
        "Get-WinGetPackage | Select-Object Name,Id,InstalledVersion,Source | ConvertTo-Json -Compress"));

    SourceDefinition choco;
    choco.name = "choco";
    choco.origin = Origin::PackageManagerB;
    choco.program = "choco";
    choco.args = {"list", "--limit-output"};
    choco.format = SourceFormat::Pipe;
    choco.columns = {"Id", "Version"};
    sources.push_back(choco);

    sources.push_back(powershell_source(
        "appx", Origin::OSPackage,
        "Get-AppxPackage -AllUsers | Select-Object Name,PackageFullName,PackageFamilyName,Publisher"
        " | ConvertTo-Json -Compress"));

    sources.push_back(powershell_source(
        "provisioned", Origin::ProvisionedPackage,
        "Get-AppxProvisionedPackage -Online | Select-Object DisplayName,PackageName | ConvertTo-Json -Compress"));

    sources.push_back(powershell_source(
        "uninstall-registry", Origin::RegistryUninstall,
        "Get-ItemProperty 'HKLM:\\Software\\Microsoft\\Windows\\CurrentVersion\\Uninstall\\*',"
        "'HKLM:\\Software\\WOW6432Node\\Microsoft\\Windows\\CurrentVersion\\Uninstall\\*',"
        "'HKCU:\\Software\\Microsoft\\Windows\\CurrentVersion\\Uninstall\\*' -ErrorAction SilentlyContinue"
        " | Where-Object DisplayName"
        " | Select-Object DisplayName,PSChildName,Publisher,UninstallString,QuietUninstallString,PSPath"
        " | ConvertTo-Json -Compress"));

    sources.push_back(powershell_source(
        "optional-features", Origin::WindowsFeature,
        "Get-WindowsOptionalFeature -Online | Where-Object State -eq 'Enabled'"
        " | Select-Object FeatureName | ConvertTo-Json -Compress"));

    sources.push_back(powershell_source(
        "services", Origin::Service,
        "Get-Service | Select-Object Name,DisplayName | ConvertTo-Json -Compress"));

    sources.push_back(powershell_source(
        "scheduled-tasks", Origin::ScheduledTask,
        "Get-ScheduledTask | Select-Object TaskName,TaskPath,URI | ConvertTo-Json -Compress"));

    sources.push_back(powershell_source(
        "start-menu", Origin::StartMenuShortcut,
        "Get-ChildItem -Recurse -Filter *.lnk"
        " \"$env:ProgramData\\Microsoft\\Windows\\Start Menu\\Programs\","
        "\"$env:APPDATA\\Microsoft\\Windows\\Start Menu\\Programs\" -ErrorAction SilentlyContinue"
        " | Select-Object BaseName,FullName | ConvertTo-Json -Compress"));

    sources.push_back(powershell_source(
        "startup", Origin::StartupEntry,
        "Get-CimInstance Win32_StartupCommand | Select-Object Name,Command,Location | ConvertTo-Json -Compress"));

    return sources;
}

std::vector<std::string> merge_patterns(const std::vector<std::string>& builtin,
                                        const std::vector<std::string>& custom) {
    std::vector<std::string> merged;
    std::unordered_set<std::string> seen;

    auto add = [&](const std::string& raw) {
        std::string pattern = trim(raw);
        if (pattern.empty()) return;
        if (seen.insert(fold_case(pattern)).second) {
            merged.push_back(pattern);
        }
    };

    for (const auto& p : builtin) add(p);
    for (const auto& p : custom) add(p);
    return merged;
}

Config get_builtin_config() {
    Config config;
    config.schema = kConfigSchema;
    config.bloatware.patterns = merge_patterns(builtin_bloatware_patterns(), {});
    config.bloatware.protected_patterns = merge_patterns(builtin_protected_patterns(), {});
    config.essential_apps.patterns = merge_patterns(builtin_essential_apps(), {});
    config.sources = default_sources();
    return config;
}

ConfigParseResult parse_config_full(const std::string& json_str, const std::string& source_path) {
    ConfigParseResult result;
    result.config = get_builtin_config();
    result.config.source_path = source_path;

    try {
        auto j = nlohmann::json::parse(json_str);

        if (!j.is_object()) {
            result.error = "JSON must be an object";
            return result;
        }

        // $schema (REQUIRED)
        if (auto schema = get_string(j, "$schema")) {
            result.config.schema = trim(*schema);
        } else {
            result.error = "$schema missing";
            return result;
        }

        if (result.config.schema != kConfigSchema) {
            result.error = std::string("$schema mismatch: expected ") + kConfigSchema;
            return result;
        }

        if (auto level = get_string(j, "log_level")) {
            std::string lower = fold_case(*level);
            if (lower == "debug" || lower == "info" || lower == "warn" || lower == "error") {
                result.config.log_level = lower;
            } else {
                result.warnings.push_back("invalid_configuration:invalid_log_level");
            }
        }

        // "bloatware" section
        if (j.contains("bloatware") && j["bloatware"].is_object()) {
            const auto& bloat = j["bloatware"];
            std::vector<std::string> builtin = bloat.contains("builtin")
                ? get_string_array(bloat, "builtin")
                : builtin_bloatware_patterns();
            result.config.bloatware.patterns = merge_patterns(builtin, get_string_array(bloat, "custom"));

            if (bloat.contains("protected")) {
                result.config.bloatware.protected_patterns =
                    merge_patterns(builtin_protected_patterns(), get_string_array(bloat, "protected"));
            }
        }

        // "essential_apps" section
        if (j.contains("essential_apps") && j["essential_apps"].is_object()) {
            const auto& apps = j["essential_apps"];
            std::vector<std::string> builtin = apps.contains("builtin")
                ? get_string_array(apps, "builtin")
                : builtin_essential_apps();
            result.config.essential_apps.patterns = merge_patterns(builtin, get_string_array(apps, "custom"));
        }

        // "timeouts" section
        if (j.contains("timeouts") && j["timeouts"].is_object()) {
            const auto& t = j["timeouts"];
            read_timeout(t, "package_seconds", result.config.timeouts.package, result.warnings);
            read_timeout(t, "servicing_seconds", result.config.timeouts.servicing, result.warnings);
            read_timeout(t, "query_seconds", result.config.timeouts.query, result.warnings);
        }

        // "execution" section
        if (j.contains("execution") && j["execution"].is_object()) {
            const auto& exec = j["execution"];
            if (exec.contains("max_workers")) {
                auto workers = get_int(exec, "max_workers");
                if (workers && *workers > 0) {
                    result.config.execution.max_workers = static_cast<size_t>(*workers);
                } else {
                    result.warnings.push_back("invalid_configuration:invalid_max_workers");
                }
            }
            if (auto dry = get_bool(exec, "dry_run")) {
                result.config.execution.dry_run = *dry;
            }
        }

        // "diff" section
        if (j.contains("diff") && j["diff"].is_object()) {
            const auto& d = j["diff"];
            if (auto policy = get_string(d, "empty_diff_policy")) {
                auto parsed = parse_empty_diff_policy(*policy);
                if (parsed) {
                    result.config.diff.empty_diff_policy = *parsed;
                } else {
                    result.warnings.push_back("invalid_configuration:invalid_empty_diff_policy");
                }
            }
            if (auto full = get_bool(d, "force_full_scan")) {
                result.config.diff.force_full_scan = *full;
            }
        }

        // "paths" section
        if (j.contains("paths") && j["paths"].is_object()) {
            const auto& p = j["paths"];
            if (auto v = get_string(p, "state_dir")) result.config.paths.state_dir = *v;
            if (auto v = get_string(p, "removal_snapshot")) result.config.paths.removal_snapshot = *v;
            if (auto v = get_string(p, "requirement_snapshot")) result.config.paths.requirement_snapshot = *v;
            if (auto v = get_string(p, "audit")) result.config.paths.audit = *v;
        }

        // "sources" section replaces the default source set
        if (j.contains("sources") && j["sources"].is_array()) {
            result.config.sources.clear();
            size_t index = 0;
            for (const auto& s : j["sources"]) {
                ++index;
                if (!s.is_object()) {
                    result.warnings.push_back("invalid_configuration:source_not_object:" + std::to_string(index));
                    continue;
                }

                SourceDefinition def;
                def.name = get_string(s, "name").value_or("source-" + std::to_string(index));

                auto origin_str = get_string(s, "origin");
                auto origin = origin_str ? parse_origin(*origin_str) : std::nullopt;
                if (!origin) {
                    result.warnings.push_back("invalid_configuration:invalid_origin:" + def.name);
                    continue;
                }
                def.origin = *origin;

                def.program = get_string(s, "program").value_or("");
                def.args = get_string_array(s, "args");
                def.path = get_string(s, "path").value_or("");
                def.columns = get_string_array(s, "columns");
                def.enabled = get_bool(s, "enabled").value_or(true);

                if (auto format = get_string(s, "format")) {
                    auto parsed = parse_source_format(*format);
                    if (parsed) {
                        def.format = *parsed;
                    } else {
                        result.warnings.push_back("invalid_configuration:invalid_format:" + def.name);
                    }
                }

                if (def.program.empty() && def.path.empty()) {
                    result.warnings.push_back("invalid_configuration:source_without_program_or_path:" + def.name);
                    continue;
                }

                result.config.sources.push_back(std::move(def));
            }
        }

        // "warnings" section
        if (j.contains("warnings") && j["warnings"].is_object()) {
            for (auto& [key, val] : j["warnings"].items()) {
                if (!val.is_string()) continue;
                std::string key_str = fold_case(key);
                auto action = parse_warning_action(val.get<std::string>());
                if (action) {
                    result.config.warnings[key_str] = *action;
                } else {
                    result.warnings.push_back("invalid_configuration:invalid_warning_action:" + key_str);
                }
            }
        }

        result.ok = true;
        return result;

    } catch (const nlohmann::json::parse_error& e) {
        result.error = std::string("parse error: ") + e.what();
        return result;
    } catch (const nlohmann::json::exception& e) {
        result.error = std::string("JSON error: ") + e.what();
        return result;
    }
}

void resolve_state_paths(Config& config, const std::string& root) {
    if (config.paths.state_dir.empty()) {
        config.paths.state_dir = join_path(root, "state");
    }
    if (config.paths.removal_snapshot.empty()) {
        config.paths.removal_snapshot = join_path(config.paths.state_dir, "removal.snapshot.json");
    }
    if (config.paths.requirement_snapshot.empty()) {
        config.paths.requirement_snapshot = join_path(config.paths.state_dir, "requirement.snapshot.json");
    }
}

std::string config_to_json(const Config& config) {
    nlohmann::json j;
    j["$schema"] = config.schema;
    j["log_level"] = config.log_level;
    j["bloatware"]["patterns"] = config.bloatware.patterns;
    j["bloatware"]["protected"] = config.bloatware.protected_patterns;
    j["essential_apps"]["patterns"] = config.essential_apps.patterns;
    j["timeouts"]["package_seconds"] = config.timeouts.package.count();
    j["timeouts"]["servicing_seconds"] = config.timeouts.servicing.count();
    j["timeouts"]["query_seconds"] = config.timeouts.query.count();
    j["execution"]["max_workers"] = config.execution.max_workers;
    j["execution"]["dry_run"] = config.execution.dry_run;
    j["diff"]["empty_diff_policy"] = empty_diff_policy_to_string(config.diff.empty_diff_policy);
    j["diff"]["force_full_scan"] = config.diff.force_full_scan;
    j["paths"]["state_dir"] = config.paths.state_dir;
    j["paths"]["removal_snapshot"] = config.paths.removal_snapshot;
    j["paths"]["requirement_snapshot"] = config.paths.requirement_snapshot;
    j["paths"]["audit"] = config.paths.audit;

    j["sources"] = nlohmann::json::array();
    for (const auto& s : config.sources) {
        nlohmann::json src;
        src["name"] = s.name;
        src["origin"] = origin_to_string(s.origin);
        if (!s.program.empty()) {
            src["program"] = s.program;
            src["args"] = s.args;
        }
        if (!s.path.empty()) src["path"] = s.path;
        src["format"] = s.format == SourceFormat::Pipe ? "pipe" : "json";
        if (!s.columns.empty()) src["columns"] = s.columns;
        src["enabled"] = s.enabled;
        j["sources"].push_back(src);
    }

    j["warnings"] = nlohmann::json::object();
    for (const auto& [key, action] : config.warnings) {
        j["warnings"][key] = action_to_string(action);
    }

    return j.dump(2, ' ', false, nlohmann::json::error_handler_t::replace);
}

} // namespace sweep
