#include "sweep/methods.hpp"
#include "sweep/identifier_set.hpp"
#include "sweep/matcher.hpp"
#include "sweep/platform.hpp"

#include <spdlog/spdlog.h>

#include <functional>
#include <set>

namespace sweep {

namespace {

const char* const kPowerShell = "powershell.exe";

const char* const kUninstallRoots =
    "'HKLM:\\Software\\Microsoft\\Windows\\CurrentVersion\\Uninstall\\*',"
    "'HKLM:\\Software\\WOW6432Node\\Microsoft\\Windows\\CurrentVersion\\Uninstall\\*',"
    "'HKCU:\\Software\\Microsoft\\Windows\\CurrentVersion\\Uninstall\\*'";

const char* const kAppxAllUserStore =
    "HKLM\\SOFTWARE\\Microsoft\\Windows\\CurrentVersion\\Appx\\AppxAllUserStore\\Applications\\";

// Builds the command for one item. Returns nullopt and sets `error` when the
// item lacks what the method needs.
using CommandBuilder = std::function<std::optional<CommandSpec>(const InventoryItem&, std::string& error)>;

std::string first_line(const std::string& text) {
    std::string line = trim(text.substr(0, text.find('\n')));
    if (line.size() > 200) {
        line = line.substr(0, 200) + "...";
    }
    return line;
}

MethodResult run_command(CommandRunner& runner, const CommandSpec& spec,
                         const std::set<int>& accepted_codes) {
    spdlog::debug("exec: {}", describe_command(spec));
    CommandResult result = runner.run(spec);

    if (result.timed_out) {
        return MethodResult::failure("timed out after " + std::to_string(spec.timeout.count()) + "s");
    }
    if (!result.ok) {
        return MethodResult::failure(result.error.empty() ? "failed to run " + spec.program : result.error);
    }
    if (accepted_codes.count(result.exit_code) == 0) {
        std::string detail = first_line(result.stderr_text);
        if (detail.empty()) detail = first_line(result.stdout_text);
        std::string message = "exit code " + std::to_string(result.exit_code);
        if (!detail.empty()) message += ": " + detail;
        return MethodResult::failure(message);
    }
    return MethodResult::success();
}

ActionMethod command_method(const std::string& name,
                            const std::string& lock_group,
                            CommandRunner& runner,
                            std::chrono::seconds timeout,
                            CommandBuilder build,
                            std::set<int> accepted_codes = {0}) {
    ActionMethod method;
    method.name = name;
    method.lock_group = lock_group;
    method.run = [&runner, timeout, build = std::move(build),
                  accepted_codes = std::move(accepted_codes)](const InventoryItem& item) {
        std::string error;
        auto spec = build(item, error);
        if (!spec) {
            return MethodResult::failure(error);
        }
        spec->timeout = timeout;
        return run_command(runner, *spec, accepted_codes);
    };
    return method;
}

CommandSpec powershell(const std::string& script) {
    CommandSpec spec;
    spec.program = kPowerShell;
    spec.args = {"-NoProfile", "-NonInteractive", "-Command", script};
    return spec;
}

// First non-empty metadata value among `keys`, else the primary name
std::string pick(const InventoryItem& item, const std::vector<std::string>& keys, bool fallback_to_name = true) {
    for (const auto& key : keys) {
        std::string value = trim(item.metadata(key));
        if (!value.empty()) return value;
    }
    return fallback_to_name ? item.primary_name : "";
}

// ============================================================================
// Package managers
// ============================================================================

ActionMethod winget_uninstall(CommandRunner& runner, const Timeouts& t) {
    return command_method("winget-uninstall", "winget", runner, t.package,
        [](const InventoryItem& item, std::string&) -> std::optional<CommandSpec> {
            CommandSpec spec;
            spec.program = "winget";
            spec.args = {"uninstall", "--id", pick(item, {"Id", "PackageIdentifier"}), "--exact",
                         "--silent", "--accept-source-agreements", "--disable-interactivity"};
            return spec;
        });
}

ActionMethod choco_uninstall(CommandRunner& runner, const Timeouts& t) {
    return command_method("choco-uninstall", "choco", runner, t.package,
        [](const InventoryItem& item, std::string&) -> std::optional<CommandSpec> {
            CommandSpec spec;
            spec.program = "choco";
            spec.args = {"uninstall", pick(item, {"Id"}), "-y", "--no-progress"};
            return spec;
        });
}

ActionMethod winget_install(CommandRunner& runner, const Timeouts& t) {
    return command_method("winget-install", "winget", runner, t.package,
        [](const InventoryItem& item, std::string&) -> std::optional<CommandSpec> {
            CommandSpec spec;
            spec.program = "winget";
            spec.args = {"install", "--id", pick(item, {"Id", "PackageIdentifier"}), "--exact",
                         "--silent", "--accept-package-agreements", "--accept-source-agreements",
                         "--disable-interactivity"};
            return spec;
        });
}

ActionMethod choco_install(CommandRunner& runner, const Timeouts& t) {
    return command_method("choco-install", "choco", runner, t.package,
        [](const InventoryItem& item, std::string&) -> std::optional<CommandSpec> {
            CommandSpec spec;
            spec.program = "choco";
            spec.args = {"install", pick(item, {"Id"}), "-y", "--no-progress"};
            return spec;
        });
}

// Looks the entry up by display name and runs its uninstall string
ActionMethod registry_uninstall_string(CommandRunner& runner, const Timeouts& t) {
    return command_method("registry-uninstall-string", "uninstaller", runner, t.package,
        [](const InventoryItem& item, std::string& error) -> std::optional<CommandSpec> {
            if (item.primary_name.empty()) {
                error = "no display name to look up";
                return std::nullopt;
            }
            std::string script =
                std::string("$k = Get-ItemProperty ") + kUninstallRoots +
                " -ErrorAction SilentlyContinue | Where-Object DisplayName -eq " +
                powershell_quote(item.primary_name) +
                " | Select-Object -First 1; if (-not $k) { exit 2 };"
                " $cmd = if ($k.QuietUninstallString) { $k.QuietUninstallString } else { $k.UninstallString };"
                " if (-not $cmd) { exit 3 };"
                " if ($cmd -match 'msiexec') { $cmd = ($cmd -replace '/I', '/X') + ' /qn /norestart' };"
                " $p = Start-Process cmd.exe -ArgumentList '/c', $cmd -Wait -PassThru; exit $p.ExitCode";
            return powershell(script);
        },
        {0, 3010});
}

// ============================================================================
// Appx / provisioned packages
// ============================================================================

ActionMethod remove_appx_package(CommandRunner& runner, const Timeouts& t) {
    return command_method("remove-appx-package", "appx", runner, t.package,
        [](const InventoryItem& item, std::string&) -> std::optional<CommandSpec> {
            std::string full_name = pick(item, {"PackageFullName"}, false);
            if (!full_name.empty()) {
                return powershell("Remove-AppxPackage -Package " + powershell_quote(full_name) +
                                  " -AllUsers -ErrorAction Stop");
            }
            return powershell("Get-AppxPackage -AllUsers -Name " + powershell_quote(item.primary_name) +
                              " | Remove-AppxPackage -AllUsers -ErrorAction Stop");
        });
}

ActionMethod remove_provisioned_package(CommandRunner& runner, const Timeouts& t) {
    return command_method("remove-provisioned-package", "appx", runner, t.package,
        [](const InventoryItem& item, std::string&) -> std::optional<CommandSpec> {
            std::string package_name = pick(item, {"PackageName"}, false);
            if (!package_name.empty()) {
                return powershell("Remove-AppxProvisionedPackage -Online -AllUsers -PackageName " +
                                  powershell_quote(package_name) + " -ErrorAction Stop");
            }
            return powershell("Get-AppxProvisionedPackage -Online | Where-Object DisplayName -eq " +
                              powershell_quote(item.primary_name) +
                              " | Remove-AppxProvisionedPackage -Online -AllUsers -ErrorAction Stop");
        });
}

ActionMethod dism_remove_provisioned(CommandRunner& runner, const Timeouts& t) {
    return command_method("dism-remove-provisioned", "dism", runner, t.servicing,
        [](const InventoryItem& item, std::string& error) -> std::optional<CommandSpec> {
            std::string package_name = pick(item, {"PackageName", "PackageFullName"}, false);
            if (package_name.empty()) {
                error = "no package name";
                return std::nullopt;
            }
            CommandSpec spec;
            spec.program = "dism.exe";
            spec.args = {"/Online", "/Remove-ProvisionedAppxPackage", "/PackageName:" + package_name};
            return spec;
        },
        {0, 3010});
}

ActionMethod delete_appx_store_key(CommandRunner& runner, const Timeouts& t) {
    return command_method("registry-key-delete", "registry", runner, t.package,
        [](const InventoryItem& item, std::string& error) -> std::optional<CommandSpec> {
            std::string package_name = pick(item, {"PackageName"}, false);
            if (package_name.empty()) {
                error = "no package name";
                return std::nullopt;
            }
            CommandSpec spec;
            spec.program = "reg.exe";
            spec.args = {"delete", std::string(kAppxAllUserStore) + package_name, "/f"};
            return spec;
        });
}

// ============================================================================
// Uninstall registry entries
// ============================================================================

ActionMethod quiet_uninstall_string(CommandRunner& runner, const Timeouts& t) {
    return command_method("quiet-uninstall-string", "uninstaller", runner, t.package,
        [](const InventoryItem& item, std::string& error) -> std::optional<CommandSpec> {
            std::string command = pick(item, {"QuietUninstallString"}, false);
            if (command.empty()) {
                error = "no QuietUninstallString";
                return std::nullopt;
            }
            CommandSpec spec;
            spec.program = "cmd.exe";
            spec.args = {"/c", command};
            return spec;
        },
        {0, 3010});
}

ActionMethod uninstall_string(CommandRunner& runner, const Timeouts& t) {
    return command_method("uninstall-string", "uninstaller", runner, t.package,
        [](const InventoryItem& item, std::string& error) -> std::optional<CommandSpec> {
            std::string command = pick(item, {"UninstallString"}, false);
            if (command.empty()) {
                error = "no UninstallString";
                return std::nullopt;
            }
            CommandSpec spec;
            spec.program = "cmd.exe";
            spec.args = {"/c", silent_uninstall_command(command)};
            return spec;
        },
        {0, 3010});
}

ActionMethod delete_uninstall_key(CommandRunner& runner, const Timeouts& t) {
    return command_method("registry-key-delete", "registry", runner, t.package,
        [](const InventoryItem& item, std::string& error) -> std::optional<CommandSpec> {
            std::string key = registry_key_from_ps_path(pick(item, {"PSPath"}, false));
            if (key.empty()) {
                error = "no registry path";
                return std::nullopt;
            }
            CommandSpec spec;
            spec.program = "reg.exe";
            spec.args = {"delete", key, "/f"};
            return spec;
        });
}

// ============================================================================
// Features, services, tasks, shortcuts, startup entries
// ============================================================================

ActionMethod dism_disable_feature(CommandRunner& runner, const Timeouts& t) {
    return command_method("dism-disable-feature", "dism", runner, t.servicing,
        [](const InventoryItem& item, std::string&) -> std::optional<CommandSpec> {
            CommandSpec spec;
            spec.program = "dism.exe";
            spec.args = {"/Online", "/Disable-Feature", "/FeatureName:" + pick(item, {"FeatureName"}),
                         "/NoRestart"};
            return spec;
        },
        {0, 3010});
}

ActionMethod stop_and_disable_service(CommandRunner& runner, const Timeouts& t) {
    return command_method("stop-and-disable", "", runner, t.package,
        [](const InventoryItem& item, std::string&) -> std::optional<CommandSpec> {
            std::string name = powershell_quote(pick(item, {"Name", "ServiceName"}));
            return powershell("Stop-Service -Name " + name + " -Force -ErrorAction SilentlyContinue; "
                              "Set-Service -Name " + name + " -StartupType Disabled -ErrorAction Stop");
        });
}

ActionMethod delete_service(CommandRunner& runner, const Timeouts& t) {
    return command_method("delete-service", "", runner, t.package,
        [](const InventoryItem& item, std::string&) -> std::optional<CommandSpec> {
            CommandSpec spec;
            spec.program = "sc.exe";
            spec.args = {"delete", pick(item, {"Name", "ServiceName"})};
            return spec;
        });
}

std::string task_name(const InventoryItem& item) {
    std::string uri = pick(item, {"URI"}, false);
    if (!uri.empty()) return uri;
    return pick(item, {"TaskPath"}, false) + pick(item, {"TaskName"});
}

ActionMethod disable_task(CommandRunner& runner, const Timeouts& t) {
    return command_method("disable-task", "schtasks", runner, t.package,
        [](const InventoryItem& item, std::string&) -> std::optional<CommandSpec> {
            CommandSpec spec;
            spec.program = "schtasks.exe";
            spec.args = {"/Change", "/TN", task_name(item), "/Disable"};
            return spec;
        });
}

ActionMethod delete_task(CommandRunner& runner, const Timeouts& t) {
    return command_method("delete-task", "schtasks", runner, t.package,
        [](const InventoryItem& item, std::string&) -> std::optional<CommandSpec> {
            CommandSpec spec;
            spec.program = "schtasks.exe";
            spec.args = {"/Delete", "/TN", task_name(item), "/F"};
            return spec;
        });
}

ActionMethod delete_shortcut() {
    ActionMethod method;
    method.name = "delete-shortcut";
    method.run = [](const InventoryItem& item) {
        std::string path = pick(item, {"FullName", "Path"}, false);
        if (path.empty()) {
            return MethodResult::failure("no shortcut path");
        }
        if (!remove_file(path)) {
            return MethodResult::failure("failed to delete " + path);
        }
        return MethodResult::success();
    };
    return method;
}

ActionMethod delete_startup_value(CommandRunner& runner, const Timeouts& t) {
    return command_method("delete-startup-value", "registry", runner, t.package,
        [](const InventoryItem& item, std::string& error) -> std::optional<CommandSpec> {
            std::string location = pick(item, {"Location"}, false);
            if (location.rfind("HK", 0) != 0) {
                error = "unsupported startup location: " + (location.empty() ? "<none>" : location);
                return std::nullopt;
            }
            CommandSpec spec;
            spec.program = "reg.exe";
            spec.args = {"delete", location, "/v", pick(item, {"Name"}), "/f"};
            return spec;
        });
}

} // namespace

std::string powershell_quote(const std::string& value) {
    std::string quoted = "'";
    for (char c : value) {
        if (c == '\'') quoted += '\'';
        quoted += c;
    }
    quoted += '\'';
    return quoted;
}

std::string silent_uninstall_command(const std::string& uninstall_string) {
    if (fold_case(uninstall_string).find("msiexec") == std::string::npos) {
        return uninstall_string;
    }

    std::string command = uninstall_string;
    for (size_t i = 0; i + 1 < command.size(); ++i) {
        if (command[i] == '/' && (command[i + 1] == 'I' || command[i + 1] == 'i')) {
            command[i + 1] = 'X';
        }
    }
    if (fold_case(command).find("/qn") == std::string::npos) {
        command += " /qn";
    }
    if (fold_case(command).find("/norestart") == std::string::npos) {
        command += " /norestart";
    }
    return command;
}

std::string registry_key_from_ps_path(const std::string& ps_path) {
    auto sep = ps_path.find("::");
    if (sep == std::string::npos) {
        return ps_path;
    }
    return ps_path.substr(sep + 2);
}

MethodTable default_method_table(CommandRunner& runner, const Timeouts& timeouts) {
    MethodTable table;
    const auto R = ActionMode::Remove;

    table.set(Origin::PackageManagerA, R,
              {winget_uninstall(runner, timeouts), registry_uninstall_string(runner, timeouts)});
    table.set(Origin::PackageManagerB, R,
              {choco_uninstall(runner, timeouts), registry_uninstall_string(runner, timeouts)});
    table.set(Origin::OSPackage, R,
              {remove_appx_package(runner, timeouts), remove_provisioned_package(runner, timeouts),
               dism_remove_provisioned(runner, timeouts)});
    table.set(Origin::ProvisionedPackage, R,
              {remove_provisioned_package(runner, timeouts), dism_remove_provisioned(runner, timeouts),
               delete_appx_store_key(runner, timeouts)});
    table.set(Origin::RegistryUninstall, R,
              {quiet_uninstall_string(runner, timeouts), uninstall_string(runner, timeouts),
               delete_uninstall_key(runner, timeouts)});
    table.set(Origin::WindowsFeature, R, {dism_disable_feature(runner, timeouts)});
    table.set(Origin::Service, R,
              {stop_and_disable_service(runner, timeouts), delete_service(runner, timeouts)});
    table.set(Origin::ScheduledTask, R, {disable_task(runner, timeouts), delete_task(runner, timeouts)});
    table.set(Origin::StartMenuShortcut, R, {delete_shortcut()});
    table.set(Origin::StartupEntry, R, {delete_startup_value(runner, timeouts)});

    // Missing essentials are installed through the package managers
    std::vector<ActionMethod> install = {winget_install(runner, timeouts), choco_install(runner, timeouts)};
    table.set(Origin::PackageManagerA, ActionMode::Install, install);
    table.set(Origin::PackageManagerB, ActionMode::Install, install);

    return table;
}

// ============================================================================
// SourceVerifier
// ============================================================================

std::optional<SourceVerifier::View> SourceVerifier::query(const std::vector<Origin>& origins) {
    std::lock_guard<std::mutex> lock(query_mutex_);

    View view;
    std::vector<std::vector<RawRecord>> raw;
    for (const auto& source : sources_) {
        bool relevant = false;
        for (Origin o : origins) {
            if (source->origin() == o) relevant = true;
        }
        if (!relevant) continue;

        CollectResult collected = source->collect();
        if (!collected.ok) {
            spdlog::debug("verification query on {} failed: {}", source->name(), collected.error);
            view.complete = false;
            continue;
        }
        raw.push_back(std::move(collected.records));
    }

    if (raw.empty()) {
        return std::nullopt;
    }
    view.items = normalize(raw).items;
    return view;
}

std::optional<bool> SourceVerifier::is_present(const InventoryItem& item, ActionMode mode) {
    if (mode == ActionMode::Install) {
        auto view = query({Origin::PackageManagerA, Origin::PackageManagerB,
                           Origin::RegistryUninstall, Origin::OSPackage});
        if (!view) return std::nullopt;
        if (find_unmatched_patterns(view->items, {item.primary_name}).empty()) {
            return true;
        }
        // An unreadable source may hold the installation
        if (!view->complete) return std::nullopt;
        return false;
    }

    // Absence is only trusted when every source of the origin answered
    auto view = query({item.origin});
    if (!view || !view->complete) return std::nullopt;

    CanonicalIdentifierSet present = CanonicalIdentifierSet::from_items(view->items);
    for (const auto& id : specific_identifiers(item)) {
        if (present.contains(id)) {
            return true;
        }
    }
    return false;
}

} // namespace sweep
