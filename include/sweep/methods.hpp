#pragma once

/**
 * @file methods.hpp
 * @brief Default Windows method tables and source-backed verification
 */

#include "sweep/command.hpp"
#include "sweep/config.hpp"
#include "sweep/executor.hpp"
#include "sweep/inventory.hpp"

#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace sweep {

// ============================================================================
// Command helpers
// ============================================================================

// Quote a value for a single-quoted PowerShell string literal
std::string powershell_quote(const std::string& value);

// "MsiExec.exe /I{GUID}" -> "MsiExec.exe /X{GUID} /qn /norestart".
// Non-MSI strings are returned unchanged.
std::string silent_uninstall_command(const std::string& uninstall_string);

// "Microsoft.PowerShell.Core\Registry::HKEY_LOCAL_MACHINE\..." -> "HKEY_LOCAL_MACHINE\..."
std::string registry_key_from_ps_path(const std::string& ps_path);

// ============================================================================
// Default method table
// ============================================================================

/**
 * Ordered removal methods for every origin plus install methods for the
 * package managers. Every method runs an external tool through `runner`;
 * package operations use `timeouts.package` and DISM uses
 * `timeouts.servicing`.
 */
MethodTable default_method_table(CommandRunner& runner, const Timeouts& timeouts);

// ============================================================================
// Source-backed verification
// ============================================================================

/**
 * Verifies an action by re-querying the inventory sources.
 *
 * Remove: every source of the item's origin is queried and any of the
 * item's origin-specific ids still listed means the entity is present. A
 * display name shared with another entity does not count. If any of those
 * sources fails, the result is nullopt.
 *
 * Install: the package-manager, registry and OS-package views are queried
 * and the item's name is matched like an essential-app pattern. A match is
 * trusted even if some source failed; a miss is not.
 */
class SourceVerifier : public Verifier {
public:
    explicit SourceVerifier(const std::vector<std::unique_ptr<InventorySource>>& sources)
        : sources_(sources) {}

    std::optional<bool> is_present(const InventoryItem& item, ActionMode mode) override;

private:
    struct View {
        std::vector<InventoryItem> items;
        bool complete = true;  // every queried source answered
    };

    // Normalized items from every source of the given origins; nullopt if
    // none of them could be read
    std::optional<View> query(const std::vector<Origin>& origins);

    const std::vector<std::unique_ptr<InventorySource>>& sources_;
    std::mutex query_mutex_;
};

} // namespace sweep
