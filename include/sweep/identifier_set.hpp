#pragma once

#include "sweep/types.hpp"

#include <string>
#include <unordered_map>
#include <vector>

namespace sweep {

// Lowercase an identifier for case-insensitive comparison (ASCII folding)
std::string fold_case(const std::string& s);

// Trim leading and trailing whitespace
std::string trim(const std::string& s);

// Valid UTF-8 passes through unchanged. Any other byte is taken as
// Latin-1 and re-encoded, so "Caf\xe9" becomes "Caf\xc3\xa9".
std::string repair_utf8(const std::string& s);

// ============================================================================
// Canonical Identifier Set
// ============================================================================

/**
 * Set of identifiers observed in one run, unique case-insensitively.
 *
 * The first spelling inserted for a folded key is kept as the display form,
 * so a snapshot written from this set preserves the original casing.
 */
class CanonicalIdentifierSet {
public:
    CanonicalIdentifierSet() = default;

    // Build from every identifier of every item
    static CanonicalIdentifierSet from_items(const std::vector<InventoryItem>& items);

    // Build from a plain list of strings (empty strings are ignored)
    static CanonicalIdentifierSet from_strings(const std::vector<std::string>& values);

    // Returns true if the identifier was not already present
    bool insert(const std::string& identifier);

    bool contains(const std::string& identifier) const;

    // Membership test on an already folded key
    bool contains_folded(const std::string& folded) const {
        return entries_.count(folded) > 0;
    }

    size_t size() const { return entries_.size(); }
    bool empty() const { return entries_.empty(); }

    // Display forms, sorted case-insensitively for stable output
    std::vector<std::string> sorted() const;

    // Access to folded key -> display form
    const std::unordered_map<std::string, std::string>& entries() const { return entries_; }

    // Set equality (case-insensitive, order-independent)
    bool operator==(const CanonicalIdentifierSet& other) const;
    bool operator!=(const CanonicalIdentifierSet& other) const { return !(*this == other); }

private:
    std::unordered_map<std::string, std::string> entries_;
};

} // namespace sweep
