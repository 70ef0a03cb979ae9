#pragma once

#include "sweep/types.hpp"

#include <string>
#include <vector>

namespace sweep {

// ============================================================================
// Pattern Matcher
// ============================================================================

// Ordered pattern list: exact identifiers or '*'/'?' wildcards
using PatternList = std::vector<std::string>;

// Lowercase and strip '.', '-', '_' and whitespace
std::string normalize_identifier(const std::string& s);

// Case-insensitive glob with '*' (any run) and '?' (one character)
bool glob_match(const std::string& pattern, const std::string& text);

bool is_wildcard_pattern(const std::string& pattern);

// Split "publisher.app" at the first '.'; false if either part is empty
bool split_publisher(const std::string& pattern, std::string& publisher, std::string& app);

/**
 * Match items against an ordered pattern list.
 *
 * For each item the first pattern that matches by any strategy wins; within
 * one pattern Exact is tried before Normalized before PartialPublisher.
 * Items that match any `excluded` pattern are never reported. Items without
 * identifiers are skipped.
 */
std::vector<MatchRecord> match(const std::vector<InventoryItem>& items,
                               const PatternList& patterns,
                               const PatternList& excluded = {});

// Patterns that no item satisfies by any strategy, in list order
PatternList find_unmatched_patterns(const std::vector<InventoryItem>& items,
                                    const PatternList& patterns);

} // namespace sweep
