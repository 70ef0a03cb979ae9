#pragma once

#include "sweep/identifier_set.hpp"
#include "sweep/result.hpp"

#include <optional>
#include <string>

namespace sweep {

// ============================================================================
// Snapshot Store
// ============================================================================

inline constexpr const char* kSnapshotSchema = "sweep.snapshot.v1";

// The removal and requirement passes observe different pattern universes
// and keep separate snapshots.
enum class SnapshotPurpose {
    Removal,
    Requirement
};

inline const char* snapshot_purpose_to_string(SnapshotPurpose p) {
    switch (p) {
        case SnapshotPurpose::Removal: return "removal";
        case SnapshotPurpose::Requirement: return "requirement";
        default: return "removal";
    }
}

std::optional<SnapshotPurpose> parse_snapshot_purpose(const std::string& s);

struct SnapshotLoadResult {
    enum class State {
        Loaded,
        Missing,
        Corrupt
    };

    State state = State::Missing;
    std::string error;                                  // set when Corrupt
    std::optional<CanonicalIdentifierSet> identifiers;  // set when Loaded
    std::string captured_at;
};

// Serialize a snapshot document
std::string serialize_snapshot(const CanonicalIdentifierSet& set,
                               SnapshotPurpose purpose,
                               const std::string& captured_at);

// Parse a snapshot document; schema or purpose mismatch is Corrupt
SnapshotLoadResult parse_snapshot(const std::string& json_str, SnapshotPurpose purpose);

/**
 * Persists one purpose's identifier set at a fixed path.
 *
 * Loading fails open: a missing or unreadable file behaves as "no previous
 * run". Saving replaces the file atomically, so an interrupted save leaves
 * the previous snapshot intact.
 */
class SnapshotStore {
public:
    SnapshotStore(std::string path, SnapshotPurpose purpose)
        : path_(std::move(path)), purpose_(purpose) {}

    const std::string& path() const { return path_; }
    SnapshotPurpose purpose() const { return purpose_; }

    // Detailed load (Loaded / Missing / Corrupt)
    SnapshotLoadResult load_detailed() const;

    // The previous identifier set, or nullopt for missing/corrupt
    std::optional<CanonicalIdentifierSet> load() const;

    Result<void> save(const CanonicalIdentifierSet& set) const;

    // Delete the snapshot so the next run reprocesses everything
    Result<void> clear() const;

private:
    std::string path_;
    SnapshotPurpose purpose_;
};

} // namespace sweep
