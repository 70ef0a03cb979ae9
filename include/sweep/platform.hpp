#pragma once

#include <optional>
#include <string>
#include <vector>

namespace sweep {

// ============================================================================
// Atomic File Operations
// ============================================================================

struct AtomicWriteResult {
    bool ok = false;
    std::string error;
};

// Write content atomically using temp file + fsync + rename + fsync(dir).
// On failure the previous file at `path` (if any) is left untouched.
AtomicWriteResult atomic_write_file(const std::string& path, const std::string& content);

// ============================================================================
// File and Path Utilities
// ============================================================================

// Read an entire file; nullopt if it cannot be opened
std::optional<std::string> read_file(const std::string& path);

// Get the directory containing a file path
std::string get_parent_directory(const std::string& path);

// Join path components
std::string join_path(const std::string& base, const std::string& rel);

// Check if a path exists
bool path_exists(const std::string& path);

// Create directories recursively
bool create_directories(const std::string& path);

// Remove a file
bool remove_file(const std::string& path);

// ============================================================================
// Environment
// ============================================================================

// Get an environment variable
std::optional<std::string> get_env(const std::string& name);

// Get current timestamp as RFC3339 string
std::string get_current_timestamp();

} // namespace sweep
