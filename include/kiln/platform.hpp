#pragma once

#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace kiln {

// ============================================================================
// Atomic File Operations
// ============================================================================

struct AtomicWriteResult {
    bool ok = false;
    bool aborted = false;  // commit predicate declined; temp file removed
    std::string error;
};

/// Called after the temp file is durable and before the rename.
/// Returning false abandons the write.
using CommitPredicate = std::function<bool()>;

// Write content atomically: write "<path>.tmp", fsync, rename over <path>,
// fsync(dir). A crash or abort before the rename leaves <path> untouched.
AtomicWriteResult atomic_write_file(const std::string& path, const std::string& content,
                                    const CommitPredicate& may_commit = nullptr);

// Append one line (a trailing '\n' is added) with O_APPEND, then fsync.
AtomicWriteResult append_line_durable(const std::string& path, const std::string& line);

// ============================================================================
// Path Utilities
// ============================================================================

struct PathValidation {
    bool safe = false;
    std::string error;
    std::string normalized_path;
};

// Validate a manifest-supplied relative path: non-empty, not absolute,
// no ".." component. "." and empty components are dropped.
PathValidation validate_relative_path(const std::string& path);

// True when one portable path equals the other or is a directory prefix of it
bool paths_overlap(const std::string& a, const std::string& b);

// Convert a path to use forward slashes (portable format)
std::string to_portable_path(const std::string& path);

// Get the directory containing a file path
std::string get_parent_directory(const std::string& path);

// Join path components
std::string join_path(const std::string& base, const std::string& rel);

// Check if a path exists (never throws; unreachable paths do not exist)
bool path_exists(const std::string& path);

bool is_directory(const std::string& path);

bool is_regular_file(const std::string& path);

// Create parent directories recursively
bool create_directories(const std::string& path);

// Remove a file; false if it did not exist or could not be removed
bool remove_file(const std::string& path);

// Remove a directory only if it is empty
bool remove_empty_directory(const std::string& path);

// Read a whole file as bytes
std::optional<std::string> read_file(const std::string& path);

// ============================================================================
// Environment
// ============================================================================

std::optional<std::string> get_env(const std::string& name);

// Get current timestamp as ISO 8601 / RFC3339 UTC string
std::string get_current_timestamp();

// Generate a UUID string
std::string generate_uuid();

} // namespace kiln
