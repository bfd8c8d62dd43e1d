#pragma once

#include "kiln/error.hpp"

#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace kiln {

class WarningCollector;

// ============================================================================
// Install Record (one ledger line)
// ============================================================================

struct FileRecord {
    std::string path;      // dest, relative to the target root
    std::string checksum;  // "sha256:<hex>"
};

struct InstallRecord {
    std::string name;
    std::string version;
    std::vector<FileRecord> files;
    std::string installed_at;  // RFC3339 UTC
    bool requested_directly = false;
};

struct InstallRecordParseResult {
    bool ok = false;
    std::string error;
    InstallRecord record;
};

/// Single-line JSON: {"name","version","files":[{"path","checksum"}],"installedAt","requestedDirectly"}
std::string serialize_install_record(const InstallRecord& record);

InstallRecordParseResult parse_install_record(const std::string& line);

/// <target_root>/.component-lock/ledger.jsonl
std::string ledger_path(const std::string& target_root);

// ============================================================================
// Ledger
// ============================================================================

/**
 * Append-only record of installed components for one target tree.
 *
 * Lines already on disk are loaded once; appends go to disk first (fsync)
 * and only then become visible in entries(). The file is never rewritten.
 * All methods are thread-safe; appends are serialized by one writer lock.
 */
class Ledger {
public:
    explicit Ledger(std::string path) : path_(std::move(path)) {}

    Ledger(const Ledger&) = delete;
    Ledger& operator=(const Ledger&) = delete;

    /// Read existing lines. A missing file is an empty ledger; malformed
    /// lines are reported as invalid_ledger_entry and skipped.
    Result<void> load(WarningCollector* warnings = nullptr);

    Result<void> append(const InstallRecord& record);

    /// Every entry in file order
    std::vector<InstallRecord> entries() const;

    /// Most recent entry per component, ordered by first appearance
    std::vector<InstallRecord> latest_per_component() const;

    /// True when an entry appended since load() records `path` with
    /// `checksum` for exactly this name and version
    bool recorded_this_run(const std::string& name, const std::string& version,
                           const std::string& path, const std::string& checksum) const;

    /// "name@version" of the latest entry listing `path`
    std::optional<std::string> owner_of(const std::string& path) const;

    const std::string& path() const { return path_; }

private:
    std::string path_;
    mutable std::mutex mutex_;
    std::vector<InstallRecord> entries_;
    size_t loaded_count_ = 0;
};

} // namespace kiln
