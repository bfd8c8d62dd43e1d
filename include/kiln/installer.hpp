#pragma once

/**
 * @file installer.hpp
 * @brief Executes an InstallPlan against a target tree
 *
 * Each component is all-or-nothing: its bundle is fetched, every destination
 * is checked for conflicts, every file is rendered, and only then are files
 * written (temp + fsync + rename). The ledger append is the last durable
 * step. Any failure before it rolls the component back, leaving the tree as
 * it was when the component started.
 *
 * Components run on up to `workers` threads. A component starts only after
 * all of its dependencies are installed, and components whose destinations
 * overlap never run at the same time.
 */

#include "kiln/error.hpp"
#include "kiln/ledger.hpp"
#include "kiln/registry.hpp"
#include "kiln/resolver.hpp"
#include "kiln/types.hpp"

#include <atomic>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace kiln {

class WarningCollector;

struct InstallPolicy {
    bool force = false;
    size_t workers = 1;
};

/// Shared cancellation flag; safe to set from a signal handler
class CancellationToken {
public:
    void cancel() { cancelled_.store(true); }
    bool is_cancelled() const { return cancelled_.load(); }

private:
    std::atomic<bool> cancelled_{false};
};

// ============================================================================
// Progress Events
// ============================================================================

enum class InstallEventKind {
    ComponentStarted,
    FileWritten,
    ComponentInstalled,
    ComponentFailed,
    ComponentSkipped,
    Done,  // always last, exactly once
};

const char* install_event_kind_to_string(InstallEventKind kind);

struct InstallEvent {
    InstallEventKind kind;
    std::string component;  // empty for Done
    std::string version;
    std::string path;       // FileWritten: dest
    std::string message;    // failure / skip reason
};

/// Invoked from worker threads, never concurrently
using InstallObserver = std::function<void(const InstallEvent&)>;

// ============================================================================
// Report
// ============================================================================

enum class ComponentStatus {
    Installed,
    Skipped,
    Failed,
};

const char* component_status_to_string(ComponentStatus status);

struct ComponentOutcome {
    std::string name;
    std::string version;
    bool requested_directly = false;
    ComponentStatus status = ComponentStatus::Skipped;
    std::optional<Error> error;        // Failed: the failure; Skipped: the reason
    std::vector<std::string> files;    // Installed: dest paths written
    std::string post_install_message;

    /// "component B failed: FileConflictError at path X; caused by ..."
    std::string summary() const;
};

struct InstallReport {
    std::vector<ComponentOutcome> components;  // plan order
    std::vector<InstallRecord> ledger;         // full ledger after the run

    const ComponentOutcome* find(const std::string& name) const;
    bool all_installed() const;
};

// ============================================================================
// Installer
// ============================================================================

class Installer {
public:
    explicit Installer(RegistryClient& registry, WarningCollector* warnings = nullptr)
        : registry_(registry), warnings_(warnings) {}

    void set_observer(InstallObserver observer) { observer_ = std::move(observer); }

    /**
     * @brief Install every component of the plan under target_root
     *
     * Never throws on a component failure; the report covers every plan
     * component. `variables` maps component name to its variable values.
     */
    InstallReport install(const InstallPlan& plan,
                          const std::string& target_root,
                          const ComponentVariables& variables,
                          const InstallPolicy& policy,
                          const CancellationToken* cancel = nullptr);

private:
    RegistryClient& registry_;
    WarningCollector* warnings_;
    InstallObserver observer_;
};

// ============================================================================
// Verification
// ============================================================================

enum class FileState {
    Ok,
    Modified,
    Missing,
};

const char* file_state_to_string(FileState state);

struct VerifiedFile {
    std::string component;
    std::string version;
    std::string path;
    FileState state = FileState::Ok;
};

struct VerifyReport {
    std::vector<VerifiedFile> files;

    bool clean() const;
};

/// Re-hash every file of the latest ledger entry per component
Result<VerifyReport> verify_installation(const std::string& target_root,
                                         WarningCollector* warnings = nullptr);

} // namespace kiln
