#pragma once

#include "kiln/types.hpp"

#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace kiln {

// ============================================================================
// Warning Collector
// ============================================================================

/**
 * Collects non-fatal diagnostics and applies the project's warning policy.
 *
 * Emitting is thread-safe: installer workers report into one collector.
 * Every effective warning is also logged through spdlog.
 */
class WarningCollector {
public:
    WarningCollector() = default;

    explicit WarningCollector(const std::unordered_map<std::string, WarningAction>& policy)
        : policy_(policy) {}

    WarningCollector(const WarningCollector&) = delete;
    WarningCollector& operator=(const WarningCollector&) = delete;

    // Replace the policy map (key -> action)
    void set_policy(const std::unordered_map<std::string, WarningAction>& policy);

    // Emit a warning with fields
    void emit(Warning warning, const std::unordered_map<std::string, std::string>& fields);

    // Emit a warning with context string (convenience)
    void emit_with_context(Warning warning, const std::string& context);

    // Emit a warning by key string
    void emit(const std::string& warning_key, std::unordered_map<std::string, std::string> fields = {});

    // Get all emitted warnings after policy application.
    // Warnings with action "ignore" are excluded.
    std::vector<WarningObject> get_warnings() const;

    // Check if any warning was upgraded to error
    bool has_errors() const;

    void clear();

private:
    struct CollectedWarning {
        std::string key;
        std::unordered_map<std::string, std::string> fields;
        WarningAction effective_action;
    };

    mutable std::mutex mutex_;
    std::unordered_map<std::string, WarningAction> policy_;
    std::vector<CollectedWarning> warnings_;

    WarningAction get_effective_action(const std::string& key) const;
};

namespace warnings {

inline std::unordered_map<std::string, std::string> unused_template_variable(
    const std::string& component, const std::string& variable) {
    return {{"component", component}, {"variable", variable}};
}

inline std::unordered_map<std::string, std::string> unused_supplied_variable(
    const std::string& component, const std::string& variable) {
    return {{"component", component}, {"variable", variable}};
}

inline std::unordered_map<std::string, std::string> unknown_manifest_field(
    const std::string& component, const std::string& field) {
    return {{"component", component}, {"field", field}};
}

inline std::unordered_map<std::string, std::string> invalid_ledger_entry(
    const std::string& source_path, size_t line, const std::string& reason) {
    return {{"source_path", source_path}, {"line", std::to_string(line)}, {"reason", reason}};
}

inline std::unordered_map<std::string, std::string> registry_source_failed(
    const std::string& alias, const std::string& reason) {
    return {{"source", alias}, {"reason", reason}};
}

} // namespace warnings

} // namespace kiln
