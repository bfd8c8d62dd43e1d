#pragma once

#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace kiln {

// ============================================================================
// Component Type
// ============================================================================

enum class ComponentType {
    Agent,
    Tool,
    PromptTemplate
};

inline const char* component_type_to_string(ComponentType t) {
    switch (t) {
        case ComponentType::Agent: return "agent";
        case ComponentType::Tool: return "tool";
        case ComponentType::PromptTemplate: return "prompt_template";
        default: return "unknown";
    }
}

// Parse "agent" | "tool" | "prompt_template" (exact, lowercase)
std::optional<ComponentType> parse_component_type(const std::string& s);

// ============================================================================
// Warning System
// ============================================================================

enum class Warning {
    unused_template_variable,
    unused_supplied_variable,
    unknown_manifest_field,
    invalid_ledger_entry,
    invalid_configuration,
    registry_source_failed,
};

// Convert warning enum to canonical lowercase snake_case string
inline const char* warning_to_string(Warning w) {
    switch (w) {
        case Warning::unused_template_variable: return "unused_template_variable";
        case Warning::unused_supplied_variable: return "unused_supplied_variable";
        case Warning::unknown_manifest_field: return "unknown_manifest_field";
        case Warning::invalid_ledger_entry: return "invalid_ledger_entry";
        case Warning::invalid_configuration: return "invalid_configuration";
        case Warning::registry_source_failed: return "registry_source_failed";
        default: return "unknown";
    }
}

// Parse warning key string to enum (case-insensitive)
std::optional<Warning> parse_warning_key(const std::string& key);

enum class WarningAction {
    Warn,
    Ignore,
    Error
};

inline const char* action_to_string(WarningAction a) {
    switch (a) {
        case WarningAction::Warn: return "warn";
        case WarningAction::Ignore: return "ignore";
        case WarningAction::Error: return "error";
        default: return "warn";
    }
}

std::optional<WarningAction> parse_warning_action(const std::string& s);

struct WarningObject {
    std::string key;                                      // lowercase snake_case
    std::string action;                                   // "warn" | "error"
    std::unordered_map<std::string, std::string> fields;  // warning-specific
};

/// Variables supplied for one component: variable name -> value
using VariableMap = std::unordered_map<std::string, std::string>;

/// Variables for a whole install run: component name -> its variables
using ComponentVariables = std::unordered_map<std::string, VariableMap>;

} // namespace kiln
