#include "kiln/types.hpp"

#include <algorithm>
#include <cctype>
#include <optional>

namespace kiln {

namespace {

std::string to_lower(const std::string& s) {
    std::string result = s;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return result;
}

} // namespace

std::optional<ComponentType> parse_component_type(const std::string& s) {
    if (s == "agent") return ComponentType::Agent;
    if (s == "tool") return ComponentType::Tool;
    if (s == "prompt_template") return ComponentType::PromptTemplate;
    return std::nullopt;
}

std::optional<Warning> parse_warning_key(const std::string& key) {
    std::string lower = to_lower(key);

    if (lower == "unused_template_variable") return Warning::unused_template_variable;
    if (lower == "unused_supplied_variable") return Warning::unused_supplied_variable;
    if (lower == "unknown_manifest_field") return Warning::unknown_manifest_field;
    if (lower == "invalid_ledger_entry") return Warning::invalid_ledger_entry;
    if (lower == "invalid_configuration") return Warning::invalid_configuration;
    if (lower == "registry_source_failed") return Warning::registry_source_failed;

    return std::nullopt;
}

std::optional<WarningAction> parse_warning_action(const std::string& s) {
    std::string lower = to_lower(s);
    if (lower == "warn") return WarningAction::Warn;
    if (lower == "ignore") return WarningAction::Ignore;
    if (lower == "error") return WarningAction::Error;
    return std::nullopt;
}

} // namespace kiln
