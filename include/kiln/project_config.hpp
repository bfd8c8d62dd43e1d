#pragma once

#include "kiln/error.hpp"
#include "kiln/types.hpp"

#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace kiln {

// ============================================================================
// Project Configuration (<target_root>/kiln.json)
// ============================================================================

struct RegistrySourceConfig {
    std::string alias;
    std::string path;
    int priority = 100;
    bool enabled = true;
};

struct ProjectConfig {
    std::string schema;  // MUST be "kiln.project.v1"

    std::vector<RegistrySourceConfig> registries;

    // [install] section
    struct {
        size_t workers = 1;
        bool force = false;
    } install;

    ComponentVariables variables;

    // [warnings] section - maps warning key to action
    std::unordered_map<std::string, WarningAction> warnings;

    std::string source_path;
};

ProjectConfig get_default_project_config();

struct ProjectConfigParseResult {
    bool ok = false;
    std::string error;
    ProjectConfig config;
    std::vector<std::string> warnings;  // "invalid_configuration:<what>"
};

ProjectConfigParseResult parse_project_config(const std::string& json_str,
                                              const std::string& source_path = "");

/// <target_root>/kiln.json
std::string project_config_path(const std::string& target_root);

/// Read kiln.json from target_root; an absent file yields the defaults
ProjectConfigParseResult load_project_config(const std::string& target_root);

/// kiln.json document for a configuration; keys sorted, two-space indent
std::string serialize_project_config(const ProjectConfig& config);

/**
 * @brief Write <target_root>/kiln.json atomically
 *
 * An existing file is only replaced when `overwrite` is set.
 * @return the path written
 */
Result<std::string> write_project_config(const std::string& target_root,
                                         const ProjectConfig& config,
                                         bool overwrite = false);

// ============================================================================
// Effective Settings
// ============================================================================

/// Values given on the command line; unset means "not given"
struct CliSettings {
    std::vector<std::string> registries;
    std::optional<size_t> workers;
    bool force = false;
};

struct EffectiveSettings {
    std::vector<RegistrySourceConfig> registries;  // enabled, priority order
    size_t workers = 1;
    bool force = false;
};

/**
 * @brief Merge settings: CLI flag > environment > kiln.json > default
 *
 * Environment: KILN_REGISTRY (one or more paths separated by ':'),
 * KILN_WORKERS (positive integer).
 */
EffectiveSettings resolve_settings(const ProjectConfig& config, const CliSettings& cli);

} // namespace kiln
