#pragma once

#include "kiln/error.hpp"
#include "kiln/semver.hpp"
#include "kiln/types.hpp"

#include <optional>
#include <set>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace kiln {

// ============================================================================
// Manifest
// ============================================================================

struct ManifestDependency {
    std::string name;
    std::string constraint;  // as written; "*" when omitted
    VersionRange range;
};

struct ManifestFile {
    std::string src;   // relative to the bundle
    std::string dest;  // relative to the target root, normalized
};

struct TemplateVariable {
    std::string name;
    std::string description;
    std::optional<std::string> default_value;
};

/**
 * One component's description, as published next to its bundle.
 *
 * Known fields are typed; any other top-level field is kept verbatim in
 * `extra` and otherwise ignored.
 */
struct Manifest {
    std::string name;
    ComponentType type = ComponentType::Tool;
    Version version;
    std::string description;
    std::string author;
    std::set<std::string> tags;
    std::vector<ManifestDependency> dependencies;
    std::string min_language_version;
    std::vector<ManifestFile> files;
    std::vector<TemplateVariable> template_variables;
    std::string post_install_message;
    nlohmann::json extra = nlohmann::json::object();

    /// "name@version"
    std::string id() const;

    bool declares_variable(const std::string& variable) const;

    /// Declared defaults, to be layered beneath caller-supplied values
    VariableMap default_variables() const;
};

/**
 * @brief Parse and validate one manifest document
 *
 * Fails with ManifestError naming the offending field ("version",
 * "dependencies[1].versionConstraint", "files[0].dest", ...). File contents
 * are not inspected here.
 */
Result<Manifest> load_manifest(const std::string& raw);

/// Keys of `extra`, sorted
std::vector<std::string> unknown_fields(const Manifest& manifest);

} // namespace kiln
