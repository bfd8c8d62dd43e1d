#pragma once

#include "kiln/error.hpp"
#include "kiln/types.hpp"

#include <string>
#include <vector>

namespace kiln {

// ============================================================================
// Template Rendering
// ============================================================================
//
// A placeholder is "{{identifier}}" where identifier is [A-Za-z_][A-Za-z0-9_]*,
// optionally padded with spaces ("{{ name }}"). Anything else between braces
// is copied through untouched.

/// Distinct placeholder names in order of first appearance
std::vector<std::string> find_placeholders(const std::string& content);

/**
 * @brief Substitute every placeholder with its value from `variables`
 *
 * Pure. Fails with TemplateError listing every distinct missing variable.
 * Supplied variables that are never referenced are not an error here.
 */
Result<std::string> render_template(const std::string& content, const VariableMap& variables);

} // namespace kiln
