#pragma once

/**
 * @file semver.hpp
 * @brief Semantic Versioning 2.0.0 versions and dependency constraints
 *
 * kiln uses SemVer 2.0.0 (https://semver.org/spec/v2.0.0.html) for component
 * versions and npm-style ranges for dependency constraints:
 * - Comparators: =, ==, <, <=, >, >= (a bare version means exact)
 * - Caret ranges: ^1.2.3 (>=1.2.3 <2.0.0)
 * - Tilde ranges: ~1.2.3 (>=1.2.3 <1.3.0)
 * - X-ranges: *, 1.x, 1.2.x
 * - Space-separated AND: ">=1.0.0 <2.0.0"
 * - OR with ||: ">=1.0.0 <2.0.0 || >=3.0.0"
 *
 * Two ranges requested for the same component by different dependents are
 * combined with intersect(); an empty intersection is a version conflict.
 *
 * @example
 * ```cpp
 * auto a = kiln::parse_range(">=2.0.0");
 * auto b = kiln::parse_range("<2.0.0");
 * if (a && b && kiln::is_empty(kiln::intersect(*a, *b))) {
 *     // no version can satisfy both requesters
 * }
 * ```
 */

// cpp-semver requires <cstdint> but doesn't include it (GCC strictness)
#include <cstdint>
#include <semver/semver.hpp>
#include <optional>
#include <string>
#include <vector>

namespace kiln {

/// Semantic version type (MAJOR.MINOR.PATCH[-prerelease][+build])
using Version = semver::version;

/// Comparator operators for range expressions
enum class Comparator {
    Eq,   ///< =X.Y.Z, ==X.Y.Z or X.Y.Z (exact match)
    Lt,   ///< <X.Y.Z
    Le,   ///< <=X.Y.Z
    Gt,   ///< >X.Y.Z
    Ge    ///< >=X.Y.Z
};

/// A single comparator constraint (e.g., ">=1.0.0" or "<2.0.0")
struct Constraint {
    Comparator op;
    Version version;
};

/// A comparator set is constraints that must ALL be satisfied (AND).
/// An empty set matches every version.
using ComparatorSet = std::vector<Constraint>;

/**
 * @brief A version range is a union of comparator sets (OR)
 *
 * A range with no sets matches nothing (the result of an empty intersection).
 */
struct VersionRange {
    std::vector<ComparatorSet> sets;

    /// Get the minimum version from the range
    std::optional<Version> min_version() const;

    /// Canonical form, e.g. ">=1.0.0 <2.0.0 || =3.0.0"; "*" for match-all
    std::string str() const;
};

/**
 * @brief Parse a SemVer 2.0.0 version string
 * @param str Version string (e.g., "1.2.3", "1.0.0-alpha+build")
 * @return Parsed version or nullopt on failure
 */
std::optional<Version> parse_version(const std::string& str);

/**
 * @brief Parse a version range string
 * @param str Range string (e.g., ">=1.0.0 <2.0.0", "^1.2.0", "~1.2.3 || 2.x")
 * @return Parsed range or nullopt on failure
 */
std::optional<VersionRange> parse_range(const std::string& str);

/// Canonical text of a single constraint (">=1.2.3")
std::string to_string(const Constraint& constraint);

/// Check if a version satisfies a single constraint
bool satisfies(const Version& version, const Constraint& constraint);

/// Check if a version satisfies a comparator set (all constraints)
bool satisfies(const Version& version, const ComparatorSet& set);

/// Check if a version satisfies a version range (any set)
bool satisfies(const Version& version, const VersionRange& range);

/// Check whether any version at all can satisfy the comparator set
bool is_satisfiable(const ComparatorSet& set);

/// True when no version can satisfy the range
bool is_empty(const VersionRange& range);

/**
 * @brief Intersect two ranges
 *
 * The result is the pairwise AND of the comparator sets of both ranges, with
 * unsatisfiable sets dropped. A result with no sets is empty.
 */
VersionRange intersect(const VersionRange& a, const VersionRange& b);

/**
 * @brief Select the best matching version from a list
 * @return Highest version satisfying the range, or nullopt if none match
 */
std::optional<Version> select_best(const std::vector<Version>& versions,
                                   const VersionRange& range);

} // namespace kiln
