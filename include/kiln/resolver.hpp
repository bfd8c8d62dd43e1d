#pragma once

/**
 * @file resolver.hpp
 * @brief Dependency resolution into a topologically ordered install plan
 *
 * Resolution fetches manifests through a RegistryClient, intersects every
 * requester's constraint per component name, rejects conflicts and cycles,
 * and orders the result so dependencies precede dependents. It never touches
 * the filesystem and returns either a complete plan or an error.
 */

#include "kiln/error.hpp"
#include "kiln/manifest.hpp"
#include "kiln/registry.hpp"

#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace kiln {

/// Requester name recorded for components the caller asked for
inline constexpr const char* kRootRequester = "(root)";

struct ComponentRequest {
    std::string name;
    std::string constraint = "*";
};

/// Parse "name" or "name@constraint" (constraint may contain spaces)
ComponentRequest parse_component_request(const std::string& text);

struct PlannedComponent {
    Manifest manifest;
    bool requested_directly = false;
    std::vector<std::string> dependencies;  // names, as declared
    std::vector<std::string> requested_by;  // requesters, first requirement first
};

struct InstallPlan {
    std::vector<PlannedComponent> components;  // dependencies strictly first

    const PlannedComponent* find(const std::string& name) const;
    std::vector<std::string> names() const;
};

// ============================================================================
// Dependency Graph
// ============================================================================

/// Directed graph, edges point from a component to its dependencies.
/// Node order is insertion order; it doubles as the first-discovery order.
class DependencyGraph {
public:
    void add_node(const std::string& name);
    void add_edge(const std::string& from, const std::string& to);

    bool contains(const std::string& name) const { return index_.count(name) != 0; }
    const std::vector<std::string>& nodes() const { return nodes_; }
    const std::vector<std::string>& dependencies_of(const std::string& name) const;
    size_t discovery_index(const std::string& name) const { return index_.at(name); }

private:
    std::vector<std::string> nodes_;
    std::unordered_map<std::string, size_t> index_;
    std::unordered_map<std::string, std::vector<std::string>> edges_;
};

/**
 * @brief Find a cycle with a recursion-stack DFS
 *
 * Nodes are visited in discovery order and edges in declared order, so the
 * same graph always reports the same cycle, e.g. {"A", "B", "A"}.
 */
std::optional<std::vector<std::string>> find_cycle(const DependencyGraph& graph);

/**
 * @brief Kahn's algorithm over an acyclic graph
 *
 * Among ready nodes the one discovered first wins, then the smaller name.
 */
std::vector<std::string> topological_order(const DependencyGraph& graph);

// ============================================================================
// Resolver
// ============================================================================

struct ResolverOptions {
    size_t workers = 1;  // concurrent registry fetches
};

class DependencyResolver {
public:
    explicit DependencyResolver(RegistryClient& registry, ResolverOptions options = {})
        : registry_(registry), options_(options) {}

    /**
     * @brief Resolve the requested roots and everything they depend on
     *
     * Fails with ConstraintParseError, ManifestError, RegistryFetchError,
     * ConflictError or CycleError; never returns a partial plan. Identical
     * inputs produce identical plans.
     */
    Result<InstallPlan> resolve(const std::vector<ComponentRequest>& roots);

private:
    RegistryClient& registry_;
    ResolverOptions options_;
};

} // namespace kiln
