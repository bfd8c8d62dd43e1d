#include "kiln/resolver.hpp"

#include <algorithm>
#include <set>
#include <utility>

namespace kiln {

namespace {

enum class Mark { White, Gray, Black };

bool visit(const DependencyGraph& graph, const std::string& node,
           std::unordered_map<std::string, Mark>& marks,
           std::vector<std::string>& stack,
           std::vector<std::string>& cycle) {
    marks[node] = Mark::Gray;
    stack.push_back(node);

    for (const auto& dep : graph.dependencies_of(node)) {
        if (!graph.contains(dep)) continue;

        if (marks[dep] == Mark::Gray) {
            auto start = std::find(stack.begin(), stack.end(), dep);
            cycle.assign(start, stack.end());
            cycle.push_back(dep);
            return true;
        }
        if (marks[dep] == Mark::White && visit(graph, dep, marks, stack, cycle)) {
            return true;
        }
    }

    stack.pop_back();
    marks[node] = Mark::Black;
    return false;
}

} // namespace

void DependencyGraph::add_node(const std::string& name) {
    if (index_.count(name)) return;
    index_[name] = nodes_.size();
    nodes_.push_back(name);
    edges_[name];
}

void DependencyGraph::add_edge(const std::string& from, const std::string& to) {
    add_node(from);
    add_node(to);
    auto& deps = edges_[from];
    if (std::find(deps.begin(), deps.end(), to) == deps.end()) {
        deps.push_back(to);
    }
}

const std::vector<std::string>& DependencyGraph::dependencies_of(const std::string& name) const {
    static const std::vector<std::string> none;
    auto it = edges_.find(name);
    return it == edges_.end() ? none : it->second;
}

std::optional<std::vector<std::string>> find_cycle(const DependencyGraph& graph) {
    std::unordered_map<std::string, Mark> marks;
    for (const auto& n : graph.nodes()) marks[n] = Mark::White;

    std::vector<std::string> stack;
    std::vector<std::string> cycle;
    for (const auto& n : graph.nodes()) {
        if (marks[n] == Mark::White && visit(graph, n, marks, stack, cycle)) {
            return cycle;
        }
    }
    return std::nullopt;
}

std::vector<std::string> topological_order(const DependencyGraph& graph) {
    std::unordered_map<std::string, size_t> pending;
    std::unordered_map<std::string, std::vector<std::string>> dependents;

    for (const auto& n : graph.nodes()) {
        pending[n] = 0;
    }
    for (const auto& n : graph.nodes()) {
        for (const auto& dep : graph.dependencies_of(n)) {
            ++pending[n];
            dependents[dep].push_back(n);
        }
    }

    // (discovery index, name): first-discovered ready node goes first
    std::set<std::pair<size_t, std::string>> ready;
    for (const auto& n : graph.nodes()) {
        if (pending[n] == 0) ready.insert({graph.discovery_index(n), n});
    }

    std::vector<std::string> order;
    order.reserve(graph.nodes().size());
    while (!ready.empty()) {
        auto next = *ready.begin();
        ready.erase(ready.begin());
        order.push_back(next.second);

        for (const auto& d : dependents[next.second]) {
            if (--pending[d] == 0) {
                ready.insert({graph.discovery_index(d), d});
            }
        }
    }
    return order;
}

} // namespace kiln
