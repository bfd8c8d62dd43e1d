#include "kiln/resolver.hpp"
#include "kiln/worker_pool.hpp"

#include <algorithm>
#include <deque>
#include <future>
#include <memory>
#include <mutex>
#include <unordered_set>

#include <spdlog/spdlog.h>

namespace kiln {

namespace {

// Upper bound on how often one name may be re-fetched because a later
// requirement excluded its current selection
constexpr int kMaxReselections = 16;

struct Requirement {
    std::string requester;
    std::string requester_version;  // empty for roots
    std::string constraint;         // as written by the requester
    VersionRange range;
};

struct WorkItem {
    std::string name;
    Requirement requirement;
};

std::string describe_requester(const std::string& name, const Requirement& r) {
    if (r.requester == kRootRequester) {
        return name + " requested directly";
    }
    return name + " required by " + r.requester;
}

/**
 * Per-name list of requirements and their intersection.
 *
 * The only state touched by more than one step of a resolution; guarded by
 * a single mutex around read-intersect-write.
 */
class ConstraintTable {
public:
    Result<VersionRange> add(const std::string& name, Requirement req) {
        std::lock_guard<std::mutex> lock(mutex_);
        auto& reqs = table_[name];
        reqs.push_back(std::move(req));

        VersionRange merged = combine(reqs);
        if (is_empty(merged)) {
            std::vector<std::string> requesters;
            std::vector<std::string> constraints;
            for (const auto& r : reqs) {
                requesters.push_back(r.requester);
                constraints.push_back(r.constraint);
            }
            return Result<VersionRange>::err(conflict_error(name, requesters, constraints));
        }
        return Result<VersionRange>::ok(std::move(merged));
    }

    VersionRange current(const std::string& name) const {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = table_.find(name);
        if (it == table_.end()) return combine({});
        return combine(it->second);
    }

    // Drop everything a superseded version of `requester` asked for
    void remove_requester(const std::string& requester, const std::string& version) {
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto& [name, reqs] : table_) {
            reqs.erase(std::remove_if(reqs.begin(), reqs.end(),
                                      [&](const Requirement& r) {
                                          return r.requester == requester &&
                                                 r.requester_version == version;
                                      }),
                       reqs.end());
        }
    }

    std::vector<Requirement> requirements(const std::string& name) const {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = table_.find(name);
        return it == table_.end() ? std::vector<Requirement>{} : it->second;
    }

private:
    static VersionRange combine(const std::vector<Requirement>& reqs) {
        VersionRange merged;
        merged.sets.push_back({});  // match-all
        for (const auto& r : reqs) {
            merged = intersect(merged, r.range);
        }
        return merged;
    }

    mutable std::mutex mutex_;
    std::unordered_map<std::string, std::vector<Requirement>> table_;
};

Error annotate(Error error, const std::string& name, const std::vector<Requirement>& reqs) {
    for (const auto& r : reqs) {
        error.withContext(describe_requester(name, r));
    }
    return error;
}

} // namespace

ComponentRequest parse_component_request(const std::string& text) {
    ComponentRequest req;
    auto at = text.find('@');
    if (at == std::string::npos) {
        req.name = text;
        return req;
    }
    req.name = text.substr(0, at);
    req.constraint = text.substr(at + 1);
    if (req.constraint.empty()) req.constraint = "*";
    return req;
}

const PlannedComponent* InstallPlan::find(const std::string& name) const {
    for (const auto& c : components) {
        if (c.manifest.name == name) return &c;
    }
    return nullptr;
}

std::vector<std::string> InstallPlan::names() const {
    std::vector<std::string> out;
    for (const auto& c : components) out.push_back(c.manifest.name);
    return out;
}

Result<InstallPlan> DependencyResolver::resolve(const std::vector<ComponentRequest>& roots) {
    ConstraintTable constraints;
    std::unordered_map<std::string, Manifest> selected;
    std::unordered_map<std::string, Manifest> fetched;  // name|range -> manifest, this call only
    std::unordered_map<std::string, int> fetch_count;
    std::vector<std::string> discovery;
    std::unordered_set<std::string> discovered;

    std::unique_ptr<WorkerPool> pool;
    if (options_.workers > 1) {
        pool = std::make_unique<WorkerPool>(options_.workers);
    }

    std::vector<WorkItem> wave;
    for (const auto& root : roots) {
        auto range = parse_range(root.constraint);
        if (!range) {
            return Result<InstallPlan>::err(
                constraint_parse_error(root.constraint, "requested for " + root.name));
        }
        wave.push_back({root.name, {kRootRequester, "", root.constraint, *range}});
    }

    // Names the roots reach through the current selections
    auto reachable_from_roots = [&] {
        std::unordered_set<std::string> seen;
        std::deque<std::string> queue;
        for (const auto& root : roots) queue.push_back(root.name);
        while (!queue.empty()) {
            std::string name = queue.front();
            queue.pop_front();
            if (!seen.insert(name).second) continue;
            auto it = selected.find(name);
            if (it == selected.end()) continue;
            for (const auto& dep : it->second.dependencies) {
                queue.push_back(dep.name);
            }
        }
        return seen;
    };

    while (!wave.empty()) {
        // A reselection can orphan selections made for the superseded version;
        // drop them with their requirements before merging anything they queued
        auto live = reachable_from_roots();
        for (auto it = selected.begin(); it != selected.end();) {
            if (live.count(it->first) == 0) {
                spdlog::debug("dropping {}: no longer required", it->second.id());
                constraints.remove_requester(it->first, it->second.version.str());
                it = selected.erase(it);
            } else {
                ++it;
            }
        }

        // Merge: single-threaded, in wave order
        std::vector<std::string> to_fetch;
        for (auto& item : wave) {
            const auto& req = item.requirement;
            if (req.requester != kRootRequester) {
                auto it = selected.find(req.requester);
                if (it == selected.end() || it->second.version.str() != req.requester_version) {
                    continue;  // requester was reselected since this was queued
                }
            }

            if (discovered.insert(item.name).second) {
                discovery.push_back(item.name);
            }

            auto merged = constraints.add(item.name, item.requirement);
            if (merged.isErr()) {
                return Result<InstallPlan>::err(merged.error());
            }

            auto sel = selected.find(item.name);
            bool needs_fetch = sel == selected.end() || !satisfies(sel->second.version, merged.value());
            if (needs_fetch && std::find(to_fetch.begin(), to_fetch.end(), item.name) == to_fetch.end()) {
                to_fetch.push_back(item.name);
            }
        }

        // Fetch: concurrent, bounded by the pool
        struct Pending {
            std::string name;
            VersionRange range;
            std::string key;
            std::future<Result<Manifest>> future;
        };
        std::vector<Pending> pending;
        for (const auto& name : to_fetch) {
            if (++fetch_count[name] > kMaxReselections) {
                auto reqs = constraints.requirements(name);
                std::vector<std::string> requesters;
                std::vector<std::string> texts;
                for (const auto& r : reqs) {
                    requesters.push_back(r.requester);
                    texts.push_back(r.constraint);
                }
                return Result<InstallPlan>::err(conflict_error(name, requesters, texts));
            }

            Pending p;
            p.name = name;
            p.range = constraints.current(name);
            p.key = name + "|" + p.range.str();
            if (fetched.count(p.key) == 0) {
                RegistryClient& registry = registry_;
                auto fetch = [&registry, name, range = p.range] {
                    return registry.fetch_manifest(name, range);
                };
                if (pool) {
                    p.future = pool->submit(std::move(fetch));
                } else {
                    std::promise<Result<Manifest>> ready;
                    ready.set_value(fetch());
                    p.future = ready.get_future();
                }
            }
            pending.push_back(std::move(p));
        }

        // Apply: single-threaded, in wave order
        std::vector<WorkItem> next;
        for (auto& p : pending) {
            if (p.future.valid()) {
                auto result = p.future.get();
                if (result.isErr()) {
                    return Result<InstallPlan>::err(
                        annotate(result.error(), p.name, constraints.requirements(p.name)));
                }
                fetched.emplace(p.key, std::move(result.value()));
            }

            const Manifest& manifest = fetched.at(p.key);
            if (manifest.name != p.name || !satisfies(manifest.version, p.range)) {
                return Result<InstallPlan>::err(registry_fetch_error(
                    p.name, p.range.str(), "registry answered with " + manifest.id()));
            }

            auto old = selected.find(p.name);
            if (old != selected.end()) {
                spdlog::debug("reselecting {}: {} -> {}", p.name, old->second.version.str(),
                              manifest.version.str());
                constraints.remove_requester(p.name, old->second.version.str());
            }
            selected[p.name] = manifest;
            spdlog::debug("selected {} for '{}'", manifest.id(), p.range.str());

            for (const auto& dep : manifest.dependencies) {
                next.push_back({dep.name, {p.name, manifest.version.str(), dep.constraint, dep.range}});
            }
        }

        wave = std::move(next);
    }

    // Keep only what the roots still reach
    auto reachable = reachable_from_roots();

    DependencyGraph graph;
    for (const auto& name : discovery) {
        if (reachable.count(name) && selected.count(name)) graph.add_node(name);
    }
    for (const auto& name : graph.nodes()) {
        for (const auto& dep : selected.at(name).dependencies) {
            graph.add_edge(name, dep.name);
        }
    }

    if (auto cycle = find_cycle(graph)) {
        return Result<InstallPlan>::err(cycle_error(*cycle));
    }

    InstallPlan plan;
    for (const auto& name : topological_order(graph)) {
        PlannedComponent c;
        c.manifest = selected.at(name);
        c.dependencies = graph.dependencies_of(name);
        c.requested_directly = std::any_of(roots.begin(), roots.end(),
                                           [&](const ComponentRequest& r) { return r.name == name; });
        for (const auto& r : constraints.requirements(name)) {
            bool live = r.requester == kRootRequester || reachable.count(r.requester) != 0;
            if (live && std::find(c.requested_by.begin(), c.requested_by.end(), r.requester) ==
                            c.requested_by.end()) {
                c.requested_by.push_back(r.requester);
            }
        }
        plan.components.push_back(std::move(c));
    }

    spdlog::debug("resolved {} components", plan.components.size());
    return Result<InstallPlan>::ok(std::move(plan));
}

} // namespace kiln
