#include "kiln/installer.hpp"
#include "kiln/digest.hpp"
#include "kiln/platform.hpp"
#include "kiln/template.hpp"
#include "kiln/warnings.hpp"
#include "kiln/worker_pool.hpp"

#include <algorithm>
#include <condition_variable>
#include <exception>
#include <mutex>
#include <numeric>
#include <set>
#include <shared_mutex>
#include <unordered_map>

#include <spdlog/spdlog.h>

namespace kiln {

namespace {

// Serializes observer calls coming from several workers
class EventSink {
public:
    explicit EventSink(const InstallObserver& observer) : observer_(observer) {}

    void emit(InstallEventKind kind, const std::string& component = "", const std::string& version = "",
              const std::string& path = "", const std::string& message = "") {
        if (!observer_) return;
        std::lock_guard<std::mutex> lock(mutex_);
        try {
            observer_(InstallEvent{kind, component, version, path, message});
        } catch (const std::exception& e) {
            spdlog::warn("install observer failed on {}: {}", install_event_kind_to_string(kind), e.what());
        }
    }

private:
    const InstallObserver& observer_;
    std::mutex mutex_;
};

// Components whose destinations overlap share a group (union-find)
std::vector<size_t> conflict_groups(const InstallPlan& plan) {
    const size_t n = plan.components.size();
    std::vector<size_t> parent(n);
    std::iota(parent.begin(), parent.end(), 0);

    auto find = [&](size_t i) {
        while (parent[i] != i) {
            parent[i] = parent[parent[i]];
            i = parent[i];
        }
        return i;
    };

    for (size_t a = 0; a < n; ++a) {
        for (size_t b = a + 1; b < n; ++b) {
            bool overlap = false;
            for (const auto& fa : plan.components[a].manifest.files) {
                for (const auto& fb : plan.components[b].manifest.files) {
                    if (paths_overlap(fa.dest, fb.dest)) {
                        overlap = true;
                        break;
                    }
                }
                if (overlap) break;
            }
            if (overlap) parent[find(a)] = find(b);
        }
    }

    std::vector<size_t> group(n);
    for (size_t i = 0; i < n; ++i) group[i] = find(i);
    return group;
}

/**
 * Files and directories written for one component so far.
 *
 * rollback() deletes new files, restores the previous content of files
 * overwritten under force, then removes directories it created if empty.
 * `tree_lock` is shared by every transaction of a run: writes hold it shared
 * from directory creation until the file exists, directory removal holds it
 * exclusively, so a sibling's directory never vanishes under its write.
 */
class ComponentTransaction {
public:
    ComponentTransaction(std::string root, std::shared_mutex& tree_lock)
        : root_(std::move(root)), tree_lock_(tree_lock) {}

    Result<void> write(const std::string& path, const std::string& content,
                       const CommitPredicate& may_commit) {
        std::shared_lock<std::shared_mutex> lock(tree_lock_);
        std::string parent = get_parent_directory(path);
        for (std::string d = parent; !d.empty() && d != root_ && !is_directory(d);) {
            created_dirs_.push_back(d);
            std::string up = get_parent_directory(d);
            if (up == d) break;
            d = up;
        }
        if (!parent.empty() && !create_directories(parent)) {
            return Result<void>::err(io_error(parent, "cannot create directory"));
        }

        std::optional<std::string> backup;
        if (is_regular_file(path)) {
            backup = read_file(path);
            if (!backup) {
                return Result<void>::err(io_error(path, "cannot read existing file for backup"));
            }
        }

        auto written = atomic_write_file(path, content, may_commit);
        if (!written.ok) {
            if (written.aborted) {
                return Result<void>::err(Error(ErrorCode::CANCELLED, "install cancelled before " + path));
            }
            return Result<void>::err(io_error(path, written.error));
        }

        written_.push_back({path, std::move(backup)});
        return Result<void>::ok();
    }

    void rollback() {
        for (auto it = written_.rbegin(); it != written_.rend(); ++it) {
            if (it->backup) {
                auto restored = atomic_write_file(it->path, *it->backup);
                if (!restored.ok) {
                    spdlog::error("rollback: cannot restore {}: {}", it->path, restored.error);
                }
            } else if (!remove_file(it->path) && path_exists(it->path)) {
                spdlog::error("rollback: cannot remove {}", it->path);
            }
        }
        written_.clear();

        // Deepest first
        std::unique_lock<std::shared_mutex> lock(tree_lock_);
        std::sort(created_dirs_.begin(), created_dirs_.end(),
                  [](const std::string& a, const std::string& b) { return a.size() > b.size(); });
        for (const auto& d : created_dirs_) {
            remove_empty_directory(d);
        }
        created_dirs_.clear();
    }

private:
    struct Written {
        std::string path;
        std::optional<std::string> backup;
    };

    std::string root_;
    std::shared_mutex& tree_lock_;
    std::vector<Written> written_;
    std::vector<std::string> created_dirs_;
};

struct RunContext {
    RegistryClient& registry;
    WarningCollector* warnings;
    EventSink& events;
    Ledger& ledger;
    const std::string& root;
    const ComponentVariables& variables;
    const InstallPolicy& policy;
    const CancellationToken* cancel;
    std::shared_mutex& tree_lock;
};

void warn(WarningCollector* warnings, Warning w, std::unordered_map<std::string, std::string> fields) {
    if (warnings) {
        warnings->emit(w, fields);
    } else {
        spdlog::warn("{}: component={} variable={}", warning_to_string(w), fields["component"],
                     fields["variable"]);
    }
}

void push_unique(std::vector<std::string>& v, const std::string& s) {
    if (std::find(v.begin(), v.end(), s) == v.end()) v.push_back(s);
}

Result<std::vector<std::string>> install_component(RunContext& ctx, const PlannedComponent& component) {
    using R = Result<std::vector<std::string>>;
    const Manifest& m = component.manifest;
    const std::string version = m.version.str();

    ctx.events.emit(InstallEventKind::ComponentStarted, m.name, version);
    spdlog::debug("installing {}", m.id());

    for (const auto& field : unknown_fields(m)) {
        if (ctx.warnings) {
            ctx.warnings->emit(Warning::unknown_manifest_field,
                               warnings::unknown_manifest_field(m.name, field));
        } else {
            spdlog::warn("{}: unknown manifest field '{}'", m.id(), field);
        }
    }

    auto bundle = ctx.registry.fetch_bundle(m.name, m.version);
    if (bundle.isErr()) return R::err(bundle.error());

    for (size_t i = 0; i < m.files.size(); ++i) {
        if (bundle.value().count(m.files[i].src) == 0) {
            return R::err(manifest_error("files[" + std::to_string(i) + "].src",
                                         "'" + m.files[i].src + "' is not in the bundle of " + m.id()));
        }
    }

    // Declared defaults, overridden by caller values
    VariableMap vars = m.default_variables();
    auto supplied = ctx.variables.find(m.name);
    if (supplied != ctx.variables.end()) {
        for (const auto& [key, value] : supplied->second) {
            if (!m.declares_variable(key)) {
                warn(ctx.warnings, Warning::unused_supplied_variable,
                     warnings::unused_supplied_variable(m.name, key));
                continue;
            }
            vars[key] = value;
        }
    }

    // Conflict pre-pass over the whole component
    std::vector<std::string> conflicts;
    std::vector<std::string> owners;
    for (const auto& file : m.files) {
        std::string dest_path = join_path(ctx.root, file.dest);
        if (ctx.policy.force || !path_exists(dest_path)) continue;

        if (is_regular_file(dest_path)) {
            auto hash = compute_file_sha256(dest_path);
            if (hash.ok && ctx.ledger.recorded_this_run(m.name, version, file.dest,
                                                        format_checksum(hash.hex_digest))) {
                continue;
            }
        }
        conflicts.push_back(file.dest);
        if (auto owner = ctx.ledger.owner_of(file.dest)) {
            owners.push_back(file.dest + " is recorded for " + *owner);
        }
    }
    if (!conflicts.empty()) {
        Error e = file_conflict_error(conflicts);
        for (const auto& o : owners) e.withContext(o);
        return R::err(e);
    }

    // Render everything before the first write
    std::vector<std::string> rendered(m.files.size());
    std::vector<std::string> missing;
    std::vector<std::string> undeclared;
    std::set<std::string> referenced;
    for (size_t i = 0; i < m.files.size(); ++i) {
        const std::string& content = bundle.value().at(m.files[i].src);
        for (const auto& name : find_placeholders(content)) {
            referenced.insert(name);
            if (!m.declares_variable(name)) push_unique(undeclared, name);
        }

        auto out = render_template(content, vars);
        if (out.isErr()) {
            for (const auto& name : out.error().details().missing) {
                if (m.declares_variable(name)) push_unique(missing, name);
            }
            continue;
        }
        rendered[i] = std::move(out.value());
    }
    if (!missing.empty() || !undeclared.empty()) {
        return R::err(template_error(missing, undeclared));
    }
    for (const auto& v : m.template_variables) {
        if (referenced.count(v.name) == 0) {
            warn(ctx.warnings, Warning::unused_template_variable,
                 warnings::unused_template_variable(m.name, v.name));
        }
    }

    // Write
    ComponentTransaction tx(ctx.root, ctx.tree_lock);
    CommitPredicate may_commit;
    if (ctx.cancel) {
        const CancellationToken* cancel = ctx.cancel;
        may_commit = [cancel] { return !cancel->is_cancelled(); };
    }

    InstallRecord record;
    record.name = m.name;
    record.version = version;
    record.requested_directly = component.requested_directly;

    std::vector<std::string> written;
    for (size_t i = 0; i < m.files.size(); ++i) {
        const auto& file = m.files[i];
        auto w = tx.write(join_path(ctx.root, file.dest), rendered[i], may_commit);
        if (w.isErr()) {
            tx.rollback();
            return R::err(w.error());
        }
        written.push_back(file.dest);
        ctx.events.emit(InstallEventKind::FileWritten, m.name, version, file.dest);

        auto hash = compute_sha256(rendered[i]);
        if (!hash.ok) {
            tx.rollback();
            return R::err(io_error(file.dest, hash.error));
        }
        record.files.push_back({file.dest, format_checksum(hash.hex_digest)});
    }

    // Ledger append is the commit point
    record.installed_at = get_current_timestamp();
    auto appended = ctx.ledger.append(record);
    if (appended.isErr()) {
        tx.rollback();
        return R::err(appended.error());
    }

    return R::ok(std::move(written));
}

Error with_requesters(Error error, const PlannedComponent& component) {
    for (const auto& r : component.requested_by) {
        if (r != kRootRequester) {
            error.withContext(component.manifest.name + " required by " + r);
        }
    }
    return error;
}

} // namespace

const char* install_event_kind_to_string(InstallEventKind kind) {
    switch (kind) {
        case InstallEventKind::ComponentStarted: return "component_started";
        case InstallEventKind::FileWritten: return "file_written";
        case InstallEventKind::ComponentInstalled: return "component_installed";
        case InstallEventKind::ComponentFailed: return "component_failed";
        case InstallEventKind::ComponentSkipped: return "component_skipped";
        case InstallEventKind::Done: return "done";
        default: return "unknown";
    }
}

const char* component_status_to_string(ComponentStatus status) {
    switch (status) {
        case ComponentStatus::Installed: return "installed";
        case ComponentStatus::Skipped: return "skipped";
        case ComponentStatus::Failed: return "failed";
        default: return "unknown";
    }
}

std::string ComponentOutcome::summary() const {
    std::string out = "component " + name + " " + component_status_to_string(status);
    if (error) {
        out += ": " + error->describe();
    }
    return out;
}

const ComponentOutcome* InstallReport::find(const std::string& name) const {
    for (const auto& c : components) {
        if (c.name == name) return &c;
    }
    return nullptr;
}

bool InstallReport::all_installed() const {
    return std::all_of(components.begin(), components.end(), [](const ComponentOutcome& c) {
        return c.status == ComponentStatus::Installed;
    });
}

InstallReport Installer::install(const InstallPlan& plan,
                                 const std::string& target_root,
                                 const ComponentVariables& variables,
                                 const InstallPolicy& policy,
                                 const CancellationToken* cancel) {
    InstallReport report;
    EventSink events(observer_);
    Ledger ledger(ledger_path(target_root));

    const size_t n = plan.components.size();
    std::unordered_map<std::string, size_t> index_of;
    for (size_t i = 0; i < n; ++i) {
        const auto& c = plan.components[i];
        index_of[c.manifest.name] = i;

        ComponentOutcome outcome;
        outcome.name = c.manifest.name;
        outcome.version = c.manifest.version.str();
        outcome.requested_directly = c.requested_directly;
        outcome.post_install_message = c.manifest.post_install_message;
        report.components.push_back(std::move(outcome));
    }

    auto loaded = ledger.load(warnings_);
    if (loaded.isErr()) {
        for (auto& outcome : report.components) {
            outcome.status = ComponentStatus::Failed;
            outcome.error = loaded.error();
            events.emit(InstallEventKind::ComponentFailed, outcome.name, outcome.version, "",
                        loaded.error().describe());
        }
        events.emit(InstallEventKind::Done);
        return report;
    }

    enum class State { Waiting, Running, Finished };
    std::vector<State> state(n, State::Waiting);
    std::vector<size_t> group = conflict_groups(plan);
    std::vector<bool> group_busy(n, false);
    std::mutex mutex;
    std::condition_variable cv;
    size_t running = 0;
    size_t finished = 0;
    const size_t workers = std::max<size_t>(policy.workers, 1);

    std::shared_mutex tree_lock;
    RunContext ctx{registry_, warnings_, events, ledger, target_root, variables, policy, cancel, tree_lock};

    // Caller holds `mutex`
    auto skip = [&](size_t i, Error reason) {
        auto& outcome = report.components[i];
        outcome.status = ComponentStatus::Skipped;
        outcome.error = std::move(reason);
        state[i] = State::Finished;
        ++finished;
        spdlog::info("{}", outcome.summary());
        events.emit(InstallEventKind::ComponentSkipped, outcome.name, outcome.version, "",
                    outcome.error->describe());
    };

    {
        WorkerPool pool(workers);
        std::unique_lock<std::mutex> lock(mutex);

        while (finished < n) {
            // Settle skips; repeat so they propagate down the plan
            for (bool changed = true; changed;) {
                changed = false;
                for (size_t i = 0; i < n; ++i) {
                    if (state[i] != State::Waiting) continue;

                    if (cancel && cancel->is_cancelled()) {
                        skip(i, Error(ErrorCode::CANCELLED, "cancelled before start"));
                        changed = true;
                        continue;
                    }

                    for (const auto& dep : plan.components[i].dependencies) {
                        size_t j = index_of.at(dep);
                        if (state[j] == State::Finished &&
                            report.components[j].status != ComponentStatus::Installed) {
                            Error reason(ErrorCode::SKIPPED_DEPENDENCY_FAILED,
                                         "dependency " + dep + " was not installed");
                            reason.withContext(report.components[j].summary());
                            skip(i, std::move(reason));
                            changed = true;
                            break;
                        }
                    }
                }
            }

            // Dispatch ready components in plan order
            for (size_t i = 0; i < n && running < workers; ++i) {
                if (state[i] != State::Waiting || group_busy[group[i]]) continue;

                const auto& deps = plan.components[i].dependencies;
                bool ready = std::all_of(deps.begin(), deps.end(), [&](const std::string& dep) {
                    return state[index_of.at(dep)] == State::Finished;
                });
                if (!ready) continue;

                state[i] = State::Running;
                group_busy[group[i]] = true;
                ++running;

                pool.submit([&, i] {
                    const auto& component = plan.components[i];
                    std::optional<Result<std::vector<std::string>>> result;
                    try {
                        result.emplace(install_component(ctx, component));
                    } catch (const std::exception& e) {
                        result.emplace(Result<std::vector<std::string>>::err(
                            io_error(component.manifest.name, std::string("unexpected error: ") + e.what())));
                    }

                    std::lock_guard<std::mutex> guard(mutex);
                    state[i] = State::Finished;
                    group_busy[group[i]] = false;
                    --running;
                    ++finished;

                    auto& outcome = report.components[i];
                    outcome.status = result->isOk() ? ComponentStatus::Installed : ComponentStatus::Failed;
                    try {
                        if (result->isOk()) {
                            outcome.files = std::move(result->value());
                            spdlog::info("{}", outcome.summary());
                            events.emit(InstallEventKind::ComponentInstalled, outcome.name, outcome.version);
                        } else {
                            outcome.error = with_requesters(result->error(), component);
                            spdlog::error("{}", outcome.summary());
                            events.emit(InstallEventKind::ComponentFailed, outcome.name, outcome.version, "",
                                        outcome.error->describe());
                        }
                    } catch (const std::exception& e) {
                        spdlog::error("{}: reporting outcome failed: {}", outcome.name, e.what());
                    }
                    cv.notify_all();
                });
            }

            if (finished < n) {
                cv.wait(lock);
            }
        }
    }

    report.ledger = ledger.entries();
    events.emit(InstallEventKind::Done);
    return report;
}

} // namespace kiln
