#include "kiln/registry.hpp"
#include "kiln/platform.hpp"

#include <algorithm>
#include <cctype>
#include <filesystem>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

namespace kiln {

namespace fs = std::filesystem;

namespace {

std::optional<std::string> get_string(const nlohmann::json& j, const std::string& key) {
    if (j.contains(key) && j[key].is_string()) {
        return j[key].get<std::string>();
    }
    return std::nullopt;
}

std::string to_lower(const std::string& s) {
    std::string result = s;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return result;
}

// component.json files under root, sorted for a stable scan order
std::vector<std::string> find_manifests(const std::string& root) {
    std::vector<std::string> found;
    std::error_code ec;
    for (fs::recursive_directory_iterator it(root, ec), end; !ec && it != end; it.increment(ec)) {
        if (it->is_regular_file(ec) && it->path().filename() == "component.json") {
            found.push_back(to_portable_path(fs::relative(it->path(), root, ec).string()));
        }
    }
    std::sort(found.begin(), found.end());
    return found;
}

} // namespace

Result<std::vector<RegistryIndexEntry>> parse_registry_index(const std::string& json_str) {
    using R = Result<std::vector<RegistryIndexEntry>>;
    std::vector<RegistryIndexEntry> entries;

    try {
        auto j = nlohmann::json::parse(json_str);
        if (!j.is_object()) {
            return R::err(registry_fetch_error("index.json", "*", "JSON must be an object"));
        }
        if (!j.contains("components") || !j["components"].is_array()) {
            return R::err(registry_fetch_error("index.json", "*", "components array missing"));
        }

        for (const auto& c : j["components"]) {
            RegistryIndexEntry e;
            auto name = get_string(c, "name");
            auto version = get_string(c, "version");
            auto path = get_string(c, "manifest_path");
            if (!name || !version || !path) {
                return R::err(registry_fetch_error(
                    "index.json", "*", "entry needs name, version and manifest_path"));
            }
            e.name = *name;
            e.version = *version;
            e.manifest_path = *path;
            e.type = get_string(c, "type").value_or("");
            e.description = get_string(c, "description").value_or("");
            entries.push_back(std::move(e));
        }
        return R::ok(std::move(entries));

    } catch (const nlohmann::json::parse_error& e) {
        return R::err(registry_fetch_error("index.json", "*", std::string("parse error: ") + e.what()));
    } catch (const nlohmann::json::exception& e) {
        return R::err(registry_fetch_error("index.json", "*", std::string("JSON error: ") + e.what()));
    }
}

DirectoryRegistry::DirectoryRegistry(std::string root) : root_(std::move(root)) {}

Result<void> DirectoryRegistry::ensure_loaded() {
    // Caller holds mutex_
    if (loaded_) return Result<void>::ok();

    if (!is_directory(root_)) {
        return Result<void>::err(
            registry_fetch_error("*", "*", "registry root is not a directory: " + root_));
    }

    std::vector<RegistryIndexEntry> entries;
    std::string index_path = join_path(root_, "index.json");

    if (auto content = read_file(index_path)) {
        auto parsed = parse_registry_index(*content);
        if (parsed.isErr()) {
            return Result<void>::err(parsed.error().withContext("reading " + index_path));
        }
        entries = std::move(parsed.value());
    } else {
        spdlog::debug("no index.json under {}, scanning for component.json", root_);
        for (const auto& rel : find_manifests(root_)) {
            auto content = read_file(join_path(root_, rel));
            if (!content) continue;
            auto manifest = load_manifest(*content);
            if (manifest.isErr()) {
                spdlog::warn("skipping {}: {}", rel, manifest.error().describe());
                continue;
            }
            RegistryIndexEntry e;
            e.name = manifest.value().name;
            e.version = manifest.value().version.str();
            e.type = component_type_to_string(manifest.value().type);
            e.description = manifest.value().description;
            e.manifest_path = rel;
            entries.push_back(std::move(e));
        }
    }

    for (auto& e : entries) {
        auto v = parse_version(e.version);
        if (!v) {
            spdlog::warn("index entry {} has invalid version '{}', ignored", e.name, e.version);
            continue;
        }
        index_.push_back({std::move(e), *v});
    }

    loaded_ = true;
    spdlog::debug("registry {} lists {} component versions", root_, index_.size());
    return Result<void>::ok();
}

const DirectoryRegistry::Indexed* DirectoryRegistry::find(const std::string& name,
                                                          const Version& version) const {
    for (const auto& i : index_) {
        if (i.entry.name == name && i.version == version) {
            return &i;
        }
    }
    return nullptr;
}

Result<Manifest> DirectoryRegistry::read_manifest(const RegistryIndexEntry& entry) const {
    std::string path = join_path(root_, entry.manifest_path);
    auto content = read_file(path);
    if (!content) {
        return Result<Manifest>::err(
            registry_fetch_error(entry.name, entry.version, "cannot read " + path));
    }

    auto manifest = load_manifest(*content);
    if (manifest.isErr()) {
        return Result<Manifest>::err(manifest.error().withContext("manifest " + path));
    }

    if (manifest.value().name != entry.name || manifest.value().version.str() != entry.version) {
        return Result<Manifest>::err(registry_fetch_error(
            entry.name, entry.version,
            "index entry does not match manifest " + manifest.value().id()));
    }
    return manifest;
}

Result<Manifest> DirectoryRegistry::fetch_manifest(const std::string& name, const VersionRange& range) {
    const Indexed* best = nullptr;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto loaded = ensure_loaded();
        if (loaded.isErr()) return Result<Manifest>::err(loaded.error());

        std::vector<Version> versions;
        for (const auto& i : index_) {
            if (i.entry.name == name) versions.push_back(i.version);
        }
        auto selected = select_best(versions, range);
        if (!selected) {
            std::string reason = versions.empty() ? "not in registry"
                                                  : "no version satisfies the constraint";
            return Result<Manifest>::err(registry_fetch_error(name, range.str(), reason));
        }
        best = find(name, *selected);
    }

    spdlog::debug("registry {}: {} '{}' -> {}", root_, name, range.str(), best->entry.version);
    return read_manifest(best->entry);
}

Result<Bundle> DirectoryRegistry::fetch_bundle(const std::string& name, const Version& version) {
    const Indexed* indexed = nullptr;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto loaded = ensure_loaded();
        if (loaded.isErr()) return Result<Bundle>::err(loaded.error());
        indexed = find(name, version);
    }
    if (!indexed) {
        return Result<Bundle>::err(registry_fetch_error(name, version.str(), "not in registry"));
    }

    auto manifest = read_manifest(indexed->entry);
    if (manifest.isErr()) return Result<Bundle>::err(manifest.error());

    std::string base = get_parent_directory(join_path(root_, indexed->entry.manifest_path));
    Bundle bundle;
    for (const auto& file : manifest.value().files) {
        std::string path = join_path(base, file.src);
        if (!is_regular_file(path)) {
            // Reported by the installer as files[i].src
            continue;
        }
        auto content = read_file(path);
        if (!content) {
            return Result<Bundle>::err(
                registry_fetch_error(name, version.str(), "cannot read " + path, true));
        }
        bundle[file.src] = std::move(*content);
    }
    return Result<Bundle>::ok(std::move(bundle));
}

Result<std::vector<RegistryIndexEntry>> DirectoryRegistry::entries() {
    std::lock_guard<std::mutex> lock(mutex_);
    auto loaded = ensure_loaded();
    if (loaded.isErr()) return Result<std::vector<RegistryIndexEntry>>::err(loaded.error());

    std::vector<RegistryIndexEntry> out;
    for (const auto& i : index_) out.push_back(i.entry);
    return Result<std::vector<RegistryIndexEntry>>::ok(std::move(out));
}

std::vector<RegistryIndexEntry> filter_registry_entries(const std::vector<RegistryIndexEntry>& entries,
                                                        const std::string& term,
                                                        const std::string& type) {
    std::string needle = to_lower(term);
    std::vector<RegistryIndexEntry> out;
    for (const auto& e : entries) {
        if (!type.empty() && to_lower(e.type) != to_lower(type)) continue;
        if (!needle.empty() && to_lower(e.name).find(needle) == std::string::npos &&
            to_lower(e.description).find(needle) == std::string::npos) {
            continue;
        }
        out.push_back(e);
    }
    return out;
}

Result<IndexBuildResult> build_registry_index(const std::string& root) {
    using R = Result<IndexBuildResult>;

    if (!is_directory(root)) {
        return R::err(io_error(root, "not a directory"));
    }

    IndexBuildResult result;
    std::vector<std::string> failing;
    std::vector<std::string> reasons;

    for (const auto& rel : find_manifests(root)) {
        auto content = read_file(join_path(root, rel));
        if (!content) {
            failing.push_back(rel);
            reasons.push_back(rel + ": unreadable");
            continue;
        }
        auto manifest = load_manifest(*content);
        if (manifest.isErr()) {
            failing.push_back(rel);
            reasons.push_back(rel + ": " + manifest.error().message());
            continue;
        }

        const auto& m = manifest.value();
        auto dup = std::find_if(result.entries.begin(), result.entries.end(),
                                [&](const RegistryIndexEntry& e) {
                                    return e.name == m.name && e.version == m.version.str();
                                });
        if (dup != result.entries.end()) {
            failing.push_back(rel);
            reasons.push_back(rel + ": duplicate " + m.id() + " (also " + dup->manifest_path + ")");
            continue;
        }

        RegistryIndexEntry e;
        e.name = m.name;
        e.version = m.version.str();
        e.type = component_type_to_string(m.type);
        e.description = m.description;
        e.manifest_path = rel;
        result.entries.push_back(std::move(e));
    }

    if (!failing.empty()) {
        std::string msg = "invalid manifests in " + root + ":";
        for (const auto& r : reasons) msg += " " + r + ";";
        ErrorDetails details;
        details.paths = failing;
        return R::err(Error(ErrorCode::MANIFEST_INVALID, msg, std::move(details)));
    }

    std::sort(result.entries.begin(), result.entries.end(),
              [](const RegistryIndexEntry& a, const RegistryIndexEntry& b) {
                  if (a.name != b.name) return a.name < b.name;
                  return *parse_version(a.version) < *parse_version(b.version);
              });

    nlohmann::json j;
    j["registry_version"] = "1.0";
    j["components"] = nlohmann::json::array();
    for (const auto& e : result.entries) {
        j["components"].push_back({
            {"name", e.name},
            {"version", e.version},
            {"type", e.type},
            {"description", e.description},
            {"manifest_path", e.manifest_path},
        });
    }

    result.index_path = join_path(root, "index.json");
    auto written = atomic_write_file(result.index_path, j.dump(2) + "\n");
    if (!written.ok) {
        return R::err(io_error(result.index_path, written.error));
    }

    spdlog::info("indexed {} component versions into {}", result.entries.size(), result.index_path);
    return R::ok(std::move(result));
}

} // namespace kiln
