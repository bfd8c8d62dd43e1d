#include "kiln/project_config.hpp"
#include "kiln/platform.hpp"

#include <algorithm>
#include <cctype>
#include <sstream>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

namespace kiln {

namespace {

std::string to_lower(const std::string& s) {
    std::string result = s;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return result;
}

std::string trim(const std::string& s) {
    size_t start = 0;
    while (start < s.size() && std::isspace(static_cast<unsigned char>(s[start]))) ++start;
    size_t end = s.size();
    while (end > start && std::isspace(static_cast<unsigned char>(s[end - 1]))) --end;
    return s.substr(start, end - start);
}

// Helper to safely get a string from JSON
std::optional<std::string> get_string(const nlohmann::json& j, const std::string& key) {
    if (j.contains(key) && j[key].is_string()) {
        return j[key].get<std::string>();
    }
    return std::nullopt;
}

std::optional<size_t> parse_worker_count(const std::string& s) {
    std::string t = trim(s);
    if (t.empty() || !std::all_of(t.begin(), t.end(), [](unsigned char c) { return std::isdigit(c); })) {
        return std::nullopt;
    }
    try {
        unsigned long value = std::stoul(t);
        if (value == 0) return std::nullopt;
        return static_cast<size_t>(value);
    } catch (const std::out_of_range&) {
        return std::nullopt;
    }
}

std::vector<std::string> split_paths(const std::string& s) {
    std::vector<std::string> parts;
    std::istringstream ss(s);
    std::string part;
    while (std::getline(ss, part, ':')) {
        part = trim(part);
        if (!part.empty()) parts.push_back(part);
    }
    return parts;
}

std::vector<RegistrySourceConfig> from_paths(const std::vector<std::string>& paths,
                                             const std::string& alias_prefix) {
    std::vector<RegistrySourceConfig> out;
    for (size_t i = 0; i < paths.size(); ++i) {
        RegistrySourceConfig r;
        r.alias = alias_prefix + std::to_string(i);
        r.path = paths[i];
        r.priority = static_cast<int>(i);
        out.push_back(std::move(r));
    }
    return out;
}

} // namespace

ProjectConfig get_default_project_config() {
    ProjectConfig config;
    config.schema = "kiln.project.v1";
    return config;
}

ProjectConfigParseResult parse_project_config(const std::string& json_str,
                                              const std::string& source_path) {
    ProjectConfigParseResult result;
    result.config = get_default_project_config();
    result.config.source_path = source_path;

    try {
        auto j = nlohmann::json::parse(json_str);

        if (!j.is_object()) {
            result.error = "JSON must be an object";
            return result;
        }

        // $schema (REQUIRED)
        if (auto schema = get_string(j, "$schema")) {
            result.config.schema = trim(*schema);
        } else {
            result.error = "$schema missing";
            return result;
        }

        if (result.config.schema != "kiln.project.v1") {
            result.error = "$schema mismatch: expected kiln.project.v1";
            return result;
        }

        // "registries" section
        if (j.contains("registries")) {
            if (!j["registries"].is_array()) {
                result.warnings.push_back("invalid_configuration:registries_not_array");
            } else {
                for (const auto& r : j["registries"]) {
                    RegistrySourceConfig source;
                    auto path = r.is_object() ? get_string(r, "path") : std::nullopt;
                    if (!path || trim(*path).empty()) {
                        result.warnings.push_back("invalid_configuration:registry_path_missing");
                        continue;
                    }
                    source.path = trim(*path);
                    source.alias = get_string(r, "alias").value_or(source.path);
                    if (r.contains("priority")) {
                        if (r["priority"].is_number_integer()) {
                            source.priority = r["priority"].get<int>();
                        } else {
                            result.warnings.push_back("invalid_configuration:invalid_priority:" + source.alias);
                        }
                    }
                    if (r.contains("enabled")) {
                        if (r["enabled"].is_boolean()) {
                            source.enabled = r["enabled"].get<bool>();
                        } else {
                            result.warnings.push_back("invalid_configuration:invalid_enabled:" + source.alias);
                        }
                    }
                    result.config.registries.push_back(std::move(source));
                }
            }
        }

        // "install" section
        if (j.contains("install") && j["install"].is_object()) {
            const auto& install = j["install"];
            if (install.contains("workers")) {
                if (install["workers"].is_number_unsigned() && install["workers"].get<size_t>() > 0) {
                    result.config.install.workers = install["workers"].get<size_t>();
                } else {
                    result.warnings.push_back("invalid_configuration:invalid_workers");
                }
            }
            if (install.contains("force")) {
                if (install["force"].is_boolean()) {
                    result.config.install.force = install["force"].get<bool>();
                } else {
                    result.warnings.push_back("invalid_configuration:invalid_force");
                }
            }
        }

        // "variables" section: component -> {key: value}
        if (j.contains("variables") && j["variables"].is_object()) {
            for (auto& [component, vars] : j["variables"].items()) {
                if (!vars.is_object()) {
                    result.warnings.push_back("invalid_configuration:invalid_variables:" + component);
                    continue;
                }
                for (auto& [key, val] : vars.items()) {
                    if (val.is_string()) {
                        result.config.variables[component][key] = val.get<std::string>();
                    } else if (val.is_primitive() && !val.is_null()) {
                        result.config.variables[component][key] = val.dump();
                    } else {
                        result.warnings.push_back("invalid_configuration:invalid_variable:" +
                                                  component + "." + key);
                    }
                }
            }
        }

        // "warnings" section
        if (j.contains("warnings") && j["warnings"].is_object()) {
            for (auto& [key, val] : j["warnings"].items()) {
                if (val.is_string()) {
                    std::string key_str = to_lower(key);
                    auto action = parse_warning_action(val.get<std::string>());
                    if (action) {
                        result.config.warnings[key_str] = *action;
                    } else {
                        result.warnings.push_back("invalid_configuration:invalid_warning_action:" + key_str);
                    }
                }
            }
        }

        result.ok = true;
        return result;

    } catch (const nlohmann::json::parse_error& e) {
        result.error = std::string("parse error: ") + e.what();
        return result;
    } catch (const nlohmann::json::exception& e) {
        result.error = std::string("JSON error: ") + e.what();
        return result;
    }
}

std::string project_config_path(const std::string& target_root) {
    return join_path(target_root, "kiln.json");
}

ProjectConfigParseResult load_project_config(const std::string& target_root) {
    std::string path = project_config_path(target_root);
    if (!path_exists(path)) {
        ProjectConfigParseResult result;
        result.ok = true;
        result.config = get_default_project_config();
        return result;
    }

    auto content = read_file(path);
    if (!content) {
        ProjectConfigParseResult result;
        result.error = "cannot read " + path;
        return result;
    }

    auto result = parse_project_config(*content, path);
    for (const auto& w : result.warnings) {
        spdlog::warn("{}: {}", path, w);
    }
    return result;
}

std::string serialize_project_config(const ProjectConfig& config) {
    nlohmann::json j;
    j["$schema"] = config.schema.empty() ? "kiln.project.v1" : config.schema;

    j["registries"] = nlohmann::json::array();
    for (const auto& r : config.registries) {
        j["registries"].push_back({{"alias", r.alias},
                                   {"path", r.path},
                                   {"priority", r.priority},
                                   {"enabled", r.enabled}});
    }

    j["install"] = {{"workers", config.install.workers}, {"force", config.install.force}};

    j["variables"] = nlohmann::json::object();
    for (const auto& [component, vars] : config.variables) {
        for (const auto& [key, value] : vars) {
            j["variables"][component][key] = value;
        }
    }

    j["warnings"] = nlohmann::json::object();
    for (const auto& [key, action] : config.warnings) {
        j["warnings"][key] = action_to_string(action);
    }

    return j.dump(2) + "\n";
}

Result<std::string> write_project_config(const std::string& target_root,
                                         const ProjectConfig& config,
                                         bool overwrite) {
    std::string path = project_config_path(target_root);
    if (!overwrite && path_exists(path)) {
        return Result<std::string>::err(io_error(path, "already exists"));
    }
    if (!create_directories(target_root)) {
        return Result<std::string>::err(io_error(target_root, "cannot create directory"));
    }

    auto written = atomic_write_file(path, serialize_project_config(config));
    if (!written.ok) {
        return Result<std::string>::err(io_error(path, written.error));
    }
    spdlog::debug("wrote {}", path);
    return Result<std::string>::ok(path);
}

EffectiveSettings resolve_settings(const ProjectConfig& config, const CliSettings& cli) {
    EffectiveSettings settings;

    // Registries
    std::vector<RegistrySourceConfig> registries;
    if (!cli.registries.empty()) {
        registries = from_paths(cli.registries, "cli");
    } else if (auto env = get_env("KILN_REGISTRY"); env && !split_paths(*env).empty()) {
        registries = from_paths(split_paths(*env), "env");
    } else {
        registries = config.registries;
    }
    for (auto& r : registries) {
        if (r.enabled) settings.registries.push_back(r);
    }
    std::stable_sort(settings.registries.begin(), settings.registries.end(),
                     [](const RegistrySourceConfig& a, const RegistrySourceConfig& b) {
                         return a.priority < b.priority;
                     });

    // Workers
    if (cli.workers && *cli.workers > 0) {
        settings.workers = *cli.workers;
    } else if (auto env = get_env("KILN_WORKERS")) {
        if (auto parsed = parse_worker_count(*env)) {
            settings.workers = *parsed;
        } else {
            spdlog::warn("ignoring KILN_WORKERS='{}': not a positive integer", *env);
            settings.workers = config.install.workers;
        }
    } else {
        settings.workers = config.install.workers;
    }

    settings.force = cli.force || config.install.force;
    return settings;
}

} // namespace kiln
