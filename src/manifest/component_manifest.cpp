#include "kiln/manifest.hpp"
#include "kiln/platform.hpp"

#include <algorithm>
#include <utility>
#include <unordered_set>

namespace kiln {

namespace {

const std::unordered_set<std::string>& known_fields() {
    static const std::unordered_set<std::string> fields = {
        "name", "componentType", "version", "description", "author", "tags",
        "dependencies", "minLanguageVersion", "files", "templateVariables",
        "postInstallMessage",
    };
    return fields;
}

std::string indexed(const std::string& field, size_t i) {
    return field + "[" + std::to_string(i) + "]";
}

// Optional string field; present-but-not-a-string is an error
Result<std::string> get_optional_string(const nlohmann::json& j, const std::string& key) {
    if (!j.contains(key) || j[key].is_null()) {
        return Result<std::string>::ok("");
    }
    if (!j[key].is_string()) {
        return Result<std::string>::err(manifest_error(key, "must be a string"));
    }
    return Result<std::string>::ok(j[key].get<std::string>());
}

Result<std::string> get_required_string(const nlohmann::json& j, const std::string& key) {
    if (!j.contains(key)) {
        return Result<std::string>::err(manifest_error(key, "missing"));
    }
    if (!j[key].is_string() || j[key].get<std::string>().empty()) {
        return Result<std::string>::err(manifest_error(key, "must be a non-empty string"));
    }
    return Result<std::string>::ok(j[key].get<std::string>());
}

Result<void> parse_dependencies(const nlohmann::json& j, Manifest& m) {
    if (!j.contains("dependencies") || j["dependencies"].is_null()) {
        return Result<void>::ok();
    }
    const auto& deps = j["dependencies"];
    if (!deps.is_array()) {
        return Result<void>::err(manifest_error("dependencies", "must be an array"));
    }

    for (size_t i = 0; i < deps.size(); ++i) {
        const auto& d = deps[i];
        std::string field = indexed("dependencies", i);
        if (!d.is_object()) {
            return Result<void>::err(manifest_error(field, "must be an object"));
        }

        ManifestDependency dep;
        if (!d.contains("name") || !d["name"].is_string() || d["name"].get<std::string>().empty()) {
            return Result<void>::err(manifest_error(field + ".name", "must be a non-empty string"));
        }
        dep.name = d["name"].get<std::string>();

        dep.constraint = "*";
        if (d.contains("versionConstraint") && !d["versionConstraint"].is_null()) {
            if (!d["versionConstraint"].is_string()) {
                return Result<void>::err(
                    manifest_error(field + ".versionConstraint", "must be a string"));
            }
            dep.constraint = d["versionConstraint"].get<std::string>();
        }

        auto range = parse_range(dep.constraint);
        if (!range) {
            return Result<void>::err(manifest_error(
                field + ".versionConstraint", "unparseable constraint '" + dep.constraint + "'"));
        }
        dep.range = *range;
        m.dependencies.push_back(std::move(dep));
    }
    return Result<void>::ok();
}

Result<void> parse_files(const nlohmann::json& j, Manifest& m) {
    if (!j.contains("files") || j["files"].is_null()) {
        return Result<void>::ok();
    }
    const auto& files = j["files"];
    if (!files.is_array()) {
        return Result<void>::err(manifest_error("files", "must be an array"));
    }

    std::unordered_set<std::string> seen_dest;
    for (size_t i = 0; i < files.size(); ++i) {
        const auto& f = files[i];
        std::string field = indexed("files", i);
        if (!f.is_object()) {
            return Result<void>::err(manifest_error(field, "must be an object"));
        }

        ManifestFile file;
        const std::pair<const char*, std::string*> paths[] = {{"src", &file.src}, {"dest", &file.dest}};
        for (const auto& [key, out] : paths) {
            if (!f.contains(key) || !f[key].is_string()) {
                return Result<void>::err(manifest_error(field + "." + key, "must be a string"));
            }
            auto validation = validate_relative_path(f[key].get<std::string>());
            if (!validation.safe) {
                return Result<void>::err(manifest_error(field + "." + key, validation.error));
            }
            *out = validation.normalized_path;
        }

        if (!seen_dest.insert(file.dest).second) {
            return Result<void>::err(
                manifest_error(field + ".dest", "duplicate destination '" + file.dest + "'"));
        }
        m.files.push_back(std::move(file));
    }
    return Result<void>::ok();
}

Result<void> parse_template_variables(const nlohmann::json& j, Manifest& m) {
    if (!j.contains("templateVariables") || j["templateVariables"].is_null()) {
        return Result<void>::ok();
    }
    const auto& vars = j["templateVariables"];
    if (!vars.is_array()) {
        return Result<void>::err(manifest_error("templateVariables", "must be an array"));
    }

    for (size_t i = 0; i < vars.size(); ++i) {
        const auto& v = vars[i];
        std::string field = indexed("templateVariables", i);
        TemplateVariable var;

        if (v.is_string()) {
            var.name = v.get<std::string>();
        } else if (v.is_object()) {
            if (v.contains("name") && v["name"].is_string()) {
                var.name = v["name"].get<std::string>();
            }
            if (v.contains("description") && v["description"].is_string()) {
                var.description = v["description"].get<std::string>();
            }
            if (v.contains("default") && !v["default"].is_null()) {
                // Non-string defaults (numbers, booleans) render as their JSON text
                var.default_value = v["default"].is_string() ? v["default"].get<std::string>()
                                                             : v["default"].dump();
            }
        } else {
            return Result<void>::err(manifest_error(field, "must be a string or an object"));
        }

        if (var.name.empty()) {
            return Result<void>::err(manifest_error(field, "variable name missing"));
        }
        if (m.declares_variable(var.name)) {
            continue;
        }
        m.template_variables.push_back(std::move(var));
    }
    return Result<void>::ok();
}

} // namespace

std::string Manifest::id() const {
    return name + "@" + version.str();
}

bool Manifest::declares_variable(const std::string& variable) const {
    return std::any_of(template_variables.begin(), template_variables.end(),
                       [&](const TemplateVariable& v) { return v.name == variable; });
}

VariableMap Manifest::default_variables() const {
    VariableMap defaults;
    for (const auto& v : template_variables) {
        if (v.default_value) {
            defaults[v.name] = *v.default_value;
        }
    }
    return defaults;
}

Result<Manifest> load_manifest(const std::string& raw) {
    Manifest m;

    try {
        auto j = nlohmann::json::parse(raw);

        if (!j.is_object()) {
            return Result<Manifest>::err(manifest_error("", "manifest must be a JSON object"));
        }

        auto name = get_required_string(j, "name");
        if (name.isErr()) return Result<Manifest>::err(name.error());
        m.name = name.value();

        auto type_str = get_required_string(j, "componentType");
        if (type_str.isErr()) return Result<Manifest>::err(type_str.error());
        auto type = parse_component_type(type_str.value());
        if (!type) {
            return Result<Manifest>::err(manifest_error(
                "componentType", "unknown component type '" + type_str.value() + "'"));
        }
        m.type = *type;

        auto version_str = get_required_string(j, "version");
        if (version_str.isErr()) return Result<Manifest>::err(version_str.error());
        auto version = parse_version(version_str.value());
        if (!version) {
            return Result<Manifest>::err(manifest_error(
                "version", "not a semantic version: '" + version_str.value() + "'"));
        }
        m.version = *version;

        const std::pair<const char*, std::string*> optional_fields[] = {
            {"description", &m.description},
            {"author", &m.author},
            {"minLanguageVersion", &m.min_language_version},
            {"postInstallMessage", &m.post_install_message},
        };
        for (const auto& [key, out] : optional_fields) {
            auto value = get_optional_string(j, key);
            if (value.isErr()) return Result<Manifest>::err(value.error());
            *out = value.value();
        }

        if (j.contains("tags") && !j["tags"].is_null()) {
            if (!j["tags"].is_array()) {
                return Result<Manifest>::err(manifest_error("tags", "must be an array"));
            }
            for (size_t i = 0; i < j["tags"].size(); ++i) {
                if (!j["tags"][i].is_string()) {
                    return Result<Manifest>::err(manifest_error(indexed("tags", i), "must be a string"));
                }
                m.tags.insert(j["tags"][i].get<std::string>());
            }
        }

        auto deps = parse_dependencies(j, m);
        if (deps.isErr()) return Result<Manifest>::err(deps.error());

        auto files = parse_files(j, m);
        if (files.isErr()) return Result<Manifest>::err(files.error());

        auto vars = parse_template_variables(j, m);
        if (vars.isErr()) return Result<Manifest>::err(vars.error());

        for (auto& [key, val] : j.items()) {
            if (known_fields().count(key) == 0) {
                m.extra[key] = val;
            }
        }

        return Result<Manifest>::ok(std::move(m));

    } catch (const nlohmann::json::parse_error& e) {
        return Result<Manifest>::err(manifest_error("", std::string("parse error: ") + e.what()));
    } catch (const nlohmann::json::exception& e) {
        return Result<Manifest>::err(manifest_error("", std::string("JSON error: ") + e.what()));
    }
}

std::vector<std::string> unknown_fields(const Manifest& manifest) {
    std::vector<std::string> keys;
    for (auto& [key, val] : manifest.extra.items()) {
        keys.push_back(key);
    }
    std::sort(keys.begin(), keys.end());
    return keys;
}

} // namespace kiln
