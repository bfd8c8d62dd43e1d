/**
 * kiln CLI - Common utilities and types
 */

#pragma once

#include <kiln/kiln.hpp>
#include <nlohmann/json.hpp>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace kiln::cli {

/**
 * Global options available to all commands.
 */
struct GlobalOptions {
    std::string root = ".";                 // --root
    std::vector<std::string> registries;    // --registry (repeatable)
    bool json = false;                      // --json
    bool verbose = false;                   // -v, --verbose
    bool quiet = false;                     // -q, --quiet
};

/**
 * Route logs to stderr and pick the level: -v debug, -q error, else info.
 */
inline void configure_logging(const GlobalOptions& opts) {
    static bool configured = false;
    if (!configured) {
        auto logger = spdlog::stderr_color_mt("kiln");
        logger->set_pattern("%^%l%$: %v");
        spdlog::set_default_logger(logger);
        configured = true;
    }

    if (opts.verbose) {
        spdlog::set_level(spdlog::level::debug);
    } else if (opts.quiet) {
        spdlog::set_level(spdlog::level::err);
    } else {
        spdlog::set_level(spdlog::level::info);
    }
}

/**
 * Output utilities.
 */
inline nlohmann::json warnings_to_json(const WarningCollector& warnings) {
    nlohmann::json out = nlohmann::json::array();
    for (const auto& w : warnings.get_warnings()) {
        nlohmann::json entry;
        entry["key"] = w.key;
        entry["action"] = w.action;
        entry["fields"] = w.fields;
        out.push_back(entry);
    }
    return out;
}

inline void print_error(const std::string& msg, bool json_mode) {
    if (json_mode) {
        nlohmann::json j;
        j["ok"] = false;
        j["error"] = msg;
        std::cout << j.dump(2) << std::endl;
    } else {
        std::cerr << "Error: " << msg << std::endl;
    }
}

inline void print_success(const std::string& msg, bool json_mode) {
    if (!json_mode) {
        std::cout << msg << std::endl;
    }
}

inline void output_json(const nlohmann::json& j, const WarningCollector& warnings) {
    nlohmann::json output = j;
    auto w = warnings_to_json(warnings);
    if (!w.empty() && !output.contains("warnings")) {
        output["warnings"] = w;
    }
    std::cout << output.dump(2) << std::endl;
}

/**
 * Configuration, merged settings and the registry built from them.
 */
struct CommandContext {
    ProjectConfig config;
    EffectiveSettings settings;
    std::shared_ptr<RegistryClient> registry;
};

/**
 * Load kiln.json, apply its warning policy and build the registry chain:
 * cache -> retry -> source list -> one DirectoryRegistry per source.
 */
inline std::optional<CommandContext> prepare_command(const GlobalOptions& opts,
                                                     CliSettings cli,
                                                     WarningCollector& warnings,
                                                     bool need_registry) {
    auto loaded = load_project_config(opts.root);
    if (!loaded.ok) {
        print_error(project_config_path(opts.root) + ": " + loaded.error, opts.json);
        return std::nullopt;
    }
    for (const auto& w : loaded.warnings) {
        warnings.emit(Warning::invalid_configuration, {{"detail", w}});
    }

    CommandContext ctx;
    ctx.config = loaded.config;
    warnings.set_policy(ctx.config.warnings);

    cli.registries = opts.registries;
    ctx.settings = resolve_settings(ctx.config, cli);

    if (need_registry) {
        if (ctx.settings.registries.empty()) {
            print_error("no registry configured (use --registry, KILN_REGISTRY or kiln.json)", opts.json);
            return std::nullopt;
        }

        auto sources = std::make_shared<SourceList>(&warnings);
        for (const auto& r : ctx.settings.registries) {
            spdlog::debug("registry source {} ({}), priority {}", r.alias, r.path, r.priority);
            sources->add({r.alias, r.priority, r.enabled, std::make_shared<DirectoryRegistry>(r.path)});
        }
        auto retrying = std::make_shared<RetryingRegistryClient>(sources);
        ctx.registry = std::make_shared<CachingRegistryClient>(retrying);
    }

    return ctx;
}

/**
 * Parse "name" / "name@constraint" targets.
 */
inline std::vector<ComponentRequest> parse_targets(const std::vector<std::string>& targets) {
    std::vector<ComponentRequest> requests;
    for (const auto& t : targets) {
        requests.push_back(parse_component_request(t));
    }
    return requests;
}

} // namespace kiln::cli
