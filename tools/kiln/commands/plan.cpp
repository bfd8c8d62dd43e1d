/**
 * kiln CLI - plan command
 *
 * Resolve without installing and print the install order.
 */

#include "../common.hpp"
#include <CLI/CLI.hpp>

namespace kiln::cli::commands {

namespace {

struct PlanOptions {
    std::vector<std::string> targets;
};

int cmd_plan(const GlobalOptions& opts, const PlanOptions& plan_opts) {
    configure_logging(opts);
    WarningCollector warnings;

    auto ctx = prepare_command(opts, {}, warnings, true);
    if (!ctx) return 1;

    DependencyResolver resolver(*ctx->registry, ResolverOptions{ctx->settings.workers});
    auto plan = resolver.resolve(parse_targets(plan_opts.targets));
    if (plan.isErr()) {
        print_error(plan.error().describe(), opts.json);
        return 1;
    }

    if (opts.json) {
        nlohmann::json j;
        j["ok"] = true;
        j["plan"] = nlohmann::json::array();
        for (const auto& c : plan.value().components) {
            nlohmann::json entry;
            entry["name"] = c.manifest.name;
            entry["version"] = c.manifest.version.str();
            entry["type"] = component_type_to_string(c.manifest.type);
            entry["requested_directly"] = c.requested_directly;
            entry["dependencies"] = c.dependencies;
            entry["requested_by"] = c.requested_by;
            j["plan"].push_back(entry);
        }
        output_json(j, warnings);
        return 0;
    }

    size_t n = 1;
    for (const auto& c : plan.value().components) {
        std::cout << n++ << ". " << c.manifest.id() << " ("
                  << component_type_to_string(c.manifest.type) << ")";
        if (!c.requested_directly) {
            std::cout << " required by";
            for (const auto& r : c.requested_by) std::cout << " " << r;
        }
        std::cout << std::endl;
    }
    return 0;
}

} // anonymous namespace

void setup_plan(CLI::App* app, GlobalOptions& opts) {
    static PlanOptions plan_opts;

    app->add_option("targets", plan_opts.targets, "Components as name or name@constraint")->required();

    app->callback([&opts]() {
        std::exit(cmd_plan(opts, plan_opts));
    });
}

} // namespace kiln::cli::commands
