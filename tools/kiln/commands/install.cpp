/**
 * kiln CLI - install command
 *
 * Resolve the requested components and install them into --root.
 */

#include "../common.hpp"
#include <CLI/CLI.hpp>

#include <csignal>

namespace kiln::cli::commands {

namespace {

struct InstallOptions {
    std::vector<std::string> targets;
    std::vector<std::string> vars;   // component.key=value
    bool force = false;
    size_t workers = 0;              // 0 = not given
};

CancellationToken g_cancel;

void on_interrupt(int) {
    g_cancel.cancel();
}

// "component.key=value"
bool parse_var(const std::string& text, ComponentVariables& out) {
    auto eq = text.find('=');
    if (eq == std::string::npos) return false;
    std::string lhs = text.substr(0, eq);
    auto dot = lhs.find('.');
    if (dot == std::string::npos || dot == 0 || dot + 1 == lhs.size()) return false;
    out[lhs.substr(0, dot)][lhs.substr(dot + 1)] = text.substr(eq + 1);
    return true;
}

nlohmann::json outcome_to_json(const ComponentOutcome& c) {
    nlohmann::json j;
    j["name"] = c.name;
    j["version"] = c.version;
    j["status"] = component_status_to_string(c.status);
    j["requested_directly"] = c.requested_directly;
    if (c.error) {
        j["error"] = c.error->describe();
        j["error_code"] = error_code_to_string(c.error->code());
    }
    j["files"] = c.files;
    return j;
}

int cmd_install(const GlobalOptions& opts, const InstallOptions& install_opts) {
    configure_logging(opts);
    WarningCollector warnings;

    CliSettings cli;
    cli.force = install_opts.force;
    if (install_opts.workers > 0) cli.workers = install_opts.workers;

    auto ctx = prepare_command(opts, cli, warnings, true);
    if (!ctx) return 1;

    ComponentVariables variables = ctx->config.variables;
    for (const auto& v : install_opts.vars) {
        if (!parse_var(v, variables)) {
            print_error("invalid --var '" + v + "' (expected component.key=value)", opts.json);
            return 1;
        }
    }

    DependencyResolver resolver(*ctx->registry, ResolverOptions{ctx->settings.workers});
    auto plan = resolver.resolve(parse_targets(install_opts.targets));
    if (plan.isErr()) {
        print_error(plan.error().describe(), opts.json);
        return 1;
    }

    Installer installer(*ctx->registry, &warnings);
    installer.set_observer([](const InstallEvent& e) {
        if (e.kind == InstallEventKind::FileWritten) {
            spdlog::debug("  wrote {}", e.path);
        }
    });

    std::signal(SIGINT, on_interrupt);
    InstallPolicy policy{ctx->settings.force, ctx->settings.workers};
    auto report = installer.install(plan.value(), opts.root, variables, policy, &g_cancel);
    std::signal(SIGINT, SIG_DFL);

    bool ok = report.all_installed() && !warnings.has_errors();

    if (opts.json) {
        nlohmann::json j;
        j["ok"] = ok;
        j["components"] = nlohmann::json::array();
        for (const auto& c : report.components) {
            j["components"].push_back(outcome_to_json(c));
        }
        output_json(j, warnings);
    } else {
        for (const auto& c : report.components) {
            if (c.status == ComponentStatus::Installed) {
                std::cout << "installed " << c.name << "@" << c.version << std::endl;
            } else {
                std::cout << c.summary() << std::endl;
            }
        }
        for (const auto& c : report.components) {
            if (c.status == ComponentStatus::Installed && !c.post_install_message.empty()) {
                std::cout << std::endl << c.name << ": " << c.post_install_message << std::endl;
            }
        }
    }

    return ok ? 0 : 1;
}

} // anonymous namespace

void setup_install(CLI::App* app, GlobalOptions& opts) {
    static InstallOptions install_opts;

    app->add_option("targets", install_opts.targets, "Components as name or name@constraint")->required();
    app->add_option("--var", install_opts.vars, "Template variable component.key=value (repeatable)");
    app->add_flag("-f,--force", install_opts.force, "Overwrite existing files");
    app->add_option("-j,--workers", install_opts.workers, "Concurrent installer workers");

    app->callback([&opts]() {
        std::exit(cmd_install(opts, install_opts));
    });
}

} // namespace kiln::cli::commands
