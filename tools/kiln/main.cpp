/**
 * kiln CLI - Entry Point
 */

#include <CLI/CLI.hpp>
#include "common.hpp"

// Forward declarations for commands
namespace kiln::cli::commands {
    void setup_install(CLI::App* app, GlobalOptions& opts);
    void setup_plan(CLI::App* app, GlobalOptions& opts);
    void setup_list(CLI::App* app, GlobalOptions& opts);
    void setup_verify(CLI::App* app, GlobalOptions& opts);
    void setup_index(CLI::App* app, GlobalOptions& opts);
    void setup_search(CLI::App* app, GlobalOptions& opts);
    void setup_init(CLI::App* app, GlobalOptions& opts);
}

int main(int argc, char** argv) {
    using namespace kiln::cli;

    CLI::App app{"kiln - component bundle installer"};
    app.set_version_flag("-V,--version", KILN_VERSION);
    app.require_subcommand(0, 1);

    GlobalOptions opts;

    // Global options
    app.add_option("--root", opts.root, "Target project root")->capture_default_str();
    app.add_option("--registry", opts.registries, "Registry directory (repeatable, first wins)");
    app.add_flag("--json", opts.json, "Machine-readable output");
    app.add_flag("-v,--verbose", opts.verbose, "Detailed progress");
    app.add_flag("-q,--quiet", opts.quiet, "Errors only");

    // Commands
    auto* install_cmd = app.add_subcommand("install", "Resolve and install components");
    commands::setup_install(install_cmd, opts);

    auto* plan_cmd = app.add_subcommand("plan", "Print the install plan without writing");
    commands::setup_plan(plan_cmd, opts);

    auto* list_cmd = app.add_subcommand("list", "List installed components");
    commands::setup_list(list_cmd, opts);

    auto* verify_cmd = app.add_subcommand("verify", "Check installed files against the ledger");
    commands::setup_verify(verify_cmd, opts);

    auto* index_cmd = app.add_subcommand("index", "Build index.json for a registry directory");
    commands::setup_index(index_cmd, opts);

    auto* search_cmd = app.add_subcommand("search", "Search the configured registries");
    commands::setup_search(search_cmd, opts);

    auto* init_cmd = app.add_subcommand("init", "Write kiln.json for a project");
    commands::setup_init(init_cmd, opts);

    CLI11_PARSE(app, argc, argv);

    // If no subcommand, show help
    if (app.get_subcommands().empty()) {
        std::cout << app.help() << std::endl;
    }

    return 0;
}
