/**
 * kiln CLI - init command
 *
 * Write a kiln.json for the target project.
 */

#include "../common.hpp"
#include <CLI/CLI.hpp>

namespace kiln::cli::commands {

namespace {

struct InitOptions {
    size_t workers = 1;
    bool overwrite = false;
};

int cmd_init(const GlobalOptions& opts, const InitOptions& init_opts) {
    configure_logging(opts);
    WarningCollector warnings;

    if (init_opts.workers == 0) {
        print_error("--workers must be at least 1", opts.json);
        return 1;
    }

    ProjectConfig config = get_default_project_config();
    config.install.workers = init_opts.workers;
    for (size_t i = 0; i < opts.registries.size(); ++i) {
        RegistrySourceConfig source;
        source.alias = i == 0 ? "default" : "registry" + std::to_string(i);
        source.path = opts.registries[i];
        source.priority = static_cast<int>(100 + i * 10);
        config.registries.push_back(std::move(source));
    }

    auto written = write_project_config(opts.root, config, init_opts.overwrite);
    if (written.isErr()) {
        print_error(written.error().describe(), opts.json);
        return 1;
    }

    if (opts.json) {
        nlohmann::json j;
        j["ok"] = true;
        j["path"] = written.value();
        output_json(j, warnings);
    } else {
        print_success("Wrote " + written.value(), opts.json);
        if (config.registries.empty()) {
            std::cout << "No registry recorded; add one under \"registries\" or pass --registry." << std::endl;
        }
    }
    return 0;
}

} // anonymous namespace

void setup_init(CLI::App* app, GlobalOptions& opts) {
    static InitOptions init_opts;

    app->add_option("--workers", init_opts.workers, "Default install workers")->capture_default_str();
    app->add_flag("--force", init_opts.overwrite, "Replace an existing kiln.json");

    app->callback([&opts]() {
        std::exit(cmd_init(opts, init_opts));
    });
}

} // namespace kiln::cli::commands
