/**
 * kiln CLI - index command
 *
 * Validate every component.json under a registry directory and write index.json.
 */

#include "../common.hpp"
#include <CLI/CLI.hpp>

namespace kiln::cli::commands {

namespace {

struct IndexOptions {
    std::string registry_dir;
};

int cmd_index(const GlobalOptions& opts, const IndexOptions& index_opts) {
    configure_logging(opts);
    WarningCollector warnings;

    auto built = build_registry_index(index_opts.registry_dir);
    if (built.isErr()) {
        if (opts.json) {
            nlohmann::json j;
            j["ok"] = false;
            j["error"] = built.error().describe();
            j["failing"] = built.error().details().paths;
            output_json(j, warnings);
        } else {
            print_error(built.error().describe(), opts.json);
        }
        return 1;
    }

    if (opts.json) {
        nlohmann::json j;
        j["ok"] = true;
        j["index_path"] = built.value().index_path;
        j["components"] = built.value().entries.size();
        output_json(j, warnings);
    } else {
        print_success("Wrote " + built.value().index_path + " (" +
                      std::to_string(built.value().entries.size()) + " component versions)",
                      opts.json);
    }
    return 0;
}

} // anonymous namespace

void setup_index(CLI::App* app, GlobalOptions& opts) {
    static IndexOptions index_opts;

    app->add_option("registry", index_opts.registry_dir, "Registry directory")->required();

    app->callback([&opts]() {
        std::exit(cmd_index(opts, index_opts));
    });
}

} // namespace kiln::cli::commands
