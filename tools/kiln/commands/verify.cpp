/**
 * kiln CLI - verify command
 */

#include "../common.hpp"
#include <CLI/CLI.hpp>

namespace kiln::cli::commands {

namespace {

int cmd_verify(const GlobalOptions& opts) {
    configure_logging(opts);
    WarningCollector warnings;

    auto report = verify_installation(opts.root, &warnings);
    if (report.isErr()) {
        print_error(report.error().describe(), opts.json);
        return 1;
    }

    const auto& files = report.value().files;
    if (opts.json) {
        nlohmann::json j;
        j["ok"] = report.value().clean();
        j["files"] = nlohmann::json::array();
        for (const auto& f : files) {
            j["files"].push_back({{"component", f.component},
                                  {"version", f.version},
                                  {"path", f.path},
                                  {"state", file_state_to_string(f.state)}});
        }
        output_json(j, warnings);
    } else {
        for (const auto& f : files) {
            if (f.state != FileState::Ok || opts.verbose) {
                std::cout << file_state_to_string(f.state) << "  " << f.path << "  ("
                          << f.component << "@" << f.version << ")" << std::endl;
            }
        }
        print_success(report.value().clean() ? "All installed files match the ledger."
                                             : "Installed files differ from the ledger.",
                      opts.json);
    }

    return report.value().clean() ? 0 : 1;
}

} // anonymous namespace

void setup_verify(CLI::App* app, GlobalOptions& opts) {
    app->callback([&opts]() {
        std::exit(cmd_verify(opts));
    });
}

} // namespace kiln::cli::commands
