/**
 * kiln CLI - list command
 *
 * List components recorded in the target's ledger.
 */

#include "../common.hpp"
#include <CLI/CLI.hpp>

namespace kiln::cli::commands {

namespace {

struct ListOptions {
    bool all = false;  // every ledger entry, not just the latest per component
};

int cmd_list(const GlobalOptions& opts, const ListOptions& list_opts) {
    configure_logging(opts);
    WarningCollector warnings;

    Ledger ledger(ledger_path(opts.root));
    auto loaded = ledger.load(&warnings);
    if (loaded.isErr()) {
        print_error(loaded.error().describe(), opts.json);
        return 1;
    }

    auto records = list_opts.all ? ledger.entries() : ledger.latest_per_component();

    if (opts.json) {
        nlohmann::json j;
        j["components"] = nlohmann::json::array();
        for (const auto& r : records) {
            j["components"].push_back(nlohmann::json::parse(serialize_install_record(r)));
        }
        output_json(j, warnings);
        return 0;
    }

    if (records.empty()) {
        std::cout << "No components installed." << std::endl;
        return 0;
    }

    for (const auto& r : records) {
        std::cout << r.name << "@" << r.version << "  " << r.installed_at
                  << (r.requested_directly ? "" : "  (dependency)") << std::endl;
        if (opts.verbose) {
            for (const auto& f : r.files) {
                std::cout << "    " << f.path << "  " << f.checksum << std::endl;
            }
        }
    }
    return 0;
}

} // anonymous namespace

void setup_list(CLI::App* app, GlobalOptions& opts) {
    static ListOptions list_opts;

    app->add_flag("--all", list_opts.all, "Show every ledger entry");

    app->callback([&opts]() {
        std::exit(cmd_list(opts, list_opts));
    });
}

} // namespace kiln::cli::commands
