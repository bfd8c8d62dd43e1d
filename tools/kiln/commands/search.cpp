/**
 * kiln CLI - search command
 *
 * Browse the components the configured registries offer.
 */

#include "../common.hpp"
#include <CLI/CLI.hpp>

namespace kiln::cli::commands {

namespace {

struct SearchOptions {
    std::string term;
    std::string type;
};

struct Listing {
    std::string source;
    RegistryIndexEntry entry;
};

int cmd_search(const GlobalOptions& opts, const SearchOptions& search_opts) {
    configure_logging(opts);
    WarningCollector warnings;

    auto ctx = prepare_command(opts, {}, warnings, false);
    if (!ctx) return 1;

    if (ctx->settings.registries.empty()) {
        print_error("no registry configured (use --registry, KILN_REGISTRY or kiln.json)", opts.json);
        return 1;
    }

    if (!search_opts.type.empty() && !parse_component_type(search_opts.type)) {
        print_error("unknown component type: " + search_opts.type, opts.json);
        return 1;
    }

    // Sources in priority order; an unreadable source is reported and skipped
    std::vector<Listing> found;
    for (const auto& source : ctx->settings.registries) {
        DirectoryRegistry registry(source.path);
        auto entries = registry.entries();
        if (entries.isErr()) {
            warnings.emit(Warning::registry_source_failed,
                          warnings::registry_source_failed(source.alias, entries.error().describe()));
            continue;
        }
        for (auto& e : filter_registry_entries(entries.value(), search_opts.term, search_opts.type)) {
            found.push_back({source.alias, std::move(e)});
        }
    }

    if (opts.json) {
        nlohmann::json j;
        j["ok"] = true;
        j["components"] = nlohmann::json::array();
        for (const auto& l : found) {
            j["components"].push_back({{"name", l.entry.name},
                                       {"version", l.entry.version},
                                       {"type", l.entry.type},
                                       {"description", l.entry.description},
                                       {"source", l.source}});
        }
        output_json(j, warnings);
        return warnings.has_errors() ? 1 : 0;
    }

    if (found.empty()) {
        std::cout << "No matching components." << std::endl;
    }
    for (const auto& l : found) {
        std::cout << l.entry.name << "@" << l.entry.version << "  (" << l.entry.type << ")  ["
                  << l.source << "]";
        if (!l.entry.description.empty()) std::cout << "  " << l.entry.description;
        std::cout << std::endl;
    }
    return warnings.has_errors() ? 1 : 0;
}

} // anonymous namespace

void setup_search(CLI::App* app, GlobalOptions& opts) {
    static SearchOptions search_opts;

    app->add_option("term", search_opts.term, "Text to look for in names and descriptions");
    app->add_option("--type", search_opts.type, "Only components of this type");

    app->callback([&opts]() {
        std::exit(cmd_search(opts, search_opts));
    });
}

} // namespace kiln::cli::commands
