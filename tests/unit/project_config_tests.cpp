#include <doctest/doctest.h>
#include <kiln/project_config.hpp>

#include "test_support.hpp"

#include <algorithm>
#include <cstdlib>

using namespace kiln;
using namespace kiln::test;

namespace {

// Sets an environment variable for the lifetime of the guard
class EnvGuard {
public:
    EnvGuard(const char* name, const char* value) : name_(name) {
        if (value) {
            setenv(name, value, 1);
        } else {
            unsetenv(name);
        }
    }
    ~EnvGuard() { unsetenv(name_); }

private:
    const char* name_;
};

bool has(const std::vector<std::string>& items, const std::string& needle) {
    return std::find(items.begin(), items.end(), needle) != items.end();
}

} // namespace

// ============================================================================
// Parsing
// ============================================================================

TEST_CASE("project config parses every section") {
    auto r = parse_project_config(R"({
        "$schema": "kiln.project.v1",
        "registries": [
            {"alias": "local", "path": "/srv/registry", "priority": 5},
            {"path": "/mnt/mirror", "enabled": false}
        ],
        "install": {"workers": 4, "force": true},
        "variables": {"web_search": {"region": "eu", "retries": 3}},
        "warnings": {"Unused_Template_Variable": "error"}
    })", "/proj/kiln.json");

    REQUIRE(r.ok);
    CHECK(r.warnings.empty());
    CHECK(r.config.source_path == "/proj/kiln.json");

    REQUIRE(r.config.registries.size() == 2);
    CHECK(r.config.registries[0].alias == "local");
    CHECK(r.config.registries[0].priority == 5);
    CHECK(r.config.registries[1].alias == "/mnt/mirror");
    CHECK(r.config.registries[1].priority == 100);
    CHECK_FALSE(r.config.registries[1].enabled);

    CHECK(r.config.install.workers == 4);
    CHECK(r.config.install.force);
    CHECK(r.config.variables["web_search"]["region"] == "eu");
    CHECK(r.config.variables["web_search"]["retries"] == "3");
    CHECK(r.config.warnings["unused_template_variable"] == WarningAction::Error);
}

TEST_CASE("project config requires the schema tag") {
    CHECK_FALSE(parse_project_config("{}").ok);
    CHECK_FALSE(parse_project_config(R"({"$schema": "kiln.project.v2"})").ok);
    CHECK_FALSE(parse_project_config("[]").ok);
    CHECK_FALSE(parse_project_config("{").ok);
}

TEST_CASE("invalid values become configuration warnings") {
    auto r = parse_project_config(R"({
        "$schema": "kiln.project.v1",
        "registries": [{"alias": "nopath"}],
        "install": {"workers": 0, "force": "yes"},
        "variables": {"a": "not-an-object"},
        "warnings": {"unused_supplied_variable": "loud"}
    })");

    REQUIRE(r.ok);
    CHECK(has(r.warnings, "invalid_configuration:registry_path_missing"));
    CHECK(has(r.warnings, "invalid_configuration:invalid_workers"));
    CHECK(has(r.warnings, "invalid_configuration:invalid_force"));
    CHECK(has(r.warnings, "invalid_configuration:invalid_variables:a"));
    CHECK(has(r.warnings, "invalid_configuration:invalid_warning_action:unused_supplied_variable"));
    CHECK(r.config.install.workers == 1);
    CHECK(r.config.registries.empty());
}

TEST_CASE("absent kiln.json loads the defaults") {
    TempDir dir;
    auto r = load_project_config(dir.path());
    REQUIRE(r.ok);
    CHECK(r.config.schema == "kiln.project.v1");
    CHECK(r.config.install.workers == 1);
}

TEST_CASE("load_project_config reads kiln.json from the target root") {
    TempDir dir;
    dir.write("kiln.json", R"({"$schema": "kiln.project.v1", "install": {"workers": 2}})");
    auto r = load_project_config(dir.path());
    REQUIRE(r.ok);
    CHECK(r.config.install.workers == 2);
    CHECK(r.config.source_path == project_config_path(dir.path()));
}

TEST_CASE("write_project_config creates a kiln.json that loads back") {
    TempDir dir;
    ProjectConfig config = get_default_project_config();
    config.registries.push_back({"local", "/srv/registry", 10, true});
    config.install.workers = 3;
    config.variables["A"]["greeting"] = "hi";
    config.warnings["unused_template_variable"] = WarningAction::Ignore;

    auto written = write_project_config(dir.path(), config);
    REQUIRE(written.isOk());
    CHECK(written.value() == project_config_path(dir.path()));

    auto r = load_project_config(dir.path());
    REQUIRE(r.ok);
    CHECK(r.warnings.empty());
    REQUIRE(r.config.registries.size() == 1);
    CHECK(r.config.registries[0].alias == "local");
    CHECK(r.config.registries[0].priority == 10);
    CHECK(r.config.install.workers == 3);
    CHECK(r.config.variables["A"]["greeting"] == "hi");
    CHECK(r.config.warnings["unused_template_variable"] == WarningAction::Ignore);
}

TEST_CASE("write_project_config keeps an existing kiln.json unless told to overwrite") {
    TempDir dir;
    dir.write("kiln.json", R"({"$schema": "kiln.project.v1", "install": {"workers": 2}})");

    auto refused = write_project_config(dir.path(), get_default_project_config());
    REQUIRE(refused.isErr());
    CHECK(refused.error().code() == ErrorCode::IO_ERROR);
    CHECK(load_project_config(dir.path()).config.install.workers == 2);

    auto replaced = write_project_config(dir.path(), get_default_project_config(), true);
    REQUIRE(replaced.isOk());
    CHECK(load_project_config(dir.path()).config.install.workers == 1);
}

// ============================================================================
// Precedence
// ============================================================================

TEST_CASE("settings fall back to the config file") {
    EnvGuard registry("KILN_REGISTRY", nullptr);
    EnvGuard workers("KILN_WORKERS", nullptr);

    auto config = get_default_project_config();
    config.registries = {{"slow", "/b", 20, true}, {"fast", "/a", 10, true}, {"off", "/c", 1, false}};
    config.install.workers = 3;

    auto s = resolve_settings(config, {});
    REQUIRE(s.registries.size() == 2);
    CHECK(s.registries[0].alias == "fast");
    CHECK(s.registries[1].alias == "slow");
    CHECK(s.workers == 3);
    CHECK_FALSE(s.force);
}

TEST_CASE("environment overrides the config file") {
    EnvGuard registry("KILN_REGISTRY", "/env/one:/env/two");
    EnvGuard workers("KILN_WORKERS", "6");

    auto config = get_default_project_config();
    config.registries = {{"cfg", "/cfg", 0, true}};
    config.install.workers = 3;

    auto s = resolve_settings(config, {});
    REQUIRE(s.registries.size() == 2);
    CHECK(s.registries[0].path == "/env/one");
    CHECK(s.registries[1].path == "/env/two");
    CHECK(s.workers == 6);
}

TEST_CASE("invalid KILN_WORKERS is ignored") {
    EnvGuard workers("KILN_WORKERS", "many");
    auto config = get_default_project_config();
    config.install.workers = 2;
    CHECK(resolve_settings(config, {}).workers == 2);
}

TEST_CASE("command line overrides everything") {
    EnvGuard registry("KILN_REGISTRY", "/env");
    EnvGuard workers("KILN_WORKERS", "6");

    auto config = get_default_project_config();
    config.install.force = false;

    CliSettings cli;
    cli.registries = {"/cli"};
    cli.workers = 8;
    cli.force = true;

    auto s = resolve_settings(config, cli);
    REQUIRE(s.registries.size() == 1);
    CHECK(s.registries[0].path == "/cli");
    CHECK(s.workers == 8);
    CHECK(s.force);
}
