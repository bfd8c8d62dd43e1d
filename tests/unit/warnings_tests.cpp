#include <doctest/doctest.h>
#include <kiln/warnings.hpp>
#include <kiln/types.hpp>

#include <thread>
#include <vector>

using namespace kiln;

TEST_CASE("warning_to_string returns correct warning key") {
    CHECK(std::string(warning_to_string(Warning::unused_template_variable)) == "unused_template_variable");
    CHECK(std::string(warning_to_string(Warning::unused_supplied_variable)) == "unused_supplied_variable");
    CHECK(std::string(warning_to_string(Warning::invalid_ledger_entry)) == "invalid_ledger_entry");
    CHECK(std::string(warning_to_string(Warning::registry_source_failed)) == "registry_source_failed");
}

TEST_CASE("parse_warning_key parses known warning keys") {
    CHECK(parse_warning_key("unknown_manifest_field") == Warning::unknown_manifest_field);
    CHECK(parse_warning_key("invalid_configuration") == Warning::invalid_configuration);
    CHECK(parse_warning_key("Unused_Template_Variable") == Warning::unused_template_variable);
}

TEST_CASE("parse_warning_key returns nullopt for unknown keys") {
    CHECK_FALSE(parse_warning_key("unknown_warning").has_value());
    CHECK_FALSE(parse_warning_key("").has_value());
}

TEST_CASE("parse_warning_action accepts the three actions") {
    CHECK(parse_warning_action("warn") == WarningAction::Warn);
    CHECK(parse_warning_action("IGNORE") == WarningAction::Ignore);
    CHECK(parse_warning_action("error") == WarningAction::Error);
    CHECK_FALSE(parse_warning_action("fatal").has_value());
}

TEST_CASE("WarningCollector default policy is warn") {
    WarningCollector collector;

    collector.emit(Warning::unused_supplied_variable,
                   warnings::unused_supplied_variable("web_search", "region"));

    auto warnings = collector.get_warnings();
    REQUIRE(warnings.size() == 1);
    CHECK(warnings[0].action == "warn");
    CHECK(warnings[0].key == "unused_supplied_variable");
    CHECK(warnings[0].fields["component"] == "web_search");
    CHECK(warnings[0].fields["variable"] == "region");
}

TEST_CASE("WarningCollector applies error policy") {
    std::unordered_map<std::string, WarningAction> policy;
    policy["unused_template_variable"] = WarningAction::Error;

    WarningCollector collector(policy);
    collector.emit_with_context(Warning::unused_template_variable, "test context");

    auto warnings = collector.get_warnings();
    REQUIRE(warnings.size() == 1);
    CHECK(warnings[0].action == "error");
    CHECK(warnings[0].fields["context"] == "test context");
}

TEST_CASE("WarningCollector applies ignore policy") {
    WarningCollector collector;
    collector.set_policy({{"Unknown_Manifest_Field", WarningAction::Ignore}});
    collector.emit(Warning::unknown_manifest_field, warnings::unknown_manifest_field("a", "homepage"));

    CHECK(collector.get_warnings().empty());
}

TEST_CASE("WarningCollector has_errors detects error-level warnings") {
    std::unordered_map<std::string, WarningAction> policy;
    policy["registry_source_failed"] = WarningAction::Error;

    WarningCollector collector(policy);
    CHECK_FALSE(collector.has_errors());

    collector.emit_with_context(Warning::invalid_ledger_entry, "context1");  // warn
    CHECK_FALSE(collector.has_errors());

    collector.emit(Warning::registry_source_failed, warnings::registry_source_failed("mirror", "timeout"));
    CHECK(collector.has_errors());

    collector.clear();
    CHECK_FALSE(collector.has_errors());
    CHECK(collector.get_warnings().empty());
}

TEST_CASE("WarningCollector accepts emits from several threads") {
    WarningCollector collector;
    std::vector<std::thread> threads;
    for (int t = 0; t < 4; ++t) {
        threads.emplace_back([&collector, t] {
            for (int i = 0; i < 25; ++i) {
                collector.emit("invalid_ledger_entry", {{"thread", std::to_string(t)}});
            }
        });
    }
    for (auto& th : threads) th.join();

    CHECK(collector.get_warnings().size() == 100);
}

TEST_CASE("warning field builders") {
    auto fields = warnings::invalid_ledger_entry("/x/ledger.jsonl", 7, "parse error");
    CHECK(fields["source_path"] == "/x/ledger.jsonl");
    CHECK(fields["line"] == "7");
    CHECK(fields["reason"] == "parse error");
}
