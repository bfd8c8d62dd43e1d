#include <doctest/doctest.h>
#include <kiln/ledger.hpp>
#include <kiln/warnings.hpp>

#include "test_support.hpp"

using namespace kiln;
using namespace kiln::test;

namespace {

InstallRecord make_record(const std::string& name, const std::string& version,
                          std::vector<FileRecord> files = {}) {
    InstallRecord r;
    r.name = name;
    r.version = version;
    r.files = std::move(files);
    r.installed_at = "2026-01-01T00:00:00Z";
    return r;
}

} // namespace

// ============================================================================
// Record serialization
// ============================================================================

TEST_CASE("serialize_install_record writes one line in field order") {
    auto r = make_record("web_search", "1.2.0", {{"tools/search.py", "sha256:ab"}});
    r.requested_directly = true;

    std::string line = serialize_install_record(r);
    CHECK(line.find('\n') == std::string::npos);
    CHECK(line ==
          R"({"name":"web_search","version":"1.2.0","files":[{"path":"tools/search.py","checksum":"sha256:ab"}],)"
          R"("installedAt":"2026-01-01T00:00:00Z","requestedDirectly":true})");
}

TEST_CASE("parse_install_record reads a serialized line") {
    auto parsed = parse_install_record(
        R"({"name":"a","version":"1.0.0","files":[{"path":"x","checksum":"sha256:00"}],"installedAt":"t"})");
    REQUIRE(parsed.ok);
    CHECK(parsed.record.name == "a");
    CHECK(parsed.record.files.size() == 1);
    CHECK(parsed.record.files[0].checksum == "sha256:00");
    CHECK_FALSE(parsed.record.requested_directly);
}

TEST_CASE("parse_install_record rejects incomplete lines") {
    CHECK_FALSE(parse_install_record("not json").ok);
    CHECK_FALSE(parse_install_record("[]").ok);
    CHECK_FALSE(parse_install_record(R"({"version":"1.0.0","files":[]})").ok);
    CHECK_FALSE(parse_install_record(R"({"name":"a","files":[]})").ok);
    CHECK_FALSE(parse_install_record(R"({"name":"a","version":"1.0.0"})").ok);
    CHECK_FALSE(parse_install_record(R"({"name":"a","version":"1.0.0","files":[{"path":"x"}]})").ok);
}

TEST_CASE("ledger_path lives under .component-lock") {
    CHECK(ledger_path("/srv/app") == "/srv/app/.component-lock/ledger.jsonl");
}

// ============================================================================
// Ledger
// ============================================================================

TEST_CASE("missing ledger file loads as empty") {
    TempDir dir;
    Ledger ledger(ledger_path(dir.path()));
    REQUIRE(ledger.load().isOk());
    CHECK(ledger.entries().empty());
}

TEST_CASE("append creates the file and survives reload") {
    TempDir dir;
    {
        Ledger ledger(ledger_path(dir.path()));
        REQUIRE(ledger.load().isOk());
        REQUIRE(ledger.append(make_record("A", "1.0.0", {{"a.txt", "sha256:1"}})).isOk());
        REQUIRE(ledger.append(make_record("B", "1.0.0")).isOk());
        CHECK(ledger.entries().size() == 2);
    }

    CHECK(dir.exists(".component-lock/ledger.jsonl"));

    Ledger reloaded(ledger_path(dir.path()));
    REQUIRE(reloaded.load().isOk());
    auto entries = reloaded.entries();
    REQUIRE(entries.size() == 2);
    CHECK(entries[0].name == "A");
    CHECK(entries[1].name == "B");
}

TEST_CASE("appends never rewrite earlier lines") {
    TempDir dir;
    Ledger ledger(ledger_path(dir.path()));
    REQUIRE(ledger.load().isOk());
    REQUIRE(ledger.append(make_record("A", "1.0.0")).isOk());
    std::string before = dir.read(".component-lock/ledger.jsonl");

    REQUIRE(ledger.append(make_record("A", "1.1.0")).isOk());
    std::string after = dir.read(".component-lock/ledger.jsonl");
    CHECK(after.compare(0, before.size(), before) == 0);
    CHECK(after.size() > before.size());
}

TEST_CASE("invalid lines are skipped with a warning") {
    TempDir dir;
    dir.write(".component-lock/ledger.jsonl",
              serialize_install_record(make_record("A", "1.0.0")) + "\n" +
              "{broken\n" +
              "\n" +
              serialize_install_record(make_record("B", "2.0.0")) + "\n");

    WarningCollector warnings;
    Ledger ledger(ledger_path(dir.path()));
    REQUIRE(ledger.load(&warnings).isOk());
    CHECK(ledger.entries().size() == 2);

    auto emitted = warnings.get_warnings();
    REQUIRE(emitted.size() == 1);
    CHECK(emitted[0].key == "invalid_ledger_entry");
    CHECK(emitted[0].fields["line"] == "2");
}

TEST_CASE("latest_per_component keeps the newest entry in first-seen order") {
    TempDir dir;
    Ledger ledger(ledger_path(dir.path()));
    REQUIRE(ledger.load().isOk());
    REQUIRE(ledger.append(make_record("A", "1.0.0")).isOk());
    REQUIRE(ledger.append(make_record("B", "1.0.0")).isOk());
    REQUIRE(ledger.append(make_record("A", "1.1.0")).isOk());

    auto latest = ledger.latest_per_component();
    REQUIRE(latest.size() == 2);
    CHECK(latest[0].name == "A");
    CHECK(latest[0].version == "1.1.0");
    CHECK(latest[1].name == "B");
}

TEST_CASE("owner_of returns the latest entry listing a path") {
    TempDir dir;
    Ledger ledger(ledger_path(dir.path()));
    REQUIRE(ledger.load().isOk());
    REQUIRE(ledger.append(make_record("A", "1.0.0", {{"shared.txt", "sha256:1"}})).isOk());
    REQUIRE(ledger.append(make_record("B", "3.0.0", {{"shared.txt", "sha256:2"}})).isOk());

    CHECK(ledger.owner_of("shared.txt") == std::optional<std::string>("B@3.0.0"));
    CHECK_FALSE(ledger.owner_of("other.txt"));
}

TEST_CASE("recorded_this_run ignores entries loaded from disk") {
    TempDir dir;
    {
        Ledger first(ledger_path(dir.path()));
        REQUIRE(first.load().isOk());
        REQUIRE(first.append(make_record("A", "1.0.0", {{"a.txt", "sha256:1"}})).isOk());
        CHECK(first.recorded_this_run("A", "1.0.0", "a.txt", "sha256:1"));
        CHECK_FALSE(first.recorded_this_run("A", "1.0.0", "a.txt", "sha256:2"));
        CHECK_FALSE(first.recorded_this_run("A", "2.0.0", "a.txt", "sha256:1"));
    }

    Ledger second(ledger_path(dir.path()));
    REQUIRE(second.load().isOk());
    CHECK_FALSE(second.recorded_this_run("A", "1.0.0", "a.txt", "sha256:1"));
}
