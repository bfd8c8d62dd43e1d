#include <doctest/doctest.h>
#include <kiln/registry.hpp>
#include <kiln/warnings.hpp>

#include "test_support.hpp"

using namespace kiln;
using namespace kiln::test;

namespace {

VersionRange range(const std::string& text) {
    auto r = parse_range(text);
    REQUIRE(r);
    return *r;
}

// Two versions of web_search and one of http_client, laid out by directory
void write_registry(const TempDir& dir) {
    dir.write("web_search/1.0.0/component.json",
              component_json("web_search", "1.0.0", {{"http_client", "^2.0.0"}},
                             {{"src/search.py", "tools/search.py"}}));
    dir.write("web_search/1.0.0/src/search.py", "print('v1')");
    dir.write("web_search/1.1.0/component.json",
              component_json("web_search", "1.1.0", {}, {{"src/search.py", "tools/search.py"}}));
    dir.write("web_search/1.1.0/src/search.py", "print('v1.1')");
    dir.write("http_client/component.json", component_json("http_client", "2.3.0"));
}

std::shared_ptr<InMemoryRegistry> memory_with(const std::string& name, const std::string& version) {
    auto registry = std::make_shared<InMemoryRegistry>();
    registry->add(component_json(name, version));
    return registry;
}

} // namespace

// ============================================================================
// DirectoryRegistry
// ============================================================================

TEST_CASE("directory registry scans component.json without an index") {
    TempDir dir;
    write_registry(dir);
    DirectoryRegistry registry(dir.path());

    auto latest = registry.fetch_manifest("web_search", range("^1.0.0"));
    REQUIRE(latest.isOk());
    CHECK(latest.value().version.str() == "1.1.0");

    auto pinned = registry.fetch_manifest("web_search", range("1.0.0"));
    REQUIRE(pinned.isOk());
    CHECK(pinned.value().dependencies.size() == 1);

    auto entries = registry.entries();
    REQUIRE(entries.isOk());
    CHECK(entries.value().size() == 3);
}

TEST_CASE("filter_registry_entries matches name or description and type") {
    TempDir dir;
    write_registry(dir);
    DirectoryRegistry registry(dir.path());
    auto entries = registry.entries();
    REQUIRE(entries.isOk());

    auto by_name = filter_registry_entries(entries.value(), "SEARCH");
    REQUIRE(by_name.size() == 2);
    CHECK(by_name[0].version == "1.0.0");
    CHECK(by_name[1].version == "1.1.0");

    auto by_description = filter_registry_entries(entries.value(), "client comp");
    REQUIRE(by_description.size() == 1);
    CHECK(by_description[0].name == "http_client");

    CHECK(filter_registry_entries(entries.value(), "").size() == 3);
    CHECK(filter_registry_entries(entries.value(), "", "tool").size() == 3);
    CHECK(filter_registry_entries(entries.value(), "search", "agent").empty());
    CHECK(filter_registry_entries(entries.value(), "nothing like this").empty());
}

TEST_CASE("directory registry reads bundles beside the manifest") {
    TempDir dir;
    write_registry(dir);
    DirectoryRegistry registry(dir.path());

    auto bundle = registry.fetch_bundle("web_search", *parse_version("1.0.0"));
    REQUIRE(bundle.isOk());
    REQUIRE(bundle.value().count("src/search.py") == 1);
    CHECK(bundle.value().at("src/search.py") == "print('v1')");
}

TEST_CASE("directory registry distinguishes unknown names from unsatisfied ranges") {
    TempDir dir;
    write_registry(dir);
    DirectoryRegistry registry(dir.path());

    auto unknown = registry.fetch_manifest("nope", range("*"));
    REQUIRE(unknown.isErr());
    CHECK(unknown.error().code() == ErrorCode::REGISTRY_FETCH);
    CHECK_FALSE(unknown.error().details().retryable);
    CHECK(unknown.error().message().find("not in registry") != std::string::npos);

    auto unsatisfied = registry.fetch_manifest("web_search", range(">=2.0.0"));
    REQUIRE(unsatisfied.isErr());
    CHECK(unsatisfied.error().message().find("no version satisfies") != std::string::npos);
}

TEST_CASE("build_registry_index writes a sorted index the registry then uses") {
    TempDir dir;
    write_registry(dir);

    auto built = build_registry_index(dir.path());
    REQUIRE(built.isOk());
    CHECK(dir.exists("index.json"));

    const auto& entries = built.value().entries;
    REQUIRE(entries.size() == 3);
    CHECK(entries[0].name == "http_client");
    CHECK(entries[1].version == "1.0.0");
    CHECK(entries[2].version == "1.1.0");
    CHECK(entries[2].manifest_path == "web_search/1.1.0/component.json");
    CHECK(entries[2].type == "tool");

    auto parsed = parse_registry_index(dir.read("index.json"));
    REQUIRE(parsed.isOk());
    CHECK(parsed.value().size() == 3);

    DirectoryRegistry registry(dir.path());
    auto manifest = registry.fetch_manifest("http_client", range("^2.0.0"));
    REQUIRE(manifest.isOk());
    CHECK(manifest.value().version.str() == "2.3.0");
}

TEST_CASE("build_registry_index lists every invalid manifest") {
    TempDir dir;
    write_registry(dir);
    dir.write("broken/component.json", "{\"name\": \"broken\"}");
    dir.write("copy/component.json", component_json("http_client", "2.3.0"));

    auto built = build_registry_index(dir.path());
    REQUIRE(built.isErr());
    CHECK(built.error().code() == ErrorCode::MANIFEST_INVALID);
    CHECK(built.error().details().paths ==
          std::vector<std::string>{"broken/component.json", "http_client/component.json"});
    CHECK_FALSE(dir.exists("index.json"));
}

TEST_CASE("index entry that disagrees with its manifest is rejected") {
    TempDir dir;
    write_registry(dir);
    dir.write("index.json", R"({"components":[
        {"name":"web_search","version":"9.9.9","manifest_path":"web_search/1.0.0/component.json"}]})");

    DirectoryRegistry registry(dir.path());
    auto manifest = registry.fetch_manifest("web_search", range("*"));
    REQUIRE(manifest.isErr());
    CHECK(manifest.error().code() == ErrorCode::REGISTRY_FETCH);
}

TEST_CASE("parse_registry_index rejects malformed documents") {
    CHECK(parse_registry_index("[]").isErr());
    CHECK(parse_registry_index("{}").isErr());
    CHECK(parse_registry_index(R"({"components":[{"name":"a"}]})").isErr());
    CHECK(parse_registry_index("{").isErr());
}

// ============================================================================
// SourceList
// ============================================================================

TEST_CASE("source list prefers the lowest priority number") {
    SourceList sources;
    sources.add({"mirror", 50, true, memory_with("lib", "1.0.0")});
    sources.add({"primary", 10, true, memory_with("lib", "1.5.0")});
    CHECK(sources.size() == 2);

    auto manifest = sources.fetch_manifest("lib", range("*"));
    REQUIRE(manifest.isOk());
    CHECK(manifest.value().version.str() == "1.5.0");
}

TEST_CASE("source list skips disabled sources and falls through on not found") {
    SourceList sources;
    sources.add({"off", 1, false, memory_with("lib", "9.0.0")});
    sources.add({"empty", 2, true, std::make_shared<InMemoryRegistry>()});
    sources.add({"last", 3, true, memory_with("lib", "1.0.0")});

    auto manifest = sources.fetch_manifest("lib", range("*"));
    REQUIRE(manifest.isOk());
    CHECK(manifest.value().version.str() == "1.0.0");
}

TEST_CASE("source list fetches bundles from the source that served the manifest") {
    auto first = std::make_shared<InMemoryRegistry>();
    first->add(component_json("lib", "1.0.0", {}, {{"f", "f.txt"}}), {{"f", "first"}});
    auto second = std::make_shared<InMemoryRegistry>();
    second->add(component_json("lib", "2.0.0", {}, {{"f", "f.txt"}}), {{"f", "second"}});

    SourceList sources;
    sources.add({"first", 1, true, first});
    sources.add({"second", 2, true, second});

    auto manifest = sources.fetch_manifest("lib", range("^2.0.0"));
    REQUIRE(manifest.isOk());
    auto bundle = sources.fetch_bundle("lib", manifest.value().version);
    REQUIRE(bundle.isOk());
    CHECK(bundle.value().at("f") == "second");
}

TEST_CASE("failing source is reported and the search continues") {
    auto flaky = memory_with("lib", "3.0.0");
    flaky->fail_transiently("lib", 1);

    WarningCollector warnings;
    SourceList sources(&warnings);
    sources.add({"flaky", 1, true, flaky});
    sources.add({"backup", 2, true, memory_with("lib", "1.0.0")});

    auto manifest = sources.fetch_manifest("lib", range("*"));
    REQUIRE(manifest.isOk());
    CHECK(manifest.value().version.str() == "1.0.0");

    auto emitted = warnings.get_warnings();
    REQUIRE(emitted.size() == 1);
    CHECK(emitted[0].key == "registry_source_failed");
    CHECK(emitted[0].fields["source"] == "flaky");
}

TEST_CASE("source list with no match is a not-found error") {
    SourceList sources;
    sources.add({"a", 1, true, std::make_shared<InMemoryRegistry>()});
    auto manifest = sources.fetch_manifest("ghost", range("*"));
    REQUIRE(manifest.isErr());
    CHECK(manifest.error().code() == ErrorCode::REGISTRY_FETCH);
    CHECK_FALSE(manifest.error().details().retryable);
}

// ============================================================================
// CachingRegistryClient
// ============================================================================

TEST_CASE("caching client serves repeated lookups from memory") {
    auto inner = memory_with("lib", "1.0.0");
    CachingRegistryClient cache(inner);

    REQUIRE(cache.fetch_manifest("lib", range("^1.0.0")).isOk());
    REQUIRE(cache.fetch_manifest("lib", range("^1.0.0")).isOk());
    // same canonical range, different spelling
    REQUIRE(cache.fetch_manifest("lib", range(">=1.0.0 <2.0.0")).isOk());

    CHECK(inner->manifest_fetches() == 1);
    CHECK(cache.hits() == 2);
    CHECK(cache.misses() == 1);
    CHECK(cache.size() == 1);
}

TEST_CASE("caching client does not cache failures") {
    auto inner = std::make_shared<InMemoryRegistry>();
    CachingRegistryClient cache(inner);

    CHECK(cache.fetch_manifest("lib", range("*")).isErr());
    CHECK(cache.fetch_manifest("lib", range("*")).isErr());
    CHECK(inner->manifest_fetches() == 2);
    CHECK(cache.size() == 0);
}

TEST_CASE("caching client evicts the least recently used entry") {
    auto inner = std::make_shared<InMemoryRegistry>();
    inner->add(component_json("a", "1.0.0"));
    inner->add(component_json("b", "1.0.0"));
    inner->add(component_json("c", "1.0.0"));
    CachingRegistryClient cache(inner, 2);

    REQUIRE(cache.fetch_manifest("a", range("*")).isOk());
    REQUIRE(cache.fetch_manifest("b", range("*")).isOk());
    REQUIRE(cache.fetch_manifest("a", range("*")).isOk());  // a is now most recent
    REQUIRE(cache.fetch_manifest("c", range("*")).isOk());  // evicts b
    CHECK(cache.size() == 2);

    size_t before = inner->manifest_fetches();
    REQUIRE(cache.fetch_manifest("a", range("*")).isOk());
    CHECK(inner->manifest_fetches() == before);
    REQUIRE(cache.fetch_manifest("b", range("*")).isOk());
    CHECK(inner->manifest_fetches() == before + 1);
}

TEST_CASE("invalidate drops cached entries") {
    auto inner = std::make_shared<InMemoryRegistry>();
    inner->add(component_json("a", "1.0.0"));
    inner->add(component_json("b", "1.0.0"));
    CachingRegistryClient cache(inner);

    REQUIRE(cache.fetch_manifest("a", range("*")).isOk());
    REQUIRE(cache.fetch_manifest("b", range("*")).isOk());
    cache.invalidate("a");
    CHECK(cache.size() == 1);
    cache.invalidate();
    CHECK(cache.size() == 0);
}

// ============================================================================
// RetryingRegistryClient
// ============================================================================

TEST_CASE("retrying client retries transient failures") {
    auto inner = memory_with("lib", "1.0.0");
    inner->fail_transiently("lib", 2);
    RetryingRegistryClient client(inner, RetryPolicy{3, std::chrono::milliseconds(0), 2});

    auto manifest = client.fetch_manifest("lib", range("*"));
    REQUIRE(manifest.isOk());
    CHECK(inner->manifest_fetches() == 3);
}

TEST_CASE("retrying client gives up after the configured attempts") {
    auto inner = memory_with("lib", "1.0.0");
    inner->fail_transiently("lib", 5);
    RetryingRegistryClient client(inner, RetryPolicy{3, std::chrono::milliseconds(0), 2});

    auto manifest = client.fetch_manifest("lib", range("*"));
    REQUIRE(manifest.isErr());
    CHECK(manifest.error().details().retryable);
    CHECK(inner->manifest_fetches() == 3);
}

TEST_CASE("retrying client does not retry not-found") {
    auto inner = std::make_shared<InMemoryRegistry>();
    RetryingRegistryClient client(inner, RetryPolicy{3, std::chrono::milliseconds(0), 2});

    CHECK(client.fetch_manifest("ghost", range("*")).isErr());
    CHECK(inner->manifest_fetches() == 1);
}
