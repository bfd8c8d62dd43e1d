#include <doctest/doctest.h>
#include <kiln/digest.hpp>
#include <kiln/platform.hpp>

#include "test_support.hpp"

using namespace kiln;
using namespace kiln::test;

// ============================================================================
// validate_relative_path
// ============================================================================

TEST_CASE("normalize simple relative path") {
    auto r = validate_relative_path("tools/search.py");
    CHECK(r.safe);
    CHECK(r.normalized_path == "tools/search.py");
}

TEST_CASE("collapse dot segments and repeated slashes") {
    auto r = validate_relative_path("./tools//./search.py");
    CHECK(r.safe);
    CHECK(r.normalized_path == "tools/search.py");
}

TEST_CASE("backslashes are treated as separators") {
    auto r = validate_relative_path("tools\\search.py");
    CHECK(r.safe);
    CHECK(r.normalized_path == "tools/search.py");
}

TEST_CASE("reject parent segments anywhere") {
    CHECK_FALSE(validate_relative_path("../escape").safe);
    CHECK_FALSE(validate_relative_path("a/../../escape").safe);
    CHECK_FALSE(validate_relative_path("a/b/..").safe);
}

TEST_CASE("reject absolute paths") {
    CHECK_FALSE(validate_relative_path("/etc/passwd").safe);
    CHECK_FALSE(validate_relative_path("C:\\Windows\\system.ini").safe);
    CHECK_FALSE(validate_relative_path("c:/x").safe);
}

TEST_CASE("reject empty, NUL and no-op paths") {
    CHECK_FALSE(validate_relative_path("").safe);
    CHECK_FALSE(validate_relative_path(std::string("a\0b", 3)).safe);
    CHECK_FALSE(validate_relative_path(".").safe);
    CHECK_FALSE(validate_relative_path("./").safe);
}

TEST_CASE("paths_overlap matches equal paths and directory prefixes") {
    CHECK(paths_overlap("a/b.txt", "a/b.txt"));
    CHECK(paths_overlap("a", "a/b.txt"));
    CHECK(paths_overlap("a/b.txt", "a"));
    CHECK_FALSE(paths_overlap("a/b.txt", "a/b.txt.bak"));
    CHECK_FALSE(paths_overlap("ab/c", "a"));
    CHECK_FALSE(paths_overlap("x/1", "y/1"));
}

// ============================================================================
// Atomic file operations
// ============================================================================

TEST_CASE("atomic_write_file replaces content and leaves no temp file") {
    TempDir dir;
    dir.write("out.txt", "old");

    auto r = atomic_write_file(dir.file("out.txt"), "new");
    REQUIRE(r.ok);
    CHECK(dir.read("out.txt") == "new");
    CHECK_FALSE(dir.exists("out.txt.tmp"));
}

TEST_CASE("declined commit leaves the target untouched") {
    TempDir dir;
    dir.write("out.txt", "old");

    auto r = atomic_write_file(dir.file("out.txt"), "new", [] { return false; });
    CHECK_FALSE(r.ok);
    CHECK(r.aborted);
    CHECK(dir.read("out.txt") == "old");
    CHECK_FALSE(dir.exists("out.txt.tmp"));
}

TEST_CASE("atomic_write_file fails when the directory is missing") {
    TempDir dir;
    auto r = atomic_write_file(dir.file("missing/out.txt"), "x");
    CHECK_FALSE(r.ok);
    CHECK_FALSE(r.aborted);
    CHECK_FALSE(r.error.empty());
}

TEST_CASE("append_line_durable appends newline-terminated lines") {
    TempDir dir;
    REQUIRE(append_line_durable(dir.file("log.jsonl"), "one").ok);
    REQUIRE(append_line_durable(dir.file("log.jsonl"), "two").ok);
    CHECK(dir.read("log.jsonl") == "one\ntwo\n");
}

TEST_CASE("remove_empty_directory keeps non-empty directories") {
    TempDir dir;
    dir.write("full/x.txt", "x");
    REQUIRE(create_directories(dir.file("empty/inner")));

    CHECK_FALSE(remove_empty_directory(dir.file("full")));
    CHECK(dir.exists("full/x.txt"));
    CHECK_FALSE(remove_empty_directory(dir.file("empty")));
    CHECK(remove_empty_directory(dir.file("empty/inner")));
    CHECK(remove_empty_directory(dir.file("empty")));
}

TEST_CASE("create_directories fails under a regular file") {
    TempDir dir;
    dir.write("blocked", "file");
    CHECK_FALSE(create_directories(dir.file("blocked/sub")));
    CHECK_FALSE(path_exists(dir.file("blocked/sub/c.txt")));
}

TEST_CASE("timestamps are RFC3339 UTC") {
    auto ts = get_current_timestamp();
    CHECK(ts.size() == 20);
    CHECK(ts[10] == 'T');
    CHECK(ts.back() == 'Z');
}

// ============================================================================
// Digests
// ============================================================================

TEST_CASE("compute_sha256 of known input") {
    auto h = compute_sha256("abc");
    REQUIRE(h.ok);
    CHECK(h.hex_digest == "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
    CHECK(format_checksum(h.hex_digest) == "sha256:" + h.hex_digest);
}

TEST_CASE("compute_file_sha256 matches the in-memory digest") {
    TempDir dir;
    std::string content(20000, 'k');
    dir.write("big.bin", content);

    auto file = compute_file_sha256(dir.file("big.bin"));
    REQUIRE(file.ok);
    CHECK(file.hex_digest == compute_sha256(content).hex_digest);

    CHECK_FALSE(compute_file_sha256(dir.file("absent.bin")).ok);
}
