#include <doctest/doctest.h>
#include <kiln/template.hpp>

using namespace kiln;

TEST_CASE("render_template substitutes placeholders") {
    auto result = render_template("Hello {{name}}", {{"name", "World"}});
    REQUIRE(result.isOk());
    CHECK(result.value() == "Hello World");
}

TEST_CASE("render_template allows padded placeholders and repeats") {
    auto result = render_template("{{ a }}-{{a}}-{{b}}", {{"a", "1"}, {"b", "2"}});
    REQUIRE(result.isOk());
    CHECK(result.value() == "1-1-2");
}

TEST_CASE("render_template leaves content without placeholders untouched") {
    std::string content = "plain text with { braces } and {{ not valid! }}";
    auto result = render_template(content, {});
    REQUIRE(result.isOk());
    CHECK(result.value() == content);
}

TEST_CASE("render_template ignores unreferenced variables") {
    auto result = render_template("static", {{"unused", "x"}});
    REQUIRE(result.isOk());
    CHECK(result.value() == "static");
}

TEST_CASE("missing variable fails with TemplateError") {
    auto result = render_template("Hello {{name}}", {});
    REQUIRE(result.isErr());
    CHECK(result.error().code() == ErrorCode::TEMPLATE);
    CHECK(result.error().details().missing == std::vector<std::string>{"name"});
}

TEST_CASE("every distinct missing variable is reported once") {
    auto result = render_template("{{x}} {{y}} {{x}} {{z}}", {{"y", "ok"}});
    REQUIRE(result.isErr());
    CHECK(result.error().details().missing == std::vector<std::string>{"x", "z"});
}

TEST_CASE("empty values are substitutions, not omissions") {
    auto result = render_template("[{{v}}]", {{"v", ""}});
    REQUIRE(result.isOk());
    CHECK(result.value() == "[]");
}

TEST_CASE("substituted values are not rendered again") {
    auto result = render_template("{{a}}", {{"a", "{{b}}"}});
    REQUIRE(result.isOk());
    CHECK(result.value() == "{{b}}");
}

TEST_CASE("find_placeholders lists distinct names in order") {
    CHECK(find_placeholders("{{b}} {{a}} {{ b }} {{_c1}}") ==
          std::vector<std::string>{"b", "a", "_c1"});
    CHECK(find_placeholders("{{1abc}} {{}}").empty());
}
