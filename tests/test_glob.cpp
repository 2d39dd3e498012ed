#include <catch2/catch.hpp>

#include "repo/glob.hpp"

using namespace librarian::repo;

TEST_CASE("GlobToRegex translates wildcards", "[glob]") {
    CHECK(GlobToRegex("*.ts") == "^[^/]*\\.ts$");
    CHECK(GlobToRegex("src/?.md") == "^src/[^/]\\.md$");
    CHECK(GlobToRegex("**/*.ts") == "^(?:.*/)?[^/]*\\.ts$");
    CHECK(GlobToRegex("src/**") == "^src/.*$");
}

TEST_CASE("ExpandBraceGlob expands alternatives", "[glob]") {
    CHECK(ExpandBraceGlob("*.{ts,tsx}") == std::vector<std::string>{"*.ts", "*.tsx"});
    CHECK(ExpandBraceGlob("{a,b}/{c,d}") == std::vector<std::string>{"a/c", "a/d", "b/c", "b/d"});
    CHECK(ExpandBraceGlob("plain.ts") == std::vector<std::string>{"plain.ts"});
    CHECK(ExpandBraceGlob("odd{}.ts") == std::vector<std::string>{"odd{}.ts"});
}

TEST_CASE("MatchAnyGlob matches root-relative paths", "[glob]") {
    const auto globs = CompileGlobs({"**/*.{ts,tsx}"});
    CHECK(MatchAnyGlob(globs, "index.ts"));
    CHECK(MatchAnyGlob(globs, "src/view.tsx"));
    CHECK(MatchAnyGlob(globs, "src\\nested\\deep.ts"));
    CHECK_FALSE(MatchAnyGlob(globs, "src/readme.md"));

    const auto shallow = CompileGlobs({"*.ts"});
    CHECK(MatchAnyGlob(shallow, "index.ts"));
    CHECK_FALSE(MatchAnyGlob(shallow, "src/index.ts"));
}

TEST_CASE("EffectivePattern anchors bare patterns for recursive searches", "[glob]") {
    CHECK(EffectivePattern("*.ts", true) == "**/*.ts");
    CHECK(EffectivePattern("*.ts", false) == "*.ts");
    CHECK(EffectivePattern("src/*.ts", true) == "src/*.ts");
    CHECK(EffectivePattern("**/*.md", true) == "**/*.md");
}
