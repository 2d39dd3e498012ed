#include <catch2/catch.hpp>

#include "repo/gitignore.hpp"
#include "test_helpers.hpp"

using librarian::repo::GitIgnore;

TEST_CASE("GitIgnore matches names at any depth", "[gitignore]") {
    const auto ignore = GitIgnore::Parse("*.log\nnode_cache\n");
    CHECK(ignore.ShouldIgnore("debug.log", false));
    CHECK(ignore.ShouldIgnore("src/deep/trace.log", false));
    CHECK(ignore.ShouldIgnore("node_cache", true));
    CHECK(ignore.ShouldIgnore("pkg/node_cache/index.js", false));
    CHECK_FALSE(ignore.ShouldIgnore("src/main.ts", false));
    CHECK_FALSE(ignore.ShouldIgnore(".", true));
}

TEST_CASE("GitIgnore honours anchors, directory rules and negation", "[gitignore]") {
    const auto ignore = GitIgnore::Parse("# comment\r\n\n/generated\nout/\n*.log\n!keep.log\n");

    SECTION("leading slash anchors to the root") {
        CHECK(ignore.ShouldIgnore("generated", true));
        CHECK(ignore.ShouldIgnore("generated/a.ts", false));
        CHECK_FALSE(ignore.ShouldIgnore("src/generated", true));
    }
    SECTION("trailing slash only matches directories") {
        CHECK(ignore.ShouldIgnore("out", true));
        CHECK(ignore.ShouldIgnore("lib/out", true));
        CHECK(ignore.ShouldIgnore("out/a.js", false));
        CHECK_FALSE(ignore.ShouldIgnore("out", false));
    }
    SECTION("last matching rule wins") {
        CHECK(ignore.ShouldIgnore("app.log", false));
        CHECK_FALSE(ignore.ShouldIgnore("keep.log", false));
        CHECK_FALSE(ignore.ShouldIgnore("logs/keep.log", false));
    }
}

TEST_CASE("GitIgnore loads from the repository root", "[gitignore]") {
    librarian::testing::TempDir dir;
    CHECK(GitIgnore::Load(dir.path()).Empty());

    dir.Write(".gitignore", "tmp/\n");
    const auto ignore = GitIgnore::Load(dir.path());
    CHECK_FALSE(ignore.Empty());
    CHECK(ignore.ShouldIgnore("tmp", true));
}
