#include <catch2/catch.hpp>

#include <string>

#include "repo/path_guard.hpp"
#include "test_helpers.hpp"

using librarian::repo::kEscapeMarker;
using librarian::repo::PercentDecode;
using librarian::repo::RelativeToRoot;
using librarian::repo::ResolveUnderRoot;

TEST_CASE("PercentDecode decodes valid escapes only", "[path_guard]") {
    CHECK(PercentDecode("%2e%2E") == "..");
    CHECK(PercentDecode("a%2Fb") == "a/b");
    CHECK(PercentDecode("100%") == "100%");
    CHECK(PercentDecode("%zz") == "%zz");
    CHECK(PercentDecode("%4") == "%4");
}

TEST_CASE("ResolveUnderRoot accepts paths inside the root", "[path_guard]") {
    librarian::testing::TempDir dir;
    dir.Write("src/a.ts", "x");

    SECTION("relative file") {
        const auto resolved = ResolveUnderRoot(dir.path(), "src/a.ts");
        REQUIRE(resolved.ok);
        CHECK(resolved.path == dir.path() / "src" / "a.ts");
    }
    SECTION("empty and dot resolve to the root") {
        CHECK(ResolveUnderRoot(dir.path(), "").path == dir.path());
        CHECK(ResolveUnderRoot(dir.path(), ".").path == dir.path());
    }
    SECTION("inner .. that stays inside") {
        const auto resolved = ResolveUnderRoot(dir.path(), "src/../src/a.ts");
        REQUIRE(resolved.ok);
        CHECK(resolved.path == dir.path() / "src" / "a.ts");
    }
    SECTION("absolute path under the root") {
        const auto resolved = ResolveUnderRoot(dir.path(), (dir.path() / "src").string());
        CHECK(resolved.ok);
    }
    SECTION("missing files still resolve") {
        const auto resolved = ResolveUnderRoot(dir.path(), "src/missing.ts");
        REQUIRE(resolved.ok);
        CHECK(resolved.path == dir.path() / "src" / "missing.ts");
    }
}

TEST_CASE("ResolveUnderRoot rejects escapes in every encoding", "[path_guard]") {
    librarian::testing::TempDir dir;
    dir.Write("inner/file.txt", "x");
    const auto root = dir.path() / "inner";

    const char* attempts[] = {
        "../",
        "..",
        "../../etc/passwd",
        "/etc/passwd",
        "%2e%2e/%2e%2e/etc/passwd",
        "%252e%252e/secret",
        "..\\..\\windows",
        "file:///etc/passwd",
        "sub/../../outside",
    };
    for (const auto* attempt : attempts) {
        INFO(attempt);
        const auto resolved = ResolveUnderRoot(root, attempt);
        CHECK_FALSE(resolved.ok);
        CHECK(resolved.escaped);
        CHECK(resolved.error.find(kEscapeMarker) != std::string::npos);
        CHECK(resolved.error.find(attempt) != std::string::npos);
    }
}

TEST_CASE("ResolveUnderRoot rejects symlinks that leave the root", "[path_guard]") {
    librarian::testing::TempDir dir;
    dir.Write("outside/secret.txt", "secret");
    dir.Write("root/keep.txt", "keep");
    std::error_code ec;
    std::filesystem::create_directory_symlink(dir.path() / "outside", dir.path() / "root" / "link", ec);
    if (ec) {
        WARN("symlinks unavailable: " << ec.message());
        return;
    }

    const auto resolved = ResolveUnderRoot(dir.path() / "root", "link/secret.txt");
    CHECK_FALSE(resolved.ok);
    CHECK(resolved.escaped);
}

TEST_CASE("ResolveUnderRoot rejects a sibling sharing the root prefix", "[path_guard]") {
    librarian::testing::TempDir dir;
    dir.Write("app/a.txt", "a");
    dir.Write("app-secrets/b.txt", "b");

    const auto resolved = ResolveUnderRoot(dir.path() / "app", "../app-secrets/b.txt");
    CHECK(resolved.escaped);
}

TEST_CASE("ResolveUnderRoot reports NUL bytes", "[path_guard]") {
    librarian::testing::TempDir dir;
    const auto resolved = ResolveUnderRoot(dir.path(), std::string("a\0b", 3));
    CHECK_FALSE(resolved.ok);
    CHECK_FALSE(resolved.escaped);
    CHECK(resolved.error.find("NUL byte") != std::string::npos);
}

TEST_CASE("RelativeToRoot renders generic relative paths", "[path_guard]") {
    librarian::testing::TempDir dir;
    CHECK(RelativeToRoot(dir.path(), dir.path()) == ".");
    CHECK(RelativeToRoot(dir.path(), dir.path() / "src" / "a.ts") == "src/a.ts");
}
