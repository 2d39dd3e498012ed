#include <catch2/catch.hpp>

#include <memory>
#include <string>

#include "agent/script_session.hpp"
#include "test_helpers.hpp"

using librarian::agent::ScriptSession;
using librarian::config::SessionConfig;
using librarian::sandbox::SandboxRuntime;
using json = nlohmann::json;

namespace {

struct SessionFixture {
    SessionFixture() {
        librarian::testing::WriteSampleRepo(dir);
        repo = librarian::repo::RepoApi::ForDirectory(dir.path(), nullptr);
    }

    ScriptSession MakeSession(SessionConfig options = {}, std::optional<std::string> corpus = std::nullopt) {
        return ScriptSession(runtime, repo, {}, std::move(corpus), options, nullptr);
    }

    librarian::testing::TempDir dir;
    std::shared_ptr<librarian::repo::RepoApi> repo;
    std::shared_ptr<const SandboxRuntime> runtime = std::make_shared<SandboxRuntime>();
};

}  // namespace

TEST_CASE_METHOD(SessionFixture, "Buffers carry from one step to the next", "[script_session]") {
    auto session = MakeSession();

    const auto first = session.Step("buffers.files = await repo.find({patterns: ['*.ts']}); print('found');");
    CHECK_FALSE(first.is_complete);
    CHECK(session.Iteration() == 1);
    CHECK(session.Buffers().at("files").size() == 3);
    CHECK(session.LastStdout() == "found");

    const auto second = session.Step("FINAL('count=' + buffers.files.length);");
    CHECK(second.is_complete);
    CHECK(second.final_answer == std::string("count=3"));
    CHECK(session.Iteration() == 2);
}

TEST_CASE_METHOD(SessionFixture, "Return values do not leak into the next step", "[script_session]") {
    auto session = MakeSession();

    const auto first = session.Step("buffers.kept = 'yes'; return {n: 1};");
    CHECK(first.result.buffers.at("__returnValue") == json{{"n", 1}});
    CHECK(session.Buffers() == json{{"kept", "yes"}});

    const auto second = session.Step("print(Object.keys(buffers).join(','));");
    CHECK(session.LastStdout() == "kept");
    CHECK_FALSE(second.result.buffers.contains("__returnValue"));
}

TEST_CASE_METHOD(SessionFixture, "Failed steps keep their buffers and become feedback", "[script_session]") {
    auto session = MakeSession();

    const auto failed = session.Step("buffers.partial = 1; throw new Error('bad step');");
    CHECK_FALSE(failed.is_complete);
    CHECK(failed.result.error);
    CHECK(session.Buffers() == json{{"partial", 1}});
    CHECK(session.Metadata().at("errorFeedback").get<std::string>().rfind("Error: bad step", 0) == 0);

    session.Step("buffers.partial += 1;");
    CHECK_FALSE(session.Metadata().contains("errorFeedback"));
    CHECK(session.Buffers() == json{{"partial", 2}});
}

TEST_CASE_METHOD(SessionFixture, "Metadata summarises the session state", "[script_session]") {
    SessionConfig options{};
    options.stdout_preview_chars = 5;
    auto session = MakeSession(options, std::string("corpus text"));

    session.Step("print('abcdefghij'); buffers.big = 'x'.repeat(300); buffers.list = [1, 2];");
    const auto metadata = session.Metadata();

    CHECK(metadata.at("iteration") == 1);
    CHECK(metadata.at("stdoutPreview") == "fghij");
    CHECK(metadata.at("stdoutLength") == 10);
    CHECK(metadata.at("hasContext") == true);
    CHECK(metadata.at("bufferKeys") == json::array({"big", "list"}));

    const auto& summary = metadata.at("bufferSummary");
    REQUIRE(summary.size() == 2);
    CHECK(summary[0].at("key") == "big");
    CHECK(summary[0].at("preview").get<std::string>().size() == 200);
    CHECK(summary[0].at("size") == 300);
    CHECK(summary[1].at("preview") == "[1,2]");

    session.SetErrorFeedback("try a smaller search");
    CHECK(session.Metadata().at("errorFeedback") == "try a smaller search");
}

TEST_CASE_METHOD(SessionFixture, "The session stops at the iteration cap", "[script_session]") {
    SessionConfig options{};
    options.max_iterations = 2;
    auto session = MakeSession(options);

    CHECK_FALSE(session.Step("buffers.note = 'first';").is_complete);
    const auto last = session.Step("print('still looking');");
    REQUIRE(last.is_complete);
    REQUIRE(last.final_answer);
    CHECK(last.final_answer->rfind("Max iterations (2) reached.\n\n=== Iteration Summary ===\nTotal iterations: 2", 0) == 0);
    CHECK(last.final_answer->find("note (5 chars):\nfirst") != std::string::npos);
    CHECK(last.final_answer->find("=== Last Output ===\nstill looking") != std::string::npos);
    CHECK_FALSE(last.result.final_answer);
}

TEST_CASE_METHOD(SessionFixture, "Observers reach every step", "[script_session]") {
    auto session = MakeSession();
    std::vector<std::string> printed;
    librarian::sandbox::ExecutionContext observers{};
    observers.on_print = [&printed](const std::string& line) { printed.push_back(line); };
    session.SetObservers(observers);

    session.Step("print('one')");
    session.Step("print('two')");
    CHECK(printed == std::vector<std::string>{"one", "two"});
}
