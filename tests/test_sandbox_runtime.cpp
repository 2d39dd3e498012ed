#include <catch2/catch.hpp>

#include <chrono>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "repo/repo_api.hpp"
#include "sandbox/sandbox_runtime.hpp"
#include "test_helpers.hpp"

using namespace librarian::sandbox;
using librarian::repo::RepoApi;
using librarian::testing::TempDir;
using json = nlohmann::json;
using namespace std::chrono_literals;

namespace {

struct SandboxFixture {
    SandboxFixture() {
        librarian::testing::WriteSampleRepo(dir);
        repo = RepoApi::ForDirectory(dir.path(), nullptr);
    }

    ExecutionResult Run(const std::string& script,
                        const ExecutionContext& context = {},
                        LlmQuery query = {}) const {
        return runtime.Execute(script, repo, std::move(query), context);
    }

    TempDir dir;
    std::shared_ptr<RepoApi> repo;
    SandboxRuntime runtime;
};

SandboxOptions ShortTimeout(std::chrono::milliseconds timeout) {
    SandboxOptions options;
    options.timeout = timeout;
    return options;
}

std::string EchoQuery(const std::string& instruction, const std::string& data) {
    return "<LLM_QUERY_OUTPUT>\n" + instruction + "|" + data + "\n</LLM_QUERY_OUTPUT>";
}

}  // namespace

TEST_CASE_METHOD(SandboxFixture, "FINAL sets the final answer without an error", "[sandbox]") {
    const auto result = Run("FINAL(\"X\")");
    CHECK(result.final_answer == std::string("X"));
    CHECK_FALSE(result.error);
    CHECK(result.Ok());
}

TEST_CASE_METHOD(SandboxFixture, "A script without FINAL or return leaves no answer", "[sandbox]") {
    const auto result = Run("print('working'); buffers.seen = true;");
    CHECK_FALSE(result.final_answer);
    CHECK_FALSE(result.buffers.contains(kReturnValueKey));
    CHECK(result.buffers == json{{"seen", true}});
    CHECK(result.stdout_text == "working");
}

TEST_CASE_METHOD(SandboxFixture, "Every capability rejects an escaping path with the marker", "[sandbox]") {
    const auto result = Run(R"(
const marker = 'escape the working directory sandbox';
const results = await Promise.all([
  repo.list({ directoryPath: '../' }),
  repo.view({ filePath: '../../etc/passwd' }),
  repo.find({ searchPath: '%2e%2e', patterns: ['*'] }),
  repo.grep({ searchPath: '/etc', query: 'root' }),
]);
FINAL(results.map((r) => typeof r === 'string' && r.includes(marker)).join(','));
)");
    REQUIRE(result.Ok());
    CHECK(result.final_answer == std::string("true,true,true,true"));
}

TEST_CASE_METHOD(SandboxFixture, "FINAL_VAR on a missing buffer fails and names the key", "[sandbox]") {
    const auto result = Run("FINAL_VAR(\"missing\")");
    REQUIRE(result.error);
    CHECK(result.error_kind == ErrorKind::kRuntime);
    CHECK(result.error->rfind("ReferenceError: FINAL_VAR: buffer \"missing\" not found", 0) == 0);
    CHECK_FALSE(result.final_answer);
}

TEST_CASE_METHOD(SandboxFixture, "Identical runs produce identical output", "[sandbox]") {
    const std::string script = R"(
const files = await repo.find({ patterns: ['*.ts'] });
for (const file of files) {
  const text = await repo.view({ filePath: file, viewRange: [1, 1] });
  print(file, text);
}
buffers.files = files;
buffers.runs = (buffers.runs || 0) + 1;
)";
    ExecutionContext context{};
    context.buffers = json{{"runs", 1}};

    const auto first = Run(script, context);
    const auto second = Run(script, context);
    REQUIRE(first.Ok());
    CHECK(first.stdout_text == second.stdout_text);
    CHECK(first.buffers == second.buffers);
    CHECK(first.buffers.at("runs") == 2);
}

TEST_CASE("An infinite loop is aborted with the timeout message", "[sandbox]") {
    const SandboxRuntime runtime(ShortTimeout(300ms));

    SECTION("synchronous loop") {
        const auto start = std::chrono::steady_clock::now();
        const auto result = runtime.Execute("print('before'); buffers.partial = 1; while (true) {}",
                                            nullptr, {}, ExecutionContext{});
        CHECK(std::chrono::steady_clock::now() - start < 2500ms);
        CHECK(result.error == std::string(kTimeoutMessage));
        CHECK(result.error_kind == ErrorKind::kTimeout);
        CHECK(result.stdout_text == "before");
        CHECK(result.buffers == json{{"partial", 1}});
    }
    SECTION("loop across awaits") {
        const auto result = runtime.Execute("while (true) { await null; }", nullptr, {}, ExecutionContext{});
        CHECK(result.error == std::string(kTimeoutMessage));
    }
    SECTION("host call that outlives the deadline") {
        LlmQuery slow = [](const std::string&, const std::string&) {
            std::this_thread::sleep_for(1500ms);
            return std::string("late");
        };
        const auto start = std::chrono::steady_clock::now();
        const auto result = runtime.Execute("FINAL(await llm_query('slow', 'x'))", nullptr, slow, ExecutionContext{});
        CHECK(std::chrono::steady_clock::now() - start < 1200ms);
        CHECK(result.error == std::string(kTimeoutMessage));
        CHECK_FALSE(result.final_answer);
    }
}

TEST_CASE_METHOD(SandboxFixture, "A returned value lands under the reserved key", "[sandbox]") {
    SECTION("array") {
        const auto result = Run("return [1,2,3];");
        REQUIRE(result.Ok());
        CHECK(result.buffers.at(kReturnValueKey) == json::array({1, 2, 3}));
        CHECK_FALSE(result.final_answer);
    }
    SECTION("null is not stored") {
        CHECK_FALSE(Run("return null;").buffers.contains(kReturnValueKey));
    }
    SECTION("compatibility switched off") {
        SandboxOptions options;
        options.return_value_compat = false;
        const SandboxRuntime strict(options);
        const auto result = strict.Execute("return 'value';", repo, {}, ExecutionContext{});
        CHECK_FALSE(result.buffers.contains(kReturnValueKey));
    }
}

TEST_CASE_METHOD(SandboxFixture, "repo.find returns an array of matches", "[sandbox]") {
    const auto result = Run("const l = await repo.find({patterns:[\"*.ts\"]}); FINAL(\"found:\"+l.length)");
    REQUIRE(result.Ok());
    CHECK(result.final_answer == std::string("found:3"));
}

TEST_CASE_METHOD(SandboxFixture, "Concurrent runs keep their buffers apart", "[sandbox]") {
    const std::string script = R"(
for (let i = 0; i < 40; i++) {
  buffers.count = (buffers.count || 0) + 1;
  buffers.trail = (buffers.trail || '') + buffers.id;
  await repo.list({});
}
)";
    ExecutionResult first;
    ExecutionResult second;
    std::thread a([&] {
        ExecutionContext context{};
        context.buffers = json{{"id", "A"}};
        first = Run(script, context);
    });
    std::thread b([&] {
        ExecutionContext context{};
        context.buffers = json{{"id", "B"}};
        second = Run(script, context);
    });
    a.join();
    b.join();

    REQUIRE(first.Ok());
    REQUIRE(second.Ok());
    CHECK(first.buffers.at("count") == 40);
    CHECK(second.buffers.at("count") == 40);
    CHECK(first.buffers.at("trail") == std::string(40, 'A'));
    CHECK(second.buffers.at("trail") == std::string(40, 'B'));
}

TEST_CASE_METHOD(SandboxFixture, "Only allow-listed globals resolve", "[sandbox]") {
    SECTION("ambient host objects read as undefined") {
        const auto result = Run(
            "print(typeof process, typeof require, typeof fetch, typeof setTimeout, typeof eval,"
            " typeof Function, typeof Reflect, typeof Proxy, typeof SharedArrayBuffer, typeof std)");
        REQUIRE(result.Ok());
        CHECK(result.stdout_text ==
              "undefined undefined undefined undefined undefined undefined undefined undefined undefined undefined");
    }
    SECTION("a bare unknown name is undefined, not a ReferenceError") {
        const auto result = Run("FINAL(String(someUnknownName) + ':' + String(globalThis.process))");
        REQUIRE(result.Ok());
        CHECK(result.final_answer == std::string("undefined:undefined"));
    }
    SECTION("curated names are present") {
        const auto result = Run(
            "print(typeof JSON, typeof Math, typeof Promise, typeof Map, typeof repo.grep, typeof llm_query,"
            " typeof buffers, typeof context, typeof chunk, typeof console.log)");
        CHECK(result.stdout_text == "object object function function function function object undefined function function");
    }
    SECTION("the Function constructor cannot compile code") {
        const auto result = Run(R"(
try {
  const make = (() => {}).constructor;
  make('return 1')();
  FINAL('compiled');
} catch (e) {
  FINAL('blocked');
}
)");
        CHECK(result.final_answer == std::string("blocked"));
    }
    SECTION("reaching for process surfaces as an ordinary TypeError") {
        const auto result = Run("process.exit(1)");
        REQUIRE(result.error);
        CHECK(result.error->rfind("TypeError", 0) == 0);
    }
}

TEST_CASE_METHOD(SandboxFixture, "Failures are classified", "[sandbox]") {
    SECTION("syntax") {
        const auto result = Run("const x = ;");
        REQUIRE(result.error);
        CHECK(result.error_kind == ErrorKind::kSyntax);
        CHECK(result.error->rfind("SyntaxError", 0) == 0);
    }
    SECTION("uncaught error keeps earlier stdout") {
        const auto result = Run("print('step 1'); throw new Error('boom');");
        REQUIRE(result.error);
        CHECK(result.error_kind == ErrorKind::kRuntime);
        CHECK(result.error->rfind("Error: boom", 0) == 0);
        CHECK(result.stdout_text == "step 1");
    }
    SECTION("non-Error throw values are stringified") {
        CHECK(Run("throw 'plain failure';").error == std::string("plain failure"));
    }
    SECTION("a promise that can never settle") {
        CHECK(Run("await new Promise(() => {});").error == std::string("Error: script promise never settled"));
    }
    SECTION("oversized script") {
        SandboxOptions options;
        options.max_script_chars = 10;
        const SandboxRuntime small(options);
        const auto result = small.Execute("print('hello world')", repo, {}, ExecutionContext{});
        CHECK(result.error_kind == ErrorKind::kInvalidInput);
        CHECK(result.error == std::string("Script exceeds maximum size of 10 characters"));
    }
    SECTION("unbounded recursion") {
        const auto result = Run("function f() { return f() + 1; } f();");
        REQUIRE(result.error);
        CHECK(result.error_kind == ErrorKind::kRuntime);
        CHECK(result.error->find("stack overflow") != std::string::npos);
    }
    SECTION("buffers that cannot be serialised") {
        ExecutionContext context{};
        context.buffers = json{{"kept", 1}};
        const auto result = Run("buffers.self = buffers;", context);
        REQUIRE(result.error);
        CHECK(result.error_kind == ErrorKind::kInternal);
        CHECK(result.error->rfind("Internal error: buffers could not be serialised", 0) == 0);
        CHECK(result.buffers == json{{"kept", 1}});
    }
}

TEST_CASE_METHOD(SandboxFixture, "FINAL does not halt the script", "[sandbox]") {
    const auto result = Run("FINAL('first'); buffers.after = 1; print('still running'); FINAL('second');");
    REQUIRE(result.Ok());
    CHECK(result.final_answer == std::string("second"));
    CHECK(result.buffers.at("after") == 1);
    CHECK(result.stdout_text == "still running");
}

TEST_CASE_METHOD(SandboxFixture, "FINAL_VAR stringifies the buffer value", "[sandbox]") {
    std::vector<std::string> names;
    ExecutionContext context{};
    context.buffers = json{{"answer", {{"n", 1}}}, {"text", "plain"}};
    context.on_final_var = [&names](const std::string& name) { names.push_back(name); };

    CHECK(Run("FINAL_VAR('answer')", context).final_answer == std::string("{\n  \"n\": 1\n}"));
    CHECK(Run("FINAL_VAR('text')", context).final_answer == std::string("plain"));
    CHECK(names == std::vector<std::string>{"answer", "text"});
}

TEST_CASE_METHOD(SandboxFixture, "print and console format their arguments", "[sandbox]") {
    auto sink = std::make_shared<librarian::testing::CaptureLogSink>();
    const SandboxRuntime logged(SandboxOptions{}, sink);
    std::vector<std::string> printed;
    ExecutionContext context{};
    context.on_print = [&printed](const std::string& line) { printed.push_back(line); };

    const auto result = logged.Execute(
        "print('a', 1, {k: [1]}, null); console.log('from console'); print(new Error('oops'));",
        repo, {}, context);
    REQUIRE(result.Ok());
    CHECK(result.stdout_text == "a 1 {\n  \"k\": [\n    1\n  ]\n} null\nfrom console\nError: oops");
    CHECK(printed == std::vector<std::string>{"a 1 {\n  \"k\": [\n    1\n  ]\n} null", "Error: oops"});
    CHECK(sink->Contains("script", "console output"));
    CHECK(sink->Contains("sandbox", "Script finished"));
}

TEST_CASE_METHOD(SandboxFixture, "Observers fire in call order", "[sandbox]") {
    std::vector<std::string> events;
    ExecutionContext context{};
    context.buffers = json{{"k", "v"}};
    context.on_print = [&events](const std::string& line) { events.push_back("print:" + line); };
    context.on_final = [&events](const std::string& answer) { events.push_back("final:" + answer); };
    context.on_final_var = [&events](const std::string& name) { events.push_back("final_var:" + name); };

    Run("print('one'); FINAL('two'); await repo.list({}); FINAL_VAR('k'); print('three');", context);
    CHECK(events == std::vector<std::string>{"print:one", "final:two", "final_var:k", "print:three"});
}

TEST_CASE_METHOD(SandboxFixture, "A throwing observer becomes a script error", "[sandbox]") {
    ExecutionContext context{};
    context.on_print = [](const std::string&) { throw std::runtime_error("sink closed"); };

    const auto caught = Run("try { print('x'); } catch (e) { FINAL(e.message); }", context);
    CHECK(caught.final_answer == std::string("onPrint observer failed: sink closed"));

    const auto uncaught = Run("print('x');", context);
    REQUIRE(uncaught.error);
    CHECK(uncaught.error->find("onPrint observer failed: sink closed") != std::string::npos);
}

TEST_CASE_METHOD(SandboxFixture, "context and buffers are wired from the execution context", "[sandbox]") {
    ExecutionContext context{};
    context.corpus = std::string("hello corpus");
    context.buffers = json{{"seed", json::array({1, 2})}};

    const auto result = Run(
        "buffers = {}; buffers.seed.push(3); buffers.upper = context.toUpperCase(); FINAL(typeof context);",
        context);
    REQUIRE(result.Ok());
    CHECK(result.final_answer == std::string("string"));
    CHECK(result.buffers.at("seed") == json::array({1, 2, 3}));
    CHECK(result.buffers.at("upper") == "HELLO CORPUS");
    CHECK(context.buffers == json{{"seed", json::array({1, 2})}});
}

TEST_CASE_METHOD(SandboxFixture, "chunk and batch split their input", "[sandbox]") {
    SECTION("chunk") {
        const auto result = Run("return [chunk('abcdefg', 3), chunk('', 2), chunk(12345, 10)];");
        REQUIRE(result.Ok());
        CHECK(result.buffers.at(kReturnValueKey) ==
              json::array({json::array({"abc", "def", "g"}), json::array(), json::array({"12345"})}));
    }
    SECTION("batch") {
        const auto result = Run("return batch([1, 2, 3, 4, 5], 2);");
        REQUIRE(result.Ok());
        CHECK(result.buffers.at(kReturnValueKey) ==
              json::array({json::array({1, 2}), json::array({3, 4}), json::array({5})}));
    }
    SECTION("invalid arguments") {
        CHECK(Run("chunk('abc', 0)").error->rfind("RangeError: chunk: size must be a positive number", 0) == 0);
        CHECK(Run("batch('abc', 2)").error->rfind("TypeError: batch: items must be an array", 0) == 0);
        CHECK(Run("batch([1], -1)").error->rfind("RangeError: batch: size must be a positive number", 0) == 0);
    }
}

TEST_CASE_METHOD(SandboxFixture, "llm_query resolves through the injected function", "[sandbox]") {
    SECTION("delimited answer") {
        const auto result = Run("FINAL(await llm_query('summarise', 'some data'))", {}, EchoQuery);
        CHECK(result.final_answer == std::string("<LLM_QUERY_OUTPUT>\nsummarise|some data\n</LLM_QUERY_OUTPUT>"));
        CHECK(result.stdout_text.empty());
        CHECK(result.buffers.empty());
    }
    SECTION("non-string data is stringified") {
        const auto result = Run("FINAL(await llm_query('count', {n: 2}))", {}, EchoQuery);
        CHECK(result.final_answer == std::string("<LLM_QUERY_OUTPUT>\ncount|{\n  \"n\": 2\n}\n</LLM_QUERY_OUTPUT>"));
    }
    SECTION("calls run concurrently") {
        LlmQuery slow = [](const std::string& instruction, const std::string&) {
            std::this_thread::sleep_for(200ms);
            return instruction;
        };
        const auto start = std::chrono::steady_clock::now();
        const auto result = Run(
            "const r = await Promise.all([llm_query('a', ''), llm_query('b', ''), llm_query('c', '')]);"
            " FINAL(r.join(''))",
            {}, slow);
        CHECK(result.final_answer == std::string("abc"));
        CHECK(std::chrono::steady_clock::now() - start < 550ms);
    }
}

TEST_CASE_METHOD(SandboxFixture, "llm_query failures reject the script's promise", "[sandbox]") {
    LlmQuery failing = [](const std::string&, const std::string&) -> std::string {
        throw std::runtime_error("rate limited");
    };

    SECTION("caught by the script") {
        const auto result = Run(
            "try { await llm_query('a', 'b'); } catch (e) { FINAL('caught:' + e.message); }", {}, failing);
        REQUIRE(result.Ok());
        CHECK(result.final_answer == std::string("caught:rate limited"));
    }
    SECTION("routed around with allSettled") {
        const auto result = Run(R"(
const settled = await Promise.allSettled([repo.find({ patterns: ['*.md'] }), llm_query('a', 'b')]);
FINAL(settled.map((s) => s.status).join(','));
)", {}, failing);
        CHECK(result.final_answer == std::string("fulfilled,rejected"));
    }
    SECTION("uncaught rejection fails the run") {
        const auto result = Run("await llm_query('a', 'b');", {}, failing);
        REQUIRE(result.error);
        CHECK(result.error_kind == ErrorKind::kRuntime);
        CHECK(result.error->find("rate limited") != std::string::npos);
    }
    SECTION("no function configured") {
        const auto result = Run("try { await llm_query('a', 'b'); } catch (e) { FINAL(e.message); }");
        CHECK(result.final_answer == std::string("llm_query is not configured for this run"));
    }
}

TEST_CASE("Capabilities without a repository resolve to an error string", "[sandbox]") {
    const SandboxRuntime runtime;
    const auto result = runtime.Execute("FINAL(await repo.list({}))", nullptr, {}, ExecutionContext{});
    CHECK(result.final_answer == std::string("Error: repo.list is not available in this run"));
}

TEST_CASE_METHOD(SandboxFixture, "Capability argument errors come back as strings", "[sandbox]") {
    const auto result = Run("FINAL(await repo.view({ viewRange: [1, 2] }))");
    CHECK(result.final_answer == std::string("Error: repo.view requires \"filePath\" (string)"));
}

TEST_CASE("SandboxOptions follow the sandbox config", "[sandbox]") {
    librarian::config::SandboxConfig config{};
    config.timeout_ms = 500;
    config.max_host_workers = 0;
    config.return_value_compat = false;

    const auto options = SandboxOptions::FromConfig(config);
    CHECK(options.timeout == 500ms);
    CHECK(options.max_host_workers == 1);
    CHECK_FALSE(options.return_value_compat);
    CHECK(SandboxOptions{}.timeout == 30000ms);
}
