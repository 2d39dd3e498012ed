#include "sandbox/sandbox_runtime.hpp"

#include <algorithm>

#include <quickjs.h>

#include "sandbox/js_values.hpp"
#include "sandbox/result_assembler.hpp"
#include "sandbox/run_state.hpp"
#include "sandbox/sandbox_globals.hpp"

namespace librarian::sandbox {
namespace {

constexpr auto kSnapshotGrace = std::chrono::milliseconds(200);
constexpr const char* kScriptName = "<script>";
constexpr const char* kNeverSettled = "Error: script promise never settled";

// Owns one runtime and its sandbox context. The context has no eval
// intrinsic, so code can only enter it as precompiled bytecode.
class Isolate {
public:
    explicit Isolate(const SandboxOptions& options) {
        runtime_ = JS_NewRuntime();
        if (!runtime_) {
            return;
        }
        if (options.memory_limit_bytes > 0) {
            JS_SetMemoryLimit(runtime_, options.memory_limit_bytes);
        }
        JS_SetMaxStackSize(runtime_, options.max_stack_bytes);
        if (!RegisterSandboxClasses(runtime_)) {
            return;
        }
        context_ = JS_NewContextRaw(runtime_);
        if (!context_) {
            return;
        }
        JS_AddIntrinsicBaseObjects(context_);
        JS_AddIntrinsicDate(context_);
        JS_AddIntrinsicRegExpCompiler(context_);
        JS_AddIntrinsicRegExp(context_);
        JS_AddIntrinsicJSON(context_);
        JS_AddIntrinsicMapSet(context_);
        JS_AddIntrinsicPromise(context_);
    }

    ~Isolate() {
        if (context_) {
            JS_FreeContext(context_);
        }
        if (runtime_) {
            JS_FreeRuntime(runtime_);
        }
    }

    Isolate(const Isolate&) = delete;
    Isolate& operator=(const Isolate&) = delete;

    bool Ok() const { return runtime_ && context_; }
    JSRuntime* runtime() const { return runtime_; }
    JSContext* context() const { return context_; }

private:
    JSRuntime* runtime_ = nullptr;
    JSContext* context_ = nullptr;
};

struct ValueRelease {
    JSContext* ctx;
    RunState& run;
    ~ValueRelease() { ReleaseRunValues(ctx, run); }
};

int InterruptHandler(JSRuntime*, void* opaque) {
    auto* run = static_cast<RunState*>(opaque);
    if (std::chrono::steady_clock::now() >= run->deadline) {
        run->timed_out = true;
        return 1;
    }
    return 0;
}

// Line 1 of the script stays line 1 of the compiled unit.
std::string WrapScript(const std::string& script) {
    return "(async () => {" + script + "\n})()";
}

void Fail(RunOutcome& outcome, ErrorKind kind, std::string message) {
    if (outcome.error_kind != ErrorKind::kNone) {
        return;
    }
    outcome.error_kind = kind;
    outcome.error_message = std::move(message);
}

// Compiles in a throwaway context that has eval, then loads the bytecode
// into ctx so that it binds to the sandbox globals.
JSValue CompileScript(JSRuntime* rt, JSContext* ctx, const std::string& source,
                      ErrorKind* kind, std::string* error) {
    JSContext* compiler = JS_NewContextRaw(rt);
    if (!compiler) {
        *kind = ErrorKind::kInternal;
        *error = "Internal error: failed to create compiler context";
        return JS_EXCEPTION;
    }
    JS_AddIntrinsicBaseObjects(compiler);
    JS_AddIntrinsicEval(compiler);
    JS_AddIntrinsicRegExpCompiler(compiler);

    JSValue compiled = JS_Eval(compiler, source.c_str(), source.size(), kScriptName,
                               JS_EVAL_TYPE_GLOBAL | JS_EVAL_FLAG_COMPILE_ONLY);
    if (JS_IsException(compiled)) {
        JSValue exception = JS_GetException(compiler);
        *error = js::DescribeException(compiler, exception);
        *kind = error->rfind("SyntaxError", 0) == 0 ? ErrorKind::kSyntax : ErrorKind::kRuntime;
        JS_FreeValue(compiler, exception);
        JS_FreeContext(compiler);
        return JS_EXCEPTION;
    }

    std::size_t size = 0;
    uint8_t* bytecode = JS_WriteObject(compiler, &size, compiled, JS_WRITE_OBJ_BYTECODE);
    JS_FreeValue(compiler, compiled);
    if (!bytecode) {
        js::ClearException(compiler);
        JS_FreeContext(compiler);
        *kind = ErrorKind::kInternal;
        *error = "Internal error: failed to serialise compiled script";
        return JS_EXCEPTION;
    }
    JSValue function = JS_ReadObject(ctx, bytecode, size, JS_READ_OBJ_BYTECODE);
    js_free(compiler, bytecode);
    JS_FreeContext(compiler);
    if (JS_IsException(function)) {
        js::ClearException(ctx);
        *kind = ErrorKind::kInternal;
        *error = "Internal error: failed to load compiled script";
    }
    return function;
}

// Observes settlement through the intrinsic then, which the script cannot
// have replaced yet.
bool WatchBody(JSContext* ctx, RunState& run, JSValueConst body, std::string* error) {
    JSValue handlers[2] = {NewBodyHandler(ctx, false), NewBodyHandler(ctx, true)};
    JSValue derived = JS_Call(ctx, run.promise_then, body, 2, handlers);
    JS_FreeValue(ctx, handlers[0]);
    JS_FreeValue(ctx, handlers[1]);
    if (JS_IsException(derived)) {
        *error = js::TakeException(ctx);
        return false;
    }
    JS_FreeValue(ctx, derived);
    return true;
}

bool DrainJobs(JSRuntime* rt, std::string* error) {
    while (JS_IsJobPending(rt)) {
        JSContext* job_ctx = nullptr;
        if (JS_ExecutePendingJob(rt, &job_ctx) < 0) {
            *error = job_ctx ? js::TakeException(job_ctx) : std::string("job failed");
            return false;
        }
    }
    return true;
}

void RunEventLoop(JSRuntime* rt, JSContext* ctx, RunState& run, RunOutcome& outcome) {
    while (true) {
        std::string error;
        if (!DrainJobs(rt, &error)) {
            if (run.timed_out) {
                Fail(outcome, ErrorKind::kTimeout, kTimeoutMessage);
            } else {
                Fail(outcome, ErrorKind::kRuntime, error);
            }
            return;
        }
        if (run.body_state != BodyState::kPending) {
            break;
        }
        if (run.timed_out || std::chrono::steady_clock::now() >= run.deadline) {
            Fail(outcome, ErrorKind::kTimeout, kTimeoutMessage);
            return;
        }
        if (run.pending.empty()) {
            Fail(outcome, ErrorKind::kRuntime, kNeverSettled);
            return;
        }
        for (const auto& completion : run.tasks.WaitForCompletions(run.deadline)) {
            SettleHostCall(ctx, run, completion);
        }
    }

    // An interrupt inside the async body surfaces as a rejection.
    if (run.body_state == BodyState::kRejected) {
        if (run.timed_out) {
            Fail(outcome, ErrorKind::kTimeout, kTimeoutMessage);
        } else {
            Fail(outcome, ErrorKind::kRuntime, js::DescribeException(ctx, run.body_value));
        }
    }
}

void CollectReturnValue(JSContext* ctx, RunState& run, RunOutcome& outcome) {
    if (run.body_state != BodyState::kFulfilled ||
        JS_IsUndefined(run.body_value) || JS_IsNull(run.body_value)) {
        return;
    }
    std::string error;
    auto value = js::ToJson(ctx, run.body_value, &error);
    if (value) {
        outcome.return_value = std::move(*value);
    } else {
        outcome.return_value = js::Stringify(ctx, run.body_value);
    }
}

void SnapshotBuffers(JSContext* ctx, RunState& run, RunOutcome& outcome) {
    if (run.timed_out) {
        // toJSON hooks still run script code; give them a short grace deadline.
        run.timed_out = false;
        run.deadline = std::chrono::steady_clock::now() + kSnapshotGrace;
    }
    std::string error;
    auto snapshot = js::ToJson(ctx, run.buffers, &error);
    if (!snapshot || !snapshot->is_object()) {
        run.sink->Log(utils::LogLevel::kWarn, "sandbox", "Buffer snapshot failed", {{"error", error}});
        Fail(outcome, ErrorKind::kInternal, "Internal error: buffers could not be serialised: " + error);
        return;
    }
    outcome.buffers = std::move(*snapshot);
}

void RunInIsolate(const Isolate& isolate, const std::string& script, RunState& run, RunOutcome& outcome) {
    JSRuntime* rt = isolate.runtime();
    JSContext* ctx = isolate.context();
    JS_SetContextOpaque(ctx, &run);
    JS_SetInterruptHandler(rt, InterruptHandler, &run);
    ValueRelease release{ctx, run};

    std::string error;
    if (!InstallGlobals(ctx, run, &error)) {
        Fail(outcome, ErrorKind::kInternal, "Internal error: " + error);
        return;
    }

    ErrorKind compile_kind = ErrorKind::kNone;
    JSValue function = CompileScript(rt, ctx, WrapScript(script), &compile_kind, &error);
    if (JS_IsException(function)) {
        Fail(outcome, run.timed_out ? ErrorKind::kTimeout : compile_kind,
             run.timed_out ? std::string(kTimeoutMessage) : error);
        return;
    }

    JSValue body = JS_EvalFunction(ctx, function);
    if (JS_IsException(body)) {
        error = js::TakeException(ctx);
        if (run.timed_out) {
            Fail(outcome, ErrorKind::kTimeout, kTimeoutMessage);
        } else {
            Fail(outcome, ErrorKind::kRuntime, error);
        }
        SnapshotBuffers(ctx, run, outcome);
        return;
    }
    const bool watching = WatchBody(ctx, run, body, &error);
    JS_FreeValue(ctx, body);
    if (!watching) {
        Fail(outcome, run.timed_out ? ErrorKind::kTimeout : ErrorKind::kRuntime,
             run.timed_out ? std::string(kTimeoutMessage) : error);
        SnapshotBuffers(ctx, run, outcome);
        return;
    }

    RunEventLoop(rt, ctx, run, outcome);
    if (outcome.error_kind == ErrorKind::kNone && outcome.return_value_compat) {
        CollectReturnValue(ctx, run, outcome);
    }
    SnapshotBuffers(ctx, run, outcome);
}

}  // namespace

SandboxOptions SandboxOptions::FromConfig(const config::SandboxConfig& config) {
    SandboxOptions options;
    options.timeout = std::chrono::milliseconds(std::max(config.timeout_ms, 1));
    options.max_script_chars = config.max_script_chars;
    options.memory_limit_bytes = config.memory_limit_bytes;
    options.max_stack_bytes = config.max_stack_bytes;
    options.max_host_workers = static_cast<std::size_t>(std::max(config.max_host_workers, 1));
    options.return_value_compat = config.return_value_compat;
    return options;
}

SandboxRuntime::SandboxRuntime(SandboxOptions options, std::shared_ptr<utils::LogSink> sink)
    : options_(std::move(options)),
      sink_(sink ? std::move(sink) : std::make_shared<utils::NullLogSink>()) {}

ExecutionResult SandboxRuntime::Execute(const std::string& script,
                                        std::shared_ptr<repo::RepoApi> repo,
                                        LlmQuery llm_query,
                                        const ExecutionContext& context) const {
    const auto started = std::chrono::steady_clock::now();
    RunOutcome outcome;
    outcome.seed_buffers = context.buffers.is_object() ? context.buffers : nlohmann::json::object();
    outcome.return_value_compat = options_.return_value_compat;

    if (script.size() > options_.max_script_chars) {
        sink_->Log(utils::LogLevel::kWarn, "sandbox", "Script rejected", {{"script", script}});
        Fail(outcome, ErrorKind::kInvalidInput,
             "Script exceeds maximum size of " + std::to_string(options_.max_script_chars) + " characters");
        return AssembleResult(std::move(outcome));
    }

    sink_->Log(utils::LogLevel::kDebug, "sandbox", "Executing script", {
        {"script", script},
        {"has_context", context.corpus ? "true" : "false"},
        {"buffer_keys", std::to_string(outcome.seed_buffers.size())}
    });

    RunState run(options_.max_host_workers);
    run.context = &context;
    run.repo = std::move(repo);
    run.llm_query = std::move(llm_query);
    run.sink = sink_;
    run.deadline = started + options_.timeout;

    {
        Isolate isolate(options_);
        if (!isolate.Ok()) {
            Fail(outcome, ErrorKind::kInternal, "Internal error: failed to create JavaScript runtime");
        } else {
            RunInIsolate(isolate, script, run, outcome);
        }
    }
    run.tasks.Abandon();

    outcome.stdout_lines = std::move(run.stdout_lines);
    outcome.final_answer = std::move(run.final_answer);

    const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started);
    sink_->Log(outcome.error_kind == ErrorKind::kNone ? utils::LogLevel::kInfo : utils::LogLevel::kWarn,
               "sandbox", "Script finished", {
        {"duration_ms", std::to_string(elapsed.count())},
        {"error_kind", ToString(outcome.error_kind)},
        {"stdout_lines", std::to_string(outcome.stdout_lines.size())},
        {"final_answer", outcome.final_answer ? "yes" : "no"}
    });
    return AssembleResult(std::move(outcome));
}

}  // namespace librarian::sandbox
