#include "sandbox/sandbox_globals.hpp"

#include <algorithm>
#include <cmath>
#include <mutex>
#include <unordered_set>

#include "sandbox/js_values.hpp"

namespace librarian::sandbox {
namespace {

const std::unordered_set<std::string> kAllowedBuiltins = {
    "globalThis", "JSON", "Math", "Map", "Set", "WeakMap", "WeakSet",
    "Array", "Object", "String", "Number", "Boolean", "RegExp",
    "Error", "TypeError", "RangeError", "SyntaxError", "ReferenceError",
    "EvalError", "URIError", "AggregateError", "Date", "Promise", "Symbol",
    "parseInt", "parseFloat", "isNaN", "isFinite",
    "encodeURI", "decodeURI", "encodeURIComponent", "decodeURIComponent",
    "NaN", "Infinity", "undefined"
};

const char* const kRepoOperations[] = {"list", "view", "find", "grep"};

enum ConsoleMethod {
    kConsoleLog,
    kConsoleInfo,
    kConsoleWarn,
    kConsoleError,
    kConsoleDebug
};

JSClassID g_unresolved_class_id = 0;
std::once_flag g_class_id_once;

// Global lookups that miss every own property land here: anything
// Object.prototype provides still resolves, every other name is undefined.
JSValue UnresolvedGet(JSContext* ctx, JSValueConst, JSAtom atom, JSValueConst) {
    auto* run = GetRunState(ctx);
    if (run && JS_IsObject(run->object_prototype)) {
        return JS_GetProperty(ctx, run->object_prototype, atom);
    }
    return JS_UNDEFINED;
}

const JSClassDef* UnresolvedClassDef() {
    static JSClassExoticMethods exotic = [] {
        JSClassExoticMethods methods{};
        methods.get_property = UnresolvedGet;
        return methods;
    }();
    static JSClassDef def = [] {
        JSClassDef d{};
        d.class_name = "UnresolvedScope";
        d.exotic = &exotic;
        return d;
    }();
    return &def;
}

std::string JoinArgs(JSContext* ctx, int argc, JSValueConst* argv) {
    std::string line;
    for (int i = 0; i < argc; ++i) {
        if (i > 0) {
            line += ' ';
        }
        line += js::Stringify(ctx, argv[i]);
    }
    return line;
}

JSValue SettledPromise(JSContext* ctx, JSValue value, bool rejected) {
    JSValue funcs[2];
    JSValue promise = JS_NewPromiseCapability(ctx, funcs);
    if (JS_IsException(promise)) {
        JS_FreeValue(ctx, value);
        return promise;
    }
    JSValue ret = JS_Call(ctx, funcs[rejected ? 1 : 0], JS_UNDEFINED, 1, &value);
    JS_FreeValue(ctx, ret);
    JS_FreeValue(ctx, value);
    JS_FreeValue(ctx, funcs[0]);
    JS_FreeValue(ctx, funcs[1]);
    return promise;
}

JSValue HostPromise(JSContext* ctx, RunState& run, std::string label, HostTaskQueue::Work work) {
    JSValue funcs[2];
    JSValue promise = JS_NewPromiseCapability(ctx, funcs);
    if (JS_IsException(promise)) {
        return promise;
    }
    const auto id = run.tasks.Submit(std::move(work));
    run.pending.emplace(id, PendingCall{std::move(label), funcs[0], funcs[1]});
    return promise;
}

JSValue NotifyObserver(JSContext* ctx,
                       const std::function<void(const std::string&)>& observer,
                       const char* name,
                       const std::string& value) {
    if (!observer) {
        return JS_UNDEFINED;
    }
    try {
        observer(value);
    } catch (const std::exception& ex) {
        return JS_ThrowInternalError(ctx, "%s observer failed: %s", name, ex.what());
    }
    return JS_UNDEFINED;
}

JSValue JsPrint(JSContext* ctx, JSValueConst, int argc, JSValueConst* argv) {
    auto* run = GetRunState(ctx);
    auto line = JoinArgs(ctx, argc, argv);
    run->stdout_lines.push_back(line);
    return NotifyObserver(ctx, run->context->on_print, "onPrint", line);
}

JSValue JsConsole(JSContext* ctx, JSValueConst, int argc, JSValueConst* argv, int magic) {
    auto* run = GetRunState(ctx);
    auto line = JoinArgs(ctx, argc, argv);
    utils::LogLevel level = utils::LogLevel::kInfo;
    switch (magic) {
        case kConsoleWarn: level = utils::LogLevel::kWarn; break;
        case kConsoleError: level = utils::LogLevel::kError; break;
        case kConsoleDebug: level = utils::LogLevel::kDebug; break;
        default: break;
    }
    run->sink->Log(level, "script", "console output", {{"content", line}});
    run->stdout_lines.push_back(std::move(line));
    return JS_UNDEFINED;
}

JSValue JsFinal(JSContext* ctx, JSValueConst, int argc, JSValueConst* argv) {
    auto* run = GetRunState(ctx);
    auto answer = argc > 0 ? js::Stringify(ctx, argv[0]) : std::string("undefined");
    run->final_answer = answer;
    return NotifyObserver(ctx, run->context->on_final, "onFinal", answer);
}

JSValue JsFinalVar(JSContext* ctx, JSValueConst, int argc, JSValueConst* argv) {
    auto* run = GetRunState(ctx);
    if (argc < 1) {
        return JS_ThrowTypeError(ctx, "FINAL_VAR: expected a buffer name");
    }
    const auto name = js::ToStdString(ctx, argv[0]);
    JSAtom atom = JS_NewAtomLen(ctx, name.data(), name.size());
    if (atom == JS_ATOM_NULL) {
        return JS_EXCEPTION;
    }
    const int found = JS_GetOwnProperty(ctx, nullptr, run->buffers, atom);
    if (found <= 0) {
        JS_FreeAtom(ctx, atom);
        if (found < 0) {
            return JS_EXCEPTION;
        }
        return JS_ThrowReferenceError(ctx, "FINAL_VAR: buffer \"%s\" not found", name.c_str());
    }
    JSValue value = JS_GetProperty(ctx, run->buffers, atom);
    JS_FreeAtom(ctx, atom);
    if (JS_IsException(value)) {
        return value;
    }
    auto answer = js::Stringify(ctx, value);
    JS_FreeValue(ctx, value);
    run->final_answer = std::move(answer);
    return NotifyObserver(ctx, run->context->on_final_var, "onFinalVar", name);
}

// Validated slice width; a width at or above length yields one slice.
bool ReadSliceSize(JSContext* ctx, JSValueConst value, int64_t length, int64_t* size) {
    double requested = 0;
    if (JS_ToFloat64(ctx, &requested, value) < 0) {
        return false;
    }
    if (!(requested >= 1)) {
        return false;
    }
    const double whole = std::floor(requested);
    *size = whole >= static_cast<double>(std::max<int64_t>(length, 1))
        ? std::max<int64_t>(length, 1)
        : static_cast<int64_t>(whole);
    return true;
}

int64_t ReadLength(JSContext* ctx, JSValueConst value) {
    JSValue length_value = JS_GetPropertyStr(ctx, value, "length");
    int64_t length = 0;
    if (JS_IsException(length_value) || JS_ToInt64(ctx, &length, length_value) < 0) {
        length = -1;
    }
    JS_FreeValue(ctx, length_value);
    return length;
}

JSValue JsChunk(JSContext* ctx, JSValueConst, int argc, JSValueConst* argv) {
    JSValue text = JS_UNDEFINED;
    if (argc > 0 && JS_IsString(argv[0])) {
        text = JS_DupValue(ctx, argv[0]);
    } else {
        const auto rendered = argc > 0 ? js::Stringify(ctx, argv[0]) : std::string();
        text = JS_NewStringLen(ctx, rendered.data(), rendered.size());
    }
    const int64_t length = ReadLength(ctx, text);
    int64_t size = 0;
    if (length < 0) {
        JS_FreeValue(ctx, text);
        return JS_EXCEPTION;
    }
    if (argc < 2 || !ReadSliceSize(ctx, argv[1], length, &size)) {
        JS_FreeValue(ctx, text);
        return JS_ThrowRangeError(ctx, "chunk: size must be a positive number");
    }

    JSValue slice = JS_GetPropertyStr(ctx, text, "slice");
    JSValue pieces = JS_NewArray(ctx);
    uint32_t index = 0;
    for (int64_t start = 0; start < length; start += size) {
        JSValue bounds[2] = {
            JS_NewInt64(ctx, start),
            JS_NewInt64(ctx, std::min(start + size, length))
        };
        JSValue piece = JS_Call(ctx, slice, text, 2, bounds);
        if (JS_IsException(piece)) {
            JS_FreeValue(ctx, pieces);
            pieces = JS_EXCEPTION;
            break;
        }
        JS_SetPropertyUint32(ctx, pieces, index++, piece);
    }
    JS_FreeValue(ctx, slice);
    JS_FreeValue(ctx, text);
    return pieces;
}

JSValue JsBatch(JSContext* ctx, JSValueConst, int argc, JSValueConst* argv) {
    if (argc < 1 || JS_IsArray(ctx, argv[0]) <= 0) {
        return JS_ThrowTypeError(ctx, "batch: items must be an array");
    }
    const int64_t length = ReadLength(ctx, argv[0]);
    if (length < 0) {
        return JS_EXCEPTION;
    }
    int64_t size = 0;
    if (argc < 2 || !ReadSliceSize(ctx, argv[1], length, &size)) {
        return JS_ThrowRangeError(ctx, "batch: size must be a positive number");
    }

    JSValue groups = JS_NewArray(ctx);
    uint32_t group_index = 0;
    for (int64_t start = 0; start < length; start += size) {
        JSValue group = JS_NewArray(ctx);
        const int64_t end = std::min(start + size, length);
        for (int64_t i = start; i < end; ++i) {
            JSValue item = JS_GetPropertyUint32(ctx, argv[0], static_cast<uint32_t>(i));
            if (JS_IsException(item)) {
                JS_FreeValue(ctx, group);
                JS_FreeValue(ctx, groups);
                return item;
            }
            JS_SetPropertyUint32(ctx, group, static_cast<uint32_t>(i - start), item);
        }
        JS_SetPropertyUint32(ctx, groups, group_index++, group);
    }
    return groups;
}

JSValue JsRepoCall(JSContext* ctx, JSValueConst, int argc, JSValueConst* argv, int magic) {
    auto* run = GetRunState(ctx);
    const std::string operation = kRepoOperations[magic];
    if (!run->repo) {
        const std::string message = "Error: repo." + operation + " is not available in this run";
        return SettledPromise(ctx, JS_NewStringLen(ctx, message.data(), message.size()), false);
    }

    nlohmann::json args = nlohmann::json::object();
    if (argc > 0 && !JS_IsUndefined(argv[0]) && !JS_IsNull(argv[0])) {
        std::string error;
        auto converted = js::ToJson(ctx, argv[0], &error);
        if (!converted) {
            const std::string message = "Error: repo." + operation + " arguments are not serialisable: " + error;
            return SettledPromise(ctx, JS_NewStringLen(ctx, message.data(), message.size()), false);
        }
        args = std::move(*converted);
    }

    auto repo = run->repo;
    return HostPromise(ctx, *run, "repo." + operation, [repo, operation, args] {
        return HostCallResult{true, repo->Call(operation, args), {}};
    });
}

JSValue JsLlmQuery(JSContext* ctx, JSValueConst, int argc, JSValueConst* argv) {
    auto* run = GetRunState(ctx);
    if (!run->llm_query) {
        return SettledPromise(ctx, js::NewErrorWithMessage(ctx, "llm_query is not configured for this run"), true);
    }
    auto instruction = argc > 0 ? js::Stringify(ctx, argv[0]) : std::string();
    auto data = argc > 1 && !JS_IsUndefined(argv[1]) ? js::Stringify(ctx, argv[1]) : std::string();
    auto query = run->llm_query;
    return HostPromise(ctx, *run, "llm_query",
                       [query, instruction = std::move(instruction), data = std::move(data)] {
        return HostCallResult{true, nlohmann::json(query(instruction, data)), {}};
    });
}

JSValue JsBodySettled(JSContext* ctx, JSValueConst, int argc, JSValueConst* argv, int magic) {
    auto* run = GetRunState(ctx);
    if (run->body_state == BodyState::kPending) {
        run->body_state = magic == 0 ? BodyState::kFulfilled : BodyState::kRejected;
        run->body_value = argc > 0 ? JS_DupValue(ctx, argv[0]) : JS_UNDEFINED;
    }
    return JS_UNDEFINED;
}

bool Define(JSContext* ctx, JSValueConst target, const char* name, JSValue value, int flags,
            std::string* error) {
    if (JS_IsException(value) || JS_DefinePropertyValueStr(ctx, target, name, value, flags) < 0) {
        js::ClearException(ctx);
        *error = std::string("failed to install ") + name;
        return false;
    }
    return true;
}

bool DefineFunction(JSContext* ctx, JSValueConst target, const char* name, JSCFunction* fn,
                    int length, std::string* error) {
    return Define(ctx, target, name, JS_NewCFunction(ctx, fn, name, length),
                  JS_PROP_WRITABLE | JS_PROP_CONFIGURABLE, error);
}

JSValue GetPath(JSContext* ctx, JSValueConst root, const char* first, const char* second) {
    JSValue outer = JS_GetPropertyStr(ctx, root, first);
    if (JS_IsException(outer)) {
        return outer;
    }
    JSValue inner = JS_GetPropertyStr(ctx, outer, second);
    JS_FreeValue(ctx, outer);
    return inner;
}

bool PruneGlobals(JSContext* ctx, JSValueConst global, std::string* error) {
    JSPropertyEnum* props = nullptr;
    uint32_t count = 0;
    if (JS_GetOwnPropertyNames(ctx, &props, &count, global, JS_GPN_STRING_MASK) < 0) {
        js::ClearException(ctx);
        *error = "failed to enumerate global object";
        return false;
    }
    bool ok = true;
    for (uint32_t i = 0; i < count; ++i) {
        const char* name = JS_AtomToCString(ctx, props[i].atom);
        const bool keep = name && kAllowedBuiltins.count(name) > 0;
        if (!keep && ok && JS_DeleteProperty(ctx, global, props[i].atom, 0) <= 0) {
            js::ClearException(ctx);
            *error = std::string("failed to remove global ") + (name ? name : "<unnamed>");
            ok = false;
        }
        if (name) {
            JS_FreeCString(ctx, name);
        }
    }
    for (uint32_t i = 0; i < count; ++i) {
        JS_FreeAtom(ctx, props[i].atom);
    }
    js_free(ctx, props);
    return ok;
}

bool InstallConsole(JSContext* ctx, JSValueConst global, std::string* error) {
    static const std::pair<const char*, int> kMethods[] = {
        {"log", kConsoleLog}, {"info", kConsoleInfo}, {"warn", kConsoleWarn},
        {"error", kConsoleError}, {"debug", kConsoleDebug}
    };
    JSValue console = JS_NewObject(ctx);
    if (JS_IsException(console)) {
        js::ClearException(ctx);
        *error = "failed to create console";
        return false;
    }
    for (const auto& [name, method] : kMethods) {
        if (!Define(ctx, console, name,
                    JS_NewCFunctionMagic(ctx, JsConsole, name, 1, JS_CFUNC_generic_magic, method),
                    JS_PROP_WRITABLE | JS_PROP_CONFIGURABLE, error)) {
            JS_FreeValue(ctx, console);
            return false;
        }
    }
    return Define(ctx, global, "console", console, JS_PROP_WRITABLE | JS_PROP_CONFIGURABLE, error);
}

bool InstallRepo(JSContext* ctx, JSValueConst global, std::string* error) {
    JSValue repo = JS_NewObject(ctx);
    if (JS_IsException(repo)) {
        js::ClearException(ctx);
        *error = "failed to create repo";
        return false;
    }
    for (int i = 0; i < 4; ++i) {
        const char* name = kRepoOperations[i];
        if (!Define(ctx, repo, name,
                    JS_NewCFunctionMagic(ctx, JsRepoCall, name, 1, JS_CFUNC_generic_magic, i),
                    JS_PROP_ENUMERABLE, error)) {
            JS_FreeValue(ctx, repo);
            return false;
        }
    }
    return Define(ctx, global, "repo", repo, JS_PROP_ENUMERABLE, error);
}

bool InstallState(JSContext* ctx, JSValueConst global, RunState& run, std::string* error) {
    const auto& seed = run.context->buffers;
    JSValue buffers = js::FromJson(ctx, seed.is_object() ? seed : nlohmann::json::object());
    if (JS_IsException(buffers) || !JS_IsObject(buffers)) {
        js::ClearException(ctx);
        JS_FreeValue(ctx, buffers);
        *error = "failed to seed buffers";
        return false;
    }
    run.buffers = JS_DupValue(ctx, buffers);
    if (!Define(ctx, global, "buffers", buffers, JS_PROP_ENUMERABLE, error)) {
        return false;
    }

    if (run.context->corpus) {
        const auto& corpus = *run.context->corpus;
        if (!Define(ctx, global, "context", JS_NewStringLen(ctx, corpus.data(), corpus.size()),
                    JS_PROP_ENUMERABLE, error)) {
            return false;
        }
    }
    return true;
}

bool InstallInto(JSContext* ctx, JSValueConst global, RunState& run, std::string* error) {
    run.object_prototype = GetPath(ctx, global, "Object", "prototype");
    run.promise_then = JS_UNDEFINED;
    JSValue promise_prototype = GetPath(ctx, global, "Promise", "prototype");
    if (!JS_IsException(promise_prototype)) {
        run.promise_then = JS_GetPropertyStr(ctx, promise_prototype, "then");
    }
    JS_FreeValue(ctx, promise_prototype);
    if (!JS_IsObject(run.object_prototype) || !JS_IsFunction(ctx, run.promise_then)) {
        js::ClearException(ctx);
        *error = "missing core intrinsics";
        return false;
    }

    if (!PruneGlobals(ctx, global, error)) {
        return false;
    }

    if (!DefineFunction(ctx, global, "print", JsPrint, 1, error) ||
        !DefineFunction(ctx, global, "FINAL", JsFinal, 1, error) ||
        !DefineFunction(ctx, global, "FINAL_VAR", JsFinalVar, 1, error) ||
        !DefineFunction(ctx, global, "chunk", JsChunk, 2, error) ||
        !DefineFunction(ctx, global, "batch", JsBatch, 2, error) ||
        !DefineFunction(ctx, global, "llm_query", JsLlmQuery, 2, error) ||
        !InstallConsole(ctx, global, error) ||
        !InstallRepo(ctx, global, error) ||
        !InstallState(ctx, global, run, error)) {
        return false;
    }

    JSValue fallback = JS_NewObjectClass(ctx, static_cast<int>(g_unresolved_class_id));
    if (JS_IsException(fallback) || JS_SetPrototype(ctx, global, fallback) < 0) {
        js::ClearException(ctx);
        JS_FreeValue(ctx, fallback);
        *error = "failed to install unresolved-name fallback";
        return false;
    }
    JS_FreeValue(ctx, fallback);
    return true;
}

}  // namespace

bool RegisterSandboxClasses(JSRuntime* rt) {
    std::call_once(g_class_id_once, [] { JS_NewClassID(&g_unresolved_class_id); });
    return JS_NewClass(rt, g_unresolved_class_id, UnresolvedClassDef()) == 0;
}

bool InstallGlobals(JSContext* ctx, RunState& run, std::string* error) {
    JSValue global = JS_GetGlobalObject(ctx);
    const bool ok = InstallInto(ctx, global, run, error);
    JS_FreeValue(ctx, global);
    return ok;
}

JSValue NewBodyHandler(JSContext* ctx, bool rejected) {
    return JS_NewCFunctionMagic(ctx, JsBodySettled, rejected ? "onRejected" : "onFulfilled", 1,
                                JS_CFUNC_generic_magic, rejected ? 1 : 0);
}

void SettleHostCall(JSContext* ctx, RunState& run, const HostCompletion& completion) {
    auto it = run.pending.find(completion.id);
    if (it == run.pending.end()) {
        return;
    }
    PendingCall call = std::move(it->second);
    run.pending.erase(it);

    bool rejected = !completion.result.ok;
    JSValue argument = rejected
        ? js::NewErrorWithMessage(ctx, completion.result.error)
        : js::FromJson(ctx, completion.result.value);
    if (JS_IsException(argument)) {
        argument = JS_GetException(ctx);
        rejected = true;
    }
    if (rejected) {
        run.sink->Log(utils::LogLevel::kDebug, "sandbox", "Host call rejected",
                      {{"call", call.label}, {"error", completion.result.error}});
    }

    JSValue ret = JS_Call(ctx, rejected ? call.reject : call.resolve, JS_UNDEFINED, 1, &argument);
    if (JS_IsException(ret)) {
        js::ClearException(ctx);
    }
    JS_FreeValue(ctx, ret);
    JS_FreeValue(ctx, argument);
    JS_FreeValue(ctx, call.resolve);
    JS_FreeValue(ctx, call.reject);
}

void ReleaseRunValues(JSContext* ctx, RunState& run) {
    for (auto& [id, call] : run.pending) {
        JS_FreeValue(ctx, call.resolve);
        JS_FreeValue(ctx, call.reject);
    }
    run.pending.clear();
    for (JSValue* value : {&run.buffers, &run.object_prototype, &run.promise_then, &run.body_value}) {
        JS_FreeValue(ctx, *value);
        *value = JS_UNDEFINED;
    }
}

}  // namespace librarian::sandbox
