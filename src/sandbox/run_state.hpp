#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include <quickjs.h>

#include "repo/repo_api.hpp"
#include "sandbox/execution_context.hpp"
#include "sandbox/host_tasks.hpp"
#include "utils/logging.hpp"

namespace librarian::sandbox {

// Resolving functions of a promise handed to the script for a host call.
struct PendingCall {
    std::string label;
    JSValue resolve = JS_UNDEFINED;
    JSValue reject = JS_UNDEFINED;
};

enum class BodyState {
    kPending,
    kFulfilled,
    kRejected
};

// Per-run state reachable from native callbacks through the context opaque.
// Lives on the stack of one Execute call and is never shared across runs.
struct RunState {
    explicit RunState(std::size_t max_host_workers) : tasks(max_host_workers) {}

    const ExecutionContext* context = nullptr;
    std::shared_ptr<repo::RepoApi> repo;
    LlmQuery llm_query;
    std::shared_ptr<utils::LogSink> sink;

    HostTaskQueue tasks;
    std::unordered_map<std::uint64_t, PendingCall> pending;

    std::vector<std::string> stdout_lines;
    std::optional<std::string> final_answer;

    std::chrono::steady_clock::time_point deadline;
    bool timed_out = false;

    JSValue buffers = JS_UNDEFINED;
    JSValue object_prototype = JS_UNDEFINED;
    JSValue promise_then = JS_UNDEFINED;

    BodyState body_state = BodyState::kPending;
    JSValue body_value = JS_UNDEFINED;
};

inline RunState* GetRunState(JSContext* ctx) {
    return static_cast<RunState*>(JS_GetContextOpaque(ctx));
}

}  // namespace librarian::sandbox
