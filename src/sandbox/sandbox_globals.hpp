#pragma once

#include <string>

#include <quickjs.h>

#include "sandbox/host_tasks.hpp"
#include "sandbox/run_state.hpp"

namespace librarian::sandbox {

// Registers the classes the sandbox global object depends on. Must run on
// every runtime before its first context is created.
bool RegisterSandboxClasses(JSRuntime* rt);

// Rebuilds the global object of ctx from the allow-list and installs the host
// surface bound to run. ctx must carry run as its opaque.
bool InstallGlobals(JSContext* ctx, RunState& run, std::string* error);

// Native reaction recording the settlement of the script body in run.
JSValue NewBodyHandler(JSContext* ctx, bool rejected);

// Resolves or rejects the script promise waiting on a finished host call.
void SettleHostCall(JSContext* ctx, RunState& run, const HostCompletion& completion);

// Frees every script value held by run. Must precede JS_FreeContext.
void ReleaseRunValues(JSContext* ctx, RunState& run);

}  // namespace librarian::sandbox
